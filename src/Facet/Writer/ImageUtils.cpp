//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <Facet/Writer/ImageUtils.h>

#include <array>
#include <utility>

namespace facet::writer {

auto MimeTypeToExtension(const std::string_view mime_type) -> std::string
{
  static constexpr std::array<std::pair<std::string_view, std::string_view>, 4>
    kKnown { {
      { "image/png", "png" },
      { "image/jpeg", "jpg" },
      { "image/ktx2", "ktx2" },
      { "image/webp", "webp" },
    } };

  for (const auto& [mime, extension] : kKnown) {
    if (mime == mime_type) {
      return std::string(extension);
    }
  }

  const auto slash = mime_type.find('/');
  if (slash == std::string_view::npos || slash + 1 == mime_type.size()) {
    return "bin";
  }
  return std::string(mime_type.substr(slash + 1));
}

} // namespace facet::writer
