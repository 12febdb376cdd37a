//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <Facet/Writer/UniqueUriGenerator.h>

#include <fmt/format.h>

#include <Facet/Writer/Property.h>

namespace facet::writer {

auto UniqueUriGenerator::CreateUri(
  const Property& property, const std::string_view extension) -> std::string
{
  if (!property.Uri().empty()) {
    return property.Uri();
  }
  if (!multiple_) {
    return fmt::format("{}.{}", basename_, extension);
  }
  return fmt::format("{}_{}.{}", basename_, counter_++, extension);
}

} // namespace facet::writer
