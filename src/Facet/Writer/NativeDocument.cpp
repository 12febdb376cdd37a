//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <Facet/Writer/NativeDocument.h>

namespace facet::writer {

auto NativeDocument::Definitions(const DefinitionKind kind) -> nlohmann::json&
{
  auto& array = json[ArrayName(kind)];
  if (array.is_null()) {
    array = nlohmann::json::array();
  }
  return array;
}

auto NativeDocument::DefinitionCount(const DefinitionKind kind) const -> size_t
{
  const auto it = json.find(ArrayName(kind));
  if (it == json.end() || !it->is_array()) {
    return 0;
  }
  return it->size();
}

} // namespace facet::writer
