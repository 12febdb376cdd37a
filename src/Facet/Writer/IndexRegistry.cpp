//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <Facet/Writer/IndexRegistry.h>

#include <Facet/Base/Logging.h>
#include <Facet/Writer/NativeDocument.h>
#include <Facet/Writer/Property.h>

namespace facet::writer {

IndexRegistry::IndexRegistry(NativeDocument& document)
  : document_(document)
{
}

auto IndexRegistry::IndexOf(const DefinitionKind kind,
  const Property& property) const -> std::optional<uint32_t>
{
  const auto& table = tables_.at(static_cast<size_t>(kind));
  if (const auto it = table.find(&property); it != table.end()) {
    return it->second;
  }
  return std::nullopt;
}

auto IndexRegistry::Register(
  const DefinitionKind kind, const Property& property) -> uint32_t
{
  auto& table = tables_.at(static_cast<size_t>(kind));
  if (const auto it = table.find(&property); it != table.end()) {
    return it->second;
  }

  auto& definitions = document_.Definitions(kind);
  const auto index = static_cast<uint32_t>(definitions.size());
  definitions.push_back(nlohmann::json::object());
  table.emplace(&property, index);

  DLOG_F(1, "Register {} '{}' -> index {}", to_string(kind), property.Name(),
    index);
  return index;
}

auto IndexRegistry::Count(const DefinitionKind kind) const -> size_t
{
  return tables_.at(static_cast<size_t>(kind)).size();
}

} // namespace facet::writer
