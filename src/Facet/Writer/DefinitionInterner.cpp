//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <Facet/Writer/DefinitionInterner.h>

#include <utility>

#include <Facet/Base/Logging.h>
#include <Facet/Writer/NativeDocument.h>
#include <Facet/Writer/Property.h>

namespace facet::writer {

namespace {

  auto StripNulls(nlohmann::json& value) -> void
  {
    if (value.is_object()) {
      for (auto it = value.begin(); it != value.end();) {
        if (it->is_null()) {
          it = value.erase(it);
        } else {
          StripNulls(*it);
          ++it;
        }
      }
    } else if (value.is_array()) {
      // Array positions are meaningful; only their members are normalized.
      for (auto& element : value) {
        StripNulls(element);
      }
    }
  }

  auto Canonicalize(const nlohmann::json& record) -> nlohmann::json
  {
    auto canonical = record;
    StripNulls(canonical);
    return canonical;
  }

} // namespace

auto CanonicalKey(const nlohmann::json& record) -> std::string
{
  return Canonicalize(record).dump();
}

auto MakeSamplerDef(const TextureSampler& sampler) -> nlohmann::json
{
  auto def = nlohmann::json::object();
  if (sampler.mag_filter != 0) {
    def["magFilter"] = sampler.mag_filter;
  }
  if (sampler.min_filter != 0) {
    def["minFilter"] = sampler.min_filter;
  }
  def["wrapS"] = sampler.wrap_s;
  def["wrapT"] = sampler.wrap_t;
  return def;
}

auto MakeTextureDef(const std::optional<uint32_t> image_index,
  const uint32_t sampler_index) -> nlohmann::json
{
  auto def = nlohmann::json::object();
  if (image_index.has_value()) {
    def["source"] = *image_index;
  }
  def["sampler"] = sampler_index;
  return def;
}

DefinitionInterner::DefinitionInterner(NativeDocument& document)
  : document_(document)
{
}

auto DefinitionInterner::Intern(
  const DefinitionKind kind, const nlohmann::json& record) -> uint32_t
{
  auto& [index_by_key, requests] = tables_.at(static_cast<size_t>(kind));
  ++requests;

  auto canonical = Canonicalize(record);
  auto key = canonical.dump();

  if (const auto it = index_by_key.find(key); it != index_by_key.end()) {
    DLOG_F(1, "Reuse {} {} -> index {}", to_string(kind), key, it->second);
    return it->second;
  }

  auto& definitions = document_.Definitions(kind);
  const auto index = static_cast<uint32_t>(definitions.size());
  definitions.push_back(std::move(canonical));
  LOG_F(INFO, "Emit {} {} -> index {}", to_string(kind), key, index);
  index_by_key.emplace(std::move(key), index);

  return index;
}

auto DefinitionInterner::UniqueCount(const DefinitionKind kind) const -> size_t
{
  return tables_.at(static_cast<size_t>(kind)).index_by_key.size();
}

auto DefinitionInterner::RequestCount(const DefinitionKind kind) const
  -> size_t
{
  return tables_.at(static_cast<size_t>(kind)).requests;
}

} // namespace facet::writer
