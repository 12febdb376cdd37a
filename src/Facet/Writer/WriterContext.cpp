//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <Facet/Writer/WriterContext.h>

#include <utility>
#include <variant>

#include <fmt/format.h>

#include <Facet/Base/Logging.h>
#include <Facet/Writer/ImageUtils.h>
#include <Facet/Writer/NativeDocument.h>
#include <Facet/Writer/Property.h>
#include <Facet/Writer/WriterErrors.h>

namespace facet::writer {

namespace {

  //! Checks that `def[member]`, when present, indexes into `target`.
  /*!
   @param required When true, a missing member is an error too.
  */
  auto CheckReference(const NativeDocument& document, const nlohmann::json& def,
    const DefinitionKind owner_kind, const size_t owner_index,
    const char* member, const DefinitionKind target, const bool required)
    -> void
  {
    const auto it = def.find(member);
    if (it == def.end()) {
      if (required) {
        throw DanglingReferenceError(
          fmt::format("{} {} has no '{}': its {} was never registered",
            to_string(owner_kind), owner_index, member, to_string(target)));
      }
      return;
    }

    const auto count = document.DefinitionCount(target);
    if (!it->is_number_integer() || it->get<int64_t>() < 0
      || static_cast<size_t>(it->get<int64_t>()) >= count) {
      throw DanglingReferenceError(
        fmt::format("{} {} has '{}' = {} but only {} {} definition(s) exist",
          to_string(owner_kind), owner_index, member, it->dump(), count,
          to_string(target)));
    }
  }

  //! An image carries its data through exactly one of `uri` or `bufferView`.
  auto CheckImageSource(const nlohmann::json& def, const size_t index) -> void
  {
    const auto has_uri = def.contains("uri");
    const auto has_view = def.contains("bufferView");
    if (has_uri == has_view) {
      throw DanglingReferenceError(fmt::format(
        "image {} must have exactly one of 'uri' or 'bufferView' (has {})",
        index, has_uri ? "both" : "neither"));
    }
  }

} // namespace

WriterContext::WriterContext(NativeDocument& document, WriterOptions options)
  : document_(document)
  , options_(std::move(options))
  , registry_(document_)
  , interner_(document_)
  , router_(document_, options_)
{
  LOG_F(INFO,
    "Begin writer session (container={}, images='{}'{}, buffers='{}'{})",
    to_string(options_.container_mode), options_.image_basename,
    options_.multiple_images ? "_N" : "", options_.buffer_basename,
    options_.multiple_buffers ? "_N" : "");
}

WriterContext::~WriterContext()
{
  if (!finalized_) {
    LOG_F(WARNING, "Writer session discarded without Finalize()");
  }
}

auto WriterContext::CreatePropertyDef(const Property& property) const
  -> nlohmann::json
{
  auto def = nlohmann::json::object();
  if (!property.Name().empty()) {
    def["name"] = property.Name();
  }
  if (const auto& extras = property.Extras();
    extras.is_object() && !extras.empty()) {
    def["extras"] = extras;
  }
  return def;
}

auto WriterContext::CreateAccessorDef(const Accessor& accessor) const
  -> nlohmann::json
{
  auto def = CreatePropertyDef(accessor);
  def["type"] = accessor.Type();
  def["componentType"] = accessor.ComponentType();
  def["count"] = accessor.Count();
  def["max"] = accessor.Max();
  def["min"] = accessor.Min();
  def["normalized"] = accessor.Normalized();
  return def;
}

auto WriterContext::CreateImageDef(const Texture& texture) -> uint32_t
{
  if (const auto existing = registry_.IndexOf(DefinitionKind::kImage, texture);
    existing.has_value()) {
    return *existing;
  }

  // Route first: a rejected name must leave no image behind.
  const auto placement = router_.Place(texture.Image(), texture,
    ResourceCategory::kImage, MimeTypeToExtension(texture.MimeType()));

  auto def = CreatePropertyDef(texture);
  if (!texture.MimeType().empty()) {
    def["mimeType"] = texture.MimeType();
  }
  if (const auto* embedded = std::get_if<EmbeddedPlacement>(&placement)) {
    def["bufferView"] = embedded->buffer_view;
  } else {
    def["uri"] = std::get<ExternalPlacement>(placement).uri;
  }

  const auto index = registry_.Register(DefinitionKind::kImage, texture);
  document_.Definitions(DefinitionKind::kImage).at(index) = std::move(def);
  return index;
}

auto WriterContext::CreateTextureInfoDef(const Texture& texture,
  const TextureInfo& texture_info, const TextureSampler& sampler)
  -> nlohmann::json
{
  const auto sampler_index
    = interner_.Intern(DefinitionKind::kSampler, MakeSamplerDef(sampler));

  const auto image_index = registry_.IndexOf(DefinitionKind::kImage, texture);
  if (!image_index.has_value()) {
    LOG_F(WARNING, "Texture '{}' bound before its image was registered",
      texture.Name());
  }

  const auto texture_index = interner_.Intern(
    DefinitionKind::kTexture, MakeTextureDef(image_index, sampler_index));

  return {
    { "index", texture_index },
    { "texCoord", texture_info.tex_coord },
  };
}

auto WriterContext::CreateBufferUri(const Buffer& buffer) -> std::string
{
  auto uri = router_.AllocateName(buffer, ResourceCategory::kBuffer, "bin");
  router_.ClaimResourceName(uri, buffer);
  return uri;
}

auto WriterContext::ValidateReferences() const -> void
{
  const auto& json = document_.json;

  if (const auto it = json.find(ArrayName(DefinitionKind::kTexture));
    it != json.end()) {
    for (size_t i = 0; i < it->size(); ++i) {
      const auto& def = (*it)[i];
      CheckReference(document_, def, DefinitionKind::kTexture, i, "source",
        DefinitionKind::kImage, true);
      CheckReference(document_, def, DefinitionKind::kTexture, i, "sampler",
        DefinitionKind::kSampler, false);
    }
  }

  if (const auto it = json.find(ArrayName(DefinitionKind::kImage));
    it != json.end()) {
    for (size_t i = 0; i < it->size(); ++i) {
      CheckImageSource((*it)[i], i);
      CheckReference(document_, (*it)[i], DefinitionKind::kImage, i,
        "bufferView", DefinitionKind::kBufferView, false);
    }
  }
}

auto WriterContext::Finalize() -> uint64_t
{
  LOG_SCOPE_F(INFO, "Finalize writer session");
  CHECK_F(!finalized_, "writer session finalized more than once");

  // A failed validation leaves the session open for the caller to repair.
  ValidateReferences();
  const auto blob_length = router_.ResolveOffsets();
  finalized_ = true;

  LOG_F(INFO,
    "samplers: {} requested, {} unique; textures: {} requested, {} unique",
    interner_.RequestCount(DefinitionKind::kSampler),
    interner_.UniqueCount(DefinitionKind::kSampler),
    interner_.RequestCount(DefinitionKind::kTexture),
    interner_.UniqueCount(DefinitionKind::kTexture));
  LOG_F(INFO, "embedded blobs: {} ({} bytes), external resources: {}",
    router_.Blobs().size(), blob_length, document_.resources.size());

  return blob_length;
}

} // namespace facet::writer
