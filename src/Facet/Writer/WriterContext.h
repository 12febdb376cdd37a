//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include <Facet/Base/Macros.h>
#include <Facet/Writer/DefinitionInterner.h>
#include <Facet/Writer/DefinitionKind.h>
#include <Facet/Writer/IndexRegistry.h>
#include <Facet/Writer/ResourceRouter.h>
#include <Facet/Writer/WriterOptions.h>
#include <Facet/Writer/api_export.h>

namespace facet::writer {

class Accessor;
class Buffer;
class Property;
class Texture;
struct NativeDocument;
struct TextureInfo;
struct TextureSampler;

//! Mutable state of one export pass.
/*!
 A WriterContext is the session object handed to the export driver. It owns
 the index registry, the definition interner and the resource router, and
 writes into a caller-owned NativeDocument. Constructing it begins the
 session; `Finalize()` ends it.

 ### Usage Pattern

 ```cpp
 NativeDocument document;
 WriterContext context(document, options);

 // Driver visits the graph in a fixed order.
 const auto image = context.CreateImageDef(texture);
 const auto info = context.CreateTextureInfoDef(texture, slot, sampler);

 const auto blob_length = context.Finalize();
 // Hand context.Router().Blobs() and document to container assembly.
 ```

 Index assignment follows call order, so visiting the same graph in the
 same order always produces the same document.

 @warning Not thread safe. Concurrent exports need one context (and one
  document) each.
*/
class WriterContext final {
public:
  FCT_WRTR_API WriterContext(NativeDocument& document, WriterOptions options);
  FCT_WRTR_API ~WriterContext();

  FACET_MAKE_NON_COPYABLE(WriterContext)
  FACET_MAKE_NON_MOVABLE(WriterContext)

  //=== Index registry ===----------------------------------------------------//

  //! Returns the index of `property` in `kind`, allocating it if needed.
  auto RegisterProperty(const DefinitionKind kind, const Property& property)
    -> uint32_t
  {
    return registry_.Register(kind, property);
  }

  [[nodiscard]] auto IndexOf(const DefinitionKind kind,
    const Property& property) const -> std::optional<uint32_t>
  {
    return registry_.IndexOf(kind, property);
  }

  //=== Definitions ===-------------------------------------------------------//

  //! Definition holding the common property fields.
  /*!
   `name` is set only when non-empty, `extras` only when it is a non-empty
   object.
  */
  FCT_WRTR_NDAPI auto CreatePropertyDef(const Property& property) const
    -> nlohmann::json;

  //! Accessor definition without its buffer view binding.
  FCT_WRTR_NDAPI auto CreateAccessorDef(const Accessor& accessor) const
    -> nlohmann::json;

  //! Registers the texture's image and routes its encoded bytes.
  /*!
   Fills the image definition with the property fields, `mimeType`, and
   either `bufferView` (embedded) or `uri` (external). Calling it again for
   the same texture returns the existing index without routing again.

   @return Index of the image definition.
   @throw NamingConflictError if the image name is already taken. The image
    is not registered in that case.
  */
  FCT_WRTR_API auto CreateImageDef(const Texture& texture) -> uint32_t;

  //! Texture reference for a material slot, sharing sampler and texture defs.
  /*!
   Interns the sampler first, then the texture binding that embeds the
   resolved sampler index. The texture's image should already be registered
   through `CreateImageDef()`; otherwise the binding has no `source` and
   `Finalize()` rejects the document.

   @return `{ "index": texture, "texCoord": n }`.
  */
  FCT_WRTR_API auto CreateTextureInfoDef(const Texture& texture,
    const TextureInfo& texture_info, const TextureSampler& sampler)
    -> nlohmann::json;

  //! Name for an external buffer file, from the buffer URI generator.
  FCT_WRTR_API auto CreateBufferUri(const Buffer& buffer) -> std::string;

  //! Routes an arbitrary payload (see ResourceRouter::Place).
  auto PlaceResource(const std::span<const std::byte> payload,
    const Property& owner, const ResourceCategory category,
    const std::string_view extension) -> ResourcePlacement
  {
    return router_.Place(payload, owner, category, extension);
  }

  //=== Session end ===-------------------------------------------------------//

  //! Validates cross references, then resolves embedded buffer view offsets.
  /*!
   Must succeed exactly once, after every object has been visited. When it
   throws, nothing has been resolved and the session stays open: the caller
   may repair the document and call it again.

   @return Length of the embedded blob in bytes (0 in external mode).
   @throw DanglingReferenceError if a texture or image refers to a missing
    image, sampler or buffer view, or an image has neither or both of `uri`
    and `bufferView`.
  */
  FCT_WRTR_API auto Finalize() -> uint64_t;

  [[nodiscard]] auto IsFinalized() const noexcept -> bool { return finalized_; }

  //=== Accessors ===---------------------------------------------------------//

  [[nodiscard]] auto Document() -> NativeDocument& { return document_; }
  [[nodiscard]] auto Options() const -> const WriterOptions&
  {
    return options_;
  }
  [[nodiscard]] auto Registry() const -> const IndexRegistry&
  {
    return registry_;
  }
  [[nodiscard]] auto Interner() const -> const DefinitionInterner&
  {
    return interner_;
  }
  [[nodiscard]] auto Router() const -> const ResourceRouter& { return router_; }

private:
  auto ValidateReferences() const -> void;

  NativeDocument& document_;
  WriterOptions options_;
  IndexRegistry registry_;
  DefinitionInterner interner_;
  ResourceRouter router_;
  bool finalized_ = false;
};

} // namespace facet::writer
