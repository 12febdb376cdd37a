//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include <Facet/Base/Macros.h>
#include <Facet/Writer/DefinitionKind.h>
#include <Facet/Writer/UniqueUriGenerator.h>
#include <Facet/Writer/WriterOptions.h>
#include <Facet/Writer/api_export.h>

namespace facet::writer {

class Property;
struct NativeDocument;

//! Payload packed into the shared blob, addressed by a buffer view.
struct EmbeddedPlacement {
  uint32_t buffer_view = 0;
};

//! Payload stored as a named external resource.
struct ExternalPlacement {
  std::string uri;
};

//! Outcome of routing one binary payload.
using ResourcePlacement = std::variant<EmbeddedPlacement, ExternalPlacement>;

//! Routes binary payloads to the embedded blob or to external resources.
/*!
 ### Embedded mode

 Placement is a two-phase operation:

 1. `Place()` copies the payload to the ordered blob list, appends a buffer
    view `{buffer: 0, byteLength: n}` to the document and returns its index
    immediately. The view has no `byteOffset` yet.
 2. `ResolveOffsets()` runs once, after every payload has been placed. It
    walks the blobs in insertion order and writes each view's `byteOffset`
    as the running sum of the preceding blob lengths, each rounded up to the
    configured alignment.

 Placing a payload after `ResolveOffsets()` is a programmer error and
 aborts.

 ### External mode

 `Place()` asks the URI generator of the payload's category for a name,
 claims that name for the owner, and stores the bytes in the document's
 resource side-table.

 @warning Not thread safe. One router per session.
*/
class ResourceRouter final {
public:
  FCT_WRTR_API ResourceRouter(
    NativeDocument& document, const WriterOptions& options);
  ~ResourceRouter() = default;

  FACET_MAKE_NON_COPYABLE(ResourceRouter)
  FACET_MAKE_NON_MOVABLE(ResourceRouter)

  //! Routes `payload` according to the session's container mode.
  /*!
   @param payload   Bytes to store; copied.
   @param owner     Object the payload belongs to; used for naming.
   @param category  Resource category, selects the URI generator.
   @param extension File extension without the dot (external mode only).
   @return The buffer view index or the resource name.

   @throw NamingConflictError if the external name is already claimed by a
     different owner.
  */
  FCT_WRTR_API auto Place(std::span<const std::byte> payload,
    const Property& owner, ResourceCategory category,
    std::string_view extension) -> ResourcePlacement;

  //! Name for `owner` from the URI generator of `category`.
  /*!
   The name is not claimed. Use `ClaimResourceName()` when the name will be
   written.
  */
  FCT_WRTR_NDAPI auto AllocateName(const Property& owner,
    ResourceCategory category, std::string_view extension) -> std::string;

  //! Records that `name` belongs to `owner` for the rest of the session.
  /*!
   Re-claiming a name for the same owner is a no-op.

   @throw NamingConflictError if a different owner already holds `name`.
  */
  FCT_WRTR_API auto ClaimResourceName(
    const std::string& name, const Property& owner) -> void;

  //! Patches the byte offset of every embedded buffer view.
  /*!
   @return Total length of the embedded blob, including alignment padding
    between payloads (trailing padding excluded).
  */
  FCT_WRTR_API auto ResolveOffsets() -> uint64_t;

  [[nodiscard]] auto IsResolved() const noexcept -> bool { return resolved_; }

  //! Embedded payloads in insertion order, for container assembly.
  [[nodiscard]] auto Blobs() const -> const std::vector<std::vector<std::byte>>&
  {
    return blobs_;
  }

  //! URI generator for the given category.
  [[nodiscard]] auto UriGenerator(const ResourceCategory category) const
    -> const UniqueUriGenerator&
  {
    return generators_.at(static_cast<size_t>(category));
  }

private:
  auto PlaceEmbedded(std::span<const std::byte> payload) -> EmbeddedPlacement;
  auto PlaceExternal(std::span<const std::byte> payload, const Property& owner,
    ResourceCategory category, std::string_view extension) -> ExternalPlacement;

  NativeDocument& document_;
  ContainerMode mode_;
  uint64_t alignment_;
  std::array<UniqueUriGenerator, kResourceCategoryCount> generators_;

  std::vector<std::vector<std::byte>> blobs_;
  //! Buffer view index of each blob, parallel to `blobs_`.
  std::vector<uint32_t> pending_views_;
  std::unordered_map<std::string, const Property*> owner_by_name_;
  bool resolved_ = false;
};

} // namespace facet::writer
