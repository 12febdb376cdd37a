//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include <Facet/Base/Macros.h>
#include <Facet/Writer/DefinitionKind.h>
#include <Facet/Writer/api_export.h>

namespace facet::writer {

struct NativeDocument;
struct TextureSampler;

//! Canonical form of a definition record, used as its deduplication key.
/*!
 Null-valued object members are dropped recursively, then the record is
 serialized compactly. nlohmann::json keeps object members sorted by key, so
 the result does not depend on the order in which members were set.
*/
FCT_WRTR_NDAPI auto CanonicalKey(const nlohmann::json& record) -> std::string;

//! Sampler definition derived from texture filter and wrap settings.
/*!
 Filters equal to 0 (unset) are omitted so that an implicit default and an
 explicit default produce the same record. Wrap modes are always present.
*/
FCT_WRTR_NDAPI auto MakeSamplerDef(const TextureSampler& sampler)
  -> nlohmann::json;

//! Texture binding definition referencing an image and a resolved sampler.
/*!
 `source` is omitted when `image_index` is empty. Such a record is a dangling
 texture binding and is rejected by WriterContext::Finalize().
*/
FCT_WRTR_NDAPI auto MakeTextureDef(std::optional<uint32_t> image_index,
  uint32_t sampler_index) -> nlohmann::json;

//! Deduplicates value-typed definitions by canonical content.
/*!
 Unlike IndexRegistry, interned records have no object identity: two records
 with the same canonical key share one entry and one index in the kind's
 definition array.

 Nested references must already be resolved to indices before interning, so
 composite records are interned bottom-up (sampler before texture).
*/
class DefinitionInterner final {
public:
  FCT_WRTR_API explicit DefinitionInterner(NativeDocument& document);
  ~DefinitionInterner() = default;

  FACET_MAKE_NON_COPYABLE(DefinitionInterner)
  FACET_MAKE_NON_MOVABLE(DefinitionInterner)

  //! Returns the index of an equal record in `kind`, appending it if new.
  FCT_WRTR_API auto Intern(DefinitionKind kind, const nlohmann::json& record)
    -> uint32_t;

  //! Number of distinct records interned in `kind`.
  FCT_WRTR_NDAPI auto UniqueCount(DefinitionKind kind) const -> size_t;

  //! Number of Intern() calls for `kind`, including the deduplicated ones.
  FCT_WRTR_NDAPI auto RequestCount(DefinitionKind kind) const -> size_t;

private:
  struct KeyTable {
    std::unordered_map<std::string, uint32_t> index_by_key;
    size_t requests = 0;
  };

  NativeDocument& document_;
  std::array<KeyTable, kDefinitionKindCount> tables_;
};

} // namespace facet::writer
