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
#include <unordered_map>

#include <Facet/Base/Macros.h>
#include <Facet/Writer/DefinitionKind.h>
#include <Facet/Writer/api_export.h>

namespace facet::writer {

class Property;
struct NativeDocument;

//! Maps graph objects to their index in the output definition arrays.
/*!
 One table per DefinitionKind, keyed by object address. The registry does
 not own the properties it references; they must outlive it.

 Registration is write-once: the first `Register()` for a (kind, property)
 pair appends an empty placeholder definition to the kind's array and
 returns its position; later calls return the same index without touching
 the document. Callers fill in the placeholder's fields.

 @see DefinitionInterner for value-keyed definitions.
*/
class IndexRegistry final {
public:
  FCT_WRTR_API explicit IndexRegistry(NativeDocument& document);
  ~IndexRegistry() = default;

  FACET_MAKE_NON_COPYABLE(IndexRegistry)
  FACET_MAKE_NON_MOVABLE(IndexRegistry)

  //! Index previously registered for `property` in `kind`, if any.
  FCT_WRTR_NDAPI auto IndexOf(DefinitionKind kind,
    const Property& property) const -> std::optional<uint32_t>;

  //! Returns the existing index, or allocates the next one in `kind`.
  FCT_WRTR_API auto Register(DefinitionKind kind, const Property& property)
    -> uint32_t;

  [[nodiscard]] auto Contains(
    const DefinitionKind kind, const Property& property) const -> bool
  {
    return IndexOf(kind, property).has_value();
  }

  //! Number of properties registered in `kind`.
  FCT_WRTR_NDAPI auto Count(DefinitionKind kind) const -> size_t;

private:
  using IndexTable = std::unordered_map<const Property*, uint32_t>;

  NativeDocument& document_;
  std::array<IndexTable, kDefinitionKindCount> tables_;
};

} // namespace facet::writer
