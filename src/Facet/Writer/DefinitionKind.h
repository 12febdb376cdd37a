//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>

#include <Facet/Writer/api_export.h>

namespace facet::writer {

//! Kind of definition array in the output document.
/*!
 Each kind maps to one top-level array of the definition tree. Indices are
 allocated independently per kind, so a node and a mesh may both have
 index 0.
*/
enum class DefinitionKind : uint8_t {
  kScene = 0,
  kNode,
  kMesh,
  kMaterial,
  kSkin,
  kCamera,
  kAccessor,
  kImage,
  kSampler,
  kTexture,
  kBufferView,
  kBuffer,
};

//! Number of distinct DefinitionKind values.
inline constexpr size_t kDefinitionKindCount = 12;

//! String representation of enum values in `DefinitionKind`.
FCT_WRTR_NDAPI auto to_string(DefinitionKind value) -> const char*;

//! Name of the document array holding definitions of the given kind.
/*!
 @return The glTF member name, e.g. `"bufferViews"` for kBufferView.
*/
FCT_WRTR_NDAPI auto ArrayName(DefinitionKind kind) -> const char*;

//! Category of externally addressable binary resources.
/*!
 Each category gets its own URI allocator so that images and buffers never
 compete for the same counter.
*/
enum class ResourceCategory : uint8_t {
  kImage = 0,
  kBuffer,
};

//! Number of distinct ResourceCategory values.
inline constexpr size_t kResourceCategoryCount = 2;

//! String representation of enum values in `ResourceCategory`.
FCT_WRTR_NDAPI auto to_string(ResourceCategory value) -> const char*;

//! Where binary payloads end up.
enum class ContainerMode : uint8_t {
  //! Payloads are packed into one shared blob, addressed by byte range.
  kEmbedded = 0,

  //! Payloads are written as separately named resources.
  kExternal,
};

//! String representation of enum values in `ContainerMode`.
FCT_WRTR_NDAPI auto to_string(ContainerMode value) -> const char*;

} // namespace facet::writer
