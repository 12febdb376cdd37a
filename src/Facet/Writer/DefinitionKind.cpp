//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <Facet/Writer/DefinitionKind.h>

namespace facet::writer {

auto to_string(const DefinitionKind value) -> const char*
{
  switch (value) {
    // clang-format off
    case DefinitionKind::kScene:      return "Scene";
    case DefinitionKind::kNode:       return "Node";
    case DefinitionKind::kMesh:       return "Mesh";
    case DefinitionKind::kMaterial:   return "Material";
    case DefinitionKind::kSkin:       return "Skin";
    case DefinitionKind::kCamera:     return "Camera";
    case DefinitionKind::kAccessor:   return "Accessor";
    case DefinitionKind::kImage:      return "Image";
    case DefinitionKind::kSampler:    return "Sampler";
    case DefinitionKind::kTexture:    return "Texture";
    case DefinitionKind::kBufferView: return "BufferView";
    case DefinitionKind::kBuffer:     return "Buffer";
    // clang-format on
  }

  return "__NotSupported__";
}

auto ArrayName(const DefinitionKind kind) -> const char*
{
  switch (kind) {
    // clang-format off
    case DefinitionKind::kScene:      return "scenes";
    case DefinitionKind::kNode:       return "nodes";
    case DefinitionKind::kMesh:       return "meshes";
    case DefinitionKind::kMaterial:   return "materials";
    case DefinitionKind::kSkin:       return "skins";
    case DefinitionKind::kCamera:     return "cameras";
    case DefinitionKind::kAccessor:   return "accessors";
    case DefinitionKind::kImage:      return "images";
    case DefinitionKind::kSampler:    return "samplers";
    case DefinitionKind::kTexture:    return "textures";
    case DefinitionKind::kBufferView: return "bufferViews";
    case DefinitionKind::kBuffer:     return "buffers";
    // clang-format on
  }

  return "__NotSupported__";
}

auto to_string(const ResourceCategory value) -> const char*
{
  switch (value) {
    // clang-format off
    case ResourceCategory::kImage:  return "Image";
    case ResourceCategory::kBuffer: return "Buffer";
    // clang-format on
  }

  return "__NotSupported__";
}

auto to_string(const ContainerMode value) -> const char*
{
  switch (value) {
    // clang-format off
    case ContainerMode::kEmbedded: return "Embedded";
    case ContainerMode::kExternal: return "External";
    // clang-format on
  }

  return "__NotSupported__";
}

} // namespace facet::writer
