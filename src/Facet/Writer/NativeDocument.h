//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include <Facet/Writer/DefinitionKind.h>
#include <Facet/Writer/api_export.h>

namespace facet::writer {

//! The serialized form under construction: definition tree plus resources.
/*!
 The definition tree is a JSON object holding one array per
 DefinitionKind. Arrays are created on first access and are append-only: an
 index handed out for an entry stays valid for the life of the document, and
 other definitions refer to it by position.

 `resources` is the side-table of externally named payloads (name to raw
 bytes) for writers that persist multiple files.
*/
struct NativeDocument final {
  nlohmann::json json = nlohmann::json::object();
  std::map<std::string, std::vector<std::byte>> resources;

  //! Definition array for the given kind, created empty if missing.
  FCT_WRTR_NDAPI auto Definitions(DefinitionKind kind) -> nlohmann::json&;

  //! Number of definitions of the given kind, 0 if the array is missing.
  FCT_WRTR_NDAPI auto DefinitionCount(DefinitionKind kind) const -> size_t;
};

} // namespace facet::writer
