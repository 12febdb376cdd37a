//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>

#include <nlohmann/json.hpp>

#include <Facet/Writer/DefinitionKind.h>
#include <Facet/Writer/api_export.h>

namespace facet::writer {

//! Per-session writer configuration.
/*!
 Options can be built in code or loaded from a JSON options file:

 ```json
 {
   "container": "embedded",
   "image_basename": "texture",
   "buffer_basename": "scene",
   "multiple_images": true,
   "multiple_buffers": false,
   "blob_alignment": 4
 }
 ```

 All keys are optional; missing keys keep their defaults.
*/
struct WriterOptions final {
  //! Embedded blob or external files for binary payloads.
  ContainerMode container_mode = ContainerMode::kExternal;

  //! Base name for generated image resource names.
  std::string image_basename = "texture";

  //! Base name for generated buffer resource names.
  std::string buffer_basename = "buffer";

  //! Use `basename_N.ext` names for images (`basename.ext` otherwise).
  bool multiple_images = true;

  //! Use `basename_N.ext` names for buffers (`basename.ext` otherwise).
  bool multiple_buffers = false;

  //! Alignment, in bytes, of each payload inside the embedded blob.
  /*!
   Must be a power of two. The default of 1 packs payloads back to back.
  */
  uint32_t blob_alignment = 1;

  //! Base name used by the URI generator of `category`.
  [[nodiscard]] auto BasenameFor(const ResourceCategory category) const
    -> const std::string&
  {
    return category == ResourceCategory::kImage ? image_basename
                                                : buffer_basename;
  }

  //! Whether the URI generator of `category` runs in multi-resource mode.
  [[nodiscard]] auto MultipleFor(const ResourceCategory category) const -> bool
  {
    return category == ResourceCategory::kImage ? multiple_images
                                                : multiple_buffers;
  }

  //! Build options from a parsed JSON document.
  /*!
   The document is validated against the options schema first.

   @param json_data    Parsed options document.
   @param error_stream Receives one `ERROR:` line per problem.
   @return The options, or nullopt if the document is invalid.
  */
  FCT_WRTR_NDAPI static auto FromJson(const nlohmann::json& json_data,
    std::ostream& error_stream) -> std::optional<WriterOptions>;

  //! Load options from a JSON file.
  /*!
   @param options_path Path to the options file.
   @param error_stream Receives one `ERROR:` line per problem.
   @return The options, or nullopt if the file cannot be read or is invalid.
  */
  FCT_WRTR_NDAPI static auto Load(const std::filesystem::path& options_path,
    std::ostream& error_stream) -> std::optional<WriterOptions>;
};

} // namespace facet::writer
