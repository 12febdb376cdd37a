//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <string_view>

namespace facet::writer {

inline constexpr std::string_view kWriterOptionsSchema = R"({
"$schema": "http://json-schema.org/draft-07/schema#",
"title": "Facet Writer Options",
"type": "object",
"additionalProperties": false,
"properties": {
    "container": {
        "type": "string",
        "enum": ["embedded", "external"]
    },
    "image_basename": {
        "$ref": "#/definitions/basename"
    },
    "buffer_basename": {
        "$ref": "#/definitions/basename"
    },
    "multiple_images": {
        "type": "boolean"
    },
    "multiple_buffers": {
        "type": "boolean"
    },
    "blob_alignment": {
        "type": "integer",
        "minimum": 1,
        "maximum": 65536
    }
},
"definitions": {
    "basename": {
        "type": "string",
        "minLength": 1,
        "pattern": "^[^/\\\\]+$"
    }
}
})";

} // namespace facet::writer
