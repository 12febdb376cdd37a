//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <string>
#include <string_view>

#include <Facet/Writer/api_export.h>

namespace facet::writer {

//! File extension (without dot) for an image MIME type.
/*!
 Known types map to their conventional extension (`image/jpeg` to `jpg`).
 Other types use the subtype after the slash; a type with no subtype maps
 to `bin`.
*/
FCT_WRTR_NDAPI auto MimeTypeToExtension(std::string_view mime_type)
  -> std::string;

} // namespace facet::writer
