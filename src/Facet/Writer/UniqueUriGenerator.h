//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include <Facet/Writer/api_export.h>

namespace facet::writer {

class Property;

//! Produces file names for externally stored resources of one category.
/*!
 Naming policy, in order:

 1. A property that declares a URI gets that URI verbatim. The counter is not
    advanced, so repeated calls are stable.
 2. In single-resource mode every other property gets `basename.ext`.
 3. In multi-resource mode every other property gets `basename_N.ext`, with N
    starting at 1 and incremented on each such call.

 Generated names never collide with each other within one generator.
 Collisions with declared names are detected by the ResourceRouter, not
 here. Use one generator per resource category per session.
*/
class UniqueUriGenerator final {
public:
  UniqueUriGenerator(const bool multiple, std::string basename)
    : multiple_(multiple)
    , basename_(std::move(basename))
  {
  }

  //! Name for `property`'s payload with the given extension (no dot).
  FCT_WRTR_NDAPI auto CreateUri(
    const Property& property, std::string_view extension) -> std::string;

  [[nodiscard]] auto IsMultiple() const noexcept -> bool { return multiple_; }
  [[nodiscard]] auto Basename() const -> const std::string&
  {
    return basename_;
  }

  //! Suffix the next generated multi-resource name will use.
  [[nodiscard]] auto NextCounter() const noexcept -> uint32_t
  {
    return counter_;
  }

private:
  bool multiple_;
  std::string basename_;
  uint32_t counter_ = 1;
};

} // namespace facet::writer
