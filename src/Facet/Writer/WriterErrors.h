//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace facet::writer {

//! Thrown when two different objects claim the same external resource name.
/*!
 Applies to declared URIs colliding with each other and to a declared URI
 colliding with a generated one. The resource side-table is left unchanged.
*/
class NamingConflictError final : public std::runtime_error {
public:
  NamingConflictError(std::string name, const std::string& message)
    : std::runtime_error(message)
    , name_(std::move(name))
  {
  }

  //! The contested resource name.
  [[nodiscard]] auto Name() const -> const std::string& { return name_; }

private:
  std::string name_;
};

//! Thrown by finalization when a definition references a missing entry.
/*!
 Indicates a caller ordering error, e.g. binding a texture whose image was
 never registered.
*/
class DanglingReferenceError final : public std::logic_error {
public:
  using logic_error::logic_error;
};

} // namespace facet::writer
