//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

// use this inside a class declaration to make it non-copyable
#define FACET_MAKE_NON_COPYABLE(Type)                                          \
  Type(const Type&) = delete;                                                  \
  auto operator=(const Type&)->Type& = delete;

// use this inside a class declaration to make it non-movable
// NOLINTBEGIN
#define FACET_MAKE_NON_MOVABLE(Type)                                           \
  Type(Type&&) = delete;                                                       \
  auto operator=(Type&&)->Type& = delete;
// NOLINTEND

