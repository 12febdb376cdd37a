//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

// Single include point for logging. Facet formats log messages with fmt
// syntax ("{}" placeholders); the build defines LOGURU_USE_FMTLIB=1 for every
// target that links loguru.
#if !defined(LOGURU_USE_FMTLIB) || !LOGURU_USE_FMTLIB
#  error "Facet requires loguru built with LOGURU_USE_FMTLIB=1"
#endif

#include <loguru.hpp>
