//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#if defined(_WIN32) || defined(_WIN64)
#  ifdef FCT_WRTR_STATIC
#    define FCT_WRTR_API
#  else
#    ifdef FCT_WRTR_EXPORTS
#      define FCT_WRTR_API __declspec(dllexport)
#    else
#      define FCT_WRTR_API __declspec(dllimport)
#    endif
#  endif
#elif defined(__APPLE__) || defined(__linux__)
#  ifdef FCT_WRTR_EXPORTS
#    define FCT_WRTR_API __attribute__((visibility("default")))
#  else
#    define FCT_WRTR_API
#  endif
#else
#  define FCT_WRTR_API
#endif

#define FCT_WRTR_NDAPI [[nodiscard]] FCT_WRTR_API
