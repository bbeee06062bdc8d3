// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#pragma once

#include <slotstore/core/likely.h>

#ifdef __cplusplus
extern "C"
{
#endif

__attribute__((noreturn)) void slotstore_assertion_failed(
    char const *expr, char const *function, char const *file, long line);

#ifdef __cplusplus
}
#endif

#define SLOTSTORE_ASSERT(expr)                                                 \
    (SLOTSTORE_LIKELY(!!(expr))                                                \
         ? ((void)0)                                                           \
         : slotstore_assertion_failed(                                         \
               #expr, __PRETTY_FUNCTION__, __FILE__, __LINE__))
