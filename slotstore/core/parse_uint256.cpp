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

#include <slotstore/core/config.hpp>
#include <slotstore/core/int.hpp>
#include <slotstore/core/likely.h>
#include <slotstore/core/parse_uint256.hpp>
#include <slotstore/core/result.hpp>

#include <boost/outcome/config.hpp>
#include <boost/outcome/success_failure.hpp>

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string_view>

SLOTSTORE_ANONYMOUS_NAMESPACE_BEGIN

std::optional<uint64_t> digit_value(char const c, unsigned const base)
{
    uint64_t d = 0;
    if (c >= '0' && c <= '9') {
        d = static_cast<uint64_t>(c - '0');
    }
    else if (base == 16 && c >= 'a' && c <= 'f') {
        d = static_cast<uint64_t>(c - 'a' + 10);
    }
    else if (base == 16 && c >= 'A' && c <= 'F') {
        d = static_cast<uint64_t>(c - 'A' + 10);
    }
    else {
        return std::nullopt;
    }
    return d;
}

SLOTSTORE_ANONYMOUS_NAMESPACE_END

SLOTSTORE_NAMESPACE_BEGIN

Result<uint256_t> parse_uint256(std::string_view input)
{
    unsigned base = 10;
    if (input.size() >= 2 && input[0] == '0' &&
        (input[1] == 'x' || input[1] == 'X')) {
        base = 16;
        input.remove_prefix(2);
    }

    if (SLOTSTORE_UNLIKELY(input.empty())) {
        return ParseError::Empty;
    }

    // x * base + d <= UINT256_MAX  <=>  x <= (UINT256_MAX - d) / base
    uint256_t x = 0;
    for (char const c : input) {
        auto const d = digit_value(c, base);
        if (SLOTSTORE_UNLIKELY(!d.has_value())) {
            return ParseError::InvalidDigit;
        }
        if (SLOTSTORE_UNLIKELY(x > (UINT256_MAX - *d) / base)) {
            return ParseError::DomainViolation;
        }
        x = x * base + *d;
    }
    return x;
}

SLOTSTORE_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<slotstore::ParseError>::mapping> const &
quick_status_code_from_enum<slotstore::ParseError>::value_mappings()
{
    using slotstore::ParseError;

    static std::initializer_list<mapping> const v = {
        {ParseError::Success, "success", {errc::success}},
        {ParseError::Empty, "empty input", {}},
        {ParseError::InvalidDigit, "invalid digit", {errc::invalid_argument}},
        {ParseError::DomainViolation,
         "value exceeds 2^256 - 1",
         {errc::result_out_of_range}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
