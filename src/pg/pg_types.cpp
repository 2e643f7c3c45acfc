// SPDX-License-Identifier: MIT

#include "pg_typemap/pg/pg_types.hpp"

#include <iterator>

namespace pg_typemap::pg::detail {

std::string quote_literal(std::string_view s) {
    std::string result;
    result.reserve(s.size() + 2);
    result += '\'';
    for (char c : s) {
        if (c == '\'') {
            result += '\'';  // Double the quote
        }
        result += c;
    }
    result += '\'';
    return result;
}

std::string float_literal(double value, std::string_view type_name) {
    if (std::isfinite(value)) {
        return fmt::format("{}", value);
    }
    std::string out;
    auto it = std::back_inserter(out);
    if (std::isnan(value)) {
        fmt::format_to(it, "'NaN'::{}", type_name);
    } else if (value > 0) {
        fmt::format_to(it, "'Infinity'::{}", type_name);
    } else {
        fmt::format_to(it, "'-Infinity'::{}", type_name);
    }
    return out;
}

}  // namespace pg_typemap::pg::detail
