// SPDX-License-Identifier: MIT

#include "pg_typemap/pg/numeric.hpp"

#include <charconv>
#include <functional>
#include <limits>
#include <system_error>

#include <fmt/format.h>

namespace pg_typemap::pg {

std::optional<Numeric> Numeric::parse(std::string_view text) {
    bool negative = false;
    if (!text.empty() && (text.front() == '-' || text.front() == '+')) {
        negative = text.front() == '-';
        text.remove_prefix(1);
    }

    std::string digits;
    digits.reserve(text.size() + 1);
    if (negative) {
        digits += '-';
    }

    int32_t scale = 0;
    bool seen_point = false;
    bool seen_digit = false;
    for (char c : text) {
        if (c == '.') {
            if (seen_point) return std::nullopt;
            seen_point = true;
            continue;
        }
        if (c < '0' || c > '9') return std::nullopt;
        digits += c;
        seen_digit = true;
        if (seen_point) ++scale;
    }
    if (!seen_digit) return std::nullopt;

    int64_t unscaled = 0;
    const char* end = digits.data() + digits.size();
    auto [ptr, ec] = std::from_chars(digits.data(), end, unscaled);
    if (ec != std::errc{} || ptr != end) return std::nullopt;

    return Numeric{unscaled, scale};
}

std::string Numeric::to_string() const {
    // Magnitude in unsigned arithmetic so INT64_MIN does not overflow.
    uint64_t magnitude = unscaled < 0 ? 0 - static_cast<uint64_t>(unscaled)
                                      : static_cast<uint64_t>(unscaled);
    std::string out = fmt::format("{}", magnitude);

    if (scale > 0) {
        auto frac = static_cast<std::size_t>(scale);
        if (out.size() <= frac) {
            out.insert(0, frac + 1 - out.size(), '0');
        }
        out.insert(out.size() - frac, 1, '.');
    } else if (scale < 0 && magnitude != 0) {
        out.append(static_cast<std::size_t>(-static_cast<int64_t>(scale)), '0');
    }
    if (unscaled < 0) {
        out.insert(0, 1, '-');
    }
    return out;
}

Numeric Numeric::normalized() const {
    Numeric n = *this;
    if (n.unscaled == 0) {
        return Numeric{0, 0};
    }
    while (n.unscaled % 10 == 0 && n.scale > std::numeric_limits<int32_t>::min()) {
        n.unscaled /= 10;
        --n.scale;
    }
    return n;
}

bool NumericComparer::equals(const Numeric& a, const Numeric& b) const {
    return a.normalized() == b.normalized();
}

std::size_t NumericComparer::hash(const Numeric& value) const {
    Numeric n = value.normalized();
    return hash_combine(std::hash<int64_t>{}(n.unscaled), std::hash<int32_t>{}(n.scale));
}

const std::shared_ptr<const NumericComparer>& NumericComparer::instance() {
    static const std::shared_ptr<const NumericComparer> comparer =
        std::make_shared<NumericComparer>();
    return comparer;
}

}  // namespace pg_typemap::pg
