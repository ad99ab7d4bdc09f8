#pragma once

#include <string_view>

#include "spanwire/core/errors.hpp"
#include "spanwire/core/models.hpp"

namespace spanwire::core {
    [[nodiscard]] constexpr bool is_lower_hex(std::string_view s) noexcept {
        if (s.empty()) {
            return false;
        }
        for (char c : s) {
            const bool digit = c >= '0' && c <= '9';
            const bool alpha = c >= 'a' && c <= 'f';
            if (!digit && !alpha) {
                return false;
            }
        }
        return true;
    }

    [[nodiscard]] constexpr bool trace_id_valid(std::string_view s) noexcept {
        return (s.size() == kSpanIdHexChars || s.size() == kTraceIdHexChars) && is_lower_hex(s);
    }

    [[nodiscard]] constexpr bool span_id_valid(std::string_view s) noexcept {
        return s.size() == kSpanIdHexChars && is_lower_hex(s);
    }

    // Checks the caller contract the writers rely on. Not used on the encode
    // path itself. aux carries the index of the first offending field:
    // 1 trace id, 2 id, 3 parent id, 4 kind.
    Status span_validate(const Span& span) noexcept;

} // namespace spanwire::core
