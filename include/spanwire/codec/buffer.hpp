#pragma once

#include <string_view>
#include <type_traits>

#include "spanwire/core/types.hpp"

namespace spanwire::codec {
    using u8 = spanwire::core::u8;
    using u32 = spanwire::core::u32;
    using u64 = spanwire::core::u64;

    struct BufferView {
        const u8* data{nullptr};
        u32 len{0};
    };

    struct BufferMut {
        u8* data{nullptr};
        u32 len{0};
    };

    // Largest region a Buffer can address. Sizes are computed in u64 so a
    // total past this is reported rather than wrapped.
    inline constexpr u64 kMaxRegionBytes = 0xffffffffull;

    // Longest decimal rendering of a u64 (18446744073709551615).
    inline constexpr u32 kMaxDecimalDigits = 20;

    // Number of ASCII digits in the decimal rendering of v (no sign, no
    // leading zeros); 1 for zero.
    [[nodiscard]] constexpr u32 ascii_size_in_bytes(u64 v) noexcept {
        u32 digits = 1;
        while (v >= 10) {
            v /= 10;
            ++digits;
        }
        return digits;
    }

    // Forward-only byte sink over a caller-owned region. A write that does
    // not fit is dropped whole and latches overflowed(); every later write is
    // ignored, so the region is never exceeded.
    class Buffer {
    public:
        explicit Buffer(BufferMut out) noexcept : out_(out) {}

        Buffer& write_byte(u8 b) noexcept;

        // Pre-validated ASCII, copied as is.
        Buffer& write_ascii(std::string_view s) noexcept;

        // UTF-8 bytes that the caller already escaped.
        Buffer& write_utf8(std::string_view s) noexcept;

        Buffer& write_decimal(u64 v) noexcept;

        [[nodiscard]] u32 pos() const noexcept { return pos_; }
        [[nodiscard]] u32 remaining() const noexcept { return out_.len - pos_; }
        [[nodiscard]] bool overflowed() const noexcept { return overflowed_; }

    private:
        [[nodiscard]] bool reserve(u64 n) noexcept;

        BufferMut out_{};
        u32 pos_{0};
        bool overflowed_{false};
    };

    static_assert(std::is_trivially_copyable_v<BufferView>);
    static_assert(std::is_standard_layout_v<BufferView>);
    static_assert(std::is_trivially_copyable_v<BufferMut>);
    static_assert(std::is_standard_layout_v<BufferMut>);
} // namespace spanwire::codec
