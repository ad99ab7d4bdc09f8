#pragma once

#include <cstdint>
#include <cstddef>
#include <type_traits>

namespace spanwire::core {

    using u8 = std::uint8_t;
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;
    using u64 = std::uint64_t;

    using i64 = std::int64_t;

    // Epoch microseconds, as carried on the wire.
    using TimestampMicros = u64;
    using DurationMicros = u64;

    inline constexpr u32 kSpanIdHexChars = 16;
    inline constexpr u32 kTraceIdHexChars = 32;

    static_assert(sizeof(TimestampMicros) == 8);

} // namespace spanwire::core
