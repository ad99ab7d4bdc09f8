#pragma once

#include "spanwire/codec/buffer.hpp"
#include "spanwire/core/models.hpp"

namespace spanwire::codec {
    // [span,span,...]; zero spans encode as [].
    [[nodiscard]] u64 span_list_size_in_bytes(const spanwire::core::Span* spans, u32 count) noexcept;

    void span_list_write(const spanwire::core::Span* spans, u32 count, Buffer& b) noexcept;

    // Returns bytes written, 0 if the region was too small.
    [[nodiscard]] u32 span_list_write(const spanwire::core::Span* spans, u32 count, BufferMut out) noexcept;

    // Joins already encoded JSON values (e.g. spans a reporter buffered
    // earlier) into one array without re-encoding them.
    [[nodiscard]] u64 json_list_size_in_bytes(const BufferView* items, u32 count) noexcept;

    [[nodiscard]] u32 json_list_write(const BufferView* items, u32 count, BufferMut out) noexcept;

} // namespace spanwire::codec
