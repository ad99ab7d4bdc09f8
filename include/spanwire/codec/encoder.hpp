#pragma once

#include <type_traits>
#include <vector>

#include "spanwire/codec/buffer.hpp"
#include "spanwire/core/errors.hpp"
#include "spanwire/core/models.hpp"

namespace spanwire::codec {
    enum class Encoding : u8 {
        Json = 1,
    };

    [[nodiscard]] constexpr const char* encoding_name(Encoding e) noexcept {
        switch (e) {
        case Encoding::Json: return "JSON";
        }
        return nullptr;
    }

    // One table per wire format. A new format adds a table; the JSON one
    // does not change. Every write reports bytes written, 0 on a short region.
    struct SpanBytesEncoder {
        Encoding encoding{Encoding::Json};
        u64 (*size_in_bytes)(const spanwire::core::Span&) noexcept {nullptr};
        u32 (*write)(const spanwire::core::Span&, BufferMut) noexcept {nullptr};
        u64 (*list_size_in_bytes)(const spanwire::core::Span*, u32) noexcept {nullptr};
        u32 (*list_write)(const spanwire::core::Span*, u32, BufferMut) noexcept {nullptr};
    };

    // nullptr for an encoding this build does not know.
    [[nodiscard]] const SpanBytesEncoder* span_bytes_encoder(Encoding e) noexcept;

    // Sizes, allocates exactly that much and writes. A size past
    // kMaxRegionBytes is Codec/Unsupported. A written length that differs
    // from the computed one is reported as Codec/Corrupt. *out is left empty
    // on any failure.
    [[nodiscard]] spanwire::core::Status span_encode(const SpanBytesEncoder& enc,
        const spanwire::core::Span& span,
        std::vector<u8>* out);

    [[nodiscard]] spanwire::core::Status span_list_encode(const SpanBytesEncoder& enc,
        const spanwire::core::Span* spans,
        u32 count,
        std::vector<u8>* out);

    static_assert(std::is_trivially_copyable_v<SpanBytesEncoder>);
    static_assert(std::is_standard_layout_v<SpanBytesEncoder>);
} // namespace spanwire::codec
