#pragma once

#include "spanwire/codec/buffer.hpp"
#include "spanwire/core/models.hpp"

namespace spanwire::codec {
    // {"timestamp":N,"value":".."}
    inline constexpr u32 kAnnotationFixedBytes = 25;

    [[nodiscard]] u64 annotation_size_in_bytes(const spanwire::core::Annotation& a) noexcept;

    void annotation_write(const spanwire::core::Annotation& a, Buffer& b) noexcept;

} // namespace spanwire::codec
