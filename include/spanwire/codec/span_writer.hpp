#pragma once

#include "spanwire/codec/buffer.hpp"
#include "spanwire/core/models.hpp"

namespace spanwire::codec {
    // Zipkin v2 JSON. Member order is fixed:
    //   traceId, parentId, id, kind, name, timestamp, duration, localEndpoint,
    //   remoteEndpoint, annotations, tags, debug, shared
    // Absent members are omitted; empty annotations/tags are omitted; debug
    // and shared appear only when true.
    //
    // Ids are written verbatim and sized by their actual length, so the size
    // always matches what span_write emits. Id format is not checked here
    // (see span_validate).
    [[nodiscard]] u64 span_size_in_bytes(const spanwire::core::Span& s) noexcept;

    void span_write(const spanwire::core::Span& s, Buffer& b) noexcept;

    // Writes into a caller region. Returns bytes written, 0 if the region was
    // too small (nothing past out.len is touched).
    [[nodiscard]] u32 span_write(const spanwire::core::Span& s, BufferMut out) noexcept;

} // namespace spanwire::codec
