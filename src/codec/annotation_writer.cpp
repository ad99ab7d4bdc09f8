#include "spanwire/codec/annotation_writer.hpp"

#include "spanwire/codec/json_escape.hpp"

namespace spanwire::codec {
    u64 annotation_size_in_bytes(const spanwire::core::Annotation& a) noexcept {
        return u64{kAnnotationFixedBytes} + ascii_size_in_bytes(a.timestamp) + json_escaped_size_in_bytes(a.value);
    }

    void annotation_write(const spanwire::core::Annotation& a, Buffer& b) noexcept {
        b.write_ascii("{\"timestamp\":").write_decimal(a.timestamp);
        b.write_ascii(",\"value\":\"");
        json_escape(a.value, b);
        b.write_ascii("\"}");
    }
} // namespace spanwire::codec
