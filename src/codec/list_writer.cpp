#include "spanwire/codec/list_writer.hpp"

#include <string_view>

#include "spanwire/codec/span_writer.hpp"

namespace spanwire::codec {
    u64 span_list_size_in_bytes(const spanwire::core::Span* spans, u32 count) noexcept {
        u64 size = 2; // []
        if (spans == nullptr || count == 0) {
            return size;
        }
        size += count - 1; // commas between elements
        for (u32 i = 0; i < count; ++i) {
            size += span_size_in_bytes(spans[i]);
        }
        return size;
    }

    void span_list_write(const spanwire::core::Span* spans, u32 count, Buffer& b) noexcept {
        b.write_byte('[');
        if (spans != nullptr) {
            for (u32 i = 0; i < count; ++i) {
                if (i > 0) b.write_byte(',');
                span_write(spans[i], b);
            }
        }
        b.write_byte(']');
    }

    u32 span_list_write(const spanwire::core::Span* spans, u32 count, BufferMut out) noexcept {
        Buffer b(out);
        span_list_write(spans, count, b);
        if (b.overflowed()) {
            return 0;
        }
        return b.pos();
    }

    u64 json_list_size_in_bytes(const BufferView* items, u32 count) noexcept {
        u64 size = 2; // []
        if (items == nullptr || count == 0) {
            return size;
        }
        size += count - 1; // commas between elements
        for (u32 i = 0; i < count; ++i) {
            size += items[i].len;
        }
        return size;
    }

    u32 json_list_write(const BufferView* items, u32 count, BufferMut out) noexcept {
        Buffer b(out);
        b.write_byte('[');
        if (items != nullptr) {
            for (u32 i = 0; i < count; ++i) {
                if (i > 0) b.write_byte(',');
                if (items[i].len > 0 && items[i].data == nullptr) {
                    return 0;
                }
                b.write_utf8(std::string_view(reinterpret_cast<const char*>(items[i].data), items[i].len));
            }
        }
        b.write_byte(']');
        if (b.overflowed()) {
            return 0;
        }
        return b.pos();
    }
} // namespace spanwire::codec
