#include "spanwire/codec/json_escape.hpp"

#include <cstddef>
#include <string>

namespace spanwire::codec {
    namespace {
        constexpr char kHex[] = "0123456789abcdef";

        constexpr u32 kUnicodeEscapeBytes = 6;

        // U+2028 / U+2029 in UTF-8 are E2 80 A8 / E2 80 A9.
        constexpr u8 kSeparatorLead0 = 0xe2;
        constexpr u8 kSeparatorLead1 = 0x80;
        constexpr u8 kLineSeparatorTail = 0xa8;
        constexpr u8 kParagraphSeparatorTail = 0xa9;
        constexpr u32 kSeparatorBytes = 3;

        // Size of the escape for a single byte; 1 when it is copied verbatim.
        [[nodiscard]] constexpr u32 byte_escaped_size(u8 c) noexcept {
            switch (c) {
            case '"':
            case '\\':
            case '\b':
            case '\f':
            case '\n':
            case '\r':
            case '\t':
                return 2;
            default:
                return c < 0x20 ? kUnicodeEscapeBytes : 1;
            }
        }

        [[nodiscard]] bool separator_at(const u8* p, size_t remaining) noexcept {
            return remaining >= kSeparatorBytes && p[0] == kSeparatorLead0 && p[1] == kSeparatorLead1 &&
                   (p[2] == kLineSeparatorTail || p[2] == kParagraphSeparatorTail);
        }

        // Appends to a std::string with the Buffer calls escape_into uses.
        class StringSink {
        public:
            explicit StringSink(std::string* out) noexcept : out_(out) {}

            StringSink& write_ascii(std::string_view s) {
                out_->append(s);
                return *this;
            }

            StringSink& write_utf8(std::string_view s) { return write_ascii(s); }

        private:
            std::string* out_;
        };

        template <typename Sink>
        void write_unicode_escape(u8 hi, u8 lo, Sink& b) {
            const char seq[kUnicodeEscapeBytes] = {
                '\\', 'u',
                kHex[hi >> 4], kHex[hi & 0x0f],
                kHex[lo >> 4], kHex[lo & 0x0f],
            };
            b.write_ascii(std::string_view(seq, sizeof(seq)));
        }

        template <typename Sink>
        void write_escaped_byte(u8 c, Sink& b) {
            switch (c) {
            case '"': b.write_ascii("\\\""); return;
            case '\\': b.write_ascii("\\\\"); return;
            case '\b': b.write_ascii("\\b"); return;
            case '\f': b.write_ascii("\\f"); return;
            case '\n': b.write_ascii("\\n"); return;
            case '\r': b.write_ascii("\\r"); return;
            case '\t': b.write_ascii("\\t"); return;
            default: write_unicode_escape(0x00, c, b); return;
            }
        }

        template <typename Sink>
        void escape_into(std::string_view s, Sink& b) {
            const u8* p = reinterpret_cast<const u8*>(s.data());
            const size_t n = s.size();
            size_t i = 0;
            size_t run = 0; // start of the pending verbatim run
            while (i < n) {
                if (separator_at(p + i, n - i)) {
                    b.write_utf8(s.substr(run, i - run));
                    write_unicode_escape(0x20, p[i + 2] == kLineSeparatorTail ? 0x28 : 0x29, b);
                    i += kSeparatorBytes;
                    run = i;
                    continue;
                }
                if (byte_escaped_size(p[i]) != 1) {
                    b.write_utf8(s.substr(run, i - run));
                    write_escaped_byte(p[i], b);
                    run = i + 1;
                }
                ++i;
            }
            b.write_utf8(s.substr(run, n - run));
        }
    } // namespace

    u64 json_escaped_size_in_bytes(std::string_view s) noexcept {
        const u8* p = reinterpret_cast<const u8*>(s.data());
        const size_t n = s.size();
        u64 size = 0;
        size_t i = 0;
        while (i < n) {
            if (separator_at(p + i, n - i)) {
                size += kUnicodeEscapeBytes;
                i += kSeparatorBytes;
                continue;
            }
            size += byte_escaped_size(p[i]);
            ++i;
        }
        return size;
    }

    void json_escape(std::string_view s, Buffer& b) noexcept {
        escape_into(s, b);
    }

    std::string json_escape(std::string_view s) {
        std::string out;
        out.reserve(static_cast<size_t>(json_escaped_size_in_bytes(s)));
        StringSink sink(&out);
        escape_into(s, sink);
        return out;
    }
} // namespace spanwire::codec
