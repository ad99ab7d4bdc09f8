#include "spanwire/codec/buffer.hpp"

#include <cstring>

namespace spanwire::codec {
    bool Buffer::reserve(u64 n) noexcept {
        if (overflowed_) {
            return false;
        }
        if (out_.data == nullptr || n > out_.len - pos_) {
            overflowed_ = true;
            return false;
        }
        return true;
    }

    Buffer& Buffer::write_byte(u8 b) noexcept {
        if (!reserve(1)) {
            return *this;
        }
        out_.data[pos_++] = b;
        return *this;
    }

    Buffer& Buffer::write_ascii(std::string_view s) noexcept {
        if (s.empty()) {
            return *this;
        }
        if (!reserve(s.size())) {
            return *this;
        }
        const u32 n = static_cast<u32>(s.size());
        std::memcpy(out_.data + pos_, s.data(), n);
        pos_ += n;
        return *this;
    }

    Buffer& Buffer::write_utf8(std::string_view s) noexcept {
        // No transcoding: strings are held as UTF-8 already.
        return write_ascii(s);
    }

    Buffer& Buffer::write_decimal(u64 v) noexcept {
        char digits[kMaxDecimalDigits];
        char* p = digits + sizeof(digits);
        do {
            *--p = static_cast<char>('0' + (v % 10));
            v /= 10;
        } while (v > 0);
        return write_ascii(std::string_view(p, static_cast<size_t>(digits + sizeof(digits) - p)));
    }
} // namespace spanwire::codec
