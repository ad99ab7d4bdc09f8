#include "spanwire/codec/encoder.hpp"

#include <new>

#include "spanwire/codec/list_writer.hpp"
#include "spanwire/codec/span_writer.hpp"

namespace spanwire::codec {
    namespace {
        constexpr SpanBytesEncoder kJsonEncoder{
            Encoding::Json,
            &span_size_in_bytes,
            &span_write,
            &span_list_size_in_bytes,
            &span_list_write,
        };

        [[nodiscard]] spanwire::core::Status codec_status(spanwire::core::StatusCode code, u32 aux = 0) noexcept {
            return spanwire::core::make_status(spanwire::core::StatusDomain::Codec, code, aux);
        }

        [[nodiscard]] bool encoder_complete(const SpanBytesEncoder& enc) noexcept {
            return enc.size_in_bytes != nullptr && enc.write != nullptr && enc.list_size_in_bytes != nullptr &&
                   enc.list_write != nullptr;
        }

        // Shared tail of both encode paths: allocate exactly `size`, run the
        // writer, and insist it filled the allocation.
        template <typename WriteFn>
        [[nodiscard]] spanwire::core::Status encode_exact(u64 size, WriteFn&& write, std::vector<u8>* out) {
            out->clear();
            if (size > kMaxRegionBytes) {
                return codec_status(spanwire::core::StatusCode::Unsupported);
            }
            const u32 region_len = static_cast<u32>(size);
            try {
                out->resize(region_len);
            } catch (const std::bad_alloc&) {
                out->clear();
                return codec_status(spanwire::core::StatusCode::OutOfMemory, region_len);
            }

            const u32 written = write(BufferMut{out->data(), region_len});
            if (written != region_len) {
                out->clear();
                return codec_status(spanwire::core::StatusCode::Corrupt, written);
            }
            return spanwire::core::ok_status();
        }
    } // namespace

    const SpanBytesEncoder* span_bytes_encoder(Encoding e) noexcept {
        switch (e) {
        case Encoding::Json:
            return &kJsonEncoder;
        }
        return nullptr;
    }

    spanwire::core::Status span_encode(const SpanBytesEncoder& enc,
        const spanwire::core::Span& span,
        std::vector<u8>* out) {
        if (out == nullptr || !encoder_complete(enc)) {
            return codec_status(spanwire::core::StatusCode::Invalid);
        }
        const u64 size = enc.size_in_bytes(span);
        return encode_exact(size, [&](BufferMut region) { return enc.write(span, region); }, out);
    }

    spanwire::core::Status span_list_encode(const SpanBytesEncoder& enc,
        const spanwire::core::Span* spans,
        u32 count,
        std::vector<u8>* out) {
        if (out == nullptr || !encoder_complete(enc)) {
            return codec_status(spanwire::core::StatusCode::Invalid);
        }
        if (count > 0 && spans == nullptr) {
            return codec_status(spanwire::core::StatusCode::Invalid);
        }
        const u64 size = enc.list_size_in_bytes(spans, count);
        return encode_exact(size, [&](BufferMut region) { return enc.list_write(spans, count, region); }, out);
    }
} // namespace spanwire::codec
