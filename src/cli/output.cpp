#include "spanwire/cli/output.hpp"

#include <cerrno>

namespace spanwire::cli {
    namespace {
        [[nodiscard]] spanwire::core::Status io_error(int err) noexcept {
            return spanwire::core::make_status(spanwire::core::StatusDomain::Cli, spanwire::core::StatusCode::Io,
                                               static_cast<spanwire::core::u32>(err));
        }

        [[nodiscard]] bool write_all(std::FILE* f, spanwire::codec::BufferView bytes) noexcept {
            if (bytes.len == 0) {
                return true;
            }
            if (bytes.data == nullptr) {
                errno = EINVAL;
                return false;
            }
            return std::fwrite(bytes.data, 1, bytes.len, f) == bytes.len;
        }
    } // namespace

    spanwire::core::Status output_write_stream(std::FILE* stream, spanwire::codec::BufferView bytes) noexcept {
        if (stream == nullptr) {
            return spanwire::core::make_status(spanwire::core::StatusDomain::Cli, spanwire::core::StatusCode::Invalid);
        }
        errno = 0;
        if (!write_all(stream, bytes) || std::fputc('\n', stream) == EOF || std::fflush(stream) != 0) {
            return io_error(errno != 0 ? errno : EIO);
        }
        return spanwire::core::ok_status();
    }

    spanwire::core::Status output_write_file(const char* path, spanwire::codec::BufferView bytes) noexcept {
        if (path == nullptr) {
            return spanwire::core::make_status(spanwire::core::StatusDomain::Cli, spanwire::core::StatusCode::Invalid);
        }
        std::FILE* f = std::fopen(path, "wb");
        if (f == nullptr) {
            return io_error(errno);
        }
        errno = 0;
        if (!write_all(f, bytes)) {
            const int write_errno = errno != 0 ? errno : EIO;
            (void)std::fclose(f); // the write error is the one reported
            return io_error(write_errno);
        }
        errno = 0;
        if (std::fclose(f) != 0) {
            return io_error(errno != 0 ? errno : EIO);
        }
        return spanwire::core::ok_status();
    }
} // namespace spanwire::cli
