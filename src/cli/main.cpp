#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <array>
#include <vector>

#include "spanwire/cli/commands.hpp"
#include "spanwire/cli/options.hpp"
#include "spanwire/cli/output.hpp"
#include "spanwire/cli/span_args.hpp"
#include "spanwire/codec/encoder.hpp"
#include "spanwire/core/errors.hpp"
#include "spanwire/core/validate.hpp"

// ========================================================================
// Configuration
// ========================================================================

namespace {

constexpr const char* kServiceNameEnv = "SPANWIRE_SERVICE_NAME";

// Every option may appear at most this many times in total.
constexpr spanwire::core::u32 kMaxParsedOptions = 256;

const std::array<spanwire::cli::CommandSpec, 3> g_commands = {{
    {spanwire::cli::CommandId::Help, "help"},
    {spanwire::cli::CommandId::Encode, "encode"},
    {spanwire::cli::CommandId::Size, "size"},
}};

// ========================================================================
// Error Handling
// ========================================================================

void print_error(const char* msg) {
    fprintf(stderr, "error: %s\n", msg);
}

void print_status_error_detailed(const char* context, spanwire::core::Status s) {
    fprintf(stderr,
            "error: %s failed (code=%s/%u, domain=%s/%u, aux=%u)\n",
            context,
            spanwire::core::status_code_name(s.code),
            static_cast<unsigned>(s.code),
            spanwire::core::status_domain_name(s.domain),
            static_cast<unsigned>(s.domain),
            s.aux);
    if (s.code == spanwire::core::StatusCode::Io && s.aux != 0) {
        fprintf(stderr, "error: %s: %s\n", context, std::strerror(static_cast<int>(s.aux)));
    }
}

const char* span_field_name(spanwire::core::u32 field) {
    switch (field) {
        case 1: return "trace id (16 or 32 lower-hex chars)";
        case 2: return "id (16 lower-hex chars)";
        case 3: return "parent id (16 lower-hex chars)";
        case 4: return "kind";
        default: return "span";
    }
}

// ========================================================================
// Output
// ========================================================================

spanwire::core::Status write_output(const char* path, const std::vector<spanwire::core::u8>& bytes) {
    const spanwire::codec::BufferView view{bytes.data(), static_cast<spanwire::core::u32>(bytes.size())};
    if (path == nullptr) {
        return spanwire::cli::output_write_stream(stdout, view);
    }
    return spanwire::cli::output_write_file(path, view);
}

void print_encode_error(spanwire::core::Status s) {
    if (s.code == spanwire::core::StatusCode::Unsupported) {
        fprintf(stderr, "error: encoded output exceeds %llu bytes\n",
                static_cast<unsigned long long>(spanwire::codec::kMaxRegionBytes));
        return;
    }
    print_status_error_detailed("encode", s);
}

// ========================================================================
// Request Assembly
// ========================================================================

bool build_request(const spanwire::cli::CliArgs& args, spanwire::cli::EncodeRequest* req) {
    spanwire::core::u32 spec_count = 0;
    const spanwire::cli::OptionSpec* specs = spanwire::cli::span_option_specs(&spec_count);

    std::array<spanwire::cli::ParsedOption, kMaxParsedOptions> storage{};
    spanwire::cli::ParsedOptions opts{storage.data(), 0, kMaxParsedOptions};
    spanwire::core::u32 consumed = 0;
    spanwire::core::Status s = spanwire::cli::parse_options(args, specs, spec_count, &opts, &consumed);
    if (!spanwire::core::is_ok(s)) {
        print_error("invalid option, unknown option or missing value (see 'spanwire help')");
        return false;
    }
    if (consumed != args.argc) {
        fprintf(stderr, "error: unexpected argument %s\n", args.argv[consumed]);
        return false;
    }

    s = spanwire::cli::span_request_from_options(opts, std::getenv(kServiceNameEnv), req);
    if (!spanwire::core::is_ok(s)) {
        if (s.code == spanwire::core::StatusCode::Invalid && s.aux < opts.len) {
            const spanwire::cli::ParsedOption& bad = opts.data[s.aux];
            if (bad.type == spanwire::cli::OptionType::String) {
                fprintf(stderr, "error: invalid value '%s'\n", bad.value.str);
                return false;
            }
        }
        print_status_error_detailed("option mapping", s);
        return false;
    }

    s = spanwire::core::span_validate(req->span);
    if (!spanwire::core::is_ok(s)) {
        fprintf(stderr, "error: invalid %s\n", span_field_name(s.aux));
        return false;
    }
    return true;
}

// ========================================================================
// Command Handlers
// ========================================================================

void handle_help() {
    printf("Usage: spanwire <command> [options]\n");
    printf("\n");
    printf("Commands:\n");
    printf("  encode            Print the span as Zipkin v2 JSON\n");
    printf("  size              Print the encoded size in bytes\n");
    printf("  help              Show this help\n");
    printf("\n");
    printf("Span options:\n");
    printf("  -t, --trace-id <hex>        16 or 32 lower-hex chars (required)\n");
    printf("  -i, --id <hex>              16 lower-hex chars (required)\n");
    printf("  -p, --parent-id <hex>       16 lower-hex chars\n");
    printf("  -k, --kind <kind>           CLIENT, SERVER, PRODUCER or CONSUMER\n");
    printf("  -n, --name <name>\n");
    printf("      --timestamp <micros>    epoch microseconds\n");
    printf("  -d, --duration <micros>\n");
    printf("      --local-service|--local-ipv4|--local-ipv6|--local-port <v>\n");
    printf("      --remote-service|--remote-ipv4|--remote-ipv6|--remote-port <v>\n");
    printf("  -a, --annotation <ts:value> repeatable, kept in order\n");
    printf("  -g, --tag <key=value>       repeatable, last value wins\n");
    printf("      --debug, --shared\n");
    printf("\n");
    printf("Output options:\n");
    printf("  -l, --list                  wrap the span in a JSON array\n");
    printf("  -r, --repeat <n>            emit n copies in a JSON array\n");
    printf("  -o, --output <path>         write to a file instead of stdout\n");
    printf("  -v, --verbose\n");
    printf("\n");
    printf("Environment:\n");
    printf("  %s   local service name when --local-service is absent\n", kServiceNameEnv);
}

int handle_encode(const spanwire::cli::CliArgs& args) {
    spanwire::cli::EncodeRequest req;
    if (!build_request(args, &req)) {
        return EXIT_FAILURE;
    }

    const spanwire::codec::SpanBytesEncoder* enc = spanwire::codec::span_bytes_encoder(spanwire::codec::Encoding::Json);
    if (enc == nullptr) {
        print_error("JSON encoder unavailable");
        return EXIT_FAILURE;
    }

    std::vector<spanwire::core::u8> bytes;
    spanwire::core::Status s{};
    if (req.as_list) {
        std::vector<spanwire::core::Span> spans;
        s = spanwire::cli::span_request_list(req, &spans);
        if (!spanwire::core::is_ok(s)) {
            print_status_error_detailed("list", s);
            return EXIT_FAILURE;
        }
        s = spanwire::codec::span_list_encode(*enc, spans.data(), static_cast<spanwire::core::u32>(spans.size()), &bytes);
    } else {
        s = spanwire::codec::span_encode(*enc, req.span, &bytes);
    }
    if (!spanwire::core::is_ok(s)) {
        print_encode_error(s);
        return EXIT_FAILURE;
    }

    s = write_output(req.output, bytes);
    if (!spanwire::core::is_ok(s)) {
        print_status_error_detailed("write", s);
        return EXIT_FAILURE;
    }
    if (req.verbose) {
        fprintf(stderr, "info: wrote %zu bytes (%s)\n", bytes.size(),
                spanwire::codec::encoding_name(enc->encoding));
    }
    return EXIT_SUCCESS;
}

int handle_size(const spanwire::cli::CliArgs& args) {
    spanwire::cli::EncodeRequest req;
    if (!build_request(args, &req)) {
        return EXIT_FAILURE;
    }

    const spanwire::codec::SpanBytesEncoder* enc = spanwire::codec::span_bytes_encoder(spanwire::codec::Encoding::Json);
    if (enc == nullptr) {
        print_error("JSON encoder unavailable");
        return EXIT_FAILURE;
    }

    spanwire::core::u64 size = 0;
    if (req.as_list) {
        std::vector<spanwire::core::Span> spans;
        const spanwire::core::Status s = spanwire::cli::span_request_list(req, &spans);
        if (!spanwire::core::is_ok(s)) {
            print_status_error_detailed("list", s);
            return EXIT_FAILURE;
        }
        size = enc->list_size_in_bytes(spans.data(), static_cast<spanwire::core::u32>(spans.size()));
    } else {
        size = enc->size_in_bytes(req.span);
    }
    if (size > spanwire::codec::kMaxRegionBytes) {
        fprintf(stderr, "error: encoded size %llu exceeds %llu bytes\n", static_cast<unsigned long long>(size),
                static_cast<unsigned long long>(spanwire::codec::kMaxRegionBytes));
        return EXIT_FAILURE;
    }
    char text[spanwire::codec::kMaxDecimalDigits + 1];
    const int n = snprintf(text, sizeof(text), "%llu", static_cast<unsigned long long>(size));
    const spanwire::core::Status s = spanwire::cli::output_write_stream(
        stdout, {reinterpret_cast<const spanwire::core::u8*>(text), static_cast<spanwire::core::u32>(n)});
    if (!spanwire::core::is_ok(s)) {
        print_status_error_detailed("write", s);
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

} // namespace

// ========================================================================
// Main Entry Point
// ========================================================================

int main(int argc, char** argv) {
    if (argc < 2) {
        handle_help();
        return EXIT_FAILURE;
    }

    const spanwire::cli::CliArgs args{argv + 1, static_cast<spanwire::core::u32>(argc - 1)};
    spanwire::cli::CommandInvocation cmd;
    spanwire::core::u32 consumed = 0;
    const spanwire::core::Status s = spanwire::cli::parse_command(
        args, g_commands.data(), static_cast<spanwire::core::u32>(g_commands.size()), &cmd, &consumed);
    if (!spanwire::core::is_ok(s)) {
        fprintf(stderr, "error: unknown command %s\n", argv[1]);
        return EXIT_FAILURE;
    }

    switch (cmd.id) {
        case spanwire::cli::CommandId::Help:
            handle_help();
            return EXIT_SUCCESS;
        case spanwire::cli::CommandId::Encode:
            return handle_encode(cmd.args);
        case spanwire::cli::CommandId::Size:
            return handle_size(cmd.args);
        case spanwire::cli::CommandId::None:
            break;
    }
    print_error("unknown command");
    return EXIT_FAILURE;
}
