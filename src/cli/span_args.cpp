#include "spanwire/cli/span_args.hpp"

#include <array>
#include <charconv>
#include <cstring>
#include <initializer_list>
#include <limits>
#include <new>
#include <string_view>
#include <utility>

namespace spanwire::cli {
    namespace {
        // Bounds how many copies of the span a list request materializes. The
        // encoded size is checked separately when encoding.
        constexpr u64 kMaxRepeat = 65536;

        constexpr std::array<OptionSpec, 23> kSpanOptions = {{
            {OptionId::TraceId, OptionType::String, "trace-id", 't'},
            {OptionId::SpanId, OptionType::String, "id", 'i'},
            {OptionId::ParentId, OptionType::String, "parent-id", 'p'},
            {OptionId::Kind, OptionType::String, "kind", 'k'},
            {OptionId::Name, OptionType::String, "name", 'n'},
            {OptionId::Timestamp, OptionType::U64, "timestamp", '\0'},
            {OptionId::Duration, OptionType::U64, "duration", 'd'},
            {OptionId::LocalService, OptionType::String, "local-service", '\0'},
            {OptionId::LocalIpv4, OptionType::String, "local-ipv4", '\0'},
            {OptionId::LocalIpv6, OptionType::String, "local-ipv6", '\0'},
            {OptionId::LocalPort, OptionType::U64, "local-port", '\0'},
            {OptionId::RemoteService, OptionType::String, "remote-service", '\0'},
            {OptionId::RemoteIpv4, OptionType::String, "remote-ipv4", '\0'},
            {OptionId::RemoteIpv6, OptionType::String, "remote-ipv6", '\0'},
            {OptionId::RemotePort, OptionType::U64, "remote-port", '\0'},
            {OptionId::Annotation, OptionType::String, "annotation", 'a'},
            {OptionId::Tag, OptionType::String, "tag", 'g'},
            {OptionId::Debug, OptionType::Flag, "debug", '\0'},
            {OptionId::Shared, OptionType::Flag, "shared", '\0'},
            {OptionId::List, OptionType::Flag, "list", 'l'},
            {OptionId::Repeat, OptionType::U64, "repeat", 'r'},
            {OptionId::Output, OptionType::String, "output", 'o'},
            {OptionId::Verbose, OptionType::Flag, "verbose", 'v'},
        }};

        [[nodiscard]] spanwire::core::Status invalid_at(u32 index) noexcept {
            return spanwire::core::make_status(spanwire::core::StatusDomain::Cli, spanwire::core::StatusCode::Invalid, index);
        }

        [[nodiscard]] bool ascii_iequals(std::string_view a, std::string_view b) noexcept {
            if (a.size() != b.size()) {
                return false;
            }
            for (size_t i = 0; i < a.size(); ++i) {
                char x = a[i];
                char y = b[i];
                if (x >= 'a' && x <= 'z') x = static_cast<char>(x - 'a' + 'A');
                if (y >= 'a' && y <= 'z') y = static_cast<char>(y - 'a' + 'A');
                if (x != y) {
                    return false;
                }
            }
            return true;
        }

        [[nodiscard]] bool parse_kind(const char* s, spanwire::core::SpanKind* out) noexcept {
            using spanwire::core::SpanKind;
            for (SpanKind k : {SpanKind::Client, SpanKind::Server, SpanKind::Producer, SpanKind::Consumer}) {
                if (ascii_iequals(s, spanwire::core::span_kind_name(k))) {
                    *out = k;
                    return true;
                }
            }
            return false;
        }

        // "<micros>:<value>"; the value may itself contain ':'.
        [[nodiscard]] bool parse_annotation(const char* s, spanwire::core::Annotation* out) {
            const char* colon = std::strchr(s, ':');
            if (colon == nullptr || colon == s) {
                return false;
            }
            u64 ts{};
            auto r = std::from_chars(s, colon, ts, 10);
            if (r.ec != std::errc() || r.ptr != colon) {
                return false;
            }
            out->timestamp = ts;
            out->value.assign(colon + 1);
            return true;
        }

        // "<key>=<value>"; empty keys are rejected, empty values are kept.
        [[nodiscard]] bool parse_tag(const char* s, spanwire::core::Tags* tags) {
            const char* eq = std::strchr(s, '=');
            if (eq == nullptr || eq == s) {
                return false;
            }
            (*tags)[std::string(s, static_cast<size_t>(eq - s))] = std::string(eq + 1);
            return true;
        }

        [[nodiscard]] bool to_port(u64 v, spanwire::core::u16* out) noexcept {
            if (v > std::numeric_limits<spanwire::core::u16>::max()) {
                return false;
            }
            *out = static_cast<spanwire::core::u16>(v);
            return true;
        }

        spanwire::core::Endpoint& endpoint(std::optional<spanwire::core::Endpoint>& slot) {
            if (!slot.has_value()) {
                slot.emplace();
            }
            return *slot;
        }
    } // namespace

    const OptionSpec* span_option_specs(u32* count) noexcept {
        if (count != nullptr) {
            *count = static_cast<u32>(kSpanOptions.size());
        }
        return kSpanOptions.data();
    }

    spanwire::core::Status span_request_from_options(const ParsedOptions& opts,
        const char* default_service,
        EncodeRequest* out) {
        if (out == nullptr || (opts.len > 0 && opts.data == nullptr)) {
            return spanwire::core::make_status(spanwire::core::StatusDomain::Cli, spanwire::core::StatusCode::Invalid);
        }
        *out = EncodeRequest{};
        spanwire::core::Span& span = out->span;

        u32 i = 0;
        try {
            for (; i < opts.len; ++i) {
                const ParsedOption& o = opts.data[i];
                switch (o.id) {
                case OptionId::TraceId:
                    span.trace_id = o.value.str;
                    break;
                case OptionId::SpanId:
                    span.id = o.value.str;
                    break;
                case OptionId::ParentId:
                    span.parent_id = o.value.str;
                    break;
                case OptionId::Kind:
                    if (!parse_kind(o.value.str, &span.kind)) {
                        return invalid_at(i);
                    }
                    break;
                case OptionId::Name:
                    span.name = o.value.str;
                    break;
                case OptionId::Timestamp:
                    span.timestamp = o.value.u64v;
                    break;
                case OptionId::Duration:
                    span.duration = o.value.u64v;
                    break;
                case OptionId::LocalService:
                    endpoint(span.local_endpoint).service_name = o.value.str;
                    break;
                case OptionId::LocalIpv4:
                    endpoint(span.local_endpoint).ipv4 = o.value.str;
                    break;
                case OptionId::LocalIpv6:
                    endpoint(span.local_endpoint).ipv6 = o.value.str;
                    break;
                case OptionId::LocalPort: {
                    spanwire::core::u16 port{};
                    if (!to_port(o.value.u64v, &port)) {
                        return invalid_at(i);
                    }
                    endpoint(span.local_endpoint).port = port;
                    break;
                }
                case OptionId::RemoteService:
                    endpoint(span.remote_endpoint).service_name = o.value.str;
                    break;
                case OptionId::RemoteIpv4:
                    endpoint(span.remote_endpoint).ipv4 = o.value.str;
                    break;
                case OptionId::RemoteIpv6:
                    endpoint(span.remote_endpoint).ipv6 = o.value.str;
                    break;
                case OptionId::RemotePort: {
                    spanwire::core::u16 port{};
                    if (!to_port(o.value.u64v, &port)) {
                        return invalid_at(i);
                    }
                    endpoint(span.remote_endpoint).port = port;
                    break;
                }
                case OptionId::Annotation: {
                    spanwire::core::Annotation a;
                    if (!parse_annotation(o.value.str, &a)) {
                        return invalid_at(i);
                    }
                    span.annotations.push_back(std::move(a));
                    break;
                }
                case OptionId::Tag:
                    if (!parse_tag(o.value.str, &span.tags)) {
                        return invalid_at(i);
                    }
                    break;
                case OptionId::Debug:
                    span.debug = true;
                    break;
                case OptionId::Shared:
                    span.shared = true;
                    break;
                case OptionId::List:
                    out->as_list = true;
                    break;
                case OptionId::Repeat:
                    if (o.value.u64v == 0 || o.value.u64v > kMaxRepeat) {
                        return invalid_at(i);
                    }
                    out->repeat = o.value.u64v;
                    out->as_list = true;
                    break;
                case OptionId::Output:
                    out->output = o.value.str;
                    break;
                case OptionId::Verbose:
                    out->verbose = true;
                    break;
                case OptionId::None:
                    return invalid_at(i);
                }
            }

            if (default_service != nullptr && *default_service != '\0') {
                spanwire::core::Endpoint& local = endpoint(span.local_endpoint);
                if (!local.service_name.has_value()) {
                    local.service_name = default_service;
                }
            }
        } catch (const std::bad_alloc&) {
            *out = EncodeRequest{};
            return spanwire::core::make_status(spanwire::core::StatusDomain::Cli, spanwire::core::StatusCode::OutOfMemory, i);
        }
        return spanwire::core::ok_status();
    }

    spanwire::core::Status span_request_list(const EncodeRequest& req,
        std::vector<spanwire::core::Span>* out) {
        if (out == nullptr) {
            return spanwire::core::make_status(spanwire::core::StatusDomain::Cli, spanwire::core::StatusCode::Invalid);
        }
        out->clear();
        const u64 copies = req.as_list ? req.repeat : 1;
        try {
            out->assign(static_cast<size_t>(copies), req.span);
        } catch (const std::bad_alloc&) {
            out->clear();
            out->shrink_to_fit();
            return spanwire::core::make_status(spanwire::core::StatusDomain::Cli, spanwire::core::StatusCode::OutOfMemory);
        }
        return spanwire::core::ok_status();
    }
} // namespace spanwire::cli
