#include "spanwire/cli/options.hpp"

#include <charconv>
#include <cstring>

namespace spanwire::cli {
    namespace {
        [[nodiscard]] spanwire::core::Status cli_invalid() noexcept {
            return spanwire::core::make_status(spanwire::core::StatusDomain::Cli, spanwire::core::StatusCode::Invalid);
        }

        [[nodiscard]] const OptionSpec* find_long(const OptionSpec* specs, u32 spec_count, const char* name) noexcept {
            if (name == nullptr) {
                return nullptr;
            }
            for (u32 i = 0; i < spec_count; ++i) {
                const OptionSpec& s = specs[i];
                if (s.long_name != nullptr && std::strcmp(s.long_name, name) == 0) {
                    return &s;
                }
            }
            return nullptr;
        }

        [[nodiscard]] const OptionSpec* find_short(const OptionSpec* specs, u32 spec_count, char c) noexcept {
            if (c == '\0') {
                return nullptr;
            }
            for (u32 i = 0; i < spec_count; ++i) {
                const OptionSpec& s = specs[i];
                if (s.short_name == c) {
                    return &s;
                }
            }
            return nullptr;
        }

        // Decimal only; rejects signs, blanks and trailing junk.
        [[nodiscard]] bool parse_u64(const char* s, u64* out) noexcept {
            if (out == nullptr || s == nullptr || *s == '\0') {
                return false;
            }
            const char* end = s + std::strlen(s);
            u64 v{};
            auto r = std::from_chars(s, end, v, 10);
            if (r.ec != std::errc() || r.ptr != end) {
                return false;
            }
            *out = v;
            return true;
        }

        [[nodiscard]] spanwire::core::Status push_option(ParsedOptions* out, const ParsedOption& opt) noexcept {
            if (out == nullptr) {
                return cli_invalid();
            }
            if (out->cap == 0 || out->data == nullptr) {
                return cli_invalid();
            }
            if (out->len >= out->cap) {
                return cli_invalid();
            }
            out->data[out->len++] = opt;
            return spanwire::core::ok_status();
        }

        // Stores a value-carrying option once its text has been located.
        [[nodiscard]] spanwire::core::Status push_valued(ParsedOptions* out, const OptionSpec& spec, const char* value) noexcept {
            ParsedOption opt{};
            opt.id = spec.id;
            opt.type = spec.type;
            if (spec.type == OptionType::String) {
                opt.value.str = value;
            } else if (spec.type == OptionType::U64) {
                u64 v{};
                if (!parse_u64(value, &v)) {
                    return cli_invalid();
                }
                opt.value.u64v = v;
            } else {
                return cli_invalid();
            }
            return push_option(out, opt);
        }

        [[nodiscard]] spanwire::core::Status push_flag(ParsedOptions* out, const OptionSpec& spec) noexcept {
            ParsedOption opt{};
            opt.id = spec.id;
            opt.type = spec.type;
            opt.value.boolv = 1;
            return push_option(out, opt);
        }
    } // namespace

    spanwire::core::Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return cli_invalid();
        }
        *consumed = 0;
        out->len = 0;

        if (args.argc > 0 && args.argv == nullptr) {
            return cli_invalid();
        }
        if (spec_count > 0 && specs == nullptr) {
            return cli_invalid();
        }

        u32 i = 0;
        while (i < args.argc) {
            const char* tok = args.argv[i];
            if (tok == nullptr) {
                break;
            }
            if (tok[0] != '-' || tok[1] == '\0') {
                break;
            }
            if (std::strcmp(tok, "--") == 0) {
                ++i;
                break;
            }

            if (tok[1] == '-') {
                const char* name = tok + 2;

                const char* value = nullptr;
                char name_buf[128]{};
                const char* eq = std::strchr(name, '=');
                if (eq != nullptr) {
                    const size_t name_len = static_cast<size_t>(eq - name);
                    if (name_len == 0 || name_len >= sizeof(name_buf)) {
                        return cli_invalid();
                    }
                    std::memcpy(name_buf, name, name_len);
                    name_buf[name_len] = '\0';
                    name = name_buf;
                    value = eq + 1;
                }

                const OptionSpec* spec = find_long(specs, spec_count, name);
                if (spec == nullptr) {
                    return cli_invalid();
                }

                if (spec->type == OptionType::Flag) {
                    if (value != nullptr) {
                        return cli_invalid();
                    }
                    const spanwire::core::Status s = push_flag(out, *spec);
                    if (!spanwire::core::is_ok(s)) {
                        return s;
                    }
                    ++i;
                    continue;
                }

                if (value == nullptr) {
                    if (i + 1 >= args.argc || args.argv[i + 1] == nullptr) {
                        return cli_invalid();
                    }
                    value = args.argv[i + 1];
                    i += 2;
                } else {
                    ++i;
                }

                const spanwire::core::Status s = push_valued(out, *spec, value);
                if (!spanwire::core::is_ok(s)) {
                    return s;
                }
                continue;
            }

            // Short option: -x, -xVALUE or -x VALUE.
            const OptionSpec* spec = find_short(specs, spec_count, tok[1]);
            if (spec == nullptr) {
                return cli_invalid();
            }

            if (spec->type == OptionType::Flag) {
                if (tok[2] != '\0') {
                    return cli_invalid();
                }
                const spanwire::core::Status s = push_flag(out, *spec);
                if (!spanwire::core::is_ok(s)) {
                    return s;
                }
                ++i;
                continue;
            }

            const char* value = nullptr;
            if (tok[2] != '\0') {
                value = tok + 2;
                ++i;
            } else {
                if (i + 1 >= args.argc || args.argv[i + 1] == nullptr) {
                    return cli_invalid();
                }
                value = args.argv[i + 1];
                i += 2;
            }

            const spanwire::core::Status s = push_valued(out, *spec, value);
            if (!spanwire::core::is_ok(s)) {
                return s;
            }
        }

        *consumed = i;
        return spanwire::core::ok_status();
    }
} // namespace spanwire::cli
