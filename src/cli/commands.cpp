#include "spanwire/cli/commands.hpp"

#include <cstring>

namespace spanwire::cli {
    namespace {
        [[nodiscard]] spanwire::core::Status cli_invalid() noexcept {
            return spanwire::core::make_status(spanwire::core::StatusDomain::Cli, spanwire::core::StatusCode::Invalid);
        }
    } // namespace

    spanwire::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return cli_invalid();
        }
        *consumed = 0;
        out->id = CommandId::None;
        out->args = CliArgs{};

        if (args.argc == 0) {
            return cli_invalid();
        }
        if (args.argv == nullptr || args.argv[0] == nullptr) {
            return cli_invalid();
        }
        if (spec_count > 0 && specs == nullptr) {
            return cli_invalid();
        }

        const char* cmd = args.argv[0];
        if (cmd[0] == '-') {
            return cli_invalid();
        }

        const CommandSpec* match = nullptr;
        for (u32 i = 0; i < spec_count; ++i) {
            const CommandSpec& s = specs[i];
            if (s.name != nullptr && std::strcmp(s.name, cmd) == 0) {
                match = &s;
                break;
            }
        }
        if (match == nullptr) {
            return spanwire::core::make_status(spanwire::core::StatusDomain::Cli, spanwire::core::StatusCode::NotFound);
        }

        out->id = match->id;
        out->args.argv = args.argv + 1;
        out->args.argc = args.argc - 1;
        *consumed = 1;
        return spanwire::core::ok_status();
    }
} // namespace spanwire::cli
