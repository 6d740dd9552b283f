#include "parcel/cli/commands.hpp"

#include <cstring>

namespace parcel::cli {
    parcel::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept {
        const parcel::core::Status invalid =
            parcel::core::make_status(parcel::core::StatusDomain::Cli, parcel::core::StatusCode::Invalid);
        if (out == nullptr || consumed == nullptr) {
            return invalid;
        }
        *consumed = 0;
        *out = CommandInvocation{};

        if (args.argc == 0 || args.argv == nullptr || args.argv[0] == nullptr) {
            return invalid;
        }
        if (spec_count > 0 && specs == nullptr) {
            return invalid;
        }

        const char* cmd = args.argv[0];
        for (u32 i = 0; i < spec_count; ++i) {
            if (specs[i].name != nullptr && std::strcmp(specs[i].name, cmd) == 0) {
                out->id = specs[i].id;
                out->args.argv = args.argv + 1;
                out->args.argc = args.argc - 1;
                *consumed = 1;
                return parcel::core::ok_status();
            }
        }
        return parcel::core::make_status(parcel::core::StatusDomain::Cli, parcel::core::StatusCode::NotFound);
    }
} // namespace parcel::cli
