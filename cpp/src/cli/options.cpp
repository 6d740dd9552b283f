#include "parcel/cli/options.hpp"

#include <charconv>
#include <cstring>

namespace parcel::cli {
    using parcel::core::Status;

    namespace {
        [[nodiscard]] Status cli_error(u32 position) noexcept {
            return parcel::core::make_status(parcel::core::StatusDomain::Cli, parcel::core::StatusCode::Invalid, position);
        }

        [[nodiscard]] const OptionSpec* find_long(const OptionSpec* specs, u32 spec_count, const char* name) noexcept {
            for (u32 i = 0; i < spec_count; ++i) {
                if (specs[i].long_name != nullptr && std::strcmp(specs[i].long_name, name) == 0) {
                    return &specs[i];
                }
            }
            return nullptr;
        }

        [[nodiscard]] const OptionSpec* find_short(const OptionSpec* specs, u32 spec_count, char c) noexcept {
            for (u32 i = 0; i < spec_count; ++i) {
                if (specs[i].short_name != '\0' && specs[i].short_name == c) {
                    return &specs[i];
                }
            }
            return nullptr;
        }

        // Plain decimal only: no sign, no whitespace, no suffix.
        [[nodiscard]] bool parse_u64(const char* s, u64* out) noexcept {
            if (s == nullptr || *s < '0' || *s > '9') {
                return false;
            }
            const char* end = s + std::strlen(s);
            u64 v{};
            const auto r = std::from_chars(s, end, v, 10);
            if (r.ec != std::errc() || r.ptr != end) {
                return false;
            }
            *out = v;
            return true;
        }

        [[nodiscard]] bool decode_value(OptionType type, const char* value, OptionValue* out) noexcept {
            switch (type) {
                case OptionType::String:
                    out->str = value;
                    return true;
                case OptionType::U64:
                    return parse_u64(value, &out->u64v);
                case OptionType::Flag:
                    break;
            }
            return false;
        }

        [[nodiscard]] bool push_option(ParsedOptions* out, const ParsedOption& opt) noexcept {
            if (out->data == nullptr || out->len >= out->cap) {
                return false;
            }
            out->data[out->len++] = opt;
            return true;
        }
    } // namespace

    Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return cli_error(0);
        }
        *consumed = 0;
        out->len = 0;

        if ((args.argc > 0 && args.argv == nullptr) || (spec_count > 0 && specs == nullptr)) {
            return cli_error(0);
        }

        u32 i = 0;
        while (i < args.argc) {
            const char* tok = args.argv[i];
            if (tok == nullptr || tok[0] != '-' || tok[1] == '\0') {
                break;
            }
            if (std::strcmp(tok, "--") == 0) {
                ++i;
                break;
            }

            const u32 at = i;
            const OptionSpec* spec = nullptr;
            const char* value = nullptr;

            if (tok[1] == '-') {
                const char* name = tok + 2;
                char name_buf[64]{};
                const char* eq = std::strchr(name, '=');
                if (eq != nullptr) {
                    const size_t name_len = static_cast<size_t>(eq - name);
                    if (name_len == 0 || name_len >= sizeof(name_buf)) {
                        return cli_error(at);
                    }
                    std::memcpy(name_buf, name, name_len);
                    name = name_buf;
                    value = eq + 1;
                }
                spec = find_long(specs, spec_count, name);
            } else {
                spec = find_short(specs, spec_count, tok[1]);
                if (spec != nullptr && tok[2] != '\0') {
                    value = tok + 2;
                }
            }
            if (spec == nullptr) {
                return cli_error(at);
            }

            ParsedOption opt{};
            opt.id = spec->id;
            opt.type = spec->type;

            if (spec->type == OptionType::Flag) {
                // Flags never carry a value, attached or not.
                if (value != nullptr) {
                    return cli_error(at);
                }
                opt.value.boolv = 1;
                ++i;
            } else {
                if (value == nullptr) {
                    if (i + 1 >= args.argc || args.argv[i + 1] == nullptr) {
                        return cli_error(at);
                    }
                    value = args.argv[i + 1];
                    i += 2;
                } else {
                    ++i;
                }
                if (!decode_value(spec->type, value, &opt.value)) {
                    return cli_error(at);
                }
            }

            if (!push_option(out, opt)) {
                return cli_error(at);
            }
        }

        *consumed = i;
        return parcel::core::ok_status();
    }

    const ParsedOption* find_option(const ParsedOptions& opts, OptionId id) noexcept {
        const ParsedOption* found = nullptr;
        for (u32 i = 0; i < opts.len; ++i) {
            if (opts.data[i].id == id) {
                found = &opts.data[i];
            }
        }
        return found;
    }
} // namespace parcel::cli
