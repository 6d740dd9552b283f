#include <cstdlib>
#include <cstdio>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

#include "parcel/chunker/chunker.hpp"
#include "parcel/cli/commands.hpp"
#include "parcel/cli/config.hpp"
#include "parcel/cli/options.hpp"
#include "parcel/core/errors.hpp"
#include "parcel/core/time.hpp"
#include "parcel/inventory/inventory.hpp"
#include "parcel/log/event_log.hpp"
#include "parcel/rebuild/rebuild.hpp"
#include "parcel/storage/fs.hpp"
#include "parcel/storage/hashing.hpp"
#include "parcel/storage/layout.hpp"

namespace {

using parcel::core::u32;
using parcel::core::u64;

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

// ========================================================================
// Option Table
// ========================================================================

constexpr parcel::cli::OptionSpec kOptions[] = {
    {parcel::cli::OptionId::Size, parcel::cli::OptionType::U64, "size", 's'},
    {parcel::cli::OptionId::Bytes, parcel::cli::OptionType::U64, "bytes", 'b'},
    {parcel::cli::OptionId::Chunk, parcel::cli::OptionType::U64, "chunk", 'c'},
    {parcel::cli::OptionId::Output, parcel::cli::OptionType::String, "output", 'o'},
    {parcel::cli::OptionId::Log, parcel::cli::OptionType::String, "log", 'l'},
    {parcel::cli::OptionId::Inventory, parcel::cli::OptionType::String, "inventory", 'i'},
    {parcel::cli::OptionId::Hash, parcel::cli::OptionType::String, "hash", '\0'},
    {parcel::cli::OptionId::Resume, parcel::cli::OptionType::Flag, "resume", '\0'},
    {parcel::cli::OptionId::NoValidate, parcel::cli::OptionType::Flag, "no-validate", '\0'},
    {parcel::cli::OptionId::Margin, parcel::cli::OptionType::U64, "margin", '\0'},
    {parcel::cli::OptionId::Help, parcel::cli::OptionType::Flag, "help", 'h'},
};
constexpr u32 kOptionCount = sizeof(kOptions) / sizeof(kOptions[0]);

constexpr parcel::cli::CommandSpec kCommands[] = {
    {parcel::cli::CommandId::Help, "help"},
    {parcel::cli::CommandId::Split, "split"},
    {parcel::cli::CommandId::Join, "join"},
    {parcel::cli::CommandId::Status, "status"},
    {parcel::cli::CommandId::Verify, "verify"},
    {parcel::cli::CommandId::Merge, "merge"},
};
constexpr u32 kCommandCount = sizeof(kCommands) / sizeof(kCommands[0]);

constexpr u32 kMaxOptions = 64;

// ========================================================================
// Configuration
// ========================================================================

// Environment defaults with command-line overrides applied.
struct RunOptions {
    parcel::cli::ToolConfig env;
    u64 chunk_size_bytes{0};
    parcel::core::ChunkIndex chunk{parcel::core::ChunkIndex::invalid()};
    parcel::storage::HashAlgorithm algorithm{parcel::storage::kDefaultHashAlgorithm};
    u64 margin_bytes{0};
    std::string output;
    std::string log_dir;
    std::string inventory;
    bool resume{false};
    bool validate{true};
    bool help{false};
};

// ========================================================================
// Error Handling
// ========================================================================

void print_error(const char* msg) {
    fprintf(stderr, "error: %s\n", msg);
}

void print_status_error_detailed(const char* context, parcel::core::Status s) {
    fprintf(stderr,
            "error: %s failed (code=%s/%u, domain=%s/%u, aux=%u)\n",
            context,
            parcel::core::status_code_name(s.code),
            static_cast<unsigned>(s.code),
            parcel::core::status_domain_name(s.domain),
            static_cast<unsigned>(s.domain),
            s.aux);
    if (s.code == parcel::core::StatusCode::Io && s.aux != 0) {
        fprintf(stderr, "error: %s: %s\n", context, std::strerror(static_cast<int>(s.aux)));
    }
}

// 12180089987 -> "12,180,089,987"
std::string format_count(u64 v) {
    std::string digits = std::to_string(v);
    std::string out;
    const size_t n = digits.size();
    for (size_t i = 0; i < n; ++i) {
        if (i != 0 && (n - i) % 3 == 0) {
            out.push_back(',');
        }
        out.push_back(digits[i]);
    }
    return out;
}

std::string format_time(parcel::core::Timestamp t) {
    return t == 0 ? std::string("-") : parcel::core::format_iso8601(t);
}

// ========================================================================
// Argument Handling
// ========================================================================

// Splits args into options (any position) and positionals. Everything after
// "--" is positional.
bool collect_arguments(parcel::cli::CliArgs args,
    parcel::cli::ParsedOption* storage,
    u32* used,
    std::vector<const char*>* positional) {
    bool options_done = false;
    while (args.argc > 0) {
        if (!options_done) {
            parcel::cli::ParsedOptions chunk{storage + *used, 0, kMaxOptions - *used};
            u32 consumed = 0;
            const parcel::core::Status s = parcel::cli::parse_options(args, kOptions, kOptionCount, &chunk, &consumed);
            if (!parcel::core::is_ok(s)) {
                const u32 at = s.aux < args.argc ? s.aux : 0;
                fprintf(stderr, "error: invalid or incomplete option: %s\n", args.argv[at] ? args.argv[at] : "");
                return false;
            }
            *used += chunk.len;
            if (consumed > 0 && std::strcmp(args.argv[consumed - 1], "--") == 0) {
                options_done = true;
            }
            args.argv += consumed;
            args.argc -= consumed;
        }
        if (args.argc > 0) {
            positional->push_back(args.argv[0]);
            ++args.argv;
            --args.argc;
        }
    }
    return true;
}

bool resolve_run_options(const parcel::cli::ParsedOptions& opts, RunOptions* ro) {
    using parcel::cli::OptionId;
    using parcel::cli::find_option;

    ro->algorithm = ro->env.algorithm;
    if (const auto* o = find_option(opts, OptionId::Hash)) {
        if (!parcel::storage::hash_algorithm_parse(o->value.str, &ro->algorithm)) {
            fprintf(stderr, "error: unknown hash algorithm '%s' (expected blake3 or sha256)\n", o->value.str);
            return false;
        }
    }

    u64 size_mib = ro->env.chunk_size_mib;
    if (const auto* o = find_option(opts, OptionId::Size)) {
        size_mib = o->value.u64v;
    }
    if (const auto* o = find_option(opts, OptionId::Bytes)) {
        ro->chunk_size_bytes = o->value.u64v;
    } else if (!parcel::cli::mib_to_bytes(size_mib, &ro->chunk_size_bytes)) {
        print_error("chunk size is too large");
        return false;
    }
    if (ro->chunk_size_bytes == 0) {
        print_error("chunk size must be greater than zero");
        return false;
    }

    u64 margin_mib = ro->env.space_margin_mib;
    if (const auto* o = find_option(opts, OptionId::Margin)) {
        margin_mib = o->value.u64v;
    }
    if (!parcel::cli::mib_to_bytes(margin_mib, &ro->margin_bytes)) {
        print_error("space margin is too large");
        return false;
    }

    if (const auto* o = find_option(opts, OptionId::Chunk)) {
        if (o->value.u64v >= parcel::core::ChunkIndex::invalid().v) {
            print_error("chunk number is too large");
            return false;
        }
        ro->chunk = parcel::core::ChunkIndex{static_cast<u32>(o->value.u64v)};
    }

    if (const auto* o = find_option(opts, OptionId::Output)) ro->output = o->value.str;
    if (const auto* o = find_option(opts, OptionId::Log)) ro->log_dir = o->value.str;
    if (const auto* o = find_option(opts, OptionId::Inventory)) ro->inventory = o->value.str;
    ro->resume = find_option(opts, OptionId::Resume) != nullptr;
    ro->validate = find_option(opts, OptionId::NoValidate) == nullptr;
    ro->help = find_option(opts, OptionId::Help) != nullptr;
    return true;
}

// Accepts either an inventory file or any chunk artifact beside one.
std::string resolve_inventory_argument(const char* arg) {
    std::string derived;
    if (parcel::storage::layout_inventory_path_for_chunk(arg, &derived)) {
        return derived;
    }
    return std::string(arg);
}

bool load_inventory_or_report(const std::string& path, parcel::inventory::Inventory* inv) {
    std::string detail;
    const parcel::core::Status s = parcel::inventory::inventory_load(path.c_str(), inv, &detail);
    if (!parcel::core::is_ok(s)) {
        print_status_error_detailed("load inventory", s);
        if (!detail.empty()) {
            fprintf(stderr, "error: %s: %s\n", path.c_str(), detail.c_str());
        }
        return false;
    }
    return true;
}

void open_event_log(parcel::log::EventLog* log, const std::string& dir, const std::string& stem, const char* subject) {
    const std::string path = parcel::storage::layout_join(dir, parcel::storage::layout_log_name(stem));
    const parcel::core::Status s = log->open(path.c_str(), subject);
    if (!parcel::core::is_ok(s)) {
        fprintf(stderr, "warning: cannot open log file %s, continuing without it\n", path.c_str());
    }
}

void print_index_list(const char* title, const std::vector<u32>& indices) {
    if (indices.empty()) {
        return;
    }
    printf("\n%s:\n", title);
    for (u32 i : indices) {
        printf("  - Chunk %u\n", i);
    }
}

// ========================================================================
// Command Handlers
// ========================================================================

void handle_help() {
    printf("Usage: parcel [options] <command> [options] <args>\n");
    printf("\n");
    printf("Commands:\n");
    printf("  split <file>          Split a file into chunks and record them in an inventory\n");
    printf("  join <chunk>          Rebuild the original file from any one of its chunks\n");
    printf("  status <inventory|chunk>\n");
    printf("                        Show completed, pending and failed chunks\n");
    printf("  verify <inventory|chunk>\n");
    printf("                        Check inventory consistency and chunk artifacts\n");
    printf("  merge <out> <in...>   Combine completed chunks from inventories of one file\n");
    printf("  help                  Show this help\n");
    printf("\n");
    printf("Options:\n");
    printf("  -s, --size <MiB>      Chunk size in MiB (default: PARCEL_CHUNK_SIZE_MB or 1000)\n");
    printf("  -b, --bytes <n>       Chunk size in bytes, overrides --size\n");
    printf("  -c, --chunk <n>       Process only chunk n (split)\n");
    printf("  -o, --output <dir>    Chunk directory (split, verify) or rebuild directory (join)\n");
    printf("  -l, --log <dir>       Log directory (default: PARCEL_LOG_DIR or the inventory directory)\n");
    printf("  -i, --inventory <p>   Inventory directory (split) or inventory file (join)\n");
    printf("      --hash <name>     blake3 or sha256 for new inventories (default: PARCEL_HASH or blake3)\n");
    printf("      --resume          Process only chunks that are not completed (split)\n");
    printf("      --no-validate     Skip hash checks (join, verify)\n");
    printf("      --margin <MiB>    Free space kept in reserve (default: PARCEL_SPACE_MARGIN_MB or 16)\n");
    printf("\n");
    printf("One invocation at a time per inventory: running split and join against the\n");
    printf("same inventory concurrently is not supported.\n");
}

int handle_split(const RunOptions& ro, const std::vector<const char*>& args) {
    if (args.size() != 1) {
        print_error("split: expected exactly one input file");
        return kExitUsage;
    }
    const char* source = args[0];

    parcel::chunker::ChunkParams params;
    params.source_path = source;
    params.output_dir = ro.output.empty() ? parcel::storage::layout_dirname(source) : ro.output;
    params.inventory_dir = ro.inventory.empty() ? params.output_dir : ro.inventory;
    params.chunk_size_bytes = ro.chunk_size_bytes;
    params.target = ro.chunk;
    params.algorithm = ro.algorithm;
    params.space_margin_bytes = ro.margin_bytes;
    params.resume_pending = ro.resume;

    const std::string stem = parcel::storage::layout_file_stem(parcel::storage::layout_basename(source));
    const std::string log_dir = !ro.log_dir.empty() ? ro.log_dir
        : !ro.env.log_dir.empty() ? ro.env.log_dir
        : params.inventory_dir;

    parcel::log::EventLog log;
    open_event_log(&log, log_dir, stem, source);

    parcel::chunker::ChunkSummary summary;
    const parcel::core::Status s = parcel::chunker::chunk_file(params, &log, &summary);
    log.close();

    if (!parcel::core::is_ok(s)) {
        print_status_error_detailed("split", s);
        switch (s.code) {
            case parcel::core::StatusCode::SourceNotFound:
                fprintf(stderr, "error: cannot read input file %s\n", source);
                break;
            case parcel::core::StatusCode::InsufficientSpace:
                fprintf(stderr, "error: insufficient disk space: %s bytes free, %s bytes required\n",
                        format_count(summary.space.available_bytes).c_str(),
                        format_count(summary.space.required_bytes).c_str());
                break;
            case parcel::core::StatusCode::ChunkSizeMismatch:
                fprintf(stderr, "error: %s was created with a different chunk size\n", summary.inventory_path.c_str());
                break;
            case parcel::core::StatusCode::SourceChanged:
                fprintf(stderr, "error: %s no longer matches %s\n", source, summary.inventory_path.c_str());
                break;
            case parcel::core::StatusCode::ChunkIndexOutOfRange:
                fprintf(stderr, "error: chunk %u does not exist\n", s.aux);
                break;
            default:
                break;
        }
        return kExitFailure;
    }

    printf("Input file: %s\n", source);
    printf("Output directory: %s\n", summary.output_dir.c_str());
    if (log.path().empty()) {
        printf("Log file: -\n");
    } else {
        printf("Log file: %s\n", log.path().c_str());
    }
    printf("Inventory file: %s%s\n", summary.inventory_path.c_str(), summary.inventory_created ? " (new)" : "");
    printf("\nSummary:\n");
    printf("Total chunks: %u\n", summary.total_chunks);
    printf("Processed this run: %u\n", summary.processed);
    printf("Completed: %u\n", summary.completed);
    printf("Remaining: %u\n", summary.remaining);
    printf("Original file size: %s bytes\n", format_count(summary.original_size).c_str());
    printf("Original file hash: %s (%s)\n",
           parcel::storage::hash_hex(summary.original_hash).c_str(),
           parcel::storage::hash_algorithm_name(summary.algorithm));

    if (!summary.failures.empty()) {
        fprintf(stderr, "\n%zu chunk(s) failed:\n", summary.failures.size());
        for (const auto& f : summary.failures) {
            fprintf(stderr, "  - chunk %u: %s", f.index, parcel::core::status_code_name(f.cause.code));
            if (f.cause.code == parcel::core::StatusCode::Io && f.cause.aux != 0) {
                fprintf(stderr, " (%s)", std::strerror(static_cast<int>(f.cause.aux)));
            }
            fprintf(stderr, "\n");
        }
        fprintf(stderr, "Re-run with --resume or -c <n> to regenerate them.\n");
        return kExitFailure;
    }
    return kExitOk;
}

int handle_join(const RunOptions& ro, const std::vector<const char*>& args) {
    if (args.size() != 1) {
        print_error("join: expected exactly one chunk file");
        return kExitUsage;
    }

    parcel::rebuild::RebuildParams params;
    params.chunk_path = args[0];
    params.output_dir = ro.output;
    params.inventory_path = ro.inventory;
    params.validate = ro.validate;

    parcel::log::EventLog log;
    parcel::storage::ChunkName name;
    if (parcel::storage::layout_parse_chunk_name(parcel::storage::layout_basename(params.chunk_path), &name)) {
        const std::string log_dir = !ro.log_dir.empty() ? ro.log_dir
            : !ro.env.log_dir.empty() ? ro.env.log_dir
            : parcel::storage::layout_dirname(params.chunk_path);
        open_event_log(&log, log_dir, name.stem, params.chunk_path.c_str());
    }

    printf("Validating chunk files...\n");
    parcel::rebuild::RebuildResult result;
    const parcel::core::Status s = parcel::rebuild::rebuild_file(params, &log, &result);
    log.close();

    if (!result.inventory_path.empty()) {
        printf("Using inventory: %s\n", result.inventory_path.c_str());
    }

    if (!parcel::core::is_ok(s)) {
        print_status_error_detailed("join", s);
        switch (s.code) {
            case parcel::core::StatusCode::InventoryNotFound:
                if (!result.inventory_error.empty()) {
                    fprintf(stderr, "error: unreadable inventory: %s\n", result.inventory_error.c_str());
                } else {
                    fprintf(stderr, "error: no inventory found for %s\n", params.chunk_path.c_str());
                }
                break;
            case parcel::core::StatusCode::ReconstructionBlocked:
            case parcel::core::StatusCode::HashVerificationFailed:
                if (!result.blocked_chunks.empty()) {
                    fprintf(stderr, "\nCannot reconstruct: %zu chunk(s) missing or invalid:\n", result.blocked_chunks.size());
                    for (const auto& e : result.plan.entries) {
                        if (e.issue != parcel::rebuild::PlanIssue::None) {
                            fprintf(stderr, "  - %s (%s)\n", e.chunk_id.c_str(), parcel::rebuild::plan_issue_name(e.issue));
                        }
                    }
                    fprintf(stderr, "Regenerate them with: parcel split -c <n> <original file>\n");
                } else {
                    fprintf(stderr, "error: file hash mismatch\n  expected: %s\n  got:      %s\n",
                            parcel::storage::hash_hex(result.expected_hash).c_str(),
                            parcel::storage::hash_hex(result.computed_hash).c_str());
                    fprintf(stderr, "Hash verification: FAILED (output kept at %s)\n", result.output_path.c_str());
                }
                break;
            case parcel::core::StatusCode::SizeMismatch:
                fprintf(stderr, "error: file size mismatch\n  expected: %s bytes\n  got:      %s bytes\n",
                        format_count(result.expected_size).c_str(),
                        format_count(result.bytes_written).c_str());
                break;
            case parcel::core::StatusCode::OutputExists:
                fprintf(stderr, "error: output file already exists: %s\n", result.output_path.c_str());
                break;
            default:
                break;
        }
        return kExitFailure;
    }

    printf("\nReconstruction complete!\n");
    printf("Written to: %s\n", result.output_path.c_str());
    printf("Final size: %s bytes\n", format_count(result.bytes_written).c_str());
    printf("Hash verification: %s\n", parcel::rebuild::verification_name(result.verification));
    return kExitOk;
}

int handle_status(const std::vector<const char*>& args) {
    if (args.size() != 1) {
        print_error("status: expected an inventory or chunk file");
        return kExitUsage;
    }
    const std::string path = resolve_inventory_argument(args[0]);
    parcel::inventory::Inventory inv;
    if (!load_inventory_or_report(path, &inv)) {
        return kExitFailure;
    }

    using parcel::core::ChunkStatus;
    const auto completed = parcel::inventory::inventory_indices_with_status(inv, ChunkStatus::Completed);
    const auto pending = parcel::inventory::inventory_indices_with_status(inv, ChunkStatus::Pending);
    const auto failed = parcel::inventory::inventory_indices_with_status(inv, ChunkStatus::Failed);

    printf("Inventory Status\n");
    printf("================\n");
    printf("Inventory: %s\n", path.c_str());
    printf("File: %s\n", inv.original.name.c_str());
    printf("Size: %s bytes\n", format_count(inv.original.size_bytes).c_str());
    printf("Hash: %s (%s)\n", parcel::storage::hash_hex(inv.original.hash).c_str(),
           parcel::storage::hash_algorithm_name(inv.algorithm));
    printf("Chunk size: %s bytes\n", format_count(inv.chunk_size).c_str());
    printf("Total Chunks: %u\n", inv.total_chunks);
    printf("Completed: %zu\n", completed.size());
    printf("Pending: %zu\n", pending.size());
    printf("Failed: %zu\n", failed.size());
    printf("\nCreated: %s\n", format_time(inv.creation_time).c_str());
    printf("Last Updated: %s\n", format_time(inv.last_updated).c_str());
    if (!inv.merged_from.empty()) {
        printf("Merged from:\n");
        for (const auto& p : inv.merged_from) {
            printf("  - %s\n", p.c_str());
        }
    }

    print_index_list("Completed Chunks", completed);
    print_index_list("Pending Chunks", pending);
    print_index_list("Failed Chunks", failed);
    return kExitOk;
}

int handle_verify(const RunOptions& ro, const std::vector<const char*>& args) {
    if (args.size() != 1) {
        print_error("verify: expected an inventory or chunk file");
        return kExitUsage;
    }
    const std::string path = resolve_inventory_argument(args[0]);
    parcel::inventory::Inventory inv;
    if (!load_inventory_or_report(path, &inv)) {
        return kExitFailure;
    }

    printf("Checking %s...\n", path.c_str());
    std::vector<std::string> issues;
    parcel::inventory::inventory_check(inv, &issues);

    // Artifacts live beside the argument unless -o names their directory.
    const std::string chunk_dir = ro.output.empty() ? parcel::storage::layout_dirname(args[0]) : ro.output;
    parcel::rebuild::ReconstructionPlan plan;
    const parcel::core::Status s = parcel::rebuild::rebuild_plan(inv, chunk_dir, ro.validate, &plan);
    if (!parcel::core::is_ok(s)) {
        print_status_error_detailed("verify", s);
        return kExitFailure;
    }
    for (const auto& e : plan.entries) {
        if (e.issue != parcel::rebuild::PlanIssue::None) {
            issues.push_back(e.chunk_id + ": " + parcel::rebuild::plan_issue_name(e.issue));
        }
    }

    if (issues.empty()) {
        printf("All checks passed - ready for reconstruction (%u chunks, hashes %s)\n",
               inv.total_chunks, ro.validate ? "verified" : "not checked");
        return kExitOk;
    }
    printf("Issues found:\n");
    for (const auto& issue : issues) {
        printf("  - %s\n", issue.c_str());
    }
    return kExitFailure;
}

int handle_merge(const std::vector<const char*>& args) {
    if (args.size() < 2) {
        print_error("merge: expected an output path and at least one input inventory");
        return kExitUsage;
    }
    const std::string out_path = args[0];

    std::vector<parcel::inventory::Inventory> inputs;
    std::vector<std::string> sources;
    for (size_t i = 1; i < args.size(); ++i) {
        if (out_path == args[i]) {
            print_error("merge: the output must not be one of the inputs");
            return kExitUsage;
        }
        parcel::inventory::Inventory inv;
        if (!load_inventory_or_report(args[i], &inv)) {
            return kExitFailure;
        }
        inputs.push_back(std::move(inv));
        sources.emplace_back(args[i]);
    }

    parcel::inventory::Inventory merged;
    parcel::core::Status s = parcel::inventory::inventory_merge(inputs, sources, parcel::core::now_utc(), &merged);
    if (!parcel::core::is_ok(s)) {
        print_status_error_detailed("merge", s);
        if (s.code == parcel::core::StatusCode::Conflict && s.aux < sources.size()) {
            fprintf(stderr, "error: incompatible inventory: %s\n", sources[s.aux].c_str());
        }
        return kExitFailure;
    }

    s = parcel::inventory::inventory_save_new(out_path.c_str(), merged);
    if (s.code == parcel::core::StatusCode::OutputExists) {
        fprintf(stderr, "error: merge: %s already exists, refusing to replace it\n", out_path.c_str());
        return kExitFailure;
    }
    if (!parcel::core::is_ok(s)) {
        print_status_error_detailed("merge: write", s);
        return kExitFailure;
    }

    const auto counters = parcel::inventory::inventory_counters(merged);
    printf("Merged %zu inventories into %s\n", inputs.size(), out_path.c_str());
    printf("Completed: %u of %u chunks\n", counters.total_processed, merged.total_chunks);
    return kExitOk;
}

} // namespace

// ========================================================================
// Main
// ========================================================================

int main(int argc, char** argv) {
    RunOptions ro;
    const char* bad_var = nullptr;
    parcel::core::Status s = parcel::cli::load_config(nullptr, &ro.env, &bad_var);
    if (!parcel::core::is_ok(s)) {
        fprintf(stderr, "error: invalid value in environment variable %s\n", bad_var ? bad_var : "?");
        return kExitUsage;
    }

    parcel::cli::ParsedOption storage[kMaxOptions];
    u32 used = 0;

    // Options may precede the command.
    parcel::cli::CliArgs all{argv + 1, argc > 0 ? static_cast<u32>(argc - 1) : 0u};
    parcel::cli::ParsedOptions leading{storage, 0, kMaxOptions};
    u32 consumed = 0;
    s = parcel::cli::parse_options(all, kOptions, kOptionCount, &leading, &consumed);
    if (!parcel::core::is_ok(s)) {
        const u32 at = s.aux < all.argc ? s.aux : 0;
        fprintf(stderr, "error: invalid or incomplete option: %s\n", all.argc > 0 ? all.argv[at] : "");
        return kExitUsage;
    }
    used = leading.len;
    all.argv += consumed;
    all.argc -= consumed;

    if (all.argc == 0) {
        handle_help();
        return parcel::cli::find_option(leading, parcel::cli::OptionId::Help) != nullptr ? kExitOk : kExitUsage;
    }

    parcel::cli::CommandInvocation inv;
    s = parcel::cli::parse_command(all, kCommands, kCommandCount, &inv, &consumed);
    if (!parcel::core::is_ok(s)) {
        fprintf(stderr, "error: unknown command '%s' (try 'parcel help')\n", all.argv[0]);
        return kExitUsage;
    }

    std::vector<const char*> positional;
    if (!collect_arguments(inv.args, storage, &used, &positional)) {
        return kExitUsage;
    }
    const parcel::cli::ParsedOptions opts{storage, used, kMaxOptions};
    if (!resolve_run_options(opts, &ro)) {
        return kExitUsage;
    }

    if (ro.help || inv.id == parcel::cli::CommandId::Help) {
        handle_help();
        return kExitOk;
    }

    switch (inv.id) {
        case parcel::cli::CommandId::Split: return handle_split(ro, positional);
        case parcel::cli::CommandId::Join: return handle_join(ro, positional);
        case parcel::cli::CommandId::Status: return handle_status(positional);
        case parcel::cli::CommandId::Verify: return handle_verify(ro, positional);
        case parcel::cli::CommandId::Merge: return handle_merge(positional);
        default: break;
    }
    handle_help();
    return kExitUsage;
}
