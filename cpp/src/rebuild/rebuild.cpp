#include "parcel/rebuild/rebuild.hpp"

#include <new>
#include <utility>

#include "parcel/storage/fs.hpp"
#include "parcel/storage/layout.hpp"

namespace parcel::rebuild {

using namespace parcel::core;
using parcel::inventory::ChunkSpec;
using parcel::inventory::Inventory;
using parcel::log::EventLog;

namespace {
    constexpr u32 kCopyBufferBytes = parcel::storage::kHashReadBufferBytes;

    [[nodiscard]] Status rebuild_error(StatusCode code, u32 aux = 0) noexcept {
        return make_status(StatusDomain::Rebuild, code, aux);
    }

    // Appends the artifact at path to out_fd, adding the byte count to *written.
    Status append_artifact(const char* path, int out_fd, std::vector<u8>* buf, u64* written) noexcept {
        parcel::storage::UniqueFd in;
        Status s = parcel::storage::fs_open_read(path, &in);
        if (!is_ok(s)) {
            return s;
        }
        while (true) {
            u32 got = 0;
            s = parcel::storage::fs_read_some(in.get(),
                parcel::storage::BufferMut{buf->data(), static_cast<u32>(buf->size())}, &got);
            if (!is_ok(s)) {
                return s;
            }
            if (got == 0) {
                return ok_status();
            }
            s = parcel::storage::fs_write_all(out_fd, parcel::storage::BufferView{buf->data(), got});
            if (!is_ok(s)) {
                return s;
            }
            *written += got;
        }
    }

    void discard_output(const std::string& path, EventLog& log) noexcept {
        const Status s = parcel::storage::fs_remove_file(path.c_str());
        if (is_ok(s)) {
            log.info("Removed incomplete file: %s", path.c_str());
        } else {
            log.warn("Could not remove incomplete file %s (errno %u)", path.c_str(), s.aux);
        }
    }
} // namespace

const char* plan_issue_name(PlanIssue issue) noexcept {
    switch (issue) {
        case PlanIssue::None: return "ok";
        case PlanIssue::NotCompleted: return "not completed";
        case PlanIssue::Missing: return "missing";
        case PlanIssue::SizeMismatch: return "size mismatch";
        case PlanIssue::HashMismatch: return "hash mismatch";
    }
    return "unknown";
}

const char* verification_name(Verification v) noexcept {
    switch (v) {
        case Verification::Skipped: return "SKIPPED";
        case Verification::Passed: return "PASSED";
        case Verification::Failed: return "FAILED";
    }
    return "UNKNOWN";
}

Status rebuild_plan(const Inventory& inv, const std::string& chunk_dir, bool validate, ReconstructionPlan* out) noexcept {
    if (out == nullptr) {
        return rebuild_error(StatusCode::Invalid);
    }
    *out = ReconstructionPlan{};

    try {
        out->chunk_dir = chunk_dir;
        out->entries.reserve(inv.total_chunks);
        const std::string stem = parcel::storage::layout_file_stem(inv.original.name);

        for (u32 i = 1; i <= inv.total_chunks; ++i) {
            const ChunkIndex index{i};
            const ChunkSpec* spec = parcel::inventory::inventory_find(inv, index);

            // Artifact names are always derived, never taken from the record.
            PlanEntry entry;
            entry.index = i;
            entry.chunk_id = parcel::storage::layout_chunk_id(stem, index, inv.total_chunks);
            if (spec == nullptr) {
                const auto extent = parcel::storage::layout_chunk_extent(inv.original.size_bytes, inv.chunk_size, index);
                entry.offset = extent.offset;
                entry.expected_size = extent.size_bytes;
            } else {
                entry.offset = spec->offset;
                entry.expected_size = spec->size_bytes;
            }
            entry.artifact_path = parcel::storage::layout_join(chunk_dir, entry.chunk_id);

            if (spec == nullptr || spec->status != ChunkStatus::Completed) {
                entry.issue = PlanIssue::NotCompleted;
                ++out->not_completed;
                out->entries.push_back(std::move(entry));
                continue;
            }

            parcel::storage::FileStat st;
            Status s = parcel::storage::fs_stat(entry.artifact_path.c_str(), &st);
            if (!is_ok(s)) {
                return s;
            }
            if (!st.exists || !st.is_regular) {
                entry.issue = PlanIssue::Missing;
                ++out->missing;
            } else if (st.size_bytes != entry.expected_size) {
                entry.actual_size = st.size_bytes;
                entry.issue = PlanIssue::SizeMismatch;
                ++out->size_mismatched;
            } else {
                entry.actual_size = st.size_bytes;
                if (validate) {
                    Hash256 actual{};
                    s = parcel::storage::hash_file_range(inv.algorithm, entry.artifact_path.c_str(), 0,
                        entry.expected_size, &actual, nullptr);
                    if (!is_ok(s)) {
                        return s;
                    }
                    if (actual != spec->hash) {
                        entry.issue = PlanIssue::HashMismatch;
                        ++out->hash_mismatched;
                    }
                }
            }
            out->entries.push_back(std::move(entry));
        }
    } catch (const std::bad_alloc&) {
        return rebuild_error(StatusCode::Unknown);
    }
    return ok_status();
}

Status rebuild_assemble(const Inventory& inv,
    const ReconstructionPlan& plan,
    const std::string& output_dir_in,
    bool validate,
    EventLog* log_in,
    RebuildResult* out) noexcept {
    if (out == nullptr) {
        return rebuild_error(StatusCode::Invalid);
    }
    EventLog closed_log;
    EventLog& log = log_in != nullptr ? *log_in : closed_log;

    if (!plan_complete(plan)) {
        return rebuild_error(StatusCode::ReconstructionBlocked);
    }
    if (!parcel::storage::layout_is_plain_name(inv.original.name)) {
        log.error("Refusing to write output named '%s'", inv.original.name.c_str());
        return rebuild_error(StatusCode::InventoryCorrupt);
    }
    out->algorithm = inv.algorithm;
    out->expected_size = inv.original.size_bytes;
    out->expected_hash = inv.original.hash;
    out->bytes_written = 0;
    out->computed_hash = Hash256{};
    out->verification = Verification::Skipped;

    parcel::storage::UniqueFd fd;
    std::vector<u8> buf;
    try {
        const std::string output_dir = output_dir_in.empty() ? std::string(".") : output_dir_in;
        Status s = parcel::storage::fs_ensure_directory(output_dir.c_str());
        if (!is_ok(s)) {
            log.error("Cannot create directory %s", output_dir.c_str());
            return s;
        }
        out->output_path = parcel::storage::layout_join(output_dir, inv.original.name);
        buf.resize(kCopyBufferBytes);
    } catch (const std::bad_alloc&) {
        return rebuild_error(StatusCode::Unknown);
    }

    Status s = parcel::storage::fs_open_write(out->output_path.c_str(), true, &fd);
    if (s.code == StatusCode::Conflict) {
        log.error("Output file already exists: %s", out->output_path.c_str());
        return rebuild_error(StatusCode::OutputExists);
    }
    if (!is_ok(s)) {
        log.error("Cannot create %s", out->output_path.c_str());
        return s;
    }

    log.step("write", "START", "%s", out->output_path.c_str());
    for (const PlanEntry& e : plan.entries) {
        s = append_artifact(e.artifact_path.c_str(), fd.get(), &buf, &out->bytes_written);
        if (!is_ok(s)) {
            log.error("Failed while appending %s (errno %u)", e.chunk_id.c_str(), s.aux);
            fd.reset();
            discard_output(out->output_path, log);
            return s;
        }
    }
    s = parcel::storage::fs_sync_close(&fd);
    if (!is_ok(s)) {
        log.error("Failed to flush %s (errno %u)", out->output_path.c_str(), s.aux);
        discard_output(out->output_path, log);
        return s;
    }
    log.step("write", "DONE", "%llu bytes", static_cast<unsigned long long>(out->bytes_written));

    if (out->bytes_written != inv.original.size_bytes) {
        out->verification = Verification::Failed;
        log.error("File size mismatch: expected %llu bytes, got %llu",
            static_cast<unsigned long long>(inv.original.size_bytes),
            static_cast<unsigned long long>(out->bytes_written));
        return rebuild_error(StatusCode::SizeMismatch);
    }

    if (!validate) {
        return ok_status();
    }

    u64 hashed = 0;
    s = parcel::storage::hash_file_range(inv.algorithm, out->output_path.c_str(), 0,
        parcel::storage::kToEndOfFile, &out->computed_hash, &hashed);
    if (!is_ok(s)) {
        log.error("Failed to hash %s (errno %u)", out->output_path.c_str(), s.aux);
        return s;
    }
    if (out->computed_hash != inv.original.hash || hashed != inv.original.size_bytes) {
        out->verification = Verification::Failed;
        log.error("File hash mismatch: expected %s, got %s",
            parcel::storage::hash_hex(inv.original.hash).c_str(),
            parcel::storage::hash_hex(out->computed_hash).c_str());
        return rebuild_error(StatusCode::HashVerificationFailed);
    }
    out->verification = Verification::Passed;
    log.info("Hash verification: PASSED");
    return ok_status();
}

Status rebuild_file(const RebuildParams& params, EventLog* log_in, RebuildResult* out) noexcept {
    if (out == nullptr) {
        return rebuild_error(StatusCode::Invalid);
    }
    EventLog closed_log;
    *out = RebuildResult{};
    EventLog& log = log_in != nullptr ? *log_in : closed_log;

    if (params.chunk_path.empty()) {
        return rebuild_error(StatusCode::Invalid);
    }

    try {
        if (!params.inventory_path.empty()) {
            out->inventory_path = params.inventory_path;
        } else if (!parcel::storage::layout_inventory_path_for_chunk(params.chunk_path, &out->inventory_path)) {
            log.error("Cannot derive an inventory name from %s", params.chunk_path.c_str());
            return rebuild_error(StatusCode::InventoryNotFound);
        }

        // An unreadable inventory is as good as none: report InventoryNotFound
        // with aux 1 and keep the parser message.
        Inventory inv;
        Status s = parcel::inventory::inventory_load(out->inventory_path.c_str(), &inv, &out->inventory_error);
        if (s.code == StatusCode::InventoryCorrupt || s.code == StatusCode::Unsupported) {
            log.error("Failed to load inventory %s: %s", out->inventory_path.c_str(), out->inventory_error.c_str());
            return rebuild_error(StatusCode::InventoryNotFound, 1);
        }
        if (!is_ok(s)) {
            log.error("Inventory not found: %s", out->inventory_path.c_str());
            return s;
        }
        out->algorithm = inv.algorithm;
        out->expected_size = inv.original.size_bytes;
        out->expected_hash = inv.original.hash;
        log.info("Using inventory: %s", out->inventory_path.c_str());

        log.step("plan", "START", "%u chunks, validation %s", inv.total_chunks, params.validate ? "enabled" : "disabled");
        s = rebuild_plan(inv, parcel::storage::layout_dirname(params.chunk_path), params.validate, &out->plan);
        if (!is_ok(s)) {
            log.error("Failed to inspect chunk artifacts (errno %u)", s.aux);
            return s;
        }

        if (!plan_complete(out->plan)) {
            for (const PlanEntry& e : out->plan.entries) {
                if (e.issue != PlanIssue::None) {
                    out->blocked_chunks.push_back(e.chunk_id);
                    log.error("Chunk %s: %s", e.chunk_id.c_str(), plan_issue_name(e.issue));
                }
            }
            const u32 count = static_cast<u32>(out->blocked_chunks.size());
            if (out->plan.not_completed + out->plan.missing + out->plan.size_mismatched > 0) {
                log.step("plan", "BLOCKED", "%u chunks missing or incomplete", count);
                return rebuild_error(StatusCode::ReconstructionBlocked, count);
            }
            log.step("plan", "FAILED", "%u chunks failed hash verification", count);
            return rebuild_error(StatusCode::HashVerificationFailed, count);
        }
        log.step("plan", "DONE", "all %u chunks present", inv.total_chunks);

        return rebuild_assemble(inv, out->plan, params.output_dir, params.validate, &log, out);
    } catch (const std::bad_alloc&) {
        return rebuild_error(StatusCode::Unknown);
    }
}

} // namespace parcel::rebuild
