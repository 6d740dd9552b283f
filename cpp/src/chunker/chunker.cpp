#include "parcel/chunker/chunker.hpp"

#include <algorithm>
#include <chrono>
#include <limits>
#include <new>
#include <utility>

#include "parcel/core/time.hpp"
#include "parcel/storage/layout.hpp"

namespace parcel::chunker {

using namespace parcel::core;
using parcel::inventory::ChunkSpec;
using parcel::inventory::Inventory;
using parcel::log::EventLog;

namespace {
    constexpr u32 kCopyBufferBytes = parcel::storage::kHashReadBufferBytes;

    [[nodiscard]] Status chunker_error(StatusCode code, u32 aux = 0) noexcept {
        return make_status(StatusDomain::Chunker, code, aux);
    }

    [[nodiscard]] u64 saturating_add(u64 a, u64 b) noexcept {
        return a > std::numeric_limits<u64>::max() - b ? std::numeric_limits<u64>::max() : a + b;
    }

    void fill_counts(const Inventory& inv, ChunkSummary* out) noexcept {
        const auto counters = parcel::inventory::inventory_counters(inv);
        out->algorithm = inv.algorithm;
        out->original_size = inv.original.size_bytes;
        out->original_hash = inv.original.hash;
        out->total_chunks = inv.total_chunks;
        out->completed = counters.total_processed;
        out->remaining = counters.chunks_remaining;
    }

    // Loads the inventory for this source, or creates and persists a new one.
    Status load_or_create(const ChunkParams& params,
        const std::string& source_name,
        u64 source_size,
        const std::string& inventory_path,
        EventLog& log,
        Inventory* inv,
        bool* created) noexcept {
        *created = false;
        std::string detail;
        Status s = parcel::inventory::inventory_load(inventory_path.c_str(), inv, &detail);
        if (is_ok(s)) {
            log.info("Loaded existing inventory: %s", inventory_path.c_str());
            if (inv->chunk_size != params.chunk_size_bytes) {
                log.error("Chunk size %llu differs from recorded chunk size %llu",
                    static_cast<unsigned long long>(params.chunk_size_bytes),
                    static_cast<unsigned long long>(inv->chunk_size));
                return chunker_error(StatusCode::ChunkSizeMismatch);
            }
            if (inv->original.size_bytes != source_size || inv->original.name != source_name) {
                log.error("Source %s (%llu bytes) does not match inventory record %s (%llu bytes)",
                    source_name.c_str(), static_cast<unsigned long long>(source_size),
                    inv->original.name.c_str(), static_cast<unsigned long long>(inv->original.size_bytes));
                return chunker_error(StatusCode::SourceChanged);
            }
            if (inv->algorithm != params.algorithm) {
                log.info("Keeping recorded hash algorithm %s", parcel::storage::hash_algorithm_name(inv->algorithm));
            }
            return ok_status();
        }
        if (s.code != StatusCode::InventoryNotFound) {
            log.error("Failed to load inventory %s: %s", inventory_path.c_str(), detail.c_str());
            return s;
        }

        log.step("hash", "START", "Hashing %s with %s", params.source_path.c_str(),
            parcel::storage::hash_algorithm_name(params.algorithm));
        parcel::inventory::OriginalFile original;
        original.name = source_name;
        u64 hashed = 0;
        s = parcel::storage::hash_file_range(params.algorithm, params.source_path.c_str(), 0,
            parcel::storage::kToEndOfFile, &original.hash, &hashed);
        if (!is_ok(s)) {
            log.error("Failed to hash %s", params.source_path.c_str());
            return s;
        }
        if (hashed != source_size) {
            log.error("Source size changed while hashing: %llu bytes, expected %llu",
                static_cast<unsigned long long>(hashed), static_cast<unsigned long long>(source_size));
            return chunker_error(StatusCode::SourceChanged);
        }
        original.size_bytes = source_size;
        log.step("hash", "DONE", "%s", parcel::storage::hash_hex(original.hash).c_str());

        s = parcel::inventory::inventory_create(original, params.algorithm, params.chunk_size_bytes, now_utc(), inv);
        if (!is_ok(s)) {
            return s;
        }
        s = parcel::inventory::inventory_save(inventory_path.c_str(), *inv);
        if (!is_ok(s)) {
            log.error("Failed to write inventory %s", inventory_path.c_str());
            return s;
        }
        log.info("Created new inventory: %s", inventory_path.c_str());
        *created = true;
        return ok_status();
    }
} // namespace

Status chunk_select(const Inventory& inv, ChunkIndex target, bool resume_pending, std::vector<u32>* out) noexcept {
    if (out == nullptr) {
        return chunker_error(StatusCode::Invalid);
    }
    out->clear();
    if (target.is_valid()) {
        if (!chunk_index_in_range(target, inv.total_chunks)) {
            return chunker_error(StatusCode::ChunkIndexOutOfRange, target.v);
        }
        out->push_back(target.v);
        return ok_status();
    }
    try {
        out->reserve(inv.total_chunks);
        for (u32 i = 1; i <= inv.total_chunks; ++i) {
            if (resume_pending) {
                const ChunkSpec* spec = parcel::inventory::inventory_find(inv, ChunkIndex{i});
                if (spec != nullptr && spec->status == ChunkStatus::Completed) {
                    continue;
                }
            }
            out->push_back(i);
        }
    } catch (const std::bad_alloc&) {
        return chunker_error(StatusCode::Unknown);
    }
    return ok_status();
}

Status chunk_write_artifact(int src_fd,
    const char* artifact_path,
    u64 offset,
    u64 size,
    parcel::storage::HashAlgorithm algorithm,
    Hash256* hash_out) noexcept {
    if (artifact_path == nullptr || hash_out == nullptr) {
        return chunker_error(StatusCode::Invalid);
    }

    parcel::storage::UniqueFd dst;
    Status s = parcel::storage::fs_open_write(artifact_path, false, &dst);
    if (!is_ok(s)) {
        return s;
    }

    parcel::storage::Hasher hasher;
    s = hasher.init(algorithm);
    if (!is_ok(s)) {
        return s;
    }

    std::vector<u8> buf;
    try {
        buf.resize(static_cast<size_t>(std::min<u64>(size == 0 ? 1 : size, kCopyBufferBytes)));
    } catch (const std::bad_alloc&) {
        return chunker_error(StatusCode::Unknown);
    }
    u64 done = 0;
    while (done < size) {
        const u32 want = static_cast<u32>(std::min<u64>(size - done, buf.size()));
        s = parcel::storage::fs_pread_exact(src_fd, offset + done, parcel::storage::BufferMut{buf.data(), want});
        if (!is_ok(s)) {
            return s;
        }
        const parcel::storage::BufferView view{buf.data(), want};
        s = hasher.update(view);
        if (!is_ok(s)) {
            return s;
        }
        s = parcel::storage::fs_write_all(dst.get(), view);
        if (!is_ok(s)) {
            return s;
        }
        done += want;
    }

    s = parcel::storage::fs_sync_close(&dst);
    if (!is_ok(s)) {
        return s;
    }
    return hasher.finalize(hash_out);
}

namespace {
    Status run_chunking(const ChunkParams& params, EventLog& log, ChunkSummary* out) {
        parcel::storage::FileStat st;
        Status s = parcel::storage::fs_stat(params.source_path.c_str(), &st);
        if (!is_ok(s) || !st.exists || !st.is_regular) {
            log.error("Source file not found or not a regular file: %s", params.source_path.c_str());
            return chunker_error(StatusCode::SourceNotFound, is_ok(s) ? 0 : s.aux);
        }

        parcel::storage::UniqueFd src;
        s = parcel::storage::fs_open_read(params.source_path.c_str(), &src);
        if (!is_ok(s)) {
            log.error("Source file is not readable: %s", params.source_path.c_str());
            return chunker_error(StatusCode::SourceNotFound, s.aux);
        }

        // Range-check the target against the current size before any hashing.
        const u64 expected_total = parcel::storage::layout_total_chunks(st.size_bytes, params.chunk_size_bytes);
        if (expected_total > std::numeric_limits<u32>::max() - 1) {
            return chunker_error(StatusCode::Invalid);
        }
        if (params.target.is_valid() && !chunk_index_in_range(params.target, static_cast<u32>(expected_total))) {
            log.error("Chunk %u is outside 1..%llu", params.target.v, static_cast<unsigned long long>(expected_total));
            return chunker_error(StatusCode::ChunkIndexOutOfRange, params.target.v);
        }

        const std::string output_dir = params.output_dir.empty() ? std::string(".") : params.output_dir;
        const std::string inventory_dir = params.inventory_dir.empty() ? output_dir : params.inventory_dir;
        out->output_dir = output_dir;

        for (const std::string* dir : {&output_dir, &inventory_dir}) {
            s = parcel::storage::fs_ensure_directory(dir->c_str());
            if (!is_ok(s)) {
                log.error("Cannot create directory %s", dir->c_str());
                return s;
            }
        }
        log.step("setup", "DONE", "output=%s inventory=%s", output_dir.c_str(), inventory_dir.c_str());

        const std::string source_name = parcel::storage::layout_basename(params.source_path);
        const std::string stem = parcel::storage::layout_file_stem(source_name);
        out->inventory_path = parcel::storage::layout_join(inventory_dir, parcel::storage::layout_inventory_name(stem));

        Inventory inv;
        s = load_or_create(params, source_name, st.size_bytes, out->inventory_path, log, &inv, &out->inventory_created);
        if (!is_ok(s)) {
            return s;
        }
        fill_counts(inv, out);

        s = chunk_select(inv, params.target, params.resume_pending, &out->selected);
        if (!is_ok(s)) {
            return s;
        }

        u64 selected_bytes = 0;
        for (u32 i : out->selected) {
            const auto extent = parcel::storage::layout_chunk_extent(inv.original.size_bytes, inv.chunk_size, ChunkIndex{i});
            selected_bytes = saturating_add(selected_bytes, extent.size_bytes);
        }
        const u64 required = saturating_add(selected_bytes, params.space_margin_bytes);
        s = parcel::storage::fs_space_check(output_dir.c_str(), required, &out->space);
        if (!is_ok(s)) {
            log.warn("Disk space probe failed for %s (errno %u), continuing", output_dir.c_str(), s.aux);
        } else {
            out->space_checked = true;
            log.info("Disk space: %llu bytes free, %llu bytes required",
                static_cast<unsigned long long>(out->space.available_bytes),
                static_cast<unsigned long long>(required));
            if (!out->space.sufficient) {
                log.error("Insufficient disk space in %s", output_dir.c_str());
                return chunker_error(StatusCode::InsufficientSpace);
            }
        }

        log.step("chunk", "START", "%zu of %u chunks selected", out->selected.size(), inv.total_chunks);
        for (u32 i : out->selected) {
            const ChunkIndex index{i};
            const auto extent = parcel::storage::layout_chunk_extent(inv.original.size_bytes, inv.chunk_size, index);
            const ChunkSpec* spec = parcel::inventory::inventory_find(inv, index);
            const std::string chunk_id = parcel::storage::layout_chunk_id(stem, index, inv.total_chunks);
            const std::string artifact = parcel::storage::layout_join(output_dir, chunk_id);

            // The artifact is about to change; drop the completed record first.
            if (spec != nullptr && spec->status == ChunkStatus::Completed) {
                s = parcel::inventory::inventory_mark_pending(&inv, index, now_utc());
                if (is_ok(s)) {
                    s = parcel::inventory::inventory_save(out->inventory_path.c_str(), inv);
                }
                if (!is_ok(s)) {
                    log.error("Failed to update inventory %s", out->inventory_path.c_str());
                    fill_counts(inv, out);
                    return s;
                }
            }

            const auto started = std::chrono::steady_clock::now();
            Hash256 hash{};
            const Status written = chunk_write_artifact(src.get(), artifact.c_str(), extent.offset, extent.size_bytes,
                inv.algorithm, &hash);
            const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
            ++out->processed;

            parcel::log::ChunkEvent event;
            event.chunk_id = chunk_id;
            event.size_bytes = extent.size_bytes;
            event.offset = extent.offset;
            event.duration_seconds = elapsed;

            if (is_ok(written)) {
                s = parcel::inventory::inventory_mark_completed(&inv, index, hash, extent.size_bytes, elapsed, now_utc());
                event.status = ChunkStatus::Completed;
                event.hash = &hash;
            } else {
                const Status removed = parcel::storage::fs_remove_file(artifact.c_str());
                if (!is_ok(removed)) {
                    log.warn("Could not remove partial chunk %s (errno %u)", artifact.c_str(), removed.aux);
                }
                log.error("Chunk %s failed (code=%s, aux=%u)", chunk_id.c_str(), status_code_name(written.code), written.aux);
                out->failures.push_back(ChunkFailure{i, chunker_error(StatusCode::ChunkWriteFailed, i), written});
                s = parcel::inventory::inventory_mark_failed(&inv, index, now_utc());
                event.status = ChunkStatus::Failed;
            }
            log.chunk(event);

            if (is_ok(s)) {
                s = parcel::inventory::inventory_save(out->inventory_path.c_str(), inv);
            }
            if (!is_ok(s)) {
                log.error("Failed to update inventory %s", out->inventory_path.c_str());
                fill_counts(inv, out);
                return s;
            }
        }

        fill_counts(inv, out);
        log.step("chunk", out->failures.empty() ? "DONE" : "PARTIAL", "%u processed, %zu failed, %u remaining",
            out->processed, out->failures.size(), out->remaining);
        return ok_status();
    }
} // namespace

Status chunk_file(const ChunkParams& params, EventLog* log_in, ChunkSummary* out) noexcept {
    if (out == nullptr) {
        return chunker_error(StatusCode::Invalid);
    }
    *out = ChunkSummary{};
    EventLog closed_log;
    EventLog& log = log_in != nullptr ? *log_in : closed_log;

    if (params.source_path.empty() || params.chunk_size_bytes == 0) {
        return chunker_error(StatusCode::Invalid);
    }

    try {
        return run_chunking(params, log, out);
    } catch (const std::bad_alloc&) {
        log.error("Out of memory while chunking %s", params.source_path.c_str());
        return chunker_error(StatusCode::Unknown);
    }
}

} // namespace parcel::chunker
