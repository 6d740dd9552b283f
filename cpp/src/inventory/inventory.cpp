#include "parcel/inventory/inventory.hpp"

#include <limits>
#include <new>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include "parcel/core/time.hpp"
#include "parcel/storage/fs.hpp"
#include "parcel/storage/layout.hpp"

namespace parcel::inventory {

using namespace parcel::core;
using json = nlohmann::json;
using ordered_json = nlohmann::ordered_json;

namespace {
    [[nodiscard]] Status inventory_error(StatusCode code, u32 aux = 0) noexcept {
        return make_status(StatusDomain::Inventory, code, aux);
    }

    void set_error(std::string* error, std::string text) {
        if (error != nullptr) {
            *error = std::move(text);
        }
    }

    [[nodiscard]] bool parse_index_key(std::string_view key, u32* out) noexcept {
        if (key.empty() || key.size() > 9) {
            return false;
        }
        u32 v = 0;
        for (char c : key) {
            if (c < '0' || c > '9') {
                return false;
            }
            v = v * 10 + static_cast<u32>(c - '0');
        }
        if (v == 0) {
            return false;
        }
        *out = v;
        return true;
    }

    // Field accessors for decoding. Each returns false and fills why when the
    // field is absent or has the wrong type.
    bool read_u64(const json& obj, const char* key, u64* out, std::string* why) {
        const auto it = obj.find(key);
        if (it == obj.end()) {
            *why = std::string("missing required field: ") + key;
            return false;
        }
        if (!it->is_number_unsigned()) {
            *why = std::string("field is not a non-negative integer: ") + key;
            return false;
        }
        *out = it->get<u64>();
        return true;
    }

    bool read_u32(const json& obj, const char* key, u32* out, std::string* why) {
        u64 v = 0;
        if (!read_u64(obj, key, &v, why)) {
            return false;
        }
        if (v > std::numeric_limits<u32>::max() - 1) {
            *why = std::string("field out of range: ") + key;
            return false;
        }
        *out = static_cast<u32>(v);
        return true;
    }

    bool read_string(const json& obj, const char* key, std::string* out, std::string* why) {
        const auto it = obj.find(key);
        if (it == obj.end()) {
            *why = std::string("missing required field: ") + key;
            return false;
        }
        if (!it->is_string()) {
            *why = std::string("field is not a string: ") + key;
            return false;
        }
        *out = it->get<std::string>();
        return true;
    }

    bool read_hash(const json& obj, const char* key, Hash256* out, std::string* why) {
        std::string hex;
        if (!read_string(obj, key, &hex, why)) {
            return false;
        }
        if (!parcel::storage::hash_from_hex(hex.c_str(), out)) {
            *why = std::string("field is not a 64-digit hex digest: ") + key;
            return false;
        }
        return true;
    }

    // Absent timestamps read as 0.
    bool read_optional_time(const json& obj, const char* key, Timestamp* out, std::string* why) {
        const auto it = obj.find(key);
        if (it == obj.end() || it->is_null()) {
            *out = 0;
            return true;
        }
        if (!it->is_string() || !parse_iso8601(it->get<std::string>(), out)) {
            *why = std::string("field is not an ISO-8601 time: ") + key;
            return false;
        }
        return true;
    }

    bool decode_chunk(u32 index, const json& obj, ChunkSpec* out, std::string* why) {
        if (!obj.is_object()) {
            *why = "chunk " + std::to_string(index) + " is not an object";
            return false;
        }

        ChunkSpec spec;
        spec.index = ChunkIndex{index};

        std::string status;
        bool ok = read_string(obj, "chunk_id", &spec.chunk_id, why) &&
            read_string(obj, "status", &status, why) &&
            read_u64(obj, "offset", &spec.offset, why) &&
            read_u64(obj, "size", &spec.size_bytes, why);
        if (ok && !chunk_status_parse(status, &spec.status)) {
            *why = "unknown status '" + status + "'";
            ok = false;
        }

        if (ok && spec.status == ChunkStatus::Completed) {
            ok = read_hash(obj, "hash", &spec.hash, why) &&
                read_optional_time(obj, "completed_at", &spec.completed_at, why);
            const auto pt = obj.find("processing_time");
            if (ok && pt != obj.end()) {
                if (!pt->is_number()) {
                    *why = "field is not a number: processing_time";
                    ok = false;
                } else {
                    spec.processing_time = pt->get<double>();
                }
            }
        }

        if (!ok) {
            *why = "chunk " + std::to_string(index) + ": " + *why;
            return false;
        }
        *out = std::move(spec);
        return true;
    }

    std::string expected_chunk_id(const Inventory& inv, u32 index) {
        return parcel::storage::layout_chunk_id(
            parcel::storage::layout_file_stem(inv.original.name), ChunkIndex{index}, inv.total_chunks);
    }

    [[nodiscard]] bool extent_matches(const Inventory& inv, u32 index, const ChunkSpec& spec) noexcept {
        const auto extent = parcel::storage::layout_chunk_extent(inv.original.size_bytes, inv.chunk_size, ChunkIndex{index});
        return spec.offset == extent.offset && spec.size_bytes == extent.size_bytes;
    }

    // Names and extents must follow from original_filename, original_size
    // and chunk_size, since chunk files are created and read by those names.
    bool check_structure(const Inventory& inv, std::string* why) {
        if (!parcel::storage::layout_is_plain_name(inv.original.name)) {
            *why = "original_filename '" + inv.original.name + "' is not a plain file name";
            return false;
        }
        if (inv.chunk_size == 0) {
            *why = "chunk_size is zero";
            return false;
        }
        const u64 expected = parcel::storage::layout_total_chunks(inv.original.size_bytes, inv.chunk_size);
        if (expected != inv.total_chunks) {
            *why = "total_chunks is " + std::to_string(inv.total_chunks) + ", expected " + std::to_string(expected);
            return false;
        }
        for (const auto& [index, spec] : inv.chunks) {
            const std::string prefix = "chunk " + std::to_string(index) + ": ";
            if (index > inv.total_chunks) {
                *why = prefix + "beyond total_chunks " + std::to_string(inv.total_chunks);
                return false;
            }
            const std::string chunk_id = expected_chunk_id(inv, index);
            if (spec.chunk_id != chunk_id) {
                *why = prefix + "chunk_id '" + spec.chunk_id + "' does not match expected '" + chunk_id + "'";
                return false;
            }
            if (!extent_matches(inv, index, spec)) {
                *why = prefix + "offset or size does not match the chunk layout";
                return false;
            }
        }
        return true;
    }

    Status decode_inventory(const json& doc, Inventory* out, std::string* why) {
        if (!doc.is_object()) {
            *why = "inventory document is not an object";
            return inventory_error(StatusCode::InventoryCorrupt);
        }

        Inventory inv;

        const auto version = doc.find("format_version");
        if (version != doc.end()) {
            if (!version->is_number_unsigned()) {
                *why = "field is not a non-negative integer: format_version";
                return inventory_error(StatusCode::InventoryCorrupt);
            }
            if (version->get<u64>() > kInventoryFormatVersion) {
                *why = "unsupported format_version " + std::to_string(version->get<u64>());
                return inventory_error(StatusCode::Unsupported);
            }
            inv.format_version = static_cast<u32>(version->get<u64>());
        }

        std::string hash_type;
        bool ok = read_string(doc, "original_filename", &inv.original.name, why) &&
            read_u64(doc, "original_size", &inv.original.size_bytes, why) &&
            read_hash(doc, "original_hash", &inv.original.hash, why) &&
            read_string(doc, "hash_type", &hash_type, why) &&
            read_u64(doc, "chunk_size", &inv.chunk_size, why) &&
            read_u32(doc, "total_chunks", &inv.total_chunks, why) &&
            read_optional_time(doc, "creation_time", &inv.creation_time, why) &&
            read_optional_time(doc, "last_updated", &inv.last_updated, why);
        if (!ok) {
            return inventory_error(StatusCode::InventoryCorrupt);
        }
        if (!parcel::storage::hash_algorithm_parse(hash_type.c_str(), &inv.algorithm)) {
            *why = "unsupported hash_type '" + hash_type + "'";
            return inventory_error(StatusCode::InventoryCorrupt);
        }

        const auto counters = doc.find("chunk_status");
        if (counters == doc.end() || !counters->is_object()) {
            *why = "missing required field: chunk_status";
            return inventory_error(StatusCode::InventoryCorrupt);
        }
        if (!read_u32(*counters, "total_processed", &inv.recorded.total_processed, why) ||
            !read_u32(*counters, "chunks_remaining", &inv.recorded.chunks_remaining, why)) {
            return inventory_error(StatusCode::InventoryCorrupt);
        }

        const auto chunks = doc.find("chunks");
        if (chunks == doc.end() || !chunks->is_object()) {
            *why = "missing required field: chunks";
            return inventory_error(StatusCode::InventoryCorrupt);
        }
        for (auto it = chunks->begin(); it != chunks->end(); ++it) {
            u32 index = 0;
            if (!parse_index_key(it.key(), &index)) {
                *why = "chunk key '" + it.key() + "' is not a positive decimal index";
                return inventory_error(StatusCode::InventoryCorrupt);
            }
            ChunkSpec spec;
            if (!decode_chunk(index, it.value(), &spec, why)) {
                return inventory_error(StatusCode::InventoryCorrupt);
            }
            if (!inv.chunks.emplace(index, std::move(spec)).second) {
                *why = "chunk " + std::to_string(index) + " appears more than once";
                return inventory_error(StatusCode::InventoryCorrupt);
            }
        }

        const auto merged = doc.find("merged_from");
        if (merged != doc.end()) {
            if (!merged->is_array()) {
                *why = "field is not an array: merged_from";
                return inventory_error(StatusCode::InventoryCorrupt);
            }
            for (const auto& p : *merged) {
                if (!p.is_string()) {
                    *why = "merged_from entries must be strings";
                    return inventory_error(StatusCode::InventoryCorrupt);
                }
                inv.merged_from.push_back(p.get<std::string>());
            }
        }

        if (!check_structure(inv, why)) {
            return inventory_error(StatusCode::InventoryCorrupt);
        }

        *out = std::move(inv);
        return ok_status();
    }

    ChunkSpec* upsert_chunk(Inventory* inv, ChunkIndex index) {
        auto it = inv->chunks.find(index.v);
        if (it != inv->chunks.end()) {
            return &it->second;
        }
        ChunkSpec spec;
        spec.index = index;
        spec.chunk_id = parcel::storage::layout_chunk_id(
            parcel::storage::layout_file_stem(inv->original.name), index, inv->total_chunks);
        const auto extent = parcel::storage::layout_chunk_extent(inv->original.size_bytes, inv->chunk_size, index);
        spec.offset = extent.offset;
        spec.size_bytes = extent.size_bytes;
        return &inv->chunks.emplace(index.v, std::move(spec)).first->second;
    }

    Status mark_not_completed(Inventory* inv, ChunkIndex index, ChunkStatus status, Timestamp now) noexcept {
        if (inv == nullptr) {
            return inventory_error(StatusCode::Invalid);
        }
        if (!chunk_index_in_range(index, inv->total_chunks)) {
            return inventory_error(StatusCode::ChunkIndexOutOfRange, index.v);
        }
        try {
            ChunkSpec* spec = upsert_chunk(inv, index);
            spec->status = status;
            spec->hash = Hash256{};
            spec->processing_time = 0.0;
            spec->completed_at = 0;
        } catch (const std::bad_alloc&) {
            return inventory_error(StatusCode::Unknown);
        }
        inv->last_updated = now;
        return ok_status();
    }

    std::string join_indices(const std::vector<u32>& indices) {
        std::string out;
        for (u32 i : indices) {
            if (!out.empty()) {
                out += ", ";
            }
            out += std::to_string(i);
        }
        return out;
    }
} // namespace

const char* chunk_status_name(ChunkStatus status) noexcept {
    switch (status) {
        case ChunkStatus::Pending: return "pending";
        case ChunkStatus::Completed: return "completed";
        case ChunkStatus::Failed: return "failed";
    }
    return "unknown";
}

bool chunk_status_parse(std::string_view text, ChunkStatus* out) noexcept {
    if (out == nullptr) {
        return false;
    }
    if (text == "pending") {
        *out = ChunkStatus::Pending;
    } else if (text == "completed") {
        *out = ChunkStatus::Completed;
    } else if (text == "failed") {
        *out = ChunkStatus::Failed;
    } else {
        return false;
    }
    return true;
}

Status inventory_create(const OriginalFile& original,
    parcel::storage::HashAlgorithm algorithm,
    u64 chunk_size,
    Timestamp now,
    Inventory* out) noexcept {
    if (out == nullptr || chunk_size == 0) {
        return inventory_error(StatusCode::Invalid);
    }
    const u64 total = parcel::storage::layout_total_chunks(original.size_bytes, chunk_size);
    if (total > std::numeric_limits<u32>::max() - 1) {
        return inventory_error(StatusCode::Invalid);
    }

    try {
        Inventory inv;
        inv.original = original;
        inv.algorithm = algorithm;
        inv.chunk_size = chunk_size;
        inv.total_chunks = static_cast<u32>(total);
        inv.creation_time = now;
        inv.last_updated = now;
        for (u32 i = 1; i <= inv.total_chunks; ++i) {
            upsert_chunk(&inv, ChunkIndex{i});
        }
        inv.recorded = inventory_counters(inv);
        *out = std::move(inv);
    } catch (const std::bad_alloc&) {
        return inventory_error(StatusCode::Unknown);
    }
    return ok_status();
}

const ChunkSpec* inventory_find(const Inventory& inv, ChunkIndex index) noexcept {
    const auto it = inv.chunks.find(index.v);
    return it == inv.chunks.end() ? nullptr : &it->second;
}

InventoryCounters inventory_counters(const Inventory& inv) noexcept {
    InventoryCounters c{};
    for (const auto& [index, spec] : inv.chunks) {
        if (spec.status == ChunkStatus::Completed && chunk_index_in_range(ChunkIndex{index}, inv.total_chunks)) {
            ++c.total_processed;
        }
    }
    c.chunks_remaining = inv.total_chunks - c.total_processed;
    return c;
}

std::vector<u32> inventory_indices_with_status(const Inventory& inv, ChunkStatus status) {
    std::vector<u32> out;
    for (const auto& [index, spec] : inv.chunks) {
        if (spec.status == status) {
            out.push_back(index);
        }
    }
    return out;
}

Status inventory_mark_completed(Inventory* inv,
    ChunkIndex index,
    const Hash256& hash,
    u64 size_bytes,
    double processing_time,
    Timestamp now) noexcept {
    if (inv == nullptr) {
        return inventory_error(StatusCode::Invalid);
    }
    if (!chunk_index_in_range(index, inv->total_chunks)) {
        return inventory_error(StatusCode::ChunkIndexOutOfRange, index.v);
    }
    try {
        ChunkSpec* spec = upsert_chunk(inv, index);
        spec->status = ChunkStatus::Completed;
        spec->hash = hash;
        spec->size_bytes = size_bytes;
        spec->processing_time = processing_time;
        spec->completed_at = now;
    } catch (const std::bad_alloc&) {
        return inventory_error(StatusCode::Unknown);
    }
    inv->last_updated = now;
    return ok_status();
}

Status inventory_mark_failed(Inventory* inv, ChunkIndex index, Timestamp now) noexcept {
    return mark_not_completed(inv, index, ChunkStatus::Failed, now);
}

Status inventory_mark_pending(Inventory* inv, ChunkIndex index, Timestamp now) noexcept {
    return mark_not_completed(inv, index, ChunkStatus::Pending, now);
}

Status inventory_to_json(const Inventory& inv, std::string* out) noexcept {
    if (out == nullptr) {
        return inventory_error(StatusCode::Invalid);
    }
    try {
        const InventoryCounters counters = inventory_counters(inv);

        ordered_json doc;
        doc["format_version"] = inv.format_version;
        doc["original_filename"] = inv.original.name;
        doc["original_size"] = inv.original.size_bytes;
        doc["original_hash"] = parcel::storage::hash_hex(inv.original.hash);
        doc["hash_type"] = parcel::storage::hash_algorithm_name(inv.algorithm);
        doc["chunk_size"] = inv.chunk_size;
        doc["total_chunks"] = inv.total_chunks;
        doc["creation_time"] = format_iso8601(inv.creation_time);
        doc["last_updated"] = format_iso8601(inv.last_updated);
        doc["chunk_status"] = {
            {"total_processed", counters.total_processed},
            {"chunks_remaining", counters.chunks_remaining},
        };

        ordered_json chunks = ordered_json::object();
        for (const auto& [index, spec] : inv.chunks) {
            ordered_json entry;
            entry["chunk_id"] = spec.chunk_id;
            entry["status"] = chunk_status_name(spec.status);
            entry["size"] = spec.size_bytes;
            entry["offset"] = spec.offset;
            if (spec.status == ChunkStatus::Completed) {
                entry["hash"] = parcel::storage::hash_hex(spec.hash);
                entry["processing_time"] = spec.processing_time;
                entry["completed_at"] = format_iso8601(spec.completed_at);
            }
            chunks[std::to_string(index)] = std::move(entry);
        }
        doc["chunks"] = std::move(chunks);

        if (!inv.merged_from.empty()) {
            doc["merged_from"] = inv.merged_from;
        }

        // File names are not guaranteed to be valid UTF-8.
        *out = doc.dump(2, ' ', false, json::error_handler_t::replace);
        out->push_back('\n');
    } catch (const json::exception&) {
        return inventory_error(StatusCode::Invalid);
    } catch (const std::bad_alloc&) {
        return inventory_error(StatusCode::Unknown);
    }
    return ok_status();
}

Status inventory_from_json(std::string_view text, Inventory* out, std::string* error) noexcept {
    if (out == nullptr) {
        return inventory_error(StatusCode::Invalid);
    }
    try {
        const json doc = json::parse(text.begin(), text.end());
        std::string why;
        const Status s = decode_inventory(doc, out, &why);
        if (!is_ok(s)) {
            set_error(error, std::move(why));
        }
        return s;
    } catch (const json::exception& e) {
        set_error(error, e.what());
        return inventory_error(StatusCode::InventoryCorrupt);
    } catch (const std::bad_alloc&) {
        return inventory_error(StatusCode::Unknown);
    }
}

Status inventory_load(const char* path, Inventory* out, std::string* error) noexcept {
    if (path == nullptr || out == nullptr) {
        return inventory_error(StatusCode::Invalid);
    }
    std::string text;
    const Status s = parcel::storage::fs_read_file(path, &text);
    if (s.code == StatusCode::NotFound) {
        return inventory_error(StatusCode::InventoryNotFound);
    }
    if (!is_ok(s)) {
        return s;
    }
    return inventory_from_json(text, out, error);
}

Status inventory_save(const char* path, const Inventory& inv) noexcept {
    if (path == nullptr) {
        return inventory_error(StatusCode::Invalid);
    }
    std::string text;
    const Status s = inventory_to_json(inv, &text);
    if (!is_ok(s)) {
        return s;
    }
    return parcel::storage::fs_write_file_atomic(path, text);
}

Status inventory_save_new(const char* path, const Inventory& inv) noexcept {
    if (path == nullptr) {
        return inventory_error(StatusCode::Invalid);
    }
    std::string text;
    Status s = inventory_to_json(inv, &text);
    if (!is_ok(s)) {
        return s;
    }
    s = parcel::storage::fs_write_file_exclusive(path, text);
    if (s.code == StatusCode::Conflict) {
        return inventory_error(StatusCode::OutputExists);
    }
    return s;
}

bool inventory_check(const Inventory& inv, std::vector<std::string>* issues) {
    std::vector<std::string> found;

    if (inv.original.name.empty()) {
        found.push_back("original_filename is empty");
    } else if (!parcel::storage::layout_is_plain_name(inv.original.name)) {
        found.push_back("original_filename '" + inv.original.name + "' is not a plain file name");
    }
    if (inv.chunk_size == 0) {
        found.push_back("chunk_size is zero");
    } else {
        const u64 expected = parcel::storage::layout_total_chunks(inv.original.size_bytes, inv.chunk_size);
        if (expected != inv.total_chunks) {
            found.push_back("total_chunks is " + std::to_string(inv.total_chunks) + ", expected " +
                std::to_string(expected) + " for " + std::to_string(inv.original.size_bytes) +
                " bytes at chunk size " + std::to_string(inv.chunk_size));
        }
    }

    std::vector<u32> missing;
    std::vector<u32> unexpected;
    for (u32 i = 1; i <= inv.total_chunks; ++i) {
        if (inv.chunks.find(i) == inv.chunks.end()) {
            missing.push_back(i);
        }
    }
    for (const auto& [index, spec] : inv.chunks) {
        if (index > inv.total_chunks) {
            unexpected.push_back(index);
        }
    }
    if (!missing.empty() || !unexpected.empty()) {
        std::string line = "chunk numbers are not sequential";
        if (!missing.empty()) {
            line += "; missing " + join_indices(missing);
        }
        if (!unexpected.empty()) {
            line += "; beyond total_chunks " + join_indices(unexpected);
        }
        found.push_back(std::move(line));
    }

    const InventoryCounters actual = inventory_counters(inv);
    if (!(actual == inv.recorded)) {
        found.push_back("chunk status counter mismatch: recorded " + std::to_string(inv.recorded.total_processed) +
            " processed / " + std::to_string(inv.recorded.chunks_remaining) + " remaining, actual " +
            std::to_string(actual.total_processed) + " / " + std::to_string(actual.chunks_remaining));
    }

    for (const auto& [index, spec] : inv.chunks) {
        if (index > inv.total_chunks) {
            continue;
        }
        const std::string prefix = "chunk " + std::to_string(index) + ": ";

        const std::string chunk_id = expected_chunk_id(inv, index);
        if (spec.chunk_id != chunk_id) {
            found.push_back(prefix + "chunk_id '" + spec.chunk_id + "' does not match expected '" + chunk_id + "'");
        }

        if (inv.chunk_size != 0 && !extent_matches(inv, index, spec)) {
            const auto extent = parcel::storage::layout_chunk_extent(inv.original.size_bytes, inv.chunk_size, ChunkIndex{index});
            found.push_back(prefix + "covers [" + std::to_string(spec.offset) + ", +" +
                std::to_string(spec.size_bytes) + "), expected [" + std::to_string(extent.offset) + ", +" +
                std::to_string(extent.size_bytes) + ")");
        }

        if (spec.status == ChunkStatus::Completed && parcel::storage::hash_is_zero(spec.hash)) {
            found.push_back(prefix + "completed without a hash");
        }
    }

    const bool clean = found.empty();
    if (issues != nullptr) {
        issues->insert(issues->end(), found.begin(), found.end());
    }
    return clean;
}

Status inventory_merge(const std::vector<Inventory>& inputs,
    const std::vector<std::string>& source_paths,
    Timestamp now,
    Inventory* out) noexcept {
    if (out == nullptr || inputs.empty()) {
        return inventory_error(StatusCode::Invalid);
    }

    const Inventory& base = inputs.front();
    for (size_t i = 1; i < inputs.size(); ++i) {
        const Inventory& other = inputs[i];
        if (other.original.hash != base.original.hash || other.original.size_bytes != base.original.size_bytes ||
            other.chunk_size != base.chunk_size || other.algorithm != base.algorithm ||
            other.total_chunks != base.total_chunks) {
            return inventory_error(StatusCode::Conflict, static_cast<u32>(i));
        }
    }

    Inventory merged;
    Status s = inventory_create(base.original, base.algorithm, base.chunk_size, base.creation_time, &merged);
    if (!is_ok(s)) {
        return s;
    }

    try {
        for (const Inventory& in : inputs) {
            for (const auto& [index, spec] : in.chunks) {
                if (spec.status == ChunkStatus::Completed && chunk_index_in_range(ChunkIndex{index}, merged.total_chunks)) {
                    merged.chunks[index] = spec;
                }
            }
        }
        merged.merged_from = source_paths;
    } catch (const std::bad_alloc&) {
        return inventory_error(StatusCode::Unknown);
    }
    merged.last_updated = now;
    merged.recorded = inventory_counters(merged);

    *out = std::move(merged);
    return ok_status();
}

} // namespace parcel::inventory
