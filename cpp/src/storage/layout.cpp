#include "parcel/storage/layout.hpp"

#include <cstdio>
#include <filesystem>

namespace parcel::storage {
    namespace {
        [[nodiscard]] bool all_digits(std::string_view s) noexcept {
            if (s.empty()) {
                return false;
            }
            for (char c : s) {
                if (c < '0' || c > '9') {
                    return false;
                }
            }
            return true;
        }
    } // namespace

    u32 layout_chunk_id_digits(u32 total_chunks) noexcept {
        u32 digits = 1;
        for (u32 v = total_chunks; v >= 10; v /= 10) {
            ++digits;
        }
        return digits < kMinChunkIdDigits ? kMinChunkIdDigits : digits;
    }

    std::string layout_file_stem(std::string_view original_name) {
        const std::filesystem::path p{std::string(original_name)};
        return p.filename().stem().string();
    }

    std::string layout_chunk_id(std::string_view stem, parcel::core::ChunkIndex index, u32 total_chunks) {
        char num[16];
        std::snprintf(num, sizeof(num), "%0*u", static_cast<int>(layout_chunk_id_digits(total_chunks)), index.v);

        std::string out;
        out.reserve(stem.size() + kChunkMarker.size() + sizeof(num) + kChunkExtension.size());
        out.append(stem);
        out.append(kChunkMarker);
        out.append(num);
        out.append(kChunkExtension);
        return out;
    }

    std::string layout_inventory_name(std::string_view stem) {
        std::string out(stem);
        out.append(kInventorySuffix);
        return out;
    }

    std::string layout_log_name(std::string_view stem) {
        std::string out(stem);
        out.append(kLogSuffix);
        return out;
    }

    bool layout_parse_chunk_name(std::string_view file_name, ChunkName* out) {
        if (out == nullptr) {
            return false;
        }
        if (file_name.size() <= kChunkExtension.size() ||
            file_name.substr(file_name.size() - kChunkExtension.size()) != kChunkExtension) {
            return false;
        }
        const std::string_view without_ext = file_name.substr(0, file_name.size() - kChunkExtension.size());

        const size_t marker = without_ext.rfind(kChunkMarker);
        if (marker == std::string_view::npos || marker == 0) {
            return false;
        }
        const std::string_view digits = without_ext.substr(marker + kChunkMarker.size());
        if (!all_digits(digits) || digits.size() > 9) {
            return false;
        }

        u32 index = 0;
        for (char c : digits) {
            index = index * 10 + static_cast<u32>(c - '0');
        }
        if (index == 0) {
            return false;
        }

        out->stem = std::string(without_ext.substr(0, marker));
        out->index = parcel::core::ChunkIndex{index};
        return true;
    }

    std::string layout_dirname(std::string_view path) {
        const std::filesystem::path parent = std::filesystem::path{std::string(path)}.parent_path();
        return parent.empty() ? std::string(".") : parent.string();
    }

    std::string layout_basename(std::string_view path) {
        return std::filesystem::path{std::string(path)}.filename().string();
    }

    std::string layout_join(std::string_view dir, std::string_view name) {
        if (dir.empty()) {
            return std::string(name);
        }
        return (std::filesystem::path{std::string(dir)} / std::string(name)).string();
    }

    bool layout_is_plain_name(std::string_view name) noexcept {
        if (name.empty() || name == "." || name == "..") {
            return false;
        }
        return name.find('/') == std::string_view::npos && name.find('\0') == std::string_view::npos;
    }

    bool layout_inventory_path_for_chunk(std::string_view chunk_path, std::string* out) {
        if (out == nullptr) {
            return false;
        }
        ChunkName name;
        if (!layout_parse_chunk_name(layout_basename(chunk_path), &name)) {
            return false;
        }
        *out = layout_join(layout_dirname(chunk_path), layout_inventory_name(name.stem));
        return true;
    }
} // namespace parcel::storage
