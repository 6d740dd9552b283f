#include "parcel/storage/hashing.hpp"

#include <cerrno>
#include <cstddef>
#include <cstring>
#include <new>
#include <vector>
#include <unistd.h>

#include <blake3.h>
#include <openssl/evp.h>

#include "parcel/storage/fs.hpp"

namespace parcel::storage {

using namespace parcel::core;

struct Hasher::State {
    blake3_hasher b3;
    EVP_MD_CTX* md{nullptr};
    bool active{false};

    ~State() {
        if (md != nullptr) {
            EVP_MD_CTX_free(md);
        }
    }
};

namespace {
    [[nodiscard]] Status hash_error(StatusCode code) noexcept {
        return make_status(StatusDomain::Hash, code);
    }

    [[nodiscard]] bool is_hex_char(char c) noexcept {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
    }

    [[nodiscard]] u8 hex_value(char c) noexcept {
        if (c >= '0' && c <= '9') return static_cast<u8>(c - '0');
        if (c >= 'a' && c <= 'f') return static_cast<u8>(c - 'a' + 10);
        return static_cast<u8>(c - 'A' + 10);
    }
} // namespace

const char* hash_algorithm_name(HashAlgorithm algo) noexcept {
    switch (algo) {
        case HashAlgorithm::Blake3: return "blake3";
        case HashAlgorithm::Sha256: return "sha256";
    }
    return "unknown";
}

bool hash_algorithm_parse(const char* name, HashAlgorithm* out) noexcept {
    if (name == nullptr || out == nullptr) {
        return false;
    }
    if (std::strcmp(name, "blake3") == 0) {
        *out = HashAlgorithm::Blake3;
        return true;
    }
    if (std::strcmp(name, "sha256") == 0) {
        *out = HashAlgorithm::Sha256;
        return true;
    }
    return false;
}

Hasher::Hasher() noexcept = default;
Hasher::~Hasher() = default;
Hasher::Hasher(Hasher&&) noexcept = default;
Hasher& Hasher::operator=(Hasher&&) noexcept = default;

Status Hasher::init(HashAlgorithm algo) noexcept {
    if (!state_) {
        state_.reset(new (std::nothrow) State());
        if (!state_) {
            return hash_error(StatusCode::Unknown);
        }
    }
    algo_ = algo;
    state_->active = false;

    switch (algo) {
        case HashAlgorithm::Blake3:
            blake3_hasher_init(&state_->b3);
            break;
        case HashAlgorithm::Sha256:
            if (state_->md == nullptr) {
                state_->md = EVP_MD_CTX_new();
                if (state_->md == nullptr) {
                    return make_status(StatusDomain::External, StatusCode::Unknown);
                }
            }
            if (EVP_DigestInit_ex(state_->md, EVP_sha256(), nullptr) != 1) {
                return make_status(StatusDomain::External, StatusCode::Unknown);
            }
            break;
        default:
            return hash_error(StatusCode::Unsupported);
    }

    state_->active = true;
    return ok_status();
}

Status Hasher::update(BufferView data) noexcept {
    if (!state_ || !state_->active) {
        return hash_error(StatusCode::Invalid);
    }
    if (!buffer_ok(data)) {
        return hash_error(StatusCode::Invalid);
    }
    if (data.len == 0) {
        return ok_status();
    }

    if (algo_ == HashAlgorithm::Blake3) {
        blake3_hasher_update(&state_->b3, data.data, static_cast<size_t>(data.len));
        return ok_status();
    }
    if (EVP_DigestUpdate(state_->md, data.data, static_cast<size_t>(data.len)) != 1) {
        return make_status(StatusDomain::External, StatusCode::Unknown);
    }
    return ok_status();
}

Status Hasher::finalize(Hash256* out) noexcept {
    if (out == nullptr || !state_ || !state_->active) {
        return hash_error(StatusCode::Invalid);
    }
    state_->active = false;

    if (algo_ == HashAlgorithm::Blake3) {
        blake3_hasher_finalize(&state_->b3, out->b.data(), out->b.size());
        return ok_status();
    }

    unsigned int len = 0;
    if (EVP_DigestFinal_ex(state_->md, out->b.data(), &len) != 1 || len != out->b.size()) {
        return make_status(StatusDomain::External, StatusCode::Unknown);
    }
    return ok_status();
}

Status hash_compute(HashAlgorithm algo, BufferView data, Hash256* out) noexcept {
    if (out == nullptr) {
        return hash_error(StatusCode::Invalid);
    }
    if (!buffer_ok(data)) {
        return hash_error(StatusCode::Invalid);
    }

    Hasher hasher;
    Status s = hasher.init(algo);
    if (!is_ok(s)) {
        return s;
    }
    s = hasher.update(data);
    if (!is_ok(s)) {
        return s;
    }
    return hasher.finalize(out);
}

Status hash_file_range(HashAlgorithm algo,
    const char* path,
    u64 offset,
    u64 length,
    Hash256* out,
    u64* bytes_out) noexcept {
    if (path == nullptr || out == nullptr) {
        return hash_error(StatusCode::Invalid);
    }
    if (bytes_out != nullptr) {
        *bytes_out = 0;
    }

    UniqueFd fd;
    Status s = fs_open_read(path, &fd);
    if (!is_ok(s)) {
        return s;
    }

    Hasher hasher;
    s = hasher.init(algo);
    if (!is_ok(s)) {
        return s;
    }

    std::vector<u8> buf(kHashReadBufferBytes);
    const bool to_eof = (length == kToEndOfFile);
    u64 done = 0;
    while (to_eof || done < length) {
        u32 want = kHashReadBufferBytes;
        if (!to_eof && length - done < want) {
            want = static_cast<u32>(length - done);
        }

        if (to_eof) {
            // Sequential reads from offset; pread keeps the descriptor position untouched.
            const ssize_t n = ::pread(fd.get(), buf.data(), want, static_cast<off_t>(offset + done));
            if (n < 0) {
                if (errno == EINTR) continue;
                return make_status(StatusDomain::Storage, StatusCode::Io, static_cast<u32>(errno));
            }
            if (n == 0) break;
            want = static_cast<u32>(n);
        } else {
            s = fs_pread_exact(fd.get(), offset + done, BufferMut{buf.data(), want});
            if (!is_ok(s)) {
                return s;
            }
        }

        s = hasher.update(BufferView{buf.data(), want});
        if (!is_ok(s)) {
            return s;
        }
        done += want;
    }

    s = hasher.finalize(out);
    if (!is_ok(s)) {
        return s;
    }
    if (bytes_out != nullptr) {
        *bytes_out = done;
    }
    return ok_status();
}

void hash_to_hex(const Hash256& hash, char* out, size_t out_size) noexcept {
    static const char hex[] = "0123456789abcdef";
    if (out == nullptr || out_size == 0) {
        return;
    }
    size_t pos = 0;
    for (size_t i = 0; i < hash.b.size() && pos + 2 < out_size; ++i) {
        out[pos++] = hex[(hash.b[i] >> 4) & 0xF];
        out[pos++] = hex[hash.b[i] & 0xF];
    }
    out[pos] = '\0';
}

std::string hash_hex(const Hash256& hash) {
    char buf[kHashHexChars + 1];
    hash_to_hex(hash, buf, sizeof(buf));
    return std::string(buf);
}

bool hash_from_hex(const char* hex, Hash256* out) noexcept {
    if (hex == nullptr || out == nullptr) return false;
    if (std::strlen(hex) != kHashHexChars) return false;
    for (size_t i = 0; i < kHashHexChars; ++i) {
        if (!is_hex_char(hex[i])) return false;
    }
    Hash256 h{};
    for (size_t i = 0; i < h.b.size(); ++i) {
        h.b[i] = static_cast<u8>((hex_value(hex[i * 2]) << 4) | hex_value(hex[i * 2 + 1]));
    }
    *out = h;
    return true;
}

} // namespace parcel::storage
