#include <array>
#include <cstddef>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "parcel/storage/hashing.hpp"
#include "test_support.hpp"

using parcel::core::Hash256;
using parcel::core::StatusCode;
using parcel::storage::HashAlgorithm;

namespace {
    Hash256 one_shot(HashAlgorithm algo, const std::vector<parcel::core::u8>& data) {
        Hash256 out{};
        const auto s = parcel::storage::hash_compute(algo,
            {data.data(), static_cast<parcel::core::u32>(data.size())}, &out);
        EXPECT_EQ(s.code, StatusCode::Ok);
        return out;
    }
} // namespace

TEST(StorageHashing, Blake3EmptyVector) {
    Hash256 out{};
    const auto s = parcel::storage::hash_compute(HashAlgorithm::Blake3, {nullptr, 0}, &out);
    ASSERT_EQ(s.code, StatusCode::Ok);
    EXPECT_EQ(parcel::storage::hash_hex(out), "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262");
}

TEST(StorageHashing, Sha256KnownVectors) {
    Hash256 out{};
    ASSERT_EQ(parcel::storage::hash_compute(HashAlgorithm::Sha256, {nullptr, 0}, &out).code, StatusCode::Ok);
    EXPECT_EQ(parcel::storage::hash_hex(out), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");

    const unsigned char abc[] = {'a', 'b', 'c'};
    ASSERT_EQ(parcel::storage::hash_compute(HashAlgorithm::Sha256, {abc, 3}, &out).code, StatusCode::Ok);
    EXPECT_EQ(parcel::storage::hash_hex(out), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(StorageHashing, AlgorithmsDisagree) {
    const auto data = parcel::testing::make_pattern(1000);
    EXPECT_NE(one_shot(HashAlgorithm::Blake3, data), one_shot(HashAlgorithm::Sha256, data));
}

TEST(StorageHashing, StreamingMatchesOneShot) {
    const auto data = parcel::testing::make_pattern(3 * 4096 + 17);
    for (HashAlgorithm algo : {HashAlgorithm::Blake3, HashAlgorithm::Sha256}) {
        parcel::storage::Hasher h;
        ASSERT_EQ(h.init(algo).code, StatusCode::Ok);
        size_t off = 0;
        for (size_t piece : {1u, 4095u, 4096u, 7u}) {
            ASSERT_EQ(h.update({data.data() + off, static_cast<parcel::core::u32>(piece)}).code, StatusCode::Ok);
            off += piece;
        }
        ASSERT_EQ(h.update({data.data() + off, static_cast<parcel::core::u32>(data.size() - off)}).code, StatusCode::Ok);
        Hash256 streamed{};
        ASSERT_EQ(h.finalize(&streamed).code, StatusCode::Ok);
        EXPECT_EQ(streamed, one_shot(algo, data)) << parcel::storage::hash_algorithm_name(algo);
    }
}

TEST(StorageHashing, HasherReusableAfterInit) {
    const auto data = parcel::testing::make_pattern(64);
    parcel::storage::Hasher h;
    Hash256 first{};
    Hash256 second{};
    ASSERT_EQ(h.init(HashAlgorithm::Sha256).code, StatusCode::Ok);
    ASSERT_EQ(h.update({data.data(), 64}).code, StatusCode::Ok);
    ASSERT_EQ(h.finalize(&first).code, StatusCode::Ok);
    ASSERT_EQ(h.init(HashAlgorithm::Sha256).code, StatusCode::Ok);
    ASSERT_EQ(h.update({data.data(), 64}).code, StatusCode::Ok);
    ASSERT_EQ(h.finalize(&second).code, StatusCode::Ok);
    EXPECT_EQ(first, second);
}

TEST(StorageHashing, UpdateBeforeInitIsInvalid) {
    parcel::storage::Hasher h;
    const unsigned char b = 1;
    EXPECT_EQ(h.update({&b, 1}).code, StatusCode::Invalid);
    Hash256 out{};
    EXPECT_EQ(h.finalize(&out).code, StatusCode::Invalid);
}

TEST(StorageHashing, InvalidWhenOutNull) {
    const auto s = parcel::storage::hash_compute(HashAlgorithm::Blake3, {nullptr, 0}, nullptr);
    EXPECT_EQ(s.domain, parcel::core::StatusDomain::Hash);
    EXPECT_EQ(s.code, StatusCode::Invalid);
}

TEST(StorageHashing, InvalidWhenDataNullButLenNonZero) {
    Hash256 out{};
    const auto s = parcel::storage::hash_compute(HashAlgorithm::Blake3, {nullptr, 1}, &out);
    EXPECT_EQ(s.code, StatusCode::Invalid);
}

TEST(StorageHashing, AlgorithmNames) {
    HashAlgorithm algo{};
    ASSERT_TRUE(parcel::storage::hash_algorithm_parse("sha256", &algo));
    EXPECT_EQ(algo, HashAlgorithm::Sha256);
    ASSERT_TRUE(parcel::storage::hash_algorithm_parse("blake3", &algo));
    EXPECT_EQ(algo, HashAlgorithm::Blake3);
    EXPECT_FALSE(parcel::storage::hash_algorithm_parse("md5", &algo));
    EXPECT_FALSE(parcel::storage::hash_algorithm_parse("SHA256", &algo));
    EXPECT_STREQ(parcel::storage::hash_algorithm_name(HashAlgorithm::Sha256), "sha256");
}

TEST(StorageHashing, HexDecodeRejectsMalformed) {
    const auto data = parcel::testing::make_pattern(10);
    const Hash256 h = one_shot(HashAlgorithm::Blake3, data);
    const std::string hex = parcel::storage::hash_hex(h);
    ASSERT_EQ(hex.size(), parcel::storage::kHashHexChars);

    Hash256 back{};
    ASSERT_TRUE(parcel::storage::hash_from_hex(hex.c_str(), &back));
    EXPECT_EQ(back, h);

    std::string upper = hex;
    for (char& c : upper) {
        if (c >= 'a' && c <= 'f') c = static_cast<char>(c - 'a' + 'A');
    }
    ASSERT_TRUE(parcel::storage::hash_from_hex(upper.c_str(), &back));
    EXPECT_EQ(back, h);

    EXPECT_FALSE(parcel::storage::hash_from_hex(hex.substr(0, 63).c_str(), &back));
    EXPECT_FALSE(parcel::storage::hash_from_hex((hex.substr(0, 63) + "g").c_str(), &back));
    EXPECT_FALSE(parcel::storage::hash_from_hex("", &back));
}

class StorageHashingFile : public parcel::testing::TempDirTest {};

TEST_F(StorageHashingFile, RangeMatchesSliceHash) {
    const auto data = parcel::testing::make_pattern(3 * 1024 * 1024 + 5);
    const std::string p = path("input.bin");
    parcel::testing::write_file(p, data);

    const parcel::core::u64 offset = 1024 * 1024 - 3;
    const parcel::core::u64 length = 1024 * 1024 + 11;
    Hash256 ranged{};
    parcel::core::u64 bytes = 0;
    ASSERT_EQ(parcel::storage::hash_file_range(HashAlgorithm::Blake3, p.c_str(), offset, length, &ranged, &bytes).code,
        StatusCode::Ok);
    EXPECT_EQ(bytes, length);

    const std::vector<parcel::core::u8> slice(data.begin() + offset, data.begin() + offset + length);
    EXPECT_EQ(ranged, one_shot(HashAlgorithm::Blake3, slice));
}

TEST_F(StorageHashingFile, WholeFileToEnd) {
    const auto data = parcel::testing::make_pattern(2 * 1024 * 1024 + 1);
    const std::string p = path("whole.bin");
    parcel::testing::write_file(p, data);

    Hash256 h{};
    parcel::core::u64 bytes = 0;
    ASSERT_EQ(parcel::storage::hash_file_range(HashAlgorithm::Sha256, p.c_str(), 0, parcel::storage::kToEndOfFile, &h, &bytes).code,
        StatusCode::Ok);
    EXPECT_EQ(bytes, data.size());
    EXPECT_EQ(h, one_shot(HashAlgorithm::Sha256, data));
}

TEST_F(StorageHashingFile, RangePastEndIsIo) {
    const std::string p = path("short.bin");
    parcel::testing::write_file(p, parcel::testing::make_pattern(100));
    Hash256 h{};
    const auto s = parcel::storage::hash_file_range(HashAlgorithm::Blake3, p.c_str(), 50, 51, &h, nullptr);
    EXPECT_EQ(s.code, StatusCode::Io);
    EXPECT_EQ(s.aux, 0u);
}

TEST_F(StorageHashingFile, MissingFileIsNotFound) {
    Hash256 h{};
    const auto s = parcel::storage::hash_file_range(HashAlgorithm::Blake3, path("nope").c_str(), 0,
        parcel::storage::kToEndOfFile, &h, nullptr);
    EXPECT_EQ(s.code, StatusCode::NotFound);
}
