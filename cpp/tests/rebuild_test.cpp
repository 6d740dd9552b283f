#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "parcel/chunker/chunker.hpp"
#include "parcel/rebuild/rebuild.hpp"
#include "test_support.hpp"

using namespace parcel::core;
using namespace parcel::rebuild;
using parcel::chunker::ChunkParams;
using parcel::chunker::ChunkSummary;
using parcel::storage::HashAlgorithm;
using parcel::testing::file_exists;
using parcel::testing::make_pattern;
using parcel::testing::read_file;
using parcel::testing::write_file;

class RebuildTest : public parcel::testing::TempDirTest {
protected:
    // Splits a source of the given size into out/ and returns its bytes.
    std::vector<u8> split(const std::string& name, size_t size, u64 chunk, HashAlgorithm algo = HashAlgorithm::Blake3) {
        std::vector<u8> data = make_pattern(size, static_cast<u32>(size) + 3);
        const std::string source = path(name);
        write_file(source, data);

        ChunkParams p;
        p.source_path = source;
        p.output_dir = path("out");
        p.chunk_size_bytes = chunk;
        p.algorithm = algo;
        p.space_margin_bytes = 0;
        ChunkSummary summary;
        EXPECT_TRUE(is_ok(parcel::chunker::chunk_file(p, nullptr, &summary)));
        EXPECT_TRUE(summary.failures.empty());
        return data;
    }

    void regenerate(const std::string& name, u64 chunk, u32 index) {
        ChunkParams p;
        p.source_path = path(name);
        p.output_dir = path("out");
        p.chunk_size_bytes = chunk;
        p.space_margin_bytes = 0;
        p.target = ChunkIndex{index};
        ChunkSummary summary;
        ASSERT_TRUE(is_ok(parcel::chunker::chunk_file(p, nullptr, &summary)));
    }

    RebuildParams join_params(const std::string& chunk_name) const {
        RebuildParams p;
        p.chunk_path = path("out/" + chunk_name);
        p.output_dir = path("restored");
        return p;
    }
};

TEST_F(RebuildTest, RoundTripBlake3) {
    const std::vector<u8> data = split("data.bin", 10000, 1000);
    RebuildResult result;
    ASSERT_TRUE(is_ok(rebuild_file(join_params("data.chunk004.bin"), nullptr, &result)));
    EXPECT_EQ(result.verification, Verification::Passed);
    EXPECT_EQ(result.output_path, path("restored/data.bin"));
    EXPECT_EQ(result.bytes_written, 10000u);
    EXPECT_EQ(result.computed_hash, result.expected_hash);
    EXPECT_EQ(read_file(result.output_path), data);
}

TEST_F(RebuildTest, RoundTripSha256) {
    const std::vector<u8> data = split("data.bin", 7777, 1024, HashAlgorithm::Sha256);
    RebuildResult result;
    ASSERT_TRUE(is_ok(rebuild_file(join_params("data.chunk001.bin"), nullptr, &result)));
    EXPECT_EQ(result.algorithm, HashAlgorithm::Sha256);
    EXPECT_EQ(result.verification, Verification::Passed);
    EXPECT_EQ(read_file(result.output_path), data);
}

TEST_F(RebuildTest, SingleByteSource) {
    const std::vector<u8> data = split("one.bin", 1, 1000);
    RebuildResult result;
    ASSERT_TRUE(is_ok(rebuild_file(join_params("one.chunk001.bin"), nullptr, &result)));
    EXPECT_EQ(read_file(result.output_path), data);
}

TEST_F(RebuildTest, EmptySource) {
    split("empty.bin", 0, 1000);
    // No artifact exists; the name only locates the inventory.
    RebuildResult result;
    ASSERT_TRUE(is_ok(rebuild_file(join_params("empty.chunk001.bin"), nullptr, &result)));
    EXPECT_EQ(result.verification, Verification::Passed);
    EXPECT_TRUE(file_exists(result.output_path));
    EXPECT_TRUE(read_file(result.output_path).empty());
}

TEST_F(RebuildTest, MissingChunksBlockUntilRegenerated) {
    const std::vector<u8> data = split("data.bin", 10000, 1000);
    ASSERT_TRUE(is_ok(parcel::storage::fs_remove_file(path("out/data.chunk003.bin").c_str())));
    ASSERT_TRUE(is_ok(parcel::storage::fs_remove_file(path("out/data.chunk008.bin").c_str())));

    RebuildResult result;
    const Status s = rebuild_file(join_params("data.chunk001.bin"), nullptr, &result);
    EXPECT_EQ(s.code, StatusCode::ReconstructionBlocked);
    EXPECT_EQ(s.aux, 2u);
    EXPECT_EQ(result.blocked_chunks, (std::vector<std::string>{"data.chunk003.bin", "data.chunk008.bin"}));
    EXPECT_EQ(result.plan.missing, 2u);
    EXPECT_FALSE(file_exists(path("restored/data.bin")));

    regenerate("data.bin", 1000, 3);
    regenerate("data.bin", 1000, 8);

    ASSERT_TRUE(is_ok(rebuild_file(join_params("data.chunk001.bin"), nullptr, &result)));
    EXPECT_EQ(result.verification, Verification::Passed);
    EXPECT_EQ(read_file(result.output_path), data);
}

TEST_F(RebuildTest, PendingChunkBlocks) {
    split("data.bin", 5000, 1000);
    parcel::inventory::Inventory inv;
    const std::string inv_path = path("out/data.inventory.json");
    ASSERT_TRUE(is_ok(parcel::inventory::inventory_load(inv_path.c_str(), &inv, nullptr)));
    ASSERT_TRUE(is_ok(parcel::inventory::inventory_mark_failed(&inv, ChunkIndex{5}, 0)));
    ASSERT_TRUE(is_ok(parcel::inventory::inventory_save(inv_path.c_str(), inv)));

    RebuildResult result;
    const Status s = rebuild_file(join_params("data.chunk001.bin"), nullptr, &result);
    EXPECT_EQ(s.code, StatusCode::ReconstructionBlocked);
    EXPECT_EQ(s.aux, 1u);
    EXPECT_EQ(result.plan.not_completed, 1u);
    EXPECT_EQ(result.blocked_chunks, std::vector<std::string>{"data.chunk005.bin"});
}

TEST_F(RebuildTest, TruncatedChunkBlocks) {
    split("data.bin", 5000, 1000);
    const std::string victim = path("out/data.chunk002.bin");
    std::vector<u8> bytes = read_file(victim);
    bytes.pop_back();
    write_file(victim, bytes);

    RebuildResult result;
    EXPECT_EQ(rebuild_file(join_params("data.chunk001.bin"), nullptr, &result).code, StatusCode::ReconstructionBlocked);
    EXPECT_EQ(result.plan.size_mismatched, 1u);
    EXPECT_EQ(result.plan.entries[1].issue, PlanIssue::SizeMismatch);
    EXPECT_EQ(result.plan.entries[1].actual_size, 999u);
    EXPECT_FALSE(file_exists(path("restored/data.bin")));
}

TEST_F(RebuildTest, AlteredChunkFailsVerification) {
    const std::vector<u8> data = split("data.bin", 5000, 1000);
    const std::string victim = path("out/data.chunk004.bin");
    std::vector<u8> bytes = read_file(victim);
    bytes[10] ^= 0xFF;
    write_file(victim, bytes);

    RebuildResult result;
    const Status s = rebuild_file(join_params("data.chunk001.bin"), nullptr, &result);
    EXPECT_EQ(s.code, StatusCode::HashVerificationFailed);
    EXPECT_EQ(result.plan.hash_mismatched, 1u);
    EXPECT_EQ(result.blocked_chunks, std::vector<std::string>{"data.chunk004.bin"});
    EXPECT_FALSE(file_exists(path("restored/data.bin")));

    // Without validation the damage goes unnoticed.
    RebuildParams p = join_params("data.chunk001.bin");
    p.validate = false;
    ASSERT_TRUE(is_ok(rebuild_file(p, nullptr, &result)));
    EXPECT_EQ(result.verification, Verification::Skipped);
    EXPECT_TRUE(parcel::storage::hash_is_zero(result.computed_hash));
    EXPECT_NE(read_file(result.output_path), data);
}

TEST_F(RebuildTest, WholeFileHashMismatchKeepsOutput) {
    split("data.bin", 5000, 1000);
    parcel::inventory::Inventory inv;
    const std::string inv_path = path("out/data.inventory.json");
    ASSERT_TRUE(is_ok(parcel::inventory::inventory_load(inv_path.c_str(), &inv, nullptr)));
    inv.original.hash.b[0] ^= 0xFF;
    ASSERT_TRUE(is_ok(parcel::inventory::inventory_save(inv_path.c_str(), inv)));

    RebuildResult result;
    const Status s = rebuild_file(join_params("data.chunk001.bin"), nullptr, &result);
    EXPECT_EQ(s.code, StatusCode::HashVerificationFailed);
    EXPECT_EQ(s.aux, 0u);
    EXPECT_EQ(result.verification, Verification::Failed);
    EXPECT_TRUE(result.blocked_chunks.empty());
    EXPECT_TRUE(plan_complete(result.plan));
    EXPECT_EQ(result.bytes_written, 5000u);
    EXPECT_NE(result.computed_hash, result.expected_hash);
    EXPECT_TRUE(file_exists(path("restored/data.bin")));
}

TEST_F(RebuildTest, WrittenSizeMismatchKeepsOutput) {
    split("data.bin", 5000, 1000);
    parcel::inventory::Inventory inv;
    ASSERT_TRUE(is_ok(parcel::inventory::inventory_load(path("out/data.inventory.json").c_str(), &inv, nullptr)));
    ReconstructionPlan plan;
    ASSERT_TRUE(is_ok(rebuild_plan(inv, path("out"), true, &plan)));
    ASSERT_TRUE(plan_complete(plan));

    // The chunks no longer add up to the recorded original.
    inv.original.size_bytes += 1;
    RebuildResult result;
    const Status s = rebuild_assemble(inv, plan, path("restored"), true, nullptr, &result);
    EXPECT_EQ(s.code, StatusCode::SizeMismatch);
    EXPECT_EQ(result.verification, Verification::Failed);
    EXPECT_EQ(result.bytes_written, 5000u);
    EXPECT_EQ(result.expected_size, 5001u);
    EXPECT_TRUE(file_exists(path("restored/data.bin")));
}

TEST_F(RebuildTest, EditedOriginalSizeIsCaughtOnLoad) {
    split("data.bin", 5000, 1000);
    ASSERT_TRUE(parcel::testing::replace_in_file(path("out/data.inventory.json"),
        "\"original_size\": 5000", "\"original_size\": 4999"));

    RebuildResult result;
    const Status s = rebuild_file(join_params("data.chunk001.bin"), nullptr, &result);
    EXPECT_EQ(s.code, StatusCode::InventoryNotFound);
    EXPECT_EQ(s.aux, 1u);
    EXPECT_NE(result.inventory_error.find("chunk 5"), std::string::npos) << result.inventory_error;
    EXPECT_FALSE(file_exists(path("restored/data.bin")));
}

TEST_F(RebuildTest, OutputNameStaysInsideOutputDirectory) {
    split("data.bin", 3000, 1000);
    ASSERT_TRUE(parcel::testing::replace_in_file(path("out/data.inventory.json"),
        "\"original_filename\": \"data.bin\"", "\"original_filename\": \"../escaped.bin\""));

    RebuildResult result;
    const Status s = rebuild_file(join_params("data.chunk001.bin"), nullptr, &result);
    EXPECT_EQ(s.code, StatusCode::InventoryNotFound);
    EXPECT_EQ(s.aux, 1u);
    EXPECT_FALSE(file_exists(path("escaped.bin")));

    // An in-memory inventory gets the same treatment.
    parcel::inventory::Inventory inv;
    parcel::inventory::OriginalFile original;
    original.name = "../escaped.bin";
    ASSERT_TRUE(is_ok(parcel::inventory::inventory_create(original, HashAlgorithm::Blake3, 1000, 0, &inv)));
    ReconstructionPlan plan;
    ASSERT_TRUE(is_ok(rebuild_plan(inv, path("out"), true, &plan)));
    EXPECT_EQ(rebuild_assemble(inv, plan, path("restored"), true, nullptr, &result).code, StatusCode::InventoryCorrupt);
    EXPECT_FALSE(file_exists(path("escaped.bin")));
}

TEST_F(RebuildTest, ExistingOutputIsNotReplaced) {
    split("data.bin", 3000, 1000);
    const std::string out = path("restored/data.bin");
    ASSERT_TRUE(is_ok(parcel::storage::fs_ensure_directory(path("restored").c_str())));
    parcel::testing::write_text(out, "keep me");

    RebuildResult result;
    EXPECT_EQ(rebuild_file(join_params("data.chunk001.bin"), nullptr, &result).code, StatusCode::OutputExists);
    const std::vector<u8> kept = read_file(out);
    EXPECT_EQ(std::string(kept.begin(), kept.end()), "keep me");
}

TEST_F(RebuildTest, CorruptInventoryIsReportedAsNotFound) {
    split("data.bin", 3000, 1000);
    parcel::testing::write_text(path("out/data.inventory.json"), "{\"original_filename\": ");

    RebuildResult result;
    const Status s = rebuild_file(join_params("data.chunk001.bin"), nullptr, &result);
    EXPECT_EQ(s.code, StatusCode::InventoryNotFound);
    EXPECT_EQ(s.aux, 1u);
    EXPECT_FALSE(result.inventory_error.empty());
}

TEST_F(RebuildTest, MissingInventory) {
    RebuildResult result;
    RebuildParams p = join_params("ghost.chunk001.bin");
    Status s = rebuild_file(p, nullptr, &result);
    EXPECT_EQ(s.code, StatusCode::InventoryNotFound);
    EXPECT_EQ(s.aux, 0u);

    p.chunk_path = path("out/not-a-chunk.txt");
    s = rebuild_file(p, nullptr, &result);
    EXPECT_EQ(s.code, StatusCode::InventoryNotFound);
}

TEST_F(RebuildTest, ExplicitInventoryPath) {
    const std::vector<u8> data = split("data.bin", 2500, 1000);
    const std::string moved = path("data.inventory.json");
    std::vector<u8> raw = read_file(path("out/data.inventory.json"));
    write_file(moved, raw);
    ASSERT_TRUE(is_ok(parcel::storage::fs_remove_file(path("out/data.inventory.json").c_str())));

    RebuildParams p = join_params("data.chunk002.bin");
    p.inventory_path = moved;
    RebuildResult result;
    ASSERT_TRUE(is_ok(rebuild_file(p, nullptr, &result)));
    EXPECT_EQ(result.inventory_path, moved);
    EXPECT_EQ(read_file(result.output_path), data);
}

TEST_F(RebuildTest, PlanListsEveryChunk) {
    split("data.bin", 2500, 1000);
    parcel::inventory::Inventory inv;
    ASSERT_TRUE(is_ok(parcel::inventory::inventory_load(path("out/data.inventory.json").c_str(), &inv, nullptr)));

    ReconstructionPlan plan;
    ASSERT_TRUE(is_ok(rebuild_plan(inv, path("out"), true, &plan)));
    ASSERT_EQ(plan.entries.size(), 3u);
    EXPECT_TRUE(plan_complete(plan));
    EXPECT_EQ(plan.entries[2].offset, 2000u);
    EXPECT_EQ(plan.entries[2].expected_size, 500u);
    EXPECT_EQ(plan.entries[2].artifact_path, path("out/data.chunk003.bin"));

    ASSERT_TRUE(is_ok(rebuild_plan(inv, path("elsewhere"), false, &plan)));
    EXPECT_EQ(plan.missing, 3u);
    EXPECT_FALSE(plan_complete(plan));
}

TEST(RebuildNames, IssueAndVerificationNames) {
    EXPECT_STREQ(plan_issue_name(PlanIssue::Missing), "missing");
    EXPECT_STREQ(plan_issue_name(PlanIssue::HashMismatch), "hash mismatch");
    EXPECT_STREQ(verification_name(Verification::Passed), "PASSED");
    EXPECT_STREQ(verification_name(Verification::Skipped), "SKIPPED");
}
