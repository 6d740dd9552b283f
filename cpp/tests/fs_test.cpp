#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>
#include <fcntl.h>

#include "parcel/storage/fs.hpp"
#include "test_support.hpp"

using namespace parcel::core;
using namespace parcel::storage;

class StorageFsTest : public parcel::testing::TempDirTest {};

TEST_F(StorageFsTest, StatReportsKindAndSize) {
    const std::string f = path("a.bin");
    parcel::testing::write_file(f, parcel::testing::make_pattern(123));

    FileStat st;
    ASSERT_TRUE(is_ok(fs_stat(f.c_str(), &st)));
    EXPECT_TRUE(st.exists);
    EXPECT_TRUE(st.is_regular);
    EXPECT_EQ(st.size_bytes, 123u);

    ASSERT_TRUE(is_ok(fs_stat(root().c_str(), &st)));
    EXPECT_TRUE(st.is_directory);
    EXPECT_FALSE(st.is_regular);

    ASSERT_TRUE(is_ok(fs_stat(path("missing").c_str(), &st)));
    EXPECT_FALSE(st.exists);
    ASSERT_TRUE(is_ok(fs_stat(path("a.bin/below").c_str(), &st)));
    EXPECT_FALSE(st.exists);
}

TEST_F(StorageFsTest, EnsureDirectoryCreatesParents) {
    const std::string deep = path("x/y/z");
    ASSERT_TRUE(is_ok(fs_ensure_directory(deep.c_str())));
    ASSERT_TRUE(is_ok(fs_ensure_directory(deep.c_str())));
    FileStat st;
    ASSERT_TRUE(is_ok(fs_stat(deep.c_str(), &st)));
    EXPECT_TRUE(st.is_directory);

    const std::string file = path("plain");
    parcel::testing::write_text(file, "x");
    const Status s = fs_ensure_directory(file.c_str());
    EXPECT_EQ(s.code, StatusCode::Io);
}

TEST_F(StorageFsTest, ExclusiveOpenRefusesExistingFile) {
    const std::string f = path("out.bin");
    UniqueFd fd;
    ASSERT_TRUE(is_ok(fs_open_write(f.c_str(), true, &fd)));
    fd.reset();

    EXPECT_EQ(fs_open_write(f.c_str(), true, &fd).code, StatusCode::Conflict);
    EXPECT_TRUE(is_ok(fs_open_write(f.c_str(), false, &fd)));
}

TEST_F(StorageFsTest, OpenReadMissingIsNotFound) {
    UniqueFd fd;
    EXPECT_EQ(fs_open_read(path("nope").c_str(), &fd).code, StatusCode::NotFound);
    EXPECT_FALSE(fd.valid());
}

TEST_F(StorageFsTest, WriteThenPread) {
    const std::string f = path("data.bin");
    const std::vector<u8> data = parcel::testing::make_pattern(5000, 3);
    {
        UniqueFd fd;
        ASSERT_TRUE(is_ok(fs_open_write(f.c_str(), false, &fd)));
        ASSERT_TRUE(is_ok(fs_write_all(fd.get(), BufferView{data.data(), static_cast<u32>(data.size())})));
        ASSERT_TRUE(is_ok(fs_sync_close(&fd)));
        EXPECT_FALSE(fd.valid());
    }

    UniqueFd fd;
    ASSERT_TRUE(is_ok(fs_open_read(f.c_str(), &fd)));
    std::vector<u8> buf(100);
    ASSERT_TRUE(is_ok(fs_pread_exact(fd.get(), 4000, BufferMut{buf.data(), 100})));
    EXPECT_TRUE(std::equal(buf.begin(), buf.end(), data.begin() + 4000));

    const Status eof = fs_pread_exact(fd.get(), 4950, BufferMut{buf.data(), 100});
    EXPECT_EQ(eof.code, StatusCode::Io);
    EXPECT_EQ(eof.aux, 0u);
}

TEST_F(StorageFsTest, AtomicWriteReplacesContents) {
    const std::string f = path("inv.json");
    ASSERT_TRUE(is_ok(fs_write_file_atomic(f.c_str(), "first")));
    ASSERT_TRUE(is_ok(fs_write_file_atomic(f.c_str(), "second")));
    EXPECT_FALSE(parcel::testing::file_exists(f + ".tmp"));

    std::string back;
    ASSERT_TRUE(is_ok(fs_read_file(f.c_str(), &back)));
    EXPECT_EQ(back, "second");
    EXPECT_EQ(fs_read_file(path("absent").c_str(), &back).code, StatusCode::NotFound);
}

TEST_F(StorageFsTest, AtomicWriteIntoNestedDirectory) {
    ASSERT_TRUE(is_ok(fs_ensure_directory(path("a/b").c_str())));
    const std::string f = path("a/b/inv.json");
    ASSERT_TRUE(is_ok(fs_write_file_atomic(f.c_str(), "nested")));
    std::string back;
    ASSERT_TRUE(is_ok(fs_read_file(f.c_str(), &back)));
    EXPECT_EQ(back, "nested");

    // The parent must exist; nothing is left behind when it does not.
    const std::string orphan = path("missing/inv.json");
    EXPECT_FALSE(is_ok(fs_write_file_atomic(orphan.c_str(), "x")));
    EXPECT_FALSE(parcel::testing::file_exists(orphan + ".tmp"));
}

TEST_F(StorageFsTest, SyncDirectory) {
    EXPECT_TRUE(is_ok(fs_sync_directory(root().c_str())));
    EXPECT_EQ(fs_sync_directory(path("absent").c_str()).code, StatusCode::NotFound);

    const std::string f = path("plain.txt");
    parcel::testing::write_text(f, "x");
    EXPECT_EQ(fs_sync_directory(f.c_str()).code, StatusCode::Io);
    EXPECT_EQ(fs_sync_directory("").code, StatusCode::Invalid);
}

TEST_F(StorageFsTest, ExclusiveWriteNeverReplaces) {
    const std::string f = path("merged.json");
    ASSERT_TRUE(is_ok(fs_write_file_exclusive(f.c_str(), "first")));
    EXPECT_EQ(fs_write_file_exclusive(f.c_str(), "second").code, StatusCode::Conflict);

    std::string back;
    ASSERT_TRUE(is_ok(fs_read_file(f.c_str(), &back)));
    EXPECT_EQ(back, "first");
}

TEST_F(StorageFsTest, RemoveMissingIsFine) {
    EXPECT_TRUE(is_ok(fs_remove_file(path("never").c_str())));
    const std::string f = path("gone");
    parcel::testing::write_text(f, "x");
    ASSERT_TRUE(is_ok(fs_remove_file(f.c_str())));
    EXPECT_FALSE(parcel::testing::file_exists(f));
}

TEST_F(StorageFsTest, SpaceCheck) {
    SpaceCheck check;
    ASSERT_TRUE(is_ok(fs_space_check(root().c_str(), 1, &check)));
    EXPECT_TRUE(check.sufficient);
    EXPECT_GT(check.available_bytes, 0u);

    ASSERT_TRUE(is_ok(fs_space_check(root().c_str(), ~u64{0}, &check)));
    EXPECT_FALSE(check.sufficient);
    EXPECT_EQ(check.required_bytes, ~u64{0});

    EXPECT_EQ(fs_space_check(path("missing/dir").c_str(), 1, &check).code, StatusCode::Io);
}

TEST(StorageFd, MoveTransfersOwnership) {
    UniqueFd a(::open("/dev/null", O_RDONLY));
    ASSERT_TRUE(a.valid());
    const int raw = a.get();
    UniqueFd b(std::move(a));
    EXPECT_FALSE(a.valid());
    EXPECT_EQ(b.get(), raw);
}
