#include <gtest/gtest.h>

#include "parcel/core/errors.hpp"
#include "parcel/core/types.hpp"

TEST(Status, DefaultIsOk){
    parcel::core::Status s{};
    EXPECT_EQ(s.code, parcel::core::StatusCode::Ok);
    EXPECT_EQ(s.domain, parcel::core::StatusDomain::Core);
    EXPECT_EQ(s.aux, 0u);
    EXPECT_TRUE(parcel::core::is_ok(s));
}

TEST(Status, Names){
    EXPECT_STREQ(parcel::core::status_code_name(parcel::core::StatusCode::ReconstructionBlocked), "ReconstructionBlocked");
    EXPECT_STREQ(parcel::core::status_code_name(parcel::core::StatusCode::OutputExists), "OutputExists");
    EXPECT_STREQ(parcel::core::status_domain_name(parcel::core::StatusDomain::Rebuild), "Rebuild");
}

TEST(ChunkIndex, RangeCheck){
    using parcel::core::ChunkIndex;
    EXPECT_FALSE(parcel::core::chunk_index_in_range(ChunkIndex{0}, 3));
    EXPECT_TRUE(parcel::core::chunk_index_in_range(ChunkIndex{1}, 3));
    EXPECT_TRUE(parcel::core::chunk_index_in_range(ChunkIndex{3}, 3));
    EXPECT_FALSE(parcel::core::chunk_index_in_range(ChunkIndex{4}, 3));
    EXPECT_FALSE(parcel::core::chunk_index_in_range(ChunkIndex::invalid(), 3));
    EXPECT_FALSE(ChunkIndex::invalid().is_valid());
}
