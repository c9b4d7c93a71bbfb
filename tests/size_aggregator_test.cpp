#include <gtest/gtest.h>

#include <algorithm>
#include <span>

#include "core/size/size_aggregator.hpp"
#include "test_utils.hpp"

using bucketcp::core::RemoteObject;
using bucketcp::core::stat_local_files;
using bucketcp::core::total_local_size;
using bucketcp::core::total_remote_size;
using bucketcp::infra::ErrorCode;

class SizeAggregatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_.write("a.bin", std::string(10, 'a'));
        dir_.write("b.bin", std::string(250, 'b'));
        dir_.write("nested/c.bin", std::string(4096, 'c'));
        dir_.write("empty.bin", "");
    }

    bucketcp::testing::TempDir dir_;
};

TEST_F(SizeAggregatorTest, SumsLocalFiles)
{
    std::vector<std::string> paths{"a.bin", "b.bin", "nested/c.bin", "empty.bin"};
    auto total = total_local_size(dir_.path(), paths);
    ASSERT_TRUE(total.has_value());
    EXPECT_EQ(*total, 10u + 250u + 4096u);
}

TEST_F(SizeAggregatorTest, OrderDoesNotMatter)
{
    std::vector<std::string> paths{"a.bin", "b.bin", "nested/c.bin"};
    auto forward = total_local_size(dir_.path(), paths);
    std::reverse(paths.begin(), paths.end());
    auto backward = total_local_size(dir_.path(), paths);
    ASSERT_TRUE(forward && backward);
    EXPECT_EQ(*forward, *backward);
}

TEST_F(SizeAggregatorTest, DirectoriesAreIgnored)
{
    std::vector<std::string> paths{"a.bin", "nested"};
    auto files = stat_local_files(dir_.path(), paths);
    ASSERT_TRUE(files.has_value());
    ASSERT_EQ(files->size(), 1u);
    EXPECT_EQ(files->front().path, "a.bin");
    EXPECT_EQ(files->front().size, 10u);
}

TEST_F(SizeAggregatorTest, StatFailureAbortsAggregation)
{
    std::vector<std::string> paths{"a.bin", "missing.bin"};
    auto total = total_local_size(dir_.path(), paths);
    ASSERT_FALSE(total.has_value());
    EXPECT_EQ(total.error().code, ErrorCode::StatFailed);
    EXPECT_TRUE(total.error().is_fatal());
}

TEST(RemoteSizeTest, SumsListedSizes)
{
    std::vector<RemoteObject> objects{{"a", 1}, {"b", 20}, {"c/d", 300}};
    EXPECT_EQ(total_remote_size(objects), 321u);
    EXPECT_EQ(total_remote_size(std::span<const RemoteObject>{}), 0u);
}
