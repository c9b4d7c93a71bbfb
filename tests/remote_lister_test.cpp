#include <gtest/gtest.h>

#include <algorithm>
#include <set>
#include <utility>

#include "core/lister/remote_lister.hpp"
#include "fakes/memory_object_store.hpp"

using bucketcp::core::Pattern;
using bucketcp::core::RemoteLister;
using bucketcp::core::RemoteObject;
using bucketcp::infra::ErrorCode;
using bucketcp::testing::MemoryObjectStore;

namespace {

auto as_set(const std::vector<RemoteObject>& objects) -> std::set<std::pair<std::string, std::uint64_t>> {
    std::set<std::pair<std::string, std::uint64_t>> out;
    for (const auto& o : objects) out.emplace(o.key, o.size);
    return out;
}

} // namespace

class RemoteListerTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_.put("bkt", "a.txt", "1");
        store_.put("bkt", "logs/2024/jan.gz", "22");
        store_.put("bkt", "logs/2024/feb.gz", "333");
        store_.put("bkt", "logs/2025/jan.gz", "4444");
        store_.put("bkt", "logs/", "");
        store_.put("bkt", "z.txt", "55555");
    }

    MemoryObjectStore store_;
};

TEST_F(RemoteListerTest, FollowsEveryPage)
{
    RemoteLister lister(store_, 2);
    auto all = lister.list("bkt");
    ASSERT_TRUE(all.has_value());
    EXPECT_EQ(all->size(), 6u);
    EXPECT_EQ(store_.list_calls(), 3u);
}

TEST_F(RemoteListerTest, SameResultForAnyPageSize)
{
    auto reference = RemoteLister(store_, 1000).list("bkt");
    ASSERT_TRUE(reference.has_value());

    for (std::uint32_t page_size : {1u, 2u, 5u, 6u, 7u}) {
        auto listed = RemoteLister(store_, page_size).list("bkt");
        ASSERT_TRUE(listed.has_value()) << page_size;
        EXPECT_EQ(as_set(*listed), as_set(*reference)) << page_size;
        EXPECT_EQ(listed->size(), reference->size()) << page_size;
    }
}

TEST_F(RemoteListerTest, PrefixNarrowsTheListing)
{
    auto listed = RemoteLister(store_, 1000).list("bkt", "logs/2024/");
    ASSERT_TRUE(listed.has_value());
    EXPECT_EQ(as_set(*listed), (std::set<std::pair<std::string, std::uint64_t>>{
        {"logs/2024/feb.gz", 3}, {"logs/2024/jan.gz", 2}}));
}

TEST_F(RemoteListerTest, PageFailureDiscardsPartialListing)
{
    store_.fail_list_page(2);
    auto listed = RemoteLister(store_, 2).list("bkt");
    ASSERT_FALSE(listed.has_value());
    EXPECT_EQ(listed.error().code, ErrorCode::ListingFailed);
    EXPECT_TRUE(listed.error().is_fatal());
}

TEST_F(RemoteListerTest, MatchingFiltersKeysAndSkipsFolderPlaceholders)
{
    auto pattern = Pattern::compile("logs/**/*");
    ASSERT_TRUE(pattern.has_value());

    auto listed = RemoteLister(store_, 2).list_matching("bkt", *pattern);
    ASSERT_TRUE(listed.has_value());
    EXPECT_EQ(as_set(*listed), (std::set<std::pair<std::string, std::uint64_t>>{
        {"logs/2024/feb.gz", 3}, {"logs/2024/jan.gz", 2}, {"logs/2025/jan.gz", 4}}));
}

TEST_F(RemoteListerTest, MatchingUsesSingleSegmentStar)
{
    auto pattern = Pattern::compile("logs/*/jan.gz");
    ASSERT_TRUE(pattern.has_value());

    auto listed = RemoteLister(store_, 1000).list_matching("bkt", *pattern);
    ASSERT_TRUE(listed.has_value());
    EXPECT_EQ(listed->size(), 2u);
    EXPECT_TRUE(std::all_of(listed->begin(), listed->end(),
                            [](const RemoteObject& o) { return o.key.ends_with("/jan.gz"); }));
}

TEST_F(RemoteListerTest, UnknownBucketIsEmpty)
{
    auto listed = RemoteLister(store_, 10).list("other");
    ASSERT_TRUE(listed.has_value());
    EXPECT_TRUE(listed->empty());
}
