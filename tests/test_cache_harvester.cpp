#include "debsnap/builder/cache_harvester.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>

namespace debsnap {
namespace {

class CacheHarvesterTest : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;
    std::filesystem::path cache = tmp / "archives";
    Pool pool{tmp / "repo/pool"};
};

TEST_F(CacheHarvesterTest, CopiesTopLevelArchivesOnly) {
    testutil::WriteDeb(cache, "a_1.0_amd64.deb", {"a", "1.0", "amd64"});
    testutil::WriteDeb(cache, "b_1%3a2_all.deb", {"b", "1:2", "all"});
    testutil::WriteFile(cache / "partial/c_1_all.deb", std::string("in flight"));
    testutil::WriteFile(cache / "lock", std::string());

    HarvestSummary summary;
    ASSERT_TRUE(HarvestCache(cache, pool, summary).is_ok());
    EXPECT_EQ(summary.copied, 2u);
    EXPECT_EQ(summary.already_present, 0u);
    EXPECT_EQ(summary.failed, 0u);
    EXPECT_EQ(testutil::ListFiles(pool.Dir()), (std::vector<std::string>{"a_1.0_amd64.deb", "b_1%3a2_all.deb"}));
    EXPECT_EQ(testutil::ReadFile(pool.Dir() / "a_1.0_amd64.deb"), testutil::ReadFile(cache / "a_1.0_amd64.deb"));
}

TEST_F(CacheHarvesterTest, ExistingPoolFilesAreNotReplaced) {
    testutil::WriteDeb(cache, "a_1.0_amd64.deb", {"a", "1.0", "amd64"}, "new bytes");
    testutil::WriteFile(pool.Dir() / "a_1.0_amd64.deb", std::string("already here"));

    HarvestSummary summary;
    ASSERT_TRUE(HarvestCache(cache, pool, summary).is_ok());
    EXPECT_EQ(summary.copied, 0u);
    EXPECT_EQ(summary.already_present, 1u);
    EXPECT_EQ(testutil::ReadFile(pool.Dir() / "a_1.0_amd64.deb"), "already here");
}

TEST_F(CacheHarvesterTest, RepackedArchiveIsNotDuplicatedByItsCacheName) {
    // An earlier run repacked foo; dpkg-deb names the archive without the epoch.
    testutil::WriteDeb(pool.Dir(), "foo_2.0_amd64.deb", {"foo", "1:2.0", "amd64"}, "repacked");
    testutil::WriteDeb(cache, "foo_1%3a2.0_amd64.deb", {"foo", "1:2.0", "amd64"}, "downloaded");
    testutil::WriteDeb(cache, "bar_1%3a3_all.deb", {"bar", "1:3", "all"});

    HarvestSummary summary;
    ASSERT_TRUE(HarvestCache(cache, pool, summary).is_ok());
    EXPECT_EQ(summary.copied, 1u);
    EXPECT_EQ(summary.already_present, 1u);
    EXPECT_EQ(testutil::ListFiles(pool.Dir()), (std::vector<std::string>{"bar_1%3a3_all.deb", "foo_2.0_amd64.deb"}));
}

TEST_F(CacheHarvesterTest, MissingCacheIsNotAnError) {
    HarvestSummary summary;
    ASSERT_TRUE(HarvestCache(tmp / "nope", pool, summary).is_ok());
    EXPECT_EQ(summary.copied + summary.already_present + summary.failed, 0u);
}

} // namespace
} // namespace debsnap
