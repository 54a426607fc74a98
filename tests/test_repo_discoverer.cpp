#include "debsnap/installer/repo_discoverer.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>

#include <cerrno>

namespace debsnap {
namespace {

void MakeRepo(const std::filesystem::path& dir, const std::string& index = "Packages") {
    std::filesystem::create_directories(dir / "pool");
    testutil::WriteFile(dir / index, std::string("Package: a\n"));
}

class RepoDiscovererTest : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;
    std::filesystem::path root = tmp / "media";
};

TEST_F(RepoDiscovererTest, RecognizesFlatRepoLayout) {
    MakeRepo(root / "plain");
    MakeRepo(root / "compressed", "Packages.gz");
    std::filesystem::create_directories(root / "no-index/pool");
    testutil::WriteFile(root / "no-pool/Packages", std::string("Package: a\n"));

    EXPECT_TRUE(IsFlatRepo(root / "plain"));
    EXPECT_TRUE(IsFlatRepo(root / "compressed"));
    EXPECT_FALSE(IsFlatRepo(root / "no-index"));
    EXPECT_FALSE(IsFlatRepo(root / "no-pool"));
}

TEST_F(RepoDiscovererTest, FindsTheOnlyRepoAmongSiblings) {
    std::filesystem::create_directories(root / "docs");
    MakeRepo(root / "offline-repo");

    std::filesystem::path found;
    ASSERT_TRUE(DiscoverRepo(root, found).is_ok());
    EXPECT_EQ(found, std::filesystem::path(tmp.Path()) / "media/offline-repo");
}

TEST_F(RepoDiscovererTest, SearchRootItselfCanBeTheRepo) {
    MakeRepo(root);
    MakeRepo(root / "copy");

    std::filesystem::path found;
    ASSERT_TRUE(DiscoverRepo(root, found).is_ok());
    EXPECT_EQ(found, root);
}

TEST_F(RepoDiscovererTest, ShallowestThenLexicographicWins) {
    MakeRepo(root / "x/deep/repo");
    MakeRepo(root / "b-repo");
    MakeRepo(root / "a-repo");

    std::vector<std::filesystem::path> all;
    ASSERT_TRUE(DiscoverAllRepos(root, all).is_ok());
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0], root / "a-repo");
    EXPECT_EQ(all[1], root / "b-repo");
    EXPECT_EQ(all[2], root / "x/deep/repo");
}

TEST_F(RepoDiscovererTest, DoesNotLookInsidePools) {
    MakeRepo(root / "repo");
    MakeRepo(root / "repo/pool/vendored");

    std::vector<std::filesystem::path> all;
    ASSERT_TRUE(DiscoverAllRepos(root, all).is_ok());
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0], root / "repo");
}

TEST_F(RepoDiscovererTest, NothingFoundIsENOENT) {
    std::filesystem::create_directories(root / "empty/pool");

    std::filesystem::path found;
    const Result r = DiscoverRepo(root, found);
    EXPECT_FALSE(r.is_ok());
    EXPECT_EQ(r.err, ENOENT);
    EXPECT_TRUE(found.empty());

    EXPECT_EQ(DiscoverRepo(tmp / "missing", found).err, ENOENT);
}

} // namespace
} // namespace debsnap
