#include "debsnap/builder/build_pipeline.hpp"
#include "debsnap/builder/host_package_query.hpp"
#include "debsnap/builder/update_fetcher.hpp"
#include "debsnap/debian/source_entries.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>
#include <memory>

namespace debsnap {
namespace {

TEST(HostPackageQueryTest, ParsesQueryOutputAndIgnoresJunk) {
    testutil::FakeCommandRunner runner;
    runner.On("dpkg-query -W", testutil::Exit(0, "b 2.0 amd64\nbroken line\na 1.0 all\nb 2.0 amd64\n"));

    std::vector<PackageRecord> out;
    ASSERT_TRUE(QueryInstalledPackages(runner, out).is_ok());
    EXPECT_EQ(out, (std::vector<PackageRecord>{{"a", "1.0", "all"}, {"b", "2.0", "amd64"}}));
}

TEST(HostPackageQueryTest, EmptyOrFailedQueryIsAnError) {
    testutil::FakeCommandRunner runner;
    std::vector<PackageRecord> out;
    EXPECT_FALSE(QueryInstalledPackages(runner, out).is_ok());

    runner.On("dpkg-query", testutil::Exit(2, "", "dpkg-query: error"));
    EXPECT_FALSE(QueryInstalledPackages(runner, out).is_ok());
}

TEST(UpdateFetcherTest, UpdatesThenDownloadsWithoutInstalling) {
    testutil::FakeCommandRunner runner;
    ASSERT_TRUE(FetchUpdates(runner).is_ok());
    EXPECT_EQ(runner.Calls(),
              (std::vector<std::string>{"apt-get update", "apt-get -y --download-only dist-upgrade"}));
    for (const auto& spec : runner.Specs()) {
        ASSERT_EQ(spec.env.size(), 1u);
        EXPECT_EQ(spec.env[0].first, "DEBIAN_FRONTEND");
        EXPECT_EQ(spec.env[0].second, "noninteractive");
    }
}

TEST(UpdateFetcherTest, StopsWhenIndexRefreshFails) {
    testutil::FakeCommandRunner runner;
    runner.On("apt-get update", testutil::Exit(100, "", "E: network unreachable"));
    EXPECT_FALSE(FetchUpdates(runner).is_ok());
    EXPECT_EQ(runner.CountCalls("apt-get -y"), 0u);
}

TEST(RepoRegistrarTest, WritesListFileThenRefreshes) {
    testutil::TemporaryDirectory tmp;
    testutil::FakeCommandRunner runner;
    const auto list = tmp / "sources.list.d/offline-repo.list";

    ASSERT_TRUE(RegisterRepo(runner, "/srv/offline-repo/", true, list).is_ok());
    EXPECT_EQ(testutil::ReadFile(list), "deb [trusted=yes] file:/srv/offline-repo ./\n");
    EXPECT_EQ(runner.Calls(), std::vector<std::string>{"apt-get update"});

    runner.On("apt-get update", testutil::Exit(100, "", "E: failed"));
    EXPECT_FALSE(RegisterRepo(runner, "/srv/offline-repo", true, list).is_ok());
}

class BuildPipelineTest : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;
    std::shared_ptr<testutil::FakeCommandRunner> runner = std::make_shared<testutil::FakeCommandRunner>();
    std::shared_ptr<testutil::FakeRepacker> repacker = std::make_shared<testutil::FakeRepacker>();
    std::vector<PackageRecord> host = {{"A", "1.0", "amd64"}, {"B", "2.0", "amd64"}};

    void SetUp() override {
        runner->On("dpkg-query", [this](const CommandSpec&) {
            return testutil::Exit(0, testutil::DpkgQueryOutput(host));
        });
        // One stanza per pool file is enough for the index stage.
        runner->On("apt-ftparchive packages", [](const CommandSpec& spec) {
            std::string text;
            for (const auto& f : testutil::ListFiles(std::filesystem::path(spec.cwd) / "pool")) {
                if (!text.empty())
                    text += "\n";
                text += "Package: " + f.substr(0, f.find('_')) + "\nFilename: ./pool/" + f + "\n";
            }
            return testutil::Exit(0, text);
        });
        runner->On("apt-ftparchive release", testutil::Exit(0, "Origin: local\n"));
    }

    BuildOptions Options() const {
        BuildOptions opt;
        opt.repo_dir = tmp / "offline-repo";
        opt.cache_dir = tmp / "archives";
        opt.jobs = 2;
        opt.register_list_path = tmp / "sources.list.d/offline-repo.list";
        opt.check_tools = false;
        return opt;
    }
};

TEST_F(BuildPipelineTest, BuildsCompleteRepoFromCacheAndRepacks) {
    testutil::WriteDeb(tmp / "archives", "A_1.0_amd64.deb", host[0]);

    BuildReport report;
    ASSERT_TRUE(BuildPipeline(runner, repacker, Options()).Run(report).is_ok());

    EXPECT_FALSE(report.updates_fetched);
    EXPECT_EQ(report.harvest.copied, 1u);
    EXPECT_EQ(report.reconcile.present_exact, 1u);
    EXPECT_EQ(report.reconcile.repacked, 1u);
    EXPECT_EQ(report.index.stanzas, 2u);
    EXPECT_EQ(report.inventory.rows.size(), 2u);
    EXPECT_FALSE(report.registered);

    const auto repo = tmp / "offline-repo";
    EXPECT_EQ(testutil::ListFiles(repo),
              (std::vector<std::string>{"Packages", "Packages.gz", "Release", "installed-packages.csv",
                                        "pool/A_1.0_amd64.deb", "pool/B_2.0_amd64.deb"}));
    EXPECT_EQ(runner->CountCalls("apt-get"), 0u);
}

TEST_F(BuildPipelineTest, RerunIsIdempotent) {
    testutil::WriteDeb(tmp / "archives", "A_1.0_amd64.deb", host[0]);

    BuildReport first;
    ASSERT_TRUE(BuildPipeline(runner, repacker, Options()).Run(first).is_ok());
    const auto csv = testutil::ReadFile(tmp / "offline-repo/installed-packages.csv");

    BuildReport second;
    ASSERT_TRUE(BuildPipeline(runner, repacker, Options()).Run(second).is_ok());
    EXPECT_EQ(second.harvest.copied, 0u);
    EXPECT_EQ(second.harvest.already_present, 1u);
    EXPECT_EQ(second.reconcile.repacked, 0u);
    EXPECT_EQ(second.inventory.rows.size(), first.inventory.rows.size());
    EXPECT_EQ(testutil::ReadFile(tmp / "offline-repo/installed-packages.csv"), csv);
    EXPECT_EQ(repacker->Calls(), 1);
}

TEST_F(BuildPipelineTest, FetchesUpdatesAndRegistersWhenAsked) {
    auto opt = Options();
    opt.include_updates = true;
    opt.register_repo = true;
    opt.trusted = false;

    BuildReport report;
    ASSERT_TRUE(BuildPipeline(runner, repacker, opt).Run(report).is_ok());
    EXPECT_TRUE(report.updates_fetched);
    EXPECT_TRUE(report.registered);
    EXPECT_EQ(testutil::ReadFile(opt.register_list_path), FormatLocalSourceLine(opt.repo_dir, false) + "\n");

    const auto calls = runner->Calls();
    ASSERT_FALSE(calls.empty());
    EXPECT_EQ(calls.front(), "apt-get update");
    EXPECT_EQ(calls.back(), "apt-get update");
    EXPECT_EQ(runner->CountCalls("apt-get -y --download-only dist-upgrade"), 1u);
}

TEST_F(BuildPipelineTest, SkippedPackagesDoNotFailTheBuild) {
    repacker->failing = {"B"};

    BuildReport report;
    ASSERT_TRUE(BuildPipeline(runner, repacker, Options()).Run(report).is_ok());
    ASSERT_EQ(report.reconcile.skipped, 1u);
    EXPECT_EQ(report.reconcile.repacked, 1u);
    EXPECT_EQ(report.reconcile.Skipped().front().record.name, "B");
    EXPECT_EQ(report.inventory.rows.size(), 1u);
}

TEST_F(BuildPipelineTest, FailedUpdateFetchStopsBeforeTouchingThePool) {
    runner->On("apt-get update", testutil::Exit(100, "", "E: Could not resolve"));
    auto opt = Options();
    opt.include_updates = true;

    BuildReport report;
    EXPECT_FALSE(BuildPipeline(runner, repacker, opt).Run(report).is_ok());
    EXPECT_EQ(runner->CountCalls("dpkg-query"), 0u);
    EXPECT_TRUE(testutil::ListFiles(tmp / "offline-repo").empty());
}

} // namespace
} // namespace debsnap
