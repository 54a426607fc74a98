#include "debsnap/installer/apt_client.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>

namespace debsnap {
namespace {

TEST(DpkgListTest, KeepsOnlyInstalledRows) {
    const std::string text =
        "Desired=Unknown/Install/Remove/Purge/Hold\n"
        "||/ Name                     Version            Architecture Description\n"
        "+++-========================-==================-============-===========\n"
        "ii  linux-image-6.8.0-45-generic 6.8.0-45.45    amd64        Signed kernel image generic\n"
        "rc  linux-image-6.5.0-14-generic 6.5.0-14.14    amd64        Signed kernel image generic\n"
        "ii  linux-image-generic      6.8.0-45.45        amd64        Generic Linux kernel image\n";

    const auto rows = ParseDpkgList(text);
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].name, "linux-image-6.8.0-45-generic");
    EXPECT_EQ(rows[0].version, "6.8.0-45.45");
    EXPECT_EQ(rows[1].name, "linux-image-generic");
}

TEST(AptErrorLinesTest, FindsFetchFailures) {
    const std::string text =
        "Get:1 file:/opt/offline-repo ./ InRelease\n"
        "Ign:2 file:/opt/offline-repo ./ Translation-en\n"
        "Err:3 http://archive.ubuntu.com/ubuntu noble InRelease\n"
        "  Temporary failure resolving 'archive.ubuntu.com'\n"
        "W: Some index files failed to download.\n"
        "  E: Failed to fetch something\n";

    const auto errors = AptErrorLines(text);
    ASSERT_EQ(errors.size(), 2u);
    EXPECT_EQ(errors[0], "Err:3 http://archive.ubuntu.com/ubuntu noble InRelease");
    EXPECT_EQ(errors[1], "E: Failed to fetch something");
    EXPECT_TRUE(AptErrorLines("Hit:1 file:/opt/offline-repo ./ Release\n").empty());
}

class AptClientTest : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;
    testutil::FakeCommandRunner runner;
    AptClient apt{runner, tmp / "lists"};
};

TEST_F(AptClientTest, UpdateFailsOnErrorLinesDespiteZeroExit) {
    EXPECT_TRUE(apt.Update().is_ok());

    runner.On("apt-get update", testutil::Exit(0, "Err:1 http://mirror noble InRelease\n"));
    const Result r = apt.Update();
    EXPECT_FALSE(r.is_ok());
    EXPECT_NE(r.msg.find("Err:1"), std::string::npos);

    runner.On("apt-get update", testutil::Exit(100, "", "E: boom"));
    EXPECT_EQ(apt.Update().err, 100);
}

TEST_F(AptClientTest, CommandsRunNonInteractively) {
    ASSERT_TRUE(apt.FullUpgrade().is_ok());
    ASSERT_TRUE(apt.Install({"linux-generic", "base-files"}).is_ok());
    ASSERT_TRUE(apt.Install({}).is_ok());
    ASSERT_TRUE(apt.AutoremovePurge().is_ok());

    EXPECT_EQ(runner.Calls(),
              (std::vector<std::string>{
                  "apt-get -y -o Dpkg::Options::=--force-confold -o Dpkg::Options::=--force-confdef full-upgrade",
                  "apt-get -y install linux-generic base-files",
                  "apt-get -y autoremove --purge",
              }));
    for (const auto& spec : runner.Specs()) {
        ASSERT_EQ(spec.env.size(), 1u);
        EXPECT_EQ(spec.env[0].first, "DEBIAN_FRONTEND");
    }
}

constexpr const char* kPolicy =
    "Package files:\n"
    " 100 /var/lib/dpkg/status\n"
    "     release a=now\n"
    " 500 file:/opt/offline-repo ./ Packages\n"
    "     release c=\n"
    " 500 http://archive.ubuntu.com/ubuntu noble/main amd64 Packages\n"
    "     release v=24.04,o=Ubuntu,a=noble,n=noble,l=Ubuntu,c=main,b=amd64\n"
    "     origin archive.ubuntu.com\n"
    "Pinned packages:\n"
    "     base-files -> 13ubuntu10 with priority 1001\n";

TEST(PolicyPackageFilesTest, ListsIndexesButNotTheStatusFile) {
    EXPECT_EQ(ParsePolicyPackageFiles(kPolicy),
              (std::vector<std::string>{"file:/opt/offline-repo ./ Packages",
                                        "http://archive.ubuntu.com/ubuntu noble/main amd64 Packages"}));
    EXPECT_TRUE(ParsePolicyPackageFiles("Package files:\n 100 /var/lib/dpkg/status\n     release a=now\n").empty());
}

TEST(PolicyPackageFilesTest, MatchesOnlyTheGivenFlatRepo) {
    const auto files = ParsePolicyPackageFiles(kPolicy);
    EXPECT_TRUE(HasLocalPackagesIndex(files, "/opt/offline-repo"));
    EXPECT_TRUE(HasLocalPackagesIndex(files, "/opt/offline-repo/"));
    EXPECT_TRUE(HasLocalPackagesIndex({"file:/opt/offline-repo/ ./ Packages"}, "/opt/offline-repo"));
    EXPECT_FALSE(HasLocalPackagesIndex(files, "/opt/offline"));
    EXPECT_FALSE(HasLocalPackagesIndex(files, "/media/usb/offline-repo"));
}

TEST_F(AptClientTest, PackageFilesRunsPolicy) {
    runner.On("apt-cache policy", testutil::Exit(0, kPolicy));
    std::vector<std::string> files;
    ASSERT_TRUE(apt.PackageFiles(files).is_ok());
    EXPECT_EQ(files.size(), 2u);
    EXPECT_EQ(runner.Calls(), (std::vector<std::string>{"apt-cache policy"}));

    runner.On("apt-cache policy", testutil::Exit(100, "", "E: cache is broken"));
    EXPECT_FALSE(apt.PackageFiles(files).is_ok());
}

TEST_F(AptClientTest, ListInstalledToleratesNoMatch) {
    runner.On("dpkg -l", testutil::Exit(1, "", "dpkg-query: no packages found matching linux-image-*"));
    std::vector<DpkgListRow> rows;
    ASSERT_TRUE(apt.ListInstalled("linux-image-*", rows).is_ok());
    EXPECT_TRUE(rows.empty());

    runner.On("dpkg -l", testutil::Exit(2));
    EXPECT_FALSE(apt.ListInstalled("linux-image-*", rows).is_ok());
}

TEST_F(AptClientTest, ClearListsEmptiesTheDirectory) {
    testutil::WriteFile(tmp / "lists/archive.ubuntu.com_dists_noble_InRelease", std::string("x"));
    testutil::WriteFile(tmp / "lists/partial/tmp", std::string("y"));

    ASSERT_TRUE(apt.ClearLists().is_ok());
    EXPECT_TRUE(std::filesystem::is_directory(tmp / "lists"));
    EXPECT_TRUE(std::filesystem::is_empty(tmp / "lists"));

    AptClient missing(runner, tmp / "absent");
    EXPECT_TRUE(missing.ClearLists().is_ok());
}

} // namespace
} // namespace debsnap
