#include "debsnap/installer/source_switch.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>

#include <cerrno>
#include <cstdio>
#include <string>

namespace debsnap {
namespace {

namespace fs = std::filesystem;

constexpr const char* kStamp = "20261019T120000Z";

class SourceSwitchTest : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;
    testutil::FakeCommandRunner runner;
    AptClient apt{runner, tmp / "lists"};
    SourceLayout layout;
    fs::path stage = tmp / "opt/offline-repo";

    void SetUp() override {
        layout.sources_list = tmp / "etc/apt/sources.list";
        layout.sources_list_d = tmp / "etc/apt/sources.list.d";
        layout.backup_base = tmp / "etc/apt";

        testutil::WriteFile(layout.sources_list, std::string("deb http://archive.ubuntu.com/ubuntu noble main\n"));
        testutil::WriteFile(layout.sources_list_d / "ubuntu.sources",
                            std::string("Types: deb\nURIs: http://archive.ubuntu.com/ubuntu\nSuites: noble\n"));
        testutil::WriteFile(layout.sources_list_d / "ppa.list", std::string("deb http://ppa.example/ubuntu noble main\n"));
        fs::create_directories(stage);
        testutil::WriteFile(tmp / "lists/old_InRelease", std::string("stale"));

        runner.On("apt-cache policy", testutil::Exit(0, Policy(" 500 file:" + stage.string() + " ./ Packages\n")));
    }

    static std::string Policy(const std::string& indexes) {
        return "Package files:\n 100 /var/lib/dpkg/status\n     release a=now\n" + indexes + "Pinned packages:\n";
    }

    // Renames like rename(2) except for files called `name`, which fail with EXDEV.
    static SourceSwitch::RenameFn FailingFor(std::string name) {
        return [name](const char* from, const char* to) {
            if (fs::path(from).filename() == name) {
                errno = EXDEV;
                return -1;
            }
            return ::rename(from, to);
        };
    }

    SourceSwitch::Options Options() const { return {.layout = layout, .stage_dir = stage, .trusted = true, .stamp = kStamp}; }

    fs::path Quarantine() const { return tmp / (std::string("etc/apt/sources.backup.") + kStamp); }
};

TEST_F(SourceSwitchTest, SwitchesToLocalSourceOnly) {
    SourceSwitch sw(apt, Options());
    ASSERT_TRUE(sw.Run().is_ok());
    EXPECT_EQ(sw.GetState(), SourceSwitch::State::kVerified);
    EXPECT_EQ(sw.QuarantineDir(), Quarantine());
    EXPECT_TRUE(sw.Unmoved().empty());

    EXPECT_EQ(testutil::ReadFile(layout.sources_list), "deb [trusted=yes] file:" + stage.string() + " ./\n");
    EXPECT_TRUE(fs::is_empty(layout.sources_list_d));
    EXPECT_EQ(testutil::ListFiles(Quarantine()),
              (std::vector<std::string>{"sources.list", "sources.list.d/ppa.list", "sources.list.d/ubuntu.sources"}));
    EXPECT_EQ(testutil::ReadFile(Quarantine() / "sources.list"), "deb http://archive.ubuntu.com/ubuntu noble main\n");

    EXPECT_TRUE(fs::is_empty(tmp / "lists"));
    EXPECT_EQ(runner.Calls(), (std::vector<std::string>{"apt-get clean", "apt-get update", "apt-cache policy"}));
}

TEST_F(SourceSwitchTest, UntrustedLineOmitsOption) {
    auto opt = Options();
    opt.trusted = false;
    SourceSwitch sw(apt, opt);
    ASSERT_TRUE(sw.Quarantine().is_ok());
    ASSERT_TRUE(sw.WriteLocalSource().is_ok());
    EXPECT_EQ(testutil::ReadFile(layout.sources_list), "deb file:" + stage.string() + " ./\n");
}

TEST_F(SourceSwitchTest, StraySourceStopsBeforeAnyAptCall) {
    SourceSwitch sw(apt, Options());
    ASSERT_TRUE(sw.Quarantine().is_ok());
    ASSERT_TRUE(sw.WriteLocalSource().is_ok());
    // Something re-creates a network source between the steps.
    testutil::WriteFile(layout.sources_list_d / "late.list", std::string("deb http://mirror.example/ubuntu noble main\n"));

    const Result r = sw.CheckNoStraySources();
    EXPECT_FALSE(r.is_ok());
    EXPECT_NE(r.msg.find("late.list"), std::string::npos);
    EXPECT_NE(r.msg.find(Quarantine().string()), std::string::npos);
    EXPECT_EQ(sw.GetState(), SourceSwitch::State::kFailed);

    EXPECT_EQ(sw.Verify().err, EPERM);
    EXPECT_TRUE(runner.Calls().empty());
}

TEST_F(SourceSwitchTest, CommentedEntriesAreNotStray) {
    SourceSwitch sw(apt, Options());
    ASSERT_TRUE(sw.Quarantine().is_ok());
    ASSERT_TRUE(sw.WriteLocalSource().is_ok());
    testutil::WriteFile(layout.sources_list_d / "disabled.list", std::string("# deb http://mirror.example/ubuntu noble main\n"));

    EXPECT_TRUE(sw.CheckNoStraySources().is_ok());
    EXPECT_EQ(sw.GetState(), SourceSwitch::State::kSwitched);
}

TEST_F(SourceSwitchTest, StepsOutOfOrderChangeNothing) {
    SourceSwitch sw(apt, Options());
    EXPECT_EQ(sw.WriteLocalSource().err, EPERM);
    EXPECT_EQ(sw.CheckNoStraySources().err, EPERM);
    EXPECT_EQ(sw.Verify().err, EPERM);
    EXPECT_EQ(sw.GetState(), SourceSwitch::State::kActive);
    EXPECT_EQ(testutil::ReadFile(layout.sources_list), "deb http://archive.ubuntu.com/ubuntu noble main\n");
    EXPECT_FALSE(fs::exists(Quarantine()));

    ASSERT_TRUE(sw.Quarantine().is_ok());
    ASSERT_TRUE(sw.WriteLocalSource().is_ok());
    // The guard has not run yet.
    EXPECT_EQ(sw.Verify().err, EPERM);
    EXPECT_EQ(sw.GetState(), SourceSwitch::State::kSwitched);
    EXPECT_TRUE(runner.Calls().empty());
    EXPECT_EQ(sw.Quarantine().err, EPERM);
}

TEST_F(SourceSwitchTest, ExistingQuarantineDirectoryIsNotReused) {
    testutil::WriteFile(Quarantine() / "sources.list", std::string("earlier backup\n"));

    SourceSwitch sw(apt, Options());
    const Result r = sw.Quarantine();
    EXPECT_EQ(r.err, EEXIST);
    EXPECT_EQ(sw.GetState(), SourceSwitch::State::kFailed);
    EXPECT_EQ(testutil::ReadFile(Quarantine() / "sources.list"), "earlier backup\n");
    EXPECT_TRUE(fs::exists(layout.sources_list_d / "ppa.list"));
}

TEST_F(SourceSwitchTest, FetchErrorsFailVerification) {
    runner.On("apt-get update", testutil::Exit(0, "Err:1 file:" + stage.string() + " ./ Packages\n"));

    SourceSwitch sw(apt, Options());
    const Result r = sw.Run();
    EXPECT_FALSE(r.is_ok());
    EXPECT_EQ(sw.GetState(), SourceSwitch::State::kFailed);
    EXPECT_EQ(runner.CountCalls("apt-cache"), 0u);
    // The host stays on the local source; nothing is restored.
    EXPECT_TRUE(fs::exists(Quarantine() / "sources.list"));
}

TEST_F(SourceSwitchTest, InstalledPackagesAloneDoNotVerifyTheLocalIndex) {
    // apt-get update was quiet but nothing was loaded from the staged repo.
    runner.On("apt-cache policy", testutil::Exit(0, Policy("")));

    SourceSwitch sw(apt, Options());
    const Result r = sw.Run();
    EXPECT_EQ(r.err, ENOENT);
    EXPECT_EQ(sw.GetState(), SourceSwitch::State::kFailed);
    EXPECT_NE(r.msg.find(stage.string()), std::string::npos);
}

TEST_F(SourceSwitchTest, IndexOfAnotherRepoDoesNotVerify) {
    runner.On("apt-cache policy", testutil::Exit(0, Policy(" 500 file:/media/usb/offline-repo ./ Packages\n")));

    SourceSwitch sw(apt, Options());
    EXPECT_EQ(sw.Run().err, ENOENT);
    EXPECT_EQ(sw.GetState(), SourceSwitch::State::kFailed);
}

TEST_F(SourceSwitchTest, UnmovableSourcesListIsNeverOverwritten) {
    auto opt = Options();
    opt.rename_fn = FailingFor("sources.list");
    SourceSwitch sw(apt, opt);

    const Result r = sw.Quarantine();
    EXPECT_EQ(r.err, EXDEV);
    EXPECT_EQ(sw.GetState(), SourceSwitch::State::kFailed);
    EXPECT_NE(r.msg.find(layout.sources_list.string()), std::string::npos);
    EXPECT_EQ(r.msg.find("previous sources are in"), std::string::npos);
    ASSERT_EQ(sw.Unmoved().size(), 1u);

    EXPECT_EQ(sw.WriteLocalSource().err, EPERM);
    EXPECT_EQ(sw.Verify().err, EPERM);
    EXPECT_EQ(testutil::ReadFile(layout.sources_list), "deb http://archive.ubuntu.com/ubuntu noble main\n");
    EXPECT_TRUE(fs::exists(layout.sources_list_d / "ppa.list"));
    EXPECT_TRUE(runner.Calls().empty());
}

TEST_F(SourceSwitchTest, UnmovableDropInIsCaughtByTheGuard) {
    auto opt = Options();
    opt.rename_fn = FailingFor("ppa.list");
    SourceSwitch sw(apt, opt);

    ASSERT_TRUE(sw.Quarantine().is_ok());
    ASSERT_EQ(sw.Unmoved(), (std::vector<fs::path>{layout.sources_list_d / "ppa.list"}));
    ASSERT_TRUE(sw.WriteLocalSource().is_ok());

    const Result r = sw.CheckNoStraySources();
    EXPECT_EQ(r.err, EEXIST);
    EXPECT_NE(r.msg.find("left in place: " + (layout.sources_list_d / "ppa.list").string()), std::string::npos);
    EXPECT_EQ(testutil::ReadFile(Quarantine() / "sources.list"), "deb http://archive.ubuntu.com/ubuntu noble main\n");
    EXPECT_TRUE(runner.Calls().empty());
}

TEST(SourceSwitchStateTest, NamesStates) {
    EXPECT_STREQ(ToString(SourceSwitch::State::kActive), "active");
    EXPECT_STREQ(ToString(SourceSwitch::State::kVerified), "verified");
    EXPECT_STREQ(ToString(SourceSwitch::State::kFailed), "failed");
}

} // namespace
} // namespace debsnap
