#include <gtest/gtest.h>
#include "../src/auditor.hpp"
#include "../src/config.hpp"
#include "../src/localization.hpp"
#include "../src/utils.hpp"
#include "test_doubles.hpp"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class AuditorTest : public ::testing::Test {
protected:
    fs::path test_root;
    FakeProbe probe;
    RecordingChannel channel;
    RequirementList requirements = {
        {"git", "Git", "*", "git", "--version"},
        {"node", "Node.js", "^18.17.0", "node", "-v"},
        {"go", "Go", ">=1.21", "go", "version"},
    };

    void SetUp() override {
        load_strings("en", DEVSETUP_TEST_L10N_DIR);
        test_root = fs::absolute("tmp_auditor_test");
        if (fs::exists(test_root)) fs::remove_all(test_root);
        fs::create_directories(test_root);
        probe.tools = {{"git", "2.39.2"}, {"node", "16.2.0"}};
    }

    void TearDown() override {
        set_non_interactive_mode(NonInteractiveMode::INTERACTIVE);
        set_homebrew_installer_url(std::string(DEFAULT_HOMEBREW_INSTALLER_URL));
        std::error_code ec;
        fs::remove_all(get_tmp_dir(), ec);
        if (fs::exists(test_root)) fs::remove_all(test_root);
    }
};

TEST_F(AuditorTest, LinuxProbesEveryRequirementInOrder) {
    Auditor auditor(probe, channel, Platform::LINUX);
    auto results = auditor.run(requirements);

    ASSERT_TRUE(results.has_value());
    ASSERT_EQ(results->size(), 3u);
    for (size_t i = 0; i < requirements.size(); ++i) {
        EXPECT_EQ((*results)[i].dependency, &requirements[i]);
    }
    EXPECT_TRUE((*results)[0].is_installed);
    EXPECT_EQ((*results)[0].installed_version, "2.39.2");
    EXPECT_EQ((*results)[1].installed_version, "16.2.0");
    EXPECT_FALSE((*results)[2].is_installed);
    EXPECT_TRUE(channel.commands.empty()); // preflight on Linux changes nothing
}

TEST_F(AuditorTest, UnknownDistributionIsOnlyAWarning) {
    probe.distro = "gentoo";
    Auditor auditor(probe, channel, Platform::LINUX);
    auto results = auditor.run(requirements);
    ASSERT_TRUE(results.has_value());
    EXPECT_EQ(results->size(), 3u);
}

TEST_F(AuditorTest, UnreadableOsReleaseAborts) {
    probe.distro.reset();
    Auditor auditor(probe, channel, Platform::LINUX);
    EXPECT_FALSE(auditor.run(requirements).has_value());
    EXPECT_EQ(probe.dependency_checks.load(), 0);
}

TEST_F(AuditorTest, NoRequirementsIsNotAnError) {
    Auditor auditor(probe, channel, Platform::LINUX);
    auto results = auditor.run({});
    ASSERT_TRUE(results.has_value());
    EXPECT_TRUE(results->empty());
}

TEST_F(AuditorTest, CrashingProbeOnlyAffectsItsOwnResult) {
    probe.exploding = {"node"};
    Auditor auditor(probe, channel, Platform::LINUX);
    auto results = auditor.run(requirements);

    ASSERT_TRUE(results.has_value());
    ASSERT_EQ(results->size(), 3u);
    EXPECT_TRUE((*results)[0].is_installed);
    EXPECT_EQ((*results)[1].dependency, &requirements[1]);
    EXPECT_FALSE((*results)[1].is_installed);
}

TEST_F(AuditorTest, UnsupportedPlatformAborts) {
    Auditor auditor(probe, channel, Platform::UNSUPPORTED);
    EXPECT_FALSE(auditor.run(requirements).has_value());
    EXPECT_EQ(probe.dependency_checks.load(), 0);
}

TEST_F(AuditorTest, MacWithHomebrewSkipsInstaller) {
    probe.managers = {"brew"};
    Auditor auditor(probe, channel, Platform::MACOS);
    EXPECT_TRUE(auditor.run(requirements).has_value());
    EXPECT_TRUE(channel.commands.empty());
}

TEST_F(AuditorTest, MacInstallsHomebrewInTerminalAndVerifies) {
    fs::path installer = test_root / "install.sh";
    std::ofstream(installer) << "#!/bin/bash\necho installing\n";
    set_homebrew_installer_url("file://" + installer.string());
    channel.on_run = [this](const std::string&) { probe.add_manager("brew"); };

    Auditor auditor(probe, channel, Platform::MACOS);
    auto results = auditor.run(requirements);

    ASSERT_TRUE(results.has_value());
    ASSERT_EQ(channel.commands.size(), 1u);
    EXPECT_EQ(channel.commands[0].first.rfind("/bin/bash '", 0), 0u);
    EXPECT_NE(channel.commands[0].first.find("homebrew-install.sh"), std::string::npos);
    EXPECT_EQ(channel.commands[0].second, ExecutionMode::INTERACTIVE);
    EXPECT_EQ(probe.manager_checks.size(), 2u); // checked, then re-verified
}

TEST_F(AuditorTest, MacAbortsWhenHomebrewStillMissing) {
    fs::path installer = test_root / "install.sh";
    std::ofstream(installer) << "#!/bin/bash\nexit 0\n";
    set_homebrew_installer_url("file://" + installer.string());

    Auditor auditor(probe, channel, Platform::MACOS);
    EXPECT_FALSE(auditor.run(requirements).has_value());
    EXPECT_EQ(channel.commands.size(), 1u);
    EXPECT_EQ(probe.dependency_checks.load(), 0);
}

TEST_F(AuditorTest, MacAbortsWhenInstallerCannotBeFetched) {
    set_homebrew_installer_url("file://" + (test_root / "missing.sh").string());
    Auditor auditor(probe, channel, Platform::MACOS);
    EXPECT_FALSE(auditor.run(requirements).has_value());
    EXPECT_TRUE(channel.commands.empty());
}

TEST_F(AuditorTest, MacAbortsWhenInstallerFails) {
    fs::path installer = test_root / "install.sh";
    std::ofstream(installer) << "#!/bin/bash\nexit 1\n";
    set_homebrew_installer_url("file://" + installer.string());
    channel.failing = {"/bin/bash"};

    Auditor auditor(probe, channel, Platform::MACOS);
    EXPECT_FALSE(auditor.run(requirements).has_value());
}

TEST_F(AuditorTest, WindowsWithWingetProceeds) {
    probe.managers = {"winget"};
    Auditor auditor(probe, channel, Platform::WINDOWS);
    EXPECT_TRUE(auditor.run(requirements).has_value());
}

TEST_F(AuditorTest, WindowsWithoutWingetAbortsWhenDeclined) {
    set_non_interactive_mode(NonInteractiveMode::NO);
    Auditor auditor(probe, channel, Platform::WINDOWS);
    EXPECT_FALSE(auditor.run(requirements).has_value());
    EXPECT_TRUE(channel.commands.empty());
}

TEST_F(AuditorTest, WindowsWithoutWingetOpensStoreAndStillAborts) {
    set_non_interactive_mode(NonInteractiveMode::YES);
    Auditor auditor(probe, channel, Platform::WINDOWS);
    EXPECT_FALSE(auditor.run(requirements).has_value());

    ASSERT_EQ(channel.commands.size(), 1u);
    EXPECT_NE(channel.commands[0].first.find(STORE_APP_INSTALLER_URI), std::string::npos);
    EXPECT_EQ(channel.commands[0].second, ExecutionMode::SILENT);
    EXPECT_EQ(probe.dependency_checks.load(), 0);
}

TEST(DistributionTest, SupportedIds) {
    EXPECT_TRUE(is_supported_distribution("ubuntu"));
    EXPECT_TRUE(is_supported_distribution("opensuse"));
    EXPECT_FALSE(is_supported_distribution("gentoo"));
    EXPECT_FALSE(is_supported_distribution(""));
}
