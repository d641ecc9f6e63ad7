#include <gtest/gtest.h>
#include "../src/utils.hpp"
#include "../src/config.hpp"
#include "../src/localization.hpp"

#include <filesystem>
#include <fstream>
#include <future>
#include <memory>
#include <thread>

namespace fs = std::filesystem;

class LockTest : public ::testing::Test {
protected:
    fs::path test_root;
    fs::path saved_lock_dir;
    fs::path saved_lock_file;

    void SetUp() override {
        load_strings("en", DEVSETUP_TEST_L10N_DIR);
        test_root = fs::absolute("tmp_lock_test");
        if (fs::exists(test_root)) fs::remove_all(test_root);
        saved_lock_dir = LOCK_DIR;
        saved_lock_file = LOCK_FILE;
        LOCK_DIR = test_root / "lock";
        LOCK_FILE = LOCK_DIR / "run.lck";
    }

    void TearDown() override {
        LOCK_DIR = saved_lock_dir;
        LOCK_FILE = saved_lock_file;
        if (fs::exists(test_root)) fs::remove_all(test_root);
    }
};

TEST_F(LockTest, SecondRunIsRejected) {
    std::unique_ptr<RunLock> lock1;
    EXPECT_NO_THROW(lock1 = std::make_unique<RunLock>());
    EXPECT_TRUE(fs::exists(LOCK_FILE));

    EXPECT_THROW(RunLock lock2, DevsetupException);
}

TEST_F(LockTest, LockReleaseAndReacquire) {
    {
        RunLock lock1;
    } // released here

    EXPECT_NO_THROW(RunLock lock2);
}

TEST_F(LockTest, HeldByAnotherThread) {
    std::promise<void> locked;
    std::promise<void> release;
    auto release_future = release.get_future();

    std::thread holder([&]() {
        RunLock lock;
        locked.set_value();
        release_future.wait();
    });

    locked.get_future().wait();
    EXPECT_THROW(RunLock lock2, DevsetupException);
    release.set_value();
    holder.join();

    EXPECT_NO_THROW(RunLock lock3);
}

TEST(UtilsTest, ShellQuote) {
    EXPECT_EQ(shell_quote("git"), "'git'");
    EXPECT_EQ(shell_quote(""), "''");
    EXPECT_EQ(shell_quote("it's"), "'it'\\''s'");
    EXPECT_EQ(shell_quote("$(rm -rf /)"), "'$(rm -rf /)'");
}

TEST(UtilsTest, Trim) {
    EXPECT_EQ(trim("  ubuntu \r\n"), "ubuntu");
    EXPECT_EQ(trim(" \t "), "");
    EXPECT_EQ(trim("x"), "x");
}

TEST(UtilsTest, NonInteractiveAnswers) {
    set_non_interactive_mode(NonInteractiveMode::YES);
    EXPECT_TRUE(user_confirms("continue?"));
    set_non_interactive_mode(NonInteractiveMode::NO);
    EXPECT_FALSE(user_confirms("continue?"));
    set_non_interactive_mode(NonInteractiveMode::INTERACTIVE);
}

TEST(UtilsTest, EnsureDirExists) {
    load_strings("en", DEVSETUP_TEST_L10N_DIR);
    fs::path dir = fs::absolute("tmp_utils_dir") / "nested";
    EXPECT_NO_THROW(ensure_dir_exists(dir));
    EXPECT_TRUE(fs::is_directory(dir));
    EXPECT_NO_THROW(ensure_dir_exists(dir));

    fs::path file = dir / "file";
    std::ofstream(file) << "x";
    EXPECT_THROW(ensure_dir_exists(file), DevsetupException);
    fs::remove_all(fs::absolute("tmp_utils_dir"));
}

TEST(ConfigTest, PlatformOverride) {
    set_platform_override(Platform::MACOS);
    EXPECT_EQ(get_platform(), Platform::MACOS);
    EXPECT_EQ(platform_name(get_platform()), "darwin");
    clear_platform_override();
#if defined(__linux__)
    EXPECT_EQ(get_platform(), Platform::LINUX);
#endif
}
