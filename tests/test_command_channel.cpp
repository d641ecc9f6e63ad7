#include <gtest/gtest.h>
#include "../src/command_channel.hpp"
#include "../src/exception.hpp"
#include "../src/localization.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace {

// Answers each command by replaying scripted output chunks from its own thread.
class ScriptedTerminal : public Terminal {
public:
    using Script = std::function<std::vector<std::string>(const std::string& sent, const std::string& token)>;

    explicit ScriptedTerminal(Script script, bool close_instead = false)
        : script_(std::move(script)), close_instead_(close_instead) {}

    ~ScriptedTerminal() override {
        for (auto& t : threads_) {
            if (t.joinable()) t.join();
        }
    }

    void send_text(const std::string& text) override {
        {
            std::lock_guard<std::mutex> lock(sent_mutex_);
            sent_.push_back(text);
        }
        const std::string token = extract_token(text);
        if (token.empty()) return; // a notice, not a command
        if (close_instead_) {
            threads_.emplace_back([this] {
                std::this_thread::sleep_for(20ms);
                publish_closed();
            });
            return;
        }
        std::vector<std::string> chunks = script_(text, token);
        threads_.emplace_back([this, chunks] {
            for (const auto& chunk : chunks) {
                std::this_thread::sleep_for(5ms);
                publish(chunk);
            }
        });
    }

    std::vector<std::string> sent() {
        std::lock_guard<std::mutex> lock(sent_mutex_);
        return sent_;
    }

    static std::string extract_token(const std::string& text) {
        const std::string marker = "; echo ";
        size_t start = text.rfind(marker);
        if (start == std::string::npos) return "";
        start += marker.size();
        size_t end = text.find('\'', start);
        if (end == std::string::npos) return "";
        return text.substr(start, end - start);
    }

private:
    Script script_;
    bool close_instead_;
    std::mutex sent_mutex_;
    std::vector<std::string> sent_;
    std::vector<std::thread> threads_;
};

} // anonymous namespace

class CommandChannelTest : public ::testing::Test {
protected:
    void SetUp() override {
        load_strings("en", DEVSETUP_TEST_L10N_DIR);
    }

    // Factory that hands out `terminal` once and remembers it for inspection.
    TerminalFactory factory_for(std::unique_ptr<ScriptedTerminal> terminal) {
        raw_terminal = terminal.get();
        auto holder = std::make_shared<std::unique_ptr<ScriptedTerminal>>(std::move(terminal));
        return [holder](const std::string&) -> std::unique_ptr<Terminal> {
            return std::move(*holder);
        };
    }

    ScriptedTerminal* raw_terminal = nullptr;
};

TEST(MarkerScannerTest, MatchesMarkerInOneChunk) {
    MarkerScanner scanner("TOK_1");
    EXPECT_EQ(scanner.feed("building...\r\nTOK_1:0\r\n$ "), MarkerScanner::State::MATCHED);
    EXPECT_EQ(scanner.exit_code(), 0);
}

TEST(MarkerScannerTest, MarkerSplitAcrossManyChunks) {
    MarkerScanner scanner("DEVSETUP_EXIT_42");
    for (std::string_view chunk : {"noise DEV", "SETUP_EX", "IT_4", "2", ":", "1", "27", "\r\n"}) {
        scanner.feed(chunk);
    }
    EXPECT_EQ(scanner.state(), MarkerScanner::State::MATCHED);
    EXPECT_EQ(scanner.exit_code(), 127);
}

TEST(MarkerScannerTest, WaitsForTheWholeExitCode) {
    MarkerScanner scanner("TOK");
    EXPECT_EQ(scanner.feed("TOK:1"), MarkerScanner::State::WAITING);
    EXPECT_EQ(scanner.feed("2\n"), MarkerScanner::State::MATCHED);
    EXPECT_EQ(scanner.exit_code(), 12);
}

TEST(MarkerScannerTest, EchoedCommandLineDoesNotMatch) {
    MarkerScanner scanner("TOK_9");
    EXPECT_EQ(scanner.feed("$ sudo apt-get install -y git; echo TOK_9':'$?\r\n"), MarkerScanner::State::WAITING);
    EXPECT_EQ(scanner.feed("Reading package lists...\r\nTOK_9:100\r\n"), MarkerScanner::State::MATCHED);
    EXPECT_EQ(scanner.exit_code(), 100);
}

TEST(MarkerScannerTest, TokenWithoutDigitsIsIgnored) {
    MarkerScanner scanner("TOK");
    EXPECT_EQ(scanner.feed("TOK: not yet\nTOKEN:5\n"), MarkerScanner::State::WAITING);
    EXPECT_EQ(scanner.feed("TOK:0\n"), MarkerScanner::State::MATCHED);
    EXPECT_EQ(scanner.exit_code(), 0);
}

TEST(MarkerScannerTest, CloseEndsWaiting) {
    MarkerScanner scanner("TOK");
    scanner.feed("TOK:");
    scanner.close();
    EXPECT_EQ(scanner.state(), MarkerScanner::State::CLOSED);
    EXPECT_EQ(scanner.feed("3\n"), MarkerScanner::State::CLOSED);
}

TEST(MarkerScannerTest, MatchedScannerIgnoresClose) {
    MarkerScanner scanner("TOK");
    scanner.feed("TOK:0\n");
    scanner.close();
    EXPECT_EQ(scanner.state(), MarkerScanner::State::MATCHED);
}

TEST(ExitTokenTest, FreshPerCall) {
    std::set<std::string> tokens;
    for (int i = 0; i < 100; ++i) {
        std::string token = make_exit_token();
        EXPECT_EQ(token.rfind("DEVSETUP_EXIT_", 0), 0u);
        EXPECT_EQ(token.find_first_of(" ':$"), std::string::npos);
        tokens.insert(token);
    }
    EXPECT_EQ(tokens.size(), 100u);
}

TEST_F(CommandChannelTest, InteractiveFailureCodeArrivesInLaterChunk) {
    auto terminal = std::make_unique<ScriptedTerminal>([](const std::string& sent, const std::string& token) {
        return std::vector<std::string>{sent + "\r\n", "output\r\n", token.substr(0, 6), token.substr(6) + ":", "1\r\n$ "};
    });
    ShellCommandChannel channel("test", factory_for(std::move(terminal)));

    try {
        channel.run("exit 1", ExecutionMode::INTERACTIVE);
        FAIL() << "expected CommandError";
    } catch (const CommandError& e) {
        EXPECT_EQ(e.kind(), CommandFailure::EXIT_CODE);
        EXPECT_EQ(e.exit_code(), 1);
    }

    auto sent = raw_terminal->sent();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].rfind("exit 1; echo DEVSETUP_EXIT_", 0), 0u);
    EXPECT_NE(sent[0].find("':'$?"), std::string::npos);
}

TEST_F(CommandChannelTest, InteractiveSuccessAndFreshTokens) {
    auto terminal = std::make_unique<ScriptedTerminal>([](const std::string&, const std::string& token) {
        return std::vector<std::string>{"done\r\n" + token + ":0\r\n"};
    });
    ShellCommandChannel channel("test", factory_for(std::move(terminal)));

    EXPECT_NO_THROW(channel.run("true", ExecutionMode::INTERACTIVE));
    EXPECT_NO_THROW(channel.run("true", ExecutionMode::INTERACTIVE));

    auto sent = raw_terminal->sent();
    ASSERT_EQ(sent.size(), 2u);
    EXPECT_NE(ScriptedTerminal::extract_token(sent[0]), ScriptedTerminal::extract_token(sent[1]));
}

TEST_F(CommandChannelTest, StaleTokenFromEarlierCommandIsIgnored) {
    std::string previous_token;
    auto terminal = std::make_unique<ScriptedTerminal>([&previous_token](const std::string&, const std::string& token) {
        std::vector<std::string> chunks;
        if (!previous_token.empty()) chunks.push_back(previous_token + ":7\r\n");
        chunks.push_back(token + ":0\r\n");
        previous_token = token;
        return chunks;
    });
    ShellCommandChannel channel("test", factory_for(std::move(terminal)));

    EXPECT_NO_THROW(channel.run("first", ExecutionMode::INTERACTIVE));
    EXPECT_NO_THROW(channel.run("second", ExecutionMode::INTERACTIVE));
}

TEST_F(CommandChannelTest, ClosedTerminalReleasesWaiter) {
    auto terminal = std::make_unique<ScriptedTerminal>(ScriptedTerminal::Script{}, true);
    ShellCommandChannel channel("test", factory_for(std::move(terminal)));

    try {
        channel.run("sudo true", ExecutionMode::INTERACTIVE);
        FAIL() << "expected CommandError";
    } catch (const CommandError& e) {
        EXPECT_EQ(e.kind(), CommandFailure::TERMINAL_CLOSED);
    }
}

TEST_F(CommandChannelTest, EndedSessionIsReplacedOnNextCommand) {
    int created = 0;
    ScriptedTerminal* second = nullptr;
    ShellCommandChannel channel("test", [&](const std::string&) -> std::unique_ptr<Terminal> {
        ++created;
        if (created == 1) {
            return std::make_unique<ScriptedTerminal>(ScriptedTerminal::Script{}, true);
        }
        auto terminal = std::make_unique<ScriptedTerminal>([](const std::string&, const std::string& token) {
            return std::vector<std::string>{token + ":0\r\n"};
        });
        second = terminal.get();
        return terminal;
    });

    EXPECT_THROW(channel.run("sudo true", ExecutionMode::INTERACTIVE), CommandError);
    // A notice for the dead session is dropped rather than written.
    EXPECT_NO_THROW(channel.notify("after close"));
    EXPECT_EQ(created, 1);

    EXPECT_NO_THROW(channel.run("sudo true", ExecutionMode::INTERACTIVE));
    EXPECT_EQ(created, 2);
    ASSERT_NE(second, nullptr);
    EXPECT_EQ(second->sent().size(), 1u);
}

TEST_F(CommandChannelTest, NotifyOnlyWritesToAnOpenSession) {
    auto terminal = std::make_unique<ScriptedTerminal>([](const std::string&, const std::string&) {
        return std::vector<std::string>{};
    });
    ShellCommandChannel channel("test", factory_for(std::move(terminal)));

    channel.notify("before");
    EXPECT_TRUE(raw_terminal->sent().empty());

    channel.open_session();
    channel.notify("it's done");
    auto sent = raw_terminal->sent();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0], "echo 'it'\\''s done'");
}

TEST_F(CommandChannelTest, SilentSuccessAndExitCode) {
    ShellCommandChannel channel("test", make_pty_terminal, 5s);
    EXPECT_NO_THROW(channel.run("echo fine", ExecutionMode::SILENT));

    try {
        channel.run("exit 4", ExecutionMode::SILENT);
        FAIL() << "expected CommandError";
    } catch (const CommandError& e) {
        EXPECT_EQ(e.kind(), CommandFailure::EXIT_CODE);
        EXPECT_EQ(e.exit_code(), 4);
    }
}

TEST_F(CommandChannelTest, SilentTimeoutNeverHangs) {
    ShellCommandChannel channel("test", make_pty_terminal, 200ms);
    auto start = std::chrono::steady_clock::now();
    try {
        channel.run("sleep 5", ExecutionMode::SILENT);
        FAIL() << "expected CommandError";
    } catch (const CommandError& e) {
        EXPECT_EQ(e.kind(), CommandFailure::TIMEOUT);
    }
    EXPECT_LT(std::chrono::steady_clock::now() - start, 3s);
}

TEST_F(CommandChannelTest, InteractiveOverRealPseudoTerminal) {
    ShellCommandChannel channel("pty-test", [](const std::string& title) -> std::unique_ptr<Terminal> {
        return std::make_unique<PtyTerminal>(title, "/bin/sh", false);
    });

    EXPECT_NO_THROW(channel.run("true", ExecutionMode::INTERACTIVE));
    try {
        channel.run("(exit 3)", ExecutionMode::INTERACTIVE);
        FAIL() << "expected CommandError";
    } catch (const CommandError& e) {
        EXPECT_EQ(e.kind(), CommandFailure::EXIT_CODE);
        EXPECT_EQ(e.exit_code(), 3);
    }
}
