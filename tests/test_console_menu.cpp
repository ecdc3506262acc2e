/**
 * @file test_console_menu.cpp
 * @brief Unit tests for the console task menu
 *
 * Tests the console menu including:
 * - Static and dynamic entries, duplicates and removal
 * - Clicking entries by index
 * - Command parsing and output
 * - The input loop: buffered lines, partial lines, EOF and stop
 */

#include <gtest/gtest.h>
#include "lanclip/console_menu.hpp"
#include "lanclip/session_engine.hpp"

#include <chrono>
#include <filesystem>
#include <sstream>
#include <string>
#include <thread>

#include <unistd.h>

using namespace lanclip;
namespace fs = std::filesystem;

// Test fixture for console menu tests
class ConsoleMenuTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() / "lanclip_menu_test";
        clipboard_ = std::make_shared<SpoolClipboard>(test_dir_);
        menu_ = std::make_unique<ConsoleMenu>(clipboard_, out_);
    }

    void TearDown() override {
        menu_.reset();
        clipboard_.reset();
        if (fs::exists(test_dir_)) {
            fs::remove_all(test_dir_);
        }
    }

    std::string take_output() {
        std::string text = out_.str();
        out_.str("");
        return text;
    }

    fs::path test_dir_;
    std::ostringstream out_;
    std::shared_ptr<SpoolClipboard> clipboard_;
    std::unique_ptr<ConsoleMenu> menu_;
};

// ============================================================================
// Entry Tests
// ============================================================================

TEST_F(ConsoleMenuTest, NullClipboardRejected) {
    EXPECT_THROW({ ConsoleMenu menu(nullptr, out_); }, std::invalid_argument);
}

TEST_F(ConsoleMenuTest, AddAndClick) {
    int clicks = 0;
    MenuEntry clicked;
    menu_->add_dynamic_entry(MenuEntry{"Copy from desk", "10.0.0.2:53300", true},
                             [&](const MenuEntry& entry) { clicks++; clicked = entry; });

    ASSERT_EQ(menu_->entries().size(), 1u);
    EXPECT_TRUE(menu_->click(0));
    EXPECT_EQ(clicks, 1);
    EXPECT_EQ(clicked.attributes, "10.0.0.2:53300");
    EXPECT_FALSE(menu_->click(1));
}

TEST_F(ConsoleMenuTest, DuplicateEntryReplacesCallback) {
    int first = 0;
    int second = 0;
    MenuEntry entry{"Copy from desk", "10.0.0.2:53300", true};
    menu_->add_dynamic_entry(entry, [&](const MenuEntry&) { first++; });
    menu_->add_dynamic_entry(entry, [&](const MenuEntry&) { second++; });

    ASSERT_EQ(menu_->entries().size(), 1u);
    menu_->click(0);
    EXPECT_EQ(first, 0);
    EXPECT_EQ(second, 1);
}

TEST_F(ConsoleMenuTest, RemoveEntryByMatcher) {
    menu_->add_dynamic_entry(MenuEntry{"Copy from a", "10.0.0.2:53300", true}, nullptr);
    menu_->add_dynamic_entry(MenuEntry{"Copy from b", "10.0.0.3:53300", true}, nullptr);

    EXPECT_TRUE(menu_->remove_entry([](const MenuEntry& e) { return e.label == "Copy from a"; }));
    EXPECT_FALSE(menu_->remove_entry([](const MenuEntry& e) { return e.label == "Copy from a"; }));
    ASSERT_EQ(menu_->entries().size(), 1u);
    EXPECT_EQ(menu_->entries()[0].label, "Copy from b");
}

TEST_F(ConsoleMenuTest, RemoveAllDynamicKeepsStatic) {
    menu_->add_static_entry(MenuEntry{DISCOVER_ENTRY_LABEL, "", false}, nullptr);
    menu_->add_dynamic_entry(MenuEntry{"Copy from a", "10.0.0.2:53300", true}, nullptr);
    menu_->add_dynamic_entry(MenuEntry{"Copy from b", "10.0.0.3:53300", true}, nullptr);

    EXPECT_TRUE(menu_->remove_all_dynamic());
    ASSERT_EQ(menu_->entries().size(), 1u);
    EXPECT_EQ(menu_->entries()[0].label, "Discover");
    EXPECT_TRUE(menu_->remove_all_dynamic());
}

TEST_F(ConsoleMenuTest, CallbackMayModifyMenu) {
    menu_->add_dynamic_entry(MenuEntry{"self-removing", "x", true}, [this](const MenuEntry&) {
        menu_->remove_all_dynamic();
    });

    EXPECT_TRUE(menu_->click(0));
    EXPECT_TRUE(menu_->entries().empty());
}

// ============================================================================
// Command Tests
// ============================================================================

TEST_F(ConsoleMenuTest, QuitEndsLoop) {
    EXPECT_FALSE(menu_->handle_command("quit"));
    EXPECT_FALSE(menu_->handle_command("  EXIT "));
    EXPECT_TRUE(menu_->handle_command(""));
}

TEST_F(ConsoleMenuTest, MenuListsEntries) {
    EXPECT_TRUE(menu_->handle_command("menu"));
    EXPECT_EQ(take_output(), "(no entries)\n");

    menu_->add_static_entry(MenuEntry{DISCOVER_ENTRY_LABEL, "", false}, nullptr);
    menu_->add_dynamic_entry(MenuEntry{"Copy from desk", "10.0.0.2:53300", true}, nullptr);

    EXPECT_TRUE(menu_->handle_command("peers"));
    EXPECT_EQ(take_output(), "  [0] Discover\n  [1] Copy from desk  (10.0.0.2:53300)\n");
}

TEST_F(ConsoleMenuTest, ClickCommand) {
    int clicks = 0;
    menu_->add_dynamic_entry(MenuEntry{"Copy from desk", "10.0.0.2:53300", true},
                             [&](const MenuEntry&) { clicks++; });

    EXPECT_TRUE(menu_->handle_command("click 0"));
    EXPECT_EQ(clicks, 1);

    EXPECT_TRUE(menu_->handle_command("click 4"));
    EXPECT_EQ(take_output(), "No entry 4\n");

    EXPECT_TRUE(menu_->handle_command("click one"));
    EXPECT_EQ(take_output(), "Usage: click <n>\n");
}

TEST_F(ConsoleMenuTest, DiscoverCommand) {
    EXPECT_TRUE(menu_->handle_command("discover"));
    EXPECT_EQ(take_output(), "Discovery not available yet\n");

    int clicks = 0;
    menu_->add_static_entry(MenuEntry{DISCOVER_ENTRY_LABEL, "", false}, [&](const MenuEntry&) { clicks++; });
    EXPECT_TRUE(menu_->handle_command("discover"));
    EXPECT_EQ(clicks, 1);
}

TEST_F(ConsoleMenuTest, DiscoverCommandFindsEngineEntry) {
    int clicks = 0;
    menu_->add_static_entry(MenuEntry{SessionEngine::DISCOVER_LABEL, "", false},
                            [&](const MenuEntry&) { clicks++; });

    EXPECT_TRUE(menu_->handle_command("discover"));
    EXPECT_EQ(clicks, 1);
    EXPECT_EQ(take_output(), "");
}

TEST_F(ConsoleMenuTest, TextAndHtmlSetClipboard) {
    EXPECT_TRUE(menu_->handle_command("text hello world"));
    EXPECT_EQ(take_output(), "Clipboard set (11 B)\n");

    auto content = clipboard_->read();
    ASSERT_TRUE(content.has_value());
    EXPECT_EQ(*content, ClipboardData::text(StringType::PLAIN_UTF8, std::string("hello world")));

    EXPECT_TRUE(menu_->handle_command("html <b>x</b>"));
    EXPECT_EQ(clipboard_->read()->string_type, StringType::HTML);
}

TEST_F(ConsoleMenuTest, ShowCommand) {
    EXPECT_TRUE(menu_->handle_command("show"));
    EXPECT_EQ(take_output(), "(empty)\n");

    clipboard_->set_local(ClipboardData::text(StringType::PLAIN_UTF8, std::string("abc")));
    EXPECT_TRUE(menu_->handle_command("show"));
    EXPECT_EQ(take_output(), "text (3 B)\n");
}

TEST_F(ConsoleMenuTest, FileCommandWithMissingFile) {
    EXPECT_TRUE(menu_->handle_command("file /nonexistent/lanclip/file.bin"));
    EXPECT_EQ(take_output(), "Cannot read file '/nonexistent/lanclip/file.bin'\n");
    EXPECT_FALSE(clipboard_->read().has_value());
}

TEST_F(ConsoleMenuTest, UnknownCommand) {
    EXPECT_TRUE(menu_->handle_command("frobnicate now"));
    EXPECT_EQ(take_output(), "Unknown command 'frobnicate', try help\n");
}

// ============================================================================
// Input Loop Tests
// ============================================================================

// Fixture that feeds the menu through a pipe
class ConsoleMenuInputTest : public ConsoleMenuTest {
protected:
    void SetUp() override {
        ConsoleMenuTest::SetUp();
        ASSERT_EQ(::pipe(fds_), 0);
        menu_ = std::make_unique<ConsoleMenu>(clipboard_, out_, fds_[0]);
    }

    void TearDown() override {
        close_writer();
        ::close(fds_[0]);
        ConsoleMenuTest::TearDown();
    }

    void feed(const std::string& text) {
        ASSERT_EQ(::write(fds_[1], text.data(), text.size()), static_cast<ssize_t>(text.size()));
    }

    void close_writer() {
        if (fds_[1] >= 0) {
            ::close(fds_[1]);
            fds_[1] = -1;
        }
    }

    int fds_[2] = {-1, -1};
};

TEST_F(ConsoleMenuInputTest, LinesWrittenTogetherAreAllHandled) {
    feed("text a\nshow\nquit\n");

    auto start = std::chrono::steady_clock::now();
    menu_->run();
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(1));

    std::string output = take_output();
    EXPECT_NE(output.find("Clipboard set (1 B)"), std::string::npos);
    EXPECT_NE(output.find("text (1 B)"), std::string::npos);
}

TEST_F(ConsoleMenuInputTest, LastLineWithoutNewlineHandledAtEof) {
    feed("text tail");
    close_writer();

    menu_->run();

    auto content = clipboard_->read();
    ASSERT_TRUE(content.has_value());
    EXPECT_EQ(*content, ClipboardData::text(StringType::PLAIN_UTF8, std::string("tail")));
}

TEST_F(ConsoleMenuInputTest, StopBeforeRunReturnsAtOnce) {
    menu_->stop();

    auto start = std::chrono::steady_clock::now();
    menu_->run();
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(100));
    EXPECT_EQ(take_output(), "");
}

TEST_F(ConsoleMenuInputTest, StopEndsRunWaitingOnPartialLine) {
    feed("text unfinish");

    std::thread runner([this]() { menu_->run(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    auto start = std::chrono::steady_clock::now();
    menu_->stop();
    runner.join();

    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(1));
    EXPECT_FALSE(clipboard_->read().has_value());
}
