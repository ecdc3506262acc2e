/**
 * @file console_menu.hpp
 * @brief Interactive stdin task menu
 *
 * LanClip - LAN clipboard exchange
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Commands:
 *   help              List commands
 *   menu | peers      List menu entries with their indices
 *   click <n>         Activate entry n
 *   discover          Activate the Discover entry
 *   text <string>     Set local clipboard to plain text
 *   html <markup>     Set local clipboard to HTML
 *   file <path>       Set local clipboard to a file
 *   show              Describe local clipboard
 *   quit              Leave the menu loop
 */

#pragma once

#include "lanclip/collaborators.hpp"
#include "lanclip/spool_clipboard.hpp"

#include <atomic>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <unistd.h>

namespace lanclip {

/**
 * @brief TaskMenu driven by console commands
 */
class ConsoleMenu : public TaskMenu {
public:
    /**
     * @param clipboard Local clipboard edited by text/html/file commands
     * @param out Stream receiving listings and replies
     * @param input_fd Descriptor commands are read from
     * @throws std::invalid_argument if clipboard is null
     */
    explicit ConsoleMenu(std::shared_ptr<SpoolClipboard> clipboard, std::ostream& out = std::cout,
                         int input_fd = STDIN_FILENO);

    // Disable copy and move
    ConsoleMenu(const ConsoleMenu&) = delete;
    ConsoleMenu& operator=(const ConsoleMenu&) = delete;
    ConsoleMenu(ConsoleMenu&&) = delete;
    ConsoleMenu& operator=(ConsoleMenu&&) = delete;

    bool add_dynamic_entry(const MenuEntry& entry, MenuCallback on_click) override;
    bool add_static_entry(const MenuEntry& entry, MenuCallback on_click) override;
    bool remove_entry(const MenuMatcher& matcher) override;
    bool remove_all_dynamic() override;

    /**
     * @brief Read commands from the input descriptor until quit, EOF or stop()
     *
     * Every complete line already buffered is handled before polling again.
     * Returns at once if stop() was called earlier.
     */
    void run() override;

    /**
     * @brief Make run() return within one poll interval, even mid-line
     */
    void stop() override;

    /**
     * @brief Execute one command line
     * @return false if the command asks to quit
     */
    bool handle_command(const std::string& line);

    /**
     * @brief Invoke the callback of entry index
     * @return false if index is out of range
     */
    bool click(size_t index);

    std::vector<MenuEntry> entries() const;

private:
    struct Item {
        MenuEntry entry;
        MenuCallback on_click;
    };

    bool add_entry(const MenuEntry& entry, MenuCallback on_click);
    bool take_line(std::string& line);
    void print_entries();
    void print_help();

    std::shared_ptr<SpoolClipboard> clipboard_;
    std::ostream& out_;
    int input_fd_;
    std::string pending_;

    mutable std::mutex mutex_;
    std::vector<Item> items_;

    std::atomic<bool> stop_requested_;
};

} // namespace lanclip
