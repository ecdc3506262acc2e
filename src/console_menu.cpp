/**
 * @file console_menu.cpp
 * @brief Implementation of the interactive stdin task menu
 *
 * LanClip - LAN clipboard exchange
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "lanclip/console_menu.hpp"
#include "lanclip/utilities.hpp"

#include <algorithm>
#include <cerrno>
#include <optional>
#include <stdexcept>

#include <poll.h>
#include <unistd.h>

namespace lanclip {

namespace {
    constexpr int INPUT_POLL_TIMEOUT_MS = 200;
    constexpr size_t INPUT_READ_SIZE = 4096;

    void split_command(const std::string& line, std::string& verb, std::string& argument) {
        std::string trimmed = utilities::trim_string(line);
        auto space = trimmed.find(' ');
        if (space == std::string::npos) {
            verb = utilities::to_lowercase(trimmed);
            argument.clear();
        } else {
            verb = utilities::to_lowercase(trimmed.substr(0, space));
            argument = utilities::trim_string(trimmed.substr(space + 1));
        }
    }
}

ConsoleMenu::ConsoleMenu(std::shared_ptr<SpoolClipboard> clipboard, std::ostream& out, int input_fd)
    : clipboard_(std::move(clipboard))
    , out_(out)
    , input_fd_(input_fd)
    , stop_requested_(false)
{
    if (!clipboard_) {
        throw std::invalid_argument("ConsoleMenu: clipboard cannot be null");
    }
}

// ============================================================================
// Entries
// ============================================================================

bool ConsoleMenu::add_entry(const MenuEntry& entry, MenuCallback on_click) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto duplicate = std::find_if(items_.begin(), items_.end(), [&entry](const Item& item) {
        return item.entry == entry;
    });
    if (duplicate != items_.end()) {
        duplicate->on_click = std::move(on_click);
        return true;
    }

    items_.push_back(Item{entry, std::move(on_click)});
    return true;
}

bool ConsoleMenu::add_dynamic_entry(const MenuEntry& entry, MenuCallback on_click) {
    MenuEntry dynamic_entry = entry;
    dynamic_entry.dynamic = true;
    utilities::log_debug("Menu: + " + dynamic_entry.label);
    return add_entry(dynamic_entry, std::move(on_click));
}

bool ConsoleMenu::add_static_entry(const MenuEntry& entry, MenuCallback on_click) {
    MenuEntry static_entry = entry;
    static_entry.dynamic = false;
    return add_entry(static_entry, std::move(on_click));
}

bool ConsoleMenu::remove_entry(const MenuMatcher& matcher) {
    std::lock_guard<std::mutex> lock(mutex_);

    size_t before = items_.size();
    items_.erase(
        std::remove_if(items_.begin(), items_.end(), [&matcher](const Item& item) {
            return matcher(item.entry);
        }),
        items_.end()
    );
    return items_.size() != before;
}

bool ConsoleMenu::remove_all_dynamic() {
    remove_entry([](const MenuEntry& entry) { return entry.dynamic; });
    return true;
}

std::vector<MenuEntry> ConsoleMenu::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<MenuEntry> result;
    result.reserve(items_.size());
    for (const auto& item : items_) {
        result.push_back(item.entry);
    }
    return result;
}

bool ConsoleMenu::click(size_t index) {
    MenuEntry entry;
    MenuCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (index >= items_.size()) {
            return false;
        }
        entry = items_[index].entry;
        callback = items_[index].on_click;
    }

    // Outside the lock: callbacks may call back into the menu
    if (callback) {
        callback(entry);
    }
    return true;
}

// ============================================================================
// Command Loop
// ============================================================================

void ConsoleMenu::run() {
    if (stop_requested_.load()) {
        return;
    }
    print_help();

    while (!stop_requested_.load()) {
        std::string line;
        if (take_line(line)) {
            if (!handle_command(line)) {
                break;
            }
            continue;
        }

        struct pollfd pfd;
        pfd.fd = input_fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int ready = ::poll(&pfd, 1, INPUT_POLL_TIMEOUT_MS);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            utilities::log_error("Menu: input poll failed");
            break;
        }
        if (ready == 0) {
            continue;
        }

        char buffer[INPUT_READ_SIZE];
        ssize_t n = ::read(input_fd_, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            utilities::log_error("Menu: input read failed");
            break;
        }
        if (n == 0) {
            // Last line may lack a newline
            if (!pending_.empty()) {
                std::string last;
                last.swap(pending_);
                handle_command(last);
            }
            utilities::log_info("Menu: input closed");
            break;
        }

        pending_.append(buffer, static_cast<size_t>(n));
    }
}

void ConsoleMenu::stop() {
    stop_requested_ = true;
}

bool ConsoleMenu::take_line(std::string& line) {
    auto newline = pending_.find('\n');
    if (newline == std::string::npos) {
        return false;
    }
    line = pending_.substr(0, newline);
    pending_.erase(0, newline + 1);
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return true;
}

bool ConsoleMenu::handle_command(const std::string& line) {
    std::string verb;
    std::string argument;
    split_command(line, verb, argument);

    if (verb.empty()) {
        return true;
    }

    if (verb == "quit" || verb == "exit") {
        return false;
    }

    if (verb == "help") {
        print_help();
    } else if (verb == "menu" || verb == "peers") {
        print_entries();
    } else if (verb == "click") {
        try {
            size_t index = std::stoul(argument);
            if (!click(index)) {
                out_ << "No entry " << index << std::endl;
            }
        } catch (const std::exception&) {
            out_ << "Usage: click <n>" << std::endl;
        }
    } else if (verb == "discover") {
        std::optional<size_t> index;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (size_t i = 0; i < items_.size(); ++i) {
                if (!items_[i].entry.dynamic && items_[i].entry.label == DISCOVER_ENTRY_LABEL) {
                    index = i;
                    break;
                }
            }
        }
        if (!index || !click(*index)) {
            out_ << "Discovery not available yet" << std::endl;
        }
    } else if (verb == "text" || verb == "html") {
        StringType type = (verb == "html") ? StringType::HTML : StringType::PLAIN_UTF8;
        clipboard_->set_local(ClipboardData::text(type, argument));
        out_ << "Clipboard set (" << utilities::format_file_size(argument.size()) << ")" << std::endl;
    } else if (verb == "file") {
        if (argument.empty() || !clipboard_->set_local_file(argument)) {
            out_ << "Cannot read file '" << argument << "'" << std::endl;
        } else {
            out_ << "Clipboard set to file " << argument << std::endl;
        }
    } else if (verb == "show") {
        auto content = clipboard_->read();
        out_ << (content ? content->describe() : std::string("(empty)")) << std::endl;
    } else {
        out_ << "Unknown command '" << verb << "', try help" << std::endl;
    }

    return true;
}

void ConsoleMenu::print_entries() {
    auto current = entries();
    if (current.empty()) {
        out_ << "(no entries)" << std::endl;
        return;
    }
    for (size_t i = 0; i < current.size(); ++i) {
        out_ << "  [" << i << "] " << current[i].label;
        if (!current[i].attributes.empty()) {
            out_ << "  (" << current[i].attributes << ")";
        }
        out_ << std::endl;
    }
}

void ConsoleMenu::print_help() {
    out_ << "Commands: help, menu, peers, click <n>, discover, text <string>, "
         << "html <markup>, file <path>, show, quit" << std::endl;
}

} // namespace lanclip
