/**
 * @file spool_clipboard.cpp
 * @brief Implementation of the spooling clipboard
 *
 * LanClip - LAN clipboard exchange
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "lanclip/spool_clipboard.hpp"
#include "lanclip/node_config.hpp"
#include "lanclip/utilities.hpp"

namespace lanclip {

namespace {
    constexpr size_t HTML_PREVIEW_LENGTH = 120;
}

SpoolClipboard::SpoolClipboard(const std::filesystem::path& received_dir)
    : received_dir_(received_dir)
{
    std::error_code ec;
    std::filesystem::create_directories(received_dir_, ec);
    if (ec) {
        utilities::log_warn("Clipboard: Cannot create " + received_dir_.string() + ": " + ec.message());
    }
}

std::optional<ClipboardData> SpoolClipboard::read() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!content_) {
        utilities::log_debug("Clipboard: Empty");
    }
    return content_;
}

bool SpoolClipboard::write(const ClipboardData& data) {
    auto path = spool_path(data);
    if (!path) {
        utilities::log_error("Clipboard: Refusing unsafe filename '" + data.filename + "'");
        return false;
    }

    if (!utilities::write_file_binary(path->string(), data.data)) {
        return false;
    }

    if (data.kind == ClipboardKind::STRING && data.string_type == StringType::HTML) {
        std::string plain = utilities::extract_plain_text_from_html(
            std::string(data.data.begin(), data.data.end()));
        utilities::log_info("Clipboard: HTML preview: " +
                            utilities::truncate_utf8(utilities::trim_string(plain), HTML_PREVIEW_LENGTH));
    }

    utilities::log_info("Clipboard: Saved " + data.describe() + " to " + path->string());

    std::lock_guard<std::mutex> lock(mutex_);
    content_ = data;
    return true;
}

void SpoolClipboard::set_local(const ClipboardData& data) {
    std::lock_guard<std::mutex> lock(mutex_);
    content_ = data;
}

bool SpoolClipboard::set_local_file(const std::string& path) {
    auto bytes = utilities::read_file_binary(path);
    if (!bytes) {
        return false;
    }

    std::string name = std::filesystem::path(path).filename().string();
    set_local(ClipboardData::file(name, std::move(*bytes)));
    return true;
}

void SpoolClipboard::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    content_.reset();
}

std::optional<std::filesystem::path> SpoolClipboard::spool_path(const ClipboardData& data) const {
    std::string name;
    if (data.kind == ClipboardKind::FILE) {
        name = config::sanitize_filename(data.filename);
    } else if (data.string_type == StringType::HTML) {
        name = "clipboard.html";
    } else {
        name = "clipboard.txt";
    }

    std::filesystem::path path = received_dir_ / name;
    if (!config::is_safe_path(path, received_dir_)) {
        return std::nullopt;
    }
    return path;
}

} // namespace lanclip
