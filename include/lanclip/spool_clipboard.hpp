/**
 * @file spool_clipboard.hpp
 * @brief In-process clipboard that spools received content to disk
 *
 * LanClip - LAN clipboard exchange
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include "lanclip/collaborators.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

namespace lanclip {

/**
 * @brief Clipboard backed by memory and a "received" directory
 *
 * Local content is set from the console. Content written by the engine
 * replaces it and is saved as clipboard.txt, clipboard.html or the
 * sanitized filename of a received file.
 */
class SpoolClipboard : public Clipboard {
public:
    /**
     * @param received_dir Directory for received content (created if missing)
     */
    explicit SpoolClipboard(const std::filesystem::path& received_dir);

    // Disable copy and move
    SpoolClipboard(const SpoolClipboard&) = delete;
    SpoolClipboard& operator=(const SpoolClipboard&) = delete;
    SpoolClipboard(SpoolClipboard&&) = delete;
    SpoolClipboard& operator=(SpoolClipboard&&) = delete;

    std::optional<ClipboardData> read() override;

    bool write(const ClipboardData& data) override;

    /**
     * @brief Replace local content without touching the disk
     */
    void set_local(const ClipboardData& data);

    /**
     * @brief Load a file as local content
     * @return false if the file cannot be read
     */
    bool set_local_file(const std::string& path);

    void clear();

    /**
     * @brief Path a given content would be spooled to
     * @return Path, or std::nullopt if it would escape the received directory
     */
    std::optional<std::filesystem::path> spool_path(const ClipboardData& data) const;

    const std::filesystem::path& received_directory() const { return received_dir_; }

private:
    std::filesystem::path received_dir_;
    mutable std::mutex mutex_;
    std::optional<ClipboardData> content_;
};

} // namespace lanclip
