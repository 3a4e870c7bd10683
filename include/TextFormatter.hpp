/**
 * @file TextFormatter.hpp
 * @brief Plain-text layout primitives for reports and index files
 *
 * Pure functions producing aligned, boxed and tabular text. Widths are
 * measured in UTF-8 code points so box-drawing and bar glyphs line up.
 *
 * Copyright (c) 2026 The QReport Authors
 * Portions copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace qreport {

/**
 * @brief Border glyph sets for create_box()
 */
enum class BoxStyle {
    SINGLE,   // ┌─┐│└┘
    DOUBLE,   // ╔═╗║╚╝
    ASCII     // +-+|++
};

/**
 * @brief Text layout helper used by the text report and index writers
 */
class TextFormatter {
public:
    struct Config {
        int line_width = 80;          ///< Default width for centered text and rules
        std::string bullet = "•";     ///< Bullet glyph for bullet lists
        int progress_bar_width = 20;  ///< Cells in a progress bar
    };

    TextFormatter() = default;
    explicit TextFormatter(const Config& config) : config_(config) {}

    const Config& config() const { return config_; }

    /**
     * @brief Center text in the given width (left padding only)
     */
    std::string center_text(const std::string& text, int width = 0) const;

    std::string left_align(const std::string& text, int width) const;
    std::string right_align(const std::string& text, int width) const;

    /**
     * @brief Word-wrap text into lines no wider than width
     *
     * Words longer than the width are hard-split.
     */
    std::vector<std::string> wrap_text(const std::string& text, int width) const;

    /**
     * @brief Horizontal rule of repeated characters
     */
    std::string rule(char c = '=', int width = 0) const;

    /**
     * @brief ASCII table with a +---+ separator above and below the header
     *
     * Column widths grow to fit the widest cell. Missing cells are blank.
     */
    std::string create_table(const std::vector<std::string>& headers,
                             const std::vector<std::vector<std::string>>& rows) const;

    std::string create_box(const std::vector<std::string>& lines,
                           BoxStyle style = BoxStyle::SINGLE,
                           int width = 0) const;

    /**
     * @brief Progress bar such as "[██████░░░░] 60.0% (6/10)"
     */
    std::string create_progress_bar(int current, int total, int width = 0) const;

    std::string bullet_list(const std::vector<std::string>& items, int indent = 0) const;
    std::string numbered_list(const std::vector<std::string>& items, int indent = 0) const;

    /**
     * @brief Title, underline of matching length, then content
     */
    std::string create_section(const std::string& title, const std::string& content,
                               char underline = '-') const;

    /**
     * @brief "Key:        value" with the key padded to key_width
     */
    std::string key_value(const std::string& key, const std::string& value,
                          int key_width = 22) const;

    std::string truncate_text(const std::string& text, int max_width,
                              const std::string& ellipsis = "...") const;

    /**
     * @brief Two columns side by side, each half of the total width
     */
    std::string create_columns(const std::vector<std::string>& left,
                               const std::vector<std::string>& right,
                               int width = 0) const;

    /**
     * @brief Number of UTF-8 code points in text
     */
    static int display_width(const std::string& text);

    /**
     * @brief Human-readable size: "512 B", "1.5 KB", "3.2 MB", "1.0 GB"
     */
    static std::string format_file_size(std::uintmax_t bytes);

    /**
     * @brief Human-readable duration: "850ms", "2.4s", "3m12s"
     */
    static std::string format_duration(std::chrono::milliseconds duration);

    /**
     * @brief strftime-style local-time formatting
     */
    static std::string format_timestamp(std::chrono::system_clock::time_point time,
                                        const char* pattern = "%d/%m/%Y %H:%M");

private:
    Config config_;

    int resolve_width(int width) const { return width > 0 ? width : config_.line_width; }
};

} // namespace qreport
