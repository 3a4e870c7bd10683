/**
 * @file TextFormatter.cpp
 * @brief Implementation of plain-text layout primitives
 */

#include "TextFormatter.hpp"
#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace qreport {

namespace {

struct BoxGlyphs {
    const char* top_left;
    const char* top_right;
    const char* bottom_left;
    const char* bottom_right;
    const char* horizontal;
    const char* vertical;
};

BoxGlyphs glyphs_for(BoxStyle style) {
    switch (style) {
        case BoxStyle::DOUBLE:
            return {"╔", "╗", "╚", "╝", "═", "║"};
        case BoxStyle::ASCII:
            return {"+", "+", "+", "+", "-", "|"};
        case BoxStyle::SINGLE:
        default:
            return {"┌", "┐", "└", "┘", "─", "│"};
    }
}

std::string repeat(const std::string& unit, int count) {
    std::string out;
    for (int i = 0; i < count; ++i) {
        out += unit;
    }
    return out;
}

// Byte offset of the code point at index cp_index
size_t byte_offset(const std::string& text, int cp_index) {
    int seen = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if ((c & 0xC0) != 0x80) {
            if (seen == cp_index) return i;
            ++seen;
        }
    }
    return text.size();
}

} // namespace

int TextFormatter::display_width(const std::string& text) {
    int width = 0;
    for (char ch : text) {
        if ((static_cast<unsigned char>(ch) & 0xC0) != 0x80) {
            ++width;
        }
    }
    return width;
}

std::string TextFormatter::center_text(const std::string& text, int width) const {
    int w = resolve_width(width);
    int padding = std::max(0, (w - display_width(text)) / 2);
    return std::string(padding, ' ') + text;
}

std::string TextFormatter::left_align(const std::string& text, int width) const {
    int padding = std::max(0, width - display_width(text));
    return text + std::string(padding, ' ');
}

std::string TextFormatter::right_align(const std::string& text, int width) const {
    int padding = std::max(0, width - display_width(text));
    return std::string(padding, ' ') + text;
}

std::vector<std::string> TextFormatter::wrap_text(const std::string& text, int width) const {
    std::vector<std::string> lines;
    if (width <= 0) {
        lines.push_back(text);
        return lines;
    }

    std::istringstream words(text);
    std::string word;
    std::string current;

    while (words >> word) {
        while (display_width(word) > width) {
            if (!current.empty()) {
                lines.push_back(current);
                current.clear();
            }
            size_t cut = byte_offset(word, width);
            lines.push_back(word.substr(0, cut));
            word = word.substr(cut);
        }

        if (current.empty()) {
            current = word;
        } else if (display_width(current) + 1 + display_width(word) <= width) {
            current += " " + word;
        } else {
            lines.push_back(current);
            current = word;
        }
    }

    if (!current.empty()) {
        lines.push_back(current);
    }
    if (lines.empty()) {
        lines.emplace_back();
    }
    return lines;
}

std::string TextFormatter::rule(char c, int width) const {
    return std::string(resolve_width(width), c);
}

std::string TextFormatter::create_table(const std::vector<std::string>& headers,
                                        const std::vector<std::vector<std::string>>& rows) const {
    size_t columns = headers.size();
    for (const auto& row : rows) {
        columns = std::max(columns, row.size());
    }
    if (columns == 0) {
        return "";
    }

    std::vector<int> widths(columns, 0);
    auto measure = [&widths](const std::vector<std::string>& cells) {
        for (size_t i = 0; i < cells.size(); ++i) {
            widths[i] = std::max(widths[i], display_width(cells[i]));
        }
    };
    measure(headers);
    for (const auto& row : rows) {
        measure(row);
    }

    std::string separator = "+";
    for (int w : widths) {
        separator += std::string(w + 2, '-') + "+";
    }

    auto render_row = [&](const std::vector<std::string>& cells) {
        std::string line = "|";
        for (size_t i = 0; i < columns; ++i) {
            const std::string cell = i < cells.size() ? cells[i] : "";
            line += " " + left_align(cell, widths[i]) + " |";
        }
        return line;
    };

    std::ostringstream out;
    out << separator << "\n";
    if (!headers.empty()) {
        out << render_row(headers) << "\n";
        out << separator << "\n";
    }
    for (const auto& row : rows) {
        out << render_row(row) << "\n";
    }
    if (!rows.empty()) {
        out << separator << "\n";
    }
    return out.str();
}

std::string TextFormatter::create_box(const std::vector<std::string>& lines,
                                      BoxStyle style, int width) const {
    BoxGlyphs g = glyphs_for(style);

    int inner = 0;
    if (width > 0) {
        inner = std::max(0, width - 4);
    } else {
        for (const auto& line : lines) {
            inner = std::max(inner, display_width(line));
        }
    }

    std::ostringstream out;
    out << g.top_left << repeat(g.horizontal, inner + 2) << g.top_right << "\n";
    for (const auto& line : lines) {
        for (const auto& wrapped : wrap_text(line, inner)) {
            out << g.vertical << " " << left_align(wrapped, inner) << " " << g.vertical << "\n";
        }
    }
    out << g.bottom_left << repeat(g.horizontal, inner + 2) << g.bottom_right << "\n";
    return out.str();
}

std::string TextFormatter::create_progress_bar(int current, int total, int width) const {
    int cells = width > 0 ? width : config_.progress_bar_width;
    double ratio = total > 0 ? static_cast<double>(current) / total : 0.0;
    ratio = std::clamp(ratio, 0.0, 1.0);
    int filled = static_cast<int>(ratio * cells + 0.5);

    std::ostringstream out;
    out << "[" << repeat("█", filled) << repeat("░", cells - filled) << "] "
        << std::fixed << std::setprecision(1) << ratio * 100.0 << "% ("
        << current << "/" << total << ")";
    return out.str();
}

std::string TextFormatter::bullet_list(const std::vector<std::string>& items, int indent) const {
    std::ostringstream out;
    std::string pad(indent, ' ');
    for (const auto& item : items) {
        out << pad << config_.bullet << " " << item << "\n";
    }
    return out.str();
}

std::string TextFormatter::numbered_list(const std::vector<std::string>& items, int indent) const {
    std::ostringstream out;
    std::string pad(indent, ' ');
    for (size_t i = 0; i < items.size(); ++i) {
        out << pad << (i + 1) << ". " << items[i] << "\n";
    }
    return out.str();
}

std::string TextFormatter::create_section(const std::string& title, const std::string& content,
                                          char underline) const {
    std::ostringstream out;
    out << title << "\n" << std::string(display_width(title), underline) << "\n";
    out << content;
    if (!content.empty() && content.back() != '\n') {
        out << "\n";
    }
    return out.str();
}

std::string TextFormatter::key_value(const std::string& key, const std::string& value,
                                     int key_width) const {
    return left_align(key + ":", key_width) + value;
}

std::string TextFormatter::truncate_text(const std::string& text, int max_width,
                                         const std::string& ellipsis) const {
    if (display_width(text) <= max_width) {
        return text;
    }
    int keep = max_width - display_width(ellipsis);
    if (keep <= 0) {
        return text.substr(0, byte_offset(text, max_width));
    }
    return text.substr(0, byte_offset(text, keep)) + ellipsis;
}

std::string TextFormatter::create_columns(const std::vector<std::string>& left,
                                          const std::vector<std::string>& right,
                                          int width) const {
    int column = resolve_width(width) / 2;
    size_t rows = std::max(left.size(), right.size());

    std::ostringstream out;
    for (size_t i = 0; i < rows; ++i) {
        std::string l = i < left.size() ? truncate_text(left[i], column - 1) : "";
        std::string r = i < right.size() ? truncate_text(right[i], column) : "";
        out << left_align(l, column) << r << "\n";
    }
    return out.str();
}

std::string TextFormatter::format_file_size(std::uintmax_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB"};
    double size = static_cast<double>(bytes);
    int unit = 0;

    while (size >= 1024 && unit < 3) {
        size /= 1024;
        unit++;
    }

    std::ostringstream oss;
    if (unit == 0) {
        oss << bytes << " B";
    } else {
        oss << std::fixed << std::setprecision(1) << size << " " << units[unit];
    }
    return oss.str();
}

std::string TextFormatter::format_duration(std::chrono::milliseconds duration) {
    auto ms = duration.count();
    if (ms < 1000) {
        return std::to_string(ms) + "ms";
    } else if (ms < 60000) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(1) << ms / 1000.0 << "s";
        return oss.str();
    }
    auto minutes = ms / 60000;
    auto seconds = (ms % 60000) / 1000;
    return std::to_string(minutes) + "m" + std::to_string(seconds) + "s";
}

std::string TextFormatter::format_timestamp(std::chrono::system_clock::time_point time,
                                            const char* pattern) {
    std::time_t t = std::chrono::system_clock::to_time_t(time);
    std::tm tm{};
    localtime_r(&t, &tm);

    char buffer[64];
    size_t written = std::strftime(buffer, sizeof(buffer), pattern, &tm);
    return std::string(buffer, written);
}

} // namespace qreport
