/**
 * @file PhotoNamingPolicy.cpp
 * @brief Implementation of photo naming and quality rules
 */

#include "PhotoNamingPolicy.hpp"
#include "TextFormatter.hpp"
#include <cctype>
#include <iomanip>
#include <sstream>

namespace qreport {

std::string PhotoNamingPolicy::zero_padded(int value, int width) {
    std::ostringstream oss;
    oss << std::setw(width) << std::setfill('0') << value;
    return oss.str();
}

std::string PhotoNamingPolicy::normalize_segment(const std::string& text) {
    std::string out;
    out.reserve(text.size());

    for (char ch : text) {
        unsigned char c = static_cast<unsigned char>(ch);
        char mapped;
        if (c == ' ' || c == '\t' || c == '-') {
            mapped = '-';
        } else if (c < 0x80 && std::isalnum(c)) {
            mapped = static_cast<char>(std::tolower(c));
        } else {
            continue;
        }

        if (mapped == '-' && (out.empty() || out.back() == '-')) {
            continue;
        }
        out += mapped;
    }

    while (!out.empty() && out.back() == '-') {
        out.pop_back();
    }
    return out;
}

std::string PhotoNamingPolicy::structured_name(const PhotoContext& context, const Photo& photo) {
    std::string section = normalize_segment(context.section_title);
    if (section.empty()) {
        section = "section" + zero_padded(context.section_index + 1, 2);
    }

    std::string item = normalize_segment(context.item_title);
    if (item.empty()) {
        item = "item" + zero_padded(context.item_index + 1, 3);
    }

    std::string caption = normalize_segment(photo.caption);
    if (caption.empty()) {
        caption = "foto" + std::to_string(context.photo_index_in_item + 1);
    }

    std::string stem = zero_padded(context.section_index + 1, 2) + "_" + section + "_" + item + "_" + caption;

    const std::size_t max_stem = MAX_FILE_NAME_LENGTH - std::string(EXTENSION).size();
    if (stem.size() > max_stem) {
        stem.resize(max_stem);
        while (!stem.empty() && (stem.back() == '-' || stem.back() == '_')) {
            stem.pop_back();
        }
    }

    return stem + EXTENSION;
}

std::string PhotoNamingPolicy::with_counter(const std::string& file_name, int counter) {
    const std::string extension(EXTENSION);
    std::string stem = file_name;
    if (stem.size() >= extension.size() &&
        stem.compare(stem.size() - extension.size(), extension.size(), extension) == 0) {
        stem.resize(stem.size() - extension.size());
    }

    const std::string suffix = "_" + std::to_string(counter);
    const std::size_t max_stem = MAX_FILE_NAME_LENGTH - extension.size() - suffix.size();
    if (stem.size() > max_stem) {
        stem.resize(max_stem);
        while (!stem.empty() && (stem.back() == '-' || stem.back() == '_')) {
            stem.pop_back();
        }
    }

    return stem + suffix + extension;
}

std::string PhotoNamingPolicy::file_name(const PhotoContext& context,
                                         int global_index,
                                         PhotoNamingStrategy strategy,
                                         const Photo& photo) {
    switch (strategy) {
        case PhotoNamingStrategy::SEQUENTIAL:
            return "foto_" + zero_padded(global_index + 1, 3) + EXTENSION;

        case PhotoNamingStrategy::TIMESTAMP:
            return TextFormatter::format_timestamp(photo.taken_at, "%Y%m%d_%H%M%S") + "_" +
                   zero_padded(global_index + 1, 3) + EXTENSION;

        case PhotoNamingStrategy::STRUCTURED:
        default:
            return structured_name(context, photo);
    }
}

int PhotoNamingPolicy::encoder_quality(PhotoQuality quality) {
    switch (quality) {
        case PhotoQuality::ORIGINAL: return 100;
        case PhotoQuality::OPTIMIZED: return 85;
        case PhotoQuality::COMPRESSED: return 70;
    }
    return 100;
}

int PhotoNamingPolicy::target_width(PhotoQuality quality, int photo_max_width) {
    switch (quality) {
        case PhotoQuality::OPTIMIZED:
            return photo_max_width;
        case PhotoQuality::COMPRESSED:
            return photo_max_width * 3 / 4;
        case PhotoQuality::ORIGINAL:
        default:
            return 0;
    }
}

} // namespace qreport
