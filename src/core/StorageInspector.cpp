/**
 * @file StorageInspector.cpp
 * @brief Implementation of the free-space check
 */

#include "StorageInspector.hpp"
#include "TextFormatter.hpp"
#include <filesystem>

namespace qreport {

namespace fs = std::filesystem;

StorageInspector::StorageInspector()
    : logger_("StorageInspector") {
}

std::optional<std::uintmax_t> StorageInspector::available_bytes(const std::string& path) const {
    std::error_code ec;
    fs::path existing = fs::absolute(path, ec);
    if (ec) {
        existing = fs::path(path);
    }

    while (!existing.empty() && !fs::exists(existing, ec)) {
        fs::path parent = existing.parent_path();
        if (parent == existing) break;
        existing = parent;
    }
    if (existing.empty()) {
        existing = fs::current_path(ec);
    }

    fs::space_info info = fs::space(existing, ec);
    if (ec) {
        logger_.warning("Cannot query free space at " + existing.string() + ": " + ec.message());
        return std::nullopt;
    }
    return info.available;
}

bool StorageInspector::has_space_for(const std::string& path, std::uintmax_t required_bytes) const {
    auto available = available_bytes(path);
    if (!available) {
        return true;
    }

    logger_.debug("Storage: " + TextFormatter::format_file_size(*available) + " available, " +
                  TextFormatter::format_file_size(required_bytes) + " required");
    return *available >= required_bytes;
}

} // namespace qreport
