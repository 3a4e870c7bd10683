/**
 * @file StorageInspector.hpp
 * @brief Free-space check for the exports root
 */

#pragma once

#include "Logger.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace qreport {

class StorageInspector {
public:
    StorageInspector();

    /**
     * @brief Bytes available to the caller at path
     *
     * A path that does not exist yet is measured at its nearest existing
     * ancestor. nullopt when no ancestor can be queried.
     */
    std::optional<std::uintmax_t> available_bytes(const std::string& path) const;

    /**
     * @brief Whether required_bytes fit at path
     *
     * An unmeasurable location is treated as having space; the write
     * itself will then report the failure.
     */
    bool has_space_for(const std::string& path, std::uintmax_t required_bytes) const;

private:
    Logger logger_;
};

} // namespace qreport
