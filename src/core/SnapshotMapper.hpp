/**
 * @file SnapshotMapper.hpp
 * @brief Builds a CheckupSnapshot from flat persistence records
 */

#pragma once

#include "qreport_export.hpp"
#include <optional>
#include <string>
#include <vector>

namespace qreport {

/**
 * @brief Checkup row with its client, site, island and technician columns
 */
struct CheckupRecord {
    std::string id;
    std::string status;
    Timestamp created_at{};
    std::optional<Timestamp> completed_at;
    CheckupHeader header;
};

struct CheckItemRecord {
    std::string id;
    std::string module_key;
    std::string module_name;        // Empty: derived from module_key
    std::string description;
    CheckItemStatus status = CheckItemStatus::PENDING;
    CriticalityLevel criticality = CriticalityLevel::ROUTINE;
    std::string notes;
    int order_index = 0;
};

struct PhotoRecord {
    std::string id;
    std::string check_item_id;
    std::string file_path;
    std::string file_name;
    std::string caption;
    Timestamp taken_at{};
    int order_index = 0;
};

/**
 * @brief Everything loaded for one checkup, as stored
 */
struct CheckupRecordSet {
    CheckupRecord checkup;
    std::vector<CheckItemRecord> items;
    std::vector<PhotoRecord> photos;
    std::vector<SparePart> spare_parts;
};

class SnapshotMapper {
public:
    /**
     * @brief Group items by module (first-appearance order) and attach photos
     *
     * Items keep their order_index order within a module, photos theirs
     * within an item. Photos whose item is unknown are dropped.
     * Statistics are computed and generated_at is stamped with now.
     */
    static CheckupSnapshot from_records(const CheckupRecordSet& records,
                                        Timestamp now = std::chrono::system_clock::now());

    static CheckupStatistics compute_statistics(const std::vector<CheckupModule>& modules);

    /**
     * @brief "SAFETY_SYSTEMS" -> "Safety Systems"
     */
    static std::string display_name_for_key(const std::string& module_key);
};

} // namespace qreport
