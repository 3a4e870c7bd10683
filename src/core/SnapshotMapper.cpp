/**
 * @file SnapshotMapper.cpp
 * @brief Implementation of the record-to-snapshot mapping
 */

#include "SnapshotMapper.hpp"
#include <algorithm>
#include <cctype>
#include <map>

namespace qreport {

std::string SnapshotMapper::display_name_for_key(const std::string& module_key) {
    std::string name;
    bool word_start = true;
    for (char c : module_key) {
        if (c == '_' || c == '-' || c == ' ') {
            if (!name.empty() && name.back() != ' ') name += ' ';
            word_start = true;
            continue;
        }
        unsigned char u = static_cast<unsigned char>(c);
        name += static_cast<char>(word_start ? std::toupper(u) : std::tolower(u));
        word_start = false;
    }
    while (!name.empty() && name.back() == ' ') name.pop_back();
    return name;
}

CheckupStatistics SnapshotMapper::compute_statistics(const std::vector<CheckupModule>& modules) {
    CheckupStatistics stats;
    stats.total_modules = static_cast<int>(modules.size());

    for (const auto& module : modules) {
        bool has_issue = false;
        for (const auto& item : module.items) {
            ++stats.total_items;
            stats.total_photos += static_cast<int>(item.photos.size());

            switch (item.status) {
                case CheckItemStatus::OK: ++stats.ok_items; break;
                case CheckItemStatus::NOK: ++stats.nok_items; break;
                case CheckItemStatus::NA: ++stats.na_items; break;
                case CheckItemStatus::PENDING: ++stats.pending_items; break;
            }

            if (item.status == CheckItemStatus::NOK) {
                has_issue = true;
                if (item.criticality == CriticalityLevel::CRITICAL) ++stats.critical_issues;
                if (item.criticality == CriticalityLevel::IMPORTANT) ++stats.important_issues;
            }
        }
        if (has_issue) ++stats.modules_with_issues;
    }

    return stats;
}

CheckupSnapshot SnapshotMapper::from_records(const CheckupRecordSet& records, Timestamp now) {
    CheckupSnapshot snapshot;
    snapshot.checkup_id = records.checkup.id;
    snapshot.header = records.checkup.header;
    snapshot.status_label = records.checkup.status;
    snapshot.created_at = records.checkup.created_at;
    snapshot.completed_at = records.checkup.completed_at;
    snapshot.spare_parts = records.spare_parts;
    snapshot.generated_at = now;

    // Photos per item, in their stored order
    std::map<std::string, std::vector<const PhotoRecord*>> photos_by_item;
    for (const auto& photo : records.photos) {
        photos_by_item[photo.check_item_id].push_back(&photo);
    }
    for (auto& [item_id, photos] : photos_by_item) {
        std::stable_sort(photos.begin(), photos.end(), [](const PhotoRecord* a, const PhotoRecord* b) {
            return a->order_index < b->order_index;
        });
    }

    // Modules in first-appearance order
    std::map<std::string, size_t> module_positions;
    std::vector<std::vector<const CheckItemRecord*>> module_items;
    for (const auto& item : records.items) {
        auto it = module_positions.find(item.module_key);
        if (it == module_positions.end()) {
            module_positions[item.module_key] = snapshot.modules.size();

            CheckupModule module;
            module.key = item.module_key;
            module.display_name = item.module_name.empty() ? display_name_for_key(item.module_key)
                                                           : item.module_name;
            snapshot.modules.push_back(module);
            module_items.emplace_back();
            module_items.back().push_back(&item);
        } else {
            module_items[it->second].push_back(&item);
        }
    }

    for (size_t m = 0; m < snapshot.modules.size(); ++m) {
        auto& items = module_items[m];
        std::stable_sort(items.begin(), items.end(), [](const CheckItemRecord* a, const CheckItemRecord* b) {
            return a->order_index < b->order_index;
        });

        for (const CheckItemRecord* record : items) {
            CheckItem item;
            item.id = record->id;
            item.description = record->description;
            item.status = record->status;
            item.criticality = record->criticality;
            item.notes = record->notes;

            auto photos = photos_by_item.find(record->id);
            if (photos != photos_by_item.end()) {
                for (const PhotoRecord* photo_record : photos->second) {
                    Photo photo;
                    photo.id = photo_record->id;
                    photo.file_path = photo_record->file_path;
                    photo.file_name = photo_record->file_name;
                    photo.caption = photo_record->caption;
                    photo.taken_at = photo_record->taken_at;
                    item.photos.push_back(photo);
                }
            }
            snapshot.modules[m].items.push_back(item);
        }
    }

    snapshot.statistics = compute_statistics(snapshot.modules);
    return snapshot;
}

} // namespace qreport
