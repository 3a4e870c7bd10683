/**
 * @file CheckupFileLoader.cpp
 * @brief Implementation of the JSON checkup file reader
 */

#include "CheckupFileLoader.hpp"
#include <nlohmann/json.hpp>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace qreport {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::string string_field(const json& object, const char* key) {
    if (!object.contains(key) || object[key].is_null()) return "";
    return object[key].get<std::string>();
}

int int_field(const json& object, const char* key, int default_value) {
    if (!object.contains(key) || !object[key].is_number()) return default_value;
    return object[key].get<int>();
}

std::optional<Timestamp> timestamp_field(const json& object, const char* key) {
    if (!object.contains(key) || object[key].is_null()) return std::nullopt;

    const json& value = object[key];
    if (value.is_number()) {
        return Timestamp(std::chrono::milliseconds(value.get<long long>()));
    }

    std::tm tm{};
    std::istringstream iss(value.get<std::string>());
    iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) {
        throw CheckupFileError(std::string("Invalid timestamp in '") + key + "': " + value.get<std::string>());
    }
    return std::chrono::system_clock::from_time_t(timegm(&tm));
}

template <typename T>
T enum_field(const json& object, const char* key, T default_value,
             std::optional<T> (*parse)(const std::string&)) {
    const std::string text = string_field(object, key);
    if (text.empty()) return default_value;
    auto parsed = parse(text);
    if (!parsed) {
        throw CheckupFileError(std::string("Unknown value for '") + key + "': " + text);
    }
    return *parsed;
}

CheckupHeader parse_header(const json& header) {
    CheckupHeader result;
    result.client_company = string_field(header, "clientCompany");
    result.contact_person = string_field(header, "contactPerson");
    result.site = string_field(header, "site");
    result.address = string_field(header, "address");
    result.technician_name = string_field(header, "technicianName");
    result.technician_company = string_field(header, "technicianCompany");
    result.equipment_type = string_field(header, "equipmentType");
    result.serial_number = string_field(header, "serialNumber");
    result.model = string_field(header, "model");
    result.operating_hours = int_field(header, "operatingHours", 0);
    result.notes = string_field(header, "notes");
    return result;
}

} // namespace

CheckupFileLoader::CheckupFileLoader()
    : logger_("CheckupFileLoader") {
}

CheckupRecordSet CheckupFileLoader::load(const std::string& filename) const {
    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        throw CheckupFileError("Cannot open checkup file: " + filename);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    logger_.detailed("Loading checkup file " + filename);
    return parse(buffer.str(), fs::path(filename).parent_path().string());
}

CheckupRecordSet CheckupFileLoader::parse(const std::string& content, const std::string& base_directory) const {
    CheckupRecordSet records;

    try {
        const json root = json::parse(content);
        if (!root.is_object() || !root.contains("checkup")) {
            throw CheckupFileError("Checkup file has no 'checkup' object");
        }

        const json& checkup = root["checkup"];
        records.checkup.id = string_field(checkup, "id");
        records.checkup.status = string_field(checkup, "status");
        if (auto created = timestamp_field(checkup, "createdAt")) {
            records.checkup.created_at = *created;
        }
        records.checkup.completed_at = timestamp_field(checkup, "completedAt");
        if (checkup.contains("header")) {
            records.checkup.header = parse_header(checkup["header"]);
        }

        for (const auto& item : root.value("items", json::array())) {
            CheckItemRecord record;
            record.id = string_field(item, "id");
            record.module_key = string_field(item, "moduleKey");
            record.module_name = string_field(item, "moduleName");
            record.description = string_field(item, "description");
            record.status = enum_field(item, "status", CheckItemStatus::PENDING, &parse_check_item_status);
            record.criticality = enum_field(item, "criticality", CriticalityLevel::ROUTINE, &parse_criticality);
            record.notes = string_field(item, "notes");
            record.order_index = int_field(item, "orderIndex", static_cast<int>(records.items.size()));
            records.items.push_back(record);
        }

        for (const auto& photo : root.value("photos", json::array())) {
            PhotoRecord record;
            record.id = string_field(photo, "id");
            record.check_item_id = string_field(photo, "checkItemId");
            record.file_path = string_field(photo, "filePath");
            if (!base_directory.empty() && !record.file_path.empty() && fs::path(record.file_path).is_relative()) {
                record.file_path = (fs::path(base_directory) / record.file_path).string();
            }
            record.file_name = string_field(photo, "fileName");
            if (record.file_name.empty()) {
                record.file_name = fs::path(record.file_path).filename().string();
            }
            record.caption = string_field(photo, "caption");
            if (auto taken = timestamp_field(photo, "takenAt")) {
                record.taken_at = *taken;
            }
            record.order_index = int_field(photo, "orderIndex", static_cast<int>(records.photos.size()));
            records.photos.push_back(record);
        }

        for (const auto& part : root.value("spareParts", json::array())) {
            SparePart spare;
            spare.part_number = string_field(part, "partNumber");
            spare.description = string_field(part, "description");
            spare.quantity = int_field(part, "quantity", 1);
            spare.urgency = enum_field(part, "urgency", SparePartUrgency::ROUTINE, &parse_urgency);
            spare.notes = string_field(part, "notes");
            if (part.contains("estimatedCost") && part["estimatedCost"].is_number()) {
                spare.estimated_cost = part["estimatedCost"].get<double>();
            }
            records.spare_parts.push_back(spare);
        }

    } catch (const json::exception& e) {
        throw CheckupFileError(std::string("Malformed checkup file: ") + e.what());
    }

    logger_.debug("Checkup " + records.checkup.id + ": " + std::to_string(records.items.size()) + " items, " +
                  std::to_string(records.photos.size()) + " photos, " +
                  std::to_string(records.spare_parts.size()) + " spare parts");
    return records;
}

} // namespace qreport
