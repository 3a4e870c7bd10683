/**
 * @file ExportNaming.cpp
 * @brief Implementation of export naming rules
 */

#include "ExportNaming.hpp"
#include "TextFormatter.hpp"
#include <cctype>

namespace qreport {

std::string ExportNaming::sanitize_client_name(const std::string& client_name) {
    std::string out;
    for (char ch : client_name) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (c < 0x80 && std::isalnum(c)) {
            out += ch;
            if (out.size() == MAX_CLIENT_LENGTH) break;
        }
    }
    return out.empty() ? "Client" : out;
}

std::string ExportNaming::base_name(const CheckupSnapshot& snapshot) {
    return "Checkup_" + sanitize_client_name(snapshot.header.client_company) + "_" +
           snapshot.checkup_id.substr(0, CHECKUP_ID_PREFIX);
}

std::string ExportNaming::directory_name(const CheckupSnapshot& snapshot, bool timestamped, Timestamp now) {
    if (!timestamped) {
        return base_name(snapshot);
    }
    return TextFormatter::format_timestamp(now, "%Y%m%d_%H%M%S") + "_" + base_name(snapshot);
}

std::string ExportNaming::file_name(const CheckupSnapshot& snapshot, ExportFormat format) {
    return base_name(snapshot) + file_extension(format);
}

} // namespace qreport
