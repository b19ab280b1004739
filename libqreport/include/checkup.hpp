/**
 * @file checkup.hpp
 * @brief Read-only check-up aggregate consumed by the export engine.
 *
 * The aggregate is assembled by the caller; nothing in the export engine
 * mutates it.
 */

#ifndef QREPORT_CHECKUP_HPP
#define QREPORT_CHECKUP_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace qreport {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

enum class CheckItemStatus { Ok, Nok, Critical, Pending, Na };

enum class Criticality { Critical, Important, Routine, Na };

[[nodiscard]] constexpr std::string_view to_string(const CheckItemStatus status) noexcept {
    switch (status) {
        case CheckItemStatus::Ok:       return "OK";
        case CheckItemStatus::Nok:      return "NOK";
        case CheckItemStatus::Critical: return "CRITICAL";
        case CheckItemStatus::Pending:  return "PENDING";
        case CheckItemStatus::Na:       return "N/A";
    }
    return "";
}

[[nodiscard]] constexpr std::string_view to_string(const Criticality criticality) noexcept {
    switch (criticality) {
        case Criticality::Critical:  return "CRITICAL";
        case Criticality::Important: return "IMPORTANT";
        case Criticality::Routine:   return "ROUTINE";
        case Criticality::Na:        return "N/A";
    }
    return "";
}

struct ClientInfo {
    std::string company_name;
    std::string contact_person;
    std::string site;
    std::string address;
};

struct TechnicianInfo {
    std::string name;
    std::string company;
    std::string certification;
    std::string phone;
    std::string email;
};

struct IslandInfo {
    std::string island_type;
    std::string serial_number;
    std::string model;
    std::optional<uint32_t> operating_hours;
    std::optional<uint64_t> cycle_count;
};

struct CheckUpHeader {
    ClientInfo client;
    TechnicianInfo technician;
    IslandInfo island;
    std::optional<TimePoint> scheduled_at;
    std::optional<TimePoint> started_at;
    std::optional<TimePoint> completed_at;
    std::string status;
    std::string notes;
};

/**
 * @brief Reference to a photo file attached to a check item.
 */
struct PhotoRef {
    std::filesystem::path path;
    std::string caption;
    std::optional<TimePoint> taken_at;
    uint32_t width = 0;  ///< original width, 0 when unknown
    uint32_t height = 0; ///< original height, 0 when unknown
    uint64_t file_size = 0;
};

struct CheckItem {
    std::string id;
    std::string code;
    std::string title;
    CheckItemStatus status = CheckItemStatus::Pending;
    Criticality criticality = Criticality::Routine;
    std::string note;
    std::vector<PhotoRef> photos;
};

struct Section {
    std::string title;
    std::vector<CheckItem> items;
};

struct SparePart {
    std::string part_number;
    std::string description;
    uint32_t quantity = 1;
    Criticality urgency = Criticality::Routine;
    std::optional<double> estimated_cost;
    std::string notes;
};

struct CheckUpAggregate {
    std::string id;
    CheckUpHeader header;
    std::vector<Section> sections;
    std::vector<SparePart> spare_parts;
};

} // namespace qreport

#endif // QREPORT_CHECKUP_HPP
