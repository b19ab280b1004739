#include "checkup_json.hpp"
#include "../../../libqreport/include/file_utils.hpp"
#include "../../../libqreport/include/logger.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>

using nlohmann::json;
using namespace qreport;

namespace {

std::string upper(std::string s) {
    std::ranges::transform(s, s.begin(), [](const unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::string str(const json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) return {};
    return j.at(key).get<std::string>();
}

std::optional<TimePoint> time_point(const json& j, const char* key) {
    const std::string text = str(j, key);
    if (text.empty()) return std::nullopt;

    std::tm tm{};
    std::istringstream in(text);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (in.fail()) {
        tm = {};
        in.clear();
        in.str(text);
        in >> std::get_time(&tm, "%Y-%m-%dT%H:%M");
    }
    if (in.fail()) {
        throw std::runtime_error("invalid timestamp in '" + std::string(key) + "': " + text);
    }
    tm.tm_isdst = -1;
    const std::time_t t = std::mktime(&tm);
    if (t == static_cast<std::time_t>(-1)) {
        throw std::runtime_error("timestamp out of range: " + text);
    }
    return Clock::from_time_t(t);
}

CheckItemStatus status_of(const json& j) {
    const std::string s = upper(str(j, "status"));
    if (s.empty() || s == "PENDING") return CheckItemStatus::Pending;
    if (s == "OK") return CheckItemStatus::Ok;
    if (s == "NOK") return CheckItemStatus::Nok;
    if (s == "CRITICAL") return CheckItemStatus::Critical;
    if (s == "NA" || s == "N/A") return CheckItemStatus::Na;
    throw std::runtime_error("unknown item status: " + s);
}

Criticality criticality_of(const json& j, const char* key) {
    const std::string s = upper(str(j, key));
    if (s.empty() || s == "ROUTINE") return Criticality::Routine;
    if (s == "CRITICAL") return Criticality::Critical;
    if (s == "IMPORTANT") return Criticality::Important;
    if (s == "NA" || s == "N/A") return Criticality::Na;
    throw std::runtime_error("unknown criticality: " + s);
}

PhotoRef photo_of(const json& j, const std::filesystem::path& base_dir) {
    PhotoRef photo;
    std::filesystem::path path = str(j, "path");
    photo.path = path.is_relative() ? base_dir / path : path;
    photo.caption = str(j, "caption");
    photo.taken_at = time_point(j, "taken_at");
    photo.width = j.value("width", 0u);
    photo.height = j.value("height", 0u);
    photo.file_size = j.value("file_size", uint64_t{0});
    return photo;
}

CheckItem item_of(const json& j, const std::filesystem::path& base_dir) {
    CheckItem item;
    item.id = str(j, "id");
    item.code = str(j, "code");
    item.title = str(j, "title");
    item.status = status_of(j);
    item.criticality = criticality_of(j, "criticality");
    item.note = str(j, "note");
    for (const auto& p : j.value("photos", json::array())) {
        item.photos.push_back(photo_of(p, base_dir));
    }
    return item;
}

CheckUpHeader header_of(const json& j) {
    CheckUpHeader h;
    const json client = j.value("client", json::object());
    h.client.company_name = str(client, "company_name");
    h.client.contact_person = str(client, "contact_person");
    h.client.site = str(client, "site");
    h.client.address = str(client, "address");

    const json technician = j.value("technician", json::object());
    h.technician.name = str(technician, "name");
    h.technician.company = str(technician, "company");
    h.technician.certification = str(technician, "certification");
    h.technician.phone = str(technician, "phone");
    h.technician.email = str(technician, "email");

    const json island = j.value("island", json::object());
    h.island.island_type = str(island, "island_type");
    h.island.serial_number = str(island, "serial_number");
    h.island.model = str(island, "model");
    if (island.contains("operating_hours") && !island.at("operating_hours").is_null()) {
        h.island.operating_hours = island.at("operating_hours").get<uint32_t>();
    }
    if (island.contains("cycle_count") && !island.at("cycle_count").is_null()) {
        h.island.cycle_count = island.at("cycle_count").get<uint64_t>();
    }

    h.scheduled_at = time_point(j, "scheduled_at");
    h.started_at = time_point(j, "started_at");
    h.completed_at = time_point(j, "completed_at");
    h.status = str(j, "status");
    h.notes = str(j, "notes");
    return h;
}

} // namespace

CheckUpAggregate parse_checkup(const std::string_view text, const std::filesystem::path& base_dir) {
    try {
        const json doc = json::parse(text);
        CheckUpAggregate aggregate;
        aggregate.id = str(doc, "id");
        aggregate.header = header_of(doc.value("header", json::object()));

        for (const auto& s : doc.value("sections", json::array())) {
            Section section;
            section.title = str(s, "title");
            for (const auto& i : s.value("items", json::array())) {
                section.items.push_back(item_of(i, base_dir));
            }
            aggregate.sections.push_back(std::move(section));
        }

        for (const auto& p : doc.value("spare_parts", json::array())) {
            SparePart part;
            part.part_number = str(p, "part_number");
            part.description = str(p, "description");
            part.quantity = p.value("quantity", 1u);
            part.urgency = criticality_of(p, "urgency");
            if (p.contains("estimated_cost") && !p.at("estimated_cost").is_null()) {
                part.estimated_cost = p.at("estimated_cost").get<double>();
            }
            part.notes = str(p, "notes");
            aggregate.spare_parts.push_back(std::move(part));
        }
        return aggregate;
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("invalid check-up JSON: ") + e.what());
    }
}

CheckUpAggregate load_checkup(const std::filesystem::path& path) {
    const auto bytes = read_file_bytes(path);
    if (!bytes) {
        throw std::runtime_error("cannot read " + path.string());
    }
    const std::string text(bytes->begin(), bytes->end());
    auto aggregate = parse_checkup(text, path.parent_path());
    Logger::log(LogLevel::Info,
                "Loaded check-up " + aggregate.id + " with " + std::to_string(aggregate.sections.size()) +
                " sections",
                "checkup_json");
    return aggregate;
}
