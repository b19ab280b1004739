/**
 * @file test_checkup_json.cpp
 * @brief Integration tests for the command line check-up input
 */

#include <doctest/doctest.h>
#include "../../qreport_cli/src/io/checkup_json.hpp"
#include "../support/test_support.hpp"
#include <stdexcept>

using namespace qreport;

namespace {

constexpr const char* kCheckup = R"({
  "id": "CU-7",
  "header": {
    "client": { "company_name": "Acme S.p.A.", "site": "Nord" },
    "technician": { "name": "Luca Bianchi" },
    "island": { "island_type": "Saldatura", "serial_number": "SN-1", "operating_hours": 1200 },
    "started_at": "2025-03-14T10:30",
    "status": "COMPLETATO"
  },
  "sections": [
    { "title": "Meccanica",
      "items": [
        { "id": "M1", "code": "MEC-01", "title": "Cinghia", "status": "nok", "criticality": "important",
          "note": "usura",
          "photos": [ { "path": "foto/a.jpg", "caption": "lato", "taken_at": "2025-03-14T10:30:00" },
                      { "path": "/abs/b.jpg" } ] },
        { "id": "M2", "title": "Cuscinetti", "status": "N/A" }
      ] }
  ],
  "spare_parts": [
    { "part_number": "P-1", "description": "Cinghia", "quantity": 2, "urgency": "CRITICAL",
      "estimated_cost": 10.5 }
  ]
})";

} // namespace

TEST_CASE("parse_checkup reads the aggregate") {
    const auto c = parse_checkup(kCheckup, "/data/checkups");

    CHECK(c.id == "CU-7");
    CHECK(c.header.client.company_name == "Acme S.p.A.");
    CHECK(c.header.island.operating_hours == 1200u);
    CHECK_FALSE(c.header.island.cycle_count.has_value());
    REQUIRE(c.header.started_at.has_value());
    CHECK(*c.header.started_at == test::fixed_time());
    CHECK_FALSE(c.header.completed_at.has_value());

    REQUIRE(c.sections.size() == 1);
    const auto& items = c.sections[0].items;
    REQUIRE(items.size() == 2);
    CHECK(items[0].status == CheckItemStatus::Nok);
    CHECK(items[0].criticality == Criticality::Important);
    CHECK(items[1].status == CheckItemStatus::Na);
    CHECK(items[1].criticality == Criticality::Routine);

    REQUIRE(items[0].photos.size() == 2);
    CHECK(items[0].photos[0].path == std::filesystem::path("/data/checkups/foto/a.jpg"));
    CHECK(items[0].photos[1].path == std::filesystem::path("/abs/b.jpg"));
    CHECK(items[0].photos[0].taken_at == test::fixed_time());
    CHECK(items[0].photos[1].caption.empty());

    REQUIRE(c.spare_parts.size() == 1);
    CHECK(c.spare_parts[0].quantity == 2);
    CHECK(c.spare_parts[0].urgency == Criticality::Critical);
    REQUIRE(c.spare_parts[0].estimated_cost.has_value());
    CHECK(*c.spare_parts[0].estimated_cost == doctest::Approx(10.5));
}

TEST_CASE("parse_checkup rejects bad input") {
    CHECK_THROWS_AS(parse_checkup("{ not json", "."), std::runtime_error);
    CHECK_THROWS_AS(parse_checkup(R"({"sections":[{"items":[{"status":"BROKEN"}]}]})", "."), std::runtime_error);
    CHECK_THROWS_AS(parse_checkup(R"({"header":{"started_at":"yesterday"}})", "."), std::runtime_error);
}

TEST_CASE("load_checkup resolves photos next to the file") {
    const test::TempDir dir("json_load");
    const auto path = test::write_bytes(dir.path(), "checkup.json", kCheckup);
    const auto c = load_checkup(path);
    CHECK(c.sections[0].items[0].photos[0].path == dir / "foto/a.jpg");

    CHECK_THROWS_AS(load_checkup(dir / "missing.json"), std::runtime_error);
}
