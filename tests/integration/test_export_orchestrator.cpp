/**
 * @file test_export_orchestrator.cpp
 * @brief Integration tests for complete export runs
 */

#include <doctest/doctest.h>
#include "../../libqreport/include/document_assembler.hpp"
#include "../../libqreport/include/events.hpp"
#include "../../libqreport/include/export_orchestrator.hpp"
#include "../../libqreport/include/naming_resolver.hpp"
#include "../../libqreport/include/photo_folder_exporter.hpp"
#include "../support/test_support.hpp"
#include <set>

using namespace qreport;
namespace fs = std::filesystem;

namespace {

constexpr uint64_t kPlentyOfSpace = uint64_t{1} << 40;

StorageBudgeter free_space(const uint64_t bytes) {
    return StorageBudgeter([bytes](const fs::path&) -> std::optional<uint64_t> { return bytes; });
}

ExportOrchestrator::ClockFn fixed_clock() {
    return [] { return test::fixed_time(); };
}

std::set<std::string> listed_photos(const std::string& report) {
    std::set<std::string> names;
    for (const auto& l : test::split_lines(report)) {
        if (l.starts_with("      - ")) names.insert(l.substr(8));
    }
    return names;
}

std::set<std::string> folder_contents(const fs::path& folder) {
    std::set<std::string> names;
    if (!fs::exists(folder)) return names;
    for (const auto& entry : fs::directory_iterator(folder)) {
        names.insert(entry.path().filename().string());
    }
    return names;
}

size_t count_files(const fs::path& dir) {
    size_t n = 0;
    if (!fs::exists(dir)) return 0;
    for (const auto& entry : fs::recursive_directory_iterator(dir)) {
        if (entry.is_regular_file()) ++n;
    }
    return n;
}

} // namespace

TEST_CASE("text report and photo folder agree on photo names") {
    const test::TempDir dir("run_text_folder");
    const auto checkup = test::sample_checkup(dir.path());
    const fs::path target = dir / "out";

    ExportOptions options;
    options.formats = {ExportFormat::Text, ExportFormat::PhotoFolder};

    EventBus bus;
    ExportOrchestrator orchestrator(bus, free_space(kPlentyOfSpace), fixed_clock());
    const auto result = orchestrator.run(checkup, target, options);
    REQUIRE(result.ok());
    const ExportManifest& m = result.value();

    CHECK(orchestrator.stage() == ExportStage::Done);
    CHECK(m.files_of(ExportFormat::Document).empty());
    REQUIRE(m.files_of(ExportFormat::Text).size() == 1);
    CHECK(m.files_of(ExportFormat::PhotoFolder).size() == 2);
    CHECK(m.warnings().empty());

    const fs::path text_path = target / NamingResolver::text_file_name(test::fixed_time());
    CHECK(m.files_of(ExportFormat::Text)[0].path == text_path);
    const std::string report = test::read_text(text_path);

    const auto listed = listed_photos(report);
    CHECK(listed.size() == 2);
    for (const auto& name : listed) {
        CHECK(name.starts_with("02_meccanica_"));
    }
    CHECK(listed == folder_contents(target / "FOTO"));
    CHECK(report.find("   Foto: Nessuna foto") != std::string::npos);
    CHECK(report.find("   Foto: 2 foto acquisite") != std::string::npos);
}

TEST_CASE("complete export publishes progress") {
    const test::TempDir dir("run_complete");
    const auto checkup = test::sample_checkup(dir.path());
    const fs::path target = dir / "out";

    EventBus bus;
    std::vector<ExportStage> stages;
    std::vector<fs::path> written;
    std::atomic<int> photos{0};
    bus.subscribe<ExportStageEvent>([&stages](const ExportStageEvent& e) { stages.push_back(e.stage); });
    bus.subscribe<FileWrittenEvent>([&written](const FileWrittenEvent& e) { written.push_back(e.path); });
    bus.subscribe<PhotoProcessedEvent>([&photos](const PhotoProcessedEvent& e) {
        if (e.success) ++photos;
    });

    ExportOrchestrator orchestrator(bus, free_space(kPlentyOfSpace), fixed_clock());
    const auto result = orchestrator.run(checkup, target, ExportOptions{});
    REQUIRE(result.ok());
    const ExportManifest& m = result.value();

    CHECK(stages == std::vector<ExportStage>{ExportStage::Validating, ExportStage::Budgeting,
                                             ExportStage::Processing, ExportStage::Writing, ExportStage::Done});
    CHECK(m.files().size() == 4);
    CHECK(written.size() == 4);
    CHECK(photos.load() == 2);
    CHECK(m.output_directory() == target);

    const fs::path docx = target / NamingResolver::document_file_name(checkup, test::fixed_time());
    REQUIRE(fs::exists(docx));
    CHECK(m.files_of(ExportFormat::Document)[0].size == fs::file_size(docx));
    const auto parts = test::read_zip(docx);
    CHECK(test::count_occurrences(parts.at("word/document.xml"), "<w:drawing>") == 2);

    // the document captions use the same names as the folder
    for (const auto& name : folder_contents(target / "FOTO")) {
        CHECK(parts.at("word/document.xml").find(name) != std::string::npos);
    }
    CHECK(m.total_size() > 0);
}

TEST_CASE("a missing photo degrades to one warning") {
    const test::TempDir dir("run_missing_photo");
    auto checkup = test::sample_checkup(dir.path());
    checkup.sections[1].items[0].photos[1].path = dir / "does_not_exist.jpg";
    const fs::path target = dir / "out";

    EventBus bus;
    int warning_events = 0;
    bus.subscribe<ExportWarningEvent>([&warning_events](const ExportWarningEvent&) { ++warning_events; });

    ExportOrchestrator orchestrator(bus, free_space(kPlentyOfSpace), fixed_clock());
    const auto result = orchestrator.run(checkup, target, ExportOptions{});
    REQUIRE(result.ok());
    const ExportManifest& m = result.value();

    REQUIRE(m.warnings().size() == 1);
    CHECK(m.warnings()[0].code == ExportErrorCode::PhotoNotFound);
    CHECK(m.warnings()[0].resource == dir / "does_not_exist.jpg");
    CHECK(warning_events == 1);

    const auto parts = test::read_zip(target / NamingResolver::document_file_name(checkup, test::fixed_time()));
    const std::string& doc = parts.at("word/document.xml");
    CHECK(test::count_occurrences(doc, DocumentAssembler::kPhotoPlaceholder) == 1);
    CHECK(test::count_occurrences(doc, "<w:drawing>") == 1);

    CHECK(folder_contents(target / "FOTO").size() == 1);
    CHECK(m.photos().size() == 1);
}

TEST_CASE("no format selected is a no-op") {
    const test::TempDir dir("run_no_format");
    const auto checkup = test::sample_checkup(dir.path());
    const fs::path target = dir / "out";

    ExportOptions options;
    options.formats.clear();

    EventBus bus;
    ExportOrchestrator orchestrator(bus, free_space(0), fixed_clock());
    const auto result = orchestrator.run(checkup, target, options);
    REQUIRE(result.ok());
    CHECK(result.value().empty());
    CHECK(result.value().files().empty());
    CHECK_FALSE(fs::exists(target));
    CHECK(orchestrator.stage() == ExportStage::Done);
}

TEST_CASE("insufficient storage stops the run before writing") {
    const test::TempDir dir("run_no_space");
    const auto checkup = test::sample_checkup(dir.path());
    const fs::path target = dir / "out";

    EventBus bus;
    std::optional<ExportError> failure;
    bus.subscribe<ExportFailedEvent>([&failure](const ExportFailedEvent& e) { failure = e.error; });

    ExportOrchestrator orchestrator(bus, free_space(1000), fixed_clock());
    const auto result = orchestrator.run(checkup, target, ExportOptions{});
    REQUIRE_FALSE(result.ok());
    CHECK(result.error().code == ExportErrorCode::InsufficientStorage);
    CHECK(result.error().stage == ExportStage::Budgeting);
    CHECK(orchestrator.stage() == ExportStage::Failed);
    REQUIRE(failure.has_value());
    CHECK(failure->code == ExportErrorCode::InsufficientStorage);
    CHECK_FALSE(fs::exists(target));
}

TEST_CASE("validation failures") {
    const test::TempDir dir("run_validation");
    const auto checkup = test::sample_checkup(dir.path());
    EventBus bus;
    ExportOrchestrator orchestrator(bus, free_space(kPlentyOfSpace), fixed_clock());

    SUBCASE("invalid options") {
        ExportOptions options;
        options.photo_policy.quality = 0;
        options.photos_per_row = 9;
        const auto result = orchestrator.run(checkup, dir / "out", options);
        REQUIRE_FALSE(result.ok());
        CHECK(result.error().code == ExportErrorCode::InvalidOptions);
        CHECK(result.error().stage == ExportStage::Validating);
        CHECK(result.error().message.find("; ") != std::string::npos);
    }

    SUBCASE("missing template") {
        ExportOptions options;
        options.custom_template = dir / "missing_styles.xml";
        const auto result = orchestrator.run(checkup, dir / "out", options);
        REQUIRE_FALSE(result.ok());
        CHECK(result.error().code == ExportErrorCode::TemplateNotFound);
        CHECK(result.error().stage == ExportStage::Validating);
    }

    SUBCASE("template ignored without a document") {
        ExportOptions options = ExportOptions::text_only();
        options.custom_template = dir / "missing_styles.xml";
        CHECK(orchestrator.run(checkup, dir / "out", options).ok());
    }

    SUBCASE("target is a file") {
        const auto file = test::write_bytes(dir.path(), "occupied", "x");
        const auto result = orchestrator.run(checkup, file, ExportOptions{});
        REQUIRE_FALSE(result.ok());
        CHECK(result.error().code == ExportErrorCode::PermissionDenied);
    }

    SUBCASE("empty target") {
        const auto result = orchestrator.run(checkup, fs::path{}, ExportOptions{});
        REQUIRE_FALSE(result.ok());
        CHECK(result.error().code == ExportErrorCode::InvalidOptions);
    }

    CHECK_FALSE(fs::exists(dir / "out" / "FOTO"));
}

TEST_CASE("cancellation rolls back the run") {
    const test::TempDir dir("run_cancel");
    const auto checkup = test::sample_checkup(dir.path());
    const fs::path target = dir / "nested" / "out";

    SUBCASE("before the run starts") {
        EventBus bus;
        ExportOrchestrator orchestrator(bus, free_space(kPlentyOfSpace), fixed_clock());
        orchestrator.request_stop();
        CHECK(orchestrator.is_stopped());
        const auto result = orchestrator.run(checkup, target, ExportOptions{});
        REQUIRE_FALSE(result.ok());
        CHECK(result.error().code == ExportErrorCode::Cancelled);
    }

    SUBCASE("after the first file is written") {
        EventBus bus;
        ExportOrchestrator orchestrator(bus, free_space(kPlentyOfSpace), fixed_clock());
        bus.subscribe<FileWrittenEvent>([&orchestrator](const FileWrittenEvent&) { orchestrator.request_stop(); });
        const auto result = orchestrator.run(checkup, target, ExportOptions{});
        REQUIRE_FALSE(result.ok());
        CHECK(result.error().code == ExportErrorCode::Cancelled);
        CHECK(orchestrator.stage() == ExportStage::Failed);
    }

    CHECK_FALSE(fs::exists(dir / "nested"));
    CHECK(count_files(dir.path()) == 2);
}

TEST_CASE("re-exporting into the same directory") {
    const test::TempDir dir("run_reexport");
    const auto checkup = test::sample_checkup(dir.path());
    const fs::path target = dir / "out";
    const fs::path document = target / NamingResolver::document_file_name(checkup, test::fixed_time());
    const fs::path text = target / NamingResolver::text_file_name(test::fixed_time());
    NamingResolver naming(NamingStrategy::Structured, test::fixed_time());
    const fs::path photo = target / std::string(PhotoFolderExporter::kFolderName) / naming.name_for(checkup, 1, 0, 0);
    fs::create_directories(photo.parent_path());
    test::write_bytes(target, document.filename().string(), "PREVIOUS DOCUMENT");
    test::write_bytes(target, text.filename().string(), "PREVIOUS TEXT");
    test::write_bytes(photo.parent_path(), photo.filename().string(), "PREVIOUS PHOTO");

    EventBus bus;
    ExportOrchestrator orchestrator(bus, free_space(kPlentyOfSpace), fixed_clock());

    SUBCASE("cancelled run restores the earlier files") {
        size_t written = 0;
        bus.subscribe<FileWrittenEvent>([&](const FileWrittenEvent&) {
            if (++written == 3) orchestrator.request_stop();
        });
        const auto result = orchestrator.run(checkup, target, ExportOptions{});
        REQUIRE_FALSE(result.ok());
        CHECK(result.error().code == ExportErrorCode::Cancelled);

        CHECK(test::read_text(document) == "PREVIOUS DOCUMENT");
        CHECK(test::read_text(text) == "PREVIOUS TEXT");
        CHECK(test::read_text(photo) == "PREVIOUS PHOTO");
        CHECK(count_files(target) == 3);
    }

    SUBCASE("completed run replaces them without leftovers") {
        const auto result = orchestrator.run(checkup, target, ExportOptions{});
        REQUIRE(result.ok());
        CHECK(test::read_text(text) != "PREVIOUS TEXT");
        CHECK(test::read_text(photo) != "PREVIOUS PHOTO");
        CHECK(count_files(target) == 4);
    }
}

TEST_CASE("optional outputs") {
    const test::TempDir dir("run_options");
    const auto checkup = test::sample_checkup(dir.path());
    EventBus bus;
    ExportOrchestrator orchestrator(bus, free_space(kPlentyOfSpace), fixed_clock());

    SUBCASE("timestamped directory") {
        ExportOptions options = ExportOptions::text_only();
        options.create_timestamped_directory = true;
        const auto result = orchestrator.run(checkup, dir / "out", options);
        REQUIRE(result.ok());
        const fs::path expected = dir / "out" / "Export_Checkup_20250314_1030";
        CHECK(result.value().output_directory() == expected);
        CHECK(fs::exists(expected / "Checkup_Summary_20250314_1030.txt"));
    }

    SUBCASE("photo index") {
        ExportOptions options = ExportOptions::photo_archive();
        const auto result = orchestrator.run(checkup, dir / "out", options);
        REQUIRE(result.ok());
        const fs::path index = dir / "out" / "FOTO" / std::string(PhotoFolderExporter::kIndexFileName);
        CHECK(fs::exists(index));
        CHECK(result.value().files_of(ExportFormat::PhotoFolder).size() == 3);
    }

    SUBCASE("photos excluded") {
        ExportOptions options;
        options.include_photos = false;
        const auto result = orchestrator.run(checkup, dir / "out", options);
        REQUIRE(result.ok());
        CHECK(result.value().files().size() == 2);
        CHECK(result.value().photos().empty());
        CHECK_FALSE(fs::exists(dir / "out" / "FOTO"));

        const auto parts = test::read_zip(dir / "out" / NamingResolver::document_file_name(checkup, test::fixed_time()));
        CHECK(parts.count("word/media/image1.jpg") == 0);
        const std::string report = test::read_text(dir / "out" / NamingResolver::text_file_name(test::fixed_time()));
        CHECK(report.find("Foto:") == std::string::npos);
    }

    SUBCASE("sequential naming is shared by every output") {
        ExportOptions options;
        options.naming_strategy = NamingStrategy::Sequential;
        const auto result = orchestrator.run(checkup, dir / "out", options);
        REQUIRE(result.ok());
        CHECK(folder_contents(dir / "out" / "FOTO") == std::set<std::string>{"foto_001.jpg", "foto_002.jpg"});
        const std::string report = test::read_text(dir / "out" / NamingResolver::text_file_name(test::fixed_time()));
        CHECK(listed_photos(report) == folder_contents(dir / "out" / "FOTO"));
    }
}
