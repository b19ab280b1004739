/**
 * @file test_report_exporter.cpp
 * @brief Integration tests for the public ReportExporter API
 */

#include <doctest/doctest.h>
#include "../../libqreport/include/logger.hpp"
#include "../../libqreport/include/naming_resolver.hpp"
#include "../../libqreport/include/qreport.hpp"
#include "../support/test_support.hpp"
#include <atomic>
#include <mutex>
#include <vector>

using namespace qreport;
namespace fs = std::filesystem;

namespace {

class RecordingObserver final : public ReportObserver {
public:
    void on_stage(const ExportStage stage) override { stages.push_back(stage); }

    void on_photo(const fs::path&, const std::string& name, const bool success, uint64_t) override {
        std::lock_guard lock(mtx);
        photos.push_back(name);
        if (!success) ++photo_failures;
    }

    void on_warning(const ExportWarning& warning) override { warnings.push_back(warning); }

    void on_file(const fs::path& path, uint64_t, const ExportFormat format) override {
        files.emplace_back(path, format);
    }

    void on_failed(const ExportError& error) override { failures.push_back(error); }

    void on_log(int, const std::string&, const std::string& tag) override {
        std::lock_guard lock(mtx);
        log_tags.push_back(tag);
    }

    std::mutex mtx;
    std::vector<ExportStage> stages;
    std::vector<std::string> photos;
    int photo_failures = 0;
    std::vector<ExportWarning> warnings;
    std::vector<std::pair<fs::path, ExportFormat>> files;
    std::vector<ExportError> failures;
    std::vector<std::string> log_tags;
};

} // namespace

TEST_CASE("export_checkup reports progress to the observer") {
    const test::TempDir dir("facade_observer");
    const auto checkup = test::sample_checkup(dir.path());

    ReportExporter exporter;
    RecordingObserver observer;
    exporter.threads(3).clock([] { return test::fixed_time(); });
    exporter.set_observer(&observer);

    const auto result = exporter.export_checkup(checkup, dir / "out");
    REQUIRE(result.ok());

    CHECK(observer.stages.front() == ExportStage::Validating);
    CHECK(observer.stages.back() == ExportStage::Done);
    CHECK(observer.photos.size() == 2);
    CHECK(observer.photo_failures == 0);
    CHECK(observer.files.size() == 4);
    CHECK(observer.failures.empty());
    CHECK(observer.warnings.empty());
    CHECK_FALSE(observer.log_tags.empty());

    CHECK(fs::exists(dir / "out" / NamingResolver::document_file_name(checkup, test::fixed_time())));
    CHECK(fs::exists(dir / "out" / "Checkup_Summary_20250314_1030.txt"));
}

TEST_CASE("observer sees warnings and failures") {
    const test::TempDir dir("facade_failures");
    auto checkup = test::sample_checkup(dir.path());
    checkup.sections[1].items[0].photos[0].path = dir / "lost.jpg";

    ReportExporter exporter;
    RecordingObserver observer;
    exporter.set_observer(&observer);

    SUBCASE("missing photo") {
        const auto result = exporter.export_checkup(checkup, dir / "out");
        REQUIRE(result.ok());
        CHECK(observer.warnings.size() == 1);
        CHECK(observer.photo_failures == 1);
        CHECK(result.value().warnings().size() == 1);
    }

    SUBCASE("invalid options") {
        ExportOptions options;
        options.photo_policy.max_width = 10;
        const auto result = exporter.export_checkup(checkup, dir / "out", options);
        REQUIRE_FALSE(result.ok());
        REQUIRE(observer.failures.size() == 1);
        CHECK(observer.failures[0].code == ExportErrorCode::InvalidOptions);
        CHECK(observer.stages.back() == ExportStage::Failed);
    }
}

TEST_CASE("the log bridge is removed after the run") {
    const test::TempDir dir("facade_bridge");
    const auto checkup = test::sample_checkup(dir.path());

    ReportExporter exporter;
    RecordingObserver observer;
    exporter.set_observer(&observer);
    REQUIRE(exporter.export_checkup(checkup, dir / "out", ExportOptions::text_only()).ok());

    const size_t seen = observer.log_tags.size();
    Logger::log(LogLevel::Info, "after the run", "test");
    CHECK(observer.log_tags.size() == seen);
}

TEST_CASE("exporter without observer") {
    const test::TempDir dir("facade_plain");
    const auto checkup = test::sample_checkup(dir.path());

    ReportExporter exporter;
    exporter.stop(); // no run in progress, nothing to stop
    const auto result = exporter.export_checkup(checkup, dir / "out", ExportOptions::document_only());
    REQUIRE(result.ok());
    CHECK(result.value().files().size() == 1);
}
