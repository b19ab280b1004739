/**
 * @file qreport.cpp
 * @brief Implementation of the public ReportExporter API.
 */

#include "../../include/qreport.hpp"

#include "../../include/event_bus.hpp"
#include "../../include/events.hpp"
#include "../../include/export_orchestrator.hpp"
#include "../../include/log_sink.hpp"
#include "../../include/logger.hpp"

#include <atomic>
#include <mutex>

namespace qreport {

namespace {

// bridge sink to redirect static logs to the instance observer
class BridgeLogSink final : public ILogSink {
    ReportObserver* observer_;
public:
    explicit BridgeLogSink(ReportObserver* obs) : observer_(obs) {}

    void log(const LogLevel level, const std::string_view message, const std::string_view tag) override {
        if (observer_) {
            observer_->on_log(static_cast<int>(level), std::string(message), std::string(tag));
        }
    }
};

// removes the bridge sink when the export returns, normally or not
class ScopedSink {
public:
    explicit ScopedSink(const ILogSink* sink) : sink_(sink) {}
    ~ScopedSink() {
        if (sink_) Logger::remove_sink(sink_);
    }
    ScopedSink(const ScopedSink&) = delete;
    ScopedSink& operator=(const ScopedSink&) = delete;

private:
    const ILogSink* sink_;
};

} // namespace

struct ReportExporter::Impl {
    unsigned numThreads = 0;
    std::function<TimePoint()> clock;
    ReportObserver* observer = nullptr;

    std::mutex runMtx;
    std::atomic<ExportOrchestrator*> currentOrchestrator = nullptr;

    void setupEventBridging(EventBus& bus) const {
        if (!observer) return;
        ReportObserver* obs = observer;

        bus.subscribe<ExportStageEvent>([obs](const ExportStageEvent& e) {
            obs->on_stage(e.stage);
        });

        bus.subscribe<PhotoProcessedEvent>([obs](const PhotoProcessedEvent& e) {
            obs->on_photo(e.source, e.name, e.success, e.size);
        });

        bus.subscribe<ExportWarningEvent>([obs](const ExportWarningEvent& e) {
            obs->on_warning(e.warning);
        });

        bus.subscribe<FileWrittenEvent>([obs](const FileWrittenEvent& e) {
            obs->on_file(e.path, e.size, e.format);
        });

        bus.subscribe<ExportFailedEvent>([obs](const ExportFailedEvent& e) {
            obs->on_failed(e.error);
        });
    }
};

ReportExporter::ReportExporter() : impl_(std::make_unique<Impl>()) {}

ReportExporter::~ReportExporter() {
    if (impl_) stop();
}

ReportExporter::ReportExporter(ReportExporter&&) noexcept = default;
ReportExporter& ReportExporter::operator=(ReportExporter&&) noexcept = default;

ReportExporter& ReportExporter::threads(const unsigned val) {
    impl_->numThreads = val;
    return *this;
}

ReportExporter& ReportExporter::clock(std::function<TimePoint()> clock) {
    impl_->clock = std::move(clock);
    return *this;
}

void ReportExporter::set_observer(ReportObserver* observer) {
    impl_->observer = observer;
}

Result<ExportManifest> ReportExporter::export_checkup(const CheckUpAggregate& aggregate,
                                                      const std::filesystem::path& target_dir,
                                                      const ExportOptions& options) {
    // one export at a time per instance
    std::lock_guard lock(impl_->runMtx);

    EventBus bus;
    impl_->setupEventBridging(bus);

    const ILogSink* bridge = nullptr;
    if (impl_->observer) {
        bridge = Logger::add_sink(std::make_unique<BridgeLogSink>(impl_->observer));
    }
    const ScopedSink scoped(bridge);

    ExportOptions effective = options;
    if (impl_->numThreads > 0) {
        effective.worker_threads = impl_->numThreads;
    }

    ExportOrchestrator orchestrator(bus, StorageBudgeter{}, impl_->clock);
    impl_->currentOrchestrator.store(&orchestrator);
    auto result = orchestrator.run(aggregate, target_dir, effective);
    impl_->currentOrchestrator.store(nullptr);
    return result;
}

void ReportExporter::stop() {
    auto* orchestrator = impl_->currentOrchestrator.load();
    if (orchestrator) {
        orchestrator->request_stop();
    }
}

} // namespace qreport
