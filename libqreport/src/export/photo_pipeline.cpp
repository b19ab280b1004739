#include "../../include/photo_pipeline.hpp"
#include "../../include/events.hpp"
#include "../../include/logger.hpp"
#include "../../include/naming_resolver.hpp"
#include <algorithm>
#include <chrono>

namespace qreport {

namespace {

constexpr std::string_view processor_tag() {
    return "photo_pipeline";
}

Result<ProcessedPhoto> process_and_report(const PhotoProcessor& processor, const PhotoJob& job,
                                          const PhotoPolicy& policy, EventBus* bus) {
    const auto start = std::chrono::steady_clock::now();
    auto result = processor.process(job.photo.path, policy, job.photo.taken_at);
    if (bus) {
        PhotoProcessedEvent ev;
        ev.source = job.photo.path;
        ev.name = job.name;
        ev.success = result.ok();
        if (result.ok()) {
            ev.width = result.value().width;
            ev.height = result.value().height;
            ev.size = result.value().size();
        }
        ev.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        bus->publish(ev);
    }
    return result;
}

ExportError cancelled_error(const PhotoJob& job) {
    return ExportError{ExportErrorCode::Cancelled, ExportStage::Processing, job.photo.path.string(),
                       "export cancelled"};
}

} // namespace

std::vector<PhotoJob> collect_photo_jobs(const CheckUpAggregate& aggregate, NamingResolver& naming) {
    std::vector<PhotoJob> jobs;
    for (size_t s = 0; s < aggregate.sections.size(); ++s) {
        const auto& section = aggregate.sections[s];
        for (size_t i = 0; i < section.items.size(); ++i) {
            const auto& item = section.items[i];
            for (size_t p = 0; p < item.photos.size(); ++p) {
                jobs.push_back({s, i, p, item.photos[p],
                                naming.resolve(s, section.title, item, p, item.photos[p].caption)});
            }
        }
    }
    return jobs;
}

InlinePhotoProvider::InlinePhotoProvider(const PhotoProcessor& processor, PhotoPolicy policy, EventBus* bus)
    : processor_(processor), policy_(std::move(policy)), bus_(bus) {}

Result<ProcessedPhoto> InlinePhotoProvider::take(const PhotoJob& job, const std::stop_token stop) {
    if (stop.stop_requested()) {
        return cancelled_error(job);
    }
    return process_and_report(processor_, job, policy_, bus_);
}

PhotoPipeline::PhotoPipeline(const PhotoProcessor& processor, PhotoPolicy policy, std::vector<PhotoJob> jobs,
                             const unsigned workers, EventBus* bus)
    : processor_(processor),
      policy_(std::move(policy)),
      jobs_(std::move(jobs)),
      bus_(bus),
      window_(2 * static_cast<size_t>(std::clamp(workers, 1u, 4u))) {
    const unsigned threads = std::clamp(workers, 1u, 4u);
    pool_ = std::make_unique<ThreadPool>(threads, threads);
    Logger::log(LogLevel::Debug,
                "Photo pipeline: " + std::to_string(jobs_.size()) + " photos, " + std::to_string(threads) +
                " workers, window " + std::to_string(window_),
                processor_tag());
    refill();
}

PhotoPipeline::~PhotoPipeline() {
    cancel();
}

void PhotoPipeline::refill() {
    while (next_submit_ < jobs_.size() && in_flight_.size() < window_) {
        const PhotoJob* job = &jobs_[next_submit_];
        in_flight_.push_back(pool_->enqueue([this, job](const std::stop_token& st) -> Result<ProcessedPhoto> {
            if (st.stop_requested()) {
                return cancelled_error(*job);
            }
            return process_and_report(processor_, *job, policy_, bus_);
        }));
        ++next_submit_;
        peak_in_flight_ = std::max(peak_in_flight_, in_flight_.size());
    }
}

Result<ProcessedPhoto> PhotoPipeline::take(const PhotoJob& job, const std::stop_token stop) {
    if (stop.stop_requested()) {
        cancel();
        return cancelled_error(job);
    }
    if (next_take_ >= jobs_.size() || in_flight_.empty()) {
        return ExportError{ExportErrorCode::DocumentGenerationError, ExportStage::Processing, job.name,
                           "photo requested outside the pipeline job list"};
    }
    const PhotoJob& expected = jobs_[next_take_];
    if (expected.section_index != job.section_index || expected.item_index != job.item_index ||
        expected.photo_index != job.photo_index) {
        return ExportError{ExportErrorCode::DocumentGenerationError, ExportStage::Processing, job.name,
                           "photo requested out of order, expected " + expected.name};
    }

    auto future = std::move(in_flight_.front());
    in_flight_.pop_front();
    ++next_take_;

    while (future.wait_for(std::chrono::milliseconds(50)) != std::future_status::ready) {
        if (stop.stop_requested()) {
            cancel();
            return cancelled_error(job);
        }
    }

    try {
        auto result = future.get();
        refill();
        return result;
    } catch (const std::future_error& e) {
        Logger::log(LogLevel::Warning, std::string("Photo task dropped: ") + e.what(), processor_tag());
        return cancelled_error(job);
    }
}

void PhotoPipeline::cancel() {
    if (pool_) {
        pool_->request_stop();
    }
    in_flight_.clear();
    next_submit_ = jobs_.size();
}

} // namespace qreport
