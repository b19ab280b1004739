/**
 * @file photo_pipeline.hpp
 * @brief Supplies processed photos to the document assembler in source
 * order, either inline or from a bounded worker pool.
 */

#ifndef QREPORT_PHOTO_PIPELINE_HPP
#define QREPORT_PHOTO_PIPELINE_HPP

#include "checkup.hpp"
#include "errors.hpp"
#include "event_bus.hpp"
#include "export_options.hpp"
#include "photo_processor.hpp"
#include "thread_pool.hpp"
#include <deque>
#include <future>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

namespace qreport {

class NamingResolver;

/**
 * @brief One photo to embed, in canonical (section, item, photo) order.
 */
struct PhotoJob {
    size_t section_index = 0;
    size_t item_index = 0;
    size_t photo_index = 0;
    PhotoRef photo;
    std::string name; ///< resolved file name
};

/**
 * @brief Lists every photo of @p aggregate in canonical order with its
 * resolved name.
 */
std::vector<PhotoJob> collect_photo_jobs(const CheckUpAggregate& aggregate, NamingResolver& naming);

/**
 * @brief Source of processed photos for the document assembler.
 *
 * take() is called exactly once per job, in the order of the job list.
 */
class PhotoProvider {
public:
    virtual ~PhotoProvider() = default;

    /**
     * @brief Returns the processed photo of @p job.
     * @return The photo, or the recoverable error of the photo processor.
     * CANCELLED when @p stop was requested while waiting.
     */
    virtual Result<ProcessedPhoto> take(const PhotoJob& job, std::stop_token stop) = 0;
};

/**
 * @brief Processes each photo on the calling thread when it is requested.
 */
class InlinePhotoProvider final : public PhotoProvider {
public:
    InlinePhotoProvider(const PhotoProcessor& processor, PhotoPolicy policy, EventBus* bus = nullptr);

    Result<ProcessedPhoto> take(const PhotoJob& job, std::stop_token stop) override;

private:
    const PhotoProcessor& processor_;
    PhotoPolicy policy_;
    EventBus* bus_;
};

/**
 * @brief Processes photos ahead of the assembler on a ThreadPool.
 *
 * @details At most 2 x workers photos are queued, running or waiting to be
 * taken at any time; the next photo is submitted only when the assembler
 * consumes one. Results are handed out in job order regardless of which
 * worker finishes first.
 */
class PhotoPipeline final : public PhotoProvider {
public:
    /**
     * @param processor Shared, stateless processor.
     * @param policy Compression policy.
     * @param jobs Every photo that will be taken, in order.
     * @param workers Pool size (1..4).
     * @param bus Optional event bus for PhotoProcessedEvent.
     */
    PhotoPipeline(const PhotoProcessor& processor, PhotoPolicy policy, std::vector<PhotoJob> jobs,
                  unsigned workers, EventBus* bus = nullptr);
    ~PhotoPipeline() override;

    PhotoPipeline(const PhotoPipeline&) = delete;
    PhotoPipeline& operator=(const PhotoPipeline&) = delete;

    Result<ProcessedPhoto> take(const PhotoJob& job, std::stop_token stop) override;

    /// @brief Drops queued work and stops the workers.
    void cancel();

    [[nodiscard]] size_t window() const noexcept { return window_; }

    /// @return highest number of photos in flight observed so far
    [[nodiscard]] size_t peak_in_flight() const noexcept { return peak_in_flight_; }

private:
    void refill();

    const PhotoProcessor& processor_;
    PhotoPolicy policy_;
    std::vector<PhotoJob> jobs_;
    EventBus* bus_;
    size_t window_;
    size_t next_submit_ = 0;
    size_t next_take_ = 0;
    size_t peak_in_flight_ = 0;
    std::deque<std::future<Result<ProcessedPhoto>>> in_flight_;
    std::unique_ptr<ThreadPool> pool_;
};

} // namespace qreport

#endif // QREPORT_PHOTO_PIPELINE_HPP
