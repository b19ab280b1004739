/**
 * @file errors.hpp
 * @brief Typed export errors and the Result<T> value returned by every
 * export component.
 */

#ifndef QREPORT_ERRORS_HPP
#define QREPORT_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace qreport {

/**
 * @brief Error taxonomy of the export engine.
 *
 * PhotoNotFound and ImageDecodeFailed are recovered per photo and end up as
 * manifest warnings; every other code aborts the run.
 */
enum class ExportErrorCode {
    InsufficientStorage,
    PermissionDenied,
    TemplateNotFound,
    PhotoNotFound,
    ImageDecodeFailed,
    DocumentGenerationError,
    InvalidOptions,
    Cancelled
};

/**
 * @brief Stages of one export run, in execution order.
 */
enum class ExportStage {
    Validating,
    Budgeting,
    Processing,
    Writing,
    Done,
    Failed
};

[[nodiscard]] constexpr std::string_view to_string(const ExportErrorCode code) noexcept {
    switch (code) {
        case ExportErrorCode::InsufficientStorage:     return "INSUFFICIENT_STORAGE";
        case ExportErrorCode::PermissionDenied:        return "PERMISSION_DENIED";
        case ExportErrorCode::TemplateNotFound:        return "TEMPLATE_NOT_FOUND";
        case ExportErrorCode::PhotoNotFound:           return "PHOTO_NOT_FOUND";
        case ExportErrorCode::ImageDecodeFailed:       return "IMAGE_DECODE_FAILED";
        case ExportErrorCode::DocumentGenerationError: return "DOCUMENT_GENERATION_ERROR";
        case ExportErrorCode::InvalidOptions:          return "INVALID_OPTIONS";
        case ExportErrorCode::Cancelled:               return "CANCELLED";
    }
    return "UNKNOWN";
}

[[nodiscard]] constexpr std::string_view to_string(const ExportStage stage) noexcept {
    switch (stage) {
        case ExportStage::Validating: return "VALIDATING";
        case ExportStage::Budgeting:  return "BUDGETING";
        case ExportStage::Processing: return "PROCESSING";
        case ExportStage::Writing:    return "WRITING";
        case ExportStage::Done:       return "DONE";
        case ExportStage::Failed:     return "FAILED";
    }
    return "UNKNOWN";
}

/**
 * @brief @return true for codes that are recovered locally per photo.
 */
[[nodiscard]] constexpr bool is_recoverable(const ExportErrorCode code) noexcept {
    return code == ExportErrorCode::PhotoNotFound ||
           code == ExportErrorCode::ImageDecodeFailed;
}

/**
 * @brief A typed error with enough context to retry: the stage that raised
 * it and the file or directory involved.
 */
struct ExportError {
    ExportErrorCode code = ExportErrorCode::DocumentGenerationError;
    ExportStage stage = ExportStage::Processing;
    std::string resource;
    std::string message;

    /// @return "CODE at STAGE (resource): message"
    [[nodiscard]] std::string describe() const {
        std::string out(to_string(code));
        out += " at ";
        out += to_string(stage);
        if (!resource.empty()) {
            out += " (" + resource + ")";
        }
        if (!message.empty()) {
            out += ": " + message;
        }
        return out;
    }
};

/**
 * @brief Tagged success/error value.
 *
 * @details Expected failures (a missing photo, a full disk) travel through
 * Result instead of exceptions. Accessing value() on an error, or error()
 * on a success, is a programming error and throws std::logic_error.
 */
template <typename T>
class Result {
public:
    Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}
    Result(ExportError error) : data_(std::in_place_index<1>, std::move(error)) {}

    [[nodiscard]] bool ok() const noexcept { return data_.index() == 0; }
    explicit operator bool() const noexcept { return ok(); }

    [[nodiscard]] const T& value() const & {
        if (!ok()) throw std::logic_error("Result holds an error: " + std::get<1>(data_).describe());
        return std::get<0>(data_);
    }

    [[nodiscard]] T& value() & {
        if (!ok()) throw std::logic_error("Result holds an error: " + std::get<1>(data_).describe());
        return std::get<0>(data_);
    }

    [[nodiscard]] T&& value() && {
        if (!ok()) throw std::logic_error("Result holds an error: " + std::get<1>(data_).describe());
        return std::get<0>(std::move(data_));
    }

    [[nodiscard]] const ExportError& error() const {
        if (ok()) throw std::logic_error("Result holds a value");
        return std::get<1>(data_);
    }

private:
    std::variant<T, ExportError> data_;
};

/**
 * @brief Result without a payload.
 */
template <>
class Result<void> {
public:
    Result() = default;
    Result(ExportError error) : error_(std::move(error)), failed_(true) {}

    [[nodiscard]] bool ok() const noexcept { return !failed_; }
    explicit operator bool() const noexcept { return ok(); }

    [[nodiscard]] const ExportError& error() const {
        if (ok()) throw std::logic_error("Result holds no error");
        return error_;
    }

private:
    ExportError error_{};
    bool failed_ = false;
};

using Status = Result<void>;

} // namespace qreport

#endif // QREPORT_ERRORS_HPP
