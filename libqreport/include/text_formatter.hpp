/**
 * @file text_formatter.hpp
 * @brief Small formatting helpers shared by the report generators and the
 * naming resolver.
 */

#ifndef QREPORT_TEXT_FORMATTER_HPP
#define QREPORT_TEXT_FORMATTER_HPP

#include "checkup.hpp"
#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace qreport::text {

    /**
     * @brief Formats a time point in local time with a strftime pattern.
     * @param tp The time point.
     * @param pattern strftime pattern, e.g. "%Y%m%d_%H%M".
     */
    std::string format_time(TimePoint tp, const char *pattern);

    /// @return yyyy-MM-ddTHH:mm:ssZ in UTC
    std::string format_iso8601_utc(TimePoint tp);

    /// @return dd/MM/yyyy
    inline std::string format_date(const TimePoint tp) { return format_time(tp, "%d/%m/%Y"); }

    /// @return dd/MM/yyyy HH:mm
    inline std::string format_date_time(const TimePoint tp) { return format_time(tp, "%d/%m/%Y %H:%M"); }

    /// @return yyyyMMdd_HHmm, the stamp used in output file names
    inline std::string file_stamp(const TimePoint tp) { return format_time(tp, "%Y%m%d_%H%M"); }

    /**
     * @brief Formats a number with a fixed number of decimals ("12.5").
     */
    std::string format_decimal(double value, int decimals);

    /**
     * @brief Left-pads @p text with spaces so that it is centered in @p width.
     */
    std::string center(std::string_view text, size_t width);

    /**
     * @brief Length of the longest prefix of @p text that fits in
     * @p max_bytes and ends on a UTF-8 code point boundary.
     */
    size_t utf8_prefix(std::string_view text, size_t max_bytes);

    /**
     * @brief Greedy word wrap.
     *
     * The first line gets @p first_prefix, the following lines get
     * @p next_prefix; every line including its prefix is at most @p width
     * bytes. Words longer than a line are split between UTF-8 code points.
     */
    std::vector<std::string> wrap(std::string_view text, size_t width,
                                  std::string_view first_prefix, std::string_view next_prefix);

    /**
     * @brief Replaces control characters and newlines with spaces and
     * trims the result.
     */
    std::string single_line(std::string_view text);

    /**
     * @brief Shortens @p text to @p max_chars bytes, ending with "..." when
     * cut. The cut never splits a UTF-8 sequence.
     */
    std::string ellipsize(std::string_view text, size_t max_chars);

    /**
     * @brief @return true when @p text is empty or only whitespace.
     */
    bool is_blank(std::string_view text);

} // namespace qreport::text

#endif // QREPORT_TEXT_FORMATTER_HPP
