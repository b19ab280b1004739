#ifndef QREPORT_CHECKUP_JSON_HPP
#define QREPORT_CHECKUP_JSON_HPP

#include <filesystem>
#include <string_view>
#include "../../../libqreport/include/checkup.hpp"

/**
 * @brief Reads a check-up aggregate from a JSON document.
 *
 * @details Layout:
 * @code
 * { "id": "...",
 *   "header": { "client": {...}, "technician": {...}, "island": {...},
 *               "scheduled_at": "2025-03-10T09:00:00", "started_at": ...,
 *               "completed_at": ..., "status": "...", "notes": "..." },
 *   "sections": [ { "title": "...", "items": [ { "id", "code", "title",
 *       "status": "OK|NOK|CRITICAL|PENDING|NA",
 *       "criticality": "CRITICAL|IMPORTANT|ROUTINE|NA", "note",
 *       "photos": [ { "path", "caption", "taken_at", "width", "height",
 *                     "file_size" } ] } ] } ],
 *   "spare_parts": [ { "part_number", "description", "quantity",
 *       "urgency", "estimated_cost", "notes" } ] }
 * @endcode
 * Timestamps are local time, "yyyy-MM-ddTHH:mm[:ss]". Relative photo paths
 * are resolved against @p base_dir. Missing fields keep their defaults.
 *
 * @throws std::runtime_error on malformed JSON or unknown enum values.
 */
qreport::CheckUpAggregate parse_checkup(std::string_view json, const std::filesystem::path& base_dir);

/**
 * @brief Reads and parses @p path; relative photo paths are resolved
 * against its directory.
 * @throws std::runtime_error when the file can't be read or parsed.
 */
qreport::CheckUpAggregate load_checkup(const std::filesystem::path& path);

#endif // QREPORT_CHECKUP_JSON_HPP
