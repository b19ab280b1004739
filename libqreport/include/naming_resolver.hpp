/**
 * @file naming_resolver.hpp
 * @brief Deterministic, collision-free file names shared by every output
 * format of one export run.
 */

#ifndef QREPORT_NAMING_RESOLVER_HPP
#define QREPORT_NAMING_RESOLVER_HPP

#include "checkup.hpp"
#include "export_options.hpp"
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace qreport {

/**
 * @brief Identifies one photo inside an aggregate.
 */
struct PhotoKey {
    size_t section_index = 0;
    std::string item_id;
    size_t photo_index = 0;
    std::string source;

    auto operator<=>(const PhotoKey&) const = default;
};

/**
 * @brief A resolved name in canonical (section, item, photo) order.
 */
struct ResolvedPhotoName {
    size_t section_index = 0;
    size_t item_index = 0;
    size_t photo_index = 0;
    std::string name;
};

/**
 * @brief Resolves photo and output file names for one export run.
 *
 * @details The resolver remembers every name it hands out. Asking twice for
 * the same (section, item, photo) returns the same name, and two different
 * photos never share a name: a clash gets a "_2", "_3", ... suffix before
 * the extension. Names never exceed 80 characters.
 *
 * One resolver instance is shared by the document, the text report and the
 * photo folder so that all three refer to a photo by the same name. Call
 * resolve_all() first so that numbering follows source order no matter
 * which generator asks first.
 *
 * Thread-safe.
 */
class NamingResolver {
public:
    static constexpr size_t kMaxNameLength = 80;
    static constexpr size_t kSectionPartLength = 20;
    static constexpr size_t kItemPartLength = 30;
    static constexpr size_t kMaxExtensionLength = 5; ///< without the dot

    /**
     * @param strategy Naming strategy for photo files.
     * @param generated_at Run timestamp, used by the timestamp strategy for
     * photos without a capture time.
     */
    NamingResolver(NamingStrategy strategy, TimePoint generated_at);

    /**
     * @brief Resolves the file name of one photo.
     * @param section_index 0-based section position.
     * @param section_title Section title.
     * @param item The owning check item; its identifier and the photo path
     * key the cache.
     * @param photo_index 0-based photo position inside the item.
     * @param caption Photo caption, may be blank.
     * @return A valid file name, never empty.
     */
    std::string resolve(size_t section_index,
                        std::string_view section_title,
                        const CheckItem& item,
                        size_t photo_index,
                        std::string_view caption);

    /**
     * @brief Resolves every photo of @p aggregate in source order.
     * @return The names in canonical order.
     */
    std::vector<ResolvedPhotoName> resolve_all(const CheckUpAggregate& aggregate);

    /// @brief Shorthand for resolve() reading title and caption from the aggregate.
    std::string name_for(const CheckUpAggregate& aggregate, size_t section_index,
                         size_t item_index, size_t photo_index);

    [[nodiscard]] NamingStrategy strategy() const noexcept { return strategy_; }
    [[nodiscard]] TimePoint generated_at() const noexcept { return generated_at_; }

    /**
     * @brief Lowercases, replaces every non-alphanumeric run with a single
     * '-', trims dashes and truncates to @p max_length.
     */
    static std::string normalize(std::string_view text, size_t max_length);

    /**
     * @brief Lowercased extension of @p path, ".jpeg" folded to ".jpg".
     * ".jpg" when missing, longer than kMaxExtensionLength or not made of
     * ASCII letters and digits.
     */
    static std::string extension_of(const std::filesystem::path& path);

    /// @return Checkup_{IslandType}_{Client}_{yyyyMMdd_HHmm}.docx
    static std::string document_file_name(const CheckUpAggregate& aggregate, TimePoint generated_at);

    /// @return Checkup_Summary_{yyyyMMdd_HHmm}.txt
    static std::string text_file_name(TimePoint generated_at);

    /// @return Export_Checkup_{yyyyMMdd_HHmm}
    static std::string export_directory_name(TimePoint generated_at);

private:
    std::string base_name(size_t section_index, std::string_view section_title,
                          const CheckItem& item, size_t photo_index,
                          std::string_view caption) const;
    std::string claim_unique(const std::string& stem, const std::string& extension);

    NamingStrategy strategy_;
    TimePoint generated_at_;
    size_t sequence_ = 0;
    std::map<PhotoKey, std::string> resolved_;
    std::set<std::string> used_;
    mutable std::mutex mtx_;
};

} // namespace qreport

#endif // QREPORT_NAMING_RESOLVER_HPP
