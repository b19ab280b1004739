/**
 * @file docx_package.hpp
 * @brief Streams OOXML parts into an in-memory ZIP container.
 */

#ifndef QREPORT_DOCX_PACKAGE_HPP
#define QREPORT_DOCX_PACKAGE_HPP

#include <span>
#include <string>
#include <string_view>
#include <vector>

struct archive;

namespace qreport {

/**
 * @brief Writes the parts of a .docx package with libarchive.
 *
 * @details Parts are compressed and appended as soon as they are added, so
 * an embedded photo can be released right after add_part(). Entries get a
 * zero mtime and 0644 permissions so that identical input produces an
 * identical package.
 *
 * All methods throw std::runtime_error when libarchive fails.
 */
class DocxPackage {
public:
    DocxPackage();
    ~DocxPackage();

    DocxPackage(const DocxPackage&) = delete;
    DocxPackage& operator=(const DocxPackage&) = delete;

    /**
     * @brief Appends one part.
     * @param name Part name inside the package (e.g. "word/document.xml").
     * @param data Part contents.
     */
    void add_part(std::string_view name, std::span<const unsigned char> data);

    /// @overload
    void add_part(std::string_view name, std::string_view text);

    /**
     * @brief Closes the archive.
     * @return The complete ZIP file; the package can't be used afterwards.
     */
    std::vector<unsigned char> finish();

    [[nodiscard]] size_t part_count() const noexcept { return parts_; }

private:
    archive* out_ = nullptr;
    std::vector<unsigned char> bytes_;
    size_t parts_ = 0;
    bool finished_ = false;
};

} // namespace qreport

#endif // QREPORT_DOCX_PACKAGE_HPP
