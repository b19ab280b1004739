/**
 * @file document_assembler.hpp
 * @brief Builds the formatted .docx report with embedded photos.
 */

#ifndef QREPORT_DOCUMENT_ASSEMBLER_HPP
#define QREPORT_DOCUMENT_ASSEMBLER_HPP

#include "checkup.hpp"
#include "errors.hpp"
#include "event_bus.hpp"
#include "export_manifest.hpp"
#include "export_options.hpp"
#include "naming_resolver.hpp"
#include "photo_pipeline.hpp"
#include <cstdint>
#include <stop_token>
#include <string_view>
#include <vector>

namespace qreport {

/**
 * @brief Output of one assembly: the package bytes and the photos that
 * had to be replaced by a placeholder.
 */
struct AssembledDocument {
    std::vector<unsigned char> bytes;
    std::vector<ExportWarning> warnings;
    size_t embedded_photos = 0;
    size_t placeholders = 0;
};

/**
 * @brief Builds the WordprocessingML report.
 *
 * @details Content, in order: title block with client and technician,
 * general information table, executive summary, one block per section
 * (items table, then the photo grid when photos are included), spare parts
 * table, conclusions, signature block.
 *
 * Photos are taken from a PhotoProvider one by one in source order; each
 * processed photo is written into the package and released before the
 * next one is requested. A photo that can't be processed becomes a
 * "[Foto non disponibile]" cell and a warning. The stop token is checked
 * between sections and between photos.
 */
class DocumentAssembler {
public:
    static constexpr std::string_view kPhotoPlaceholder = "[Foto non disponibile]";
    static constexpr size_t kNoteMaxChars = 200;

    explicit DocumentAssembler(EventBus* bus = nullptr);

    /**
     * @brief Assembles the document, processing photos on the calling thread.
     * @return The package, or DOCUMENT_GENERATION_ERROR / TEMPLATE_NOT_FOUND.
     */
    [[nodiscard]] Result<AssembledDocument> assemble(const CheckUpAggregate& aggregate,
                                                     const ExportOptions& options,
                                                     NamingResolver& naming) const;

    /**
     * @brief Assembles the document with photos from @p photos.
     * @param generated_at Timestamp printed in the signature block.
     * @return The package, or DOCUMENT_GENERATION_ERROR, TEMPLATE_NOT_FOUND
     * or CANCELLED.
     */
    [[nodiscard]] Result<AssembledDocument> assemble(const CheckUpAggregate& aggregate,
                                                     const ExportOptions& options,
                                                     NamingResolver& naming,
                                                     PhotoProvider& photos,
                                                     std::stop_token stop,
                                                     TimePoint generated_at) const;

    /**
     * @brief Width in points of one photo in the grid: 400 for one photo
     * per row, 250 for two, 200 otherwise.
     */
    [[nodiscard]] static uint32_t grid_cell_width(unsigned photos_per_row) noexcept;

    /**
     * @brief Width in points actually drawn: grid_cell_width() capped to the
     * column of an A4 page with @p photos_per_row columns, less the cell
     * margins.
     */
    [[nodiscard]] static uint32_t grid_image_width(unsigned photos_per_row) noexcept;

    /// @brief DrawingML units: 12700 EMU per point.
    [[nodiscard]] static constexpr int64_t points_to_emu(const double points) noexcept {
        return static_cast<int64_t>(points * 12700.0 + 0.5);
    }

    /// @brief The built-in word/styles.xml part.
    [[nodiscard]] static std::string_view default_styles();

private:
    EventBus* bus_;
};

} // namespace qreport

#endif // QREPORT_DOCUMENT_ASSEMBLER_HPP
