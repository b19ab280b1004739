#ifndef QREPORT_EXIF_ORIENTATION_HPP
#define QREPORT_EXIF_ORIENTATION_HPP

#include <span>

namespace qreport::imaging {

    /**
     * @brief Reads the orientation tag (0x0112) from IFD0 of an EXIF APP1
     * payload ("Exif\0\0" followed by a TIFF structure).
     * @param app1 The marker payload without the marker and length bytes.
     * @return 1..8, or 1 when the tag is absent or the data is malformed.
     */
    int parse_exif_orientation(std::span<const unsigned char> app1) noexcept;

} // namespace qreport::imaging

#endif // QREPORT_EXIF_ORIENTATION_HPP
