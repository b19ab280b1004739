#include "../../include/codec_registry.hpp"
#include "../../include/jpeg_codec.hpp"
#include "../../include/png_codec.hpp"
#include <algorithm>
#include <cctype>

namespace qreport {

ImageCodecRegistry::ImageCodecRegistry() {
    codecs_.push_back(std::make_unique<JpegCodec>());
    codecs_.push_back(std::make_unique<PngCodec>());
}

const IImageCodec* ImageCodecRegistry::find_by_signature(const std::span<const unsigned char> head) const {
    for (const auto& codec : codecs_) {
        if (codec->matches_signature(head)) {
            return codec.get();
        }
    }
    return nullptr;
}

const IImageCodec* ImageCodecRegistry::find_by_extension(const std::string& ext) const {
    if (ext.empty() || ext[0] != '.') return nullptr;

    auto iequals = [](const std::string_view s1, const std::string_view s2) {
        return std::equal(s1.begin(), s1.end(), s2.begin(), s2.end(),
                          [](char a, char b) {
                              return std::tolower(static_cast<unsigned char>(a)) ==
                                     std::tolower(static_cast<unsigned char>(b));
                          });
    };

    for (const auto& codec : codecs_) {
        for (const auto supported_ext : codec->get_supported_extensions()) {
            if (iequals(supported_ext, ext)) {
                return codec.get();
            }
        }
    }
    return nullptr;
}

} // namespace qreport
