#include "../../include/naming_resolver.hpp"
#include "../../include/logger.hpp"
#include "../../include/text_formatter.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>

namespace qreport {

namespace {

constexpr std::string_view processor_tag() {
    return "naming_resolver";
}

std::string alnum_only(const std::string_view text, const size_t max_length) {
    std::string out;
    for (const char c : text) {
        if (out.size() >= max_length) break;
        if (std::isalnum(static_cast<unsigned char>(c))) out += c;
    }
    return out;
}

std::string zero_pad(const size_t value, const int width) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%0*zu", width, value);
    return buf;
}

} // namespace

NamingResolver::NamingResolver(const NamingStrategy strategy, const TimePoint generated_at)
    : strategy_(strategy), generated_at_(generated_at) {}

std::string NamingResolver::normalize(const std::string_view text, const size_t max_length) {
    std::string out;
    out.reserve(text.size());
    bool pending_dash = false;
    for (const char ch : text) {
        const auto c = static_cast<unsigned char>(ch);
        if (c < 0x80 && std::isalnum(c)) {
            if (pending_dash && !out.empty()) out += '-';
            pending_dash = false;
            out += static_cast<char>(std::tolower(c));
        } else {
            pending_dash = true;
        }
    }
    if (out.size() > max_length) {
        out.resize(max_length);
    }
    while (!out.empty() && out.back() == '-') {
        out.pop_back();
    }
    return out;
}

std::string NamingResolver::extension_of(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::ranges::transform(ext, ext.begin(),
                           [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext == ".jpeg" || ext == ".jpe") return ".jpg";
    const bool usable = ext.size() >= 2 && ext.size() <= kMaxExtensionLength + 1 &&
                        std::all_of(ext.begin() + 1, ext.end(), [](const unsigned char c) {
                            return c < 0x80 && std::isalnum(c);
                        });
    return usable ? ext : ".jpg";
}

std::string NamingResolver::base_name(const size_t section_index,
                                      const std::string_view section_title,
                                      const CheckItem& item,
                                      const size_t photo_index,
                                      const std::string_view caption) const {
    switch (strategy_) {
        case NamingStrategy::Sequential:
            return "foto_" + zero_pad(sequence_ + 1, 3);
        case NamingStrategy::Timestamp: {
            TimePoint when = generated_at_;
            if (photo_index < item.photos.size() && item.photos[photo_index].taken_at) {
                when = *item.photos[photo_index].taken_at;
            }
            return text::format_time(when, "%Y%m%d_%H%M%S") + "_" + zero_pad(sequence_ + 1, 3);
        }
        case NamingStrategy::Structured:
            break;
    }

    std::string section = normalize(section_title, kSectionPartLength);
    if (section.empty()) section = "sezione";

    std::string item_part = normalize(item.title, kItemPartLength);
    if (item_part.empty()) item_part = normalize(item.code, kItemPartLength);
    if (item_part.empty()) item_part = "controllo";

    std::string caption_part = normalize(caption, kMaxNameLength);
    if (caption_part.empty()) caption_part = "foto" + std::to_string(photo_index + 1);

    return zero_pad(section_index + 1, 2) + "_" + section + "_" + item_part + "_" + caption_part;
}

std::string NamingResolver::claim_unique(const std::string& stem, const std::string& extension) {
    for (size_t attempt = 1;; ++attempt) {
        const std::string suffix = attempt == 1 ? std::string() : "_" + std::to_string(attempt);
        const size_t reserved = extension.size() + suffix.size();
        const size_t budget = reserved < kMaxNameLength ? kMaxNameLength - reserved : 1;
        std::string trimmed = stem.substr(0, std::min(stem.size(), budget));
        while (trimmed.size() > 1 && (trimmed.back() == '-' || trimmed.back() == '_')) {
            trimmed.pop_back();
        }
        std::string candidate = trimmed + suffix + extension;
        if (used_.insert(candidate).second) {
            if (attempt > 1) {
                Logger::log(LogLevel::Debug, "Name clash on " + trimmed + extension + ", using " + candidate,
                            processor_tag());
            }
            return candidate;
        }
    }
}

std::string NamingResolver::resolve(const size_t section_index,
                                    const std::string_view section_title,
                                    const CheckItem& item,
                                    const size_t photo_index,
                                    const std::string_view caption) {
    std::lock_guard lock(mtx_);
    const std::filesystem::path source = photo_index < item.photos.size()
                                             ? item.photos[photo_index].path
                                             : std::filesystem::path{};
    PhotoKey key{section_index, item.id.empty() ? item.code + "/" + item.title : item.id,
                 photo_index, source.string()};
    if (const auto it = resolved_.find(key); it != resolved_.end()) {
        return it->second;
    }

    const std::string stem = base_name(section_index, section_title, item, photo_index, caption);
    std::string name = claim_unique(stem, extension_of(source));
    ++sequence_;
    resolved_.emplace(std::move(key), name);
    return name;
}

std::vector<ResolvedPhotoName> NamingResolver::resolve_all(const CheckUpAggregate& aggregate) {
    std::vector<ResolvedPhotoName> out;
    for (size_t s = 0; s < aggregate.sections.size(); ++s) {
        const auto& section = aggregate.sections[s];
        for (size_t i = 0; i < section.items.size(); ++i) {
            const auto& item = section.items[i];
            for (size_t p = 0; p < item.photos.size(); ++p) {
                out.push_back({s, i, p, resolve(s, section.title, item, p, item.photos[p].caption)});
            }
        }
    }
    Logger::log(LogLevel::Debug, "Resolved " + std::to_string(out.size()) + " photo names", processor_tag());
    return out;
}

std::string NamingResolver::name_for(const CheckUpAggregate& aggregate, const size_t section_index,
                                     const size_t item_index, const size_t photo_index) {
    const auto& section = aggregate.sections.at(section_index);
    const auto& item = section.items.at(item_index);
    const std::string_view caption = photo_index < item.photos.size()
                                         ? std::string_view(item.photos[photo_index].caption)
                                         : std::string_view{};
    return resolve(section_index, section.title, item, photo_index, caption);
}

std::string NamingResolver::document_file_name(const CheckUpAggregate& aggregate, const TimePoint generated_at) {
    std::string island = alnum_only(aggregate.header.island.island_type, 30);
    if (island.empty()) island = "Isola";
    std::string client = alnum_only(aggregate.header.client.company_name, 15);
    if (client.empty()) client = "Cliente";
    return "Checkup_" + island + "_" + client + "_" + text::file_stamp(generated_at) + ".docx";
}

std::string NamingResolver::text_file_name(const TimePoint generated_at) {
    return "Checkup_Summary_" + text::file_stamp(generated_at) + ".txt";
}

std::string NamingResolver::export_directory_name(const TimePoint generated_at) {
    return "Export_Checkup_" + text::file_stamp(generated_at);
}

} // namespace qreport
