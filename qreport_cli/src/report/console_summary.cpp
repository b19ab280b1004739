#include "console_summary.hpp"
#include "../../utils/color.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>

#ifdef _WIN32

#include <windows.h>
#include <io.h>      // _isatty, _fileno
#define isatty _isatty
#define fileno _fileno

#else

#include <sys/ioctl.h>
#include <unistd.h>

#endif

static bool is_stderr_a_tty() {
    return isatty(fileno(stderr)) != 0;
}

unsigned get_terminal_width() {
#ifdef _WIN32
    CONSOLE_SCREEN_BUFFER_INFO csbi;
    if (GetConsoleScreenBufferInfo(GetStdHandle(STD_ERROR_HANDLE), &csbi))
        return csbi.srWindow.Right - csbi.srWindow.Left + 1;
    return 80;
#else
    winsize w{};
    if (ioctl(STDERR_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0)
        return w.ws_col;
    return 80;
#endif
}

static std::string human_size(const uint64_t bytes) {
    std::ostringstream os;
    if (bytes >= 1024 * 1024) {
        os << std::fixed << std::setprecision(1) << static_cast<double>(bytes) / (1024.0 * 1024.0) << " MB";
    } else if (bytes >= 1024) {
        os << std::fixed << std::setprecision(1) << static_cast<double>(bytes) / 1024.0 << " KB";
    } else {
        os << bytes << " B";
    }
    return os.str();
}

void print_manifest_summary(const qreport::ExportManifest& manifest, const double total_seconds) {
    const bool use_colors = is_stderr_a_tty();
    const unsigned term_width = get_terminal_width();
    constexpr size_t format_col = 14;
    constexpr size_t size_col = 12;
    const size_t file_col = term_width > format_col + size_col + 10 ? term_width - format_col - size_col : 40;

    auto truncate = [](const std::string& s, const size_t max_len) {
        return s.size() <= max_len ? s : s.substr(0, max_len - 3) + "...";
    };

    if (manifest.files().empty()) {
        std::cerr << "\nNothing exported.\n";
        return;
    }

    std::cerr << "\nOutput directory: " << manifest.output_directory().string() << "\n\n"
              << std::left << std::setw(static_cast<int>(file_col)) << "File"
              << std::setw(format_col) << "Format"
              << std::setw(size_col) << "Size"
              << "\n";

    size_t photo_files = 0;
    for (const auto& f : manifest.files()) {
        if (f.format == qreport::ExportFormat::PhotoFolder) {
            ++photo_files;
            continue;
        }
        std::cerr << std::left << std::setw(static_cast<int>(file_col))
                  << truncate(f.path.filename().string(), file_col - 1)
                  << std::setw(format_col) << qreport::to_string(f.format)
                  << std::setw(size_col) << human_size(f.size)
                  << "\n";
    }
    if (photo_files > 0) {
        uint64_t folder_size = 0;
        for (const auto& f : manifest.files_of(qreport::ExportFormat::PhotoFolder)) folder_size += f.size;
        std::ostringstream label;
        label << "FOTO/ (" << manifest.photos().size() << " photos)";
        std::cerr << std::left << std::setw(static_cast<int>(file_col)) << label.str()
                  << std::setw(format_col) << qreport::to_string(qreport::ExportFormat::PhotoFolder)
                  << std::setw(size_col) << human_size(folder_size)
                  << "\n";
    }

    if (!manifest.warnings().empty()) {
        std::cerr << "\n" << (use_colors ? YELLOW : "") << manifest.warnings().size() << " warning"
                  << (manifest.warnings().size() > 1 ? "s" : "") << (use_colors ? RESET : "") << "\n";
        for (const auto& w : manifest.warnings()) {
            std::cerr << "  [" << qreport::to_string(w.code) << "] " << w.resource.string();
            if (!w.section.empty()) std::cerr << " (" << w.section << " / " << w.item << ")";
            std::cerr << "\n    " << w.message << "\n";
        }
    }

    std::cerr << "\n" << (use_colors ? GREEN : "") << "Total size: " << human_size(manifest.total_size())
              << (use_colors ? RESET : "") << "\n"
              << "Total time: " << std::fixed << std::setprecision(2) << total_seconds << " s\n";
}

void print_export_error(const qreport::ExportError& error) {
    const bool use_colors = is_stderr_a_tty();
    std::cerr << (use_colors ? RED : "") << "Export failed: " << error.describe()
              << (use_colors ? RESET : "") << std::endl;
}
