#ifndef QREPORT_CONSOLE_SUMMARY_HPP
#define QREPORT_CONSOLE_SUMMARY_HPP

#include "../../../libqreport/include/errors.hpp"
#include "../../../libqreport/include/export_manifest.hpp"

/**
 * @brief Returns the terminal width, 80 when it can't be queried.
 */
unsigned get_terminal_width();

/**
 * @brief Prints the produced files and the warnings of a run to stderr.
 */
void print_manifest_summary(const qreport::ExportManifest& manifest, double total_seconds);

/**
 * @brief Prints a fatal export error to stderr.
 */
void print_export_error(const qreport::ExportError& error);

#endif // QREPORT_CONSOLE_SUMMARY_HPP
