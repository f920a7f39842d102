#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <array>
#include <string>
#include <vector>

namespace equipstat {

/**
 * @brief Reads an equipment table from CSV text
 *
 * The header must contain the exact column names below (case- and
 * spelling-exact); extra columns are ignored. Supports quoted fields with
 * "" escapes, CRLF line endings, a leading UTF-8 BOM and blank lines.
 *
 * All column problems are reported together in one VALIDATION_ERROR message
 * before any row is converted.
 */
class CsvTableReader {
public:
    static constexpr std::array<const char*, 5> kRequiredColumns = {
        "Equipment Name", "Type", "Flowrate", "Pressure", "Temperature"
    };

    /// Max invalid cells listed individually in an error message
    static constexpr size_t kMaxReportedCells = 10;

    [[nodiscard]] static Result<RecordTable> read(const std::string& content);

    /**
     * @brief Split CSV text into rows of raw cells (RFC 4180 quoting)
     * @throws std::runtime_error on an unterminated quoted field
     */
    [[nodiscard]] static std::vector<std::vector<std::string>> parse_rows(
        const std::string& content);

    /**
     * @brief Names of required columns absent from a header row
     */
    [[nodiscard]] static std::vector<std::string> missing_columns(
        const std::vector<std::string>& header);
};

} // namespace equipstat
