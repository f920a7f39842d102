#include "ingest/csv_reader.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>

namespace equipstat {

namespace {

constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

bool is_blank_row(const std::vector<std::string>& row) {
    return std::all_of(row.begin(), row.end(),
                       [](const std::string& cell) { return utils::trim(cell).empty(); });
}

std::string join(const std::vector<std::string>& items, std::string_view sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

} // anonymous namespace

std::vector<std::vector<std::string>> CsvTableReader::parse_rows(const std::string& content) {
    std::vector<std::vector<std::string>> rows;
    std::vector<std::string> row;
    std::string cell;
    bool in_quotes = false;
    bool row_has_data = false;

    std::string_view text(content);
    if (text.starts_with(kUtf8Bom)) {
        text.remove_prefix(kUtf8Bom.size());
    }

    const auto end_row = [&] {
        row.emplace_back(std::move(cell));
        cell.clear();
        rows.emplace_back(std::move(row));
        row.clear();
        row_has_data = false;
    };

    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    cell += '"';
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                cell += c;
            }
            continue;
        }

        switch (c) {
            case '"':
                in_quotes = true;
                row_has_data = true;
                break;
            case ',':
                row.emplace_back(std::move(cell));
                cell.clear();
                row_has_data = true;
                break;
            case '\r':
                if (i + 1 < text.size() && text[i + 1] == '\n') ++i;
                end_row();
                break;
            case '\n':
                end_row();
                break;
            default:
                cell += c;
                row_has_data = true;
        }
    }

    if (in_quotes) {
        throw std::runtime_error("Unterminated quoted field in CSV input");
    }
    if (row_has_data || !cell.empty()) {
        end_row();
    }
    return rows;
}

std::vector<std::string> CsvTableReader::missing_columns(const std::vector<std::string>& header) {
    std::vector<std::string> missing;
    for (const char* required : kRequiredColumns) {
        if (std::find(header.begin(), header.end(), required) == header.end()) {
            missing.emplace_back(required);
        }
    }
    return missing;
}

Result<RecordTable> CsvTableReader::read(const std::string& content) {
    std::vector<std::vector<std::string>> rows;
    try {
        rows = parse_rows(content);
    } catch (const std::exception& e) {
        return Result<RecordTable>::error(ErrorCategory::VALIDATION_ERROR, e.what());
    }

    // Drop blank lines (commonly trailing)
    std::erase_if(rows, is_blank_row);

    const std::vector<std::string> header = rows.empty() ? std::vector<std::string>{} : rows.front();
    const auto missing = missing_columns(header);
    if (!missing.empty()) {
        std::vector<std::string> expected(kRequiredColumns.begin(), kRequiredColumns.end());
        return Result<RecordTable>::error(ErrorCategory::VALIDATION_ERROR,
            std::format("Missing required columns: {}. Expected: {}",
                        join(missing, ", "), join(expected, ", ")));
    }

    const auto index_of = [&header](std::string_view name) {
        return static_cast<size_t>(
            std::find(header.begin(), header.end(), name) - header.begin());
    };
    const size_t name_idx = index_of("Equipment Name");
    const size_t type_idx = index_of("Type");
    std::array<size_t, kNumericColumnCount> numeric_idx{};
    for (const auto c : kNumericColumns) {
        numeric_idx[column_index(c)] = index_of(column_header(c));
    }

    if (rows.size() < 2) {
        return Result<RecordTable>::error(ErrorCategory::VALIDATION_ERROR,
                                          "Table contains no data rows");
    }

    RecordTable records;
    records.reserve(rows.size() - 1);
    std::vector<std::string> invalid_cells;
    size_t invalid_count = 0;

    for (size_t r = 1; r < rows.size(); ++r) {
        const auto& row = rows[r];
        const auto cell_at = [&row](size_t idx) -> std::string {
            return idx < row.size() ? row[idx] : std::string{};
        };

        EquipmentRecord rec;
        rec.equipment_name = cell_at(name_idx);
        rec.type = cell_at(type_idx);

        std::array<double, kNumericColumnCount> values{};
        for (const auto c : kNumericColumns) {
            const std::string raw = cell_at(numeric_idx[column_index(c)]);
            const auto parsed = utils::try_parse_double(raw);
            if (!parsed) {
                ++invalid_count;
                if (invalid_cells.size() < kMaxReportedCells) {
                    invalid_cells.push_back(
                        std::format("{} (row {}: '{}')", column_header(c), r, raw));
                }
                continue;
            }
            values[column_index(c)] = *parsed;
        }

        rec.flowrate = values[column_index(NumericColumn::FLOWRATE)];
        rec.pressure = values[column_index(NumericColumn::PRESSURE)];
        rec.temperature = values[column_index(NumericColumn::TEMPERATURE)];
        records.push_back(std::move(rec));
    }

    if (invalid_count > 0) {
        std::string message = std::format("Invalid numeric values: {}", join(invalid_cells, ", "));
        if (invalid_count > invalid_cells.size()) {
            message += std::format(" and {} more", invalid_count - invalid_cells.size());
        }
        return Result<RecordTable>::error(ErrorCategory::VALIDATION_ERROR, std::move(message));
    }

    return Result<RecordTable>::ok(std::move(records));
}

} // namespace equipstat
