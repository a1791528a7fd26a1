/*
 * SPDX-License-Identifier: MIT
 * Author: Robert Zheng
 * Copyright (c) 2026 ZHENG Robert
 */

/**
 * @file csv_preview.hpp
 * @brief Renders CSV files as sortable HTML tables.
 */

#ifndef RENDAR_CSV_PREVIEW_HPP
#define RENDAR_CSV_PREVIEW_HPP

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rendar {

namespace fs = std::filesystem;

/// Default row limit of a CSV preview.
inline constexpr std::size_t kDefaultCsvMaxRows = 1000;

using CsvRow = std::vector<std::string>;

/**
 * @brief Picks the most plausible delimiter out of `,` `;` TAB and `|`.
 *
 * Each candidate is scored by how many times it appears per line and how
 * evenly; quoted text is skipped. Ties go to the earlier candidate.
 */
char detectDelimiter(std::string_view sample);

/**
 * @brief Splits CSV text into records.
 *
 * Double quotes group fields and `""` is a literal quote. Lines end with LF or
 * CRLF. Blank lines are skipped, and records may differ in length. An
 * unterminated quote runs to the end of the input.
 *
 * @param maxRecords Stop after this many records, if given.
 */
std::vector<CsvRow> parseCsv(std::string_view text, char delimiter,
                             std::optional<std::size_t> maxRecords = {});

/**
 * @brief Guesses whether @p first is a header, comparing it with the row that
 * follows it.
 */
bool isHeaderRow(const CsvRow &first, const CsvRow &second);

/**
 * @brief True when the trimmed cell parses as a floating point number.
 */
bool isNumericCell(std::string_view value);

/**
 * @brief Renders CSV text as a table fragment.
 * @param maxRows Data row limit; std::nullopt renders every row.
 */
std::string renderCsv(std::string_view contents,
                      std::optional<std::size_t> maxRows);

/**
 * @brief Reads and renders a CSV file.
 * @throws std::runtime_error if the file cannot be read or parsed.
 */
std::string renderCsvFile(const fs::path &path,
                          std::optional<std::size_t> maxRows);

} // namespace rendar

#endif // RENDAR_CSV_PREVIEW_HPP
