/*
 * SPDX-License-Identifier: MIT
 * Author: Robert Zheng
 * Copyright (c) 2026 ZHENG Robert
 */

#include "csv_preview.hpp"

#include "file_io.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <climits>
#include <format>
#include <stdexcept>

namespace rendar {

namespace {

// Attached to every CSV page; the guard keeps it from wiring a table twice.
constexpr std::string_view kSortScript = R"JS(<script>
(function () {
  if (window.__rendarCsvSort) {
    return;
  }
  window.__rendarCsvSort = true;

  function getCellValue(row, index) {
    var cell = row.children[index];
    return cell ? cell.textContent.trim() : "";
  }

  function isNumeric(value) {
    if (value === "") {
      return false;
    }
    return !Number.isNaN(Number(value));
  }

  function setupTable(table) {
    var tbody = table.tBodies[0];
    if (!tbody) {
      return;
    }
    var headers = table.tHead ? table.tHead.rows[0].cells : table.rows[0].cells;
    Array.prototype.forEach.call(headers, function (th, index) {
      th.setAttribute("role", "button");
      th.tabIndex = 0;
      function sort() {
        var rows = Array.prototype.slice.call(tbody.rows);
        var values = rows.map(function (row) {
          return getCellValue(row, index);
        });
        var numeric = values.filter(function (value) { return value !== ""; }).every(isNumeric);
        var next = th.getAttribute("data-sort") === "asc" ? "desc" : "asc";
        Array.prototype.forEach.call(headers, function (header) {
          header.removeAttribute("data-sort");
          header.removeAttribute("aria-sort");
        });
        th.setAttribute("data-sort", next);
        th.setAttribute("aria-sort", next === "asc" ? "ascending" : "descending");
        rows.sort(function (a, b) {
          var aValue = getCellValue(a, index);
          var bValue = getCellValue(b, index);
          if (numeric && isNumeric(aValue) && isNumeric(bValue)) {
            var diff = Number(aValue) - Number(bValue);
            return next === "asc" ? diff : -diff;
          }
          var order = aValue.localeCompare(bValue);
          return next === "asc" ? order : -order;
        });
        rows.forEach(function (row) {
          tbody.appendChild(row);
        });
      }
      th.addEventListener("click", sort);
      th.addEventListener("keydown", function (event) {
        if (event.key === "Enter" || event.key === " ") {
          event.preventDefault();
          sort();
        }
      });
    });
  }

  function init() {
    Array.prototype.forEach.call(document.querySelectorAll("table.csv-table"), setupTable);
  }

  if (document.readyState === "loading") {
    document.addEventListener("DOMContentLoaded", init);
  } else {
    init();
  }
})();
</script>
)JS";

std::string_view trim(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
    text.remove_prefix(1);
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
    text.remove_suffix(1);
  return text;
}

int delimiterScore(std::string_view sample, char delimiter) {
  std::vector<std::size_t> counts;
  std::size_t current = 0;
  bool inQuotes = false;

  for (std::size_t i = 0; i < sample.size(); ++i) {
    char ch = sample[i];
    if (ch == '"') {
      if (inQuotes && i + 1 < sample.size() && sample[i + 1] == '"')
        ++i;
      else
        inQuotes = !inQuotes;
    } else if (!inQuotes && ch == delimiter) {
      ++current;
    } else if (ch == '\n') {
      counts.push_back(current);
      current = 0;
    }
  }
  if (current > 0 || !counts.empty())
    counts.push_back(current);

  if (std::ranges::all_of(counts, [](std::size_t c) { return c == 0; }))
    return 0;

  std::size_t sum = 0;
  for (std::size_t c : counts)
    sum += c;
  double mean = static_cast<double>(sum) / static_cast<double>(counts.size());
  auto [minIt, maxIt] = std::ranges::minmax_element(counts);
  auto zeroLines = std::ranges::count(counts, std::size_t{0});

  return static_cast<int>(mean * 100.0) -
         static_cast<int>(*maxIt - *minIt) * 10 -
         static_cast<int>(zeroLines) * 25;
}

std::size_t countIf(const CsvRow &row, bool numeric) {
  return static_cast<std::size_t>(std::ranges::count_if(row, [&](const std::string &cell) {
    if (numeric)
      return isNumericCell(cell);
    return !trim(cell).empty() && !isNumericCell(cell);
  }));
}

} // namespace

char detectDelimiter(std::string_view sample) {
  constexpr char candidates[] = {',', ';', '\t', '|'};
  char best = ',';
  int bestScore = INT_MIN;
  for (char delimiter : candidates) {
    int score = delimiterScore(sample, delimiter);
    if (score > bestScore) {
      bestScore = score;
      best = delimiter;
    }
  }
  return best;
}

std::vector<CsvRow> parseCsv(std::string_view text, char delimiter,
                             std::optional<std::size_t> maxRecords) {
  std::vector<CsvRow> rows;
  CsvRow row;
  std::string field;
  bool inQuotes = false;
  bool quotedField = false;
  bool rowStarted = false;

  auto endRecord = [&] {
    if (rowStarted) {
      row.push_back(std::move(field));
      rows.push_back(std::move(row));
    }
    row.clear();
    field.clear();
    quotedField = false;
    rowStarted = false;
  };

  for (std::size_t i = 0; i < text.size(); ++i) {
    if (maxRecords && rows.size() >= *maxRecords)
      return rows;

    char ch = text[i];
    if (inQuotes) {
      if (ch == '"') {
        if (i + 1 < text.size() && text[i + 1] == '"') {
          field += '"';
          ++i;
        } else {
          inQuotes = false;
        }
      } else {
        field += ch;
      }
      continue;
    }

    if (ch == '"' && field.empty() && !quotedField) {
      inQuotes = true;
      quotedField = true;
      rowStarted = true;
    } else if (ch == delimiter) {
      row.push_back(std::move(field));
      field.clear();
      quotedField = false;
      rowStarted = true;
    } else if (ch == '\r' || ch == '\n') {
      if (ch == '\r' && i + 1 < text.size() && text[i + 1] == '\n')
        ++i;
      endRecord();
    } else {
      field += ch;
      rowStarted = true;
    }
  }

  if (!maxRecords || rows.size() < *maxRecords)
    endRecord();
  return rows;
}

bool isNumericCell(std::string_view value) {
  std::string_view trimmed = trim(value);
  if (trimmed.starts_with('+'))
    trimmed.remove_prefix(1);
  if (trimmed.empty() || trimmed.starts_with('+'))
    return false;

  double number = 0.0;
  auto [ptr, ec] =
      std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), number);
  return ec == std::errc() && ptr == trimmed.data() + trimmed.size();
}

bool isHeaderRow(const CsvRow &first, const CsvRow &second) {
  if (first.empty() || second.empty())
    return false;

  std::size_t cols = std::max(first.size(), second.size());
  std::size_t firstNumeric = countIf(first, true);
  std::size_t secondNumeric = countIf(second, true);
  std::size_t firstText = countIf(first, false);
  std::size_t secondText = countIf(second, false);

  bool strongHeader =
      firstText >= (cols + 1) / 2 && firstNumeric < secondNumeric;
  bool textHeavier = firstText > secondText && firstNumeric <= secondNumeric;
  return strongHeader || textHeavier;
}

std::string renderCsv(std::string_view contents,
                      std::optional<std::size_t> maxRows) {
  char delimiter = detectDelimiter(contents);

  // Room for a possible header and one extra row; one record past that
  // tells whether the input was cut.
  std::optional<std::size_t> readCap;
  if (maxRows)
    readCap = *maxRows + 2;
  std::vector<CsvRow> rows = parseCsv(
      contents, delimiter,
      readCap ? std::optional<std::size_t>(*readCap + 1) : std::nullopt);
  bool truncated = false;
  if (readCap && rows.size() > *readCap) {
    rows.pop_back();
    truncated = true;
  }

  if (rows.empty())
    return R"(<div class="csv-preview"><div class="csv-empty">Empty CSV.</div></div>)";

  std::optional<CsvRow> header;
  if (rows.size() >= 2 && isHeaderRow(rows[0], rows[1]))
    header = rows[0];

  std::vector<CsvRow> data(rows.begin() + (header ? 1 : 0), rows.end());
  if (maxRows && data.size() > *maxRows) {
    data.resize(*maxRows);
    truncated = true;
  }

  std::size_t maxCols = header ? header->size() : 0;
  for (const auto &row : data)
    maxCols = std::max(maxCols, row.size());
  if (maxCols == 0)
    maxCols = 1;

  if (!header) {
    header.emplace();
    for (std::size_t i = 1; i <= maxCols; ++i)
      header->push_back(std::format("Column {}", i));
  }

  std::string html = R"(<div class="csv-preview">)";
  if (truncated)
    html += std::format(
        R"(<div class="csv-notice">Showing first {} rows.</div>)", data.size());
  html += R"(<div class="csv-table-wrap"><table class="csv-table">)";
  html += "<thead><tr>";
  for (std::size_t i = 0; i < maxCols; ++i) {
    std::string_view label =
        i < header->size() ? std::string_view((*header)[i]) : std::string_view();
    html += std::format(R"(<th scope="col">{}</th>)", escapeHtml(label));
  }
  html += "</tr></thead><tbody>";
  for (const auto &row : data) {
    html += "<tr>";
    for (std::size_t i = 0; i < maxCols; ++i) {
      std::string_view value =
          i < row.size() ? std::string_view(row[i]) : std::string_view();
      html += std::format("<td>{}</td>", escapeHtml(value));
    }
    html += "</tr>";
  }
  html += "</tbody></table></div></div>";
  html += kSortScript;
  return html;
}

std::string renderCsvFile(const fs::path &path,
                          std::optional<std::size_t> maxRows) {
  std::string contents;
  try {
    contents = readFile(path);
  } catch (const std::runtime_error &) {
    throw std::runtime_error(
        std::format("Failed to read CSV file {}", path.string()));
  }
  return renderCsv(contents, maxRows);
}

} // namespace rendar
