/*
 * SPDX-License-Identifier: MIT
 * Author: Robert Zheng
 * Copyright (c) 2026 ZHENG Robert
 */

#include "config.hpp"

#include "file_io.hpp"

#include <cctype>
#include <charconv>
#include <format>
#include <limits>
#include <set>

#include <nlohmann/json.hpp>

namespace rendar {

using json = nlohmann::json;

namespace {

bool isBareKeyChar(char ch) {
  return std::isalnum(static_cast<unsigned char>(ch)) || ch == '_' ||
         ch == '-';
}

/**
 * @brief Reads `key = value` pairs into json values, tracking the table
 * each key belongs to.
 */
class TomlReader {
public:
  TomlReader(std::string_view text, std::string_view origin)
      : text_(text), origin_(origin) {}

  /// Calls @p onValue(table, key, value) for every assignment.
  template <typename Fn> void read(Fn &&onValue) {
    std::string table;
    std::set<std::string> seen;

    while (true) {
      skipBlank();
      if (atEnd())
        break;

      if (peek() == '[') {
        ++pos_;
        skipSpaces();
        table = parseKey();
        skipSpaces();
        expect(']');
        if (!seen.insert("[" + table).second)
          fail(std::format("duplicate table [{}]", table));
        expectLineEnd();
        continue;
      }

      std::string key = parseKey();
      skipSpaces();
      expect('=');
      skipSpaces();
      std::size_t keyLine = line_;
      json value = parseValue();
      expectLineEnd();

      if (!seen.insert(table + "." + key).second)
        throw ConfigError(std::format("{}:{}: duplicate key '{}'", origin_,
                                      keyLine, key));
      onValue(table, key, value, keyLine);
    }
  }

private:
  [[noreturn]] void fail(const std::string &message) const {
    throw ConfigError(std::format("{}:{}: {}", origin_, line_, message));
  }

  bool atEnd() const { return pos_ >= text_.size(); }
  char peek() const { return atEnd() ? '\0' : text_[pos_]; }

  void skipSpaces() {
    while (!atEnd() && (peek() == ' ' || peek() == '\t'))
      ++pos_;
  }

  void skipComment() {
    if (peek() != '#')
      return;
    while (!atEnd() && peek() != '\n')
      ++pos_;
  }

  /// Skips whitespace, newlines and comments.
  void skipBlank() {
    while (!atEnd()) {
      skipSpaces();
      skipComment();
      if (peek() == '\r' || peek() == '\n') {
        if (peek() == '\n')
          ++line_;
        ++pos_;
        continue;
      }
      break;
    }
  }

  void expect(char ch) {
    if (peek() != ch)
      fail(atEnd() ? std::format("expected '{}' before end of file", ch)
                   : std::format("expected '{}'", ch));
    ++pos_;
  }

  void expectLineEnd() {
    skipSpaces();
    skipComment();
    if (peek() == '\r')
      ++pos_;
    if (atEnd())
      return;
    if (peek() != '\n')
      fail("unexpected text after value");
    ++pos_;
    ++line_;
  }

  std::string parseKey() {
    if (peek() == '"' || peek() == '\'')
      return parseString();
    std::size_t start = pos_;
    while (!atEnd() && isBareKeyChar(peek()))
      ++pos_;
    if (pos_ == start)
      fail("expected a key");
    return std::string(text_.substr(start, pos_ - start));
  }

  json parseValue() {
    char ch = peek();
    if (ch == '"' || ch == '\'')
      return parseString();
    if (ch == '[')
      return parseArray();
    if (text_.substr(pos_).starts_with("true")) {
      pos_ += 4;
      return true;
    }
    if (text_.substr(pos_).starts_with("false")) {
      pos_ += 5;
      return false;
    }
    if (ch == '+' || ch == '-' || std::isdigit(static_cast<unsigned char>(ch)))
      return parseInteger();
    fail("expected a value");
  }

  json parseInteger() {
    std::string digits;
    if (peek() == '+' || peek() == '-') {
      if (peek() == '-')
        digits += '-';
      ++pos_;
    }
    while (!atEnd() &&
           (std::isdigit(static_cast<unsigned char>(peek())) || peek() == '_')) {
      if (peek() != '_')
        digits += peek();
      ++pos_;
    }
    std::int64_t number = 0;
    auto [ptr, ec] =
        std::from_chars(digits.data(), digits.data() + digits.size(), number);
    if (ec != std::errc() || ptr != digits.data() + digits.size())
      fail("invalid integer");
    return number;
  }

  std::string parseString() {
    char quote = peek();
    ++pos_;
    std::string out;
    while (true) {
      if (atEnd() || peek() == '\n')
        fail("unterminated string");
      char ch = text_[pos_++];
      if (ch == quote)
        return out;
      if (ch != '\\' || quote == '\'') {
        out += ch;
        continue;
      }
      if (atEnd())
        fail("unterminated string");
      char esc = text_[pos_++];
      switch (esc) {
      case '"':
        out += '"';
        break;
      case '\\':
        out += '\\';
        break;
      case 'n':
        out += '\n';
        break;
      case 't':
        out += '\t';
        break;
      case 'r':
        out += '\r';
        break;
      default:
        fail(std::format("unsupported escape '\\{}'", esc));
      }
    }
  }

  json parseArray() {
    expect('[');
    json array = json::array();
    while (true) {
      skipBlank();
      if (peek() == ']') {
        ++pos_;
        return array;
      }
      array.push_back(parseValue());
      skipBlank();
      if (peek() == ',') {
        ++pos_;
        continue;
      }
      expect(']');
      return array;
    }
  }

  std::string_view text_;
  std::string_view origin_;
  std::size_t pos_ = 0;
  std::size_t line_ = 1;
};

/// Strings of a json array, or std::nullopt if any element is not one.
std::optional<std::vector<std::string>> toStringList(const json &value) {
  if (!value.is_array())
    return std::nullopt;
  std::vector<std::string> list;
  for (const auto &item : value) {
    if (!item.is_string())
      return std::nullopt;
    list.push_back(item.get<std::string>());
  }
  return list;
}

fs::path resolveAgainst(const fs::path &base, const fs::path &path) {
  return path.is_absolute() ? path : base / path;
}

} // namespace

Config parseConfig(std::string_view text, std::string_view origin) {
  Config cfg;
  TomlReader reader(text, origin);

  reader.read([&](const std::string &table, const std::string &key,
                  const json &value, std::size_t line) {
    auto typeError = [&](std::string_view expected) {
      throw ConfigError(std::format("{}:{}: '{}' must be {}", origin, line,
                                    key, expected));
    };

    if (table.empty()) {
      if (key == "input" || key == "template") {
        if (!value.is_string())
          typeError("a string");
        fs::path path(value.get<std::string>());
        (key == "input" ? cfg.input : cfg.templatePath) = path;
      } else if (key == "exclude") {
        cfg.exclude = toStringList(value);
        if (!cfg.exclude)
          typeError("an array of strings");
      } else if (key == "csv_max_rows") {
        if (!value.is_number_integer() || value.get<std::int64_t>() < 0)
          typeError("a non-negative integer");
        cfg.csvMaxRows = value.get<std::size_t>();
      }
    } else if (table == "preview") {
      if (key == "port") {
        if (!value.is_number_integer() || value.get<std::int64_t>() < 1 ||
            value.get<std::int64_t>() > std::numeric_limits<std::uint16_t>::max())
          typeError("a port number between 1 and 65535");
        cfg.preview.port = value.get<std::uint16_t>();
      } else if (key == "open") {
        if (!value.is_boolean())
          typeError("a boolean");
        cfg.preview.open = value.get<bool>();
      }
    }
  });

  return cfg;
}

std::optional<Config> loadConfig(const std::optional<fs::path> &path,
                                 const fs::path &cwd) {
  fs::path configPath;
  if (path) {
    configPath = resolveAgainst(cwd, *path);
  } else {
    fs::path candidate = cwd / kConfigFileName;
    std::error_code ec;
    if (!fs::exists(candidate, ec))
      return std::nullopt;
    configPath = candidate;
  }

  std::string raw;
  try {
    raw = readFile(configPath);
  } catch (const std::runtime_error &) {
    throw std::runtime_error(
        std::format("Failed to read config {}", configPath.string()));
  }

  Config cfg = parseConfig(raw, configPath.string());
  fs::path base = configPath.parent_path();
  if (base.empty())
    base = ".";
  if (cfg.input)
    cfg.input = resolveAgainst(base, *cfg.input);
  if (cfg.templatePath)
    cfg.templatePath = resolveAgainst(base, *cfg.templatePath);
  return cfg;
}

} // namespace rendar
