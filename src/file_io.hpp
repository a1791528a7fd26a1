/*
 * SPDX-License-Identifier: MIT
 * Author: Robert Zheng
 * Copyright (c) 2026 ZHENG Robert
 */

/**
 * @file file_io.hpp
 * @brief Whole-file read/write helpers and HTML escaping.
 */

#ifndef RENDAR_FILE_IO_HPP
#define RENDAR_FILE_IO_HPP

#include <filesystem>
#include <string>
#include <string_view>

namespace rendar {

namespace fs = std::filesystem;

/**
 * @brief Reads the contents of a file.
 * @param path Path to the file.
 * @return File content.
 * @throws std::runtime_error if the file cannot be opened.
 */
std::string readFile(const fs::path &path);

/**
 * @brief Writes content to a file, creating missing parent directories.
 * @param path Path to the file.
 * @param content Content to write.
 * @throws std::runtime_error if the file cannot be written.
 */
void writeFile(const fs::path &path, std::string_view content);

/**
 * @brief Copies a file byte for byte, overwriting the destination.
 * @param from Source file.
 * @param to Destination file.
 */
void copyFile(const fs::path &from, const fs::path &to);

/**
 * @brief Escapes the five HTML special characters.
 */
std::string escapeHtml(std::string_view input);

} // namespace rendar

#endif // RENDAR_FILE_IO_HPP
