// Tools for formatting strings
#pragma once
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include "cellgate_utils_export.h"

namespace cellgate::format_tools
{

/**
 * @brief Formats a system_clock time_point into a string with microsecond precision.
 * @param timestamp The time_point to format.
 * @return A string in the format "YYYY-MM-DD HH:MM:SS.us".
 */
CELLGATE_UTILS_EXPORT std::string formatted_time(std::chrono::system_clock::time_point timestamp);

/**
 * @brief Formats a duration in milliseconds for humans ("850ms", "12.4s", "3m07s").
 */
CELLGATE_UTILS_EXPORT std::string formatted_duration(std::chrono::milliseconds duration);

/**
 * @brief Returns the last @p max_bytes of @p text.
 *
 * When the text is cut, the result starts at the next line boundary (if one exists
 * within the kept part) and is prefixed with "...\n" so readers see it is a tail.
 * Without a line boundary the cut is moved past any UTF-8 continuation bytes.
 */
CELLGATE_UTILS_EXPORT std::string tail_bytes(std::string_view text, std::size_t max_bytes);

/**
 * @brief Splits text into lines, dropping a trailing '\r' from each line.
 */
CELLGATE_UTILS_EXPORT std::vector<std::string> split_lines(std::string_view text);

/**
 * @brief Removes ANSI terminal escape sequences (CSI such as "\x1b[1;33m", and
 *        two-byte ESC sequences) from a line of tool output.
 */
CELLGATE_UTILS_EXPORT std::string strip_ansi(std::string_view text);

/**
 * @brief Reads a whole file into a string.
 * @return The content, or std::nullopt if the file cannot be opened.
 */
CELLGATE_UTILS_EXPORT std::optional<std::string> read_file(const std::filesystem::path &path);

/**
 * @brief Quotes an argv vector for display: arguments containing spaces or quotes are
 *        wrapped in double quotes.
 */
CELLGATE_UTILS_EXPORT std::string join_command_line(const std::vector<std::string> &argv);

/**
 * @brief Converts a UTF-8 encoded std::string to a std::wstring on Windows.
 * @return The converted wstring. Returns an empty string on non-Windows platforms.
 */
CELLGATE_UTILS_EXPORT std::wstring s2ws(const std::string &s);

/**
 * @brief Converts a std::wstring to a UTF-8 encoded std::string on Windows.
 * @return The converted string. Returns an empty string on non-Windows platforms.
 */
CELLGATE_UTILS_EXPORT std::string ws2s(const std::wstring &w);

} // namespace cellgate::format_tools
