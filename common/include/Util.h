#ifndef COMMON_UTIL_H
#define COMMON_UTIL_H

#include <string>
#include <string_view>
#include <vector>

bool InsensitiveCharEquals(char a, char b);

bool InsensitiveStrEquals(std::string_view a, std::string_view b);

/**
 * @brief Strips leading and trailing spaces and tabs.
 */
std::string_view Trim(std::string_view s);

bool EndsWith(std::string_view s, std::string_view suffix);

std::vector<std::string_view> SplitString(std::string_view s, char c);

/**
 * @brief Reads a whole file into memory. Throws if it cannot be opened or read.
 */
std::string ReadFile(const char* filepath);

std::vector<std::string_view> GetLines(std::string_view data);

#endif
