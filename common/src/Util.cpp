#include "Util.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

bool InsensitiveCharEquals(char a, char b) {
    return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
}

bool InsensitiveStrEquals(std::string_view a, std::string_view b) {
    return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), InsensitiveCharEquals);
}

std::string_view Trim(std::string_view s) {
    constexpr std::string_view Whitespace = " \t";

    size_t first = s.find_first_not_of(Whitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    size_t last = s.find_last_not_of(Whitespace);
    return s.substr(first, last - first + 1);
}

bool EndsWith(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

std::vector<std::string_view> SplitString(std::string_view s, char c) {
    std::vector<std::string_view> res;
    size_t pos = 0;
    while (pos < s.size()) {
        auto lineEnd = s.find(c, pos);
        if (lineEnd == std::string::npos) {
            lineEnd = s.size();
        }

        auto line = s.substr(pos, lineEnd - pos);
        res.push_back(line);
        pos = lineEnd + 1;
    }
    return res;
}

std::string ReadFile(const char* filepath) {
    FILE* file = fopen(filepath, "rb");
    if (!file) {
        throw std::runtime_error("failed to open file " + std::string{filepath});
    }

    fseek(file, 0, SEEK_END);
    long size = ftell(file);
    if (size < 0) {
        fclose(file);
        throw std::runtime_error("failed to size file " + std::string{filepath});
    }

    std::string buffer;
    buffer.resize(static_cast<size_t>(size));

    fseek(file, 0, SEEK_SET);
    size_t bytesRead = fread(buffer.data(), 1, buffer.size(), file);
    fclose(file);

    if (bytesRead != buffer.size()) {
        throw std::runtime_error("failed to read file " + std::string{filepath});
    }

    return buffer;
}

std::vector<std::string_view> GetLines(std::string_view data) {
    auto lines = SplitString(data, '\n');
    // Config files written on Windows
    for (auto& line : lines) {
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
    }
    return lines;
}
