#include "Report.h"

#include "Counter.h"
#include "Util.h"

#include <algorithm>
#include <cstddef>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
#include <spdlog/spdlog.h>

namespace wordcount {

using namespace std::string_view_literals;

SortOrder ParseSortOrder(std::string_view name) {
    if (InsensitiveStrEquals(name, "count"sv)) {
        return SortOrder::Count;
    } else if (InsensitiveStrEquals(name, "unit"sv)) {
        return SortOrder::Unit;
    }
    throw std::runtime_error("Unknown sort order: " + std::string{name});
}

std::vector<ReportEntry> SortedEntries(const FrequencyTable& table, SortOrder order, size_t limit) {
    std::vector<ReportEntry> entries(table.begin(), table.end());

    if (order == SortOrder::Count) {
        std::sort(entries.begin(), entries.end(), [](const ReportEntry& a, const ReportEntry& b) {
            if (a.second != b.second) {
                return a.second > b.second;
            }
            return a.first < b.first;
        });
    } else {
        std::sort(entries.begin(), entries.end(), [](const ReportEntry& a, const ReportEntry& b) {
            return a.first < b.first;
        });
    }

    if (limit > 0 && entries.size() > limit) {
        entries.resize(limit);
    }
    return entries;
}

void WriteReport(std::ostream& out, const std::vector<ReportEntry>& entries) {
    for (const auto& [unit, count] : entries) {
        out << count << '\t' << unit << '\n';
    }
}

std::string FormatSummary(CountMode mode, const FrequencyTable& table) {
    return fmt::format("{} {} units, {} distinct", TotalUnits(table), mode, table.size());
}

}  // namespace wordcount
