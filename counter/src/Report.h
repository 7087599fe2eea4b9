#ifndef COUNTER_REPORT_H
#define COUNTER_REPORT_H

#include "Counter.h"

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace wordcount {

enum class SortOrder {
    Count,  // most frequent first, ties by unit
    Unit,
};

SortOrder ParseSortOrder(std::string_view name);

using ReportEntry = std::pair<std::string, size_t>;

/**
 * @brief Orders the entries of table deterministically.
 *
 * @param limit Keep only the first limit entries, 0 keeps all of them
 */
std::vector<ReportEntry> SortedEntries(const FrequencyTable& table, SortOrder order, size_t limit = 0);

/**
 * @brief Writes one "count<TAB>unit" row per entry.
 */
void WriteReport(std::ostream& out, const std::vector<ReportEntry>& entries);

std::string FormatSummary(CountMode mode, const FrequencyTable& table);

}  // namespace wordcount

#endif
