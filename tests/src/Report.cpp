#include "Counter.h"
#include "Report.h"

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <gtest/gtest.h>

using namespace wordcount;

class ReportTest : public ::testing::Test {
protected:
    FrequencyTable table = {
        {"pear", 2},
        {"apple", 5},
        {"fig", 2},
        {"kiwi", 1},
        {"banana", 2},
    };
};

TEST_F(ReportTest, SortsByCountThenUnit) {
    std::vector<ReportEntry> expected = {
        { "apple", 5},
        {"banana", 2},
        {   "fig", 2},
        {  "pear", 2},
        {  "kiwi", 1},
    };
    EXPECT_EQ(SortedEntries(table, SortOrder::Count), expected);
}

TEST_F(ReportTest, SortsByUnit) {
    std::vector<ReportEntry> expected = {
        { "apple", 5},
        {"banana", 2},
        {   "fig", 2},
        {  "kiwi", 1},
        {  "pear", 2},
    };
    EXPECT_EQ(SortedEntries(table, SortOrder::Unit), expected);
}

TEST_F(ReportTest, LimitKeepsLeadingEntries) {
    std::vector<ReportEntry> expected = {
        { "apple", 5},
        {"banana", 2},
    };
    EXPECT_EQ(SortedEntries(table, SortOrder::Count, 2), expected);
    EXPECT_EQ(SortedEntries(table, SortOrder::Count, 100).size(), table.size());
    EXPECT_EQ(SortedEntries(table, SortOrder::Count, 0).size(), table.size());
}

TEST_F(ReportTest, WritesTabSeparatedRows) {
    std::ostringstream out;
    WriteReport(out, SortedEntries(table, SortOrder::Count, 3));
    EXPECT_EQ(out.str(), "5\tapple\n2\tbanana\n2\tfig\n");
}

TEST_F(ReportTest, EmptyTableWritesNothing) {
    std::ostringstream out;
    WriteReport(out, SortedEntries(FrequencyTable{}, SortOrder::Count));
    EXPECT_EQ(out.str(), "");
}

TEST_F(ReportTest, FormatsSummary) {
    EXPECT_EQ(FormatSummary(CountMode::Word, table), "12 word units, 5 distinct");
    EXPECT_EQ(FormatSummary(CountMode::Line, FrequencyTable{}), "0 line units, 0 distinct");
}

TEST(SortOrderTest, ParsesNames) {
    EXPECT_EQ(ParseSortOrder("count"), SortOrder::Count);
    EXPECT_EQ(ParseSortOrder("Unit"), SortOrder::Unit);
    EXPECT_THROW(ParseSortOrder("frequency"), std::runtime_error);
}
