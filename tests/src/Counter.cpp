#include "Counter.h"

#include "data/LineReader.h"
#include "data/Reader.h"

#include <span>
#include <sstream>
#include <stdexcept>
#include <string>
#include <gtest/gtest.h>

using namespace wordcount;

namespace {

FrequencyTable CountString(const std::string& s, CountMode mode) {
    std::istringstream in(s);
    return Count(in, mode);
}

// 'a', then a 4-byte lead whose sequence is cut short by another lead byte
const std::string MalformedInput{'a', '\xf0', '\x90', '\x80', '\xe3', '\x81', '\x82'};

}  // namespace

TEST(CounterTest, WordModeCountsRepeatedWords) {
    FrequencyTable expected = {
        {"aa", 1},
        {"bb", 2},
        {"cc", 1},
    };
    EXPECT_EQ(CountString("aa bb cc bb", CountMode::Word), expected);
}

TEST(CounterTest, WordModeHasOnlyWordsFromInput) {
    auto freqs = CountString("aa cc dd", CountMode::Word);
    EXPECT_EQ(freqs.size(), 3);
    EXPECT_EQ(freqs["aa"], 1);
    EXPECT_EQ(freqs["cc"], 1);
    EXPECT_EQ(freqs["dd"], 1);
}

TEST(CounterTest, WordModeIsCaseSensitive) {
    auto freqs = CountString("Word word WORD word", CountMode::Word);
    EXPECT_EQ(freqs.size(), 3);
    EXPECT_EQ(freqs["word"], 2);
    EXPECT_EQ(freqs["Word"], 1);
    EXPECT_EQ(freqs["WORD"], 1);
}

TEST(CounterTest, WordModeSplitsOnPunctuation) {
    FrequencyTable expected = {
        {"foo", 1},
        {"bar", 2},
        {"baz", 1},
        {"qux", 1},
    };
    EXPECT_EQ(CountString("foo-bar, (baz.qux) bar!", CountMode::Word), expected);
}

TEST(CounterTest, WordModeKeepsDigitsAndUnderscores) {
    FrequencyTable expected = {
        {"snake_case", 1},
        {"x1", 1},
        {"42", 1},
        {"_", 1},
    };
    EXPECT_EQ(CountString("snake_case x1 42 _", CountMode::Word), expected);
}

TEST(CounterTest, WordModeIsUnicodeAware) {
    FrequencyTable expected = {
        {"héllo", 1},
        {"wörld_1", 1},
        {"日本", 1},
    };
    EXPECT_EQ(CountString("héllo, wörld_1 — 日本。", CountMode::Word), expected);
}

TEST(CounterTest, WordModeKeepsCombiningMarksInWord) {
    // e followed by U+0301 COMBINING ACUTE ACCENT
    auto freqs = CountString("caf\x65\xcc\x81 cafe", CountMode::Word);
    EXPECT_EQ(freqs.size(), 2);
    EXPECT_EQ(freqs["caf\x65\xcc\x81"], 1);
    EXPECT_EQ(freqs["cafe"], 1);
}

TEST(CounterTest, WordModeWordsDoNotSpanLines) {
    FrequencyTable expected = {
        {"ab", 2},
        {"c", 1},
    };
    EXPECT_EQ(CountString("ab\nab\r\nc", CountMode::Word), expected);
}

TEST(CounterTest, WordModeIgnoresLinesWithoutWords) {
    EXPECT_TRUE(CountString("!!! ... ---\n\n   \n", CountMode::Word).empty());
}

TEST(CounterTest, DefaultModeIsWord) {
    std::istringstream withDefault("one two two\nthree");
    std::istringstream explicitWord("one two two\nthree");

    EXPECT_EQ(DefaultCountMode, CountMode::Word);
    EXPECT_EQ(Count(withDefault), Count(explicitWord, CountMode::Word));
}

TEST(CounterTest, CharModeCountsEachCharacter) {
    FrequencyTable expected = {
        {"a", 1},
        {"b", 1},
    };
    EXPECT_EQ(CountString("ab", CountMode::Char), expected);
}

TEST(CounterTest, CharModeCountsCodePointsNotBytes) {
    auto freqs = CountString("aé日😀a", CountMode::Char);
    EXPECT_EQ(freqs.size(), 4);
    EXPECT_EQ(freqs["a"], 2);
    EXPECT_EQ(freqs["é"], 1);
    EXPECT_EQ(freqs["日"], 1);
    EXPECT_EQ(freqs["😀"], 1);
    EXPECT_EQ(TotalUnits(freqs), 5);
}

TEST(CounterTest, CharModeCountsSpacesButNotTerminators) {
    FrequencyTable expected = {
        {"a", 2},
        {" ", 1},
        {"b", 1},
    };
    EXPECT_EQ(CountString("a b\r\na\n", CountMode::Char), expected);
}

TEST(CounterTest, LineModeCountsDistinctLines) {
    FrequencyTable expected = {
        {"first line", 1},
        {"second line", 1},
    };
    EXPECT_EQ(CountString("first line\nsecond line\n", CountMode::Line), expected);
}

TEST(CounterTest, LineModeAccumulatesRepeatedLines) {
    FrequencyTable expected = {
        {"x", 3},
        {"y", 1},
    };
    EXPECT_EQ(CountString("x\ny\nx\r\nx", CountMode::Line), expected);
}

TEST(CounterTest, LineModeCountsEmptyLines) {
    FrequencyTable expected = {
        {"", 2},
        {"a", 1},
    };
    EXPECT_EQ(CountString("\n\na\n", CountMode::Line), expected);
}

TEST(CounterTest, LineModeKeepsLoneCarriageReturn) {
    FrequencyTable expected = {
        {"a\rb", 1},
    };
    EXPECT_EQ(CountString("a\rb\r\n", CountMode::Line), expected);
}

TEST(CounterTest, CrLfAndLfGiveSameResult) {
    for (auto mode : {CountMode::Char, CountMode::Word, CountMode::Line}) {
        EXPECT_EQ(CountString("one two\nthree\n\nfour\n", mode), CountString("one two\r\nthree\r\n\r\nfour\r\n", mode))
            << "mode " << CountModeName(mode);
    }
}

TEST(CounterTest, EmptyInputGivesEmptyTable) {
    for (auto mode : {CountMode::Char, CountMode::Word, CountMode::Line}) {
        EXPECT_TRUE(CountString("", mode).empty()) << "mode " << CountModeName(mode);
    }
}

TEST(CounterTest, TotalMatchesNumberOfUnits) {
    const std::string text = "the cat\nsat on the mat\n\nthe end é\n";

    EXPECT_EQ(TotalUnits(CountString(text, CountMode::Char)), 30);
    EXPECT_EQ(TotalUnits(CountString(text, CountMode::Word)), 9);
    EXPECT_EQ(TotalUnits(CountString(text, CountMode::Line)), 4);
}

TEST(CounterTest, RepeatedCallsAreDeterministic) {
    const std::string text = "b a c a\nb b\nzz é é\n";
    for (auto mode : {CountMode::Char, CountMode::Word, CountMode::Line}) {
        EXPECT_EQ(CountString(text, mode), CountString(text, mode)) << "mode " << CountModeName(mode);
    }
}

TEST(CounterTest, InvalidUtf8FailsInEveryMode) {
    for (auto mode : {CountMode::Char, CountMode::Word, CountMode::Line}) {
        EXPECT_THROW(CountString(MalformedInput, mode), InvalidEncodingError) << "mode " << CountModeName(mode);
    }
}

TEST(CounterTest, InvalidUtf8ReportsLineAndOffset) {
    try {
        CountString("fine\nalso fine\nbad \xff byte\nnever read", CountMode::Line);
        FAIL() << "expected InvalidEncodingError";
    } catch (const InvalidEncodingError& e) {
        EXPECT_EQ(e.Line(), 3);
        EXPECT_EQ(e.Offset(), 4);
    }

    try {
        CountString(MalformedInput, CountMode::Word);
        FAIL() << "expected InvalidEncodingError";
    } catch (const InvalidEncodingError& e) {
        EXPECT_EQ(e.Line(), 1);
        EXPECT_EQ(e.Offset(), 1);
    }
}

TEST(CounterTest, InvalidEncodingIsARuntimeError) {
    EXPECT_THROW(CountString("\xc0\xaf", CountMode::Char), std::runtime_error);
}

TEST(CounterTest, CountsFromAnyLineSource) {
    const std::string text = "x y\nx\n";
    data::BufferReader reader(std::span<const char>(text.data(), text.size()));
    data::LineReader<data::BufferReader> lines(reader, 2);

    FrequencyTable expected = {
        {"x", 2},
        {"y", 1},
    };
    EXPECT_EQ(Count(lines, CountMode::Word), expected);
}

TEST(CounterTest, StreamWithExceptionsEnabled) {
    std::istringstream in("aa bb\naa");
    in.exceptions(std::ios::failbit | std::ios::badbit);

    FrequencyTable expected = {
        {"aa", 2},
        {"bb", 1},
    };
    EXPECT_EQ(Count(in, CountMode::Word), expected);
}

TEST(CounterTest, StreamAlreadyAtEndGivesEmptyTable) {
    std::istringstream in("");
    in.get();
    EXPECT_TRUE(Count(in, CountMode::Line).empty());
}

TEST(FrequencyCounterTest, FinishHandsOverAndResets) {
    FrequencyCounter counter(CountMode::Line);
    counter.AddLine("a", 1);
    counter.AddLine("a", 2);

    auto first = counter.Finish();
    EXPECT_EQ(first.size(), 1);
    EXPECT_EQ(first["a"], 2);

    EXPECT_TRUE(counter.Finish().empty());
}

TEST(CountModeTest, ParsesNamesCaseInsensitively) {
    EXPECT_EQ(ParseCountMode("char"), CountMode::Char);
    EXPECT_EQ(ParseCountMode("Word"), CountMode::Word);
    EXPECT_EQ(ParseCountMode("LINE"), CountMode::Line);
    EXPECT_THROW(ParseCountMode("words"), std::runtime_error);
    EXPECT_THROW(ParseCountMode(""), std::runtime_error);
}

TEST(CountModeTest, NamesRoundTrip) {
    for (auto mode : {CountMode::Char, CountMode::Word, CountMode::Line}) {
        EXPECT_EQ(ParseCountMode(CountModeName(mode)), mode);
    }
}

// A rejected line leaves what was counted before it untouched
TEST(FrequencyCounterTest, InvalidLineAddsNothing) {
    for (auto mode : {CountMode::Char, CountMode::Word, CountMode::Line}) {
        FrequencyCounter counter(mode);
        counter.AddLine("ok", 1);

        EXPECT_THROW(counter.AddLine("fine \xff", 2), InvalidEncodingError);

        auto table = counter.Finish();
        EXPECT_EQ(table.count("fine"), 0) << "mode " << CountModeName(mode);
        EXPECT_EQ(table.count("f"), 0) << "mode " << CountModeName(mode);
        EXPECT_EQ(TotalUnits(table), mode == CountMode::Char ? 2 : 1) << "mode " << CountModeName(mode);
    }
}
