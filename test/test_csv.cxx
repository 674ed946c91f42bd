/// @file
/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#include <gtest/gtest.h>

#include <stash/csv/csv.hxx>

#include <sstream>

using namespace stash;
using namespace stash::csv::impl;

using Adapter = parse::StringStreamAdapter;

TEST(CsvParser, Unquoted) {
    Parser parser{Adapter{"a,bbb,cc\ndd,e,f\ng,hh,iii"}};
    Value value = parser.parse();
    EXPECT_EQ(value.to_str(), R"([["a", "bbb", "cc"], ["dd", "e", "f"], ["g", "hh", "iii"]])");
}

TEST(CsvParser, DoubleQuoted) {
    Parser parser{Adapter{"\"a\",\"b,b\"\n\"say \"\"hi\"\"\",\"x\ny\"\n"}};
    Value value = parser.parse();
    ASSERT_EQ(value.size(), 2UL);
    EXPECT_EQ(value.get(0).get(1), "b,b");
    EXPECT_EQ(value.get(1).get(0), "say \"hi\"");
    EXPECT_EQ(value.get(1).get(1), "x\ny");
}

TEST(CsvParser, EmptyCellsAreNil) {
    Parser parser{Adapter{"a,,c\n,b,\n"}};
    Value value = parser.parse();
    EXPECT_EQ(value.to_str(), R"([["a", nil, "c"], [nil, "b", nil]])");
}

TEST(CsvParser, QuotedEmptyCellIsString) {
    Parser parser{Adapter{"\"\",x\n"}};
    Value value = parser.parse();
    EXPECT_EQ(value.get(0).get(0), "");
}

TEST(CsvParser, CarriageReturnLineFeed) {
    Parser parser{Adapter{"Title,Author\r\nMoby Dick,Herman Melville\r\nMiddlemarch,George Eliot\r\n"}};
    Value value = parser.parse();
    ASSERT_EQ(value.size(), 3UL);
    for (size_t i=0; i<value.size(); i++)
        EXPECT_EQ(value.get(i).size(), 2UL);
    EXPECT_EQ(value.get(1).get(0), "Moby Dick");
    EXPECT_EQ(value.get(2).get(1), "George Eliot");
}

TEST(CsvParser, UnterminatedQuote) {
    Parser parser{Adapter{"a,\"bc\n"}};
    Value value = parser.parse();
    EXPECT_TRUE(value.is_empty());
    EXPECT_EQ(parser.error(), "Unterminated quoted field");
}

TEST(CsvParser, TextAfterQuote) {
    Parser parser{Adapter{"\"a\"b,c\n"}};
    Value value = parser.parse();
    EXPECT_TRUE(value.is_empty());
    EXPECT_EQ(parser.error(), "Expected comma or new-line");
}

TEST(Csv, ParseThrowsSyntaxError) {
    EXPECT_THROW(csv::parse("\"open"), parse::SyntaxError);
}

TEST(Csv, ParseReportsError) {
    std::optional<csv::ParseError> error;
    auto value = csv::parse("x\n\"open", error);
    EXPECT_TRUE(value.is_empty());
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->error_message, "Unterminated quoted field");
}

TEST(Csv, Write) {
    List rows;
    rows.push_back(List{"name", "score", "ok"});
    rows.push_back(List{"a,b", 1.5, true});
    rows.push_back(List{"say \"hi\"", nil, false});
    rows.push_back(List{"", -3, UInt{7}});

    std::stringstream ss;
    csv::write(ss, rows);
    EXPECT_EQ(ss.str(), "name,score,ok\n\"a,b\",1.5,true\n\"say \"\"hi\"\"\",,false\n\"\",-3,7\n");
}

TEST(Csv, WriteThenParse) {
    List rows;
    rows.push_back(List{"multi\nline", "plain"});
    rows.push_back(List{nil, "x"});

    std::stringstream ss;
    csv::write(ss, rows);
    auto value = csv::parse(ss.str());
    EXPECT_EQ(value, Value{rows});
}

TEST(Csv, WriteRejectsBytes) {
    List rows;
    rows.push_back(List{Bytes{1}});
    std::stringstream ss;
    EXPECT_THROW(csv::write(ss, rows), WrongType);
}
