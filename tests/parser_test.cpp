#include <gtest/gtest.h>
#include <algorithm>
#include <string>
#include "parser.h"
#include "grammar_loader.h"
#include "errors.h"

using namespace semchart;

namespace {

const std::string kBindop = std::string(SEMCHART_GRAMMAR_DIR) + "/bindop.fcfg";

const char* kAgreement =
    "S[NUM=?n] -> NP[NUM=?n] VP[NUM=?n]\n"
    "NP[NUM=sg] -> 'dog'\n"
    "NP[NUM=pl] -> 'dogs'\n"
    "VP[NUM=sg] -> 'barks'\n"
    "VP[NUM=pl] -> 'bark'\n";

class ParserTest: public ::testing::Test {
protected:
    ParserTest(): parser_(LoadGrammar(kBindop), Warn) {}

    ChartParser parser_;
};

} // namespace

TEST_F(ParserTest, SimpleSentence) {
    ParseResult res = parser_.Parse(3, "a dog barks");
    EXPECT_EQ(res.GetId(), 3);
    ASSERT_EQ(res.Size(), 1u);
    EdgeType parse = res.GetParses()[0];
    EXPECT_EQ(parse->GetCategory(), Category::Parse("S"));
    EXPECT_EQ(parse->GetStart(), 0);
    EXPECT_EQ(parse->GetEnd(), 3);
    EXPECT_EQ(Bracketed(parse).Get(), "(S (NP (Det a) (N dog)) (VP (IV barks)))");
    EXPECT_EQ(parse->ToStr(), "(S (NP (Det a) (N dog)) (VP (IV barks)))");
    // Det N IV VP NP S
    EXPECT_EQ(res.NumEdges(), 6u);
    EXPECT_EQ(parse->NumDescendants(), 5);
}

TEST_F(ParserTest, Derivation) {
    EdgeType parse = parser_.Parse(0, "a dog barks").GetParses()[0];
    std::string deriv = Derivation(parse).Get();
    // categories, words, then a rule line and a label per tree node
    EXPECT_EQ(std::count(deriv.begin(), deriv.end(), '\n'), 8);
    EXPECT_EQ(deriv.substr(0, deriv.find('\n')),
              std::string(" Det ") + "  N  " + "  IV   ");
    EXPECT_NE(Derivation(parse, true).Get().find("S[SEM=[BO="), std::string::npos);
}

TEST_F(ParserTest, NoParse) {
    EXPECT_TRUE(parser_.Parse(0, "dog a barks").NoParse());
    EXPECT_TRUE(parser_.Parse(0, "a unicorn barks").NoParse());
    EXPECT_TRUE(parser_.Parse(0, "a dog").NoParse());
    ParseResult empty = parser_.Parse(0, "");
    EXPECT_TRUE(empty.NoParse());
    EXPECT_EQ(empty.NumEdges(), 0u);
}

TEST_F(ParserTest, AmbiguousWord) {
    // walks is both IV and TV; only the IV reading completes
    ParseResult res = parser_.Parse(0, "john walks");
    ASSERT_EQ(res.Size(), 1u);
    EXPECT_EQ(res.GetParses()[0]->ToStr(), "(S (NP (PropN john)) (VP (IV walks)))");

    res = parser_.Parse(0, "john walks a dog");
    ASSERT_EQ(res.Size(), 1u);
    EXPECT_EQ(res.GetParses()[0]->ToStr(),
              "(S (NP (PropN john)) (VP (TV walks) (NP (Det a) (N dog))))");
}

TEST_F(ParserTest, ChartOverflow) {
    parser_.SetMaxEdges(3);
    EXPECT_THROW(parser_.Parse(0, "a dog barks"), ChartOverflow);
    parser_.SetMaxEdges(6);
    EXPECT_EQ(parser_.Parse(0, "a dog barks").Size(), 1u);
}

TEST_F(ParserTest, ParseSentences) {
    std::vector<std::string> doc = {
        "a dog barks", "dog a barks", "john walks", "a cat feeds a mouse"};
    std::vector<ParseResult> res = parser_.ParseSentences(doc);
    ASSERT_EQ(res.size(), 4u);
    for (unsigned i = 0; i < res.size(); i++)
        EXPECT_EQ(res[i].GetId(), (int)i);
    EXPECT_EQ(res[0].Size(), 1u);
    EXPECT_TRUE(res[1].NoParse());
    EXPECT_EQ(res[2].Size(), 1u);
    EXPECT_EQ(res[3].Size(), 1u);
    EXPECT_EQ(res[3].GetTokens().size(), 5u);
}

TEST_F(ParserTest, ParseSentencesRethrows) {
    parser_.SetMaxEdges(3);
    std::vector<std::string> doc = {"john", "a dog barks"};
    EXPECT_THROW(parser_.ParseSentences(doc), ChartOverflow);
}

TEST(ChartParserTest, TernaryRule) {
    ChartParser parser(ParseGrammarString(
            "S -> A B C\nA -> 'a'\nB -> 'b'\nC -> 'c'\n"), Warn);
    ParseResult res = parser.Parse(0, "a b c");
    ASSERT_EQ(res.Size(), 1u);
    EXPECT_EQ(res.GetParses()[0]->ToStr(), "(S (A a) (B b) (C c))");
    EXPECT_EQ(res.NumEdges(), 4u);
    EXPECT_TRUE(parser.Parse(0, "a b").NoParse());
    EXPECT_TRUE(parser.Parse(0, "a c b").NoParse());
}

TEST(ChartParserTest, Agreement) {
    ChartParser parser(ParseGrammarString(kAgreement), Warn);
    ParseResult res = parser.Parse(0, "dog barks");
    ASSERT_EQ(res.Size(), 1u);
    EXPECT_EQ(res.GetParses()[0]->GetFeatures()->ToStr(), "[NUM=sg]");
    res = parser.Parse(0, "dogs bark");
    ASSERT_EQ(res.Size(), 1u);
    EXPECT_EQ(res.GetParses()[0]->GetFeatures()->ToStr(), "[NUM=pl]");
    EXPECT_TRUE(parser.Parse(0, "dogs barks").NoParse());
    EXPECT_TRUE(parser.Parse(0, "dog bark").NoParse());
}

TEST(ChartParserTest, EquivalentEdgesAreMerged) {
    ChartParser parser(ParseGrammarString(
            "S -> N\nN -> 'dog'\nN -> 'dog'\n"), Warn);
    ParseResult res = parser.Parse(0, "dog");
    EXPECT_EQ(res.Size(), 1u);
    EXPECT_EQ(res.NumEdges(), 2u);
}

TEST(ChartParserTest, DistinctFeaturesAreKept) {
    ChartParser parser(ParseGrammarString(
            "S[K=a] -> A\nS[K=b] -> B\nA -> 'x'\nB -> 'x'\n"), Warn);
    ParseResult res = parser.Parse(0, "x");
    ASSERT_EQ(res.Size(), 2u);
    EXPECT_EQ(res.GetParses()[0]->GetFeatures()->ToStr(), "[K=a]");
    EXPECT_EQ(res.GetParses()[1]->GetFeatures()->ToStr(), "[K=b]");
}

TEST(ChartParserTest, OnlyStartCategorySpans) {
    ChartParser parser(ParseGrammarString(
            "% start S\nS -> NP VP\nNP -> 'dog'\nVP -> 'barks'\n"), Warn);
    EXPECT_TRUE(parser.Parse(0, "dog").NoParse());
    EXPECT_EQ(parser.Parse(0, "dog barks").Size(), 1u);
}
