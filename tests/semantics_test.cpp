#include <gtest/gtest.h>
#include <string>
#include "semantics.h"
#include "parser.h"
#include "grammar_loader.h"
#include "errors.h"

using namespace semchart;

namespace {

const std::string kBindop = std::string(SEMCHART_GRAMMAR_DIR) + "/bindop.fcfg";

class SemanticsTest: public ::testing::Test {
protected:
    SemanticsTest(): parser_(LoadGrammar(kBindop), Warn) {}

    EdgeType ParseOne(const std::string& sent) {
        ParseResult res = parser_.Parse(0, sent);
        EXPECT_EQ(res.Size(), 1u) << sent;
        return res.GetParses().at(0);
    }

    ChartParser parser_;
    SemanticsComposer composer_;
};

::testing::AssertionResult IsAlpha(TermType actual, const std::string& expected) {
    if (AlphaEquivalent(actual, Term::Parse(expected)))
        return ::testing::AssertionSuccess();
    return ::testing::AssertionFailure()
        << actual->ToStr() << " is not alpha-equivalent to " << expected;
}

} // namespace

TEST_F(SemanticsTest, ProperName) {
    EdgeType parse = ParseOne("john walks");
    EXPECT_EQ(GetBindingOperators(parse->GetFeatures()).size(), 1u);
    EXPECT_TRUE(IsAlpha(composer_.Reading(parse), "bark(John)"));
}

TEST_F(SemanticsTest, Quantifier) {
    EdgeType parse = ParseOne("a dog barks");
    TermType core = GetCore(parse->GetFeatures());
    EXPECT_TRUE(core->IsApplication());
    EXPECT_TRUE(IsAlpha(composer_.Reading(parse), "exists x.(dog(x) & bark(x))"));
    EXPECT_EQ(composer_.Readings(parse).size(), 1u);
}

TEST_F(SemanticsTest, ScopeAmbiguity) {
    EdgeType parse = ParseOne("a dog feeds a cat");
    std::vector<TermType> readings = composer_.Readings(parse);
    ASSERT_EQ(readings.size(), 2u);
    // the operator stored last takes widest scope
    EXPECT_TRUE(IsAlpha(readings[0], "exists x.(cat(x) & exists z.(dog(z) & feed(z,x)))"));
    EXPECT_TRUE(IsAlpha(readings[1], "exists x.(dog(x) & exists z.(cat(z) & feed(x,z)))"));
    EXPECT_TRUE(AlphaEquivalent(composer_.Reading(parse), readings[0]));
    EXPECT_EQ(SemanticsComposer::UniqueReadings(readings).size(), 2u);
}

TEST_F(SemanticsTest, ProperNameWithQuantifier) {
    EdgeType parse = ParseOne("john feeds a mouse");
    std::vector<TermType> readings = composer_.Readings(parse);
    ASSERT_EQ(readings.size(), 2u);
    for (auto&& reading: readings)
        EXPECT_TRUE(IsAlpha(reading, "exists x.(mouse(x) & feed(John,x))"));
    EXPECT_EQ(SemanticsComposer::UniqueReadings(readings).size(), 1u);
}

TEST(SemanticsComposerTest, ComposeOrder) {
    TermType core = Term::Parse("love(x1,y1)");
    std::vector<BindingOperator> bos = {
        BindingOperator(Term::Parse("\\P.all z.(man(z) -> P(z))"), "x1"),
        BindingOperator(Term::Parse("\\P.exists z.(woman(z) & P(z))"), "y1")
    };
    SemanticsComposer composer;
    EXPECT_TRUE(IsAlpha(composer.Compose(core, bos, {0, 1}),
                        "exists w.(woman(w) & all m.(man(m) -> love(m,w)))"));
    EXPECT_TRUE(IsAlpha(composer.Compose(core, bos, {1, 0}),
                        "all m.(man(m) -> exists w.(woman(w) & love(m,w)))"));
    EXPECT_TRUE(IsAlpha(composer.Compose(core, bos, {}), "love(x1,y1)"));
    EXPECT_THROW(composer.Compose(core, bos, {2}), std::out_of_range);
}

TEST(SemanticsComposerTest, BindingOperatorFromTerm) {
    BindingOperator bo = BindingOperator::FromTerm(Term::Parse("bo(\\P.P(John),x1)"));
    EXPECT_EQ(bo.GetVariable(), "x1");
    EXPECT_TRUE(IsAlpha(bo.GetExpr(), "\\P.P(John)"));
    EXPECT_TRUE(IsAlpha(bo.Apply(Term::Parse("walk(x1)")), "(\\P.P(John))(\\x1.walk(x1))"));

    EXPECT_THROW(BindingOperator::FromTerm(Term::Parse("bo(\\P.P(John),@x)")), CaptureHazard);
    EXPECT_THROW(BindingOperator::FromTerm(Term::Parse("bo(\\P.P(John),John)")), std::runtime_error);
    EXPECT_THROW(BindingOperator::FromTerm(Term::Parse("f(\\P.P(John),x1)")), CaptureHazard);
    EXPECT_THROW(BindingOperator::FromTerm(Term::Parse("bo(x1)")), CaptureHazard);
}

TEST(SemanticsComposerTest, OperatorBoundToConstantIsInputError) {
    ChartParser parser(ParseGrammarString(
            "S[SEM=[CORE=<bark(?v)>, BO={<bo(\\P.P(John),?v)>}]] -> N[SEM=<?v>]\n"
            "N[SEM=<John>] -> 'john'\n"), Warn);
    ParseResult res = parser.Parse(0, "john");
    ASSERT_EQ(res.Size(), 1u);
    SemanticsComposer composer;
    EXPECT_THROW(composer.Reading(res.GetParses()[0]), std::runtime_error);
}

TEST(SemanticsComposerTest, PlaceholderInCore) {
    SemanticsComposer composer;
    EXPECT_THROW(composer.Compose(Term::Parse("walk(@x)"), {}, {}), CaptureHazard);
}

TEST(SemanticsComposerTest, StepBound) {
    SemanticsComposer composer(5);
    EXPECT_EQ(composer.GetMaxSteps(), 5u);
    EXPECT_THROW(composer.Compose(Term::Parse("(\\x.x(x))(\\x.x(x))"), {}, {}),
                 NonTerminatingReduction);
}

TEST(SemanticsComposerTest, CoreAndOperators) {
    FeatType plain = FeatStruct::Parse("[SEM=<walk(John)>]");
    EXPECT_TRUE(IsAlpha(GetCore(plain), "walk(John)"));
    EXPECT_TRUE(GetBindingOperators(plain).empty());

    FeatType pending = FeatStruct::Parse("[SEM=[CORE=<walk(x1)>, BO={{<bo(\\P.P(John),x1)>}+?b}]]");
    EXPECT_EQ(GetBindingOperators(pending).size(), 1u);

    EXPECT_THROW(GetCore(FeatStruct::Parse("[NUM=sg]")), std::runtime_error);
    EXPECT_THROW(GetCore(FeatStruct::Parse("[SEM=[BO={/}]]")), std::runtime_error);
}

TEST(SemanticsComposerTest, UniqueReadings) {
    std::vector<TermType> readings = {
        Term::Parse("\\x.P(x)"), Term::Parse("\\y.P(y)"), Term::Parse("\\y.Q(y)")};
    std::vector<TermType> unique = SemanticsComposer::UniqueReadings(readings);
    ASSERT_EQ(unique.size(), 2u);
    EXPECT_EQ(unique[0], readings[0]);
    EXPECT_EQ(unique[1], readings[2]);
}
