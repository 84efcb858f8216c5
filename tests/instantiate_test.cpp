#include <gtest/gtest.h>
#include <set>
#include "instantiate.h"
#include "errors.h"

using namespace semchart;

namespace {

const char* kPropN = "[SEM=[CORE=<@x>, BO={<bo(\\P.P(John),@x)>}]]";

std::string CoreName(FeatType fs) {
    return fs->Get(kSemCore)->GetTerm()->GetName();
}

} // namespace

TEST(InstantiateTest, ReplacesEveryOccurrenceConsistently) {
    FeatType fs = InstantiatePlaceholders(FeatStruct::Parse(kPropN));
    TermType core = fs->Get(kSemCore)->GetTerm();
    ASSERT_TRUE(core->IsVariable());
    EXPECT_EQ(core->GetName().substr(0, 1), "x");

    TermType bo = fs->Get(kSemBo)->GetElements()[0];
    ASSERT_TRUE(bo->GetArgument()->IsVariable());
    EXPECT_EQ(bo->GetArgument()->GetName(), core->GetName());
    EXPECT_TRUE(Placeholders(fs).empty());
}

TEST(InstantiateTest, FreshVariablesAreUnique) {
    FeatType source = FeatStruct::Parse(kPropN);
    std::set<std::string> names;
    for (int i = 0; i < 100; i++)
        names.insert(CoreName(InstantiatePlaceholders(source)));
    EXPECT_EQ(names.size(), 100u);
}

TEST(InstantiateTest, FreshVariablesAreUniqueAcrossThreads) {
    FeatType source = FeatStruct::Parse(kPropN);
    std::vector<std::string> names(200);
    #pragma omp parallel for
    for (int i = 0; i < 200; i++)
        names[i] = CoreName(InstantiatePlaceholders(source));
    EXPECT_EQ(std::set<std::string>(names.begin(), names.end()).size(), 200u);
}

TEST(InstantiateTest, DistinctPlaceholders) {
    FeatType fs = InstantiatePlaceholders(FeatStruct::Parse("[A=<r(@x,@y,@x)>]"));
    TermType term = fs->Get("A")->GetTerm();
    std::string x = term->GetFunction()->GetFunction()->GetArgument()->GetName();
    std::string y = term->GetFunction()->GetArgument()->GetName();
    EXPECT_EQ(term->GetArgument()->GetName(), x);
    EXPECT_NE(x, y);
}

TEST(InstantiateTest, NothingToInstantiate) {
    FeatType fs = FeatStruct::Parse("[SEM=[CORE=<dog>, BO={/}]]");
    EXPECT_EQ(InstantiatePlaceholders(fs), fs);
}

TEST(InstantiateTest, CollisionIsCaptureHazard) {
    // the next name minted for @x is x<n+1>
    unsigned next = NextFreshId() + 1;
    FeatType fs = FeatStruct::Parse(
            "[A=<f(@x, x" + std::to_string(next) + ")>]");
    EXPECT_THROW(InstantiatePlaceholders(fs), CaptureHazard);
}
