#include <gtest/gtest.h>
#include <stdexcept>
#include "feat.h"

using namespace semchart;

TEST(FeatTest, ParsePrintsBack) {
    FeatType fs = FeatStruct::Parse("[C=[D=?x], A=b]");
    EXPECT_EQ(fs->ToStr(), "[A=b, C=[D=?x]]");
    EXPECT_EQ(FeatStruct::Parse("[]")->ToStr(), "[]");
    EXPECT_TRUE(FeatStruct::Parse("")->IsEmpty());
}

TEST(FeatTest, BooleanFeatures) {
    FeatType fs = FeatStruct::Parse("[+TO, -AUX]");
    EXPECT_EQ(fs->Get("TO")->GetName(), "+");
    EXPECT_EQ(fs->Get("AUX")->GetName(), "-");
}

TEST(FeatTest, ValueKinds) {
    FeatType fs = FeatStruct::Parse(
            "[A=atom, B=?var, C=<\\x.dog(x)>, D=@x, E={<p(a)>, <q(a)>}, F='two words']");
    EXPECT_TRUE(fs->Get("A")->IsAtom());
    EXPECT_TRUE(fs->Get("B")->IsVariable());
    EXPECT_TRUE(fs->Get("C")->IsTerm());
    EXPECT_TRUE(fs->Get("D")->IsTerm());
    EXPECT_TRUE(fs->Get("D")->GetTerm()->IsPlaceholder());
    EXPECT_TRUE(fs->Get("E")->IsSet());
    EXPECT_EQ(fs->Get("E")->GetElements().size(), 2u);
    EXPECT_EQ(fs->Get("F")->GetName(), "two words");
}

TEST(FeatTest, PendingSetUnion) {
    FeatType fs = FeatStruct::Parse("[BO={{<bo(?det(?n),@x)>}+?b1+?b2}]");
    Value bo = fs->Get(kBo);
    ASSERT_TRUE(bo->IsSet());
    ASSERT_EQ(bo->GetElements().size(), 1u);
    EXPECT_EQ(bo->GetElements()[0]->ToStr(), "bo(?det(?n),@x)");
    EXPECT_EQ(bo->GetPending(), std::vector<std::string>({"b1", "b2"}));
    EXPECT_EQ(FeatureValue::Parse("{/}")->ToStr(), "{/}");
}

TEST(FeatTest, SetsCompareUnordered) {
    Value s1 = FeatureValue::Parse("{<p(a)>, <q(a)>, <p(a)>}");
    Value s2 = FeatureValue::Parse("{<q(a)>, <p(a)>}");
    EXPECT_EQ(s1->GetElements().size(), 2u);
    EXPECT_TRUE(s1->Equals(s2.get()));
    EXPECT_EQ(Canonical(s1), Canonical(s2));
}

TEST(FeatTest, GetPath) {
    FeatType fs = FeatStruct::Parse("[SEM=[CORE=<dog>, BO={/}]]");
    ASSERT_TRUE(fs->Get(kSemCore) != nullptr);
    EXPECT_EQ(fs->Get(kSemCore)->ToStr(), "<dog>");
    EXPECT_TRUE(fs->Get(kSemBo)->IsSet());
    EXPECT_TRUE(fs->Get(ParsePath("SEM.CORE.X")) == nullptr);
    EXPECT_TRUE(fs->Get("NUM") == nullptr);
}

TEST(FeatTest, CanonicalIgnoresVariableNames) {
    EXPECT_EQ(Canonical(FeatStruct::Parse("[A=?x, B=<f(?x)>]")),
              Canonical(FeatStruct::Parse("[A=?y, B=<f(?y)>]")));
    EXPECT_NE(Canonical(FeatStruct::Parse("[A=?x, B=?x]")),
              Canonical(FeatStruct::Parse("[A=?x, B=?y]")));
    EXPECT_NE(Canonical(FeatStruct::Parse("[A=<f(x)>]")),
              Canonical(FeatStruct::Parse("[A=<f(y)>]")));

    // set members mentioning a variable that is also used outside the set
    EXPECT_EQ(Canonical(FeatStruct::Parse("[A=?v9, B={<p(?v10)>, <p(?v9)>}]")),
              Canonical(FeatStruct::Parse("[A=?w1, B={<p(?w1)>, <p(?w2)>}]")));
    EXPECT_EQ(Canonical(FeatStruct::Parse("[A=?a, B={?b+?a}]")),
              Canonical(FeatStruct::Parse("[A=?z, B={?z+?c}]")));
    EXPECT_NE(Canonical(FeatStruct::Parse("[A=?a, B={<p(?a)>, <q(?b)>}]")),
              Canonical(FeatStruct::Parse("[A=?a, B={<p(?b)>, <q(?a)>}]")));
}

TEST(FeatTest, Malformed) {
    EXPECT_THROW(FeatStruct::Parse("[A=b, A=c]"), std::runtime_error);
    EXPECT_THROW(FeatStruct::Parse("[A=[B=c]"), std::runtime_error);
    EXPECT_THROW(FeatStruct::Parse("[A]"), std::runtime_error);
    EXPECT_THROW(FeatStruct::Parse("[A=<f(a>]"), std::runtime_error);
    EXPECT_THROW(FeatureValue::Parse("{atom}"), std::runtime_error);
}
