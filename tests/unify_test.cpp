#include <gtest/gtest.h>
#include "unify.h"

using namespace semchart;

namespace {

Value Fs(const std::string& str) { return FeatStruct::Parse(str); }

} // namespace

TEST(UnifyTest, Atoms) {
    EXPECT_EQ(Unify(Fs("[A=a]"), Fs("[A=a]"))->ToStr(), "[A=a]");
    EXPECT_TRUE(Unify(Fs("[A=a]"), Fs("[A=b]")) == nullptr);
}

TEST(UnifyTest, KeepsUnionOfPaths) {
    Value res = Unify(Fs("[A=a, B=[C=c]]"), Fs("[B=[D=d], E=e]"));
    ASSERT_TRUE(res != nullptr);
    EXPECT_EQ(res->ToStr(), "[A=a, B=[C=c, D=d], E=e]");
}

TEST(UnifyTest, VariablesAreShared) {
    Value res = Unify(Fs("[A=?x, B=?x]"), Fs("[A=a]"));
    ASSERT_TRUE(res != nullptr);
    EXPECT_EQ(res->ToStr(), "[A=a, B=a]");
    EXPECT_TRUE(Unify(Fs("[A=?x, B=?x]"), Fs("[A=a, B=b]")) == nullptr);
}

TEST(UnifyTest, OccursCheck) {
    EXPECT_TRUE(Unify(Fs("[A=?x]"), Fs("[A=<f(?x)>]")) == nullptr);
    EXPECT_TRUE(Unify(Fs("[A=?x]"), Fs("[A=[B=?x]]")) == nullptr);
}

TEST(UnifyTest, TermsUnifyStructurally) {
    Value res = Unify(Fs("[S=<love(?x,mary)>]"), Fs("[S=<love(john,?y)>]"));
    ASSERT_TRUE(res != nullptr);
    EXPECT_EQ(res->ToStr(), "[S=<love(john,mary)>]");
    EXPECT_TRUE(Unify(Fs("[S=<love(?x,mary)>]"), Fs("[S=<hate(john,?y)>]")) == nullptr);
}

TEST(UnifyTest, FeatureVariableInsideTerm) {
    Value res = Unify(Fs("[A=?f, B=<?f(John)>]"), Fs("[A=<\\x.bark(x)>]"));
    ASSERT_TRUE(res != nullptr);
    EXPECT_EQ(res->AsStruct().Get("B")->ToStr(), "<(\\x.bark(x))(John)>");
}

TEST(UnifyTest, AtomMatchesConstant) {
    Value res = Unify(Fs("[X=john]"), Fs("[X=<john>]"));
    ASSERT_TRUE(res != nullptr);
    EXPECT_EQ(res->ToStr(), "[X=<john>]");
    EXPECT_TRUE(Unify(Fs("[X=mary]"), Fs("[X=<john>]")) == nullptr);

    res = Unify(Fs("[X=john, Y=<love(?X,mary)>]"), Fs("[X=?X]"));
    ASSERT_TRUE(res != nullptr);
    EXPECT_EQ(res->AsStruct().Get("Y")->ToStr(), "<love(john,mary)>");
}

TEST(UnifyTest, StructureInTermPositionFails) {
    EXPECT_TRUE(Unify(Fs("[A=?f, B=<?f(John)>]"), Fs("[A=[C=c]]")) == nullptr);
}

TEST(UnifyTest, SetsMerge) {
    Value res = Unify(Fs("[BO={<p(a)>}]"), Fs("[BO={<q(a)>, <p(a)>}]"));
    ASSERT_TRUE(res != nullptr);
    EXPECT_TRUE(res->AsStruct().Get("BO")->Equals(
            FeatureValue::Parse("{<p(a)>, <q(a)>}").get()));
}

TEST(UnifyTest, PendingSetVariablesResolve) {
    Bindings bindings;
    Value pattern = Fs("[L=?b1, R=?b2]");
    Value res = Unify(pattern, Fs("[L={<p(a)>}, R={<q(a)>}]"), &bindings);
    ASSERT_TRUE(res != nullptr);
    Value merged = Substitute(FeatureValue::Parse("{{<r(a)>}+?b1+?b2+?b3}"), bindings);
    ASSERT_TRUE(merged != nullptr);
    EXPECT_EQ(merged->GetElements().size(), 3u);
    EXPECT_EQ(merged->GetPending(), std::vector<std::string>({"b3"}));
}

TEST(UnifyTest, Idempotent) {
    std::vector<std::string> structures = {
        "[A=a, B=[C=?x, D=<f(?x)>]]",
        "[SEM=[CORE=<?vp(?subj)>, BO={?b1+?b2}]]",
        "[SEM=[CORE=<@x>, BO={{<bo(?det(?n),@x)>}+?b1+?b2}]]",
        "[NUM=sg, +TO, SEM=<\\x y.feed(y,x)>]",
    };
    for (auto&& str: structures) {
        Value fs = Fs(str);
        Value res = Unify(fs, fs);
        ASSERT_TRUE(res != nullptr) << str;
        EXPECT_TRUE(res->Equals(fs.get())) << str << " " << res->ToStr();
    }
}

TEST(UnifyTest, Commutative) {
    std::vector<std::pair<std::string, std::string>> pairs = {
        {"[A=?x, B=b]", "[A=a, C=<g(?y)>]"},
        {"[A=?x, B=?x]", "[A=?y, C=?y]"},
        {"[S=<love(?x,mary)>]", "[S=<love(john,?y)>]"},
        {"[BO={<p(a)>}, X=john]", "[BO={<q(a)>}, X=<john>]"},
        {"[A=[B=?x]]", "[A=?y, C=?y]"},
    };
    for (auto&& pair: pairs) {
        Value res1 = Unify(Fs(pair.first), Fs(pair.second));
        Value res2 = Unify(Fs(pair.second), Fs(pair.first));
        ASSERT_TRUE(res1 != nullptr && res2 != nullptr) << pair.first;
        EXPECT_EQ(Canonical(res1), Canonical(res2)) << pair.first << " " << pair.second;
    }
}

TEST(UnifyTest, VariableRepresentativeIsOrderIndependent) {
    EXPECT_EQ(Unify(Fs("[A=?x]"), Fs("[A=?y]"))->ToStr(), "[A=?x]");
    EXPECT_EQ(Unify(Fs("[A=?y]"), Fs("[A=?x]"))->ToStr(), "[A=?x]");
    EXPECT_EQ(Unify(Fs("[A=?x, B=?x]"), Fs("[A=?y, C=?y]"))->ToStr(),
              Unify(Fs("[A=?y, C=?y]"), Fs("[A=?x, B=?x]"))->ToStr());
    EXPECT_EQ(Unify(Fs("[S=<f(?y)>]"), Fs("[S=<f(?x)>]"))->ToStr(), "[S=<f(?x)>]");
    EXPECT_EQ(Unify(Fs("[S=<f(?x)>]"), Fs("[S=<f(?y)>]"))->ToStr(), "[S=<f(?x)>]");
}

TEST(UnifyTest, RenameApart) {
    std::unordered_map<std::string, std::string> renaming;
    Value fs = RenameApart(Fs("[A=?x, B=<f(?x)>, C={{<g(?y)>}+?b}]"), &renaming);
    ASSERT_EQ(renaming.size(), 3u);
    const std::string& x = renaming["x"];
    EXPECT_NE(x, "x");
    EXPECT_EQ(fs->AsStruct().Get("A")->GetName(), x);
    EXPECT_EQ(fs->AsStruct().Get("B")->ToStr(), "<f(?" + x + ")>");
    EXPECT_EQ(fs->AsStruct().Get("C")->GetPending()[0], renaming["b"]);

    std::unordered_map<std::string, std::string> other;
    Value again = RenameApart(Fs("[A=?x]"), &other);
    EXPECT_NE(again->AsStruct().Get("A")->GetName(), x);
}
