// File: tests/unit/test_lang_combinators.cpp
// Purpose: Verify AND/OR evaluation, message merging and type preservation of
//          the should/andShould/orShould chain.
// Key invariants: Every leaf runs for every element; a violated node emits one
//                 merged event in written order; satisfied nodes emit nothing.
// Ownership/Lifetime: Standalone unit test executable.
// Links: docs/codemap.md

#include <gtest/gtest.h>

#include "ArchFixtures.hpp"
#include "RuleAssertions.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <type_traits>
#include <vector>

using namespace archcheck;
using namespace archcheck::lang;
using archcheck::test::kString;
using archcheck::test::kVoid;

namespace
{

/// Emits one event with a fixed verdict and text, counting invocations.
template <class T> class FixedCondition final : public Condition<T>
{
  public:
    FixedCondition(std::string description, bool violate, std::string text)
        : Condition<T>(std::move(description)), violate_(violate), text_(std::move(text))
    {
    }

    void check(const T &item, const core::CodeModel &, ConditionEvents &events) const override
    {
        ++calls;
        if (violate_)
            events.add(ConditionEvent::violated(item, text_));
        else
            events.add(ConditionEvent::satisfied(item, text_));
    }

    mutable std::atomic<int> calls{0};

  private:
    bool violate_;
    std::string text_;
};

template <class T = core::Member> std::shared_ptr<FixedCondition<T>> passing(const std::string &name)
{
    return std::make_shared<FixedCondition<T>>("be " + name, false, name + " holds");
}

template <class T = core::Member> std::shared_ptr<FixedCondition<T>> failing(const std::string &name)
{
    return std::make_shared<FixedCondition<T>>("be " + name, true, name + " broken");
}

core::CodeModel makeSingleMethodModel()
{
    build::ModelBuilder b;
    auto &a = b.addClass("p.A");
    b.addMethod(a, "run", {}, kVoid);
    return b.build();
}

} // namespace

TEST(LangCombinators, AndKeepsOnlyTheViolatedLeafText)
{
    core::CodeModel model = makeSingleMethodModel();
    auto a = passing("a");
    auto b = failing("b");
    auto result = syntax::methods().should(a).andShould(b).evaluate(model);

    const auto details = result.failureReport().details();
    ASSERT_EQ(details.size(), 1u);
    EXPECT_EQ(details[0], "b broken");
    EXPECT_EQ(details[0].find("a holds"), std::string::npos);
    EXPECT_EQ(a->calls.load(), 1);
    EXPECT_EQ(b->calls.load(), 1);
}

TEST(LangCombinators, OrHoldsWhenAnyLeafHolds)
{
    core::CodeModel model = makeSingleMethodModel();
    auto a = failing("a");
    auto b = passing("b");
    auto result = syntax::methods().should(a).orShould(b).evaluate(model);

    EXPECT_FALSE(result.hasViolation());
    EXPECT_TRUE(result.events().empty());
    EXPECT_EQ(a->calls.load(), 1);
    EXPECT_EQ(b->calls.load(), 1);
}

TEST(LangCombinators, LeavesRunEvenWhenTheFirstDecides)
{
    core::CodeModel model = makeSingleMethodModel();
    auto decidingAnd = failing("a");
    auto laterAnd = failing("b");
    auto decidingOr = passing("c");
    auto laterOr = passing("d");
    (void)syntax::methods().should(decidingAnd).andShould(laterAnd).evaluate(model);
    (void)syntax::methods().should(decidingOr).orShould(laterOr).evaluate(model);
    EXPECT_EQ(laterAnd->calls.load(), 1);
    EXPECT_EQ(laterOr->calls.load(), 1);
}

TEST(LangCombinators, OrOfTwoFailuresJoinsBothInWrittenOrder)
{
    core::CodeModel model = makeSingleMethodModel();
    auto rule = syntax::methods().should(failing("first")).orShould(failing("second"));
    EXPECT_TRUE(test::ruleViolatesExactly(rule, model, {"first broken and second broken"}));
    EXPECT_EQ(rule.description(), "methods should be first or should be second");
}

TEST(LangCombinators, LoneLeafPassesEventsThrough)
{
    core::CodeModel model = makeSingleMethodModel();
    auto broken = failing("y");
    auto both = conditions::and_<core::Member>(broken, passing("x"));

    auto leafResult = syntax::methods().should(conditions::haveName("stop")).evaluate(model);
    ASSERT_EQ(leafResult.events().size(), 1u);
    EXPECT_EQ(leafResult.failureReport().details()[0],
              "Method <p.A.run()> does not have name 'stop' in (A.java:0)");

    auto satisfiedLeaf = syntax::methods().should(conditions::haveName("run")).evaluate(model);
    ASSERT_EQ(satisfiedLeaf.events().size(), 1u);
    EXPECT_FALSE(satisfiedLeaf.hasViolation());

    auto joined = syntax::methods().should(both).evaluate(model);
    EXPECT_EQ(joined.events().size(), 1u);
    EXPECT_EQ(both->description(), "be y and be x");
}

TEST(LangCombinators, NestedTreesMergeOnlyViolatedSubtrees)
{
    core::CodeModel model = makeSingleMethodModel();
    // ((a AND b) OR c): the AND node reports "a", then the OR node adds "c".
    auto rule = syntax::methods().should(failing("a")).andShould(passing("b")).orShould(failing("c"));
    EXPECT_TRUE(test::ruleViolatesExactly(rule, model, {"a broken and c broken"}));
    EXPECT_EQ(rule.description(), "methods should be a and should be b or should be c");

    auto holds = syntax::methods().should(failing("a")).andShould(passing("b")).orShould(passing("c"));
    EXPECT_TRUE(test::ruleHolds(holds, model));
}

TEST(LangCombinators, ConditionLevelJoins)
{
    auto both = conditions::and_<core::Member>(failing("a"), failing("b"));
    auto either = conditions::or_<core::Member>(failing("a"), passing("b"));
    EXPECT_EQ(both->description(), "be a and be b");
    EXPECT_EQ(either->description(), "be a or be b");

    core::CodeModel model = makeSingleMethodModel();
    EXPECT_TRUE(test::ruleViolatesExactly(syntax::members().should(both), model, {"a broken and b broken"}));
    EXPECT_TRUE(test::ruleHolds(syntax::members().should(either), model));
}

TEST(LangCombinators, ThreeLeafOrMergesEverySubMessage)
{
    core::CodeModel model = test::makeTargetModel();
    auto rule = syntax::codeUnits()
                    .that(predicates::declaredIn("com.acme.Target"))
                    .should(conditions::beAnnotatedWith("com.acme.A"))
                    .orShould(conditions::beProtected())
                    .orShould(conditions::haveRawReturnType(kString));

    const std::string ctor = "Constructor <com.acme.Target.<init>(java.lang.String)>";
    EXPECT_TRUE(test::ruleViolatesExactly(
        rule,
        model,
        {ctor + " is not annotated with @A in (Target.java:4) and " + ctor +
         " does not have modifier PROTECTED in (Target.java:4) and " + ctor +
         " does not have raw return type java.lang.String in (Target.java:4)"}));
    EXPECT_EQ(rule.description(),
              "code units that are declared in com.acme.Target should be annotated with @A or should be protected "
              "or should have raw return type java.lang.String");
}

TEST(LangCombinators, SupertypeConditionsKeepTheSelectedKind)
{
    core::CodeModel model = makeSingleMethodModel();
    auto exists = passing<core::Member>("existing");
    auto methodOnly = failing<core::Method>("expected");

    auto chain = syntax::methods().should(exists).andShould(methodOnly);
    static_assert(std::is_same_v<decltype(chain), syntax::ElementsShould<core::Method>>);
    auto widened = chain.andShould(passing<core::Element>("element"));
    static_assert(std::is_same_v<decltype(widened), syntax::ElementsShould<core::Method>>);

    const auto details = widened.evaluate(model).failureReport().details();
    ASSERT_EQ(details.size(), 1u);
    EXPECT_NE(details[0].find("expected broken"), std::string::npos);

    auto units = syntax::codeUnits().should(passing<core::Member>("m")).orShould(failing<core::CodeUnit>("u"));
    static_assert(std::is_same_v<decltype(units), syntax::ElementsShould<core::CodeUnit>>);
    EXPECT_TRUE(test::ruleHolds(units, model));
}

TEST(LangCombinators, EvaluationIsDeterministic)
{
    auto scenario = test::WidgetScenario::make();
    auto rule = syntax::codeUnits()
                    .should(conditions::bePublic())
                    .andShould(conditions::notHaveRawParameterTypes(std::vector<std::string>{"java.lang.String"}));
    const auto first = rule.evaluate(scenario.model).failureReport().details();
    const auto second = rule.evaluate(scenario.model).failureReport().details();
    EXPECT_FALSE(first.empty());
    EXPECT_EQ(first, second);
}
