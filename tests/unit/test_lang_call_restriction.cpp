// File: tests/unit/test_lang_call_restriction.cpp
// Purpose: Verify the "only be called by ..." conditions and
//          onlyDependOnClassesThat against hand-built call graphs.
// Key invariants: A caller of the wrong kind always violates; otherwise the
//                 predicate decides, one event per rejected edge.
// Ownership/Lifetime: Standalone unit test executable.
// Links: docs/codemap.md

#include <gtest/gtest.h>

#include "ArchFixtures.hpp"
#include "RuleAssertions.hpp"

#include <string>
#include <vector>

using namespace archcheck;
using namespace archcheck::lang;
using archcheck::test::kString;
using archcheck::test::kVoid;
using archcheck::test::WidgetScenario;

namespace
{

const std::string kWidgetCtor = "constructor <com.acme.Widget.<init>(java.lang.String)>";
const std::string kWidgetUse = "method <com.acme.Widget.use(java.lang.String)>";
const std::string kGoodCtor = "Constructor <com.acme.GoodCaller.<init>()>";
const std::string kGoodCall = "Method <com.acme.GoodCaller.call()>";
const std::string kBadCall = "Method <com.acme.BadCaller.callWrongly()>";

std::string at(const std::string &file, uint32_t line)
{
    return " in (" + file + ":" + std::to_string(line) + ")";
}

} // namespace

TEST(LangCallRestriction, ConstructorsOnlyCalledByGoodCaller)
{
    auto scenario = WidgetScenario::make();
    auto rule = syntax::constructors().shouldOnlyBeCalled().byClassesThat(
        predicates::belongToAnyOf({"com.acme.GoodCaller"}));

    EXPECT_TRUE(test::ruleViolatesExactly(
        rule,
        scenario.model,
        {kBadCall + " calls " + kWidgetCtor + at("BadCaller.java", WidgetScenario::kBadMethodLine)}));
    EXPECT_EQ(rule.description(),
              "constructors should only be called by classes that belong to any of [com.acme.GoodCaller]");
}

TEST(LangCallRestriction, ViolationsCorrelateCallerAndCallee)
{
    auto scenario = WidgetScenario::make();
    auto rule = syntax::constructors().shouldOnlyBeCalled().byClassesThat(
        predicates::belongToAnyOf({"com.acme.GoodCaller"}));
    auto result = rule.evaluate(scenario.model);

    const core::Class *bad = scenario.model.findClass("com.acme.BadCaller");
    const core::Class *widget = scenario.model.findClass("com.acme.Widget");
    ASSERT_NE(bad, nullptr);
    ASSERT_NE(widget, nullptr);
    ASSERT_EQ(bad->methods().size(), 1u);
    ASSERT_EQ(widget->constructors().size(), 1u);

    std::vector<const ConditionEvent *> violations;
    for (const auto &event : result.events().events())
        if (event.isViolation())
            violations.push_back(&event);
    ASSERT_EQ(violations.size(), 1u);
    const auto &correlated = violations[0]->correlatedElements();
    ASSERT_EQ(correlated.size(), 2u);
    EXPECT_EQ(correlated[0], bad->methods()[0]);
    EXPECT_EQ(correlated[1], widget->constructors()[0]);
}

TEST(LangCallRestriction, ClassesVariantFollowsTheOwner)
{
    auto scenario = WidgetScenario::make();
    auto rule = syntax::methods()
                    .that(predicates::haveName("use"))
                    .should(conditions::onlyBeCalledByClassesThat(predicates::haveSimpleNameEndingWith("Caller")));
    EXPECT_TRUE(test::ruleHolds(rule, scenario.model));

    auto strict = syntax::methods()
                      .that(predicates::haveName("use"))
                      .should(conditions::onlyBeCalledByClassesThat(predicates::haveSimpleName("BadCaller")));
    EXPECT_TRUE(test::ruleViolatesExactly(
        strict,
        scenario.model,
        {kGoodCtor + " calls " + kWidgetUse + at("GoodCaller.java", WidgetScenario::kGoodCtorLine + 1),
         kGoodCall + " calls " + kWidgetUse + at("GoodCaller.java", WidgetScenario::kGoodMethodLine + 1)}));
}

TEST(LangCallRestriction, MethodsVariantRejectsConstructorCallers)
{
    auto scenario = WidgetScenario::make();
    // Accepts every method, so only the constructor caller remains.
    auto anyMethod = predicates::describe<core::Method>("are anything", [](const core::Method &) { return true; });
    auto rule = syntax::codeUnits()
                    .that(predicates::declaredIn("com.acme.Widget"))
                    .shouldOnlyBeCalled()
                    .byMethodsThat(anyMethod);

    EXPECT_TRUE(test::ruleViolatesExactly(
        rule,
        scenario.model,
        {kGoodCtor + " calls " + kWidgetCtor + at("GoodCaller.java", WidgetScenario::kGoodCtorLine),
         kGoodCtor + " calls " + kWidgetUse + at("GoodCaller.java", WidgetScenario::kGoodCtorLine + 1)}));
    EXPECT_EQ(rule.description(),
              "code units that are declared in com.acme.Widget should only be called by methods that are anything");
}

TEST(LangCallRestriction, ConstructorsVariantRejectsMethodCallers)
{
    auto scenario = WidgetScenario::make();
    auto rule = syntax::methods()
                    .shouldOnlyBeCalled()
                    .byConstructorsThat(predicates::declaredIn(predicates::haveSimpleName("GoodCaller")));

    EXPECT_TRUE(test::ruleViolatesExactly(
        rule,
        scenario.model,
        {kGoodCall + " calls " + kWidgetUse + at("GoodCaller.java", WidgetScenario::kGoodMethodLine + 1),
         kBadCall + " calls " + kWidgetUse + at("BadCaller.java", WidgetScenario::kBadMethodLine + 1)}));
}

TEST(LangCallRestriction, CodeUnitsVariantTestsTheCaller)
{
    auto scenario = WidgetScenario::make();
    auto rule = syntax::codeUnits()
                    .that(predicates::declaredIn("com.acme.Widget"))
                    .shouldOnlyBeCalled()
                    .byCodeUnitsThat(predicates::not_(predicates::haveName("callWrongly")));

    EXPECT_TRUE(test::ruleViolatesExactly(
        rule,
        scenario.model,
        {kBadCall + " calls " + kWidgetCtor + at("BadCaller.java", WidgetScenario::kBadMethodLine),
         kBadCall + " calls " + kWidgetUse + at("BadCaller.java", WidgetScenario::kBadMethodLine + 1)}));
}

TEST(LangCallRestriction, PredicateOnTheCallerKindIsNeverConsultedForOtherKinds)
{
    build::ModelBuilder b;
    auto &target = b.addClass("p.Target");
    auto &go = b.addMethod(target, "go", {}, kVoid);
    auto &caller = b.addClass("p.Caller");
    auto &ctor = b.addConstructor(caller, {});
    b.addCall(ctor, go, 3);
    core::CodeModel model = b.build();

    int consulted = 0;
    auto counting = predicates::describe<core::Method>("are counted",
                                                       [&consulted](const core::Method &)
                                                       {
                                                           ++consulted;
                                                           return true;
                                                       });
    auto result = syntax::methods().should(conditions::onlyBeCalledByMethodsThat(counting)).evaluate(model);
    EXPECT_EQ(consulted, 0);
    ASSERT_EQ(result.failureReport().details().size(), 1u);
    EXPECT_EQ(result.failureReport().details()[0],
              "Constructor <p.Caller.<init>()> calls method <p.Target.go()> in (Caller.java:3)");
}

TEST(LangCallRestriction, SupertypePredicatesAreAccepted)
{
    auto scenario = WidgetScenario::make();
    auto rule = syntax::constructors().shouldOnlyBeCalled().byMethodsThat(predicates::arePublic());
    const auto details = rule.evaluate(scenario.model).failureReport().details();
    // GoodCaller's constructor is the wrong kind; call() and callWrongly() are not public.
    EXPECT_EQ(details.size(), 3u);
    EXPECT_EQ(conditions::onlyBeCalledByCodeUnitsThat(predicates::haveName("x"))->description(),
              "only be called by code units that have name 'x'");
}

TEST(LangCallRestriction, UncalledTargetsHold)
{
    auto scenario = WidgetScenario::make();
    auto rule = syntax::constructors()
                    .that(predicates::declaredIn("com.acme.GoodCaller"))
                    .shouldOnlyBeCalled()
                    .byClassesThat(predicates::haveSimpleName("Nobody"));
    auto result = rule.evaluate(scenario.model);
    EXPECT_EQ(result.checkedElements(), 1u);
    EXPECT_TRUE(result.events().empty());
}

TEST(LangCallRestriction, OnlyDependOnClassesThat)
{
    build::ModelBuilder b;
    auto &repo = b.addClass("com.acme.data.Repo");
    auto &load = b.addMethod(repo, "load", {}, kVoid);
    auto &web = b.addClass("com.acme.web.Controller");
    auto &handle = b.addMethod(web, "handle", {}, kVoid);
    auto &cache = b.addField(web, "cache", kString);
    auto &svc = b.addClass("com.acme.service.Service");
    auto &serve = b.addMethod(svc, "serve", {}, kVoid);
    b.addCall(handle, serve, 11);
    b.addCall(handle, load, 12);
    b.addFieldWrite(handle, cache, 13);
    core::CodeModel model = b.build();

    auto rule = syntax::classes()
                    .that(predicates::resideInAPackage("..web.."))
                    .should(conditions::onlyDependOnClassesThat(
                        predicates::or_(predicates::resideInAPackage("..service.."),
                                        predicates::resideInAPackage("..web.."))));
    EXPECT_TRUE(test::ruleViolatesExactly(
        rule,
        model,
        {"Method <com.acme.web.Controller.handle()> calls method <com.acme.data.Repo.load()> in (Controller.java:12)"}));
    EXPECT_EQ(rule.description(),
              "classes that reside in a package '..web..' should only depend on classes that reside in a package "
              "'..service..' or reside in a package '..web..'");
}
