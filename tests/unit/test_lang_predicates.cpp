// File: tests/unit/test_lang_predicates.cpp
// Purpose: Verify predicate composition and the built-in selection filters.
// Key invariants: Type, name and predicate forms of a filter select the same
//                 elements under the same description.
// Ownership/Lifetime: Standalone unit test executable.
// Links: docs/codemap.md

#include <gtest/gtest.h>

#include "ArchFixtures.hpp"
#include "archcheck/Rules.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace archcheck;
using namespace archcheck::lang;
using archcheck::test::kString;
using archcheck::test::kVoid;

namespace
{

core::CodeModel makeUnitsModel()
{
    build::ModelBuilder b;
    auto &svc = b.addClass("com.acme.service.Service");
    b.addConstructor(svc, {kString});
    auto &find = b.addMethod(svc, "find", {kString, core::Type("int")}, kString);
    b.declareThrowable(find, core::Type("java.io.IOException"));
    b.addMethod(svc, "close", {}, kVoid);
    auto &parse = b.addMethod(svc, "parse", {kString}, core::Type("int"));
    b.declareThrowable(parse, core::Type("java.lang.NumberFormatException"));
    b.declareThrowable(parse, core::Type("java.io.IOException"));
    b.addClass("com.acme.service.impl.ServiceImpl");
    b.addClass("com.acme.web.Controller");
    return b.build();
}

std::vector<std::string> selected(const syntax::GivenElements<core::CodeUnit> &given, const core::CodeModel &model)
{
    std::vector<std::string> names;
    for (const auto *unit : ElementKind<core::CodeUnit>::collect(model))
    {
        if (!given.filter() || given.filter()->test(*unit))
            names.push_back(unit->fullName());
    }
    return names;
}

} // namespace

TEST(LangPredicates, CompositesDeriveDescriptions)
{
    auto isPublic = predicates::arePublic();
    auto named = predicates::haveName("run");
    EXPECT_EQ(predicates::and_(isPublic, named)->description(), "are public and have name 'run'");
    EXPECT_EQ(predicates::or_(isPublic, named)->description(), "are public or have name 'run'");
    EXPECT_EQ(predicates::not_(named)->description(), "not have name 'run'");
    EXPECT_EQ(predicates::as(named, "are runners")->description(), "are runners");
}

TEST(LangPredicates, CompositesEvaluateBothOperands)
{
    build::ModelBuilder b;
    auto &a = b.addClass("p.A");
    auto &run = b.addMethod(a, "run", {}, kVoid, {core::Modifier::Public});
    auto &stop = b.addMethod(a, "stop", {}, kVoid);
    core::CodeModel model = b.build();

    auto publicRun = predicates::and_(predicates::arePublic(), predicates::haveName("run"));
    auto publicOrStop = predicates::or_(predicates::arePublic(), predicates::haveName("stop"));
    EXPECT_TRUE(publicRun->test(run));
    EXPECT_FALSE(publicRun->test(stop));
    EXPECT_TRUE(publicOrStop->test(stop));
    EXPECT_FALSE(predicates::not_(publicOrStop)->test(run));
}

TEST(LangPredicates, NullOperandsAreRejected)
{
    PredicatePtr<core::Element> none;
    EXPECT_THROW(predicates::and_(predicates::arePublic(), none), std::invalid_argument);
    EXPECT_THROW(predicates::not_(none), std::invalid_argument);
    EXPECT_THROW(predicates::haveRawReturnType(PredicatePtr<core::Type>()), std::invalid_argument);
    EXPECT_THROW((void)syntax::methods().that(none), std::invalid_argument);
}

TEST(LangPredicates, ParameterFilterFormsAreEquivalent)
{
    core::CodeModel model = makeUnitsModel();
    auto byType = syntax::codeUnits().that(predicates::haveRawParameterTypes(std::vector<core::Type>{kString}));
    auto byName = syntax::codeUnits().that(predicates::haveRawParameterTypes(std::vector<std::string>{"java.lang.String"}));
    auto byPredicate = syntax::codeUnits().that(
        predicates::haveRawParameterTypes(predicates::typeListEqualTo({kString})));

    const std::vector<std::string> expected{"com.acme.service.Service.<init>(java.lang.String)",
                                            "com.acme.service.Service.parse(java.lang.String)"};
    EXPECT_EQ(selected(byType, model), expected);
    EXPECT_EQ(selected(byName, model), expected);
    EXPECT_EQ(selected(byPredicate, model), expected);
    EXPECT_EQ(byType.description(), "code units that have raw parameter types [java.lang.String]");
    EXPECT_EQ(byName.description(), byType.description());
    EXPECT_EQ(byPredicate.description(), byType.description());
}

TEST(LangPredicates, ReturnTypeFilterFormsAreEquivalent)
{
    core::CodeModel model = makeUnitsModel();
    auto byType = syntax::codeUnits().that(predicates::haveRawReturnType(kString));
    auto byName = syntax::codeUnits().that(predicates::haveRawReturnType("java.lang.String"));
    auto byPredicate = syntax::codeUnits().that(predicates::haveRawReturnType(predicates::typeNamed("java.lang.String")));

    const std::vector<std::string> expected{"com.acme.service.Service.find(java.lang.String, int)"};
    EXPECT_EQ(selected(byType, model), expected);
    EXPECT_EQ(selected(byName, model), expected);
    EXPECT_EQ(selected(byPredicate, model), expected);
    EXPECT_EQ(byName.description(), "code units that have raw return type java.lang.String");
}

TEST(LangPredicates, ThrowableFilterTestsMembership)
{
    core::CodeModel model = makeUnitsModel();
    const core::Type ioException("java.io.IOException");
    auto byType = syntax::codeUnits().that(predicates::declareThrowableOfType(ioException));
    auto byName = syntax::codeUnits().that(predicates::declareThrowableOfType("java.io.IOException"));
    auto byPredicate = syntax::codeUnits().that(predicates::declareThrowableOfType(predicates::equivalentTo(ioException)));

    const std::vector<std::string> expected{"com.acme.service.Service.find(java.lang.String, int)",
                                            "com.acme.service.Service.parse(java.lang.String)"};
    EXPECT_EQ(selected(byType, model), expected);
    EXPECT_EQ(selected(byName, model), expected);
    EXPECT_EQ(selected(byPredicate, model), expected);
    EXPECT_EQ(byPredicate.description(),
              "code units that declare throwable of type equivalent to java.io.IOException");
}

TEST(LangPredicates, ThatAndOrThatCombineFilters)
{
    core::CodeModel model = makeUnitsModel();
    auto methodsOnly = syntax::codeUnits().that(predicates::areMethods()).andThat(predicates::haveName("close"));
    EXPECT_EQ(selected(methodsOnly, model), std::vector<std::string>{"com.acme.service.Service.close()"});
    EXPECT_EQ(methodsOnly.description(), "code units that are methods and have name 'close'");

    auto either = syntax::codeUnits().that(predicates::areConstructors()).orThat(predicates::haveName("close"));
    EXPECT_EQ(selected(either, model),
              (std::vector<std::string>{"com.acme.service.Service.<init>(java.lang.String)",
                                        "com.acme.service.Service.close()"}));
}

TEST(LangPredicates, PackageIdentifiers)
{
    EXPECT_TRUE(predicates::packageMatches("com.acme.service", "com.acme.service"));
    EXPECT_FALSE(predicates::packageMatches("com.acme.service", "com.acme.service.impl"));
    EXPECT_TRUE(predicates::packageMatches("com.acme.service..", "com.acme.service.impl"));
    EXPECT_TRUE(predicates::packageMatches("com.acme.service..", "com.acme.service"));
    EXPECT_FALSE(predicates::packageMatches("com.acme.service..", "com.acme.services"));
    EXPECT_TRUE(predicates::packageMatches("..service..", "com.acme.service.impl"));
    EXPECT_TRUE(predicates::packageMatches("com.*.web", "com.acme.web"));
    EXPECT_FALSE(predicates::packageMatches("com.*.web", "com.acme.x.web"));
    EXPECT_TRUE(predicates::packageMatches("..", "com.acme"));
    EXPECT_TRUE(predicates::packageMatches("..", "com"));
    EXPECT_FALSE(predicates::packageMatches("a+", "aa"));
    EXPECT_TRUE(predicates::packageMatches("a+", "a+"));
    EXPECT_TRUE(predicates::packageMatches("p$q", "p$q"));

    core::CodeModel model = makeUnitsModel();
    auto inService = predicates::resideInAPackage("com.acme.service..");
    int matches = 0;
    for (const auto *cls : model.classes())
        matches += inService->test(*cls) ? 1 : 0;
    EXPECT_EQ(matches, 2);
}

TEST(LangPredicates, BelongToAnyOfIncludesNestedClasses)
{
    build::ModelBuilder b;
    auto &outer = b.addClass("p.Outer");
    auto &inner = b.addClass("p.Outer$Inner");
    auto &sibling = b.addClass("p.OuterSibling");
    core::CodeModel model = b.build();

    auto belongs = predicates::belongToAnyOf({"p.Outer"});
    EXPECT_EQ(belongs->description(), "belong to any of [p.Outer]");
    EXPECT_TRUE(belongs->test(outer));
    EXPECT_TRUE(belongs->test(inner));
    EXPECT_FALSE(belongs->test(sibling));
}

TEST(LangPredicates, AnnotationAndOwnerFilters)
{
    build::ModelBuilder b;
    auto &a = b.addClass("p.A");
    auto &run = b.addMethod(a, "run", {}, kVoid);
    b.annotate(run, core::Type("p.Marker"));
    auto &other = b.addClass("p.B");
    auto &stop = b.addMethod(other, "stop", {}, kVoid);
    core::CodeModel model = b.build();

    auto marked = predicates::areAnnotatedWith("p.Marker");
    EXPECT_EQ(marked->description(), "are annotated with @Marker");
    EXPECT_TRUE(marked->test(run));
    EXPECT_FALSE(marked->test(stop));
    EXPECT_TRUE(predicates::areAnnotatedWith(core::Type("p.Marker"))->test(run));

    auto inA = predicates::declaredIn("p.A");
    EXPECT_EQ(inA->description(), "are declared in p.A");
    EXPECT_TRUE(inA->test(run));
    EXPECT_FALSE(inA->test(stop));
    EXPECT_TRUE(predicates::declaredIn(predicates::haveSimpleName("B"))->test(stop));
}
