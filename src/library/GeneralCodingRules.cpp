//===----------------------------------------------------------------------===//
//
// Part of the Archcheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the general coding rules on top of the public rule syntax.
//
//===----------------------------------------------------------------------===//

#include "library/GeneralCodingRules.hpp"

#include "core/CodeModel.hpp"
#include "lang/Conditions.hpp"
#include "lang/Predicates.hpp"
#include "lang/syntax/RuleDefinition.hpp"

#include <memory>
#include <utility>
#include <vector>

namespace archcheck::library
{

using namespace archcheck::lang;

namespace
{

class SamePackageAsImplementation final : public Condition<core::Class>
{
  public:
    explicit SamePackageAsImplementation(std::string suffix)
        : Condition<core::Class>("reside in the same package as implementation"), suffix_(std::move(suffix))
    {
    }

    void check(const core::Class &testClass, const core::CodeModel &model, ConditionEvents &events) const override
    {
        const std::string testName = testClass.simpleName();
        if (testName.size() <= suffix_.size())
            return;
        const std::string implName = testName.substr(0, testName.size() - suffix_.size());

        std::vector<const core::Class *> implementations;
        for (const core::Class *cls : model.classes())
        {
            if (cls->simpleName() == implName)
                implementations.push_back(cls);
        }
        if (implementations.empty())
            return;

        for (const core::Class *impl : implementations)
        {
            if (impl->packageName() == testClass.packageName() || hasTestClassIn(model, testName, impl->packageName()))
            {
                events.add(ConditionEvent::satisfied(
                    testClass,
                    elementMessage(testClass,
                                   "resides in same package as implementation class <" + impl->fullName() + ">")));
                return;
            }
        }

        events.add(ConditionEvent::violated(
            testClass,
            elementMessage(testClass,
                           "does not reside in same package as implementation class <" +
                               implementations.front()->fullName() + ">")));
    }

  private:
    static bool hasTestClassIn(const core::CodeModel &model, const std::string &testName, const std::string &package)
    {
        for (const core::Class *cls : model.classes())
        {
            if (cls->simpleName() == testName && cls->packageName() == package)
                return true;
        }
        return false;
    }

    std::string suffix_;
};

} // namespace

ConditionPtr<core::Class> resideInTheSamePackageAsImplementation(const std::string &testClassSuffix)
{
    return std::make_shared<SamePackageAsImplementation>(testClassSuffix);
}

Rule testClassesShouldResideInTheSamePackageAsImplementation(const std::string &testClassSuffix)
{
    return syntax::classes()
        .that(predicates::haveSimpleNameEndingWith(testClassSuffix))
        .should(resideInTheSamePackageAsImplementation(testClassSuffix))
        .allowEmptyShould(true);
}

Rule codeUnitsShouldNotDeclareGenericExceptions()
{
    return syntax::codeUnits()
        .should(conditions::notDeclareThrowableOfType("java.lang.Throwable"))
        .andShould(conditions::notDeclareThrowableOfType("java.lang.Exception"))
        .andShould(conditions::notDeclareThrowableOfType("java.lang.RuntimeException"))
        .as("no code units should declare generic exceptions")
        .allowEmptyShould(true);
}

} // namespace archcheck::library
