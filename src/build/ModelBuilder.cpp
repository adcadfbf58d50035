//===----------------------------------------------------------------------===//
//
// Part of the Archcheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements ModelBuilder.  Entities are allocated individually and handed to
// the CodeModel under construction, which keeps their addresses stable for the
// edges and back-references that point at them.  Misuse is reported with
// std::logic_error naming the builder operation and the offending entity.
//
//===----------------------------------------------------------------------===//

#include "build/ModelBuilder.hpp"

#include <memory>
#include <stdexcept>
#include <utility>

namespace archcheck::build
{

using core::Class;
using core::CodeUnit;
using core::Member;

core::Class &ModelBuilder::addClass(const std::string &fullName, core::ModifierSet modifiers)
{
    if (classes_.count(fullName))
        throw std::logic_error("addClass: duplicate class '" + fullName + "'");
    auto cls = std::make_unique<Class>(fullName, std::move(modifiers), true);
    Class &ref = *cls;
    model_.byName_.emplace(fullName, &ref);
    model_.analyzed_.push_back(&ref);
    classes_.emplace(fullName, &ref);
    owned_.insert(&ref);
    model_.classStorage_.push_back(std::move(cls));
    return ref;
}

core::Class &ModelBuilder::addExternalClass(const std::string &fullName)
{
    auto it = classes_.find(fullName);
    if (it != classes_.end())
    {
        if (it->second->isAnalyzed())
            throw std::logic_error("addExternalClass: '" + fullName + "' is an analyzed class");
        return *it->second;
    }
    auto cls = std::make_unique<Class>(fullName, core::ModifierSet{}, false);
    Class &ref = *cls;
    model_.byName_.emplace(fullName, &ref);
    classes_.emplace(fullName, &ref);
    owned_.insert(&ref);
    model_.classStorage_.push_back(std::move(cls));
    return ref;
}

template <class M> M &ModelBuilder::adopt(core::Class &owner, std::unique_ptr<M> member)
{
    M &ref = *member;
    owner.members_.push_back(&ref);
    owned_.insert(&ref);
    model_.members_.push_back(std::move(member));
    return ref;
}

core::Field &ModelBuilder::addField(core::Class &owner,
                                    const std::string &name,
                                    core::Type rawType,
                                    core::ModifierSet modifiers)
{
    requireOwned("addField", owner);
    return adopt(owner,
                 std::make_unique<core::Field>(owner, name, std::move(rawType), std::move(modifiers)));
}

core::Method &ModelBuilder::addMethod(core::Class &owner,
                                      const std::string &name,
                                      std::vector<core::Type> parameters,
                                      core::Type returnType,
                                      core::ModifierSet modifiers)
{
    requireOwned("addMethod", owner);
    return adopt(owner,
                 std::make_unique<core::Method>(
                     owner, name, std::move(parameters), std::move(returnType), std::move(modifiers)));
}

core::Constructor &ModelBuilder::addConstructor(core::Class &owner,
                                                std::vector<core::Type> parameters,
                                                core::ModifierSet modifiers)
{
    requireOwned("addConstructor", owner);
    return adopt(owner,
                 std::make_unique<core::Constructor>(
                     owner, std::move(parameters), std::move(modifiers)));
}

void ModelBuilder::annotate(core::Element &element, core::Type annotation)
{
    requireOwned("annotate", element);
    if (!element.isAnnotatedWith(annotation))
        element.annotations_.push_back(std::move(annotation));
}

void ModelBuilder::declareThrowable(core::CodeUnit &unit, core::Type throwable)
{
    requireOwned("declareThrowable", unit);
    if (!unit.declaresThrowable(throwable))
        unit.throws_.push_back(std::move(throwable));
}

void ModelBuilder::setLine(core::Member &member, uint32_t line)
{
    requireOwned("setLine", member);
    member.line_ = line;
}

void ModelBuilder::setSourceFile(core::Class &cls, std::string fileName)
{
    requireOwned("setSourceFile", cls);
    cls.sourceFile_ = std::move(fileName);
}

void ModelBuilder::addCall(const core::CodeUnit &origin, const core::CodeUnit &target, uint32_t line)
{
    addEdge("addCall", origin, target, core::DependencyKind::Call, line);
}

void ModelBuilder::addFieldRead(const core::CodeUnit &origin, const core::Field &target, uint32_t line)
{
    addEdge("addFieldRead", origin, target, core::DependencyKind::FieldRead, line);
}

void ModelBuilder::addFieldWrite(const core::CodeUnit &origin, const core::Field &target, uint32_t line)
{
    addEdge("addFieldWrite", origin, target, core::DependencyKind::FieldWrite, line);
}

void ModelBuilder::addEdge(const char *what,
                           const core::CodeUnit &origin,
                           const core::Member &target,
                           core::DependencyKind kind,
                           uint32_t line)
{
    if (!owned_.count(&origin))
        throw std::logic_error(std::string(what) + ": unknown origin '" + origin.fullName() + "'");
    if (!owned_.count(&target))
        throw std::logic_error(std::string(what) + ": unknown target '" + target.fullName() + "'");
    if (!origin.owner().isAnalyzed())
        throw std::logic_error(std::string(what) + ": origin '" + origin.fullName() +
                               "' belongs to an external class");

    core::Dependency dep;
    dep.origin = &origin;
    dep.target = &target;
    dep.kind = kind;
    dep.location.line = line;
    model_.dependencies_.push_back(std::move(dep));
}

void ModelBuilder::requireOwned(const char *what, const core::Element &element) const
{
    if (!owned_.count(&element))
        throw std::logic_error(std::string(what) + ": '" + element.fullName() +
                               "' was not created by this builder");
}

core::CodeModel ModelBuilder::build()
{
    // Source files may change until the model is finished.
    for (auto &dep : model_.dependencies_)
        dep.location.file = dep.origin->owner().sourceFileName();
    model_.graph_ = analysis::buildCallGraph(model_.dependencies_);
    core::CodeModel out = std::move(model_);
    model_ = core::CodeModel();
    classes_.clear();
    owned_.clear();
    return out;
}

} // namespace archcheck::build
