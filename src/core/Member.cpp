//===----------------------------------------------------------------------===//
//
// Part of the Archcheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements member naming and message rendering.  Full names follow the
// "<owner>.<name>(<param>, <param>)" shape that violation reports and rule
// authors match against, so the formatting is centralised here.
//
//===----------------------------------------------------------------------===//

#include "core/Member.hpp"

#include "core/Class.hpp"

#include <algorithm>
#include <utility>

namespace archcheck::core
{

std::string_view kindLabel(MemberKind kind)
{
    switch (kind)
    {
        case MemberKind::Field:
            return "Field";
        case MemberKind::Method:
            return "Method";
        case MemberKind::Constructor:
            return "Constructor";
    }
    return "";
}

std::string_view lowerKindLabel(MemberKind kind)
{
    switch (kind)
    {
        case MemberKind::Field:
            return "field";
        case MemberKind::Method:
            return "method";
        case MemberKind::Constructor:
            return "constructor";
    }
    return "";
}

Member::Member(MemberKind kind, const Class &owner, std::string name, ModifierSet modifiers)
    : Element(std::move(name), std::move(modifiers)), kind_(kind), owner_(&owner)
{
}

std::string Member::fullName() const
{
    return owner_->fullName() + "." + name();
}

std::string Member::description() const
{
    std::string out(kindLabel(kind_));
    out += " <";
    out += fullName();
    out += '>';
    return out;
}

/// @brief Members report the owning class's file with their own line.
support::SourceLoc Member::sourceLocation() const
{
    return support::SourceLoc{owner_->sourceFileName(), line_};
}

Field::Field(const Class &owner, std::string name, Type rawType, ModifierSet modifiers)
    : Member(MemberKind::Field, owner, std::move(name), std::move(modifiers)),
      rawType_(std::move(rawType))
{
}

CodeUnit::CodeUnit(MemberKind kind,
                   const Class &owner,
                   std::string name,
                   std::vector<Type> parameters,
                   Type returnType,
                   ModifierSet modifiers)
    : Member(kind, owner, std::move(name), std::move(modifiers)),
      parameters_(std::move(parameters)), returnType_(std::move(returnType))
{
}

bool CodeUnit::declaresThrowable(const Type &type) const
{
    return std::find(throws_.begin(), throws_.end(), type) != throws_.end();
}

std::string CodeUnit::fullName() const
{
    std::string out = owner().fullName();
    out += '.';
    out += name();
    out += '(';
    for (size_t i = 0; i < parameters_.size(); ++i)
    {
        if (i)
            out += ", ";
        out += parameters_[i].fullName();
    }
    out += ')';
    return out;
}

Method::Method(const Class &owner,
               std::string name,
               std::vector<Type> parameters,
               Type returnType,
               ModifierSet modifiers)
    : CodeUnit(MemberKind::Method,
               owner,
               std::move(name),
               std::move(parameters),
               std::move(returnType),
               std::move(modifiers))
{
}

Constructor::Constructor(const Class &owner, std::vector<Type> parameters, ModifierSet modifiers)
    : CodeUnit(MemberKind::Constructor,
               owner,
               std::string(kName),
               std::move(parameters),
               owner.type(),
               std::move(modifiers))
{
}

} // namespace archcheck::core
