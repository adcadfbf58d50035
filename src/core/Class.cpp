//===----------------------------------------------------------------------===//
//
// Part of the Archcheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Member views and message rendering for Class.  The kind-filtered views keep
// declaration order so selections enumerate members deterministically.
//
//===----------------------------------------------------------------------===//

#include "core/Class.hpp"

#include "core/Member.hpp"

#include <utility>

namespace archcheck::core
{

Class::Class(std::string fullName, ModifierSet modifiers, bool analyzed)
    : Element(fullName, std::move(modifiers)), type_(fullName), analyzed_(analyzed)
{
    sourceFile_ = Type(type_.topLevelName()).simpleName() + ".java";
}

std::vector<const Field *> Class::fields() const
{
    std::vector<const Field *> out;
    for (const Member *m : members_)
    {
        if (m->kind() == MemberKind::Field)
            out.push_back(static_cast<const Field *>(m));
    }
    return out;
}

std::vector<const Method *> Class::methods() const
{
    std::vector<const Method *> out;
    for (const Member *m : members_)
    {
        if (m->kind() == MemberKind::Method)
            out.push_back(static_cast<const Method *>(m));
    }
    return out;
}

std::vector<const Constructor *> Class::constructors() const
{
    std::vector<const Constructor *> out;
    for (const Member *m : members_)
    {
        if (m->kind() == MemberKind::Constructor)
            out.push_back(static_cast<const Constructor *>(m));
    }
    return out;
}

std::vector<const CodeUnit *> Class::codeUnits() const
{
    std::vector<const CodeUnit *> out;
    for (const Member *m : members_)
    {
        if (m->kind() != MemberKind::Field)
            out.push_back(static_cast<const CodeUnit *>(m));
    }
    return out;
}

std::string Class::fullName() const
{
    return type_.fullName();
}

std::string Class::description() const
{
    return "Class <" + type_.fullName() + ">";
}

support::SourceLoc Class::sourceLocation() const
{
    return support::SourceLoc{sourceFile_, 0};
}

} // namespace archcheck::core
