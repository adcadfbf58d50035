// File: src/core/Dependency.cpp
// Purpose: Message rendering for dependency edges.
// Key invariants: Output format is part of the stable violation contract.
// Ownership/Lifetime: Stateless helpers.
// Links: docs/codemap.md

#include "core/Dependency.hpp"

#include "core/Member.hpp"

namespace archcheck::core
{

std::string_view verbOf(const Dependency &dependency)
{
    switch (dependency.kind)
    {
        case DependencyKind::Call:
            return "calls";
        case DependencyKind::FieldRead:
            return "gets";
        case DependencyKind::FieldWrite:
            return "sets";
    }
    return "";
}

std::string Dependency::description() const
{
    std::string out(kindLabel(origin->kind()));
    out += " <";
    out += origin->fullName();
    out += "> ";
    out += verbOf(*this);
    out += ' ';
    out += lowerKindLabel(target->kind());
    out += " <";
    out += target->fullName();
    out += "> in ";
    out += location.str();
    return out;
}

} // namespace archcheck::core
