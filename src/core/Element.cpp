// File: src/core/Element.cpp
// Purpose: Modifier and annotation queries shared by classes and members.
// Key invariants: Annotation lookup compares fully-qualified names.
// Ownership/Lifetime: Elements are owned by their CodeModel.
// Links: docs/codemap.md

#include "core/Element.hpp"

#include <algorithm>
#include <utility>

namespace archcheck::core
{

Element::Element(std::string name, ModifierSet modifiers)
    : name_(std::move(name)), modifiers_(std::move(modifiers))
{
}

bool Element::hasModifier(Modifier modifier) const
{
    return modifiers_.count(modifier) != 0;
}

bool Element::isPackagePrivate() const
{
    return !hasModifier(Modifier::Public) && !hasModifier(Modifier::Protected) &&
           !hasModifier(Modifier::Private);
}

bool Element::isAnnotatedWith(const Type &annotation) const
{
    return isAnnotatedWith(annotation.fullName());
}

bool Element::isAnnotatedWith(std::string_view annotationName) const
{
    return std::any_of(annotations_.begin(),
                       annotations_.end(),
                       [&](const Type &t) { return t.fullName() == annotationName; });
}

} // namespace archcheck::core
