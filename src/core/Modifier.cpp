// File: src/core/Modifier.cpp
// Purpose: Mnemonics for declaration modifiers.
// Key invariants: Names match the upper-case spelling used in violation text.
// Ownership/Lifetime: Returns views of string literals.
// Links: docs/codemap.md

#include "core/Modifier.hpp"

namespace archcheck::core
{

std::string_view toString(Modifier modifier)
{
    switch (modifier)
    {
        case Modifier::Public:
            return "PUBLIC";
        case Modifier::Protected:
            return "PROTECTED";
        case Modifier::Private:
            return "PRIVATE";
        case Modifier::Static:
            return "STATIC";
        case Modifier::Final:
            return "FINAL";
        case Modifier::Abstract:
            return "ABSTRACT";
        case Modifier::Synchronized:
            return "SYNCHRONIZED";
        case Modifier::Native:
            return "NATIVE";
        case Modifier::Transient:
            return "TRANSIENT";
        case Modifier::Volatile:
            return "VOLATILE";
    }
    return "";
}

} // namespace archcheck::core
