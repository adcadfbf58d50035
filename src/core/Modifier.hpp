// File: src/core/Modifier.hpp
// Purpose: Declares access and declaration modifiers of classes and members.
// Key invariants: ModifierSet is ordered by enumerator value.
// Ownership/Lifetime: Value types.
// Links: docs/codemap.md
#pragma once

#include <set>
#include <string_view>

namespace archcheck::core
{

/// @brief Declaration modifiers reported by the model provider.
enum class Modifier
{
    Public,
    Protected,
    Private,
    Static,
    Final,
    Abstract,
    Synchronized,
    Native,
    Transient,
    Volatile
};

using ModifierSet = std::set<Modifier>;

/// @brief Upper-case mnemonic used in messages, e.g. "PROTECTED".
std::string_view toString(Modifier modifier);

} // namespace archcheck::core
