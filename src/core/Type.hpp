// File: src/core/Type.hpp
// Purpose: Declares the fully-qualified type name identity used by the model.
// Key invariants: Equality and ordering are by fully-qualified name only.
// Ownership/Lifetime: Types are lightweight values.
// Links: docs/codemap.md
#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace archcheck::core
{

/// @brief Name identity of a class, parameter, return or throwable type.
/// @details Nested classes use the binary '$' separator, e.g. "a.Outer$Inner".
class Type
{
  public:
    Type() = default;

    /// @brief Construct a type named @p fullName.
    explicit Type(std::string fullName);

    /// @brief Fully-qualified name, e.g. "java.lang.String".
    [[nodiscard]] const std::string &fullName() const
    {
        return fullName_;
    }

    /// @brief Name after the last package and nesting separator.
    [[nodiscard]] std::string simpleName() const;

    /// @brief Package part of the name; empty for the default package.
    [[nodiscard]] std::string packageName() const;

    /// @brief Name of the outermost enclosing class ("a.Outer" for "a.Outer$Inner").
    [[nodiscard]] std::string topLevelName() const;

    bool operator==(const Type &other) const
    {
        return fullName_ == other.fullName_;
    }

    bool operator!=(const Type &other) const
    {
        return !(*this == other);
    }

    bool operator<(const Type &other) const
    {
        return fullName_ < other.fullName_;
    }

  private:
    std::string fullName_;
};

/// @brief Format a list of types as "[a.B, c.D]".
std::string formatTypeList(const std::vector<Type> &types);

/// @brief Convert a list of names into types.
std::vector<Type> typesNamed(const std::vector<std::string> &names);

} // namespace archcheck::core
