//===----------------------------------------------------------------------===//
//
// Part of the Archcheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the member hierarchy of the code model:
//
//   Member
//   |- Field        (raw type)
//   `- CodeUnit     (parameters, return type, throws clause)
//      |- Method
//      `- Constructor  (named "<init>", returns its owning class)
//
// Members refer to their owning class through a non-owning back-reference; the
// CodeModel owns both.  Call and access edges are not stored on members but in
// the model's dependency index, so the cyclic caller/callee relation never
// becomes an ownership cycle.
//
// The structural kind is available both through the C++ type and through
// kind(), which lets the call-graph conditions classify edge endpoints without
// RTTI.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "core/Element.hpp"

#include <cstdint>
#include <string_view>
#include <vector>

namespace archcheck::core
{

/// @brief Structural kind of a member.
enum class MemberKind
{
    Field,
    Method,
    Constructor
};

/// @brief Capitalised kind label ("Field", "Method", "Constructor").
std::string_view kindLabel(MemberKind kind);

/// @brief Lower-case kind label ("field", "method", "constructor").
std::string_view lowerKindLabel(MemberKind kind);

/// @brief Field, method or constructor declared by a class.
class Member : public Element
{
  public:
    [[nodiscard]] MemberKind kind() const
    {
        return kind_;
    }

    /// @brief Declaring class.
    [[nodiscard]] const Class &owner() const
    {
        return *owner_;
    }

    /// @brief One-based declaration line; 0 when unknown.
    [[nodiscard]] uint32_t line() const
    {
        return line_;
    }

    std::string fullName() const override;
    std::string description() const override;
    support::SourceLoc sourceLocation() const override;

  protected:
    Member(MemberKind kind, const Class &owner, std::string name, ModifierSet modifiers);

  private:
    friend class build::ModelBuilder;

    MemberKind kind_;
    const Class *owner_;
    uint32_t line_ = 0;
};

/// @brief Data member with a raw type.
class Field final : public Member
{
  public:
    Field(const Class &owner, std::string name, Type rawType, ModifierSet modifiers);

    [[nodiscard]] const Type &rawType() const
    {
        return rawType_;
    }

  private:
    Type rawType_;
};

/// @brief Common supertype of methods and constructors.
class CodeUnit : public Member
{
  public:
    /// @brief Declared parameter types in order.
    [[nodiscard]] const std::vector<Type> &rawParameterTypes() const
    {
        return parameters_;
    }

    [[nodiscard]] const Type &rawReturnType() const
    {
        return returnType_;
    }

    /// @brief Declared throwable types, without duplicates, in declaration order.
    [[nodiscard]] const std::vector<Type> &throwsClause() const
    {
        return throws_;
    }

    [[nodiscard]] bool declaresThrowable(const Type &type) const;

    [[nodiscard]] bool isMethod() const
    {
        return kind() == MemberKind::Method;
    }

    [[nodiscard]] bool isConstructor() const
    {
        return kind() == MemberKind::Constructor;
    }

    /// @brief "<owner>.<name>(<param>, <param>)".
    std::string fullName() const override;

  protected:
    CodeUnit(MemberKind kind,
             const Class &owner,
             std::string name,
             std::vector<Type> parameters,
             Type returnType,
             ModifierSet modifiers);

  private:
    friend class build::ModelBuilder;

    std::vector<Type> parameters_;
    Type returnType_;
    std::vector<Type> throws_;
};

/// @brief Named code unit with a declared return type.
class Method final : public CodeUnit
{
  public:
    Method(const Class &owner,
           std::string name,
           std::vector<Type> parameters,
           Type returnType,
           ModifierSet modifiers);
};

/// @brief Instance initialiser of a class.
class Constructor final : public CodeUnit
{
  public:
    /// @brief Name shared by every constructor.
    static constexpr std::string_view kName = "<init>";

    Constructor(const Class &owner, std::vector<Type> parameters, ModifierSet modifiers);
};

} // namespace archcheck::core
