//===----------------------------------------------------------------------===//
//
// Part of the Archcheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares Class, the code model's representation of a type
// definition together with the members it declares.
//
// A class is either analyzed (imported as part of the analysis run and visible
// to selections) or external (known only because a dependency edge targets one
// of its members).  External classes carry identity only: no modifiers,
// annotations or members beyond those referenced by edges.
//
// Key Invariants:
// - Fully-qualified names are unique within one CodeModel
// - Members are listed in declaration order
// - The source file defaults to "<TopLevelSimpleName>.java"
//
//===----------------------------------------------------------------------===//

#pragma once

#include "core/Element.hpp"

#include <vector>

namespace archcheck::core
{

/// @brief Class definition with its declared members.
class Class final : public Element
{
  public:
    Class(std::string fullName, ModifierSet modifiers, bool analyzed);

    /// @brief Type identity of the class.
    [[nodiscard]] const Type &type() const
    {
        return type_;
    }

    [[nodiscard]] std::string simpleName() const
    {
        return type_.simpleName();
    }

    [[nodiscard]] std::string packageName() const
    {
        return type_.packageName();
    }

    /// @brief File the class was compiled from, e.g. "Widget.java".
    [[nodiscard]] const std::string &sourceFileName() const
    {
        return sourceFile_;
    }

    /// @brief False for classes known only as owners of edge targets.
    [[nodiscard]] bool isAnalyzed() const
    {
        return analyzed_;
    }

    [[nodiscard]] const std::vector<const Member *> &members() const
    {
        return members_;
    }

    [[nodiscard]] std::vector<const Field *> fields() const;
    [[nodiscard]] std::vector<const Method *> methods() const;
    [[nodiscard]] std::vector<const Constructor *> constructors() const;
    [[nodiscard]] std::vector<const CodeUnit *> codeUnits() const;

    std::string fullName() const override;
    std::string description() const override;
    support::SourceLoc sourceLocation() const override;

  private:
    friend class build::ModelBuilder;

    Type type_;
    std::string sourceFile_;
    bool analyzed_;
    std::vector<const Member *> members_;
};

} // namespace archcheck::core
