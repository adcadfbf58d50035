//===----------------------------------------------------------------------===//
//
// Part of the Archcheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares Element, the common supertype of classes and members in
// the code model.  Every element has a name, a modifier set, an ordered list of
// annotations, a human-readable description used as the subject of violation
// messages, and a source location.
//
// Conditions and predicates typed for Element can be attached to any selection
// (classes, fields, methods, constructors, code units or members) because every
// selectable kind derives from it.
//
// Elements are created exclusively by build::ModelBuilder and owned by the
// CodeModel they belong to; they are immutable once the model is built.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "core/Modifier.hpp"
#include "core/Type.hpp"
#include "core/fwd.hpp"
#include "support/source_location.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace archcheck::core
{

/// @brief Named, modifiable, annotatable entity of the code model.
class Element
{
  public:
    virtual ~Element() = default;

    Element(const Element &) = delete;
    Element &operator=(const Element &) = delete;

    /// @brief Declared name: the fully-qualified name for classes, the plain
    ///        member name ("use", "<init>") for members.
    [[nodiscard]] const std::string &name() const
    {
        return name_;
    }

    /// @brief Name that is unique within the model.
    [[nodiscard]] virtual std::string fullName() const = 0;

    /// @brief Subject text for messages, e.g. "Method <a.B.use(java.lang.String)>".
    [[nodiscard]] virtual std::string description() const = 0;

    /// @brief Declaring file and line of the element.
    [[nodiscard]] virtual support::SourceLoc sourceLocation() const = 0;

    [[nodiscard]] const ModifierSet &modifiers() const
    {
        return modifiers_;
    }

    [[nodiscard]] bool hasModifier(Modifier modifier) const;

    /// @brief True when neither public, protected nor private.
    [[nodiscard]] bool isPackagePrivate() const;

    /// @brief Annotation types in declaration order.
    [[nodiscard]] const std::vector<Type> &annotations() const
    {
        return annotations_;
    }

    [[nodiscard]] bool isAnnotatedWith(const Type &annotation) const;

    [[nodiscard]] bool isAnnotatedWith(std::string_view annotationName) const;

  protected:
    Element(std::string name, ModifierSet modifiers);

  private:
    friend class build::ModelBuilder;

    std::string name_;
    ModifierSet modifiers_;
    std::vector<Type> annotations_;
};

} // namespace archcheck::core
