//===----------------------------------------------------------------------===//
//
// Part of the Archcheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares ModelBuilder, the programmatic API for assembling a
// CodeModel snapshot.  Importers that decode compiled artefacts and unit tests
// that describe small programs by hand both go through it.
//
// Key Capabilities:
// - Classes: add analyzed classes, or external classes that only own edge
//   targets outside the analysis run
// - Members: fields, methods and constructors with modifiers, annotations,
//   throws clauses and declaration lines
// - Edges: calls, field reads and field writes with a source line
//
// Typical Usage Pattern:
//   ModelBuilder b;
//   auto &widget = b.addClass("com.acme.Widget");
//   auto &ctor = b.addConstructor(widget, {Type("java.lang.String")});
//   auto &caller = b.addClass("com.acme.Caller");
//   auto &run = b.addMethod(caller, "run", {}, Type("void"));
//   b.addCall(run, ctor, 12);
//   CodeModel model = b.build();
//
// The builder validates structural invariants eagerly and throws
// std::logic_error on misuse: duplicate class names, entities created by a
// different builder (or handed out before the last build()), or edges
// originating outside the analyzed classes.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "core/CodeModel.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace archcheck::build
{

/// @brief Helper to construct code models.
class ModelBuilder
{
  public:
    ModelBuilder() = default;

    /// @brief Add an analyzed class.
    /// @param fullName Fully-qualified binary name, e.g. "a.Outer$Inner".
    /// @param modifiers Declaration modifiers.
    /// @throws std::logic_error If a class named @p fullName already exists.
    core::Class &addClass(const std::string &fullName, core::ModifierSet modifiers = {});

    /// @brief Return the external class named @p fullName, creating it on first use.
    /// @throws std::logic_error If @p fullName names an analyzed class.
    core::Class &addExternalClass(const std::string &fullName);

    /// @brief Add a field to @p owner.
    core::Field &addField(core::Class &owner,
                          const std::string &name,
                          core::Type rawType,
                          core::ModifierSet modifiers = {});

    /// @brief Add a method to @p owner.
    core::Method &addMethod(core::Class &owner,
                            const std::string &name,
                            std::vector<core::Type> parameters,
                            core::Type returnType,
                            core::ModifierSet modifiers = {});

    /// @brief Add a constructor to @p owner.
    core::Constructor &addConstructor(core::Class &owner,
                                      std::vector<core::Type> parameters,
                                      core::ModifierSet modifiers = {});

    /// @brief Attach annotation @p annotation to a class or member.
    /// @throws std::logic_error If @p element was not created by this builder.
    void annotate(core::Element &element, core::Type annotation);

    /// @brief Record @p throwable in the throws clause of @p unit; duplicates are ignored.
    void declareThrowable(core::CodeUnit &unit, core::Type throwable);

    /// @brief Set the declaration line of @p member.
    void setLine(core::Member &member, uint32_t line);

    /// @brief Override the source file name of @p cls.
    void setSourceFile(core::Class &cls, std::string fileName);

    /// @brief Record that @p origin calls @p target at @p line.
    /// @throws std::logic_error If either endpoint was not created by this
    ///         builder or @p origin belongs to an external class.
    void addCall(const core::CodeUnit &origin, const core::CodeUnit &target, uint32_t line = 0);

    /// @brief Record that @p origin reads @p target at @p line.
    void addFieldRead(const core::CodeUnit &origin, const core::Field &target, uint32_t line = 0);

    /// @brief Record that @p origin writes @p target at @p line.
    void addFieldWrite(const core::CodeUnit &origin, const core::Field &target, uint32_t line = 0);

    /// @brief Index the edges and hand the finished model to the caller.
    /// @post The builder is empty and may be reused for a new model.
    core::CodeModel build();

  private:
    template <class M> M &adopt(core::Class &owner, std::unique_ptr<M> member);
    void addEdge(const char *what,
                 const core::CodeUnit &origin,
                 const core::Member &target,
                 core::DependencyKind kind,
                 uint32_t line);
    void requireOwned(const char *what, const core::Element &element) const;

    core::CodeModel model_;
    std::unordered_map<std::string, core::Class *> classes_;
    std::unordered_set<const core::Element *> owned_;
};

} // namespace archcheck::build
