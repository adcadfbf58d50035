//===----------------------------------------------------------------------===//
//
// Part of the Archcheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares CodeModel, the immutable snapshot of classes, members and
// dependency edges that rules are evaluated against.
//
// The model is a flat store: classes and members are owned through
// unique_ptr so their addresses stay stable when the model is moved, and the
// dependency edges sit in one vector indexed by an analysis::CallGraph keyed by
// member identity.  Callers and callees never own each other, which keeps
// mutual recursion in the analysed program from turning into ownership cycles.
//
// Key Invariants:
// - classes() lists analyzed classes only, in import order
// - Every edge's origin belongs to an analyzed class
// - Fully-qualified class names are unique across analyzed and external classes
//
// Ownership Model:
// - Built once by build::ModelBuilder, then read-only
// - Move-only; safe to share by const reference across threads
//
//===----------------------------------------------------------------------===//

#pragma once

#include "analysis/CallGraph.hpp"
#include "core/Class.hpp"
#include "core/Dependency.hpp"
#include "core/Member.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace archcheck::core
{

/// @brief Immutable code model snapshot.
class CodeModel
{
  public:
    CodeModel();
    ~CodeModel();
    CodeModel(CodeModel &&) noexcept;
    CodeModel &operator=(CodeModel &&) noexcept;
    CodeModel(const CodeModel &) = delete;
    CodeModel &operator=(const CodeModel &) = delete;

    /// @brief Analyzed classes in import order.
    [[nodiscard]] const std::vector<const Class *> &classes() const
    {
        return analyzed_;
    }

    /// @brief Look up an analyzed or external class by fully-qualified name.
    /// @return The class, or nullptr when the model does not know the name.
    [[nodiscard]] const Class *findClass(std::string_view fullName) const;

    /// @brief All edges in insertion order.
    [[nodiscard]] const std::vector<Dependency> &dependencies() const
    {
        return dependencies_;
    }

    /// @brief Call edges whose target is @p target, in insertion order.
    [[nodiscard]] std::vector<const Dependency *> callsTo(const CodeUnit &target) const;

    /// @brief Edges of any kind whose target is @p target.
    [[nodiscard]] std::vector<const Dependency *> dependenciesTo(const Member &target) const;

    /// @brief Edges of any kind originating in @p origin.
    [[nodiscard]] std::vector<const Dependency *> dependenciesFrom(const CodeUnit &origin) const;

    /// @brief Number of members owned by the model, external ones included.
    [[nodiscard]] size_t memberCount() const
    {
        return members_.size();
    }

  private:
    friend class build::ModelBuilder;

    std::vector<std::unique_ptr<Class>> classStorage_;
    std::vector<std::unique_ptr<Member>> members_;
    std::vector<const Class *> analyzed_;
    std::unordered_map<std::string, const Class *> byName_;
    std::vector<Dependency> dependencies_;
    analysis::CallGraph graph_;
};

} // namespace archcheck::core
