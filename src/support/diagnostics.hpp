//===----------------------------------------------------------------------===//
//
// Part of the Archcheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diagnostics.hpp
// Purpose: Declares the diagnostic engine used for rule evaluation traces and
//          reportable errors.
// Key invariants: Counts reflect reported diagnostics.
// Ownership/Lifetime: Engine owns collected diagnostics.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace archcheck::support
{

/// @brief Severity levels for diagnostics.
enum class Severity
{
    Note,
    Warning,
    Error
};

/// @brief Single diagnostic message with location.
struct Diagnostic
{
    Severity severity;   ///< Message severity
    std::string message; ///< Human-readable text
    SourceLoc loc;       ///< Optional source location
};

/// @brief Collects diagnostics and prints them in order.
/// @invariant Diagnostics are kept in arrival order.
class DiagnosticEngine
{
  public:
    /// @brief Record diagnostic @p d.
    /// @param d Diagnostic to store.
    void report(Diagnostic d);

    /// @brief Print all recorded diagnostics to stream @p os.
    /// @param os Output stream.
    void printAll(std::ostream &os) const;

    /// @brief Access the recorded diagnostics.
    [[nodiscard]] const std::vector<Diagnostic> &diagnostics() const;

    /// @brief Number of errors reported.
    size_t errorCount() const;

    /// @brief Number of notes reported.
    size_t noteCount() const;

  private:
    std::vector<Diagnostic> diags_;
    size_t errors_ = 0;
    size_t notes_ = 0;
};

} // namespace archcheck::support
