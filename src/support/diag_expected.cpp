//===----------------------------------------------------------------------===//
//
// Part of the Archcheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the diagnostic-oriented Expected helpers used across the support
// library: the Expected<void> specialisation, severity names, and the printer
// shared by the diagnostic engine and ad-hoc callers.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Supplies the `Expected<void>` helpers specialized for diagnostics.

#include "support/diag_expected.hpp"

namespace archcheck::support
{
/// @brief Construct an Expected<void> that stores a diagnostic error state.
Expected<void>::Expected(Diag diag) : error_(std::move(diag))
{
}

/// @brief Report whether the Expected<void> represents a successful outcome.
///
/// @details Success is indicated by the absence of a stored diagnostic.
bool Expected<void>::hasValue() const
{
    return !error_.has_value();
}

Expected<void>::operator bool() const
{
    return hasValue();
}

/// @brief Access the diagnostic that describes the recorded failure.
///
/// @details Callers must ensure the `Expected` represents an error before
///          invoking this accessor.
const Diag &Expected<void>::error() const &
{
    return *error_;
}

namespace detail
{
/// @brief Map a diagnostic severity to a lowercase string used for printing.
const char *diagSeverityToString(Severity severity)
{
    switch (severity)
    {
        case Severity::Note:
            return "note";
        case Severity::Warning:
            return "warning";
        case Severity::Error:
            return "error";
    }
    return "";
}
} // namespace detail

Diag makeError(SourceLoc loc, std::string msg)
{
    return Diag{Severity::Error, std::move(msg), std::move(loc)};
}

/// @brief Print a diagnostic to the provided output stream.
///
/// @details When the diagnostic carries a file name the message is prefixed
///          with "<file>:<line>:" in the usual compiler style; the line is
///          omitted when unknown.  A trailing newline is always written so
///          multiple diagnostics form a contiguous block.
void printDiag(const Diag &diag, std::ostream &os)
{
    if (diag.loc.hasFile())
    {
        os << diag.loc.file;
        if (diag.loc.hasLine())
            os << ':' << diag.loc.line;
        os << ": ";
    }
    os << detail::diagSeverityToString(diag.severity) << ": " << diag.message << '\n';
}
} // namespace archcheck::support
