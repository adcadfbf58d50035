/**
 * @file diagnostics.cpp
 * @brief Implements the diagnostic engine responsible for collecting messages.
 * @copyright
 *     GNU GPL v3. See the LICENSE file in the project root for full terms.
 * @details
 *     Rule evaluation reports trace notes and model gaps to a caller-supplied
 *     engine.  Diagnostics are stored until callers explicitly print or
 *     inspect them; the engine never writes to a stream on its own.
 */

#include "support/diagnostics.hpp"
#include "support/diag_expected.hpp"

#include <utility>

namespace archcheck::support
{
/**
 * @brief Adds a diagnostic to the engine and updates severity counters.
 *
 * @param d Diagnostic to record; moved into the engine's storage.
 */
void DiagnosticEngine::report(Diagnostic d)
{
    switch (d.severity)
    {
        case Severity::Error:
            ++errors_;
            break;
        case Severity::Warning:
            break;
        case Severity::Note:
            ++notes_;
            break;
    }
    diags_.push_back(std::move(d));
}

/**
 * @brief Writes all stored diagnostics to the provided output stream.
 *
 * Formatting is delegated to `printDiag` so engine output and ad-hoc
 * diagnostics printed by callers look identical.
 *
 * @param os Output stream that receives the formatted diagnostics.
 */
void DiagnosticEngine::printAll(std::ostream &os) const
{
    for (const auto &d : diags_)
    {
        printDiag(d, os);
    }
}

const std::vector<Diagnostic> &DiagnosticEngine::diagnostics() const
{
    return diags_;
}

/**
 * @brief Returns the number of error-severity diagnostics recorded so far.
 */
size_t DiagnosticEngine::errorCount() const
{
    return errors_;
}

size_t DiagnosticEngine::noteCount() const
{
    return notes_;
}
} // namespace archcheck::support
