//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Declarations for diagnostic reporting interfaces used across the frontend, schema analysis, and code generation.
///
//===----------------------------------------------------------------------===//
#ifndef STATESERDE_SUPPORT_DIAGNOSTICS_H
#define STATESERDE_SUPPORT_DIAGNOSTICS_H

#include "stateserde/Frontend/SourceLocation.h"

#include <cstddef>
#include <string>
#include <vector>

namespace stateserde
{

/// @file
/// @brief Diagnostic collection and reporting interfaces.

/// @brief Severity level for a diagnostic message.
enum class DiagnosticLevel
{

    /// @brief Informational note.
    Note,

    /// @brief Non-fatal warning.
    Warning,

    /// @brief Fatal error.
    Error,
};

/// @brief Build-time failure class a diagnostic belongs to.
enum class DiagnosticCategory
{

    /// @brief I/O, configuration, and other tool-level problems.
    General,

    /// @brief Malformed schema text rejected by the parser.
    Syntax,

    /// @brief Malformed or conflicting annotations and declarations (`SchemaError`).
    Schema,

    /// @brief Non-terminating per-field bound inference (`RecursionError`).
    Recursion,
};

/// @brief Returns the short tag printed in front of a category's messages.
/// @param[in] category Diagnostic category.
/// @return Tag text such as `schema` or `recursion`.
const char* diagnosticCategoryTag(DiagnosticCategory category);

/// @brief Single diagnostic record produced by the pipeline.
struct Diagnostic
{
    /// @brief Severity level.
    DiagnosticLevel level;

    /// @brief Failure class.
    DiagnosticCategory category;

    /// @brief Source location associated with the message.
    SourceLocation location;

    /// @brief Human-readable message text.
    std::string message;
};

/// @brief Accumulates diagnostics emitted across all compilation stages.
class DiagnosticEngine final
{
public:
    /// @brief Appends a diagnostic entry.
    /// @param[in] level Severity level.
    /// @param[in] category Failure class.
    /// @param[in] location Source location associated with the message.
    /// @param[in] message Human-readable message text.
    void report(DiagnosticLevel level, DiagnosticCategory category, const SourceLocation& location, std::string message);

    /// @brief Emits a note-level diagnostic.
    /// @param[in] location Source location associated with the message.
    /// @param[in] message Human-readable message text.
    void note(const SourceLocation& location, std::string message);

    /// @brief Emits a warning-level diagnostic.
    /// @param[in] location Source location associated with the message.
    /// @param[in] message Human-readable message text.
    void warning(const SourceLocation& location, std::string message);

    /// @brief Emits a general error-level diagnostic.
    /// @param[in] location Source location associated with the message.
    /// @param[in] message Human-readable message text.
    void error(const SourceLocation& location, std::string message);

    /// @brief Emits an error-level diagnostic in a specific category.
    /// @param[in] category Failure class.
    /// @param[in] location Source location associated with the message.
    /// @param[in] message Human-readable message text.
    void error(DiagnosticCategory category, const SourceLocation& location, std::string message);

    /// @brief Indicates whether any error diagnostics were recorded.
    /// @return True when at least one error exists.
    [[nodiscard]] bool hasErrors() const;

    /// @brief Counts recorded errors of one category.
    /// @param[in] category Failure class to count.
    /// @return Number of error-level diagnostics in `category`.
    [[nodiscard]] std::size_t errorCount(DiagnosticCategory category) const;

    /// @brief Returns all recorded diagnostics in insertion order.
    /// @return Immutable diagnostic list.
    [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const
    {
        return diagnostics_;
    }

private:
    /// @brief Backing storage for collected diagnostics.
    std::vector<Diagnostic> diagnostics_;
};

}  // namespace stateserde

#endif  // STATESERDE_SUPPORT_DIAGNOSTICS_H
