//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements diagnostic collection and formatting helpers.
///
/// The diagnostic engine records source-aware notes, warnings, and errors consumed throughout the schema pipeline.
///
//===----------------------------------------------------------------------===//

#include "stateserde/Support/Diagnostics.h"

#include <algorithm>
#include <utility>

namespace stateserde
{

const char* diagnosticCategoryTag(const DiagnosticCategory category)
{
    switch (category)
    {
    case DiagnosticCategory::General:
        return "general";
    case DiagnosticCategory::Syntax:
        return "syntax";
    case DiagnosticCategory::Schema:
        return "schema";
    case DiagnosticCategory::Recursion:
        return "recursion";
    }
    return "general";
}

void DiagnosticEngine::report(DiagnosticLevel          level,
                              const DiagnosticCategory category,
                              const SourceLocation&    location,
                              std::string              message)
{
    diagnostics_.push_back(Diagnostic{level, category, location, std::move(message)});
}

void DiagnosticEngine::note(const SourceLocation& location, std::string message)
{
    report(DiagnosticLevel::Note, DiagnosticCategory::General, location, std::move(message));
}

void DiagnosticEngine::warning(const SourceLocation& location, std::string message)
{
    report(DiagnosticLevel::Warning, DiagnosticCategory::General, location, std::move(message));
}

void DiagnosticEngine::error(const SourceLocation& location, std::string message)
{
    report(DiagnosticLevel::Error, DiagnosticCategory::General, location, std::move(message));
}

void DiagnosticEngine::error(const DiagnosticCategory category, const SourceLocation& location, std::string message)
{
    report(DiagnosticLevel::Error, category, location, std::move(message));
}

bool DiagnosticEngine::hasErrors() const
{
    return std::any_of(diagnostics_.begin(), diagnostics_.end(), [](const Diagnostic& d) {
        return d.level == DiagnosticLevel::Error;
    });
}

std::size_t DiagnosticEngine::errorCount(const DiagnosticCategory category) const
{
    std::size_t count = 0;
    for (const Diagnostic& d : diagnostics_)
    {
        if (d.level == DiagnosticLevel::Error && d.category == category)
        {
            ++count;
        }
    }
    return count;
}

}  // namespace stateserde
