//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Schema discovery declarations for locating and loading schema source files.
///
//===----------------------------------------------------------------------===//
#ifndef STATESERDE_FRONTEND_DISCOVERY_H
#define STATESERDE_FRONTEND_DISCOVERY_H

#include "stateserde/Frontend/AST.h"
#include "stateserde/Support/Diagnostics.h"

#include <string>
#include <vector>

namespace stateserde
{

/// @file
/// @brief Discovery routines for locating and loading schema files.

/// @brief File extension of schema sources.
inline constexpr const char* SchemaFileExtension = ".ssd";

/// @brief Discovers and loads every schema file below the given roots.
/// @param[in] schemaRoots Root directories scanned recursively.
/// @param[in,out] diagnostics Diagnostic sink for discovery and I/O issues.
/// @return Discovered schemas sorted by relative path.
std::vector<DiscoveredSchema> discoverSchemas(const std::vector<std::string>& schemaRoots,
                                              DiagnosticEngine&               diagnostics);

}  // namespace stateserde

#endif  // STATESERDE_FRONTEND_DISCOVERY_H
