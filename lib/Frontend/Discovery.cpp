//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements filesystem discovery for schema files.
///
/// Discovery scans schema roots, loads every `*.ssd` file, and rejects files that would map to the same output path.
///
//===----------------------------------------------------------------------===//

#include "stateserde/Frontend/Discovery.h"
#include "stateserde/Support/Diagnostics.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unordered_map>
#include <utility>

namespace stateserde
{
namespace
{

bool readTextFile(const std::filesystem::path& path, std::string& out)
{
    std::ifstream in(path, std::ios::binary);
    if (!in.good())
    {
        return false;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    out = ss.str();
    return true;
}

void discoverInRoot(const std::filesystem::path& root, std::vector<DiscoveredSchema>& out, DiagnosticEngine& diagnostics)
{
    std::error_code ec;
    const auto      canonicalRoot = std::filesystem::weakly_canonical(root, ec);
    if (ec || !std::filesystem::is_directory(canonicalRoot))
    {
        diagnostics.error({root.string(), 1, 1}, "schema root is not a directory: " + root.string());
        return;
    }

    for (const auto& entry : std::filesystem::recursive_directory_iterator(canonicalRoot))
    {
        if (!entry.is_regular_file() || entry.path().extension() != SchemaFileExtension)
        {
            continue;
        }

        DiscoveredSchema schema;
        schema.filePath     = entry.path().string();
        schema.relativePath = std::filesystem::relative(entry.path(), canonicalRoot).generic_string();
        if (!readTextFile(entry.path(), schema.text))
        {
            diagnostics.error({schema.filePath, 1, 1}, "failed to read schema file");
            continue;
        }
        out.push_back(std::move(schema));
    }
}

}  // namespace

std::vector<DiscoveredSchema> discoverSchemas(const std::vector<std::string>& schemaRoots,
                                              DiagnosticEngine&               diagnostics)
{
    std::vector<DiscoveredSchema> schemas;
    for (const std::string& root : schemaRoots)
    {
        discoverInRoot(root, schemas, diagnostics);
    }

    std::sort(schemas.begin(), schemas.end(), [](const DiscoveredSchema& a, const DiscoveredSchema& b) {
        if (a.relativePath != b.relativePath)
        {
            return a.relativePath < b.relativePath;
        }
        return a.filePath < b.filePath;
    });

    std::unordered_map<std::string, std::string> byRelativePath;
    for (const auto& schema : schemas)
    {
        const auto [it, inserted] = byRelativePath.emplace(schema.relativePath, schema.filePath);
        if (!inserted)
        {
            diagnostics.error({schema.filePath, 1, 1},
                              "schema file " + schema.relativePath + " is also provided by " + it->second);
        }
    }

    if (schemas.empty() && !diagnostics.hasErrors())
    {
        diagnostics.warning({schemaRoots.empty() ? std::string() : schemaRoots.front(), 1, 1},
                            "no schema files found");
    }
    return schemas;
}

}  // namespace stateserde
