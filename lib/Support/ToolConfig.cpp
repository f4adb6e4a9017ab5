//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements JSON configuration loading for the generator.
///
//===----------------------------------------------------------------------===//

#include "stateserde/Support/ToolConfig.h"

#include "llvm/Support/JSON.h"
#include "llvm/Support/MemoryBuffer.h"

#include <utility>

namespace stateserde
{
namespace
{

llvm::Error wrongKind(llvm::StringRef key, llvm::StringRef expected)
{
    return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                   "config key '%s' must be %s",
                                   key.str().c_str(),
                                   expected.str().c_str());
}

llvm::Error readBoolean(const llvm::json::Value& value, llvm::StringRef key, bool& out)
{
    if (auto parsed = value.getAsBoolean())
    {
        out = *parsed;
        return llvm::Error::success();
    }
    return wrongKind(key, "a boolean");
}

llvm::Error readString(const llvm::json::Value& value, llvm::StringRef key, std::string& out)
{
    if (auto parsed = value.getAsString())
    {
        out = parsed->str();
        return llvm::Error::success();
    }
    return wrongKind(key, "a string");
}

llvm::Error readNamespace(const llvm::json::Value& value, std::vector<std::string>& out)
{
    if (auto text = value.getAsString())
    {
        auto components = splitNamespace(*text);
        if (!components)
        {
            return components.takeError();
        }
        out = std::move(*components);
        return llvm::Error::success();
    }

    const auto* array = value.getAsArray();
    if (!array)
    {
        return wrongKind("namespacePrefix", "a string or an array of strings");
    }
    std::vector<std::string> components;
    for (const llvm::json::Value& item : *array)
    {
        auto text = item.getAsString();
        if (!text || text->empty())
        {
            return wrongKind("namespacePrefix", "a string or an array of non-empty strings");
        }
        components.push_back(text->str());
    }
    out = std::move(components);
    return llvm::Error::success();
}

}  // namespace

llvm::Expected<std::vector<std::string>> splitNamespace(llvm::StringRef text)
{
    std::vector<std::string> out;
    if (text.empty())
    {
        return out;
    }

    const llvm::StringRef separator = text.contains("::") ? "::" : ".";
    llvm::StringRef       rest      = text;
    while (true)
    {
        const auto [head, tail] = rest.split(separator);
        if (head.empty())
        {
            return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                           "invalid namespace '%s': empty component",
                                           text.str().c_str());
        }
        out.push_back(head.str());
        if (tail.data() == nullptr)
        {
            break;
        }
        rest = tail;
    }
    return out;
}

llvm::Error applyToolConfigJson(llvm::StringRef text, ToolConfig& config)
{
    auto parsed = llvm::json::parse(text);
    if (!parsed)
    {
        return parsed.takeError();
    }
    const auto* root = parsed->getAsObject();
    if (!root)
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(), "config root must be a JSON object");
    }

    ToolConfig updated = config;
    const auto applyKey = [&updated](llvm::StringRef key, const llvm::json::Value& value) -> llvm::Error {
        if (key == "outDir")
        {
            return readString(value, key, updated.outDir);
        }
        if (key == "headerExtension")
        {
            return readString(value, key, updated.headerExtension);
        }
        if (key == "runtimeInclude")
        {
            return readString(value, key, updated.runtimeInclude);
        }
        if (key == "namespacePrefix")
        {
            return readNamespace(value, updated.namespacePrefix);
        }
        if (key == "dryRun")
        {
            return readBoolean(value, key, updated.dryRun);
        }
        if (key == "noOverwrite")
        {
            return readBoolean(value, key, updated.noOverwrite);
        }
        if (key == "depfile")
        {
            return readBoolean(value, key, updated.depfile);
        }
        if (key == "verbose")
        {
            return readBoolean(value, key, updated.verbose);
        }
        return llvm::createStringError(llvm::inconvertibleErrorCode(), "unknown config key '%s'", key.str().c_str());
    };

    for (const auto& [key, value] : *root)
    {
        if (llvm::Error err = applyKey(key, value))
        {
            return err;
        }
    }

    if (updated.headerExtension.empty() || updated.headerExtension.front() != '.')
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "config key 'headerExtension' must start with '.'");
    }
    config = std::move(updated);
    return llvm::Error::success();
}

llvm::Error loadToolConfigFile(llvm::StringRef path, ToolConfig& config)
{
    auto buffer = llvm::MemoryBuffer::getFile(path, /*IsText=*/true);
    if (!buffer)
    {
        return llvm::createStringError(buffer.getError(), "failed to read config %s", path.str().c_str());
    }
    if (llvm::Error err = applyToolConfigJson((*buffer)->getBuffer(), config))
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "%s: %s",
                                       path.str().c_str(),
                                       llvm::toString(std::move(err)).c_str());
    }
    return llvm::Error::success();
}

}  // namespace stateserde
