//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include "stateserde/CodeGen/GeneratedOutput.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/raw_ostream.h"

#include <set>
#include <system_error>

namespace stateserde
{

namespace
{

const llvm::sys::fs::perms kReadOnlyMode = llvm::sys::fs::all_read;
const llvm::sys::fs::perms kWritableMode = llvm::sys::fs::all_read | llvm::sys::fs::owner_write;

void appendEscaped(std::string& out, llvm::StringRef token)
{
    for (const char c : token)
    {
        if (c == '$')
        {
            out += "$$";
            continue;
        }
        if (c == ' ' || c == '\t' || c == '#' || c == ':' || c == '\\')
        {
            out.push_back('\\');
        }
        out.push_back(c);
    }
}

llvm::Error ioError(const std::error_code ec, const char* action, llvm::StringRef path)
{
    return llvm::createStringError(ec, "failed to %s %s: %s", action, path.str().c_str(), ec.message().c_str());
}

}  // namespace

std::string absoluteOutputPath(llvm::StringRef path)
{
    llvm::SmallString<256> buffer(path);
    // An unresolvable working directory leaves the path relative; it is still folded.
    (void) llvm::sys::fs::make_absolute(buffer);
    llvm::sys::path::remove_dots(buffer, true);
    return std::string(buffer.str());
}

llvm::Error writeOutputFile(llvm::StringRef path, llvm::StringRef content, const OutputPolicy& policy)
{
    if (policy.written != nullptr)
    {
        policy.written->push_back(absoluteOutputPath(path));
    }
    if (policy.dryRun)
    {
        return llvm::Error::success();
    }

    const llvm::StringRef parent = llvm::sys::path::parent_path(path);
    if (!parent.empty())
    {
        if (const std::error_code ec = llvm::sys::fs::create_directories(parent))
        {
            return ioError(ec, "create output directory", parent);
        }
    }

    if (llvm::sys::fs::exists(path))
    {
        if (policy.noOverwrite)
        {
            return llvm::createStringError(std::make_error_code(std::errc::file_exists),
                                           "refusing to overwrite existing output file %s",
                                           path.str().c_str());
        }
        if (const std::error_code ec = llvm::sys::fs::remove(path))
        {
            return ioError(ec, "remove existing output file", path);
        }
    }

    std::error_code      ec;
    llvm::raw_fd_ostream os(path, ec, llvm::sys::fs::OF_Text);
    if (ec)
    {
        return ioError(ec, "open", path);
    }
    os << content;
    os.close();
    if (os.has_error())
    {
        const std::error_code writeError = os.error();
        os.clear_error();
        return ioError(writeError, "write", path);
    }

    if (const std::error_code modeError =
            llvm::sys::fs::setPermissions(path, policy.readOnly ? kReadOnlyMode : kWritableMode))
    {
        return ioError(modeError, "set mode on", path);
    }
    return llvm::Error::success();
}

std::string renderDepfileRule(llvm::StringRef target, const std::vector<std::string>& sources)
{
    const std::set<std::string> ordered(sources.begin(), sources.end());

    std::string rule;
    appendEscaped(rule, target);
    rule.push_back(':');
    for (const std::string& source : ordered)
    {
        rule.push_back(' ');
        appendEscaped(rule, source);
    }
    rule.push_back('\n');
    return rule;
}

llvm::Error writeGeneratedHeader(const GeneratedHeader& header, const bool withDepfile, const OutputPolicy& policy)
{
    if (auto err = writeOutputFile(header.path, header.content, policy))
    {
        return err;
    }
    if (!withDepfile)
    {
        return llvm::Error::success();
    }

    std::vector<std::string> sources;
    sources.reserve(header.schemaSources.size());
    for (const std::string& source : header.schemaSources)
    {
        sources.push_back(absoluteOutputPath(source));
    }
    return writeOutputFile(header.path + ".d", renderDepfileRule(absoluteOutputPath(header.path), sources), policy);
}

}  // namespace stateserde
