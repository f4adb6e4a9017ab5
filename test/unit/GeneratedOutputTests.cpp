//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>
#include <string>
#include <vector>

#include "stateserde/CodeGen/GeneratedOutput.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Path.h"

namespace
{

std::string readTextFile(const std::string& path)
{
    auto buffer = llvm::MemoryBuffer::getFile(path);
    if (!buffer)
    {
        return {};
    }
    return (*buffer)->getBuffer().str();
}

std::string join(llvm::StringRef root, llvm::StringRef a, llvm::StringRef b = "")
{
    llvm::SmallString<256> path(root);
    llvm::sys::path::append(path, a);
    if (!b.empty())
    {
        llvm::sys::path::append(path, b);
    }
    return std::string(path.str());
}

bool testDepfileRule()
{
    const std::string rule =
        stateserde::renderDepfileRule("/tmp/out dir/a:b.hpp", {"/s/z $.ssd", "/s/a#.ssd", "/s/z $.ssd"});
    if (rule != "/tmp/out\\ dir/a\\:b.hpp: /s/a\\#.ssd /s/z\\ $$.ssd\n")
    {
        std::cerr << "depfile rule escaping or ordering mismatch: " << rule;
        return false;
    }
    if (stateserde::renderDepfileRule("/tmp/target", {}) != "/tmp/target:\n")
    {
        std::cerr << "depfile rule without sources mismatch\n";
        return false;
    }
    if (stateserde::absoluteOutputPath("/a/./b/../c.hpp") != "/a/c.hpp")
    {
        std::cerr << "absolute output paths should fold dot components\n";
        return false;
    }
    return true;
}

bool testHeaderWriting()
{
    llvm::SmallString<128> rootBuffer;
    if (llvm::sys::fs::createUniqueDirectory("stateserde-output-tests", rootBuffer))
    {
        std::cerr << "could not create a scratch directory\n";
        return false;
    }
    const std::string root(rootBuffer.str());
    auto              fail = [&](const std::string& message) {
        std::cerr << message << "\n";
        (void) llvm::sys::fs::remove_directories(root);
        return false;
    };

    std::vector<std::string>     written;
    stateserde::OutputPolicy     policy;
    stateserde::GeneratedHeader  header;
    policy.written       = &written;
    header.path          = join(root, "demo", "shapes.hpp");
    header.content       = "first\n";
    header.schemaSources = {"/s/shapes.ssd", "/s/base.ssd", "/s/shapes.ssd"};

    if (auto err = stateserde::writeGeneratedHeader(header, true, policy))
    {
        return fail("header write failed: " + llvm::toString(std::move(err)));
    }
    if (readTextFile(header.path) != "first\n")
    {
        return fail("generated header content mismatch");
    }
    if (readTextFile(header.path + ".d") !=
        stateserde::renderDepfileRule(stateserde::absoluteOutputPath(header.path), {"/s/base.ssd", "/s/shapes.ssd"}))
    {
        return fail("depfile should list each schema source once, by absolute path");
    }
    if (written.size() != 2 || written.back() != stateserde::absoluteOutputPath(header.path + ".d"))
    {
        return fail("the header and its depfile should both be reported");
    }
    auto mode = llvm::sys::fs::getPermissions(header.path);
    if (!mode || (*mode & llvm::sys::fs::owner_write) != 0 || (*mode & llvm::sys::fs::owner_read) == 0)
    {
        return fail("generated headers should be read-only");
    }

    // Output left read-only by the previous run is replaced.
    header.content = "second\n";
    if (auto err = stateserde::writeGeneratedHeader(header, false, policy))
    {
        return fail("rewrite failed: " + llvm::toString(std::move(err)));
    }
    if (readTextFile(header.path) != "second\n" || written.size() != 3)
    {
        return fail("rewrite should replace the header and report it without a depfile");
    }

    stateserde::OutputPolicy keep;
    keep.noOverwrite = true;
    if (auto err = stateserde::writeOutputFile(header.path, "third\n", keep))
    {
        llvm::consumeError(std::move(err));
    }
    else
    {
        return fail("noOverwrite should reject an existing header");
    }

    stateserde::OutputPolicy writable;
    const std::string        loose = join(root, "loose.hpp");
    if (auto err = stateserde::writeOutputFile(loose, "x\n", writable))
    {
        return fail("write failed: " + llvm::toString(std::move(err)));
    }
    writable.readOnly = false;
    if (auto err = stateserde::writeOutputFile(loose, "y\n", writable))
    {
        return fail("write failed: " + llvm::toString(std::move(err)));
    }
    auto looseMode = llvm::sys::fs::getPermissions(loose);
    if (!looseMode || (*looseMode & llvm::sys::fs::owner_write) == 0)
    {
        return fail("readOnly=false should leave the file writable");
    }

    std::vector<std::string>    dryWritten;
    stateserde::OutputPolicy    dry;
    stateserde::GeneratedHeader dryHeader;
    dry.dryRun          = true;
    dry.written         = &dryWritten;
    dryHeader.path      = join(root, "dry", "x.hpp");
    dryHeader.content   = "never\n";
    if (auto err = stateserde::writeGeneratedHeader(dryHeader, true, dry))
    {
        return fail("dry run failed: " + llvm::toString(std::move(err)));
    }
    if (llvm::sys::fs::exists(dryHeader.path) || llvm::sys::fs::exists(dryHeader.path + ".d") ||
        dryWritten.size() != 2 || !llvm::StringRef(dryWritten.back()).endswith(".hpp.d"))
    {
        return fail("a dry run should report the header and depfile without creating them");
    }

    (void) llvm::sys::fs::remove_directories(root);
    return true;
}

}  // namespace

bool runGeneratedOutputTests()
{
    bool ok = true;
    ok      = testDepfileRule() && ok;
    ok      = testHeaderWriting() && ok;
    return ok;
}
