//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include "SchemaTestSupport.h"

#include "stateserde/CodeGen/CppEmitter.h"

#include "llvm/Support/Error.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace
{

using stateserde::test::analyzeSources;

const char* const ShapesSchema = R"(namespace demo;
include "fixtures/Recorder.h";

record Wrapper<T> {
    @rename("v") value: T;
    @stateless label: string;
    @skip cache: u32;
}

union Event { Idle, Tick(u64), Moved { x: i32; y: i32; } }

@state(::app::Ctx)
record Node {
    value: i32;
    next: optional<box<Node>>;
}

record Meters(f64);
)";

std::filesystem::path makeUniqueTempDir()
{
    const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    return std::filesystem::temp_directory_path() / ("stateserde-cpp-emitter-" + std::to_string(now));
}

std::string readTextFile(const std::filesystem::path& path)
{
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

bool expectContains(const std::string& text, const std::string& needle, const std::string& what)
{
    if (text.find(needle) != std::string::npos)
    {
        return true;
    }
    std::cerr << what << ": expected generated header to contain:\n" << needle << "\n";
    return false;
}

bool testShapesHeader()
{
    stateserde::DiagnosticEngine diag;
    const auto                   semantic = analyzeSources({{"demo/shapes.ssd", ShapesSchema}}, diag);
    if (!semantic)
    {
        std::cerr << "shapes schema failed analysis\n";
        stateserde::test::dumpDiagnostics(diag);
        return false;
    }
    const stateserde::CppEmitOptions options;
    const std::string header = stateserde::renderCppHeader(*semantic, semantic->units.front(), options);

    bool ok = true;
    ok      = expectContains(header, "// Generated by stateserdec from demo/shapes.ssd. Do not edit.", "banner") && ok;
    ok      = expectContains(header, "#ifndef STATESERDE_GENERATED_DEMO_SHAPES_HPP", "guard") && ok;
    ok      = expectContains(header, "#endif  // STATESERDE_GENERATED_DEMO_SHAPES_HPP", "guard end") && ok;
    ok      = expectContains(header, "#include \"stateserde/Runtime/StateSerde.h\"", "runtime include") && ok;
    ok      = expectContains(header, "#include \"fixtures/Recorder.h\"", "user include") && ok;
    ok      = expectContains(header, "namespace demo\n{", "namespace") && ok;
    ok      = expectContains(header, "template <typename T>\nstruct Wrapper;", "forward declaration") && ok;

    // Definitions.
    ok = expectContains(header, "  // Wire key \"v\".\n  T value{};", "renamed member") && ok;
    ok = expectContains(header, "  // Not written; value-initialized on decode.\n  std::uint32_t cache{};", "skip") && ok;
    ok = expectContains(header, "  std::variant<Idle, Tick, Moved> value;", "union storage") && ok;
    ok = expectContains(header, "    std::uint64_t _0;", "positional payload member") && ok;
    ok = expectContains(header, "  std::optional<::stateserde::Box<::demo::Node>> next{};", "boxed member") && ok;
    ok = expectContains(header, "  double _0{};", "newtype member") && ok;

    // Generic record: constrained partial specialization.
    ok = expectContains(header,
                        "template <typename T, typename State>\n"
                        "  requires ::stateserde::StateEncodable<T, State>\n"
                        "struct StateEncoder<::demo::Wrapper<T>, State>",
                        "constrained encoder") &&
         ok;
    ok = expectContains(header,
                        "template <typename T, typename State>\n"
                        "  requires ::stateserde::StateDecodable<T, State>\n"
                        "struct StateDecoder<::demo::Wrapper<T>, State>",
                        "constrained decoder") &&
         ok;
    ok = expectContains(header, "::stateserde::encodeStateField(value.value, state, object, \"v\")", "stateful") && ok;
    ok = expectContains(header, "::stateserde::encodePlainField(value.label, object, \"label\")", "stateless") && ok;
    ok = expectContains(header, "::stateserde::decodePlainField(entry.second, f_label, \"label\")", "plain decode") &&
         ok;
    ok = expectContains(header, "::stateserde::makeMissingFieldError(\"v\")", "missing key uses wire key") && ok;
    if (header.find("value.cache") != std::string::npos || header.find("f_cache") != std::string::npos)
    {
        std::cerr << "skipped field must not be visited by generated codecs\n";
        ok = false;
    }

    // Pinned context: full specialization defined after all declarations.
    ok = expectContains(header, "template <>\nstruct StateEncoder<::demo::Node, ::app::Ctx>", "pinned encoder") && ok;
    ok = expectContains(header,
                        "inline llvm::Error StateEncoder<::demo::Node, ::app::Ctx>::encode(const ::demo::Node& value, "
                        "::app::Ctx& state, llvm::json::Value& out)",
                        "pinned encoder definition") &&
         ok;
    ok = expectContains(header,
                        "inline llvm::Expected<::demo::Node> StateDecoder<::demo::Node, ::app::Ctx>::decode("
                        "::app::Ctx& state, const llvm::json::Value& in)",
                        "pinned decoder definition") &&
         ok;
    ok = expectContains(header, ".next = std::move(f_next).value_or(std::nullopt)", "absent optional") && ok;
    if (header.find("makeMissingFieldError(\"next\")") != std::string::npos)
    {
        std::cerr << "optional field must not be reported missing\n";
        ok = false;
    }

    // Union codecs.
    ok = expectContains(header, "template <typename State>\nstruct StateEncoder<::demo::Event, State>", "union") && ok;
    ok = expectContains(header,
                        "::stateserde::makeUnknownVariantError(*bareTag, {\"Idle\", \"Tick\", \"Moved\"})",
                        "bare tag fallback") &&
         ok;
    ok = expectContains(header, "::stateserde::makeUnknownVariantError(tag, {\"Idle\", \"Tick\", \"Moved\"})", "tag") &&
         ok;
    ok = expectContains(header, "return ::demo::Event{.value = typename ::demo::Event::Idle{}};", "unit variant") && ok;
    ok = expectContains(header, "out = \"Idle\";", "unit variant encode") && ok;
    ok = expectContains(header, "return ::stateserde::withFieldContext(std::move(err), \"Tick\");", "tag path") && ok;
    ok = expectContains(header, "wrapper[\"Moved\"] = std::move(payload);", "external tagging") && ok;
    ok = expectContains(header, "case 2:\n", "variant dispatch") && ok;

    // Newtype record.
    ok = expectContains(header, "::stateserde::encodeStateValue(value._0, state, out)", "newtype encode") && ok;
    ok = expectContains(header, "::stateserde::decodeStateValue(state, in, f_0)", "newtype decode") && ok;
    return ok;
}

bool testCrossFileDependencies()
{
    stateserde::DiagnosticEngine diag;
    const auto                   semantic =
        analyzeSources({{"demo/base.ssd", "namespace demo;\nrecord Point { x: i32; y: i32; }\n"},
                        {"demo/geometry.ssd", "namespace demo;\nrecord Segment { a: Point; b: Point; }\n"}},
                       diag);
    if (!semantic)
    {
        std::cerr << "cross-file schemas failed analysis\n";
        stateserde::test::dumpDiagnostics(diag);
        return false;
    }
    const stateserde::SchemaUnit* geometry = nullptr;
    for (const auto& unit : semantic->units)
    {
        if (unit.relativePath == "demo/geometry.ssd")
        {
            geometry = &unit;
        }
    }
    if (geometry == nullptr)
    {
        std::cerr << "geometry unit missing from module\n";
        return false;
    }
    if (stateserde::generatedHeaderPath(*geometry, ".hh") != "demo/geometry.hh")
    {
        std::cerr << "generated header path should replace the schema extension\n";
        return false;
    }
    stateserde::CppEmitOptions options;
    options.runtimeInclude = "runtime/All.h";
    const std::string header = stateserde::renderCppHeader(*semantic, *geometry, options);
    bool              ok     = true;
    ok = expectContains(header, "#include \"runtime/All.h\"", "custom runtime include") && ok;
    ok = expectContains(header, "#include \"demo/base.hpp\"", "dependency header include") && ok;
    ok = expectContains(header, "  ::demo::Point a{};", "cross-file member") && ok;
    return ok;
}

bool testEmitToDirectory()
{
    stateserde::DiagnosticEngine diag;
    const auto                   semantic = analyzeSources({{"demo/shapes.ssd", ShapesSchema}}, diag);
    if (!semantic)
    {
        std::cerr << "shapes schema failed analysis\n";
        return false;
    }

    const std::filesystem::path root = makeUniqueTempDir();
    std::error_code             ec;
    auto                        fail = [&](const std::string& message) {
        std::cerr << message << "\n";
        std::filesystem::remove_all(root, ec);
        return false;
    };

    stateserde::CppEmitOptions options;
    options.outDir        = root.string();
    options.writeDepfiles = true;
    if (auto err = stateserde::emitCpp(*semantic, options, diag))
    {
        return fail("emitCpp failed: " + llvm::toString(std::move(err)));
    }
    const auto header = root / "demo" / "shapes.hpp";
    if (readTextFile(header).find("struct Wrapper") == std::string::npos)
    {
        return fail("emitted header is missing or incomplete");
    }
    if (readTextFile(header.string() + ".d").find("/schemas/demo/shapes.ssd") == std::string::npos)
    {
        return fail("depfile should list the schema file");
    }

    std::vector<std::string>   recorded;
    stateserde::CppEmitOptions dry;
    dry.outDir                      = (root / "dry").string();
    dry.outputPolicy.dryRun          = true;
    dry.outputPolicy.written = &recorded;
    if (auto err = stateserde::emitCpp(*semantic, dry, diag))
    {
        return fail("dry-run emitCpp failed: " + llvm::toString(std::move(err)));
    }
    if (recorded.size() != 1 || std::filesystem::exists(root / "dry", ec))
    {
        return fail("dry run must record exactly one output and write nothing");
    }

    stateserde::CppEmitOptions selectedMissing;
    selectedMissing.outDir          = root.string();
    selectedMissing.selectedSchemas = {"demo/absent.ssd"};
    if (auto err = stateserde::emitCpp(*semantic, selectedMissing, diag))
    {
        llvm::consumeError(std::move(err));
    }
    else
    {
        return fail("selecting an unknown schema file should fail");
    }
    if (!stateserde::test::hasError(diag, stateserde::DiagnosticCategory::General, "was not found under any schema root"))
    {
        return fail("unknown selected schema should be reported as a diagnostic");
    }

    stateserde::CppEmitOptions noOutDir;
    if (auto err = stateserde::emitCpp(*semantic, noOutDir, diag))
    {
        llvm::consumeError(std::move(err));
    }
    else
    {
        return fail("emitCpp without an output directory should fail");
    }

    std::filesystem::remove_all(root, ec);
    return true;
}

}  // namespace

bool runCppEmitterTests()
{
    bool ok = true;
    ok      = testShapesHeader() && ok;
    ok      = testCrossFileDependencies() && ok;
    ok      = testEmitToDirectory() && ok;
    return ok;
}
