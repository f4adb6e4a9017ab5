//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Entry point for the `stateserdec` command-line schema compiler.
///
/// This tool discovers `.ssd` schema files, resolves field modes and wire
/// names, infers the constraints of the context-threaded operations, and
/// either prints the parsed or resolved model (`ast`, `check`) or writes C++
/// headers (`cpp`).
///
//===----------------------------------------------------------------------===//

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "stateserde/CodeGen/CppEmitter.h"
#include "stateserde/Frontend/ASTPrinter.h"
#include "stateserde/Frontend/Parser.h"
#include "stateserde/Semantics/Analyzer.h"
#include "stateserde/Semantics/ModelPrinter.h"
#include "stateserde/Support/Diagnostics.h"
#include "stateserde/Support/ToolConfig.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/InitLLVM.h"
#include "llvm/Support/raw_ostream.h"

namespace
{

/// @brief Checks whether a command token is implemented by `stateserdec`.
///
/// @param[in] command Command token from argv.
/// @return `true` if the command is one of the supported subcommands.
bool isKnownCommand(llvm::StringRef command)
{
    return command == "ast" || command == "check" || command == "cpp";
}

bool isHelpToken(llvm::StringRef arg)
{
    return arg == "--help" || arg == "-h";
}

/// @brief Prints compact usage guidance for invalid CLI invocations.
void printUsage()
{
    llvm::errs() << "Usage: stateserdec <ast|check|cpp> --schema-dir <dir> [options]\n"
                 << "Try: stateserdec --help\n";
}

/// @brief Prints the full help text and optional command-focused details.
///
/// @param[in] selectedCommand Optional command name used for focused help.
void printHelp(const std::string& selectedCommand = "")
{
    llvm::errs()
        << "NAME\n"
        << "  stateserdec - schema compiler for context-threaded JSON encode/decode\n\n"
        << "SYNOPSIS\n"
        << "  stateserdec <command> --schema-dir <dir> [--schema-dir <dir> ...] [options]\n"
        << "  stateserdec --help\n"
        << "  stateserdec <command> --help\n\n"
        << "DESCRIPTION\n"
        << "  stateserdec discovers .ssd schema files, resolves stateful/stateless field modes, wire keys and\n"
        << "  skipped fields, infers the constraints each generated operation needs, and rejects recursive\n"
        << "  types whose constraints would never terminate unless they pin the context with @state or\n"
        << "  @state_implements.\n\n"
        << "COMMANDS\n"
        << "  ast    Print the parsed schema files.\n"
        << "  check  Print the resolved model with the inferred constraint sets.\n"
        << "  cpp    Generate one C++20 header per schema file.\n\n"
        << "COMMON OPTIONS\n"
        << "  --schema-dir <dir>\n"
        << "      Schema root. Repeat to add more roots. Required for all commands except --help.\n"
        << "  --namespace-prefix <a::b>\n"
        << "      Namespace prepended to every schema namespace.\n"
        << "  --config <file>\n"
        << "      JSON file with defaults for outDir, headerExtension, runtimeInclude, namespacePrefix,\n"
        << "      dryRun, noOverwrite, depfile and verbose. Command-line flags win.\n"
        << "  --verbose\n"
        << "      Print per-type inference notes.\n"
        << "  --help, -h\n"
        << "      Print this help text. With a command, prints command-focused guidance.\n\n"
        << "CODEGEN OPTIONS (cpp)\n"
        << "  --out-dir <dir>\n"
        << "      Output directory root for generated headers.\n"
        << "  --schema <relative/path.ssd>\n"
        << "      Only write the header of this schema file. Repeatable. All files are still analyzed.\n"
        << "  --dry-run\n"
        << "      Compute outputs without writing files.\n"
        << "  --no-overwrite\n"
        << "      Fail instead of replacing existing files.\n"
        << "  --depfile\n"
        << "      Write a make depfile next to every generated header.\n\n"
        << "RUN SUMMARY\n"
        << "  On successful command execution, stateserdec prints a summary to stderr with:\n"
        << "    - files generated\n"
        << "    - output root\n"
        << "    - elapsed wall time\n\n"
        << "EXAMPLES\n"
        << "  stateserdec check --schema-dir schemas\n"
        << "  stateserdec cpp --schema-dir schemas --out-dir build/generated --depfile\n"
        << "  stateserdec cpp --schema-dir schemas --schema demo/counters.ssd --out-dir build/generated\n\n"
        << "EXIT STATUS\n"
        << "  0 on success, non-zero on syntax/schema/recursion errors, codegen failure or invalid CLI usage.\n";

    if (!selectedCommand.empty() && isKnownCommand(selectedCommand))
    {
        llvm::errs() << "\nCOMMAND FOCUS (" << selectedCommand << ")\n";
        if (selectedCommand == "ast")
        {
            llvm::errs() << "  Emits the parsed schema text to stdout. --out-dir is not used.\n";
        }
        else if (selectedCommand == "check")
        {
            llvm::errs() << "  Emits the resolved model to stdout. --out-dir is not used.\n";
        }
        else if (selectedCommand == "cpp")
        {
            llvm::errs() << "  Requires --out-dir. Honors --schema, --dry-run, --no-overwrite and --depfile.\n";
        }
    }
}

/// @brief Emits collected diagnostics to stderr.
///
/// @param[in] diag Diagnostic engine containing accumulated diagnostics.
void printDiagnostics(const stateserde::DiagnosticEngine& diag)
{
    for (const auto& d : diag.diagnostics())
    {
        llvm::StringRef level = "note";
        if (d.level == stateserde::DiagnosticLevel::Warning)
        {
            level = "warning";
        }
        else if (d.level == stateserde::DiagnosticLevel::Error)
        {
            level = "error";
        }
        llvm::errs() << d.location.str() << ": " << level << ": ";
        if (d.level == stateserde::DiagnosticLevel::Error)
        {
            llvm::errs() << "[" << stateserde::diagnosticCategoryTag(d.category) << "] ";
        }
        llvm::errs() << d.message << "\n";
    }
}

/// @brief Resolves a path to an absolute output-root string when possible.
std::string resolveOutputRoot(const std::string& root)
{
    if (root.empty())
    {
        return "stdout";
    }
    std::error_code ec;
    const auto      abs = std::filesystem::absolute(root, ec);
    if (!ec)
    {
        return abs.string();
    }
    return root;
}

/// @brief Prints the post-run command summary.
///
/// @param[in] command Executed top-level command.
/// @param[in] outputRoot Resolved output root description.
/// @param[in] generatedFiles Number of generated files.
/// @param[in] elapsed Wall-clock execution duration.
void printRunSummary(llvm::StringRef                           command,
                     llvm::StringRef                           outputRoot,
                     const std::uint64_t                       generatedFiles,
                     const std::chrono::steady_clock::duration elapsed)
{
    const auto elapsedMs         = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
    const auto elapsedWholeSec   = elapsedMs / 1000;
    const auto elapsedFractionMs = elapsedMs % 1000;
    llvm::errs() << "Run summary:\n"
                 << "  command: " << command << "\n"
                 << "  output root: " << outputRoot << "\n"
                 << "  files generated: " << generatedFiles << "\n"
                 << "  elapsed: " << elapsedWholeSec << ".";
    if (elapsedFractionMs < 100)
    {
        llvm::errs() << "0";
    }
    if (elapsedFractionMs < 10)
    {
        llvm::errs() << "0";
    }
    llvm::errs() << elapsedFractionMs << "s\n";
}

/// @brief Records one note per container describing the chosen bound strategy.
void reportInferenceNotes(const stateserde::SemanticModule& semantic, stateserde::DiagnosticEngine& diagnostics)
{
    for (const auto& unit : semantic.units)
    {
        for (const auto& type : unit.types)
        {
            std::string text = type.shape.qualifiedName + ": ";
            text += type.bounds.coarse ? "bounds pinned by " + type.shape.recursionMarker->str()
                                       : std::string("per-field bounds");
            text += "; encode " + std::to_string(type.bounds.encode.size()) + " constraint(s), decode " +
                    std::to_string(type.bounds.decode.size()) + " constraint(s)";
            diagnostics.note(type.shape.location, std::move(text));
        }
    }
}

}  // namespace

/// @brief Program entry point for `stateserdec`.
///
/// @param[in] argc Argument count.
/// @param[in] argv Argument vector.
/// @return Zero on success, non-zero on CLI, syntax, schema, recursion or
///         code-generation failure.
int main(int argc, char** argv)
{
    llvm::InitLLVM y(argc, argv);

    if (argc < 2)
    {
        printUsage();
        return 1;
    }

    const std::string command = argv[1];
    if (isHelpToken(command) || command == "help")
    {
        printHelp();
        return 0;
    }
    if (!isKnownCommand(command))
    {
        llvm::errs() << "Unknown command: " << command << "\n";
        printUsage();
        return 1;
    }

    std::vector<std::string>   roots;
    std::vector<std::string>   selectedSchemas;
    std::string                configPath;
    std::optional<std::string> outDir;
    std::optional<std::string> namespacePrefix;
    bool                       helpRequested = false;
    bool                       dryRun        = false;
    bool                       noOverwrite   = false;
    bool                       depfile       = false;
    bool                       verbose       = false;

    for (int i = 2; i < argc; ++i)
    {
        const std::string arg          = argv[i];
        auto              requireValue = [&](const std::string& name) -> std::string {
            if (i + 1 >= argc)
            {
                llvm::errs() << "Missing value for " << name << "\n";
                printUsage();
                std::exit(1);
            }
            return argv[++i];
        };

        if (arg == "--schema-dir")
        {
            roots.push_back(requireValue(arg));
        }
        else if (arg == "--schema")
        {
            selectedSchemas.push_back(requireValue(arg));
        }
        else if (isHelpToken(arg))
        {
            helpRequested = true;
        }
        else if (arg == "--out-dir")
        {
            outDir = requireValue(arg);
        }
        else if (arg == "--config")
        {
            configPath = requireValue(arg);
        }
        else if (arg == "--namespace-prefix")
        {
            namespacePrefix = requireValue(arg);
        }
        else if (arg == "--dry-run")
        {
            dryRun = true;
        }
        else if (arg == "--no-overwrite")
        {
            noOverwrite = true;
        }
        else if (arg == "--depfile")
        {
            depfile = true;
        }
        else if (arg == "--verbose")
        {
            verbose = true;
        }
        else
        {
            llvm::errs() << "Unknown argument: " << arg << "\n";
            printUsage();
            return 1;
        }
    }

    if (helpRequested)
    {
        printHelp(command);
        return 0;
    }

    if (roots.empty())
    {
        llvm::errs() << "At least one --schema-dir is required\n";
        return 1;
    }

    stateserde::ToolConfig config;
    if (!configPath.empty())
    {
        if (llvm::Error err = stateserde::loadToolConfigFile(configPath, config))
        {
            llvm::errs() << configPath << ": error: " << llvm::toString(std::move(err)) << "\n";
            return 1;
        }
    }
    if (outDir)
    {
        config.outDir = *outDir;
    }
    if (namespacePrefix)
    {
        auto components = stateserde::splitNamespace(*namespacePrefix);
        if (!components)
        {
            llvm::errs() << "Invalid --namespace-prefix value: " << llvm::toString(components.takeError()) << "\n";
            printUsage();
            return 1;
        }
        config.namespacePrefix = std::move(*components);
    }
    config.dryRun      = config.dryRun || dryRun;
    config.noOverwrite = config.noOverwrite || noOverwrite;
    config.depfile     = config.depfile || depfile;
    config.verbose     = config.verbose || verbose;

    const auto                   startTime = std::chrono::steady_clock::now();
    stateserde::DiagnosticEngine diagnostics;
    auto finish = [&](const std::string& outputRoot, const std::uint64_t generatedFiles) -> int {
        printDiagnostics(diagnostics);
        printRunSummary(command, outputRoot, generatedFiles, std::chrono::steady_clock::now() - startTime);
        return diagnostics.hasErrors() ? 1 : 0;
    };

    auto ast = stateserde::parseSchemas(roots, diagnostics);
    if (!ast)
    {
        llvm::consumeError(ast.takeError());
        printDiagnostics(diagnostics);
        return 1;
    }

    if (command == "ast")
    {
        llvm::outs() << stateserde::printAST(*ast);
        return finish("stdout", 0);
    }

    stateserde::AnalyzeOptions analyzeOptions;
    analyzeOptions.namespacePrefix = config.namespacePrefix;
    auto semantic                  = stateserde::analyze(*ast, diagnostics, analyzeOptions);
    if (!semantic)
    {
        llvm::consumeError(semantic.takeError());
        printDiagnostics(diagnostics);
        return 1;
    }
    if (config.verbose)
    {
        reportInferenceNotes(*semantic, diagnostics);
    }

    if (command == "check")
    {
        llvm::outs() << stateserde::printModel(*semantic);
        return finish("stdout", 0);
    }

    if (config.outDir.empty())
    {
        llvm::errs() << "--out-dir is required for 'cpp' command\n";
        return 1;
    }

    std::vector<std::string>   recordedOutputs;
    stateserde::CppEmitOptions options;
    options.outDir                      = config.outDir;
    options.headerExtension             = config.headerExtension;
    options.runtimeInclude              = config.runtimeInclude;
    options.selectedSchemas             = selectedSchemas;
    options.writeDepfiles               = config.depfile;
    options.outputPolicy.dryRun          = config.dryRun;
    options.outputPolicy.noOverwrite     = config.noOverwrite;
    options.outputPolicy.written = &recordedOutputs;

    if (llvm::Error err = stateserde::emitCpp(*semantic, options, diagnostics))
    {
        llvm::errs() << llvm::toString(std::move(err)) << "\n";
        printDiagnostics(diagnostics);
        return 1;
    }

    if (config.verbose)
    {
        for (const auto& path : recordedOutputs)
        {
            llvm::errs() << (config.dryRun ? "would write " : "wrote ") << path << "\n";
        }
    }
    return finish(resolveOutputRoot(config.outDir), recordedOutputs.size());
}
