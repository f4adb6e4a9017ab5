//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements semantic analysis for parsed schema files.
///
/// The analyzer registers every declared type, builds the structural shape of each declaration, hands annotations to
/// attribute resolution, rejects types that would contain themselves by value, and runs bound inference.
///
//===----------------------------------------------------------------------===//

#include "stateserde/Semantics/Analyzer.h"

#include "stateserde/Frontend/AST.h"
#include "stateserde/Semantics/AttributeResolver.h"
#include "stateserde/Semantics/BoundInference.h"
#include "stateserde/Support/Diagnostics.h"

#include "llvm/Support/Error.h"

#include <algorithm>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace stateserde
{
namespace
{

/// Name of the context template parameter in generated code.
constexpr const char* ContextParameterName = "State";

std::string joinQualified(const std::vector<std::string>& components, const std::string& leaf)
{
    std::string out;
    for (const std::string& c : components)
    {
        out += c + "::";
    }
    return out + leaf;
}

class AnalyzerImpl final
{
public:
    AnalyzerImpl(const ASTModule& module, DiagnosticEngine& diagnostics, AnalyzeOptions options)
        : module_(module)
        , diagnostics_(diagnostics)
        , options_(std::move(options))
    {
    }

    llvm::Expected<SemanticModule> run()
    {
        registerTypes();
        buildShapes();
        if (diagnostics_.hasErrors())
        {
            return llvm::createStringError(llvm::inconvertibleErrorCode(), "semantic analysis failed");
        }

        indexShapes();
        checkValueCycles();
        checkUnitDependencies();
        if (diagnostics_.hasErrors())
        {
            return llvm::createStringError(llvm::inconvertibleErrorCode(), "semantic analysis failed");
        }

        inferBounds();
        if (diagnostics_.hasErrors())
        {
            return llvm::createStringError(llvm::inconvertibleErrorCode(), "bound inference failed");
        }
        return std::move(out_);
    }

private:
    struct Declared
    {
        const TypeDeclAST* decl{nullptr};
        std::size_t        unit{0};
    };

    enum class Visit
    {
        Unvisited,
        Visiting,
        Done,
    };

    const ASTModule&                module_;
    DiagnosticEngine&               diagnostics_;
    AnalyzeOptions                  options_;
    std::map<std::string, Declared> registry_;
    std::map<std::string, std::size_t> unitOfType_;
    ShapeIndex                      shapes_;
    SemanticModule                  out_;

    void schemaError(const SourceLocation& location, const std::string& message)
    {
        diagnostics_.error(DiagnosticCategory::Schema, location, message);
    }

    bool checkIdentifier(const std::string& name, const std::string& what, const SourceLocation& location)
    {
        if (isReservedIdentifier(name))
        {
            schemaError(location, what + " '" + name + "' is a reserved C++ keyword");
            return false;
        }
        return true;
    }

    void registerTypes()
    {
        for (std::size_t u = 0; u < module_.schemas.size(); ++u)
        {
            const ParsedSchema& schema = module_.schemas[u];

            SchemaUnit unit;
            unit.filePath            = schema.info.filePath;
            unit.relativePath        = schema.info.relativePath;
            unit.namespaceComponents = options_.namespacePrefix;
            unit.namespaceComponents.insert(unit.namespaceComponents.end(),
                                            schema.ast.namespaceComponents.begin(),
                                            schema.ast.namespaceComponents.end());
            for (const IncludeDeclAST& include : schema.ast.includes)
            {
                unit.includes.push_back(include.path);
            }
            for (const std::string& component : unit.namespaceComponents)
            {
                (void) checkIdentifier(component, "namespace component", schema.ast.location);
            }

            for (const TypeDeclAST& decl : schema.ast.types)
            {
                if (!checkIdentifier(decl.name, "type name", decl.location))
                {
                    continue;
                }
                if (builtinScalarFromName(decl.name) || builtinContainerFromName(decl.name))
                {
                    schemaError(decl.location, "type name '" + decl.name + "' shadows a builtin type");
                    continue;
                }

                const std::string key         = joinQualified(unit.namespaceComponents, decl.name);
                const auto [it, inserted]     = registry_.emplace(key, Declared{&decl, u});
                if (!inserted)
                {
                    schemaError(decl.location,
                                "type '" + key + "' is already declared at " + it->second.decl->location.str());
                }
            }
            out_.units.push_back(std::move(unit));
        }
    }

    std::optional<TypeRef> classify(const TypeRefAST&               ref,
                                    const std::vector<std::string>& generics,
                                    const std::vector<std::string>& ns)
    {
        TypeRef out;
        out.location = ref.location;

        std::optional<std::string> schemaKey;
        if (!ref.globalQualified && ref.path.size() == 1)
        {
            const std::string& name = ref.path.front();
            if (std::find(generics.begin(), generics.end(), name) != generics.end())
            {
                if (!ref.arguments.empty())
                {
                    schemaError(ref.location, "generic parameter '" + name + "' cannot take type arguments");
                    return std::nullopt;
                }
                out.kind = TypeRefKind::GenericParam;
                out.name = name;
                return out;
            }
            if (auto scalar = builtinScalarFromName(name))
            {
                if (!ref.arguments.empty())
                {
                    schemaError(ref.location, "builtin type '" + name + "' cannot take type arguments");
                    return std::nullopt;
                }
                out.kind   = TypeRefKind::BuiltinScalar;
                out.scalar = *scalar;
                out.name   = name;
                return out;
            }
            if (auto container = builtinContainerFromName(name))
            {
                if (ref.arguments.size() != 1)
                {
                    schemaError(ref.location,
                                "builtin container '" + name + "' expects exactly one type argument, got " +
                                    std::to_string(ref.arguments.size()));
                    return std::nullopt;
                }
                auto element = classify(ref.arguments.front(), generics, ns);
                if (!element)
                {
                    return std::nullopt;
                }
                out.kind      = TypeRefKind::BuiltinContainer;
                out.container = *container;
                out.name      = name;
                out.arguments.push_back(std::move(*element));
                return out;
            }

            const std::string key = joinQualified(ns, name);
            if (registry_.count(key) > 0)
            {
                schemaKey = key;
            }
            else
            {
                out.kind = TypeRefKind::External;
                out.name = "::" + key;
            }
        }
        else
        {
            const std::string written  = ref.qualifiedName();
            const std::string key      = ref.globalQualified ? written.substr(2) : written;
            const std::string prefixed = joinQualified(options_.namespacePrefix, key);
            if (registry_.count(key) > 0)
            {
                schemaKey = key;
            }
            else if (!options_.namespacePrefix.empty() && registry_.count(prefixed) > 0)
            {
                schemaKey = prefixed;
            }
            else
            {
                out.kind = TypeRefKind::External;
                out.name = "::" + key;
            }
        }

        if (schemaKey)
        {
            const TypeDeclAST& target = *registry_.at(*schemaKey).decl;
            if (target.genericParams.size() != ref.arguments.size())
            {
                schemaError(ref.location,
                            "type '" + *schemaKey + "' expects " + std::to_string(target.genericParams.size()) +
                                " type argument(s), got " + std::to_string(ref.arguments.size()));
                return std::nullopt;
            }
            out.kind = TypeRefKind::SchemaType;
            out.name = *schemaKey;
        }

        for (const TypeRefAST& argument : ref.arguments)
        {
            auto resolved = classify(argument, generics, ns);
            if (!resolved)
            {
                return std::nullopt;
            }
            out.arguments.push_back(std::move(*resolved));
        }
        return out;
    }

    bool buildFields(const std::vector<FieldDeclAST>& decls,
                     const PayloadStyle               style,
                     const TypeShape&                 owner,
                     std::vector<FieldSpec>&          fields)
    {
        bool                  ok = true;
        std::set<std::string> names;
        for (std::size_t i = 0; i < decls.size(); ++i)
        {
            const FieldDeclAST& decl = decls[i];

            FieldSpec field;
            field.location     = decl.location;
            field.declaredName = style == PayloadStyle::Positional ? std::to_string(i) : decl.name;
            if (style == PayloadStyle::Named)
            {
                ok = checkIdentifier(decl.name, "field name", decl.location) && ok;
                if (!names.insert(decl.name).second)
                {
                    schemaError(decl.location, "duplicate field '" + decl.name + "' in '" + owner.name + "'");
                    ok = false;
                }
            }

            if (auto type = classify(decl.type, owner.genericParams, owner.namespaceComponents))
            {
                field.declaredType = std::move(*type);
            }
            else
            {
                ok = false;
            }
            fields.push_back(std::move(field));
        }
        return ok;
    }

    std::optional<TypeShape> buildShape(const TypeDeclAST& decl, const SchemaUnit& unit)
    {
        TypeShape shape;
        shape.location            = decl.location;
        shape.kind                = decl.kind == TypeDeclKind::Union ? ShapeKind::Union : ShapeKind::Record;
        shape.name                = decl.name;
        shape.namespaceComponents = unit.namespaceComponents;
        shape.qualifiedName       = joinQualified(unit.namespaceComponents, decl.name);
        shape.style               = decl.style;

        bool ok = true;
        for (const std::string& param : decl.genericParams)
        {
            if (std::find(shape.genericParams.begin(), shape.genericParams.end(), param) != shape.genericParams.end())
            {
                schemaError(decl.location, "duplicate generic parameter '" + param + "' in '" + decl.name + "'");
                ok = false;
                continue;
            }
            if (param == ContextParameterName || param == decl.name)
            {
                schemaError(decl.location, "generic parameter name '" + param + "' is reserved in '" + decl.name + "'");
                ok = false;
            }
            ok = checkIdentifier(param, "generic parameter", decl.location) && ok;
            shape.genericParams.push_back(param);
        }

        if (shape.kind == ShapeKind::Record)
        {
            ok = buildFields(decl.fields, decl.style, shape, shape.fields) && ok;
            return ok ? std::optional<TypeShape>(std::move(shape)) : std::nullopt;
        }

        std::set<std::string> names;
        for (const VariantDeclAST& variantDecl : decl.variants)
        {
            VariantSpec variant;
            variant.location = variantDecl.location;
            variant.name     = variantDecl.name;
            variant.style    = variantDecl.style;

            ok = checkIdentifier(variant.name, "variant name", variant.location) && ok;
            if (variant.name == decl.name || variant.name == "value")
            {
                schemaError(variant.location,
                            "variant name '" + variant.name + "' is reserved in union '" + decl.name + "'");
                ok = false;
            }
            if (!names.insert(variant.name).second)
            {
                schemaError(variant.location, "duplicate variant '" + variant.name + "' in '" + decl.name + "'");
                ok = false;
            }
            ok = buildFields(variantDecl.fields, variantDecl.style, shape, variant.fields) && ok;
            shape.variants.push_back(std::move(variant));
        }
        return ok ? std::optional<TypeShape>(std::move(shape)) : std::nullopt;
    }

    void buildShapes()
    {
        for (std::size_t u = 0; u < module_.schemas.size(); ++u)
        {
            SchemaUnit& unit = out_.units[u];
            for (const TypeDeclAST& decl : module_.schemas[u].ast.types)
            {
                const auto registered = registry_.find(joinQualified(unit.namespaceComponents, decl.name));
                if (registered == registry_.end() || registered->second.decl != &decl)
                {
                    continue;
                }

                auto shape = buildShape(decl, unit);
                if (!shape)
                {
                    continue;
                }

                const std::vector<std::string> generics = shape->genericParams;
                const std::vector<std::string> ns       = unit.namespaceComponents;
                AttributeResolver resolver(diagnostics_, [this, generics, ns](const TypeRefAST& ref) {
                    return classify(ref, generics, ns);
                });
                if (!resolver.resolve(decl, *shape))
                {
                    continue;
                }
                unitOfType_.emplace(shape->qualifiedName, u);
                unit.types.push_back(AnalyzedType{std::move(*shape), BoundSet{}});
            }
        }
    }

    void indexShapes()
    {
        for (const SchemaUnit& unit : out_.units)
        {
            for (const AnalyzedType& type : unit.types)
            {
                shapes_.emplace(type.shape.qualifiedName, &type.shape);
            }
        }
    }

    /// @brief Edge set and message of one "type needs type" graph.
    struct ValueGraph
    {
        std::vector<std::string> (*edges)(const TypeShape&);
        const char* problem;
        const char* hint;
    };

    static std::vector<std::string> layoutEdges(const TypeShape& shape)
    {
        return valueDependencies(shape, false);
    }

    void checkValueCycles()
    {
        const ValueGraph graphs[] = {
            {&layoutEdges, "contains itself by value", "store one of the fields in box<...> or list<...>"},
            {&defaultConstructionDependencies,
             "cannot be default-constructed",
             "wrap one of the box<...> fields in optional<...>"},
        };
        for (const ValueGraph& graph : graphs)
        {
            std::map<std::string, Visit> state;
            std::vector<std::string>     stack;
            for (const auto& [key, shape] : shapes_)
            {
                visitValueGraph(graph, key, state, stack);
            }
            if (diagnostics_.hasErrors())
            {
                return;
            }
        }
    }

    void visitValueGraph(const ValueGraph&             graph,
                         const std::string&            key,
                         std::map<std::string, Visit>& state,
                         std::vector<std::string>&     stack)
    {
        Visit& mark = state[key];
        if (mark == Visit::Done)
        {
            return;
        }
        if (mark == Visit::Visiting)
        {
            std::string chain;
            for (auto it = std::find(stack.begin(), stack.end(), key); it != stack.end(); ++it)
            {
                chain += *it + " -> ";
            }
            chain += key;
            const TypeShape& shape = *shapes_.at(key);
            schemaError(shape.location,
                        "'" + shape.name + "' " + graph.problem + ": " + chain + "; " + graph.hint);
            return;
        }

        mark = Visit::Visiting;
        stack.push_back(key);
        for (const std::string& dependency : graph.edges(*shapes_.at(key)))
        {
            if (shapes_.count(dependency) > 0)
            {
                visitValueGraph(graph, dependency, state, stack);
            }
        }
        stack.pop_back();
        state[key] = Visit::Done;
    }

    void checkUnitDependencies()
    {
        for (std::size_t u = 0; u < out_.units.size(); ++u)
        {
            std::set<std::string> dependencies;
            for (const AnalyzedType& type : out_.units[u].types)
            {
                for (const std::string& key : referencedSchemaTypes(type.shape))
                {
                    const auto owner = unitOfType_.find(key);
                    if (owner != unitOfType_.end() && owner->second != u)
                    {
                        dependencies.insert(out_.units[owner->second].relativePath);
                    }
                }
            }
            out_.units[u].dependencies.assign(dependencies.begin(), dependencies.end());
        }

        std::map<std::string, Visit> state;
        std::vector<std::string>     stack;
        for (const SchemaUnit& unit : out_.units)
        {
            visitUnitGraph(unit.relativePath, state, stack);
        }
    }

    const SchemaUnit* unitByPath(const std::string& relativePath) const
    {
        for (const SchemaUnit& unit : out_.units)
        {
            if (unit.relativePath == relativePath)
            {
                return &unit;
            }
        }
        return nullptr;
    }

    void visitUnitGraph(const std::string&            path,
                        std::map<std::string, Visit>& state,
                        std::vector<std::string>&     stack)
    {
        Visit& mark = state[path];
        if (mark == Visit::Done)
        {
            return;
        }
        const SchemaUnit* unit = unitByPath(path);
        if (mark == Visit::Visiting)
        {
            std::string chain;
            for (auto it = std::find(stack.begin(), stack.end(), path); it != stack.end(); ++it)
            {
                chain += *it + " -> ";
            }
            schemaError({unit ? unit->filePath : path, 1, 1},
                        "schema files reference each other's types: " + chain + path +
                            "; move the mutually dependent types into one file");
            return;
        }

        mark = Visit::Visiting;
        stack.push_back(path);
        if (unit)
        {
            for (const std::string& dependency : unit->dependencies)
            {
                visitUnitGraph(dependency, state, stack);
            }
        }
        stack.pop_back();
        state[path] = Visit::Done;
    }

    void inferBounds()
    {
        BoundInference inference(shapes_, diagnostics_);
        for (SchemaUnit& unit : out_.units)
        {
            for (AnalyzedType& type : unit.types)
            {
                if (auto bounds = inference.infer(type.shape))
                {
                    type.bounds = std::move(*bounds);
                }
            }
        }
    }
};

}  // namespace

bool isReservedIdentifier(const std::string& name)
{
    static const std::set<std::string> keywords = {
        "alignas",  "alignof",   "and",      "and_eq",       "asm",         "auto",         "bitand",
        "bitor",    "bool",      "break",    "case",         "catch",       "char",         "char8_t",
        "char16_t", "char32_t",  "class",    "compl",        "concept",     "const",        "consteval",
        "constexpr", "constinit", "const_cast", "continue",  "co_await",    "co_return",    "co_yield",
        "decltype", "default",   "delete",   "do",           "double",      "dynamic_cast", "else",
        "enum",     "explicit",  "export",   "extern",       "false",       "float",        "for",
        "friend",   "goto",      "if",       "inline",       "int",         "long",         "mutable",
        "namespace", "new",      "noexcept", "not",          "not_eq",      "nullptr",      "operator",
        "or",       "or_eq",     "private",  "protected",    "public",      "register",     "reinterpret_cast",
        "requires", "return",    "short",    "signed",       "sizeof",      "static",       "static_assert",
        "static_cast", "struct", "switch",   "template",     "this",        "thread_local", "throw",
        "true",     "try",       "typedef",  "typeid",       "typename",    "union",        "unsigned",
        "using",    "virtual",   "void",     "volatile",     "wchar_t",     "while",        "xor",
        "xor_eq",
    };
    return keywords.count(name) > 0;
}

llvm::Expected<SemanticModule> analyze(const ASTModule& module, DiagnosticEngine& diagnostics)
{
    return analyze(module, diagnostics, AnalyzeOptions{});
}

llvm::Expected<SemanticModule> analyze(const ASTModule&      module,
                                       DiagnosticEngine&     diagnostics,
                                       const AnalyzeOptions& options)
{
    AnalyzerImpl impl(module, diagnostics, options);
    return impl.run();
}

}  // namespace stateserde
