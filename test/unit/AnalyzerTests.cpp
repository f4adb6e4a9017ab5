//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>
#include <string>
#include <vector>

#include "SchemaTestSupport.h"
#include "stateserde/Semantics/ModelPrinter.h"

namespace
{

using stateserde::DiagnosticCategory;

bool testTypeClassification()
{
    const std::string text = "namespace demo;\n"
                             "record Pair<A, B> { first: A; second: B; }\n"
                             "record User<T> {\n"
                             "    a: T;\n"
                             "    b: u16;\n"
                             "    c: map<list<Pair<T, string>>>;\n"
                             "    d: Thing;\n"
                             "    e: ::fixture::Recorder;\n"
                             "    f: demo::Pair<i8, i8>;\n"
                             "}\n";

    stateserde::DiagnosticEngine diag;
    auto                         semantic = stateserde::test::analyzeText(text, diag);
    if (!semantic)
    {
        std::cerr << "classification schema failed to analyze\n";
        stateserde::test::dumpDiagnostics(diag);
        return false;
    }

    const auto& fields = semantic->find("demo::User")->shape.fields;
    using Kind         = stateserde::TypeRefKind;
    const std::vector<std::pair<Kind, std::string>> expected = {
        {Kind::GenericParam, "T"},
        {Kind::BuiltinScalar, "u16"},
        {Kind::BuiltinContainer, "map<list<demo::Pair<T, string>>>"},
        {Kind::External, "::demo::Thing"},
        {Kind::External, "::fixture::Recorder"},
        {Kind::SchemaType, "demo::Pair<i8, i8>"},
    };
    for (std::size_t i = 0; i < expected.size(); ++i)
    {
        if (fields[i].declaredType.kind != expected[i].first || fields[i].declaredType.str() != expected[i].second)
        {
            std::cerr << "unexpected classification of field " << fields[i].declaredName << ": "
                      << fields[i].declaredType.str() << "\n";
            return false;
        }
    }
    return true;
}

bool testNamespacePrefix()
{
    stateserde::AnalyzeOptions options;
    options.namespacePrefix = {"acme"};

    stateserde::DiagnosticEngine diag;
    auto                         semantic =
        stateserde::test::analyzeSources({{"m.ssd", "namespace demo;\nrecord Inner;\nrecord Outer { a: demo::Inner; }\n"}},
                                         diag,
                                         options);
    if (!semantic)
    {
        std::cerr << "prefixed schema failed to analyze\n";
        stateserde::test::dumpDiagnostics(diag);
        return false;
    }
    const auto* outer = semantic->find("acme::demo::Outer");
    if (outer == nullptr || outer->shape.namespaceComponents != std::vector<std::string>{"acme", "demo"} ||
        outer->shape.fields.front().declaredType.kind != stateserde::TypeRefKind::SchemaType ||
        outer->shape.fields.front().declaredType.name != "acme::demo::Inner")
    {
        std::cerr << "namespace prefix was not applied to declarations and references\n";
        return false;
    }
    return true;
}

struct RejectedCase
{
    const char* name;
    const char* text;
    const char* needle;
};

bool testRejectedDeclarations()
{
    const std::vector<RejectedCase> cases = {
        {"keyword type", "record class;", "type name 'class' is a reserved C++ keyword"},
        {"keyword field", "record A { int: i32; }", "field name 'int' is a reserved C++ keyword"},
        {"builtin shadow", "record list;", "type name 'list' shadows a builtin type"},
        {"duplicate type", "record A;\nunion A { X }", "type 'demo::A' is already declared at"},
        {"duplicate field", "record A { a: i32; a: u8; }", "duplicate field 'a' in 'A'"},
        {"duplicate variant", "union U { X, X }", "duplicate variant 'X' in 'U'"},
        {"reserved variant", "union U { value }", "variant name 'value' is reserved in union 'U'"},
        {"variant named like union", "union U { U }", "variant name 'U' is reserved in union 'U'"},
        {"context parameter name", "record A<State> { a: State; }", "generic parameter name 'State' is reserved"},
        {"duplicate parameter", "record A<T, T> { a: T; }", "duplicate generic parameter 'T' in 'A'"},
        {"arity", "record P<A, B> { a: A; b: B; }\nrecord U { p: P<i8>; }",
         "type 'demo::P' expects 2 type argument(s), got 1"},
        {"container arity", "record A { a: list<i32, i32>; }",
         "builtin container 'list' expects exactly one type argument, got 2"},
        {"scalar arguments", "record A { a: i32<u8>; }", "builtin type 'i32' cannot take type arguments"},
        {"generic arguments", "record A<T> { a: T<u8>; }", "generic parameter 'T' cannot take type arguments"},
        {"value cycle", "record A { b: B; }\nrecord B { a: optional<A>; }",
         "'A' contains itself by value: demo::A -> demo::B -> demo::A; store one of the fields in box<...>"},
        {"default construction", "record Chain { next: box<Chain>; }",
         "'Chain' cannot be default-constructed: demo::Chain -> demo::Chain"},
        {"union default construction", "union V { More(box<V>), Stop }",
         "'V' cannot be default-constructed: demo::V -> demo::V"},
    };

    bool ok = true;
    for (const auto& c : cases)
    {
        stateserde::DiagnosticEngine diag;
        auto semantic = stateserde::test::analyzeText(std::string("namespace demo;\n") + c.text + "\n", diag);
        if (semantic)
        {
            std::cerr << c.name << ": expected the schema to be rejected\n";
            ok = false;
            continue;
        }
        if (!stateserde::test::hasError(diag, DiagnosticCategory::Schema, c.needle))
        {
            std::cerr << c.name << ": missing schema error containing \"" << c.needle << "\"\n";
            stateserde::test::dumpDiagnostics(diag);
            ok = false;
        }
    }
    return ok;
}

bool testAcceptedIndirection()
{
    const std::string text = "namespace demo;\n"
                             "union Stack { Empty, Push(box<Stack>) }\n"
                             "record Chain { next: optional<box<Chain>>; all: list<Chain>; by: map<Chain>; }\n";

    stateserde::DiagnosticEngine diag;
    // Both types are stateful and self-referential, so bound inference still needs a marker.
    (void) stateserde::test::analyzeText(text, diag);
    if (diag.errorCount(DiagnosticCategory::Schema) != 0)
    {
        std::cerr << "indirect self references must pass the value checks\n";
        stateserde::test::dumpDiagnostics(diag);
        return false;
    }
    return true;
}

bool testUnitDependencies()
{
    stateserde::DiagnosticEngine diag;
    auto                         semantic = stateserde::test::analyzeSources(
        {
            {"a.ssd", "namespace a;\nrecord A { b: b::B; c: c::C; }\n"},
            {"b.ssd", "namespace b;\nrecord B { c: c::C; }\n"},
            {"c.ssd", "namespace c;\nrecord C;\n"},
        },
        diag);
    if (!semantic)
    {
        std::cerr << "layered schema files failed to analyze\n";
        stateserde::test::dumpDiagnostics(diag);
        return false;
    }
    if (semantic->units[0].dependencies != std::vector<std::string>{"b.ssd", "c.ssd"} ||
        semantic->units[1].dependencies != std::vector<std::string>{"c.ssd"} || !semantic->units[2].dependencies.empty())
    {
        std::cerr << "unexpected unit dependencies\n";
        return false;
    }

    stateserde::DiagnosticEngine cyclic;
    auto                         rejected = stateserde::test::analyzeSources(
        {
            {"a.ssd", "namespace a;\nrecord A { b: b::B; }\n"},
            {"b.ssd", "namespace b;\nrecord B { items: list<a::A>; }\n"},
        },
        cyclic);
    if (rejected ||
        !stateserde::test::hasError(cyclic,
                                    DiagnosticCategory::Schema,
                                    "schema files reference each other's types: a.ssd -> b.ssd -> a.ssd"))
    {
        std::cerr << "expected a schema file cycle error\n";
        stateserde::test::dumpDiagnostics(cyclic);
        return false;
    }
    return true;
}

bool testModelPrinter()
{
    const std::string text = "namespace demo;\n"
                             "@stateless\n"
                             "record P<T> { @stateful a: T; @rename(\"bee\") b: i32; @skip c: T; }\n";

    stateserde::DiagnosticEngine diag;
    auto                         semantic = stateserde::test::analyzeText(text, diag);
    if (!semantic)
    {
        std::cerr << "printer schema failed to analyze\n";
        stateserde::test::dumpDiagnostics(diag);
        return false;
    }

    const std::string expected = "schema \"test.ssd\" {\n"
                                 "  record demo::P<T> named default stateless {\n"
                                 "    field a: T stateful key \"a\"\n"
                                 "    field b: i32 stateless key \"bee\"\n"
                                 "    field c: T skip\n"
                                 "    bounds per-field\n"
                                 "    encode requires state(T)\n"
                                 "    decode requires state(T), zero(T)\n"
                                 "  }\n"
                                 "}\n";
    const std::string printed = stateserde::printModel(*semantic);
    if (printed != expected)
    {
        std::cerr << "unexpected model print:\n" << printed;
        return false;
    }
    return true;
}

bool testReservedIdentifiers()
{
    if (!stateserde::isReservedIdentifier("co_await") || !stateserde::isReservedIdentifier("requires") ||
        stateserde::isReservedIdentifier("counter"))
    {
        std::cerr << "unexpected reserved identifier classification\n";
        return false;
    }
    return true;
}

}  // namespace

bool runAnalyzerTests()
{
    bool ok = true;
    ok      = testTypeClassification() && ok;
    ok      = testNamespacePrefix() && ok;
    ok      = testRejectedDeclarations() && ok;
    ok      = testAcceptedIndirection() && ok;
    ok      = testUnitDependencies() && ok;
    ok      = testModelPrinter() && ok;
    ok      = testReservedIdentifiers() && ok;
    return ok;
}
