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
#include "stateserde/Semantics/BoundInference.h"

namespace
{

using stateserde::DiagnosticCategory;
using stateserde::test::joinConstraints;

bool expectBounds(const stateserde::SemanticModule& semantic,
                  const std::string&                type,
                  const std::string&                encode,
                  const std::string&                decode)
{
    const auto* analyzed = semantic.find(type);
    if (analyzed == nullptr)
    {
        std::cerr << "missing type " << type << "\n";
        return false;
    }
    const std::string actualEncode = joinConstraints(analyzed->bounds.encode);
    const std::string actualDecode = joinConstraints(analyzed->bounds.decode);
    if (actualEncode != encode || actualDecode != decode)
    {
        std::cerr << type << " bounds mismatch\n"
                  << "  encode: " << actualEncode << "\n  expected: " << encode << "\n"
                  << "  decode: " << actualDecode << "\n  expected: " << decode << "\n";
        return false;
    }
    return true;
}

bool testPerFieldBounds()
{
    const std::string text = "namespace demo;\n"
                             "record Wrapper<T> { value: T; }\n"
                             "record Holder<A, B> {\n"
                             "    items: list<A>;\n"
                             "    again: optional<A>;\n"
                             "    @stateless label: B;\n"
                             "    @skip cache: map<B>;\n"
                             "    count: u32;\n"
                             "    @stateless name: string;\n"
                             "}\n"
                             "record Outer<X> { inner: Wrapper<list<X>>; plain: Wrapper<i32>; extra: Counter; }\n";

    stateserde::DiagnosticEngine diag;
    auto                         semantic = stateserde::test::analyzeText(text, diag);
    if (!semantic)
    {
        std::cerr << "per-field schema failed to analyze\n";
        stateserde::test::dumpDiagnostics(diag);
        return false;
    }

    bool ok = true;
    ok      = expectBounds(*semantic, "demo::Wrapper", "state(T)", "state(T)") && ok;
    // Container arguments narrow to the element; duplicates collapse; skipped generic fields need a zero value.
    ok = expectBounds(*semantic, "demo::Holder", "state(A), plain(B)", "state(A), plain(B), zero(map<B>)") && ok;
    // Nested schema types are expanded through their own fields with the arguments substituted.
    ok = expectBounds(*semantic, "demo::Outer", "state(X), state(::demo::Counter)", "state(X), state(::demo::Counter)") &&
         ok;
    return ok;
}

bool testNonGenericStatelessFieldsAddNothing()
{
    stateserde::DiagnosticEngine diag;
    auto semantic = stateserde::test::analyzeText("namespace demo;\n@stateless record Flat { a: i32; b: ::ext::Blob; }\n",
                                                  diag);
    if (!semantic)
    {
        std::cerr << "flat schema failed to analyze\n";
        stateserde::test::dumpDiagnostics(diag);
        return false;
    }
    return expectBounds(*semantic, "demo::Flat", "", "");
}

bool testRecursionWithoutMarkerFails()
{
    const std::string text = "namespace demo;\n"
                             "record Tree<T> { value: T; children: list<Tree<T>>; }\n";

    stateserde::DiagnosticEngine diag;
    auto                         semantic = stateserde::test::analyzeText(text, diag);
    if (semantic)
    {
        std::cerr << "expected recursion failure\n";
        return false;
    }
    if (!stateserde::test::hasError(diag,
                                    DiagnosticCategory::Recursion,
                                    "bound inference for record 'Tree' does not terminate: demo::Tree -> demo::Tree"))
    {
        std::cerr << "missing recursion diagnostic\n";
        stateserde::test::dumpDiagnostics(diag);
        return false;
    }
    if (diag.errorCount(DiagnosticCategory::Recursion) != 1)
    {
        std::cerr << "recursion must be reported once per container, got "
                  << diag.errorCount(DiagnosticCategory::Recursion) << "\n";
        return false;
    }
    return true;
}

bool testMutualRecursionReportsChain()
{
    const std::string text = "namespace demo;\n"
                             "union Expr { Lit(i64), Call(Call), Neg(box<Expr>) }\n"
                             "record Call { args: list<Expr>; }\n";

    stateserde::DiagnosticEngine diag;
    (void) stateserde::test::analyzeText(text, diag);
    if (!stateserde::test::hasError(diag, DiagnosticCategory::Recursion, "demo::Expr -> demo::Call -> demo::Expr") ||
        !stateserde::test::hasError(diag, DiagnosticCategory::Recursion, "demo::Call -> demo::Expr -> demo::Call"))
    {
        std::cerr << "expected recursion chains for both containers\n";
        stateserde::test::dumpDiagnostics(diag);
        return false;
    }
    return true;
}

bool testStatelessRecursionTerminates()
{
    const std::string text = "namespace demo;\n"
                             "record List { @stateless next: optional<box<List>>; }\n";

    stateserde::DiagnosticEngine diag;
    auto                         semantic = stateserde::test::analyzeText(text, diag);
    if (!semantic)
    {
        std::cerr << "stateless self reference should not need a marker\n";
        stateserde::test::dumpDiagnostics(diag);
        return false;
    }
    return expectBounds(*semantic, "demo::List", "", "");
}

bool testMarkersReplaceInference()
{
    const std::string text = "namespace demo;\n"
                             "@state(::app::Ctx)\n"
                             "record Node<T> { value: T; next: optional<box<Node<T>>>; }\n"
                             "@state_implements(::app::CountingContext)\n"
                             "union Tree<K, V> { Leaf(V), Branch { key: K; kids: list<Tree<K, V>>; } }\n"
                             "record UsesNode { head: Node<i32>; }\n";

    stateserde::DiagnosticEngine diag;
    auto                         semantic = stateserde::test::analyzeText(text, diag);
    if (!semantic)
    {
        std::cerr << "marked recursive schema failed to analyze\n";
        stateserde::test::dumpDiagnostics(diag);
        return false;
    }

    bool ok = true;
    ok      = expectBounds(*semantic, "demo::Node", "state(T)", "state(T)") && ok;
    ok      = expectBounds(*semantic,
                      "demo::Tree",
                      "capability(::app::CountingContext), state(K), state(V)",
                      "capability(::app::CountingContext), state(K), state(V)") &&
         ok;
    // A marked type is treated as a leaf by its users.
    ok = expectBounds(*semantic, "demo::UsesNode", "state(demo::Node<i32>)", "state(demo::Node<i32>)") && ok;
    if (!semantic->find("demo::Node")->bounds.coarse || semantic->find("demo::UsesNode")->bounds.coarse)
    {
        std::cerr << "unexpected coarse flags\n";
        ok = false;
    }
    return ok;
}

bool testAddConstraintDeduplicates()
{
    std::vector<stateserde::Constraint> constraints;
    stateserde::TypeRef                 param;
    param.kind = stateserde::TypeRefKind::GenericParam;
    param.name = "T";

    const bool first  = stateserde::addConstraint(constraints, {stateserde::ConstraintKind::StateProtocol, param});
    const bool second = stateserde::addConstraint(constraints, {stateserde::ConstraintKind::StateProtocol, param});
    const bool plain  = stateserde::addConstraint(constraints, {stateserde::ConstraintKind::PlainProtocol, param});
    if (!first || second || !plain || constraints.size() != 2)
    {
        std::cerr << "addConstraint must drop only identical constraints\n";
        return false;
    }
    return true;
}

}  // namespace

bool runBoundInferenceTests()
{
    bool ok = true;
    ok      = testPerFieldBounds() && ok;
    ok      = testNonGenericStatelessFieldsAddNothing() && ok;
    ok      = testRecursionWithoutMarkerFails() && ok;
    ok      = testMutualRecursionReportsChain() && ok;
    ok      = testStatelessRecursionTerminates() && ok;
    ok      = testMarkersReplaceInference() && ok;
    ok      = testAddConstraintDeduplicates() && ok;
    return ok;
}
