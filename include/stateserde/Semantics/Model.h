//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Schema model declarations produced from parsed schema declarations.
///
//===----------------------------------------------------------------------===//
#ifndef STATESERDE_SEMANTICS_MODEL_H
#define STATESERDE_SEMANTICS_MODEL_H

#include "stateserde/Frontend/AST.h"
#include "stateserde/Frontend/SourceLocation.h"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace stateserde
{

/// @file
/// @brief Schema model consumed by bound inference and code generation.

/// @brief Which protocol a field is encoded and decoded through.
enum class Mode
{

    /// @brief The caller's context is threaded into the field's own codec.
    Stateful,

    /// @brief The field uses the context-free codec.
    Stateless,
};

/// @brief Whether a field appears on the wire.
enum class Omission
{

    /// @brief Field is written and read.
    Include,

    /// @brief Field is never written; decode value-initializes it.
    SkipWithDefault,
};

/// @brief Classification of a resolved type reference.
enum class TypeRefKind
{

    /// @brief Generic parameter of the enclosing container.
    GenericParam,

    /// @brief `bool`, fixed-width integers, floats, `string`.
    BuiltinScalar,

    /// @brief `list`, `optional`, `map`, `box`.
    BuiltinContainer,

    /// @brief Type declared in some schema file of the current run.
    SchemaType,

    /// @brief Hand-written C++ type outside the schema.
    External,
};

/// @brief Builtin scalar types.
enum class BuiltinScalar
{
    Bool,
    I8,
    I16,
    I32,
    I64,
    U8,
    U16,
    U32,
    U64,
    F32,
    F64,
    String,
};

/// @brief Builtin generic containers, each with exactly one type argument.
enum class BuiltinContainer
{
    List,
    Optional,
    Map,
    Box,
};

/// @brief Looks up a builtin scalar by its schema spelling.
std::optional<BuiltinScalar> builtinScalarFromName(const std::string& name);

/// @brief Looks up a builtin container by its schema spelling.
std::optional<BuiltinContainer> builtinContainerFromName(const std::string& name);

/// @brief Returns the schema spelling of a builtin scalar.
const char* builtinScalarName(BuiltinScalar scalar);

/// @brief Returns the schema spelling of a builtin container.
const char* builtinContainerName(BuiltinContainer container);

/// @brief Resolved type reference.
struct TypeRef final
{
    TypeRefKind      kind{TypeRefKind::External};
    BuiltinScalar    scalar{BuiltinScalar::Bool};
    BuiltinContainer container{BuiltinContainer::List};

    /// @brief Parameter name, builtin spelling, schema type key (`a::b::Name`), or external name (`::a::Name`).
    std::string name;

    /// @brief Generic arguments.
    std::vector<TypeRef> arguments;

    SourceLocation location;

    /// @brief Returns true when any generic parameter occurs in this reference.
    [[nodiscard]] bool mentionsGeneric() const;

    /// @brief Stable textual form used in messages and for constraint deduplication.
    [[nodiscard]] std::string str() const;
};

/// @brief Replaces generic parameters by name.
/// @param[in] type Reference to rewrite.
/// @param[in] bindings Parameter name to replacement.
/// @return Rewritten reference.
TypeRef substituteGenerics(const TypeRef& type, const std::map<std::string, TypeRef>& bindings);

/// @brief Fully resolved field.
struct FieldSpec final
{
    SourceLocation location;

    /// @brief Declared name, or the positional index for positional fields.
    std::string declaredName;

    /// @brief Key under which the field is written; for positional fields its index among non-skipped fields.
    std::string wireKey;

    TypeRef  declaredType;
    Mode     mode{Mode::Stateful};
    Omission omission{Omission::Include};
};

/// @brief Fully resolved union alternative.
struct VariantSpec final
{
    SourceLocation location;
    std::string    name;

    /// @brief Tag written on the wire; the declared name unless renamed.
    std::string wireTag;

    PayloadStyle           style{PayloadStyle::Unit};
    std::vector<FieldSpec> fields;

    /// @brief Variant-level mode annotation, if any.
    std::optional<Mode> containerModeOverride;
};

/// @brief Kind of container-level recursion-breaking declaration.
enum class RecursionMarkerKind
{

    /// @brief `@state(T)`: the context type is pinned to `T`.
    ExplicitContextType,

    /// @brief `@state_implements(C)`: the context type must satisfy capability `C`.
    ExplicitCapability,
};

/// @brief Container-level recursion-breaking declaration.
struct RecursionMarker final
{
    RecursionMarkerKind kind{RecursionMarkerKind::ExplicitContextType};

    /// @brief Pinned context type, or the capability name.
    TypeRef subject;

    [[nodiscard]] std::string str() const;
};

/// @brief Top-level container kind.
enum class ShapeKind
{
    Record,
    Union,
};

/// @brief Resolved record or union declaration.
struct TypeShape final
{
    SourceLocation location;
    ShapeKind      kind{ShapeKind::Record};

    /// @brief Declared short name.
    std::string name;

    /// @brief Enclosing C++ namespace components.
    std::vector<std::string> namespaceComponents;

    /// @brief Lookup key `a::b::Name`.
    std::string qualifiedName;

    std::vector<std::string> genericParams;

    /// @brief Container default mode.
    Mode containerMode{Mode::Stateful};

    /// @brief Encoded as its single non-skipped field.
    bool transparent{false};

    std::optional<RecursionMarker> recursionMarker;

    /// @brief Field layout of a record.
    PayloadStyle style{PayloadStyle::Unit};

    std::vector<FieldSpec>   fields;
    std::vector<VariantSpec> variants;

    /// @brief Returns true when the record encodes as its single positional field.
    [[nodiscard]] bool isNewtype() const;
};

/// @brief Returns true when a positional payload encodes as its single field.
bool isNewtypePayload(PayloadStyle style, const std::vector<FieldSpec>& fields);

/// @brief Lists schema types a container stores by value, outside `list`, `map` and `box`.
/// @param[in] shape Container to inspect.
/// @param[in] throughSchemaArguments Also report arguments of generic schema types, which may be stored by value.
/// @return Lookup keys in first-occurrence order, without duplicates.
std::vector<std::string> valueDependencies(const TypeShape& shape, bool throughSchemaArguments);

/// @brief Lists schema types a default-constructed container constructs, following `box` but not `list`, `map` or
/// `optional`. Only the first variant of a union is constructed.
/// @param[in] shape Container to inspect.
/// @return Lookup keys in first-occurrence order, without duplicates.
std::vector<std::string> defaultConstructionDependencies(const TypeShape& shape);

/// @brief Lists every schema type a container mentions anywhere, including its recursion marker.
/// @param[in] shape Container to inspect.
/// @return Lookup keys in first-occurrence order, without duplicates.
std::vector<std::string> referencedSchemaTypes(const TypeShape& shape);

/// @brief Requirement category attached to generated operations.
enum class ConstraintKind
{

    /// @brief Subject implements the context-threaded protocol for the context type.
    StateProtocol,

    /// @brief Subject implements the plain protocol.
    PlainProtocol,

    /// @brief Subject is value-initializable.
    ZeroValue,

    /// @brief Context type satisfies the capability named by the subject.
    Capability,
};

/// @brief Returns a short name for a constraint kind.
const char* constraintKindName(ConstraintKind kind);

/// @brief One requirement of a generated operation.
struct Constraint final
{
    ConstraintKind kind{ConstraintKind::StateProtocol};
    TypeRef        subject;

    /// @brief Text form such as `state(list<T>)`; equal strings mean equivalent constraints.
    [[nodiscard]] std::string str() const;
};

/// @brief Constraint sets inferred for one container.
struct BoundSet final
{
    /// @brief True when a recursion marker replaced per-field inference.
    bool coarse{false};

    std::vector<Constraint> encode;
    std::vector<Constraint> decode;
};

/// @brief Container plus its inferred bounds.
struct AnalyzedType final
{
    TypeShape shape;
    BoundSet  bounds;
};

/// @brief Everything known about one schema file after analysis.
struct SchemaUnit final
{
    std::string filePath;
    std::string relativePath;

    /// @brief Effective C++ namespace of the file's types.
    std::vector<std::string> namespaceComponents;

    /// @brief Verbatim `include` paths.
    std::vector<std::string> includes;

    /// @brief Types in declaration order.
    std::vector<AnalyzedType> types;

    /// @brief Relative paths of other units whose types this unit references.
    std::vector<std::string> dependencies;
};

/// @brief Analysis result for one run.
struct SemanticModule final
{
    std::vector<SchemaUnit> units;

    /// @brief Finds a container by its lookup key.
    [[nodiscard]] const AnalyzedType* find(const std::string& qualifiedName) const;
};

/// @brief Index from lookup key to shape, used while the module is being assembled.
using ShapeIndex = std::map<std::string, const TypeShape*>;

}  // namespace stateserde

#endif  // STATESERDE_SEMANTICS_MODEL_H
