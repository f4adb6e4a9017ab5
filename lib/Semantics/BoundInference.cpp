//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements bound and recursion inference.
///
/// Expansion walks field types with an explicit stack of schema types being unfolded. A schema type that reappears
/// on the stack means the constraint set would have to unfold forever.
///
//===----------------------------------------------------------------------===//

#include "stateserde/Semantics/BoundInference.h"

#include "stateserde/Support/Diagnostics.h"

#include <algorithm>
#include <utility>

namespace stateserde
{
namespace
{

TypeRef genericParamRef(const std::string& name)
{
    TypeRef ref;
    ref.kind = TypeRefKind::GenericParam;
    ref.name = name;
    return ref;
}

ConstraintKind protocolFor(const Mode mode)
{
    return mode == Mode::Stateful ? ConstraintKind::StateProtocol : ConstraintKind::PlainProtocol;
}

}  // namespace

bool addConstraint(std::vector<Constraint>& constraints, Constraint constraint)
{
    const std::string key = constraint.str();
    const bool        present =
        std::any_of(constraints.begin(), constraints.end(), [&](const Constraint& c) { return c.str() == key; });
    if (present)
    {
        return false;
    }
    constraints.push_back(std::move(constraint));
    return true;
}

BoundInference::BoundInference(const ShapeIndex& shapes, DiagnosticEngine& diagnostics)
    : shapes_(shapes)
    , diagnostics_(diagnostics)
{
}

std::optional<BoundSet> BoundInference::infer(const TypeShape& shape)
{
    BoundSet bounds;
    if (shape.recursionMarker)
    {
        inferCoarse(shape, bounds);
        return bounds;
    }

    root_          = &shape;
    cycleReported_ = false;
    for (const bool decode : {false, true})
    {
        Expansion expansion;
        expansion.decode = decode;
        expansion.out    = decode ? &bounds.decode : &bounds.encode;
        expansion.stack.push_back(shape.qualifiedName);

        expandShapeFields(shape, {}, expansion);
        if (expansion.failed)
        {
            return std::nullopt;
        }
    }
    return bounds;
}

void BoundInference::inferCoarse(const TypeShape& shape, BoundSet& bounds) const
{
    const RecursionMarker& marker = *shape.recursionMarker;
    bounds.coarse                 = true;
    for (std::vector<Constraint>* out : {&bounds.encode, &bounds.decode})
    {
        if (marker.kind == RecursionMarkerKind::ExplicitCapability)
        {
            addConstraint(*out, Constraint{ConstraintKind::Capability, marker.subject});
        }
        for (const std::string& param : shape.genericParams)
        {
            addConstraint(*out, Constraint{ConstraintKind::StateProtocol, genericParamRef(param)});
        }
    }
}

void BoundInference::expandShapeFields(const TypeShape&                      shape,
                                       const std::map<std::string, TypeRef>& bindings,
                                       Expansion&                            expansion)
{
    if (shape.kind == ShapeKind::Record)
    {
        expandFields(shape.fields, bindings, expansion);
        return;
    }
    for (const VariantSpec& variant : shape.variants)
    {
        expandFields(variant.fields, bindings, expansion);
        if (expansion.failed)
        {
            return;
        }
    }
}

void BoundInference::expandFields(const std::vector<FieldSpec>&         fields,
                                  const std::map<std::string, TypeRef>& bindings,
                                  Expansion&                            expansion)
{
    for (const FieldSpec& field : fields)
    {
        TypeRef type = substituteGenerics(field.declaredType, bindings);
        if (field.omission == Omission::SkipWithDefault)
        {
            if (expansion.decode && type.mentionsGeneric())
            {
                addConstraint(*expansion.out, Constraint{ConstraintKind::ZeroValue, std::move(type)});
            }
            continue;
        }
        expandType(type, field.mode, expansion);
        if (expansion.failed)
        {
            return;
        }
    }
}

void BoundInference::expandType(const TypeRef& type, const Mode mode, Expansion& expansion)
{
    if (type.kind == TypeRefKind::GenericParam)
    {
        addConstraint(*expansion.out, Constraint{protocolFor(mode), type});
        return;
    }
    // Concrete plain positions are checked by the compiler when the body is instantiated.
    if (mode == Mode::Stateless && !type.mentionsGeneric())
    {
        return;
    }

    switch (type.kind)
    {
    case TypeRefKind::BuiltinScalar:
    case TypeRefKind::GenericParam:
        return;
    case TypeRefKind::BuiltinContainer:
        for (const TypeRef& argument : type.arguments)
        {
            expandType(argument, mode, expansion);
            if (expansion.failed)
            {
                return;
            }
        }
        return;
    case TypeRefKind::External:
        addConstraint(*expansion.out, Constraint{protocolFor(mode), type});
        return;
    case TypeRefKind::SchemaType:
        break;
    }

    const auto found = shapes_.find(type.name);
    if (found == shapes_.end() || mode == Mode::Stateless || found->second->recursionMarker)
    {
        addConstraint(*expansion.out, Constraint{protocolFor(mode), type});
        return;
    }

    if (std::find(expansion.stack.begin(), expansion.stack.end(), type.name) != expansion.stack.end())
    {
        reportCycle(type, expansion);
        expansion.failed = true;
        return;
    }

    const TypeShape&               nested = *found->second;
    std::map<std::string, TypeRef> bindings;
    for (std::size_t i = 0; i < nested.genericParams.size() && i < type.arguments.size(); ++i)
    {
        bindings.emplace(nested.genericParams[i], type.arguments[i]);
    }

    expansion.stack.push_back(type.name);
    expandShapeFields(nested, bindings, expansion);
    expansion.stack.pop_back();
}

void BoundInference::reportCycle(const TypeRef& type, const Expansion& expansion)
{
    if (cycleReported_)
    {
        return;
    }
    cycleReported_ = true;

    std::string chain;
    for (const std::string& step : expansion.stack)
    {
        chain += step + " -> ";
    }
    chain += type.name;

    const char* kind = root_->kind == ShapeKind::Union ? "union" : "record";
    diagnostics_.error(DiagnosticCategory::Recursion,
                       root_->location,
                       std::string("bound inference for ") + kind + " '" + root_->name +
                           "' does not terminate: " + chain + "; declare @state(...) or @state_implements(...) on '" +
                           root_->name + "' or on a type in the cycle");
}

}  // namespace stateserde
