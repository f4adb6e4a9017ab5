//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Bound and recursion inference for generated codec specializations.
///
//===----------------------------------------------------------------------===//
#ifndef STATESERDE_SEMANTICS_BOUND_INFERENCE_H
#define STATESERDE_SEMANTICS_BOUND_INFERENCE_H

#include "stateserde/Semantics/Model.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace stateserde
{

class DiagnosticEngine;

/// @file
/// @brief Constraint inference over resolved schema shapes.

/// @brief Computes the constraint sets a container's generated operations require.
///
/// Without a recursion marker every field type is expanded to the narrowest point that needs a constraint: generic
/// parameters directly, builtin containers through their arguments, and schema types through their own fields.
/// Reaching a type that is already being expanded is a recursion error. With a marker the expansion is replaced by
/// one constraint per generic parameter.
class BoundInference final
{
public:
    /// @brief Creates an inference engine over a complete set of shapes.
    /// @param[in] shapes Index of every schema type of the run.
    /// @param[in,out] diagnostics Sink for recursion errors.
    BoundInference(const ShapeIndex& shapes, DiagnosticEngine& diagnostics);

    /// @brief Infers both constraint sets for one container.
    /// @param[in] shape Container to analyze.
    /// @return Constraint sets, or `std::nullopt` after reporting a recursion error.
    std::optional<BoundSet> infer(const TypeShape& shape);

private:
    /// @brief Direction-specific accumulation state.
    struct Expansion
    {
        bool                     decode{false};
        std::vector<Constraint>* out{nullptr};
        std::vector<std::string> stack;
        bool                     failed{false};
    };

    void inferCoarse(const TypeShape& shape, BoundSet& bounds) const;

    void expandFields(const std::vector<FieldSpec>&         fields,
                      const std::map<std::string, TypeRef>& bindings,
                      Expansion&                            expansion);

    void expandShapeFields(const TypeShape& shape, const std::map<std::string, TypeRef>& bindings, Expansion& expansion);

    void expandType(const TypeRef& type, Mode mode, Expansion& expansion);

    void reportCycle(const TypeRef& type, const Expansion& expansion);

    const ShapeIndex& shapes_;
    DiagnosticEngine& diagnostics_;
    const TypeShape*  root_{nullptr};
    bool              cycleReported_{false};
};

/// @brief Appends `constraint` unless an equivalent one is already present.
/// @param[in,out] constraints Ordered constraint list.
/// @param[in] constraint Candidate.
/// @return True when the constraint was appended.
bool addConstraint(std::vector<Constraint>& constraints, Constraint constraint);

}  // namespace stateserde

#endif  // STATESERDE_SEMANTICS_BOUND_INFERENCE_H
