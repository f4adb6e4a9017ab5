//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements C++ header emission for analyzed schema files.
///
/// Every container yields an aggregate definition plus one
/// `stateserde::StateEncoder` and one `stateserde::StateDecoder`
/// specialization. Field bodies dispatch on the resolved mode: stateful
/// fields go through the context-threaded helpers, stateless ones through
/// the plain helpers, and skipped fields are never visited.
///
//===----------------------------------------------------------------------===//

#include "stateserde/CodeGen/CppEmitter.h"

#include "stateserde/CodeGen/TypeRender.h"
#include "stateserde/Semantics/Model.h"
#include "stateserde/Support/Diagnostics.h"

#include "llvm/Support/Error.h"

#include <cctype>
#include <filesystem>
#include <functional>
#include <map>
#include <set>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace stateserde
{

namespace
{

void emitLine(std::ostringstream& out, const int indent, const std::string& line)
{
    if (line.empty())
    {
        out << '\n';
        return;
    }
    out << std::string(static_cast<std::size_t>(indent) * 2U, ' ') << line << '\n';
}

void emitNamespaceOpen(std::ostringstream& out, const std::vector<std::string>& components)
{
    if (components.empty())
    {
        return;
    }
    out << "namespace " << cppNamespacePath(components) << "\n{\n\n";
}

void emitNamespaceClose(std::ostringstream& out, const std::vector<std::string>& components)
{
    if (components.empty())
    {
        return;
    }
    out << "}  // namespace " << cppNamespacePath(components) << "\n\n";
}

std::string headerGuard(const std::string& headerPath)
{
    std::string out = "STATESERDE_GENERATED_";
    for (const char c : headerPath)
    {
        out += std::isalnum(static_cast<unsigned char>(c)) != 0
                   ? static_cast<char>(std::toupper(static_cast<unsigned char>(c)))
                   : '_';
    }
    return out;
}

/// @brief Statement lines of one generated function body.
class Body final
{
public:
    void line(const std::string& text)
    {
        lines_.emplace_back(depth_, text);
    }

    void open(const std::string& head)
    {
        line(head);
        line("{");
        ++depth_;
    }

    void close()
    {
        --depth_;
        line("}");
    }

    void write(std::ostringstream& out, const int indent) const
    {
        for (const auto& [depth, text] : lines_)
        {
            emitLine(out, indent + depth, text);
        }
    }

private:
    std::vector<std::pair<int, std::string>> lines_;
    int                                      depth_{0};
};

struct MemberFunction final
{
    std::string returnType;
    std::string name;
    std::string parameters;
    Body        body;
};

/// @brief Produces the statement returning an error expression from the current function.
using FailStatement = std::function<std::string(const std::string& errorExpression)>;

std::string memberName(const FieldSpec& field, const PayloadStyle style)
{
    return style == PayloadStyle::Positional ? "_" + field.declaredName : field.declaredName;
}

std::string slotName(const FieldSpec& field)
{
    return "f_" + field.declaredName;
}

bool isOptionalType(const TypeRef& type)
{
    return type.kind == TypeRefKind::BuiltinContainer && type.container == BuiltinContainer::Optional;
}

std::vector<const FieldSpec*> includedFields(const std::vector<FieldSpec>& fields)
{
    std::vector<const FieldSpec*> out;
    for (const FieldSpec& field : fields)
    {
        if (field.omission == Omission::Include)
        {
            out.push_back(&field);
        }
    }
    return out;
}

bool anyStateful(const std::vector<const FieldSpec*>& fields)
{
    for (const FieldSpec* field : fields)
    {
        if (field->mode == Mode::Stateful)
        {
            return true;
        }
    }
    return false;
}

/// @brief Renders the definition and specializations of one container.
class TypeEmitter final
{
public:
    explicit TypeEmitter(const AnalyzedType& type)
        : type_(type)
        , shape_(type.shape)
        , valueType_(renderValueType(type.shape))
    {
        const bool pinned = shape_.recursionMarker &&
                            shape_.recursionMarker->kind == RecursionMarkerKind::ExplicitContextType;
        contextType_      = pinned ? renderCppType(shape_.recursionMarker->subject) : ContextTypeParameter;
        for (const std::string& param : shape_.genericParams)
        {
            templateParams_.push_back("typename " + param);
        }
        if (!pinned)
        {
            templateParams_.push_back(std::string("typename ") + ContextTypeParameter);
        }
    }

    void emitForwardDeclaration(std::ostringstream& out) const
    {
        emitGenericHead(out, 0);
        emitLine(out, 0, "struct " + shape_.name + ";");
    }

    void emitDefinition(std::ostringstream& out) const
    {
        emitGenericHead(out, 0);
        emitLine(out, 0, "struct " + shape_.name);
        emitLine(out, 0, "{");
        if (shape_.kind == ShapeKind::Record)
        {
            for (const FieldSpec& field : shape_.fields)
            {
                emitFieldComment(out, 1, field);
                emitLine(out, 1, renderCppType(field.declaredType) + " " + memberName(field, shape_.style) + "{};");
            }
            if (!shape_.fields.empty())
            {
                emitLine(out, 0, "");
            }
        }
        else
        {
            std::string alternatives;
            for (const VariantSpec& variant : shape_.variants)
            {
                if (variant.wireTag != variant.name)
                {
                    emitLine(out, 1, "// Wire tag " + cppStringLiteral(variant.wireTag) + ".");
                }
                emitLine(out, 1, "struct " + variant.name);
                emitLine(out, 1, "{");
                for (const FieldSpec& field : variant.fields)
                {
                    emitFieldComment(out, 2, field);
                    emitLine(out, 2, renderCppType(field.declaredType) + " " + memberName(field, variant.style) + ";");
                }
                if (!variant.fields.empty())
                {
                    emitLine(out, 0, "");
                }
                emitLine(out, 2, "bool operator==(const " + variant.name + "&) const = default;");
                emitLine(out, 1, "};");
                emitLine(out, 0, "");
                alternatives += (alternatives.empty() ? "" : ", ") + variant.name;
            }
            emitLine(out, 1, "std::variant<" + alternatives + "> value;");
            emitLine(out, 0, "");
        }
        emitLine(out, 1, "bool operator==(const " + shape_.name + "&) const = default;");
        emitLine(out, 0, "};");
    }

    /// @brief Emits both specializations; full specializations put their member definitions into `definitions`.
    void emitSpecializations(std::ostringstream& declarations, std::ostringstream& definitions) const
    {
        emitSpecialization(declarations, definitions, false);
        emitSpecialization(declarations, definitions, true);
    }

private:
    const AnalyzedType&      type_;
    const TypeShape&         shape_;
    std::string              valueType_;
    std::string              contextType_;
    std::vector<std::string> templateParams_;

    bool isFullSpecialization() const
    {
        return templateParams_.empty();
    }

    void emitGenericHead(std::ostringstream& out, const int indent) const
    {
        if (shape_.genericParams.empty())
        {
            return;
        }
        std::string head;
        for (const std::string& param : shape_.genericParams)
        {
            head += (head.empty() ? "typename " : ", typename ") + param;
        }
        emitLine(out, indent, "template <" + head + ">");
    }

    static void emitFieldComment(std::ostringstream& out, const int indent, const FieldSpec& field)
    {
        if (field.omission == Omission::SkipWithDefault)
        {
            emitLine(out, indent, "// Not written; value-initialized on decode.");
        }
        else if (field.wireKey != field.declaredName)
        {
            emitLine(out, indent, "// Wire key " + cppStringLiteral(field.wireKey) + ".");
        }
    }

    std::string variantType(const VariantSpec& variant) const
    {
        return "typename " + valueType_ + "::" + variant.name;
    }

    std::string describe() const
    {
        return shape_.qualifiedName;
    }

    static std::string returnStatement(const std::string& errorExpression)
    {
        return "return " + errorExpression + ";";
    }

    static FailStatement tagged(const std::string& tag)
    {
        return [tag](const std::string& errorExpression) {
            return "return ::stateserde::withFieldContext(" + errorExpression + ", " + cppStringLiteral(tag) + ");";
        };
    }

    //===------------------------------------------------------------------===//
    // Encode
    //===------------------------------------------------------------------===//

    void encodePayload(Body&                         body,
                       const std::vector<FieldSpec>& fields,
                       const PayloadStyle            style,
                       const bool                    asInner,
                       const std::string&            target,
                       const FailStatement&          fail) const
    {
        const auto included = includedFields(fields);
        if (asInner)
        {
            const FieldSpec&  field  = *included.front();
            const std::string access = "value." + memberName(field, style);
            body.open("if (llvm::Error err = " +
                      (field.mode == Mode::Stateful
                           ? "::stateserde::encodeStateValue(" + access + ", state, " + target + ")"
                           : "::stateserde::encodePlainValue(" + access + ", " + target + ")") +
                      ")");
            body.line(fail("std::move(err)"));
            body.close();
            return;
        }

        switch (style)
        {
        case PayloadStyle::Unit:
            body.line(target + " = nullptr;");
            return;
        case PayloadStyle::Named:
            body.line("llvm::json::Object object;");
            for (const FieldSpec* field : included)
            {
                const std::string access = "value." + memberName(*field, style);
                const std::string key    = cppStringLiteral(field->wireKey);
                body.open("if (llvm::Error err = " +
                          (field->mode == Mode::Stateful
                               ? "::stateserde::encodeStateField(" + access + ", state, object, " + key + ")"
                               : "::stateserde::encodePlainField(" + access + ", object, " + key + ")") +
                          ")");
                body.line(fail("std::move(err)"));
                body.close();
            }
            body.line(target + " = std::move(object);");
            return;
        case PayloadStyle::Positional:
            body.line("llvm::json::Array array;");
            for (std::size_t index = 0; index < included.size(); ++index)
            {
                const FieldSpec&  field    = *included[index];
                const std::string access   = "value." + memberName(field, style);
                const std::string position = std::to_string(index);
                body.open("if (llvm::Error err = " +
                          (field.mode == Mode::Stateful
                               ? "::stateserde::encodeStateElement(" + access + ", state, array, " + position + ")"
                               : "::stateserde::encodePlainElement(" + access + ", array, " + position + ")") +
                          ")");
                body.line(fail("std::move(err)"));
                body.close();
            }
            body.line(target + " = std::move(array);");
            return;
        }
    }

    MemberFunction encodeRecord() const
    {
        MemberFunction fn{"llvm::Error",
                          "encode",
                          "const " + valueType_ + "& value, " + contextType_ + "& state, llvm::json::Value& out",
                          {}};
        const auto     included = includedFields(shape_.fields);
        if (!anyStateful(included))
        {
            fn.body.line("(void) state;");
        }
        if (included.empty())
        {
            fn.body.line("(void) value;");
        }
        encodePayload(fn.body,
                      shape_.fields,
                      shape_.style,
                      shape_.transparent || shape_.isNewtype(),
                      "out",
                      &returnStatement);
        fn.body.line("return llvm::Error::success();");
        return fn;
    }

    MemberFunction encodeVariant(const VariantSpec& variant) const
    {
        MemberFunction fn{"llvm::Error",
                          "encode" + variant.name,
                          "const " + variantType(variant) + "& value, " + contextType_ +
                              "& state, llvm::json::Value& out",
                          {}};
        const auto     included = includedFields(variant.fields);
        if (!anyStateful(included))
        {
            fn.body.line("(void) state;");
        }
        if (variant.style == PayloadStyle::Unit)
        {
            fn.body.line("(void) value;");
            fn.body.line("out = " + cppStringLiteral(variant.wireTag) + ";");
            fn.body.line("return llvm::Error::success();");
            return fn;
        }
        if (included.empty())
        {
            fn.body.line("(void) value;");
        }
        fn.body.line("llvm::json::Value payload(nullptr);");
        encodePayload(fn.body,
                      variant.fields,
                      variant.style,
                      isNewtypePayload(variant.style, variant.fields),
                      "payload",
                      tagged(variant.wireTag));
        fn.body.line("llvm::json::Object wrapper;");
        fn.body.line("wrapper[" + cppStringLiteral(variant.wireTag) + "] = std::move(payload);");
        fn.body.line("out = std::move(wrapper);");
        fn.body.line("return llvm::Error::success();");
        return fn;
    }

    MemberFunction encodeUnion() const
    {
        MemberFunction fn{"llvm::Error",
                          "encode",
                          "const " + valueType_ + "& value, " + contextType_ + "& state, llvm::json::Value& out",
                          {}};
        fn.body.open("switch (value.value.index())");
        for (std::size_t index = 0; index < shape_.variants.size(); ++index)
        {
            const std::string position = std::to_string(index);
            fn.body.line("case " + position + ":");
            fn.body.line("  return encode" + shape_.variants[index].name + "(std::get<" + position +
                         ">(value.value), state, out);");
        }
        fn.body.line("default:");
        fn.body.line("  break;");
        fn.body.close();
        fn.body.line("return ::stateserde::makeInvalidValueError(" +
                     cppStringLiteral("union '" + describe() + "' holds no alternative") + ");");
        return fn;
    }

    //===------------------------------------------------------------------===//
    // Decode
    //===------------------------------------------------------------------===//

    void decodePayload(Body&                                         body,
                       const std::vector<FieldSpec>&                 fields,
                       const PayloadStyle                            style,
                       const bool                                    asInner,
                       const std::string&                            payloadType,
                       const std::function<std::string(std::string)>& wrap,
                       const FailStatement&                          fail) const
    {
        const auto included = includedFields(fields);
        for (const FieldSpec* field : included)
        {
            body.line("std::optional<" + renderCppType(field->declaredType) + "> " + slotName(*field) + ";");
        }

        if (asInner)
        {
            const FieldSpec& field = *included.front();
            body.open("if (llvm::Error err = " +
                      (field.mode == Mode::Stateful
                           ? "::stateserde::decodeStateValue(state, in, " + slotName(field) + ")"
                           : "::stateserde::decodePlainValue(in, " + slotName(field) + ")") +
                      ")");
            body.line(fail("std::move(err)"));
            body.close();
        }
        else if (style == PayloadStyle::Unit)
        {
            body.open("if (!in.getAsNull())");
            body.line(fail("::stateserde::makeInvalidValueError(" + cppStringLiteral("expected null") + ")"));
            body.close();
        }
        else if (style == PayloadStyle::Named)
        {
            body.line("const llvm::json::Object* object = in.getAsObject();");
            body.open("if (object == nullptr)");
            body.line(fail("::stateserde::makeInvalidValueError(" + cppStringLiteral("expected an object") + ")"));
            body.close();
            if (!included.empty())
            {
                body.open("for (const auto& entry : *object)");
                body.line("const llvm::StringRef key = entry.first;");
                for (std::size_t index = 0; index < included.size(); ++index)
                {
                    const FieldSpec&  field = *included[index];
                    const std::string key   = cppStringLiteral(field.wireKey);
                    body.open((index == 0 ? "if (key == " : "else if (key == ") + key + ")");
                    body.open("if (llvm::Error err = " +
                              (field.mode == Mode::Stateful
                                   ? "::stateserde::decodeStateField(state, entry.second, " + slotName(field) + ", " +
                                         key + ")"
                                   : "::stateserde::decodePlainField(entry.second, " + slotName(field) + ", " + key +
                                         ")") +
                              ")");
                    body.line(fail("std::move(err)"));
                    body.close();
                    body.close();
                }
                body.close();
            }
            for (const FieldSpec* field : included)
            {
                if (isOptionalType(field->declaredType))
                {
                    continue;
                }
                body.open("if (!" + slotName(*field) + ")");
                body.line(fail("::stateserde::makeMissingFieldError(" + cppStringLiteral(field->wireKey) + ")"));
                body.close();
            }
        }
        else
        {
            const std::string count = std::to_string(included.size());
            body.line("const llvm::json::Array* array = in.getAsArray();");
            body.open("if (array == nullptr || array->size() != " + count + ")");
            body.line(fail("::stateserde::makeInvalidValueError(" +
                           cppStringLiteral("expected an array of " + count + " element(s)") + ")"));
            body.close();
            for (std::size_t index = 0; index < included.size(); ++index)
            {
                const FieldSpec&  field    = *included[index];
                const std::string position = std::to_string(index);
                const std::string segment  = cppStringLiteral("[" + position + "]");
                body.open("if (llvm::Error err = " +
                          (field.mode == Mode::Stateful
                               ? "::stateserde::decodeStateField(state, (*array)[" + position + "], " +
                                     slotName(field) + ", " + segment + ")"
                               : "::stateserde::decodePlainField((*array)[" + position + "], " + slotName(field) +
                                     ", " + segment + ")") +
                          ")");
                body.line(fail("std::move(err)"));
                body.close();
            }
        }

        std::string initializers;
        for (const FieldSpec* field : included)
        {
            const bool        lenient = !asInner && style == PayloadStyle::Named && isOptionalType(field->declaredType);
            const std::string moved   = lenient ? "std::move(" + slotName(*field) + ").value_or(std::nullopt)"
                                                : "std::move(*" + slotName(*field) + ")";
            initializers += (initializers.empty() ? "" : ", ") + std::string(".") + memberName(*field, style) +
                            " = " + moved;
        }
        body.line("return " + wrap(payloadType + "{" + initializers + "}") + ";");
    }

    MemberFunction decodeRecord() const
    {
        MemberFunction fn{"llvm::Expected<" + valueType_ + ">",
                          "decode",
                          contextType_ + "& state, const llvm::json::Value& in",
                          {}};
        if (!anyStateful(includedFields(shape_.fields)))
        {
            fn.body.line("(void) state;");
        }
        decodePayload(
            fn.body,
            shape_.fields,
            shape_.style,
            shape_.transparent || shape_.isNewtype(),
            valueType_,
            [](std::string value) { return value; },
            &returnStatement);
        return fn;
    }

    MemberFunction decodeVariant(const VariantSpec& variant) const
    {
        MemberFunction fn{"llvm::Expected<" + valueType_ + ">",
                          "decode" + variant.name,
                          contextType_ + "& state, const llvm::json::Value& in",
                          {}};
        if (!anyStateful(includedFields(variant.fields)))
        {
            fn.body.line("(void) state;");
        }
        const std::string wrapper = valueType_;
        decodePayload(
            fn.body,
            variant.fields,
            variant.style,
            isNewtypePayload(variant.style, variant.fields),
            variantType(variant),
            [wrapper](std::string payload) { return wrapper + "{.value = " + payload + "}"; },
            tagged(variant.wireTag));
        return fn;
    }

    MemberFunction decodeUnion() const
    {
        MemberFunction fn{"llvm::Expected<" + valueType_ + ">",
                          "decode",
                          contextType_ + "& state, const llvm::json::Value& in",
                          {}};

        std::string validTags;
        for (const VariantSpec& variant : shape_.variants)
        {
            validTags += (validTags.empty() ? "" : ", ") + cppStringLiteral(variant.wireTag);
        }

        fn.body.open("if (auto bareTag = in.getAsString())");
        for (const VariantSpec& variant : shape_.variants)
        {
            const std::string tag = cppStringLiteral(variant.wireTag);
            fn.body.open("if (*bareTag == " + tag + ")");
            if (variant.style == PayloadStyle::Unit)
            {
                fn.body.line("return " + valueType_ + "{.value = " + variantType(variant) + "{}};");
            }
            else
            {
                fn.body.line("return ::stateserde::withFieldContext(::stateserde::makeInvalidValueError(" +
                             cppStringLiteral("variant requires a payload") + "), " + tag + ");");
            }
            fn.body.close();
        }
        fn.body.line("return ::stateserde::makeUnknownVariantError(*bareTag, {" + validTags + "});");
        fn.body.close();

        fn.body.line("const llvm::json::Object* object = in.getAsObject();");
        fn.body.open("if (object == nullptr || object->size() != 1)");
        fn.body.line("return ::stateserde::makeInvalidValueError(" +
                     cppStringLiteral("expected a variant tag or an object with exactly one key for union '" +
                                      describe() + "'") +
                     ");");
        fn.body.close();
        fn.body.line("const auto&           entry = *object->begin();");
        fn.body.line("const llvm::StringRef tag   = entry.first;");
        for (const VariantSpec& variant : shape_.variants)
        {
            fn.body.open("if (tag == " + cppStringLiteral(variant.wireTag) + ")");
            fn.body.line("return decode" + variant.name + "(state, entry.second);");
            fn.body.close();
        }
        fn.body.line("return ::stateserde::makeUnknownVariantError(tag, {" + validTags + "});");
        return fn;
    }

    //===------------------------------------------------------------------===//
    // Specialization layout
    //===------------------------------------------------------------------===//

    std::vector<MemberFunction> members(const bool decode) const
    {
        std::vector<MemberFunction> out;
        if (shape_.kind == ShapeKind::Record)
        {
            out.push_back(decode ? decodeRecord() : encodeRecord());
            return out;
        }
        out.push_back(decode ? decodeUnion() : encodeUnion());
        for (const VariantSpec& variant : shape_.variants)
        {
            out.push_back(decode ? decodeVariant(variant) : encodeVariant(variant));
        }
        return out;
    }

    void emitSpecialization(std::ostringstream& declarations, std::ostringstream& definitions, const bool decode) const
    {
        const std::string templateName = decode ? "StateDecoder" : "StateEncoder";
        const std::string specialized  = templateName + "<" + valueType_ + ", " + contextType_ + ">";
        const std::string clause =
            renderRequiresExpression(decode ? type_.bounds.decode : type_.bounds.encode, decode, contextType_);

        if (isFullSpecialization())
        {
            emitLine(declarations, 0, "template <>");
        }
        else
        {
            std::string head;
            for (const std::string& param : templateParams_)
            {
                head += (head.empty() ? "" : ", ") + param;
            }
            emitLine(declarations, 0, "template <" + head + ">");
            if (!clause.empty())
            {
                emitLine(declarations, 1, "requires " + clause);
            }
        }
        emitLine(declarations, 0, "struct " + specialized);
        emitLine(declarations, 0, "{");

        const auto functions = members(decode);
        for (std::size_t i = 0; i < functions.size(); ++i)
        {
            const MemberFunction& fn = functions[i];
            if (i > 0 && !isFullSpecialization())
            {
                emitLine(declarations, 0, "");
            }
            if (isFullSpecialization())
            {
                emitLine(declarations, 1, "static " + fn.returnType + " " + fn.name + "(" + fn.parameters + ");");
                emitLine(definitions,
                         0,
                         "inline " + fn.returnType + " " + specialized + "::" + fn.name + "(" + fn.parameters + ")");
                emitLine(definitions, 0, "{");
                fn.body.write(definitions, 1);
                emitLine(definitions, 0, "}");
                emitLine(definitions, 0, "");
                continue;
            }
            emitLine(declarations, 1, "static " + fn.returnType + " " + fn.name + "(" + fn.parameters + ")");
            emitLine(declarations, 1, "{");
            fn.body.write(declarations, 2);
            emitLine(declarations, 1, "}");
        }
        emitLine(declarations, 0, "};");
        emitLine(declarations, 0, "");
    }
};

/// @brief Orders a unit's types so that each follows the same-unit types it depends on.
std::vector<const AnalyzedType*> dependencyOrder(const SchemaUnit&                                            unit,
                                                 const std::function<std::vector<std::string>(const TypeShape&)>& edges)
{
    std::map<std::string, const AnalyzedType*> byKey;
    for (const AnalyzedType& type : unit.types)
    {
        byKey.emplace(type.shape.qualifiedName, &type);
    }

    std::vector<const AnalyzedType*> out;
    std::set<std::string>            visited;
    std::function<void(const AnalyzedType&)> visit = [&](const AnalyzedType& type) {
        if (!visited.insert(type.shape.qualifiedName).second)
        {
            return;
        }
        for (const std::string& dependency : edges(type.shape))
        {
            const auto it = byKey.find(dependency);
            if (it != byKey.end())
            {
                visit(*it->second);
            }
        }
        out.push_back(&type);
    };
    for (const AnalyzedType& type : unit.types)
    {
        visit(type);
    }
    return out;
}

const SchemaUnit* findUnit(const SemanticModule& semantic, const std::string& relativePath)
{
    for (const SchemaUnit& unit : semantic.units)
    {
        if (unit.relativePath == relativePath)
        {
            return &unit;
        }
    }
    return nullptr;
}

std::vector<std::string> transitiveSchemaFiles(const SemanticModule& semantic, const SchemaUnit& root)
{
    std::vector<std::string>       files;
    std::set<std::string>          seen{root.relativePath};
    std::vector<const SchemaUnit*> pending{&root};
    while (!pending.empty())
    {
        const SchemaUnit* unit = pending.back();
        pending.pop_back();
        files.push_back(unit->filePath);
        for (const std::string& dependency : unit->dependencies)
        {
            const SchemaUnit* next = findUnit(semantic, dependency);
            if (next != nullptr && seen.insert(dependency).second)
            {
                pending.push_back(next);
            }
        }
    }
    return files;
}

}  // namespace

std::string generatedHeaderPath(const SchemaUnit& unit, llvm::StringRef headerExtension)
{
    std::filesystem::path path(unit.relativePath);
    path.replace_extension(headerExtension.str());
    return path.generic_string();
}

std::string renderCppHeader(const SemanticModule& semantic, const SchemaUnit& unit, const CppEmitOptions& options)
{
    const std::string headerPath = generatedHeaderPath(unit, options.headerExtension);
    const std::string guard      = headerGuard(headerPath);

    std::ostringstream out;
    out << "// Generated by stateserdec from " << unit.relativePath << ". Do not edit.\n";
    out << "#ifndef " << guard << "\n";
    out << "#define " << guard << "\n\n";
    out << "#include \"" << options.runtimeInclude << "\"\n\n";
    for (const char* header : {"<concepts>", "<cstdint>", "<map>", "<optional>", "<string>", "<utility>", "<variant>",
                               "<vector>"})
    {
        out << "#include " << header << "\n";
    }
    out << "\n";

    if (!unit.includes.empty() || !unit.dependencies.empty())
    {
        for (const std::string& include : unit.includes)
        {
            out << "#include " << (!include.empty() && include.front() == '<' ? include : "\"" + include + "\"") << "\n";
        }
        for (const std::string& dependency : unit.dependencies)
        {
            if (const SchemaUnit* dependencyUnit = findUnit(semantic, dependency))
            {
                out << "#include \"" << generatedHeaderPath(*dependencyUnit, options.headerExtension) << "\"\n";
            }
        }
        out << "\n";
    }

    emitNamespaceOpen(out, unit.namespaceComponents);
    for (const AnalyzedType& type : unit.types)
    {
        TypeEmitter(type).emitForwardDeclaration(out);
    }
    if (!unit.types.empty())
    {
        out << "\n";
    }
    for (const AnalyzedType* type :
         dependencyOrder(unit, [](const TypeShape& shape) { return valueDependencies(shape, true); }))
    {
        TypeEmitter(*type).emitDefinition(out);
        out << "\n";
    }
    emitNamespaceClose(out, unit.namespaceComponents);

    std::ostringstream declarations;
    std::ostringstream definitions;
    for (const AnalyzedType* type : dependencyOrder(unit, &referencedSchemaTypes))
    {
        TypeEmitter(*type).emitSpecializations(declarations, definitions);
    }

    out << "namespace stateserde\n{\n\n";
    out << declarations.str();
    out << definitions.str();
    out << "}  // namespace stateserde\n\n";
    out << "#endif  // " << guard << "\n";
    return out.str();
}

llvm::Error emitCpp(const SemanticModule& semantic, const CppEmitOptions& options, DiagnosticEngine& diagnostics)
{
    if (options.outDir.empty())
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(), "output directory is required");
    }

    const std::set<std::string> selected(options.selectedSchemas.begin(), options.selectedSchemas.end());
    for (const std::string& path : selected)
    {
        if (findUnit(semantic, path) == nullptr)
        {
            diagnostics.error({path, 1, 1}, "selected schema file was not found under any schema root");
        }
    }
    if (diagnostics.hasErrors())
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(), "unknown schema file selected");
    }

    const std::filesystem::path outRoot(options.outDir);
    for (const SchemaUnit& unit : semantic.units)
    {
        if (!selected.empty() && selected.count(unit.relativePath) == 0)
        {
            continue;
        }
        GeneratedHeader header;
        header.path          = (outRoot / generatedHeaderPath(unit, options.headerExtension)).string();
        header.content       = renderCppHeader(semantic, unit, options);
        header.schemaSources = transitiveSchemaFiles(semantic, unit);
        if (auto err = writeGeneratedHeader(header, options.writeDepfiles, options.outputPolicy))
        {
            return err;
        }
    }
    return llvm::Error::success();
}

}  // namespace stateserde
