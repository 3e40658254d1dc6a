//===----------------------------------------------------------------------===//
//
// Part of the Cortado project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Recursive-descent parser for JVM field and method descriptors.
//
//===----------------------------------------------------------------------===//

#include "classfile/FieldType.hpp"

namespace cortado::classfile
{
namespace
{

ClassFileError fieldError(std::string_view text)
{
    return ClassFileError{ClassFileError::Kind::InvalidFieldType,
                          "invalid field type '" + std::string(text) + "'"};
}

ClassFileError methodError(std::string_view text)
{
    return ClassFileError{ClassFileError::Kind::InvalidMethodDescriptor,
                          "invalid method descriptor '" + std::string(text) + "'"};
}

/// Parse one field type starting at @p pos; advances @p pos past it.
std::optional<FieldType> parseAt(std::string_view text, size_t &pos)
{
    if (pos >= text.size())
        return std::nullopt;
    const char c = text[pos];
    switch (c)
    {
        case 'B':
        case 'C':
        case 'D':
        case 'F':
        case 'I':
        case 'J':
        case 'S':
        case 'Z':
            ++pos;
            return FieldType::makeBase(static_cast<BaseType>(c));
        case 'L':
        {
            const size_t end = text.find(';', pos);
            if (end == std::string_view::npos || end == pos + 1)
                return std::nullopt;
            std::string name(text.substr(pos + 1, end - pos - 1));
            pos = end + 1;
            return FieldType::makeObject(std::move(name));
        }
        case '[':
        {
            ++pos;
            auto component = parseAt(text, pos);
            if (!component)
                return std::nullopt;
            return FieldType::makeArray(std::move(*component));
        }
        default:
            return std::nullopt;
    }
}

} // namespace

FieldType FieldType::makeBase(BaseType type)
{
    FieldType t;
    t.kind = Kind::Base;
    t.base = type;
    return t;
}

FieldType FieldType::makeObject(std::string name)
{
    FieldType t;
    t.kind = Kind::Object;
    t.className = std::move(name);
    return t;
}

FieldType FieldType::makeArray(FieldType componentType)
{
    FieldType t;
    t.kind = Kind::Array;
    t.component = std::make_shared<const FieldType>(std::move(componentType));
    return t;
}

std::string FieldType::descriptor() const
{
    switch (kind)
    {
        case Kind::Base:
            return std::string(1, static_cast<char>(base));
        case Kind::Object:
            return "L" + className + ";";
        case Kind::Array:
            return "[" + component->descriptor();
    }
    return {};
}

Expected<FieldType> parseFieldType(std::string_view text)
{
    size_t pos = 0;
    auto type = parseAt(text, pos);
    if (!type || pos != text.size())
        return fieldError(text);
    return std::move(*type);
}

Expected<MethodDescriptor> parseMethodDescriptor(std::string_view text)
{
    if (text.empty() || text.front() != '(')
        return methodError(text);

    MethodDescriptor desc;
    size_t pos = 1;
    while (pos < text.size() && text[pos] != ')')
    {
        auto param = parseAt(text, pos);
        if (!param)
            return methodError(text);
        desc.parameters.push_back(std::move(*param));
    }
    if (pos >= text.size())
        return methodError(text);
    ++pos; // ')'

    if (pos < text.size() && text[pos] == 'V')
    {
        if (pos + 1 != text.size())
            return methodError(text);
        return desc;
    }
    auto ret = parseAt(text, pos);
    if (!ret || pos != text.size())
        return methodError(text);
    desc.returnType = std::move(*ret);
    return desc;
}

} // namespace cortado::classfile
