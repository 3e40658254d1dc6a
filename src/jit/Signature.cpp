//===----------------------------------------------------------------------===//
//
// Part of the Cortado project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Descriptor to Signature mapping. boolean, byte, char, short and int share
// the 32-bit integer kind, matching their representation on the JVM operand
// stack.
//
//===----------------------------------------------------------------------===//

#include "jit/Signature.hpp"

namespace cortado::jit
{
namespace
{

Expected<Kind> kindOf(const classfile::FieldType &type)
{
    if (type.kind != classfile::FieldType::Kind::Base)
        return Error::make(ErrorKind::UnsupportedType, "unsupported type " + type.descriptor());

    switch (type.base)
    {
        case classfile::BaseType::Boolean:
        case classfile::BaseType::Byte:
        case classfile::BaseType::Char:
        case classfile::BaseType::Short:
        case classfile::BaseType::Int:
            return Kind::Int32;
        case classfile::BaseType::Long:
            return Kind::Int64;
        case classfile::BaseType::Float:
            return Kind::Float32;
        case classfile::BaseType::Double:
            return Kind::Float64;
    }
    return Error::make(ErrorKind::UnsupportedType, "unsupported type " + type.descriptor());
}

} // namespace

const char *toString(Kind kind)
{
    switch (kind)
    {
        case Kind::Int32:
            return "Int32";
        case Kind::Int64:
            return "Int64";
        case Kind::Float32:
            return "Float32";
        case Kind::Float64:
            return "Float64";
        case Kind::Void:
            return "Void";
    }
    return "<unknown>";
}

std::optional<ValueKind> valueKindOf(Kind kind)
{
    switch (kind)
    {
        case Kind::Int32:
            return ValueKind::I32;
        case Kind::Int64:
            return ValueKind::I64;
        case Kind::Float32:
            return ValueKind::F32;
        case Kind::Float64:
            return ValueKind::F64;
        case Kind::Void:
            break;
    }
    return std::nullopt;
}

Expected<Signature> Signature::fromDescriptor(std::string_view descriptor)
{
    auto desc = classfile::parseMethodDescriptor(descriptor);
    if (!desc)
        return Error::fromClassFile(desc.error());
    return fromMethodDescriptor(desc.value());
}

Expected<Signature> Signature::fromMethodDescriptor(const classfile::MethodDescriptor &desc)
{
    Signature sig;
    sig.parameters.reserve(desc.parameters.size());
    for (const auto &param : desc.parameters)
    {
        auto kind = kindOf(param);
        if (!kind)
            return kind.error();
        sig.parameters.push_back(kind.value());
    }
    if (desc.returnType)
    {
        auto kind = kindOf(*desc.returnType);
        if (!kind)
            return kind.error();
        sig.returnKind = kind.value();
    }
    return sig;
}

size_t Signature::parameterSlots() const
{
    size_t slots = 0;
    for (Kind kind : parameters)
        slots += (kind == Kind::Int64 || kind == Kind::Float64) ? 2 : 1;
    return slots;
}

std::string Signature::toString() const
{
    std::string out = "(";
    for (size_t i = 0; i < parameters.size(); ++i)
    {
        if (i != 0)
            out += ", ";
        out += jit::toString(parameters[i]);
    }
    out += ") -> ";
    out += jit::toString(returnKind);
    return out;
}

} // namespace cortado::jit
