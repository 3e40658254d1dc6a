//===----------------------------------------------------------------------===//
//
// Part of the Cortado project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Constant-pool storage and typed lookups. Every lookup that can fail returns
// an Expected carrying a ClassFileError so the JIT can wrap the cause
// verbatim.
//
//===----------------------------------------------------------------------===//

#include "classfile/ConstantPool.hpp"

#include <sstream>

namespace cortado::classfile
{

const char *toString(ClassFileError::Kind kind)
{
    switch (kind)
    {
        case ClassFileError::Kind::InvalidConstantPoolIndex:
            return "invalid constant pool index";
        case ClassFileError::Kind::InvalidConstantPoolIndexType:
            return "invalid constant pool index type";
        case ClassFileError::Kind::InvalidMethodDescriptor:
            return "invalid method descriptor";
        case ClassFileError::Kind::InvalidFieldType:
            return "invalid field type";
    }
    return "<unknown>";
}

Constant Constant::makeUtf8(std::string value)
{
    Constant c;
    c.tag = Tag::Utf8;
    c.utf8 = std::move(value);
    return c;
}

Constant Constant::makeInteger(int32_t value)
{
    Constant c;
    c.tag = Tag::Integer;
    c.i32 = value;
    return c;
}

Constant Constant::makeFloat(float value)
{
    Constant c;
    c.tag = Tag::Float;
    c.f32 = value;
    return c;
}

Constant Constant::makeLong(int64_t value)
{
    Constant c;
    c.tag = Tag::Long;
    c.i64 = value;
    return c;
}

Constant Constant::makeDouble(double value)
{
    Constant c;
    c.tag = Tag::Double;
    c.f64 = value;
    return c;
}

Constant Constant::makeClass(uint16_t nameIndex)
{
    Constant c;
    c.tag = Tag::Class;
    c.first = nameIndex;
    return c;
}

Constant Constant::makeString(uint16_t utf8Index)
{
    Constant c;
    c.tag = Tag::String;
    c.first = utf8Index;
    return c;
}

Constant Constant::makeNameAndType(uint16_t nameIndex, uint16_t descriptorIndex)
{
    Constant c;
    c.tag = Tag::NameAndType;
    c.first = nameIndex;
    c.second = descriptorIndex;
    return c;
}

Constant Constant::makeMethodref(uint16_t classIndex, uint16_t nameAndTypeIndex)
{
    Constant c;
    c.tag = Tag::Methodref;
    c.first = classIndex;
    c.second = nameAndTypeIndex;
    return c;
}

bool Constant::isWide() const
{
    return tag == Tag::Long || tag == Tag::Double;
}

const char *toString(Constant::Tag tag)
{
    switch (tag)
    {
        case Constant::Tag::Utf8:
            return "Utf8";
        case Constant::Tag::Integer:
            return "Integer";
        case Constant::Tag::Float:
            return "Float";
        case Constant::Tag::Long:
            return "Long";
        case Constant::Tag::Double:
            return "Double";
        case Constant::Tag::Class:
            return "Class";
        case Constant::Tag::String:
            return "String";
        case Constant::Tag::Fieldref:
            return "Fieldref";
        case Constant::Tag::Methodref:
            return "Methodref";
        case Constant::Tag::InterfaceMethodref:
            return "InterfaceMethodref";
        case Constant::Tag::NameAndType:
            return "NameAndType";
    }
    return "<unknown>";
}

std::string toString(const Constant &constant)
{
    std::ostringstream os;
    os << toString(constant.tag) << '(';
    switch (constant.tag)
    {
        case Constant::Tag::Utf8:
            os << '"' << constant.utf8 << '"';
            break;
        case Constant::Tag::Integer:
            os << constant.i32;
            break;
        case Constant::Tag::Float:
            os << constant.f32;
            break;
        case Constant::Tag::Long:
            os << constant.i64;
            break;
        case Constant::Tag::Double:
            os << constant.f64;
            break;
        case Constant::Tag::Class:
        case Constant::Tag::String:
            os << '#' << constant.first;
            break;
        default:
            os << '#' << constant.first << ", #" << constant.second;
            break;
    }
    os << ')';
    return os.str();
}

uint16_t ConstantPool::add(Constant constant)
{
    const auto index = static_cast<uint16_t>(slots_.size());
    const bool wide = constant.isWide();
    slots_.emplace_back(std::move(constant));
    if (wide)
        slots_.emplace_back(std::nullopt);
    return index;
}

uint16_t ConstantPool::addUtf8(std::string value)
{
    return add(Constant::makeUtf8(std::move(value)));
}

uint16_t ConstantPool::addInteger(int32_t value)
{
    return add(Constant::makeInteger(value));
}

uint16_t ConstantPool::addFloat(float value)
{
    return add(Constant::makeFloat(value));
}

uint16_t ConstantPool::addLong(int64_t value)
{
    return add(Constant::makeLong(value));
}

uint16_t ConstantPool::addDouble(double value)
{
    return add(Constant::makeDouble(value));
}

uint16_t ConstantPool::addClass(std::string name)
{
    const uint16_t nameIndex = addUtf8(std::move(name));
    return add(Constant::makeClass(nameIndex));
}

const Constant *ConstantPool::get(uint16_t index) const
{
    if (index >= slots_.size() || !slots_[index])
        return nullptr;
    return &*slots_[index];
}

Expected<const Constant *> ConstantPool::tryGet(uint16_t index) const
{
    if (const Constant *constant = get(index))
        return constant;
    return ClassFileError{ClassFileError::Kind::InvalidConstantPoolIndex,
                          "invalid constant pool index " + std::to_string(index)};
}

Expected<std::string> ConstantPool::tryGetUtf8(uint16_t index) const
{
    auto constant = tryGet(index);
    if (!constant)
        return constant.error();
    if (constant.value()->tag != Constant::Tag::Utf8)
    {
        return ClassFileError{ClassFileError::Kind::InvalidConstantPoolIndexType,
                              "expected Utf8 at index " + std::to_string(index) + ", found " +
                                  toString(*constant.value())};
    }
    return constant.value()->utf8;
}

Expected<std::string> ConstantPool::tryGetClassName(uint16_t index) const
{
    auto constant = tryGet(index);
    if (!constant)
        return constant.error();
    if (constant.value()->tag != Constant::Tag::Class)
    {
        return ClassFileError{ClassFileError::Kind::InvalidConstantPoolIndexType,
                              "expected Class at index " + std::to_string(index) + ", found " +
                                  toString(*constant.value())};
    }
    return tryGetUtf8(constant.value()->first);
}

size_t ConstantPool::size() const
{
    return slots_.size();
}

} // namespace cortado::classfile
