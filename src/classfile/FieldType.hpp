//===----------------------------------------------------------------------===//
//
// Part of the Cortado project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: classfile/FieldType.hpp
// Purpose: Field and method descriptor model with a strict parser.
// Key invariants: Parsing consumes the whole descriptor or fails.
// Ownership/Lifetime: Value types; Array owns its component type.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "classfile/ClassFileError.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cortado::classfile
{

/// @brief Primitive descriptor letters.
enum class BaseType : char
{
    Byte = 'B',
    Char = 'C',
    Double = 'D',
    Float = 'F',
    Int = 'I',
    Long = 'J',
    Short = 'S',
    Boolean = 'Z'
};

/// @brief Parsed field descriptor: a primitive, a class, or an array.
struct FieldType
{
    enum class Kind
    {
        Base,
        Object,
        Array
    };

    Kind kind = Kind::Base;
    BaseType base = BaseType::Int;          ///< Valid when kind == Base.
    std::string className;                  ///< Valid when kind == Object.
    std::shared_ptr<const FieldType> component; ///< Valid when kind == Array.

    static FieldType makeBase(BaseType type);
    static FieldType makeObject(std::string name);
    static FieldType makeArray(FieldType componentType);

    /// @brief Render back to descriptor syntax.
    [[nodiscard]] std::string descriptor() const;
};

/// @brief Parsed method descriptor; a void return leaves @c returnType empty.
struct MethodDescriptor
{
    std::vector<FieldType> parameters;
    std::optional<FieldType> returnType;
};

/// @brief Parse a single field descriptor such as "I" or "[Ljava/lang/String;".
Expected<FieldType> parseFieldType(std::string_view text);

/// @brief Parse a method descriptor such as "(IJ)V".
Expected<MethodDescriptor> parseMethodDescriptor(std::string_view text);

} // namespace cortado::classfile
