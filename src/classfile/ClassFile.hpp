//===----------------------------------------------------------------------===//
//
// Part of the Cortado project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: classfile/ClassFile.hpp
// Purpose: In-memory model of a loaded class: constant pool, methods and
//          their Code attributes.
// Key invariants: Instructions are decoded; branch operands are instruction
//                 indices. max_stack/max_locals were checked by the verifier.
// Ownership/Lifetime: ClassFile owns its methods and constant pool by value.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "classfile/ConstantPool.hpp"
#include "classfile/Instruction.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cortado::classfile
{

/// @brief Method access flag bits.
namespace MethodAccessFlags
{
inline constexpr uint16_t Public = 0x0001;
inline constexpr uint16_t Private = 0x0002;
inline constexpr uint16_t Protected = 0x0004;
inline constexpr uint16_t Static = 0x0008;
inline constexpr uint16_t Final = 0x0010;
inline constexpr uint16_t Synchronized = 0x0020;
inline constexpr uint16_t Native = 0x0100;
inline constexpr uint16_t Abstract = 0x0400;
} // namespace MethodAccessFlags

/// @brief One row of a Code attribute's exception table.
/// @details Program counters are instruction indices; @c endPc is exclusive.
struct ExceptionTableEntry
{
    uint16_t startPc = 0;
    uint16_t endPc = 0;
    uint16_t handlerPc = 0;
    uint16_t catchType = 0; ///< Class constant index, 0 for any.
};

/// @brief Decoded Code attribute.
struct CodeAttribute
{
    uint16_t maxStack = 0;
    uint16_t maxLocals = 0;
    std::vector<Instruction> code;
    std::vector<ExceptionTableEntry> exceptionTable;
};

/// @brief Method declaration with its optional body.
struct Method
{
    uint16_t accessFlags = 0;
    uint16_t nameIndex = 0;
    uint16_t descriptorIndex = 0;
    std::optional<CodeAttribute> code;

    [[nodiscard]] bool isStatic() const
    {
        return (accessFlags & MethodAccessFlags::Static) != 0;
    }
};

/// @brief Loaded class.
struct ClassFile
{
    ConstantPool constantPool;
    uint16_t accessFlags = 0;
    uint16_t thisClass = 0;
    std::vector<Method> methods;

    /// @brief Internal name of this class, e.g. "java/lang/Object".
    [[nodiscard]] Expected<std::string> className() const
    {
        return constantPool.tryGetClassName(thisClass);
    }
};

} // namespace cortado::classfile
