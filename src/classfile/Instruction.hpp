//===----------------------------------------------------------------------===//
//
// Part of the Cortado project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the Instruction struct, the decoded form of one JVM
// bytecode instruction as produced by the class-file reader.
//
// The reader has already resolved the variable-length encoding:
// - Branch operands hold absolute *instruction indices*, not byte offsets.
// - tableswitch/lookupswitch offsets stay relative to the switch's own index,
//   mirroring the JVM encoding.
// - Index operands that were preceded by the `wide` prefix carry wide = true;
//   there is no separate Wide instruction in a decoded stream.
//
// Instructions are plain value types. Factory functions construct the common
// shapes so callers cannot mix up operand slots.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "classfile/Opcode.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace cortado::classfile
{

/// @brief Primitive element type operand of the newarray instruction.
enum class ArrayType : uint8_t
{
    Boolean = 4,
    Char = 5,
    Float = 6,
    Double = 7,
    Byte = 8,
    Short = 9,
    Int = 10,
    Long = 11
};

/// @brief Size in bytes of one element of a primitive array of @p type.
uint32_t elementSize(ArrayType type);

/// @brief Java name of the primitive element type ("int", "boolean", ...).
const char *toString(ArrayType type);

/// @brief One decoded JVM instruction.
struct Instruction
{
    /// Opcode selecting which operand fields are meaningful.
    Opcode opcode = Opcode::Nop;

    /// Set when the local index (and iinc delta) used the wide encoding.
    bool wide = false;

    /// Local index, constant-pool index, immediate value, branch target or
    /// ArrayType, depending on @c opcode.
    int32_t operand = 0;

    /// Signed delta of iinc.
    int32_t increment = 0;

    /// Default offset of tableswitch/lookupswitch, relative to this index.
    int32_t switchDefault = 0;

    /// Lowest match value of tableswitch.
    int32_t switchLow = 0;

    /// Match keys of lookupswitch, sorted ascending.
    std::vector<int32_t> switchKeys;

    /// Jump offsets, relative to this index; parallel to the keys for
    /// lookupswitch, indexed by value - low for tableswitch.
    std::vector<int32_t> switchOffsets;

    /// @brief Construct an instruction without operands.
    static Instruction make(Opcode op);

    /// @brief Construct an instruction with a single operand.
    static Instruction make(Opcode op, int32_t operand);

    /// @brief Construct a wide-prefixed local load/store.
    static Instruction makeWide(Opcode op, uint16_t index);

    /// @brief Construct iinc (or its wide form when @p wide is set).
    static Instruction iinc(uint16_t index, int16_t delta, bool wide = false);

    /// @brief Construct newarray for primitive element @p type.
    static Instruction newarray(ArrayType type);

    /// @brief Construct tableswitch covering [low, low + offsets.size()).
    static Instruction tableswitch(int32_t defaultOffset, int32_t low, std::vector<int32_t> offsets);

    /// @brief Construct lookupswitch from (key, offset) pairs.
    static Instruction lookupswitch(int32_t defaultOffset,
                                    std::vector<std::pair<int32_t, int32_t>> pairs);

    /// @brief True when the instruction is one of the branch opcodes whose
    ///        operand is a target index.
    [[nodiscard]] bool hasBranchTarget() const;
};

/// @brief Render @p instr as "mnemonic operand..." for traces and errors.
std::string toString(const Instruction &instr);

} // namespace cortado::classfile
