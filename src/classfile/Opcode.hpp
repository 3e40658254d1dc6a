//===----------------------------------------------------------------------===//
//
// Part of the Cortado project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: classfile/Opcode.hpp
// Purpose: Enumerates JVM bytecode opcodes and classifies their control flow.
// Key invariants: Enumerator values equal the opcode byte encoding.
// Ownership/Lifetime: Not applicable.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>

namespace cortado::classfile
{

/// @brief Every opcode defined by the JVM instruction set.
enum class Opcode : uint8_t
{
#define CLASSFILE_OPCODE(NAME, MNEMONIC, BYTE) NAME = BYTE,
#include "classfile/Opcode.def"
#undef CLASSFILE_OPCODE
};

/// @brief Convert opcode @p op to its lowercase JVM mnemonic.
/// @return Pointer to static storage; "<unknown>" for unassigned bytes.
const char *toString(Opcode op);

/// @brief True for the if* and if_*cmp* family, including ifnull/ifnonnull.
bool isConditionalBranch(Opcode op);

/// @brief True for goto and goto_w.
bool isUnconditionalBranch(Opcode op);

/// @brief True for tableswitch and lookupswitch.
bool isSwitch(Opcode op);

/// @brief True for every return opcode, including the void return.
bool isReturn(Opcode op);

/// @brief True when execution never falls through to the next instruction.
bool endsFallThrough(Opcode op);

} // namespace cortado::classfile
