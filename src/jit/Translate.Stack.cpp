//===----------------------------------------------------------------------===//
//
// Part of the Cortado project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: jit/Translate.Stack.cpp
// Purpose: Lower operand-stack shuffles and monitor instructions.
// Key invariants: Shuffles emit no IR; they only rearrange value handles.
// Ownership/Lifetime: Operates on the translator's borrowed builder.
//
//===----------------------------------------------------------------------===//

#include "jit/InstructionTranslator.hpp"

namespace cortado::jit
{

using classfile::Instruction;

Expected<void> InstructionTranslator::translateStack(const Instruction &instr)
{
    return stack_.shuffle(instr.opcode);
}

/// Compiled code runs without other Java threads observing its objects, so
/// monitors reduce to the null check the JVM performs on entry and exit.
Expected<void> InstructionTranslator::translateMonitor(const Instruction &)
{
    auto ref = stack_.popReference();
    if (!ref)
        return ref.error();
    nullCheck(ref.value());
    return {};
}

} // namespace cortado::jit
