//===----------------------------------------------------------------------===//
//
// Part of the Cortado project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: jit/Translate.Locals.cpp
// Purpose: Lower local-variable loads, stores and iinc.
// Key invariants: The _0.._3 forms address locals 0 through 3; wide forms
//                 carry their full index in the operand.
// Ownership/Lifetime: Operates on the translator's borrowed builder.
//
//===----------------------------------------------------------------------===//

#include "jit/InstructionTranslator.hpp"

namespace cortado::jit
{

using classfile::Instruction;
using classfile::Opcode;

namespace
{

struct LocalOp
{
    StackKind kind;
    uint32_t index;
    bool store;
};

std::optional<LocalOp> decodeLocal(const Instruction &instr)
{
    const auto index = static_cast<uint32_t>(instr.operand);
    switch (instr.opcode)
    {
        case Opcode::Iload:
            return LocalOp{StackKind::Int, index, false};
        case Opcode::Lload:
            return LocalOp{StackKind::Long, index, false};
        case Opcode::Fload:
            return LocalOp{StackKind::Float, index, false};
        case Opcode::Dload:
            return LocalOp{StackKind::Double, index, false};
        case Opcode::Aload:
            return LocalOp{StackKind::Reference, index, false};
        case Opcode::Istore:
            return LocalOp{StackKind::Int, index, true};
        case Opcode::Lstore:
            return LocalOp{StackKind::Long, index, true};
        case Opcode::Fstore:
            return LocalOp{StackKind::Float, index, true};
        case Opcode::Dstore:
            return LocalOp{StackKind::Double, index, true};
        case Opcode::Astore:
            return LocalOp{StackKind::Reference, index, true};
        default:
            break;
    }

    static constexpr StackKind kinds[] = {StackKind::Int,
                                          StackKind::Long,
                                          StackKind::Float,
                                          StackKind::Double,
                                          StackKind::Reference};
    const auto byte = static_cast<unsigned>(instr.opcode);
    const auto loads = static_cast<unsigned>(Opcode::Iload0);
    const auto stores = static_cast<unsigned>(Opcode::Istore0);
    if (byte >= loads && byte <= static_cast<unsigned>(Opcode::Aload3))
        return LocalOp{kinds[(byte - loads) / 4], (byte - loads) % 4, false};
    if (byte >= stores && byte <= static_cast<unsigned>(Opcode::Astore3))
        return LocalOp{kinds[(byte - stores) / 4], (byte - stores) % 4, true};
    return std::nullopt;
}

} // namespace

Expected<void> InstructionTranslator::translateLocal(const Instruction &instr)
{
    const auto op = decodeLocal(instr);
    if (!op)
        return Error::make(ErrorKind::UnsupportedInstruction, toString(instr));

    if (!op->store)
    {
        auto value = ctx_.locals.load(ctx_.builder, op->index, op->kind);
        if (!value)
            return value.error();
        return stack_.push(op->kind, value.value());
    }

    auto value = stack_.pop(op->kind);
    if (!value)
        return value.error();
    return ctx_.locals.store(ctx_.builder, op->index, op->kind, value.value());
}

Expected<void> InstructionTranslator::translateIinc(const Instruction &instr)
{
    const auto index = static_cast<uint32_t>(instr.operand);
    auto current = ctx_.locals.load(ctx_.builder, index, StackKind::Int);
    if (!current)
        return current.error();
    llvm::Value *sum = ctx_.builder.CreateAdd(
        current.value(), ctx_.builder.getInt32(static_cast<uint32_t>(instr.increment)));
    return ctx_.locals.store(ctx_.builder, index, StackKind::Int, sum);
}

} // namespace cortado::jit
