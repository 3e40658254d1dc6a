//===----------------------------------------------------------------------===//
//
// Part of the Cortado project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: jit/Translate.Control.cpp
// Purpose: Lower conditional and unconditional branches, switches and
//          returns.
// Key invariants: Branch operands are absolute instruction indices; switch
//                 offsets are relative to the switch. A return opcode must
//                 agree with the signature's return kind.
// Ownership/Lifetime: Operates on the translator's borrowed builder.
//
//===----------------------------------------------------------------------===//

#include "jit/InstructionTranslator.hpp"

#include <llvm/IR/Constants.h>

namespace cortado::jit
{

using classfile::Instruction;
using classfile::Opcode;

namespace
{

/// Predicate and operand shape of a conditional branch.
struct Condition
{
    llvm::CmpInst::Predicate predicate;
    StackKind kind;
    bool againstZero; ///< Compares one operand against 0 / null.
};

std::optional<Condition> conditionOf(Opcode op)
{
    using P = llvm::CmpInst::Predicate;
    switch (op)
    {
        case Opcode::Ifeq:
            return Condition{P::ICMP_EQ, StackKind::Int, true};
        case Opcode::Ifne:
            return Condition{P::ICMP_NE, StackKind::Int, true};
        case Opcode::Iflt:
            return Condition{P::ICMP_SLT, StackKind::Int, true};
        case Opcode::Ifge:
            return Condition{P::ICMP_SGE, StackKind::Int, true};
        case Opcode::Ifgt:
            return Condition{P::ICMP_SGT, StackKind::Int, true};
        case Opcode::Ifle:
            return Condition{P::ICMP_SLE, StackKind::Int, true};
        case Opcode::IfIcmpeq:
            return Condition{P::ICMP_EQ, StackKind::Int, false};
        case Opcode::IfIcmpne:
            return Condition{P::ICMP_NE, StackKind::Int, false};
        case Opcode::IfIcmplt:
            return Condition{P::ICMP_SLT, StackKind::Int, false};
        case Opcode::IfIcmpge:
            return Condition{P::ICMP_SGE, StackKind::Int, false};
        case Opcode::IfIcmpgt:
            return Condition{P::ICMP_SGT, StackKind::Int, false};
        case Opcode::IfIcmple:
            return Condition{P::ICMP_SLE, StackKind::Int, false};
        case Opcode::IfAcmpeq:
            return Condition{P::ICMP_EQ, StackKind::Reference, false};
        case Opcode::IfAcmpne:
            return Condition{P::ICMP_NE, StackKind::Reference, false};
        case Opcode::Ifnull:
            return Condition{P::ICMP_EQ, StackKind::Reference, true};
        case Opcode::Ifnonnull:
            return Condition{P::ICMP_NE, StackKind::Reference, true};
        default:
            return std::nullopt;
    }
}

/// Signature return kind a return opcode produces.
Kind returnKindOf(Opcode op)
{
    switch (op)
    {
        case Opcode::Ireturn:
            return Kind::Int32;
        case Opcode::Lreturn:
            return Kind::Int64;
        case Opcode::Freturn:
            return Kind::Float32;
        case Opcode::Dreturn:
            return Kind::Float64;
        default:
            return Kind::Void;
    }
}

} // namespace

Expected<void> InstructionTranslator::translateBranch(size_t pc, const Instruction &instr)
{
    auto &b = ctx_.builder;
    const auto target = static_cast<size_t>(instr.operand);
    if (classfile::isUnconditionalBranch(instr.opcode))
        return jumpTo(target);

    const auto cond = conditionOf(instr.opcode);
    if (!cond)
        return Error::make(ErrorKind::UnsupportedInstruction, toString(instr));

    auto rhs = stack_.pop(cond->kind);
    if (!rhs)
        return rhs.error();
    llvm::Value *lhs = nullptr;
    llvm::Value *right = rhs.value();
    if (cond->againstZero)
    {
        lhs = right;
        right = llvm::ConstantInt::get(irType(context(), cond->kind), 0);
    }
    else
    {
        auto popped = stack_.pop(cond->kind);
        if (!popped)
            return popped.error();
        lhs = popped.value();
    }
    llvm::Value *taken = b.CreateICmp(cond->predicate, lhs, right);

    auto takenBlock = edgeTo(target);
    if (!takenBlock)
        return takenBlock.error();
    auto fallBlock = edgeTo(pc + 1);
    if (!fallBlock)
        return fallBlock.error();
    b.CreateCondBr(taken, takenBlock.value(), fallBlock.value());
    return {};
}

Expected<void> InstructionTranslator::translateSwitch(size_t pc, const Instruction &instr)
{
    auto &b = ctx_.builder;
    auto key = stack_.popInt();
    if (!key)
        return key.error();

    const auto base = static_cast<int64_t>(pc);
    auto defaultBlock = edgeTo(static_cast<size_t>(base + instr.switchDefault));
    if (!defaultBlock)
        return defaultBlock.error();
    llvm::SwitchInst *dispatch = b.CreateSwitch(
        key.value(), defaultBlock.value(), static_cast<unsigned>(instr.switchOffsets.size()));

    for (size_t i = 0; i < instr.switchOffsets.size(); ++i)
    {
        const int32_t match = instr.opcode == Opcode::Tableswitch
                                  ? instr.switchLow + static_cast<int32_t>(i)
                                  : instr.switchKeys[i];
        auto caseBlock = edgeTo(static_cast<size_t>(base + instr.switchOffsets[i]));
        if (!caseBlock)
            return caseBlock.error();
        dispatch->addCase(b.getInt32(static_cast<uint32_t>(match)), caseBlock.value());
    }
    return {};
}

Expected<void> InstructionTranslator::translateReturn(const Instruction &instr)
{
    auto &b = ctx_.builder;
    const Kind kind = returnKindOf(instr.opcode);
    if (kind != ctx_.signature.returnKind)
    {
        return Error::internal(std::string(classfile::toString(instr.opcode)) +
                               " in method returning " + toString(ctx_.signature.returnKind));
    }

    llvm::Value *tagPtr = ctx_.result;
    llvm::Value *payloadPtr = b.CreateBitCast(
        b.CreateConstInBoundsGEP1_64(b.getInt8Ty(), ctx_.result, 8), b.getInt64Ty()->getPointerTo());

    if (kind == Kind::Void)
    {
        b.CreateStore(b.getInt8(static_cast<uint8_t>(JitValueTag::None)), tagPtr);
        b.CreateRet(b.getInt32(static_cast<int32_t>(TrapCode::None)));
        return {};
    }

    const StackKind stackKind = *stackKindOf(kind);
    auto value = stack_.pop(stackKind);
    if (!value)
        return value.error();

    llvm::Value *payload = nullptr;
    JitValueTag tag = JitValueTag::None;
    switch (kind)
    {
        case Kind::Int32:
            tag = JitValueTag::I32;
            payload = b.CreateSExt(value.value(), b.getInt64Ty());
            break;
        case Kind::Int64:
            tag = JitValueTag::I64;
            payload = value.value();
            break;
        case Kind::Float32:
            tag = JitValueTag::F32;
            payload = b.CreateZExt(b.CreateBitCast(value.value(), b.getInt32Ty()), b.getInt64Ty());
            break;
        case Kind::Float64:
            tag = JitValueTag::F64;
            payload = b.CreateBitCast(value.value(), b.getInt64Ty());
            break;
        case Kind::Void:
            break;
    }

    b.CreateStore(b.getInt8(static_cast<uint8_t>(tag)), tagPtr);
    b.CreateStore(payload, payloadPtr);
    b.CreateRet(b.getInt32(static_cast<int32_t>(TrapCode::None)));
    return {};
}

} // namespace cortado::jit
