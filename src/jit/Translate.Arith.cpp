//===----------------------------------------------------------------------===//
//
// Part of the Cortado project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: jit/Translate.Arith.cpp
// Purpose: Lower integer and floating-point arithmetic, bitwise logic and
//          shifts with exact JVM semantics.
// Key invariants: Integer arithmetic wraps; shift amounts are masked to 5
//                 (int) or 6 (long) bits; MIN / -1 yields MIN and MIN % -1
//                 yields 0; a zero divisor traps with ArithmeticException.
// Ownership/Lifetime: Operates on the translator's borrowed builder.
//
//===----------------------------------------------------------------------===//

#include "jit/InstructionTranslator.hpp"

#include <llvm/IR/Constants.h>

#include <cstdint>

namespace cortado::jit
{

using classfile::Instruction;
using classfile::Opcode;

namespace
{

/// Operand kind of a typed arithmetic opcode (i*, l*, f*, d*).
StackKind arithmeticKind(Opcode op)
{
    switch (op)
    {
        case Opcode::Ladd:
        case Opcode::Lsub:
        case Opcode::Lmul:
        case Opcode::Ldiv:
        case Opcode::Lrem:
        case Opcode::Lneg:
        case Opcode::Land:
        case Opcode::Lor:
        case Opcode::Lxor:
        case Opcode::Lshl:
        case Opcode::Lshr:
        case Opcode::Lushr:
            return StackKind::Long;
        case Opcode::Fadd:
        case Opcode::Fsub:
        case Opcode::Fmul:
        case Opcode::Fdiv:
        case Opcode::Frem:
        case Opcode::Fneg:
            return StackKind::Float;
        case Opcode::Dadd:
        case Opcode::Dsub:
        case Opcode::Dmul:
        case Opcode::Ddiv:
        case Opcode::Drem:
        case Opcode::Dneg:
            return StackKind::Double;
        default:
            return StackKind::Int;
    }
}

} // namespace

Expected<void> InstructionTranslator::translateArithmetic(const Instruction &instr)
{
    auto &b = ctx_.builder;
    const Opcode op = instr.opcode;
    const StackKind kind = arithmeticKind(op);

    if (op == Opcode::Ineg || op == Opcode::Lneg || op == Opcode::Fneg || op == Opcode::Dneg)
    {
        auto value = stack_.pop(kind);
        if (!value)
            return value.error();
        llvm::Value *neg = (kind == StackKind::Int || kind == StackKind::Long)
                               ? b.CreateNeg(value.value())
                               : b.CreateFNeg(value.value());
        return stack_.push(kind, neg);
    }

    auto rhs = stack_.pop(kind);
    if (!rhs)
        return rhs.error();
    auto lhs = stack_.pop(kind);
    if (!lhs)
        return lhs.error();
    llvm::Value *a = lhs.value();
    llvm::Value *c = rhs.value();

    llvm::Value *result = nullptr;
    switch (op)
    {
        case Opcode::Iadd:
        case Opcode::Ladd:
            result = b.CreateAdd(a, c);
            break;
        case Opcode::Isub:
        case Opcode::Lsub:
            result = b.CreateSub(a, c);
            break;
        case Opcode::Imul:
        case Opcode::Lmul:
            result = b.CreateMul(a, c);
            break;
        case Opcode::Iand:
        case Opcode::Land:
            result = b.CreateAnd(a, c);
            break;
        case Opcode::Ior:
        case Opcode::Lor:
            result = b.CreateOr(a, c);
            break;
        case Opcode::Ixor:
        case Opcode::Lxor:
            result = b.CreateXor(a, c);
            break;
        case Opcode::Fadd:
        case Opcode::Dadd:
            result = b.CreateFAdd(a, c);
            break;
        case Opcode::Fsub:
        case Opcode::Dsub:
            result = b.CreateFSub(a, c);
            break;
        case Opcode::Fmul:
        case Opcode::Dmul:
            result = b.CreateFMul(a, c);
            break;
        case Opcode::Fdiv:
        case Opcode::Ddiv:
            result = b.CreateFDiv(a, c);
            break;
        case Opcode::Frem:
        case Opcode::Drem:
            // LLVM frem has fmod semantics: the result takes the dividend's sign.
            result = b.CreateFRem(a, c);
            break;
        default:
            return Error::internal(std::string("not an arithmetic opcode: ") +
                                   classfile::toString(op));
    }
    return stack_.push(kind, result);
}

Expected<void> InstructionTranslator::translateDivRem(const Instruction &instr)
{
    auto &b = ctx_.builder;
    const Opcode op = instr.opcode;
    const StackKind kind = arithmeticKind(op);
    const bool isLong = kind == StackKind::Long;

    auto rhs = stack_.pop(kind);
    if (!rhs)
        return rhs.error();
    auto lhs = stack_.pop(kind);
    if (!lhs)
        return lhs.error();
    llvm::Value *dividend = lhs.value();
    llvm::Value *divisor = rhs.value();
    auto *type = llvm::cast<llvm::IntegerType>(irType(context(), kind));

    trapIf(b.CreateICmpEQ(divisor, llvm::ConstantInt::get(type, 0)), TrapCode::ArithmeticException);

    // sdiv/srem on MIN / -1 is undefined in LLVM; divide by 1 instead, which
    // gives MIN for the quotient and 0 for the remainder as the JVM requires.
    llvm::Value *minValue = isLong ? b.getInt64(static_cast<uint64_t>(INT64_MIN))
                                   : b.getInt32(static_cast<uint32_t>(INT32_MIN));
    llvm::Value *overflow =
        b.CreateAnd(b.CreateICmpEQ(dividend, minValue),
                    b.CreateICmpEQ(divisor, llvm::ConstantInt::getSigned(type, -1)));
    llvm::Value *safeDivisor = b.CreateSelect(overflow, llvm::ConstantInt::get(type, 1), divisor);

    llvm::Value *result = (op == Opcode::Idiv || op == Opcode::Ldiv)
                              ? b.CreateSDiv(dividend, safeDivisor)
                              : b.CreateSRem(dividend, safeDivisor);
    return stack_.push(kind, result);
}

Expected<void> InstructionTranslator::translateShift(const Instruction &instr)
{
    auto &b = ctx_.builder;
    const Opcode op = instr.opcode;
    const StackKind kind = arithmeticKind(op);

    auto amount = stack_.popInt();
    if (!amount)
        return amount.error();
    auto value = stack_.pop(kind);
    if (!value)
        return value.error();

    llvm::Value *shift = nullptr;
    if (kind == StackKind::Long)
        shift = b.CreateZExt(b.CreateAnd(amount.value(), b.getInt32(63)), b.getInt64Ty());
    else
        shift = b.CreateAnd(amount.value(), b.getInt32(31));

    llvm::Value *result = nullptr;
    switch (op)
    {
        case Opcode::Ishl:
        case Opcode::Lshl:
            result = b.CreateShl(value.value(), shift);
            break;
        case Opcode::Ishr:
        case Opcode::Lshr:
            result = b.CreateAShr(value.value(), shift);
            break;
        default:
            result = b.CreateLShr(value.value(), shift);
            break;
    }
    return stack_.push(kind, result);
}

} // namespace cortado::jit
