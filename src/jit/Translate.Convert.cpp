//===----------------------------------------------------------------------===//
//
// Part of the Cortado project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: jit/Translate.Convert.cpp
// Purpose: Lower primitive conversions and three-way comparisons.
// Key invariants: Floating to integer conversions saturate and map NaN to 0;
//                 fcmpl/dcmpl yield -1 and fcmpg/dcmpg yield +1 when either
//                 operand is NaN.
// Ownership/Lifetime: Operates on the translator's borrowed builder.
//
//===----------------------------------------------------------------------===//

#include "jit/InstructionTranslator.hpp"

#include <llvm/IR/Intrinsics.h>

namespace cortado::jit
{

using classfile::Instruction;
using classfile::Opcode;

namespace
{

struct Conversion
{
    StackKind from;
    StackKind to;
};

Conversion conversionKinds(Opcode op)
{
    switch (op)
    {
        case Opcode::I2l:
            return {StackKind::Int, StackKind::Long};
        case Opcode::I2f:
            return {StackKind::Int, StackKind::Float};
        case Opcode::I2d:
            return {StackKind::Int, StackKind::Double};
        case Opcode::L2i:
            return {StackKind::Long, StackKind::Int};
        case Opcode::L2f:
            return {StackKind::Long, StackKind::Float};
        case Opcode::L2d:
            return {StackKind::Long, StackKind::Double};
        case Opcode::F2i:
            return {StackKind::Float, StackKind::Int};
        case Opcode::F2l:
            return {StackKind::Float, StackKind::Long};
        case Opcode::F2d:
            return {StackKind::Float, StackKind::Double};
        case Opcode::D2i:
            return {StackKind::Double, StackKind::Int};
        case Opcode::D2l:
            return {StackKind::Double, StackKind::Long};
        case Opcode::D2f:
            return {StackKind::Double, StackKind::Float};
        default:
            return {StackKind::Int, StackKind::Int};
    }
}

} // namespace

Expected<void> InstructionTranslator::translateConversion(const Instruction &instr)
{
    auto &b = ctx_.builder;
    const Opcode op = instr.opcode;
    const Conversion kinds = conversionKinds(op);
    llvm::Type *target = irType(context(), kinds.to);

    auto popped = stack_.pop(kinds.from);
    if (!popped)
        return popped.error();
    llvm::Value *value = popped.value();

    llvm::Value *result = nullptr;
    switch (op)
    {
        case Opcode::I2l:
            result = b.CreateSExt(value, target);
            break;
        case Opcode::L2i:
            result = b.CreateTrunc(value, target);
            break;
        case Opcode::I2f:
        case Opcode::I2d:
        case Opcode::L2f:
        case Opcode::L2d:
            result = b.CreateSIToFP(value, target);
            break;
        case Opcode::F2d:
            result = b.CreateFPExt(value, target);
            break;
        case Opcode::D2f:
            result = b.CreateFPTrunc(value, target);
            break;
        case Opcode::F2i:
        case Opcode::F2l:
        case Opcode::D2i:
        case Opcode::D2l:
            result = b.CreateIntrinsic(llvm::Intrinsic::fptosi_sat, {target, value->getType()}, {value});
            break;
        case Opcode::I2b:
            result = b.CreateSExt(b.CreateTrunc(value, b.getInt8Ty()), target);
            break;
        case Opcode::I2c:
            result = b.CreateZExt(b.CreateTrunc(value, b.getInt16Ty()), target);
            break;
        case Opcode::I2s:
            result = b.CreateSExt(b.CreateTrunc(value, b.getInt16Ty()), target);
            break;
        default:
            return Error::internal(std::string("not a conversion opcode: ") + classfile::toString(op));
    }
    return stack_.push(kinds.to, result);
}

Expected<void> InstructionTranslator::translateComparison(const Instruction &instr)
{
    auto &b = ctx_.builder;
    const Opcode op = instr.opcode;
    StackKind kind = StackKind::Long;
    if (op == Opcode::Fcmpl || op == Opcode::Fcmpg)
        kind = StackKind::Float;
    else if (op == Opcode::Dcmpl || op == Opcode::Dcmpg)
        kind = StackKind::Double;

    auto rhs = stack_.pop(kind);
    if (!rhs)
        return rhs.error();
    auto lhs = stack_.pop(kind);
    if (!lhs)
        return lhs.error();
    llvm::Value *a = lhs.value();
    llvm::Value *c = rhs.value();

    llvm::Value *minusOne = b.getInt32(static_cast<uint32_t>(-1));
    llvm::Value *zero = b.getInt32(0);
    llvm::Value *one = b.getInt32(1);

    llvm::Value *result = nullptr;
    if (kind == StackKind::Long)
    {
        llvm::Value *greater = b.CreateZExt(b.CreateICmpSGT(a, c), b.getInt32Ty());
        llvm::Value *less = b.CreateZExt(b.CreateICmpSLT(a, c), b.getInt32Ty());
        result = b.CreateSub(greater, less);
    }
    else if (op == Opcode::Fcmpl || op == Opcode::Dcmpl)
    {
        // Ordered predicates are false for NaN, leaving -1.
        llvm::Value *equalOrLess = b.CreateSelect(b.CreateFCmpOEQ(a, c), zero, minusOne);
        result = b.CreateSelect(b.CreateFCmpOGT(a, c), one, equalOrLess);
    }
    else
    {
        // Ordered predicates are false for NaN, leaving +1.
        llvm::Value *equalOrGreater = b.CreateSelect(b.CreateFCmpOEQ(a, c), zero, one);
        result = b.CreateSelect(b.CreateFCmpOLT(a, c), minusOne, equalOrGreater);
    }
    return stack_.pushInt(result);
}

} // namespace cortado::jit
