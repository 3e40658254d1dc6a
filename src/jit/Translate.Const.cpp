//===----------------------------------------------------------------------===//
//
// Part of the Cortado project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: jit/Translate.Const.cpp
// Purpose: Lower constant-pushing opcodes, including ldc constant-pool loads.
// Key invariants: ldc/ldc_w accept Integer and Float entries only; ldc2_w
//                 accepts Long and Double.
// Ownership/Lifetime: Operates on the translator's borrowed builder.
//
//===----------------------------------------------------------------------===//

#include "jit/InstructionTranslator.hpp"

#include <llvm/IR/Constants.h>

namespace cortado::jit
{

using classfile::Constant;
using classfile::Instruction;
using classfile::Opcode;

Expected<void> InstructionTranslator::translateConstant(const Instruction &instr)
{
    auto &b = ctx_.builder;
    switch (instr.opcode)
    {
        case Opcode::AconstNull:
            return stack_.pushReference(b.getInt64(0));
        case Opcode::IconstM1:
        case Opcode::Iconst0:
        case Opcode::Iconst1:
        case Opcode::Iconst2:
        case Opcode::Iconst3:
        case Opcode::Iconst4:
        case Opcode::Iconst5:
        {
            const int32_t value =
                static_cast<int32_t>(instr.opcode) - static_cast<int32_t>(Opcode::Iconst0);
            return stack_.pushInt(b.getInt32(static_cast<uint32_t>(value)));
        }
        case Opcode::Lconst0:
            return stack_.pushLong(b.getInt64(0));
        case Opcode::Lconst1:
            return stack_.pushLong(b.getInt64(1));
        case Opcode::Fconst0:
            return stack_.pushFloat(llvm::ConstantFP::get(b.getFloatTy(), 0.0));
        case Opcode::Fconst1:
            return stack_.pushFloat(llvm::ConstantFP::get(b.getFloatTy(), 1.0));
        case Opcode::Fconst2:
            return stack_.pushFloat(llvm::ConstantFP::get(b.getFloatTy(), 2.0));
        case Opcode::Dconst0:
            return stack_.pushDouble(llvm::ConstantFP::get(b.getDoubleTy(), 0.0));
        case Opcode::Dconst1:
            return stack_.pushDouble(llvm::ConstantFP::get(b.getDoubleTy(), 1.0));
        case Opcode::Bipush:
        case Opcode::Sipush:
            return stack_.pushInt(b.getInt32(static_cast<uint32_t>(instr.operand)));
        default:
            break;
    }

    // ldc, ldc_w, ldc2_w
    auto kind = constantKind(ctx_.constants, instr);
    if (!kind)
        return kind.error();
    const Constant *constant = ctx_.constants.get(static_cast<uint16_t>(instr.operand));
    switch (kind.value())
    {
        case StackKind::Int:
            return stack_.pushInt(b.getInt32(static_cast<uint32_t>(constant->i32)));
        case StackKind::Long:
            return stack_.pushLong(b.getInt64(static_cast<uint64_t>(constant->i64)));
        case StackKind::Float:
            return stack_.pushFloat(llvm::ConstantFP::get(b.getFloatTy(), constant->f32));
        case StackKind::Double:
            return stack_.pushDouble(llvm::ConstantFP::get(b.getDoubleTy(), constant->f64));
        case StackKind::Reference:
            break;
    }
    return Error::internal("unexpected constant kind " + std::string(toString(kind.value())));
}

} // namespace cortado::jit
