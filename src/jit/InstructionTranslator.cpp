//===----------------------------------------------------------------------===//
//
// Part of the Cortado project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: jit/InstructionTranslator.cpp
// Purpose: Block driver, opcode dispatch, edge wiring and trap blocks for the
//          bytecode to LLVM IR translator.
// Key invariants: Every emitted edge adds exactly one incoming value to each
//                 phi of its target; the stack leaving a block matches the
//                 target's entry shape.
// Ownership/Lifetime: Borrows all IR objects from the TranslationContext.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include "jit/InstructionTranslator.hpp"

namespace cortado::jit
{

using classfile::Instruction;
using classfile::Opcode;

bool isSupportedOpcode(Opcode op)
{
    switch (op)
    {
        case Opcode::Getstatic:
        case Opcode::Putstatic:
        case Opcode::Getfield:
        case Opcode::Putfield:
        case Opcode::Invokevirtual:
        case Opcode::Invokespecial:
        case Opcode::Invokestatic:
        case Opcode::Invokeinterface:
        case Opcode::Invokedynamic:
        case Opcode::New:
        case Opcode::Anewarray:
        case Opcode::Multianewarray:
        case Opcode::Athrow:
        case Opcode::Checkcast:
        case Opcode::Instanceof:
        case Opcode::Aaload:
        case Opcode::Aastore:
        case Opcode::Areturn:
        case Opcode::Jsr:
        case Opcode::JsrW:
        case Opcode::Ret:
        case Opcode::Wide:
        case Opcode::Breakpoint:
        case Opcode::Impdep1:
        case Opcode::Impdep2:
            return false;
        default:
            return true;
    }
}

InstructionTranslator::InstructionTranslator(TranslationContext ctx)
    : ctx_(ctx), stack_(ctx.code.maxStack)
{
}

Expected<void> InstructionTranslator::translateBlock(size_t id)
{
    const BasicBlock &block = ctx_.cfg.block(id);
    const EmittedBlock &emitted = ctx_.blocks[id];
    if (!emitted.block || emitted.params.size() != block.entryStack.size())
        return Error::internal("block at pc " + std::to_string(block.startPc) + " was not declared");

    ctx_.trace.onBlock(block);
    ctx_.builder.SetInsertPoint(emitted.block);

    std::vector<StackValue> entry;
    entry.reserve(emitted.params.size());
    for (size_t i = 0; i < emitted.params.size(); ++i)
        entry.push_back(StackValue{block.entryStack[i], emitted.params[i]});
    stack_.reset(std::move(entry));

    for (size_t pc = block.startPc; pc < block.endPc; ++pc)
    {
        const Instruction &instr = ctx_.code.code[pc];
        ctx_.trace.onInstruction(pc, instr, stack_.depth());
        pc_ = pc;
        if (auto r = translate(pc, instr); !r)
            return r;
    }

    const Opcode last = ctx_.code.code[block.endPc - 1].opcode;
    if (classfile::isConditionalBranch(last) || classfile::endsFallThrough(last))
        return {};
    return jumpTo(block.endPc);
}

Expected<void> InstructionTranslator::translate(size_t pc, const Instruction &instr)
{
    const Opcode op = instr.opcode;
    if (!isSupportedOpcode(op))
        return Error::make(ErrorKind::UnsupportedInstruction, toString(instr));

    switch (op)
    {
        case Opcode::Nop:
            return {};

        case Opcode::AconstNull:
        case Opcode::IconstM1:
        case Opcode::Iconst0:
        case Opcode::Iconst1:
        case Opcode::Iconst2:
        case Opcode::Iconst3:
        case Opcode::Iconst4:
        case Opcode::Iconst5:
        case Opcode::Lconst0:
        case Opcode::Lconst1:
        case Opcode::Fconst0:
        case Opcode::Fconst1:
        case Opcode::Fconst2:
        case Opcode::Dconst0:
        case Opcode::Dconst1:
        case Opcode::Bipush:
        case Opcode::Sipush:
        case Opcode::Ldc:
        case Opcode::LdcW:
        case Opcode::Ldc2W:
            return translateConstant(instr);

        case Opcode::Iinc:
            return translateIinc(instr);

        case Opcode::Pop:
        case Opcode::Pop2:
        case Opcode::Dup:
        case Opcode::DupX1:
        case Opcode::DupX2:
        case Opcode::Dup2:
        case Opcode::Dup2X1:
        case Opcode::Dup2X2:
        case Opcode::Swap:
            return translateStack(instr);

        case Opcode::Monitorenter:
        case Opcode::Monitorexit:
            return translateMonitor(instr);

        case Opcode::Idiv:
        case Opcode::Ldiv:
        case Opcode::Irem:
        case Opcode::Lrem:
            return translateDivRem(instr);

        case Opcode::Ishl:
        case Opcode::Lshl:
        case Opcode::Ishr:
        case Opcode::Lshr:
        case Opcode::Iushr:
        case Opcode::Lushr:
            return translateShift(instr);

        case Opcode::Iadd:
        case Opcode::Ladd:
        case Opcode::Fadd:
        case Opcode::Dadd:
        case Opcode::Isub:
        case Opcode::Lsub:
        case Opcode::Fsub:
        case Opcode::Dsub:
        case Opcode::Imul:
        case Opcode::Lmul:
        case Opcode::Fmul:
        case Opcode::Dmul:
        case Opcode::Fdiv:
        case Opcode::Ddiv:
        case Opcode::Frem:
        case Opcode::Drem:
        case Opcode::Ineg:
        case Opcode::Lneg:
        case Opcode::Fneg:
        case Opcode::Dneg:
        case Opcode::Iand:
        case Opcode::Land:
        case Opcode::Ior:
        case Opcode::Lor:
        case Opcode::Ixor:
        case Opcode::Lxor:
            return translateArithmetic(instr);

        case Opcode::I2l:
        case Opcode::I2f:
        case Opcode::I2d:
        case Opcode::L2i:
        case Opcode::L2f:
        case Opcode::L2d:
        case Opcode::F2i:
        case Opcode::F2l:
        case Opcode::F2d:
        case Opcode::D2i:
        case Opcode::D2l:
        case Opcode::D2f:
        case Opcode::I2b:
        case Opcode::I2c:
        case Opcode::I2s:
            return translateConversion(instr);

        case Opcode::Lcmp:
        case Opcode::Fcmpl:
        case Opcode::Fcmpg:
        case Opcode::Dcmpl:
        case Opcode::Dcmpg:
            return translateComparison(instr);

        case Opcode::Tableswitch:
        case Opcode::Lookupswitch:
            return translateSwitch(pc, instr);

        case Opcode::Ireturn:
        case Opcode::Lreturn:
        case Opcode::Freturn:
        case Opcode::Dreturn:
        case Opcode::Return:
            return translateReturn(instr);

        case Opcode::Newarray:
            return translateNewArray(instr);
        case Opcode::Arraylength:
            return translateArrayLength();
        case Opcode::Iaload:
        case Opcode::Laload:
        case Opcode::Faload:
        case Opcode::Daload:
        case Opcode::Baload:
        case Opcode::Caload:
        case Opcode::Saload:
            return translateArrayLoad(instr);
        case Opcode::Iastore:
        case Opcode::Lastore:
        case Opcode::Fastore:
        case Opcode::Dastore:
        case Opcode::Bastore:
        case Opcode::Castore:
        case Opcode::Sastore:
            return translateArrayStore(instr);

        default:
            break;
    }

    if (classfile::isConditionalBranch(op) || classfile::isUnconditionalBranch(op))
        return translateBranch(pc, instr);
    return translateLocal(instr);
}

Expected<llvm::BasicBlock *> InstructionTranslator::edgeTo(size_t pc)
{
    const auto id = ctx_.cfg.blockAt(pc);
    if (!id)
        return Error::internal("no block starts at pc " + std::to_string(pc));
    const BasicBlock &target = ctx_.cfg.block(*id);
    EmittedBlock &emitted = ctx_.blocks[*id];
    if (!emitted.block)
        return Error::internal("branch to undeclared block at pc " + std::to_string(pc));

    const auto &values = stack_.values();
    if (values.size() != emitted.params.size() || stack_.shape() != target.entryStack)
    {
        return Error::internal("operand stack " + toString(stack_.shape()) + " does not match " +
                               toString(target.entryStack) + " entering pc " +
                               std::to_string(pc));
    }

    llvm::BasicBlock *from = ctx_.builder.GetInsertBlock();
    for (size_t i = 0; i < values.size(); ++i)
        emitted.params[i]->addIncoming(values[i].value, from);
    return emitted.block;
}

Expected<void> InstructionTranslator::jumpTo(size_t pc)
{
    auto target = edgeTo(pc);
    if (!target)
        return target.error();
    ctx_.builder.CreateBr(target.value());
    return {};
}

llvm::BasicBlock *InstructionTranslator::trapBlock(TrapCode code)
{
    auto it = traps_.find(code);
    if (it != traps_.end())
        return it->second;

    llvm::BasicBlock *block = llvm::BasicBlock::Create(context(), "trap", &ctx_.function);
    llvm::IRBuilder<> trap(block);
    trap.CreateRet(trap.getInt32(static_cast<int32_t>(code)));
    traps_.emplace(code, block);
    return block;
}

llvm::BasicBlock *InstructionTranslator::catchBlock(size_t handler, TrapCode code)
{
    auto key = std::make_pair(handler, code);
    auto it = catches_.find(key);
    if (it != catches_.end())
        return it->second;

    EmittedBlock &target = ctx_.blocks[handler];
    llvm::BasicBlock *block = llvm::BasicBlock::Create(context(), "catch", &ctx_.function);
    llvm::IRBuilder<> raise(block);
    raise.CreateBr(target.block);
    target.params.front()->addIncoming(raise.getInt64(static_cast<uint64_t>(code)), block);
    catches_.emplace(key, block);
    return block;
}

void InstructionTranslator::trapIf(llvm::Value *cond, TrapCode code)
{
    const auto handler = ctx_.cfg.handlerFor(pc_, code);
    llvm::BasicBlock *raise = handler ? catchBlock(*handler, code) : trapBlock(code);

    llvm::BasicBlock *cont = llvm::BasicBlock::Create(context(), "cont", &ctx_.function);
    ctx_.builder.CreateCondBr(cond, raise, cont);
    ctx_.builder.SetInsertPoint(cont);
}

void InstructionTranslator::nullCheck(llvm::Value *ref)
{
    llvm::Value *isNull = ctx_.builder.CreateICmpEQ(ref, ctx_.builder.getInt64(0));
    trapIf(isNull, TrapCode::NullPointerException);
}

} // namespace cortado::jit
