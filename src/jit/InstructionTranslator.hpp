//===----------------------------------------------------------------------===//
//
// Part of the Cortado project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the InstructionTranslator, which lowers the instructions
// of one basic block to LLVM IR against a simulated operand stack.
//
// Each CFG block is pre-declared as an LLVM block carrying one phi per entry
// stack slot (its block parameters). When the translator leaves a block it
// passes the live stack, bottom slot first, as the incoming values of the
// successor's phis, one set per emitted edge.
//
// Runtime failures (division by zero, bad array index, null array, negative
// array size, heap exhaustion) enter the innermost exception handler that
// covers the failing instruction and catches the matching throwable. With no
// such handler they branch to per-function trap blocks that return a
// TrapCode. The caught exception is an opaque non-null reference holding the
// trap code; compiled code never materializes a Java exception object.
//
// The opcode families are implemented in Translate.*.cpp.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "classfile/ClassFile.hpp"
#include "jit/ControlFlowBuilder.hpp"
#include "jit/Error.hpp"
#include "jit/LocalVariables.hpp"
#include "jit/OperandStack.hpp"
#include "jit/Runtime.hpp"
#include "jit/Signature.hpp"
#include "jit/Trace.hpp"

#include <llvm/IR/BasicBlock.h>
#include <llvm/IR/IRBuilder.h>
#include <llvm/IR/Instructions.h>
#include <llvm/IR/Module.h>

#include <cstddef>
#include <map>
#include <utility>
#include <vector>

namespace cortado::jit
{

/// @brief LLVM block emitted for a reachable CFG block.
struct EmittedBlock
{
    llvm::BasicBlock *block = nullptr;
    std::vector<llvm::PHINode *> params; ///< One per entry stack slot, bottom first.
};

/// @brief Everything a translator borrows from the compile in progress.
struct TranslationContext
{
    llvm::Module &module;
    llvm::Function &function;
    llvm::IRBuilder<> &builder;
    const ControlFlowGraph &cfg;
    std::vector<EmittedBlock> &blocks;
    LocalVariables &locals;
    const classfile::CodeAttribute &code;
    const classfile::ConstantPool &constants;
    const Signature &signature;
    llvm::Value *result; ///< JitValue record receiving the return value.
    TraceSink &trace;
};

/// @brief True when the translator can lower @p op.
bool isSupportedOpcode(classfile::Opcode op);

/// @brief Lowers CFG blocks to LLVM IR.
class InstructionTranslator
{
  public:
    explicit InstructionTranslator(TranslationContext ctx);

    /// @brief Translate block @p id, including its terminating branch.
    /// @pre The block is reachable and its LLVM block is declared.
    Expected<void> translateBlock(size_t id);

  private:
    Expected<void> translate(size_t pc, const classfile::Instruction &instr);

    // Translate.Const.cpp
    Expected<void> translateConstant(const classfile::Instruction &instr);

    // Translate.Locals.cpp
    Expected<void> translateLocal(const classfile::Instruction &instr);
    Expected<void> translateIinc(const classfile::Instruction &instr);

    // Translate.Stack.cpp
    Expected<void> translateStack(const classfile::Instruction &instr);
    Expected<void> translateMonitor(const classfile::Instruction &instr);

    // Translate.Arith.cpp
    Expected<void> translateArithmetic(const classfile::Instruction &instr);
    Expected<void> translateDivRem(const classfile::Instruction &instr);
    Expected<void> translateShift(const classfile::Instruction &instr);

    // Translate.Convert.cpp
    Expected<void> translateConversion(const classfile::Instruction &instr);
    Expected<void> translateComparison(const classfile::Instruction &instr);

    // Translate.Control.cpp
    Expected<void> translateBranch(size_t pc, const classfile::Instruction &instr);
    Expected<void> translateSwitch(size_t pc, const classfile::Instruction &instr);
    Expected<void> translateReturn(const classfile::Instruction &instr);

    // Translate.Array.cpp
    Expected<void> translateNewArray(const classfile::Instruction &instr);
    Expected<void> translateArrayLength();
    Expected<void> translateArrayLoad(const classfile::Instruction &instr);
    Expected<void> translateArrayStore(const classfile::Instruction &instr);

    /// @brief Register an edge from the current block to the block starting
    ///        at @p pc, feeding the live stack into its parameters.
    /// @return The LLVM block to branch to.
    Expected<llvm::BasicBlock *> edgeTo(size_t pc);

    /// @brief Emit an unconditional branch to the block starting at @p pc.
    Expected<void> jumpTo(size_t pc);

    /// @brief Raise @p code when @p cond holds and continue in a fresh block
    ///        otherwise. The raise enters the handler covering the current
    ///        instruction, or leaves the function through a trap block.
    void trapIf(llvm::Value *cond, TrapCode code);

    /// @brief Trap with NullPointerException when @p ref is zero.
    void nullCheck(llvm::Value *ref);

    llvm::BasicBlock *trapBlock(TrapCode code);

    /// @brief Block that passes the exception for @p code to handler block
    ///        @p handler.
    llvm::BasicBlock *catchBlock(size_t handler, TrapCode code);

    llvm::LLVMContext &context()
    {
        return ctx_.module.getContext();
    }

    TranslationContext ctx_;
    OperandStack stack_;
    std::map<TrapCode, llvm::BasicBlock *> traps_;
    std::map<std::pair<size_t, TrapCode>, llvm::BasicBlock *> catches_;
    size_t pc_ = 0; ///< Instruction being translated.
};

} // namespace cortado::jit
