//===----------------------------------------------------------------------===//
//
// Part of the Cortado project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: jit/OperandStack.hpp
// Purpose: Compile-time simulation of the JVM operand stack holding typed
//          LLVM values.
// Key invariants: Depth never exceeds max_stack; every entry records the
//                 kind it was pushed with and pops check it.
// Ownership/Lifetime: Holds non-owning llvm::Value pointers that belong to
//                     the function under construction.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "classfile/Opcode.hpp"
#include "jit/Error.hpp"
#include "jit/TypeStack.hpp"

#include <llvm/IR/LLVMContext.h>
#include <llvm/IR/Type.h>
#include <llvm/IR/Value.h>

#include <cstddef>
#include <vector>

namespace cortado::jit
{

/// @brief LLVM type used for values of @p kind; references are i64.
llvm::Type *irType(llvm::LLVMContext &context, StackKind kind);

/// @brief One operand-stack slot.
struct StackValue
{
    StackKind kind;
    llvm::Value *value;
};

/// @brief Typed operand stack used while translating one block.
class OperandStack
{
  public:
    explicit OperandStack(size_t maxDepth);

    /// @brief Replace the contents, e.g. with a block's parameters.
    void reset(std::vector<StackValue> values);

    Expected<void> push(StackKind kind, llvm::Value *value);
    Expected<void> pushInt(llvm::Value *value);
    Expected<void> pushLong(llvm::Value *value);
    Expected<void> pushFloat(llvm::Value *value);
    Expected<void> pushDouble(llvm::Value *value);
    Expected<void> pushReference(llvm::Value *value);

    /// @brief Pop a value that must have kind @p expected.
    /// @return OperandStackUnderflow when empty; InvalidValue on a kind
    ///         mismatch.
    Expected<llvm::Value *> pop(StackKind expected);
    Expected<llvm::Value *> popInt();
    Expected<llvm::Value *> popLong();
    Expected<llvm::Value *> popFloat();
    Expected<llvm::Value *> popDouble();
    Expected<llvm::Value *> popReference();

    /// @brief Apply pop, pop2, dup*, dup2* or swap.
    Expected<void> shuffle(classfile::Opcode op);

    [[nodiscard]] size_t depth() const
    {
        return values_.size();
    }

    /// @brief Live values, bottom first; this is the block-argument order.
    [[nodiscard]] const std::vector<StackValue> &values() const
    {
        return values_;
    }

    [[nodiscard]] StackShape shape() const;

  private:
    std::vector<StackValue> values_;
    size_t maxDepth_;
};

} // namespace cortado::jit
