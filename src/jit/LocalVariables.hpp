//===----------------------------------------------------------------------===//
//
// Part of the Cortado project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: jit/LocalVariables.hpp
// Purpose: Stack slots backing the JVM local variable array.
// Key invariants: One alloca per (index, kind) pair, created lazily in the
//                 function's entry block; mem2reg promotes them to SSA.
// Ownership/Lifetime: Allocas belong to the function under construction.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "jit/Error.hpp"
#include "jit/TypeStack.hpp"

#include <llvm/IR/Function.h>
#include <llvm/IR/IRBuilder.h>
#include <llvm/IR/Instructions.h>

#include <cstdint>
#include <map>
#include <utility>

namespace cortado::jit
{

/// @brief Local variable storage for one compiled method.
class LocalVariables
{
  public:
    LocalVariables(llvm::Function &function, size_t maxLocals);

    /// @brief Load local @p index as @p kind at the builder's position.
    Expected<llvm::Value *> load(llvm::IRBuilder<> &builder, uint32_t index, StackKind kind);

    /// @brief Store @p value of @p kind into local @p index.
    Expected<void> store(llvm::IRBuilder<> &builder, uint32_t index, StackKind kind, llvm::Value *value);

    [[nodiscard]] size_t size() const
    {
        return maxLocals_;
    }

  private:
    Expected<llvm::AllocaInst *> slot(uint32_t index, StackKind kind);

    llvm::Function &function_;
    size_t maxLocals_;
    std::map<std::pair<uint32_t, StackKind>, llvm::AllocaInst *> slots_;
};

} // namespace cortado::jit
