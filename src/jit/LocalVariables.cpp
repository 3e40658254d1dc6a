//===----------------------------------------------------------------------===//
//
// Part of the Cortado project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Lazily created allocas for JVM locals. A slot reused with different kinds
// gets a separate alloca per kind, which keeps every access well typed.
//
//===----------------------------------------------------------------------===//

#include "jit/LocalVariables.hpp"

#include "jit/OperandStack.hpp"

namespace cortado::jit
{

LocalVariables::LocalVariables(llvm::Function &function, size_t maxLocals)
    : function_(function), maxLocals_(maxLocals)
{
}

Expected<llvm::AllocaInst *> LocalVariables::slot(uint32_t index, StackKind kind)
{
    if (auto r = checkLocalIndex(index, kind, maxLocals_); !r)
        return r.error();

    auto key = std::make_pair(index, kind);
    auto it = slots_.find(key);
    if (it != slots_.end())
        return it->second;

    llvm::BasicBlock &entry = function_.getEntryBlock();
    llvm::IRBuilder<> allocaBuilder(&entry, entry.begin());
    llvm::AllocaInst *alloca = allocaBuilder.CreateAlloca(
        irType(function_.getContext(), kind), nullptr,
        "local" + std::to_string(index) + "." + toString(kind));
    slots_.emplace(key, alloca);
    return alloca;
}

Expected<llvm::Value *> LocalVariables::load(llvm::IRBuilder<> &builder,
                                             uint32_t index,
                                             StackKind kind)
{
    auto ptr = slot(index, kind);
    if (!ptr)
        return ptr.error();
    llvm::AllocaInst *alloca = ptr.value();
    return builder.CreateLoad(alloca->getAllocatedType(), alloca);
}

Expected<void> LocalVariables::store(llvm::IRBuilder<> &builder,
                                     uint32_t index,
                                     StackKind kind,
                                     llvm::Value *value)
{
    auto ptr = slot(index, kind);
    if (!ptr)
        return ptr.error();
    builder.CreateStore(value, ptr.value());
    return {};
}

} // namespace cortado::jit
