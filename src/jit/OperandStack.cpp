//===----------------------------------------------------------------------===//
//
// Part of the Cortado project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Typed operand stack over LLVM values.
//
//===----------------------------------------------------------------------===//

#include "jit/OperandStack.hpp"

#include <llvm/IR/DerivedTypes.h>

namespace cortado::jit
{

llvm::Type *irType(llvm::LLVMContext &context, StackKind kind)
{
    switch (kind)
    {
        case StackKind::Int:
            return llvm::Type::getInt32Ty(context);
        case StackKind::Long:
        case StackKind::Reference:
            return llvm::Type::getInt64Ty(context);
        case StackKind::Float:
            return llvm::Type::getFloatTy(context);
        case StackKind::Double:
            return llvm::Type::getDoubleTy(context);
    }
    return nullptr;
}

OperandStack::OperandStack(size_t maxDepth) : maxDepth_(maxDepth) {}

void OperandStack::reset(std::vector<StackValue> values)
{
    values_ = std::move(values);
}

Expected<void> OperandStack::push(StackKind kind, llvm::Value *value)
{
    if (values_.size() >= maxDepth_)
    {
        return Error::internal("operand stack depth exceeds max_stack " +
                               std::to_string(maxDepth_));
    }
    values_.push_back(StackValue{kind, value});
    return {};
}

Expected<void> OperandStack::pushInt(llvm::Value *value)
{
    return push(StackKind::Int, value);
}

Expected<void> OperandStack::pushLong(llvm::Value *value)
{
    return push(StackKind::Long, value);
}

Expected<void> OperandStack::pushFloat(llvm::Value *value)
{
    return push(StackKind::Float, value);
}

Expected<void> OperandStack::pushDouble(llvm::Value *value)
{
    return push(StackKind::Double, value);
}

Expected<void> OperandStack::pushReference(llvm::Value *value)
{
    return push(StackKind::Reference, value);
}

Expected<llvm::Value *> OperandStack::pop(StackKind expected)
{
    if (values_.empty())
        return Error::make(ErrorKind::OperandStackUnderflow, "operand stack underflow");
    const StackValue top = values_.back();
    if (top.kind != expected)
        return Error::mismatch(ErrorKind::InvalidValue, toString(expected), toString(top.kind));
    values_.pop_back();
    return top.value;
}

Expected<llvm::Value *> OperandStack::popInt()
{
    return pop(StackKind::Int);
}

Expected<llvm::Value *> OperandStack::popLong()
{
    return pop(StackKind::Long);
}

Expected<llvm::Value *> OperandStack::popFloat()
{
    return pop(StackKind::Float);
}

Expected<llvm::Value *> OperandStack::popDouble()
{
    return pop(StackKind::Double);
}

Expected<llvm::Value *> OperandStack::popReference()
{
    return pop(StackKind::Reference);
}

Expected<void> OperandStack::shuffle(classfile::Opcode op)
{
    auto result =
        applyStackShuffle(op, values_, [](const StackValue &entry) { return entry.kind; });
    if (!result)
        return result;
    if (values_.size() > maxDepth_)
    {
        return Error::internal("operand stack depth exceeds max_stack " +
                               std::to_string(maxDepth_));
    }
    return {};
}

StackShape OperandStack::shape() const
{
    StackShape kinds;
    kinds.reserve(values_.size());
    for (const auto &entry : values_)
        kinds.push_back(entry.kind);
    return kinds;
}

} // namespace cortado::jit
