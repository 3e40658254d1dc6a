//===----------------------------------------------------------------------===//
//
// Part of the Cortado project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: jit/Translate.Array.cpp
// Purpose: Lower primitive array allocation, length and element access.
// Key invariants: An array is an 8-byte signed length header followed by the
//                 elements; element i lives at base + 8 + i * elementSize.
//                 Indices are checked unsigned against the header.
// Ownership/Lifetime: Storage comes from cortado_jit_allocate and is owned by
//                     the heap behind it.
//
//===----------------------------------------------------------------------===//

#include "jit/InstructionTranslator.hpp"

namespace cortado::jit
{

using classfile::ArrayType;
using classfile::Instruction;
using classfile::Opcode;

namespace
{

constexpr uint64_t kArrayHeaderSize = 8;

/// Memory representation of one element of an array access opcode.
struct ElementAccess
{
    StackKind kind;      ///< Operand stack kind of the value.
    unsigned bits;       ///< Width in memory.
    bool isFloat;
    bool signExtend;     ///< Narrow integer loads.
};

ElementAccess elementAccess(Opcode op)
{
    switch (op)
    {
        case Opcode::Laload:
        case Opcode::Lastore:
            return {StackKind::Long, 64, false, false};
        case Opcode::Faload:
        case Opcode::Fastore:
            return {StackKind::Float, 32, true, false};
        case Opcode::Daload:
        case Opcode::Dastore:
            return {StackKind::Double, 64, true, false};
        case Opcode::Baload:
        case Opcode::Bastore:
            return {StackKind::Int, 8, false, true};
        case Opcode::Caload:
        case Opcode::Castore:
            return {StackKind::Int, 16, false, false};
        case Opcode::Saload:
        case Opcode::Sastore:
            return {StackKind::Int, 16, false, true};
        default:
            return {StackKind::Int, 32, false, false};
    }
}

llvm::Type *memoryType(llvm::LLVMContext &context, const ElementAccess &access)
{
    if (access.isFloat)
        return irType(context, access.kind);
    return llvm::Type::getIntNTy(context, access.bits);
}

} // namespace

Expected<void> InstructionTranslator::translateNewArray(const Instruction &instr)
{
    auto &b = ctx_.builder;
    const auto type = static_cast<ArrayType>(instr.operand);
    if (instr.operand < static_cast<int32_t>(ArrayType::Boolean) ||
        instr.operand > static_cast<int32_t>(ArrayType::Long))
    {
        return Error::make(ErrorKind::InvalidValue,
                           "invalid newarray element type " + std::to_string(instr.operand));
    }

    auto count = stack_.popInt();
    if (!count)
        return count.error();
    trapIf(b.CreateICmpSLT(count.value(), b.getInt32(0)), TrapCode::NegativeArraySizeException);

    llvm::Value *length = b.CreateSExt(count.value(), b.getInt64Ty());
    llvm::Value *total = b.CreateAdd(b.getInt64(kArrayHeaderSize),
                                     b.CreateMul(length, b.getInt64(classfile::elementSize(type))));

    llvm::FunctionCallee allocate = ctx_.module.getOrInsertFunction(
        kAllocateSymbol, llvm::FunctionType::get(b.getInt64Ty(), {b.getInt64Ty()}, false));
    llvm::Value *array = b.CreateCall(allocate, {total});
    trapIf(b.CreateICmpEQ(array, b.getInt64(0)), TrapCode::OutOfMemoryError);

    b.CreateStore(length, b.CreateIntToPtr(array, b.getInt64Ty()->getPointerTo()));
    return stack_.pushReference(array);
}

Expected<void> InstructionTranslator::translateArrayLength()
{
    auto &b = ctx_.builder;
    auto array = stack_.popReference();
    if (!array)
        return array.error();
    nullCheck(array.value());

    llvm::Value *header = b.CreateIntToPtr(array.value(), b.getInt64Ty()->getPointerTo());
    llvm::Value *length = b.CreateLoad(b.getInt64Ty(), header);
    return stack_.pushInt(b.CreateTrunc(length, b.getInt32Ty()));
}

Expected<void> InstructionTranslator::translateArrayLoad(const Instruction &instr)
{
    auto &b = ctx_.builder;
    const ElementAccess access = elementAccess(instr.opcode);

    auto index = stack_.popInt();
    if (!index)
        return index.error();
    auto array = stack_.popReference();
    if (!array)
        return array.error();

    nullCheck(array.value());
    llvm::Value *offset = b.CreateSExt(index.value(), b.getInt64Ty());
    llvm::Value *length =
        b.CreateLoad(b.getInt64Ty(), b.CreateIntToPtr(array.value(), b.getInt64Ty()->getPointerTo()));
    trapIf(b.CreateICmpUGE(offset, length), TrapCode::ArrayIndexOutOfBoundsException);

    llvm::Type *memType = memoryType(context(), access);
    llvm::Value *address = b.CreateAdd(
        array.value(),
        b.CreateAdd(b.getInt64(kArrayHeaderSize), b.CreateMul(offset, b.getInt64(access.bits / 8))));
    llvm::Value *element = b.CreateLoad(memType, b.CreateIntToPtr(address, memType->getPointerTo()));

    if (access.kind == StackKind::Int && access.bits < 32)
    {
        element = access.signExtend ? b.CreateSExt(element, b.getInt32Ty())
                                    : b.CreateZExt(element, b.getInt32Ty());
    }
    return stack_.push(access.kind, element);
}

Expected<void> InstructionTranslator::translateArrayStore(const Instruction &instr)
{
    auto &b = ctx_.builder;
    const ElementAccess access = elementAccess(instr.opcode);

    auto value = stack_.pop(access.kind);
    if (!value)
        return value.error();
    auto index = stack_.popInt();
    if (!index)
        return index.error();
    auto array = stack_.popReference();
    if (!array)
        return array.error();

    nullCheck(array.value());
    llvm::Value *offset = b.CreateSExt(index.value(), b.getInt64Ty());
    llvm::Value *length =
        b.CreateLoad(b.getInt64Ty(), b.CreateIntToPtr(array.value(), b.getInt64Ty()->getPointerTo()));
    trapIf(b.CreateICmpUGE(offset, length), TrapCode::ArrayIndexOutOfBoundsException);

    llvm::Type *memType = memoryType(context(), access);
    llvm::Value *element = value.value();
    if (access.kind == StackKind::Int && access.bits < 32)
        element = b.CreateTrunc(element, memType);

    llvm::Value *address = b.CreateAdd(
        array.value(),
        b.CreateAdd(b.getInt64(kArrayHeaderSize), b.CreateMul(offset, b.getInt64(access.bits / 8))));
    b.CreateStore(element, b.CreateIntToPtr(address, memType->getPointerTo()));
    return {};
}

} // namespace cortado::jit
