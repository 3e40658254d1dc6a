// File: tests/jit/test_type_stack.cpp
// Purpose: Verify the abstract operand stack used by dataflow, including the
//          category rules of the dup/pop/swap family.
// Key invariants: Shuffles move whole values; a category-2 value may never be
//                 split by a word-counted shuffle.
// Ownership/Lifetime: Stacks and pools are stack-local.
// Links: src/jit/TypeStack.cpp

#include "jit/TypeStack.hpp"

#include <gtest/gtest.h>

namespace cortado::jit
{
namespace
{
using classfile::Instruction;
using classfile::Opcode;
using K = StackKind;

StackShape shuffled(StackShape shape, Opcode op)
{
    TypeStack stack(std::move(shape), 16);
    auto r = stack.shuffle(op);
    EXPECT_TRUE(r) << toString(op);
    return stack.shape();
}

TEST(TypeStack, DupFamilyCategoryOne)
{
    EXPECT_EQ(shuffled({K::Int}, Opcode::Dup), (StackShape{K::Int, K::Int}));
    EXPECT_EQ(shuffled({K::Int, K::Float}, Opcode::DupX1),
              (StackShape{K::Float, K::Int, K::Float}));
    EXPECT_EQ(shuffled({K::Int, K::Int, K::Float}, Opcode::DupX2),
              (StackShape{K::Float, K::Int, K::Int, K::Float}));
    EXPECT_EQ(shuffled({K::Int, K::Float}, Opcode::Dup2),
              (StackShape{K::Int, K::Float, K::Int, K::Float}));
    EXPECT_EQ(shuffled({K::Reference, K::Int, K::Float}, Opcode::Dup2X1),
              (StackShape{K::Int, K::Float, K::Reference, K::Int, K::Float}));
    EXPECT_EQ(shuffled({K::Int, K::Int, K::Float, K::Float}, Opcode::Dup2X2),
              (StackShape{K::Float, K::Float, K::Int, K::Int, K::Float, K::Float}));
    EXPECT_EQ(shuffled({K::Int, K::Float}, Opcode::Swap), (StackShape{K::Float, K::Int}));
}

TEST(TypeStack, DupFamilyCategoryTwo)
{
    EXPECT_EQ(shuffled({K::Long}, Opcode::Dup2), (StackShape{K::Long, K::Long}));
    EXPECT_EQ(shuffled({K::Int, K::Double}, Opcode::Dup2X1),
              (StackShape{K::Double, K::Int, K::Double}));
    EXPECT_EQ(shuffled({K::Long, K::Double}, Opcode::Dup2X2),
              (StackShape{K::Double, K::Long, K::Double}));
    EXPECT_EQ(shuffled({K::Long, K::Int}, Opcode::DupX2),
              (StackShape{K::Int, K::Long, K::Int}));
    EXPECT_EQ(shuffled({K::Int, K::Long}, Opcode::Pop2), (StackShape{K::Int}));
    EXPECT_EQ(shuffled({K::Int, K::Int}, Opcode::Pop2), StackShape{});
}

TEST(TypeStack, ShufflesRejectSplitValues)
{
    TypeStack dupLong({K::Long}, 8);
    auto dup = dupLong.shuffle(Opcode::Dup);
    ASSERT_FALSE(dup);
    EXPECT_EQ(dup.error().kind, ErrorKind::InvalidValue);

    TypeStack popPair({K::Long, K::Int}, 8);
    auto pop2 = popPair.shuffle(Opcode::Pop2);
    ASSERT_FALSE(pop2);
    EXPECT_EQ(pop2.error().kind, ErrorKind::InvalidValue);

    TypeStack swapWide({K::Int, K::Double}, 8);
    EXPECT_FALSE(swapWide.shuffle(Opcode::Swap));
}

TEST(TypeStack, UnderflowAndDepthLimit)
{
    TypeStack empty({}, 2);
    auto pop = empty.popAny();
    ASSERT_FALSE(pop);
    EXPECT_EQ(pop.error().kind, ErrorKind::OperandStackUnderflow);
    EXPECT_EQ(empty.shuffle(Opcode::Dup).error().kind, ErrorKind::OperandStackUnderflow);

    TypeStack full({K::Int, K::Int}, 2);
    auto push = full.push(K::Int);
    ASSERT_FALSE(push);
    EXPECT_EQ(push.error().kind, ErrorKind::InternalError);
    EXPECT_FALSE(full.shuffle(Opcode::Dup));
}

TEST(TypeStack, PopChecksKind)
{
    TypeStack stack({K::Float}, 4);
    auto r = stack.pop(K::Int);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ErrorKind::InvalidValue);
    EXPECT_EQ(r.error().expected, "Int");
    EXPECT_EQ(r.error().actual, "Float");
}

TEST(StackEffect, ConstantsResolveThroughPool)
{
    classfile::ConstantPool pool;
    const uint16_t i = pool.addInteger(1);
    const uint16_t f = pool.addFloat(2.0f);
    const uint16_t l = pool.addLong(3);
    const uint16_t s = pool.addUtf8("str");

    EXPECT_EQ(constantKind(pool, Instruction::make(Opcode::Ldc, i)).value(), K::Int);
    EXPECT_EQ(constantKind(pool, Instruction::make(Opcode::LdcW, f)).value(), K::Float);
    EXPECT_EQ(constantKind(pool, Instruction::make(Opcode::Ldc2W, l)).value(), K::Long);

    auto narrowWide = constantKind(pool, Instruction::make(Opcode::Ldc, l));
    ASSERT_FALSE(narrowWide);
    EXPECT_EQ(narrowWide.error().kind, ErrorKind::InvalidConstant);
    EXPECT_EQ(narrowWide.error().expected, "Integer|Float");

    auto wideNarrow = constantKind(pool, Instruction::make(Opcode::Ldc2W, i));
    ASSERT_FALSE(wideNarrow);
    EXPECT_EQ(wideNarrow.error().expected, "Long|Double");

    EXPECT_EQ(constantKind(pool, Instruction::make(Opcode::Ldc, s)).error().kind,
              ErrorKind::InvalidConstant);
    EXPECT_EQ(constantKind(pool, Instruction::make(Opcode::Ldc, 40)).error().kind,
              ErrorKind::InvalidConstantIndex);
}

TEST(StackEffect, StoresInvalidateOverlappedLocals)
{
    classfile::ConstantPool pool;
    LocalShape locals(4);
    TypeStack stack({K::Long, K::Int}, 8);

    ASSERT_TRUE(applyStackEffect(Instruction::make(Opcode::Istore2), pool, stack, locals));
    ASSERT_TRUE(applyStackEffect(Instruction::make(Opcode::Lstore1), pool, stack, locals));
    EXPECT_EQ(locals[1], K::Long);
    EXPECT_FALSE(locals[2].has_value());

    stack = TypeStack({K::Int}, 8);
    ASSERT_TRUE(applyStackEffect(Instruction::make(Opcode::Istore2), pool, stack, locals));
    EXPECT_FALSE(locals[1].has_value());
    EXPECT_EQ(locals[2], K::Int);
}

TEST(StackEffect, LocalIndexBounds)
{
    classfile::ConstantPool pool;
    LocalShape locals(2);
    TypeStack stack({}, 8);
    auto wideLoad = applyStackEffect(Instruction::make(Opcode::Lload1), pool, stack, locals);
    ASSERT_FALSE(wideLoad);
    EXPECT_EQ(wideLoad.error().kind, ErrorKind::InvalidLocalVariableIndex);

    auto iinc = applyStackEffect(Instruction::iinc(5, 1, false), pool, stack, locals);
    ASSERT_FALSE(iinc);
    EXPECT_EQ(iinc.error().kind, ErrorKind::InvalidLocalVariableIndex);

    EXPECT_TRUE(checkLocalIndex(0, K::Long, 2));
    EXPECT_FALSE(checkLocalIndex(1, K::Long, 2));
}

TEST(StackEffect, UnsupportedOpcode)
{
    classfile::ConstantPool pool;
    LocalShape locals(1);
    TypeStack stack({}, 8);
    auto r = applyStackEffect(Instruction::make(Opcode::Invokestatic, 1), pool, stack, locals);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ErrorKind::UnsupportedInstruction);
}

TEST(StackShape, Renders)
{
    EXPECT_EQ(toString(StackShape{K::Int, K::Long}), "[Int, Long]");
    EXPECT_EQ(toString(StackShape{}), "[]");
    EXPECT_EQ(*stackKindOf(Kind::Float64), K::Double);
    EXPECT_FALSE(stackKindOf(Kind::Void).has_value());
}

} // namespace
} // namespace cortado::jit
