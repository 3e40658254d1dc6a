// File: tests/jit/test_control_flow.cpp
// Purpose: Verify basic-block partitioning, edges, entry shapes and
//          translation order produced by ControlFlowBuilder.
// Key invariants: Blocks are ordered by start pc; every predecessor of a
//                 block agrees on its entry stack; a handler is reachable only
//                 through a covered instruction that can raise what it catches.
// Ownership/Lifetime: Code attributes and pools outlive the builder.
// Links: src/jit/ControlFlowBuilder.cpp

#include "jit/ControlFlowBuilder.hpp"

#include <gtest/gtest.h>

#include <algorithm>

namespace cortado::jit
{
namespace
{
using classfile::Instruction;
using classfile::Opcode;

Instruction op(Opcode opcode, int32_t operand = 0)
{
    return Instruction::make(opcode, operand);
}

classfile::CodeAttribute makeCode(std::vector<Instruction> instrs,
                                  uint16_t maxLocals = 2,
                                  uint16_t maxStack = 4)
{
    classfile::CodeAttribute code;
    code.maxStack = maxStack;
    code.maxLocals = maxLocals;
    code.code = std::move(instrs);
    return code;
}

LocalShape intParams(size_t params, size_t maxLocals)
{
    LocalShape locals(maxLocals);
    for (size_t i = 0; i < params; ++i)
        locals[i] = StackKind::Int;
    return locals;
}

// max(a, b) with the result merged on the operand stack.
classfile::CodeAttribute maxDiamond()
{
    return makeCode({op(Opcode::Iload0),     // 0
                     op(Opcode::Iload1),     // 1
                     op(Opcode::IfIcmplt, 5), // 2
                     op(Opcode::Iload0),     // 3
                     op(Opcode::Goto, 6),    // 4
                     op(Opcode::Iload1),     // 5
                     op(Opcode::Ireturn)});  // 6
}

TEST(ControlFlow, SingleBlockMethod)
{
    classfile::ConstantPool pool;
    auto code = makeCode({op(Opcode::Iconst3), op(Opcode::Ireturn)}, 0);
    auto cfg = ControlFlowBuilder(code, pool).build({});
    ASSERT_TRUE(cfg) << cfg.error();
    ASSERT_EQ(cfg.value().blocks().size(), 1u);
    const BasicBlock &entry = cfg.value().block(0);
    EXPECT_EQ(entry.startPc, 0u);
    EXPECT_EQ(entry.endPc, 2u);
    EXPECT_TRUE(entry.successors.empty());
    EXPECT_TRUE(entry.reachable);
    EXPECT_EQ(cfg.value().translationOrder(), std::vector<size_t>{0});
}

TEST(ControlFlow, DiamondMergesStackValue)
{
    classfile::ConstantPool pool;
    auto code = maxDiamond();
    auto cfg = ControlFlowBuilder(code, pool).build(intParams(2, 2));
    ASSERT_TRUE(cfg) << cfg.error();
    const auto &blocks = cfg.value().blocks();
    ASSERT_EQ(blocks.size(), 4u);

    EXPECT_EQ(blocks[0].startPc, 0u);
    EXPECT_EQ(blocks[1].startPc, 3u);
    EXPECT_EQ(blocks[2].startPc, 5u);
    EXPECT_EQ(blocks[3].startPc, 6u);

    EXPECT_EQ(blocks[0].successors, (std::vector<size_t>{2, 1}));
    EXPECT_EQ(blocks[1].successors, std::vector<size_t>{3});
    EXPECT_EQ(blocks[2].successors, std::vector<size_t>{3});
    EXPECT_EQ(blocks[3].predecessors.size(), 2u);

    EXPECT_TRUE(blocks[1].entryStack.empty());
    EXPECT_EQ(blocks[3].entryStack, StackShape{StackKind::Int});

    EXPECT_EQ(cfg.value().blockAt(4), std::optional<size_t>(1));
    EXPECT_EQ(cfg.value().blockAt(6), std::optional<size_t>(3));
    EXPECT_FALSE(cfg.value().blockAt(99).has_value());
}

TEST(ControlFlow, ReversePostorderVisitsDefinitionsFirst)
{
    classfile::ConstantPool pool;
    auto code = maxDiamond();
    auto cfg = ControlFlowBuilder(code, pool).build(intParams(2, 2));
    ASSERT_TRUE(cfg);
    const auto &order = cfg.value().translationOrder();
    ASSERT_EQ(order.size(), 4u);
    EXPECT_EQ(order.front(), 0u);
    EXPECT_EQ(order.back(), 3u);
}

TEST(ControlFlow, LoopBackEdgeToEntry)
{
    classfile::ConstantPool pool;
    // while (n != 0) n--; return n;  with the header at pc 0
    auto code = makeCode({op(Opcode::Iload0),   // 0
                          op(Opcode::Ifeq, 4),   // 1
                          Instruction::iinc(0, -1, false), // 2
                          op(Opcode::Goto, 0),   // 3
                          op(Opcode::Iload0),   // 4
                          op(Opcode::Ireturn)}, // 5
                         1);
    auto cfg = ControlFlowBuilder(code, pool).build(intParams(1, 1));
    ASSERT_TRUE(cfg) << cfg.error();
    const auto &blocks = cfg.value().blocks();
    ASSERT_EQ(blocks.size(), 3u);
    EXPECT_EQ(blocks[1].successors, std::vector<size_t>{0});
    const auto &preds = blocks[0].predecessors;
    EXPECT_NE(std::find(preds.begin(), preds.end(), 1u), preds.end());
}

TEST(ControlFlow, SwitchTargetsAreRelativeAndDeduplicated)
{
    classfile::ConstantPool pool;
    auto code = makeCode({op(Opcode::Iload0),                       // 0
                          Instruction::tableswitch(3, 0, {1, 1, 3}), // 1
                          op(Opcode::Iconst1),                      // 2
                          op(Opcode::Ireturn),                      // 3
                          op(Opcode::Iconst2),                      // 4
                          op(Opcode::Ireturn)},                     // 5
                         1);
    auto cfg = ControlFlowBuilder(code, pool).build(intParams(1, 1));
    ASSERT_TRUE(cfg) << cfg.error();
    const auto &blocks = cfg.value().blocks();
    ASSERT_EQ(blocks.size(), 3u);
    EXPECT_EQ(blocks[1].startPc, 2u);
    EXPECT_EQ(blocks[2].startPc, 4u);
    EXPECT_EQ(blocks[0].successors, (std::vector<size_t>{2, 1}));
    EXPECT_EQ(blocks[1].predecessors, std::vector<size_t>{0});
    EXPECT_EQ(blocks[2].predecessors, std::vector<size_t>{0});
}

TEST(ControlFlow, SwitchTargetOutOfRange)
{
    classfile::ConstantPool pool;
    auto code = makeCode({op(Opcode::Iload0),                          // 0
                          Instruction::lookupswitch(1, {{7, 1}, {9, 4}}), // 1
                          op(Opcode::Iconst1),                         // 2
                          op(Opcode::Ireturn)},                        // 3
                         1);
    auto cfg = ControlFlowBuilder(code, pool).build(intParams(1, 1));
    ASSERT_FALSE(cfg);
    EXPECT_EQ(cfg.error().kind, ErrorKind::InvalidBlockAddress);
}

TEST(ControlFlow, InvalidBranchTarget)
{
    classfile::ConstantPool pool;
    auto code = makeCode({op(Opcode::Goto, 7)}, 0);
    auto cfg = ControlFlowBuilder(code, pool).build({});
    ASSERT_FALSE(cfg);
    EXPECT_EQ(cfg.error().kind, ErrorKind::InvalidBlockAddress);

    auto negative = makeCode({op(Opcode::Iconst0), op(Opcode::Ifeq, -1), op(Opcode::Return)}, 0);
    EXPECT_EQ(ControlFlowBuilder(negative, pool).build({}).error().kind,
              ErrorKind::InvalidBlockAddress);
}

TEST(ControlFlow, EmptyCodeIsRejected)
{
    classfile::ConstantPool pool;
    auto code = makeCode({}, 0);
    auto cfg = ControlFlowBuilder(code, pool).build({});
    ASSERT_FALSE(cfg);
    EXPECT_EQ(cfg.error().kind, ErrorKind::InvalidBlockAddress);
}

TEST(ControlFlow, FallingOffTheEndIsRejected)
{
    classfile::ConstantPool pool;
    auto code = makeCode({op(Opcode::Iconst0), op(Opcode::Pop)}, 0);
    auto cfg = ControlFlowBuilder(code, pool).build({});
    ASSERT_FALSE(cfg);
    EXPECT_EQ(cfg.error().kind, ErrorKind::InvalidBlockAddress);
}

TEST(ControlFlow, StackMismatchAtMerge)
{
    classfile::ConstantPool pool;
    // One path leaves an int on the stack, the other a long.
    auto code = makeCode({op(Opcode::Iload0),  // 0
                          op(Opcode::Ifeq, 4),  // 1
                          op(Opcode::Iconst1), // 2
                          op(Opcode::Goto, 5),  // 3
                          op(Opcode::Lconst1), // 4
                          op(Opcode::Pop2),    // 5
                          op(Opcode::Return)}, // 6
                         1);
    auto cfg = ControlFlowBuilder(code, pool).build(intParams(1, 1));
    ASSERT_FALSE(cfg);
    EXPECT_EQ(cfg.error().kind, ErrorKind::InternalError);
    EXPECT_NE(cfg.error().message.find("mismatch"), std::string::npos);
}

TEST(ControlFlow, MaxStackIsEnforced)
{
    classfile::ConstantPool pool;
    auto code = makeCode({op(Opcode::Iconst1), op(Opcode::Iconst2), op(Opcode::Iadd), op(Opcode::Ireturn)},
                         0,
                         1);
    auto cfg = ControlFlowBuilder(code, pool).build({});
    ASSERT_FALSE(cfg);
    EXPECT_EQ(cfg.error().kind, ErrorKind::InternalError);
}

TEST(ControlFlow, LocalsMergeTowardDead)
{
    classfile::ConstantPool pool;
    auto code = makeCode({op(Opcode::Iload0),   // 0
                          op(Opcode::Ifeq, 5),   // 1
                          op(Opcode::Fconst1),  // 2
                          op(Opcode::Fstore1),  // 3
                          op(Opcode::Goto, 7),   // 4
                          op(Opcode::Iconst1),  // 5
                          op(Opcode::Istore1),  // 6
                          op(Opcode::Return)},  // 7
                         2);
    auto cfg = ControlFlowBuilder(code, pool).build(intParams(1, 2));
    ASSERT_TRUE(cfg) << cfg.error();
    auto merge = cfg.value().blockAt(7);
    ASSERT_TRUE(merge.has_value());
    const BasicBlock &block = cfg.value().block(*merge);
    EXPECT_EQ(block.entryLocals[0], StackKind::Int);
    EXPECT_FALSE(block.entryLocals[1].has_value());
}

TEST(ControlFlow, HandlerWithoutTrappingRangeIsUnreachable)
{
    classfile::ConstantPool pool;
    auto code = makeCode({op(Opcode::Iconst1), // 0
                          op(Opcode::Ireturn), // 1
                          op(Opcode::Iconst2), // 2 handler
                          op(Opcode::Ireturn)}, // 3
                         0);
    code.exceptionTable.push_back({0, 2, 2, 0});
    auto cfg = ControlFlowBuilder(code, pool).build({});
    ASSERT_TRUE(cfg) << cfg.error();
    const auto &blocks = cfg.value().blocks();
    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_TRUE(blocks[1].handler);
    EXPECT_FALSE(blocks[1].reachable);
    EXPECT_EQ(cfg.value().translationOrder(), std::vector<size_t>{0});
}

// static int f(int a, int b) { try { return a / b; } catch (Throwable e) { return 0; } }
classfile::CodeAttribute guardedDivision(uint16_t catchType)
{
    auto code = makeCode({op(Opcode::Iload0),  // 0
                          op(Opcode::Iload1),  // 1
                          op(Opcode::Idiv),    // 2
                          op(Opcode::Ireturn), // 3
                          op(Opcode::Astore2), // 4 handler
                          op(Opcode::Iconst0), // 5
                          op(Opcode::Ireturn)}, // 6
                         3);
    code.exceptionTable.push_back({0, 4, 4, catchType});
    return code;
}

TEST(ControlFlow, CoveredDivisionReachesHandler)
{
    classfile::ConstantPool pool;
    auto code = guardedDivision(0);
    auto cfg = ControlFlowBuilder(code, pool).build(intParams(2, 3));
    ASSERT_TRUE(cfg) << cfg.error();
    const auto &blocks = cfg.value().blocks();
    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_TRUE(blocks[1].handler);
    EXPECT_TRUE(blocks[1].reachable);
    EXPECT_EQ(blocks[1].entryStack, StackShape{StackKind::Reference});
    EXPECT_EQ(blocks[1].entryLocals[0], StackKind::Int);
    EXPECT_EQ(blocks[0].exceptionSuccessors, std::vector<size_t>{1});
    EXPECT_TRUE(blocks[0].successors.empty());
    EXPECT_EQ(blocks[1].predecessors, std::vector<size_t>{0});
    EXPECT_EQ(cfg.value().translationOrder(), (std::vector<size_t>{0, 1}));

    EXPECT_EQ(cfg.value().handlerFor(2, TrapCode::ArithmeticException), 1u);
    EXPECT_FALSE(cfg.value().handlerFor(4, TrapCode::ArithmeticException).has_value());
}

TEST(ControlFlow, CatchTypeSelectsHandledTraps)
{
    classfile::ConstantPool pool;
    const uint16_t npe = pool.addClass("java/lang/NullPointerException");
    const uint16_t runtime = pool.addClass("java/lang/RuntimeException");

    auto unrelated = guardedDivision(npe);
    auto cfg = ControlFlowBuilder(unrelated, pool).build(intParams(2, 3));
    ASSERT_TRUE(cfg) << cfg.error();
    EXPECT_FALSE(cfg.value().block(1).reachable);
    EXPECT_FALSE(cfg.value().handlerFor(2, TrapCode::ArithmeticException).has_value());

    auto superclass = guardedDivision(runtime);
    cfg = ControlFlowBuilder(superclass, pool).build(intParams(2, 3));
    ASSERT_TRUE(cfg) << cfg.error();
    EXPECT_TRUE(cfg.value().block(1).reachable);
}

TEST(ControlFlow, MalformedHandlerEntries)
{
    classfile::ConstantPool pool;
    auto empty = guardedDivision(0);
    empty.exceptionTable.front().endPc = 0;
    EXPECT_EQ(ControlFlowBuilder(empty, pool).build(intParams(2, 3)).error().kind,
              ErrorKind::InvalidBlockAddress);

    auto pastEnd = guardedDivision(0);
    pastEnd.exceptionTable.front().endPc = 9;
    EXPECT_EQ(ControlFlowBuilder(pastEnd, pool).build(intParams(2, 3)).error().kind,
              ErrorKind::InvalidBlockAddress);

    auto badCatch = guardedDivision(42);
    auto cfg = ControlFlowBuilder(badCatch, pool).build(intParams(2, 3));
    ASSERT_FALSE(cfg);
    EXPECT_EQ(cfg.error().kind, ErrorKind::ClassFileError);
    EXPECT_TRUE(cfg.error().cause.has_value());
}

TEST(ControlFlow, UnreachableTailMayLeaveTheMethod)
{
    classfile::ConstantPool pool;
    auto fallsOff = makeCode({op(Opcode::Return),  // 0
                              op(Opcode::Iconst0), // 1
                              op(Opcode::Pop)},    // 2
                             0);
    auto cfg = ControlFlowBuilder(fallsOff, pool).build({});
    ASSERT_TRUE(cfg) << cfg.error();
    EXPECT_FALSE(cfg.value().block(1).reachable);
    EXPECT_EQ(cfg.value().translationOrder(), std::vector<size_t>{0});

    auto badGoto = makeCode({op(Opcode::Return), op(Opcode::Goto, 9)}, 0);
    EXPECT_TRUE(ControlFlowBuilder(badGoto, pool).build({}));
}

TEST(ControlFlow, ParameterLayoutMustMatchMaxLocals)
{
    classfile::ConstantPool pool;
    auto code = makeCode({op(Opcode::Return)}, 3);
    auto cfg = ControlFlowBuilder(code, pool).build(intParams(1, 1));
    ASSERT_FALSE(cfg);
    EXPECT_EQ(cfg.error().kind, ErrorKind::InternalError);
}

} // namespace
} // namespace cortado::jit
