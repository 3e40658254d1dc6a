// File: tests/jit/test_arrays.cpp
// Purpose: Verify primitive array allocation, element access, length and the
//          array-related runtime traps.
// Key invariants: Arrays carry a 64-bit length header followed by densely
//                 packed elements; every access is null- and bounds-checked.
// Ownership/Lifetime: Arrays live in the default JIT heap or in storage the
//                     test hook hands out; tests restore the default hook.
// Links: src/jit/Translate.Array.cpp, src/jit/Runtime.cpp

#include "common/JitTestSupport.hpp"
#include "jit/Runtime.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <cstring>
#include <vector>

namespace cortado::tests
{
namespace
{
using classfile::ArrayType;
using jit::ErrorKind;
using jit::Value;

/// new T[n]; a[i] = v; return a[i];  with n, i in slots 0, 1 and v from slot 2.
std::vector<Instruction> roundTrip(ArrayType type, Opcode loadValue, Opcode ret, Opcode store, Opcode load)
{
    return {op(Opcode::Iload0),
            Instruction::newarray(type),
            op(Opcode::Astore, 5),
            op(Opcode::Aload, 5),
            op(Opcode::Iload1),
            op(loadValue),
            op(store),
            op(Opcode::Aload, 5),
            op(Opcode::Iload1),
            op(load),
            op(ret)};
}

TEST(Arrays, IntElements)
{
    auto fn = compileOrFail("(III)I",
                            roundTrip(ArrayType::Int, Opcode::Iload2, Opcode::Ireturn, Opcode::Iastore,
                                      Opcode::Iaload));
    ASSERT_TRUE(fn);
    EXPECT_EQ(runOrFail(*fn, {Value::i32(4), Value::i32(3), Value::i32(-77)}), Value::i32(-77));
}

TEST(Arrays, LongAndDoubleElements)
{
    auto longs = compileOrFail("(IIJ)J",
                               roundTrip(ArrayType::Long, Opcode::Lload2, Opcode::Lreturn, Opcode::Lastore,
                                         Opcode::Laload));
    ASSERT_TRUE(longs);
    EXPECT_EQ(runOrFail(*longs, {Value::i32(2), Value::i32(1), Value::i64(1LL << 62)}),
              Value::i64(1LL << 62));

    auto doubles = compileOrFail("(IID)D",
                                 roundTrip(ArrayType::Double, Opcode::Dload2, Opcode::Dreturn,
                                           Opcode::Dastore, Opcode::Daload));
    ASSERT_TRUE(doubles);
    EXPECT_EQ(runOrFail(*doubles, {Value::i32(3), Value::i32(0), Value::f64(-0.125)}), Value::f64(-0.125));

    auto floats = compileOrFail("(IIF)F",
                                roundTrip(ArrayType::Float, Opcode::Fload2, Opcode::Freturn,
                                          Opcode::Fastore, Opcode::Faload));
    ASSERT_TRUE(floats);
    EXPECT_EQ(runOrFail(*floats, {Value::i32(1), Value::i32(0), Value::f32(3.5f)}), Value::f32(3.5f));
}

TEST(Arrays, NarrowElementsExtendOnLoad)
{
    auto bytes = compileOrFail("(III)I",
                               roundTrip(ArrayType::Byte, Opcode::Iload2, Opcode::Ireturn, Opcode::Bastore,
                                         Opcode::Baload));
    auto chars = compileOrFail("(III)I",
                               roundTrip(ArrayType::Char, Opcode::Iload2, Opcode::Ireturn, Opcode::Castore,
                                         Opcode::Caload));
    auto shorts = compileOrFail("(III)I",
                                roundTrip(ArrayType::Short, Opcode::Iload2, Opcode::Ireturn,
                                          Opcode::Sastore, Opcode::Saload));
    auto booleans = compileOrFail("(III)I",
                                  roundTrip(ArrayType::Boolean, Opcode::Iload2, Opcode::Ireturn,
                                            Opcode::Bastore, Opcode::Baload));
    ASSERT_TRUE(bytes && chars && shorts && booleans);
    EXPECT_EQ(runOrFail(*bytes, {Value::i32(2), Value::i32(1), Value::i32(0x180)}), Value::i32(-128));
    EXPECT_EQ(runOrFail(*chars, {Value::i32(2), Value::i32(1), Value::i32(-1)}), Value::i32(0xffff));
    EXPECT_EQ(runOrFail(*shorts, {Value::i32(2), Value::i32(1), Value::i32(0xffff)}), Value::i32(-1));
    EXPECT_EQ(runOrFail(*booleans, {Value::i32(1), Value::i32(0), Value::i32(1)}), Value::i32(1));
}

TEST(Arrays, NewArrayIsZeroed)
{
    auto fn = compileOrFail("(I)J",
                            {op(Opcode::Bipush, 16),
                             Instruction::newarray(ArrayType::Long),
                             op(Opcode::Iload0),
                             op(Opcode::Laload),
                             op(Opcode::Lreturn)});
    ASSERT_TRUE(fn);
    for (int i = 0; i < 16; ++i)
        EXPECT_EQ(runOrFail(*fn, {Value::i32(i)}), Value::i64(0));
}

TEST(Arrays, Length)
{
    auto fn = compileOrFail("(I)I",
                            {op(Opcode::Iload0),
                             Instruction::newarray(ArrayType::Short),
                             op(Opcode::Arraylength),
                             op(Opcode::Ireturn)});
    ASSERT_TRUE(fn);
    EXPECT_EQ(runOrFail(*fn, {Value::i32(0)}), Value::i32(0));
    EXPECT_EQ(runOrFail(*fn, {Value::i32(1234)}), Value::i32(1234));
}

TEST(Arrays, SumOfSquaresLoop)
{
    // int[] a = new int[n]; for (i = 0; i < n; i++) a[i] = i * i;
    // int s = 0; while (i > 0) { i--; s += a[i]; } return s;
    auto fn = compileOrFail("(I)I",
                            {op(Opcode::Iload0),                   // 0
                             Instruction::newarray(ArrayType::Int), // 1
                             op(Opcode::Astore1),                  // 2
                             op(Opcode::Iconst0),                  // 3
                             op(Opcode::Istore2),                  // 4
                             op(Opcode::Iload2),                   // 5
                             op(Opcode::Iload0),                   // 6
                             op(Opcode::IfIcmpge, 16),             // 7
                             op(Opcode::Aload1),                   // 8
                             op(Opcode::Iload2),                   // 9
                             op(Opcode::Iload2),                   // 10
                             op(Opcode::Iload2),                   // 11
                             op(Opcode::Imul),                     // 12
                             op(Opcode::Iastore),                  // 13
                             Instruction::iinc(2, 1, false),       // 14
                             op(Opcode::Goto, 5),                  // 15
                             op(Opcode::Iconst0),                  // 16
                             op(Opcode::Istore3),                  // 17
                             op(Opcode::Iload2),                   // 18
                             op(Opcode::Ifle, 28),                 // 19
                             Instruction::iinc(2, -1, false),      // 20
                             op(Opcode::Iload3),                   // 21
                             op(Opcode::Aload1),                   // 22
                             op(Opcode::Iload2),                   // 23
                             op(Opcode::Iaload),                   // 24
                             op(Opcode::Iadd),                     // 25
                             op(Opcode::Istore3),                  // 26
                             op(Opcode::Goto, 18),                 // 27
                             op(Opcode::Iload3),                   // 28
                             op(Opcode::Ireturn)});                // 29
    ASSERT_TRUE(fn);
    EXPECT_EQ(runOrFail(*fn, {Value::i32(4)}), Value::i32(14));
    EXPECT_EQ(runOrFail(*fn, {Value::i32(0)}), Value::i32(0));
    EXPECT_EQ(runOrFail(*fn, {Value::i32(10)}), Value::i32(285));
}

TEST(Arrays, NegativeSizeTraps)
{
    auto fn = compileOrFail("(I)I",
                            {op(Opcode::Iload0),
                             Instruction::newarray(ArrayType::Int),
                             op(Opcode::Arraylength),
                             op(Opcode::Ireturn)});
    ASSERT_TRUE(fn);
    auto result = fn->execute({Value::i32(-1)});
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind, ErrorKind::RuntimeException);
    EXPECT_EQ(result.error().message, "java/lang/NegativeArraySizeException");
}

TEST(Arrays, IndexOutOfBoundsTraps)
{
    auto fn = compileOrFail("(II)I",
                            {op(Opcode::Iload0),
                             Instruction::newarray(ArrayType::Int),
                             op(Opcode::Iload1),
                             op(Opcode::Iaload),
                             op(Opcode::Ireturn)});
    ASSERT_TRUE(fn);
    for (int32_t index : {3, 100, -1})
    {
        auto result = fn->execute({Value::i32(3), Value::i32(index)});
        ASSERT_FALSE(result) << index;
        EXPECT_EQ(result.error().message, "java/lang/ArrayIndexOutOfBoundsException");
    }
    EXPECT_EQ(runOrFail(*fn, {Value::i32(3), Value::i32(2)}), Value::i32(0));

    auto store = compileOrFail("(I)V",
                               {op(Opcode::Iconst2),
                                Instruction::newarray(ArrayType::Byte),
                                op(Opcode::Iload0),
                                op(Opcode::Iconst1),
                                op(Opcode::Bastore),
                                op(Opcode::Return)});
    ASSERT_TRUE(store);
    auto bad = store->execute({Value::i32(2)});
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().message, "java/lang/ArrayIndexOutOfBoundsException");
}

TEST(Arrays, NullArrayTraps)
{
    auto length = compileOrFail("()I", {op(Opcode::AconstNull), op(Opcode::Arraylength), op(Opcode::Ireturn)});
    ASSERT_TRUE(length);
    auto result = length->execute({});
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().message, "java/lang/NullPointerException");

    auto load = compileOrFail("()I",
                              {op(Opcode::AconstNull), op(Opcode::Iconst0), op(Opcode::Iaload), op(Opcode::Ireturn)});
    ASSERT_TRUE(load);
    auto loaded = load->execute({});
    ASSERT_FALSE(loaded);
    EXPECT_EQ(loaded.error().message, "java/lang/NullPointerException");
}

TEST(Arrays, InvalidElementTypeIsRejected)
{
    auto fn = MethodBuilder("()V")
                  .code({op(Opcode::Iconst1), op(Opcode::Newarray, 3), op(Opcode::Pop), op(Opcode::Return)})
                  .compile();
    ASSERT_FALSE(fn);
    EXPECT_EQ(fn.error().kind, ErrorKind::InvalidValue);
}

std::vector<int64_t> hookRequests;
alignas(8) unsigned char hookBuffer[256];

int64_t recordingHook(int64_t size)
{
    hookRequests.push_back(size);
    std::memset(hookBuffer, 0, sizeof(hookBuffer));
    return static_cast<int64_t>(reinterpret_cast<intptr_t>(hookBuffer));
}

int64_t failingHook(int64_t)
{
    return 0;
}

class AllocateHookTest : public ::testing::Test
{
  protected:
    void TearDown() override
    {
        jit::setAllocateHook(nullptr);
        hookRequests.clear();
    }
};

TEST_F(AllocateHookTest, RequestsHeaderPlusPayload)
{
    jit::setAllocateHook(&recordingHook);
    auto fn = compileOrFail("(I)I",
                            {op(Opcode::Iload0),
                             Instruction::newarray(ArrayType::Char),
                             op(Opcode::Arraylength),
                             op(Opcode::Ireturn)});
    ASSERT_TRUE(fn);
    EXPECT_EQ(runOrFail(*fn, {Value::i32(5)}), Value::i32(5));
    ASSERT_EQ(hookRequests.size(), 1u);
    EXPECT_EQ(hookRequests.front(), 8 + 5 * 2);

    int64_t header = 0;
    std::memcpy(&header, hookBuffer, sizeof(header));
    EXPECT_EQ(header, 5);
}

TEST_F(AllocateHookTest, NullAllocationRaisesOutOfMemory)
{
    jit::setAllocateHook(&failingHook);
    auto fn = compileOrFail("()I",
                            {op(Opcode::Iconst4),
                             Instruction::newarray(ArrayType::Int),
                             op(Opcode::Arraylength),
                             op(Opcode::Ireturn)});
    ASSERT_TRUE(fn);
    auto result = fn->execute({});
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind, ErrorKind::RuntimeException);
    EXPECT_EQ(result.error().message, "java/lang/OutOfMemoryError");
}

TEST(Runtime, DefaultHeapRejectsHugeRequests)
{
    EXPECT_EQ(cortado_jit_allocate(-8), 0);
    EXPECT_EQ(cortado_jit_allocate(int64_t{1} << 40), 0);
    const int64_t a = cortado_jit_allocate(24);
    const int64_t b = cortado_jit_allocate(24);
    EXPECT_NE(a, 0);
    EXPECT_NE(b, 0);
    EXPECT_NE(a, b);
    EXPECT_EQ(a % 8, 0);
}

TEST(Runtime, ExceptionClassNames)
{
    EXPECT_EQ(jit::exceptionClassName(jit::TrapCode::None), nullptr);
    EXPECT_STREQ(jit::exceptionClassName(jit::TrapCode::ArithmeticException), "java/lang/ArithmeticException");
    EXPECT_STREQ(jit::exceptionClassName(jit::TrapCode::OutOfMemoryError), "java/lang/OutOfMemoryError");
}

} // namespace
} // namespace cortado::tests
