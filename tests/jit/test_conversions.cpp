// File: tests/jit/test_conversions.cpp
// Purpose: Verify numeric conversions and the lcmp/fcmp/dcmp family,
//          including NaN ordering.
// Key invariants: Float to integer conversions saturate and map NaN to 0;
//                 fcmpl/dcmpl push -1 on NaN while fcmpg/dcmpg push 1.
// Ownership/Lifetime: Functions are compiled per test.
// Links: src/jit/Translate.Convert.cpp

#include "common/JitTestSupport.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>

namespace cortado::tests
{
namespace
{
using jit::Value;

constexpr float kFloatNaN = std::numeric_limits<float>::quiet_NaN();
constexpr double kDoubleNaN = std::numeric_limits<double>::quiet_NaN();
constexpr double kInf = std::numeric_limits<double>::infinity();

std::optional<jit::Function> convert(const char *descriptor, Opcode load, Opcode conv, Opcode ret)
{
    return compileOrFail(descriptor, {op(load), op(conv), op(ret)});
}

TEST(Conversions, Widening)
{
    auto i2l = convert("(I)J", Opcode::Iload0, Opcode::I2l, Opcode::Lreturn);
    ASSERT_TRUE(i2l);
    EXPECT_EQ(runOrFail(*i2l, {Value::i32(-2)}), Value::i64(-2));

    auto i2d = convert("(I)D", Opcode::Iload0, Opcode::I2d, Opcode::Dreturn);
    ASSERT_TRUE(i2d);
    EXPECT_EQ(runOrFail(*i2d, {Value::i32(7)}), Value::f64(7.0));

    auto f2d = convert("(F)D", Opcode::Fload0, Opcode::F2d, Opcode::Dreturn);
    ASSERT_TRUE(f2d);
    EXPECT_EQ(runOrFail(*f2d, {Value::f32(0.5f)}), Value::f64(0.5));

    auto l2f = convert("(J)F", Opcode::Lload0, Opcode::L2f, Opcode::Freturn);
    ASSERT_TRUE(l2f);
    EXPECT_EQ(runOrFail(*l2f, {Value::i64(1LL << 40)}), Value::f32(1099511627776.0f));
}

TEST(Conversions, Narrowing)
{
    auto l2i = convert("(J)I", Opcode::Lload0, Opcode::L2i, Opcode::Ireturn);
    ASSERT_TRUE(l2i);
    EXPECT_EQ(runOrFail(*l2i, {Value::i64(0x1'0000'0005LL)}), Value::i32(5));

    auto d2f = convert("(D)F", Opcode::Dload0, Opcode::D2f, Opcode::Freturn);
    ASSERT_TRUE(d2f);
    EXPECT_EQ(runOrFail(*d2f, {Value::f64(0.25)}), Value::f32(0.25f));
}

TEST(Conversions, IntSubwordTruncation)
{
    auto i2b = convert("(I)I", Opcode::Iload0, Opcode::I2b, Opcode::Ireturn);
    auto i2c = convert("(I)I", Opcode::Iload0, Opcode::I2c, Opcode::Ireturn);
    auto i2s = convert("(I)I", Opcode::Iload0, Opcode::I2s, Opcode::Ireturn);
    ASSERT_TRUE(i2b && i2c && i2s);
    EXPECT_EQ(runOrFail(*i2b, {Value::i32(0x1ff)}), Value::i32(-1));
    EXPECT_EQ(runOrFail(*i2b, {Value::i32(0x7f)}), Value::i32(127));
    EXPECT_EQ(runOrFail(*i2c, {Value::i32(-1)}), Value::i32(0xffff));
    EXPECT_EQ(runOrFail(*i2s, {Value::i32(0x18000)}), Value::i32(-32768));
}

TEST(Conversions, FloatToIntSaturates)
{
    auto f2i = convert("(F)I", Opcode::Fload0, Opcode::F2i, Opcode::Ireturn);
    ASSERT_TRUE(f2i);
    EXPECT_EQ(runOrFail(*f2i, {Value::f32(-3.9f)}), Value::i32(-3));
    EXPECT_EQ(runOrFail(*f2i, {Value::f32(1e20f)}), Value::i32(std::numeric_limits<int32_t>::max()));
    EXPECT_EQ(runOrFail(*f2i, {Value::f32(-1e20f)}), Value::i32(std::numeric_limits<int32_t>::min()));
    EXPECT_EQ(runOrFail(*f2i, {Value::f32(kFloatNaN)}), Value::i32(0));

    auto d2l = convert("(D)J", Opcode::Dload0, Opcode::D2l, Opcode::Lreturn);
    ASSERT_TRUE(d2l);
    EXPECT_EQ(runOrFail(*d2l, {Value::f64(kInf)}), Value::i64(std::numeric_limits<int64_t>::max()));
    EXPECT_EQ(runOrFail(*d2l, {Value::f64(kDoubleNaN)}), Value::i64(0));
    EXPECT_EQ(runOrFail(*d2l, {Value::f64(-2.5)}), Value::i64(-2));

    auto d2i = convert("(D)I", Opcode::Dload0, Opcode::D2i, Opcode::Ireturn);
    ASSERT_TRUE(d2i);
    EXPECT_EQ(runOrFail(*d2i, {Value::f64(-kInf)}), Value::i32(std::numeric_limits<int32_t>::min()));

    auto f2l = convert("(F)J", Opcode::Fload0, Opcode::F2l, Opcode::Lreturn);
    ASSERT_TRUE(f2l);
    EXPECT_EQ(runOrFail(*f2l, {Value::f32(kFloatNaN)}), Value::i64(0));
}

TEST(Comparisons, LongCompare)
{
    auto lcmp = compileOrFail("(JJ)I",
                              {op(Opcode::Lload0), op(Opcode::Lload2), op(Opcode::Lcmp), op(Opcode::Ireturn)});
    ASSERT_TRUE(lcmp);
    EXPECT_EQ(runOrFail(*lcmp, {Value::i64(1), Value::i64(2)}), Value::i32(-1));
    EXPECT_EQ(runOrFail(*lcmp, {Value::i64(2), Value::i64(2)}), Value::i32(0));
    EXPECT_EQ(runOrFail(*lcmp, {Value::i64(3), Value::i64(-2)}), Value::i32(1));
}

TEST(Comparisons, FloatCompareNaNBias)
{
    const std::vector<Instruction> body{
        op(Opcode::Fload0), op(Opcode::Fload1), op(Opcode::Fcmpl), op(Opcode::Ireturn)};
    auto fcmpl = compileOrFail("(FF)I", body);
    auto gbody = body;
    gbody[2] = op(Opcode::Fcmpg);
    auto fcmpg = compileOrFail("(FF)I", gbody);
    ASSERT_TRUE(fcmpl && fcmpg);

    EXPECT_EQ(runOrFail(*fcmpl, {Value::f32(1.0f), Value::f32(2.0f)}), Value::i32(-1));
    EXPECT_EQ(runOrFail(*fcmpl, {Value::f32(2.0f), Value::f32(2.0f)}), Value::i32(0));
    EXPECT_EQ(runOrFail(*fcmpl, {Value::f32(3.0f), Value::f32(2.0f)}), Value::i32(1));
    EXPECT_EQ(runOrFail(*fcmpl, {Value::f32(kFloatNaN), Value::f32(2.0f)}), Value::i32(-1));
    EXPECT_EQ(runOrFail(*fcmpg, {Value::f32(kFloatNaN), Value::f32(2.0f)}), Value::i32(1));
    EXPECT_EQ(runOrFail(*fcmpg, {Value::f32(2.0f), Value::f32(kFloatNaN)}), Value::i32(1));
    EXPECT_EQ(runOrFail(*fcmpg, {Value::f32(1.0f), Value::f32(2.0f)}), Value::i32(-1));
    EXPECT_EQ(runOrFail(*fcmpg, {Value::f32(0.0f), Value::f32(-0.0f)}), Value::i32(0));
}

TEST(Comparisons, DoubleCompareNaNBias)
{
    const std::vector<Instruction> body{
        op(Opcode::Dload0), op(Opcode::Dload2), op(Opcode::Dcmpl), op(Opcode::Ireturn)};
    auto dcmpl = compileOrFail("(DD)I", body);
    auto gbody = body;
    gbody[2] = op(Opcode::Dcmpg);
    auto dcmpg = compileOrFail("(DD)I", gbody);
    ASSERT_TRUE(dcmpl && dcmpg);

    EXPECT_EQ(runOrFail(*dcmpl, {Value::f64(kDoubleNaN), Value::f64(kDoubleNaN)}), Value::i32(-1));
    EXPECT_EQ(runOrFail(*dcmpg, {Value::f64(kDoubleNaN), Value::f64(kDoubleNaN)}), Value::i32(1));
    EXPECT_EQ(runOrFail(*dcmpl, {Value::f64(-kInf), Value::f64(0.0)}), Value::i32(-1));
    EXPECT_EQ(runOrFail(*dcmpg, {Value::f64(kInf), Value::f64(0.0)}), Value::i32(1));
}

TEST(Comparisons, IsNaNIdiom)
{
    // return (f != f) ? 1 : 0, compiled the way javac emits Float.isNaN.
    auto fn = compileOrFail("(F)I",
                            {op(Opcode::Fload0),    // 0
                             op(Opcode::Fload0),    // 1
                             op(Opcode::Fcmpl),     // 2
                             op(Opcode::Ifeq, 6),   // 3
                             op(Opcode::Iconst1),   // 4
                             op(Opcode::Ireturn),   // 5
                             op(Opcode::Iconst0),   // 6
                             op(Opcode::Ireturn)}); // 7
    ASSERT_TRUE(fn);
    EXPECT_EQ(runOrFail(*fn, {Value::f32(kFloatNaN)}), Value::i32(1));
    EXPECT_EQ(runOrFail(*fn, {Value::f32(1.0f)}), Value::i32(0));
}

} // namespace
} // namespace cortado::tests
