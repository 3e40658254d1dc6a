// File: tests/classfile/test_constant_pool.cpp
// Purpose: Verify constant pool indexing, wide-entry shadow slots and the
//          typed lookup helpers.
// Key invariants: Index 0 and the slot after a Long/Double are never valid;
//                 typed lookups report the tag they found on mismatch.
// Ownership/Lifetime: Pools are built locally per test.
// Links: src/classfile/ConstantPool.cpp

#include "classfile/ClassFile.hpp"
#include "classfile/ConstantPool.hpp"

#include <gtest/gtest.h>

namespace cortado::classfile
{
namespace
{

TEST(ConstantPool, IndicesStartAtOne)
{
    ConstantPool pool;
    EXPECT_EQ(pool.size(), 1u);
    EXPECT_EQ(pool.addInteger(7), 1);
    EXPECT_EQ(pool.addUtf8("x"), 2);
    EXPECT_EQ(pool.get(0), nullptr);
    ASSERT_NE(pool.get(1), nullptr);
    EXPECT_EQ(pool.get(1)->tag, Constant::Tag::Integer);
    EXPECT_EQ(pool.get(1)->i32, 7);
}

TEST(ConstantPool, WideEntriesTakeTwoSlots)
{
    ConstantPool pool;
    const uint16_t longIdx = pool.addLong(1LL << 40);
    const uint16_t doubleIdx = pool.addDouble(2.5);
    const uint16_t intIdx = pool.addInteger(3);
    EXPECT_EQ(longIdx, 1);
    EXPECT_EQ(doubleIdx, 3);
    EXPECT_EQ(intIdx, 5);
    EXPECT_EQ(pool.size(), 6u);

    auto shadow = pool.tryGet(2);
    ASSERT_FALSE(shadow);
    EXPECT_EQ(shadow.error().kind, ClassFileError::Kind::InvalidConstantPoolIndex);
    EXPECT_EQ(pool.get(4), nullptr);
    EXPECT_EQ(pool.get(longIdx)->i64, 1LL << 40);
    EXPECT_DOUBLE_EQ(pool.get(doubleIdx)->f64, 2.5);
}

TEST(ConstantPool, OutOfRangeIndexFails)
{
    ConstantPool pool;
    pool.addUtf8("a");
    auto missing = pool.tryGet(9);
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().kind, ClassFileError::Kind::InvalidConstantPoolIndex);
    EXPECT_NE(missing.error().message.find("9"), std::string::npos);
}

TEST(ConstantPool, TypedLookupsCheckTag)
{
    ConstantPool pool;
    const uint16_t intIdx = pool.addInteger(1);
    const uint16_t classIdx = pool.addClass("java/lang/Object");

    auto notUtf8 = pool.tryGetUtf8(intIdx);
    ASSERT_FALSE(notUtf8);
    EXPECT_EQ(notUtf8.error().kind, ClassFileError::Kind::InvalidConstantPoolIndexType);
    EXPECT_NE(notUtf8.error().message.find("Integer"), std::string::npos);

    auto name = pool.tryGetClassName(classIdx);
    ASSERT_TRUE(name);
    EXPECT_EQ(name.value(), "java/lang/Object");

    auto notClass = pool.tryGetClassName(intIdx);
    ASSERT_FALSE(notClass);
    EXPECT_EQ(notClass.error().kind, ClassFileError::Kind::InvalidConstantPoolIndexType);
}

TEST(ConstantPool, ClassFileResolvesItsName)
{
    ClassFile cls;
    cls.thisClass = cls.constantPool.addClass("demo/Point");
    auto name = cls.className();
    ASSERT_TRUE(name);
    EXPECT_EQ(name.value(), "demo/Point");

    ClassFile broken;
    broken.thisClass = broken.constantPool.addUtf8("demo/Point");
    EXPECT_FALSE(broken.className());
}

TEST(ConstantPool, ToStringNamesTag)
{
    EXPECT_EQ(toString(Constant::makeInteger(42)), "Integer(42)");
    EXPECT_EQ(toString(Constant::makeUtf8("hi")), "Utf8(\"hi\")");
    EXPECT_STREQ(toString(Constant::Tag::Methodref), "Methodref");
    EXPECT_TRUE(Constant::makeLong(0).isWide());
    EXPECT_TRUE(Constant::makeDouble(0).isWide());
    EXPECT_FALSE(Constant::makeFloat(0).isWide());
}

} // namespace
} // namespace cortado::classfile
