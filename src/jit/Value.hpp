//===----------------------------------------------------------------------===//
//
// Part of the Cortado project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: jit/Value.hpp
// Purpose: Runtime values exchanged with compiled functions and their
//          fixed-layout native encoding.
// Key invariants: Value holds exactly one of the four machine kinds.
//                 JitValue places the payload at offset 8; floats travel as
//                 their IEEE bits zero-extended to 64 bits.
// Ownership/Lifetime: Plain value types.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "jit/Error.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace cortado::jit
{

/// @brief Machine kind carried by a runtime Value.
enum class ValueKind : uint8_t
{
    I32,
    I64,
    F32,
    F64
};

const char *toString(ValueKind kind);

/// @brief Typed runtime value crossing the native boundary.
class Value
{
  public:
    static Value i32(int32_t v);
    static Value i64(int64_t v);
    static Value f32(float v);
    static Value f64(double v);

    [[nodiscard]] ValueKind kind() const
    {
        return kind_;
    }

    /// @brief Payload accessors; each requires the matching kind().
    [[nodiscard]] int32_t asI32() const;
    [[nodiscard]] int64_t asI64() const;
    [[nodiscard]] float asF32() const;
    [[nodiscard]] double asF64() const;

    /// @brief Raw 64-bit payload as stored in a JitValue.
    [[nodiscard]] uint64_t bits() const
    {
        return bits_;
    }

    /// @brief Bitwise equality; NaN payloads compare equal to themselves.
    bool operator==(const Value &other) const;
    bool operator!=(const Value &other) const
    {
        return !(*this == other);
    }

  private:
    Value(ValueKind kind, uint64_t bits) : kind_(kind), bits_(bits) {}

    ValueKind kind_;
    uint64_t bits_;
};

/// @brief Render as "I32(42)", "F64(1.5)", ...
std::string toString(const Value &value);

std::ostream &operator<<(std::ostream &os, const Value &value);

/// @brief Discriminants of JitValue.
enum class JitValueTag : int8_t
{
    None = 0,
    I32 = 1,
    I64 = 2,
    F32 = 3,
    F64 = 4
};

/// @brief Native argument/result record passed to compiled code.
struct JitValue
{
    int8_t discriminant = 0;
    int64_t value = 0;
};

static_assert(offsetof(JitValue, value) == 8, "compiled code reads the payload at offset 8");
static_assert(sizeof(JitValue) == 16, "compiled code indexes arguments with a 16-byte stride");

/// @brief Encode @p value for compiled code.
JitValue toJitValue(const Value &value);

/// @brief Decode a result record; None yields an empty optional.
/// @return InternalError for an unknown discriminant.
Expected<std::optional<Value>> fromJitValue(const JitValue &raw);

} // namespace cortado::jit
