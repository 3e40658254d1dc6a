//===----------------------------------------------------------------------===//
//
// Part of the Cortado project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Runtime Value construction and JitValue marshalling.
//
//===----------------------------------------------------------------------===//

#include "jit/Value.hpp"

#include <cstring>
#include <sstream>

namespace cortado::jit
{
namespace
{

uint64_t floatBits(float v)
{
    uint32_t raw;
    std::memcpy(&raw, &v, sizeof(raw));
    return raw;
}

uint64_t doubleBits(double v)
{
    uint64_t raw;
    std::memcpy(&raw, &v, sizeof(raw));
    return raw;
}

} // namespace

const char *toString(ValueKind kind)
{
    switch (kind)
    {
        case ValueKind::I32:
            return "I32";
        case ValueKind::I64:
            return "I64";
        case ValueKind::F32:
            return "F32";
        case ValueKind::F64:
            return "F64";
    }
    return "<unknown>";
}

Value Value::i32(int32_t v)
{
    return Value(ValueKind::I32, static_cast<uint32_t>(v));
}

Value Value::i64(int64_t v)
{
    return Value(ValueKind::I64, static_cast<uint64_t>(v));
}

Value Value::f32(float v)
{
    return Value(ValueKind::F32, floatBits(v));
}

Value Value::f64(double v)
{
    return Value(ValueKind::F64, doubleBits(v));
}

int32_t Value::asI32() const
{
    return static_cast<int32_t>(static_cast<uint32_t>(bits_));
}

int64_t Value::asI64() const
{
    return static_cast<int64_t>(bits_);
}

float Value::asF32() const
{
    const auto raw = static_cast<uint32_t>(bits_);
    float v;
    std::memcpy(&v, &raw, sizeof(v));
    return v;
}

double Value::asF64() const
{
    double v;
    std::memcpy(&v, &bits_, sizeof(v));
    return v;
}

bool Value::operator==(const Value &other) const
{
    return kind_ == other.kind_ && bits_ == other.bits_;
}

std::string toString(const Value &value)
{
    std::ostringstream os;
    os << toString(value.kind()) << '(';
    switch (value.kind())
    {
        case ValueKind::I32:
            os << value.asI32();
            break;
        case ValueKind::I64:
            os << value.asI64();
            break;
        case ValueKind::F32:
            os << value.asF32();
            break;
        case ValueKind::F64:
            os << value.asF64();
            break;
    }
    os << ')';
    return os.str();
}

std::ostream &operator<<(std::ostream &os, const Value &value)
{
    return os << toString(value);
}

JitValue toJitValue(const Value &value)
{
    JitValue raw;
    switch (value.kind())
    {
        case ValueKind::I32:
            raw.discriminant = static_cast<int8_t>(JitValueTag::I32);
            raw.value = value.asI32();
            break;
        case ValueKind::I64:
            raw.discriminant = static_cast<int8_t>(JitValueTag::I64);
            raw.value = value.asI64();
            break;
        case ValueKind::F32:
            raw.discriminant = static_cast<int8_t>(JitValueTag::F32);
            raw.value = static_cast<int64_t>(value.bits());
            break;
        case ValueKind::F64:
            raw.discriminant = static_cast<int8_t>(JitValueTag::F64);
            raw.value = static_cast<int64_t>(value.bits());
            break;
    }
    return raw;
}

Expected<std::optional<Value>> fromJitValue(const JitValue &raw)
{
    const auto bits = static_cast<uint64_t>(raw.value);
    switch (static_cast<JitValueTag>(raw.discriminant))
    {
        case JitValueTag::None:
            return std::optional<Value>{};
        case JitValueTag::I32:
            return std::optional<Value>{Value::i32(static_cast<int32_t>(bits))};
        case JitValueTag::I64:
            return std::optional<Value>{Value::i64(raw.value)};
        case JitValueTag::F32:
        {
            const auto low = static_cast<uint32_t>(bits);
            float v;
            std::memcpy(&v, &low, sizeof(v));
            return std::optional<Value>{Value::f32(v)};
        }
        case JitValueTag::F64:
        {
            double v;
            std::memcpy(&v, &bits, sizeof(v));
            return std::optional<Value>{Value::f64(v)};
        }
    }
    return Error::internal("unknown result discriminant " + std::to_string(raw.discriminant));
}

} // namespace cortado::jit
