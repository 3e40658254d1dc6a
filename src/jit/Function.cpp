//===----------------------------------------------------------------------===//
//
// Part of the Cortado project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Argument marshalling and result checking around a compiled entry point.
//
//===----------------------------------------------------------------------===//

#include "jit/Function.hpp"

#include "jit/Runtime.hpp"

namespace cortado::jit
{

Function::Function(std::string name, Signature signature, NativeCode code)
    : name_(std::move(name)), signature_(std::move(signature)), code_(std::move(code))
{
}

Expected<std::optional<Value>> Function::execute(const std::vector<Value> &arguments) const
{
    const auto &params = signature_.parameters;
    if (arguments.size() != params.size())
    {
        return Error::mismatch(ErrorKind::InvalidArgumentCount,
                               std::to_string(params.size()),
                               std::to_string(arguments.size()));
    }

    std::vector<JitValue> raw;
    raw.reserve(arguments.size());
    for (size_t i = 0; i < arguments.size(); ++i)
    {
        const ValueKind expected = *valueKindOf(params[i]);
        if (arguments[i].kind() != expected)
        {
            return Error::mismatch(
                ErrorKind::InvalidValue, toString(expected), toString(arguments[i].kind()));
        }
        raw.push_back(toJitValue(arguments[i]));
    }

    JitValue result;
    const auto trap = static_cast<TrapCode>(code_.entry()(raw.data(), raw.size(), &result));
    if (trap != TrapCode::None)
    {
        const char *exception = exceptionClassName(trap);
        if (!exception)
            return Error::internal("unknown trap code " + std::to_string(static_cast<int32_t>(trap)));
        return Error::make(ErrorKind::RuntimeException, exception);
    }

    auto value = fromJitValue(result);
    if (!value)
        return value;

    const auto expected = valueKindOf(signature_.returnKind);
    const auto &actual = value.value();
    if (expected.has_value() != actual.has_value() ||
        (expected && *expected != actual->kind()))
    {
        return Error::mismatch(ErrorKind::InvalidValue,
                               expected ? toString(*expected) : "None",
                               actual ? toString(actual->kind()) : "None");
    }
    return value;
}

} // namespace cortado::jit
