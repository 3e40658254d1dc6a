//===----------------------------------------------------------------------===//
//
// Part of the Cortado project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: jit/Function.hpp
// Purpose: Executable result of compiling one method.
// Key invariants: Arguments and results are checked against the Signature
//                 on every call; the Function holds no mutable state, so one
//                 instance may be executed concurrently.
// Ownership/Lifetime: Move-only; owns its machine code.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "jit/Backend.hpp"
#include "jit/Error.hpp"
#include "jit/Signature.hpp"
#include "jit/Value.hpp"

#include <optional>
#include <string>
#include <vector>

namespace cortado::jit
{

/// @brief Compiled, callable method.
class Function
{
  public:
    Function(std::string name, Signature signature, NativeCode code);

    Function(Function &&) noexcept = default;
    Function &operator=(Function &&) noexcept = default;
    Function(const Function &) = delete;
    Function &operator=(const Function &) = delete;

    /// @brief Native symbol name, e.g. "java_lang_Math__max".
    [[nodiscard]] const std::string &name() const
    {
        return name_;
    }

    [[nodiscard]] const Signature &signature() const
    {
        return signature_;
    }

    /// @brief Invoke the compiled code synchronously.
    /// @return InvalidArgumentCount or InvalidValue for arguments that do not
    ///         match the signature; RuntimeException carrying the Java
    ///         throwable name when the code traps; the return value, or an
    ///         empty optional for void methods, otherwise.
    Expected<std::optional<Value>> execute(const std::vector<Value> &arguments) const;

  private:
    std::string name_;
    Signature signature_;
    NativeCode code_;
};

} // namespace cortado::jit
