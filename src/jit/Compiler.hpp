//===----------------------------------------------------------------------===//
//
// Part of the Cortado project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the Compiler, the driver that turns one method of a
// loaded class into an executable Function.
//
// Pipeline: resolve names through the constant pool, derive the Signature,
// reject unsupported opcodes anywhere in the body, build the control-flow
// graph, declare one LLVM block (with phis for its entry stack) per reachable
// CFG block, translate blocks in reverse postorder, then verify, optimize and
// finalize through the backend. The result is a complete Function or an
// Error; nothing partial escapes.
//
// A Compiler holds only its options; compile() keeps all other state local,
// so one Compiler may serve concurrent compiles.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "classfile/ClassFile.hpp"
#include "jit/Error.hpp"
#include "jit/Function.hpp"
#include "jit/JitOptions.hpp"

#include <string>
#include <string_view>

namespace cortado::jit
{

/// @brief Bytecode to native code compiler.
class Compiler
{
  public:
    explicit Compiler(JitOptions options = {});

    /// @brief Compile @p method of @p classFile.
    /// @details Only static methods and constructors are accepted.
    Expected<Function> compile(const classfile::ClassFile &classFile,
                               const classfile::Method &method) const;

    [[nodiscard]] const JitOptions &options() const
    {
        return options_;
    }

    /// @brief Native symbol for @p method of @p className: slashes become
    ///        underscores and angle brackets are dropped, joined by "__".
    static std::string functionName(std::string_view className, std::string_view methodName);

  private:
    JitOptions options_;
};

} // namespace cortado::jit
