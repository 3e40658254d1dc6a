//===----------------------------------------------------------------------===//
//
// Part of the Cortado project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: jit/Error.hpp
// Purpose: Closed error taxonomy shared by every JIT stage.
// Key invariants: Compilation and execution report failures only through
//                 Expected<T> carrying an Error; nothing is thrown.
// Ownership/Lifetime: Value type; wrapped class-file causes are copied and
//                     backend causes are shared.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "classfile/ClassFileError.hpp"
#include "support/expected.hpp"

#include <memory>
#include <optional>
#include <ostream>
#include <string>

namespace llvm
{
class Error;
class ErrorInfoBase;
} // namespace llvm

namespace cortado::jit
{

/// @brief Failure classes reported by the compiler and compiled functions.
enum class ErrorKind
{
    UnsupportedInstruction,
    UnsupportedMethod,
    UnsupportedType,
    UnsupportedTargetISA,
    OperandStackUnderflow,
    InvalidLocalVariableIndex,
    InvalidConstantIndex,
    InvalidConstant,
    InvalidValue,
    InvalidBlockAddress,
    InvalidArgumentCount,
    ClassFileError,
    CodegenError,
    ModuleError,
    RuntimeException,
    InternalError
};

/// @brief Stable CamelCase name of @p kind.
const char *toString(ErrorKind kind);

/// @brief Error value produced by the JIT.
/// @details @c expected and @c actual are filled for mismatch kinds
///          (InvalidConstant, InvalidValue, InvalidArgumentCount). @c cause
///          keeps the class-file error a ClassFileError wraps; @c backendCause
///          keeps the first LLVM error a CodegenError or ModuleError wraps.
struct Error
{
    ErrorKind kind = ErrorKind::InternalError;
    std::string message;
    std::string expected;
    std::string actual;
    std::optional<classfile::ClassFileError> cause;
    std::shared_ptr<const llvm::ErrorInfoBase> backendCause;

    /// @brief Build an error of @p kind with a free-form message.
    static Error make(ErrorKind kind, std::string message);

    /// @brief Build a mismatch error recording what was expected and found.
    static Error mismatch(ErrorKind kind, std::string expected, std::string actual);

    /// @brief Wrap a class-file model failure.
    static Error fromClassFile(classfile::ClassFileError cause);

    /// @brief Take ownership of an LLVM failure as an error of @p kind.
    /// @details The message joins every payload of @p cause; the first
    ///          payload is kept as @c backendCause.
    static Error fromBackend(ErrorKind kind, llvm::Error cause);

    /// @brief Shorthand for InternalError.
    static Error internal(std::string message);
};

/// @brief Render @p error as "Kind: message".
std::string toString(const Error &error);

std::ostream &operator<<(std::ostream &os, const Error &error);

/// @brief Result of a fallible JIT operation.
template <class T> using Expected = support::Expected<T, Error>;

} // namespace cortado::jit
