//===----------------------------------------------------------------------===//
//
// Part of the Cortado project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Error construction and formatting helpers.
//
//===----------------------------------------------------------------------===//

#include "jit/Error.hpp"

#include <llvm/Support/Error.h>

#include <memory>

namespace cortado::jit
{

const char *toString(ErrorKind kind)
{
    switch (kind)
    {
        case ErrorKind::UnsupportedInstruction:
            return "UnsupportedInstruction";
        case ErrorKind::UnsupportedMethod:
            return "UnsupportedMethod";
        case ErrorKind::UnsupportedType:
            return "UnsupportedType";
        case ErrorKind::UnsupportedTargetISA:
            return "UnsupportedTargetISA";
        case ErrorKind::OperandStackUnderflow:
            return "OperandStackUnderflow";
        case ErrorKind::InvalidLocalVariableIndex:
            return "InvalidLocalVariableIndex";
        case ErrorKind::InvalidConstantIndex:
            return "InvalidConstantIndex";
        case ErrorKind::InvalidConstant:
            return "InvalidConstant";
        case ErrorKind::InvalidValue:
            return "InvalidValue";
        case ErrorKind::InvalidBlockAddress:
            return "InvalidBlockAddress";
        case ErrorKind::InvalidArgumentCount:
            return "InvalidArgumentCount";
        case ErrorKind::ClassFileError:
            return "ClassFileError";
        case ErrorKind::CodegenError:
            return "CodegenError";
        case ErrorKind::ModuleError:
            return "ModuleError";
        case ErrorKind::RuntimeException:
            return "RuntimeException";
        case ErrorKind::InternalError:
            return "InternalError";
    }
    return "<unknown>";
}

Error Error::make(ErrorKind kind, std::string message)
{
    Error err;
    err.kind = kind;
    err.message = std::move(message);
    return err;
}

Error Error::mismatch(ErrorKind kind, std::string expected, std::string actual)
{
    Error err;
    err.kind = kind;
    err.message = "expected " + expected + ", found " + actual;
    err.expected = std::move(expected);
    err.actual = std::move(actual);
    return err;
}

Error Error::fromClassFile(classfile::ClassFileError cause)
{
    Error err;
    err.kind = ErrorKind::ClassFileError;
    err.message = cause.message;
    err.cause = std::move(cause);
    return err;
}

Error Error::fromBackend(ErrorKind kind, llvm::Error cause)
{
    Error err;
    err.kind = kind;
    llvm::handleAllErrors(std::move(cause),
                          [&err](std::unique_ptr<llvm::ErrorInfoBase> info)
                          {
                              if (!err.message.empty())
                                  err.message += "; ";
                              err.message += info->message();
                              if (!err.backendCause)
                                  err.backendCause = std::move(info);
                          });
    return err;
}

Error Error::internal(std::string message)
{
    return make(ErrorKind::InternalError, std::move(message));
}

std::string toString(const Error &error)
{
    std::string out = toString(error.kind);
    if (!error.message.empty())
    {
        out += ": ";
        out += error.message;
    }
    return out;
}

std::ostream &operator<<(std::ostream &os, const Error &error)
{
    return os << toString(error);
}

} // namespace cortado::jit
