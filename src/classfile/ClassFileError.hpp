//===----------------------------------------------------------------------===//
//
// Part of the Cortado project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: classfile/ClassFileError.hpp
// Purpose: Error payload reported by class-file model lookups.
// Key invariants: kind selects the failure class; message is human readable.
// Ownership/Lifetime: Value type.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/expected.hpp"

#include <string>

namespace cortado::classfile
{

/// @brief Failure raised while reading the class-file model.
struct ClassFileError
{
    enum class Kind
    {
        InvalidConstantPoolIndex,
        InvalidConstantPoolIndexType,
        InvalidMethodDescriptor,
        InvalidFieldType
    };

    Kind kind;
    std::string message;
};

/// @brief Result of a class-file lookup.
template <class T> using Expected = support::Expected<T, ClassFileError>;

/// @brief Stable lowercase name of @p kind.
const char *toString(ClassFileError::Kind kind);

} // namespace cortado::classfile
