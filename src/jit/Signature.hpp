//===----------------------------------------------------------------------===//
//
// Part of the Cortado project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: jit/Signature.hpp
// Purpose: Machine-level calling signature derived from a method descriptor.
// Key invariants: Parameters never have kind Void; object and array types
//                 are rejected with UnsupportedType.
// Ownership/Lifetime: Value type, immutable once built.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "classfile/FieldType.hpp"
#include "jit/Error.hpp"
#include "jit/Value.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cortado::jit
{

/// @brief Parameter or return kind of a compiled function.
enum class Kind : uint8_t
{
    Int32,
    Int64,
    Float32,
    Float64,
    Void
};

const char *toString(Kind kind);

/// @brief Runtime value kind for @p kind; empty for Void.
std::optional<ValueKind> valueKindOf(Kind kind);

/// @brief Ordered parameter kinds and one return kind.
struct Signature
{
    std::vector<Kind> parameters;
    Kind returnKind = Kind::Void;

    /// @brief Derive from a descriptor string such as "(IJ)F".
    static Expected<Signature> fromDescriptor(std::string_view descriptor);

    /// @brief Derive from an already parsed descriptor.
    static Expected<Signature> fromMethodDescriptor(const classfile::MethodDescriptor &desc);

    /// @brief Number of local slots occupied by the parameters.
    [[nodiscard]] size_t parameterSlots() const;

    /// @brief Render as "(Int32, Int64) -> Float32".
    [[nodiscard]] std::string toString() const;
};

} // namespace cortado::jit
