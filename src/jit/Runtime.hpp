//===----------------------------------------------------------------------===//
//
// Part of the Cortado project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: jit/Runtime.hpp
// Purpose: Entry points compiled code calls into and the trap codes it
//          returns.
// Key invariants: cortado_jit_allocate returns zero-filled, 8-byte aligned
//                 memory or 0 when the heap is exhausted.
// Ownership/Lifetime: The default heap lives for the whole process.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <string_view>

namespace cortado::jit
{

/// @brief Status returned by compiled code; None means normal completion.
enum class TrapCode : int32_t
{
    None = 0,
    ArithmeticException = 1,
    NegativeArraySizeException = 2,
    ArrayIndexOutOfBoundsException = 3,
    NullPointerException = 4,
    OutOfMemoryError = 5
};

/// @brief Internal name of the Java throwable a trap stands for, or nullptr
///        for an unknown code.
const char *exceptionClassName(TrapCode code);

/// @brief True when the throwable @p code stands for is an instance of the
///        class with internal name @p className (its own class or one of
///        its superclasses).
bool isInstanceOf(TrapCode code, std::string_view className);

/// @brief Allocation function signature: size in bytes to address.
using AllocateHook = int64_t (*)(int64_t size);

/// @brief Route cortado_jit_allocate to @p hook; nullptr restores the
///        default arena heap.
void setAllocateHook(AllocateHook hook);

/// @brief Symbol name compiled code binds the allocator to.
inline constexpr const char *kAllocateSymbol = "cortado_jit_allocate";

} // namespace cortado::jit

/// @brief Allocation entry point called by compiled newarray.
extern "C" int64_t cortado_jit_allocate(int64_t size);
