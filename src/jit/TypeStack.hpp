//===----------------------------------------------------------------------===//
//
// Part of the Cortado project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: jit/TypeStack.hpp
// Purpose: Compile-time value kinds, operand-stack shuffles shared by the
//          kind-level and IR-level stacks, and the kind-level stack effect of
//          every supported instruction.
// Key invariants: Long and Double are category 2 (two words); Int, Float and
//                 Reference are category 1. Shuffles never split a category 2
//                 value.
// Ownership/Lifetime: TypeStack owns its kinds by value.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "classfile/ConstantPool.hpp"
#include "classfile/Instruction.hpp"
#include "jit/Error.hpp"
#include "jit/Signature.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace cortado::jit
{

/// @brief Kind of a value on the simulated operand stack or in a local.
enum class StackKind : uint8_t
{
    Int,
    Long,
    Float,
    Double,
    Reference
};

const char *toString(StackKind kind);

/// @brief True for Long and Double.
inline bool isCategory2(StackKind kind)
{
    return kind == StackKind::Long || kind == StackKind::Double;
}

/// @brief Stack kind carrying a signature kind; empty for Void.
std::optional<StackKind> stackKindOf(Kind kind);

/// @brief Operand-stack kinds, bottom first.
using StackShape = std::vector<StackKind>;

/// @brief Kind held by each local slot; empty for dead or unset slots and for
///        the upper half of a category 2 value.
using LocalShape = std::vector<std::optional<StackKind>>;

/// @brief Render as "[Int, Long]".
std::string toString(const StackShape &shape);

namespace detail
{

/// @brief Count entries below the top @p skip entries that make up exactly
///        @p words stack words.
template <class Entry, class KindOf>
Expected<size_t> entriesForWords(const std::vector<Entry> &slots,
                                 size_t skip,
                                 unsigned words,
                                 KindOf kindOf)
{
    size_t count = 0;
    unsigned covered = 0;
    while (covered < words)
    {
        if (skip + count >= slots.size())
            return Error::make(ErrorKind::OperandStackUnderflow, "operand stack underflow");
        const StackKind kind = kindOf(slots[slots.size() - 1 - skip - count]);
        covered += isCategory2(kind) ? 2 : 1;
        ++count;
        if (covered > words)
            return Error::mismatch(ErrorKind::InvalidValue, "category 1 value", toString(kind));
    }
    return count;
}

} // namespace detail

/// @brief Apply pop, pop2, dup*, dup2* or swap to @p slots (top at back).
/// @details Operand groups are measured in stack words so every form of the
///          category rules falls out of one rule: copy the top group of
///          @p n words and insert it below the next group of @p m words.
template <class Entry, class KindOf>
Expected<void> applyStackShuffle(classfile::Opcode op, std::vector<Entry> &slots, KindOf kindOf)
{
    using classfile::Opcode;

    unsigned topWords = 0;
    unsigned belowWords = 0;
    switch (op)
    {
        case Opcode::Pop:
        case Opcode::Pop2:
        {
            auto top = detail::entriesForWords(slots, 0, op == Opcode::Pop ? 1 : 2, kindOf);
            if (!top)
                return top.error();
            slots.resize(slots.size() - top.value());
            return {};
        }
        case Opcode::Swap:
        {
            auto top = detail::entriesForWords(slots, 0, 1, kindOf);
            if (!top)
                return top.error();
            auto below = detail::entriesForWords(slots, 1, 1, kindOf);
            if (!below)
                return below.error();
            std::swap(slots[slots.size() - 1], slots[slots.size() - 2]);
            return {};
        }
        case Opcode::Dup:
            topWords = 1;
            break;
        case Opcode::DupX1:
            topWords = 1;
            belowWords = 1;
            break;
        case Opcode::DupX2:
            topWords = 1;
            belowWords = 2;
            break;
        case Opcode::Dup2:
            topWords = 2;
            break;
        case Opcode::Dup2X1:
            topWords = 2;
            belowWords = 1;
            break;
        case Opcode::Dup2X2:
            topWords = 2;
            belowWords = 2;
            break;
        default:
            return Error::internal(std::string("not a stack shuffle: ") + classfile::toString(op));
    }

    auto top = detail::entriesForWords(slots, 0, topWords, kindOf);
    if (!top)
        return top.error();
    size_t below = 0;
    if (belowWords != 0)
    {
        auto entries = detail::entriesForWords(slots, top.value(), belowWords, kindOf);
        if (!entries)
            return entries.error();
        below = entries.value();
    }

    const size_t insertAt = slots.size() - top.value() - below;
    std::vector<Entry> copy(slots.end() - static_cast<std::ptrdiff_t>(top.value()), slots.end());
    slots.insert(slots.begin() + static_cast<std::ptrdiff_t>(insertAt), copy.begin(), copy.end());
    return {};
}

/// @brief Operand stack of kinds used by the control-flow dataflow pass.
class TypeStack
{
  public:
    TypeStack(StackShape initial, size_t maxDepth);

    /// @brief Push @p kind; exceeding the declared depth is InternalError.
    Expected<void> push(StackKind kind);

    /// @brief Pop a value that must have kind @p expected.
    Expected<void> pop(StackKind expected);

    /// @brief Pop the top value whatever its kind.
    Expected<StackKind> popAny();

    /// @brief Apply a stack shuffle opcode.
    Expected<void> shuffle(classfile::Opcode op);

    [[nodiscard]] const StackShape &shape() const
    {
        return kinds_;
    }

  private:
    StackShape kinds_;
    size_t maxDepth_;
};

/// @brief Kind pushed by ldc, ldc_w or ldc2_w.
/// @return InvalidConstantIndex for an unusable index; InvalidConstant when
///         the entry is not a loadable numeric constant of the right width.
Expected<StackKind> constantKind(const classfile::ConstantPool &pool,
                                 const classfile::Instruction &instr);

/// @brief Validate that local @p index can hold a value of @p kind within
///        @p maxLocals slots.
Expected<void> checkLocalIndex(uint32_t index, StackKind kind, size_t maxLocals);

/// @brief Apply the kind-level effect of @p instr to @p stack and @p locals.
/// @details Control transfers only pop their operands; successor selection is
///          the caller's job.
Expected<void> applyStackEffect(const classfile::Instruction &instr,
                                const classfile::ConstantPool &pool,
                                TypeStack &stack,
                                LocalShape &locals);

} // namespace cortado::jit
