//===----------------------------------------------------------------------===//
//
// Part of the Cortado project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the constant pool of a class file and the Constant
// tagged union stored in it.
//
// Indexing follows the JVM rules: index 0 is never valid, and Long/Double
// entries occupy two consecutive indices (the second one is unusable). The
// pool is populated by the class-file reader, or directly by tests through the
// add* helpers, and is read-only for the JIT.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "classfile/ClassFileError.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cortado::classfile
{

/// @brief Tagged constant-pool entry.
struct Constant
{
    /// @brief Constant tags; values equal the class-file encoding.
    enum class Tag : uint8_t
    {
        Utf8 = 1,
        Integer = 3,
        Float = 4,
        Long = 5,
        Double = 6,
        Class = 7,
        String = 8,
        Fieldref = 9,
        Methodref = 10,
        InterfaceMethodref = 11,
        NameAndType = 12
    };

    Tag tag = Tag::Utf8;
    std::string utf8;      ///< Payload when tag == Utf8.
    int32_t i32 = 0;       ///< Payload when tag == Integer.
    float f32 = 0.0f;      ///< Payload when tag == Float.
    int64_t i64 = 0;       ///< Payload when tag == Long.
    double f64 = 0.0;      ///< Payload when tag == Double.
    uint16_t first = 0;    ///< Class/String name index, or first index of a pair.
    uint16_t second = 0;   ///< Second index of Fieldref/Methodref/NameAndType.

    static Constant makeUtf8(std::string value);
    static Constant makeInteger(int32_t value);
    static Constant makeFloat(float value);
    static Constant makeLong(int64_t value);
    static Constant makeDouble(double value);
    static Constant makeClass(uint16_t nameIndex);
    static Constant makeString(uint16_t utf8Index);
    static Constant makeNameAndType(uint16_t nameIndex, uint16_t descriptorIndex);
    static Constant makeMethodref(uint16_t classIndex, uint16_t nameAndTypeIndex);

    /// @brief True for Long and Double, which occupy two pool slots.
    [[nodiscard]] bool isWide() const;
};

/// @brief Mnemonic of @p tag ("Integer", "Utf8", ...).
const char *toString(Constant::Tag tag);

/// @brief Render @p constant for diagnostics, e.g. "Integer(42)".
std::string toString(const Constant &constant);

/// @brief Indexed collection of constants.
class ConstantPool
{
  public:
    /// @brief Append @p constant and return its index.
    uint16_t add(Constant constant);

    uint16_t addUtf8(std::string value);
    uint16_t addInteger(int32_t value);
    uint16_t addFloat(float value);
    uint16_t addLong(int64_t value);
    uint16_t addDouble(double value);

    /// @brief Add a Utf8 entry for @p name and a Class entry pointing at it.
    /// @return Index of the Class entry.
    uint16_t addClass(std::string name);

    /// @brief Lookup without error reporting.
    /// @return Pointer to the constant or nullptr for an unusable index.
    [[nodiscard]] const Constant *get(uint16_t index) const;

    /// @brief Lookup reporting InvalidConstantPoolIndex on failure.
    [[nodiscard]] Expected<const Constant *> tryGet(uint16_t index) const;

    /// @brief Lookup a Utf8 entry.
    [[nodiscard]] Expected<std::string> tryGetUtf8(uint16_t index) const;

    /// @brief Lookup a Class entry and return its internal name.
    [[nodiscard]] Expected<std::string> tryGetClassName(uint16_t index) const;

    /// @brief Number of slots including the reserved slot 0.
    [[nodiscard]] size_t size() const;

  private:
    /// Slot 0 and the shadow slot after Long/Double stay empty.
    std::vector<std::optional<Constant>> slots_{std::nullopt};
};

} // namespace cortado::classfile
