//===----------------------------------------------------------------------===//
//
// Part of the Cortado project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Factories and formatting for decoded JVM instructions.
//
//===----------------------------------------------------------------------===//

#include "classfile/Instruction.hpp"

#include <sstream>

namespace cortado::classfile
{

uint32_t elementSize(ArrayType type)
{
    switch (type)
    {
        case ArrayType::Boolean:
        case ArrayType::Byte:
            return 1;
        case ArrayType::Char:
        case ArrayType::Short:
            return 2;
        case ArrayType::Float:
        case ArrayType::Int:
            return 4;
        case ArrayType::Double:
        case ArrayType::Long:
            return 8;
    }
    return 0;
}

const char *toString(ArrayType type)
{
    switch (type)
    {
        case ArrayType::Boolean:
            return "boolean";
        case ArrayType::Char:
            return "char";
        case ArrayType::Float:
            return "float";
        case ArrayType::Double:
            return "double";
        case ArrayType::Byte:
            return "byte";
        case ArrayType::Short:
            return "short";
        case ArrayType::Int:
            return "int";
        case ArrayType::Long:
            return "long";
    }
    return "<invalid>";
}

Instruction Instruction::make(Opcode op)
{
    Instruction instr;
    instr.opcode = op;
    return instr;
}

Instruction Instruction::make(Opcode op, int32_t operand)
{
    Instruction instr;
    instr.opcode = op;
    instr.operand = operand;
    return instr;
}

Instruction Instruction::makeWide(Opcode op, uint16_t index)
{
    Instruction instr;
    instr.opcode = op;
    instr.operand = index;
    instr.wide = true;
    return instr;
}

Instruction Instruction::iinc(uint16_t index, int16_t delta, bool wide)
{
    Instruction instr;
    instr.opcode = Opcode::Iinc;
    instr.operand = index;
    instr.increment = delta;
    instr.wide = wide;
    return instr;
}

Instruction Instruction::newarray(ArrayType type)
{
    return make(Opcode::Newarray, static_cast<int32_t>(type));
}

Instruction Instruction::tableswitch(int32_t defaultOffset, int32_t low, std::vector<int32_t> offsets)
{
    Instruction instr;
    instr.opcode = Opcode::Tableswitch;
    instr.switchDefault = defaultOffset;
    instr.switchLow = low;
    instr.switchOffsets = std::move(offsets);
    return instr;
}

Instruction Instruction::lookupswitch(int32_t defaultOffset,
                                      std::vector<std::pair<int32_t, int32_t>> pairs)
{
    Instruction instr;
    instr.opcode = Opcode::Lookupswitch;
    instr.switchDefault = defaultOffset;
    instr.switchKeys.reserve(pairs.size());
    instr.switchOffsets.reserve(pairs.size());
    for (const auto &[key, offset] : pairs)
    {
        instr.switchKeys.push_back(key);
        instr.switchOffsets.push_back(offset);
    }
    return instr;
}

bool Instruction::hasBranchTarget() const
{
    return isConditionalBranch(opcode) || isUnconditionalBranch(opcode) || opcode == Opcode::Jsr ||
           opcode == Opcode::JsrW;
}

std::string toString(const Instruction &instr)
{
    std::ostringstream os;
    os << toString(instr.opcode);
    switch (instr.opcode)
    {
        case Opcode::Bipush:
        case Opcode::Sipush:
        case Opcode::Ldc:
        case Opcode::LdcW:
        case Opcode::Ldc2W:
        case Opcode::Iload:
        case Opcode::Lload:
        case Opcode::Fload:
        case Opcode::Dload:
        case Opcode::Aload:
        case Opcode::Istore:
        case Opcode::Lstore:
        case Opcode::Fstore:
        case Opcode::Dstore:
        case Opcode::Astore:
        case Opcode::Ret:
            os << (instr.wide ? "_w " : " ") << instr.operand;
            break;
        case Opcode::Iinc:
            os << (instr.wide ? "_w " : " ") << instr.operand << ' ' << instr.increment;
            break;
        case Opcode::Newarray:
            os << ' ' << toString(static_cast<ArrayType>(instr.operand));
            break;
        case Opcode::Tableswitch:
            os << " low=" << instr.switchLow << " cases=" << instr.switchOffsets.size()
               << " default=" << instr.switchDefault;
            break;
        case Opcode::Lookupswitch:
            os << " cases=" << instr.switchKeys.size() << " default=" << instr.switchDefault;
            break;
        default:
            if (instr.hasBranchTarget())
                os << ' ' << instr.operand;
            break;
    }
    return os.str();
}

} // namespace cortado::classfile
