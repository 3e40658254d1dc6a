//===----------------------------------------------------------------------===//
//
// Part of the Cortado project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Mnemonic lookup and control-flow classification for JVM opcodes. The name
// table is generated from `Opcode.def` so adding an opcode only touches the
// definition file.
//
//===----------------------------------------------------------------------===//

#include "classfile/Opcode.hpp"

namespace cortado::classfile
{

const char *toString(Opcode op)
{
    switch (op)
    {
#define CLASSFILE_OPCODE(NAME, MNEMONIC, BYTE)                                                     \
    case Opcode::NAME:                                                                             \
        return MNEMONIC;
#include "classfile/Opcode.def"
#undef CLASSFILE_OPCODE
    }
    return "<unknown>";
}

bool isConditionalBranch(Opcode op)
{
    switch (op)
    {
        case Opcode::Ifeq:
        case Opcode::Ifne:
        case Opcode::Iflt:
        case Opcode::Ifge:
        case Opcode::Ifgt:
        case Opcode::Ifle:
        case Opcode::IfIcmpeq:
        case Opcode::IfIcmpne:
        case Opcode::IfIcmplt:
        case Opcode::IfIcmpge:
        case Opcode::IfIcmpgt:
        case Opcode::IfIcmple:
        case Opcode::IfAcmpeq:
        case Opcode::IfAcmpne:
        case Opcode::Ifnull:
        case Opcode::Ifnonnull:
            return true;
        default:
            return false;
    }
}

bool isUnconditionalBranch(Opcode op)
{
    return op == Opcode::Goto || op == Opcode::GotoW;
}

bool isSwitch(Opcode op)
{
    return op == Opcode::Tableswitch || op == Opcode::Lookupswitch;
}

bool isReturn(Opcode op)
{
    switch (op)
    {
        case Opcode::Ireturn:
        case Opcode::Lreturn:
        case Opcode::Freturn:
        case Opcode::Dreturn:
        case Opcode::Areturn:
        case Opcode::Return:
            return true;
        default:
            return false;
    }
}

bool endsFallThrough(Opcode op)
{
    if (isUnconditionalBranch(op) || isSwitch(op) || isReturn(op))
        return true;
    switch (op)
    {
        case Opcode::Athrow:
        case Opcode::Ret:
        case Opcode::Jsr:
        case Opcode::JsrW:
            return true;
        default:
            return false;
    }
}

} // namespace cortado::classfile
