//===----------------------------------------------------------------------===//
//
// Part of the Cortado project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Kind-level simulation of the supported instruction set. The control-flow
// builder runs this over every reachable block to derive entry shapes before
// any IR is emitted; the IR translator repeats the same pops and pushes on
// real values, so both must stay in step opcode for opcode.
//
//===----------------------------------------------------------------------===//

#include "jit/TypeStack.hpp"

namespace cortado::jit
{

using classfile::Constant;
using classfile::Instruction;
using classfile::Opcode;

const char *toString(StackKind kind)
{
    switch (kind)
    {
        case StackKind::Int:
            return "Int";
        case StackKind::Long:
            return "Long";
        case StackKind::Float:
            return "Float";
        case StackKind::Double:
            return "Double";
        case StackKind::Reference:
            return "Reference";
    }
    return "<unknown>";
}

std::optional<StackKind> stackKindOf(Kind kind)
{
    switch (kind)
    {
        case Kind::Int32:
            return StackKind::Int;
        case Kind::Int64:
            return StackKind::Long;
        case Kind::Float32:
            return StackKind::Float;
        case Kind::Float64:
            return StackKind::Double;
        case Kind::Void:
            break;
    }
    return std::nullopt;
}

std::string toString(const StackShape &shape)
{
    std::string out = "[";
    for (size_t i = 0; i < shape.size(); ++i)
    {
        if (i != 0)
            out += ", ";
        out += toString(shape[i]);
    }
    out += "]";
    return out;
}

TypeStack::TypeStack(StackShape initial, size_t maxDepth)
    : kinds_(std::move(initial)), maxDepth_(maxDepth)
{
}

Expected<void> TypeStack::push(StackKind kind)
{
    if (kinds_.size() >= maxDepth_)
    {
        return Error::internal("operand stack depth exceeds max_stack " +
                               std::to_string(maxDepth_));
    }
    kinds_.push_back(kind);
    return {};
}

Expected<void> TypeStack::pop(StackKind expected)
{
    auto actual = popAny();
    if (!actual)
        return actual.error();
    if (actual.value() != expected)
        return Error::mismatch(ErrorKind::InvalidValue, toString(expected), toString(actual.value()));
    return {};
}

Expected<StackKind> TypeStack::popAny()
{
    if (kinds_.empty())
        return Error::make(ErrorKind::OperandStackUnderflow, "operand stack underflow");
    const StackKind kind = kinds_.back();
    kinds_.pop_back();
    return kind;
}

Expected<void> TypeStack::shuffle(Opcode op)
{
    auto result = applyStackShuffle(op, kinds_, [](StackKind kind) { return kind; });
    if (!result)
        return result;
    if (kinds_.size() > maxDepth_)
    {
        return Error::internal("operand stack depth exceeds max_stack " +
                               std::to_string(maxDepth_));
    }
    return {};
}

Expected<StackKind> constantKind(const classfile::ConstantPool &pool, const Instruction &instr)
{
    const Constant *constant = nullptr;
    if (instr.operand >= 0 && instr.operand <= 0xffff)
        constant = pool.get(static_cast<uint16_t>(instr.operand));
    if (!constant)
    {
        return Error::make(ErrorKind::InvalidConstantIndex,
                           "invalid constant index " + std::to_string(instr.operand));
    }

    if (instr.opcode == Opcode::Ldc2W)
    {
        if (constant->tag == Constant::Tag::Long)
            return StackKind::Long;
        if (constant->tag == Constant::Tag::Double)
            return StackKind::Double;
        return Error::mismatch(ErrorKind::InvalidConstant, "Long|Double", toString(constant->tag));
    }
    if (constant->tag == Constant::Tag::Integer)
        return StackKind::Int;
    if (constant->tag == Constant::Tag::Float)
        return StackKind::Float;
    return Error::mismatch(ErrorKind::InvalidConstant, "Integer|Float", toString(constant->tag));
}

Expected<void> checkLocalIndex(uint32_t index, StackKind kind, size_t maxLocals)
{
    const size_t last = static_cast<size_t>(index) + (isCategory2(kind) ? 1 : 0);
    if (last >= maxLocals)
    {
        return Error::make(ErrorKind::InvalidLocalVariableIndex,
                           "invalid local variable index " + std::to_string(index));
    }
    return {};
}

namespace
{

/// Kind loaded or stored by a local-variable opcode, and its implicit index
/// for the _0.._3 forms.
struct LocalAccess
{
    StackKind kind;
    std::optional<uint32_t> fixedIndex;
    bool store;
};

std::optional<LocalAccess> localAccess(Opcode op)
{
    switch (op)
    {
        case Opcode::Iload:
            return LocalAccess{StackKind::Int, std::nullopt, false};
        case Opcode::Lload:
            return LocalAccess{StackKind::Long, std::nullopt, false};
        case Opcode::Fload:
            return LocalAccess{StackKind::Float, std::nullopt, false};
        case Opcode::Dload:
            return LocalAccess{StackKind::Double, std::nullopt, false};
        case Opcode::Aload:
            return LocalAccess{StackKind::Reference, std::nullopt, false};
        case Opcode::Istore:
            return LocalAccess{StackKind::Int, std::nullopt, true};
        case Opcode::Lstore:
            return LocalAccess{StackKind::Long, std::nullopt, true};
        case Opcode::Fstore:
            return LocalAccess{StackKind::Float, std::nullopt, true};
        case Opcode::Dstore:
            return LocalAccess{StackKind::Double, std::nullopt, true};
        case Opcode::Astore:
            return LocalAccess{StackKind::Reference, std::nullopt, true};
        default:
            break;
    }

    const auto byte = static_cast<uint8_t>(op);
    const auto loadBase = static_cast<uint8_t>(Opcode::Iload0);
    const auto storeBase = static_cast<uint8_t>(Opcode::Istore0);
    static constexpr StackKind kinds[] = {StackKind::Int,
                                          StackKind::Long,
                                          StackKind::Float,
                                          StackKind::Double,
                                          StackKind::Reference};
    if (byte >= loadBase && byte < loadBase + 20)
    {
        const unsigned rel = byte - loadBase;
        return LocalAccess{kinds[rel / 4], rel % 4, false};
    }
    if (byte >= storeBase && byte < storeBase + 20)
    {
        const unsigned rel = byte - storeBase;
        return LocalAccess{kinds[rel / 4], rel % 4, true};
    }
    return std::nullopt;
}

/// Record a store of @p kind into @p index, invalidating overlapped halves.
void storeLocal(LocalShape &locals, uint32_t index, StackKind kind)
{
    if (index > 0 && locals[index - 1] && isCategory2(*locals[index - 1]))
        locals[index - 1].reset();
    locals[index] = kind;
    if (isCategory2(kind))
        locals[index + 1].reset();
}

/// Binary operation: pop two of @p kind, push one of @p kind.
Expected<void> binary(TypeStack &stack, StackKind kind)
{
    if (auto r = stack.pop(kind); !r)
        return r;
    if (auto r = stack.pop(kind); !r)
        return r;
    return stack.push(kind);
}

/// Shift: pop an int amount and a value of @p kind, push @p kind.
Expected<void> shift(TypeStack &stack, StackKind kind)
{
    if (auto r = stack.pop(StackKind::Int); !r)
        return r;
    if (auto r = stack.pop(kind); !r)
        return r;
    return stack.push(kind);
}

Expected<void> unary(TypeStack &stack, StackKind from, StackKind to)
{
    if (auto r = stack.pop(from); !r)
        return r;
    return stack.push(to);
}

Expected<void> compare(TypeStack &stack, StackKind kind)
{
    if (auto r = stack.pop(kind); !r)
        return r;
    if (auto r = stack.pop(kind); !r)
        return r;
    return stack.push(StackKind::Int);
}

Expected<void> popN(TypeStack &stack, StackKind kind, unsigned count)
{
    for (unsigned i = 0; i < count; ++i)
    {
        if (auto r = stack.pop(kind); !r)
            return r;
    }
    return {};
}

Expected<void> arrayLoad(TypeStack &stack, StackKind element)
{
    if (auto r = stack.pop(StackKind::Int); !r)
        return r;
    if (auto r = stack.pop(StackKind::Reference); !r)
        return r;
    return stack.push(element);
}

Expected<void> arrayStore(TypeStack &stack, StackKind element)
{
    if (auto r = stack.pop(element); !r)
        return r;
    if (auto r = stack.pop(StackKind::Int); !r)
        return r;
    return stack.pop(StackKind::Reference);
}

} // namespace

Expected<void> applyStackEffect(const Instruction &instr,
                                const classfile::ConstantPool &pool,
                                TypeStack &stack,
                                LocalShape &locals)
{
    const Opcode op = instr.opcode;

    if (auto access = localAccess(op))
    {
        const uint32_t index =
            access->fixedIndex ? *access->fixedIndex : static_cast<uint32_t>(instr.operand);
        if (auto r = checkLocalIndex(index, access->kind, locals.size()); !r)
            return r;
        if (!access->store)
            return stack.push(access->kind);
        if (auto r = stack.pop(access->kind); !r)
            return r;
        storeLocal(locals, index, access->kind);
        return {};
    }

    switch (op)
    {
        case Opcode::Nop:
            return {};

        case Opcode::AconstNull:
            return stack.push(StackKind::Reference);
        case Opcode::IconstM1:
        case Opcode::Iconst0:
        case Opcode::Iconst1:
        case Opcode::Iconst2:
        case Opcode::Iconst3:
        case Opcode::Iconst4:
        case Opcode::Iconst5:
        case Opcode::Bipush:
        case Opcode::Sipush:
            return stack.push(StackKind::Int);
        case Opcode::Lconst0:
        case Opcode::Lconst1:
            return stack.push(StackKind::Long);
        case Opcode::Fconst0:
        case Opcode::Fconst1:
        case Opcode::Fconst2:
            return stack.push(StackKind::Float);
        case Opcode::Dconst0:
        case Opcode::Dconst1:
            return stack.push(StackKind::Double);
        case Opcode::Ldc:
        case Opcode::LdcW:
        case Opcode::Ldc2W:
        {
            auto kind = constantKind(pool, instr);
            if (!kind)
                return kind.error();
            return stack.push(kind.value());
        }

        case Opcode::Iinc:
            return checkLocalIndex(static_cast<uint32_t>(instr.operand), StackKind::Int, locals.size());

        case Opcode::Pop:
        case Opcode::Pop2:
        case Opcode::Dup:
        case Opcode::DupX1:
        case Opcode::DupX2:
        case Opcode::Dup2:
        case Opcode::Dup2X1:
        case Opcode::Dup2X2:
        case Opcode::Swap:
            return stack.shuffle(op);

        case Opcode::Iadd:
        case Opcode::Isub:
        case Opcode::Imul:
        case Opcode::Idiv:
        case Opcode::Irem:
        case Opcode::Iand:
        case Opcode::Ior:
        case Opcode::Ixor:
            return binary(stack, StackKind::Int);
        case Opcode::Ladd:
        case Opcode::Lsub:
        case Opcode::Lmul:
        case Opcode::Ldiv:
        case Opcode::Lrem:
        case Opcode::Land:
        case Opcode::Lor:
        case Opcode::Lxor:
            return binary(stack, StackKind::Long);
        case Opcode::Fadd:
        case Opcode::Fsub:
        case Opcode::Fmul:
        case Opcode::Fdiv:
        case Opcode::Frem:
            return binary(stack, StackKind::Float);
        case Opcode::Dadd:
        case Opcode::Dsub:
        case Opcode::Dmul:
        case Opcode::Ddiv:
        case Opcode::Drem:
            return binary(stack, StackKind::Double);
        case Opcode::Ineg:
            return unary(stack, StackKind::Int, StackKind::Int);
        case Opcode::Lneg:
            return unary(stack, StackKind::Long, StackKind::Long);
        case Opcode::Fneg:
            return unary(stack, StackKind::Float, StackKind::Float);
        case Opcode::Dneg:
            return unary(stack, StackKind::Double, StackKind::Double);
        case Opcode::Ishl:
        case Opcode::Ishr:
        case Opcode::Iushr:
            return shift(stack, StackKind::Int);
        case Opcode::Lshl:
        case Opcode::Lshr:
        case Opcode::Lushr:
            return shift(stack, StackKind::Long);

        case Opcode::I2l:
            return unary(stack, StackKind::Int, StackKind::Long);
        case Opcode::I2f:
            return unary(stack, StackKind::Int, StackKind::Float);
        case Opcode::I2d:
            return unary(stack, StackKind::Int, StackKind::Double);
        case Opcode::L2i:
            return unary(stack, StackKind::Long, StackKind::Int);
        case Opcode::L2f:
            return unary(stack, StackKind::Long, StackKind::Float);
        case Opcode::L2d:
            return unary(stack, StackKind::Long, StackKind::Double);
        case Opcode::F2i:
            return unary(stack, StackKind::Float, StackKind::Int);
        case Opcode::F2l:
            return unary(stack, StackKind::Float, StackKind::Long);
        case Opcode::F2d:
            return unary(stack, StackKind::Float, StackKind::Double);
        case Opcode::D2i:
            return unary(stack, StackKind::Double, StackKind::Int);
        case Opcode::D2l:
            return unary(stack, StackKind::Double, StackKind::Long);
        case Opcode::D2f:
            return unary(stack, StackKind::Double, StackKind::Float);
        case Opcode::I2b:
        case Opcode::I2c:
        case Opcode::I2s:
            return unary(stack, StackKind::Int, StackKind::Int);

        case Opcode::Lcmp:
            return compare(stack, StackKind::Long);
        case Opcode::Fcmpl:
        case Opcode::Fcmpg:
            return compare(stack, StackKind::Float);
        case Opcode::Dcmpl:
        case Opcode::Dcmpg:
            return compare(stack, StackKind::Double);

        case Opcode::Ifeq:
        case Opcode::Ifne:
        case Opcode::Iflt:
        case Opcode::Ifge:
        case Opcode::Ifgt:
        case Opcode::Ifle:
        case Opcode::Tableswitch:
        case Opcode::Lookupswitch:
            return stack.pop(StackKind::Int);
        case Opcode::IfIcmpeq:
        case Opcode::IfIcmpne:
        case Opcode::IfIcmplt:
        case Opcode::IfIcmpge:
        case Opcode::IfIcmpgt:
        case Opcode::IfIcmple:
            return popN(stack, StackKind::Int, 2);
        case Opcode::IfAcmpeq:
        case Opcode::IfAcmpne:
            return popN(stack, StackKind::Reference, 2);
        case Opcode::Ifnull:
        case Opcode::Ifnonnull:
        case Opcode::Monitorenter:
        case Opcode::Monitorexit:
            return stack.pop(StackKind::Reference);
        case Opcode::Goto:
        case Opcode::GotoW:
            return {};

        case Opcode::Ireturn:
            return stack.pop(StackKind::Int);
        case Opcode::Lreturn:
            return stack.pop(StackKind::Long);
        case Opcode::Freturn:
            return stack.pop(StackKind::Float);
        case Opcode::Dreturn:
            return stack.pop(StackKind::Double);
        case Opcode::Return:
            return {};

        case Opcode::Newarray:
            return unary(stack, StackKind::Int, StackKind::Reference);
        case Opcode::Arraylength:
            return unary(stack, StackKind::Reference, StackKind::Int);
        case Opcode::Iaload:
        case Opcode::Baload:
        case Opcode::Caload:
        case Opcode::Saload:
            return arrayLoad(stack, StackKind::Int);
        case Opcode::Laload:
            return arrayLoad(stack, StackKind::Long);
        case Opcode::Faload:
            return arrayLoad(stack, StackKind::Float);
        case Opcode::Daload:
            return arrayLoad(stack, StackKind::Double);
        case Opcode::Iastore:
        case Opcode::Bastore:
        case Opcode::Castore:
        case Opcode::Sastore:
            return arrayStore(stack, StackKind::Int);
        case Opcode::Lastore:
            return arrayStore(stack, StackKind::Long);
        case Opcode::Fastore:
            return arrayStore(stack, StackKind::Float);
        case Opcode::Dastore:
            return arrayStore(stack, StackKind::Double);

        default:
            break;
    }
    return Error::make(ErrorKind::UnsupportedInstruction, toString(instr));
}

} // namespace cortado::jit
