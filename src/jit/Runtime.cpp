//===----------------------------------------------------------------------===//
//
// Part of the Cortado project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Default JIT heap: a process-wide arena guarded by a mutex so concurrently
// executing functions can allocate arrays. Memory is never reclaimed; a VM
// with a collector installs its own hook.
//
//===----------------------------------------------------------------------===//

#include "jit/Runtime.hpp"

#include "support/arena.hpp"

#include <atomic>
#include <mutex>
#include <new>

namespace cortado::jit
{
namespace
{

/// Largest single request the default heap serves; larger ones report
/// OutOfMemoryError instead of committing the memory.
constexpr int64_t kMaxHeapRequest = int64_t{1} << 30;

std::atomic<AllocateHook> allocateHook{nullptr};

int64_t defaultAllocate(int64_t size)
{
    static std::mutex mutex;
    static support::Arena heap;
    if (size < 0 || size > kMaxHeapRequest)
        return 0;
    std::lock_guard<std::mutex> lock(mutex);
    try
    {
        void *memory = heap.allocate(static_cast<size_t>(size), 8);
        return static_cast<int64_t>(reinterpret_cast<intptr_t>(memory));
    }
    catch (const std::bad_alloc &)
    {
        // Compiled frames cannot unwind; the caller traps on 0.
        return 0;
    }
}

} // namespace

const char *exceptionClassName(TrapCode code)
{
    switch (code)
    {
        case TrapCode::None:
            return nullptr;
        case TrapCode::ArithmeticException:
            return "java/lang/ArithmeticException";
        case TrapCode::NegativeArraySizeException:
            return "java/lang/NegativeArraySizeException";
        case TrapCode::ArrayIndexOutOfBoundsException:
            return "java/lang/ArrayIndexOutOfBoundsException";
        case TrapCode::NullPointerException:
            return "java/lang/NullPointerException";
        case TrapCode::OutOfMemoryError:
            return "java/lang/OutOfMemoryError";
    }
    return nullptr;
}

bool isInstanceOf(TrapCode code, std::string_view className)
{
    const char *name = exceptionClassName(code);
    if (!name)
        return false;
    if (className == name || className == "java/lang/Throwable")
        return true;
    if (code == TrapCode::OutOfMemoryError)
        return className == "java/lang/VirtualMachineError" || className == "java/lang/Error";
    if (code == TrapCode::ArrayIndexOutOfBoundsException &&
        className == "java/lang/IndexOutOfBoundsException")
        return true;
    return className == "java/lang/RuntimeException" || className == "java/lang/Exception";
}

void setAllocateHook(AllocateHook hook)
{
    allocateHook.store(hook, std::memory_order_release);
}

} // namespace cortado::jit

extern "C" int64_t cortado_jit_allocate(int64_t size)
{
    if (auto hook = cortado::jit::allocateHook.load(std::memory_order_acquire))
        return hook(size);
    return cortado::jit::defaultAllocate(size);
}
