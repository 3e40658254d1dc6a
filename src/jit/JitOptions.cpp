//===----------------------------------------------------------------------===//
//
// Part of the Cortado project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Environment overlay for JitOptions. Unparseable values leave the default
// untouched.
//
//===----------------------------------------------------------------------===//

#include "jit/JitOptions.hpp"

#include <cstdlib>
#include <optional>
#include <string_view>

namespace cortado::jit
{
namespace
{

std::optional<bool> envFlag(const char *name)
{
    const char *raw = std::getenv(name);
    if (!raw)
        return std::nullopt;
    const std::string_view text(raw);
    if (text == "1" || text == "true" || text == "on")
        return true;
    if (text == "0" || text == "false" || text == "off")
        return false;
    return std::nullopt;
}

} // namespace

JitOptions JitOptions::fromEnvironment()
{
    JitOptions opts;
    if (auto trace = envFlag("CORTADO_JIT_TRACE"))
        opts.trace = *trace;
    if (auto verify = envFlag("CORTADO_JIT_VERIFY"))
        opts.verify = *verify;
    if (const char *raw = std::getenv("CORTADO_JIT_OPT"))
    {
        const std::string_view text(raw);
        if (text.size() == 1 && text[0] >= '0' && text[0] <= '3')
            opts.optLevel = static_cast<unsigned>(text[0] - '0');
    }
    return opts;
}

} // namespace cortado::jit
