#pragma once

/**
 * @file debug_log.h
 * @brief Opt-in stderr tracing for staleness, recompute and sparsity events.
 *
 * Each channel is off unless its environment variable is set when the channel is first queried:
 * - BLOCKFLOW_DEBUG_STALE      staleness announcements
 * - BLOCKFLOW_DEBUG_RECOMPUTE  successful block / scalar recomputes
 * - BLOCKFLOW_DEBUG_SPARSITY   pulls abandoned because an operand was absent
 *
 * Tests and embedding code can override the environment with set_debug_enabled().
 */

#include <blockflow/blockflow_export.h>

#include <fmt/format.h>

#include <cstdio>
#include <string_view>
#include <utility>

namespace blockflow {

enum class DebugChannel : unsigned char {
    Staleness = 0,
    Recompute = 1,
    Sparsity = 2,
};

[[nodiscard]] BLOCKFLOW_EXPORT bool debug_enabled(DebugChannel channel);

BLOCKFLOW_EXPORT void set_debug_enabled(DebugChannel channel, bool enabled);

[[nodiscard]] BLOCKFLOW_EXPORT std::string_view debug_channel_name(DebugChannel channel);

template<typename... Ts>
void debug_log(DebugChannel channel, fmt::format_string<Ts...> fmt_str, Ts&&... xs) {
    if (!debug_enabled(channel)) { return; }
    fmt::print(stderr, "[{}] {}\n", debug_channel_name(channel), fmt::format(fmt_str, std::forward<Ts>(xs)...));
}

} // namespace blockflow
