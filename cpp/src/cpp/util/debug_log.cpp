#include <blockflow/util/debug_log.h>

#include <array>
#include <cstdlib>
#include <optional>

namespace blockflow {

namespace {

constexpr std::size_t CHANNEL_COUNT = 3;

constexpr std::array<const char *, CHANNEL_COUNT> ENV_NAMES{
    "BLOCKFLOW_DEBUG_STALE",
    "BLOCKFLOW_DEBUG_RECOMPUTE",
    "BLOCKFLOW_DEBUG_SPARSITY",
};

constexpr std::array<std::string_view, CHANNEL_COUNT> CHANNEL_NAMES{"STALE", "RECOMPUTE", "SPARSITY"};

// Lazily seeded from the environment, single-threaded like the rest of the graph.
std::array<std::optional<bool>, CHANNEL_COUNT> &channel_state() {
    static std::array<std::optional<bool>, CHANNEL_COUNT> state{};
    return state;
}

} // namespace

bool debug_enabled(DebugChannel channel) {
    auto index = static_cast<std::size_t>(channel);
    auto &state = channel_state()[index];
    if (!state.has_value()) { state = std::getenv(ENV_NAMES[index]) != nullptr; }
    return *state;
}

void set_debug_enabled(DebugChannel channel, bool enabled) {
    channel_state()[static_cast<std::size_t>(channel)] = enabled;
}

std::string_view debug_channel_name(DebugChannel channel) {
    return CHANNEL_NAMES[static_cast<std::size_t>(channel)];
}

} // namespace blockflow
