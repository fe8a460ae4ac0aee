#ifndef BLOCKFLOW_UTIL_ERRORS
#define BLOCKFLOW_UTIL_ERRORS

#include <fmt/format.h>

#include <concepts>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>

namespace blockflow {

    /**
     * Raised when a graph is wired in a way that can never evaluate: mismatched block geometry across a
     * dependency edge, a missing upstream, the wrong number of upstreams, or an invalid BlockConfig.
     * These are programmer errors and surface at construction time, never during a pull.
     */
    struct ConfigurationError : std::logic_error {
        using std::logic_error::logic_error;
    };

    /**
     * A format string that captures where it was written, so the formatting overload of throw_error can append
     * the source location even though its arguments are a pack.
     */
    template<typename... Ts>
    struct located_format_string {
        template<typename S>
            requires std::convertible_to<const S &, std::string_view>
        consteval located_format_string(const S &s, std::source_location location = std::source_location::current())
            : str{s}, loc{location} {}

        fmt::format_string<Ts...> str;
        std::source_location loc;
    };

    // Overload (I) - takes error msg and appends the source location
    template<typename Error = std::runtime_error>
        requires std::constructible_from<Error, std::string>
    [[noreturn]] constexpr auto throw_error(
        std::string_view msg,
        std::source_location loc = std::source_location::current()
    ) {
        throw Error{fmt::format(
            "{}\nFile: {}({}:{}): {}", msg,
            loc.file_name(), loc.line(), loc.column(), loc.function_name()
        )};
    }

    // Overload (II) - direct formatting of error msg from args, the source location is appended as in (I)
    template<typename Error = std::runtime_error, typename... Ts>
        requires (std::constructible_from<Error, std::string> && sizeof...(Ts) > 0)
    [[noreturn]] constexpr auto throw_error(located_format_string<std::type_identity_t<Ts>...> fmt_str, Ts&&... xs) {
        throw Error{fmt::format(
            "{}\nFile: {}({}:{}): {}", fmt::format(fmt_str.str, std::forward<Ts>(xs)...),
            fmt_str.loc.file_name(), fmt_str.loc.line(), fmt_str.loc.column(), fmt_str.loc.function_name()
        )};
    }

} // namespace blockflow

#endif // BLOCKFLOW_UTIL_ERRORS
