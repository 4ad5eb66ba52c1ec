#ifndef PULSEGRAPH_UTIL_ERRORS
#define PULSEGRAPH_UTIL_ERRORS

#include <fmt/format.h>

#include <concepts>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>

namespace pulsegraph {

    /**
     * Programmer errors: the lifecycle flag protocol was bypassed, the graph topology was misused, etc.
     * These are never recovered from, they are surfaced to whoever invoked the operation.
     */
    struct ProtocolViolation : std::logic_error {
        using std::logic_error::logic_error;
    };

    struct DuplicateNodeError : ProtocolViolation {
        using ProtocolViolation::ProtocolViolation;
    };

    struct CycleError : ProtocolViolation {
        using ProtocolViolation::ProtocolViolation;
    };

    /**
     * A value is outside the domain the receiving node declares (attribute setters, channel metadata,
     * incoming chunk shapes). The node stays non-functional until the value is corrected.
     */
    struct ValidationError : std::invalid_argument {
        using std::invalid_argument::invalid_argument;
    };

    // Overload (I) - takes error msg and appends source location
    template<typename Error = std::runtime_error>
        requires std::constructible_from<Error, std::string>
    [[noreturn]] void throw_error(std::string_view msg,
                                  std::source_location loc = std::source_location::current()) {
        throw Error{fmt::format("{}\nFile: {}({}:{}): {}", msg, loc.file_name(), loc.line(), loc.column(),
                                loc.function_name())};
    }

    // Overload (II) - direct formatting of error msg from args
    template<typename Error = std::runtime_error, typename... Ts>
        requires (std::constructible_from<Error, std::string> && sizeof...(Ts) > 0)
    [[noreturn]] void throw_error(fmt::format_string<Ts...> fmt_str, Ts &&... xs) {
        throw Error{fmt::format(fmt_str, std::forward<Ts>(xs)...)};
    }

} // namespace pulsegraph

#endif // PULSEGRAPH_UTIL_ERRORS
