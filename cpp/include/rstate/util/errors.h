#ifndef RSTATE_UTIL_ERRORS
#define RSTATE_UTIL_ERRORS

#include <fmt/format.h>

#include <concepts>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>

namespace rstate {

    template<typename Error = std::runtime_error, typename... Ts>
        requires (!std::constructible_from<Error, std::string>)
    [[noreturn]] constexpr auto throw_error(Ts&&... args) {
        throw Error{std::forward<Ts>(args)...};
    }

    // Overload (I) - takes error msg and appends the source location of the throw site
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

    // Overload (II) - direct formatting of error msg from args
    template<typename Error = std::runtime_error, typename... Ts>
        requires (std::constructible_from<Error, std::string> && sizeof...(Ts) > 0)
    [[noreturn]] constexpr auto throw_error(fmt::format_string<Ts...> fmt_str, Ts&&... xs) {
        throw Error{fmt::format(fmt_str, std::forward<Ts>(xs)...)};
    }

    /**
     * Base of the errors raised by the engine itself. Errors raised by consumer computations are never wrapped,
     * they propagate as thrown.
     */
    struct ReactiveError : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    /**
     * A Value (or PlainValue) was accessed as an alternative it does not hold.
     */
    struct BadValueType : ReactiveError {
        BadValueType(std::string_view expected, std::string_view actual)
            : ReactiveError{fmt::format("Expected value of type '{}', got: {}", expected, actual)} {}
    };

    /**
     * A handle refers to a container that has been released (or never belonged to this engine).
     */
    struct ReleasedContainerError : ReactiveError {
        using ReactiveError::ReactiveError;
    };

    /**
     * Attempt to write a field that is backed by a derived value.
     */
    struct ReadOnlyFieldError : ReactiveError {
        using ReactiveError::ReactiveError;
    };

    /**
     * A derived value was read while it was computing itself.
     */
    struct CircularDependencyError : ReactiveError {
        using ReactiveError::ReactiveError;
    };

} // namespace rstate

#endif // RSTATE_UTIL_ERRORS
