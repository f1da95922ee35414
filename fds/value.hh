#ifndef FINITE_DOMAIN_SEARCH_GUARD_FDS_VALUE_HH
#define FINITE_DOMAIN_SEARCH_GUARD_FDS_VALUE_HH

#include <cstddef>
#include <string>
#include <variant>

namespace fds
{
    /**
     * \brief A value that can appear in a Domain.
     *
     * Values are either integers, or symbols such as colour names. Two values
     * of different kinds are never equal.
     *
     * \ingroup Core
     */
    using Value = std::variant<long long, std::string>;

    /**
     * \brief Create a symbolic Value, so that `"red"_v` does not turn into
     * something surprising.
     *
     * \ingroup Core
     */
    [[nodiscard]] inline auto operator"" _v(const char * s, std::size_t n) -> Value
    {
        return Value{std::string(s, n)};
    }

    /**
     * \brief Create an integer Value from a literal.
     *
     * \ingroup Core
     */
    [[nodiscard]] inline auto operator"" _v(unsigned long long v) -> Value
    {
        return Value{static_cast<long long>(v)};
    }

    /**
     * \brief Give a human readable representation of a Value.
     *
     * \ingroup Core
     */
    [[nodiscard]] auto debug_string(const Value &) -> std::string;
}

#endif
