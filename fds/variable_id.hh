#ifndef FINITE_DOMAIN_SEARCH_GUARD_FDS_VARIABLE_ID_HH
#define FINITE_DOMAIN_SEARCH_GUARD_FDS_VARIABLE_ID_HH

#include <compare>
#include <cstddef>
#include <functional>

namespace fds
{
    /**
     * \brief Identifies a variable inside a CSP.
     *
     * Variables are compared by identity, not by name: two variables created
     * with the same name are still different variables. A VariableID is only
     * meaningful for the CSP that created it.
     *
     * \sa CSP::create_variable()
     * \ingroup Core
     */
    struct VariableID final
    {
        unsigned long long index;

        constexpr explicit VariableID(unsigned long long x) :
            index(x)
        {
        }

        [[nodiscard]] constexpr auto operator<=>(const VariableID &) const = default;
    };
}

template <>
struct std::hash<fds::VariableID>
{
    auto operator()(const fds::VariableID & v) const -> std::size_t
    {
        return std::hash<unsigned long long>{}(v.index);
    }
};

#endif
