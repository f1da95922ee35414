#ifndef FINITE_DOMAIN_SEARCH_GUARD_FDS_DOMAIN_HH
#define FINITE_DOMAIN_SEARCH_GUARD_FDS_DOMAIN_HH

#include <fds/value.hh>

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <vector>

namespace fds
{
    /**
     * \brief The ordered set of values still considered legal for a variable.
     *
     * A Domain never contains the same value twice, and constructing one with
     * a duplicate throws MalformedProblem. Values can be removed, and then put
     * back in exactly the position they came from, which is how the CSP trail
     * undoes pruning. An empty domain is a legitimate state, and indicates
     * failure.
     *
     * \ingroup Core
     */
    class Domain
    {
    private:
        std::vector<Value> _values;

    public:
        /**
         * \name Constructors, destructors, etc.
         * @{
         */
        Domain() = default;

        explicit Domain(std::vector<Value>);

        Domain(std::initializer_list<Value>);

        ///@}

        /**
         * \name Queries.
         * @{
         */
        [[nodiscard]] auto size() const -> std::size_t;

        [[nodiscard]] auto empty() const -> bool;

        [[nodiscard]] auto contains(const Value &) const -> bool;

        [[nodiscard]] auto position_of(const Value &) const -> std::optional<std::size_t>;

        [[nodiscard]] auto values() const -> const std::vector<Value> &;

        [[nodiscard]] auto begin() const -> std::vector<Value>::const_iterator;

        [[nodiscard]] auto end() const -> std::vector<Value>::const_iterator;

        [[nodiscard]] auto operator==(const Domain &) const -> bool = default;

        ///@}

        /**
         * \name Reduction and restoration.
         * @{
         */

        /**
         * Remove a value, returning the position it was at so that it can be
         * restored later, or nullopt if it was not present.
         */
        auto remove(const Value &) -> std::optional<std::size_t>;

        /**
         * Put a value back at the given position. Restoring must happen in the
         * reverse order of removal.
         */
        auto restore(std::size_t position, const Value &) -> void;

        ///@}
    };
}

#endif
