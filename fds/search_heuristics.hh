#ifndef FINITE_DOMAIN_SEARCH_GUARD_FDS_SEARCH_HEURISTICS_HH
#define FINITE_DOMAIN_SEARCH_GUARD_FDS_SEARCH_HEURISTICS_HH

#include <fds/assignment.hh>
#include <fds/csp.hh>
#include <fds/value.hh>
#include <fds/variable_id.hh>

#include <functional>
#include <optional>
#include <vector>

namespace fds
{
    /**
     * \defgroup SearchHeuristics Common search heuristics for FlexibleBacktrackingSolver
     */

    /**
     * Specifies how to decide which variable to branch on next. Returning
     * nullopt means every variable is already assigned. Functions in the
     * fds::variable_order namespace create these.
     *
     * \ingroup SearchHeuristics
     */
    using VariableSelector = std::function<auto(const CSP &, const Assignment &)->std::optional<VariableID>>;

    /**
     * Given a branch variable, in which order do we try its values? Functions
     * in the fds::value_order namespace create these.
     *
     * \ingroup SearchHeuristics
     */
    using ValueOrderer = std::function<auto(const CSP &, const Assignment &, VariableID)->std::vector<Value>>;

    /**
     * Variable ordering heuristics. Ties always go to the variable that was
     * created first.
     *
     * \ingroup SearchHeuristics
     */
    namespace variable_order
    {
        /**
         * Branch on the first unassigned variable, in declaration order.
         *
         * \ingroup SearchHeuristics
         */
        [[nodiscard]] auto in_order() -> VariableSelector;

        /**
         * Branch on the unassigned variable with the smallest domain, also
         * known as minimum remaining values (MRV).
         *
         * \ingroup SearchHeuristics
         */
        [[nodiscard]] auto dom() -> VariableSelector;

        /**
         * Branch on the unassigned variable involved in the most constraints
         * with other unassigned variables (DEG).
         *
         * \ingroup SearchHeuristics
         */
        [[nodiscard]] auto deg() -> VariableSelector;

        /**
         * Branch on the unassigned variable with the smallest domain,
         * tie-breaking on degree.
         *
         * \ingroup SearchHeuristics
         */
        [[nodiscard]] auto dom_then_deg() -> VariableSelector;
    }

    /**
     * Value ordering heuristics.
     *
     * \ingroup SearchHeuristics
     */
    namespace value_order
    {
        /**
         * Try values in the order they appear in the domain.
         *
         * \ingroup SearchHeuristics
         */
        [[nodiscard]] auto in_domain_order() -> ValueOrderer;

        /**
         * Least constraining value (LCV): try first the values that rule out
         * fewest values of neighbouring unassigned variables. Ties stay in
         * domain order.
         *
         * \ingroup SearchHeuristics
         */
        [[nodiscard]] auto least_constraining() -> ValueOrderer;
    }

    /**
     * \brief How many constraints on this variable involve at least one other
     * unassigned variable?
     *
     * \ingroup SearchHeuristics
     */
    [[nodiscard]] auto unassigned_degree_of(const CSP &, const Assignment &, VariableID) -> long long;

    /**
     * \brief How many values of neighbouring unassigned variables would
     * giving this variable this value rule out?
     *
     * \ingroup SearchHeuristics
     */
    [[nodiscard]] auto values_ruled_out_by(const CSP &, const Assignment &, VariableID, const Value &) -> long long;
}

#endif
