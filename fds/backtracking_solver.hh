#ifndef FINITE_DOMAIN_SEARCH_GUARD_FDS_BACKTRACKING_SOLVER_HH
#define FINITE_DOMAIN_SEARCH_GUARD_FDS_BACKTRACKING_SOLVER_HH

#include <fds/inference.hh>
#include <fds/search_heuristics.hh>
#include <fds/solver.hh>

#include <optional>

namespace fds
{
    /**
     * \brief Systematic backtracking search, with pluggable variable
     * ordering, value ordering and inference.
     *
     * Each of the three strategies occupies a slot, and set() replaces
     * whatever was in the relevant slot, so setting the same thing twice is
     * harmless. A bare solver orders variables and values as declared, and
     * does no inference, which gives plain chronological backtracking. None
     * of the strategies affect which problems can be solved, only how
     * quickly.
     *
     * At each node, the variable is chosen first, then its values are
     * ordered, and inference is run after each tentative assignment that is
     * consistent with the variable's constraints. If inference is installed,
     * it is also run once over the whole problem before search begins.
     *
     * \ingroup Solvers
     */
    class FlexibleBacktrackingSolver : public CspSolver
    {
    private:
        VariableSelector _select_variable;
        ValueOrderer _order_values;
        InferenceStrategy _infer;

        [[nodiscard]] auto infer(CSP &, const Assignment &, const std::optional<VariableID> &) -> Inference;
        [[nodiscard]] auto backtrack(CSP &, Assignment &, unsigned long long depth) -> bool;

    protected:
        [[nodiscard]] virtual auto search(CSP &) -> std::optional<Assignment> override;

    public:
        FlexibleBacktrackingSolver();

        auto set(VariableSelector) -> FlexibleBacktrackingSolver &;
        auto set(ValueOrderer) -> FlexibleBacktrackingSolver &;
        auto set(InferenceStrategy) -> FlexibleBacktrackingSolver &;

        /**
         * Use minimum remaining values with a degree tie-breaker, least
         * constraining value, and arc consistency.
         */
        auto set_all() -> FlexibleBacktrackingSolver &;
    };
}

#endif
