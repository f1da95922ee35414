#ifndef FINITE_DOMAIN_SEARCH_GUARD_FDS_MIN_CONFLICTS_SOLVER_HH
#define FINITE_DOMAIN_SEARCH_GUARD_FDS_MIN_CONFLICTS_SOLVER_HH

#include <fds/solver.hh>

#include <cstddef>
#include <optional>
#include <random>

namespace fds
{
    /**
     * \brief Local search by repeatedly repairing a complete assignment.
     *
     * Starts from a greedy assignment, then for up to the given number of
     * steps picks a random variable involved in a violated constraint, and
     * moves it to a value that violates as few constraints as possible, with
     * ties broken randomly.
     *
     * This solver is incomplete: nullopt means only that the step budget ran
     * out, not that there is no solution. The final assignment is still
     * available from current_assignment(), with its number of violated
     * constraints in Stats::conflicts.
     *
     * \ingroup Solvers
     */
    class MinConflictsSolver : public CspSolver
    {
    private:
        unsigned long long _max_steps;
        std::mt19937 _rand;
        Assignment _current;

        [[nodiscard]] auto conflicts_if(const CSP &, VariableID, const Value &) const -> std::size_t;
        [[nodiscard]] auto min_conflicts_value(const CSP &, VariableID) -> std::optional<Value>;
        [[nodiscard]] auto random_conflicted_variable(const CSP &) -> std::optional<VariableID>;

    protected:
        [[nodiscard]] virtual auto search(CSP &) -> std::optional<Assignment> override;

    public:
        /**
         * If no seed is given, one is taken from std::random_device.
         */
        explicit MinConflictsSolver(unsigned long long max_steps,
            std::optional<std::mt19937::result_type> seed = std::nullopt);

        /**
         * The assignment as it was when search finished, whether or not it
         * is a solution.
         */
        [[nodiscard]] auto current_assignment() const -> const Assignment &;
    };
}

#endif
