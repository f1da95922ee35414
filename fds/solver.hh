#ifndef FINITE_DOMAIN_SEARCH_GUARD_FDS_SOLVER_HH
#define FINITE_DOMAIN_SEARCH_GUARD_FDS_SOLVER_HH

#include <fds/assignment.hh>
#include <fds/csp.hh>
#include <fds/stats.hh>
#include <fds/variable_id.hh>

#include <atomic>
#include <functional>
#include <optional>
#include <vector>

namespace fds
{
    /**
     * \defgroup Solvers Solvers
     */

    /**
     * \brief Called by a solver after every step: once for each tentative or
     * final assignment, with the variable that changed (or nullopt if more
     * than one did) and the assignment, and once for each domain reduction,
     * with no assignment.
     *
     * Listeners are called synchronously, and the solver waits for them to
     * return. The CSP and assignment are only valid during the call. If false
     * is returned, the solver will stop before taking another step.
     *
     * \ingroup Solvers
     */
    using ProgressListener = std::function<auto(const CSP &, const std::optional<VariableID> &, const Assignment *)->bool>;

    /**
     * \brief Base class for every solver.
     *
     * A solver is not thread safe, and only one solver may work on a given
     * CSP at once.
     *
     * \ingroup Solvers
     */
    class CspSolver
    {
    private:
        std::vector<ProgressListener> _listeners;
        std::atomic<bool> * _optional_abort_flag = nullptr;
        bool _stop_requested = false;

    protected:
        Stats _stats;

        /**
         * Carry out the search. Return nullopt if there is no solution, if
         * the solver gives up, or if should_stop() became true.
         */
        [[nodiscard]] virtual auto search(CSP &) -> std::optional<Assignment> = 0;

        /**
         * Call every listener, in registration order.
         */
        auto notify(const CSP &, const std::optional<VariableID> &, const Assignment *) -> void;

        /**
         * Has a listener asked us to stop, or has the abort flag been set?
         */
        [[nodiscard]] auto should_stop() const -> bool;

    public:
        /**
         * \name Constructors, destructors, etc.
         * @{
         */
        CspSolver() = default;

        virtual ~CspSolver() = 0;

        CspSolver(const CspSolver &) = delete;
        auto operator=(const CspSolver &) -> CspSolver & = delete;

        ///@}

        auto add_listener(ProgressListener) -> void;

        /**
         * \brief Try to solve the problem, returning a solution, or nullopt if
         * none was found.
         *
         * Use stats() afterwards to tell whether nullopt meant the problem is
         * unsatisfiable, the solver gave up, or search was aborted. If the
         * final argument is not nullptr, the provided atomic will be polled
         * and search will abort if it becomes true.
         *
         * Exceptions propagate. A StructuralError leaves the outcome as
         * Outcome::StructurallyInvalid, and anything else, including an
         * exception thrown by a listener, as Outcome::Aborted.
         */
        [[nodiscard]] auto solve(CSP &, std::atomic<bool> * optional_abort_flag = nullptr) -> std::optional<Assignment>;

        /**
         * \brief Statistics for the most recent call to solve().
         */
        [[nodiscard]] auto stats() const -> const Stats &;
    };
}

#endif
