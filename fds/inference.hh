#ifndef FINITE_DOMAIN_SEARCH_GUARD_FDS_INFERENCE_HH
#define FINITE_DOMAIN_SEARCH_GUARD_FDS_INFERENCE_HH

#include <fds/assignment.hh>
#include <fds/constraint.hh>
#include <fds/csp.hh>
#include <fds/variable_id.hh>

#include <functional>
#include <optional>

namespace fds
{
    /**
     * \brief Did an inference strategy change anything?
     *
     * \ingroup Solvers
     */
    enum class Inference
    {
        NoChange,
        Change,
        Contradiction
    };

    /**
     * \brief Prunes domains after a variable has been assigned, or, if the
     * variable is nullopt, once over the whole problem before search starts.
     *
     * All pruning must go through CSP::remove_value() or CSP::restrict_to(),
     * so that the caller can undo it with CSP::backtrack(). After returning
     * Inference::Contradiction the domains may be partially pruned, and the
     * caller is expected to backtrack.
     *
     * \ingroup Solvers
     */
    using InferenceStrategy = std::function<auto(CSP &, const Assignment &, const std::optional<VariableID> &)->Inference>;

    /**
     * \brief Inference strategies for FlexibleBacktrackingSolver.
     *
     * \ingroup Solvers
     */
    namespace inference
    {
        /**
         * Do no inference at all, giving plain chronological backtracking.
         */
        [[nodiscard]] auto none() -> InferenceStrategy;

        /**
         * Forward checking: after an assignment, for each constraint on the
         * assigned variable that now has exactly one unassigned variable,
         * remove values of that variable the constraint would reject. Does
         * nothing before search.
         */
        [[nodiscard]] auto forward_checking() -> InferenceStrategy;

        /**
         * AC-3 style arc consistency, generalised to constraints of any
         * arity. After an assignment, the assigned variable's domain is
         * reduced to its value, and arcs are revised until nothing changes.
         * Before search, every arc of every constraint is revised.
         */
        [[nodiscard]] auto arc_consistency() -> InferenceStrategy;
    }

    /**
     * \brief Does this value for this variable have support on this
     * constraint? Other scope variables take their assigned value if they
     * have one, and otherwise anything from their current domain.
     *
     * \ingroup Solvers
     */
    [[nodiscard]] auto has_support(const CSP &, const Assignment &, const Constraint &, VariableID, const Value &) -> bool;

    /**
     * \brief Remove every value of the variable that has no support on the
     * constraint.
     *
     * \ingroup Solvers
     */
    auto revise(CSP &, const Assignment &, VariableID, const Constraint &) -> Inference;
}

#endif
