#ifndef FINITE_DOMAIN_SEARCH_GUARD_FDS_TREE_CSP_SOLVER_HH
#define FINITE_DOMAIN_SEARCH_GUARD_FDS_TREE_CSP_SOLVER_HH

#include <fds/solver.hh>

#include <optional>
#include <random>

namespace fds
{
    /**
     * \brief How does a TreeCspSolver choose the root of its tree?
     *
     * \ingroup Solvers
     */
    enum class RootSelection
    {
        FirstVariable,
        Random
    };

    /**
     * \brief Solves problems whose constraint graph is a tree, or a forest,
     * in linear time and without backtracking.
     *
     * Variables are ordered by breadth first traversal from the root, values
     * that have no support on their child's edge are removed working from the
     * leaves upwards, and then every variable is assigned from the root
     * downwards. If a domain becomes empty, there is no solution.
     *
     * Unary constraints are allowed, and are dealt with first. Throws
     * StructuralError if any constraint has more than two variables, or if
     * the constraint graph has a cycle (including two constraints over the
     * same pair of variables).
     *
     * \ingroup Solvers
     */
    class TreeCspSolver : public CspSolver
    {
    private:
        RootSelection _root_selection;
        std::mt19937 _rand;

    protected:
        [[nodiscard]] virtual auto search(CSP &) -> std::optional<Assignment> override;

    public:
        /**
         * The seed is only used if the root is selected randomly. If no
         * seed is given, one is taken from std::random_device.
         */
        explicit TreeCspSolver(RootSelection = RootSelection::FirstVariable,
            std::optional<std::mt19937::result_type> seed = std::nullopt);
    };
}

#endif
