#ifndef FINITE_DOMAIN_SEARCH_GUARD_FDS_CONSTRAINTS_ALL_DIFFERENT_HH
#define FINITE_DOMAIN_SEARCH_GUARD_FDS_CONSTRAINTS_ALL_DIFFERENT_HH

#include <fds/constraint.hh>
#include <fds/variable_id.hh>

#include <string>
#include <vector>

namespace fds
{
    /**
     * \brief All different constraint: no two variables in the scope may
     * share a value.
     *
     * This is a single n-ary constraint, not a clique of NotEquals, so it
     * gives a TreeCspSolver a StructuralError if it has more than two
     * variables.
     *
     * \ingroup Constraints
     */
    class AllDifferent : public Constraint
    {
    private:
        std::vector<VariableID> _vars;

    public:
        explicit AllDifferent(std::vector<VariableID> vars);

        virtual auto scope() const -> const std::vector<VariableID> & override;
        virtual auto check(const std::vector<Value> &) const -> bool override;
        virtual auto clone() const -> std::unique_ptr<Constraint> override;
        virtual auto describe(const CSP &) const -> std::string override;
    };
}

#endif
