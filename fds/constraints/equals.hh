#ifndef FINITE_DOMAIN_SEARCH_GUARD_FDS_CONSTRAINTS_EQUALS_HH
#define FINITE_DOMAIN_SEARCH_GUARD_FDS_CONSTRAINTS_EQUALS_HH

#include <fds/constraint.hh>
#include <fds/variable_id.hh>

#include <string>
#include <vector>

namespace fds
{
    /**
     * \brief Constrain that two variables take the same value.
     *
     * \ingroup Constraints
     */
    class Equals : public Constraint
    {
    private:
        std::vector<VariableID> _scope;

    public:
        Equals(const VariableID v1, const VariableID v2);

        virtual auto scope() const -> const std::vector<VariableID> & override;
        virtual auto check(const std::vector<Value> &) const -> bool override;
        virtual auto clone() const -> std::unique_ptr<Constraint> override;
        virtual auto describe(const CSP &) const -> std::string override;
    };
}

#endif
