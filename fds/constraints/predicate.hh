#ifndef FINITE_DOMAIN_SEARCH_GUARD_FDS_CONSTRAINTS_PREDICATE_HH
#define FINITE_DOMAIN_SEARCH_GUARD_FDS_CONSTRAINTS_PREDICATE_HH

#include <fds/constraint.hh>
#include <fds/variable_id.hh>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace fds
{
    /**
     * \brief Called by a Predicate constraint with one value per scope
     * variable, in scope order.
     *
     * \ingroup Constraints
     */
    using PredicateFunction = std::function<auto(const std::vector<Value> &)->bool>;

    /**
     * \brief A constraint of any arity, defined by an arbitrary function.
     *
     * The function must behave like any other constraint: no state, no side
     * effects, and the same answer for the same values. It is only ever
     * called with every scope variable given a value.
     *
     * \ingroup Constraints
     */
    class Predicate : public Constraint
    {
    private:
        std::vector<VariableID> _vars;
        PredicateFunction _func;
        std::optional<std::string> _name;

    public:
        Predicate(std::vector<VariableID> vars, PredicateFunction func, std::optional<std::string> name = std::nullopt);

        virtual auto scope() const -> const std::vector<VariableID> & override;
        virtual auto check(const std::vector<Value> &) const -> bool override;
        virtual auto clone() const -> std::unique_ptr<Constraint> override;
        virtual auto describe(const CSP &) const -> std::string override;
    };
}

#endif
