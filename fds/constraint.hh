#ifndef FINITE_DOMAIN_SEARCH_GUARD_FDS_CONSTRAINT_HH
#define FINITE_DOMAIN_SEARCH_GUARD_FDS_CONSTRAINT_HH

#include <fds/value.hh>
#include <fds/variable_id.hh>

#include <memory>
#include <string>
#include <vector>

namespace fds
{
    class Assignment;
    class CSP;

    /**
     * \defgroup Constraints Constraints
     */

    /**
     * \brief Subclasses of Constraint restrict which combinations of values
     * their scope variables may take. See \ref Constraints for a list of
     * available constraints.
     *
     * A Constraint is used by passing it to CSP::post(), which keeps a clone.
     * Constraints are stateless: checking the same values always gives the
     * same answer, and checking never has side effects.
     *
     * \ingroup Core
     */
    class [[nodiscard]] Constraint
    {
    public:
        virtual ~Constraint() = 0;

        /**
         * The variables this constraint is over, in the order that check()
         * expects their values. Never empty.
         */
        [[nodiscard]] virtual auto scope() const -> const std::vector<VariableID> & = 0;

        /**
         * Are these values, one per scope variable in scope order, allowed?
         */
        [[nodiscard]] virtual auto check(const std::vector<Value> &) const -> bool = 0;

        /**
         * Create a copy of the constraint. To be used internally.
         */
        [[nodiscard]] virtual auto clone() const -> std::unique_ptr<Constraint> = 0;

        /**
         * A short human readable description, using the CSP for variable names.
         */
        [[nodiscard]] virtual auto describe(const CSP &) const -> std::string;

        /**
         * True if any scope variable is unassigned, otherwise whether the
         * assigned values are allowed.
         */
        [[nodiscard]] auto is_satisfied_by(const Assignment &) const -> bool;

        /**
         * Would giving this variable this value, alongside whatever is already
         * assigned, still be allowed? Any other scope variable that is not yet
         * assigned means the answer is yes. The variable's own entry in the
         * assignment, if it has one, is ignored.
         */
        [[nodiscard]] auto accepts(VariableID, const Value &, const Assignment &) const -> bool;

        [[nodiscard]] auto involves(VariableID) const -> bool;

        [[nodiscard]] auto is_binary() const -> bool;
    };
}

#endif
