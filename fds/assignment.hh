#ifndef FINITE_DOMAIN_SEARCH_GUARD_FDS_ASSIGNMENT_HH
#define FINITE_DOMAIN_SEARCH_GUARD_FDS_ASSIGNMENT_HH

#include <fds/value.hh>
#include <fds/variable_id.hh>

#include <cstddef>
#include <exception>
#include <optional>
#include <string>
#include <vector>

namespace fds
{
    class Constraint;
    class CSP;

    /**
     * \brief Thrown by Assignment::operator() if a variable is not assigned.
     *
     * \ingroup Core
     */
    class VariableNotAssigned : public std::exception
    {
    private:
        std::string _wat;

    public:
        explicit VariableNotAssigned(const std::string &);

        virtual auto what() const noexcept -> const char * override;
    };

    /**
     * \brief A partial or total mapping from variables to values.
     *
     * The order in which variables were first assigned is remembered, and
     * reassigning a variable does not change its position. The assignment
     * does not check values against domains: keeping the two consistent is
     * the job of whichever solver is using it.
     *
     * \ingroup Core
     */
    class Assignment
    {
    private:
        std::vector<std::optional<Value>> _values;
        std::vector<VariableID> _order;

    public:
        /**
         * \name Changing the assignment.
         * @{
         */
        auto assign(VariableID, Value) -> void;

        auto unassign(VariableID) -> void;

        ///@}

        /**
         * \name Queries.
         * @{
         */
        [[nodiscard]] auto contains(VariableID) const -> bool;

        [[nodiscard]] auto value_of(VariableID) const -> std::optional<Value>;

        /**
         * Get the value of an assigned variable, or throw VariableNotAssigned.
         */
        [[nodiscard]] auto operator()(VariableID) const -> const Value &;

        [[nodiscard]] auto size() const -> std::size_t;

        [[nodiscard]] auto empty() const -> bool;

        /**
         * Assigned variables, in the order they were first assigned.
         */
        [[nodiscard]] auto variables() const -> const std::vector<VariableID> &;

        ///@}

        /**
         * \name Checking against a CSP.
         * @{
         */
        [[nodiscard]] auto is_complete(const CSP &) const -> bool;

        [[nodiscard]] auto is_consistent(const std::vector<const Constraint *> &) const -> bool;

        /**
         * Is every variable assigned, with every constraint satisfied?
         */
        [[nodiscard]] auto is_solution(const CSP &) const -> bool;

        /**
         * How many constraints have every scope variable assigned, but are
         * not satisfied?
         */
        [[nodiscard]] auto number_of_conflicts(const CSP &) const -> std::size_t;

        ///@}
    };

    /**
     * \brief Give a human readable representation of an assignment, in
     * assignment order, using names from the CSP.
     *
     * \ingroup Core
     */
    [[nodiscard]] auto describe(const CSP &, const Assignment &) -> std::string;
}

#endif
