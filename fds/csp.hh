#ifndef FINITE_DOMAIN_SEARCH_GUARD_FDS_CSP_HH
#define FINITE_DOMAIN_SEARCH_GUARD_FDS_CSP_HH

#include <fds/constraint.hh>
#include <fds/domain.hh>
#include <fds/value.hh>
#include <fds/variable_id.hh>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fds
{
    /**
     * \defgroup Core Core functionality
     */

    /**
     * \brief Used to indicate a point for backtracking domain reductions.
     *
     * \sa CSP::new_epoch()
     * \sa CSP::backtrack()
     * \ingroup Core
     */
    struct Timestamp
    {
        std::size_t when;

        explicit Timestamp(std::size_t w) :
            when(w)
        {
        }
    };

    /**
     * \brief The central class which defines a constraint satisfaction problem
     * instance to be solved.
     *
     * A CSP owns its variables, the current domain of each variable, and its
     * constraints. Solvers use it as scratch space: domain reductions made
     * through remove_value() and restrict_to() are recorded on a trail, and
     * can be undone using backtrack().
     *
     * \ingroup Core
     */
    class CSP
    {
    private:
        struct Imp;
        std::unique_ptr<Imp> _imp;

        auto check_variable(VariableID) const -> void;

    public:
        /**
         * \name Constructors, destructors, etc.
         * @{
         */
        CSP();

        ~CSP();

        CSP(CSP &&);
        auto operator=(CSP &&) -> CSP &;

        CSP(const CSP &) = delete;
        auto operator=(const CSP &) -> CSP & = delete;

        ///@}

        /**
         * \name Building a problem.
         *@{
         */

        /**
         * \brief Create a new variable with the given domain. The name is used
         * only for output, and does not have to be unique.
         */
        [[nodiscard]] auto create_variable(Domain, const std::optional<std::string> & name = std::nullopt) -> VariableID;

        /**
         * \brief Create one variable per name, each with a copy of the given
         * domain.
         */
        [[nodiscard]] auto create_variables(const std::vector<std::string> & names, const Domain &) -> std::vector<VariableID>;

        /**
         * \brief Replace a variable's domain wholesale, for example to fix
         * its value before solving. This is not recorded on the trail.
         */
        auto set_domain(VariableID, Domain) -> void;

        /**
         * \brief Add a clone of this Constraint to the problem. Throws
         * MalformedProblem if its scope is empty, repeats a variable, or
         * mentions a variable that is not part of this CSP.
         */
        auto post(const Constraint &) -> void;

        ///@}

        /**
         * \name Queries.
         *@{
         */
        [[nodiscard]] auto variables() const -> const std::vector<VariableID> &;

        [[nodiscard]] auto contains(VariableID) const -> bool;

        [[nodiscard]] auto name_of(VariableID) const -> const std::string &;

        [[nodiscard]] auto domain(VariableID) const -> const Domain &;

        [[nodiscard]] auto constraints() const -> const std::vector<const Constraint *> &;

        /**
         * \brief Every constraint whose scope includes this variable, in
         * posting order.
         */
        [[nodiscard]] auto constraints_of(VariableID) const -> const std::vector<const Constraint *> &;

        /**
         * \brief For a binary constraint involving this variable, the other
         * variable. For any other constraint, nullopt.
         */
        [[nodiscard]] auto neighbour_of(VariableID, const Constraint &) const -> std::optional<VariableID>;

        /**
         * \brief Every variable sharing at least one constraint with this
         * one, in declaration order.
         */
        [[nodiscard]] auto neighbours_of(VariableID) const -> std::vector<VariableID>;

        [[nodiscard]] auto degree_of(VariableID) const -> std::size_t;

        ///@}

        /**
         * \name Reversible domain reduction, for use by solvers.
         * @{
         */
        [[nodiscard]] auto new_epoch() -> Timestamp;

        /**
         * \brief Remove a value from a variable's domain. Returns true if the
         * value was present.
         */
        auto remove_value(VariableID, const Value &) -> bool;

        /**
         * \brief Remove every value except this one from the domain. Returns
         * true if anything was removed.
         */
        auto restrict_to(VariableID, const Value &) -> bool;

        /**
         * \brief Undo every reduction made since the Timestamp was created,
         * restoring values to their original positions.
         */
        auto backtrack(Timestamp) -> void;

        ///@}
    };

    /**
     * \brief Give a human readable representation of the current domain of a
     * variable.
     *
     * \ingroup Core
     */
    [[nodiscard]] auto describe(const CSP &, VariableID) -> std::string;
}

#endif
