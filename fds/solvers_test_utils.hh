#ifndef FINITE_DOMAIN_SEARCH_GUARD_FDS_SOLVERS_TEST_UTILS_HH
#define FINITE_DOMAIN_SEARCH_GUARD_FDS_SOLVERS_TEST_UTILS_HH

#include <fds/assignment.hh>
#include <fds/constraints/not_equals.hh>
#include <fds/csp.hh>
#include <fds/domain.hh>
#include <fds/solver.hh>
#include <fds/value.hh>

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace fds::test_innards
{
    inline const Value red = "RED"_v, green = "GREEN"_v, blue = "BLUE"_v;

    /**
     * The map of Australia: seven regions, three colours, nine borders, and
     * Tasmania bordering nothing.
     */
    struct Australia
    {
        CSP csp;
        VariableID wa, nt, q, nsw, v, sa, t;

        Australia() :
            wa(csp.create_variable(Domain{red, green, blue}, "WA")),
            nt(csp.create_variable(Domain{red, green, blue}, "NT")),
            q(csp.create_variable(Domain{red, green, blue}, "Q")),
            nsw(csp.create_variable(Domain{red, green, blue}, "NSW")),
            v(csp.create_variable(Domain{red, green, blue}, "V")),
            sa(csp.create_variable(Domain{red, green, blue}, "SA")),
            t(csp.create_variable(Domain{red, green, blue}, "T"))
        {
            csp.post(NotEquals{wa, sa});
            csp.post(NotEquals{wa, nt});
            csp.post(NotEquals{nt, sa});
            csp.post(NotEquals{nt, q});
            csp.post(NotEquals{sa, q});
            csp.post(NotEquals{sa, nsw});
            csp.post(NotEquals{sa, v});
            csp.post(NotEquals{q, nsw});
            csp.post(NotEquals{nsw, v});
        }
    };

    /**
     * Eight variables whose constraint graph is a tree, with some leaves
     * already fixed to a single colour.
     */
    struct TreeMap
    {
        CSP csp;
        std::vector<VariableID> vars;

        TreeMap()
        {
            vars.push_back(csp.create_variable(Domain{red, green, blue}, "V0"));
            vars.push_back(csp.create_variable(Domain{red, green, blue}, "V1"));
            vars.push_back(csp.create_variable(Domain{red}, "V2"));
            vars.push_back(csp.create_variable(Domain{red, green, blue}, "V3"));
            vars.push_back(csp.create_variable(Domain{green}, "V4"));
            vars.push_back(csp.create_variable(Domain{red, green, blue}, "V5"));
            vars.push_back(csp.create_variable(Domain{red}, "V6"));
            vars.push_back(csp.create_variable(Domain{blue}, "V7"));

            csp.post(NotEquals{vars[0], vars[1]});
            csp.post(NotEquals{vars[1], vars[2]});
            csp.post(NotEquals{vars[1], vars[3]});
            csp.post(NotEquals{vars[1], vars[4]});
            csp.post(NotEquals{vars[3], vars[5]});
            csp.post(NotEquals{vars[5], vars[6]});
            csp.post(NotEquals{vars[5], vars[7]});
        }
    };

    /**
     * Four mutually adjacent regions but only three colours.
     */
    struct OverConstrained
    {
        CSP csp;
        std::vector<VariableID> vars;

        OverConstrained()
        {
            vars = csp.create_variables({"A", "B", "C", "D"}, Domain{red, green, blue});
            for (std::size_t i = 0; i < vars.size(); ++i)
                for (std::size_t j = i + 1; j < vars.size(); ++j)
                    csp.post(NotEquals{vars[i], vars[j]});
        }
    };

    /**
     * Snapshot every domain, for checking that pruning was undone.
     */
    [[nodiscard]] inline auto all_domains(const CSP & csp) -> std::vector<Domain>
    {
        std::vector<Domain> result;
        for (auto & v : csp.variables())
            result.push_back(csp.domain(v));
        return result;
    }

    /**
     * Everything a solver told its listener.
     */
    struct RecordedEvent
    {
        std::optional<VariableID> var;
        std::optional<Assignment> assignment;
    };

    inline auto record_events(CspSolver & solver, std::vector<RecordedEvent> & events) -> void
    {
        solver.add_listener([&events](const CSP &, const std::optional<VariableID> & var, const Assignment * assignment) -> bool {
            events.push_back(RecordedEvent{var, assignment ? std::make_optional(*assignment) : std::nullopt});
            return true;
        });
    }
}

#endif
