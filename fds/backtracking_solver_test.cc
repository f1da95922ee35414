#include <fds/backtracking_solver.hh>
#include <fds/solvers_test_utils.hh>

#include <catch2/catch_test_macros.hpp>

#include <functional>
#include <string>
#include <utility>
#include <vector>

using namespace fds;
using namespace fds::test_innards;

using std::function;
using std::pair;
using std::string;
using std::vector;

namespace
{
    struct Configuration
    {
        string name;
        function<auto(FlexibleBacktrackingSolver &)->void> apply;
    };

    auto all_configurations() -> vector<Configuration>
    {
        vector<Configuration> result;
        vector<pair<string, VariableSelector>> variables{
            {"in order", variable_order::in_order()},
            {"dom", variable_order::dom()},
            {"deg", variable_order::deg()},
            {"dom then deg", variable_order::dom_then_deg()}};
        vector<pair<string, ValueOrderer>> values{
            {"domain order", value_order::in_domain_order()},
            {"lcv", value_order::least_constraining()}};
        vector<pair<string, InferenceStrategy>> inferences{
            {"no inference", inference::none()},
            {"fc", inference::forward_checking()},
            {"ac3", inference::arc_consistency()}};

        for (auto & [vn, vs] : variables)
            for (auto & [on, os] : values)
                for (auto & [in, is] : inferences)
                    result.push_back(Configuration{vn + ", " + on + ", " + in,
                        [vs = vs, os = os, is = is](FlexibleBacktrackingSolver & s) { s.set(vs).set(os).set(is); }});

        result.push_back(Configuration{"all", [](FlexibleBacktrackingSolver & s) { s.set_all(); }});
        return result;
    }
}

TEST_CASE("Plain backtracking colours Australia in declaration order")
{
    Australia australia;
    FlexibleBacktrackingSolver solver;
    auto solution = solver.solve(australia.csp);

    REQUIRE(solution);
    CHECK(solution->is_solution(australia.csp));
    CHECK(describe(australia.csp, *solution) == "{WA=RED, NT=GREEN, Q=RED, NSW=GREEN, V=RED, SA=BLUE, T=RED}");
    CHECK(solver.stats().outcome == Outcome::Solved);
    CHECK(solver.stats().assignments == 11);
    CHECK(solver.stats().failures == 4);
}

TEST_CASE("Every configuration colours Australia")
{
    auto configurations = all_configurations();

    SECTION("Unrestricted")
    {
        for (auto & config : configurations) {
            INFO(config.name);
            Australia australia;
            FlexibleBacktrackingSolver solver;
            config.apply(solver);
            auto solution = solver.solve(australia.csp);
            REQUIRE(solution);
            CHECK(solution->is_solution(australia.csp));
            CHECK(solver.stats().outcome == Outcome::Solved);
        }
    }

    SECTION("NSW is blue")
    {
        for (auto & config : configurations) {
            INFO(config.name);
            Australia australia;
            australia.csp.set_domain(australia.nsw, Domain{blue});
            FlexibleBacktrackingSolver solver;
            config.apply(solver);
            auto solution = solver.solve(australia.csp);
            REQUIRE(solution);
            CHECK(solution->is_solution(australia.csp));
            CHECK((*solution)(australia.nsw) == blue);
        }
    }

    SECTION("WA is red")
    {
        for (auto & config : configurations) {
            INFO(config.name);
            Australia australia;
            australia.csp.set_domain(australia.wa, Domain{red});
            FlexibleBacktrackingSolver solver;
            config.apply(solver);
            auto solution = solver.solve(australia.csp);
            REQUIRE(solution);
            CHECK(solution->is_solution(australia.csp));
            CHECK((*solution)(australia.wa) == red);
            CHECK((*solution)(australia.sa) != red);
        }
    }

    SECTION("SA and V are both blue")
    {
        for (auto & config : configurations) {
            INFO(config.name);
            Australia australia;
            australia.csp.set_domain(australia.sa, Domain{blue});
            australia.csp.set_domain(australia.v, Domain{blue});
            FlexibleBacktrackingSolver solver;
            config.apply(solver);
            CHECK(! solver.solve(australia.csp));
            CHECK(solver.stats().outcome == Outcome::Exhausted);
        }
    }

    SECTION("Four mutual neighbours")
    {
        for (auto & config : configurations) {
            INFO(config.name);
            OverConstrained problem;
            auto before = all_domains(problem.csp);
            FlexibleBacktrackingSolver solver;
            config.apply(solver);
            CHECK(! solver.solve(problem.csp));
            CHECK(solver.stats().outcome == Outcome::Exhausted);
            CHECK(all_domains(problem.csp) == before);
        }
    }
}

TEST_CASE("Pruned domains come back in their original order")
{
    CSP csp;
    auto a = csp.create_variable(Domain{blue, red, green}, "A");
    auto b = csp.create_variable(Domain{green, blue, red}, "B");
    auto c = csp.create_variable(Domain{red, green}, "C");
    auto d = csp.create_variable(Domain{red, green}, "D");
    csp.post(NotEquals{a, b});
    csp.post(NotEquals{b, c});
    csp.post(NotEquals{c, d});
    csp.post(NotEquals{d, a});
    csp.post(NotEquals{a, c});
    csp.post(NotEquals{b, d});
    auto before = all_domains(csp);

    FlexibleBacktrackingSolver solver;
    solver.set(inference::forward_checking());
    CHECK(! solver.solve(csp));
    CHECK(solver.stats().values_pruned > 0);
    CHECK(all_domains(csp) == before);
}

TEST_CASE("Backtracking is deterministic")
{
    for (auto & config : all_configurations()) {
        INFO(config.name);

        Australia first, second;
        FlexibleBacktrackingSolver first_solver, second_solver;
        config.apply(first_solver);
        config.apply(second_solver);

        auto first_solution = first_solver.solve(first.csp);
        auto second_solution = second_solver.solve(second.csp);
        REQUIRE(first_solution);
        REQUIRE(second_solution);
        CHECK(describe(first.csp, *first_solution) == describe(second.csp, *second_solution));
        CHECK(first_solver.stats().assignments == second_solver.stats().assignments);
        CHECK(first_solver.stats().events == second_solver.stats().events);
    }
}

TEST_CASE("Setting a strategy twice is the same as setting it once")
{
    Australia once, twice;

    FlexibleBacktrackingSolver once_solver;
    once_solver.set(variable_order::deg()).set(inference::forward_checking());

    FlexibleBacktrackingSolver twice_solver;
    twice_solver.set(variable_order::deg()).set(inference::forward_checking());
    twice_solver.set(variable_order::deg()).set(inference::forward_checking());

    auto once_solution = once_solver.solve(once.csp);
    auto twice_solution = twice_solver.solve(twice.csp);
    REQUIRE(once_solution);
    REQUIRE(twice_solution);
    CHECK(describe(once.csp, *once_solution) == describe(twice.csp, *twice_solution));
    CHECK(once_solver.stats().events == twice_solver.stats().events);
}

TEST_CASE("Setting a slot replaces what it held")
{
    Australia replaced, direct;

    FlexibleBacktrackingSolver replaced_solver;
    replaced_solver.set(inference::arc_consistency()).set(inference::none());
    FlexibleBacktrackingSolver direct_solver;

    auto replaced_solution = replaced_solver.solve(replaced.csp);
    auto direct_solution = direct_solver.solve(direct.csp);
    REQUIRE(replaced_solution);
    REQUIRE(direct_solution);
    CHECK(describe(replaced.csp, *replaced_solution) == describe(direct.csp, *direct_solution));
    CHECK(replaced_solver.stats().values_pruned == 0);
}

TEST_CASE("Backtracking events")
{
    Australia australia;
    vector<RecordedEvent> events;
    FlexibleBacktrackingSolver solver;

    SECTION("Without inference")
    {
        record_events(solver, events);
        auto solution = solver.solve(australia.csp);
        REQUIRE(solution);

        // one per tentative assignment, then the solution
        REQUIRE(events.size() == 12);
        for (unsigned i = 0; i + 1 < events.size(); ++i) {
            CHECK(events[i].var);
            CHECK(events[i].assignment);
        }
        CHECK(events[0].var == australia.wa);
        CHECK(events[0].assignment->size() == 1);
        CHECK(! events.back().var);
        REQUIRE(events.back().assignment);
        CHECK(describe(australia.csp, *events.back().assignment) == describe(australia.csp, *solution));
        CHECK(solver.stats().events == events.size());
    }

    SECTION("With forward checking")
    {
        solver.set(inference::forward_checking());
        record_events(solver, events);
        auto solution = solver.solve(australia.csp);
        REQUIRE(solution);

        bool saw_reduction = false;
        for (auto & e : events)
            if (! e.var && ! e.assignment)
                saw_reduction = true;
        CHECK(saw_reduction);
        CHECK(events.front().var == australia.wa);
    }

    SECTION("Contradiction before search")
    {
        australia.csp.set_domain(australia.sa, Domain{blue});
        australia.csp.set_domain(australia.v, Domain{blue});
        solver.set(inference::arc_consistency());
        record_events(solver, events);
        CHECK(! solver.solve(australia.csp));

        REQUIRE(events.size() == 1);
        CHECK(! events[0].var);
        CHECK(! events[0].assignment);
        CHECK(solver.stats().assignments == 0);
        CHECK(solver.stats().contradicting_inferences == 1);
    }
}

TEST_CASE("Heuristics reduce work on Australia")
{
    Australia plain, all;
    FlexibleBacktrackingSolver plain_solver, all_solver;
    all_solver.set_all();

    REQUIRE(plain_solver.solve(plain.csp));
    REQUIRE(all_solver.solve(all.csp));
    CHECK(all_solver.stats().failures == 0);
    CHECK(all_solver.stats().assignments == 7);
    CHECK(all_solver.stats().inferences > 0);
}
