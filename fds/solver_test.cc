#include <fds/backtracking_solver.hh>
#include <fds/exception.hh>
#include <fds/inference.hh>
#include <fds/solvers_test_utils.hh>
#include <fds/stats.hh>

#include <catch2/catch_test_macros.hpp>

#include <fmt/format.h>

#include <atomic>
#include <optional>
#include <string>
#include <vector>

using namespace fds;
using namespace fds::test_innards;

using std::atomic;
using std::optional;
using std::string;
using std::vector;

TEST_CASE("Listeners are called in registration order")
{
    Australia australia;
    FlexibleBacktrackingSolver solver;
    vector<string> calls;
    solver.add_listener([&](const CSP &, const optional<VariableID> &, const Assignment *) -> bool {
        calls.push_back("first");
        return true;
    });
    solver.add_listener([&](const CSP &, const optional<VariableID> &, const Assignment *) -> bool {
        calls.push_back("second");
        return true;
    });

    REQUIRE(solver.solve(australia.csp));
    REQUIRE(calls.size() == 2 * solver.stats().events);
    for (unsigned i = 0; i < calls.size(); i += 2) {
        CHECK(calls[i] == "first");
        CHECK(calls[i + 1] == "second");
    }
}

TEST_CASE("A listener can stop search")
{
    OverConstrained problem;
    FlexibleBacktrackingSolver solver;
    unsigned calls = 0;
    solver.add_listener([&](const CSP &, const optional<VariableID> &, const Assignment *) -> bool {
        return ++calls < 3;
    });

    CHECK(! solver.solve(problem.csp));
    CHECK(solver.stats().outcome == Outcome::Aborted);
    CHECK(calls == 3);
    CHECK(solver.stats().assignments == 3);
}

TEST_CASE("Every listener still hears about the step that stopped search")
{
    Australia australia;
    FlexibleBacktrackingSolver solver;
    unsigned later_calls = 0;
    solver.add_listener([&](const CSP &, const optional<VariableID> &, const Assignment *) -> bool { return false; });
    solver.add_listener([&](const CSP &, const optional<VariableID> &, const Assignment *) -> bool {
        ++later_calls;
        return true;
    });

    CHECK(! solver.solve(australia.csp));
    CHECK(later_calls == 1);
    CHECK(solver.stats().outcome == Outcome::Aborted);
}

TEST_CASE("Nothing happens after a listener asks to stop")
{
    OverConstrained problem;
    FlexibleBacktrackingSolver solver;
    solver.set(inference::forward_checking());
    bool stopped = false;
    unsigned calls_after_stop = 0;
    solver.add_listener([&](const CSP &, const optional<VariableID> & var, const Assignment * assignment) -> bool {
        if (stopped)
            ++calls_after_stop;
        else if (var && assignment) {
            stopped = true;
            return false;
        }
        return true;
    });

    auto before = all_domains(problem.csp);
    CHECK(! solver.solve(problem.csp));
    CHECK(solver.stats().outcome == Outcome::Aborted);
    CHECK(calls_after_stop == 0);
    CHECK(solver.stats().events == 1);
    CHECK(solver.stats().assignments == 1);
    // only the pass before search
    CHECK(solver.stats().inferences == 1);
    CHECK(solver.stats().values_pruned == 0);
    CHECK(all_domains(problem.csp) == before);
}

TEST_CASE("A throwing listener leaves the solver aborted")
{
    Australia australia;
    FlexibleBacktrackingSolver solver;
    atomic<bool> abort_flag{false};
    solver.add_listener([&](const CSP &, const optional<VariableID> &, const Assignment *) -> bool {
        throw UnexpectedException{"listener failed"};
    });

    CHECK_THROWS_AS(solver.solve(australia.csp, &abort_flag), UnexpectedException);
    CHECK(solver.stats().outcome == Outcome::Aborted);
    CHECK(solver.stats().assignments == 1);
}

TEST_CASE("An abort flag can stop search")
{
    OverConstrained problem;
    FlexibleBacktrackingSolver solver;
    atomic<bool> abort_flag{false};
    solver.add_listener([&](const CSP &, const optional<VariableID> &, const Assignment *) -> bool {
        abort_flag = true;
        return true;
    });

    CHECK(! solver.solve(problem.csp, &abort_flag));
    CHECK(solver.stats().outcome == Outcome::Aborted);
    CHECK(solver.stats().assignments == 1);
}

TEST_CASE("An unset abort flag changes nothing")
{
    OverConstrained problem;
    FlexibleBacktrackingSolver solver;
    atomic<bool> abort_flag{false};
    CHECK(! solver.solve(problem.csp, &abort_flag));
    CHECK(solver.stats().outcome == Outcome::Exhausted);
}

TEST_CASE("Stats are reset by each solve")
{
    Australia australia;
    FlexibleBacktrackingSolver solver;
    CHECK(solver.stats().outcome == Outcome::Unstarted);

    REQUIRE(solver.solve(australia.csp));
    auto first = solver.stats();

    Australia again;
    REQUIRE(solver.solve(again.csp));
    CHECK(solver.stats().assignments == first.assignments);
    CHECK(solver.stats().events == first.events);
}

TEST_CASE("Stats can be formatted")
{
    Australia australia;
    FlexibleBacktrackingSolver solver;
    REQUIRE(solver.solve(australia.csp));

    auto text = fmt::format("{}", solver.stats());
    CHECK(text.find("outcome: solved\n") != string::npos);
    CHECK(text.find("assignments: 11\n") != string::npos);
    CHECK(to_string(Outcome::StructurallyInvalid) == "structurally invalid");
}
