#include <fds/search_heuristics.hh>
#include <fds/solvers_test_utils.hh>

#include <catch2/catch_test_macros.hpp>

#include <optional>
#include <vector>

using namespace fds;
using namespace fds::test_innards;

using std::make_optional;
using std::vector;

TEST_CASE("Variable ordering on a fresh map")
{
    Australia australia;
    Assignment a;

    CHECK(variable_order::in_order()(australia.csp, a) == make_optional(australia.wa));
    CHECK(variable_order::dom()(australia.csp, a) == make_optional(australia.wa));
    CHECK(variable_order::deg()(australia.csp, a) == make_optional(australia.sa));
    CHECK(variable_order::dom_then_deg()(australia.csp, a) == make_optional(australia.sa));
}

TEST_CASE("Variable ordering with a fixed region")
{
    Australia australia;
    australia.csp.set_domain(australia.nsw, Domain{blue});
    Assignment a;

    CHECK(variable_order::in_order()(australia.csp, a) == make_optional(australia.wa));
    CHECK(variable_order::dom()(australia.csp, a) == make_optional(australia.nsw));
    CHECK(variable_order::deg()(australia.csp, a) == make_optional(australia.sa));
    CHECK(variable_order::dom_then_deg()(australia.csp, a) == make_optional(australia.nsw));
}

TEST_CASE("Degree only counts unassigned neighbours")
{
    Australia australia;
    Assignment a;
    a.assign(australia.sa, red);

    CHECK(unassigned_degree_of(australia.csp, a, australia.wa) == 1);
    CHECK(unassigned_degree_of(australia.csp, a, australia.nt) == 2);
    CHECK(unassigned_degree_of(australia.csp, a, australia.t) == 0);
    CHECK(variable_order::deg()(australia.csp, a) == make_optional(australia.nt));
    CHECK(variable_order::in_order()(australia.csp, a) == make_optional(australia.wa));
}

TEST_CASE("Variable ordering when everything is assigned")
{
    Australia australia;
    Assignment a;
    for (auto & v : australia.csp.variables())
        a.assign(v, red);

    CHECK(! variable_order::in_order()(australia.csp, a));
    CHECK(! variable_order::dom()(australia.csp, a));
    CHECK(! variable_order::deg()(australia.csp, a));
    CHECK(! variable_order::dom_then_deg()(australia.csp, a));
}

TEST_CASE("Least constraining value")
{
    Australia australia;
    australia.csp.set_domain(australia.nt, Domain{green});
    australia.csp.set_domain(australia.q, Domain{green, blue});
    Assignment a;

    CHECK(values_ruled_out_by(australia.csp, a, australia.sa, red) == 3);
    CHECK(values_ruled_out_by(australia.csp, a, australia.sa, green) == 5);
    CHECK(values_ruled_out_by(australia.csp, a, australia.sa, blue) == 4);

    CHECK(value_order::in_domain_order()(australia.csp, a, australia.sa) == vector<Value>{red, green, blue});
    CHECK(value_order::least_constraining()(australia.csp, a, australia.sa) == vector<Value>{red, blue, green});
}

TEST_CASE("Least constraining value keeps domain order for ties")
{
    Australia australia;
    Assignment a;
    CHECK(value_order::least_constraining()(australia.csp, a, australia.sa) == vector<Value>{red, green, blue});
    CHECK(value_order::least_constraining()(australia.csp, a, australia.t) == vector<Value>{red, green, blue});
}
