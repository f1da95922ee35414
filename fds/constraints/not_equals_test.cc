#include <fds/assignment.hh>
#include <fds/constraints/equals.hh>
#include <fds/constraints/not_equals.hh>
#include <fds/csp.hh>

#include <catch2/catch_test_macros.hpp>

using namespace fds;

TEST_CASE("NotEquals")
{
    CSP csp;
    auto a = csp.create_variable(Domain{1_v, 2_v}, "a");
    auto b = csp.create_variable(Domain{1_v, 2_v}, "b");
    NotEquals c{a, b};

    CHECK(c.is_binary());
    CHECK(c.involves(a));
    CHECK(c.describe(csp) == "a != b");

    Assignment assignment;
    CHECK(c.is_satisfied_by(assignment));
    assignment.assign(a, 1_v);
    CHECK(c.is_satisfied_by(assignment));
    CHECK(! c.accepts(b, 1_v, assignment));
    CHECK(c.accepts(b, 2_v, assignment));
    assignment.assign(b, 1_v);
    CHECK(! c.is_satisfied_by(assignment));
    assignment.assign(b, 2_v);
    CHECK(c.is_satisfied_by(assignment));

    // the variable's own value is ignored by accepts
    CHECK(c.accepts(a, 1_v, assignment));
    CHECK(! c.accepts(a, 2_v, assignment));

    auto copy = c.clone();
    CHECK(copy->scope() == c.scope());
}

TEST_CASE("Equals")
{
    CSP csp;
    auto a = csp.create_variable(Domain{1_v, 2_v}, "a");
    auto b = csp.create_variable(Domain{1_v, 2_v}, "b");
    Equals c{a, b};

    CHECK(c.describe(csp) == "a = b");

    Assignment assignment;
    assignment.assign(b, 2_v);
    CHECK(c.accepts(a, 2_v, assignment));
    CHECK(! c.accepts(a, 1_v, assignment));
}
