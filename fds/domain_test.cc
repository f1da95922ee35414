#include <fds/domain.hh>
#include <fds/exception.hh>

#include <catch2/catch_test_macros.hpp>

#include <vector>

using namespace fds;

using std::vector;

TEST_CASE("Domain keeps values in order")
{
    Domain d{"a"_v, "b"_v, "c"_v};
    CHECK(d.size() == 3);
    CHECK(! d.empty());
    CHECK(d.values() == vector<Value>{"a"_v, "b"_v, "c"_v});
    CHECK(d.contains("b"_v));
    CHECK(! d.contains("d"_v));
    CHECK(d.position_of("c"_v) == 2);
    CHECK(! d.position_of("d"_v));
}

TEST_CASE("Domain values of different kinds are different")
{
    Domain d{1_v, "1"_v};
    CHECK(d.size() == 2);
    CHECK(d.contains(1_v));
    CHECK(d.contains("1"_v));
    CHECK(! d.contains(2_v));
}

TEST_CASE("Domain rejects duplicates")
{
    CHECK_THROWS_AS((Domain{1_v, 2_v, 1_v}), MalformedProblem);
    CHECK_THROWS_AS((Domain{vector<Value>{"x"_v, "x"_v}}), MalformedProblem);
    CHECK_NOTHROW(Domain{});
}

TEST_CASE("Domain removal and restoration")
{
    Domain d{1_v, 2_v, 3_v, 4_v};

    SECTION("remove reports position")
    {
        CHECK(d.remove(3_v) == 2);
        CHECK(d.values() == vector<Value>{1_v, 2_v, 4_v});
        CHECK(! d.remove(3_v));
    }

    SECTION("restoring in reverse order gives back the original")
    {
        auto p1 = d.remove(2_v);
        auto p2 = d.remove(4_v);
        auto p3 = d.remove(1_v);
        REQUIRE(p1);
        REQUIRE(p2);
        REQUIRE(p3);
        CHECK(d.values() == vector<Value>{3_v});

        d.restore(*p3, 1_v);
        d.restore(*p2, 4_v);
        d.restore(*p1, 2_v);
        CHECK(d == Domain{1_v, 2_v, 3_v, 4_v});
    }

    SECTION("emptying is allowed")
    {
        for (auto v : {1_v, 2_v, 3_v, 4_v})
            CHECK(d.remove(v));
        CHECK(d.empty());
    }

    SECTION("restoring out of range is a bug")
    {
        CHECK_THROWS_AS(d.restore(7, 5_v), UnexpectedException);
    }
}
