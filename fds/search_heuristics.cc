#include <fds/constraint.hh>
#include <fds/search_heuristics.hh>

#include <algorithm>
#include <tuple>
#include <utility>

using std::function;
using std::move;
using std::nullopt;
using std::optional;
using std::pair;
using std::stable_sort;
using std::tuple;
using std::vector;

using namespace fds;

namespace
{
    using VariableComparator = function<auto(const CSP &, const Assignment &, VariableID, VariableID)->bool>;

    auto in_order_of(VariableComparator comp) -> VariableSelector
    {
        return [comp = move(comp)](const CSP & csp, const Assignment & assignment) -> optional<VariableID> {
            optional<VariableID> result;
            for (auto & v : csp.variables()) {
                if (assignment.contains(v))
                    continue;
                if ((! result) || comp(csp, assignment, v, *result))
                    result = v;
            }
            return result;
        };
    }
}

auto fds::unassigned_degree_of(const CSP & csp, const Assignment & assignment, VariableID var) -> long long
{
    long long result = 0;
    for (auto & c : csp.constraints_of(var))
        for (auto & v : c->scope())
            if (v != var && ! assignment.contains(v)) {
                ++result;
                break;
            }
    return result;
}

auto fds::values_ruled_out_by(const CSP & csp, const Assignment & assignment, VariableID var, const Value & value) -> long long
{
    auto with_value = assignment;
    with_value.assign(var, value);

    long long result = 0;
    for (auto & c : csp.constraints_of(var))
        for (auto & v : c->scope())
            if (v != var && ! assignment.contains(v))
                for (auto & w : csp.domain(v))
                    if (! c->accepts(v, w, with_value))
                        ++result;
    return result;
}

auto fds::variable_order::in_order() -> VariableSelector
{
    return [](const CSP & csp, const Assignment & assignment) -> optional<VariableID> {
        for (auto & v : csp.variables())
            if (! assignment.contains(v))
                return v;
        return nullopt;
    };
}

auto fds::variable_order::dom() -> VariableSelector
{
    return in_order_of([](const CSP & csp, const Assignment &, VariableID a, VariableID b) {
        return csp.domain(a).size() < csp.domain(b).size();
    });
}

auto fds::variable_order::deg() -> VariableSelector
{
    return in_order_of([](const CSP & csp, const Assignment & assignment, VariableID a, VariableID b) {
        return unassigned_degree_of(csp, assignment, a) > unassigned_degree_of(csp, assignment, b);
    });
}

auto fds::variable_order::dom_then_deg() -> VariableSelector
{
    return in_order_of([](const CSP & csp, const Assignment & assignment, VariableID a, VariableID b) {
        return tuple{csp.domain(a).size(), -unassigned_degree_of(csp, assignment, a)} <
            tuple{csp.domain(b).size(), -unassigned_degree_of(csp, assignment, b)};
    });
}

auto fds::value_order::in_domain_order() -> ValueOrderer
{
    return [](const CSP & csp, const Assignment &, VariableID var) -> vector<Value> {
        return csp.domain(var).values();
    };
}

auto fds::value_order::least_constraining() -> ValueOrderer
{
    return [](const CSP & csp, const Assignment & assignment, VariableID var) -> vector<Value> {
        vector<pair<long long, Value>> scored;
        for (auto & v : csp.domain(var))
            scored.emplace_back(values_ruled_out_by(csp, assignment, var, v), v);

        stable_sort(scored.begin(), scored.end(), [](const auto & a, const auto & b) {
            return a.first < b.first;
        });

        vector<Value> result;
        for (auto & [_, v] : scored)
            result.push_back(v);
        return result;
    };
}
