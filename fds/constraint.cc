#include <fds/assignment.hh>
#include <fds/constraint.hh>
#include <fds/csp.hh>

#include <fmt/core.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <string>
#include <vector>

using namespace fds;

using std::find;
using std::string;
using std::vector;

Constraint::~Constraint() = default;

auto Constraint::describe(const CSP & csp) const -> string
{
    vector<string> names;
    for (auto & v : scope())
        names.push_back(csp.name_of(v));
    return fmt::format("constraint({})", fmt::join(names, ", "));
}

auto Constraint::is_satisfied_by(const Assignment & assignment) const -> bool
{
    vector<Value> values;
    values.reserve(scope().size());
    for (auto & v : scope()) {
        auto val = assignment.value_of(v);
        if (! val)
            return true;
        values.push_back(*val);
    }
    return check(values);
}

auto Constraint::accepts(VariableID var, const Value & value, const Assignment & assignment) const -> bool
{
    vector<Value> values;
    values.reserve(scope().size());
    for (auto & v : scope()) {
        if (v == var)
            values.push_back(value);
        else {
            auto val = assignment.value_of(v);
            if (! val)
                return true;
            values.push_back(*val);
        }
    }
    return check(values);
}

auto Constraint::involves(VariableID var) const -> bool
{
    return scope().end() != find(scope().begin(), scope().end(), var);
}

auto Constraint::is_binary() const -> bool
{
    return 2 == scope().size();
}
