#include <fds/assignment.hh>
#include <fds/constraint.hh>
#include <fds/csp.hh>

#include <fmt/core.h>
#include <fmt/ranges.h>

#include <algorithm>

using namespace fds;

using std::count_if;
using std::find;
using std::move;
using std::nullopt;
using std::optional;
using std::size_t;
using std::string;
using std::vector;

VariableNotAssigned::VariableNotAssigned(const string & w) :
    _wat("variable " + w + " is not assigned")
{
}

auto VariableNotAssigned::what() const noexcept -> const char *
{
    return _wat.c_str();
}

auto Assignment::assign(VariableID var, Value val) -> void
{
    if (_values.size() <= var.index)
        _values.resize(var.index + 1);
    if (! _values[var.index])
        _order.push_back(var);
    _values[var.index] = move(val);
}

auto Assignment::unassign(VariableID var) -> void
{
    if (! contains(var))
        return;
    _values[var.index] = nullopt;
    _order.erase(find(_order.begin(), _order.end(), var));
}

auto Assignment::contains(VariableID var) const -> bool
{
    return var.index < _values.size() && _values[var.index].has_value();
}

auto Assignment::value_of(VariableID var) const -> optional<Value>
{
    if (var.index < _values.size())
        return _values[var.index];
    return nullopt;
}

auto Assignment::operator()(VariableID var) const -> const Value &
{
    if (! contains(var))
        throw VariableNotAssigned{"#" + std::to_string(var.index)};
    return *_values[var.index];
}

auto Assignment::size() const -> size_t
{
    return _order.size();
}

auto Assignment::empty() const -> bool
{
    return _order.empty();
}

auto Assignment::variables() const -> const vector<VariableID> &
{
    return _order;
}

auto Assignment::is_complete(const CSP & csp) const -> bool
{
    for (auto & v : csp.variables())
        if (! contains(v))
            return false;
    return true;
}

auto Assignment::is_consistent(const vector<const Constraint *> & constraints) const -> bool
{
    for (auto & c : constraints)
        if (! c->is_satisfied_by(*this))
            return false;
    return true;
}

auto Assignment::is_solution(const CSP & csp) const -> bool
{
    return is_complete(csp) && 0 == number_of_conflicts(csp);
}

auto Assignment::number_of_conflicts(const CSP & csp) const -> size_t
{
    return count_if(csp.constraints().begin(), csp.constraints().end(), [&](const Constraint * c) {
        return ! c->is_satisfied_by(*this);
    });
}

auto fds::describe(const CSP & csp, const Assignment & assignment) -> string
{
    vector<string> parts;
    for (auto & v : assignment.variables())
        parts.push_back(fmt::format("{}={}", csp.name_of(v), debug_string(assignment(v))));
    return fmt::format("{{{}}}", fmt::join(parts, ", "));
}
