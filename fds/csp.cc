#include <fds/csp.hh>
#include <fds/exception.hh>

#include <fmt/core.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <set>

using namespace fds;

using std::make_unique;
using std::move;
using std::nullopt;
using std::optional;
using std::set;
using std::size_t;
using std::string;
using std::unique_ptr;
using std::vector;

namespace
{
    struct TrailEntry
    {
        VariableID var;
        size_t position;
        Value value;
    };
}

struct CSP::Imp
{
    vector<VariableID> variables;
    vector<string> names;
    vector<Domain> domains;
    vector<unique_ptr<Constraint>> owned_constraints;
    vector<const Constraint *> constraints;
    vector<vector<const Constraint *>> constraints_by_variable;
    vector<TrailEntry> trail;
};

CSP::CSP() :
    _imp(make_unique<Imp>())
{
}

CSP::~CSP() = default;

CSP::CSP(CSP &&) = default;

auto CSP::operator=(CSP &&) -> CSP & = default;

auto CSP::check_variable(VariableID var) const -> void
{
    if (! contains(var))
        throw MalformedProblem{fmt::format("variable #{} does not belong to this problem", var.index)};
}

auto CSP::create_variable(Domain domain, const optional<string> & name) -> VariableID
{
    VariableID result{_imp->variables.size()};
    _imp->variables.push_back(result);
    _imp->names.push_back(name ? *name : fmt::format("x{}", result.index));
    _imp->domains.push_back(move(domain));
    _imp->constraints_by_variable.emplace_back();
    return result;
}

auto CSP::create_variables(const vector<string> & names, const Domain & domain) -> vector<VariableID>
{
    vector<VariableID> result;
    for (auto & n : names)
        result.push_back(create_variable(domain, n));
    return result;
}

auto CSP::set_domain(VariableID var, Domain domain) -> void
{
    check_variable(var);
    _imp->domains[var.index] = move(domain);
}

auto CSP::post(const Constraint & c) -> void
{
    if (c.scope().empty())
        throw MalformedProblem{"constraint has an empty scope"};

    set<VariableID> seen;
    for (auto & v : c.scope()) {
        check_variable(v);
        if (! seen.insert(v).second)
            throw MalformedProblem{fmt::format("variable {} appears twice in the scope of a constraint", name_of(v))};
    }

    auto & owned = _imp->owned_constraints.emplace_back(c.clone());
    _imp->constraints.push_back(owned.get());
    for (auto & v : owned->scope())
        _imp->constraints_by_variable[v.index].push_back(owned.get());
}

auto CSP::variables() const -> const vector<VariableID> &
{
    return _imp->variables;
}

auto CSP::contains(VariableID var) const -> bool
{
    return var.index < _imp->variables.size();
}

auto CSP::name_of(VariableID var) const -> const string &
{
    check_variable(var);
    return _imp->names[var.index];
}

auto CSP::domain(VariableID var) const -> const Domain &
{
    check_variable(var);
    return _imp->domains[var.index];
}

auto CSP::constraints() const -> const vector<const Constraint *> &
{
    return _imp->constraints;
}

auto CSP::constraints_of(VariableID var) const -> const vector<const Constraint *> &
{
    check_variable(var);
    return _imp->constraints_by_variable[var.index];
}

auto CSP::neighbour_of(VariableID var, const Constraint & c) const -> optional<VariableID>
{
    auto & scope = c.scope();
    if (scope.size() != 2)
        return nullopt;
    if (scope[0] == var)
        return scope[1];
    else if (scope[1] == var)
        return scope[0];
    return nullopt;
}

auto CSP::neighbours_of(VariableID var) const -> vector<VariableID>
{
    set<VariableID> result;
    for (auto & c : constraints_of(var))
        for (auto & v : c->scope())
            if (v != var)
                result.insert(v);
    return vector<VariableID>{result.begin(), result.end()};
}

auto CSP::degree_of(VariableID var) const -> size_t
{
    return constraints_of(var).size();
}

auto CSP::new_epoch() -> Timestamp
{
    return Timestamp{_imp->trail.size()};
}

auto CSP::remove_value(VariableID var, const Value & val) -> bool
{
    check_variable(var);
    auto pos = _imp->domains[var.index].remove(val);
    if (! pos)
        return false;
    _imp->trail.push_back(TrailEntry{var, *pos, val});
    return true;
}

auto CSP::restrict_to(VariableID var, const Value & val) -> bool
{
    check_variable(var);
    // copy, because removing invalidates the domain's storage
    auto values = _imp->domains[var.index].values();
    bool changed = false;
    for (auto & v : values)
        if (v != val)
            changed = remove_value(var, v) || changed;
    return changed;
}

auto CSP::backtrack(Timestamp t) -> void
{
    if (t.when > _imp->trail.size())
        throw UnexpectedException{"backtracking to a timestamp from the future"};
    while (_imp->trail.size() > t.when) {
        auto & entry = _imp->trail.back();
        _imp->domains[entry.var.index].restore(entry.position, entry.value);
        _imp->trail.pop_back();
    }
}

auto fds::describe(const CSP & csp, VariableID var) -> string
{
    vector<string> values;
    for (auto & v : csp.domain(var))
        values.push_back(debug_string(v));
    return fmt::format("{} in {{{}}}", csp.name_of(var), fmt::join(values, ", "));
}
