#include <fds/constraints/predicate.hh>
#include <fds/csp.hh>

#include <fmt/core.h>
#include <fmt/ranges.h>

using namespace fds;

using std::make_unique;
using std::move;
using std::optional;
using std::string;
using std::unique_ptr;
using std::vector;

Predicate::Predicate(vector<VariableID> v, PredicateFunction f, optional<string> n) :
    _vars(move(v)),
    _func(move(f)),
    _name(move(n))
{
}

auto Predicate::scope() const -> const vector<VariableID> &
{
    return _vars;
}

auto Predicate::check(const vector<Value> & values) const -> bool
{
    return _func(values);
}

auto Predicate::clone() const -> unique_ptr<Constraint>
{
    return make_unique<Predicate>(_vars, _func, _name);
}

auto Predicate::describe(const CSP & csp) const -> string
{
    vector<string> names;
    for (auto & v : _vars)
        names.push_back(csp.name_of(v));
    return fmt::format("{}({})", _name.value_or("predicate"), fmt::join(names, ", "));
}
