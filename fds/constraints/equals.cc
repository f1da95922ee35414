#include <fds/constraints/equals.hh>
#include <fds/csp.hh>

#include <fmt/core.h>

using namespace fds;

using std::make_unique;
using std::string;
using std::unique_ptr;
using std::vector;

Equals::Equals(const VariableID v1, const VariableID v2) :
    _scope{v1, v2}
{
}

auto Equals::scope() const -> const vector<VariableID> &
{
    return _scope;
}

auto Equals::check(const vector<Value> & values) const -> bool
{
    return values.at(0) == values.at(1);
}

auto Equals::clone() const -> unique_ptr<Constraint>
{
    return make_unique<Equals>(_scope[0], _scope[1]);
}

auto Equals::describe(const CSP & csp) const -> string
{
    return fmt::format("{} = {}", csp.name_of(_scope[0]), csp.name_of(_scope[1]));
}
