#include <fds/constraints/not_equals.hh>
#include <fds/csp.hh>

#include <fmt/core.h>

using namespace fds;

using std::make_unique;
using std::string;
using std::unique_ptr;
using std::vector;

NotEquals::NotEquals(const VariableID v1, const VariableID v2) :
    _scope{v1, v2}
{
}

auto NotEquals::scope() const -> const vector<VariableID> &
{
    return _scope;
}

auto NotEquals::check(const vector<Value> & values) const -> bool
{
    return values.at(0) != values.at(1);
}

auto NotEquals::clone() const -> unique_ptr<Constraint>
{
    return make_unique<NotEquals>(_scope[0], _scope[1]);
}

auto NotEquals::describe(const CSP & csp) const -> string
{
    return fmt::format("{} != {}", csp.name_of(_scope[0]), csp.name_of(_scope[1]));
}
