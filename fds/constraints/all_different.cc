#include <fds/constraints/all_different.hh>
#include <fds/csp.hh>

#include <fmt/core.h>
#include <fmt/ranges.h>

#include <algorithm>

using namespace fds;

using std::find;
using std::make_unique;
using std::move;
using std::next;
using std::string;
using std::unique_ptr;
using std::vector;

AllDifferent::AllDifferent(vector<VariableID> v) :
    _vars(move(v))
{
}

auto AllDifferent::scope() const -> const vector<VariableID> &
{
    return _vars;
}

auto AllDifferent::check(const vector<Value> & values) const -> bool
{
    for (auto i = values.begin(); i != values.end(); ++i)
        if (values.end() != find(next(i), values.end(), *i))
            return false;
    return true;
}

auto AllDifferent::clone() const -> unique_ptr<Constraint>
{
    return make_unique<AllDifferent>(_vars);
}

auto AllDifferent::describe(const CSP & csp) const -> string
{
    vector<string> names;
    for (auto & v : _vars)
        names.push_back(csp.name_of(v));
    return fmt::format("alldifferent({})", fmt::join(names, ", "));
}
