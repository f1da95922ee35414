#include <fds/constraint.hh>
#include <fds/min_conflicts_solver.hh>

#include <limits>
#include <set>
#include <vector>

using namespace fds;

using std::mt19937;
using std::nullopt;
using std::numeric_limits;
using std::optional;
using std::random_device;
using std::set;
using std::size_t;
using std::uniform_int_distribution;
using std::vector;

namespace
{
    auto make_rand(optional<mt19937::result_type> seed) -> mt19937
    {
        if (seed)
            return mt19937{*seed};
        random_device rand_dev;
        return mt19937{rand_dev()};
    }
}

MinConflictsSolver::MinConflictsSolver(unsigned long long max_steps, optional<mt19937::result_type> seed) :
    _max_steps(max_steps),
    _rand(make_rand(seed))
{
}

auto MinConflictsSolver::current_assignment() const -> const Assignment &
{
    return _current;
}

auto MinConflictsSolver::conflicts_if(const CSP & csp, VariableID var, const Value & value) const -> size_t
{
    size_t result = 0;
    for (auto & c : csp.constraints_of(var))
        if (! c->accepts(var, value, _current))
            ++result;
    return result;
}

auto MinConflictsSolver::min_conflicts_value(const CSP & csp, VariableID var) -> optional<Value>
{
    vector<Value> best;
    auto best_conflicts = numeric_limits<size_t>::max();
    for (auto & v : csp.domain(var)) {
        auto conflicts = conflicts_if(csp, var, v);
        if (conflicts < best_conflicts) {
            best_conflicts = conflicts;
            best.clear();
        }
        if (conflicts == best_conflicts)
            best.push_back(v);
    }

    if (best.empty())
        return nullopt;

    uniform_int_distribution<size_t> dist(0, best.size() - 1);
    return best[dist(_rand)];
}

auto MinConflictsSolver::random_conflicted_variable(const CSP & csp) -> optional<VariableID>
{
    set<VariableID> conflicted;
    for (auto & c : csp.constraints())
        if (! c->is_satisfied_by(_current))
            conflicted.insert(c->scope().begin(), c->scope().end());

    if (conflicted.empty())
        return nullopt;

    vector<VariableID> candidates{conflicted.begin(), conflicted.end()};
    uniform_int_distribution<size_t> dist(0, candidates.size() - 1);
    return candidates[dist(_rand)];
}

auto MinConflictsSolver::search(CSP & csp) -> optional<Assignment>
{
    _current = Assignment{};

    for (auto & var : csp.variables()) {
        if (should_stop())
            return nullopt;

        auto value = min_conflicts_value(csp, var);
        if (! value)
            return nullopt;

        _current.assign(var, *value);
        ++_stats.assignments;
        notify(csp, var, &_current);
    }

    for (unsigned long long step = 0; step <= _max_steps; ++step) {
        if (should_stop())
            break;

        if (_current.is_solution(csp)) {
            _stats.conflicts = 0;
            notify(csp, nullopt, &_current);
            return _current;
        }

        if (step == _max_steps)
            break;

        auto var = random_conflicted_variable(csp);
        if (! var)
            break;

        auto value = min_conflicts_value(csp, *var);
        if (! value)
            break;

        ++_stats.steps;
        _current.assign(*var, *value);
        ++_stats.assignments;
        notify(csp, var, &_current);
    }

    _stats.conflicts = _current.number_of_conflicts(csp);
    return nullopt;
}
