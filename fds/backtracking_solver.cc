#include <fds/backtracking_solver.hh>

#include <algorithm>

using namespace fds;

using std::max;
using std::move;
using std::nullopt;
using std::optional;

FlexibleBacktrackingSolver::FlexibleBacktrackingSolver() :
    _select_variable(variable_order::in_order()),
    _order_values(value_order::in_domain_order()),
    _infer(inference::none())
{
}

auto FlexibleBacktrackingSolver::set(VariableSelector s) -> FlexibleBacktrackingSolver &
{
    _select_variable = move(s);
    return *this;
}

auto FlexibleBacktrackingSolver::set(ValueOrderer o) -> FlexibleBacktrackingSolver &
{
    _order_values = move(o);
    return *this;
}

auto FlexibleBacktrackingSolver::set(InferenceStrategy i) -> FlexibleBacktrackingSolver &
{
    _infer = move(i);
    return *this;
}

auto FlexibleBacktrackingSolver::set_all() -> FlexibleBacktrackingSolver &
{
    return set(variable_order::dom_then_deg())
        .set(value_order::least_constraining())
        .set(inference::arc_consistency());
}

auto FlexibleBacktrackingSolver::infer(CSP & csp, const Assignment & assignment, const optional<VariableID> & var) -> Inference
{
    auto before = csp.new_epoch();
    auto result = _infer(csp, assignment, var);
    ++_stats.inferences;
    _stats.values_pruned += csp.new_epoch().when - before.when;

    if (Inference::NoChange != result)
        notify(csp, nullopt, nullptr);
    if (Inference::Contradiction == result)
        ++_stats.contradicting_inferences;

    return result;
}

auto FlexibleBacktrackingSolver::backtrack(CSP & csp, Assignment & assignment, unsigned long long depth) -> bool
{
    _stats.max_depth = max(_stats.max_depth, depth);
    ++_stats.recursions;

    auto var = _select_variable(csp, assignment);
    if (! var)
        return true;

    for (auto & value : _order_values(csp, assignment, *var)) {
        if (should_stop())
            return false;

        assignment.assign(*var, value);
        ++_stats.assignments;
        notify(csp, var, &assignment);
        if (should_stop()) {
            assignment.unassign(*var);
            return false;
        }

        if (assignment.is_consistent(csp.constraints_of(*var))) {
            auto timestamp = csp.new_epoch();
            if (Inference::Contradiction != infer(csp, assignment, var) && ! should_stop())
                if (backtrack(csp, assignment, depth + 1))
                    return true;
            csp.backtrack(timestamp);
        }

        assignment.unassign(*var);
        ++_stats.failures;
    }

    return false;
}

auto FlexibleBacktrackingSolver::search(CSP & csp) -> optional<Assignment>
{
    Assignment assignment;

    if (Inference::Contradiction == infer(csp, assignment, nullopt) || should_stop())
        return nullopt;

    if (! backtrack(csp, assignment, 0))
        return nullopt;

    notify(csp, nullopt, &assignment);
    return assignment;
}
