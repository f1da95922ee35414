#include <fds/inference.hh>

#include <deque>
#include <functional>
#include <set>
#include <utility>
#include <vector>

using namespace fds;

using std::deque;
using std::function;
using std::nullopt;
using std::optional;
using std::pair;
using std::set;
using std::size_t;
using std::vector;

namespace
{
    using Arc = pair<VariableID, const Constraint *>;

    struct ArcQueue
    {
        deque<Arc> arcs;
        set<Arc> queued;

        auto push(VariableID v, const Constraint * c) -> void
        {
            if (queued.emplace(v, c).second)
                arcs.emplace_back(v, c);
        }

        auto pop() -> Arc
        {
            auto result = arcs.front();
            arcs.pop_front();
            queued.erase(result);
            return result;
        }
    };
}

auto fds::has_support(const CSP & csp, const Assignment & assignment, const Constraint & constraint,
    VariableID var, const Value & value) -> bool
{
    auto & scope = constraint.scope();
    vector<Value> tuple(scope.size());

    function<auto(size_t)->bool> extend = [&](size_t pos) -> bool {
        if (pos == scope.size())
            return constraint.check(tuple);

        if (scope[pos] == var) {
            tuple[pos] = value;
            return extend(pos + 1);
        }

        auto assigned = assignment.value_of(scope[pos]);
        if (assigned) {
            tuple[pos] = *assigned;
            return extend(pos + 1);
        }

        for (auto & v : csp.domain(scope[pos])) {
            tuple[pos] = v;
            if (extend(pos + 1))
                return true;
        }
        return false;
    };

    return extend(0);
}

auto fds::revise(CSP & csp, const Assignment & assignment, VariableID var, const Constraint & constraint) -> Inference
{
    bool changed = false;
    // copy, because we remove as we go
    auto values = csp.domain(var).values();
    for (auto & v : values)
        if (! has_support(csp, assignment, constraint, var, v)) {
            csp.remove_value(var, v);
            changed = true;
        }

    if (csp.domain(var).empty())
        return Inference::Contradiction;
    return changed ? Inference::Change : Inference::NoChange;
}

auto fds::inference::none() -> InferenceStrategy
{
    return [](CSP &, const Assignment &, const optional<VariableID> &) -> Inference {
        return Inference::NoChange;
    };
}

auto fds::inference::forward_checking() -> InferenceStrategy
{
    return [](CSP & csp, const Assignment & assignment, const optional<VariableID> & var) -> Inference {
        if (! var)
            return Inference::NoChange;

        auto result = Inference::NoChange;
        for (auto & c : csp.constraints_of(*var)) {
            optional<VariableID> unassigned = nullopt;
            int how_many_unassigned = 0;
            for (auto & v : c->scope())
                if (! assignment.contains(v)) {
                    unassigned = v;
                    ++how_many_unassigned;
                }

            if (1 != how_many_unassigned)
                continue;

            auto values = csp.domain(*unassigned).values();
            for (auto & v : values)
                if (! c->accepts(*unassigned, v, assignment)) {
                    csp.remove_value(*unassigned, v);
                    result = Inference::Change;
                }

            if (csp.domain(*unassigned).empty())
                return Inference::Contradiction;
        }

        return result;
    };
}

auto fds::inference::arc_consistency() -> InferenceStrategy
{
    return [](CSP & csp, const Assignment & assignment, const optional<VariableID> & var) -> Inference {
        auto result = Inference::NoChange;
        ArcQueue queue;

        if (var) {
            if (csp.restrict_to(*var, assignment(*var)))
                result = Inference::Change;
            if (csp.domain(*var).empty())
                return Inference::Contradiction;
            for (auto & c : csp.constraints_of(*var))
                for (auto & v : c->scope())
                    if (v != *var)
                        queue.push(v, c);
        }
        else {
            for (auto & c : csp.constraints())
                for (auto & v : c->scope())
                    queue.push(v, c);
        }

        while (! queue.arcs.empty()) {
            auto [x, c] = queue.pop();
            switch (revise(csp, assignment, x, *c)) {
            case Inference::NoChange:
                break;
            case Inference::Contradiction:
                return Inference::Contradiction;
            case Inference::Change:
                result = Inference::Change;
                for (auto & other : csp.constraints_of(x))
                    if (other != c)
                        for (auto & y : other->scope())
                            if (y != x)
                                queue.push(y, other);
                break;
            }
        }

        return result;
    };
}
