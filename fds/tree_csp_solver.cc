#include <fds/constraint.hh>
#include <fds/exception.hh>
#include <fds/inference.hh>
#include <fds/tree_csp_solver.hh>

#include <fmt/core.h>

#include <utility>
#include <vector>

using namespace fds;

using std::mt19937;
using std::nullopt;
using std::optional;
using std::pair;
using std::random_device;
using std::size_t;
using std::uniform_int_distribution;
using std::vector;

namespace
{
    using ParentEdge = pair<VariableID, const Constraint *>;

    auto check_arities(const CSP & csp) -> void
    {
        for (auto & c : csp.constraints())
            if (c->scope().size() > 2)
                throw StructuralError{fmt::format("constraint {} is not binary", c->describe(csp))};
    }

    // Breadth first from the root, and then from each variable not yet
    // reached, so that a forest gets one tree per component. A variable with
    // more than one edge back to something already reached closes a cycle.
    auto order_variables(const CSP & csp, VariableID root, vector<optional<ParentEdge>> & parents) -> vector<VariableID>
    {
        vector<VariableID> ordered;
        vector<bool> reached(csp.variables().size(), false);
        parents.assign(csp.variables().size(), nullopt);

        vector<VariableID> roots{root};
        roots.insert(roots.end(), csp.variables().begin(), csp.variables().end());

        for (auto & r : roots) {
            if (reached[r.index])
                continue;

            reached[r.index] = true;
            ordered.push_back(r);

            for (auto pos = ordered.size() - 1; pos < ordered.size(); ++pos) {
                auto current = ordered[pos];
                int edges_to_reached = 0;
                for (auto & c : csp.constraints_of(current)) {
                    auto neighbour = csp.neighbour_of(current, *c);
                    if (! neighbour)
                        continue;

                    if (reached[neighbour->index]) {
                        if (++edges_to_reached > 1)
                            throw StructuralError{fmt::format("constraint graph is not a tree: {} is on a cycle", csp.name_of(current))};
                    }
                    else {
                        reached[neighbour->index] = true;
                        parents[neighbour->index] = ParentEdge{current, c};
                        ordered.push_back(*neighbour);
                    }
                }
            }
        }

        return ordered;
    }
}

TreeCspSolver::TreeCspSolver(RootSelection root_selection, optional<mt19937::result_type> seed) :
    _root_selection(root_selection),
    _rand(seed ? *seed : random_device{}())
{
}

auto TreeCspSolver::search(CSP & csp) -> optional<Assignment>
{
    check_arities(csp);

    if (csp.variables().empty())
        return Assignment{};

    auto root = csp.variables().front();
    switch (_root_selection) {
    case RootSelection::FirstVariable: break;
    case RootSelection::Random: {
        uniform_int_distribution<size_t> dist(0, csp.variables().size() - 1);
        root = csp.variables()[dist(_rand)];
    } break;
    }

    vector<optional<ParentEdge>> parents;
    auto ordered = order_variables(csp, root, parents);

    Assignment assignment;

    // unary constraints
    for (auto & c : csp.constraints()) {
        if (c->scope().size() != 1)
            continue;
        auto before = csp.new_epoch();
        auto result = revise(csp, assignment, c->scope().front(), *c);
        _stats.values_pruned += csp.new_epoch().when - before.when;
        if (Inference::NoChange != result)
            notify(csp, c->scope().front(), nullptr);
        if (Inference::Contradiction == result || should_stop())
            return nullopt;
    }

    // directional arc consistency, leaves first
    for (auto pos = ordered.size(); pos-- > 0;) {
        auto & parent = parents[ordered[pos].index];
        if (! parent)
            continue;

        ++_stats.inferences;
        auto before = csp.new_epoch();
        auto result = revise(csp, assignment, parent->first, *parent->second);
        _stats.values_pruned += csp.new_epoch().when - before.when;
        if (Inference::NoChange != result)
            notify(csp, parent->first, nullptr);
        if (Inference::Contradiction == result) {
            ++_stats.contradicting_inferences;
            return nullopt;
        }
        if (should_stop())
            return nullopt;
    }

    for (auto & v : ordered)
        if (csp.domain(v).empty())
            return nullopt;

    // assign from the roots down, which after the consistency pass can
    // never get stuck
    for (auto & v : ordered) {
        if (should_stop())
            return nullopt;

        auto & parent = parents[v.index];
        optional<Value> chosen;
        for (auto & val : csp.domain(v))
            if ((! parent) || parent->second->accepts(v, val, assignment)) {
                chosen = val;
                break;
            }

        if (! chosen)
            throw UnexpectedException{fmt::format("no value for {} consistent with its parent after arc consistency", csp.name_of(v))};

        assignment.assign(v, *chosen);
        ++_stats.assignments;
        notify(csp, v, &assignment);
    }

    return assignment;
}
