/* vim: set sw=4 sts=4 et foldmethod=syntax : */

#include <fds/exception.hh>
#include <fds/stats.hh>

#include <ostream>

using namespace fds;

using std::ostream;
using std::string;

auto fds::to_string(Outcome o) -> string
{
    switch (o) {
    case Outcome::Unstarted: return "unstarted";
    case Outcome::Searching: return "searching";
    case Outcome::Solved: return "solved";
    case Outcome::Exhausted: return "exhausted";
    case Outcome::Aborted: return "aborted";
    case Outcome::StructurallyInvalid: return "structurally invalid";
    }
    throw NonExhaustiveSwitch{};
}

auto fds::operator<<(ostream & o, const Stats & s) -> ostream &
{
    o << "outcome: " << to_string(s.outcome) << '\n';
    o << "events: " << s.events << '\n';
    o << "assignments: " << s.assignments << '\n';
    o << "recursions: " << s.recursions << '\n';
    o << "failures: " << s.failures << '\n';
    o << "inferences: " << s.inferences << '\n';
    o << "contradicting inferences: " << s.contradicting_inferences << '\n';
    o << "values pruned: " << s.values_pruned << '\n';
    o << "steps: " << s.steps << '\n';
    o << "max depth: " << s.max_depth << '\n';
    o << "conflicts: " << s.conflicts << '\n';
    o << "solve time: " << (s.solve_time.count() / 1'000'000.0) << "s" << '\n';
    return o;
}
