#include <fds/exception.hh>
#include <fds/solver.hh>

using namespace fds;

using std::atomic;
using std::move;
using std::optional;
using std::chrono::duration_cast;
using std::chrono::microseconds;
using std::chrono::steady_clock;

CspSolver::~CspSolver() = default;

auto CspSolver::add_listener(ProgressListener listener) -> void
{
    _listeners.push_back(move(listener));
}

auto CspSolver::notify(const CSP & csp, const optional<VariableID> & var, const Assignment * assignment) -> void
{
    ++_stats.events;
    for (auto & listener : _listeners)
        if (! listener(csp, var, assignment))
            _stop_requested = true;
}

auto CspSolver::should_stop() const -> bool
{
    return _stop_requested || (_optional_abort_flag && _optional_abort_flag->load());
}

auto CspSolver::solve(CSP & csp, atomic<bool> * optional_abort_flag) -> optional<Assignment>
{
    _stats = Stats{};
    _stats.outcome = Outcome::Searching;
    _optional_abort_flag = optional_abort_flag;
    _stop_requested = false;

    auto start_time = steady_clock::now();
    optional<Assignment> result;
    try {
        result = search(csp);
    }
    catch (const StructuralError &) {
        _stats.outcome = Outcome::StructurallyInvalid;
        _stats.solve_time = duration_cast<microseconds>(steady_clock::now() - start_time);
        _optional_abort_flag = nullptr;
        throw;
    }
    catch (...) {
        _stats.outcome = Outcome::Aborted;
        _stats.solve_time = duration_cast<microseconds>(steady_clock::now() - start_time);
        _optional_abort_flag = nullptr;
        throw;
    }

    _stats.solve_time = duration_cast<microseconds>(steady_clock::now() - start_time);
    if (result)
        _stats.outcome = Outcome::Solved;
    else if (should_stop())
        _stats.outcome = Outcome::Aborted;
    else
        _stats.outcome = Outcome::Exhausted;

    _optional_abort_flag = nullptr;
    return result;
}

auto CspSolver::stats() const -> const Stats &
{
    return _stats;
}
