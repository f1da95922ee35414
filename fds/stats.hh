#ifndef FINITE_DOMAIN_SEARCH_GUARD_FDS_STATS_HH
#define FINITE_DOMAIN_SEARCH_GUARD_FDS_STATS_HH

#include <chrono>
#include <iosfwd>
#include <string>

#include <fmt/ostream.h>

namespace fds
{
    /**
     * \brief How did the most recent solve end?
     *
     * \sa Stats
     * \ingroup Core
     */
    enum class Outcome
    {
        Unstarted,
        Searching,
        Solved,
        Exhausted,
        Aborted,
        StructurallyInvalid
    };

    /**
     * \brief Statistics from solving.
     *
     * Not every solver uses every counter.
     *
     * \sa CspSolver::stats()
     * \ingroup Core
     */
    struct Stats final
    {
        Outcome outcome = Outcome::Unstarted;

        unsigned long long events = 0;
        unsigned long long assignments = 0;
        unsigned long long recursions = 0;
        unsigned long long failures = 0;
        unsigned long long inferences = 0;
        unsigned long long contradicting_inferences = 0;
        unsigned long long values_pruned = 0;
        unsigned long long steps = 0;
        unsigned long long max_depth = 0;

        /**
         * For MinConflictsSolver, the number of violated constraints in the
         * final assignment.
         */
        unsigned long long conflicts = 0;

        std::chrono::microseconds solve_time{0};
    };

    [[nodiscard]] auto to_string(Outcome) -> std::string;

    /**
     * \brief Stats can be written to an ostream, for convenience.
     *
     * \sa Stats
     * \ingroup Core
     */
    auto operator<<(std::ostream &, const Stats &) -> std::ostream &;
}

template <>
struct fmt::formatter<fds::Stats> : ostream_formatter
{
};

#endif
