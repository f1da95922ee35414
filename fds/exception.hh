/* vim: set sw=4 sts=4 et foldmethod=syntax : */

#ifndef FINITE_DOMAIN_SEARCH_GUARD_FDS_EXCEPTION_HH
#define FINITE_DOMAIN_SEARCH_GUARD_FDS_EXCEPTION_HH

#include <exception>
#include <string>
#include <version>

#if __has_include(<source_location>) && __cpp_lib_source_location
#  include <source_location>
#endif

namespace fds
{
    /**
     * \brief Thrown if something has gone wrong. This usually indicates a bug
     * in the solver.
     *
     * \ingroup Core
     */
    class UnexpectedException : public std::exception
    {
    private:
        std::string _wat;

    public:
        explicit UnexpectedException(const std::string &);

        virtual auto what() const noexcept -> const char * override;
    };

    /**
     * \brief Thrown if a switch statement is missing a case entry. This usually
     * indicates a bug in the solver.
     *
     * \ingroup Core
     */
    class NonExhaustiveSwitch : public UnexpectedException
    {
    public:
#if __has_include(<source_location>) && __cpp_lib_source_location
        explicit NonExhaustiveSwitch(const std::source_location & = std::source_location::current());
#else
        explicit NonExhaustiveSwitch();
#endif
    };

    /**
     * \brief Thrown when a problem is built incorrectly, for example if a
     * domain contains a duplicate value, or if a constraint mentions a
     * variable that does not belong to the CSP.
     *
     * The offending construction call has no effect.
     *
     * \ingroup Core
     */
    class MalformedProblem : public std::exception
    {
    private:
        std::string _wat;

    public:
        explicit MalformedProblem(const std::string &);

        virtual auto what() const noexcept -> const char * override;
    };

    /**
     * \brief Thrown by a solver that is applied to a problem whose structure
     * it cannot handle, such as a TreeCspSolver given a constraint graph
     * containing a cycle.
     *
     * This is distinct from a problem having no solution.
     *
     * \ingroup Core
     * \sa TreeCspSolver
     */
    class StructuralError : public std::exception
    {
    private:
        std::string _wat;

    public:
        explicit StructuralError(const std::string &);

        virtual auto what() const noexcept -> const char * override;
    };
}

#endif
