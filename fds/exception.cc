#include <fds/exception.hh>

using namespace fds;

#if __has_include(<source_location>) && __cpp_lib_source_location
using std::source_location;
#endif
using std::string;
#if __has_include(<source_location>) && __cpp_lib_source_location
using std::to_string;
#endif

UnexpectedException::UnexpectedException(const string & w) :
    _wat("unexpected problem: " + w)
{
}

auto UnexpectedException::what() const noexcept -> const char *
{
    return _wat.c_str();
}

MalformedProblem::MalformedProblem(const string & w) :
    _wat("malformed problem: " + w)
{
}

auto MalformedProblem::what() const noexcept -> const char *
{
    return _wat.c_str();
}

StructuralError::StructuralError(const string & w) :
    _wat(w)
{
}

auto StructuralError::what() const noexcept -> const char *
{
    return _wat.c_str();
}

#if __has_include(<source_location>) && __cpp_lib_source_location

namespace
{
    auto where_does_it_hurt(const source_location & where) -> string
    {
        return string{where.file_name()} + ":" + to_string(where.line()) + " in " + string{where.function_name()};
    }
}

NonExhaustiveSwitch::NonExhaustiveSwitch(const source_location & where) :
    UnexpectedException{"non-exhaustive at " + where_does_it_hurt(where)}
{
}

#else

NonExhaustiveSwitch::NonExhaustiveSwitch() :
    UnexpectedException{"non-exhaustive, source location not supported by your compiler"}
{
}

#endif
