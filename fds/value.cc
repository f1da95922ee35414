#include <fds/value.hh>

#include <string>
#include <type_traits>
#include <variant>

using namespace fds;

using std::decay_t;
using std::is_same_v;
using std::string;
using std::to_string;
using std::visit;

auto fds::debug_string(const Value & v) -> string
{
    return visit([](const auto & x) -> string {
        if constexpr (is_same_v<decay_t<decltype(x)>, string>)
            return x;
        else
            return to_string(x);
    },
        v);
}
