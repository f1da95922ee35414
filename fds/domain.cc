#include <fds/domain.hh>
#include <fds/exception.hh>

#include <algorithm>
#include <utility>

using namespace fds;

using std::find;
using std::initializer_list;
using std::move;
using std::nullopt;
using std::optional;
using std::size_t;
using std::vector;

Domain::Domain(vector<Value> v) :
    _values(move(v))
{
    for (auto i = _values.begin(); i != _values.end(); ++i)
        if (find(_values.begin(), i, *i) != i)
            throw MalformedProblem{"duplicate value " + debug_string(*i) + " in domain"};
}

Domain::Domain(initializer_list<Value> v) :
    Domain(vector<Value>(v))
{
}

auto Domain::size() const -> size_t
{
    return _values.size();
}

auto Domain::empty() const -> bool
{
    return _values.empty();
}

auto Domain::contains(const Value & v) const -> bool
{
    return _values.end() != find(_values.begin(), _values.end(), v);
}

auto Domain::position_of(const Value & v) const -> optional<size_t>
{
    auto i = find(_values.begin(), _values.end(), v);
    if (i == _values.end())
        return nullopt;
    return i - _values.begin();
}

auto Domain::values() const -> const vector<Value> &
{
    return _values;
}

auto Domain::begin() const -> vector<Value>::const_iterator
{
    return _values.begin();
}

auto Domain::end() const -> vector<Value>::const_iterator
{
    return _values.end();
}

auto Domain::remove(const Value & v) -> optional<size_t>
{
    auto pos = position_of(v);
    if (pos)
        _values.erase(_values.begin() + *pos);
    return pos;
}

auto Domain::restore(size_t position, const Value & v) -> void
{
    if (position > _values.size())
        throw UnexpectedException{"restoring " + debug_string(v) + " past the end of a domain"};
    _values.insert(_values.begin() + position, v);
}
