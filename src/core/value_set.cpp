#include <algorithm>
#include <cmath>
#include <wedge/logger.hpp>
#include <wedge/value_set.hpp>

namespace wedge
{

ValueSet::ValueSet(std::initializer_list<Entry> entries)
{
    entries_.reserve(entries.size());
    for (const auto& [label, value] : entries)
        set(label, value);
}

bool ValueSet::set(std::string_view label, double value)
{
    if (!std::isfinite(value) || value < 0.0)
    {
        WEDGE_LOG_WARN("values",
                       "Rejected value {} for label '{}' (must be finite and non-negative)",
                       value,
                       label);
        return false;
    }

    auto it = find(label);
    if (it != entries_.end())
        it->second = value;
    else
        entries_.emplace_back(std::string(label), value);
    return true;
}

bool ValueSet::remove(std::string_view label)
{
    auto it = find(label);
    if (it == entries_.end())
        return false;
    entries_.erase(it);
    return true;
}

bool ValueSet::contains(std::string_view label) const
{
    return find(label) != entries_.end();
}

std::optional<double> ValueSet::value(std::string_view label) const
{
    auto it = find(label);
    if (it == entries_.end())
        return std::nullopt;
    return it->second;
}

double ValueSet::total() const
{
    double sum = 0.0;
    for (const auto& entry : entries_)
        sum += entry.second;
    return sum;
}

std::vector<ValueSet::Entry>::iterator ValueSet::find(std::string_view label)
{
    return std::find_if(entries_.begin(),
                        entries_.end(),
                        [label](const Entry& e) { return e.first == label; });
}

std::vector<ValueSet::Entry>::const_iterator ValueSet::find(std::string_view label) const
{
    return std::find_if(entries_.begin(),
                        entries_.end(),
                        [label](const Entry& e) { return e.first == label; });
}

}   // namespace wedge
