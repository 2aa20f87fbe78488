#pragma once

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace wedge
{

// Ordered label -> magnitude mapping. Labels are unique and keep their first
// insertion position; magnitudes are finite and non-negative.
class ValueSet
{
   public:
    using Entry          = std::pair<std::string, double>;
    using const_iterator = std::vector<Entry>::const_iterator;

    ValueSet() = default;
    ValueSet(std::initializer_list<Entry> entries);

    // Insert or replace. Rejects negative and non-finite values.
    bool set(std::string_view label, double value);
    bool remove(std::string_view label);
    void clear() { entries_.clear(); }

    bool                  contains(std::string_view label) const;
    std::optional<double> value(std::string_view label) const;

    // Plain sum; may overflow to infinity when values are near DBL_MAX.
    double total() const;

    size_t size() const { return entries_.size(); }
    bool   empty() const { return entries_.empty(); }

    const Entry& operator[](size_t i) const { return entries_[i]; }

    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

   private:
    std::vector<Entry>::iterator       find(std::string_view label);
    std::vector<Entry>::const_iterator find(std::string_view label) const;

    std::vector<Entry> entries_;
};

}   // namespace wedge
