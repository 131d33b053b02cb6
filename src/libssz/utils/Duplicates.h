#pragma once

#include <cstddef>
#include <map>
#include <vector>

namespace ssz {
namespace utils {

/**
 * Values that occur more than once, each reported once, in order of first
 * occurrence. Used to reject container schemas with repeated field names.
 */
template <class T>
std::vector<T> getDuplicates(const std::vector<T>& values) {
    std::map<T, size_t> counts;
    for (const auto& value : values) {
        ++counts[value];
    }

    std::vector<T> duplicates;
    for (const auto& value : values) {
        auto it = counts.find(value);
        if (it != counts.end() && it->second > 1) {
            duplicates.push_back(value);
            counts.erase(it);
        }
    }
    return duplicates;
}

} // namespace utils
} // namespace ssz
