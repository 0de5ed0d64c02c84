#include "seqscope/counter.hpp"
#include <algorithm>
#include <cstddef>

namespace seqscope {

OrderedCounter::OrderedCounter(const std::vector<std::string>& keys) {
    for (const auto& key : keys) {
        add(key, 0);
    }
}

void OrderedCounter::add(std::string_view key, size_t n) {
    auto it = index_.find(std::string(key));
    if (it == index_.end()) {
        index_.emplace(std::string(key), entries_.size());
        entries_.push_back({std::string(key), n});
    } else {
        entries_[it->second].count += n;
    }
    total_ += n;
}

size_t OrderedCounter::getCount(std::string_view key) const {
    auto it = index_.find(std::string(key));
    return it != index_.end() ? entries_[it->second].count : 0;
}

bool OrderedCounter::contains(std::string_view key) const {
    return index_.find(std::string(key)) != index_.end();
}

std::vector<CountEntry> OrderedCounter::ranked() const {
    std::vector<CountEntry> result(entries_);

    std::ranges::stable_sort(result, [](const CountEntry& a, const CountEntry& b) {
        return a.count > b.count;
    });

    return result;
}

std::vector<CountEntry> OrderedCounter::mostFrequent(size_t n) const {
    auto result = ranked();
    result.resize(std::min(n, result.size()));
    return result;
}

std::vector<CountEntry> OrderedCounter::leastFrequent(size_t n) const {
    auto result = ranked();
    if (result.size() > n) {
        result.erase(result.begin(), result.end() - static_cast<std::ptrdiff_t>(n));
    }
    return result;
}

std::vector<std::string> keysOf(const std::vector<CountEntry>& entries) {
    std::vector<std::string> keys;
    keys.reserve(entries.size());

    for (const auto& entry : entries) {
        keys.push_back(entry.key);
    }

    return keys;
}

} // namespace seqscope
