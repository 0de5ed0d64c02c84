#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace seqscope {

/**
 * @brief A counted key (symbol, codon or amino acid) with its frequency
 */
struct CountEntry {
    std::string key;
    size_t count;

    [[nodiscard]] double frequency(size_t total) const noexcept {
        return total > 0 ? static_cast<double>(count) / total : 0.0;
    }

    [[nodiscard]] bool operator==(const CountEntry& other) const = default;
};

/**
 * @brief Occurrence counter that remembers first-seen order
 *
 * Iteration visits keys in the order they were first added, and the
 * rankings are stable sorts over that order, so ties are reported in
 * discovery order rather than alphabetically.
 */
class OrderedCounter {
public:
    using Entries = std::vector<CountEntry>;
    using const_iterator = Entries::const_iterator;

    OrderedCounter() = default;

    /**
     * @brief Build a counter that lists @p keys first, each at zero
     */
    explicit OrderedCounter(const std::vector<std::string>& keys);

    /**
     * @brief Add @p n occurrences of @p key
     */
    void add(std::string_view key, size_t n = 1);

    /**
     * @brief Get count for a key
     * @return The count (0 if never seen)
     */
    [[nodiscard]] size_t getCount(std::string_view key) const;

    [[nodiscard]] bool contains(std::string_view key) const;

    /**
     * @brief Entries ranked by descending count, ties in discovery order
     */
    [[nodiscard]] std::vector<CountEntry> ranked() const;

    /**
     * @brief The first @p n entries of ranked()
     */
    [[nodiscard]] std::vector<CountEntry> mostFrequent(size_t n) const;

    /**
     * @brief The last @p n entries of ranked(), still in ranked order
     */
    [[nodiscard]] std::vector<CountEntry> leastFrequent(size_t n) const;

    // Accessors
    [[nodiscard]] size_t uniqueCount() const noexcept { return entries_.size(); }
    [[nodiscard]] size_t totalCount() const noexcept { return total_; }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    // Iterator support
    [[nodiscard]] const_iterator begin() const noexcept { return entries_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return entries_.end(); }

    [[nodiscard]] bool operator==(const OrderedCounter& other) const {
        return entries_ == other.entries_;
    }

private:
    Entries entries_;
    std::unordered_map<std::string, size_t> index_;
    size_t total_ = 0;
};

// Keys of a ranking, in order
[[nodiscard]] std::vector<std::string> keysOf(const std::vector<CountEntry>& entries);

} // namespace seqscope
