#pragma once

#include <cstddef>
#include <vector>

namespace CellGa {

/**
 * Bounded per-generation (best, mean) fitness log.
 *
 * Fixed-capacity ring buffer: once full, each push overwrites the oldest entry.
 * Indexing is oldest-first.
 */
class FitnessHistory {
public:
    static constexpr size_t kDefaultCapacity = 300;

    explicit FitnessHistory(size_t capacity = kDefaultCapacity);

    void push(double best, double avg);

    size_t size() const { return count_; }
    size_t capacity() const { return best_.size(); }
    bool empty() const { return count_ == 0; }

    double bestAt(size_t index) const;
    double avgAt(size_t index) const;

    // Oldest-first copies.
    std::vector<double> best() const;
    std::vector<double> avg() const;

private:
    std::vector<double> best_;
    std::vector<double> avg_;
    size_t head_ = 0; // Slot of the oldest entry.
    size_t count_ = 0;

    size_t slot(size_t index) const { return (head_ + index) % best_.size(); }
    std::vector<double> ordered(const std::vector<double>& ring) const;
};

} // namespace CellGa
