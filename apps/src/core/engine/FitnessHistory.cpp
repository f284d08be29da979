#include "FitnessHistory.h"

#include "core/Assert.h"

namespace CellGa {

FitnessHistory::FitnessHistory(size_t capacity) : best_(capacity), avg_(capacity)
{
    CELLGA_ASSERT(capacity > 0, "FitnessHistory capacity must be positive");
}

void FitnessHistory::push(double best, double avg)
{
    if (count_ < capacity()) {
        const size_t target = slot(count_);
        best_[target] = best;
        avg_[target] = avg;
        count_++;
        return;
    }

    // Full: the oldest slot becomes the newest.
    best_[head_] = best;
    avg_[head_] = avg;
    head_ = (head_ + 1) % capacity();
}

double FitnessHistory::bestAt(size_t index) const
{
    CELLGA_ASSERT(index < count_, "FitnessHistory index out of range");
    return best_[slot(index)];
}

double FitnessHistory::avgAt(size_t index) const
{
    CELLGA_ASSERT(index < count_, "FitnessHistory index out of range");
    return avg_[slot(index)];
}

std::vector<double> FitnessHistory::best() const
{
    return ordered(best_);
}

std::vector<double> FitnessHistory::avg() const
{
    return ordered(avg_);
}

std::vector<double> FitnessHistory::ordered(const std::vector<double>& ring) const
{
    std::vector<double> result;
    result.reserve(count_);
    for (size_t i = 0; i < count_; i++) {
        result.push_back(ring[slot(i)]);
    }
    return result;
}

} // namespace CellGa
