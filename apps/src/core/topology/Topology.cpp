#include "Topology.h"

#include "core/LoggingChannels.h"
#include "core/random/DeterministicRng.h"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <stdexcept>

namespace CellGa {

namespace {

constexpr double kRingRadiusFraction = 0.4;

bool contains(const std::vector<int>& list, int id)
{
    return std::find(list.begin(), list.end(), id) != list.end();
}

// Drop self references and repeats, keeping first-seen order.
std::vector<int> simplify(const std::vector<int>& raw, int self)
{
    std::vector<int> result;
    result.reserve(raw.size());
    for (const int id : raw) {
        if (id != self && !contains(result, id)) {
            result.push_back(id);
        }
    }
    return result;
}

} // namespace

std::string toString(TopologyKind kind)
{
    switch (kind) {
        case TopologyKind::Ring:
            return "ring";
        case TopologyKind::Grid:
            return "grid";
        case TopologyKind::SmallWorld:
            return "smallworld";
    }
    return "grid";
}

std::optional<TopologyKind> parseTopologyKind(const std::string& str)
{
    if (str == "ring") return TopologyKind::Ring;
    if (str == "grid") return TopologyKind::Grid;
    if (str == "smallworld") return TopologyKind::SmallWorld;
    return std::nullopt;
}

TopologyKind topologyKindFromString(const std::string& str)
{
    const auto parsed = parseTopologyKind(str);
    if (!parsed.has_value()) {
        LOG_WARN(Topology, "Unknown topology '{}', falling back to grid", str);
        return TopologyKind::Grid;
    }
    return parsed.value();
}

void to_json(nlohmann::json& j, const TopologyKind& kind)
{
    j = toString(kind);
}

void from_json(const nlohmann::json& j, TopologyKind& kind)
{
    if (!j.is_string()) {
        throw std::runtime_error("topology must be a string.");
    }
    kind = topologyKindFromString(j.get<std::string>());
}

Topology::Topology(
    int popSize,
    TopologyKind kind,
    double rewiringProb,
    DeterministicRng& rng,
    CanvasDimensions canvas)
    : popSize_(std::max(popSize, 0)), kind_(kind), canvas_(canvas)
{
    switch (kind_) {
        case TopologyKind::Ring:
            buildRing();
            break;
        case TopologyKind::Grid:
            buildGrid();
            break;
        case TopologyKind::SmallWorld:
            buildRing();
            rewire(rewiringProb, rng);
            break;
    }

    LOG_DEBUG(
        Topology,
        "Built {} topology: {} cells, {} directed edges",
        toString(kind_),
        popSize_,
        edgeCount());
}

const std::vector<int>& Topology::neighbors(int id) const
{
    static const std::vector<int> empty;
    if (id < 0 || id >= popSize_) {
        return empty;
    }
    return neighbors_[static_cast<size_t>(id)];
}

LayoutPosition Topology::position(int id) const
{
    if (id < 0 || id >= popSize_) {
        return {};
    }
    return positions_[static_cast<size_t>(id)];
}

size_t Topology::edgeCount() const
{
    size_t total = 0;
    for (const auto& list : neighbors_) {
        total += list.size();
    }
    return total;
}

void Topology::buildRing()
{
    const int n = popSize_;
    neighbors_.assign(static_cast<size_t>(n), {});
    positions_.assign(static_cast<size_t>(n), {});

    const double centerX = canvas_.width / 2.0;
    const double centerY = canvas_.height / 2.0;
    const double radius = std::min(canvas_.width, canvas_.height) * kRingRadiusFraction;

    for (int i = 0; i < n; i++) {
        const double angle = (static_cast<double>(i) / n) * 2.0 * std::numbers::pi
            - std::numbers::pi / 2.0;
        positions_[i] = { centerX + radius * std::cos(angle), centerY + radius * std::sin(angle) };

        const int left = (i - 1 + n) % n;
        const int right = (i + 1) % n;
        neighbors_[i] = simplify({ left, right }, i);
    }
}

void Topology::buildGrid()
{
    const int n = popSize_;
    const int side = static_cast<int>(std::ceil(std::sqrt(static_cast<double>(n))));
    neighbors_.assign(static_cast<size_t>(n), {});
    positions_.assign(static_cast<size_t>(n), {});
    if (n == 0) {
        return;
    }

    const double availableWidth = canvas_.width - kGridPadding * 2.0;
    const double availableHeight = canvas_.height - kGridPadding * 2.0;
    const double cellSize = std::min(availableWidth / side, availableHeight / side);
    const double offsetX = (canvas_.width - cellSize * side) / 2.0;
    const double offsetY = (canvas_.height - cellSize * side) / 2.0;

    for (int i = 0; i < n; i++) {
        const int row = i / side;
        const int col = i % side;
        positions_[i] = { offsetX + col * cellSize + cellSize / 2.0,
                          offsetY + row * cellSize + cellSize / 2.0 };

        std::vector<int> raw;
        raw.reserve(8);
        for (int dr = -1; dr <= 1; dr++) {
            for (int dc = -1; dc <= 1; dc++) {
                if (dr == 0 && dc == 0) continue;

                const int newRow = (row + dr + side) % side;
                const int newCol = (col + dc + side) % side;
                const int idx = newRow * side + newCol;
                if (idx < n) {
                    raw.push_back(idx);
                }
            }
        }
        neighbors_[i] = simplify(raw, i);
    }
}

void Topology::rewire(double rewiringProb, DeterministicRng& rng)
{
    int rewired = 0;
    for (int i = 0; i < popSize_; i++) {
        auto& list = neighbors_[i];
        for (size_t slot = 0; slot < list.size(); slot++) {
            if (rng.nextFloat() >= rewiringProb) {
                continue;
            }

            // Every id other than i and the current list members is eligible.
            const int eligible = popSize_ - 1 - static_cast<int>(list.size());
            if (eligible <= 0) {
                LOG_TRACE(Topology, "Cell {} slot {} has no rewiring target", i, slot);
                continue;
            }

            int candidate = 0;
            do {
                candidate = rng.nextInt(0, popSize_ - 1);
            } while (candidate == i || contains(list, candidate));

            LOG_TRACE(Topology, "Cell {} slot {}: {} -> {}", i, slot, list[slot], candidate);
            list[slot] = candidate;
            rewired++;
        }
    }

    LOG_DEBUG(Topology, "Small-world rewiring replaced {} of {} edges", rewired, edgeCount());
}

} // namespace CellGa
