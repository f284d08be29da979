#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace CellGa {

class DeterministicRng;

enum class TopologyKind : uint8_t {
    Ring = 0,
    Grid,
    SmallWorld,
};

// Config identifiers: "ring", "grid", "smallworld".
std::string toString(TopologyKind kind);
std::optional<TopologyKind> parseTopologyKind(const std::string& str);

// Unrecognized identifiers fall back to Grid.
TopologyKind topologyKindFromString(const std::string& str);

void to_json(nlohmann::json& j, const TopologyKind& kind);
void from_json(const nlohmann::json& j, TopologyKind& kind);

struct LayoutPosition {
    double x = 0.0;
    double y = 0.0;

    bool operator==(const LayoutPosition& other) const = default;
};

struct CanvasDimensions {
    double width = 800.0;
    double height = 500.0;
};

/**
 * Neighborhood graph over cell ids [0, N) plus a 2D layout for renderers.
 *
 * Ring: left and right neighbor. Grid: 8-cell Moore neighborhood on a torus of
 * side ceil(sqrt(N)), ids >= N dropped. SmallWorld: ring with each neighbor slot
 * rewired with probability p to a random cell not already adjacent.
 *
 * Adjacency lists never contain the cell itself or a repeated id. Positions are
 * metadata only; selection never reads them.
 */
class Topology {
public:
    static constexpr double kGridPadding = 30.0;

    // Grid cells need a positive size once the padding is taken off both sides.
    static constexpr double kMinCanvasExtent = 2.0 * kGridPadding;

    /**
     * Small-world construction draws from rng in cell order, then slot order.
     * Ring and grid construction draw nothing.
     */
    Topology(
        int popSize,
        TopologyKind kind,
        double rewiringProb,
        DeterministicRng& rng,
        CanvasDimensions canvas = {});

    // Empty for ids outside [0, N).
    const std::vector<int>& neighbors(int id) const;

    // (0, 0) for ids outside [0, N).
    LayoutPosition position(int id) const;

    int size() const { return popSize_; }
    TopologyKind kind() const { return kind_; }
    const CanvasDimensions& canvas() const { return canvas_; }

    // Directed edge count (sum of list lengths).
    size_t edgeCount() const;

    const std::vector<std::vector<int>>& adjacency() const { return neighbors_; }

private:
    int popSize_;
    TopologyKind kind_;
    CanvasDimensions canvas_;
    std::vector<std::vector<int>> neighbors_;
    std::vector<LayoutPosition> positions_;

    void buildRing();
    void buildGrid();
    void rewire(double rewiringProb, DeterministicRng& rng);
};

} // namespace CellGa
