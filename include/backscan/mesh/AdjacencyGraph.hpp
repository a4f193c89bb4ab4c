#pragma once

#include "backscan/mesh/TriangleMesh.hpp"
#include <utility>
#include <vector>

namespace backscan {
namespace mesh {

/**
 * @brief Vertex-to-vertex adjacency in CSR layout
 *
 * offsets has size V+1; the neighbors of vertex v are
 * neighbors[offsets[v] .. offsets[v+1]), sorted ascending, without
 * duplicates or self loops. The relation is symmetric.
 */
class AdjacencyGraph {
public:
    /**
     * @brief Contiguous neighbor list of one vertex
     */
    struct NeighborRange {
        const int* first = nullptr;
        const int* last = nullptr;

        const int* begin() const { return first; }
        const int* end() const { return last; }
        size_t size() const { return static_cast<size_t>(last - first); }
        bool empty() const { return first == last; }
    };

    AdjacencyGraph() = default;

    /**
     * @brief Build from every triangle edge of the mesh
     *
     * Isolated vertices (referenced by no face) get an empty neighbor list.
     * @throws core::InputException if a face index is out of range
     */
    static AdjacencyGraph fromMesh(const TriangleMesh& mesh);

    /**
     * @brief Build from caller-supplied neighbor lists
     *
     * Duplicates and self loops are dropped.
     * @throws core::InputException on an out-of-range index or if
     *         the lists are not symmetric
     */
    static AdjacencyGraph fromNeighborLists(const std::vector<std::vector<int>>& lists);

    size_t vertexCount() const { return offsets_.empty() ? 0 : offsets_.size() - 1; }
    size_t edgeCount() const { return neighbors_.size() / 2; }

    int degree(int v) const { return offsets_[v + 1] - offsets_[v]; }

    NeighborRange neighbors(int v) const {
        const int* base = neighbors_.data();
        return { base + offsets_[v], base + offsets_[v + 1] };
    }

    bool areAdjacent(int a, int b) const;

    const std::vector<int>& offsets() const { return offsets_; }

private:
    // Sorts each row, removes duplicates and self loops, then packs
    static AdjacencyGraph fromEdgePairs(size_t vertexCount,
                                        std::vector<std::pair<int, int>>& directedEdges);

    std::vector<int> offsets_;
    std::vector<int> neighbors_;
};

} // namespace mesh
} // namespace backscan
