#pragma once

#include "backscan/mesh/TriangleMesh.hpp"
#include <cstdint>
#include <utility>
#include <vector>

namespace backscan {
namespace mesh {

/**
 * @brief Undirected edge -> incident faces, grouped by edge
 *
 * Entries are sorted by (edge, face) so every edge's faces are
 * contiguous and traversal order is deterministic.
 */
class EdgeFaceIndex {
public:
    struct Entry {
        uint64_t edge;
        int face;

        bool operator<(const Entry& other) const {
            return edge < other.edge || (edge == other.edge && face < other.face);
        }
    };

    /**
     * @brief Index every triangle edge. Face indices must already be valid.
     */
    explicit EdgeFaceIndex(const TriangleMesh& mesh);

    static uint64_t makeKey(int a, int b) {
        if (a > b) std::swap(a, b);
        return (static_cast<uint64_t>(static_cast<uint32_t>(a)) << 32) |
               static_cast<uint32_t>(b);
    }
    static int keyFirst(uint64_t key) { return static_cast<int>(key >> 32); }
    static int keySecond(uint64_t key) { return static_cast<int>(key & 0xffffffffu); }

    /**
     * @brief Call fn(edgeKey, firstEntry, lastEntry) once per distinct edge
     */
    template<typename Fn>
    void forEachEdge(Fn fn) const {
        size_t i = 0;
        while (i < entries_.size()) {
            size_t j = i + 1;
            while (j < entries_.size() && entries_[j].edge == entries_[i].edge) {
                ++j;
            }
            fn(entries_[i].edge, entries_.data() + i, entries_.data() + j);
            i = j;
        }
    }

private:
    std::vector<Entry> entries_;
};

} // namespace mesh
} // namespace backscan
