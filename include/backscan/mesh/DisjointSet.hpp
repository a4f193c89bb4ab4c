#pragma once

#include <numeric>
#include <utility>
#include <vector>

namespace backscan {
namespace mesh {

/**
 * @brief Union-Find with path compression and union by size
 */
class DisjointSet {
public:
    explicit DisjointSet(size_t count)
        : parent_(count), size_(count, 1) {
        std::iota(parent_.begin(), parent_.end(), 0);
    }

    int find(int x) {
        int root = x;
        while (parent_[root] != root) {
            root = parent_[root];
        }
        // Path compression
        while (parent_[x] != root) {
            int next = parent_[x];
            parent_[x] = root;
            x = next;
        }
        return root;
    }

    bool unite(int a, int b) {
        int rootA = find(a);
        int rootB = find(b);
        if (rootA == rootB) {
            return false;
        }
        if (size_[rootA] < size_[rootB]) {
            std::swap(rootA, rootB);
        }
        parent_[rootB] = rootA;
        size_[rootA] += size_[rootB];
        return true;
    }

    // Number of elements in x's set
    int setSize(int x) { return size_[find(x)]; }

    size_t size() const { return parent_.size(); }

private:
    std::vector<int> parent_;
    std::vector<int> size_;
};

} // namespace mesh
} // namespace backscan
