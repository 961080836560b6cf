#pragma once

#include <vector>
#include <queue>
#include <utility>

#include "utils.hpp"
#include "octree.hpp"

// Linear-scan reference searches. ground truth for the tests and the
// baseline the benchmarks compare the octree against.

template <typename Entity>
std::vector<Neighbor<Entity>> bruteForceKNN(
    const std::vector<Entity>& entities,
    const Point3D& query,
    int k,
    float maxRadius)
{
    std::vector<Neighbor<Entity>> result;
    if (k <= 0) return result;

    // max-heap of (distance, index), keeps the k smallest distances
    std::priority_queue<std::pair<float,int>> heap;
    for (int pi = 0; pi < (int)entities.size(); ++pi) {
        float d = distance(entityPosition(entities[pi]), query);
        if (!(d < maxRadius)) continue;

        if ((int)heap.size() < k) {
            heap.push({d, pi});
        } else if (d < heap.top().first) {
            heap.pop();
            heap.push({d, pi});
        }
    }

    // heap pops worst first, fill from the back to get nearest first
    result.reserve(heap.size());
    std::vector<std::pair<float,int>> temp;
    while (!heap.empty()) {
        temp.push_back(heap.top());
        heap.pop();
    }
    for (auto it = temp.rbegin(); it != temp.rend(); ++it) {
        result.emplace_back(entities[it->second], it->first);
    }
    return result;
}

template <typename Entity>
std::vector<std::vector<Neighbor<Entity>>> bruteForceKNN(
    const std::vector<Entity>& entities,
    const std::vector<Point3D>& queries,
    int k,
    float maxRadius)
{
    std::vector<std::vector<Neighbor<Entity>>> neighbors(queries.size());
    for (size_t qi = 0; qi < queries.size(); ++qi) {
        neighbors[qi] = bruteForceKNN(entities, queries[qi], k, maxRadius);
    }
    return neighbors;
}

template <typename Entity>
std::vector<Entity> bruteForceWithinRadius(
    const std::vector<Entity>& entities,
    const Point3D& query,
    float radius)
{
    std::vector<Entity> out;
    if (!(radius > 0.0f)) return out;
    for (const auto& e : entities) {
        if (radius * radius > sqDist(query, entityPosition(e))) out.push_back(e);
    }
    return out;
}
