#pragma once
#include <vector>
#include <iterator>
#include <algorithm>
#include <tbb/parallel_for.h>
#include <tbb/blocked_range.h>

#include "utils.hpp"
#include "octant.hpp"
#include "octree.hpp"

// Point, radius and k-nearest-neighbor queries on the persistent octree.
// all of these only read the tree, any number of threads can run them on
// the same snapshot.

// leaf whose cube holds pos, found purely by octant descent.
// the returned reference lives as long as the caller keeps 'tree' alive.
// throws std::out_of_range if pos is outside the root cube
template <typename Entity>
const std::vector<Entity>& locate(const OctreePtr<Entity>& tree, const Point3D& pos) {
    requireInBounds(*tree, pos, "locate");
    const OctreePtr<Entity>* node = &tree;
    while (!(*node)->isLeaf()) {
        node = &childOf(*node, octantOf((*node)->center, pos));
    }
    return (*node)->objects;
}

template <typename Entity>
bool sphereWithinBounds(const OctreePtr<Entity>& node, const Point3D& pos, float radius) {
    return sphereWithinCube(node->center, node->side, pos, radius);
}

// children that could contain a point closer than radius to pos, a leaf
// is its own (only) candidate
template <typename Entity>
std::vector<OctreePtr<Entity>> candidateChildren(const OctreePtr<Entity>& node,
                                                 const Point3D& pos, float radius) {
    if (node->isLeaf()) return {node};
    std::vector<OctreePtr<Entity>> out;
    for (Octant o : candidateOctants(node->center, node->side, pos, radius)) {
        out.push_back(childOf(node, o));
    }
    return out;
}

// ---- radius query ----

template <typename Entity>
void collectWithinRadiusInto(const OctreePtr<Entity>& node, const Point3D& pos, float radius,
                             std::vector<Entity>& out) {
    if (node->isLeaf()) {
        // whole cube inside the sphere: nothing to filter
        if (cubeWithinSphere(node->center, node->side, pos, radius)) {
            out.insert(out.end(), node->objects.begin(), node->objects.end());
            return;
        }
        const float r2 = radius * radius;
        for (const auto& e : node->objects) {
            if (r2 > sqDist(pos, entityPosition(e))) out.push_back(e);
        }
        return;
    }
    for (Octant o : candidateOctants(node->center, node->side, pos, radius)) {
        collectWithinRadiusInto(childOf(node, o), pos, radius, out);
    }
}

// every entity strictly closer than radius to pos, in no particular order.
// leaves partition the entities, so nothing is reported twice
template <typename Entity>
std::vector<Entity> collectWithinRadius(const OctreePtr<Entity>& tree, const Point3D& pos, float radius) {
    std::vector<Entity> out;
    if (!(radius > 0.0f)) return out;  // r*r would turn a negative radius positive
    collectWithinRadiusInto(tree, pos, radius, out);
    return out;
}

// ---- k nearest neighbors ----

template <typename Entity>
bool closerNeighbor(const Neighbor<Entity>& a, const Neighbor<Entity>& b) {
    return a.second < b.second;
}

// merge two ascending lists and keep the best k. on equal distance the
// newly found entry goes ahead of the one already in 'nearest', so when a
// tie sits at the k-th place the later searched child keeps its entry
template <typename Entity>
void mergeNeighbors(std::vector<Neighbor<Entity>>& nearest,
                    const std::vector<Neighbor<Entity>>& found, int k) {
    if (found.empty()) return;
    std::vector<Neighbor<Entity>> merged;
    merged.reserve(nearest.size() + found.size());
    std::merge(found.begin(), found.end(), nearest.begin(), nearest.end(),
               std::back_inserter(merged), closerNeighbor<Entity>);
    if ((int)merged.size() > k) merged.erase(merged.begin() + k, merged.end());
    nearest.swap(merged);
}

// up to k (entity, distance) pairs with distance < maxRadius, ascending.
//
// at an internal node the child holding pos is searched first. once that
// gives k hits, the distance of the k-th one becomes the pruning radius:
// if the sphere of that radius stays inside the searched child nothing
// outside can beat it and we return. otherwise the remaining children the
// sphere reaches are searched with the current radius, which only shrinks
// as better hits get merged in
template <typename Entity>
std::vector<Neighbor<Entity>> kNearest(const OctreePtr<Entity>& tree, const Point3D& pos,
                                       int k, float maxRadius) {
    std::vector<Neighbor<Entity>> nearest;
    if (k <= 0 || !(maxRadius > 0.0f)) return nearest;

    if (tree->isLeaf()) {
        for (const auto& e : tree->objects) {
            float d = distance(entityPosition(e), pos);
            if (d < maxRadius) nearest.emplace_back(e, d);
        }
        std::stable_sort(nearest.begin(), nearest.end(), closerNeighbor<Entity>);
        if ((int)nearest.size() > k) nearest.erase(nearest.begin() + k, nearest.end());
        return nearest;
    }

    const Octant own = octantOf(tree->center, pos);
    const OctreePtr<Entity>& searched = childOf(tree, own);
    nearest = kNearest(searched, pos, k, maxRadius);

    auto pruningRadius = [&]() {
        return (int)nearest.size() >= k ? nearest.back().second : maxRadius;
    };

    const float topR = pruningRadius();
    if ((int)nearest.size() >= k && sphereWithinBounds(searched, pos, topR)) {
        return nearest;
    }

    for (Octant o : candidateOctants(tree->center, tree->side, pos, topR)) {
        if (o == own) continue;  // already searched
        std::vector<Neighbor<Entity>> found = kNearest(childOf(tree, o), pos, k, pruningRadius());
        mergeNeighbors(nearest, found, k);
    }
    return nearest;
}

// ---- batch queries ----

template <typename Entity>
std::vector<std::vector<Neighbor<Entity>>> kNearestBatch(
    const OctreePtr<Entity>& tree,
    const std::vector<Point3D>& queries,
    int k,
    float maxRadius)
{
    std::vector<std::vector<Neighbor<Entity>>> results(queries.size());
    for (int qi = 0; qi < (int)queries.size(); ++qi) {
        results[qi] = kNearest(tree, queries[qi], k, maxRadius);
    }
    return results;
}

// queries are independent, TBB splits them into ranges and every worker
// writes only its own result slots
template <typename Entity>
std::vector<std::vector<Neighbor<Entity>>> kNearestBatch_parallel_tbb(
    const OctreePtr<Entity>& tree,
    const std::vector<Point3D>& queries,
    int k,
    float maxRadius)
{
    std::vector<std::vector<Neighbor<Entity>>> results(queries.size());
    tbb::parallel_for(
        tbb::blocked_range<int>(0, (int)queries.size()),
        [&](const tbb::blocked_range<int>& r) {
            for (int qi = r.begin(); qi != r.end(); ++qi) {
                results[qi] = kNearest(tree, queries[qi], k, maxRadius);
            }
        }
    );
    return results;
}

template <typename Entity>
std::vector<std::vector<Entity>> collectWithinRadiusBatch(
    const OctreePtr<Entity>& tree,
    const std::vector<Point3D>& queries,
    float radius)
{
    std::vector<std::vector<Entity>> results(queries.size());
    for (int qi = 0; qi < (int)queries.size(); ++qi) {
        results[qi] = collectWithinRadius(tree, queries[qi], radius);
    }
    return results;
}

template <typename Entity>
std::vector<std::vector<Entity>> collectWithinRadiusBatch_parallel_tbb(
    const OctreePtr<Entity>& tree,
    const std::vector<Point3D>& queries,
    float radius)
{
    std::vector<std::vector<Entity>> results(queries.size());
    tbb::parallel_for(
        tbb::blocked_range<int>(0, (int)queries.size()),
        [&](const tbb::blocked_range<int>& r) {
            for (int qi = r.begin(); qi != r.end(); ++qi) {
                results[qi] = collectWithinRadius(tree, queries[qi], radius);
            }
        }
    );
    return results;
}
