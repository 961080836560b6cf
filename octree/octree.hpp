#pragma once
#include <array>
#include <vector>
#include <memory>
#include <string>
#include <sstream>
#include <ostream>
#include <utility>
#include <algorithm>
#include <stdexcept>
#include <cmath>
#include <tbb/parallel_for.h>

#include "utils.hpp"
#include "octant.hpp"

// Persistent octree over any entity type E that has a free function
// entityPosition(const E&) returning its Point3D (found by ADL).
//
// Nodes are immutable once published. every "mutation" below returns a new
// root, copies only the nodes on the root-to-target path and shares all the
// other subtrees with the previous version through the shared_ptr, so an old
// snapshot stays valid (and readable from other threads) while the next one
// is being built.

template <typename Entity>
struct OctreeNode;

template <typename Entity>
using OctreePtr = std::shared_ptr<const OctreeNode<Entity>>;

// (entity, distance to the query point)
template <typename Entity>
using Neighbor = std::pair<Entity, float>;

// tagged node. only makeLeaf and makeInternal build one, and nodes are
// shared as const, so a leaf always has 8 null children and an internal
// node always has an empty object list
template <typename Entity>
struct OctreeNode {
    Point3D center;   // center of this node's cube
    float side;       // cube edge length
    int count;        // entities in this subtree
    bool leaf;        // tag: leaf stores objects, internal stores children
    std::array<OctreePtr<Entity>, kNumOctants> children;  // internal only, indexed by octant code
    std::vector<Entity> objects;                          // leaf only, insertion order

    bool isLeaf() const { return leaf; }
};

// limits for splitWhere. without them a predicate that never turns false
// (say 20 boids sitting on the same spot and "count > 8") splits forever
struct SplitLimits {
    int maxDepth = 16;      // root is depth 0, no leaf is created below this
    float minSide = 0.0f;   // smallest child side a split may produce
};

class SplitLimitError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// split policy: leaf holding more than 'capacity' entities
struct LeafCapacity {
    int capacity;

    template <typename Entity>
    bool operator()(const OctreeNode<Entity>& node) const {
        return node.count > capacity;
    }
};

inline LeafCapacity leafCapacity(int capacity) {
    return LeafCapacity{capacity};
}

// ---- node construction ----

template <typename Entity>
OctreePtr<Entity> makeLeaf(const Point3D& center, float side, std::vector<Entity> objects) {
    auto node = std::make_shared<OctreeNode<Entity>>();
    node->center = center;
    node->side = side;
    node->leaf = true;
    node->count = (int)objects.size();
    node->objects = std::move(objects);
    return node;
}

template <typename Entity>
OctreePtr<Entity> makeInternal(const Point3D& center, float side,
                               const std::array<OctreePtr<Entity>, kNumOctants>& children) {
    auto node = std::make_shared<OctreeNode<Entity>>();
    node->center = center;
    node->side = side;
    node->leaf = false;
    node->children = children;
    node->count = 0;
    for (const auto& c : children) node->count += c->count;
    return node;
}

template <typename Entity>
OctreePtr<Entity> emptyTree(const Point3D& center, float side) {
    if (!(side > 0.0f) || !std::isfinite(side)) {
        throw std::invalid_argument("emptyTree: side must be positive and finite, got " +
                                    std::to_string(side));
    }
    return makeLeaf<Entity>(center, side, {});
}

struct Cube {
    Point3D center;
    float side;
};

// smallest axis-aligned cube around the bounding box of the entities,
// padded a little so nothing sits exactly on the outer faces
template <typename Entity>
Cube enclosingCube(const std::vector<Entity>& entities) {
    if (entities.empty()) return Cube{{0.0f, 0.0f, 0.0f}, 1.0f};

    Point3D bb_min = entityPosition(entities.front());
    Point3D bb_max = bb_min;
    for (const auto& e : entities) {
        const Point3D& p = entityPosition(e);
        if (p.x < bb_min.x) bb_min.x = p.x;
        if (p.y < bb_min.y) bb_min.y = p.y;
        if (p.z < bb_min.z) bb_min.z = p.z;
        if (p.x > bb_max.x) bb_max.x = p.x;
        if (p.y > bb_max.y) bb_max.y = p.y;
        if (p.z > bb_max.z) bb_max.z = p.z;
    }

    float extent = std::max(bb_max.x - bb_min.x, std::max(bb_max.y - bb_min.y, bb_max.z - bb_min.z));
    float side = extent > 0.0f ? extent * 1.01f : 1.0f;
    Point3D center = (bb_min + bb_max) * 0.5f;
    return Cube{center, side};
}

// ---- addressing ----

// on a leaf this hands back the leaf itself, so descent loops
// don't need to branch on the node kind
template <typename Entity>
const OctreePtr<Entity>& childOf(const OctreePtr<Entity>& node, Octant o) {
    if (node->isLeaf()) return node;
    return node->children[octantIndex(o)];
}

// new internal node with one slot swapped, the other 7 children are shared.
// a leaf comes back unchanged
template <typename Entity>
OctreePtr<Entity> replaceChild(const OctreePtr<Entity>& node, Octant o, OctreePtr<Entity> newChild) {
    if (node->isLeaf()) return node;
    const int b = octantIndex(o);
    auto copy = std::make_shared<OctreeNode<Entity>>(*node);  // copies 8 pointers, not subtrees
    copy->count = node->count - node->children[b]->count + newChild->count;
    copy->children[b] = std::move(newChild);
    return copy;
}

// out-of-bounds policy: positions outside the closed root cube are rejected.
// octantOf alone would route them to some edge leaf without complaint
template <typename Entity>
void requireInBounds(const OctreeNode<Entity>& root, const Point3D& pos, const char* what) {
    if (!cubeContains(root.center, root.side, pos)) {
        std::ostringstream msg;
        msg << what << ": position " << pos << " lies outside the root cube (center "
            << root.center << ", side " << root.side << ")";
        throw std::out_of_range(msg.str());
    }
}

// ---- insertion ----

template <typename Entity>
OctreePtr<Entity> insertUnchecked(const OctreePtr<Entity>& node, const Entity& e) {
    if (node->isLeaf()) {
        std::vector<Entity> objs;
        objs.reserve(node->objects.size() + 1);
        objs = node->objects;
        objs.push_back(e);
        return makeLeaf(node->center, node->side, std::move(objs));
    }
    Octant o = octantOf(node->center, entityPosition(e));
    return replaceChild(node, o, insertUnchecked(childOf(node, o), e));
}

// same result as inserting one by one, but the batch is bucketed by octant
// (like the partition pass of a bulk build) so every touched leaf is copied
// once per call instead of once per entity. bucket order keeps input order
template <typename Entity>
OctreePtr<Entity> insertBatchUnchecked(const OctreePtr<Entity>& node,
                                       const std::vector<const Entity*>& batch) {
    if (batch.empty()) return node;

    if (node->isLeaf()) {
        std::vector<Entity> objs;
        objs.reserve(node->objects.size() + batch.size());
        objs = node->objects;
        for (const Entity* e : batch) objs.push_back(*e);
        return makeLeaf(node->center, node->side, std::move(objs));
    }

    std::array<std::vector<const Entity*>, kNumOctants> buckets;
    for (const Entity* e : batch) {
        buckets[octantIndex(octantOf(node->center, entityPosition(*e)))].push_back(e);
    }

    std::array<OctreePtr<Entity>, kNumOctants> children = node->children;
    for (int b = 0; b < kNumOctants; ++b) {
        if (buckets[b].empty()) continue;  // untouched subtree stays shared
        children[b] = insertBatchUnchecked(children[b], buckets[b]);
    }
    return makeInternal(node->center, node->side, children);
}

template <typename Entity>
OctreePtr<Entity> insertEntity(const OctreePtr<Entity>& tree, const Entity& e) {
    requireInBounds(*tree, entityPosition(e), "insertEntity");
    return insertUnchecked(tree, e);
}

// all positions are checked before anything is built, a rejected batch
// produces no partial version
template <typename Entity>
OctreePtr<Entity> insertAll(const OctreePtr<Entity>& tree, const std::vector<Entity>& entities) {
    std::vector<const Entity*> batch;
    batch.reserve(entities.size());
    for (const auto& e : entities) {
        requireInBounds(*tree, entityPosition(e), "insertAll");
        batch.push_back(&e);
    }
    return insertBatchUnchecked(tree, batch);
}

// ---- splitting ----

// leaf -> internal node with 8 empty half-size children tiling the cube,
// then every object goes back in through the normal insert path.
// internal nodes are returned as is
template <typename Entity>
OctreePtr<Entity> splitLeaf(const OctreePtr<Entity>& leaf) {
    if (!leaf->isLeaf()) return leaf;

    const float half = leaf->side / 2.0f;
    std::array<OctreePtr<Entity>, kNumOctants> children;
    for (int b = 0; b < kNumOctants; ++b) {
        children[b] = makeLeaf<Entity>(childCenter(leaf->center, leaf->side, octantFromIndex(b)), half, {});
    }
    OctreePtr<Entity> node = makeInternal(leaf->center, leaf->side, children);

    std::vector<const Entity*> batch;
    batch.reserve(leaf->objects.size());
    for (const auto& e : leaf->objects) batch.push_back(&e);
    return insertBatchUnchecked(node, batch);
}

template <typename Entity>
void checkSplitAllowed(const OctreeNode<Entity>& leaf, const SplitLimits& limits, int depth) {
    const float childSide = leaf.side / 2.0f;
    if (depth >= limits.maxDepth || childSide < limits.minSide || !(childSide > 0.0f)) {
        std::ostringstream msg;
        msg << "splitWhere: predicate still asks to split leaf at " << leaf.center
            << " (side " << leaf.side << ", count " << leaf.count << ", depth " << depth
            << ") past the limits (maxDepth " << limits.maxDepth
            << ", minSide " << limits.minSide << ")";
        throw SplitLimitError(msg.str());
    }
}

template <typename Entity, typename Pred>
OctreePtr<Entity> splitWhereAt(const OctreePtr<Entity>& node, const Pred& pred,
                               const SplitLimits& limits, int depth) {
    if (node->isLeaf()) {
        if (!pred(*node)) return node;
        checkSplitAllowed(*node, limits, depth);
        // the fresh internal node goes through here again, so one crowded
        // leaf can split several levels in a single call
        return splitWhereAt(splitLeaf(node), pred, limits, depth);
    }

    // internal: children always visited, predicate never asked here
    std::array<OctreePtr<Entity>, kNumOctants> children = node->children;
    bool changed = false;
    for (int b = 0; b < kNumOctants; ++b) {
        OctreePtr<Entity> c = splitWhereAt(children[b], pred, limits, depth + 1);
        if (c != children[b]) {
            children[b] = std::move(c);
            changed = true;
        }
    }
    // splitting never changes counts, and an unchanged subtree stays shared
    return changed ? makeInternal(node->center, node->side, children) : node;
}

template <typename Entity, typename Pred>
OctreePtr<Entity> splitWhere(const OctreePtr<Entity>& tree, const Pred& pred,
                             const SplitLimits& limits = SplitLimits()) {
    return splitWhereAt(tree, pred, limits, 0);
}

// same tree as splitWhere, but the 8 subtrees under the root are processed
// in parallel. pred gets called from TBB worker threads
template <typename Entity, typename Pred>
OctreePtr<Entity> splitWhereParallel(const OctreePtr<Entity>& tree, const Pred& pred,
                                     const SplitLimits& limits = SplitLimits()) {
    OctreePtr<Entity> root = tree;
    if (root->isLeaf()) {
        if (!pred(*root)) return root;
        checkSplitAllowed(*root, limits, 0);
        root = splitLeaf(root);
    }

    // each task writes only its own slot
    std::array<OctreePtr<Entity>, kNumOctants> children = root->children;
    tbb::parallel_for(0, kNumOctants, [&](int b) {
        children[b] = splitWhereAt(root->children[b], pred, limits, 1);
    });

    bool changed = (root != tree);
    for (int b = 0; b < kNumOctants; ++b) {
        if (children[b] != root->children[b]) changed = true;
    }
    return changed ? makeInternal(root->center, root->side, children) : tree;
}

// ---- traversal ----

// visits every entity: children in octant order 0..7, leaf objects in
// insertion order. can be run any number of times on the same snapshot
template <typename Entity, typename F>
void forEachEntity(const OctreePtr<Entity>& tree, F&& func) {
    if (tree->isLeaf()) {
        for (const auto& e : tree->objects) func(e);
        return;
    }
    for (const auto& c : tree->children) forEachEntity(c, func);
}

template <typename Entity, typename Acc, typename F>
Acc foldTree(const OctreePtr<Entity>& tree, Acc acc, F&& func) {
    forEachEntity(tree, [&](const Entity& e) { acc = func(std::move(acc), e); });
    return acc;
}

template <typename Entity>
std::vector<Entity> flattenTree(const OctreePtr<Entity>& tree) {
    std::vector<Entity> out;
    out.reserve(tree->count);
    forEachEntity(tree, [&](const Entity& e) { out.push_back(e); });
    return out;
}

// rebuild with every entity transformed. the transform may move an entity
// into another leaf, so the result is re-inserted from an empty root of the
// same cube (one leaf again, split it with splitWhere afterwards)
template <typename Entity, typename F>
OctreePtr<Entity> mapTree(const OctreePtr<Entity>& tree, F&& func) {
    std::vector<Entity> mapped;
    mapped.reserve(tree->count);
    forEachEntity(tree, [&](const Entity& e) { mapped.push_back(func(e)); });
    return insertAll(emptyTree<Entity>(tree->center, tree->side), mapped);
}

// ---- diagnostics ----

struct TreeStats {
    int internals = 0;
    int leaves = 0;
    int maxDepth = 0;
    int maxLeafCount = 0;
};

template <typename Entity>
void accumulateStats(const OctreePtr<Entity>& node, int depth, TreeStats& stats) {
    stats.maxDepth = std::max(stats.maxDepth, depth);
    if (node->isLeaf()) {
        stats.leaves++;
        stats.maxLeafCount = std::max(stats.maxLeafCount, node->count);
        return;
    }
    stats.internals++;
    for (const auto& c : node->children) accumulateStats(c, depth + 1, stats);
}

template <typename Entity>
TreeStats treeStats(const OctreePtr<Entity>& tree) {
    TreeStats stats;
    accumulateStats(tree, 0, stats);
    return stats;
}

// human readable dump for tracing, not meant to be parsed
template <typename Entity>
void dumpTree(const OctreePtr<Entity>& tree, std::ostream& os, int indent = 0) {
    const std::string pad(indent * 2, ' ');
    os << pad << (tree->isLeaf() ? "Leaf" : "Node") << " {\n"
       << pad << "  center: " << tree->center << "\n"
       << pad << "  side: " << tree->side << "\n"
       << pad << "  count: " << tree->count << "\n";
    if (tree->isLeaf()) {
        for (const auto& e : tree->objects) {
            os << pad << "  " << entityPosition(e) << "\n";
        }
    } else {
        for (const auto& c : tree->children) dumpTree(c, os, indent + 1);
    }
    os << pad << "}\n";
}

template <typename Entity>
std::string prettyPrint(const OctreePtr<Entity>& tree) {
    std::ostringstream os;
    dumpTree(tree, os);
    return os.str();
}
