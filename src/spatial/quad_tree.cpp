/**
 * @file quad_tree.cpp
 * @brief Point quad-tree insertion, subdivision and range queries
 */

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

#include "beatfield/core/debug.hpp"
#include "beatfield/spatial/quad_tree.hpp"

namespace Spatial {

QuadTree::QuadTree(const Region& boundary, int capacity, int maxDepth)
    : QuadTree(ChildKey{}, boundary, capacity, maxDepth, 0)
{
    if (capacity < 1) {
        throw std::invalid_argument("QuadTree capacity must be at least 1, got " +
                                    std::to_string(capacity));
    }
    if (maxDepth < 0) {
        throw std::invalid_argument("QuadTree max depth must be non-negative, got " +
                                    std::to_string(maxDepth));
    }
    if (!std::isfinite(boundary.width()) || !std::isfinite(boundary.height()) ||
        boundary.width() <= 0.0 || boundary.height() <= 0.0) {
        throw std::invalid_argument("QuadTree boundary must have a finite, positive size");
    }
}

QuadTree::QuadTree(ChildKey, const Region& boundary, int capacity, int maxDepth, int level)
    : boundary(boundary)
    , capacity(capacity)
    , maxDepth(maxDepth)
    , level(level)
    , node(Leaf{})
{
}

bool QuadTree::insert(entt::entity entity, const Position& position) {
    return insert(QuadTreeItem{entity, position});
}

bool QuadTree::insert(const QuadTreeItem& item) {
    if (!boundary.contains(item.position)) {
        return false;
    }

    if (auto* leaf = std::get_if<Leaf>(&node)) {
        if (static_cast<int>(leaf->items.size()) < capacity || level >= maxDepth) {
            leaf->items.push_back(item);
            return true;
        }
        subdivide();
    }

    return insertIntoChildren(item);
}

bool QuadTree::insertIntoChildren(const QuadTreeItem& item) {
    for (auto& child : std::get<Internal>(node).children) {
        if (child->insert(item)) {
            return true;
        }
    }
    // The quadrants tile the parent, so a contained point always finds one
    DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "[QuadTree] no child accepted ("
              << item.position.x << ", " << item.position.y << ")\n");
    return false;
}

void QuadTree::subdivide() {
    auto* leaf = std::get_if<Leaf>(&node);
    if (!leaf || level >= maxDepth) {
        return;
    }

    std::vector<QuadTreeItem> held = std::move(leaf->items);

    Internal internal;
    auto const quadrants = boundary.split();
    for (std::size_t i = 0; i < quadrants.size(); ++i) {
        internal.children[i] = std::make_unique<QuadTree>(ChildKey{}, quadrants[i], capacity,
                                                          maxDepth, level + 1);
    }
    node = std::move(internal);

    for (const auto& item : held) {
        if (!insertIntoChildren(item)) {
            DebugStats::recordDroppedInsert();
        }
    }
}

void QuadTree::query(const Region& range, std::vector<QuadTreeItem>& found) const {
    if (!boundary.intersects(range)) {
        return;
    }

    if (const auto* leaf = std::get_if<Leaf>(&node)) {
        for (const auto& item : leaf->items) {
            if (range.contains(item.position)) {
                found.push_back(item);
            }
        }
        return;
    }

    for (const auto& child : std::get<Internal>(node).children) {
        child->query(range, found);
    }
}

std::vector<QuadTreeItem> QuadTree::query(const Region& range) const {
    std::vector<QuadTreeItem> found;
    query(range, found);
    return found;
}

void QuadTree::query(const Region& range, const entt::registry& registry,
                     std::vector<entt::entity>& found) const {
    if (!boundary.intersects(range)) {
        return;
    }

    if (const auto* leaf = std::get_if<Leaf>(&node)) {
        for (const auto& item : leaf->items) {
            if (!registry.valid(item.entity)) {
                continue;
            }
            const auto* pos = registry.try_get<Position>(item.entity);
            if (pos && range.contains(*pos)) {
                found.push_back(item.entity);
            }
        }
        return;
    }

    for (const auto& child : std::get<Internal>(node).children) {
        child->query(range, registry, found);
    }
}

void QuadTree::clear() {
    node = Leaf{};
}

bool QuadTree::isLeaf() const {
    return std::holds_alternative<Leaf>(node);
}

std::size_t QuadTree::heldCount() const {
    if (const auto* leaf = std::get_if<Leaf>(&node)) {
        return leaf->items.size();
    }
    return 0;
}

std::size_t QuadTree::size() const {
    if (const auto* leaf = std::get_if<Leaf>(&node)) {
        return leaf->items.size();
    }
    std::size_t total = 0;
    for (const auto& child : std::get<Internal>(node).children) {
        total += child->size();
    }
    return total;
}

int QuadTree::depth() const {
    if (isLeaf()) {
        return 1;
    }
    int deepest = 0;
    for (const auto& child : std::get<Internal>(node).children) {
        deepest = std::max(deepest, child->depth());
    }
    return deepest + 1;
}

std::size_t QuadTree::nodeCount() const {
    if (isLeaf()) {
        return 1;
    }
    std::size_t count = 1;
    for (const auto& child : std::get<Internal>(node).children) {
        count += child->nodeCount();
    }
    return count;
}

void QuadTree::forEachRegion(const RegionVisitor& visitor) const {
    bool const leaf = isLeaf();
    visitor(boundary, level, leaf, heldCount());
    if (leaf) {
        return;
    }
    for (const auto& child : std::get<Internal>(node).children) {
        child->forEachRegion(visitor);
    }
}

} // namespace Spatial
