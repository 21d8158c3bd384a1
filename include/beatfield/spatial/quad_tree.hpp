/**
 * @file quad_tree.hpp
 * @brief Point quad-tree used for per-frame neighbour queries
 *
 * The tree is rebuilt from the registry every frame. It holds entity handles
 * filed under the position each particle had when it was inserted; it never
 * owns particles and is only valid until the next clear(). Neighbour lookups
 * during the frame go through the registry overload of query(), which tests
 * where each particle is now.
 */

#pragma once

#include <array>
#include <cstddef>
#include <functional>
#include <memory>
#include <variant>
#include <vector>

#include <entt/entt.hpp>

#include "beatfield/math/vector_math.hpp"
#include "beatfield/spatial/region.hpp"

namespace Spatial {

/**
 * @brief Non-owning reference to a particle for the lifetime of one frame
 *
 * `position` decides which leaf holds the item; it is not kept in sync with
 * the particle afterwards.
 */
struct QuadTreeItem {
    entt::entity entity;
    Position position;
};

/**
 * @class QuadTree
 * @brief Region quad-tree with leaf capacity and bounded depth
 *
 * A node is either a Leaf holding at most `capacity` items, or an Internal
 * node holding exactly four children (NW, NE, SW, SE) and no items. The only
 * exception is a leaf at `maxDepth`, which keeps accepting items so that
 * many particles sharing a point cannot recurse without bound.
 */
class QuadTree {
    // Only the tree itself can name this, so only it can build child nodes
    struct ChildKey {
        explicit ChildKey() = default;
    };

public:
    static constexpr int DefaultMaxDepth = 16;

    /**
     * @param boundary Region covered by the root node
     * @param capacity Items a leaf may hold before subdividing (>= 1)
     * @param maxDepth Deepest level that may be created (>= 0)
     * @throws std::invalid_argument on out-of-range capacity, depth or region
     */
    QuadTree(const Region& boundary, int capacity, int maxDepth = DefaultMaxDepth);

    /// Child node one level below its parent; see subdivide()
    QuadTree(ChildKey, const Region& boundary, int capacity, int maxDepth, int level);

    QuadTree(const QuadTree&) = delete;
    QuadTree& operator=(const QuadTree&) = delete;
    QuadTree(QuadTree&&) = default;
    QuadTree& operator=(QuadTree&&) = default;

    /**
     * @brief Insert an item
     * @return false when the position lies outside this node's region
     */
    bool insert(const QuadTreeItem& item);
    bool insert(entt::entity entity, const Position& position);

    /**
     * @brief Split a leaf into four quadrants and push its items down.
     *        Does nothing on an internal node or a leaf at maxDepth.
     */
    void subdivide();

    /**
     * @brief Append every item inside `range` to `found`.
     *
     * Subtrees whose region does not intersect `range` are skipped. Results
     * come out in NW, NE, SW, SE traversal order, then insertion order within
     * a leaf, so identical insert sequences give identical results.
     */
    void query(const Region& range, std::vector<QuadTreeItem>& found) const;
    std::vector<QuadTreeItem> query(const Region& range) const;

    /**
     * @brief Append every entity whose current Position in `registry` lies
     *        inside `range`.
     *
     * Pruning still uses node regions, but the range test reads the live
     * component, so a particle moved since insertion is matched where it is
     * now. Entities that were destroyed or lost their Position are skipped.
     */
    void query(const Region& range, const entt::registry& registry,
               std::vector<entt::entity>& found) const;

    /**
     * @brief Reset to an empty leaf, dropping all children
     */
    void clear();

    const Region& getBoundary() const { return boundary; }
    int getCapacity() const { return capacity; }
    int getMaxDepth() const { return maxDepth; }
    int getLevel() const { return level; }

    bool isLeaf() const;

    /// Items held directly by this node (always 0 for internal nodes)
    std::size_t heldCount() const;

    /// Items in the whole subtree
    std::size_t size() const;

    /// Number of levels in the subtree; a lone leaf has depth 1
    int depth() const;

    std::size_t nodeCount() const;

    using RegionVisitor =
        std::function<void(const Region& region, int level, bool leaf, std::size_t held)>;

    /**
     * @brief Pre-order walk over every node, for the debug overlay
     */
    void forEachRegion(const RegionVisitor& visitor) const;

private:

    bool insertIntoChildren(const QuadTreeItem& item);

    struct Leaf {
        std::vector<QuadTreeItem> items;
    };

    struct Internal {
        std::array<std::unique_ptr<QuadTree>, 4> children;  // indexed by Quadrant
    };

    Region boundary;
    int capacity;
    int maxDepth;
    int level;
    std::variant<Leaf, Internal> node;
};

} // namespace Spatial
