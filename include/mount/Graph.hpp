#pragma once

#include "mount/MountNode.hpp"

#include <optional>
#include <utility>
#include <vector>

namespace sfs::config { struct LayerConfig; }

namespace sfs::mount {

class Manager;

// Layer dependency DAG. Nodes live in an arena; an edge parent -> child
// exists when the child's mountpoint lies beneath the parent's, using the
// nearest such ancestor. Exactly one node has no parent.
class Graph {
public:
    // Throws std::invalid_argument on duplicate mountpoints or multiple roots.
    explicit Graph(std::vector<MountNode> nodes);

    static Graph fromLayers(const std::vector<config::LayerConfig>& layers);

    // Parents before children, ties broken by arena order.
    [[nodiscard]] std::vector<size_t> topologicalOrder() const;

    [[nodiscard]] std::vector<std::pair<size_t, size_t>> edges() const;

    // Mounts in topological order. On failure the nodes mounted by this call
    // are unmounted again in reverse and the original error is rethrown.
    void mountAll(Manager& manager);

    // Unmounts in reverse topological order. A node that fails stays mounted
    // and its ancestors are skipped. Returns true when every node ended up
    // Unmounted.
    bool unmountAll(Manager& manager, bool forced = false);

    [[nodiscard]] size_t mountedCount() const;
    [[nodiscard]] std::optional<size_t> root() const { return root_; }
    [[nodiscard]] bool empty() const { return nodes_.empty(); }

    [[nodiscard]] const std::vector<MountNode>& nodes() const { return nodes_; }

private:
    std::vector<MountNode> nodes_;
    std::optional<size_t> root_;
};

}
