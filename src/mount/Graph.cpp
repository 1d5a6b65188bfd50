#include "mount/Graph.hpp"
#include "mount/Manager.hpp"
#include "config/Config.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <deque>
#include <stdexcept>

using namespace sfs::mount;
using namespace sfs::log;

namespace {

std::filesystem::path normalize(const std::filesystem::path& p) {
    auto out = p.lexically_normal();
    if (out.has_filename() || out == out.root_path()) return out;
    return out.parent_path();  // drop the trailing separator
}

// True when `inner` lies strictly beneath `outer`, compared by component.
bool isBeneath(const std::filesystem::path& outer, const std::filesystem::path& inner) {
    auto o = outer.begin();
    auto i = inner.begin();
    for (; o != outer.end(); ++o, ++i) {
        if (i == inner.end() || *o != *i) return false;
    }
    return i != inner.end();
}

}

Graph::Graph(std::vector<MountNode> nodes) : nodes_(std::move(nodes)) {
    for (auto& n : nodes_) {
        n.mountPoint = normalize(n.mountPoint);
        n.parent.reset();
        n.children.clear();
    }

    for (size_t i = 0; i < nodes_.size(); ++i)
        for (size_t j = i + 1; j < nodes_.size(); ++j)
            if (nodes_[i].mountPoint == nodes_[j].mountPoint)
                throw std::invalid_argument("layers " + nodes_[i].name + " and " + nodes_[j].name +
                                            " share mountpoint " + nodes_[i].mountPoint.string());

    for (size_t child = 0; child < nodes_.size(); ++child) {
        std::optional<size_t> nearest;
        for (size_t cand = 0; cand < nodes_.size(); ++cand) {
            if (cand == child || !isBeneath(nodes_[cand].mountPoint, nodes_[child].mountPoint)) continue;
            if (!nearest || isBeneath(nodes_[*nearest].mountPoint, nodes_[cand].mountPoint)) nearest = cand;
        }

        if (nearest) {
            nodes_[child].parent = nearest;
            nodes_[*nearest].children.push_back(child);
        } else if (root_) {
            throw std::invalid_argument("layers " + nodes_[*root_].name + " and " + nodes_[child].name +
                                        " are both roots; every layer must nest under a single root");
        } else {
            root_ = child;
        }
    }
}

Graph Graph::fromLayers(const std::vector<config::LayerConfig>& layers) {
    std::vector<MountNode> nodes;
    nodes.reserve(layers.size());
    for (const auto& l : layers) {
        nodes.push_back(MountNode{
            .name = l.name.empty() ? l.mount_point.string() : l.name,
            .source = l.source,
            .mountPoint = l.mount_point,
            .fsType = l.fs_type,
            .options = l.options,
            .readOnly = l.read_only
        });
    }
    return Graph(std::move(nodes));
}

std::vector<size_t> Graph::topologicalOrder() const {
    std::vector<size_t> indegree(nodes_.size(), 0);
    for (const auto& n : nodes_)
        for (const auto c : n.children) ++indegree[c];

    std::deque<size_t> ready;
    for (size_t i = 0; i < nodes_.size(); ++i)
        if (indegree[i] == 0) ready.push_back(i);

    std::vector<size_t> order;
    order.reserve(nodes_.size());
    while (!ready.empty()) {
        const auto next = ready.front();
        ready.pop_front();
        order.push_back(next);

        auto children = nodes_[next].children;
        std::ranges::sort(children);
        for (const auto c : children)
            if (--indegree[c] == 0) ready.push_back(c);
    }

    if (order.size() != nodes_.size()) throw std::logic_error("mount graph contains a cycle");
    return order;
}

std::vector<std::pair<size_t, size_t>> Graph::edges() const {
    std::vector<std::pair<size_t, size_t>> out;
    for (size_t i = 0; i < nodes_.size(); ++i)
        if (nodes_[i].parent) out.emplace_back(*nodes_[i].parent, i);
    return out;
}

void Graph::mountAll(Manager& manager) {
    std::vector<size_t> mounted;

    for (const auto idx : topologicalOrder()) {
        const bool wasMounted = nodes_[idx].state == MountState::Mounted;
        try {
            manager.mount(nodes_, idx);
            if (!wasMounted) mounted.push_back(idx);
        } catch (const std::exception& e) {
            Registry::mount()->error("[Graph] Mounting {} failed, unwinding {} layers: {}",
                                     nodes_[idx].name, mounted.size(), e.what());
            for (auto it = mounted.rbegin(); it != mounted.rend(); ++it) {
                try {
                    manager.unmount(nodes_, *it);
                } catch (const std::exception& undo) {
                    Registry::mount()->error("[Graph] Unwind of {} failed: {}", nodes_[*it].name, undo.what());
                }
            }
            throw;
        }
    }

    Registry::mount()->info("[Graph] {} layers mounted", mounted.size());
}

bool Graph::unmountAll(Manager& manager, const bool forced) {
    auto order = topologicalOrder();
    std::ranges::reverse(order);

    std::vector<bool> blocked(nodes_.size(), false);

    for (const auto idx : order) {
        auto& node = nodes_[idx];
        if (blocked[idx]) {
            Registry::mount()->error("[Graph] Skipping {}: a layer beneath it is still mounted", node.name);
        } else {
            try {
                manager.unmount(nodes_, idx, forced);
            } catch (const std::exception& e) {
                Registry::mount()->error("[Graph] Unmount of {} failed: {}", node.name, e.what());
            }
        }

        if (node.state != MountState::Unmounted)
            for (auto p = node.parent; p; p = nodes_[*p].parent) blocked[*p] = true;
    }

    return mountedCount() == 0;
}

size_t Graph::mountedCount() const {
    return static_cast<size_t>(std::ranges::count_if(nodes_, [](const MountNode& n) {
        return n.state != MountState::Unmounted;
    }));
}
