#pragma once

#include <depot/result.hpp>
#include <algorithm>
#include <functional>
#include <queue>
#include <sstream>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <variant>
#include <vector>

namespace depot {

// ---------------------------------------------------------------------------
// Graph<NodeData, EdgeData>: directed graph stored as an arena of nodes;
// edges refer to nodes by index only.
// ---------------------------------------------------------------------------

template<typename NodeData, typename EdgeData = std::monostate>
class Graph {
public:
    using NodeId = size_t;

    struct Edge {
        NodeId from;
        NodeId to;
        EdgeData data;
    };

    NodeId add_node(NodeData data) {
        NodeId id = nodes_.size();
        nodes_.push_back(std::move(data));
        adj_.push_back({});
        radj_.push_back({});
        return id;
    }

    void add_edge(NodeId from, NodeId to, EdgeData data = {}) {
        adj_[from].push_back({from, to, std::move(data)});
        radj_[to].push_back(from);
    }

    bool has_edge(NodeId from, NodeId to) const {
        for (const auto& e : adj_[from]) {
            if (e.to == to) return true;
        }
        return false;
    }

    size_t node_count() const { return nodes_.size(); }

    const NodeData& node(NodeId id) const { return nodes_[id]; }
    NodeData& node(NodeId id) { return nodes_[id]; }

    const std::vector<Edge>& successors(NodeId id) const { return adj_[id]; }
    const std::vector<NodeId>& predecessors(NodeId id) const { return radj_[id]; }

    // Kahn's algorithm. Among ready nodes the lowest id goes first, so the
    // result only depends on insertion order. Every edge from -> to puts
    // `from` before `to`.
    Result<std::vector<NodeId>> topological_sort() const {
        size_t n = nodes_.size();
        std::vector<size_t> in_deg(n, 0);
        for (size_t i = 0; i < n; ++i) {
            in_deg[i] = radj_[i].size();
        }

        std::priority_queue<NodeId, std::vector<NodeId>, std::greater<NodeId>> ready;
        for (size_t i = 0; i < n; ++i) {
            if (in_deg[i] == 0) ready.push(i);
        }

        std::vector<NodeId> order;
        order.reserve(n);
        while (!ready.empty()) {
            NodeId u = ready.top();
            ready.pop();
            order.push_back(u);
            for (const auto& e : adj_[u]) {
                if (--in_deg[e.to] == 0) {
                    ready.push(e.to);
                }
            }
        }

        if (order.size() != n) {
            return DepotError{DepotError::Cycle, "graph contains a cycle"};
        }
        return Result<std::vector<NodeId>>::ok(std::move(order));
    }

    // Nodes of one cycle in edge order, first node repeated at the end.
    // Empty when the graph is acyclic.
    std::vector<NodeId> find_cycle() const {
        enum Mark { White, Grey, Black };
        std::vector<Mark> mark(nodes_.size(), White);
        std::vector<NodeId> stack;

        std::function<bool(NodeId)> visit = [&](NodeId u) {
            mark[u] = Grey;
            stack.push_back(u);
            for (const auto& e : adj_[u]) {
                if (mark[e.to] == Grey) {
                    auto it = std::find(stack.begin(), stack.end(), e.to);
                    std::vector<NodeId> cycle(it, stack.end());
                    cycle.push_back(e.to);
                    stack = std::move(cycle);
                    return true;
                }
                if (mark[e.to] == White && visit(e.to)) return true;
            }
            stack.pop_back();
            mark[u] = Black;
            return false;
        };

        for (NodeId i = 0; i < nodes_.size(); ++i) {
            if (mark[i] == White && visit(i)) return stack;
        }
        return {};
    }

    bool has_cycle() const { return !find_cycle().empty(); }

    // Indented tree below root. Nodes reached a second time are printed
    // once more with a "(*)" marker and not expanded again.
    std::string tree_display(
        NodeId root,
        std::function<std::string(const NodeData&)> to_string_fn) const
    {
        std::ostringstream out;
        std::unordered_set<NodeId> expanded;
        tree_display_impl(root, "", true, true, expanded, to_string_fn, out);
        return out.str();
    }

private:
    std::vector<NodeData> nodes_;
    std::vector<std::vector<Edge>> adj_;
    std::vector<std::vector<NodeId>> radj_;

    void tree_display_impl(
        NodeId u,
        const std::string& prefix,
        bool is_root,
        bool is_last,
        std::unordered_set<NodeId>& expanded,
        std::function<std::string(const NodeData&)>& to_string_fn,
        std::ostringstream& out) const
    {
        out << prefix;
        if (!is_root) {
            out << (is_last ? "└── " : "├── ");
        }
        out << to_string_fn(nodes_[u]);

        if (!expanded.insert(u).second) {
            out << " (*)\n";
            return;
        }
        out << "\n";

        std::string child_prefix = prefix;
        if (!is_root) {
            child_prefix += (is_last ? "    " : "│   ");
        }
        const auto& edges = adj_[u];
        for (size_t i = 0; i < edges.size(); ++i) {
            tree_display_impl(edges[i].to, child_prefix, false,
                              i == edges.size() - 1,
                              expanded, to_string_fn, out);
        }
    }
};

// ---------------------------------------------------------------------------
// GraphMap: nodes keyed by PackageIdentity
// ---------------------------------------------------------------------------

template<typename EdgeData = std::monostate>
class GraphMap {
public:
    using NodeId = typename Graph<std::string, EdgeData>::NodeId;

    NodeId add_node(const std::string& name) {
        auto it = name_to_id_.find(name);
        if (it != name_to_id_.end()) return it->second;
        NodeId id = graph_.add_node(name);
        name_to_id_[name] = id;
        return id;
    }

    bool has_node(const std::string& name) const {
        return name_to_id_.count(name) > 0;
    }

    void add_edge(const std::string& from, const std::string& to,
                  EdgeData data = {}) {
        NodeId f = add_node(from);
        NodeId t = add_node(to);
        if (!graph_.has_edge(f, t)) {
            graph_.add_edge(f, t, std::move(data));
        }
    }

    bool has_edge(const std::string& from, const std::string& to) const {
        auto f = name_to_id_.find(from);
        auto t = name_to_id_.find(to);
        if (f == name_to_id_.end() || t == name_to_id_.end()) return false;
        return graph_.has_edge(f->second, t->second);
    }

    // Names such that every edge from -> to lists `from` first.
    // A cycle fails with Cycle naming its members.
    Result<std::vector<std::string>> topological_sort() const {
        auto r = graph_.topological_sort();
        if (r.is_err()) {
            std::string path;
            for (auto id : graph_.find_cycle()) {
                if (!path.empty()) path += " -> ";
                path += graph_.node(id);
            }
            return DepotError{DepotError::Cycle,
                "dependency cycle: " + path};
        }
        std::vector<std::string> names;
        for (auto id : r.value()) {
            names.push_back(graph_.node(id));
        }
        return Result<std::vector<std::string>>::ok(std::move(names));
    }

    bool has_cycle() const { return graph_.has_cycle(); }

    size_t node_count() const { return graph_.node_count(); }

    std::string tree_display(
        const std::string& root,
        std::function<std::string(const std::string&)> label = nullptr) const
    {
        auto it = name_to_id_.find(root);
        if (it == name_to_id_.end()) return "";
        if (!label) label = [](const std::string& s) { return s; };
        return graph_.tree_display(it->second, label);
    }

    const Graph<std::string, EdgeData>& inner() const { return graph_; }

private:
    Graph<std::string, EdgeData> graph_;
    std::unordered_map<std::string, NodeId> name_to_id_;
};

} // namespace depot
