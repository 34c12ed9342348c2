#include "graph.hpp"
#include <algorithm>
#include <sstream>

namespace {
    const Graph::NeighborSet kNoNeighbors{};
}

bool Graph::add_vertex(const Vertex& v) {
    return adj.emplace(v, NeighborSet{}).second;
}

bool Graph::add_edge(const Vertex& u, const Vertex& v) {
    auto &Au = adj[u];
    if (!Au.insert(v).second) return false; // already present

    adj[v].insert(u);
    m += 1;
    return true;
}

bool Graph::remove_edge(const Vertex& u, const Vertex& v) {
    auto itu = adj.find(u);
    if (itu == adj.end() || itu->second.erase(v) == 0) return false;

    // m only counts links made by add_edge, which are always two-sided.
    auto itv = adj.find(v);
    bool linked = (u == v) || (itv != adj.end() && itv->second.erase(u) != 0);
    if (linked && m) m -= 1;
    return true;
}

bool Graph::remove_vertex(const Vertex& v) {
    auto it = adj.find(v);
    if (it == adj.end()) return false;

    std::size_t linked = 0;
    for (const auto &w : it->second) {
        auto jt = adj.find(w);
        if (jt != adj.end() && jt->second.count(v)) ++linked;
    }

    // Scan every set rather than only v's neighbors, so a one-sided
    // reference cannot outlive v.
    for (auto &kv : adj) {
        if (kv.first == v) continue;
        kv.second.erase(v);
    }
    m -= std::min(m, linked);
    adj.erase(it);
    return true;
}

bool Graph::has_edge(const Vertex& u, const Vertex& v) const {
    auto it = adj.find(u);
    return it != adj.end() && it->second.count(v) != 0;
}

const Graph::NeighborSet& Graph::neighbors(const Vertex& v) const {
    auto it = adj.find(v);
    return it == adj.end() ? kNoNeighbors : it->second;
}

std::vector<Graph::Vertex> Graph::isolated_vertices() const {
    std::vector<Vertex> out;
    for (const auto &kv : adj)
        if (kv.second.empty()) out.push_back(kv.first);
    return out;
}

bool Graph::validate() const {
    for (const auto &kv : adj) {
        for (const auto &v : kv.second) {
            auto it = adj.find(v);
            if (it == adj.end() || it->second.count(kv.first) == 0)
                return false;
        }
    }
    return true;
}

std::string Graph::to_string() const {
    std::ostringstream os;
    os << "Undirected Graph: n=" << vertex_count() << " m=" << m << "\n";
    for (const auto &kv : adj) {
        os << "  " << kv.first << ":";
        for (const auto &v : kv.second) os << " " << v;
        os << "\n";
    }
    os << "Degrees:";
    for (const auto &kv : adj) os << " " << kv.first << "=" << kv.second.size();
    os << "\nvalid=" << (validate() ? "true":"false") << "\n";
    return os.str();
}
