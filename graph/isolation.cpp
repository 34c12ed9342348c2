#include "isolation.hpp"
#include <algorithm>

std::vector<Graph::Vertex> remove_isolated(Graph& g) {
    std::vector<Graph::Vertex> removed;
    // A one-sided reference to a removed vertex can leave its holder empty,
    // so repeat until no isolated vertex is left. Symmetric graphs take one pass.
    for (auto iso = g.isolated_vertices(); !iso.empty(); iso = g.isolated_vertices()) {
        for (const auto& v : iso) g.remove_vertex(v);
        removed.insert(removed.end(), iso.begin(), iso.end());
    }
    std::sort(removed.begin(), removed.end());
    return removed;
}

Graph filter_isolated(const Graph& g) {
    Graph out = g;
    remove_isolated(out);
    return out;
}
