#pragma once
#include <map>
#include <set>
#include <vector>
#include <string>
#include <cstddef>

// Undirected adjacency-list graph keyed by text labels.
// Guarantees: symmetric adjacency; neighbor sets ignore duplicates;
// vertices and neighbors iterate in lexicographic order.
struct Graph {
    using Vertex = std::string;
    using NeighborSet = std::set<Vertex>;

    std::map<Vertex, NeighborSet> adj;
    std::size_t m{};                   // logical edge count (self-loop counts once)

    Graph() = default;

    // Add v with no neighbors. Returns false if v already existed.
    bool add_vertex(const Vertex& v);

    // Add u-v, creating missing endpoints. Returns false on duplicate.
    bool add_edge(const Vertex& u, const Vertex& v);

    // Remove u-v. Returns true if removed something.
    bool remove_edge(const Vertex& u, const Vertex& v);

    // Remove v and every reference to it. Returns true if v existed.
    bool remove_vertex(const Vertex& v);

    bool has_vertex(const Vertex& v) const { return adj.count(v) != 0; }
    bool has_edge(const Vertex& u, const Vertex& v) const;

    // Empty set for unknown vertices.
    const NeighborSet& neighbors(const Vertex& v) const;
    std::size_t degree(const Vertex& v) const { return neighbors(v).size(); }

    std::size_t vertex_count() const { return adj.size(); }
    std::size_t edge_count() const { return m; }

    // Sorted list of vertices with an empty neighbor set.
    std::vector<Vertex> isolated_vertices() const;

    // Consistency check: symmetry, and every neighbor is a vertex.
    bool validate() const;

    // Debug dump
    std::string to_string() const;

    bool operator==(const Graph& o) const { return m == o.m && adj == o.adj; }
    bool operator!=(const Graph& o) const { return !(*this == o); }
};
