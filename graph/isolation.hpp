#pragma once
#include <vector>
#include "graph.hpp"

// Remove every vertex with an empty neighbor set, in place.
// Returns the removed vertices in lexicographic order.
std::vector<Graph::Vertex> remove_isolated(Graph& g);

// Copy of g without isolated vertices. Idempotent.
Graph filter_isolated(const Graph& g);
