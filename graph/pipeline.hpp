#pragma once
#include <vector>
#include <string>
#include <cstddef>
#include "graph.hpp"
#include "adjacency_io.hpp"

enum class InputFormat { Adjacency, EdgeList };

struct NormalizeResult {
    IoError error{IoError::None};
    std::string reason;          // if error != None, human-readable reason

    std::size_t vertices_in{0}, edges_in{0};
    std::size_t vertices_out{0}, edges_out{0};
    std::vector<Graph::Vertex> removed;  // isolated vertices dropped, sorted
    std::size_t lines_written{0};

    bool ok() const { return error == IoError::None; }
};

// "dir/g.txt" -> "dir/g_normalized.txt", "g" -> "g_normalized".
// Only the file name's last extension counts; ".hidden" has none.
std::string derive_output_path(const std::string& input,
                               const std::string& suffix = "_normalized");

// Load -> remove isolated -> save. A read failure creates no output file.
// Optional hook sees the loaded and the filtered graph (for diagnostics).
using GraphHook = void(*)(const char* stage, const Graph& g);
NormalizeResult normalize_file(const std::string& input, const std::string& output,
                               InputFormat fmt = InputFormat::Adjacency,
                               GraphHook hook = nullptr);
