#pragma once
#include <iosfwd>
#include <string>
#include <cstddef>
#include "graph.hpp"

enum class IoError {
    None,
    ReadError,   // source missing, unreadable or not a regular file
    WriteError,  // destination cannot be created or written
};

const char* io_error_name(IoError e);

struct ParseStats {
    std::size_t lines{0};        // physical lines consumed
    std::size_t blank_lines{0};  // skipped after trimming
    std::size_t pairs{0};        // (vertex, neighbor) pairs seen, duplicates included
};

struct LoadResult {
    IoError error{IoError::None};
    Graph graph;
    ParseStats stats;
    std::string reason;          // if error != None, human-readable reason

    bool ok() const { return error == IoError::None; }
};

struct SaveResult {
    IoError error{IoError::None};
    std::size_t lines{0};        // adjacency lines written
    std::string reason;

    bool ok() const { return error == IoError::None; }
};

// Adjacency-list format: "<vertex> <neighbor>..." per line, any whitespace run
// between tokens. A bare "<vertex>" line adds a vertex with no edges.
// Returns false if the stream went bad mid-read.
bool parse_adjacency(std::istream& in, Graph& g, ParseStats* stats = nullptr);
LoadResult load_adjacency(const std::string& path);

// Edge-list format: "<u> <v>" per line; extra tokens ignored, shorter lines skipped.
bool parse_edge_list(std::istream& in, Graph& g, ParseStats* stats = nullptr);
LoadResult load_edge_list(const std::string& path);

// One line per vertex: id, a single space, neighbors joined by single spaces.
// Vertices and neighbors in lexicographic order. Isolation is not re-checked.
std::size_t write_adjacency(const Graph& g, std::ostream& out);
SaveResult save_adjacency(const Graph& g, const std::string& path);
