#include "pipeline.hpp"
#include "isolation.hpp"
#include <filesystem>

namespace fs = std::filesystem;

std::string derive_output_path(const std::string& input, const std::string& suffix) {
    fs::path p(input);
    fs::path stem = p.stem();        // "g" for "g.txt", ".hidden" for ".hidden"
    fs::path ext = p.extension();    // ".txt", empty for ".hidden"
    fs::path name = stem.string() + suffix + ext.string();
    return (p.parent_path() / name).string();
}

NormalizeResult normalize_file(const std::string& input, const std::string& output,
                               InputFormat fmt, GraphHook hook) {
    NormalizeResult r;

    LoadResult lr = (fmt == InputFormat::EdgeList) ? load_edge_list(input)
                                                   : load_adjacency(input);
    if (!lr.ok()) {
        r.error = lr.error;
        r.reason = lr.reason;
        return r;
    }
    Graph& g = lr.graph;
    r.vertices_in = g.vertex_count();
    r.edges_in = g.edge_count();
    if (hook) hook("loaded", g);

    r.removed = remove_isolated(g);
    r.vertices_out = g.vertex_count();
    r.edges_out = g.edge_count();
    if (hook) hook("filtered", g);

    SaveResult sr = save_adjacency(g, output);
    r.lines_written = sr.lines;
    if (!sr.ok()) {
        r.error = sr.error;
        r.reason = sr.reason;
    }
    return r;
}
