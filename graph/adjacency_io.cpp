#include "adjacency_io.hpp"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <istream>
#include <ostream>
#include <system_error>
#include <filesystem>

namespace fs = std::filesystem;

namespace {

using LineHandler = void(*)(const std::vector<std::string>&, Graph&, ParseStats&);

std::vector<std::string> split_ws(const std::string& line) {
    std::vector<std::string> toks;
    std::istringstream ss(line);
    std::string t;
    while (ss >> t) toks.push_back(t);
    return toks;
}

void adjacency_line(const std::vector<std::string>& toks, Graph& g, ParseStats& st) {
    const auto& v = toks.front();
    g.add_vertex(v);
    for (std::size_t i = 1; i < toks.size(); ++i) {
        g.add_edge(v, toks[i]);
        ++st.pairs;
    }
}

void edge_line(const std::vector<std::string>& toks, Graph& g, ParseStats& st) {
    if (toks.size() < 2) return;
    g.add_edge(toks[0], toks[1]);
    ++st.pairs;
}

bool parse_lines(std::istream& in, Graph& g, ParseStats* stats, LineHandler handle) {
    ParseStats local;
    ParseStats& st = stats ? *stats : local;
    std::string line;
    while (std::getline(in, line)) {
        ++st.lines;
        auto toks = split_ws(line);
        if (toks.empty()) { ++st.blank_lines; continue; }
        handle(toks, g, st);
    }
    // getline sets failbit on a clean EOF; only badbit means the read broke.
    return !in.bad();
}

// Streams do not promise to set errno; callers clear it before the operation.
std::string sys_reason(const std::string& what, const std::string& path) {
    const char* why = errno ? std::strerror(errno) : "I/O error";
    return what + " '" + path + "': " + why;
}

LoadResult load_with(const std::string& path, LineHandler handle) {
    LoadResult r;
    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        r.error = IoError::ReadError;
        r.reason = "cannot read '" + path + "': is a directory";
        return r;
    }

    errno = 0;
    std::ifstream in(path);
    if (!in) {
        r.error = IoError::ReadError;
        r.reason = sys_reason("cannot open", path);
        return r;
    }
    errno = 0;
    if (!parse_lines(in, r.graph, &r.stats, handle)) {
        r.error = IoError::ReadError;
        r.reason = sys_reason("read failed on", path);
        r.graph = Graph{};
    }
    return r;
}

} // namespace

const char* io_error_name(IoError e) {
    switch (e) {
        case IoError::None:       return "None";
        case IoError::ReadError:  return "ReadError";
        case IoError::WriteError: return "WriteError";
    }
    return "Unknown";
}

bool parse_adjacency(std::istream& in, Graph& g, ParseStats* stats) {
    return parse_lines(in, g, stats, adjacency_line);
}

LoadResult load_adjacency(const std::string& path) {
    return load_with(path, adjacency_line);
}

bool parse_edge_list(std::istream& in, Graph& g, ParseStats* stats) {
    return parse_lines(in, g, stats, edge_line);
}

LoadResult load_edge_list(const std::string& path) {
    return load_with(path, edge_line);
}

std::size_t write_adjacency(const Graph& g, std::ostream& out) {
    std::size_t lines = 0;
    for (const auto &kv : g.adj) {
        out << kv.first << ' ';
        bool first = true;
        for (const auto &v : kv.second) {
            if (!first) out << ' ';
            out << v;
            first = false;
        }
        out << '\n';
        ++lines;
    }
    return lines;
}

SaveResult save_adjacency(const Graph& g, const std::string& path) {
    SaveResult r;
    errno = 0;
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) {
        r.error = IoError::WriteError;
        r.reason = sys_reason("cannot create", path);
        return r;
    }
    errno = 0;
    r.lines = write_adjacency(g, out);
    out.flush();
    if (out) out.close();
    if (!out) {
        r.error = IoError::WriteError;
        r.reason = sys_reason("write failed on", path);
    }
    return r;
}
