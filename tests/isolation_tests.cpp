#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include "graph.hpp"
#include "adjacency_io.hpp"
#include "isolation.hpp"
#include "check.hpp"

static Graph parse(const std::string& text){
    Graph g;
    std::istringstream in(text);
    parse_adjacency(in, g);
    return g;
}

static bool every_vertex_has_neighbor(const Graph& g){
    for (const auto& kv : g.adj) if (kv.second.empty()) return false;
    return true;
}

static bool test_remove_isolated(){
    bool ok = true;
    Graph g = parse("A B C\nB A\nD\n");
    auto removed = remove_isolated(g);
    ok &= expect(removed == std::vector<std::string>{"D"}, "removed == std::vector<std::string>{\"D\"}");
    ok &= expect(g.vertex_count() == 3, "g.vertex_count() == 3");
    ok &= expect(!g.has_vertex("D"), "!g.has_vertex(\"D\")");
    ok &= expect(g.edge_count() == 2, "g.edge_count() == 2");
    ok &= expect(every_vertex_has_neighbor(g), "every_vertex_has_neighbor(g)");
    ok &= expect(g.validate(), "g.validate()");
    return ok;
}

static bool test_filter_is_pure(){
    bool ok = true;
    const Graph g = parse("q\np r\nz\ns s\n");
    Graph f = filter_isolated(g);
    ok &= expect(g.vertex_count() == 5, "g.vertex_count() == 5");  // input untouched
    ok &= expect(f.vertex_count() == 3, "f.vertex_count() == 3");  // p, r, and s (self-loop)
    ok &= expect(f.has_edge("s","s"), "f.has_edge(\"s\",\"s\")");
    ok &= expect(filter_isolated(f) == f, "filter_isolated(f) == f");
    return ok;
}

static bool test_no_data_loss(){
    bool ok = true;
    const Graph g = parse("1 2 3 4\n2 3\n5 6\n7\n8\n9 1\n");
    Graph f = filter_isolated(g);
    for (const auto& kv : g.adj) {
        if (kv.second.empty()) { ok &= expect(!f.has_vertex(kv.first), "!f.has_vertex(kv.first)"); continue; }
        ok &= expect(f.has_vertex(kv.first), "f.has_vertex(kv.first)");
        ok &= expect(f.neighbors(kv.first) == kv.second, "f.neighbors(kv.first) == kv.second");
    }
    ok &= expect(f.edge_count() == g.edge_count(), "f.edge_count() == g.edge_count()");
    ok &= expect(every_vertex_has_neighbor(f), "every_vertex_has_neighbor(f)");
    return ok;
}

static bool test_empty_and_all_isolated(){
    bool ok = true;
    Graph empty;
    ok &= expect(remove_isolated(empty).empty(), "remove_isolated(empty).empty()");
    ok &= expect(empty.vertex_count() == 0, "empty.vertex_count() == 0");

    Graph lone = parse("X\n");
    ok &= expect(remove_isolated(lone) == std::vector<std::string>{"X"}, "remove_isolated(lone) == std::vector<std::string>{\"X\"}");
    ok &= expect(lone.vertex_count() == 0, "lone.vertex_count() == 0");

    Graph many = parse("c\na\nb\n");
    ok &= expect(remove_isolated(many) == std::vector<std::string>{"a","b","c"}, "remove_isolated(many) == std::vector<std::string>{\"a\",\"b\",\"c\"}");
    ok &= expect(remove_isolated(many).empty(), "remove_isolated(many).empty()");   // second pass is a no-op
    return ok;
}

static bool test_one_sided_reference(){
    bool ok = true;
    // P lists Q, Q lists nothing: Q is isolated, and dropping it empties P.
    Graph g;
    g.adj["P"].insert("Q");
    g.adj["Q"];
    g.add_edge("R","S");
    Graph f = filter_isolated(g);
    ok &= expect(!f.has_vertex("Q"), "!f.has_vertex(\"Q\")");
    ok &= expect(!f.has_vertex("P"), "!f.has_vertex(\"P\")");
    ok &= expect(f.has_edge("R","S"), "f.has_edge(\"R\",\"S\")");
    ok &= expect(every_vertex_has_neighbor(f), "every_vertex_has_neighbor(f)");
    ok &= expect(filter_isolated(f) == f, "filter_isolated(f) == f");
    return ok;
}

int main(){
    bool ok = true;
    ok &= test_remove_isolated();
    ok &= test_filter_is_pure();
    ok &= test_no_data_loss();
    ok &= test_empty_and_all_isolated();
    ok &= test_one_sided_reference();
    std::cout << (ok ? "ALL TESTS PASSED\n" : "TESTS FAILED\n");
    return ok ? 0 : 1;
}
