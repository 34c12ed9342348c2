#include <iostream>
#include <getopt.h>
#include <string>
#include "graph.hpp"
#include "pipeline.hpp"

// --- usage ---
static void usage(const char* prog){
    std::cerr<<"Usage: "<<prog<<" [-o <output>] [-s <suffix>] [-f adj|edges] [-v] [-q] <input>\n"
             <<"  -o, --output    output path (default: <input stem><suffix><ext>)\n"
             <<"  -s, --suffix    suffix for the derived output path (default _normalized)\n"
             <<"  -f, --format    input format: adj (adjacency list, default) or edges (edge list)\n"
             <<"  -v, --verbose   dump loaded and filtered graphs to stderr\n"
             <<"  -q, --quiet     no success message\n"
             <<"  -h, --help      show this help\n";
}

static void dump_graph(const char* stage, const Graph& g){
    std::cerr<<"[info] "<<stage<<" graph\n"<<g.to_string();
}

int main(int argc, char** argv){
    std::string output, suffix = "_normalized";
    InputFormat fmt = InputFormat::Adjacency;
    bool verbose=false, quiet=false;

    const option long_opts[]={
        {"output",1,nullptr,'o'}, {"suffix",1,nullptr,'s'},
        {"format",1,nullptr,'f'}, {"verbose",0,nullptr,'v'},
        {"quiet",0,nullptr,'q'},  {"help",0,nullptr,'h'},
        {nullptr,0,nullptr,0}
    };

    int opt, idx;
    while((opt=getopt_long(argc, argv, "o:s:f:vqh", long_opts, &idx))!=-1){
        switch(opt){
            case 'o': output = optarg; break;
            case 's': suffix = optarg; break;
            case 'f': {
                std::string f = optarg;
                if (f == "adj") fmt = InputFormat::Adjacency;
                else if (f == "edges") fmt = InputFormat::EdgeList;
                else { std::cerr<<"[error] unknown format '"<<f<<"'\n"; usage(argv[0]); return 2; }
                break;
            }
            case 'v': verbose = true; break;
            case 'q': quiet = true; break;
            case 'h': usage(argv[0]); return 0;
            default: usage(argv[0]); return 2;
        }
    }
    if (argc - optind != 1) { usage(argv[0]); return 2; }

    std::string input = argv[optind];
    if (output.empty()) output = derive_output_path(input, suffix);
    if (output == input) {
        std::cerr<<"[error] output path equals input path '"<<input<<"'\n";
        return 2;
    }

    auto res = normalize_file(input, output, fmt, verbose ? dump_graph : nullptr);
    if (!res.ok()) {
        std::cerr<<"[error] "<<io_error_name(res.error)<<": "<<res.reason<<"\n";
        return 1;
    }

    if (verbose) {
        std::cerr<<"[info] vertices "<<res.vertices_in<<" -> "<<res.vertices_out
                 <<", edges "<<res.edges_in<<" -> "<<res.edges_out<<"\n";
        for (const auto& v : res.removed) std::cerr<<"[info] removed isolated vertex "<<v<<"\n";
    }
    if (res.vertices_out == 0)
        std::cerr<<"[warn] no vertex with edges left; '"<<output<<"' is empty\n";
    if (!quiet)
        std::cout<<"Normalized adjacency list saved to '"<<output<<"' ("
                 <<res.removed.size()<<" isolated vertices removed).\n";
    return 0;
}
