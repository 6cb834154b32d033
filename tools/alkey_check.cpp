#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include "alkey/diagnostics_json.hpp"
#include "alkey/engine.hpp"
#include "alkey/log.hpp"

using namespace alkey;

static bool read_file(const std::string& path, std::string& out){
    std::ifstream ifs(path); if(!ifs) return false;
    std::stringstream ss; ss<<ifs.rdbuf(); out = ss.str(); return true;
}

static void print_diagnostic(const char* level, const Diagnostic& d){
    std::cerr << level; if(!d.code.empty()) std::cerr << "["<<d.code<<"]"; std::cerr << ": " << d.message;
    if(d.line>=0) std::cerr << " (line "<<d.line<<":"<<d.col<<")";
    std::cerr << "\n";
    if(!d.hint.empty()) std::cerr << "  hint: " << d.hint << "\n";
    for(auto &n : d.notes){ std::cerr << "  note: " << n.message; if(n.line>=0) std::cerr << " (line "<<n.line<<":"<<n.col<<")"; std::cerr << "\n"; }
}

int main(int argc, char** argv){
    if(argc<2){ std::cerr << "usage: alkey-check <schema-file> [--json]\n"; return 1; }
    std::string file = argv[1];
    bool json = false;
    for(int i=2;i<argc;++i){
        std::string a = argv[i];
        if(a == "--json") json = true;
        else { std::cerr << "unknown option: " << a << "\n"; return 1; }
    }
    install_fatal_handler_if_requested();
    std::string src;
    if(!read_file(file, src)){ std::cerr << "failed to read " << file << "\n"; return 1; }

    Engine engine;
    SchemaResult r = engine.load(src, file);
    if(json){
        std::cout << diagnostics_to_json(r) << "\n";
    } else {
        for(auto &name : r.defined)
            if(auto def = engine.registry().lookup(name)) std::cout << to_string(*def) << "\n";
        for(auto &inst : r.fixtures) std::cout << to_string(*inst) << "\n";
        for(auto &e : r.errors) print_diagnostic("error", e);
        for(auto &w : r.warnings) print_diagnostic("warning", w);
    }
    if(!r.success){ if(!json) std::cerr << "schema check failed: " << r.errors.size() << " error(s)\n"; return 2; }
    return 0;
}
