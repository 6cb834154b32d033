#include "alkey/diagnostics_json.hpp"
#include <sstream>
#include <cstdio>
#include <vector>

namespace alkey {

std::string json_escape(const std::string& s){
    std::ostringstream o; o<<'"';
    for(char c: s){
        switch(c){
            case '"': o<<"\\\""; break; case '\\': o<<"\\\\"; break;
            case '\n': o<<"\\n"; break; case '\r': o<<"\\r"; break; case '\t': o<<"\\t"; break;
            default:
                if(static_cast<unsigned char>(c) < 0x20){ char buf[7]; std::snprintf(buf,sizeof(buf),"\\u%04X", (unsigned char)c); o<<buf; }
                else { o<<c; }
                break;
        }
    }
    o<<'"';
    return o.str();
}

std::string diagnostic_to_json(const Diagnostic& d){
    std::ostringstream os;
    os<<"{\"code\":"<<json_escape(d.code)
      <<",\"message\":"<<json_escape(d.message)
      <<",\"hint\":"<<json_escape(d.hint)
      <<",\"line\":"<<d.line
      <<",\"col\":"<<d.col
      <<",\"notes\":[";
    for(size_t i=0;i<d.notes.size(); ++i){
        if(i) os<<",";
        os<<"{\"message\":"<<json_escape(d.notes[i].message)<<",\"line\":"<<d.notes[i].line<<",\"col\":"<<d.notes[i].col<<"}";
    }
    os<<"]}";
    return os.str();
}

static void append_list(std::ostringstream& os, const std::vector<Diagnostic>& ds){
    os<<"[";
    for(size_t i=0;i<ds.size(); ++i){ if(i) os<<","; os<<diagnostic_to_json(ds[i]); }
    os<<"]";
}

std::string diagnostics_to_json(const SchemaResult& r){
    std::ostringstream os;
    os<<"{\"success\":"<<(r.success?"true":"false")<<",\"errors\":";
    append_list(os, r.errors);
    os<<",\"warnings\":";
    append_list(os, r.warnings);
    os<<",\"defined\":[";
    for(size_t i=0;i<r.defined.size(); ++i){ if(i) os<<","; os<<json_escape(r.defined[i]); }
    os<<"],\"fixtures\":"<<r.fixtures.size()<<"}";
    return os.str();
}

} // namespace alkey
