#include "alkey/value.hpp"
#include "alkey/cell.hpp"
#include <sstream>
#include <stdexcept>

namespace alkey {

const value* Instance::find(std::string_view name) const {
    for(auto& kv : fields) if(kv.first == name) return &kv.second;
    return nullptr;
}

const value& Instance::at(std::string_view name) const {
    if(auto* v = find(name)) return *v;
    throw std::out_of_range("instance of " + type_name + " has no field '" + std::string(name) + "'");
}

std::string describe(const value& v){
    struct V {
        std::string operator()(std::monostate) const { return "nil"; }
        std::string operator()(bool) const { return "bool"; }
        std::string operator()(int64_t) const { return "int"; }
        std::string operator()(double) const { return "float"; }
        std::string operator()(const std::string&) const { return "string"; }
        std::string operator()(const keyword&) const { return "keyword"; }
        std::string operator()(const seq&) const { return "seq"; }
        std::string operator()(const map_t&) const { return "map"; }
        std::string operator()(const instance_ptr& p) const { return p ? "instance " + p->type_name : std::string("null instance"); }
        std::string operator()(const cell_ptr& c) const { return c ? (c->is_lazy() ? "lazy cell" : "eager cell") : std::string("null cell"); }
    };
    return std::visit(V{}, v.data);
}

bool equal(const Instance& a, const Instance& b){
    if(a.type_name != b.type_name || a.variant != b.variant || a.fields.size() != b.fields.size()) return false;
    for(size_t i=0;i<a.fields.size(); ++i){
        if(a.fields[i].first != b.fields[i].first) return false;
        if(!equal(a.fields[i].second, b.fields[i].second)) return false;
    }
    return true;
}

bool equal(const value& a, const value& b){
    if(a.data.index() != b.data.index()) return false;
    struct V {
        const value& b;
        bool operator()(std::monostate) const { return true; }
        bool operator()(bool x) const { return x == std::get<bool>(b.data); }
        bool operator()(int64_t x) const { return x == std::get<int64_t>(b.data); }
        bool operator()(double x) const { return x == std::get<double>(b.data); }
        bool operator()(const std::string& x) const { return x == std::get<std::string>(b.data); }
        bool operator()(const keyword& x) const { return x.name == std::get<keyword>(b.data).name; }
        bool operator()(const seq& x) const {
            auto& y = std::get<seq>(b.data);
            if(x.elems.size() != y.elems.size()) return false;
            for(size_t i=0;i<x.elems.size(); ++i) if(!equal(x.elems[i], y.elems[i])) return false;
            return true;
        }
        bool operator()(const map_t& x) const {
            auto& y = std::get<map_t>(b.data);
            if(x.entries.size() != y.entries.size()) return false;
            for(size_t i=0;i<x.entries.size(); ++i){
                if(!equal(x.entries[i].first, y.entries[i].first) || !equal(x.entries[i].second, y.entries[i].second)) return false;
            }
            return true;
        }
        bool operator()(const instance_ptr& x) const {
            auto& y = std::get<instance_ptr>(b.data);
            if(x == y) return true;
            if(!x || !y) return false;
            return equal(*x, *y);
        }
        bool operator()(const cell_ptr& x) const {
            auto& y = std::get<cell_ptr>(b.data);
            if(x == y) return true;
            if(!x || !y) return false;
            const value* xv = x->peek();
            const value* yv = y->peek();
            return xv && yv && equal(*xv, *yv);
        }
    };
    return std::visit(V{b}, a.data);
}

static void print(std::ostringstream& os, const value& v);

static void print_instance(std::ostringstream& os, const Instance& i){
    os << "#" << i.type_name;
    if(i.variant) os << "." << *i.variant;
    os << "{";
    for(size_t k=0;k<i.fields.size(); ++k){
        if(k) os << " ";
        os << ":" << i.fields[k].first << " ";
        print(os, i.fields[k].second);
    }
    os << "}";
}

static void print_string(std::ostringstream& os, const std::string& s){
    os << '"';
    for(char c : s){
        switch(c){
            case '"': os << "\\\""; break;
            case '\\': os << "\\\\"; break;
            case '\n': os << "\\n"; break;
            case '\t': os << "\\t"; break;
            case '\r': os << "\\r"; break;
            default: os << c;
        }
    }
    os << '"';
}

static void print(std::ostringstream& os, const value& v){
    if(v.is_nil()){ os << "nil"; return; }
    if(auto* b = std::get_if<bool>(&v.data)){ os << (*b ? "true" : "false"); return; }
    if(auto* i = std::get_if<int64_t>(&v.data)){ os << *i; return; }
    if(auto* d = std::get_if<double>(&v.data)){
        std::ostringstream tmp; tmp << *d; std::string s = tmp.str();
        if(s.find_first_of(".eEn") == std::string::npos) s += ".0";
        os << s; return;
    }
    if(auto* s = std::get_if<std::string>(&v.data)){ print_string(os, *s); return; }
    if(auto* k = std::get_if<keyword>(&v.data)){ os << ":" << k->name; return; }
    if(auto* q = std::get_if<seq>(&v.data)){
        os << "[";
        for(size_t i=0;i<q->elems.size(); ++i){ if(i) os << " "; print(os, q->elems[i]); }
        os << "]"; return;
    }
    if(auto* m = std::get_if<map_t>(&v.data)){
        os << "{";
        for(size_t i=0;i<m->entries.size(); ++i){
            if(i) os << " ";
            print(os, m->entries[i].first); os << " "; print(os, m->entries[i].second);
        }
        os << "}"; return;
    }
    if(auto* p = std::get_if<instance_ptr>(&v.data)){
        if(*p) print_instance(os, **p); else os << "#null";
        return;
    }
    if(auto* c = std::get_if<cell_ptr>(&v.data)){
        if(!*c){ os << "#null"; return; }
        if(const value* inner = (*c)->peek()){ print(os, *inner); return; }
        os << "#lazy<" << (*c)->id() << ">";
        return;
    }
}

std::string to_string(const value& v){ std::ostringstream os; print(os, v); return os.str(); }
std::string to_string(const Instance& i){ std::ostringstream os; print_instance(os, i); return os.str(); }

} // namespace alkey
