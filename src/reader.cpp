#include "alkey/reader.hpp"
#include "alkey/errors.hpp"
#include "alkey/value.hpp"
#include <tao/pegtl.hpp>
#include <cerrno>
#include <cstdlib>
#include <sstream>

namespace alkey {

namespace grammar {
using namespace tao::pegtl;

struct comment : seq< one<';'>, until< eolf > > {};
struct sep : sor< space, one<','>, comment > {};
struct skip : star< sep > {};

struct sym_first : sor< alpha, one<'*','!','_','?','-','+','/','<','>','=','$','%','&','.'> > {};
struct sym_rest : sor< sym_first, digit, one<'#',':','\''> > {};

struct number : seq< opt< one<'+','-'> >, plus< digit >, opt< one<'.'>, plus< digit > >,
                     opt< one<'e','E'>, opt< one<'+','-'> >, plus< digit > >, not_at< sym_rest > > {};
struct symbol : seq< sym_first, star< sym_rest > > {};
struct keyword : seq< one<':'>, plus< sym_rest > > {};

struct escaped : seq< one<'\\'>, must< one<'"','\\','n','t','r'> > > {};
struct plain : not_one<'"','\\'> {};
struct string_lit : if_must< one<'"'>, star< sor< escaped, plain > >, one<'"'> > {};

struct form;
struct list_open : one<'('> {};
struct list_close : one<')'> {};
struct vector_open : one<'['> {};
struct vector_close : one<']'> {};
struct map_open : one<'{'> {};
struct map_close : one<'}'> {};
struct list : if_must< list_open, skip, star< form, skip >, list_close > {};
struct vector : if_must< vector_open, skip, star< form, skip >, vector_close > {};
struct map : if_must< map_open, skip, star< form, skip >, map_close > {};

struct form : sor< string_lit, list, vector, map, number, keyword, symbol > {};
struct document : must< skip, star< form, skip >, eof > {};

} // namespace grammar

namespace {

struct read_state {
    std::vector<form_ptr> top;
    std::vector<form_ptr> open; // collections being filled, innermost last

    void add(form_ptr f){
        if(open.empty()) top.push_back(std::move(f));
        else open.back()->elems.push_back(std::move(f));
    }
};

template<typename Input>
form_ptr at(form::Kind k, const Input& in){
    auto f = std::make_shared<form>();
    f->kind = k;
    auto p = in.position();
    f->line = static_cast<int>(p.line);
    f->col = static_cast<int>(p.column);
    return f;
}

template<typename Input>
[[noreturn]] void fail_at(const char* code, const std::string& msg, const Input& in){
    auto p = in.position();
    throw schema_error(make_diag(code, p.source + ":" + std::to_string(p.line) + ":" + std::to_string(p.column) + ": " + msg, {},
                                 static_cast<int>(p.line), static_cast<int>(p.column)));
}

template<typename Rule> struct action : tao::pegtl::nothing<Rule> {};

template<> struct action<grammar::number> {
    template<typename Input> static void apply(const Input& in, read_state& st){
        std::string s = in.string();
        bool isFloat = s.find_first_of(".eE") != std::string::npos;
        errno = 0;
        if(isFloat){
            auto f = at(form::Kind::Float, in);
            f->f = std::strtod(s.c_str(), nullptr);
            if(errno == ERANGE) fail_at("E1461", "float literal out of range: " + s, in);
            st.add(std::move(f));
        } else {
            auto f = at(form::Kind::Int, in);
            f->i = std::strtoll(s.c_str(), nullptr, 10);
            if(errno == ERANGE) fail_at("E1461", "integer literal out of range: " + s, in);
            st.add(std::move(f));
        }
    }
};

template<> struct action<grammar::symbol> {
    template<typename Input> static void apply(const Input& in, read_state& st){
        std::string s = in.string();
        form_ptr f;
        if(s == "nil") f = at(form::Kind::Nil, in);
        else if(s == "true" || s == "false"){ f = at(form::Kind::Bool, in); f->b = s == "true"; }
        else { f = at(form::Kind::Symbol, in); f->text = std::move(s); }
        st.add(std::move(f));
    }
};

template<> struct action<grammar::keyword> {
    template<typename Input> static void apply(const Input& in, read_state& st){
        auto f = at(form::Kind::Keyword, in);
        f->text = in.string().substr(1);
        st.add(std::move(f));
    }
};

template<> struct action<grammar::string_lit> {
    template<typename Input> static void apply(const Input& in, read_state& st){
        std::string raw = in.string();
        auto f = at(form::Kind::String, in);
        for(size_t i=1; i+1<raw.size(); ++i){
            char c = raw[i];
            if(c == '\\' && i+2 < raw.size()){
                char e = raw[++i];
                switch(e){
                    case 'n': f->text.push_back('\n'); break;
                    case 't': f->text.push_back('\t'); break;
                    case 'r': f->text.push_back('\r'); break;
                    default: f->text.push_back(e); break;
                }
            } else f->text.push_back(c);
        }
        st.add(std::move(f));
    }
};

template<form::Kind K> struct open_action {
    template<typename Input> static void apply(const Input& in, read_state& st){
        auto f = at(K, in);
        st.add(f);
        st.open.push_back(std::move(f));
    }
};
struct close_action {
    template<typename Input> static void apply(const Input& in, read_state& st){
        if(st.open.back()->kind == form::Kind::Map && st.open.back()->elems.size() % 2 != 0)
            fail_at("E1462", "map literal needs an even number of forms", in);
        st.open.pop_back();
    }
};

template<> struct action<grammar::list_open> : open_action<form::Kind::List> {};
template<> struct action<grammar::vector_open> : open_action<form::Kind::Vector> {};
template<> struct action<grammar::map_open> : open_action<form::Kind::Map> {};
template<> struct action<grammar::list_close> : close_action {};
template<> struct action<grammar::vector_close> : close_action {};
template<> struct action<grammar::map_close> : close_action {};

} // namespace

std::vector<form_ptr> read_forms(std::string_view src, std::string_view source_name){
    tao::pegtl::memory_input in(src.data(), src.size(), std::string(source_name));
    read_state st;
    try {
        tao::pegtl::parse< grammar::document, action >(in, st);
    } catch (const tao::pegtl::parse_error& e) {
        auto p = e.positions().front();
        throw schema_error(make_diag("E1460", e.what(), "check brackets, strings and escapes near this position",
                                     static_cast<int>(p.line), static_cast<int>(p.column)));
    }
    return std::move(st.top);
}

const char* to_string(form::Kind k){
    switch(k){
        case form::Kind::Nil: return "nil";
        case form::Kind::Bool: return "bool";
        case form::Kind::Int: return "int";
        case form::Kind::Float: return "float";
        case form::Kind::String: return "string";
        case form::Kind::Symbol: return "symbol";
        case form::Kind::Keyword: return "keyword";
        case form::Kind::List: return "list";
        case form::Kind::Vector: return "vector";
        case form::Kind::Map: return "map";
    }
    return "?";
}

std::string to_string(const form& f){
    std::ostringstream os;
    auto coll = [&](const char* o, const char* c){
        os << o;
        for(size_t i=0;i<f.elems.size(); ++i){ if(i) os << ' '; os << to_string(*f.elems[i]); }
        os << c;
    };
    switch(f.kind){
        case form::Kind::Nil: os << "nil"; break;
        case form::Kind::Bool: os << (f.b ? "true" : "false"); break;
        case form::Kind::Int: os << f.i; break;
        // printed as values so that floats keep a fraction and strings are re-escaped
        case form::Kind::Float: os << to_string(value(f.f)); break;
        case form::Kind::String: os << to_string(value(f.text)); break;
        case form::Kind::Symbol: os << f.text; break;
        case form::Kind::Keyword: os << ':' << f.text; break;
        case form::Kind::List: coll("(", ")"); break;
        case form::Kind::Vector: coll("[", "]"); break;
        case form::Kind::Map: coll("{", "}"); break;
    }
    return os.str();
}

} // namespace alkey
