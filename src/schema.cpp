#include "alkey/schema.hpp"
#include "alkey/cell.hpp"
#include "alkey/log.hpp"
#include <map>
#include <set>

namespace alkey {

static Diagnostic at_form(const form& f, std::string code, std::string message, std::string hint = {}){
    return make_diag(std::move(code), std::move(message), std::move(hint), f.line, f.col);
}

TypeTag parse_type_tag(const form& f){
    if(f.kind == form::Kind::Nil) return scalar_tag(TypeTag::Kind::Nil);
    if(f.kind == form::Kind::Symbol){
        if(auto s = scalar_tag_named(f.text)) return *s;
        return ref_tag(f.text);
    }
    if(f.kind == form::Kind::List && !f.elems.empty() && f.elems[0]->kind == form::Kind::Symbol){
        const std::string& head = f.elems[0]->text;
        const size_t argc = f.elems.size() - 1;
        if(head == "seq" && argc == 1) return seq_tag(parse_type_tag(*f.elems[1]));
        if(head == "map" && argc == 2) return map_tag(parse_type_tag(*f.elems[1]), parse_type_tag(*f.elems[2]));
        if((head == "rec" || head == "ref") && argc == 1 && f.elems[1]->kind == form::Kind::Symbol)
            return head == "rec" ? rec_tag(f.elems[1]->text) : ref_tag(f.elems[1]->text);
    }
    throw schema_error(at_form(f, "E1475", "invalid type form " + to_string(f), "use a scalar name, a type name, (seq T), (map K V) or (rec Name)"));
}

value form_to_value(const form& f){
    switch(f.kind){
        case form::Kind::Nil: return value();
        case form::Kind::Bool: return value(f.b);
        case form::Kind::Int: return value(f.i);
        case form::Kind::Float: return value(f.f);
        case form::Kind::String: return value(f.text);
        case form::Kind::Symbol:
        case form::Kind::Keyword: return kw(f.text);
        case form::Kind::List:
        case form::Kind::Vector: {
            seq s;
            for(auto& e : f.elems) s.elems.push_back(form_to_value(*e));
            return value(std::move(s));
        }
        case form::Kind::Map: {
            map_t m;
            for(size_t i=0; i+1<f.elems.size(); i+=2) m.entries.emplace_back(form_to_value(*f.elems[i]), form_to_value(*f.elems[i+1]));
            return value(std::move(m));
        }
    }
    return value();
}

namespace {

// Keyword arguments of a (head :k v :k v ...) form.
using kwargs = std::map<std::string, form_ptr>;

class SchemaLoader {
public:
    SchemaLoader(Registry& reg, const Validator& v, SchemaResult& r) : reg_(reg), validator_(v), r_(r) {}

    void run(const std::vector<form_ptr>& forms){
        std::vector<form_ptr> fixtures;
        for(auto& f : forms){
            const std::string head = head_of(*f);
            if(head == "product") declare_product(*f);
            else if(head == "sum") declare_sum(*f);
            else if(head == "instance") fixtures.push_back(f);
            else error(at_form(*f, "E1470", "unknown top-level form " + to_string(*f), "expected (product ...), (sum ...) or (instance ...)"));
        }
        check_references();
        for(auto& f : fixtures){
            try {
                if(auto inst = build_instance(*f)) r_.fixtures.push_back(std::move(inst));
            } catch (const ValidationError& e) {
                Diagnostic d = e.diagnostic(); d.line = f->line; d.col = f->col;
                error(std::move(d));
            } catch (const schema_error& e) {
                error(e.diagnostic());
            }
        }
    }

private:
    static std::string head_of(const form& f){
        if(f.kind != form::Kind::List || f.elems.empty() || f.elems[0]->kind != form::Kind::Symbol) return {};
        return f.elems[0]->text;
    }

    void error(Diagnostic d){ r_.success = false; r_.errors.push_back(std::move(d)); }

    std::optional<kwargs> parse_kwargs(const form& f, const std::set<std::string>& allowed, const char* shapeCode){
        kwargs out;
        if((f.elems.size() - 1) % 2 != 0){
            error(at_form(f, shapeCode, "odd number of arguments in " + to_string(f), "arguments are :keyword value pairs"));
            return std::nullopt;
        }
        for(size_t i=1; i+1<f.elems.size(); i+=2){
            const form& k = *f.elems[i];
            if(k.kind != form::Kind::Keyword){
                error(at_form(k, shapeCode, "expected a keyword, found " + to_string(k), "arguments are :keyword value pairs"));
                return std::nullopt;
            }
            if(!allowed.count(k.text)){
                Diagnostic d = at_form(k, "E1476", "unknown keyword :" + k.text + " in (" + f.elems[0]->text + " ...)");
                for(auto& a : allowed) d.notes.push_back(Note{"allowed: :" + a});
                error(std::move(d));
                return std::nullopt;
            }
            out[k.text] = f.elems[i+1];
        }
        return out;
    }

    // :name must be a symbol.
    std::optional<std::string> name_arg(const form& owner, const kwargs& args, const char* key = "name"){
        auto it = args.find(key);
        if(it == args.end() || it->second->kind != form::Kind::Symbol){
            error(at_form(owner, "E1471", std::string("missing or non-symbol :") + key + " in " + to_string(owner), std::string("add :") + key + " <Symbol>"));
            return std::nullopt;
        }
        return it->second->text;
    }

    std::optional<std::vector<FieldSpec>> parse_fields(const form& list){
        if(list.kind != form::Kind::Vector && list.kind != form::Kind::List){
            error(at_form(list, "E1473", ":fields expects a vector, found " + to_string(list)));
            return std::nullopt;
        }
        std::vector<FieldSpec> out;
        for(auto& ff : list.elems){
            if(head_of(*ff) != "field"){
                error(at_form(*ff, "E1473", "expected (field :name n :type T), found " + to_string(*ff)));
                return std::nullopt;
            }
            auto args = parse_kwargs(*ff, {"name", "type"}, "E1473");
            if(!args) return std::nullopt;
            auto name = name_arg(*ff, *args);
            if(!name) return std::nullopt;
            auto t = args->find("type");
            if(t == args->end()){
                error(at_form(*ff, "E1473", "field " + *name + " has no :type", "add :type <type form>"));
                return std::nullopt;
            }
            try {
                out.push_back(FieldSpec{*name, parse_type_tag(*t->second)});
            } catch (const schema_error& e) {
                error(e.diagnostic());
                return std::nullopt;
            }
        }
        return out;
    }

    void define(const form& f, TypeDefinition def){
        const std::string name = def.name;
        try {
            reg_.define(std::move(def));
            r_.defined.push_back(name);
        } catch (const MalformedTypeDefinition& e) {
            Diagnostic d = e.diagnostic(); d.line = f.line; d.col = f.col;
            error(std::move(d));
        }
    }

    void declare_product(const form& f){
        auto args = parse_kwargs(f, {"name", "fields"}, "E1473");
        if(!args) return;
        auto name = name_arg(f, *args);
        if(!name) return;
        auto it = args->find("fields");
        if(it == args->end()){
            error(at_form(f, "E1472", "product " + *name + " has no :fields", "add :fields [ (field :name n :type T) ... ]"));
            return;
        }
        auto fields = parse_fields(*it->second);
        if(!fields) return;
        define(f, TypeDefinition::product(*name, std::move(*fields)));
    }

    void declare_sum(const form& f){
        auto args = parse_kwargs(f, {"name", "variants"}, "E1474");
        if(!args) return;
        auto name = name_arg(f, *args);
        if(!name) return;
        auto it = args->find("variants");
        if(it == args->end() || (it->second->kind != form::Kind::Vector && it->second->kind != form::Kind::List)){
            error(at_form(f, "E1472", "sum " + *name + " has no :variants vector", "add :variants [ (variant :name V :fields [...]) ... ]"));
            return;
        }
        std::vector<VariantSpec> variants;
        for(auto& vf : it->second->elems){
            if(head_of(*vf) != "variant"){
                error(at_form(*vf, "E1474", "expected (variant :name V ...), found " + to_string(*vf)));
                return;
            }
            auto vargs = parse_kwargs(*vf, {"name", "fields"}, "E1474");
            if(!vargs) return;
            auto vname = name_arg(*vf, *vargs);
            if(!vname) return;
            VariantSpec vs{*vname, {}};
            auto fit = vargs->find("fields");
            if(fit != vargs->end()){
                auto fields = parse_fields(*fit->second);
                if(!fields) return;
                vs.fields = std::move(*fields);
            }
            variants.push_back(std::move(vs));
        }
        define(f, TypeDefinition::sum(*name, std::move(variants)));
    }

    void check_references(){
        for(auto& name : r_.defined){
            auto def = reg_.lookup(name);
            if(!def) continue;
            for(auto& ref : def->referenced_types()){
                if(reg_.contains(ref)) continue;
                Diagnostic w = make_diag("W1480", "type " + name + " refers to undefined type " + ref, "declare " + ref + " before constructing " + name);
                if(debug_enabled()) log_debug("schema", w.message);
                r_.warnings.push_back(std::move(w));
            }
        }
    }

    // Tag-directed conversion: nested (instance ...) forms where a Ref or Rec is expected.
    value convert(const form& f, const TypeTag& tag){
        using K = TypeTag::Kind;
        switch(tag.kind){
            case K::Ref:
                if(head_of(f) == "instance") return value(build_instance(f));
                break;
            case K::Rec:
                if(head_of(f) == "instance") return value(eager_cell(value(build_instance(f))));
                break;
            case K::Seq:
                if(f.kind == form::Kind::Vector || f.kind == form::Kind::List){
                    seq s;
                    for(auto& e : f.elems) s.elems.push_back(convert(*e, *tag.elem));
                    return value(std::move(s));
                }
                break;
            case K::Map:
                if(f.kind == form::Kind::Map){
                    map_t m;
                    for(size_t i=0; i+1<f.elems.size(); i+=2) m.entries.emplace_back(convert(*f.elems[i], *tag.elem), convert(*f.elems[i+1], *tag.val));
                    return value(std::move(m));
                }
                break;
            default: break;
        }
        return form_to_value(f);
    }

    // Throws ValidationError or schema_error for nested fixtures so the outermost form reports once.
    instance_ptr build_instance(const form& f){
        kwargs args;
        for(size_t i=1; i<f.elems.size(); i+=2){
            const form& k = *f.elems[i];
            if(k.kind != form::Kind::Keyword || i+1 >= f.elems.size() || (k.text != "type" && k.text != "variant" && k.text != "fields"))
                throw schema_error(at_form(k, "E1477", "malformed instance argument " + to_string(k), "use :type T [:variant V] :fields {...}"));
            args[k.text] = f.elems[i+1];
        }
        auto t = args.find("type");
        if(t == args.end() || t->second->kind != form::Kind::Symbol)
            throw schema_error(at_form(f, "E1471", "instance without a :type symbol", "add :type <TypeName>"));
        const std::string type = t->second->text;
        auto fl = args.find("fields");
        if(fl != args.end() && fl->second->kind != form::Kind::Map)
            throw schema_error(at_form(*fl->second, "E1477", ":fields of an instance must be a map", "use {:field value ...}"));

        auto def = reg_.lookup(type);
        const VariantSpec* vs = nullptr;
        std::string variant;
        auto v = args.find("variant");
        if(v != args.end()){
            if(v->second->kind != form::Kind::Symbol)
                throw schema_error(at_form(*v->second, "E1477", ":variant must be a symbol"));
            variant = v->second->text;
            if(def) vs = def->variant(variant);
        }

        field_list fields;
        if(fl != args.end()){
            const auto& e = fl->second->elems;
            for(size_t i=0; i+1<e.size(); i+=2){
                const form& k = *e[i];
                if(k.kind != form::Kind::Keyword && k.kind != form::Kind::Symbol)
                    throw schema_error(at_form(k, "E1477", "field key must be a keyword, found " + to_string(k)));
                const FieldSpec* spec = vs ? vs->field(k.text) : (def ? def->field(k.text) : nullptr);
                fields.emplace_back(k.text, spec ? convert(*e[i+1], spec->tag) : form_to_value(*e[i+1]));
            }
        }
        if(v != args.end()) return validator_.construct_variant(type, variant, std::move(fields));
        return validator_.construct_product(type, std::move(fields));
    }

    Registry& reg_;
    const Validator& validator_;
    SchemaResult& r_;
};

} // namespace

SchemaResult load_schema(Registry& reg, const Validator& validator, std::string_view text, std::string_view source_name){
    SchemaResult r;
    std::vector<form_ptr> forms;
    try {
        forms = read_forms(text, source_name);
    } catch (const schema_error& e) {
        r.success = false;
        r.errors.push_back(e.diagnostic());
        return r;
    }
    SchemaLoader(reg, validator, r).run(forms);
    if(debug_enabled())
        log_debug("schema", std::string(source_name) + ": " + std::to_string(r.defined.size()) + " types, " + std::to_string(r.fixtures.size()) +
                  " fixtures, " + std::to_string(r.errors.size()) + " errors, " + std::to_string(r.warnings.size()) + " warnings");
    return r;
}

} // namespace alkey
