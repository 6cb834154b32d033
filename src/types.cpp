#include "alkey/types.hpp"
#include <algorithm>

namespace alkey {

TypeTag scalar_tag(TypeTag::Kind k){ TypeTag t; t.kind = k; return t; }
TypeTag ref_tag(std::string type_name){ TypeTag t; t.kind = TypeTag::Kind::Ref; t.type_name = std::move(type_name); return t; }
TypeTag rec_tag(std::string type_name){ TypeTag t; t.kind = TypeTag::Kind::Rec; t.type_name = std::move(type_name); return t; }
TypeTag seq_tag(TypeTag elem){
    TypeTag t; t.kind = TypeTag::Kind::Seq;
    t.elem = std::make_shared<const TypeTag>(std::move(elem));
    return t;
}
TypeTag map_tag(TypeTag key, TypeTag val){
    TypeTag t; t.kind = TypeTag::Kind::Map;
    t.elem = std::make_shared<const TypeTag>(std::move(key));
    t.val = std::make_shared<const TypeTag>(std::move(val));
    return t;
}

std::optional<TypeTag> scalar_tag_named(std::string_view name){
    using K = TypeTag::Kind;
    if(name == "nil") return scalar_tag(K::Nil);
    if(name == "bool") return scalar_tag(K::Bool);
    if(name == "int" || name == "i64") return scalar_tag(K::Int);
    if(name == "float" || name == "f64") return scalar_tag(K::Float);
    if(name == "string") return scalar_tag(K::String);
    if(name == "keyword") return scalar_tag(K::Keyword);
    return std::nullopt;
}

static bool same_ptr_tag(const std::shared_ptr<const TypeTag>& a, const std::shared_ptr<const TypeTag>& b){
    if(a == b) return true;
    if(!a || !b) return false;
    return *a == *b;
}

bool operator==(const TypeTag& a, const TypeTag& b){
    if(a.kind != b.kind) return false;
    switch(a.kind){
        case TypeTag::Kind::Ref:
        case TypeTag::Kind::Rec: return a.type_name == b.type_name;
        case TypeTag::Kind::Seq: return same_ptr_tag(a.elem, b.elem);
        case TypeTag::Kind::Map: return same_ptr_tag(a.elem, b.elem) && same_ptr_tag(a.val, b.val);
        default: return true;
    }
}

const FieldSpec* VariantSpec::field(std::string_view n) const {
    auto it = std::find_if(fields.begin(), fields.end(), [&](const FieldSpec& f){ return f.name == n; });
    return it == fields.end() ? nullptr : &*it;
}

TypeDefinition TypeDefinition::product(std::string name, std::vector<FieldSpec> fields){
    TypeDefinition d; d.name = std::move(name); d.kind = TypeKind::Product; d.fields = std::move(fields);
    return d;
}

TypeDefinition TypeDefinition::sum(std::string name, std::vector<VariantSpec> variants){
    TypeDefinition d; d.name = std::move(name); d.kind = TypeKind::Sum; d.variants = std::move(variants);
    return d;
}

const VariantSpec* TypeDefinition::variant(std::string_view n) const {
    auto it = std::find_if(variants.begin(), variants.end(), [&](const VariantSpec& v){ return v.name == n; });
    return it == variants.end() ? nullptr : &*it;
}

const FieldSpec* TypeDefinition::field(std::string_view n) const {
    auto it = std::find_if(fields.begin(), fields.end(), [&](const FieldSpec& f){ return f.name == n; });
    return it == fields.end() ? nullptr : &*it;
}

static void collect_refs(const TypeTag& t, std::vector<std::string>& out){
    switch(t.kind){
        case TypeTag::Kind::Ref:
        case TypeTag::Kind::Rec:
            if(std::find(out.begin(), out.end(), t.type_name) == out.end()) out.push_back(t.type_name);
            break;
        case TypeTag::Kind::Seq: if(t.elem) collect_refs(*t.elem, out); break;
        case TypeTag::Kind::Map: if(t.elem) collect_refs(*t.elem, out); if(t.val) collect_refs(*t.val, out); break;
        default: break;
    }
}

std::vector<std::string> TypeDefinition::referenced_types() const {
    std::vector<std::string> out;
    for(auto& f : fields) collect_refs(f.tag, out);
    for(auto& v : variants) for(auto& f : v.fields) collect_refs(f.tag, out);
    return out;
}

const char* to_string(TypeKind k){ return k == TypeKind::Product ? "product" : "sum"; }

std::string to_string(const TypeTag& t){
    switch(t.kind){
        case TypeTag::Kind::Nil: return "nil";
        case TypeTag::Kind::Bool: return "bool";
        case TypeTag::Kind::Int: return "int";
        case TypeTag::Kind::Float: return "float";
        case TypeTag::Kind::String: return "string";
        case TypeTag::Kind::Keyword: return "keyword";
        case TypeTag::Kind::Ref: return t.type_name;
        case TypeTag::Kind::Rec: return "(rec " + t.type_name + ")";
        case TypeTag::Kind::Seq: return "(seq " + (t.elem ? to_string(*t.elem) : std::string("?")) + ")";
        case TypeTag::Kind::Map:
            return "(map " + (t.elem ? to_string(*t.elem) : std::string("?")) + " " + (t.val ? to_string(*t.val) : std::string("?")) + ")";
    }
    return "<bad-tag>";
}

static std::string fields_to_string(const std::vector<FieldSpec>& fs){
    std::string s = "[";
    for(size_t i=0;i<fs.size(); ++i){
        if(i) s += " ";
        s += "(field :name " + fs[i].name + " :type " + to_string(fs[i].tag) + ")";
    }
    return s + "]";
}

// Printed in the same form the schema loader reads.
std::string to_string(const TypeDefinition& d){
    if(d.kind == TypeKind::Product)
        return "(product :name " + d.name + " :fields " + fields_to_string(d.fields) + ")";
    std::string s = "(sum :name " + d.name + " :variants [";
    for(size_t i=0;i<d.variants.size(); ++i){
        if(i) s += " ";
        s += "(variant :name " + d.variants[i].name + " :fields " + fields_to_string(d.variants[i].fields) + ")";
    }
    return s + "])";
}

} // namespace alkey
