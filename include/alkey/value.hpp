// value.hpp - Closed tagged representation of field values and instances
#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace alkey
{

    template <typename T>
    class RecursionCell;

    struct value;
    struct Instance;

    using instance_ptr = std::shared_ptr<const Instance>;
    using cell_ptr = std::shared_ptr<RecursionCell<value>>;

    struct keyword
    {
        std::string name;
    };
    struct seq
    {
        std::vector<value> elems;
    };
    struct map_t
    {
        std::vector<std::pair<value, value>> entries;
    };

    using value_data = std::variant<std::monostate, bool, int64_t, double, std::string, keyword, seq, map_t, instance_ptr, cell_ptr>;

    struct value
    {
        value_data data;

        value() = default;
        value(bool b) : data(b) {}
        value(int i) : data(int64_t{i}) {}
        value(int64_t i) : data(i) {}
        value(double d) : data(d) {}
        value(const char *s) : data(std::string(s)) {}
        value(std::string s) : data(std::move(s)) {}
        value(keyword k) : data(std::move(k)) {}
        value(seq s) : data(std::move(s)) {}
        value(map_t m) : data(std::move(m)) {}
        value(instance_ptr p) : data(std::move(p)) {}
        value(cell_ptr c) : data(std::move(c)) {}

        bool is_nil() const { return std::holds_alternative<std::monostate>(data); }
        template <typename T>
        bool is() const { return std::holds_alternative<T>(data); }
        // Throws std::bad_variant_access on mismatch.
        template <typename T>
        const T &as() const { return std::get<T>(data); }
    };

    // Ordered (declaration order) field list used both for construction input and instance storage.
    using field_list = std::vector<std::pair<std::string, value>>;

    struct Instance
    {
        std::string type_name;
        std::optional<std::string> variant; // engaged for sum instances only
        field_list fields;
        uint64_t revision = 0;              // registry revision the instance was validated against

        const value *find(std::string_view name) const;
        // Throws std::out_of_range when the field is absent.
        const value &at(std::string_view name) const;
        bool is_variant(std::string_view v) const { return variant && *variant == v; }
    };

    inline value kw(std::string name) { return value(keyword{std::move(name)}); }
    inline value make_seq(std::vector<value> elems) { return value(seq{std::move(elems)}); }

    // Short description of the dynamic kind of a value ("int", "instance Option", ...).
    std::string describe(const value &v);

    // Structural equality. Cells compare by identity, or by forced value when both are forced.
    bool equal(const value &a, const value &b);
    bool equal(const Instance &a, const Instance &b);

    // EDN-like printing. Pending lazy cells print as #lazy<id> and are never forced here.
    std::string to_string(const value &v);
    std::string to_string(const Instance &i);

} // namespace alkey
