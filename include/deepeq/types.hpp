// Interned runtime type descriptors for compared values.
#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <unordered_map>
#include <optional>
#include <tuple>
#include <stdexcept>
#include "deepeq/form.hpp"

namespace deepeq
{

    struct type_error : std::runtime_error
    {
        using std::runtime_error::runtime_error;
    };

    using TypeId = uint32_t;

    enum class BaseType
    {
        Bool,
        I8,
        I16,
        I32,
        I64,
        U8,
        U16,
        U32,
        U64,
        F32,
        F64,
        String,
        Void
    };

    struct FieldType
    {
        std::string name;
        TypeId type;
    };

    struct Type
    {
        enum class Kind
        {
            Base,
            Array,
            Sequence,
            Record,
            Mapping,
            Reference,
            Dynamic,
            Callable
        } kind;
        BaseType base{};                // Base
        TypeId elem{0};                 // Array, Sequence
        uint64_t array_size{0};         // Array
        std::string name;               // Record, Dynamic
        std::vector<FieldType> fields;  // Record
        bool defined{false};            // Record
        TypeId key{0};                  // Mapping
        TypeId value{0};                // Mapping
        TypeId pointee{0};              // Reference
        std::vector<TypeId> params;     // Callable
        TypeId ret{0};                  // Callable
        bool variadic{false};           // Callable
    };

    class TypeContext
    {
    public:
        TypeContext()
        { // seed base types so their ids are stable across contexts
            for (int b = 0; b <= static_cast<int>(BaseType::Void); ++b)
                get_base(static_cast<BaseType>(b));
        }

        TypeId get_base(BaseType b)
        {
            auto key = static_cast<int>(b);
            auto it = base_index_.find(key);
            if (it != base_index_.end())
                return it->second;
            Type t{};
            t.kind = Type::Kind::Base;
            t.base = b;
            TypeId id = add_type(std::move(t));
            base_index_[key] = id;
            return id;
        }
        TypeId get_array(TypeId elem, uint64_t size)
        {
            require_value_type(elem, "array element");
            auto key = std::make_pair(elem, size);
            auto it = array_cache_.find(key);
            if (it != array_cache_.end())
                return it->second;
            Type t{};
            t.kind = Type::Kind::Array;
            t.elem = elem;
            t.array_size = size;
            TypeId id = add_type(std::move(t));
            array_cache_[key] = id;
            return id;
        }
        TypeId get_sequence(TypeId elem)
        {
            require_value_type(elem, "sequence element");
            auto it = seq_cache_.find(elem);
            if (it != seq_cache_.end())
                return it->second;
            Type t{};
            t.kind = Type::Kind::Sequence;
            t.elem = elem;
            TypeId id = add_type(std::move(t));
            seq_cache_[elem] = id;
            return id;
        }
        TypeId get_mapping(TypeId key, TypeId value)
        {
            require_value_type(value, "mapping value");
            const Type &kt = at(key);
            bool comparable = (kt.kind == Type::Kind::Base && kt.base != BaseType::Void) || kt.kind == Type::Kind::Reference || kt.kind == Type::Kind::Dynamic;
            if (!comparable)
                throw type_error("invalid mapping key type " + to_string(key));
            auto k = std::make_pair(key, value);
            auto it = map_cache_.find(k);
            if (it != map_cache_.end())
                return it->second;
            Type t{};
            t.kind = Type::Kind::Mapping;
            t.key = key;
            t.value = value;
            TypeId id = add_type(std::move(t));
            map_cache_[k] = id;
            return id;
        }
        TypeId get_reference(TypeId to)
        {
            require_value_type(to, "reference target");
            auto it = ptr_cache_.find(to);
            if (it != ptr_cache_.end())
                return it->second;
            Type t{};
            t.kind = Type::Kind::Reference;
            t.pointee = to;
            TypeId id = add_type(std::move(t));
            ptr_cache_[to] = id;
            return id;
        }
        TypeId get_dynamic(const std::string &name = "any")
        {
            auto it = dyn_cache_.find(name);
            if (it != dyn_cache_.end())
                return it->second;
            Type t{};
            t.kind = Type::Kind::Dynamic;
            t.name = name;
            TypeId id = add_type(std::move(t));
            dyn_cache_[name] = id;
            return id;
        }
        TypeId get_callable(const std::vector<TypeId> &params, TypeId ret, bool variadic = false)
        {
            for (auto p : params)
                require_value_type(p, "callable parameter");
            auto key = std::make_tuple(params, ret, variadic);
            auto it = fn_cache_.find(key);
            if (it != fn_cache_.end())
                return it->second;
            Type t{};
            t.kind = Type::Kind::Callable;
            t.params = params;
            t.ret = ret;
            t.variadic = variadic;
            TypeId id = add_type(std::move(t));
            fn_cache_[key] = id;
            return id;
        }
        // Nominal: the same name always yields the same id. Undefined until define_record.
        TypeId get_record(const std::string &name)
        {
            auto it = record_cache_.find(name);
            if (it != record_cache_.end())
                return it->second;
            Type t{};
            t.kind = Type::Kind::Record;
            t.name = name;
            TypeId id = add_type(std::move(t));
            record_cache_[name] = id;
            return id;
        }
        TypeId define_record(const std::string &name, std::vector<FieldType> fields)
        {
            TypeId id = get_record(name);
            Type &t = types_.at(id);
            if (t.defined)
                throw type_error("record " + name + " redefined");
            for (size_t i = 0; i < fields.size(); ++i)
            {
                require_value_type(fields[i].type, "field " + fields[i].name);
                for (size_t j = 0; j < i; ++j)
                    if (fields[j].name == fields[i].name)
                        throw type_error("record " + name + " has duplicate field " + fields[i].name);
            }
            t.fields = std::move(fields);
            t.defined = true;
            return id;
        }

        const Type &at(TypeId id) const
        {
            if (id >= types_.size())
                throw type_error("unknown type id " + std::to_string(id));
            return types_[id];
        }
        size_t size() const { return types_.size(); }
        bool is_defined(TypeId record) const { return at(record).kind != Type::Kind::Record || at(record).defined; }
        std::optional<size_t> field_index(TypeId record, const std::string &field) const
        {
            const Type &t = at(record);
            for (size_t i = 0; i < t.fields.size(); ++i)
                if (t.fields[i].name == field)
                    return i;
            return std::nullopt;
        }
        bool is_float(TypeId id) const
        {
            const Type &t = at(id);
            return t.kind == Type::Kind::Base && (t.base == BaseType::F32 || t.base == BaseType::F64);
        }

        std::string to_string(TypeId id) const
        {
            const Type &t = at(id);
            switch (t.kind)
            {
            case Type::Kind::Base:
                return base_name(t.base);
            case Type::Kind::Array:
                return "[" + std::to_string(t.array_size) + "]" + to_string(t.elem);
            case Type::Kind::Sequence:
                return "[]" + to_string(t.elem);
            case Type::Kind::Record:
                return t.name;
            case Type::Kind::Mapping:
                return "map[" + to_string(t.key) + "]" + to_string(t.value);
            case Type::Kind::Reference:
                return "*" + to_string(t.pointee);
            case Type::Kind::Dynamic:
                return t.name;
            case Type::Kind::Callable:
            {
                std::string s = "fn(";
                for (size_t i = 0; i < t.params.size(); ++i)
                {
                    if (i)
                        s += ", ";
                    s += to_string(t.params[i]);
                }
                if (t.variadic)
                {
                    if (!t.params.empty())
                        s += ", ";
                    s += "...";
                }
                s += ")";
                if (!(at(t.ret).kind == Type::Kind::Base && at(t.ret).base == BaseType::Void))
                    s += " " + to_string(t.ret);
                return s;
            }
            }
            return "<bad-type>";
        }

        // Parse an EDN type form -> TypeId
        TypeId parse_type(const form_ptr &n)
        {
            if (!n)
                throw type_error("missing type form");
            if (auto sym = as_symbol(*n))
            {
                const std::string &name = sym->name;
                static const std::pair<const char *, BaseType> bases[] = {
                    {"bool", BaseType::Bool}, {"i8", BaseType::I8}, {"i16", BaseType::I16}, {"i32", BaseType::I32}, {"i64", BaseType::I64}, {"u8", BaseType::U8}, {"u16", BaseType::U16}, {"u32", BaseType::U32}, {"u64", BaseType::U64}, {"f32", BaseType::F32}, {"f64", BaseType::F64}, {"string", BaseType::String}, {"void", BaseType::Void}};
                for (auto &b : bases)
                    if (name == b.first)
                        return get_base(b.second);
                if (name == "any")
                    return get_dynamic();
                // Fallback: treat as named record ref
                return get_record(name);
            }
            auto l = as_list(*n);
            if (!l)
                throw type_error(where(*n) + ": unsupported type form " + deepeq::to_string(*n));
            std::string head = head_name(*n);
            if (head.empty())
                throw type_error(where(*n) + ": type head must be symbol");
            const auto &e = l->elems;
            if (head == "ptr")
            {
                // (ptr <type>) or (ptr :to <type>)
                if (e.size() == 2)
                    return get_reference(parse_type(e[1]));
                if (e.size() == 3 && is_keyword(*e[1]) && std::get<keyword>(e[1]->data).name == "to")
                    return get_reference(parse_type(e[2]));
                throw type_error(where(*n) + ": ptr form invalid");
            }
            if (head == "seq")
            {
                if (e.size() != 2)
                    throw type_error(where(*n) + ": seq requires one element type");
                return get_sequence(parse_type(e[1]));
            }
            if (head == "map")
            {
                if (e.size() != 3)
                    throw type_error(where(*n) + ": map requires key and value types");
                TypeId k = parse_type(e[1]);
                return get_mapping(k, parse_type(e[2]));
            }
            if (head == "iface")
            {
                std::string name;
                if (e.size() != 2 || !name_of(*e[1], name))
                    throw type_error(where(*n) + ": iface requires a name");
                return get_dynamic(name);
            }
            if (head == "record-ref")
            {
                if (e.size() != 2 || !is_symbol(*e[1]))
                    throw type_error(where(*n) + ": record-ref requires name symbol");
                return get_record(std::get<symbol>(e[1]->data).name);
            }
            if (head == "fn-type")
            {
                // (fn-type :params [<types>*] :ret <type> [:variadic true]?)
                std::vector<TypeId> params;
                TypeId ret = get_base(BaseType::Void);
                bool variadic = false;
                for (size_t i = 1; i < e.size(); ++i)
                {
                    if (!is_keyword(*e[i]))
                        throw type_error(where(*e[i]) + ": expected keyword in fn-type");
                    std::string kw = std::get<keyword>(e[i]->data).name;
                    if (++i >= e.size())
                        throw type_error(where(*n) + ": keyword :" + kw + " missing value");
                    const auto &val = e[i];
                    if (kw == "params")
                    {
                        if (!std::holds_alternative<vector_t>(val->data))
                            throw type_error(where(*val) + ": fn-type :params expects vector");
                        for (auto &p : std::get<vector_t>(val->data).elems)
                            params.push_back(parse_type(p));
                    }
                    else if (kw == "ret")
                        ret = parse_type(val);
                    else if (kw == "variadic")
                    {
                        if (!std::holds_alternative<bool>(val->data))
                            throw type_error(where(*val) + ": :variadic expects bool");
                        variadic = std::get<bool>(val->data);
                    }
                    else
                        throw type_error(where(*e[i - 1]) + ": unknown fn-type keyword :" + kw);
                }
                return get_callable(params, ret, variadic);
            }
            if (head == "array")
            {
                // (array :elem <type> :size <int>)
                TypeId elem_id = 0;
                uint64_t sz = 0;
                bool have_elem = false, have_size = false;
                for (size_t i = 1; i < e.size(); ++i)
                {
                    if (!is_keyword(*e[i]))
                        throw type_error(where(*e[i]) + ": expected keyword in array");
                    std::string kw = std::get<keyword>(e[i]->data).name;
                    if (++i >= e.size())
                        throw type_error(where(*n) + ": array keyword :" + kw + " missing value");
                    const auto &val = e[i];
                    if (kw == "elem")
                    {
                        elem_id = parse_type(val);
                        have_elem = true;
                    }
                    else if (kw == "size")
                    {
                        if (!std::holds_alternative<int64_t>(val->data) || std::get<int64_t>(val->data) < 0)
                            throw type_error(where(*val) + ": array :size expects non-negative int");
                        sz = static_cast<uint64_t>(std::get<int64_t>(val->data));
                        have_size = true;
                    }
                    else
                        throw type_error(where(*e[i - 1]) + ": unknown array keyword :" + kw);
                }
                if (!have_elem || !have_size)
                    throw type_error(where(*n) + ": array requires :elem and :size");
                return get_array(elem_id, sz);
            }
            throw type_error(where(*n) + ": unknown type form " + head);
        }
        TypeId parse_type(std::string_view src) { return parse_type(parse(src)); }

        // (record :name N :fields [(field :name F :type T)*]) or (types <decl>*)
        void declare(const form_ptr &n)
        {
            std::string head = n ? head_name(*n) : std::string();
            if (head == "types")
            {
                const auto &e = as_list(*n)->elems;
                for (size_t i = 1; i < e.size(); ++i)
                    declare(e[i]);
                return;
            }
            if (head != "record")
                throw type_error((n ? where(*n) + ": " : std::string()) + "expected (record ...) or (types ...) declaration");
            const auto &e = as_list(*n)->elems;
            std::string name;
            form_ptr fields_form;
            for (size_t i = 1; i < e.size(); ++i)
            {
                if (!is_keyword(*e[i]))
                    throw type_error(where(*e[i]) + ": expected keyword in record");
                std::string kw = std::get<keyword>(e[i]->data).name;
                if (++i >= e.size())
                    throw type_error(where(*n) + ": record keyword :" + kw + " missing value");
                if (kw == "name")
                {
                    if (!name_of(*e[i], name))
                        throw type_error(where(*e[i]) + ": record :name expects symbol or string");
                }
                else if (kw == "fields")
                    fields_form = e[i];
                else
                    throw type_error(where(*e[i - 1]) + ": unknown record keyword :" + kw);
            }
            if (name.empty())
                throw type_error(where(*n) + ": record missing :name");
            if (!fields_form || !std::holds_alternative<vector_t>(fields_form->data))
                throw type_error(where(*n) + ": record " + name + " missing :fields vector");
            get_record(name); // fields may refer to the record itself
            std::vector<FieldType> fields;
            for (auto &f : std::get<vector_t>(fields_form->data).elems)
            {
                if (head_name(*f) != "field")
                    throw type_error(where(*f) + ": record field must be (field :name F :type T)");
                const auto &fl = as_list(*f)->elems;
                std::string fname;
                form_ptr ftype;
                for (size_t k = 1; k + 1 < fl.size(); k += 2)
                {
                    if (!is_keyword(*fl[k]))
                        break;
                    std::string kw = std::get<keyword>(fl[k]->data).name;
                    if (kw == "name")
                        name_of(*fl[k + 1], fname);
                    else if (kw == "type")
                        ftype = fl[k + 1];
                }
                if (fname.empty() || !ftype)
                    throw type_error(where(*f) + ": field requires :name and :type");
                fields.push_back(FieldType{fname, parse_type(ftype)});
            }
            define_record(name, std::move(fields));
        }
        void declare(std::string_view src) { declare(parse(src)); }

    private:
        void require_value_type(TypeId id, const std::string &role) const
        {
            const Type &t = at(id);
            if (t.kind == Type::Kind::Base && t.base == BaseType::Void)
                throw type_error(role + " cannot be void");
        }

        struct FnKeyHash
        {
            size_t operator()(const std::tuple<std::vector<TypeId>, TypeId, bool> &k) const noexcept
            {
                size_t h = std::hash<TypeId>{}(std::get<1>(k)) ^ (std::get<2>(k) ? 0x9e3779b97f4a7c15ull : 0);
                for (auto t : std::get<0>(k))
                    h ^= (std::hash<TypeId>{}(t) + 0x9e3779b97f4a7c15ull + (h << 6) + (h >> 2));
                return h;
            }
        };
        struct PairHash
        {
            template <typename A, typename B>
            size_t operator()(const std::pair<A, B> &p) const noexcept { return std::hash<A>{}(p.first) ^ (std::hash<B>{}(p.second) << 1); }
        };

        TypeId add_type(Type t)
        {
            TypeId id = static_cast<TypeId>(types_.size());
            types_.push_back(std::move(t));
            return id;
        }
        static std::string base_name(BaseType b)
        {
            switch (b)
            {
            case BaseType::Bool:
                return "bool";
            case BaseType::I8:
                return "i8";
            case BaseType::I16:
                return "i16";
            case BaseType::I32:
                return "i32";
            case BaseType::I64:
                return "i64";
            case BaseType::U8:
                return "u8";
            case BaseType::U16:
                return "u16";
            case BaseType::U32:
                return "u32";
            case BaseType::U64:
                return "u64";
            case BaseType::F32:
                return "f32";
            case BaseType::F64:
                return "f64";
            case BaseType::String:
                return "string";
            case BaseType::Void:
                return "void";
            }
            return "?";
        }

        std::vector<Type> types_;
        std::unordered_map<int, TypeId> base_index_;
        std::unordered_map<std::pair<TypeId, uint64_t>, TypeId, PairHash> array_cache_;
        std::unordered_map<TypeId, TypeId> seq_cache_;
        std::unordered_map<std::pair<TypeId, TypeId>, TypeId, PairHash> map_cache_;
        std::unordered_map<TypeId, TypeId> ptr_cache_;
        std::unordered_map<std::string, TypeId> dyn_cache_;
        std::unordered_map<std::string, TypeId> record_cache_;
        std::unordered_map<std::tuple<std::vector<TypeId>, TypeId, bool>, TypeId, FnKeyHash> fn_cache_;
    };

} // namespace deepeq

// ---- category helpers (header-only for inlining) ----
namespace deepeq
{
    inline bool is_signed_base(BaseType b)
    {
        switch (b)
        {
        case BaseType::I8:
        case BaseType::I16:
        case BaseType::I32:
        case BaseType::I64:
            return true;
        default:
            return false;
        }
    }
    inline bool is_unsigned_base(BaseType b)
    {
        switch (b)
        {
        case BaseType::U8:
        case BaseType::U16:
        case BaseType::U32:
        case BaseType::U64:
            return true;
        default:
            return false;
        }
    }
    inline unsigned base_type_bit_width(BaseType b)
    {
        switch (b)
        {
        case BaseType::Bool:
            return 1;
        case BaseType::I8:
        case BaseType::U8:
            return 8;
        case BaseType::I16:
        case BaseType::U16:
            return 16;
        case BaseType::I32:
        case BaseType::U32:
        case BaseType::F32:
            return 32;
        case BaseType::I64:
        case BaseType::U64:
        case BaseType::F64:
            return 64;
        case BaseType::String:
        case BaseType::Void:
            return 0;
        }
        return 0;
    }
    inline bool is_float_base(BaseType b) { return b == BaseType::F32 || b == BaseType::F64; }
}
