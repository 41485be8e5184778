// Value construction, validation and literal reading.
#include "deepeq/value.hpp"
#include <limits>

namespace deepeq {

namespace {

[[noreturn]] void literal_error(const form& f, const std::string& msg){
    throw value_error(where(f) + ": " + msg);
}

bool signed_in_range(BaseType b, int64_t v){
    switch(b){
        case BaseType::I8: return v >= std::numeric_limits<int8_t>::min() && v <= std::numeric_limits<int8_t>::max();
        case BaseType::I16: return v >= std::numeric_limits<int16_t>::min() && v <= std::numeric_limits<int16_t>::max();
        case BaseType::I32: return v >= std::numeric_limits<int32_t>::min() && v <= std::numeric_limits<int32_t>::max();
        default: return true;
    }
}

bool unsigned_in_range(BaseType b, uint64_t v){
    unsigned bits = base_type_bit_width(b);
    return bits >= 64 || v < (uint64_t{1} << bits);
}

} // namespace

bool is_nil(const value& v){
    if(auto s = std::get_if<sequence_data>(&v.data)) return s->storage == nullptr;
    if(auto m = std::get_if<mapping_data>(&v.data)) return m->storage == nullptr;
    if(auto r = std::get_if<reference_data>(&v.data)) return r->target == nullptr;
    if(auto d = std::get_if<dynamic_data>(&v.data)) return d->inner == nullptr;
    if(auto c = std::get_if<callable_data>(&v.data)) return !c->fn;
    return false;
}

size_t length(const value& v){
    if(auto a = std::get_if<array_data>(&v.data)) return a->elems.size();
    if(auto s = std::get_if<sequence_data>(&v.data)) return s->length;
    if(auto m = std::get_if<mapping_data>(&v.data)) return m->storage ? m->storage->size() : 0;
    return 0;
}

const value* element(const value& v, size_t i){
    if(auto a = std::get_if<array_data>(&v.data)) return i < a->elems.size() ? a->elems[i] : nullptr;
    if(auto s = std::get_if<sequence_data>(&v.data)){
        if(!s->storage || i >= s->length) return nullptr;
        return (*s->storage)[s->offset + i];
    }
    return nullptr;
}

const void* storage_identity(const value& v){
    if(auto s = std::get_if<sequence_data>(&v.data)){
        if(!s->storage) return nullptr;
        return static_cast<const void*>(s->storage->data() + s->offset);
    }
    if(auto m = std::get_if<mapping_data>(&v.data)) return m->storage;
    return nullptr;
}

bool same_key(const value* a, const value* b){
    if(!a || !b) return a == b;
    if(a->type != b->type || a->data.index() != b->data.index()) return false;
    // no identity shortcut for leaves: a NaN key is not equal to itself
    struct Visitor {
        const value& a;
        const value& b;
        bool operator()(bool x) const { return x == std::get<bool>(b.data); }
        bool operator()(int64_t x) const { return x == std::get<int64_t>(b.data); }
        bool operator()(uint64_t x) const { return x == std::get<uint64_t>(b.data); }
        bool operator()(double x) const { return x == std::get<double>(b.data); }
        bool operator()(const std::string& x) const { return x == std::get<std::string>(b.data); }
        bool operator()(const reference_data& x) const { return x.target == std::get<reference_data>(b.data).target; }
        bool operator()(const dynamic_data& x) const {
            const auto& y = std::get<dynamic_data>(b.data);
            if(!x.inner || !y.inner) return x.inner == y.inner;
            return same_key(x.inner, y.inner);
        }
        // compound keys are not hashable; only the identical node matches
        bool operator()(const array_data&) const { return &a == &b; }
        bool operator()(const sequence_data&) const { return &a == &b; }
        bool operator()(const record_data&) const { return &a == &b; }
        bool operator()(const mapping_data&) const { return &a == &b; }
        bool operator()(const callable_data&) const { return &a == &b; }
    };
    return std::visit(Visitor{*a, *b}, a->data);
}

const value* lookup(const value& mapping, const value* key){
    auto m = std::get_if<mapping_data>(&mapping.data);
    if(!m || !m->storage) return nullptr;
    for(const auto& kv : *m->storage){
        if(same_key(kv.first, key)) return kv.second;
    }
    return nullptr;
}

value* ValueContext::add(TypeId type, value_data data){
    values_.push_back(std::make_unique<value>(value{type, std::move(data)}));
    return values_.back().get();
}

const Type& ValueContext::kind_of(TypeId type, Type::Kind expected, const char* what) const {
    const Type& t = types_.at(type);
    if(t.kind != expected) throw value_error(std::string("expected ") + what + " type, got " + types_.to_string(type));
    return t;
}

void ValueContext::check_child(TypeId expected, const value* v, const std::string& role) const {
    if(v && v->type != expected)
        throw value_error(role + ": expected " + types_.to_string(expected) + " but got " + types_.to_string(v->type));
}

value* ValueContext::make_bool(bool b){ return add(types_.get_base(BaseType::Bool), b); }

value* ValueContext::make_int(TypeId type, int64_t v){
    const Type& t = types_.at(type);
    if(t.kind != Type::Kind::Base || !is_signed_base(t.base))
        throw value_error("signed integer requires a signed integer type, got " + types_.to_string(type));
    if(!signed_in_range(t.base, v))
        throw value_error(std::to_string(v) + " overflows " + types_.to_string(type));
    return add(type, v);
}

value* ValueContext::make_uint(TypeId type, uint64_t v){
    const Type& t = types_.at(type);
    if(t.kind != Type::Kind::Base || !is_unsigned_base(t.base))
        throw value_error("unsigned integer requires an unsigned integer type, got " + types_.to_string(type));
    if(!unsigned_in_range(t.base, v))
        throw value_error(std::to_string(v) + " overflows " + types_.to_string(type));
    return add(type, v);
}

value* ValueContext::make_float(TypeId type, double v){
    const Type& t = types_.at(type);
    if(t.kind != Type::Kind::Base || !is_float_base(t.base))
        throw value_error("float requires a float type, got " + types_.to_string(type));
    if(t.base == BaseType::F32) v = static_cast<double>(static_cast<float>(v));
    return add(type, v);
}

value* ValueContext::make_string(std::string s){ return add(types_.get_base(BaseType::String), std::move(s)); }

value* ValueContext::make_array(TypeId type, std::vector<value*> elems){
    const Type& t = kind_of(type, Type::Kind::Array, "array");
    if(elems.size() != t.array_size)
        throw value_error("array " + types_.to_string(type) + " given " + std::to_string(elems.size()) + " elements");
    for(size_t i=0;i<elems.size(); ++i) check_child(t.elem, elems[i], "array element " + std::to_string(i));
    return add(type, array_data{std::move(elems)});
}

value* ValueContext::make_sequence(TypeId type, std::vector<value*> elems){
    const Type& t = kind_of(type, Type::Kind::Sequence, "sequence");
    for(size_t i=0;i<elems.size(); ++i) check_child(t.elem, elems[i], "sequence element " + std::to_string(i));
    size_t n = elems.size();
    sequences_.push_back(std::make_unique<element_storage>(std::move(elems)));
    return add(type, sequence_data{sequences_.back().get(), 0, n});
}

value* ValueContext::nil_sequence(TypeId type){
    kind_of(type, Type::Kind::Sequence, "sequence");
    return add(type, sequence_data{});
}

value* ValueContext::slice(const value* seq, size_t from, size_t to){
    if(!seq) throw value_error("slice of absent value");
    auto s = std::get_if<sequence_data>(&seq->data);
    if(!s) throw value_error("slice requires a sequence, got " + types_.to_string(seq->type));
    if(from > to || to > s->length)
        throw value_error("slice bounds [" + std::to_string(from) + ":" + std::to_string(to) + "] out of range with length " + std::to_string(s->length));
    if(!s->storage) return add(seq->type, sequence_data{});
    return add(seq->type, sequence_data{s->storage, s->offset + from, to - from});
}

value* ValueContext::make_record(TypeId type, std::vector<value*> fields){
    const Type& t = kind_of(type, Type::Kind::Record, "record");
    if(!t.defined) throw value_error("record " + t.name + " is declared but not defined");
    if(fields.size() != t.fields.size())
        throw value_error("record " + t.name + " has " + std::to_string(t.fields.size()) + " fields, given " + std::to_string(fields.size()));
    for(size_t i=0;i<fields.size(); ++i) check_child(t.fields[i].type, fields[i], "field " + t.name + "." + t.fields[i].name);
    return add(type, record_data{std::move(fields)});
}

value* ValueContext::make_mapping(TypeId type, std::vector<std::pair<value*, value*>> entries){
    kind_of(type, Type::Kind::Mapping, "mapping");
    mappings_.push_back(std::make_unique<entry_storage>());
    value* m = add(type, mapping_data{mappings_.back().get()});
    for(auto& kv : entries){
        if(kv.first && lookup(*m, kv.first))
            throw value_error("duplicate mapping key of type " + types_.to_string(kv.first->type));
        insert(m, kv.first, kv.second);
    }
    return m;
}

value* ValueContext::nil_mapping(TypeId type){
    kind_of(type, Type::Kind::Mapping, "mapping");
    return add(type, mapping_data{});
}

value* ValueContext::share(const value* mapping){
    if(!mapping) throw value_error("share of absent value");
    auto m = std::get_if<mapping_data>(&mapping->data);
    if(!m) throw value_error("share requires a mapping, got " + types_.to_string(mapping->type));
    return add(mapping->type, *m);
}

value* ValueContext::make_reference(TypeId type, value* target){
    const Type& t = kind_of(type, Type::Kind::Reference, "reference");
    check_child(t.pointee, target, "reference target");
    return add(type, reference_data{target});
}

value* ValueContext::make_ref(value* target){
    if(!target) throw value_error("make_ref needs a target to derive its type");
    return make_reference(types_.get_reference(target->type), target);
}

value* ValueContext::make_dynamic(TypeId type, value* inner){
    kind_of(type, Type::Kind::Dynamic, "dynamic");
    if(inner && types_.at(inner->type).kind == Type::Kind::Dynamic)
        throw value_error("dynamic value cannot hold another dynamic value (" + types_.to_string(inner->type) + ")");
    return add(type, dynamic_data{inner});
}

value* ValueContext::make_callable(TypeId type, callable_fn fn){
    kind_of(type, Type::Kind::Callable, "callable");
    if(!fn) throw value_error("empty callable; use nil_callable for an unset one");
    return add(type, callable_data{std::make_shared<const callable_fn>(std::move(fn))});
}

value* ValueContext::nil_callable(TypeId type){
    kind_of(type, Type::Kind::Callable, "callable");
    return add(type, callable_data{});
}

value* ValueContext::zero(TypeId type){
    std::vector<TypeId> in_progress;
    return zero_impl(type, in_progress);
}

value* ValueContext::zero_impl(TypeId type, std::vector<TypeId>& in_progress){
    Type t = types_.at(type);
    switch(t.kind){
        case Type::Kind::Base:
            if(t.base == BaseType::Bool) return make_bool(false);
            if(t.base == BaseType::String) return make_string("");
            if(is_signed_base(t.base)) return make_int(type, 0);
            if(is_unsigned_base(t.base)) return make_uint(type, 0);
            if(is_float_base(t.base)) return make_float(type, 0.0);
            throw type_error("void has no zero value");
        case Type::Kind::Array: {
            std::vector<value*> elems;
            elems.reserve(t.array_size);
            for(uint64_t i=0;i<t.array_size; ++i) elems.push_back(zero_impl(t.elem, in_progress));
            return make_array(type, std::move(elems));
        }
        case Type::Kind::Sequence: return nil_sequence(type);
        case Type::Kind::Record: {
            for(auto id : in_progress)
                if(id == type) throw type_error("record " + t.name + " contains itself by value");
            in_progress.push_back(type);
            std::vector<value*> fields;
            for(const auto& f : t.fields) fields.push_back(zero_impl(f.type, in_progress));
            in_progress.pop_back();
            return make_record(type, std::move(fields));
        }
        case Type::Kind::Mapping: return nil_mapping(type);
        case Type::Kind::Reference: return nil_reference(type);
        case Type::Kind::Dynamic: return nil_dynamic(type);
        case Type::Kind::Callable: return nil_callable(type);
    }
    throw type_error("unknown type kind for " + types_.to_string(type));
}

void ValueContext::set_field(value* record, const std::string& field, value* v){
    if(!record) throw value_error("set_field on absent value");
    auto r = std::get_if<record_data>(&record->data);
    if(!r) throw value_error("set_field requires a record, got " + types_.to_string(record->type));
    auto idx = types_.field_index(record->type, field);
    if(!idx) throw value_error("record " + types_.to_string(record->type) + " has no field " + field);
    check_child(types_.at(record->type).fields[*idx].type, v, "field " + types_.to_string(record->type) + "." + field);
    r->fields[*idx] = v;
}

void ValueContext::set_element(value* arr_or_seq, size_t i, value* v){
    if(!arr_or_seq) throw value_error("set_element on absent value");
    const Type& t = types_.at(arr_or_seq->type);
    if(auto a = std::get_if<array_data>(&arr_or_seq->data)){
        if(i >= a->elems.size()) throw value_error("array index " + std::to_string(i) + " out of range");
        check_child(t.elem, v, "array element " + std::to_string(i));
        a->elems[i] = v;
        return;
    }
    if(auto s = std::get_if<sequence_data>(&arr_or_seq->data)){
        if(i >= s->length) throw value_error("sequence index " + std::to_string(i) + " out of range with length " + std::to_string(s->length));
        check_child(t.elem, v, "sequence element " + std::to_string(i));
        (*s->storage)[s->offset + i] = v;
        return;
    }
    throw value_error("set_element requires an array or sequence, got " + types_.to_string(arr_or_seq->type));
}

void ValueContext::set_target(value* ref, value* target){
    if(!ref) throw value_error("set_target on absent value");
    auto r = std::get_if<reference_data>(&ref->data);
    if(!r) throw value_error("set_target requires a reference, got " + types_.to_string(ref->type));
    check_child(types_.at(ref->type).pointee, target, "reference target");
    r->target = target;
}

void ValueContext::set_inner(value* dyn, value* inner){
    if(!dyn) throw value_error("set_inner on absent value");
    auto d = std::get_if<dynamic_data>(&dyn->data);
    if(!d) throw value_error("set_inner requires a dynamic value, got " + types_.to_string(dyn->type));
    if(inner && types_.at(inner->type).kind == Type::Kind::Dynamic)
        throw value_error("dynamic value cannot hold another dynamic value (" + types_.to_string(inner->type) + ")");
    d->inner = inner;
}

void ValueContext::insert(value* mapping, value* key, value* val){
    if(!mapping) throw value_error("insert into absent value");
    auto m = std::get_if<mapping_data>(&mapping->data);
    if(!m) throw value_error("insert requires a mapping, got " + types_.to_string(mapping->type));
    if(!m->storage) throw value_error("assignment to entry in nil mapping");
    if(!key || !val) throw value_error("mapping entries need both a key and a value");
    const Type& t = types_.at(mapping->type);
    check_child(t.key, key, "mapping key");
    check_child(t.value, val, "mapping value");
    for(auto& kv : *m->storage){
        if(same_key(kv.first, key)){ kv.second = val; return; }
    }
    m->storage->emplace_back(key, val);
}

value* ValueContext::from_form(TypeId type, const form_ptr& f){
    if(!f) throw value_error("missing literal for " + types_.to_string(type));
    Type t = types_.at(type);
    const form& lit = *f;
    bool nil = deepeq::is_nil(lit);
    switch(t.kind){
        case Type::Kind::Base: {
            if(t.base == BaseType::Bool){
                if(!std::holds_alternative<bool>(lit.data)) literal_error(lit, "expected bool literal, got " + to_string(lit));
                return make_bool(std::get<bool>(lit.data));
            }
            if(t.base == BaseType::String){
                if(!std::holds_alternative<std::string>(lit.data)) literal_error(lit, "expected string literal, got " + to_string(lit));
                return make_string(std::get<std::string>(lit.data));
            }
            if(is_float_base(t.base)){
                if(std::holds_alternative<double>(lit.data)) return make_float(type, std::get<double>(lit.data));
                if(std::holds_alternative<int64_t>(lit.data)) return make_float(type, static_cast<double>(std::get<int64_t>(lit.data)));
                literal_error(lit, "expected number literal for " + types_.to_string(type) + ", got " + to_string(lit));
            }
            if(!std::holds_alternative<int64_t>(lit.data))
                literal_error(lit, "expected integer literal for " + types_.to_string(type) + ", got " + to_string(lit));
            int64_t iv = std::get<int64_t>(lit.data);
            if(is_unsigned_base(t.base) && iv < 0)
                literal_error(lit, std::to_string(iv) + " is negative for " + types_.to_string(type));
            try {
                if(is_signed_base(t.base)) return make_int(type, iv);
                if(is_unsigned_base(t.base)) return make_uint(type, static_cast<uint64_t>(iv));
            } catch(const value_error& e){ literal_error(lit, e.what()); }
            literal_error(lit, "no literal form for " + types_.to_string(type));
        }
        case Type::Kind::Array:
        case Type::Kind::Sequence: {
            if(t.kind == Type::Kind::Sequence && nil) return nil_sequence(type);
            if(!std::holds_alternative<vector_t>(lit.data))
                literal_error(lit, "expected vector literal for " + types_.to_string(type) + ", got " + to_string(lit));
            const auto& elems = std::get<vector_t>(lit.data).elems;
            if(t.kind == Type::Kind::Array && elems.size() != t.array_size)
                literal_error(lit, "array " + types_.to_string(type) + " given " + std::to_string(elems.size()) + " elements");
            std::vector<value*> out;
            out.reserve(elems.size());
            for(const auto& e : elems) out.push_back(from_form(t.elem, e));
            return t.kind == Type::Kind::Array ? make_array(type, std::move(out)) : make_sequence(type, std::move(out));
        }
        case Type::Kind::Record: {
            if(!t.defined) literal_error(lit, "record " + t.name + " is declared but not defined");
            if(!std::holds_alternative<map>(lit.data))
                literal_error(lit, "expected {:Field value} literal for record " + t.name + ", got " + to_string(lit));
            std::vector<value*> fields(t.fields.size(), nullptr);
            for(const auto& kv : std::get<map>(lit.data).entries){
                if(!is_keyword(*kv.first)) literal_error(*kv.first, "record field names must be keywords");
                const std::string& fname = std::get<keyword>(kv.first->data).name;
                auto idx = types_.field_index(type, fname);
                if(!idx) literal_error(*kv.first, "record " + t.name + " has no field " + fname);
                if(fields[*idx]) literal_error(*kv.first, "field " + fname + " given twice");
                fields[*idx] = from_form(t.fields[*idx].type, kv.second);
            }
            for(size_t i=0;i<fields.size(); ++i)
                if(!fields[i]) fields[i] = zero(t.fields[i].type);
            return make_record(type, std::move(fields));
        }
        case Type::Kind::Mapping: {
            if(nil) return nil_mapping(type);
            if(!std::holds_alternative<map>(lit.data))
                literal_error(lit, "expected map literal for " + types_.to_string(type) + ", got " + to_string(lit));
            value* m = make_mapping(type);
            for(const auto& kv : std::get<map>(lit.data).entries){
                value* k = from_form(t.key, kv.first);
                if(lookup(*m, k)) literal_error(*kv.first, "duplicate mapping key " + to_string(kv.first));
                insert(m, k, from_form(t.value, kv.second));
            }
            return m;
        }
        case Type::Kind::Reference:
            if(nil) return nil_reference(type);
            return make_reference(type, from_form(t.pointee, f));
        case Type::Kind::Dynamic:
            if(nil) return nil_dynamic(type);
            return dynamic_from_form(type, f);
        case Type::Kind::Callable:
            if(nil) return nil_callable(type);
            literal_error(lit, "callables have no literal form");
    }
    literal_error(lit, "unsupported literal for " + types_.to_string(type));
}

value* ValueContext::dynamic_from_form(TypeId type, const form_ptr& f){
    const form& lit = *f;
    if(auto tv = std::get_if<tagged>(&lit.data)){
        TypeId concrete = types_.parse_type(std::make_shared<form>(form{tv->tag, lit.line, lit.col}));
        return make_dynamic(type, from_form(concrete, tv->inner));
    }
    if(std::holds_alternative<bool>(lit.data)) return make_dynamic(type, make_bool(std::get<bool>(lit.data)));
    if(std::holds_alternative<int64_t>(lit.data)) return make_dynamic(type, make_i64(std::get<int64_t>(lit.data)));
    if(std::holds_alternative<double>(lit.data)) return make_dynamic(type, make_f64(std::get<double>(lit.data)));
    if(std::holds_alternative<std::string>(lit.data)) return make_dynamic(type, make_string(std::get<std::string>(lit.data)));
    literal_error(lit, "dynamic literal " + to_string(lit) + " needs a #Type tag");
}

} // namespace deepeq
