// Arena-owned runtime values walked by the comparator.
#pragma once
#include "deepeq/types.hpp"
#include "deepeq/form.hpp"
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace deepeq
{

    struct value_error : std::runtime_error
    {
        using std::runtime_error::runtime_error;
    };

    struct value;

    using element_storage = std::vector<value *>;
    using entry_storage = std::vector<std::pair<value *, value *>>;
    using callable_fn = std::function<const value *(const std::vector<const value *> &)>;

    struct array_data
    {
        std::vector<value *> elems;
    };
    // Header over shared element storage; storage == nullptr is a nil sequence.
    struct sequence_data
    {
        element_storage *storage = nullptr;
        size_t offset = 0;
        size_t length = 0;
    };
    struct record_data
    {
        std::vector<value *> fields;
    };
    // Header over shared entry storage; storage == nullptr is a nil mapping.
    struct mapping_data
    {
        entry_storage *storage = nullptr;
    };
    struct reference_data
    {
        value *target = nullptr;
    };
    struct dynamic_data
    {
        value *inner = nullptr;
    };
    struct callable_data
    {
        std::shared_ptr<const callable_fn> fn;
    };

    using value_data = std::variant<bool, int64_t, uint64_t, double, std::string, array_data, sequence_data, record_data, mapping_data, reference_data, dynamic_data, callable_data>;

    struct value
    {
        TypeId type;
        value_data data;
    };

    // Nil-ness of a sequence, mapping, reference, dynamic or callable value.
    bool is_nil(const value &v);
    // Number of elements/entries for arrays, sequences and mappings; 0 otherwise.
    size_t length(const value &v);
    // Element i of an array or sequence (nullptr if unset).
    const value *element(const value &v, size_t i);
    // Identity of the storage behind a sequence or mapping, nullptr when nil.
    const void *storage_identity(const value &v);
    // Key equality used by mappings: same type, payload ==, references by target.
    bool same_key(const value *a, const value *b);
    // Entry value for key, or nullptr when absent (NaN keys are never found).
    const value *lookup(const value &mapping, const value *key);

    class ValueContext
    {
    public:
        explicit ValueContext(TypeContext &types) : types_(types) {}
        ValueContext(const ValueContext &) = delete;
        ValueContext &operator=(const ValueContext &) = delete;

        TypeContext &types() { return types_; }
        const TypeContext &types() const { return types_; }
        size_t size() const { return values_.size(); }

        // scalars
        value *make_bool(bool b);
        value *make_int(TypeId type, int64_t v);
        value *make_uint(TypeId type, uint64_t v);
        value *make_float(TypeId type, double v);
        value *make_string(std::string s);
        value *make_i64(int64_t v) { return make_int(types_.get_base(BaseType::I64), v); }
        value *make_f64(double v) { return make_float(types_.get_base(BaseType::F64), v); }

        // compounds
        value *make_array(TypeId type, std::vector<value *> elems);
        value *make_sequence(TypeId type, std::vector<value *> elems);
        value *nil_sequence(TypeId type);
        value *slice(const value *seq, size_t from, size_t to);
        value *make_record(TypeId type, std::vector<value *> fields);
        value *make_mapping(TypeId type, std::vector<std::pair<value *, value *>> entries = {});
        value *nil_mapping(TypeId type);
        value *share(const value *mapping);
        value *make_reference(TypeId type, value *target);
        value *make_ref(value *target);
        value *nil_reference(TypeId type) { return make_reference(type, nullptr); }
        value *make_dynamic(TypeId type, value *inner);
        value *nil_dynamic(TypeId type) { return make_dynamic(type, nullptr); }
        value *make_callable(TypeId type, callable_fn fn);
        value *nil_callable(TypeId type);
        value *zero(TypeId type);

        // mutation (used to close cycles)
        void set_field(value *record, const std::string &field, value *v);
        void set_element(value *arr_or_seq, size_t i, value *v);
        void set_target(value *ref, value *target);
        void set_inner(value *dyn, value *inner);
        void insert(value *mapping, value *key, value *val);

        // literals
        value *from_form(TypeId type, const form_ptr &f);
        value *read(TypeId type, std::string_view src) { return from_form(type, parse(src)); }
        value *read(std::string_view type_src, std::string_view src) { return read(types_.parse_type(type_src), src); }

    private:
        value *add(TypeId type, value_data data);
        const Type &kind_of(TypeId type, Type::Kind expected, const char *what) const;
        void check_child(TypeId expected, const value *v, const std::string &role) const;
        value *zero_impl(TypeId type, std::vector<TypeId> &in_progress);
        value *dynamic_from_form(TypeId type, const form_ptr &f);

        TypeContext &types_;
        std::vector<std::unique_ptr<value>> values_;
        std::vector<std::unique_ptr<element_storage>> sequences_;
        std::vector<std::unique_ptr<entry_storage>> mappings_;
    };

} // namespace deepeq
