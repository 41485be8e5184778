// Structural comparison: entry guard, recursive walker, cycle detector and trace building.
#include "deepeq/compare.hpp"
#include "deepeq/diagnostics_json.hpp"
#include "deepeq/render.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <functional>

namespace deepeq {

namespace {

bool addressable_compound(Type::Kind k){
    switch(k){
        case Type::Kind::Array:
        case Type::Kind::Sequence:
        case Type::Kind::Record:
        case Type::Kind::Mapping:
            return true;
        default:
            return false;
    }
}

Divergence make_divergence(DivergenceKind kind, Side side, std::string first, std::string second, int depth){
    Divergence d{kind};
    d.side = side;
    d.first = std::move(first);
    d.second = std::move(second);
    d.depth = depth;
    return d;
}

// Payload equality for two leaves already known to share a type.
bool leaf_payload_equal(const value& a, const value& b){
    if(a.data.index() != b.data.index()) return false;
    if(auto x = std::get_if<bool>(&a.data)) return *x == std::get<bool>(b.data);
    if(auto x = std::get_if<int64_t>(&a.data)) return *x == std::get<int64_t>(b.data);
    if(auto x = std::get_if<uint64_t>(&a.data)) return *x == std::get<uint64_t>(b.data);
    if(auto x = std::get_if<double>(&a.data)) return *x == std::get<double>(b.data);
    if(auto x = std::get_if<std::string>(&a.data)) return *x == std::get<std::string>(b.data);
    return false;
}

std::optional<Divergence> wrap(std::optional<Divergence> d, PathSegment seg){
    if(d) d->path.push_back(std::move(seg));
    return d;
}

} // namespace

Divergence Comparator::absence(const value* a, const value* b, int depth) const {
    bool first_absent = !a || is_nil(*a);
    return make_divergence(DivergenceKind::AbsenceMismatch, first_absent ? Side::First : Side::Second,
        first_absent ? "<nil>" : render(types_, a),
        first_absent ? render(types_, b) : "<nil>", depth);
}

bool Comparator::seen_before(const value& a, const value& b, Visited& visited) const {
    const value* lo = &a;
    const value* hi = &b;
    if(std::less<const value*>{}(hi, lo)) std::swap(lo, hi);
    return !visited.insert(VisitKey{lo, hi, a.type}).second;
}

std::optional<Divergence> Comparator::walk(const value* a, const value* b, Visited& visited, int depth) const {
    if(!a || !b){
        if(!a && !b) return std::nullopt;
        return absence(a, b, depth);
    }
    if(a->type != b->type)
        return make_divergence(DivergenceKind::TypeMismatch, Side::None, types_.to_string(a->type), types_.to_string(b->type), depth);

    const Type& t = types_.at(a->type);
    if(opts_.trace)
        std::fprintf(stderr, "[dbg][walk] depth=%d type=%s\n", depth, types_.to_string(a->type).c_str());

    if(addressable_compound(t.kind) && seen_before(*a, *b, visited)){
        if(opts_.trace)
            std::fprintf(stderr, "[dbg][visited] depth=%d type=%s pair already seen\n", depth, types_.to_string(a->type).c_str());
        return std::nullopt;
    }

    switch(t.kind){
        case Type::Kind::Array:
            return walk_elements(*a, *b, visited, depth);
        case Type::Kind::Sequence: {
            bool na = is_nil(*a), nb = is_nil(*b);
            if(na != nb) return absence(a, b, depth);
            size_t la = length(*a), lb = length(*b);
            if(la != lb)
                return make_divergence(DivergenceKind::LengthMismatch, Side::None, std::to_string(la), std::to_string(lb), depth);
            if(storage_identity(*a) == storage_identity(*b)){
                if(opts_.trace) std::fprintf(stderr, "[dbg][shortcut] depth=%d sequence storage shared\n", depth);
                return std::nullopt;
            }
            return walk_elements(*a, *b, visited, depth);
        }
        case Type::Kind::Record:
            return walk_record(*a, *b, visited, depth);
        case Type::Kind::Mapping:
            return walk_mapping(*a, *b, visited, depth);
        case Type::Kind::Reference: {
            const value* ta = std::get<reference_data>(a->data).target;
            const value* tb = std::get<reference_data>(b->data).target;
            if(ta == tb) return std::nullopt;
            return wrap(walk(ta, tb, visited, depth + 1), PathSegment{PathSegment::Kind::Pointer, {}});
        }
        case Type::Kind::Dynamic: {
            bool na = is_nil(*a), nb = is_nil(*b);
            if(na || nb){
                if(na == nb) return std::nullopt;
                return absence(a, b, depth);
            }
            return wrap(walk(std::get<dynamic_data>(a->data).inner, std::get<dynamic_data>(b->data).inner, visited, depth + 1),
                        PathSegment{PathSegment::Kind::Interface, {}});
        }
        case Type::Kind::Callable:
            if(is_nil(*a) && is_nil(*b)) return std::nullopt;
            return make_divergence(DivergenceKind::CallableDivergence, Side::None, render(types_, a), render(types_, b), depth);
        case Type::Kind::Base:
            return compare_leaf(*a, *b, depth);
    }
    return std::nullopt;
}

std::optional<Divergence> Comparator::walk_elements(const value& a, const value& b, Visited& visited, int depth) const {
    for(size_t i=0, n=length(a); i<n; ++i){
        auto d = walk(element(a, i), element(b, i), visited, depth + 1);
        if(d) return wrap(std::move(d), PathSegment{PathSegment::Kind::Index, std::to_string(i)});
    }
    return std::nullopt;
}

std::optional<Divergence> Comparator::walk_record(const value& a, const value& b, Visited& visited, int depth) const {
    const Type& t = types_.at(a.type);
    const auto& fa = std::get<record_data>(a.data).fields;
    const auto& fb = std::get<record_data>(b.data).fields;
    for(size_t i=0;i<t.fields.size(); ++i){
        const value* x = i < fa.size() ? fa[i] : nullptr;
        const value* y = i < fb.size() ? fb[i] : nullptr;
        auto d = walk(x, y, visited, depth + 1);
        if(d) return wrap(std::move(d), PathSegment{PathSegment::Kind::Field, t.fields[i].name});
    }
    return std::nullopt;
}

std::optional<Divergence> Comparator::walk_mapping(const value& a, const value& b, Visited& visited, int depth) const {
    bool na = is_nil(a), nb = is_nil(b);
    if(na != nb) return absence(&a, &b, depth);
    size_t la = length(a), lb = length(b);
    if(la != lb)
        return make_divergence(DivergenceKind::LengthMismatch, Side::None, std::to_string(la), std::to_string(lb), depth);
    if(storage_identity(a) == storage_identity(b)){
        if(opts_.trace) std::fprintf(stderr, "[dbg][shortcut] depth=%d mapping storage shared\n", depth);
        return std::nullopt;
    }
    // Keys come from the first side only; equal lengths make a second scan redundant
    // unless a key fails to match itself (NaN), which is reported as missing in x.
    for(const auto& kv : *std::get<mapping_data>(a.data).storage){
        const value* key = kv.first;
        PathSegment seg{PathSegment::Kind::Key, render(types_, key)};
        const value* va = lookup(a, key);
        const value* vb = lookup(b, key);
        if(!va || !vb){
            Side missing = !va ? Side::First : Side::Second;
            auto d = make_divergence(DivergenceKind::KeyMissing, missing,
                va ? render(types_, va) : "<missing>", vb ? render(types_, vb) : "<missing>", depth);
            d.path.push_back(std::move(seg));
            return d;
        }
        auto d = walk(va, vb, visited, depth + 1);
        if(d) return wrap(std::move(d), std::move(seg));
    }
    return std::nullopt;
}

std::optional<Divergence> Comparator::compare_leaf(const value& a, const value& b, int depth) const {
    auto fa = std::get_if<double>(&a.data);
    auto fb = std::get_if<double>(&b.data);
    if(fa && std::isnan(*fa))
        return make_divergence(DivergenceKind::NaNDivergence, Side::First, render(types_, &a), render(types_, &b), depth);
    if(fb && std::isnan(*fb))
        return make_divergence(DivergenceKind::NaNDivergence, Side::Second, render(types_, &a), render(types_, &b), depth);

    std::string ra = render(types_, &a);
    std::string rb = render(types_, &b);
    bool equal = opts_.leaf_mode == LeafMode::Typed ? leaf_payload_equal(a, b) : ra == rb;
    if(equal) return std::nullopt;
    return make_divergence(DivergenceKind::ValueMismatch, Side::None, std::move(ra), std::move(rb), depth);
}

CompareResult Comparator::compare(const value* a, const value* b) const {
    CompareResult result;
    std::optional<Divergence> d;
    if(!a || !b){
        if(!a && !b) return result;
        d = absence(a, b, 0);
        d->at_entry = true;
    } else if(a->type != b->type){
        d = make_divergence(DivergenceKind::TypeMismatch, Side::None, types_.to_string(a->type), types_.to_string(b->type), 0);
        d->at_entry = true;
    } else {
        Visited visited;
        d = walk(a, b, visited, 0);
        if(d) std::reverse(d->path.begin(), d->path.end());
        if(opts_.trace)
            std::fprintf(stderr, "[dbg][walk] done visited=%zu equal=%d\n", visited.size(), d ? 0 : 1);
    }
    if(!d) return result;
    result.equal = false;
    result.message = describe(*d, opts_.wording);
    result.divergence = std::move(d);
    maybe_print_json(result, opts_);
    return result;
}

CompareResult compare(const TypeContext& types, const value* a, const value* b){
    return Comparator(types).compare(a, b);
}

std::optional<std::string> explain(const TypeContext& types, const value* a, const value* b){
    CompareResult r = compare(types, a, b);
    if(r.equal) return std::nullopt;
    return r.message;
}

bool deep_equal(const TypeContext& types, const value* a, const value* b){
    return compare(types, a, b).equal;
}

} // namespace deepeq
