// compare.hpp - structural equality that explains the first divergence
#pragma once
#include "deepeq/config.hpp"
#include "deepeq/divergence.hpp"
#include "deepeq/value.hpp"
#include <functional>
#include <optional>
#include <string>
#include <unordered_set>
#include <utility>

namespace deepeq {

struct CompareResult {
    bool equal = true;
    std::optional<Divergence> divergence;
    std::string message; // empty when equal
};

// Depth-first structural comparison of two values built over the same TypeContext.
//
// Stops at the first divergence in declaration/index order. Compound pairs are
// remembered per call (by canonicalized node addresses plus type) before their
// children are visited; a pair reached again is treated as equal, which is what
// makes cyclic graphs terminate. Sequences and mappings sharing storage are
// equal without looking at their contents.
class Comparator {
public:
    explicit Comparator(const TypeContext& types, CompareOptions opts = CompareOptions::from_env())
        : types_(types), opts_(std::move(opts)) {}

    CompareResult compare(const value* a, const value* b) const;
    const CompareOptions& options() const { return opts_; }

private:
    struct VisitKey {
        const value* lo;
        const value* hi;
        TypeId type;
        bool operator==(const VisitKey& o) const { return lo == o.lo && hi == o.hi && type == o.type; }
    };
    struct VisitKeyHash {
        size_t operator()(const VisitKey& k) const noexcept {
            size_t h = std::hash<const value*>{}(k.lo);
            h ^= std::hash<const value*>{}(k.hi) + 0x9e3779b97f4a7c15ull + (h << 6) + (h >> 2);
            h ^= std::hash<TypeId>{}(k.type) + 0x9e3779b97f4a7c15ull + (h << 6) + (h >> 2);
            return h;
        }
    };
    using Visited = std::unordered_set<VisitKey, VisitKeyHash>;

    std::optional<Divergence> walk(const value* a, const value* b, Visited& visited, int depth) const;
    std::optional<Divergence> walk_elements(const value& a, const value& b, Visited& visited, int depth) const;
    std::optional<Divergence> walk_record(const value& a, const value& b, Visited& visited, int depth) const;
    std::optional<Divergence> walk_mapping(const value& a, const value& b, Visited& visited, int depth) const;
    std::optional<Divergence> compare_leaf(const value& a, const value& b, int depth) const;
    bool seen_before(const value& a, const value& b, Visited& visited) const;
    Divergence absence(const value* a, const value* b, int depth) const;

    const TypeContext& types_;
    CompareOptions opts_;
};

// One-shot helpers using CompareOptions::from_env().
CompareResult compare(const TypeContext& types, const value* a, const value* b);
std::optional<std::string> explain(const TypeContext& types, const value* a, const value* b);
bool deep_equal(const TypeContext& types, const value* a, const value* b);

} // namespace deepeq
