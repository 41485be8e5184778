#include "deepeq/compare.hpp"
#include <chrono>
#include <iostream>
#include <string>
#include <vector>
#include <cstdlib>
#include <algorithm>

using Clock = std::chrono::steady_clock;

struct RunResult { double ms_compare; size_t values; bool equal; };

// Builds two independent copies of the same literal and times one comparison of them.
static RunResult bench_case(const char* name, const std::string &decls, const std::string &type, const std::string &literal){
    deepeq::TypeContext types;
    deepeq::ValueContext vals(types);
    if(!decls.empty()) types.declare(decls);
    auto *a = vals.read(type, literal);
    auto *b = vals.read(type, literal);

    deepeq::Comparator cmp(types, deepeq::CompareOptions{});
    auto t0 = Clock::now();
    auto res = cmp.compare(a, b);
    auto t1 = Clock::now();
    if(!res.equal)
        std::cerr << "[bench] case '" << name << "' unexpectedly diverged: " << res.message << "\n";
    return { std::chrono::duration<double, std::milli>(t1 - t0).count(), vals.size(), res.equal };
}

static std::string repeat(const std::string &item, int n, const char* open, const char* close){
    std::string out = open;
    for(int i=0;i<n;++i){ if(i) out += ' '; out += item; }
    return out + close;
}

static std::string numbered_map(int n){
    std::string out = "{";
    for(int i=0;i<n;++i) out += "\"k" + std::to_string(i) + "\" " + std::to_string(i) + ".5 ";
    return out + "}";
}

int main(){
    int scale = 1000;
    if(const char* s = std::getenv("DEEPEQ_BENCH_SCALE")) scale = std::max(1, std::atoi(s));

    struct Case { const char* name; std::string decls; std::string type; std::string literal; };
    std::vector<Case> cases;

    // Case 1: flat sequence of integers
    cases.push_back({ "seq_i64", "", "(seq i64)", repeat("42", scale * 10, "[", "]") });

    // Case 2: mapping lookups by string key
    cases.push_back({ "map_string_f64", "", "(map string f64)", numbered_map(scale) });

    // Case 3: sequence of records behind references and dynamic fields
    cases.push_back({
        "records",
        "(record :name Item :fields [ (field :name Id :type i64) (field :name Name :type string) (field :name Tag :type any) ])",
        "(seq (ptr Item))",
        repeat("{:Id 7 :Name \"widget\" :Tag #u8 3}", scale, "[", "]")
    });

    std::cout << "name,ms_compare,values,equal\n";
    for(const auto &c : cases){
        auto r = bench_case(c.name, c.decls, c.type, c.literal);
        std::cout << c.name << "," << r.ms_compare << "," << r.values << "," << (r.equal ? 1 : 0) << "\n";
    }
    return 0;
}
