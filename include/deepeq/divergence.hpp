// divergence.hpp - structured record of the first difference between two values
#pragma once
#include <string>
#include <vector>

namespace deepeq {

enum class DivergenceKind {
    TypeMismatch,
    AbsenceMismatch,
    LengthMismatch,
    KeyMissing,
    ValueMismatch,
    NaNDivergence,
    CallableDivergence
};

// Which argument the divergence is about (the absent one, the one lacking a key, the NaN one).
enum class Side { None, First, Second };

struct PathSegment {
    enum class Kind { Field, Index, Key, Pointer, Interface } kind;
    std::string label; // field name, index digits or rendered key; empty for wrappers
};

struct Divergence {
    DivergenceKind kind;
    Side side = Side::None;
    std::string first;  // observed on the first argument: type name, length or rendering
    std::string second; // observed on the second argument
    std::vector<PathSegment> path; // outermost first once returned to the caller
    int depth = 0;
    bool at_entry = false; // raised by the entry guard before any descent
};

// How a divergence is worded: root prefix and the names of the two arguments.
struct Wording {
    std::string root = "values";
    std::string first_name = "x";
    std::string second_name = "y";
};

const char* kind_code(DivergenceKind k);  // stable code, e.g. "D0500"
const char* kind_slug(DivergenceKind k);  // e.g. "value-mismatch"
const char* side_name(Side s);            // "none" | "first" | "second"

// ".A[2](Pointer)[key]"
std::string format_path(const std::vector<PathSegment>& path);

// Human sentence, e.g. "values.B are not equal, where in x is 2 but in y is 3".
std::string describe(const Divergence& d, const Wording& w = {});

} // namespace deepeq
