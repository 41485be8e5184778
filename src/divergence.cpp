#include "deepeq/divergence.hpp"

namespace deepeq {

const char* kind_code(DivergenceKind k){
    switch(k){
        case DivergenceKind::TypeMismatch: return "D0100";
        case DivergenceKind::AbsenceMismatch: return "D0200";
        case DivergenceKind::LengthMismatch: return "D0300";
        case DivergenceKind::KeyMissing: return "D0400";
        case DivergenceKind::ValueMismatch: return "D0500";
        case DivergenceKind::NaNDivergence: return "D0600";
        case DivergenceKind::CallableDivergence: return "D0700";
    }
    return "D0000";
}

const char* kind_slug(DivergenceKind k){
    switch(k){
        case DivergenceKind::TypeMismatch: return "type-mismatch";
        case DivergenceKind::AbsenceMismatch: return "absence-mismatch";
        case DivergenceKind::LengthMismatch: return "length-mismatch";
        case DivergenceKind::KeyMissing: return "key-missing";
        case DivergenceKind::ValueMismatch: return "value-mismatch";
        case DivergenceKind::NaNDivergence: return "nan";
        case DivergenceKind::CallableDivergence: return "callable";
    }
    return "unknown";
}

const char* side_name(Side s){
    switch(s){
        case Side::None: return "none";
        case Side::First: return "first";
        case Side::Second: return "second";
    }
    return "none";
}

std::string format_path(const std::vector<PathSegment>& path){
    std::string out;
    for(const auto& seg : path){
        switch(seg.kind){
            case PathSegment::Kind::Field: out += "." + seg.label; break;
            case PathSegment::Kind::Index:
            case PathSegment::Kind::Key: out += "[" + seg.label + "]"; break;
            case PathSegment::Kind::Pointer: out += "(Pointer)"; break;
            case PathSegment::Kind::Interface: out += "(Interface)"; break;
        }
    }
    return out;
}

std::string describe(const Divergence& d, const Wording& w){
    const std::string& on = d.side == Side::Second ? w.second_name : w.first_name;
    const std::string& off = d.side == Side::Second ? w.first_name : w.second_name;
    std::string where = " where in " + w.first_name + " is " + d.first + " but in " + w.second_name + " is " + d.second;

    // An absent argument has no path to report.
    if(d.kind == DivergenceKind::AbsenceMismatch && d.at_entry)
        return on + " is nil while " + off + " is not";

    std::string out = w.root + format_path(d.path) + " ";
    switch(d.kind){
        case DivergenceKind::TypeMismatch:
            out += (d.path.empty() ? "have" : "has") + std::string(" different types,") + where;
            break;
        case DivergenceKind::AbsenceMismatch:
            out += "in " + on + " is nil but in " + off + " is not";
            break;
        case DivergenceKind::LengthMismatch:
            out += "do not have the same length," + where;
            break;
        case DivergenceKind::KeyMissing:
            out += "is missing in " + on;
            break;
        case DivergenceKind::ValueMismatch:
            out += "are not equal," + where;
            break;
        case DivergenceKind::NaNDivergence:
            out += "in " + on + " is NaN float";
            break;
        case DivergenceKind::CallableDivergence:
            out += "has different callables";
            break;
    }
    return out;
}

} // namespace deepeq
