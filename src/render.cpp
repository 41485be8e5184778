#include "deepeq/render.hpp"
#include <charconv>
#include <cmath>
#include <cstdint>
#include <sstream>

namespace deepeq {

std::string render_float(double d, BaseType width){
    if(std::isnan(d)) return "NaN";
    if(std::isinf(d)) return d > 0 ? "+Inf" : "-Inf";
    char buf[64];
    std::to_chars_result res = width == BaseType::F32
        ? std::to_chars(buf, buf + sizeof(buf), static_cast<float>(d))
        : std::to_chars(buf, buf + sizeof(buf), d);
    return std::string(buf, res.ptr);
}

std::string render_identity(const void* p){
    if(!p) return "<nil>";
    std::ostringstream os;
    os << "0x" << std::hex << reinterpret_cast<uintptr_t>(p);
    return os.str();
}

namespace {

struct Renderer {
    const TypeContext& types;
    std::vector<const value*> stack;

    std::string join(const value& v){
        std::string out = "[";
        for(size_t i=0, n=length(v); i<n; ++i){
            if(i) out += ' ';
            out += run(element(v, i));
        }
        return out + "]";
    }

    std::string run(const value* v){
        if(!v) return "<invalid>";
        for(auto s : stack) if(s == v) return "<cycle>";
        stack.push_back(v);
        std::string out = std::visit([&](const auto& d){ return visit(*v, d); }, v->data);
        stack.pop_back();
        return out;
    }

    std::string visit(const value&, bool b){ return b ? "true" : "false"; }
    std::string visit(const value&, int64_t i){ return std::to_string(i); }
    std::string visit(const value&, uint64_t u){ return std::to_string(u); }
    std::string visit(const value& v, double d){ return render_float(d, types.at(v.type).base); }
    std::string visit(const value&, const std::string& s){ return s; }
    std::string visit(const value& v, const array_data&){ return join(v); }
    std::string visit(const value& v, const sequence_data&){ return join(v); }
    std::string visit(const value& v, const record_data& r){
        const Type& t = types.at(v.type);
        std::string out = "{";
        for(size_t i=0;i<r.fields.size(); ++i){
            if(i) out += ' ';
            out += (i < t.fields.size() ? t.fields[i].name : std::to_string(i)) + ":" + run(r.fields[i]);
        }
        return out + "}";
    }
    std::string visit(const value&, const mapping_data& m){
        std::string out = "map[";
        if(m.storage){
            bool first = true;
            for(const auto& kv : *m.storage){
                if(!first) out += ' ';
                first = false;
                out += run(kv.first) + ":" + run(kv.second);
            }
        }
        return out + "]";
    }
    std::string visit(const value&, const reference_data& r){ return render_identity(r.target); }
    std::string visit(const value&, const dynamic_data& d){ return d.inner ? run(d.inner) : "<nil>"; }
    std::string visit(const value&, const callable_data& c){ return render_identity(c.fn.get()); }
};

} // namespace

std::string render(const TypeContext& types, const value* v){
    Renderer r{types, {}};
    return r.run(v);
}

} // namespace deepeq
