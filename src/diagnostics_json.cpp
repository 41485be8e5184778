#include "deepeq/diagnostics_json.hpp"
#include <sstream>
#include <cstdio>

namespace deepeq {

std::string json_escape(const std::string& s){
    std::ostringstream o; o<<'"';
    for(char c: s){
        switch(c){
            case '"': o<<"\\\""; break; case '\\': o<<"\\\\"; break;
            case '\n': o<<"\\n"; break; case '\r': o<<"\\r"; break; case '\t': o<<"\\t"; break;
            default:
                if(static_cast<unsigned char>(c) < 0x20){ char buf[7]; std::snprintf(buf,sizeof(buf),"\\u%04X", (unsigned char)c); o<<buf; }
                else { o<<c; }
                break;
        }
    }
    o<<'"';
    return o.str();
}

static const char* segment_kind_name(PathSegment::Kind k){
    switch(k){
        case PathSegment::Kind::Field: return "field";
        case PathSegment::Kind::Index: return "index";
        case PathSegment::Kind::Key: return "key";
        case PathSegment::Kind::Pointer: return "pointer";
        case PathSegment::Kind::Interface: return "interface";
    }
    return "unknown";
}

static void append_segments_json(std::ostringstream& os, const std::vector<PathSegment>& path){
    os<<"[";
    for(size_t i=0;i<path.size(); ++i){
        if(i) os<<",";
        os<<"{\"kind\":\""<<segment_kind_name(path[i].kind)<<"\""
          <<",\"label\":"<<json_escape(path[i].label)
          <<"}";
    }
    os<<"]";
}

std::string divergence_to_json(const CompareResult& r){
    std::ostringstream os;
    os<<"{\"equal\":"<<(r.equal?"true":"false");
    if(const auto& d = r.divergence){
        os<<",\"code\":\""<<kind_code(d->kind)<<"\""
          <<",\"kind\":\""<<kind_slug(d->kind)<<"\""
          <<",\"side\":\""<<side_name(d->side)<<"\""
          <<",\"path\":"<<json_escape(format_path(d->path))
          <<",\"segments\":";
        append_segments_json(os, d->path);
        os<<",\"first\":"<<json_escape(d->first)
          <<",\"second\":"<<json_escape(d->second)
          <<",\"depth\":"<<d->depth;
    }
    os<<",\"message\":"<<json_escape(r.message)<<"}";
    return os.str();
}

void maybe_print_json(const CompareResult& r, const CompareOptions& opts){
    if(!opts.emit_json || r.equal) return;
    auto js=divergence_to_json(r);
    std::fprintf(stderr, "%s\n", js.c_str());
}

} // namespace deepeq
