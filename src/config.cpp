#include "deepeq/config.hpp"
#include <cstdio>
#include <string>

namespace deepeq {

CompareOptions CompareOptions::from_env(){
    CompareOptions o;
    if(const char* mode = std::getenv("DEEPEQ_LEAF_COMPARE"); mode && *mode){
        std::string m(mode);
        if(m == "typed") o.leaf_mode = LeafMode::Typed;
        else if(m == "rendering") o.leaf_mode = LeafMode::Rendering;
        else std::fprintf(stderr, "[warn] DEEPEQ_LEAF_COMPARE=%s not recognized; using rendering\n", mode);
    }
    o.trace = detail::env_flag_enabled("DEEPEQ_DEBUG_WALK");
    o.emit_json = detail::env_flag_enabled("DEEPEQ_DIAG_JSON");
    return o;
}

} // namespace deepeq
