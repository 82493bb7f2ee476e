#include "paramdec/env.hpp"
#include <cstdlib>

namespace paramdec {

bool env_flag_enabled(const char* name){
    const char* v = std::getenv(name);
    return v && (v[0] == '1' || v[0] == 't' || v[0] == 'T' || v[0] == 'y' || v[0] == 'Y');
}

DecodeEnv detect_env(){
    DecodeEnv env;
    env.trace = env_flag_enabled("PARAMDEC_TRACE");
    env.diag_json = env_flag_enabled("PARAMDEC_DIAG_JSON");
    // Suggestions default on; only an explicit 0 turns them off.
    if(const char* s = std::getenv("PARAMDEC_SUGGEST"); s && s[0] == '0') env.suggest = false;
    return env;
}

} // namespace paramdec
