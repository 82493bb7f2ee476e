#include "paramdec/diagnostics_json.hpp"
#include <sstream>
#include <cstdio>

namespace paramdec {

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

static void append_notes_json(std::ostringstream& os, const std::vector<DecodeNote>& notes){
    os<<"[";
    for(size_t i=0;i<notes.size(); ++i){
        if(i) os<<",";
        os<<"{\"message\":"<<json_escape(notes[i].message)<<"}";
    }
    os<<"]";
}

std::string diagnostics_to_json(const DecodeResult& r){
    std::ostringstream os;
    os<<"{\"success\":"<<(r.success?"true":"false")<<",\"errors\":[";
    for(size_t i=0;i<r.errors.size(); ++i){
        const auto &e=r.errors[i]; if(i) os<<",";
        os<<"{"
            "\"code\":"<<json_escape(e.code)
            <<",\"message\":"<<json_escape(e.message)
            <<",\"hint\":"<<json_escape(e.hint)
            <<",\"key\":"<<json_escape(e.key)
            <<",\"type\":"<<json_escape(e.type)
            <<",\"notes\":";
        append_notes_json(os,e.notes);
        os<<"}";
    }
    os<<"]}";
    return os.str();
}

void maybe_print_json(const DecodeResult& r, const DecodeEnv& env){
    if(!env.diag_json || r.success) return;
    auto js=diagnostics_to_json(r);
    std::fprintf(stderr, "%s\n", js.c_str());
}

} // namespace paramdec
