#include "paramdec/shape.hpp"
#include <cstdlib>
#include <memory>
#ifdef __GNUG__
#include <cxxabi.h>
#endif

namespace paramdec {

std::string external_name(const FieldDecl& f){
    if(!f.param_tag.empty()) return f.param_tag;
    if(!f.json_tag.empty()){
        auto comma = f.json_tag.find(',');
        std::string name = f.json_tag.substr(0, comma);
        if(!name.empty()) return name;
    }
    return f.identifier;
}

namespace detail {

std::string demangle(const char* mangled){
#ifdef __GNUG__
    int status = 0;
    std::unique_ptr<char, void(*)(void*)> out(abi::__cxa_demangle(mangled, nullptr, nullptr, &status), std::free);
    if(status == 0 && out) return out.get();
#endif
    return mangled;
}

} // namespace detail
} // namespace paramdec
