// Decode a signup form posted as a query string.
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "paramdec/paramdec.hpp"
#include "paramdec/log.hpp"

struct Address {
    std::string street;
    std::string city;
};

struct Signup {
    std::string name;
    int age = 0;
    bool newsletter = false;
    std::vector<std::string> tags;
    std::map<std::string, Address> addresses;
    std::optional<std::string> referrer;
};

namespace paramdec {

template <> struct record<Address> {
    static constexpr bool enabled = true;
    static constexpr const char* name = "Address";
    static void fields(Fields<Address>& f){
        PARAMDEC_FIELD(f, Address, street);
        PARAMDEC_FIELD(f, Address, city);
    }
};

template <> struct record<Signup> {
    static constexpr bool enabled = true;
    static constexpr const char* name = "Signup";
    static void fields(Fields<Signup>& f){
        PARAMDEC_FIELD(f, Signup, name);
        PARAMDEC_FIELD(f, Signup, age);
        PARAMDEC_FIELD(f, Signup, newsletter).json("news,omitempty");
        PARAMDEC_FIELD(f, Signup, tags).param("tag");
        PARAMDEC_FIELD(f, Signup, addresses).param("addr");
        PARAMDEC_FIELD(f, Signup, referrer);
    }
};

} // namespace paramdec

int main(int argc, char** argv){
    std::string query = argc > 1 ? argv[1]
        : "name=Ada+Lovelace&age=36&news=on&tag[]=math&tag[]=engines"
          "&addr[home][street]=12+St+James%27s+Square&addr[home][city]=London";

    paramdec::Decoder dec;
    Signup s;
    try {
        dec.decode_query(query, s);
    } catch(const paramdec::query_error& e) {
        PARAMDEC_LOG_ERROR("example", "%s", e.what());
        return 2;
    } catch(const paramdec::decode_error& e) {
        auto d = paramdec::to_diagnostic(e);
        PARAMDEC_LOG_ERROR("example", "%s: %s", d.code.c_str(), d.message.c_str());
        if(!d.hint.empty()) std::cerr << "  hint: " << d.hint << "\n";
        for(auto& n : d.notes) std::cerr << "  note: " << n.message << "\n";
        return 1;
    }

    std::cout << s.name << " (" << s.age << ")" << (s.newsletter ? " subscribed" : "") << "\n";
    for(auto& t : s.tags) std::cout << "  tag " << t << "\n";
    for(auto& [label, a] : s.addresses) std::cout << "  " << label << ": " << a.street << ", " << a.city << "\n";
    if(s.referrer) std::cout << "  referred by " << *s.referrer << "\n";
    return 0;
}
