#include "paramdec/values.hpp"
#include "paramdec/errors.hpp"
#include <tao/pegtl.hpp>

namespace paramdec {
namespace query_grammar {
using namespace tao::pegtl;

struct escaped : if_must< one<'%'>, xdigit, xdigit > {};
struct key_char : sor< escaped, not_one<'&', '=', '%', ';'> > {};
struct value_char : sor< escaped, not_one<'&', '%', ';'> > {};
struct key_text : star< key_char > {};
struct value_text : star< value_char > {};
struct pair : seq< key_text, opt< one<'='>, value_text > > {};
struct query : must< list< pair, one<'&'> >, eof > {};

struct state {
    Values out;
    std::string key;
    std::string value;
};

static int hex_value(char c){
    if(c >= '0' && c <= '9') return c - '0';
    if(c >= 'a' && c <= 'f') return c - 'a' + 10;
    return c - 'A' + 10;
}

// Escapes were validated by the grammar.
static std::string unescape(std::string_view raw){
    std::string out;
    out.reserve(raw.size());
    for(size_t i=0;i<raw.size();++i){
        char c = raw[i];
        if(c == '+') out += ' ';
        else if(c == '%'){
            out += static_cast<char>(hex_value(raw[i+1]) * 16 + hex_value(raw[i+2]));
            i += 2;
        }
        else out += c;
    }
    return out;
}

template <typename Rule> struct action : nothing<Rule> {};

template <> struct action<key_text> {
    template <typename ActionInput>
    static void apply(const ActionInput& in, state& st){ st.key = unescape(in.string_view()); }
};

template <> struct action<value_text> {
    template <typename ActionInput>
    static void apply(const ActionInput& in, state& st){ st.value = unescape(in.string_view()); }
};

template <> struct action<pair> {
    template <typename ActionInput>
    static void apply(const ActionInput& in, state& st){
        if(in.size() != 0) st.out[st.key].push_back(st.value);
        st.key.clear();
        st.value.clear();
    }
};

} // namespace query_grammar

Values parse_query(std::string_view query){
    tao::pegtl::memory_input in(query.data(), query.size(), "query");
    query_grammar::state st;
    try {
        tao::pegtl::parse< query_grammar::query, query_grammar::action >(in, st);
    } catch(const tao::pegtl::parse_error& e) {
        auto p = e.positions().front();
        throw query_error("paramdec: malformed query at offset " + std::to_string(p.byte), p.byte);
    }
    return std::move(st.out);
}

} // namespace paramdec
