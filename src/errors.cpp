#include "paramdec/errors.hpp"
#include <sstream>

namespace paramdec {

const char* to_string(ErrorKind k){
    switch(k){
        case ErrorKind::Syntax: return "syntax";
        case ErrorKind::Nesting: return "nesting";
        case ErrorKind::Singleton: return "singleton";
        case ErrorKind::Value: return "value";
        case ErrorKind::Key: return "key";
        case ErrorKind::InvalidShape: return "invalid-shape";
    }
    return "?";
}

const char* to_string(SyntaxKind k){
    switch(k){
        case SyntaxKind::MissingOpeningBracket: return "missing opening bracket";
        case SyntaxKind::MissingClosingBracket: return "missing closing bracket";
    }
    return "?";
}

static std::string quoted(const std::string& s){
    std::string out = "\"";
    out += s;
    out += '"';
    return out;
}

static std::string join_values(const std::vector<std::string>& values){
    std::string out = "[";
    for(size_t i=0;i<values.size(); ++i){
        if(i) out += ", ";
        out += quoted(values[i]);
    }
    out += ']';
    return out;
}

static std::string syntax_message(const std::string& key, SyntaxKind subtype, const std::string& part){
    return "paramdec: syntax error while parsing key " + quoted(key) + ": " + to_string(subtype) + " at " + quoted(part);
}

syntax_error::syntax_error(std::string key, std::string type_name, SyntaxKind subtype, std::string error_part)
    : decode_error(ErrorKind::Syntax, key, std::move(type_name), syntax_message(key, subtype, error_part)),
      subtype(subtype), error_part(std::move(error_part)) {}

const char* syntax_error::code() const noexcept {
    return subtype == SyntaxKind::MissingOpeningBracket ? "E0101" : "E0102";
}

std::string syntax_error::hint() const {
    if(subtype == SyntaxKind::MissingOpeningBracket)
        return "values of type " + type_name() + " must be addressed as " + key() + "[name]";
    return "close the bracket segment with ']'";
}

nesting_error::nesting_error(std::string key, std::string type_name, std::string nesting)
    : decode_error(ErrorKind::Nesting, key, type_name,
                   "paramdec: error parsing key " + quoted(key) + ": invalid nesting " + quoted(nesting) + " for type " + type_name),
      nesting(std::move(nesting)) {}

std::string nesting_error::hint() const {
    if(nesting == "[]") return "only sequences accept the [] marker";
    return "remove " + quoted(nesting) + " from the key";
}

singleton_error::singleton_error(std::string key, std::string type_name, std::vector<std::string> values)
    : decode_error(ErrorKind::Singleton, key, type_name,
                   "paramdec: error parsing key " + quoted(key) + ": expected single value for type " + type_name +
                   " but was given " + std::to_string(values.size())),
      values(std::move(values)) {}

std::string singleton_error::hint() const {
    if(values.empty()) return "supply exactly one value";
    return "supply exactly one value, or use " + key() + "[] with a sequence field";
}

std::vector<std::string> singleton_error::notes() const {
    return { "given: " + join_values(values) };
}

static std::string value_message(const std::string& key, const std::string& type_name, const std::string& value,
                                 const std::string& cause){
    std::string msg = "paramdec: error parsing key " + quoted(key) + " as " + type_name + ": " + quoted(value);
    if(!cause.empty()) msg += ": " + cause;
    return msg;
}

value_error::value_error(std::string key, std::string type_name, std::string value, std::string cause_message,
                         std::exception_ptr cause)
    : decode_error(ErrorKind::Value, key, type_name, value_message(key, type_name, value, cause_message)),
      value(std::move(value)), cause_message(std::move(cause_message)), cause(std::move(cause)) {}

std::string value_error::hint() const {
    if(type_name() == "bool") return "use one of true, false, 1, 0, on, or an empty value";
    return "ensure the value is a valid " + type_name();
}

key_error::key_error(std::string full_key, std::string key, std::string type_name, std::string field,
                     std::vector<std::string> suggestions)
    : decode_error(ErrorKind::Key, key, type_name,
                   "paramdec: error parsing key " + quoted(full_key) + ": unknown field " + quoted(field) +
                   " on record " + type_name),
      full_key(std::move(full_key)), field(std::move(field)), suggestions(std::move(suggestions)) {}

std::string key_error::hint() const {
    return "check the field names declared for " + type_name();
}

std::vector<std::string> key_error::notes() const {
    if(suggestions.empty()) return {};
    std::string msg = "did you mean ";
    for(size_t i=0;i<suggestions.size();++i){ msg+=suggestions[i]; if(i+1<suggestions.size()) msg+= i+2==suggestions.size()?" or ":", "; }
    return { msg };
}

static std::string shape_message(const std::string& type_name, const std::string& detail){
    std::string msg = "paramdec: cannot decode into " + type_name;
    if(!detail.empty()) msg += ": " + detail;
    return msg;
}

invalid_shape_error::invalid_shape_error(std::string key, std::string type_name, std::string detail)
    : decode_error(ErrorKind::InvalidShape, std::move(key), type_name, shape_message(type_name, detail)),
      detail(std::move(detail)) {}

DecodeDiagnostic to_diagnostic(const decode_error& e){
    DecodeDiagnostic d;
    d.code = e.code();
    d.message = e.what();
    d.hint = e.hint();
    d.key = e.key();
    d.type = e.type_name();
    for(auto& n : e.notes()) d.notes.push_back(DecodeNote{n});
    return d;
}

} // namespace paramdec
