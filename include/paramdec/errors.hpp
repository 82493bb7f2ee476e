// Decode error taxonomy and diagnostic records
#pragma once
#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

namespace paramdec {

enum class ErrorKind { Syntax, Nesting, Singleton, Value, Key, InvalidShape };
enum class SyntaxKind { MissingOpeningBracket, MissingClosingBracket };

const char* to_string(ErrorKind k);
const char* to_string(SyntaxKind k);

// Base of every failure raised while decoding. key() is the offending key, or the
// prefix of it consumed before the failure; type_name() is the implicated shape.
class decode_error : public std::runtime_error {
public:
    decode_error(ErrorKind kind, std::string key, std::string type_name, const std::string& message)
        : std::runtime_error(message), kind_(kind), key_(std::move(key)), type_name_(std::move(type_name)) {}

    ErrorKind kind() const noexcept { return kind_; }
    const std::string& key() const noexcept { return key_; }
    const std::string& type_name() const noexcept { return type_name_; }

    // Stable diagnostic code, e.g. "E0401".
    virtual const char* code() const noexcept = 0;
    virtual std::string hint() const { return std::string(); }
    virtual std::vector<std::string> notes() const { return {}; }

private:
    ErrorKind kind_;
    std::string key_;
    std::string type_name_;
};

struct syntax_error : decode_error {
    SyntaxKind subtype;
    std::string error_part;
    syntax_error(std::string key, std::string type_name, SyntaxKind subtype, std::string error_part);
    const char* code() const noexcept override;
    std::string hint() const override;
};

struct nesting_error : decode_error {
    std::string nesting;
    nesting_error(std::string key, std::string type_name, std::string nesting);
    const char* code() const noexcept override { return "E0201"; }
    std::string hint() const override;
};

struct singleton_error : decode_error {
    std::vector<std::string> values;
    singleton_error(std::string key, std::string type_name, std::vector<std::string> values);
    const char* code() const noexcept override { return "E0301"; }
    std::string hint() const override;
    std::vector<std::string> notes() const override;
};

// Conversion failure. cause_message is empty when there is no underlying cause
// (e.g. an unknown boolean literal); cause holds the original exception otherwise.
struct value_error : decode_error {
    std::string value;
    std::string cause_message;
    std::exception_ptr cause;
    value_error(std::string key, std::string type_name, std::string value, std::string cause_message = {},
                std::exception_ptr cause = nullptr);
    const char* code() const noexcept override { return "E0401"; }
    std::string hint() const override;
};

struct key_error : decode_error {
    std::string full_key;
    std::string field;
    std::vector<std::string> suggestions;
    key_error(std::string full_key, std::string key, std::string type_name, std::string field,
              std::vector<std::string> suggestions = {});
    const char* code() const noexcept override { return "E0501"; }
    std::string hint() const override;
    std::vector<std::string> notes() const override;
};

struct invalid_shape_error : decode_error {
    std::string detail;
    invalid_shape_error(std::string key, std::string type_name, std::string detail = {});
    const char* code() const noexcept override { return "E0601"; }
    std::string hint() const override { return detail; }
};

// Raised by parse_query for malformed form-encoded input.
struct query_error : std::runtime_error {
    std::size_t offset;
    query_error(const std::string& message, std::size_t offset)
        : std::runtime_error(message), offset(offset) {}
};

struct DecodeNote { std::string message; };
struct DecodeDiagnostic {
    std::string code;
    std::string message;
    std::string hint;
    std::string key;
    std::string type;
    std::vector<DecodeNote> notes;
};
struct DecodeResult { bool success = true; std::vector<DecodeDiagnostic> errors; };

DecodeDiagnostic to_diagnostic(const decode_error& e);

} // namespace paramdec
