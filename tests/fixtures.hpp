// Record types shared by the decoder tests.
#pragma once
#include <array>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>
#include "paramdec/paramdec.hpp"

namespace fixtures {

enum class Level : int8_t { Low = -1, Mid = 0, High = 1 };
enum class Mask : uint16_t {};

struct Label : std::string {
    using std::string::string;
    Label() = default;
};

// "#rrggbb"
struct Color {
    uint8_t r = 0, g = 0, b = 0;
    bool operator==(const Color& o) const { return r == o.r && g == o.g && b == o.b; }
};

struct Sub {
    int A = 0;
    int B = 0;
};

struct Everything {
    bool Bool = false;
    int Int = 0;
    int8_t Int8 = 0;
    int64_t Int64 = 0;
    unsigned Uint = 0;
    uint8_t Uint8 = 0;
    uint64_t Uint64 = 0;
    float Float32 = 0;
    double Float = 0;
    std::map<std::string, int> Map;
    std::vector<int> Slice;
    std::string String;
    Sub Struct;
    Color Tint;

    std::optional<bool> PBool;
    std::unique_ptr<int> PInt;
    std::shared_ptr<unsigned> PUint;
    std::optional<double> PFloat;
    std::unique_ptr<std::map<std::string, int>> PMap;
    std::optional<std::vector<int>> PSlice;
    std::shared_ptr<std::string> PString;
    std::unique_ptr<Sub> PStruct;
    std::optional<Color> PTint;
    std::unique_ptr<std::unique_ptr<int>> PPInt;

    Level ALevel = Level::Mid;
    Mask AMask{};
    Label ALabel;
    std::map<Label, Level> AMap;
    std::vector<Level> ASlice;
    std::unordered_map<std::string, Sub> StructMap;
    std::vector<Color> Palette;
};

struct Crazy {
    std::unique_ptr<Crazy> A;
    std::unique_ptr<Crazy> B;
    int Value = 0;
    std::vector<int> Slice;
    std::map<std::string, Crazy> Map;
};

struct Base {
    int Id = 0;
};

struct Tagged : Base {
    int Plain = 0;
    int Renamed = 0;
    int Jsoned = 0;
    int JsonOptionsOnly = 0;
    int ParamWins = 0;
    int Skipped = 0;
    int JsonSkipped = 0;
    int secret = 0;
    int First = 0;
    int Second = 0;
};

struct IntKeyed {
    std::map<int, int> Bad;
};

struct OptionalIntKeyed {
    std::optional<std::map<int, int>> Bad;
};

struct HasArray {
    std::array<int, 2> Bad{};
};

struct Inner {
    std::array<int, 2> A{};
};

struct NestedUnsupported {
    Inner Bad;
};

struct Deferred {
    std::vector<std::array<int, 2>> Bad;
    std::map<std::string, std::map<int, int>> Outer;
    std::vector<std::vector<int>> Nested;
};

} // namespace fixtures

namespace paramdec {

template <> struct text_decoder<fixtures::Color> {
    static constexpr bool enabled = true;
    static void decode(fixtures::Color& out, std::string_view text){
        if(text.size() != 7 || text[0] != '#') throw std::invalid_argument("expected #rrggbb");
        auto channel = [&](size_t at){ return static_cast<uint8_t>(std::stoul(std::string(text.substr(at, 2)), nullptr, 16)); };
        out.r = channel(1);
        out.g = channel(3);
        out.b = channel(5);
    }
};

template <> struct record<fixtures::Sub> {
    static constexpr bool enabled = true;
    static constexpr const char* name = "Sub";
    static void fields(Fields<fixtures::Sub>& f){
        PARAMDEC_FIELD(f, fixtures::Sub, A);
        PARAMDEC_FIELD(f, fixtures::Sub, B);
    }
};

template <> struct record<fixtures::Everything> {
    static constexpr bool enabled = true;
    static constexpr const char* name = "Everything";
    static void fields(Fields<fixtures::Everything>& f){
        using E = fixtures::Everything;
        PARAMDEC_FIELD(f, E, Bool);
        PARAMDEC_FIELD(f, E, Int);
        PARAMDEC_FIELD(f, E, Int8);
        PARAMDEC_FIELD(f, E, Int64);
        PARAMDEC_FIELD(f, E, Uint);
        PARAMDEC_FIELD(f, E, Uint8);
        PARAMDEC_FIELD(f, E, Uint64);
        PARAMDEC_FIELD(f, E, Float32);
        PARAMDEC_FIELD(f, E, Float);
        PARAMDEC_FIELD(f, E, Map);
        PARAMDEC_FIELD(f, E, Slice);
        PARAMDEC_FIELD(f, E, String);
        PARAMDEC_FIELD(f, E, Struct);
        PARAMDEC_FIELD(f, E, Tint);
        PARAMDEC_FIELD(f, E, PBool);
        PARAMDEC_FIELD(f, E, PInt);
        PARAMDEC_FIELD(f, E, PUint);
        PARAMDEC_FIELD(f, E, PFloat);
        PARAMDEC_FIELD(f, E, PMap);
        PARAMDEC_FIELD(f, E, PSlice);
        PARAMDEC_FIELD(f, E, PString);
        PARAMDEC_FIELD(f, E, PStruct);
        PARAMDEC_FIELD(f, E, PTint);
        PARAMDEC_FIELD(f, E, PPInt);
        PARAMDEC_FIELD(f, E, ALevel);
        PARAMDEC_FIELD(f, E, AMask);
        PARAMDEC_FIELD(f, E, ALabel);
        PARAMDEC_FIELD(f, E, AMap);
        PARAMDEC_FIELD(f, E, ASlice);
        PARAMDEC_FIELD(f, E, StructMap);
        PARAMDEC_FIELD(f, E, Palette);
    }
};

template <> struct record<fixtures::Crazy> {
    static constexpr bool enabled = true;
    static constexpr const char* name = "Crazy";
    static void fields(Fields<fixtures::Crazy>& f){
        PARAMDEC_FIELD(f, fixtures::Crazy, A);
        PARAMDEC_FIELD(f, fixtures::Crazy, B);
        PARAMDEC_FIELD(f, fixtures::Crazy, Value);
        PARAMDEC_FIELD(f, fixtures::Crazy, Slice);
        PARAMDEC_FIELD(f, fixtures::Crazy, Map);
    }
};

template <> struct record<fixtures::Base> {
    static constexpr bool enabled = true;
    static constexpr const char* name = "Base";
    static void fields(Fields<fixtures::Base>& f){ PARAMDEC_FIELD(f, fixtures::Base, Id); }
};

template <> struct record<fixtures::Tagged> {
    static constexpr bool enabled = true;
    static constexpr const char* name = "Tagged";
    static void fields(Fields<fixtures::Tagged>& f){
        using T = fixtures::Tagged;
        f.embed<fixtures::Base>();
        PARAMDEC_FIELD(f, T, Plain);
        PARAMDEC_FIELD(f, T, Renamed).param("renamed");
        PARAMDEC_FIELD(f, T, Jsoned).json("jsoned,omitempty");
        PARAMDEC_FIELD(f, T, JsonOptionsOnly).json(",omitempty");
        PARAMDEC_FIELD(f, T, ParamWins).param("p").json("j");
        PARAMDEC_FIELD(f, T, Skipped).param("-");
        PARAMDEC_FIELD(f, T, JsonSkipped).json("-");
        PARAMDEC_FIELD(f, T, secret).hidden();
        PARAMDEC_FIELD(f, T, First).param("dup");
        PARAMDEC_FIELD(f, T, Second).param("dup");
    }
};

template <> struct record<fixtures::IntKeyed> {
    static constexpr bool enabled = true;
    static constexpr const char* name = "IntKeyed";
    static void fields(Fields<fixtures::IntKeyed>& f){ PARAMDEC_FIELD(f, fixtures::IntKeyed, Bad); }
};

template <> struct record<fixtures::OptionalIntKeyed> {
    static constexpr bool enabled = true;
    static constexpr const char* name = "OptionalIntKeyed";
    static void fields(Fields<fixtures::OptionalIntKeyed>& f){ PARAMDEC_FIELD(f, fixtures::OptionalIntKeyed, Bad); }
};

template <> struct record<fixtures::HasArray> {
    static constexpr bool enabled = true;
    static constexpr const char* name = "HasArray";
    static void fields(Fields<fixtures::HasArray>& f){ PARAMDEC_FIELD(f, fixtures::HasArray, Bad); }
};

template <> struct record<fixtures::Inner> {
    static constexpr bool enabled = true;
    static constexpr const char* name = "Inner";
    static void fields(Fields<fixtures::Inner>& f){ PARAMDEC_FIELD(f, fixtures::Inner, A); }
};

template <> struct record<fixtures::NestedUnsupported> {
    static constexpr bool enabled = true;
    static constexpr const char* name = "NestedUnsupported";
    static void fields(Fields<fixtures::NestedUnsupported>& f){ PARAMDEC_FIELD(f, fixtures::NestedUnsupported, Bad); }
};

template <> struct record<fixtures::Deferred> {
    static constexpr bool enabled = true;
    static constexpr const char* name = "Deferred";
    static void fields(Fields<fixtures::Deferred>& f){
        PARAMDEC_FIELD(f, fixtures::Deferred, Bad);
        PARAMDEC_FIELD(f, fixtures::Deferred, Outer);
        PARAMDEC_FIELD(f, fixtures::Deferred, Nested);
    }
};

} // namespace paramdec

namespace fixtures {

// Decoder over a private cache with default configuration.
struct Harness {
    paramdec::RecordCache cache;
    paramdec::Decoder decoder{cache, paramdec::DecodeEnv{}};
};

// Run f and return the E it throws, if any.
template <typename E, typename F>
std::optional<E> capture(F&& f){
    try {
        f();
    } catch(const E& e) {
        return e;
    }
    return std::nullopt;
}

} // namespace fixtures
