// Record registration: declared fields, annotations and slot accessors.
#pragma once
#include <deque>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace paramdec {

struct Shape;
template <typename T> const Shape& shape_of();

// Specialize to make T a decodable record:
//
//   template <> struct paramdec::record<Point> {
//       static constexpr bool enabled = true;
//       static constexpr const char* name = "Point";
//       static void fields(paramdec::Fields<Point>& f) { PARAMDEC_FIELD(f, Point, x); PARAMDEC_FIELD(f, Point, y); }
//   };
template <typename T>
struct record {
    static constexpr bool enabled = false;
};

struct FieldDecl {
    std::string identifier;   // declared name
    std::string param_tag;    // explicit decode name
    std::string json_tag;     // serialization name, "name[,options]"
    bool exported = true;
    bool embedded = false;
    const Shape* shape = nullptr;
    void* (*slot)(void* record) = nullptr;

    FieldDecl& param(std::string name) { param_tag = std::move(name); return *this; }
    FieldDecl& json(std::string tag) { json_tag = std::move(tag); return *this; }
    // Not visible to decoding unless embedded.
    FieldDecl& hidden() { exported = false; return *this; }
};

// Name a field is addressed by: param tag, else the json tag up to its first
// comma, else the declared identifier. "-" means the field is skipped.
std::string external_name(const FieldDecl& f);

namespace detail {
template <typename T> struct member_pointer;
template <typename M, typename C> struct member_pointer<M C::*> {
    using type = M;
    using owner = C;
};
} // namespace detail

template <typename R>
class Fields {
public:
    template <auto Member>
    FieldDecl& add(std::string identifier) {
        using traits = detail::member_pointer<decltype(Member)>;
        static_assert(std::is_base_of_v<typename traits::owner, R>, "member does not belong to this record");
        FieldDecl d;
        d.identifier = std::move(identifier);
        d.shape = &shape_of<typename traits::type>();
        d.slot = [](void* rec) -> void* { return &(static_cast<R*>(rec)->*Member); };
        decls_.push_back(std::move(d));
        return decls_.back();
    }

    // Base class subobject, addressed like a field named after the base type.
    template <typename Base>
    FieldDecl& embed() {
        static_assert(std::is_base_of_v<Base, R>, "embedded type must be a base of the record");
        FieldDecl d;
        d.shape = &shape_of<Base>();
        d.identifier = record<Base>::name;
        d.embedded = true;
        d.slot = [](void* rec) -> void* { return static_cast<Base*>(static_cast<R*>(rec)); };
        decls_.push_back(std::move(d));
        return decls_.back();
    }

    std::vector<FieldDecl> take() { return std::vector<FieldDecl>(std::make_move_iterator(decls_.begin()), std::make_move_iterator(decls_.end())); }

private:
    std::deque<FieldDecl> decls_;
};

namespace detail {
template <typename R>
void describe_record(std::vector<FieldDecl>& out) {
    Fields<R> f;
    record<R>::fields(f);
    out = f.take();
}
} // namespace detail

} // namespace paramdec

// Declare a field under its C++ member name.
#define PARAMDEC_FIELD(fields, Type, member) (fields).template add<&Type::member>(#member)
