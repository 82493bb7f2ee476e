// Shape descriptors: one immutable, kind-tagged description per destination type.
#pragma once
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <vector>
#include "paramdec/record.hpp"

namespace paramdec {

// Specialize to decode T from a single text value:
//
//   template <> struct paramdec::text_decoder<Color> {
//       static constexpr bool enabled = true;
//       static void decode(Color& out, std::string_view text); // throws on malformed text
//   };
//
// A text decoder takes precedence over every structural kind of T.
template <typename T>
struct text_decoder {
    static constexpr bool enabled = false;
};

struct Shape {
    enum class Kind { Bool, Int, Uint, Float, String, Text, Map, Pointer, Sequence, Record, Unsupported };
    Kind kind;
    std::string name;
    std::type_index id;
    unsigned bits = 0;                                          // Int, Uint, Float
    void (*store_bool)(void*, bool) = nullptr;
    void (*store_int)(void*, int64_t) = nullptr;
    void (*store_uint)(void*, uint64_t) = nullptr;
    void (*store_float)(void*, double) = nullptr;
    void (*store_string)(void*, const std::string&) = nullptr;
    void (*decode_text)(void*, std::string_view) = nullptr;
    const Shape* key = nullptr;                                 // Map
    const Shape* elem = nullptr;                                // Map value, Pointer pointee, Sequence element
    // Map with string keys: move the element out (or value-initialize it), fill it, write it back.
    void (*map_update)(void*, const std::string&, const std::function<void(void*)>&) = nullptr;
    bool (*engaged)(const void*) = nullptr;                     // Pointer
    void* (*emplace)(void*) = nullptr;                          // Pointer, returns the new pointee
    void* (*deref)(void*) = nullptr;                            // Pointer
    // Sequence: fill n fresh elements, then replace the target wholesale.
    void (*rebuild)(void*, size_t, const std::function<void(size_t, void*)>&) = nullptr;
    void (*describe)(std::vector<FieldDecl>&) = nullptr;        // Record
};

inline bool is_leaf(const Shape& s){
    switch(s.kind){
        case Shape::Kind::Bool: case Shape::Kind::Int: case Shape::Kind::Uint:
        case Shape::Kind::Float: case Shape::Kind::String: case Shape::Kind::Text:
            return true;
        default: return false;
    }
}

namespace detail {

std::string demangle(const char* mangled);
template <typename T> std::string type_label(){ return demangle(typeid(T).name()); }

template <typename T>
inline constexpr bool is_string_like_v = std::is_same_v<T, std::string> ||
    (std::is_class_v<T> && std::is_base_of_v<std::string, T> && std::is_convertible_v<T*, std::string*>);

template <typename T> struct is_std_map : std::false_type {};
template <typename K, typename V, typename C, typename A> struct is_std_map<std::map<K, V, C, A>> : std::true_type {};
template <typename K, typename V, typename H, typename E, typename A>
struct is_std_map<std::unordered_map<K, V, H, E, A>> : std::true_type {};

template <typename T> struct is_std_vector : std::false_type {};
template <typename T, typename A> struct is_std_vector<std::vector<T, A>> : std::true_type {};

template <typename T> struct pointer_ops { static constexpr bool value = false; };

template <typename T>
struct pointer_ops<std::optional<T>> {
    static constexpr bool value = true;
    using element = T;
    static constexpr const char* label = "optional";
    static bool engaged(const void* p){ return static_cast<const std::optional<T>*>(p)->has_value(); }
    static void* emplace(void* p){ return &static_cast<std::optional<T>*>(p)->emplace(); }
    static void* deref(void* p){ return &**static_cast<std::optional<T>*>(p); }
};

template <typename T>
struct pointer_ops<std::unique_ptr<T>> {
    static constexpr bool value = true;
    using element = T;
    static constexpr const char* label = "unique_ptr";
    static bool engaged(const void* p){ return *static_cast<const std::unique_ptr<T>*>(p) != nullptr; }
    static void* emplace(void* p){
        auto& up = *static_cast<std::unique_ptr<T>*>(p);
        up = std::make_unique<T>();
        return up.get();
    }
    static void* deref(void* p){ return static_cast<std::unique_ptr<T>*>(p)->get(); }
};

template <typename T>
struct pointer_ops<std::shared_ptr<T>> {
    static constexpr bool value = true;
    using element = T;
    static constexpr const char* label = "shared_ptr";
    static bool engaged(const void* p){ return *static_cast<const std::shared_ptr<T>*>(p) != nullptr; }
    static void* emplace(void* p){
        auto& sp = *static_cast<std::shared_ptr<T>*>(p);
        sp = std::make_shared<T>();
        return sp.get();
    }
    static void* deref(void* p){ return static_cast<std::shared_ptr<T>*>(p)->get(); }
};

template <typename K>
K make_key(const std::string& s){
    if constexpr (std::is_same_v<K, std::string>) return s;
    else {
        K k{};
        static_cast<std::string&>(k) = s;
        return k;
    }
}

template <typename M>
void update_map(void* p, const std::string& key, const std::function<void(void*)>& fill){
    using K = typename M::key_type;
    using V = typename M::mapped_type;
    auto& m = *static_cast<M*>(p);
    K k = make_key<K>(key);
    auto it = m.find(k);
    const bool found = it != m.end();
    V elem = found ? std::move(it->second) : V{};
    try {
        fill(&elem);
    } catch(...) {
        if(found) it->second = std::move(elem);
        throw;
    }
    m.insert_or_assign(std::move(k), std::move(elem));
}

template <typename V>
void rebuild_vector(void* p, size_t n, const std::function<void(size_t, void*)>& fill){
    V fresh;
    fresh.reserve(n);
    for(size_t i=0;i<n;++i){
        typename V::value_type e{};
        fill(i, &e);
        fresh.push_back(std::move(e));
    }
    *static_cast<V*>(p) = std::move(fresh);
}

template <typename T>
Shape base_shape(Shape::Kind kind, std::string name){
    return Shape{kind, std::move(name), std::type_index(typeid(T))};
}

template <typename T>
Shape make_shape(){
    using K = Shape::Kind;
    if constexpr (text_decoder<T>::enabled){
        Shape s = base_shape<T>(K::Text, type_label<T>());
        s.decode_text = [](void* p, std::string_view text){ text_decoder<T>::decode(*static_cast<T*>(p), text); };
        return s;
    } else if constexpr (record<T>::enabled){
        Shape s = base_shape<T>(K::Record, record<T>::name);
        s.describe = &describe_record<T>;
        return s;
    } else if constexpr (std::is_same_v<T, bool>){
        Shape s = base_shape<T>(K::Bool, "bool");
        s.store_bool = [](void* p, bool v){ *static_cast<bool*>(p) = v; };
        return s;
    } else if constexpr (std::is_enum_v<T>){
        using U = std::underlying_type_t<T>;
        if constexpr (std::is_signed_v<U>){
            Shape s = base_shape<T>(K::Int, type_label<T>());
            s.bits = sizeof(U) * 8;
            s.store_int = [](void* p, int64_t v){ *static_cast<T*>(p) = static_cast<T>(static_cast<U>(v)); };
            return s;
        } else {
            Shape s = base_shape<T>(K::Uint, type_label<T>());
            s.bits = sizeof(U) * 8;
            s.store_uint = [](void* p, uint64_t v){ *static_cast<T*>(p) = static_cast<T>(static_cast<U>(v)); };
            return s;
        }
    } else if constexpr (std::is_integral_v<T> && std::is_signed_v<T>){
        Shape s = base_shape<T>(K::Int, "int" + std::to_string(sizeof(T) * 8));
        s.bits = sizeof(T) * 8;
        s.store_int = [](void* p, int64_t v){ *static_cast<T*>(p) = static_cast<T>(v); };
        return s;
    } else if constexpr (std::is_integral_v<T>){
        Shape s = base_shape<T>(K::Uint, "uint" + std::to_string(sizeof(T) * 8));
        s.bits = sizeof(T) * 8;
        s.store_uint = [](void* p, uint64_t v){ *static_cast<T*>(p) = static_cast<T>(v); };
        return s;
    } else if constexpr (std::is_floating_point_v<T>){
        const unsigned bits = sizeof(T) == 4 ? 32 : 64;
        Shape s = base_shape<T>(K::Float, "float" + std::to_string(bits));
        s.bits = bits;
        s.store_float = [](void* p, double v){ *static_cast<T*>(p) = static_cast<T>(v); };
        return s;
    } else if constexpr (is_string_like_v<T>){
        Shape s = base_shape<T>(K::String, std::is_same_v<T, std::string> ? std::string("string") : type_label<T>());
        s.store_string = [](void* p, const std::string& v){ static_cast<std::string&>(*static_cast<T*>(p)) = v; };
        return s;
    } else if constexpr (is_std_map<T>::value){
        using Key = typename T::key_type;
        const Shape& key = shape_of<Key>();
        const Shape& elem = shape_of<typename T::mapped_type>();
        Shape s = base_shape<T>(K::Map, "map<" + key.name + ", " + elem.name + ">");
        s.key = &key;
        s.elem = &elem;
        if constexpr (is_string_like_v<Key>) s.map_update = &update_map<T>;
        return s;
    } else if constexpr (pointer_ops<T>::value){
        using Ops = pointer_ops<T>;
        const Shape& elem = shape_of<typename Ops::element>();
        Shape s = base_shape<T>(K::Pointer, std::string(Ops::label) + "<" + elem.name + ">");
        s.elem = &elem;
        s.engaged = &Ops::engaged;
        s.emplace = &Ops::emplace;
        s.deref = &Ops::deref;
        return s;
    } else if constexpr (is_std_vector<T>::value){
        const Shape& elem = shape_of<typename T::value_type>();
        Shape s = base_shape<T>(K::Sequence, "vector<" + elem.name + ">");
        s.elem = &elem;
        s.rebuild = &rebuild_vector<T>;
        return s;
    } else {
        return base_shape<T>(K::Unsupported, type_label<T>());
    }
}

} // namespace detail

// Shape of T, built on first use and kept for the process lifetime.
template <typename T>
const Shape& shape_of(){
    static const Shape s = detail::make_shape<T>();
    return s;
}

} // namespace paramdec
