// paramdec: decode bracket-keyed form values ("foo[bar][]") into registered records.
#pragma once
#include <functional>
#include <string_view>
#include "paramdec/decode.hpp"
#include "paramdec/diagnostics_json.hpp"
#include "paramdec/env.hpp"
#include "paramdec/errors.hpp"
#include "paramdec/record.hpp"
#include "paramdec/record_cache.hpp"
#include "paramdec/shape.hpp"
#include "paramdec/values.hpp"

namespace paramdec {

class Decoder {
public:
    // Shared cache, configuration from the environment.
    Decoder();
    explicit Decoder(RecordCache& cache, DecodeEnv env = detect_env());

    // Decode every key of values into target. The first failure throws a
    // decode_error; keys applied before it stay applied.
    template <typename T>
    void decode_into(const Values& values, T& target) const {
        decode_root(values, shape_of<T>(), &target);
    }

    template <typename T>
    void decode_into(const Values& values, T* target) const {
        if(!target) throw invalid_shape_error(std::string(), shape_of<T>().name, "target may not be a null pointer");
        decode_root(values, shape_of<T>(), target);
    }

    // Like decode_into, reporting decode errors as diagnostics instead of throwing.
    template <typename Target>
    DecodeResult try_decode_into(const Values& values, Target&& target) const {
        return guarded([&]{ decode_into(values, target); });
    }

    // parse_query, then decode_into. query_error propagates.
    template <typename Target>
    void decode_query(std::string_view query, Target&& target) const {
        decode_into(parse_query(query), target);
    }

    RecordCache& cache() const { return *cache_; }
    const DecodeEnv& env() const { return env_; }

private:
    void decode_root(const Values& values, const Shape& shape, void* target) const;
    DecodeResult guarded(const std::function<void()>& body) const;

    RecordCache* cache_;
    DecodeEnv env_;
};

template <typename T>
void decode_into(const Values& values, T& target){
    Decoder().decode_into(values, target);
}

template <typename T>
void decode_into(const Values& values, T* target){
    Decoder().decode_into(values, target);
}

} // namespace paramdec
