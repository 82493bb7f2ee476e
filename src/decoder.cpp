#include "paramdec/paramdec.hpp"
#include "paramdec/keypath.hpp"
#include "paramdec/log.hpp"

namespace paramdec {

Decoder::Decoder() : cache_(&RecordCache::shared()), env_(detect_env()) {}

Decoder::Decoder(RecordCache& cache, DecodeEnv env) : cache_(&cache), env_(env) {}

void Decoder::decode_root(const Values& values, const Shape& shape, void* target) const {
    if(shape.kind != Shape::Kind::Record)
        throw invalid_shape_error(std::string(), shape.name, "target must be a record");
    DecodeContext ctx{*cache_, env_};
    FieldTablePtr table = cache_->resolve(shape, env_);
    PARAMDEC_LOG_TRACE(env_, "decode", "%zu keys into %s", values.size(), shape.name.c_str());
    for(const auto& [key, vals] : values){
        auto split = split_head(key);
        decode_field(ctx, *table, key, split.head, split.tail, vals, target);
    }
}

DecodeResult Decoder::guarded(const std::function<void()>& body) const {
    DecodeResult r;
    try {
        body();
    } catch(const decode_error& e) {
        r.success = false;
        r.errors.push_back(to_diagnostic(e));
        PARAMDEC_LOG_TRACE(env_, "decode", "%s %s error: %s", e.code(), to_string(e.kind()), e.what());
    }
    maybe_print_json(r, env_);
    return r;
}

} // namespace paramdec
