#include "paramdec/record_cache.hpp"
#include "paramdec/errors.hpp"
#include "paramdec/log.hpp"
#include "paramdec/shape.hpp"
#include <mutex>

namespace paramdec {

RecordCache& RecordCache::shared(){
    static RecordCache cache;
    return cache;
}

FieldTablePtr RecordCache::lookup(const Shape& shape) const {
    std::shared_lock lock(mu_);
    auto it = tables_.find(shape.id);
    if(it == tables_.end()){ ++misses_; return nullptr; }
    ++hits_;
    return it->second;
}

static std::string quoted(const std::string& s){ return "\"" + s + "\""; }

// Reject field shapes that could never decode, naming the field and its record.
static void check_field(const Shape& record_shape, const std::string& identifier, const Shape& field_shape){
    const Shape* s = &field_shape;
    while(s->kind == Shape::Kind::Pointer) s = s->elem;
    const std::string where = "field " + quoted(identifier) + " in record " + record_shape.name;
    if(s->kind == Shape::Kind::Unsupported)
        throw invalid_shape_error(std::string(), record_shape.name, where + ": unsupported type " + s->name);
    if(s->kind == Shape::Kind::Map && !s->map_update)
        throw invalid_shape_error(std::string(), record_shape.name, where + ": map keys must be strings, not " + s->key->name);
}

FieldTablePtr RecordCache::build(const Shape& shape){
    if(shape.kind != Shape::Kind::Record)
        throw invalid_shape_error(std::string(), shape.name, "not a record");
    std::vector<FieldDecl> decls;
    shape.describe(decls);
    auto table = std::make_shared<FieldTable>();
    table->record_name = shape.name;
    for(size_t i=0;i<decls.size();++i){
        const FieldDecl& d = decls[i];
        if(!d.exported && !d.embedded) continue;
        std::string name = external_name(d);
        if(name == "-") continue;
        check_field(shape, d.identifier, *d.shape);
        FieldEntry entry{name, i, d.shape, d.slot, route(*d.shape)};
        auto it = table->by_name.find(name);
        if(it != table->by_name.end()){
            // later declaration wins
            table->fields[it->second] = std::move(entry);
            continue;
        }
        table->by_name.emplace(name, table->fields.size());
        table->fields.push_back(std::move(entry));
    }
    return table;
}

FieldTablePtr RecordCache::publish(const Shape& shape, FieldTablePtr table){
    std::unique_lock lock(mu_);
    auto [it, inserted] = tables_.emplace(shape.id, std::move(table));
    if(inserted) ++builds_;
    return it->second;
}

FieldTablePtr RecordCache::resolve(const Shape& shape, const DecodeEnv& env){
    if(auto hit = lookup(shape)){
        PARAMDEC_LOG_TRACE(env, "cache", "hit %s", shape.name.c_str());
        return hit;
    }
    // Two threads may both build here; the first publish wins and both tables are complete.
    FieldTablePtr built = build(shape);
    PARAMDEC_LOG_TRACE(env, "cache", "built %s (%zu fields)", shape.name.c_str(), built->fields.size());
    return publish(shape, std::move(built));
}

size_t RecordCache::size() const {
    std::shared_lock lock(mu_);
    return tables_.size();
}

RecordCache::Stats RecordCache::stats() const {
    return Stats{builds_.load(), hits_.load(), misses_.load()};
}

} // namespace paramdec
