// Per-record field tables, built once and shared across decode calls.
#pragma once
#include <atomic>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <typeindex>
#include <unordered_map>
#include <vector>
#include "paramdec/decode.hpp"
#include "paramdec/env.hpp"

namespace paramdec {

struct Shape;

struct FieldEntry {
    std::string name;       // external name
    size_t index;           // position in the record's declarations
    const Shape* shape;
    void* (*slot)(void* record);
    DecodeFn decode;        // precomputed route(*shape)
};

struct FieldTable {
    std::string record_name;
    std::vector<FieldEntry> fields;
    std::map<std::string, size_t, std::less<>> by_name;

    const FieldEntry* find(std::string_view name) const {
        auto it = by_name.find(name);
        return it == by_name.end() ? nullptr : &fields[it->second];
    }
    std::vector<std::string> names() const {
        std::vector<std::string> out;
        out.reserve(fields.size());
        for(auto& f : fields) out.push_back(f.name);
        return out;
    }
};

using FieldTablePtr = std::shared_ptr<const FieldTable>;

class RecordCache {
public:
    struct Stats { size_t builds; size_t hits; size_t misses; };

    RecordCache() = default;
    RecordCache(const RecordCache&) = delete;
    RecordCache& operator=(const RecordCache&) = delete;

    // Process-wide cache used by default-constructed Decoders.
    static RecordCache& shared();

    // Published table for shape, or nullptr.
    FieldTablePtr lookup(const Shape& shape) const;
    // Derive a table from shape's declarations. Touches no cache state.
    // Throws invalid_shape_error when shape is not a record or a field cannot be decoded.
    static FieldTablePtr build(const Shape& shape);
    // Install table unless another is already present; returns the one that is.
    FieldTablePtr publish(const Shape& shape, FieldTablePtr table);
    // lookup, else build outside any lock and publish.
    FieldTablePtr resolve(const Shape& shape, const DecodeEnv& env = DecodeEnv{});

    size_t size() const;
    Stats stats() const;

private:
    mutable std::shared_mutex mu_;
    std::unordered_map<std::type_index, FieldTablePtr> tables_;
    std::atomic<size_t> builds_{0};
    mutable std::atomic<size_t> hits_{0};
    mutable std::atomic<size_t> misses_{0};
};

} // namespace paramdec
