#include "recordc/Hash.hpp"

#include "recordc/Schema.hpp"

#include "xxhash.h"

namespace recordc {

Hash hash(std::string_view text, Hash seed) {
    return hash(text.data(), text.size(), seed);
}

Hash hash(const char* text, size_t length, Hash seed) {
    return XXH32(text, length, seed);
}

Hash fingerprint(const RecordSchema& schema) {
    // Each name seeds the hash of the next.
    Hash h = hash(schema.name);
    for (const auto& field : schema.fields) {
        h = hash(field.name, h ^ 0x3a);
        h = hash(field.type, h ^ 0x7c);
    }
    return h;
}

} // namespace recordc
