#ifndef SRC_RECORDC_HASH_HPP_
#define SRC_RECORDC_HASH_HPP_

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace recordc {

struct RecordSchema;

using Hash = std::uint32_t;

Hash hash(std::string_view text, Hash seed = 0);
Hash hash(const char* text, size_t length, Hash seed = 0);

// Stable over the record name and every field name and declared type, in order. Used to name build workspaces.
Hash fingerprint(const RecordSchema& schema);

} // namespace recordc

#endif // SRC_RECORDC_HASH_HPP_
