#ifndef SRC_RECORDC_RECORD_DUMP_JSON_HPP_
#define SRC_RECORDC_RECORD_DUMP_JSON_HPP_

#include "recordc/Schema.hpp"
#include "recordc/Value.hpp"

#include <memory>
#include <string_view>

namespace recordc {

// Serializes a ParsedRecord as a JSON object with members in schema field order. Fields missing from the record are
// left out. Booleans are JSON booleans, strings and integers are JSON strings, so integer text is never reinterpreted.
class RecordDumpJSON {
public:
    RecordDumpJSON();
    ~RecordDumpJSON();

    void dump(const ResolvedSchema& schema, const ParsedRecord& record, bool prettyPrint);

    std::string_view json() const;

private:
    // pImpl pattern to protect including headers from contaminating json
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace recordc

#endif // SRC_RECORDC_RECORD_DUMP_JSON_HPP_
