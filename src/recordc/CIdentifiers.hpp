#ifndef SRC_RECORDC_C_IDENTIFIERS_HPP_
#define SRC_RECORDC_C_IDENTIFIERS_HPP_

#include <string_view>

namespace recordc {

// True for C99 keywords, for identifiers reserved to the implementation (leading double underscore or underscore and
// capital), and for object-like macros defined by the headers the generated code includes. None of these can name a
// struct member.
bool isCKeywordOrMacro(std::string_view name);

// True if a record type with this name would clash with the generated code. That covers everything
// isCKeywordOrMacro() rejects, C library functions and types, the generated functions and their rc_ helpers, and names
// ending in _t.
bool isReservedRecordName(std::string_view name);

} // namespace recordc

#endif // SRC_RECORDC_C_IDENTIFIERS_HPP_
