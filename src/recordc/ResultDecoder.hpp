#ifndef SRC_RECORDC_RESULT_DECODER_HPP_
#define SRC_RECORDC_RESULT_DECODER_HPP_

#include "recordc/Schema.hpp"
#include "recordc/Value.hpp"

#include <optional>
#include <string_view>
#include <vector>

namespace recordc {

class ErrorReporter;

// Decodes the single line an artifact prints: SUCCESS|v1|...|vN. Values are matched to fields by position only.
class ResultDecoder {
public:
    static constexpr std::string_view kSuccessSentinel = "SUCCESS";
    static constexpr std::string_view kFailureSentinel = "ERROR|Failed to parse JSON";
    static constexpr char kDelimiter = '|';

    // Fewer values than fields truncates the result, extra values are ignored. Reports kParseFailureSentinel if the
    // output carries the failure sentinel, kMalformedOutput if it carries neither sentinel.
    static std::optional<ParsedRecord> decode(std::string_view output, const std::vector<Field>& fields,
            ErrorReporter* errorReporter);

    static std::vector<std::string_view> split(std::string_view line);
    static std::string_view trim(std::string_view text);
};

} // namespace recordc

#endif // SRC_RECORDC_RESULT_DECODER_HPP_
