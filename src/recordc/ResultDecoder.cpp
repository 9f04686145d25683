#include "recordc/ResultDecoder.hpp"

#include "recordc/ErrorReporter.hpp"

#include "spdlog/spdlog.h"

#include <string>

namespace recordc {

// static
std::optional<ParsedRecord> ResultDecoder::decode(std::string_view output, const std::vector<Field>& fields,
        ErrorReporter* errorReporter) {
    auto line = trim(output);
    auto tokens = split(line);

    if (tokens.front() != kSuccessSentinel) {
        if (output.find(kFailureSentinel) != std::string_view::npos) {
            errorReporter->addError(Error::kParseFailureSentinel, "Failed to parse JSON", std::string(output));
        } else {
            errorReporter->addError(Error::kMalformedOutput, "parser output missing status sentinel",
                    std::string(output));
        }
        return std::nullopt;
    }

    ParsedRecord record;
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i + 1 >= tokens.size()) {
            SPDLOG_DEBUG("Output has {} values for {} fields, truncating", tokens.size() - 1, fields.size());
            break;
        }
        std::string value(tokens[i + 1]);
        const auto& field = fields[i];
        switch (field.kind) {
        case FieldKind::kString:
            record.emplace(field.name, Value::makeString(std::move(value)));
            break;
        case FieldKind::kInteger:
            record.emplace(field.name, Value::makeInteger(std::move(value)));
            break;
        case FieldKind::kBoolean:
            record.emplace(field.name, Value::makeBoolean(value == "true"));
            break;
        }
    }

    return record;
}

// static
std::vector<std::string_view> ResultDecoder::split(std::string_view line) {
    std::vector<std::string_view> tokens;
    size_t begin = 0;
    size_t end = line.find(kDelimiter);
    while (end != std::string_view::npos) {
        tokens.emplace_back(line.substr(begin, end - begin));
        begin = end + 1;
        end = line.find(kDelimiter, begin);
    }
    tokens.emplace_back(line.substr(begin));
    return tokens;
}

// static
std::string_view ResultDecoder::trim(std::string_view text) {
    const char* whitespace = " \t\r\n";
    auto begin = text.find_first_not_of(whitespace);
    if (begin == std::string_view::npos) { return std::string_view(); }
    auto end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}

} // namespace recordc
