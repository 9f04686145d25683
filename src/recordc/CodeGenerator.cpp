#include "recordc/CodeGenerator.hpp"

#include "recordc/CIdentifiers.hpp"
#include "recordc/ErrorReporter.hpp"
#include "recordc/ResultDecoder.hpp"
#include "recordc/Templates.hpp"
#include "recordc/TypeMapper.hpp"
#include "recordc/Validator.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

#include <unordered_set>

namespace recordc {

CodeGenerator::CodeGenerator(std::shared_ptr<ErrorReporter> errorReporter): m_errorReporter(errorReporter) {}

std::optional<std::string> CodeGenerator::generate(const ResolvedSchema& schema) {
    if (!Validator::validate(schema, m_errorReporter.get())) {
        SPDLOG_ERROR("Refusing to generate code for invalid record schema '{}'", schema.name);
        return std::nullopt;
    }

    std::string code;
    try {
        code = renderHeader(schema) + renderImplementation(schema);
    } catch (const fmt::format_error& error) {
        m_errorReporter->addError(Error::kTemplateFailed, fmt::format("failed to generate C code for {}: {}",
                schema.name, error.what()));
        return std::nullopt;
    }

    SPDLOG_DEBUG("Generated {} bytes of C code for record {}", code.size(), schema.name);
    return code;
}

std::optional<std::string> CodeGenerator::generateDriver(const ResolvedSchema& schema, DriverKind driverKind) {
    const char* driverTemplate = driverKind == kProcessDriver ? templates::kProcessDriver : templates::kWorkerDriver;
    try {
        return fmt::format(fmt::runtime(driverTemplate), fmt::arg("header", headerFileName(schema.name)),
                fmt::arg("failure", ResultDecoder::kFailureSentinel));
    } catch (const fmt::format_error& error) {
        m_errorReporter->addError(Error::kTemplateFailed, fmt::format("failed to generate driver for {}: {}",
                schema.name, error.what()));
    }
    return std::nullopt;
}

// static
std::string CodeGenerator::headerFileName(std::string_view recordName) { return fmt::format("{}.h", recordName); }

// static
std::string CodeGenerator::implementationFileName(std::string_view recordName) {
    return fmt::format("{}.c", recordName);
}

// static
std::string CodeGenerator::headerEndMarker(std::string_view recordName) {
    return fmt::format("#endif // {}_H\n", recordName);
}

// static
std::vector<std::string> CodeGenerator::memberNames(const ResolvedSchema& schema) {
    auto headerGuard = fmt::format("{}_H", schema.name);
    auto isReserved = [&headerGuard](std::string_view name) { return isCKeywordOrMacro(name) || name == headerGuard; };

    // Fields that can keep their own name claim it first, so a renamed field never takes a later field's name.
    std::unordered_set<std::string> taken;
    for (const auto& field : schema.fields) {
        if (!isReserved(field.name)) { taken.emplace(field.name); }
    }

    std::vector<std::string> members;
    members.reserve(schema.fields.size());
    for (const auto& field : schema.fields) {
        if (!isReserved(field.name)) {
            members.emplace_back(field.name);
            continue;
        }
        auto member = fmt::format("{}_", field.name);
        if (isReserved(member)) { member = fmt::format("f_{}", field.name); }
        while (taken.count(member)) { member += "_"; }
        taken.emplace(member);
        members.emplace_back(std::move(member));
    }
    return members;
}

std::string CodeGenerator::renderHeader(const ResolvedSchema& schema) {
    auto names = memberNames(schema);
    std::string members;
    for (size_t i = 0; i < schema.fields.size(); ++i) {
        members += fmt::format(fmt::runtime(templates::kMember),
                fmt::arg("ctype", TypeMapper::cTypeName(schema.fields[i].kind)), fmt::arg("member", names[i]));
    }

    return fmt::format(fmt::runtime(templates::kHeader), fmt::arg("name", schema.name),
            fmt::arg("members", members));
}

std::string CodeGenerator::renderImplementation(const ResolvedSchema& schema) {
    std::string matchers;
    std::string releases;
    std::string serializers;

    auto names = memberNames(schema);
    for (size_t i = 0; i < schema.fields.size(); ++i) {
        const auto& field = schema.fields[i];
        const auto& member = names[i];
        const char* matchTemplate = nullptr;
        const char* serializeTemplate = nullptr;
        switch (field.kind) {
        case FieldKind::kString:
            matchTemplate = templates::kMatchString;
            serializeTemplate = templates::kSerializeString;
            releases += fmt::format(fmt::runtime(templates::kReleaseString), fmt::arg("member", member));
            break;
        case FieldKind::kInteger:
            matchTemplate = templates::kMatchInteger;
            serializeTemplate = templates::kSerializeInteger;
            break;
        case FieldKind::kBoolean:
            matchTemplate = templates::kMatchBoolean;
            serializeTemplate = templates::kSerializeBoolean;
            break;
        }
        matchers += fmt::format(fmt::runtime(matchTemplate), fmt::arg("field", field.name),
                fmt::arg("member", member));
        serializers += fmt::format(fmt::runtime(serializeTemplate), fmt::arg("member", member));
    }

    return fmt::format(fmt::runtime(templates::kImplementation), fmt::arg("name", schema.name),
            fmt::arg("header", headerFileName(schema.name)), fmt::arg("matchers", matchers),
            fmt::arg("releases", releases), fmt::arg("serializers", serializers),
            fmt::arg("success", ResultDecoder::kSuccessSentinel));
}

} // namespace recordc
