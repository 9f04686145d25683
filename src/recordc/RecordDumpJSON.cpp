#include "recordc/RecordDumpJSON.hpp"

#include "rapidjson/prettywriter.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/writer.h"

namespace recordc {

class RecordDumpJSON::Impl {
public:
    ~Impl() = default;

    void dump(const ResolvedSchema& schema, const ParsedRecord& record, bool prettyPrint) {
        m_buffer.Clear();
        if (prettyPrint) {
            rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(m_buffer);
            write(schema, record, writer);
        } else {
            rapidjson::Writer<rapidjson::StringBuffer> writer(m_buffer);
            write(schema, record, writer);
        }
    }

    std::string_view json() const { return std::string_view(m_buffer.GetString(), m_buffer.GetSize()); }

private:
    rapidjson::StringBuffer m_buffer;

    template <typename W> void write(const ResolvedSchema& schema, const ParsedRecord& record, W& writer) {
        writer.StartObject();
        for (const auto& field : schema.fields) {
            auto iter = record.find(field.name);
            if (iter == record.end()) { continue; }

            writer.Key(field.name.data(), static_cast<rapidjson::SizeType>(field.name.size()));
            const auto& value = iter->second;
            switch (value.kind()) {
            case FieldKind::kString:
            case FieldKind::kInteger:
                writer.String(value.text().data(), static_cast<rapidjson::SizeType>(value.text().size()));
                break;

            case FieldKind::kBoolean:
                writer.Bool(value.getBool());
                break;
            }
        }
        writer.EndObject();
    }
};

RecordDumpJSON::RecordDumpJSON(): m_impl(std::make_unique<RecordDumpJSON::Impl>()) {}

RecordDumpJSON::~RecordDumpJSON() {}

void RecordDumpJSON::dump(const ResolvedSchema& schema, const ParsedRecord& record, bool prettyPrint) {
    m_impl->dump(schema, record, prettyPrint);
}

std::string_view RecordDumpJSON::json() const { return m_impl->json(); }

} // namespace recordc
