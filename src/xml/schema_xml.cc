#include "sqlcomplete/xml/schema_xml.h"

#include <flatbuffers/flatbuffer_builder.h>

#include <string>
#include <string_view>
#include <vector>

#include "sqlcomplete/utils/console.h"

namespace sqlcomplete::xml {

std::unique_ptr<flatbuffers::DetachedBuffer> PackSchemaDescriptor(const pugi::xml_node& schema) {
    flatbuffers::FlatBufferBuilder fb;
    std::vector<std::string> databases, keywords, special_commands;
    std::vector<flatbuffers::Offset<proto::SchemaRelation>> relations;
    std::vector<flatbuffers::Offset<proto::SchemaFunction>> functions;

    for (auto node : schema.children()) {
        std::string_view tag = node.name();
        std::string name = node.attribute("name").as_string();
        if (tag == "database") {
            databases.push_back(std::move(name));
        } else if (tag == "table" || tag == "view") {
            std::vector<std::string> columns;
            for (auto column : node.children("column")) {
                columns.emplace_back(column.attribute("name").as_string());
            }
            auto kind = tag == "view" ? proto::RelationKind::VIEW : proto::RelationKind::TABLE;
            auto name_ofs = fb.CreateString(name);
            auto columns_ofs = fb.CreateVectorOfStrings(columns);
            relations.push_back(proto::CreateSchemaRelation(fb, name_ofs, kind, columns_ofs));
        } else if (tag == "function") {
            auto schema_ofs = fb.CreateString(node.attribute("schema").as_string());
            auto name_ofs = fb.CreateString(name);
            functions.push_back(proto::CreateSchemaFunction(fb, schema_ofs, name_ofs));
        } else if (tag == "keyword") {
            keywords.push_back(std::move(name));
        } else if (tag == "special") {
            special_commands.push_back(std::move(name));
        } else {
            console::log(std::string{"unknown schema element: "} + std::string{tag});
        }
    }

    auto databases_ofs = fb.CreateVectorOfStrings(databases);
    auto relations_ofs = fb.CreateVector(relations);
    auto functions_ofs = fb.CreateVector(functions);
    auto keywords_ofs = fb.CreateVectorOfStrings(keywords);
    auto special_ofs = fb.CreateVectorOfStrings(special_commands);
    fb.Finish(proto::CreateSchemaDescriptor(fb, databases_ofs, relations_ofs, functions_ofs, keywords_ofs, special_ofs));
    return std::make_unique<flatbuffers::DetachedBuffer>(fb.Release());
}

proto::StatusCode LoadCatalog(const pugi::xml_node& schema, Catalog& catalog) {
    auto buffer = PackSchemaDescriptor(schema);
    auto* descriptor = flatbuffers::GetRoot<proto::SchemaDescriptor>(buffer->data());
    return catalog.Load(*descriptor);
}

}  // namespace sqlcomplete::xml
