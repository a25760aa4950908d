#include "docsum/chunk_serializer.h"
#include "docsum/json_types.h"

namespace docsum {

std::string ChunkSerializer::serialize_chunks(const std::vector<Chunk>& chunks,
                                              const std::string& source,
                                              bool pretty) {
    JsonBuilder builder;
    auto& doc = *builder.document();
    auto& alloc = builder.allocator();

    doc.AddMember("source", builder.make_string(source), alloc);
    doc.AddMember("total_chunks", static_cast<uint64_t>(chunks.size()), alloc);

    JsonValue items(rapidjson::kArrayType);
    items.Reserve(static_cast<rapidjson::SizeType>(chunks.size()), alloc);

    for (const auto& chunk : chunks) {
        JsonValue item(rapidjson::kObjectType);
        item.AddMember("text", builder.make_string(chunk.text), alloc);

        JsonValue meta(rapidjson::kObjectType);
        meta.AddMember("index", static_cast<uint64_t>(chunk.index), alloc);
        meta.AddMember("token_estimate", chunk.token_estimate, alloc);
        meta.AddMember("char_count", static_cast<uint64_t>(chunk.text.size()), alloc);
        meta.AddMember("overlap_length", static_cast<uint64_t>(chunk.overlap_length), alloc);
        item.AddMember("meta", meta, alloc);

        items.PushBack(item, alloc);
    }

    doc.AddMember("chunks", items, alloc);
    return builder.serialize(pretty);
}

} // namespace docsum
