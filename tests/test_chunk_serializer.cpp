#include <gtest/gtest.h>
#include <docsum/chunk_serializer.h>
#include <docsum/text_chunker.h>
#include "fake_backend.h"

#include <rapidjson/document.h>

using namespace docsum;

TEST(ChunkSerializerTest, WritesSourceCountAndMeta) {
    std::vector<Chunk> chunks = {
        Chunk{0, "First chunk.", 3, 0},
        Chunk{1, "chunk.Second chunk.", 5, 6},
    };

    std::string output = ChunkSerializer::serialize_chunks(chunks, "notes.txt", false);

    rapidjson::Document doc;
    doc.Parse(output.c_str());
    ASSERT_FALSE(doc.HasParseError());

    EXPECT_STREQ(doc["source"].GetString(), "notes.txt");
    EXPECT_EQ(doc["total_chunks"].GetUint64(), 2u);
    ASSERT_TRUE(doc["chunks"].IsArray());
    ASSERT_EQ(doc["chunks"].Size(), 2u);

    const auto& second = doc["chunks"][1];
    EXPECT_STREQ(second["text"].GetString(), "chunk.Second chunk.");
    EXPECT_EQ(second["meta"]["index"].GetUint64(), 1u);
    EXPECT_EQ(second["meta"]["token_estimate"].GetInt(), 5);
    EXPECT_EQ(second["meta"]["char_count"].GetUint64(), 19u);
    EXPECT_EQ(second["meta"]["overlap_length"].GetUint64(), 6u);
}

TEST(ChunkSerializerTest, EscapesTextAndPrettyPrints) {
    std::vector<Chunk> chunks = {Chunk{0, "line one\n\"quoted\"\ttab", 6, 0}};

    std::string pretty = ChunkSerializer::serialize_chunks(chunks, "-", true);
    EXPECT_NE(pretty.find("\n  \"source\""), std::string::npos);

    rapidjson::Document doc;
    doc.Parse(pretty.c_str());
    ASSERT_FALSE(doc.HasParseError());
    EXPECT_EQ(std::string(doc["chunks"][0]["text"].GetString()), "line one\n\"quoted\"\ttab");
}

TEST(ChunkSerializerTest, EmptyChunkList) {
    std::string output = ChunkSerializer::serialize_chunks({}, "empty.txt", false);

    rapidjson::Document doc;
    doc.Parse(output.c_str());
    ASSERT_FALSE(doc.HasParseError());
    EXPECT_EQ(doc["total_chunks"].GetUint64(), 0u);
    EXPECT_EQ(doc["chunks"].Size(), 0u);
}

TEST(ChunkSerializerTest, SerializesChunkerOutput) {
    ChunkerOptions options;
    options.chunk_size = 50;
    options.chunk_overlap = 5;
    TextChunker chunker(options);

    std::string text = docsum::testing::make_words(30, "alpha") + "\n\n\n" +
                       docsum::testing::make_words(30, "omega");
    auto chunks = chunker.split_chunks(text);
    ASSERT_EQ(chunks.size(), 2u);

    rapidjson::Document doc;
    doc.Parse(ChunkSerializer::serialize_chunks(chunks, "doc.txt").c_str());
    ASSERT_FALSE(doc.HasParseError());
    EXPECT_EQ(doc["total_chunks"].GetUint64(), 2u);
    EXPECT_EQ(doc["chunks"][1]["meta"]["overlap_length"].GetUint64(), 20u);
    EXPECT_EQ(doc["chunks"][1]["meta"]["char_count"].GetUint64(), chunks[1].text.size());
}
