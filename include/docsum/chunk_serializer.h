#pragma once

#include "docsum/text_chunker.h"

#include <string>
#include <vector>

namespace docsum {

// Renders chunks as JSON:
// {"source": ..., "total_chunks": N, "chunks": [{"text": ..., "meta": {...}}]}
class ChunkSerializer {
public:
    static std::string serialize_chunks(const std::vector<Chunk>& chunks,
                                        const std::string& source,
                                        bool pretty = true);
};

} // namespace docsum
