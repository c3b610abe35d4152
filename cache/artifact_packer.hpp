#pragma once

// ============================================================
// artifact_packer.hpp -- Build the transfer artifact when needed
// ============================================================

#include "artifact_cache.hpp"
#include <string>

struct PackResult {
    bool       rebuilt{false};
    CacheEntry entry;
};

class ArtifactPacker {
public:
    explicit ArtifactPacker(ArtifactCache& cache) : cache_(cache) {}

    // Ensure 'artifact' is current. With a non-empty 'source', the source
    // is zstd-compressed into the artifact when the cache says so, when the
    // source is newer than the artifact, or when force is set. Without a
    // source, the artifact must exist and a stale entry is re-recorded.
    // Throws std::runtime_error.
    PackResult prepare(const std::string& artifact, const std::string& source, bool force);

private:
    ArtifactCache& cache_;
};
