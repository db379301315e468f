#pragma once
#include <optional>
#include <stdexcept>
#include <vector>
#include "memory/types.hpp"

namespace memsync::storage {
class MemoryStorage;
}

namespace memsync::memory {

// Raised for content the ladder cannot reduce (anything but string/object)
class CompressionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Deterministic compression ladder.
 *
 * compress(entry, L) applies every rung above the entry's current level up
 * to and including L, so a higher level never yields larger output than a
 * lower one for content past the rung thresholds. String rungs only take
 * effect when they actually shrink the text; REFERENCE_ONLY always replaces
 * the text with a pointer to the content hash.
 */
class CompressionEngine {
public:
    static MemoryEntry compress(const MemoryEntry& entry, CompressionLevel level);

    // Restores REFERENCE_ONLY entries through the storage hash index.
    // Returns nullopt for lossy levels or when the original is gone.
    static std::optional<MemoryEntry> decompress(const MemoryEntry& entry,
                                                 storage::MemoryStorage& storage);

    // LIGHT .. REFERENCE_ONLY, in escalation order
    static const std::vector<CompressionLevel>& escalation_levels();

    static std::string reference_string(const std::string& content_hash);
};

} // namespace memsync::memory
