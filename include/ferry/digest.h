#pragma once

#include "error.h"
#include "types.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>

namespace ferry {

// ---------------------------------------------------------------------------
// Hasher: streaming digest
// ---------------------------------------------------------------------------

/// Incremental digest computation. Feeding the same bytes in any split
/// produces the same Digest.
class Hasher {
public:
    virtual ~Hasher() = default;

    virtual void update(const uint8_t* data, size_t len) = 0;

    /// Finalize and return the digest. The hasher must not be reused.
    virtual Digest finish() = 0;

    /// Create a hasher for `algo`.
    static std::unique_ptr<Hasher> create(HashAlgorithm algo);
};

/// Digest length in bytes for `algo`.
size_t digest_size(HashAlgorithm algo);

/// Stream the file at `path` through `algo`, reading `chunk_size` bytes at a
/// time. The chunk size never changes the result.
/// @throws ValidationError if chunk_size is 0.
/// @throws FilesystemError if the file cannot be opened or read.
Digest fingerprint(const std::filesystem::path& path,
                   HashAlgorithm algo,
                   size_t chunk_size = DEFAULT_CHUNK_SIZE);

/// Digest an in-memory buffer.
Digest fingerprint_bytes(const void* data, size_t len, HashAlgorithm algo);

} // namespace ferry
