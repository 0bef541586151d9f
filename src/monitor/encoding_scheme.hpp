#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <optional>

/**
 * Any 1 of `factor` full copies suffices.
 */
struct Replication
{
    uint32_t factor;
};

/**
 * Any `k` of `k + m` shards suffice; survives up to `m` losses.
 */
struct ReedSolomon
{
    uint32_t k;
    uint32_t m;
};

/**
 * Any `data` of `data + parity` shards suffice.
 */
struct XorParity
{
    uint32_t data;
    uint32_t parity;
};

/**
 * Encoding scheme of a stored file.
 * 
 * Declared when the file is uploaded and never changes afterwards.
 * Consumers must handle every alternative (use std::visit).
 */
using EncodingScheme = std::variant<Replication, ReedSolomon, XorParity>;

namespace Schemes
{
    /**
     * Minimum number of online shards needed to reconstruct a file
     * (i.e. the quorum).
     */
    uint32_t neededShards(const EncodingScheme &scheme);

    /**
     * Number of shards the scheme produces on upload.
     */
    uint32_t declaredShards(const EncodingScheme &scheme);

    /**
     * Number of shard losses a fully-online file can tolerate.
     */
    uint32_t toleratedFailures(const EncodingScheme &scheme);

    /**
     * Catalog name of the scheme's algorithm, e.g. "reed-solomon".
     */
    std::string algorithmName(const EncodingScheme &scheme);

    /**
     * Human-readable form, e.g. "reed-solomon(k=4, m=2)".
     */
    std::string describe(const EncodingScheme &scheme);

    /**
     * Returns an error message if `scheme` breaks the invariants
     * (k >= 1, factor >= 1, data >= 1), nullopt otherwise.
     */
    std::optional<std::string> validate(const EncodingScheme &scheme);
}

namespace EncodingSchemeTests
{
    void testNeededShards();
    void testToleratedFailures();
    void testValidate();
    void runAll();
}
