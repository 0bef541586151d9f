#pragma once

#include <cstdint>

/**
 * Values substituted for fields missing from service responses.
 * 
 * NOTE:
 * 
 * Defaults are applied exactly once, while decoding a response
 * (see StorageNode::fromJson() and FileRecord::fromJson()). Nothing 
 * downstream of decoding re-defaults a field.
 */
namespace IngestDefaults
{
    /* capacity of a node that reports neither capacity_bytes nor capacity_gb */
    const uint64_t NODE_CAPACITY_BYTES = 50ull * 1024 * 1024 * 1024;

    const uint64_t NODE_USED_BYTES = 0;

    const uint32_t NODE_FILE_COUNT = 0;

    /* storage-overhead multiplier of a file with no cost estimate */
    const double FILE_COST_ESTIMATE = 0.0;

    const uint64_t SHARD_SIZE_BYTES = 0;

    const uint64_t BYTES_PER_GB = 1024ull * 1024 * 1024;
}
