#pragma once

#include <cpprest/json.h>

#include <string>
#include <vector>
#include <optional>

#include "encoding_scheme.hpp"
#include "ingest_defaults.hpp"

using namespace web;

/**
 * Reference to one shard of a file.
 * 
 * NOTE:
 * 
 * `nodeId` is a weak link into the node registry - the node may not exist 
 * in a given snapshot. A shard's online status is never stored, it's 
 * derived from the node's state (see HealthEvaluator).
 */
struct ShardRef
{
    /* 0-based, unique within its file */
    uint32_t index;

    /* node (bucket) the shard is stored on */
    std::string nodeId;

    uint64_t sizeBytes;

    /* object name and download url of the shard on its node */
    std::string filename;
    std::string url;

    std::string uploadedAt;

    ShardRef();
    ShardRef(uint32_t index, std::string nodeId, uint64_t sizeBytes);
};

/**
 * Represents a file in the catalog and where its shards live.
 */
class FileRecord
{
public:
    std::string id;
    std::string filename;
    uint64_t originalSizeBytes;

    /* algorithm name exactly as the catalog reports it */
    std::string algorithm;

    /**
     * Encoding scheme of the file.
     * 
     * Empty if the catalog record carries no usable scheme configuration;
     * `schemeIssue` then says why. Such files are never given a guessed scheme.
     */
    std::optional<EncodingScheme> scheme;
    std::string schemeIssue;

    /* true if the payload was compressed before encoding */
    bool compressed;

    /* shards in index order */
    std::vector<ShardRef> shards;

    /* storage-overhead multiplier */
    double costEstimate;

    std::string uploadedAt;

    FileRecord();
    FileRecord(std::string id, std::string filename, EncodingScheme scheme, std::vector<ShardRef> shards);

    /* Returns human-readable representation of the file */
    std::string toString() const;

    /**
     * Decodes one catalog record (one entry of `GET /files`).
     * 
     * Throws std::runtime_error if the record has no `id`.
     */
    static FileRecord fromJson(const json::value &obj);

    /**
     * Decodes a `GET /files` response. Records without an id are 
     * skipped (and logged).
     */
    static std::vector<FileRecord> listFromJson(const json::value &response);

    /**
     * Derives the encoding scheme from a catalog `algorithm` name and its
     * `config` object. `shardCount` is the number of shards recorded for 
     * the file, used where the config leaves a shard count implicit.
     * 
     * Returns nullopt (and sets `issue`) when no scheme can be derived 
     * without guessing.
     */
    static std::optional<EncodingScheme> parseScheme(
        const std::string &algorithm,
        const json::value &config,
        uint32_t shardCount,
        std::string &issue
    );
};

namespace FileRecordTests
{
    void testParseScheme();
    void testMissingSchemeConfig();
    void testFileFromJson();
    void testListFromJson();
    void runAll();
}
