#include <cpprest/json.h>

#include <iostream>
#include <set>
#include <algorithm>
#include <functional>

#include "file_record.hpp"
#include "utils.hpp"
#include "test_utils.hpp"

using namespace web;

////////////////////////////////////////////
// ShardRef methods
////////////////////////////////////////////

ShardRef::ShardRef()
    : index(0),
      nodeId(),
      sizeBytes(IngestDefaults::SHARD_SIZE_BYTES)
{
}

ShardRef::ShardRef(uint32_t index, std::string nodeId, uint64_t sizeBytes)
    : index(index),
      nodeId(nodeId),
      sizeBytes(sizeBytes)
{
}

////////////////////////////////////////////
// FileRecord methods
////////////////////////////////////////////

FileRecord::FileRecord()
    : originalSizeBytes(0),
      scheme(),
      compressed(false),
      shards(),
      costEstimate(IngestDefaults::FILE_COST_ESTIMATE)
{
}

FileRecord::FileRecord(std::string id, std::string filename, EncodingScheme scheme, std::vector<ShardRef> shards)
    : id(id),
      filename(filename),
      originalSizeBytes(0),
      algorithm(Schemes::algorithmName(scheme)),
      scheme(scheme),
      compressed(false),
      shards(std::move(shards)),
      costEstimate(IngestDefaults::FILE_COST_ESTIMATE)
{
}

std::string FileRecord::toString() const
{
    std::string schemeText = scheme ? Schemes::describe(*scheme) : "unknown scheme (" + schemeIssue + ")";
    return "file: " + id + " (" + filename + ", " + schemeText + ", " + std::to_string(shards.size()) + " shards)";
}

std::optional<EncodingScheme> FileRecord::parseScheme(
    const std::string &algorithm,
    const json::value &config,
    uint32_t shardCount,
    std::string &issue
)
{
    /**
     * Normalise the catalog's algorithm name, e.g. "Reed-Solomon+compress"
     * -> "reed-solomon".
     */
    std::string name = StringUtils::toLower(algorithm);
    size_t compressPos = name.find("+compress");
    if (compressPos != std::string::npos)
        name.erase(compressPos, std::string("+compress").size());

    std::optional<EncodingScheme> scheme;

    if (name == "replication" || name == "replicate")
    {
        int64_t factor = ApiUtils::intField(config, "replication_factor", -1);
        if (factor < 0)
        {
            // the factor doesn't change the quorum (1), only the shard count
            factor = shardCount;
            std::cout << "[ingest] replication_factor missing, using recorded shard count " 
                      << shardCount << std::endl;
        }
        scheme = Replication{static_cast<uint32_t>(factor)};
    }
    else if (name.find("reed") != std::string::npos && name.find("solo") != std::string::npos)
    {
        int64_t k = ApiUtils::intField(config, "k", -1);
        if (k < 0)
        {
            issue = "reed-solomon config has no k";
            return std::nullopt;
        }

        int64_t m = ApiUtils::intField(config, "m", -1);
        if (m < 0)
        {
            m = shardCount > k ? shardCount - k : 0;
            std::cout << "[ingest] reed-solomon m missing, using " << m 
                      << " from recorded shard count" << std::endl;
        }
        scheme = ReedSolomon{static_cast<uint32_t>(k), static_cast<uint32_t>(m)};
    }
    else if (name.find("xor") != std::string::npos)
    {
        int64_t data = ApiUtils::intField(config, "data", ApiUtils::intField(config, "k", -1));
        if (data < 0)
        {
            issue = "xor-parity config has no data shard count";
            return std::nullopt;
        }

        int64_t parity = ApiUtils::intField(config, "parity", ApiUtils::intField(config, "m", -1));
        if (parity < 0)
        {
            parity = shardCount > data ? shardCount - data : 0;
            std::cout << "[ingest] xor-parity parity count missing, using " << parity 
                      << " from recorded shard count" << std::endl;
        }
        scheme = XorParity{static_cast<uint32_t>(data), static_cast<uint32_t>(parity)};
    }
    else
    {
        issue = algorithm.empty() ? "no algorithm recorded" : "unknown algorithm '" + algorithm + "'";
        return std::nullopt;
    }

    std::optional<std::string> invalid = Schemes::validate(*scheme);
    if (invalid)
    {
        issue = *invalid;
        return std::nullopt;
    }
    return scheme;
}

FileRecord FileRecord::fromJson(const json::value &obj)
{
    FileRecord record;

    record.id = ApiUtils::stringField(obj, "id", "");
    if (record.id.empty())
        throw std::runtime_error("file record without id");

    record.filename = ApiUtils::stringField(obj, "filename", record.id);

    int64_t originalSize = ApiUtils::intField(obj, "original_size", ApiUtils::intField(obj, "size", 0));
    record.originalSizeBytes = originalSize > 0 ? static_cast<uint64_t>(originalSize) : 0;

    record.algorithm = ApiUtils::stringField(obj, "algorithm", ApiUtils::stringField(obj, "algorithm_used", ""));
    record.costEstimate = ApiUtils::doubleField(obj, "cost_estimate", IngestDefaults::FILE_COST_ESTIMATE);
    record.uploadedAt = ApiUtils::stringField(obj, "uploaded_at", ApiUtils::stringField(obj, "created_at", ""));

    /**
     * The config may be stored as a JSON string rather than an object.
     */
    json::value config = json::value::object();
    for (const char *key : {"config", "algorithm_config"})
    {
        if (!obj.has_field(key))
            continue;

        const json::value &raw = obj.at(key);
        if (raw.is_object())
            config = raw;
        else if (raw.is_string())
        {
            try
            {
                json::value parsed = json::value::parse(raw.as_string());
                if (parsed.is_object())
                    config = parsed;
            }
            catch (const json::json_exception &e)
            {
                std::cout << "[ingest] " << record.id << ": unreadable config: " << e.what() << std::endl;
            }
        }
        break;
    }
    record.compressed = ApiUtils::boolField(config, "compress", false) 
        || StringUtils::toLower(record.algorithm).find("+compress") != std::string::npos;

    /**
     * Shards, in index order. Duplicate indices are dropped.
     */
    if (obj.has_array_field(U("shards")))
    {
        std::set<uint32_t> seenIndices;
        for (const auto &entry : obj.at(U("shards")).as_array())
        {
            if (!entry.is_object())
                continue;

            ShardRef shard;
            shard.index = static_cast<uint32_t>(ApiUtils::intField(entry, "shard_index", record.shards.size()));
            shard.nodeId = ApiUtils::stringField(entry, "bucket", "");
            int64_t size = ApiUtils::intField(entry, "size", IngestDefaults::SHARD_SIZE_BYTES);
            shard.sizeBytes = size > 0 ? static_cast<uint64_t>(size) : 0;
            shard.filename = ApiUtils::stringField(entry, "filename", "");
            shard.url = ApiUtils::stringField(entry, "url", "");
            shard.uploadedAt = ApiUtils::stringField(entry, "uploaded_at", "");

            if (!seenIndices.insert(shard.index).second)
            {
                std::cout << "[ingest] " << record.id << ": duplicate shard index " 
                          << shard.index << " dropped" << std::endl;
                continue;
            }
            record.shards.push_back(shard);
        }

        std::sort(record.shards.begin(), record.shards.end(),
            [](const ShardRef &a, const ShardRef &b) { return a.index < b.index; });
    }

    record.scheme = parseScheme(record.algorithm, config, record.shards.size(), record.schemeIssue);
    if (!record.scheme)
        std::cout << "[ingest] " << record.id << ": scheme unavailable (" << record.schemeIssue 
                  << "), health will be reported as unknown" << std::endl;

    return record;
}

std::vector<FileRecord> FileRecord::listFromJson(const json::value &response)
{
    if (!response.is_array())
        throw std::runtime_error("file list response is not an array");

    std::vector<FileRecord> records;
    for (const auto &entry : response.as_array())
    {
        try
        {
            records.push_back(FileRecord::fromJson(entry));
        }
        catch (const std::exception &e)
        {
            std::cout << "[ingest] skipping file record: " << e.what() << std::endl;
        }
    }
    return records;
}

////////////////////////////////////////////
// FileRecord tests
////////////////////////////////////////////
namespace FileRecordTests
{
    void testParseScheme()
    {
        std::string issue;

        auto rs = FileRecord::parseScheme("reed-solomon", json::value::parse("{\"k\": 4, \"m\": 2}"), 6, issue);
        ASSERT_THAT(rs.has_value());
        ASSERT_THAT(std::get<ReedSolomon>(*rs).k == 4);
        ASSERT_THAT(std::get<ReedSolomon>(*rs).m == 2);

        auto compressedRs = FileRecord::parseScheme("Reed-Solomon+compress", json::value::parse("{\"k\": 3}"), 5, issue);
        ASSERT_THAT(compressedRs.has_value());
        ASSERT_THAT(std::get<ReedSolomon>(*compressedRs).m == 2);

        auto rep = FileRecord::parseScheme("replication", json::value::parse("{\"replication_factor\": 3}"), 3, issue);
        ASSERT_THAT(rep.has_value());
        ASSERT_THAT(std::get<Replication>(*rep).factor == 3);

        auto implicitRep = FileRecord::parseScheme("replicate", json::value::object(), 2, issue);
        ASSERT_THAT(implicitRep.has_value());
        ASSERT_THAT(std::get<Replication>(*implicitRep).factor == 2);

        auto xorScheme = FileRecord::parseScheme("xor-parity", json::value::parse("{\"data\": 2, \"parity\": 1}"), 3, issue);
        ASSERT_THAT(xorScheme.has_value());
        ASSERT_THAT(std::get<XorParity>(*xorScheme).data == 2);
        ASSERT_THAT(std::get<XorParity>(*xorScheme).parity == 1);
    }

    void testMissingSchemeConfig()
    {
        std::string issue;

        // no k: never guessed
        auto rs = FileRecord::parseScheme("reed-solomon", json::value::object(), 5, issue);
        ASSERT_THAT(!rs.has_value());
        ASSERT_THAT(issue == "reed-solomon config has no k");

        issue.clear();
        auto zeroK = FileRecord::parseScheme("reed-solomon", json::value::parse("{\"k\": 0, \"m\": 2}"), 2, issue);
        ASSERT_THAT(!zeroK.has_value());
        ASSERT_THAT(!issue.empty());

        issue.clear();
        auto unknown = FileRecord::parseScheme("fountain", json::value::object(), 5, issue);
        ASSERT_THAT(!unknown.has_value());
        ASSERT_THAT(issue == "unknown algorithm 'fountain'");

        issue.clear();
        auto none = FileRecord::parseScheme("", json::value::object(), 5, issue);
        ASSERT_THAT(!none.has_value());
        ASSERT_THAT(issue == "no algorithm recorded");
    }

    void testFileFromJson()
    {
        json::value obj = json::value::parse(
            "{\"id\": \"f1\", \"filename\": \"report.pdf\", \"original_size\": 1000,"
            " \"algorithm\": \"reed-solomon\", \"config\": \"{\\\"k\\\": 3, \\\"m\\\": 2, \\\"compress\\\": true}\","
            " \"cost_estimate\": 1.67, \"uploaded_at\": \"2024-05-01T10:00:00\","
            " \"shards\": ["
            "   {\"bucket\": \"node-2\", \"shard_index\": 1, \"size\": 340},"
            "   {\"bucket\": \"node-1\", \"shard_index\": 0, \"size\": 340},"
            "   {\"bucket\": \"node-1\", \"shard_index\": 0, \"size\": 340},"
            "   {\"bucket\": \"node-3\", \"shard_index\": 2, \"size\": 340}"
            " ]}");

        FileRecord record = FileRecord::fromJson(obj);
        ASSERT_THAT(record.id == "f1");
        ASSERT_THAT(record.filename == "report.pdf");
        ASSERT_THAT(record.originalSizeBytes == 1000);
        ASSERT_THAT(record.compressed);
        ASSERT_THAT(record.costEstimate == 1.67);
        ASSERT_THAT(record.scheme.has_value());
        ASSERT_THAT(Schemes::neededShards(*record.scheme) == 3);

        // sorted by index, duplicate index 0 dropped
        ASSERT_THAT(record.shards.size() == 3);
        ASSERT_THAT(record.shards[0].index == 0 && record.shards[0].nodeId == "node-1");
        ASSERT_THAT(record.shards[1].index == 1 && record.shards[1].nodeId == "node-2");
        ASSERT_THAT(record.shards[2].index == 2);
    }

    void testListFromJson()
    {
        json::value response = json::value::parse(
            "[{\"id\": \"a\", \"algorithm\": \"replication\", \"config\": {\"replication_factor\": 2},"
            "  \"shards\": [{\"bucket\": \"node-1\", \"shard_index\": 0}, {\"bucket\": \"node-2\", \"shard_index\": 1}]},"
            " {\"filename\": \"orphan.txt\"},"
            " {\"id\": \"b\", \"algorithm_used\": \"reed-solomon\", \"algorithm_config\": {},"
            "  \"cost_estimate\": null}]");

        std::vector<FileRecord> records = FileRecord::listFromJson(response);
        ASSERT_THAT(records.size() == 2);
        ASSERT_THAT(records[0].id == "a");
        ASSERT_THAT(records[0].filename == "a");
        ASSERT_THAT(records[1].id == "b");
        ASSERT_THAT(!records[1].scheme.has_value());
        ASSERT_THAT(records[1].costEstimate == IngestDefaults::FILE_COST_ESTIMATE);

        bool threw = false;
        try
        {
            FileRecord::listFromJson(json::value::parse("{\"files\": []}"));
        }
        catch (const std::runtime_error &)
        {
            threw = true;
        }
        ASSERT_THAT(threw);
    }

    void runAll()
    {
        std::cerr << "###################################" << std::endl;
        std::cerr << "FileRecord Tests" << std::endl;
        std::cerr << "###################################" << std::endl;

        std::vector<std::pair<std::string, std::function<void()>>> tests = {
            TEST(testParseScheme),
            TEST(testMissingSchemeConfig),
            TEST(testFileFromJson),
            TEST(testListFromJson)
        };

        for (auto &[name, func] : tests)
        {
            TestUtils::runTest(name, func);
        }
    }
}
