#include <cpprest/json.h>

#include <iostream>
#include <functional>

#include "monitor_config.hpp"
#include "ingest_defaults.hpp"
#include "utils.hpp"
#include "test_utils.hpp"

using namespace web;

namespace
{
    const uint32_t DEFAULT_POLL_PERIOD_MS = 10000;
    const uint32_t DEFAULT_REQUEST_TIMEOUT_MS = 15000;
    const char *DEFAULT_DOWNLOAD_DIR = "./downloads";
}

MonitorConfig::MonitorConfig(std::string configFilePath)
    : Config(configFilePath)
{
    loadVariables();
}

MonitorConfig::MonitorConfig(json::value jsonConfig)
    : Config(std::move(jsonConfig))
{
    loadVariables();
}

void MonitorConfig::loadVariables()
{
    /**
     * monitor-specific config
     */
    if (!this->jsonConfig.has_object_field(U("monitor")))
        throw std::runtime_error(this->configFilePath + ": missing 'monitor' section");

    json::value monitor = this->jsonConfig.at(U("monitor"));

    if (!monitor.has_string_field(U("serviceUrl")) || monitor.at(U("serviceUrl")).as_string().empty())
        throw std::runtime_error(this->configFilePath + ": 'monitor.serviceUrl' must be a non-empty string");
    this->serviceUrl = monitor.at(U("serviceUrl")).as_string();

    int64_t pollPeriod = ApiUtils::intField(monitor, "pollPeriodMs", DEFAULT_POLL_PERIOD_MS);
    int64_t requestTimeout = ApiUtils::intField(monitor, "requestTimeoutMs", DEFAULT_REQUEST_TIMEOUT_MS);
    if (pollPeriod <= 0 || requestTimeout <= 0)
        throw std::runtime_error(this->configFilePath + ": 'pollPeriodMs' and 'requestTimeoutMs' must be positive");

    this->pollPeriodMs = static_cast<uint32_t>(pollPeriod);
    this->requestTimeoutMs = static_cast<uint32_t>(requestTimeout);

    this->downloadDirPath = ApiUtils::stringField(monitor, "downloadDirPath", DEFAULT_DOWNLOAD_DIR);

    /**
     * ingestion defaults
     */
    this->defaultNodeCapacityBytes = IngestDefaults::NODE_CAPACITY_BYTES;
    if (this->jsonConfig.has_object_field(U("defaults")))
    {
        json::value defaults = this->jsonConfig.at(U("defaults"));
        int64_t capacity = ApiUtils::intField(
            defaults, "nodeCapacityBytes", static_cast<int64_t>(IngestDefaults::NODE_CAPACITY_BYTES));
        if (capacity <= 0)
            throw std::runtime_error(this->configFilePath + ": 'defaults.nodeCapacityBytes' must be positive");
        this->defaultNodeCapacityBytes = static_cast<uint64_t>(capacity);
    }
}

////////////////////////////////////////////
// MonitorConfig tests
////////////////////////////////////////////
namespace MonitorConfigTests
{
    void testFullConfig()
    {
        MonitorConfig config(json::value::parse(
            "{\"monitor\": {\"serviceUrl\": \"http://storage:8000\", \"pollPeriodMs\": 2500,"
            " \"requestTimeoutMs\": 4000, \"downloadDirPath\": \"/tmp/restored\"},"
            " \"defaults\": {\"nodeCapacityBytes\": 1048576}}"));

        ASSERT_THAT(config.serviceUrl == "http://storage:8000");
        ASSERT_THAT(config.pollPeriodMs == 2500);
        ASSERT_THAT(config.requestTimeoutMs == 4000);
        ASSERT_THAT(config.downloadDirPath == "/tmp/restored");
        ASSERT_THAT(config.defaultNodeCapacityBytes == 1048576);
    }

    void testDefaults()
    {
        MonitorConfig config(json::value::parse("{\"monitor\": {\"serviceUrl\": \"http://localhost:8000\"}}"));

        ASSERT_THAT(config.pollPeriodMs == 10000);
        ASSERT_THAT(config.requestTimeoutMs == 15000);
        ASSERT_THAT(config.downloadDirPath == "./downloads");
        ASSERT_THAT(config.defaultNodeCapacityBytes == IngestDefaults::NODE_CAPACITY_BYTES);
    }

    void testInvalidConfig()
    {
        std::vector<std::string> invalid = {
            "{}",
            "{\"monitor\": {}}",
            "{\"monitor\": {\"serviceUrl\": \"\"}}",
            "{\"monitor\": {\"serviceUrl\": \"http://localhost:8000\", \"pollPeriodMs\": 0}}",
            "{\"monitor\": {\"serviceUrl\": \"http://localhost:8000\"}, \"defaults\": {\"nodeCapacityBytes\": -1}}"
        };

        for (const std::string &body : invalid)
        {
            bool threw = false;
            try
            {
                MonitorConfig config(json::value::parse(body));
            }
            catch (const std::runtime_error &)
            {
                threw = true;
            }
            ASSERT_THAT(threw);
        }
    }

    void runAll()
    {
        std::cerr << "###################################" << std::endl;
        std::cerr << "MonitorConfig Tests" << std::endl;
        std::cerr << "###################################" << std::endl;

        std::vector<std::pair<std::string, std::function<void()>>> tests = {
            TEST(testFullConfig),
            TEST(testDefaults),
            TEST(testInvalidConfig)
        };

        for (auto &[name, func] : tests)
        {
            TestUtils::runTest(name, func);
        }
    }
}
