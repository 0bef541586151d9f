#pragma once
#include "config.hpp"

class MonitorConfig : public Config 
{
public:
    MonitorConfig(std::string configFilePath);

    /* Builds the config from an already-parsed JSON object */
    explicit MonitorConfig(json::value jsonConfig);

    void loadVariables() override;

    /**
     * Base URL of the node registry / file catalog service,
     * e.g. "http://localhost:8000".
     */
    std::string serviceUrl;

    /**
     * Time (in milliseconds) between polls of the node registry and file catalog.
     */
    uint32_t pollPeriodMs;

    /**
     * Time (in milliseconds) after which an unanswered request counts as failed.
     */
    uint32_t requestTimeoutMs;

    /* Directory reconstructed files are saved to */
    std::string downloadDirPath;

    /**
     * Capacity assumed for nodes the registry reports no capacity for.
     */
    uint64_t defaultNodeCapacityBytes;
};

namespace MonitorConfigTests
{
    void testFullConfig();
    void testDefaults();
    void testInvalidConfig();
    void runAll();
}
