#include <iostream>

#include "utils.hpp"
#include "crypto.hpp"
#include "encoding_scheme.hpp"
#include "storage_node.hpp"
#include "file_record.hpp"
#include "health_evaluator.hpp"
#include "cluster_health.hpp"
#include "in_flight.hpp"
#include "cluster_service.hpp"
#include "http_cluster_service.hpp"
#include "failure_simulator.hpp"
#include "reconstruction.hpp"
#include "monitor_config.hpp"
#include "monitor_session.hpp"
#include "test_utils.hpp"

int main()
{
    UtilsTests::runAll();
    CryptoTests::runAll();
    MonitorConfigTests::runAll();
    EncodingSchemeTests::runAll();
    StorageNodeTests::runAll();
    FileRecordTests::runAll();
    HealthEvaluatorTests::runAll();
    ClusterHealthTests::runAll();
    InFlightRegistryTests::runAll();
    ClusterServiceTests::runAll();
    HttpClusterServiceTests::runAll();
    FailureSimulatorTests::runAll();
    ReconstructionTests::runAll();
    MonitorSessionTests::runAll();

    std::cerr << std::endl << TestUtils::testsRun() << " tests run, " 
              << TestUtils::testsFailed() << " failed" << std::endl;

    return TestUtils::testsFailed() == 0 ? 0 : 1;
}
