#include <iostream>
#include <string>
#include <functional>

#include "test_utils.hpp"

namespace TestUtils
{
    namespace
    {
        int numRun = 0;
        int numFailed = 0;
    }

    void runTest(std::string &testName, std::function<void()> &testFunc)
    {
        numRun++;
        try
        {
            testFunc();
            std::cerr << "[PASS] " << testName << std::endl;
        }
        catch (const std::exception &e)
        {
            numFailed++;
            std::cerr << "[FAIL] " << testName << ": " << e.what() << std::endl;
        }
    }

    int testsRun()
    {
        return numRun;
    }

    int testsFailed()
    {
        return numFailed;
    }
};
