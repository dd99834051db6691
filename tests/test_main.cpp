#include <QtTest/QtTest>
#include <QtCore/QCoreApplication>
#include <QtCore/QDebug>

#include "utils/TestUtils.hpp"
#include "../src/core/common/Logger.hpp"

// Suites live in separate translation units, each with its own QObject.
extern int runTestExpected(int argc, char** argv);
extern int runTestConfig(int argc, char** argv);
extern int runTestChunkPlanner(int argc, char** argv);
extern int runTestPermitPools(int argc, char** argv);
extern int runTestLengthProbe(int argc, char** argv);
extern int runTestRangeWriter(int argc, char** argv);
extern int runTestChunkedDownloader(int argc, char** argv);
extern int runTestNetworkTransport(int argc, char** argv);
extern int runTestModelRegistry(int argc, char** argv);
extern int runTestModelCache(int argc, char** argv);
extern int runTestCommandLine(int argc, char** argv);

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);

    Parfetch::Logger::instance().initialize("parfetch-tests.log", Parfetch::Logger::Level::Trace);
    Parfetch::Test::TestUtils::initializeTestEnvironment();

    int totalResult = 0;
    int testCount = 0;
    int passedTests = 0;

    struct TestInfo {
        const char* name;
        int (*function)(int, char**);
    };

    TestInfo tests[] = {
        {"Expected", runTestExpected},
        {"Config", runTestConfig},
        {"ChunkPlanner", runTestChunkPlanner},
        {"PermitPools", runTestPermitPools},
        {"LengthProbe", runTestLengthProbe},
        {"RangeWriter", runTestRangeWriter},
        {"ChunkedDownloader", runTestChunkedDownloader},
        {"NetworkTransport", runTestNetworkTransport},
        {"ModelRegistry", runTestModelRegistry},
        {"ModelCache", runTestModelCache},
        {"CommandLine", runTestCommandLine}
    };

    for (const auto& test : tests) {
        qDebug() << "\n========================================";
        qDebug() << "Running test suite:" << test.name;
        qDebug() << "========================================";

        testCount++;
        int result = test.function(argc, argv);

        if (result == 0) {
            qDebug() << "Test suite" << test.name << "PASSED";
            passedTests++;
        } else {
            qDebug() << "Test suite" << test.name << "FAILED with code" << result;
            totalResult |= result;
        }
    }

    Parfetch::Test::TestUtils::cleanupTestEnvironment();
    Parfetch::Logger::instance().shutdown();

    qDebug() << "\n========================================";
    qDebug() << "TEST SUMMARY";
    qDebug() << "========================================";
    qDebug() << "Total test suites:" << testCount;
    qDebug() << "Passed:" << passedTests;
    qDebug() << "Failed:" << (testCount - passedTests);
    qDebug() << "Overall result:" << (totalResult == 0 ? "PASS" : "FAIL");

    return totalResult;
}
