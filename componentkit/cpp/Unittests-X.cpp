// componentkit-format

#include <iostream>
#include <string>

#include <gtest/gtest.h>
#include <tlx/cmdline_parser.hpp>

#include <componentkit/auxiliary/Log.hpp>
#include <componentkit/auxiliary/Parallelism.hpp>

struct Options {
    bool modeTests = false;
    bool modeDebug = false;

    bool sourceLocation = false;
    bool printTime = false;
    int numThreads = -1;
    std::string loglevel = "ERROR";

    bool parsedSuccessfully = false;

    Options(int argc, char *argv[]) {
        tlx::CmdlineParser parser;
        parser.set_description("Unit tests of ComponentKit. gtest options are passed through.");

        parser.add_flag('t', "tests", modeTests, "Run unit tests (test*)");
        parser.add_flag('d', "debug", modeDebug, "Run debug tests (debug*)");

        parser.add_string("loglevel", loglevel, "Log level: TRACE|DEBUG|INFO|WARN|ERROR|FATAL");
        parser.add_int("threads", numThreads, "Number of OpenMP threads");
        parser.add_flag("srcloc", sourceLocation, "Print source location of log messages");
        parser.add_flag("logtime", printTime, "Print time stamp of log messages");

        parsedSuccessfully = parser.process(argc, argv);
    }
};

int main(int argc, char *argv[]) {
    std::cout << "*** ComponentKit Unit Tests ***\n";

    // gtest removes the arguments it recognizes
    ::testing::InitGoogleTest(&argc, argv);
    Options options{argc, argv};
    if (!options.parsedSuccessfully)
        return -1;

    // Configure logging
    ComponentKit::Aux::Log::setLogLevel(options.loglevel);
    ComponentKit::Aux::Log::Settings::setPrintLocation(options.sourceLocation);
    ComponentKit::Aux::Log::Settings::setPrintTime(options.printTime);
    std::cout << "Loglevel: " << ComponentKit::Aux::Log::getLogLevel() << "\n";

    // Configure parallelism
    if (options.numThreads > 0)
        ComponentKit::Aux::setNumberOfThreads(options.numThreads);
    std::cout << "Number of threads: " << ComponentKit::Aux::getMaxNumberOfThreads() << "\n";

    if (options.modeTests)
        ::testing::GTEST_FLAG(filter) = "*Test.test*";
    else if (options.modeDebug)
        ::testing::GTEST_FLAG(filter) = "*Test.debug*";

    return RUN_ALL_TESTS();
}
