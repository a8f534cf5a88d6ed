#include <iostream>
#include <thread>
#include "CommandLine.hpp"
#include "MirrorManager.hpp"

namespace
{
    std::string joinPatterns(const std::vector<std::string>& patterns)
    {
        std::string joined = "[";
        for (std::size_t i = 0; i < patterns.size(); ++i)
        {
            joined += (0 == i ? "'" : ", '") + patterns[i] + "'";
        }
        return joined + "]";
    }
} //anonymous namespace

int main(int argc, char** argv)
{
    const std::string program = programName(argc, argv);

    ParseResult parsed = parseCommandLine(argc, argv);
    switch (parsed.status)
    {
    case ParseResult::Status::Help:
        std::cout << usageText(program);
        return exitCodeFor(parsed.status);
    case ParseResult::Status::Usage:
        std::cerr << usageText(program);
        return exitCodeFor(parsed.status);
    case ParseResult::Status::Error:
        std::cerr << "Error: " << parsed.error.describe() << "\n";
        return exitCodeFor(parsed.status);
    case ParseResult::Status::Run:
        break;
    }

    const MirrorOptions& options = parsed.options;
    if (!Logger::instance().init(options.logFile, options.logLevel))
    {
        std::cerr << "Error: cannot open log file " << options.logFile << "\n";
        return EXIT_CONFIGURATION;
    }

    std::cout << "Source directory: " << options.source << "\n"
        << "Destination directory: " << options.dest << "\n"
        << "Exclusions: " << joinPatterns(options.settings.excludePatterns) << "\n";

    MirrorManager mirrorManager(options.settings);
    RunResult result;

    std::thread worker([&]()
        {
            result = mirrorManager.Mirror(options.source, options.dest);
        });

    worker.join();

    if (result.error)
    {
        std::cerr << "Error: " << result.error.describe() << "\n";
        return exitCodeFor(result);
    }

    const RunStatistics& statistics = result.statistics;
    std::cout << "Mirror finished. Copied files: " << statistics.copiedFiles << "/" << statistics.totalFiles
        << ", unchanged: " << statistics.unchangedFiles
        << ", excluded: " << statistics.excludedFiles
        << ", failed: " << statistics.failedFiles + statistics.failedDirectories
        << ". Time: " << statistics.elapsed.count() << " seconds.\n";

    return exitCodeFor(result);
}
