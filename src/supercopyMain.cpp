#include <getopt.h>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <string>
#include "supercopyMain.hpp"
#include "Config.hpp"
#include "CopyQueue.hpp"
#include "IoRing.hpp"
#include "PathPlanner.hpp"
#include "ResultCollector.hpp"
#include "Util.hpp"

namespace
{
    struct CommandLine
    {
        std::string source;
        std::string destination;
        CopyOptions options;
        bool quiet = false;
    };

    void printUsage(const char* argv0)
    {
        fprintf(stderr,
                "Usage: %s [OPTIONS] SOURCE DEST\n"
                "\n"
                "Copies a file or a directory tree using a pool of parallel workers.\n"
                "\n"
                "Options:\n"
                "  -w, --workers N      Worker threads (default: logical core count)\n"
                "  -b, --buffer BYTES   Copy buffer size per worker (default: %zu, maximum: %zu)\n"
                "      --verify         Compare SHA-256 of source and destination after each copy\n"
                "  -q, --quiet          No header or progress display\n"
                "  -h, --help           Show this help\n",
                argv0, Config::DEFAULT_BUFFER_SIZE, Config::MAX_BUFFER_SIZE);
    }

    // Strictly positive decimal integer, nothing else allowed in the string
    bool parsePositive(const char* str, size_t& value)
    {
        if (str == nullptr || *str < '0' || *str > '9')
            return false;

        char* end = nullptr;
        errno = 0;
        unsigned long long parsed = strtoull(str, &end, 10);
        if (errno != 0 || *end != '\0' || parsed == 0)
            return false;

        value = size_t(parsed);
        return true;
    }

    enum class ParseStatus
    {
        Ok,
        Help,
        Error,
    };

    ParseStatus parseCommandLine(int argc, char** argv, CommandLine& commandLine)
    {
        enum LongOnly
        {
            OPT_VERIFY = 256,
        };

        static const option longOptions[] =
        {
            {"workers", required_argument, nullptr, 'w'},
            {"buffer", required_argument, nullptr, 'b'},
            {"verify", no_argument, nullptr, OPT_VERIFY},
            {"quiet", no_argument, nullptr, 'q'},
            {"help", no_argument, nullptr, 'h'},
            {nullptr, 0, nullptr, 0},
        };

        optind = 0; // full reset of getopt's internal state, we can be called more than once per process

        int opt = 0;
        while ((opt = getopt_long(argc, argv, "w:b:qh", longOptions, nullptr)) != -1)
        {
            switch (opt)
            {
                case 'w':
                {
                    if (!parsePositive(optarg, commandLine.options.workerCount))
                    {
                        fprintf(stderr, "supercopy: invalid worker count: %s\n", optarg);
                        return ParseStatus::Error;
                    }
                    break;
                }
                case 'b':
                {
                    if (!parsePositive(optarg, commandLine.options.bufferSize))
                    {
                        fprintf(stderr, "supercopy: invalid buffer size: %s\n", optarg);
                        return ParseStatus::Error;
                    }
                    if (commandLine.options.bufferSize > Config::MAX_BUFFER_SIZE)
                    {
                        fprintf(stderr, "supercopy: buffer size %s is larger than the maximum of %zu\n", optarg, Config::MAX_BUFFER_SIZE);
                        return ParseStatus::Error;
                    }
                    break;
                }
                case OPT_VERIFY:
                    commandLine.options.verify = true;
                    break;
                case 'q':
                    commandLine.quiet = true;
                    break;
                case 'h':
                    return ParseStatus::Help;
                default:
                    return ParseStatus::Error;
            }
        }

        if (argc - optind != 2)
        {
            fputs("supercopy: expected exactly one SOURCE and one DEST\n", stderr);
            return ParseStatus::Error;
        }

        commandLine.source = argv[optind];
        commandLine.destination = argv[optind + 1];

        if (commandLine.options.workerCount == 0)
            commandLine.options.workerCount = getLogicalCoreCount();

        size_t totalBufferSize = 0;
        if (__builtin_mul_overflow(commandLine.options.workerCount, commandLine.options.bufferSize, &totalBufferSize))
        {
            fputs("supercopy: workers * buffer size is too large\n", stderr);
            return ParseStatus::Error;
        }

        commandLine.options.showProgress = !commandLine.quiet;

        return ParseStatus::Ok;
    }

    void printHeader(const CommandLine& commandLine)
    {
        // Every worker makes its own ring, a throwaway one tells us which path they will take
        bool usingUring = IoRing().isUsingUring();

        printf("Source:      %s\n", commandLine.source.c_str());
        printf("Destination: %s\n", commandLine.destination.c_str());
        printf("Workers:     %zu\n", commandLine.options.workerCount);
        printf("Buffer Size: %s\n", humanFriendlyFileSize(commandLine.options.bufferSize).c_str());
        printf("Verify:      %s\n", commandLine.options.verify ? "yes" : "no");
        printf("I/O:         %s\n", usingUring ? "io_uring" : "pread / pwrite");
        fflush(stdout);
    }

    void printSummary(const RunSummary& summary)
    {
        double seconds = std::chrono::duration<double>(summary.elapsed).count();

        printf("\n----- Copy Operation Summary -----\n");
        printf("Files:       %zu / %zu copied\n", summary.succeeded, summary.totalFiles);
        printf("Bytes:       %s\n", humanFriendlyFileSize(summary.bytesCopied).c_str());
        printf("Elapsed:     %s\n", humanFriendlyTime(seconds).c_str());
        printf("Throughput:  %s/s\n", humanFriendlyFileSize(size_t(summary.averageThroughput)).c_str());

        if (!summary.failed.empty())
        {
            printf("Failed:      %zu (IOError: %zu, SizeMismatch: %zu, VerifyMismatch: %zu)\n",
                   summary.failed.size(),
                   summary.countFailed(ErrorKind::IOError),
                   summary.countFailed(ErrorKind::SizeMismatch),
                   summary.countFailed(ErrorKind::VerifyMismatch));

            for (const TaskResult& result : summary.failed)
            {
                printf("  [%s] %s: %s\n",
                       errorKindName(result.error->kind),
                       result.task.destinationPath.c_str(),
                       result.error->message().c_str());
            }
        }

        printf("Outcome:     %s\n", outcomeName(summary.outcome));
        fflush(stdout);
    }
}

int supercopyMain(int argc, char** argv)
{
    CommandLine commandLine;
    switch (parseCommandLine(argc, argv, commandLine))
    {
        case ParseStatus::Ok:
            break;
        case ParseStatus::Help:
            printUsage(argv[0]);
            return 0;
        case ParseStatus::Error:
            printUsage(argv[0]);
            return 1;
    }

    if (!commandLine.quiet)
        printHeader(commandLine);

    PlanResult planResult = PathPlanner().plan(commandLine.source, commandLine.destination);
    if (std::holds_alternative<Error>(planResult))
    {
        const Error& error = std::get<Error>(planResult);
        fprintf(stderr, "%s: %s\n", errorKindName(error.kind), error.message().c_str());
        return 1;
    }

    CopyPlan& plan = std::get<CopyPlan>(planResult);

    for (const std::string& skipped : plan.skipped)
        fprintf(stderr, "Skipping %s\n", skipped.c_str());

    if (plan.fileCount == 0 && !commandLine.quiet)
        puts("No files to copy, only creating directories");

    CopyQueue copyQueue(commandLine.options);
    {
        Result result = copyQueue.start();
        if (std::holds_alternative<Error>(result))
        {
            fprintf(stderr, "%s\n", std::get<Error>(result).message().c_str());
            return 1;
        }
    }
    copyQueue.addPlan(std::move(plan));
    RunSummary summary = copyQueue.join();

    printSummary(summary);

    switch (summary.outcome)
    {
        case RunSummary::Outcome::Success:
            return 0;
        case RunSummary::Outcome::PartialFailure:
            return 2;
        case RunSummary::Outcome::Failure:
            return 1;
    }

    return 1;
}
