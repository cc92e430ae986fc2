#include <algorithm>
#include <cstring>
#include <functional>
#include <filesystem>
#include <mutex>
#include <set>
#include <thread>
#include <csignal>
#include <fcntl.h>
#include <unistd.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include "CopyQueue.hpp"
#include "CopyRunner.hpp"
#include "Config.hpp"
#include "Heap.hpp"
#include "IoRing.hpp"
#include "PathPlanner.hpp"
#include "ProgressListener.hpp"
#include "ResultCollector.hpp"
#include "ScopedFileDescriptor.hpp"
#include "Util.hpp"
#include "Verifier.hpp"
#include "supercopyMain.hpp"
#include "Assert.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wclobbered"
#pragma GCC diagnostic ignored "-Wunused-function"
#include <acutest.h>
#pragma GCC diagnostic pop

// A fresh, empty directory for one test
std::string getTestFolder(const std::string& name)
{
    std::string folder = (std::filesystem::temp_directory_path() / "supercopy_tests" / name).string();

    std::filesystem::remove_all(folder);
    TEST_ASSERT(std::holds_alternative<std::nullptr_t>(recursiveMkdir(folder)));

    return folder;
}

void runWithAllPartialModes(const std::function<void(void)>& func)
{
    {
        Config::DEBUG_FORCE_PARTIAL_READS = false;
        Config::DEBUG_FORCE_PARTIAL_WRITES = false;
        func();
    }
    {
        Config::DEBUG_FORCE_PARTIAL_READS = false;
        Config::DEBUG_FORCE_PARTIAL_WRITES = true;
        func();
    }
    {
        Config::DEBUG_FORCE_PARTIAL_READS = true;
        Config::DEBUG_FORCE_PARTIAL_WRITES = false;
        func();
    }
    {
        Config::DEBUG_FORCE_PARTIAL_READS = true;
        Config::DEBUG_FORCE_PARTIAL_WRITES = true;
        func();
    }

    Config::DEBUG_FORCE_PARTIAL_READS = false;
    Config::DEBUG_FORCE_PARTIAL_WRITES = false;
}

void writeFile(const std::string& path, const std::vector<uint8_t>& data)
{
    FILE* f = fopen(path.c_str(), "wb");
    TEST_ASSERT(f != nullptr);

    if (!data.empty())
        TEST_ASSERT(fwrite(data.data(), 1, data.size(), f) == data.size());

    TEST_ASSERT(fclose(f) == 0);
}

void writeFile(const std::string& path, const std::string& data)
{
    writeFile(path, std::vector<uint8_t>(data.begin(), data.end()));
}

std::vector<uint8_t> randomData(size_t size)
{
    std::vector<uint8_t> data(size);
    for (size_t i = 0; i < data.size(); i++)
        data[i] = rand() & 0xFF;
    return data;
}

std::vector<uint8_t> readWholeFile(const std::string& path)
{
    FILE* f = fopen(path.c_str(), "rb");
    TEST_ASSERT(f != nullptr);

    std::vector<uint8_t> data;
    uint8_t chunk[4096];
    while (true)
    {
        size_t read = fread(chunk, 1, sizeof(chunk), f);
        if (read == 0)
        {
            TEST_ASSERT(ferror(f) == 0);
            break;
        }
        data.insert(data.end(), chunk, chunk + read);
    }

    TEST_ASSERT(fclose(f) == 0);
    return data;
}

void assertFilesEqual(const std::string& a, const std::string& b)
{
    TEST_ASSERT(readWholeFile(a) == readWholeFile(b));
}

std::set<std::string> listTree(const std::string& root)
{
    std::set<std::string> paths;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(root))
        paths.insert(std::filesystem::relative(entry.path(), root).string());
    return paths;
}

void assertFoldersEqual(const std::string& a, const std::string& b)
{
    std::set<std::string> aPaths = listTree(a);
    TEST_ASSERT(aPaths == listTree(b));

    for (const std::string& path : aPaths)
    {
        if (std::filesystem::is_regular_file(a + "/" + path))
            assertFilesEqual(a + "/" + path, b + "/" + path);
    }
}

// A mix of nested directories, an empty directory, empty files and files larger than the copy buffer
void makeTestTree(const std::string& root)
{
    TEST_ASSERT(mkdir(root.c_str(), 0755) == 0);
    TEST_ASSERT(mkdir((root + "/sub").c_str(), 0755) == 0);
    TEST_ASSERT(mkdir((root + "/sub/deeper").c_str(), 0755) == 0);
    TEST_ASSERT(mkdir((root + "/empty_dir").c_str(), 0755) == 0);

    writeFile(root + "/a.txt", "0123456789");
    writeFile(root + "/empty", std::vector<uint8_t>());
    writeFile(root + "/sub/b.bin", randomData(100 * 1024 + 7));
    writeFile(root + "/sub/deeper/c.bin", randomData(5000));
    writeFile(root + "/sub/deeper/d.bin", randomData(1));
}

int callSupercopyMain(const std::vector<std::string>& args)
{
    std::vector<std::string> storage;
    storage.emplace_back("supercopy");
    storage.insert(storage.end(), args.begin(), args.end());

    std::vector<char*> argv;
    for (std::string& arg : storage)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    return supercopyMain(int(storage.size()), argv.data());
}

CopyOptions getTestOptions(size_t workers, size_t bufferSize = 4096, bool verify = false)
{
    CopyOptions options;
    options.workerCount = workers;
    options.bufferSize = bufferSize;
    options.verify = verify;
    options.showProgress = false;
    options.showErrors = false;
    return options;
}

CopyPlan planOrFail(const std::string& source, const std::string& destination)
{
    PlanResult result = PathPlanner().plan(source, destination);
    if (std::holds_alternative<Error>(result))
        TEST_ASSERT_(false, "planning failed: %s", std::get<Error>(result).message().c_str());

    return std::move(std::get<CopyPlan>(result));
}

ErrorKind planError(const std::string& source, const std::string& destination)
{
    PlanResult result = PathPlanner().plan(source, destination);
    TEST_ASSERT(std::holds_alternative<Error>(result));
    return std::get<Error>(result).kind;
}

size_t fileSize(const std::string& path)
{
    struct stat64 sb = {};
    TEST_ASSERT(stat64(path.c_str(), &sb) == 0);
    return size_t(sb.st_size);
}

class RecordingListener : public ProgressListener
{
public:
    void onStart(size_t newFilesTotal, size_t newBytesTotal) override
    {
        this->startCalls++;
        this->filesTotal = newFilesTotal;
        this->bytesTotal = newBytesTotal;
    }

    void onTaskFinished(const TaskResult& result) override
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        if (result.succeeded())
            this->succeededPaths.insert(result.task.destinationPath);
        else
            this->failedPaths.insert(result.task.destinationPath);
    }

    void onFinish(const RunSummary& summary) override
    {
        this->finishCalls++;
        this->finalOutcome = summary.outcome;
    }

    size_t startCalls = 0;
    size_t finishCalls = 0;
    size_t filesTotal = 0;
    size_t bytesTotal = 0;
    RunSummary::Outcome finalOutcome = RunSummary::Outcome::Failure;

    std::mutex mutex;
    std::set<std::string> succeededPaths;
    std::set<std::string> failedPaths;
};

TaskResult makeResult(CopyTask::Kind kind, TaskResult::Status status, size_t bytes)
{
    TaskResult result;
    result.task.kind = kind;
    result.task.destinationPath = "/nowhere";
    result.status = status;
    result.bytesTransferred = bytes;
    if (status != TaskResult::Status::Success)
        result.error = Error(status == TaskResult::Status::VerifyMismatch ? ErrorKind::VerifyMismatch : ErrorKind::IOError, "test");
    return result;
}

class TestContainer
{
public:
    static void CopySmallFileIntoDirectory()
    {
        runWithAllPartialModes([]() {
            std::string base = getTestFolder("CopySmallFileIntoDirectory");
            std::string dest = base + "/dest";
            TEST_ASSERT(mkdir(dest.c_str(), 0755) == 0);
            writeFile(base + "/a.txt", "0123456789");

            TEST_CHECK(callSupercopyMain({"-q", base + "/a.txt", dest + "/"}) == 0);

            TEST_CHECK(fileSize(dest + "/a.txt") == 10);
            assertFilesEqual(base + "/a.txt", dest + "/a.txt");
        });
    }

    static void CopyTree()
    {
        runWithAllPartialModes([]() {
            std::string base = getTestFolder("CopyTree");
            std::string source = base + "/source";
            std::string dest = base + "/dest";
            makeTestTree(source);

            CopyQueue queue(getTestOptions(3));
            TEST_ASSERT(queue.start().index() == 1);
            queue.addPlan(planOrFail(source, dest));
            RunSummary summary = queue.join();

            TEST_CHECK(summary.outcome == RunSummary::Outcome::Success);
            TEST_CHECK(summary.totalFiles == 5);
            TEST_CHECK(summary.succeeded == 5);
            TEST_CHECK(summary.failed.empty());

            assertFoldersEqual(source, dest);
        });
    }

    static void CopyTreeWithVerify()
    {
        std::string base = getTestFolder("CopyTreeWithVerify");
        std::string source = base + "/source";
        std::string dest = base + "/dest";
        makeTestTree(source);

        TEST_CHECK(callSupercopyMain({"-q", "--verify", "-w", "2", "-b", "1000", source, dest}) == 0);

        assertFoldersEqual(source, dest);
    }

    static void ResolveCopyDestination()
    {
        std::string base = getTestFolder("ResolveCopyDestination");
        std::string source = base + "/source";
        std::string dest = base + "/dest";
        std::string contentFile = source + "/content_file";

        TEST_ASSERT(mkdir(source.c_str(), S_IRWXU) == 0);
        writeFile(contentFile, "content");

        // a missing destination becomes the copy
        TEST_CHECK(callSupercopyMain({"-q", source, dest}) == 0);
        TEST_CHECK(access((dest + "/content_file").c_str(), F_OK) == 0);

        // an existing directory gets the copy inside it
        TEST_CHECK(callSupercopyMain({"-q", source, dest}) == 0);
        TEST_CHECK(access((dest + "/source/content_file").c_str(), F_OK) == 0);

        std::filesystem::remove_all(dest);
        TEST_ASSERT(mkdir(dest.c_str(), S_IRWXU) == 0);
        TEST_CHECK(callSupercopyMain({"-q", source + "/", dest + "/"}) == 0);
        TEST_CHECK(access((dest + "/source/content_file").c_str(), F_OK) == 0);

        std::filesystem::remove_all(dest);
        TEST_CHECK(callSupercopyMain({"-q", contentFile, dest}) == 0);
        TEST_CHECK(std::filesystem::is_regular_file(dest));

        std::filesystem::remove_all(dest);
        TEST_ASSERT(mkdir(dest.c_str(), S_IRWXU) == 0);
        TEST_CHECK(callSupercopyMain({"-q", contentFile, dest}) == 0);
        TEST_CHECK(access((dest + "/content_file").c_str(), F_OK) == 0);

        // a trailing slash names a directory to create
        std::filesystem::remove_all(dest);
        TEST_CHECK(callSupercopyMain({"-q", contentFile, dest + "/"}) == 0);
        TEST_CHECK(access((dest + "/content_file").c_str(), F_OK) == 0);

        // missing parents of a single file destination are created
        std::filesystem::remove_all(dest);
        TEST_CHECK(callSupercopyMain({"-q", contentFile, dest + "/x/y/file"}) == 0);
        assertFilesEqual(contentFile, dest + "/x/y/file");
    }

    static void RelativeSingleFileCopy()
    {
        std::string base = getTestFolder("RelativeSingleFileCopy");
        writeFile(base + "/a", "asd");

        std::filesystem::path workingDirSaved = std::filesystem::current_path();
        std::filesystem::current_path(base);

        int ret = callSupercopyMain({"-q", "a", "b"});

        std::filesystem::current_path(workingDirSaved);

        TEST_CHECK(ret == 0);
        assertFilesEqual(base + "/a", base + "/b");
    }

    static void SourceDeletedBeforeTaskRuns()
    {
        std::string base = getTestFolder("SourceDeletedBeforeTaskRuns");
        std::string source = base + "/source";
        std::string dest = base + "/dest";

        TEST_ASSERT(mkdir(source.c_str(), 0755) == 0);
        writeFile(source + "/1", randomData(3000));
        writeFile(source + "/2", randomData(3000));
        writeFile(source + "/3", randomData(3000));

        CopyPlan plan = planOrFail(source, dest);
        TEST_ASSERT(plan.fileCount == 3);

        TEST_ASSERT(unlink((source + "/2").c_str()) == 0);

        CopyQueue queue(getTestOptions(2));
        TEST_ASSERT(queue.start().index() == 1);
        queue.addPlan(std::move(plan));
        RunSummary summary = queue.join();

        TEST_CHECK(summary.totalFiles == 3);
        TEST_CHECK(summary.succeeded == 2);
        TEST_ASSERT(summary.failed.size() == 1);
        TEST_CHECK(summary.failed[0].status == TaskResult::Status::Failed);
        TEST_CHECK(summary.failed[0].error->kind == ErrorKind::IOError);
        TEST_CHECK(summary.failed[0].task.sourcePath == source + "/2");
        TEST_CHECK(summary.outcome == RunSummary::Outcome::PartialFailure);

        assertFilesEqual(source + "/1", dest + "/1");
        assertFilesEqual(source + "/3", dest + "/3");
    }

    static void VerifyDetectsCorruption()
    {
        std::string base = getTestFolder("VerifyDetectsCorruption");
        std::string source = base + "/source";
        std::string dest = base + "/dest";

        TEST_ASSERT(mkdir(source.c_str(), 0755) == 0);
        writeFile(source + "/good1", randomData(10000));
        writeFile(source + "/bad", randomData(10000));
        writeFile(source + "/good2", randomData(10000));

        CopyQueue queue(getTestOptions(3, 4096, true));

        // Overwrites the start of one copied file, keeping its size, between the copy and the verify pass
        queue.beforeVerifyHook = [](const CopyTask& task)
        {
            if (std::filesystem::path(task.destinationPath).filename() != "bad")
                return;

            int fd = open(task.destinationPath.c_str(), O_WRONLY);
            release_assert(fd >= 0);
            const char garbage[] = "garbage";
            release_assert(pwrite(fd, garbage, sizeof(garbage), 0) == ssize_t(sizeof(garbage)));
            release_assert(close(fd) == 0);
        };

        TEST_ASSERT(queue.start().index() == 1);
        queue.addPlan(planOrFail(source, dest));
        RunSummary summary = queue.join();

        TEST_CHECK(summary.succeeded == 2);
        TEST_ASSERT(summary.failed.size() == 1);
        TEST_CHECK(summary.failed[0].status == TaskResult::Status::VerifyMismatch);
        TEST_CHECK(summary.failed[0].error->kind == ErrorKind::VerifyMismatch);
        TEST_CHECK(summary.failed[0].task.destinationPath == dest + "/bad");
        TEST_CHECK(summary.countFailed(ErrorKind::VerifyMismatch) == 1);
        TEST_CHECK(summary.countFailed(ErrorKind::IOError) == 0);
        TEST_CHECK(summary.outcome == RunSummary::Outcome::PartialFailure);

        assertFilesEqual(source + "/good1", dest + "/good1");
        assertFilesEqual(source + "/good2", dest + "/good2");
    }

    static void SourceGrowsDuringCopy()
    {
        std::string base = getTestFolder("SourceGrowsDuringCopy");
        std::string source = base + "/source";
        std::string dest = base + "/dest";

        TEST_ASSERT(mkdir(source.c_str(), 0755) == 0);
        writeFile(source + "/grows", randomData(10000));
        writeFile(source + "/gone", randomData(10000));
        writeFile(source + "/ok", randomData(10000));

        CopyPlan plan = planOrFail(source, dest);
        TEST_ASSERT(unlink((source + "/gone").c_str()) == 0);

        CopyQueue queue(getTestOptions(2));

        // Appends to one source after its last chunk was copied, so only the final size comparison can notice
        queue.beforeSizeCheckHook = [](const CopyTask& task)
        {
            if (std::filesystem::path(task.sourcePath).filename() != "grows")
                return;

            int fd = open(task.sourcePath.c_str(), O_WRONLY | O_APPEND);
            release_assert(fd >= 0);
            const char extra[] = "appended";
            release_assert(write(fd, extra, sizeof(extra)) == ssize_t(sizeof(extra)));
            release_assert(close(fd) == 0);
        };

        TEST_ASSERT(queue.start().index() == 1);
        queue.addPlan(std::move(plan));
        RunSummary summary = queue.join();

        TEST_CHECK(summary.totalFiles == 3);
        TEST_CHECK(summary.succeeded == 1);
        TEST_ASSERT(summary.failed.size() == 2);
        TEST_CHECK(summary.countFailed(ErrorKind::SizeMismatch) == 1);
        TEST_CHECK(summary.countFailed(ErrorKind::IOError) == 1);
        TEST_CHECK(summary.outcome == RunSummary::Outcome::PartialFailure);

        for (const TaskResult& result : summary.failed)
        {
            TEST_CHECK(result.status == TaskResult::Status::Failed);
            TEST_ASSERT(result.error.has_value());

            std::string name = std::filesystem::path(result.task.sourcePath).filename();
            if (name == "grows")
                TEST_CHECK(result.error->kind == ErrorKind::SizeMismatch);
            else
                TEST_CHECK(name == "gone" && result.error->kind == ErrorKind::IOError);
        }

        // The copy stops at the size seen while copying
        TEST_CHECK(fileSize(dest + "/grows") == 10000);
        assertFilesEqual(source + "/ok", dest + "/ok");
    }

    static void WriteErrorLeavesPartialDestination()
    {
        std::string base = getTestFolder("WriteErrorLeavesPartialDestination");
        std::vector<uint8_t> data = randomData(20000);
        writeFile(base + "/in", data);

        // Writes past the file size limit fail with EFBIG instead of killing the process
        sighandler_t oldHandler = signal(SIGXFSZ, SIG_IGN);
        TEST_ASSERT(oldHandler != SIG_ERR);

        rlimit64 fileSizeLimit = {};
        TEST_ASSERT(getrlimit64(RLIMIT_FSIZE, &fileSizeLimit) == 0);
        rlimit64 oldLimit = fileSizeLimit;
        fileSizeLimit.rlim_cur = 8192;
        TEST_ASSERT(setrlimit64(RLIMIT_FSIZE, &fileSizeLimit) == 0);

        CopyQueue queue(getTestOptions(1));
        TEST_ASSERT(queue.start().index() == 1);
        queue.addPlan(planOrFail(base + "/in", base + "/out"));
        RunSummary summary = queue.join();

        release_assert(setrlimit64(RLIMIT_FSIZE, &oldLimit) == 0);
        signal(SIGXFSZ, oldHandler);

        TEST_CHECK(summary.totalFiles == 1);
        TEST_CHECK(summary.succeeded == 0);
        TEST_ASSERT(summary.failed.size() == 1);
        TEST_CHECK(summary.failed[0].status == TaskResult::Status::Failed);
        TEST_CHECK(summary.failed[0].error->kind == ErrorKind::IOError);
        TEST_CHECK(summary.outcome == RunSummary::Outcome::Failure);

        // Nothing is cleaned up, the destination keeps whatever was written before the failure
        std::vector<uint8_t> partial = readWholeFile(base + "/out");
        TEST_ASSERT(partial.size() == 8192);
        TEST_CHECK(std::equal(partial.begin(), partial.end(), data.begin()));
    }

    static void TinyBuffer()
    {
        runWithAllPartialModes([]() {
            std::string base = getTestFolder("TinyBuffer");
            writeFile(base + "/big", randomData(1000 * 1000));

            TEST_CHECK(callSupercopyMain({"-q", "--buffer", "16", "-w", "1", base + "/big", base + "/copy"}) == 0);

            assertFilesEqual(base + "/big", base + "/copy");
        });
    }

    static void ProgressIsMonotonic()
    {
        std::string base = getTestFolder("ProgressIsMonotonic");
        std::string source = base + "/source";
        std::string dest = base + "/dest";

        TEST_ASSERT(mkdir(source.c_str(), 0755) == 0);
        size_t fileCount = 200;
        size_t bytesPerFile = 64 * 1024;
        for (size_t i = 0; i < fileCount; i++)
            writeFile(source + "/" + std::to_string(i), randomData(bytesPerFile));

        CopyQueue queue(getTestOptions(4));
        const ProgressState& progress = queue.getProgress();

        std::atomic_bool stop = false;
        std::atomic_bool invariantsHeld = true;
        std::atomic<size_t> observations = 0;

        std::thread poller([&]()
        {
            ProgressState::Snapshot previous;
            while (!stop)
            {
                ProgressState::Snapshot current = progress.snapshot();

                if (current.filesDone > current.filesTotal || current.bytesDone > current.bytesTotal ||
                    current.filesDone < previous.filesDone || current.bytesDone < previous.bytesDone ||
                    current.filesTotal < previous.filesTotal || current.bytesTotal < previous.bytesTotal)
                {
                    invariantsHeld = false;
                }

                previous = current;
                observations++;
            }
        });

        TEST_ASSERT(queue.start().index() == 1);
        queue.addPlan(planOrFail(source, dest));
        RunSummary summary = queue.join();

        stop = true;
        poller.join();

        TEST_CHECK(invariantsHeld);
        TEST_CHECK(observations > 0);
        TEST_CHECK(summary.outcome == RunSummary::Outcome::Success);

        ProgressState::Snapshot finished = progress.snapshot();
        TEST_CHECK(finished.filesTotal == fileCount);
        TEST_CHECK(finished.filesDone == fileCount);
        TEST_CHECK(finished.bytesTotal == fileCount * bytesPerFile);
        TEST_CHECK(finished.bytesDone == fileCount * bytesPerFile);
    }

    static void WorkerCountDoesNotChangeOutcome()
    {
        std::set<std::string> expectedSucceeded;
        std::set<std::string> expectedFailed;

        for (size_t workers : {1, 2, 5, 16})
        {
            std::string base = getTestFolder("WorkerCountDoesNotChangeOutcome");
            std::string source = base + "/source";
            std::string dest = base + "/dest";
            makeTestTree(source);
            writeFile(source + "/sub/gone", "will be deleted");

            CopyPlan plan = planOrFail(source, dest);
            TEST_ASSERT(unlink((source + "/sub/gone").c_str()) == 0);

            RecordingListener listener;
            CopyQueue queue(getTestOptions(workers));
            queue.setListener(&listener);
            TEST_ASSERT(queue.start().index() == 1);
            queue.addPlan(std::move(plan));
            RunSummary summary = queue.join();

            TEST_CHECK(queue.getWorkerCount() == workers);
            TEST_CHECK(summary.outcome == RunSummary::Outcome::PartialFailure);
            TEST_CHECK(listener.failedPaths.size() == 1);

            if (expectedSucceeded.empty())
            {
                expectedSucceeded = listener.succeededPaths;
                expectedFailed = listener.failedPaths;
            }
            else
            {
                TEST_CHECK(listener.succeededPaths == expectedSucceeded);
                TEST_CHECK(listener.failedPaths == expectedFailed);
            }
        }
    }

    static void ListenerEvents()
    {
        std::string base = getTestFolder("ListenerEvents");
        std::string source = base + "/source";
        std::string dest = base + "/dest";
        makeTestTree(source);

        CopyPlan plan = planOrFail(source, dest);
        size_t files = plan.fileCount;
        size_t bytes = plan.byteCount;

        RecordingListener listener;
        CopyQueue queue(getTestOptions(2));
        queue.setListener(&listener);
        TEST_ASSERT(queue.start().index() == 1);
        queue.addPlan(std::move(plan));
        queue.join();

        TEST_CHECK(listener.startCalls == 1);
        TEST_CHECK(listener.filesTotal == files);
        TEST_CHECK(listener.bytesTotal == bytes);
        TEST_CHECK(listener.succeededPaths.size() == files);
        TEST_CHECK(listener.failedPaths.empty());
        TEST_CHECK(listener.finishCalls == 1);
        TEST_CHECK(listener.finalOutcome == RunSummary::Outcome::Success);
    }

    static void AddTasksIndividually()
    {
        std::string base = getTestFolder("AddTasksIndividually");
        writeFile(base + "/src", "some bytes");

        CopyTask directory;
        directory.destinationPath = base + "/out/nested";
        directory.kind = CopyTask::Kind::Directory;
        directory.mode = 0755;

        CopyTask file;
        file.sourcePath = base + "/src";
        file.destinationPath = base + "/out/nested/dst";
        file.sizeBytes = 10;
        file.kind = CopyTask::Kind::File;

        CopyQueue queue(getTestOptions(1));
        TEST_ASSERT(queue.start().index() == 1);
        queue.addTask(std::move(directory));
        queue.addTask(std::move(file));
        RunSummary summary = queue.join();

        TEST_CHECK(summary.outcome == RunSummary::Outcome::Success);
        TEST_CHECK(summary.totalFiles == 1);
        TEST_CHECK(queue.getProgress().snapshot().filesTotal == 1);
        TEST_CHECK(queue.getProgress().snapshot().bytesDone == 10);
        assertFilesEqual(base + "/src", base + "/out/nested/dst");
    }

    static void DirectoriesOnly()
    {
        std::string base = getTestFolder("DirectoriesOnly");
        std::string source = base + "/source";
        TEST_ASSERT(recursiveMkdir(source + "/a/b").index() == 1);
        TEST_ASSERT(recursiveMkdir(source + "/c").index() == 1);

        TEST_CHECK(callSupercopyMain({"-q", source, base + "/dest"}) == 0);
        TEST_CHECK(std::filesystem::is_directory(base + "/dest/a/b"));
        TEST_CHECK(std::filesystem::is_directory(base + "/dest/c"));
    }

    static void PlanOrdering()
    {
        std::string base = getTestFolder("PlanOrdering");
        std::string source = base + "/source";
        makeTestTree(source);

        CopyPlan plan = planOrFail(source, base + "/dest");

        TEST_CHECK(plan.fileCount == 5);
        TEST_CHECK(plan.byteCount == 10 + (100 * 1024 + 7) + 5000 + 1);
        TEST_CHECK(plan.destinationRoot == base + "/dest");

        std::vector<std::string> expected =
        {
            base + "/dest",
            base + "/dest/empty_dir",
            base + "/dest/sub",
            base + "/dest/sub/deeper",
            base + "/dest/a.txt",
            base + "/dest/empty",
            base + "/dest/sub/b.bin",
            base + "/dest/sub/deeper/c.bin",
            base + "/dest/sub/deeper/d.bin",
        };

        TEST_ASSERT(plan.tasks.size() == expected.size());
        for (size_t i = 0; i < expected.size(); i++)
        {
            TEST_CHECK(plan.tasks[i].destinationPath == expected[i]);
            TEST_MSG("task %zu: %s", i, plan.tasks[i].destinationPath.c_str());
            TEST_CHECK((plan.tasks[i].kind == CopyTask::Kind::Directory) == (i < 4));
        }

        // planning never touches the destination
        TEST_CHECK(!std::filesystem::exists(base + "/dest"));
    }

    static void PlannerErrors()
    {
        std::string base = getTestFolder("PlannerErrors");
        std::string source = base + "/source";
        TEST_ASSERT(mkdir(source.c_str(), 0755) == 0);
        TEST_ASSERT(mkdir((source + "/sub").c_str(), 0755) == 0);
        writeFile(source + "/file", "x");
        writeFile(base + "/plain_file", "y");

        TEST_CHECK(planError(base + "/does_not_exist", base + "/dest") == ErrorKind::NotFound);
        TEST_CHECK(planError("", base + "/dest") == ErrorKind::NotFound);
        TEST_CHECK(planError(source, "") == ErrorKind::InvalidDestination);

        TEST_CHECK(planError(source, base + "/plain_file") == ErrorKind::InvalidDestination);
        TEST_CHECK(planError(source, source + "/sub") == ErrorKind::InvalidDestination);
        TEST_CHECK(planError(source, source + "/new") == ErrorKind::InvalidDestination);
        TEST_CHECK(planError(source, source) == ErrorKind::InvalidDestination);
        TEST_CHECK(planError(source + "/file", base + "/plain_file/inside") == ErrorKind::InvalidDestination);
        TEST_CHECK(planError(source + "/file", source + "/file") == ErrorKind::InvalidDestination);

        // planning errors stop the run before anything is created
        TEST_CHECK(callSupercopyMain({"-q", base + "/does_not_exist", base + "/dest"}) == 1);
        TEST_CHECK(!std::filesystem::exists(base + "/dest"));
    }

    static void SymlinksAndSpecialFiles()
    {
        std::string base = getTestFolder("SymlinksAndSpecialFiles");
        std::string source = base + "/source";
        TEST_ASSERT(mkdir(source.c_str(), 0755) == 0);
        TEST_ASSERT(mkdir((source + "/real_dir").c_str(), 0755) == 0);
        writeFile(source + "/real_file", "target content");
        TEST_ASSERT(symlink("real_file", (source + "/file_link").c_str()) == 0);
        TEST_ASSERT(symlink("real_dir", (source + "/dir_link").c_str()) == 0);
        TEST_ASSERT(symlink("nothing_here", (source + "/dangling").c_str()) == 0);
        TEST_ASSERT(mkfifo((source + "/fifo").c_str(), 0644) == 0);

        CopyPlan plan = planOrFail(source, base + "/dest");
        TEST_CHECK(plan.fileCount == 2);
        TEST_CHECK(plan.skipped.size() == 3);

        CopyQueue queue(getTestOptions(2));
        TEST_ASSERT(queue.start().index() == 1);
        queue.addPlan(std::move(plan));
        TEST_CHECK(queue.join().outcome == RunSummary::Outcome::Success);

        assertFilesEqual(source + "/real_file", base + "/dest/file_link");
        TEST_CHECK(!std::filesystem::is_symlink(base + "/dest/file_link"));
        TEST_CHECK(std::filesystem::is_directory(base + "/dest/real_dir"));
        TEST_CHECK(!std::filesystem::exists(base + "/dest/dir_link"));
        TEST_CHECK(!std::filesystem::exists(base + "/dest/fifo"));
    }

    static void CommandLineErrors()
    {
        std::string base = getTestFolder("CommandLineErrors");
        writeFile(base + "/a", "a");

        TEST_CHECK(callSupercopyMain({"-q", base + "/a"}) == 1);
        TEST_CHECK(callSupercopyMain({"-q", base + "/a", base + "/b", base + "/c"}) == 1);
        TEST_CHECK(callSupercopyMain({"-q", "-w", "0", base + "/a", base + "/b"}) == 1);
        TEST_CHECK(callSupercopyMain({"-q", "--workers", "two", base + "/a", base + "/b"}) == 1);
        TEST_CHECK(callSupercopyMain({"-q", "-b", "-5", base + "/a", base + "/b"}) == 1);
        TEST_CHECK(callSupercopyMain({"-q", "--buffer", "12k", base + "/a", base + "/b"}) == 1);
        TEST_CHECK(callSupercopyMain({"-q", "--frobnicate", base + "/a", base + "/b"}) == 1);
        TEST_CHECK(callSupercopyMain({"-q", "-b", "9223372036854775808", base + "/a", base + "/b"}) == 1);
        TEST_CHECK(callSupercopyMain({"-q", "--buffer", "18446744073709551615", base + "/a", base + "/b"}) == 1);
        TEST_CHECK(callSupercopyMain({"-q", "-b", std::to_string(Config::MAX_BUFFER_SIZE + 1), base + "/a", base + "/b"}) == 1);
        TEST_CHECK(callSupercopyMain({"-q", "-w", "18446744073709551615", "-b", "4096", base + "/a", base + "/b"}) == 1);
        TEST_CHECK(!std::filesystem::exists(base + "/b"));

        TEST_CHECK(callSupercopyMain({"--help"}) == 0);
    }

    static void PreservesPermissionBits()
    {
        std::string base = getTestFolder("PreservesPermissionBits");
        writeFile(base + "/script", "#!/bin/sh\n");
        TEST_ASSERT(chmod((base + "/script").c_str(), 0750) == 0);

        mode_t oldMask = umask(0022);
        int ret = callSupercopyMain({"-q", base + "/script", base + "/copy"});
        umask(oldMask);

        TEST_CHECK(ret == 0);

        struct stat64 sb = {};
        TEST_ASSERT(stat64((base + "/copy").c_str(), &sb) == 0);
        TEST_CHECK((sb.st_mode & 07777) == 0750);
    }

    static void VerifierDigest()
    {
        std::string base = getTestFolder("VerifierDigest");
        writeFile(base + "/abc", "abc");
        writeFile(base + "/empty", std::vector<uint8_t>());

        // two byte blocks, so "abc" takes more than one read
        Heap heap;
        TEST_ASSERT(heap.allocate(1, 2, 2).index() == 1);
        uint8_t* buffer = heap.getBlock();
        TEST_ASSERT(buffer != nullptr);

        {
            IoRing ioRing;
            Verifier verifier(ioRing, buffer, 2);

            DigestResult abcDigest = verifier.digestFile(base + "/abc");
            TEST_ASSERT(std::holds_alternative<Sha256Digest>(abcDigest));
            TEST_CHECK(digestToHex(std::get<Sha256Digest>(abcDigest)) == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

            DigestResult emptyDigest = verifier.digestFile(base + "/empty");
            TEST_ASSERT(std::holds_alternative<Sha256Digest>(emptyDigest));
            TEST_CHECK(digestToHex(std::get<Sha256Digest>(emptyDigest)) == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");

            TEST_CHECK(verifier.getBytesHashed() == 3);

            DigestResult missing = verifier.digestFile(base + "/missing");
            TEST_ASSERT(std::holds_alternative<Error>(missing));
            TEST_CHECK(std::get<Error>(missing).kind == ErrorKind::IOError);

            Result same = verifier.verify(base + "/abc", base + "/abc");
            TEST_CHECK(std::holds_alternative<std::nullptr_t>(same));

            Result different = verifier.verify(base + "/abc", base + "/empty");
            TEST_ASSERT(std::holds_alternative<Error>(different));
            TEST_CHECK(std::get<Error>(different).kind == ErrorKind::VerifyMismatch);
        }

        heap.returnBlock(buffer);
    }

    static void ResultCollectorOutcomes()
    {
        using Kind = CopyTask::Kind;
        using Status = TaskResult::Status;

        {
            ResultCollector collector;
            RunSummary summary = collector.buildSummary(std::chrono::seconds(0));
            TEST_CHECK(summary.outcome == RunSummary::Outcome::Success);
            TEST_CHECK(summary.totalFiles == 0);
            TEST_CHECK(summary.averageThroughput == 0);
        }
        {
            ResultCollector collector;
            collector.add(makeResult(Kind::Directory, Status::Success, 0));
            collector.add(makeResult(Kind::File, Status::Success, 1000));
            collector.add(makeResult(Kind::File, Status::Success, 3000));
            TEST_CHECK(collector.size() == 3);

            RunSummary summary = collector.buildSummary(std::chrono::seconds(2));
            TEST_CHECK(collector.size() == 0);
            TEST_CHECK(summary.outcome == RunSummary::Outcome::Success);
            TEST_CHECK(summary.totalFiles == 2);
            TEST_CHECK(summary.succeeded == 2);
            TEST_CHECK(summary.bytesCopied == 4000);
            TEST_CHECK(summary.averageThroughput == 2000);
        }
        {
            ResultCollector collector;
            collector.add(makeResult(Kind::File, Status::Success, 10));
            collector.add(makeResult(Kind::File, Status::Failed, 5));
            collector.add(makeResult(Kind::File, Status::VerifyMismatch, 10));

            RunSummary summary = collector.buildSummary(std::chrono::seconds(1));
            TEST_CHECK(summary.outcome == RunSummary::Outcome::PartialFailure);
            TEST_CHECK(summary.totalFiles == 3);
            TEST_CHECK(summary.succeeded == 1);
            TEST_ASSERT(summary.failed.size() == 2);
            TEST_CHECK(summary.failed[0].status == Status::Failed);
            TEST_CHECK(summary.failed[1].status == Status::VerifyMismatch);
            TEST_CHECK(summary.countFailed(ErrorKind::IOError) == 1);
            TEST_CHECK(summary.countFailed(ErrorKind::VerifyMismatch) == 1);
        }
        {
            // a failed directory is reported, but isn't a file
            ResultCollector collector;
            collector.add(makeResult(Kind::Directory, Status::Failed, 0));
            collector.add(makeResult(Kind::File, Status::Failed, 0));

            RunSummary summary = collector.buildSummary(std::chrono::seconds(1));
            TEST_CHECK(summary.outcome == RunSummary::Outcome::Failure);
            TEST_CHECK(summary.totalFiles == 1);
            TEST_CHECK(summary.failed.size() == 2);
        }
    }

    static void HeapBlocks()
    {
        Heap heap;
        TEST_CHECK(heap.getBlock() == nullptr);
        TEST_ASSERT(heap.allocate(3, 1000, 4096).index() == 1);
        TEST_CHECK(heap.getBlockSize() == 4096);
        TEST_CHECK(heap.getAlignment() == 4096);
        TEST_CHECK(heap.getFreeBlocksCount() == 3);

        uint8_t* a = heap.getBlock();
        uint8_t* b = heap.getBlock();
        uint8_t* c = heap.getBlock();
        TEST_ASSERT(a && b && c);
        TEST_CHECK(a != b && b != c && a != c);
        TEST_CHECK(intptr_t(a) % 4096 == 0 && intptr_t(b) % 4096 == 0 && intptr_t(c) % 4096 == 0);
        TEST_CHECK(heap.getBlock() == nullptr);
        TEST_CHECK(heap.getFreeBlocksCount() == 0);

        heap.returnBlock(b);
        TEST_CHECK(heap.getFreeBlocksCount() == 1);
        TEST_CHECK(heap.getBlock() == b);

        heap.returnBlock(a);
        heap.returnBlock(b);
        heap.returnBlock(c);
        TEST_CHECK(heap.getFreeBlocksCount() == 3);
    }

    static void HeapRejectsOversizedBuffers()
    {
        {
            Heap heap;
            Result result = heap.allocate(2, size_t(1) << 63, 4096);
            TEST_ASSERT(std::holds_alternative<Error>(result));
            TEST_CHECK(std::get<Error>(result).message().find("overflows") != std::string::npos);
            TEST_CHECK(heap.getBlock() == nullptr);
            TEST_CHECK(heap.getBlockCount() == 0);
        }

        {
            Heap heap;
            TEST_CHECK(std::holds_alternative<Error>(heap.allocate(1, SIZE_MAX, 4096)));
            TEST_CHECK(heap.getBlock() == nullptr);

            // A failed attempt leaves the heap usable
            TEST_ASSERT(heap.allocate(1, 100).index() == 1);
            uint8_t* block = heap.getBlock();
            TEST_ASSERT(block != nullptr);
            memset(block, 'x', heap.getBlockSize());
            heap.returnBlock(block);
        }
    }

    static void CopyQueueStartFailsOnHugeBuffer()
    {
        CopyQueue queue(getTestOptions(4, SIZE_MAX / 2));
        Result result = queue.start();
        TEST_ASSERT(std::holds_alternative<Error>(result));
        TEST_CHECK(!std::get<Error>(result).message().empty());
    }

    static void IoRingCopyChunk()
    {
        runWithAllPartialModes([]() {
            std::string base = getTestFolder("IoRingCopyChunk");
            std::vector<uint8_t> data = randomData(10000);
            writeFile(base + "/in", data);

            Heap heap;
            TEST_ASSERT(heap.allocate(1, 4096).index() == 1);
            uint8_t* buffer = heap.getBlock();
            TEST_ASSERT(buffer != nullptr);

            {
                IoRing ioRing;
                ScopedFileDescriptor in;
                ScopedFileDescriptor out;
                TEST_ASSERT(in.open(base + "/in", O_RDONLY).index() == 1);
                TEST_ASSERT(out.open(base + "/out", O_WRONLY | O_CREAT | O_TRUNC, 0644).index() == 1);

                off_t offset = 0;
                while (true)
                {
                    IoRing::IoResult result = ioRing.copyChunk(in, out, buffer, heap.getBlockSize(), offset);
                    TEST_ASSERT(std::holds_alternative<size_t>(result));

                    size_t copied = std::get<size_t>(result);
                    TEST_ASSERT(copied <= heap.getBlockSize());
                    if (copied == 0)
                        break;
                    offset += off_t(copied);
                }

                TEST_CHECK(offset == off_t(data.size()));
                TEST_CHECK(out.close().index() == 1);
                TEST_CHECK(in.close().index() == 1);
            }

            heap.returnBlock(buffer);
            TEST_CHECK(readWholeFile(base + "/out") == data);
        });
    }

    static void RecursiveMkdir()
    {
        std::string base = getTestFolder("RecursiveMkdir");

        TEST_CHECK(recursiveMkdir(base + "/a/b/c/").index() == 1);
        TEST_CHECK(std::filesystem::is_directory(base + "/a/b/c"));
        TEST_CHECK(recursiveMkdir(base + "/a/b").index() == 1);

        writeFile(base + "/file", "x");
        Result result = recursiveMkdir(base + "/file/below");
        TEST_ASSERT(std::holds_alternative<Error>(result));
        TEST_CHECK(std::get<Error>(result).kind == ErrorKind::IOError);
    }

    static void HumanFriendlyFormatting()
    {
        TEST_CHECK(humanFriendlyFileSize(0) == "0.00 B");
        TEST_CHECK(humanFriendlyFileSize(1536) == "1.50 KiB");
        TEST_CHECK(humanFriendlyFileSize(1024 * 1024) == "1.00 MiB");
        TEST_CHECK(humanFriendlyTime(1.25) == "1.2s" || humanFriendlyTime(1.25) == "1.3s");
        TEST_CHECK(humanFriendlyTime(125) == "2m05s");
        TEST_CHECK(humanFriendlyTime(3 * 3600 + 7 * 60) == "3h07m");
    }
};

TEST_LIST =
{
    {"CopySmallFileIntoDirectory", TestContainer::CopySmallFileIntoDirectory},
    {"CopyTree", TestContainer::CopyTree},
    {"CopyTreeWithVerify", TestContainer::CopyTreeWithVerify},
    {"ResolveCopyDestination", TestContainer::ResolveCopyDestination},
    {"RelativeSingleFileCopy", TestContainer::RelativeSingleFileCopy},
    {"SourceDeletedBeforeTaskRuns", TestContainer::SourceDeletedBeforeTaskRuns},
    {"VerifyDetectsCorruption", TestContainer::VerifyDetectsCorruption},
    {"SourceGrowsDuringCopy", TestContainer::SourceGrowsDuringCopy},
    {"WriteErrorLeavesPartialDestination", TestContainer::WriteErrorLeavesPartialDestination},
    {"TinyBuffer", TestContainer::TinyBuffer},
    {"ProgressIsMonotonic", TestContainer::ProgressIsMonotonic},
    {"WorkerCountDoesNotChangeOutcome", TestContainer::WorkerCountDoesNotChangeOutcome},
    {"ListenerEvents", TestContainer::ListenerEvents},
    {"AddTasksIndividually", TestContainer::AddTasksIndividually},
    {"DirectoriesOnly", TestContainer::DirectoriesOnly},
    {"PlanOrdering", TestContainer::PlanOrdering},
    {"PlannerErrors", TestContainer::PlannerErrors},
    {"SymlinksAndSpecialFiles", TestContainer::SymlinksAndSpecialFiles},
    {"CommandLineErrors", TestContainer::CommandLineErrors},
    {"PreservesPermissionBits", TestContainer::PreservesPermissionBits},
    {"VerifierDigest", TestContainer::VerifierDigest},
    {"ResultCollectorOutcomes", TestContainer::ResultCollectorOutcomes},
    {"HeapBlocks", TestContainer::HeapBlocks},
    {"HeapRejectsOversizedBuffers", TestContainer::HeapRejectsOversizedBuffers},
    {"CopyQueueStartFailsOnHugeBuffer", TestContainer::CopyQueueStartFailsOnHugeBuffer},
    {"IoRingCopyChunk", TestContainer::IoRingCopyChunk},
    {"RecursiveMkdir", TestContainer::RecursiveMkdir},
    {"HumanFriendlyFormatting", TestContainer::HumanFriendlyFormatting},
    {nullptr, nullptr }
};
