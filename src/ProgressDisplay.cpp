#include "ProgressDisplay.hpp"
#include "Assert.hpp"
#include "Config.hpp"
#include "Util.hpp"
#include <sys/ioctl.h>
#include <unistd.h>
#include <cerrno>
#include <cstdlib>
#include <ctime>

namespace
{
    std::string leftPad(const std::string& left, const std::string& str, int32_t targetLength, char padChar = ' ')
    {
        std::string pad(left);
        for (int32_t i = int32_t(pad.size()); i < targetLength - int32_t(str.length()); i++)
            pad += padChar;
        return pad + str;
    }

    std::string rightPad(const std::string& left, const std::string& str, int32_t targetLength)
    {
        std::string pad(left);
        for (int32_t i = int32_t(pad.size()); i < targetLength - int32_t(str.length()); i++)
            pad += " ";
        return str + pad;
    }

    std::string centreAlign(const std::string& left, const std::string& centre, int32_t lineWidth)
    {
        std::string str(left);
        for (int32_t i = int32_t(str.length()); i < (lineWidth / 2) - int32_t(centre.length() / 2); i++)
            str += " ";
        str += centre;

        return str;
    }
}

ProgressDisplay::ProgressDisplay(const ProgressState& progress)
    : progress(progress)
{}

ProgressDisplay::~ProgressDisplay()
{
    release_assert(!this->running);
    [[maybe_unused]] int ret = pthread_mutex_destroy(&this->messagesMutex);
    debug_assert(ret == 0);
}

bool ProgressDisplay::canShowOnStderr()
{
    return Config::PROGRESS_DEBUG_SIMPLE || (isatty(STDERR_FILENO) && getenv("TERM"));
}

void ProgressDisplay::postMessage(std::string&& message)
{
    pthread_mutex_lock(&this->messagesMutex);
    this->messages.emplace_back(std::move(message));
    pthread_mutex_unlock(&this->messagesMutex);
}

void ProgressDisplay::showProgress()
{
    int32_t termWidth = 100;
    if (!Config::PROGRESS_DEBUG_SIMPLE)
    {
        winsize winsize = {};
        if (ioctl(STDERR_FILENO, TIOCGWINSZ, &winsize) == 0 && winsize.ws_col > 0)
            termWidth = winsize.ws_col;
    }

    if (!this->firstShow && !Config::PROGRESS_DEBUG_SIMPLE)
    {
        // return to start of line, and move three lines up (ie, move cursor to the top left of our draw area)
        fputs("\r\033[3A", stderr);
    }

    auto showLine = [&](const std::string& line)
    {
        fputs((rightPad("", line, termWidth) + "\n").c_str(), stderr);
    };

    std::vector<std::string> localMessages;
    {
        pthread_mutex_lock(&this->messagesMutex);
        if (!this->messages.empty())
            this->messages.swap(localMessages);
        pthread_mutex_unlock(&this->messagesMutex);
    }

    for (const auto& message : localMessages)
        showLine(message);

    // read once so our calculations are consistent with eachother
    ProgressState::Snapshot snapshot = this->progress.snapshot();
    std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now();

    double bytesPerSecond = 0;
    {
        this->ratePoints.push_back(RatePoint{now, snapshot.bytesDone});

        size_t firstInWindow = 0;
        while (firstInWindow + 1 < this->ratePoints.size() &&
               std::chrono::duration<double>(now - this->ratePoints[firstInWindow].time).count() > Config::RATE_WINDOW_SECONDS)
        {
            firstInWindow++;
        }
        this->ratePoints.erase(this->ratePoints.begin(), this->ratePoints.begin() + firstInWindow);

        const RatePoint& oldest = this->ratePoints.front();
        double windowSeconds = std::chrono::duration<double>(now - oldest.time).count();
        if (windowSeconds > 0)
            bytesPerSecond = double(snapshot.bytesDone - oldest.bytes) / windowSeconds;
    }

    // bytes line
    {
        double secondsSinceStart = std::chrono::duration<double>(now - this->started).count();
        std::string statusLine = " Elapsed: " + humanFriendlyTime(secondsSinceStart);

        std::string centre = leftPad("", humanFriendlyFileSize(snapshot.bytesDone), 10) + " / " + humanFriendlyFileSize(snapshot.bytesTotal);
        statusLine = centreAlign(statusLine, centre, termWidth);

        std::string right = leftPad("", humanFriendlyFileSize(size_t(bytesPerSecond)), 10) + "/s ";
        statusLine = leftPad(statusLine, right, termWidth);

        showLine(statusLine);
    }

    // files line
    showLine(centreAlign("", "Files: " + std::to_string(snapshot.filesDone) + " / " + std::to_string(snapshot.filesTotal), termWidth));

    // progress bar
    {
        float ratio = snapshot.bytesTotal > 0 ? float(snapshot.bytesDone) / float(snapshot.bytesTotal) :
                      snapshot.filesTotal > 0 ? float(snapshot.filesDone) / float(snapshot.filesTotal) : 0;
        int percentDone = int(ratio * 100.0f);

        int32_t width = termWidth - 6;

        std::string progressBarLine = leftPad("", std::to_string(percentDone), 3) + "% ";

        int doneChars = int(ratio * float(width));
        for (int32_t i = 0; i < width; i++)
            progressBarLine += i < doneChars ? "█" : "▒";

        showLine(progressBarLine);
    }

    this->firstShow = false;
}

void ProgressDisplay::showProgressLoop()
{
    pthread_setname_np(pthread_self(), "progress");

    const float updateIntervalSeconds = float(Config::PROGRESS_UPDATE_INTERVAL_MS) / 1000.0f;

    fputs("\n", stderr);

    while (true)
    {
        this->showProgress();

        // wait for the specified time, but allow fast exit when we're done (by the controlling thread unlocking the mutex)
        timespec timeoutTime = {};
        clock_gettime(CLOCK_REALTIME, &timeoutTime);
        timeoutTime.tv_sec += time_t(updateIntervalSeconds);
        timeoutTime.tv_nsec += long((updateIntervalSeconds - float(time_t(updateIntervalSeconds))) * 1000000000.0f);
        if (timeoutTime.tv_nsec >= 1000000000L)
        {
            timeoutTime.tv_sec += 1;
            timeoutTime.tv_nsec -= 1000000000L;
        }

        int err = pthread_mutex_timedlock(&this->progressEndMutex, &timeoutTime);
        release_assert(err == 0 || err == ETIMEDOUT);
        if (err == 0)
        {
            pthread_mutex_unlock(&this->progressEndMutex);
            break;
        }
    }

    // one last draw, so the final state is what stays on screen
    this->showProgress();
}

// start() and stop() must be called from the same thread, that thread holds progressEndMutex while the display runs
void ProgressDisplay::start()
{
    release_assert(!this->running);

    this->started = std::chrono::steady_clock::now();
    this->firstShow = true;
    this->ratePoints.clear();

    pthread_mutex_lock(&this->progressEndMutex);
    release_assert(pthread_create(&this->showProgressThread, nullptr, ProgressDisplay::staticCallShowProgressLoop, this) == 0);
    this->running = true;
}

void ProgressDisplay::stop()
{
    if (!this->running)
        return;

    pthread_mutex_unlock(&this->progressEndMutex); // signals the progress thread to stop sleeping, if it is ATM
    pthread_join(this->showProgressThread, nullptr);
    this->running = false;
}
