#include "log.h"
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>

namespace beacontrack {

static std::mutex logMutex;
static FILE *logFile = nullptr;
static bool logEnabled = true;
static bool logFileFailed = false;

uint64_t nowMillis() {
    return (uint64_t)std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string formatIsoTimestamp(uint64_t epochMs) {
    time_t secs = (time_t)(epochMs / 1000);
    struct tm tmUtc;
    gmtime_r(&secs, &tmUtc);

    char b[32];
    size_t n = strftime(b, sizeof(b), "%Y-%m-%dT%H:%M:%S", &tmUtc);
    snprintf(b + n, sizeof(b) - n, ".%03uZ", (unsigned)(epochMs % 1000));
    return std::string(b);
}

std::string getFormattedTimestamp() {
    time_t secs = (time_t)(nowMillis() / 1000);
    struct tm tmUtc;
    gmtime_r(&secs, &tmUtc);

    char b[24];
    strftime(b, sizeof(b), "%Y-%m-%d %H:%M:%S", &tmUtc);
    return std::string(b);
}

void setLogEnabled(bool enabled) {
    std::lock_guard<std::mutex> lock(logMutex);
    logEnabled = enabled;
}

static void writeLine(const char *line) {
    // caller holds logMutex
    if (!logEnabled) return;
    fputs(line, stderr);
    if (logFile) {
        fprintf(logFile, "%s %s", getFormattedTimestamp().c_str(), line);
        fflush(logFile);
    }
}

void logPrintf(const char *fmt, ...) {
    char buf[1024];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);

    std::lock_guard<std::mutex> lock(logMutex);
    writeLine(buf);
}

void logPrintln(const std::string &line) {
    std::string withNewline = line + "\n";
    std::lock_guard<std::mutex> lock(logMutex);
    writeLine(withNewline.c_str());
}

bool initializeLog(const std::string &path) {
    std::lock_guard<std::mutex> lock(logMutex);
    if (logFile) {
        fclose(logFile);
        logFile = nullptr;
    }
    if (path.empty()) return true;

    logFile = fopen(path.c_str(), "a");
    if (!logFile) {
        if (!logFileFailed) {
            fprintf(stderr, "[LOG] Failed to open log file %s, console only\n", path.c_str());
            logFileFailed = true;
        }
        return false;
    }
    logFileFailed = false;
    return true;
}

void closeLog() {
    std::lock_guard<std::mutex> lock(logMutex);
    if (logFile) {
        fclose(logFile);
        logFile = nullptr;
    }
}

}  // namespace beacontrack
