#pragma once
#include <cstdint>
#include <string>

namespace beacontrack {

// Console log lines are "[TAG] message". Safe to call from any task.
void logPrintf(const char *fmt, ...) __attribute__((format(printf, 1, 2)));
void logPrintln(const std::string &line);

bool initializeLog(const std::string &path);
void closeLog();
void setLogEnabled(bool enabled);

uint64_t nowMillis();
std::string getFormattedTimestamp();
std::string formatIsoTimestamp(uint64_t epochMs);

}  // namespace beacontrack
