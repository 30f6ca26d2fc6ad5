#include "config.h"
#include "ingestion.h"
#include "log.h"
#include "message_bus.h"
#include "message_codec.h"
#include "path_loss.h"
#include "processing_scheduler.h"
#include "record_store.h"
#include "signal_store.h"
#include "site_registry.h"
#include "stats.h"
#include "temporal_smoother.h"
#include "zone_engine.h"
#include <chrono>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <map>
#include <memory>
#include <thread>
#include <unistd.h>

using namespace beacontrack;

static volatile sig_atomic_t shutdownRequested = 0;

static void handleShutdownSignal(int) {
    shutdownRequested = 1;
}

static void installSignalHandlers() {
    struct sigaction action;
    memset(&action, 0, sizeof(action));
    action.sa_handler = handleShutdownSignal;
    sigemptyset(&action.sa_mask);
    if (sigaction(SIGINT, &action, nullptr) != 0 || sigaction(SIGTERM, &action, nullptr) != 0) {
        logPrintf("[SCHED] WARNING: could not install signal handlers: %s\n", strerror(errno));
    }
}

static void printUsage(const char *argv0) {
    fprintf(stderr,
            "usage: %s <config.json>\n"
            "       %s calibrate <samples.json> [config.json]\n",
            argv0, argv0);
}

static int runCalibrate(const std::string &path, const std::string &configPath) {
    std::vector<Gateway> configured;
    if (!configPath.empty()) {
        PipelineConfig pipeline = defaultPipelineConfig();
        IoConfig io = defaultIoConfig();
        SiteRegistry registry;
        if (!loadConfiguration(configPath, pipeline, io, registry)) return 1;
        configured = registry.getGateways();
    }

    std::string json;
    if (!readTextFile(path, json)) {
        logPrintf("[CALIB] Failed to open samples file '%s'\n", path.c_str());
        return 1;
    }

    std::vector<PathLossSample> samples;
    if (!parseCalibrationSamples(json, samples)) return 1;

    std::map<std::string, CalibrationResult> results;
    if (calibrateGateways(samples, configured, BEACONTRACK_CALIBRATION_BLEND_ALPHA, results) == 0) {
        logPrintf("[CALIB] No gateway could be calibrated\n");
        return 1;
    }

    printf("%s\n", encodeCalibrationReport(results).c_str());
    return 0;
}

static int runDaemon(const std::string &configPath) {
    PipelineConfig pipeline = defaultPipelineConfig();
    IoConfig io = defaultIoConfig();
    SiteRegistry registry;

    if (!loadConfiguration(configPath, pipeline, io, registry)) {
        logPrintf("[CONFIG] Cannot start without a valid configuration\n");
        return 1;
    }
    if (!io.logFile.empty() && !initializeLog(io.logFile)) {
        logPrintf("[CONFIG] Continuing with console logging only\n");
    }

    PipelineStats stats;
    SignalStore store;

    std::unique_ptr<RecordStore> records;
    if (!io.historyFile.empty()) {
        std::unique_ptr<JsonlRecordStore> history(new JsonlRecordStore(io.historyFile));
        if (history->open()) {
            records = std::move(history);
        } else {
            logPrintf("[STORE] Keeping history in memory only\n");
        }
    }
    if (!records) records.reset(new MemoryRecordStore());

    std::unique_ptr<StreamSink> sink = StreamSink::openPath(io.output);
    if (!sink) return 1;

    int inputFd = InboundListener::openInput(io.input);
    if (inputFd < 0) return 1;

    OutboundPublisher publisher(*sink, stats, pipeline.outboundQueueSize);
    TemporalSmoother smoother(toSmootherConfig(pipeline));
    ZoneEngine zones(registry.getZones(), toZoneEngineConfig(pipeline));
    ProcessingScheduler scheduler(pipeline, io, registry, store, smoother, zones, records.get(), &publisher, stats);
    Ingestor ingestor(registry, store, records.get(), stats, pipeline.autoDiscoverBeacons);
    InboundListener listener(inputFd, inputFd != STDIN_FILENO, ingestor, stats, pipeline.inboundQueueSize);

    installSignalHandlers();
    publisher.start();
    scheduler.start();
    listener.start();

    logPrintln("===== BEACONTRACK STARTED =====");
    logPrintf("[SCHED] window %u ms, tick %u ms, %u workers\n", (unsigned)pipeline.windowMs,
              (unsigned)pipeline.tickPeriodMs, (unsigned)pipeline.workerThreads);

    uint64_t lastDiagnostics = nowMillis();
    while (!shutdownRequested && !listener.finished()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        if (pipeline.diagnosticsIntervalMs > 0 && nowMillis() - lastDiagnostics >= pipeline.diagnosticsIntervalMs) {
            logPrintln(getDiagnostics(stats));
            lastDiagnostics = nowMillis();
        }
    }

    logPrintf("[SCHED] %s, shutting down\n", shutdownRequested ? "Signal received" : "End of input");
    listener.stop();
    scheduler.stop();
    scheduler.tick(nowMillis());
    publisher.stop();

    logPrintln(getDiagnostics(stats));
    closeLog();
    return 0;
}

int main(int argc, char **argv) {
    if ((argc == 3 || argc == 4) && strcmp(argv[1], "calibrate") == 0) {
        return runCalibrate(argv[2], argc == 4 ? argv[3] : "");
    }
    if (argc != 2) {
        printUsage(argv[0]);
        return 2;
    }
    return runDaemon(argv[1]);
}
