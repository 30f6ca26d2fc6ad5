#include "message_bus.h"
#include "log.h"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace beacontrack {

static const int READER_POLL_MS = 200;
static const uint32_t QUEUE_POLL_MS = 100;

StreamSink::StreamSink(FILE *stream) : stream(stream), ownsStream(false) {}

StreamSink::~StreamSink() {
    if (ownsStream && stream) fclose(stream);
}

std::unique_ptr<StreamSink> StreamSink::openPath(const std::string &path) {
    if (path.empty() || path == "-") return std::unique_ptr<StreamSink>(new StreamSink(stdout));

    FILE *f = fopen(path.c_str(), "a");
    if (!f) {
        logPrintf("[PUBLISH] Failed to open output '%s': %s\n", path.c_str(), strerror(errno));
        return nullptr;
    }
    std::unique_ptr<StreamSink> sink(new StreamSink(f));
    sink->ownsStream = true;
    return sink;
}

bool StreamSink::publish(const OutboundMessage &message) {
    std::lock_guard<std::mutex> lock(streamMutex);
    if (fprintf(stream, "%s %s\n", message.topic.c_str(), message.payload.c_str()) < 0) return false;
    return fflush(stream) == 0;
}

OutboundPublisher::OutboundPublisher(MessageSink &sink, PipelineStats &stats, size_t capacity)
    : queue(capacity), sink(sink), stats(stats), running(false) {}

OutboundPublisher::~OutboundPublisher() {
    stop();
}

void OutboundPublisher::enqueue(const OutboundMessage &message) {
    switch (queue.push(message)) {
        case QUEUE_DROPPED_OLDEST:
            stats.outboundDropped++;
            logPrintf("[PUBLISH] Queue full, dropped oldest message\n");
            break;
        case QUEUE_CLOSED:
            logPrintf("[PUBLISH] Publisher stopped, %s not sent\n", message.topic.c_str());
            break;
        case QUEUE_PUSHED:
            break;
    }
}

void OutboundPublisher::publisherTask() {
    OutboundMessage message;
    while (queue.pop(message, QUEUE_POLL_MS) || running.load()) {
        if (message.topic.empty()) continue;

        if (sink.publish(message)) {
            if (message.kind == MESSAGE_ALERT) {
                stats.alertsPublished++;
            } else {
                stats.positionsPublished++;
            }
        } else {
            stats.errors++;
            logPrintf("[PUBLISH] Publish to %s failed\n", message.topic.c_str());
        }
        message.topic.clear();
    }
}

void OutboundPublisher::start() {
    if (running.exchange(true)) return;
    worker = std::thread(&OutboundPublisher::publisherTask, this);
}

void OutboundPublisher::stop() {
    if (!running.exchange(false)) return;
    queue.close();
    if (worker.joinable()) worker.join();
}

InboundListener::InboundListener(int fd, bool ownsFd, Ingestor &ingestor, PipelineStats &stats, size_t capacity)
    : fd(fd), ownsFd(ownsFd), ingestor(ingestor), stats(stats), lines(capacity), stopRequested(false),
      inputEnded(false) {}

InboundListener::~InboundListener() {
    stop();
    if (ownsFd && fd >= 0) ::close(fd);
}

int InboundListener::openInput(const std::string &path) {
    if (path.empty() || path == "-") return STDIN_FILENO;

    int f = ::open(path.c_str(), O_RDONLY);
    if (f < 0) {
        logPrintf("[INGEST] Failed to open input '%s': %s\n", path.c_str(), strerror(errno));
    }
    return f;
}

void InboundListener::readerTask() {
    std::string buffer;
    char chunk[4096];

    while (!stopRequested.load()) {
        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int ready = poll(&pfd, 1, READER_POLL_MS);
        if (ready < 0) {
            if (errno == EINTR) continue;
            logPrintf("[INGEST] poll failed: %s\n", strerror(errno));
            break;
        }
        if (ready == 0) continue;

        ssize_t n = ::read(fd, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            logPrintf("[INGEST] read failed: %s\n", strerror(errno));
            break;
        }
        if (n == 0) break;

        for (ssize_t i = 0; i < n; i++) {
            char c = chunk[i];
            if (c == '\n' || c == '\r') {
                if (!buffer.empty()) {
                    if (lines.push(buffer) == QUEUE_DROPPED_OLDEST) stats.inboundDropped++;
                    buffer.clear();
                }
            } else {
                buffer += c;
                if (buffer.length() > BEACONTRACK_MAX_LINE_LENGTH) {
                    logPrintf("[INGEST] Line exceeds %d bytes, discarded\n", BEACONTRACK_MAX_LINE_LENGTH);
                    stats.decodeErrors++;
                    buffer.clear();
                }
            }
        }
    }

    if (!buffer.empty() && !stopRequested.load()) {
        if (lines.push(buffer) == QUEUE_DROPPED_OLDEST) stats.inboundDropped++;
    }
    logPrintf("[INGEST] Input closed\n");
    lines.close();
}

void InboundListener::consumerTask() {
    std::string line;
    for (;;) {
        if (!lines.pop(line, QUEUE_POLL_MS)) {
            if (lines.isClosed() || stopRequested.load()) break;
            continue;
        }
        ingestor.ingestLine(line, nowMillis());
    }
    inputEnded = true;
}

void InboundListener::start() {
    if (fd < 0) return;
    reader = std::thread(&InboundListener::readerTask, this);
    consumer = std::thread(&InboundListener::consumerTask, this);
}

void InboundListener::stop() {
    stopRequested = true;
    if (reader.joinable()) reader.join();
    if (consumer.joinable()) consumer.join();
}

bool InboundListener::finished() const {
    return inputEnded.load();
}

}  // namespace beacontrack
