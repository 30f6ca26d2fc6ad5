#pragma once
#include "bounded_queue.h"
#include "ingestion.h"
#include "message_codec.h"
#include "stats.h"
#include <atomic>
#include <cstdio>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace beacontrack {

#ifndef BEACONTRACK_MAX_LINE_LENGTH
#define BEACONTRACK_MAX_LINE_LENGTH 65536
#endif

class MessageSink {
public:
    virtual ~MessageSink() {}
    virtual bool publish(const OutboundMessage &message) = 0;
};

// Writes "<topic> <json>" lines to a stdio stream.
class StreamSink : public MessageSink {
private:
    FILE *stream;
    bool ownsStream;
    std::mutex streamMutex;

public:
    explicit StreamSink(FILE *stream);
    ~StreamSink() override;

    StreamSink(const StreamSink &) = delete;
    StreamSink &operator=(const StreamSink &) = delete;

    // "-" or empty selects stdout
    static std::unique_ptr<StreamSink> openPath(const std::string &path);

    bool publish(const OutboundMessage &message) override;
};

// Drains the outbound queue into a sink on its own task, so a slow sink
// never holds up a tick.
class OutboundPublisher {
private:
    BoundedQueue<OutboundMessage> queue;
    MessageSink &sink;
    PipelineStats &stats;
    std::thread worker;
    std::atomic<bool> running;

    void publisherTask();

public:
    OutboundPublisher(MessageSink &sink, PipelineStats &stats, size_t capacity);
    ~OutboundPublisher();

    // Never blocks; a full queue drops its oldest message.
    void enqueue(const OutboundMessage &message);

    void start();
    // Publishes whatever is still queued, then joins.
    void stop();
    size_t pending() const { return queue.size(); }
};

// Reader task splits the input stream into lines onto a bounded queue; the
// consumer task decodes and ingests them.
class InboundListener {
private:
    int fd;
    bool ownsFd;
    Ingestor &ingestor;
    PipelineStats &stats;
    BoundedQueue<std::string> lines;
    std::thread reader;
    std::thread consumer;
    std::atomic<bool> stopRequested;
    std::atomic<bool> inputEnded;

    void readerTask();
    void consumerTask();

public:
    InboundListener(int fd, bool ownsFd, Ingestor &ingestor, PipelineStats &stats, size_t capacity);
    ~InboundListener();

    // "-" or empty selects stdin. Returns -1 when the file cannot be opened.
    static int openInput(const std::string &path);

    void start();
    void stop();
    // True once the input hit end-of-file and every queued line was ingested.
    bool finished() const;
};

}  // namespace beacontrack
