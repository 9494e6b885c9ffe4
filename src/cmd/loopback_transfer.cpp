/**
 * @file loopback_transfer.cpp
 * @brief Sends a file between two in-process endpoints over a lossy link
 *
 * Usage:
 *   chunkwire_loopback <file_path> [options]
 *
 * Options:
 *   --drop <rate>      Probability [0, 1) that a message is lost (default 0)
 *   --latency <ms>     One-way delivery delay (default 5)
 *   --config <path>    EngineConfig JSON file
 *   --out <dir>        Receiver output directory
 *   --seed <n>         Seed for the loss generator
 *   --timeout <s>      Give up after this many seconds (default 600)
 *   --log <path>       Mirror log lines into a journal file
 *
 * Example:
 *   chunkwire_loopback video.mp4 --drop 0.05 --latency 20
 *
 * (c) 2026 ChunkWire Project
 * Licensed under MIT License
 */

#include "chunkwire/AtomicFile.h"
#include "chunkwire/ChunkSource.h"
#include "chunkwire/EngineConfig.h"
#include "chunkwire/Scheduler.h"
#include "chunkwire/ThreadSafeLog.h"
#include "chunkwire/TransferEndpoint.h"
#include "chunkwire/TransferUtils.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

using namespace ChunkWire;

namespace {

/**
 * @brief One direction of the simulated link
 *
 * Messages are delivered to the peer endpoint from the scheduler thread
 * after the configured latency, or silently lost.
 */
class LossyLink final : public DataChannel {
public:
    LossyLink(Scheduler& scheduler, double dropRate, int64_t latencyMs, uint64_t seed)
        : m_scheduler(scheduler)
        , m_dropRate(dropRate)
        , m_latencyMs(latencyMs)
        , m_rng(seed)
    {
    }

    void connect(TransferEndpoint* peer) { m_peer = peer; }

    bool send(const uint8_t* data, size_t size, std::string& errorMsg) override {
        if (size > maxMessageSize()) {
            errorMsg = "message of " + std::to_string(size) + " bytes exceeds link limit";
            return false;
        }
        ++m_sent;
        if (shouldDrop()) {
            ++m_dropped;
            return true;
        }

        auto message = std::make_shared<std::vector<uint8_t>>(data, data + size);
        m_buffered += size;
        m_scheduler.scheduleAfter(m_latencyMs, [this, message] {
            m_buffered -= message->size();
            if (m_peer) {
                m_peer->onMessage(message->data(), message->size());
            }
        });
        return true;
    }

    size_t bufferedBytes() const override { return m_buffered.load(); }

    uint64_t sent() const { return m_sent.load(); }
    uint64_t dropped() const { return m_dropped.load(); }

private:
    bool shouldDrop() {
        if (m_dropRate <= 0.0) {
            return false;
        }
        std::lock_guard<std::mutex> lock(m_rngMutex);
        return std::uniform_real_distribution<double>(0.0, 1.0)(m_rng) < m_dropRate;
    }

    Scheduler& m_scheduler;
    const double m_dropRate;
    const int64_t m_latencyMs;
    TransferEndpoint* m_peer = nullptr;

    std::mutex m_rngMutex;
    std::mt19937_64 m_rng;

    std::atomic<size_t> m_buffered{0};
    std::atomic<uint64_t> m_sent{0};
    std::atomic<uint64_t> m_dropped{0};
};

struct Options {
    std::string filePath;
    double dropRate = 0.0;
    int64_t latencyMs = 5;
    std::string configPath;
    std::string outputDir;
    uint64_t seed = 0;
    bool seedSet = false;
    int64_t timeoutSeconds = 600;
    std::string logPath;
};

/**
 * @brief Print usage information
 */
void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " <file_path> [options]\n";
    std::cout << "\nOptions:\n";
    std::cout << "  --drop <rate>     Probability a message is lost, 0 <= rate < 1 (default 0)\n";
    std::cout << "  --latency <ms>    One-way delivery delay in ms (default 5)\n";
    std::cout << "  --config <path>   EngineConfig JSON file\n";
    std::cout << "  --out <dir>       Receiver output directory\n";
    std::cout << "  --seed <n>        Seed for the loss generator\n";
    std::cout << "  --timeout <s>     Give up after this many seconds (default 600)\n";
    std::cout << "  --log <path>      Mirror log lines into a journal file\n";
    std::cout << "\nExample:\n";
    std::cout << "  " << programName << " video.mp4 --drop 0.05 --latency 20\n";
}

bool parseArgs(int argc, char* argv[], Options& options, std::string& errorMsg) {
    if (argc < 2) {
        errorMsg = "missing file path";
        return false;
    }
    options.filePath = argv[1];

    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        if (i + 1 >= argc) {
            errorMsg = "missing value for " + arg;
            return false;
        }
        const std::string value = argv[++i];
        try {
            if (arg == "--drop") {
                options.dropRate = std::stod(value);
                if (options.dropRate < 0.0 || options.dropRate >= 1.0) {
                    errorMsg = "drop rate must be in [0, 1)";
                    return false;
                }
            } else if (arg == "--latency") {
                options.latencyMs = std::stoll(value);
            } else if (arg == "--config") {
                options.configPath = value;
            } else if (arg == "--out") {
                options.outputDir = value;
            } else if (arg == "--seed") {
                options.seed = std::stoull(value);
                options.seedSet = true;
            } else if (arg == "--timeout") {
                options.timeoutSeconds = std::stoll(value);
            } else if (arg == "--log") {
                options.logPath = value;
            } else {
                errorMsg = "unknown option " + arg;
                return false;
            }
        } catch (const std::exception&) {
            errorMsg = "invalid value for " + arg + ": " + value;
            return false;
        }
    }

    if (options.latencyMs < 0 || options.timeoutSeconds <= 0) {
        errorMsg = "latency must be >= 0 and timeout > 0";
        return false;
    }
    return true;
}

/**
 * @brief Completion latch shared by the event callbacks
 */
struct Outcome {
    std::mutex mutex;
    std::condition_variable cv;
    bool senderDone = false;
    bool receiverDone = false;
    bool failed = false;
    std::string message;
    std::shared_ptr<const AssembledArtifact> artifact;
    double receiveSeconds = 0.0;
    double receiveSpeed = 0.0;
};

}  // namespace

int main(int argc, char* argv[]) {
    std::cout << "===========================================\n";
    std::cout << "ChunkWire Loopback Transfer\n";
    std::cout << "===========================================\n\n";

    Options options;
    std::string errorMsg;
    if (!parseArgs(argc, argv, options, errorMsg)) {
        std::cerr << "Error: " << errorMsg << "\n\n";
        printUsage(argv[0]);
        return 1;
    }

    if (!options.logPath.empty()) {
        ThreadSafeLog::initialize(options.logPath);
    }

    EngineConfig config;
    if (!options.configPath.empty() &&
        !EngineConfig::loadFromFile(options.configPath, config, errorMsg)) {
        std::cerr << "Error: " << errorMsg << "\n";
        return 1;
    }
    if (!options.outputDir.empty()) {
        config.outputDirectory = options.outputDir;
    }

    auto source = FileChunkSource::open(options.filePath, errorMsg);
    if (!source) {
        std::cerr << "Error: " << errorMsg << "\n";
        return 1;
    }

    const uint64_t seed = options.seedSet ? options.seed : std::random_device{}();

    std::cout << "Configuration:\n";
    std::cout << "  File:      " << options.filePath << " (" << formatBytes(source->size()) << ")\n";
    std::cout << "  Drop rate: " << options.dropRate << "\n";
    std::cout << "  Latency:   " << options.latencyMs << " ms\n";
    std::cout << "  Tier:      " << networkTierToString(config.networkTier) << "\n";
    std::cout << "  Output:    " << config.resolvedOutputDirectory().string() << "\n";
    std::cout << "  Seed:      " << seed << "\n\n";

    Outcome outcome;

    TransferEvents senderEvents;
    senderEvents.onComplete = [&outcome](const CompleteEvent&) {
        std::lock_guard<std::mutex> lock(outcome.mutex);
        outcome.senderDone = true;
        outcome.cv.notify_all();
    };
    senderEvents.onError = [&outcome](const ErrorEvent& event) {
        std::lock_guard<std::mutex> lock(outcome.mutex);
        outcome.failed = true;
        outcome.message = "[" + event.code + "] " + event.message;
        outcome.cv.notify_all();
    };
    senderEvents.onCancelled = [&outcome](const CancelledEvent&) {
        std::lock_guard<std::mutex> lock(outcome.mutex);
        outcome.failed = true;
        outcome.message = "sender cancelled";
        outcome.cv.notify_all();
    };

    TransferEvents receiverEvents;
    receiverEvents.onProgress = [](const ProgressEvent& event) {
        std::cout << "\r  " << formatBytes(event.bytesTransferred) << " / "
                  << formatBytes(event.totalBytes) << "  " << formatSpeed(event.speed)
                  << "  ETA " << formatEta(event.etaSeconds) << "        " << std::flush;
    };
    receiverEvents.onComplete = [&outcome](const CompleteEvent& event) {
        std::lock_guard<std::mutex> lock(outcome.mutex);
        outcome.receiverDone = true;
        outcome.artifact = event.artifact;
        outcome.receiveSeconds = event.totalTimeSeconds;
        outcome.receiveSpeed = event.averageSpeed;
        outcome.cv.notify_all();
    };
    receiverEvents.onError = senderEvents.onError;
    receiverEvents.onCancelled = [&outcome](const CancelledEvent&) {
        std::lock_guard<std::mutex> lock(outcome.mutex);
        outcome.failed = true;
        outcome.message = "receiver cancelled";
        outcome.cv.notify_all();
    };

    ThreadScheduler scheduler;
    LossyLink toReceiver(scheduler, options.dropRate, options.latencyMs, seed);
    LossyLink toSender(scheduler, options.dropRate, options.latencyMs, seed ^ 0x9E3779B97F4A7C15ULL);

    TransferEndpoint senderSide(toReceiver, scheduler, config, senderEvents, "receiver");
    TransferEndpoint receiverSide(toSender, scheduler, config, receiverEvents, "sender");
    toReceiver.connect(&receiverSide);
    toSender.connect(&senderSide);

    if (!scheduler.start()) {
        std::cerr << "Error: scheduler failed to start\n";
        return 1;
    }

    SendRequest request;
    request.source = source;
    std::string transferId;
    if (!senderSide.sendFile(request, transferId, errorMsg)) {
        scheduler.stop();
        std::cerr << "Error: " << errorMsg << "\n";
        return 1;
    }

    bool timedOut = false;
    {
        std::unique_lock<std::mutex> lock(outcome.mutex);
        timedOut = !outcome.cv.wait_for(lock, std::chrono::seconds(options.timeoutSeconds), [&] {
            return outcome.failed || (outcome.senderDone && outcome.receiverDone);
        });
    }

    SenderStatus senderStatus;
    const bool haveStatus = senderSide.sender().getStatus(transferId, senderStatus);

    // Timers capture the endpoints, so stop them before anything is destroyed
    scheduler.stop();
    std::cout << "\n\n";

    if (timedOut) {
        std::cerr << "Error: transfer did not finish within " << options.timeoutSeconds << " s\n";
        return 1;
    }
    if (outcome.failed) {
        std::cerr << "Transfer failed: " << outcome.message << "\n";
        return 1;
    }

    const AssembledArtifact& artifact = *outcome.artifact;
    std::filesystem::path written = artifact.filePath;
    if (!artifact.isOnDisk()) {
        const auto dir = config.resolvedOutputDirectory();
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        written = uniqueFilePath(dir, artifact.fileName.empty() ? transferId : artifact.fileName);
        if (ec || !atomicWriteFile(written, artifact.data.data(), artifact.data.size(), errorMsg)) {
            std::cerr << "Error: cannot write " << written.string() << ": "
                      << (ec ? ec.message() : errorMsg) << "\n";
            return 1;
        }
    }

    std::cout << "Transfer complete:\n";
    std::cout << "  Transfer ID:     " << transferId << "\n";
    std::cout << "  Size:            " << formatBytes(artifact.size) << "\n";
    std::cout << "  SHA-256:         " << artifact.sha256Hex << "\n";
    std::cout << "  Time:            " << outcome.receiveSeconds << " s\n";
    std::cout << "  Average speed:   " << formatSpeed(outcome.receiveSpeed) << "\n";
    std::cout << "  Saved to:        " << written.string() << "\n";
    if (haveStatus) {
        std::cout << "  Chunks:          " << senderStatus.totalChunks << " x "
                  << formatBytes(senderStatus.chunkSize) << "\n";
        std::cout << "  Retransmissions: " << senderStatus.retransmissions << "\n";
        std::cout << "  Final window:    " << senderStatus.windowSize << "\n";
        std::cout << "  Average RTT:     " << senderStatus.averageRttMs << " ms\n";
    }
    std::cout << "  Messages lost:   " << (toReceiver.dropped() + toSender.dropped()) << " of "
              << (toReceiver.sent() + toSender.sent()) << "\n";

    return 0;
}
