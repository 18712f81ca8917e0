/**
 * Link Simulator - two endpoints over a lossy datagram path in real time
 *
 * Each station runs its own worker thread:
 * - Datagrams from the peer are pulled off a shared lossy path
 * - The connection is stepped on a ~1ms cadence
 * - Events (CONNECT / RECEIVE / DISCONNECT / TIMEOUT) are recorded
 *
 * The main thread queues packets on ALPHA and waits for BRAVO to deliver them.
 * A connection is only ever touched with its station's lock held.
 */

#include <iostream>
#include <iomanip>
#include <string>
#include <vector>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <chrono>
#include <functional>

#include "conduit/config.hpp"
#include "conduit/logging.hpp"
#include "protocol/connection.hpp"
#include "sim/lossy_link.hpp"

using namespace conduit;
using namespace conduit::protocol;

static uint64_t nowMs() {
    using namespace std::chrono;
    return static_cast<uint64_t>(
        duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count());
}

// Thread-safe datagram path (the "network" between stations)
class DatagramPath {
public:
    explicit DatagramPath(const sim::LossyLink::Config& config, uint32_t seed)
        : link_(config, seed) {}

    void write(const Bytes& datagram) {
        std::lock_guard<std::mutex> lock(mutex_);
        link_.write(datagram, nowMs());
        cv_.notify_one();
    }

    // Datagrams due now; waits up to timeout_ms when nothing is queued
    std::vector<Bytes> read(int timeout_ms = 1) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this] {
            return link_.inFlight() > 0 || shutdown_;
        });
        if (shutdown_) return {};
        return link_.read(nowMs());
    }

    sim::LossyLink::Stats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return link_.stats();
    }

    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            shutdown_ = true;
        }
        cv_.notify_all();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    sim::LossyLink link_;
    bool shutdown_ = false;
};

// One endpoint: a connection plus the thread that drives it
class Station {
public:
    Station(const std::string& name, const EndpointConfig& config,
            DatagramPath& tx_path, DatagramPath& rx_path, uint32_t seed)
        : name_(name)
        , tx_path_(tx_path)
        , rx_path_(rx_path)
        , connection_(config, name == "ALPHA" ? "BRAVO" : "ALPHA", nowMs(), seed)
    {
        connection_.setTransmitCallback([this](const std::string&, const Bytes& data) {
            LOG_TRACE("SIM", "[%s] TX %zu bytes", name_.c_str(), data.size());
            tx_path_.write(data);
        });
    }

    ~Station() {
        stop();
    }

    void start() {
        running_ = true;
        thread_ = std::thread(&Station::loop, this);
    }

    void stop() {
        running_ = false;
        if (thread_.joinable()) thread_.join();
    }

    bool send(const Bytes& data, uint8_t channel, SendMode mode) {
        std::lock_guard<std::mutex> lock(mutex_);
        return connection_.send(data, channel, mode);
    }

    void disconnect() {
        std::lock_guard<std::mutex> lock(mutex_);
        connection_.disconnect(nowMs());
    }

    bool isConnected() const { return connected_; }
    bool isClosed() const { return closed_; }
    size_t receivedCount() const { return received_count_; }
    size_t receivedBytes() const { return received_bytes_; }

    size_t pendingBytes() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return connection_.pendingBytes();
    }

    ConnectionStats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return connection_.stats();
    }

    std::optional<uint64_t> rttMs() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return connection_.rttMs();
    }

private:
    void loop() {
        LOG_INFO("SIM", "[%s] thread started", name_.c_str());

        while (running_) {
            auto datagrams = rx_path_.read(1);

            std::lock_guard<std::mutex> lock(mutex_);
            uint64_t now = nowMs();
            for (const auto& d : datagrams) {
                connection_.receive(d, now);
            }
            if (!datagrams.empty()) {
                connection_.flush(now);
            }
            connection_.step(now);

            for (auto& ev : connection_.pollEvents()) {
                switch (ev.type) {
                    case EventType::CONNECT:
                        LOG_INFO("SIM", "[%s] CONNECTED", name_.c_str());
                        connected_ = true;
                        break;
                    case EventType::RECEIVE:
                        received_count_++;
                        received_bytes_ += ev.data.size();
                        break;
                    case EventType::DISCONNECT:
                    case EventType::TIMEOUT:
                        LOG_INFO("SIM", "[%s] %s", name_.c_str(), eventTypeToString(ev.type));
                        connected_ = false;
                        closed_ = true;
                        break;
                }
            }
        }

        LOG_INFO("SIM", "[%s] thread stopped", name_.c_str());
    }

    std::string name_;
    DatagramPath& tx_path_;
    DatagramPath& rx_path_;

    mutable std::mutex mutex_;
    Connection connection_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> connected_{false};
    std::atomic<bool> closed_{false};
    std::atomic<size_t> received_count_{0};
    std::atomic<size_t> received_bytes_{0};
};

// ============================================================================
// Main harness
// ============================================================================

static bool waitFor(std::function<bool()> condition, int timeout_sec, const std::string& desc) {
    auto start = std::chrono::steady_clock::now();
    while (!condition()) {
        auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - start).count();
        if (elapsed >= timeout_sec) {
            std::cout << "  TIMEOUT waiting for: " << desc << "\n";
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return true;
}

static void printStats(const char* name, const ConnectionStats& s) {
    std::cout << "  " << std::left << std::setw(6) << name
              << " frames tx=" << s.frames_sent << " rx=" << s.frames_received
              << "  resent=" << s.fragments_resent
              << "  rejected crc=" << s.frames_rejected_crc
              << " window=" << s.frames_rejected_window
              << " ack=" << s.acks_rejected << "\n";
}

int main(int argc, char* argv[]) {
    EndpointConfig config;
    sim::LossyLink::Config link;
    link.latency_ms = 20;
    size_t packet_count = 200;
    size_t packet_size = 4000;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            if (!loadConfig(argv[++i], config)) {
                std::cerr << "Cannot load config " << argv[i] << "\n";
                return 1;
            }
        } else if (arg == "--loss" && i + 1 < argc) {
            link.drop_probability = std::stof(argv[++i]);
        } else if (arg == "--drop-every" && i + 1 < argc) {
            link.drop_every = static_cast<uint32_t>(std::stoul(argv[++i]));
        } else if (arg == "--corrupt" && i + 1 < argc) {
            link.corrupt_probability = std::stof(argv[++i]);
        } else if (arg == "--latency" && i + 1 < argc) {
            link.latency_ms = std::stoull(argv[++i]);
        } else if (arg == "--packets" && i + 1 < argc) {
            packet_count = std::stoul(argv[++i]);
        } else if (arg == "--size" && i + 1 < argc) {
            packet_size = std::stoul(argv[++i]);
        } else if (arg == "-v" || arg == "--verbose") {
            setLogLevel(LogLevel::DEBUG);
        } else if (arg == "-h" || arg == "--help") {
            std::cout << "Usage: " << argv[0] << " [options]\n";
            std::cout << "  --config <ini>     Endpoint configuration file\n";
            std::cout << "  --loss <p>         Random datagram loss probability\n";
            std::cout << "  --drop-every <n>   Drop every nth datagram\n";
            std::cout << "  --corrupt <p>      Single-bit corruption probability\n";
            std::cout << "  --latency <ms>     One-way latency (default: 20)\n";
            std::cout << "  --packets <n>      Reliable packets to send (default: 200)\n";
            std::cout << "  --size <bytes>     Packet size (default: 4000)\n";
            std::cout << "  -v                 Verbose logging\n";
            return 0;
        }
    }

    std::cout << "\n====================================================================\n";
    std::cout << "     LINK SIMULATOR\n";
    std::cout << "====================================================================\n";
    std::cout << "  Latency: " << link.latency_ms << " ms  Loss: " << link.drop_probability
              << "  Drop every: " << link.drop_every
              << "  Corrupt: " << link.corrupt_probability << "\n";
    std::cout << "  Packets: " << packet_count << " x " << packet_size << " bytes\n";
    std::cout << "====================================================================\n\n";

    DatagramPath a2b(link, 1);
    DatagramPath b2a(link, 2);

    Station alpha("ALPHA", config, a2b, b2a, 101);
    Station bravo("BRAVO", config, b2a, a2b, 202);

    alpha.start();
    bravo.start();

    auto shutdown = [&]() {
        a2b.shutdown();
        b2a.shutdown();
        alpha.stop();
        bravo.stop();
    };

    // === Handshake ===
    std::cout << "=== HANDSHAKE ===\n";
    if (!waitFor([&]{ return alpha.isConnected() && bravo.isConnected(); }, 15, "connection")) {
        shutdown();
        return 1;
    }
    std::cout << "  Connected\n";

    // === Transfer ===
    std::cout << "\n=== TRANSFER ===\n";
    auto t0 = std::chrono::steady_clock::now();
    for (size_t i = 0; i < packet_count; i++) {
        Bytes packet(packet_size, static_cast<uint8_t>(i));
        uint8_t channel = static_cast<uint8_t>(i % 4);
        if (!alpha.send(packet, channel, SendMode::RELIABLE)) {
            std::cout << "  FAILED: send rejected at packet " << i << "\n";
            shutdown();
            return 1;
        }
    }

    if (!waitFor([&]{ return bravo.receivedCount() >= packet_count; }, 120, "delivery")) {
        shutdown();
        return 1;
    }
    if (!waitFor([&]{ return alpha.pendingBytes() == 0; }, 30, "acknowledgement")) {
        shutdown();
        return 1;
    }

    double secs = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
    std::cout << "  Delivered " << bravo.receivedCount() << " packets ("
              << bravo.receivedBytes() << " bytes) in " << std::fixed << std::setprecision(2)
              << secs << " s, " << (bravo.receivedBytes() / 1024.0 / secs) << " KiB/s\n";
    if (auto rtt = alpha.rttMs()) {
        std::cout << "  RTT estimate: " << *rtt << " ms\n";
    }

    // === Teardown ===
    std::cout << "\n=== DISCONNECT ===\n";
    alpha.disconnect();
    bool closed = waitFor([&]{ return alpha.isClosed() && bravo.isClosed(); }, 15, "disconnect");

    auto sa = a2b.stats();
    auto sb = b2a.stats();
    std::cout << "\n=== STATISTICS ===\n";
    printStats("ALPHA", alpha.stats());
    printStats("BRAVO", bravo.stats());
    std::cout << "  path A->B written=" << sa.written << " dropped=" << sa.dropped
              << " corrupted=" << sa.corrupted << "\n";
    std::cout << "  path B->A written=" << sb.written << " dropped=" << sb.dropped
              << " corrupted=" << sb.corrupted << "\n";

    shutdown();
    return closed ? 0 : 1;
}
