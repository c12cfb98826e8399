/*
 * ChatRelay load test entry point
 */

#include "client.hpp"
#include "config.hpp"
#include "latency.hpp"
#include "utils.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace chatrelay;

namespace {

constexpr auto kConnectTimeout = std::chrono::seconds(10);
constexpr auto kSendSpacing = std::chrono::milliseconds(10);
constexpr auto kSettleTime = std::chrono::seconds(2);
constexpr auto kDrainTime = std::chrono::seconds(3);

// Releases every waiting client thread at once.
class PhaseGate {
public:
    void open() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = true;
        }
        cv_.notify_all();
    }

    void wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return open_; });
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool open_ = false;
};

struct Counters {
    std::atomic<std::size_t> connected{0};
    std::atomic<std::size_t> failed{0};
    std::atomic<std::size_t> public_sent{0};
    std::atomic<std::size_t> private_sent{0};
};

std::string test_username(std::size_t id) {
    return "test_user_" + std::to_string(id);
}

// Round robin over the other clients, skipping the sender.
std::size_t private_target(std::size_t id, std::size_t index, std::size_t clients) {
    std::size_t target = (id + 1 + index) % clients;
    if (target == id) {
        target = (target + 1) % clients;
    }
    return target;
}

ClientConfig client_config(const LoadTestConfig& config, const std::string& username) {
    ClientConfig client;
    client.host = config.host;
    client.port = config.port;
    client.username = username;
    client.log_level = config.log_level;
    client.quiet = true;
    return client;
}

void run_client(std::size_t id,
                const LoadTestConfig& config,
                Counters& counters,
                LatencyStats& private_latency,
                PhaseGate& public_phase,
                PhaseGate& private_phase) {
    std::unique_ptr<ChatClient> client;
    try {
        client = std::make_unique<ChatClient>(client_config(config, test_username(id)));
    } catch (const std::exception& ex) {
        log_error("Client " + std::to_string(id) + " setup failed: " + ex.what());
        ++counters.failed;
        return;
    }
    client->set_event_observer([&private_latency](const Event& event) {
        const auto* received = std::get_if<PrivateMessageReceived>(&event);
        if (received && received->timestamp.has_value()) {
            private_latency.record(latency_seconds(received->timestamp.value(), unix_time_seconds()));
        }
    });
    if (!client->start(kConnectTimeout)) {
        ++counters.failed;
        return;
    }
    ++counters.connected;

    public_phase.wait();
    for (std::size_t i = 0; i < config.public_messages; ++i) {
        client->send_public_message("Public message " + std::to_string(i) + " from " + test_username(id));
        ++counters.public_sent;
        std::this_thread::sleep_for(kSendSpacing);
    }

    private_phase.wait();
    if (config.clients > 1) {
        for (std::size_t i = 0; i < config.private_messages; ++i) {
            const std::size_t target = private_target(id, i, config.clients);
            client->send_private_message(test_username(target),
                                         "Private message " + std::to_string(i) + " from " + test_username(id));
            ++counters.private_sent;
            std::this_thread::sleep_for(kSendSpacing);
        }
    }

    // Stay connected for the replies still in flight.
    std::this_thread::sleep_for(kDrainTime);
    client->stop();
}

void print_section(const std::string& title,
                   std::size_t sent,
                   const LatencyStats& latency,
                   double duration) {
    std::cout << "\n" << std::string(30, '-') << " " << title << " " << std::string(30, '-') << "\n";
    std::cout << "Sent: " << sent << "\n";
    std::cout << "Received: " << latency.count() << "\n";
    if (latency.count() == 0) {
        return;
    }
    std::cout << "Latency - " << latency.summary() << "\n";
    std::cout << "Throughput: " << static_cast<double>(latency.count()) / duration << " messages/sec\n";
}

} // namespace

int main(int argc, char** argv) {
    LoadTestConfig config;
    std::string error;
    if (!load_loadtest_config(argc, argv, config, error)) {
        std::cerr << error << "\n" << loadtest_usage(argv[0]) << std::endl;
        return 2;
    }
    set_log_level(config.log_level);

    std::cout << "Starting load test:\n"
              << "  - " << config.clients << " clients\n"
              << "  - " << config.public_messages << " public messages per client\n"
              << "  - " << config.private_messages << " private messages per client\n"
              << "  - Server: " << config.host << ":" << config.port << std::endl;

    const auto started = std::chrono::steady_clock::now();
    Counters counters;
    LatencyStats private_latency;
    PhaseGate public_phase;
    PhaseGate private_phase;

    std::unique_ptr<ChatClient> listener;
    try {
        listener = std::make_unique<ChatClient>(client_config(config, "message_listener"));
    } catch (const std::exception& ex) {
        log_error(std::string("Listener setup failed: ") + ex.what());
        return 1;
    }
    if (!listener->start(kConnectTimeout)) {
        std::cerr << "Failed to start message listener!" << std::endl;
        return 1;
    }

    std::vector<std::thread> threads;
    threads.reserve(config.clients);
    for (std::size_t id = 0; id < config.clients; ++id) {
        threads.emplace_back(run_client, id, std::cref(config), std::ref(counters), std::ref(private_latency),
                             std::ref(public_phase), std::ref(private_phase));
        std::this_thread::sleep_for(kSendSpacing);
    }

    std::this_thread::sleep_for(kSettleTime);
    std::cout << "Starting public message phase..." << std::endl;
    public_phase.open();

    std::this_thread::sleep_for(kSettleTime);
    std::cout << "Starting private message phase..." << std::endl;
    private_phase.open();

    for (auto& thread : threads) {
        thread.join();
    }
    listener->stop();

    const double duration =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    const LatencyStats& public_latency = listener->public_latency();

    std::cout << std::fixed << std::setprecision(2);
    std::cout << "\n" << std::string(60, '=') << "\nLOAD TEST RESULTS\n" << std::string(60, '=') << "\n";
    std::cout << "Test Duration: " << duration << " seconds\n";
    std::cout << "Clients: " << counters.connected.load() << "/" << config.clients << " connected successfully\n";
    if (counters.failed > 0) {
        std::cout << "Failed Connections: " << counters.failed.load() << "\n";
    }

    print_section("PUBLIC MESSAGES", counters.public_sent.load(), public_latency, duration);
    print_section("PRIVATE MESSAGES", counters.private_sent.load(), private_latency, duration);
    if (private_latency.count() == 0) {
        std::cout << "No private messages received\n";
    } else if (counters.private_sent > 0) {
        std::cout << std::setprecision(1) << "Delivery Rate: "
                  << 100.0 * static_cast<double>(private_latency.count()) / static_cast<double>(counters.private_sent.load())
                  << "%\n"
                  << std::setprecision(2);
    }

    const std::size_t total = public_latency.count() + private_latency.count();
    std::cout << "\n" << std::string(30, '-') << " OVERALL " << std::string(30, '-') << "\n";
    std::cout << "Total Messages Processed: " << total << "\n";
    std::cout << "Overall Throughput: " << (duration > 0 ? static_cast<double>(total) / duration : 0.0)
              << " messages/sec" << std::endl;
    return 0;
}
