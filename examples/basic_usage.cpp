/*
 * chunkfetch Basic Usage Example
 *
 * This example demonstrates:
 * - Starting a node over an in-memory store
 * - Several readers blocking on one missing chunk
 * - A simulated network retrieval resolving them with a single write
 */

#include "chunkfetch/chunkfetch.hpp"
#include <chrono>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace {

using namespace chunkfetch;

// Pretends to pull chunks from peers: each address gets one worker that
// "downloads" the content after a short delay and writes it back.
class SimulatedNetwork {
public:
    void bind(FetchCoordinator* coordinator) { coordinator_ = coordinator; }

    void publish(const std::string& content) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto chunk = make_content_chunk(ByteBuffer(content.begin(), content.end()));
        remote_[chunk->address()] = chunk;
    }

    FetchFactory factory() {
        return [this](std::stop_token lifetime, const Address& address,
                      std::shared_ptr<const RequesterSet> requesters) -> FetchTrigger {
            auto started = std::make_shared<std::once_flag>();
            return [this, lifetime, address, requesters, started](const RequestContext&) {
                std::call_once(*started, [&] { start_fetch(lifetime, address, requesters); });
            };
        };
    }

    void join() {
        std::lock_guard<std::mutex> lock(mutex_);
        workers_.clear();
    }

private:
    void start_fetch(std::stop_token lifetime, const Address& address,
                     std::shared_ptr<const RequesterSet> requesters) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = remote_.find(address);
        if (it == remote_.end()) {
            std::cout << "  [net] nobody has " << address.to_hex() << "\n";
            return;
        }
        auto chunk = it->second;
        workers_.emplace_back([this, lifetime, chunk, requesters] {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            if (lifetime.stop_requested()) {
                std::cout << "  [net] fetch abandoned\n";
                return;
            }
            std::cout << "  [net] retrieved " << chunk->address().to_hex()
                      << " for " << requesters->size() << " peer(s)\n";
            auto result = coordinator_->write(chunk);
            if (!result.ok()) {
                std::cerr << "  [net] write failed: " << result.status.to_string() << "\n";
            }
        });
    }

    FetchCoordinator* coordinator_ = nullptr;
    std::mutex mutex_;
    std::unordered_map<Address, SharedChunk> remote_;
    std::vector<std::jthread> workers_;
};

}  // namespace

int main() {
    std::cout << "chunkfetch Basic Usage Example\n";
    std::cout << "==============================\n\n";

    Config config;
    config.sessions.capacity = 128;
    config.memory.max_chunks = 1024;
    config.logging.level = "warn";

    SimulatedNetwork network;
    network.publish("hello, content-addressed world");

    ChunkFetchNode node(config, network.factory());
    auto status = node.start();
    if (!status) {
        std::cerr << "Failed to start: " << status.to_string() << "\n";
        return 1;
    }
    network.bind(&node.coordinator());
    auto& coordinator = node.coordinator();

    std::cout << "Configuration:\n";
    std::cout << "  Session capacity: " << config.sessions.capacity << "\n";
    std::cout << "  Memory chunks: " << config.memory.max_chunks << "\n\n";

    // Local write then read: no session involved
    auto local = make_content_chunk(ByteBuffer{'l', 'o', 'c', 'a', 'l'});
    auto written = coordinator.write(local);
    if (written.ok() && written.wait) {
        auto durable = written.wait(RequestContext::background());
        std::cout << "Local write durable: " << (durable.ok() ? "yes" : durable.to_string()) << "\n";
    }
    auto hit = coordinator.read(RequestContext::background(), local->address());
    std::cout << "Local read: " << (hit.ok() ? "hit" : hit.status.to_string()) << "\n\n";

    // Three readers for a chunk only the network has
    auto wanted = Address::of(std::string_view("hello, content-addressed world"));
    std::cout << "Reading " << wanted.to_hex() << " from 3 peers\n";

    std::vector<std::jthread> readers;
    std::mutex out_mutex;
    for (uint64_t peer = 1; peer <= 3; ++peer) {
        readers.emplace_back([&, peer] {
            auto ctx = RequestContext::with_timeout(std::chrono::seconds(2));
            ctx.from(NodeId(peer));
            auto result = coordinator.read(ctx, wanted);
            std::lock_guard<std::mutex> lock(out_mutex);
            std::cout << "  peer " << peer << ": "
                      << (result.ok() ? std::string(reinterpret_cast<const char*>(result.chunk->data().data()),
                                                    result.chunk->size())
                                      : result.status.to_string())
                      << "\n";
        });
    }
    readers.clear();

    // A chunk nobody has: the reader gives up at its deadline
    auto missing = Address::of(std::string_view("nobody has this"));
    auto miss = coordinator.read(RequestContext::with_timeout(std::chrono::milliseconds(100)), missing);
    std::cout << "\nMissing chunk: " << miss.status.to_string() << "\n";

    network.join();

    auto stats = coordinator.stats();
    std::cout << "\nCoordinator stats:\n";
    std::cout << "  Local hits: " << stats.local_hits << "\n";
    std::cout << "  Misses: " << stats.misses << "\n";
    std::cout << "  Sessions created: " << stats.sessions_created << "\n";
    std::cout << "  Sessions torn down: " << stats.sessions_torn_down << "\n";
    std::cout << "  Deliveries: " << stats.deliveries << "\n";
    std::cout << "  Failed waits: " << stats.failed_waits << "\n";
    std::cout << "  Sessions in flight: " << stats.active_sessions << "\n";

    node.stop();
    std::cout << "\nExample completed!\n";
    return 0;
}
