#include "chunkfetch/chunkfetch.hpp"
#include <spdlog/spdlog.h>

namespace chunkfetch {

ChunkFetchNode::ChunkFetchNode(const Config& config, FetchFactory fetch_factory)
    : config_(config)
    , fetch_factory_(std::move(fetch_factory))
{}

ChunkFetchNode::~ChunkFetchNode() {
    stop();
}

Status ChunkFetchNode::start() {
    if (coordinator_) {
        return Status::error(ErrorCode::InvalidArgument, "node already started");
    }

    auto status = config_.validate();
    if (!status) {
        return status;
    }
    status = configure_logging(config_.logging);
    if (!status) {
        return status;
    }

    std::unique_ptr<IChunkStore> store;
    if (config_.disk.enabled) {
        auto disk = std::make_unique<DiskChunkStore>(config_.disk);
        status = disk->open();
        if (!status) {
            spdlog::error("failed to open disk store: {}", status.to_string());
            return status;
        }
        store = std::move(disk);
    } else {
        store = std::make_unique<MemoryChunkStore>(config_.memory);
    }

    coordinator_ = std::make_unique<FetchCoordinator>(
        std::move(store), fetch_factory_, config_.sessions);

    spdlog::info("chunkfetch {} started ({} store, session capacity {})",
                 Version::string(), config_.disk.enabled ? "disk" : "memory",
                 config_.sessions.capacity);
    return Status::make_ok();
}

void ChunkFetchNode::stop() {
    if (!coordinator_ || stopped_) {
        return;
    }
    stopped_ = true;
    coordinator_->shutdown();
}

}  // namespace chunkfetch
