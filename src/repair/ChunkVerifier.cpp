#include "repair/ChunkVerifier.h"
#include "storage/errors.h"
#include "utilities/checksum.hpp"
#include "utilities/logger.h"
#include "utilities/metrics.h"
#include <ctime>

namespace chunkvault {

static void countVerification(const char *result) {
    MetricsRegistry::instance().incrementCounter("chunkvault_chunk_verifications_total", 1.0,
                                                 {{"result", result}});
}

bool ChunkVerifier::verify(const std::string &chunkId) {
    auto chunk = repo_.findChunk(chunkId);
    if (!chunk || chunk->status == ChunkStatus::Deleted) {
        throw NotFoundError("Unknown chunk: " + chunkId);
    }
    auto node = repo_.findNode(chunk->nodeId);
    if (!node) {
        countVerification("unavailable");
        throw NodeUnavailableError("Chunk " + chunkId + " references unknown node " + chunk->nodeId,
                                   chunk->nodeId);
    }

    std::optional<std::vector<std::byte>> stored;
    try {
        stored = client_->getObject(node->address(), chunk->objectKey);
    } catch (const ObjectStoreError &e) {
        registry_.recordTransferFailure(node->id);
        countVerification("unavailable");
        Logger::getInstance().log(LogLevel::WARN, "[ChunkVerifier] Node " + node->name +
                                  " unavailable while verifying " + chunkId + ": " + e.what());
        throw NodeUnavailableError("Node " + node->name + " unavailable: " + e.what(), node->id);
    }
    registry_.recordTransferSuccess(node->id);

    std::string actual = stored ? digestBytes(*stored) : std::string();
    std::time_t now = std::time(nullptr);
    if (stored && actual == chunk->checksum) {
        repo_.recordVerification(chunkId, actual, now, false);
        countVerification("ok");
        return true;
    }

    bool newlyCorrupted = !chunk->isCorrupted();
    Chunk updated = repo_.recordVerification(chunkId, actual, now, true);
    countVerification("corrupted");
    Logger::getInstance().log(LogLevel::WARN, "[ChunkVerifier] Chunk " + chunkId + " (" + chunk->fileId +
                              "#" + std::to_string(chunk->ordinal) + ") on node " + node->name +
                              (stored ? " has digest " + actual + ", expected " + chunk->checksum
                                      : std::string(" is missing")));

    if (newlyCorrupted && onCorruption_) {
        std::vector<Chunk> siblings;
        for (auto &c : repo_.chunksForKey(chunk->fileId, chunk->ordinal)) {
            if (c.id != chunkId && c.status == ChunkStatus::Completed) {
                siblings.push_back(std::move(c));
            }
        }
        onCorruption_(updated, siblings);
    }
    return false;
}

void ChunkVerifier::requireHealthy(const std::string &chunkId) {
    if (!verify(chunkId)) {
        throw CorruptChunkError("Chunk " + chunkId + " failed verification", chunkId);
    }
}

size_t ChunkVerifier::verifyFile(const std::string &fileId) {
    if (!repo_.findFile(fileId)) {
        throw NotFoundError("Unknown file: " + fileId);
    }
    size_t failed = 0;
    for (const auto &c : repo_.chunksForFile(fileId)) {
        if (c.status != ChunkStatus::Completed && c.status != ChunkStatus::Corrupted) continue;
        try {
            if (!verify(c.id)) ++failed;
        } catch (const NodeUnavailableError &e) {
            Logger::getInstance().log(LogLevel::WARN, std::string("[ChunkVerifier] Skipping replica: ") + e.what());
        }
    }
    publishCorruptedGauge();
    return failed;
}

ChunkVerifier::Summary ChunkVerifier::verifyAll() {
    Summary summary;
    for (const auto &c : repo_.listChunks()) {
        if (c.status != ChunkStatus::Completed) continue;
        ++summary.checked;
        try {
            if (!verify(c.id)) ++summary.corrupted;
        } catch (const NodeUnavailableError &) {
            ++summary.unavailable;
        } catch (const NotFoundError &) {
            // Collected while the sweep was running.
            --summary.checked;
        }
    }
    publishCorruptedGauge();
    Logger::getInstance().log(summary.corrupted > 0 ? LogLevel::WARN : LogLevel::INFO,
                              "[ChunkVerifier] Verified " + std::to_string(summary.checked) + " replicas, " +
                              std::to_string(summary.corrupted) + " corrupted, " +
                              std::to_string(summary.unavailable) + " unreachable");
    return summary;
}

void ChunkVerifier::publishCorruptedGauge() const {
    size_t corrupted = 0;
    for (const auto &c : repo_.listChunks()) {
        if (c.isCorrupted()) ++corrupted;
    }
    MetricsRegistry::instance().setGauge("chunkvault_chunks_corrupted", static_cast<double>(corrupted));
}

} // namespace chunkvault
