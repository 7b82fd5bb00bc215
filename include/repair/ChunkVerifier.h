#pragma once
#include "cluster/node_registry.h"
#include "node/object_store.h"
#include "storage/metadata_repository.h"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace chunkvault {

/**
 * @brief Re-reads stored chunk replicas and checks them against their
 * recorded digest.
 *
 * The verifier only updates metadata; stored bytes are never modified.
 */
class ChunkVerifier {
public:
    /**
     * Called once for each replica that a verification newly marks corrupted,
     * with the completed replicas of the same (file, ordinal) on other nodes.
     */
    using CorruptionHandler =
        std::function<void(const Chunk &corrupted, const std::vector<Chunk> &healthySiblings)>;

    struct Summary {
        size_t checked{0};
        size_t corrupted{0};
        size_t unavailable{0};
    };

    /**
     * @brief Construct a ChunkVerifier.
     * @param repo Metadata repository holding the chunk records.
     * @param registry Registry notified when a node cannot be reached.
     * @param client Transport used to fetch stored bytes.
     * @param onCorruption Optional remediation hook.
     */
    ChunkVerifier(MetadataRepository &repo,
                  NodeRegistry &registry,
                  std::shared_ptr<ObjectStoreClient> client,
                  CorruptionHandler onCorruption = {})
        : repo_(repo), registry_(registry), client_(std::move(client)),
          onCorruption_(std::move(onCorruption)) {}

    /**
     * @brief Verify one replica.
     * @return true if the stored bytes match the recorded digest. A missing
     * object counts as a mismatch.
     * @throw NotFoundError if the chunk is unknown or already deleted.
     * @throw NodeUnavailableError if the owning node cannot be reached; no
     * metadata is changed in that case.
     */
    bool verify(const std::string &chunkId);

    /** Like verify(), but throws CorruptChunkError instead of returning false. */
    void requireHealthy(const std::string &chunkId);

    /**
     * @brief Verify every live replica of a file.
     * @return Number of replicas that failed verification. Replicas on
     * unreachable nodes are skipped.
     * @throw NotFoundError for an unknown file.
     */
    size_t verifyFile(const std::string &fileId);

    /**
     * @brief Sweep every completed replica in the store.
     */
    Summary verifyAll();

    void setCorruptionHandler(CorruptionHandler handler) { onCorruption_ = std::move(handler); }

private:
    void publishCorruptedGauge() const;

    MetadataRepository &repo_;
    NodeRegistry &registry_;
    std::shared_ptr<ObjectStoreClient> client_;
    CorruptionHandler onCorruption_;
};

} // namespace chunkvault
