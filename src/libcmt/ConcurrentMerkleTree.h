#pragma once

#include <libcmt/Canopy.h>
#include <libcmt/ChangeLog.h>
#include <libcmt/Node.h>
#include <libcmt/TreeError.h>
#include <libcmt/TreeParams.h>

#include <xrpl/basics/Expected.h>
#include <xrpl/beast/utility/Journal.h>

#include <cstdint>
#include <vector>

namespace ripple {
namespace cmt {

/**
 * Proof to the rightmost occupied leaf.
 *
 * `index` is one past the rightmost leaf, i.e. the slot the next append
 * writes. For an empty tree it is 0, `leaf` is empty and `proof` holds the
 * empty subtree hashes.
 */
struct RightmostPath {
    std::vector<NodeHash> proof;
    NodeHash leaf;
    std::uint32_t index = 0;
};

/**
 * Concurrent Merkle Tree
 *
 * A fixed depth binary merkle tree that accepts writes carrying proofs
 * generated against a slightly older root. Key features:
 * - Append without a proof, via a cached path to the rightmost leaf
 * - Replace/verify with stale proofs, patched from a ring of recent changes
 * - Optional canopy caching the top levels, shortening caller proofs
 *
 * Every operation either fully applies or leaves the tree untouched.
 */
class ConcurrentMerkleTree {
public:
    ConcurrentMerkleTree(TreeParams const& params, beast::Journal j);

    // Lifecycle
    ripple::Expected<NodeHash, TreeError> initialize();
    ripple::Expected<NodeHash, TreeError> initializeWithRoot(
        NodeHash const& root,
        NodeHash const& rightmostLeaf,
        std::uint32_t rightmostIndex,
        std::vector<NodeHash> const& proof);
    bool isInitialized() const;

    // Mutations, each returning the new root
    ripple::Expected<NodeHash, TreeError> append(NodeHash const& leaf);
    ripple::Expected<NodeHash, TreeError> replace(
        std::uint32_t leafIndex,
        NodeHash const& oldLeaf,
        NodeHash const& newLeaf,
        std::vector<NodeHash> const& proof);
    ripple::Expected<NodeHash, TreeError> insertOrAppend(
        std::uint32_t leafIndex,
        NodeHash const& leaf,
        std::vector<NodeHash> const& proof);

    // Queries
    ripple::Expected<void, TreeError> verify(
        std::uint32_t leafIndex,
        NodeHash const& leaf,
        std::vector<NodeHash> const& proof) const;
    ripple::Expected<void, TreeError> proveEmpty() const;

    NodeHash const& root() const { return changeLog_.active().root; }
    ChangeLogEntry const& lastChange() const { return changeLog_.active(); }
    std::uint64_t sequenceNumber() const { return sequenceNumber_; }
    TreeParams const& params() const { return params_; }
    RightmostPath const& rightmostPath() const { return rightmost_; }
    ChangeLogRing const& changeLog() const { return changeLog_; }
    Canopy const& canopy() const { return canopy_; }

    // Canopy prefill for trees that will be initialized with a root
    ripple::Expected<void, TreeError> setCanopyLeafNodes(
        std::uint32_t startIndex,
        std::vector<NodeHash> const& nodes);

    // Persistence
    void restore(
        std::uint64_t sequenceNumber,
        ChangeLogRing changeLog,
        RightmostPath rightmost,
        std::vector<NodeHash> canopyNodes);

private:
    // Outcome of resolving a caller proof against the current root.
    struct Resolution {
        std::vector<NodeHash> proof;
        bool valid = false;
        bool leafModified = false;
    };

    ripple::Expected<std::vector<NodeHash>, TreeError> completeProof(
        std::uint32_t leafIndex,
        std::vector<NodeHash> const& proof) const;
    Resolution resolve(
        std::uint32_t leafIndex,
        NodeHash const& leaf,
        std::vector<NodeHash> proof) const;
    ripple::Expected<void, TreeError> checkWritable(std::uint32_t leafIndex) const;
    std::vector<NodeHash> appendProof() const;
    NodeHash commit(
        std::uint32_t leafIndex,
        NodeHash const& newLeaf,
        std::vector<NodeHash> const& proof);
    void updateRightmost(ChangeLogEntry const& change, std::vector<NodeHash> const& proof);

    TreeParams params_;
    std::uint64_t sequenceNumber_ = 0;
    ChangeLogRing changeLog_;
    RightmostPath rightmost_;
    Canopy canopy_;
    beast::Journal j_;
};

} // namespace cmt
} // namespace ripple
