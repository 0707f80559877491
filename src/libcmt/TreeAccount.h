#pragma once

#include <libcmt/ChangeLogEvent.h>
#include <libcmt/ConcurrentMerkleTree.h>
#include <libcmt/Node.h>
#include <libcmt/TreeError.h>
#include <libcmt/TreeParams.h>

#include <xrpl/basics/Blob.h>
#include <xrpl/basics/Expected.h>
#include <xrpl/basics/Slice.h>
#include <xrpl/basics/base_uint.h>
#include <xrpl/beast/utility/Journal.h>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace ripple {
namespace cmt {

enum class AccountType : std::uint8_t {
    Uninitialized = 0,
    ConcurrentMerkleTree = 1,
};

struct TreeHeader {
    AccountType accountType = AccountType::Uninitialized;
    std::uint32_t maxBufferSize = 0;
    std::uint32_t maxDepth = 0;
    ripple::uint256 authority;
    std::uint64_t creationSlot = 0;
};

/**
 * A concurrent merkle tree bound to a fixed size account.
 *
 * Owns the byte exact persisted layout (header, counters, change log,
 * rightmost path, canopy; integers little endian) and guards every
 * mutation with the stored authority. Each successful mutation yields a
 * ChangeLogEvent for indexers.
 */
class TreeAccount {
public:
    static constexpr std::size_t headerSize = 56;

    // Exact account size for a tree of the given shape.
    static std::size_t
    sizeFor(TreeParams const& params);

    /**
     * Create an account whose tree body stays zeroed.
     *
     * The tree is brought up either with initializeEmpty(), or by filling
     * the canopy with appendCanopyNodes() and then calling
     * initializePreparedWithRoot().
     */
    static ripple::Expected<TreeAccount, TreeError>
    create(
        ripple::uint256 const& id,
        TreeParams const& params,
        ripple::uint256 const& authority,
        std::uint64_t creationSlot,
        beast::Journal j);

    static ripple::Expected<TreeAccount, TreeError>
    load(ripple::uint256 const& id, ripple::Slice data, beast::Journal j);

    ripple::Blob
    serialize() const;

    // Bring up an empty tree; the event carries the empty root at seq 0.
    ripple::Expected<ChangeLogEvent, TreeError>
    initializeEmpty(ripple::uint256 const& signer);

    ripple::Expected<void, TreeError>
    appendCanopyNodes(
        ripple::uint256 const& signer,
        std::uint32_t startIndex,
        std::vector<NodeHash> const& nodes);

    ripple::Expected<ChangeLogEvent, TreeError>
    initializePreparedWithRoot(
        ripple::uint256 const& signer,
        NodeHash const& root,
        NodeHash const& rightmostLeaf,
        std::uint32_t rightmostIndex,
        std::vector<NodeHash> const& proof);

    ripple::Expected<ChangeLogEvent, TreeError>
    append(ripple::uint256 const& signer, NodeHash const& leaf);

    ripple::Expected<ChangeLogEvent, TreeError>
    replace(
        ripple::uint256 const& signer,
        std::uint32_t leafIndex,
        NodeHash const& oldLeaf,
        NodeHash const& newLeaf,
        std::vector<NodeHash> const& proof);

    ripple::Expected<ChangeLogEvent, TreeError>
    insertOrAppend(
        ripple::uint256 const& signer,
        std::uint32_t leafIndex,
        NodeHash const& leaf,
        std::vector<NodeHash> const& proof);

    // Anyone may verify; no authority needed.
    ripple::Expected<void, TreeError>
    verify(std::uint32_t leafIndex, NodeHash const& leaf, std::vector<NodeHash> const& proof) const;

    ripple::Expected<void, TreeError>
    setAuthority(ripple::uint256 const& signer, ripple::uint256 const& newAuthority);

    // Release an account whose tree is empty; serialize() then yields zeros.
    ripple::Expected<void, TreeError>
    closeEmpty(ripple::uint256 const& signer);

    // Event describing the current root.
    ChangeLogEvent
    currentEvent() const;

    ripple::uint256 const&
    id() const
    {
        return id_;
    }

    TreeHeader const&
    header() const
    {
        return header_;
    }

    ConcurrentMerkleTree const&
    tree() const
    {
        return tree_;
    }

private:
    TreeAccount(
        ripple::uint256 const& id,
        TreeHeader const& header,
        TreeParams const& params,
        beast::Journal j);

    ripple::Expected<void, TreeError>
    checkAuthority(ripple::uint256 const& signer) const;

    ripple::Expected<ChangeLogEvent, TreeError>
    emit(ripple::Expected<NodeHash, TreeError> const& result) const;

    ripple::uint256 id_;
    TreeHeader header_;
    ConcurrentMerkleTree tree_;
    beast::Journal j_;
};

} // namespace cmt
} // namespace ripple
