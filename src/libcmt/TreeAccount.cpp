#include <libcmt/Canopy.h>
#include <libcmt/ChangeLog.h>
#include <libcmt/PathMath.h>
#include <libcmt/TreeAccount.h>

#include <xrpl/basics/Log.h>

#include <boost/endian/conversion.hpp>

#include <algorithm>

namespace ripple {
namespace cmt {

namespace {

// Size of one change log entry or of the rightmost path record.
std::size_t
pathRecordSize(std::uint32_t maxDepth)
{
    return NodeHash::size() * (std::size_t{maxDepth} + 1) + 8;
}

// sequenceNumber, activeIndex and bufferSize.
constexpr std::size_t countersSize = 24;

class ByteReader {
public:
    explicit ByteReader(ripple::Slice data) : data_(data)
    {
    }

    std::uint8_t
    u8()
    {
        return data_.data()[pos_++];
    }

    std::uint32_t
    u32()
    {
        auto const v = boost::endian::load_little_u32(data_.data() + pos_);
        pos_ += 4;
        return v;
    }

    std::uint64_t
    u64()
    {
        auto const v = boost::endian::load_little_u64(data_.data() + pos_);
        pos_ += 8;
        return v;
    }

    NodeHash
    hash()
    {
        auto const v = NodeHash::fromVoid(data_.data() + pos_);
        pos_ += NodeHash::size();
        return v;
    }

    void
    skip(std::size_t n)
    {
        pos_ += n;
    }

    std::size_t
    remaining() const
    {
        return data_.size() - pos_;
    }

private:
    ripple::Slice data_;
    std::size_t pos_ = 0;
};

class ByteWriter {
public:
    explicit ByteWriter(ripple::Blob& out) : out_(out)
    {
    }

    void
    u8(std::uint8_t v)
    {
        out_[pos_++] = v;
    }

    void
    u32(std::uint32_t v)
    {
        boost::endian::store_little_u32(out_.data() + pos_, v);
        pos_ += 4;
    }

    void
    u64(std::uint64_t v)
    {
        boost::endian::store_little_u64(out_.data() + pos_, v);
        pos_ += 8;
    }

    void
    hash(NodeHash const& v)
    {
        std::copy(v.begin(), v.end(), out_.begin() + pos_);
        pos_ += NodeHash::size();
    }

    // Padding is left as the zeros the buffer was created with.
    void
    skip(std::size_t n)
    {
        pos_ += n;
    }

private:
    ripple::Blob& out_;
    std::size_t pos_ = 0;
};

} // namespace

TreeAccount::TreeAccount(
    ripple::uint256 const& id,
    TreeHeader const& header,
    TreeParams const& params,
    beast::Journal j)
    : id_(id), header_(header), tree_(params, j), j_(j)
{
}

std::size_t
TreeAccount::sizeFor(TreeParams const& params)
{
    return headerSize + countersSize +
        pathRecordSize(params.maxDepth) * (std::size_t{params.maxBufferSize} + 1) +
        Canopy::nodeCount(params.canopyDepth) * NodeHash::size();
}

ripple::Expected<TreeAccount, TreeError>
TreeAccount::create(
    ripple::uint256 const& id,
    TreeParams const& params,
    ripple::uint256 const& authority,
    std::uint64_t creationSlot,
    beast::Journal j)
{
    if (auto const valid = validate(params); !valid)
    {
        JLOG(j.warn()) << "Rejected tree parameters: depth " << params.maxDepth << ", buffer "
                       << params.maxBufferSize << ", canopy " << params.canopyDepth;
        return ripple::Unexpected(valid.error());
    }

    TreeHeader header;
    header.accountType = AccountType::ConcurrentMerkleTree;
    header.maxBufferSize = params.maxBufferSize;
    header.maxDepth = params.maxDepth;
    header.authority = authority;
    header.creationSlot = creationSlot;

    JLOG(j.info()) << "Created tree account " << id << " of " << sizeFor(params) << " bytes";
    return TreeAccount(id, header, params, j);
}

ripple::Expected<TreeAccount, TreeError>
TreeAccount::load(ripple::uint256 const& id, ripple::Slice data, beast::Journal j)
{
    if (data.size() < headerSize)
        return ripple::Unexpected(TreeError::InvalidAccountSize);

    ByteReader in(data);
    if (in.u8() != static_cast<std::uint8_t>(AccountType::ConcurrentMerkleTree))
        return ripple::Unexpected(TreeError::IncorrectAccountType);
    in.skip(7);

    TreeHeader header;
    header.accountType = AccountType::ConcurrentMerkleTree;
    header.maxBufferSize = in.u32();
    header.maxDepth = in.u32();
    header.authority = in.hash();
    header.creationSlot = in.u64();

    TreeParams params{header.maxDepth, header.maxBufferSize, 0};
    if (!validate(params))
    {
        JLOG(j.warn()) << "Account " << id << " header has depth " << header.maxDepth
                       << " and buffer " << header.maxBufferSize;
        return ripple::Unexpected(TreeError::InvalidAccountSize);
    }

    auto const treeBytes = sizeFor(params) - headerSize;
    if (in.remaining() < treeBytes)
    {
        JLOG(j.warn()) << "Account " << id << " holds " << data.size() << " bytes, need at least "
                       << headerSize + treeBytes;
        return ripple::Unexpected(TreeError::InvalidAccountSize);
    }

    auto const canopyDepth = Canopy::depthFromBytes(in.remaining() - treeBytes, params.maxDepth);
    if (!canopyDepth)
    {
        JLOG(j.warn()) << "Account " << id << " has "
                       << in.remaining() - treeBytes << " trailing canopy bytes";
        return ripple::Unexpected(canopyDepth.error());
    }
    params.canopyDepth = *canopyDepth;

    auto const sequenceNumber = in.u64();
    auto const activeIndex = in.u64();
    auto const bufferSize = in.u64();
    if (activeIndex >= params.maxBufferSize || bufferSize > params.maxBufferSize)
        return ripple::Unexpected(TreeError::InvalidAccountSize);

    auto const readPath = [&](std::vector<NodeHash>& path) {
        path.resize(params.maxDepth);
        for (auto& node : path)
            node = in.hash();
    };

    std::vector<ChangeLogEntry> entries(params.maxBufferSize);
    for (auto& entry : entries)
    {
        entry.root = in.hash();
        readPath(entry.path);
        entry.index = in.u32();
        in.skip(4);
    }

    RightmostPath rightmost;
    rightmost.leaf = in.hash();
    readPath(rightmost.proof);
    rightmost.index = in.u32();
    in.skip(4);
    if (rightmost.index > leafCapacity(params.maxDepth))
        return ripple::Unexpected(TreeError::InvalidAccountSize);

    std::vector<NodeHash> canopyNodes(Canopy::nodeCount(params.canopyDepth));
    for (auto& node : canopyNodes)
        node = in.hash();

    ChangeLogRing changeLog(params.maxDepth, params.maxBufferSize);
    changeLog.restore(std::move(entries), activeIndex, bufferSize);

    TreeAccount account(id, header, params, j);
    account.tree_.restore(
        sequenceNumber, std::move(changeLog), std::move(rightmost), std::move(canopyNodes));

    JLOG(j.trace()) << "Loaded tree account " << id << ", sequence " << sequenceNumber;
    return account;
}

ripple::Blob
TreeAccount::serialize() const
{
    auto const& params = tree_.params();
    ripple::Blob out(sizeFor(params), 0);
    if (header_.accountType == AccountType::Uninitialized)
        return out;

    ByteWriter w(out);
    w.u8(static_cast<std::uint8_t>(header_.accountType));
    w.skip(7);
    w.u32(header_.maxBufferSize);
    w.u32(header_.maxDepth);
    w.hash(header_.authority);
    w.u64(header_.creationSlot);

    auto const& changeLog = tree_.changeLog();
    w.u64(tree_.sequenceNumber());
    w.u64(changeLog.activeIndex());
    w.u64(changeLog.bufferSize());

    for (auto const& entry : changeLog.entries())
    {
        w.hash(entry.root);
        for (auto const& node : entry.path)
            w.hash(node);
        w.u32(entry.index);
        w.skip(4);
    }

    auto const& rightmost = tree_.rightmostPath();
    w.hash(rightmost.leaf);
    for (auto const& node : rightmost.proof)
        w.hash(node);
    w.u32(rightmost.index);
    w.skip(4);

    for (auto const& node : tree_.canopy().nodes())
        w.hash(node);
    return out;
}

ripple::Expected<void, TreeError>
TreeAccount::checkAuthority(ripple::uint256 const& signer) const
{
    if (header_.accountType != AccountType::ConcurrentMerkleTree)
        return ripple::Unexpected(TreeError::IncorrectAccountType);
    if (signer != header_.authority)
    {
        JLOG(j_.warn()) << "Signer " << signer << " is not the authority of tree " << id_;
        return ripple::Unexpected(TreeError::Unauthorized);
    }
    return {};
}

ripple::Expected<ChangeLogEvent, TreeError>
TreeAccount::emit(ripple::Expected<NodeHash, TreeError> const& result) const
{
    if (!result)
    {
        JLOG(j_.debug()) << "Tree " << id_ << ": " << transToken(result.error());
        return ripple::Unexpected(result.error());
    }
    return currentEvent();
}

ChangeLogEvent
TreeAccount::currentEvent() const
{
    return ChangeLogEvent::fromChange(
        id_, tree_.lastChange(), tree_.sequenceNumber(), tree_.params().maxDepth);
}

ripple::Expected<ChangeLogEvent, TreeError>
TreeAccount::initializeEmpty(ripple::uint256 const& signer)
{
    if (auto const allowed = checkAuthority(signer); !allowed)
        return ripple::Unexpected(allowed.error());
    return emit(tree_.initialize());
}

ripple::Expected<void, TreeError>
TreeAccount::appendCanopyNodes(
    ripple::uint256 const& signer,
    std::uint32_t startIndex,
    std::vector<NodeHash> const& nodes)
{
    if (auto const allowed = checkAuthority(signer); !allowed)
        return ripple::Unexpected(allowed.error());
    return tree_.setCanopyLeafNodes(startIndex, nodes);
}

ripple::Expected<ChangeLogEvent, TreeError>
TreeAccount::initializePreparedWithRoot(
    ripple::uint256 const& signer,
    NodeHash const& root,
    NodeHash const& rightmostLeaf,
    std::uint32_t rightmostIndex,
    std::vector<NodeHash> const& proof)
{
    if (auto const allowed = checkAuthority(signer); !allowed)
        return ripple::Unexpected(allowed.error());
    return emit(tree_.initializeWithRoot(root, rightmostLeaf, rightmostIndex, proof));
}

ripple::Expected<ChangeLogEvent, TreeError>
TreeAccount::append(ripple::uint256 const& signer, NodeHash const& leaf)
{
    if (auto const allowed = checkAuthority(signer); !allowed)
        return ripple::Unexpected(allowed.error());
    return emit(tree_.append(leaf));
}

ripple::Expected<ChangeLogEvent, TreeError>
TreeAccount::replace(
    ripple::uint256 const& signer,
    std::uint32_t leafIndex,
    NodeHash const& oldLeaf,
    NodeHash const& newLeaf,
    std::vector<NodeHash> const& proof)
{
    if (auto const allowed = checkAuthority(signer); !allowed)
        return ripple::Unexpected(allowed.error());
    return emit(tree_.replace(leafIndex, oldLeaf, newLeaf, proof));
}

ripple::Expected<ChangeLogEvent, TreeError>
TreeAccount::insertOrAppend(
    ripple::uint256 const& signer,
    std::uint32_t leafIndex,
    NodeHash const& leaf,
    std::vector<NodeHash> const& proof)
{
    if (auto const allowed = checkAuthority(signer); !allowed)
        return ripple::Unexpected(allowed.error());
    return emit(tree_.insertOrAppend(leafIndex, leaf, proof));
}

ripple::Expected<void, TreeError>
TreeAccount::verify(
    std::uint32_t leafIndex,
    NodeHash const& leaf,
    std::vector<NodeHash> const& proof) const
{
    if (header_.accountType != AccountType::ConcurrentMerkleTree)
        return ripple::Unexpected(TreeError::IncorrectAccountType);
    return tree_.verify(leafIndex, leaf, proof);
}

ripple::Expected<void, TreeError>
TreeAccount::setAuthority(ripple::uint256 const& signer, ripple::uint256 const& newAuthority)
{
    if (auto const allowed = checkAuthority(signer); !allowed)
        return ripple::Unexpected(allowed.error());

    header_.authority = newAuthority;
    JLOG(j_.info()) << "Tree " << id_ << " authority set to " << newAuthority;
    return {};
}

ripple::Expected<void, TreeError>
TreeAccount::closeEmpty(ripple::uint256 const& signer)
{
    if (auto const allowed = checkAuthority(signer); !allowed)
        return ripple::Unexpected(allowed.error());
    if (auto const empty = tree_.proveEmpty(); !empty)
        return ripple::Unexpected(empty.error());

    auto const params = tree_.params();
    header_ = TreeHeader{};
    tree_ = ConcurrentMerkleTree(params, j_);
    JLOG(j_.info()) << "Closed tree " << id_;
    return {};
}

} // namespace cmt
} // namespace ripple
