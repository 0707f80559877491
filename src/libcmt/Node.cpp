#include <libcmt/Node.h>

#include <xrpl/basics/contract.h>

#include <openssl/sha.h>

#include <array>
#include <cstring>
#include <stdexcept>

namespace ripple {
namespace cmt {

NodeHash
combine(NodeHash const& left, NodeHash const& right)
{
    std::array<unsigned char, 64> input;
    std::memcpy(input.data(), left.data(), NodeHash::size());
    std::memcpy(input.data() + NodeHash::size(), right.data(), NodeHash::size());

    NodeHash result;
    SHA256(input.data(), input.size(), result.data());
    return result;
}

NodeHash const&
emptyNode(std::uint32_t level)
{
    static std::array<NodeHash, MAX_EMPTY_LEVEL + 1> const emptyHashes = [] {
        std::array<NodeHash, MAX_EMPTY_LEVEL + 1> hashes;
        hashes[0] = beast::zero;
        for (std::size_t i = 1; i < hashes.size(); ++i)
            hashes[i] = combine(hashes[i - 1], hashes[i - 1]);
        return hashes;
    }();

    if (level > MAX_EMPTY_LEVEL)
        ripple::Throw<std::out_of_range>("Empty node level too large");
    return emptyHashes[level];
}

} // namespace cmt
} // namespace ripple
