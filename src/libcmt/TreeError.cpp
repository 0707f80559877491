#include <libcmt/TreeError.h>

#include <unordered_map>
#include <utility>

namespace ripple {
namespace cmt {

namespace {

std::unordered_map<TreeError, std::pair<char const*, char const*>> const&
transResults()
{
    static std::unordered_map<TreeError, std::pair<char const*, char const*>> const results{
        {TreeError::ProofMismatch,
         {"cmtPROOF_MISMATCH", "Proof does not resolve to the current root."}},
        {TreeError::TreeFull,
         {"cmtTREE_FULL", "Every leaf slot of the tree has been appended."}},
        {TreeError::LeafIndexOutOfRange,
         {"cmtLEAF_INDEX_OUT_OF_RANGE", "Leaf index is outside the tree."}},
        {TreeError::Unauthorized,
         {"cmtUNAUTHORIZED", "Signer is not the tree authority."}},
        {TreeError::InvalidAccountSize,
         {"cmtINVALID_ACCOUNT_SIZE", "Account size does not match the tree header."}},
        {TreeError::CorruptCanopy,
         {"cmtCORRUPT_CANOPY", "Canopy byte length does not describe a canopy."}},
        {TreeError::TreeNotEmpty,
         {"cmtTREE_NOT_EMPTY", "Tree still contains non-empty leaves."}},
        {TreeError::TreeAlreadyInitialized,
         {"cmtTREE_ALREADY_INITIALIZED", "Tree has already been initialized."}},
        {TreeError::TreeNotInitialized,
         {"cmtTREE_NOT_INITIALIZED", "Tree has not been initialized."}},
        {TreeError::CannotAppendEmptyNode,
         {"cmtCANNOT_APPEND_EMPTY_NODE", "The empty node cannot be appended."}},
        {TreeError::InvalidProofLength,
         {"cmtINVALID_PROOF_LENGTH", "Proof length does not match the tree depth."}},
        {TreeError::InvalidTreeParameters,
         {"cmtINVALID_TREE_PARAMETERS", "Tree depth, buffer size or canopy depth is out of bounds."}},
        {TreeError::InvalidCanopyRange,
         {"cmtINVALID_CANOPY_RANGE", "Canopy nodes do not fit the canopy."}},
        {TreeError::CanopyRootMismatch,
         {"cmtCANOPY_ROOT_MISMATCH", "Canopy does not hash to the supplied root."}},
        {TreeError::CanopyNodeBeyondRightmost,
         {"cmtCANOPY_NODE_BEYOND_RIGHTMOST", "Canopy holds nodes right of the rightmost leaf."}},
        {TreeError::IncorrectAccountType,
         {"cmtINCORRECT_ACCOUNT_TYPE", "Account does not hold a concurrent merkle tree."}},
    };
    return results;
}

} // namespace

std::string
transToken(TreeError code)
{
    auto const& results = transResults();
    if (auto const it = results.find(code); it != results.end())
        return it->second.first;
    return "-";
}

std::string
transHuman(TreeError code)
{
    auto const& results = transResults();
    if (auto const it = results.find(code); it != results.end())
        return it->second.second;
    return "-";
}

} // namespace cmt
} // namespace ripple
