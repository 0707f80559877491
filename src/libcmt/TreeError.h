#pragma once

#include <string>

namespace ripple {
namespace cmt {

/**
 * Failure codes returned by tree and account operations.
 *
 * Every failed operation leaves the tree untouched; retrying (usually with a
 * freshly generated proof) is up to the caller.
 */
enum class TreeError {
    ProofMismatch,
    TreeFull,
    LeafIndexOutOfRange,
    Unauthorized,
    InvalidAccountSize,
    CorruptCanopy,
    TreeNotEmpty,
    TreeAlreadyInitialized,
    TreeNotInitialized,
    CannotAppendEmptyNode,
    InvalidProofLength,
    InvalidTreeParameters,
    InvalidCanopyRange,
    CanopyRootMismatch,
    CanopyNodeBeyondRightmost,
    IncorrectAccountType
};

// Short stable code, e.g. "cmtPROOF_MISMATCH".
std::string
transToken(TreeError code);

// Human readable description.
std::string
transHuman(TreeError code);

} // namespace cmt
} // namespace ripple
