#include <libcmt/Canopy.h>
#include <libcmt/TreeAccount.h>

#include <test/cmt/TreeTestHelpers.h>

#include <xrpl/basics/Slice.h>
#include <xrpl/basics/contract.h>
#include <xrpl/beast/unit_test.h>
#include <xrpl/beast/utility/Journal.h>

#include <boost/endian/conversion.hpp>

#include <algorithm>
#include <stdexcept>

namespace ripple {
namespace cmt {
namespace test {

class TreeAccount_test : public beast::unit_test::suite
{
    beast::Journal j_{beast::Journal::getNullSink()};
    ripple::uint256 const id_ = makeLeaf(1000);
    ripple::uint256 const authority_ = makeLeaf(2000);

    template <class T>
    void
    expectError(ripple::Expected<T, TreeError> const& result, TreeError code)
    {
        expect(!result && result.error() == code, transToken(code));
    }

    TreeAccount
    create(TreeParams const& params)
    {
        auto account = TreeAccount::create(id_, params, authority_, 77, j_);
        if (!BEAST_EXPECT(account) || !BEAST_EXPECT(account->initializeEmpty(authority_)))
            ripple::Throw<std::runtime_error>("account creation failed");
        return std::move(*account);
    }

public:
    void
    run() override
    {
        testSizes();
        testLayout();
        testRoundTrip();
        testLoadErrors();
        testAuthority();
        testCloseEmpty();
        testPreparedBatch();
    }

    void
    testSizes()
    {
        testcase("Sizes");

        BEAST_EXPECT(TreeAccount::sizeFor({3, 8, 0}) == 56 + 24 + (3 * 32 + 40) * 9);
        BEAST_EXPECT(TreeAccount::sizeFor({14, 64, 0}) == 56 + 24 + (14 * 32 + 40) * 65);
        BEAST_EXPECT(
            TreeAccount::sizeFor({5, 4, 3}) == 56 + 24 + (5 * 32 + 40) * 5 + 14 * 32);

        for (auto const& params :
             {TreeParams{1, 1, 0},
              TreeParams{3, 8, 0},
              TreeParams{5, 4, 3},
              TreeParams{14, 64, 0},
              TreeParams{20, 256, 10}})
        {
            auto const account = create(params);
            BEAST_EXPECT(account.serialize().size() == TreeAccount::sizeFor(params));
        }

        expectError(
            TreeAccount::create(id_, {0, 8, 0}, authority_, 0, j_),
            TreeError::InvalidTreeParameters);
        expectError(
            TreeAccount::create(id_, {3, 8, 4}, authority_, 0, j_),
            TreeError::InvalidTreeParameters);
    }

    void
    testLayout()
    {
        testcase("Layout");

        auto account = create({3, 8, 0});
        BEAST_EXPECT(account.append(authority_, makeLeaf(0)));
        BEAST_EXPECT(account.append(authority_, makeLeaf(1)));

        auto const bytes = account.serialize();
        BEAST_EXPECT(bytes[0] == 1);
        BEAST_EXPECT(std::all_of(bytes.begin() + 1, bytes.begin() + 8, [](auto b) { return b == 0; }));
        BEAST_EXPECT(boost::endian::load_little_u32(bytes.data() + 8) == 8);
        BEAST_EXPECT(boost::endian::load_little_u32(bytes.data() + 12) == 3);
        BEAST_EXPECT(ripple::uint256::fromVoid(bytes.data() + 16) == authority_);
        BEAST_EXPECT(boost::endian::load_little_u64(bytes.data() + 48) == 77);
        BEAST_EXPECT(boost::endian::load_little_u64(bytes.data() + 56) == 2);
        BEAST_EXPECT(boost::endian::load_little_u64(bytes.data() + 64) == 2);
        BEAST_EXPECT(boost::endian::load_little_u64(bytes.data() + 72) == 2);

        // Active entry sits in slot 2 of the change log.
        std::size_t const entrySize = 3 * 32 + 40;
        auto const active = bytes.data() + 80 + 2 * entrySize;
        BEAST_EXPECT(ripple::uint256::fromVoid(active) == account.tree().root());
        BEAST_EXPECT(ripple::uint256::fromVoid(active + 32) == makeLeaf(1));
        BEAST_EXPECT(boost::endian::load_little_u32(active + 32 * 4) == 1);

        auto const rightmost = bytes.data() + 80 + 8 * entrySize;
        BEAST_EXPECT(ripple::uint256::fromVoid(rightmost) == makeLeaf(1));
        BEAST_EXPECT(boost::endian::load_little_u32(rightmost + 32 * 4) == 2);
    }

    void
    testRoundTrip()
    {
        testcase("Round trip");

        TreeParams const params{5, 8, 2};
        auto account = create(params);
        OffchainMirror mirror(5);

        for (std::uint32_t i = 0; i < 12; ++i)
        {
            BEAST_EXPECT(account.append(authority_, makeLeaf(i)));
            mirror.updateLeaf(i, makeLeaf(i));
        }
        auto const stale = mirror.getProof(3);
        auto const proof9 = mirror.getProof(9);
        BEAST_EXPECT(account.replace(authority_, 9, proof9.leaf, makeLeaf(90), proof9.truncated(2)));
        mirror.updateLeaf(9, makeLeaf(90));

        auto const bytes = account.serialize();
        auto loaded = TreeAccount::load(id_, ripple::makeSlice(bytes), j_);
        if (!BEAST_EXPECT(loaded))
            return;

        BEAST_EXPECT(loaded->serialize() == bytes);
        BEAST_EXPECT(loaded->tree().params() == params);
        BEAST_EXPECT(loaded->tree().root() == mirror.root());
        BEAST_EXPECT(loaded->tree().sequenceNumber() == 13);
        BEAST_EXPECT(loaded->header().authority == authority_);
        BEAST_EXPECT(loaded->header().creationSlot == 77);

        // The restored change log still patches proofs.
        auto const patched = loaded->replace(authority_, 3, stale.leaf, makeLeaf(30), stale.truncated(2));
        mirror.updateLeaf(3, makeLeaf(30));
        BEAST_EXPECT(patched && patched->root() == mirror.root());

        auto const appended = loaded->append(authority_, makeLeaf(12));
        mirror.updateLeaf(12, makeLeaf(12));
        BEAST_EXPECT(appended && appended->root() == mirror.root());
    }

    void
    testLoadErrors()
    {
        testcase("Load errors");

        auto const bytes = create({3, 8, 0}).serialize();
        auto load = [this](ripple::Blob const& data) {
            return TreeAccount::load(id_, ripple::makeSlice(data), j_);
        };

        expectError(load(ripple::Blob(40, 0)), TreeError::InvalidAccountSize);
        expectError(load(ripple::Blob(bytes.size(), 0)), TreeError::IncorrectAccountType);

        auto wrongType = bytes;
        wrongType[0] = 7;
        expectError(load(wrongType), TreeError::IncorrectAccountType);

        auto truncated = bytes;
        truncated.pop_back();
        expectError(load(truncated), TreeError::InvalidAccountSize);

        auto badCanopy = bytes;
        badCanopy.resize(bytes.size() + 3 * 32, 0);
        expectError(load(badCanopy), TreeError::CorruptCanopy);

        auto deepCanopy = bytes;
        deepCanopy.resize(bytes.size() + Canopy::nodeCount(4) * 32, 0);
        expectError(load(deepCanopy), TreeError::CorruptCanopy);

        auto badDepth = bytes;
        boost::endian::store_little_u32(badDepth.data() + 12, 0);
        expectError(load(badDepth), TreeError::InvalidAccountSize);

        auto badIndex = bytes;
        boost::endian::store_little_u64(badIndex.data() + 64, 8);
        expectError(load(badIndex), TreeError::InvalidAccountSize);

        // Trailing bytes of a valid canopy size are a canopy.
        auto withCanopy = bytes;
        withCanopy.resize(bytes.size() + Canopy::nodeCount(1) * 32, 0);
        auto const loaded = load(withCanopy);
        BEAST_EXPECT(loaded && loaded->tree().canopy().depth() == 1);
    }

    void
    testAuthority()
    {
        testcase("Authority");

        auto account = create({3, 8, 0});
        auto const intruder = makeLeaf(3000);
        auto const successor = makeLeaf(4000);

        expectError(account.append(intruder, makeLeaf(0)), TreeError::Unauthorized);
        expectError(account.setAuthority(intruder, intruder), TreeError::Unauthorized);
        expectError(account.closeEmpty(intruder), TreeError::Unauthorized);
        BEAST_EXPECT(account.tree().sequenceNumber() == 0);

        BEAST_EXPECT(account.append(authority_, makeLeaf(0)));
        BEAST_EXPECT(account.setAuthority(authority_, successor));
        BEAST_EXPECT(account.header().authority == successor);
        expectError(account.append(authority_, makeLeaf(1)), TreeError::Unauthorized);
        BEAST_EXPECT(account.append(successor, makeLeaf(1)));

        // Verification needs no signer.
        OffchainMirror mirror(3);
        mirror.build(makeLeaves(2));
        auto const proof = mirror.getProof(1);
        BEAST_EXPECT(account.verify(1, proof.leaf, proof.proof));
    }

    void
    testCloseEmpty()
    {
        testcase("Close empty");

        auto account = create({3, 4, 1});
        OffchainMirror mirror(3);

        auto const event = account.append(authority_, makeLeaf(0));
        BEAST_EXPECT(event);
        mirror.updateLeaf(0, makeLeaf(0));
        expectError(account.closeEmpty(authority_), TreeError::TreeNotEmpty);

        auto const proof = mirror.getProof(0);
        BEAST_EXPECT(account.replace(authority_, 0, proof.leaf, NodeHash{}, proof.truncated(1)));
        BEAST_EXPECT(account.closeEmpty(authority_));

        auto const bytes = account.serialize();
        BEAST_EXPECT(bytes.size() == TreeAccount::sizeFor({3, 4, 1}));
        BEAST_EXPECT(std::all_of(bytes.begin(), bytes.end(), [](auto b) { return b == 0; }));
        expectError(
            TreeAccount::load(id_, ripple::makeSlice(bytes), j_), TreeError::IncorrectAccountType);
        expectError(account.append(authority_, makeLeaf(1)), TreeError::IncorrectAccountType);
        expectError(account.verify(0, NodeHash{}, proof.proof), TreeError::IncorrectAccountType);
    }

    void
    testPreparedBatch()
    {
        testcase("Prepared batch");

        TreeParams const params{4, 4, 2};
        OffchainMirror mirror(4);
        mirror.build(makeLeaves(11));

        std::vector<NodeHash> level2;
        for (std::uint64_t p = 0; p < 4; ++p)
            level2.push_back(subtreeRoot(mirror, 2, p));
        auto const rightmost = mirror.getProof(10);

        auto prepared = TreeAccount::create(id_, params, authority_, 5, j_);
        if (!BEAST_EXPECT(prepared))
            return;
        auto& account = *prepared;
        BEAST_EXPECT(!account.tree().isInitialized());
        expectError(account.append(authority_, makeLeaf(0)), TreeError::TreeNotInitialized);

        // A prepared account survives a round trip uninitialized.
        auto const reloaded = TreeAccount::load(id_, ripple::makeSlice(account.serialize()), j_);
        BEAST_EXPECT(reloaded && !reloaded->tree().isInitialized());

        expectError(
            account.initializePreparedWithRoot(
                authority_, mirror.root(), rightmost.leaf, 10, rightmost.truncated(2)),
            TreeError::CanopyRootMismatch);

        expectError(account.appendCanopyNodes(makeLeaf(3000), 0, level2), TreeError::Unauthorized);
        expectError(account.appendCanopyNodes(authority_, 3, level2), TreeError::InvalidCanopyRange);
        BEAST_EXPECT(account.appendCanopyNodes(authority_, 0, {level2[0], level2[1]}));
        BEAST_EXPECT(account.appendCanopyNodes(authority_, 2, {level2[2], level2[3]}));
        BEAST_EXPECT(account.tree().canopy().root() == mirror.root());

        expectError(
            account.initializePreparedWithRoot(
                authority_, mirror.root(), rightmost.leaf, 10, mirror.getProof(9).truncated(2)),
            TreeError::ProofMismatch);

        auto const event = account.initializePreparedWithRoot(
            authority_, mirror.root(), rightmost.leaf, 10, rightmost.truncated(2));
        if (!BEAST_EXPECT(event))
            return;
        BEAST_EXPECT(event->root() == mirror.root());
        BEAST_EXPECT(event->index == 10);
        BEAST_EXPECT(event->seq == 1);
        BEAST_EXPECT(account.tree().rightmostPath().index == 11);
        expectError(account.appendCanopyNodes(authority_, 0, level2), TreeError::TreeAlreadyInitialized);

        auto const appended = account.append(authority_, makeLeaf(11));
        mirror.updateLeaf(11, makeLeaf(11));
        BEAST_EXPECT(appended && appended->root() == mirror.root());

        // A canopy holding nodes right of the claimed rightmost leaf is rejected.
        OffchainMirror wide(4);
        wide.build(makeLeaves(14));
        auto other = TreeAccount::create(id_, params, authority_, 5, j_);
        if (!BEAST_EXPECT(other))
            return;
        std::vector<NodeHash> wideLevel2;
        for (std::uint64_t p = 0; p < 4; ++p)
            wideLevel2.push_back(subtreeRoot(wide, 2, p));
        BEAST_EXPECT(other->appendCanopyNodes(authority_, 0, wideLevel2));
        auto const claimed = wide.getProof(10);
        expectError(
            other->initializePreparedWithRoot(
                authority_, wide.root(), claimed.leaf, 10, claimed.truncated(2)),
            TreeError::CanopyNodeBeyondRightmost);
    }
};

BEAST_DEFINE_TESTSUITE(TreeAccount, libcmt, ripple);

} // namespace test
} // namespace cmt
} // namespace ripple
