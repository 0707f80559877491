#include <libcmt/ChangeLogEvent.h>
#include <libcmt/OffchainMirror.h>
#include <libcmt/TreeAccount.h>

#include <test/cmt/TreeTestHelpers.h>

#include <xrpl/beast/unit_test.h>
#include <xrpl/beast/utility/Journal.h>

#include <string>

namespace ripple {
namespace cmt {
namespace test {

class ChangeLogEvent_test : public beast::unit_test::suite
{
    beast::Journal j_{beast::Journal::getNullSink()};

public:
    void
    run() override
    {
        testEventPath();
        testJson();
        testEmptyTreeEvent();
        testMirrorReplay();
    }

    void
    testEventPath()
    {
        testcase("Event path");

        OffchainMirror mirror(3);
        auto const proof = mirror.getProof(5).proof;
        mirror.updateLeaf(5, makeLeaf(5));

        auto const id = makeLeaf(1000);
        auto const event = ChangeLogEvent::fromChange(id, makeChange(5, makeLeaf(5), proof), 9, 3);

        BEAST_EXPECT(event.id == id);
        BEAST_EXPECT(event.seq == 9);
        BEAST_EXPECT(event.index == 5);
        BEAST_EXPECT(event.path.size() == 4);
        BEAST_EXPECT(event.leaf() == makeLeaf(5));
        BEAST_EXPECT(event.root() == mirror.root());

        // Node numbers walk from leaf 5 (node 13) up to the root (node 1).
        BEAST_EXPECT(event.path[0].nodeIndex == 13);
        BEAST_EXPECT(event.path[1].nodeIndex == 6);
        BEAST_EXPECT(event.path[2].nodeIndex == 3);
        BEAST_EXPECT(event.path[3].nodeIndex == 1);
        BEAST_EXPECT(event.path[2].node == subtreeRoot(mirror, 2, 1));
    }

    void
    testJson()
    {
        testcase("Json");

        OffchainMirror mirror(2);
        auto const proof = mirror.getProof(2).proof;
        mirror.updateLeaf(2, makeLeaf(2));
        auto const event =
            ChangeLogEvent::fromChange(makeLeaf(7), makeChange(2, makeLeaf(2), proof), 3, 2);

        auto const json = event.getJson();
        BEAST_EXPECT(json["id"].asString() == to_string(makeLeaf(7)));
        BEAST_EXPECT(json["seq"].asString() == "3");
        BEAST_EXPECT(json["index"].asUInt() == 2);
        BEAST_EXPECT(json["root"].asString() == to_string(mirror.root()));
        BEAST_EXPECT(json["path"].isArray());
        BEAST_EXPECT(json["path"].size() == 3);
        BEAST_EXPECT(json["path"][0u]["node"].asString() == to_string(makeLeaf(2)));
        BEAST_EXPECT(json["path"][0u]["node_index"].asString() == "6");
        BEAST_EXPECT(json["path"][2u]["node_index"].asString() == "1");
    }

    void
    testEmptyTreeEvent()
    {
        testcase("Empty tree event");

        auto const id = makeLeaf(1000);
        auto const authority = makeLeaf(2000);
        auto created = TreeAccount::create(id, {5, 8, 2}, authority, 0, j_);
        if (!BEAST_EXPECT(created))
            return;

        BEAST_EXPECT(!created->initializeEmpty(makeLeaf(3000)));
        auto const event = created->initializeEmpty(authority);
        if (!BEAST_EXPECT(event))
            return;

        BEAST_EXPECT(event->id == id);
        BEAST_EXPECT(event->seq == 0);
        BEAST_EXPECT(event->index == 0);
        BEAST_EXPECT(event->path.size() == 6);
        BEAST_EXPECT(event->leaf() == emptyNode(0));
        BEAST_EXPECT(event->root() == emptyNode(5));
        BEAST_EXPECT(event->path[0].nodeIndex == 32);
        BEAST_EXPECT(event->path[3].node == emptyNode(3));

        // A fresh indexer starts from the same root.
        OffchainMirror indexer(5);
        BEAST_EXPECT(indexer.apply(*event));
        BEAST_EXPECT(indexer.root() == event->root());

        // Only one initialization per account.
        BEAST_EXPECT(!created->initializeEmpty(authority));
    }

    void
    testMirrorReplay()
    {
        testcase("Mirror replay");

        auto const authority = makeLeaf(2000);
        auto created = TreeAccount::create(makeLeaf(1000), {4, 4, 1}, authority, 0, j_);
        if (!BEAST_EXPECT(created))
            return;
        auto& account = *created;
        BEAST_EXPECT(account.initializeEmpty(authority));

        // An indexer that only sees events tracks the tree exactly.
        OffchainMirror indexer(4);
        OffchainMirror writer(4);
        for (std::uint32_t i = 0; i < 9; ++i)
        {
            auto const event = account.append(authority, makeLeaf(i));
            writer.updateLeaf(i, makeLeaf(i));
            BEAST_EXPECT(event && event->seq == i + 1 && event->index == i);
            BEAST_EXPECT(event && indexer.apply(*event));
        }

        auto const proof = writer.getProof(3);
        auto const event = account.replace(authority, 3, proof.leaf, makeLeaf(33), proof.truncated(1));
        writer.updateLeaf(3, makeLeaf(33));
        BEAST_EXPECT(event && indexer.apply(*event));
        BEAST_EXPECT(indexer.root() == writer.root());
        BEAST_EXPECT(account.currentEvent().root() == writer.root());

        // An event from another tree does not fit.
        OffchainMirror stranger(4);
        stranger.build(makeLeaves(3, 50));
        BEAST_EXPECT(!stranger.apply(*event));
    }
};

BEAST_DEFINE_TESTSUITE(ChangeLogEvent, libcmt, ripple);

} // namespace test
} // namespace cmt
} // namespace ripple
