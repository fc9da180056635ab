#include <gtest/gtest.h>

#include "adapters/secondary/persistence/InMemoryEphemeralStore.hpp"
#include "mocks/TempDirectory.hpp"

#include <filesystem>
#include <fstream>
#include <thread>

using namespace sandbox;
using namespace sandbox::tests::mocks;

class InMemoryEphemeralStoreTest : public ::testing::Test {
protected:
    adapters::secondary::InMemoryEphemeralStore store_;

    std::optional<domain::Message> say(const std::string& conversationId, const std::string& text) {
        return store_.addMessage(conversationId, domain::MessageRole::USER, text, {}, {});
    }
};

// ============================================================================
// РАЗГОВОРЫ
// ============================================================================

TEST_F(InMemoryEphemeralStoreTest, AddMessage_SequenceStrictlyIncreases) {
    auto a = store_.createConversation("sess-a");
    auto b = store_.createConversation("sess-b");

    auto m1 = say(a, "one");
    auto m2 = say(b, "two");
    auto m3 = say(a, "three");

    ASSERT_TRUE(m1 && m2 && m3);
    EXPECT_LT(m1->sequence, m2->sequence);
    EXPECT_LT(m2->sequence, m3->sequence);

    auto conversation = store_.getConversation(a);
    ASSERT_EQ(conversation->messages.size(), 2u);
    EXPECT_EQ(conversation->messages[1].content, "three");
    EXPECT_EQ(conversation->updatedAt, m3->timestamp);
}

TEST_F(InMemoryEphemeralStoreTest, AddMessage_UnknownConversation) {
    EXPECT_FALSE(say("conv-missing", "hello").has_value());
}

TEST_F(InMemoryEphemeralStoreTest, ListConversations_MostRecentlyUpdatedFirst) {
    auto first = store_.createConversation("sess-a");
    auto second = store_.createConversation("sess-a");
    store_.createConversation("sess-b");
    say(first, "bump");

    auto list = store_.listConversations("sess-a");

    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0].id, first);
    EXPECT_EQ(list[1].id, second);
}

TEST_F(InMemoryEphemeralStoreTest, DeleteConversation_RequiresOwner) {
    auto id = store_.createConversation("sess-a");

    EXPECT_FALSE(store_.deleteConversation(id, "sess-b"));
    EXPECT_TRUE(store_.deleteConversation(id, "sess-a"));
    EXPECT_FALSE(store_.getConversation(id).has_value());
}

TEST_F(InMemoryEphemeralStoreTest, ConcurrentAddMessage_NoDuplicateSequences) {
    auto id = store_.createConversation("sess-a");

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([this, &id]() {
            for (int i = 0; i < 100; ++i) {
                say(id, "msg");
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    auto messages = store_.getConversation(id)->messages;
    ASSERT_EQ(messages.size(), 400u);
    for (size_t i = 1; i < messages.size(); ++i) {
        EXPECT_LT(messages[i - 1].sequence, messages[i].sequence);
    }
}

// ============================================================================
// ДОКУМЕНТЫ
// ============================================================================

TEST_F(InMemoryEphemeralStoreTest, RecordProcessing_OnlyOnce) {
    auto document = store_.addDocument("sess-a", "a.txt", "", 1, ".txt");

    domain::ProcessingResult first;
    first.content = "first";
    domain::ProcessingResult second;
    second.content = "second";

    EXPECT_TRUE(store_.recordProcessing(document.id, first));
    EXPECT_FALSE(store_.recordProcessing(document.id, second));
    EXPECT_EQ(store_.getDocument(document.id)->processing->content, "first");
    EXPECT_FALSE(store_.recordProcessing("doc-missing", first));
}

TEST_F(InMemoryEphemeralStoreTest, DeleteDocument_RemovesFileOfOwnerOnly) {
    TempDirectory dir("ephemeral-store");
    auto path = (dir.path() / "a.txt").string();
    std::ofstream(path) << "content";
    auto document = store_.addDocument("sess-a", "a.txt", path, 7, ".txt");

    EXPECT_FALSE(store_.deleteDocument(document.id, "sess-b"));
    EXPECT_TRUE(std::filesystem::exists(path));

    EXPECT_TRUE(store_.deleteDocument(document.id, "sess-a"));
    EXPECT_FALSE(std::filesystem::exists(path));
    EXPECT_FALSE(store_.getDocument(document.id).has_value());
}

TEST_F(InMemoryEphemeralStoreTest, GetDocumentsByIds_SkipsUnknown) {
    auto a = store_.addDocument("sess-a", "a.txt", "", 1, ".txt");

    auto found = store_.getDocumentsByIds({a.id, "doc-missing"});

    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].id, a.id);
}

// ============================================================================
// КАСКАД
// ============================================================================

TEST_F(InMemoryEphemeralStoreTest, ClearSessionData_RemovesOnlyThatSession) {
    store_.createConversation("sess-a");
    store_.createConversation("sess-a");
    store_.addDocument("sess-a", "a.txt", "", 1, ".txt");
    store_.createConversation("sess-b");
    store_.addDocument("sess-b", "b.txt", "", 1, ".txt");

    EXPECT_EQ(store_.clearSessionData("sess-a"), 3u);
    EXPECT_EQ(store_.conversationCount(), 1u);
    EXPECT_EQ(store_.documentCount(), 1u);
    EXPECT_EQ(store_.clearSessionData("sess-a"), 0u);
}
