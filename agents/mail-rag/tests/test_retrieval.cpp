#include <gtest/gtest.h>
#include "../include/errors.hpp"
#include "../include/hash_embedder.hpp"
#include "../include/retrieval.hpp"
#include "../include/util.hpp"
#include "test_helpers.hpp"

static constexpr std::size_t kDim = 8;

class CountingEmbedder : public Embedder {
public:
    explicit CountingEmbedder(std::size_t dim) : hash_(dim) {}
    std::vector<float> embed(const std::string& text) override {
        ++calls;
        if (fail) throw std::runtime_error("embedding service down");
        return hash_.embed(text);
    }
    int calls {0};
    bool fail {false};

private:
    HashEmbedder hash_;
};

class ScriptedGenerator : public AnswerGenerator {
public:
    std::string generate(const std::vector<ChatMessage>& history) override {
        seen.push_back(history);
        if (fail) throw std::runtime_error("model timed out");
        return reply;
    }
    std::vector<std::vector<ChatMessage>> seen;
    std::string reply {"the answer"};
    bool fail {false};
};

class RetrievalTest : public ::testing::Test {
protected:
    void SetUp() override {
        storage_ = make_storage(storage_config(dir_, StorageKind::Database, kDim));
        embedder_ = std::make_shared<CountingEmbedder>(kDim);
    }

    void store(const std::string& id, const std::string& summary) {
        HashEmbedder h(kDim);
        auto r = make_record(id, h.embed(summary));
        r.summary = summary;
        ASSERT_EQ(storage_->store(r).status, StoreOutcome::Status::Inserted);
    }

    TempDir dir_;
    std::unique_ptr<StorageBackend> storage_;
    std::shared_ptr<CountingEmbedder> embedder_;
};

TEST(RenderContextTest, NumbersItemsFromOne) {
    auto ctx = render_context({"first", "second"}, "Email", epoch());
    EXPECT_EQ(ctx, "Today's Datetime is 1970-01-01T00:00:00Z\n\n"
                   "Email(1):\n\nfirst\n\n"
                   "Email(2):\n\nsecond\n\n");
}

TEST(RenderContextTest, DefaultLabelIsItem) {
    auto ctx = render_context({"only"}, "Item", epoch());
    EXPECT_NE(ctx.find("Item(1):\n\nonly\n\n"), std::string::npos);
}

TEST_F(RetrievalTest, EmptyStoreYieldsSentinel) {
    Retriever r(*storage_, embedder_, kDim, 5);
    EXPECT_EQ(r.retrieve("anything"), std::vector<std::string>{kNoResults});
}

TEST_F(RetrievalTest, ReturnsClosestSummaryFirst) {
    store("m1", "dentist appointment on friday");
    store("m2", "invoice for march");
    store("m3", "team offsite agenda");
    Retriever r(*storage_, embedder_, kDim, 2);
    auto items = r.retrieve("invoice for march");
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0], "invoice for march");
}

TEST_F(RetrievalTest, WrongDimensionEmbedderYieldsSentinel) {
    store("m1", "invoice for march");
    Retriever r(*storage_, std::make_shared<HashEmbedder>(kDim * 2), kDim, 5);
    EXPECT_EQ(r.retrieve("invoice for march"), std::vector<std::string>{kNoResults});
}

TEST_F(RetrievalTest, EmbedderFailureYieldsSentinel) {
    store("m1", "invoice for march");
    embedder_->fail = true;
    Retriever r(*storage_, embedder_, kDim, 5);
    EXPECT_EQ(r.retrieve("invoice"), std::vector<std::string>{kNoResults});
}

TEST(DimensionCheckTest, RejectsMismatchedEmbedder) {
    HashEmbedder small(kDim);
    EXPECT_NO_THROW(check_embedding_dimension(small, kDim));
    EXPECT_THROW(check_embedding_dimension(small, kDim * 2), DimensionMismatch);
}

TEST_F(RetrievalTest, FirstQuestionRetrievesFollowUpsReuseHistory) {
    store("m1", "invoice for march");
    Retriever r(*storage_, embedder_, kDim, 5);
    ScriptedGenerator gen;
    SessionConfig cfg;
    cfg.system_prompt = "You answer from email.";
    cfg.item_label = "Email";
    ConversationSession session(r, gen, cfg);

    EXPECT_EQ(session.ask("what is the invoice?"), "the answer");
    EXPECT_EQ(embedder_->calls, 1);
    ASSERT_EQ(session.history().size(), 3u);
    EXPECT_EQ(session.history()[0].role, "system");
    EXPECT_EQ(session.history()[0].content.rfind("You answer from email.\n\nToday's Datetime is ", 0), 0u);
    EXPECT_NE(session.history()[0].content.find("Email(1):\n\ninvoice for march"), std::string::npos);
    EXPECT_EQ(session.history()[1].role, "user");
    EXPECT_EQ(session.history()[2].role, "assistant");

    gen.reply = "second answer";
    EXPECT_EQ(session.ask("and when is it due?"), "second answer");
    EXPECT_EQ(embedder_->calls, 1);
    ASSERT_EQ(gen.seen.size(), 2u);
    EXPECT_EQ(gen.seen[1].size(), 4u);
    EXPECT_EQ(gen.seen[1].back().content, "and when is it due?");
    EXPECT_EQ(session.history().size(), 5u);

    session.reset();
    session.ask("new topic");
    EXPECT_EQ(embedder_->calls, 2);
}

TEST_F(RetrievalTest, GeneratorFailureYieldsApology) {
    Retriever r(*storage_, embedder_, kDim, 5);
    ScriptedGenerator gen;
    gen.fail = true;
    ConversationSession session(r, gen);
    EXPECT_EQ(session.ask("anything?"), kApology);
    ASSERT_EQ(session.history().size(), 3u);
    EXPECT_EQ(session.history()[2].content, kApology);
    EXPECT_NE(session.history()[0].content.find(std::string("Item(1):\n\n") + kNoResults), std::string::npos);

    gen.fail = false;
    gen.reply = "";
    EXPECT_EQ(session.ask("again?"), kApology);
}
