#include <gtest/gtest.h>
#include <modelflux/vector/ingestion_pipeline.h>
#include <modelflux/vector/retrieval_orchestrator.h>

#include <memory>
#include <set>
#include <string>
#include <vector>

using namespace modelflux;
using namespace modelflux::vector;

class RetrievalOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<RagStore>();
        ASSERT_TRUE(store_->open(":memory:"));
        index_ = std::make_shared<VectorIndex>(store_);
        staleness_ = std::make_shared<StalenessTracker>(store_);
        embedder_ = std::make_shared<EmbeddingProvider>(
            std::shared_ptr<IEmbeddingBackend>(makeHashEmbeddingBackend(384)), nullptr,
            "model-a", 384);
        pipeline_ = std::make_unique<DocumentIngestionPipeline>(store_, index_, staleness_,
                                                                embedder_);
        retrieval_ = std::make_unique<RetrievalOrchestrator>(index_, staleness_, embedder_);
    }

    std::shared_ptr<RagStore> store_;
    std::shared_ptr<VectorIndex> index_;
    std::shared_ptr<StalenessTracker> staleness_;
    std::shared_ptr<EmbeddingProvider> embedder_;
    std::unique_ptr<DocumentIngestionPipeline> pipeline_;
    std::unique_ptr<RetrievalOrchestrator> retrieval_;
};

TEST_F(RetrievalOrchestratorTest, NothingIndexedYet) {
    auto r = retrieval_->retrieve("anything");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::IndexNotReady);
}

TEST_F(RetrievalOrchestratorTest, ReturnsTopKInDescendingOrder) {
    const std::vector<std::string> docs = {
        "The boiler pressure should stay between one and two bar.",
        "Bleed the radiators once a year before winter.",
        "The warranty covers parts for five years.",
        "Descale the heat exchanger every two years.",
        "Reset the thermostat by holding the mode button.",
        "Annual service must be done by a registered engineer.",
        "The condensate pipe can freeze in cold weather.",
    };
    for (std::size_t i = 0; i < docs.size(); ++i) {
        ASSERT_TRUE(pipeline_->addText("doc" + std::to_string(i), docs[i]));
    }

    auto r = retrieval_->retrieve(docs[3], RetrievalOptions{5, std::nullopt});
    ASSERT_TRUE(r);
    ASSERT_EQ(r.value().size(), 5u);
    for (std::size_t i = 1; i < r.value().size(); ++i) {
        EXPECT_GE(r.value()[i - 1].similarity, r.value()[i].similarity);
    }
    EXPECT_EQ(r.value()[0].chunk.text, docs[3]);
    EXPECT_NEAR(r.value()[0].similarity, 1.0f, 1e-5);
}

TEST_F(RetrievalOrchestratorTest, FewerChunksThanK) {
    ASSERT_TRUE(pipeline_->addText("only", "single chunk"));
    auto r = retrieval_->retrieve("query", RetrievalOptions{5, std::nullopt});
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value().size(), 1u);
}

TEST_F(RetrievalOrchestratorTest, ZeroKReturnsNothing) {
    ASSERT_TRUE(pipeline_->addText("only", "single chunk"));
    auto r = retrieval_->retrieve("single chunk", RetrievalOptions{0, std::nullopt});
    ASSERT_TRUE(r);
    EXPECT_TRUE(r.value().empty());
}

TEST_F(RetrievalOrchestratorTest, SourceFilterLimitsResults) {
    auto a = pipeline_->addText("a", "alpha text");
    auto b = pipeline_->addText("b", "beta text");
    ASSERT_TRUE(a);
    ASSERT_TRUE(b);
    auto r = retrieval_->retrieve("alpha text",
                                  RetrievalOptions{5, std::set<std::string>{b.value().id}});
    ASSERT_TRUE(r);
    ASSERT_EQ(r.value().size(), 1u);
    EXPECT_EQ(r.value()[0].chunk.sourceId, b.value().id);
}

TEST_F(RetrievalOrchestratorTest, StaleIndexYieldsNoContext) {
    ASSERT_TRUE(pipeline_->addText("a", "alpha text"));
    auto other = std::make_shared<EmbeddingProvider>(
        std::shared_ptr<IEmbeddingBackend>(makeHashEmbeddingBackend(384)), nullptr, "model-b",
        384);
    retrieval_->setEmbeddingProvider(other);
    auto r = retrieval_->retrieve("alpha text");
    ASSERT_TRUE(r);
    EXPECT_TRUE(r.value().empty());
}

TEST(RetrievalContextTest, BuildsNumberedSourceBlocks) {
    std::vector<SearchHit> hits(2);
    hits[0].chunk.sourceId = "s1";
    hits[0].chunk.text = "  first passage\n";
    hits[0].similarity = 0.875f;
    hits[1].chunk.sourceId = "s2";
    hits[1].chunk.text = "second";
    hits[1].similarity = 0.5f;

    const auto context =
        RetrievalOrchestrator::buildContext(hits, {{"s1", "notes.txt"}});
    EXPECT_EQ(context,
              "\n --- Source 1: notes.txt (Relevance: 87.5%) --- \n first passage \n --- End of "
              "Source 1 --- \n --- Source 2: s2 (Relevance: 50.0%) --- \n second \n --- End of "
              "Source 2 ---");
    EXPECT_TRUE(RetrievalOrchestrator::buildContext({}, {}).empty());
}

TEST(RetrievalContextTest, WrapsMessage) {
    EXPECT_EQ(RetrievalOrchestrator::wrapMessageWithContext("hi", "CTX"),
              "<context>CTX</context>\nhi");
    EXPECT_EQ(RetrievalOrchestrator::wrapMessageWithContext("hi", ""), "hi");
}
