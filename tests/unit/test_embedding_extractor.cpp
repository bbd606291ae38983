#include <gtest/gtest.h>
#include "models/embedding_extractor.hpp"
#include "utils/error_handler.hpp"
#include <atomic>
#include <thread>
#include <vector>

using namespace voiceguard::models;
using voiceguard::identity::EmbeddingVector;
using voiceguard::utils::ModelLoadingException;

namespace {

class CountingExtractor : public EmbeddingExtractor {
public:
    explicit CountingExtractor(std::atomic<int>& calls) : calls_(calls) {}

    EmbeddingVector extract(const std::string& wavPath) override {
        ++calls_;
        return EmbeddingVector(std::vector<float>(3, static_cast<float>(wavPath.size())));
    }

    std::string getModelInfo() const override { return "counting extractor"; }

private:
    std::atomic<int>& calls_;
};

} // namespace

class LazyEmbeddingExtractorTest : public ::testing::Test {
protected:
    EmbeddingExtractorFactory countingFactory() {
        return [this]() {
            ++constructions;
            return std::make_unique<CountingExtractor>(extractions);
        };
    }

    std::atomic<int> constructions{0};
    std::atomic<int> extractions{0};
};

TEST_F(LazyEmbeddingExtractorTest, NothingIsBuiltUntilFirstUse) {
    LazyEmbeddingExtractor lazy(countingFactory());

    EXPECT_FALSE(lazy.isLoaded());
    EXPECT_EQ(lazy.getModelInfo(), "not loaded");
    EXPECT_EQ(constructions.load(), 0);
}

TEST_F(LazyEmbeddingExtractorTest, BuildsOnceAndDelegates) {
    LazyEmbeddingExtractor lazy(countingFactory());

    EmbeddingVector first = lazy.extract("abcd.wav");
    lazy.extract("abcd.wav");

    EXPECT_TRUE(lazy.isLoaded());
    EXPECT_EQ(constructions.load(), 1);
    EXPECT_EQ(extractions.load(), 2);
    EXPECT_EQ(first.dimension(), 3u);
    EXPECT_FLOAT_EQ(first[0], 8.0f);
    EXPECT_EQ(lazy.getModelInfo(), "counting extractor");
}

TEST_F(LazyEmbeddingExtractorTest, ConcurrentFirstUseBuildsOnce) {
    LazyEmbeddingExtractor lazy(countingFactory());

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&lazy]() { lazy.extract("x.wav"); });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(constructions.load(), 1);
    EXPECT_EQ(extractions.load(), 8);
}

TEST_F(LazyEmbeddingExtractorTest, FailedConstructionIsRetried) {
    int attempts = 0;
    LazyEmbeddingExtractor lazy([this, &attempts]() -> std::unique_ptr<EmbeddingExtractor> {
        if (++attempts == 1) {
            throw ModelLoadingException("Model file not found", "model.onnx");
        }
        return std::make_unique<CountingExtractor>(extractions);
    });

    EXPECT_THROW(lazy.extract("a.wav"), ModelLoadingException);
    EXPECT_FALSE(lazy.isLoaded());

    EXPECT_NO_THROW(lazy.extract("a.wav"));
    EXPECT_TRUE(lazy.isLoaded());
    EXPECT_EQ(attempts, 2);
}

TEST_F(LazyEmbeddingExtractorTest, MissingFactoryOrInstanceFails) {
    LazyEmbeddingExtractor noFactory(nullptr);
    EXPECT_THROW(noFactory.extract("a.wav"), ModelLoadingException);

    LazyEmbeddingExtractor nullInstance([]() { return std::unique_ptr<EmbeddingExtractor>(); });
    EXPECT_THROW(nullInstance.extract("a.wav"), ModelLoadingException);
}
