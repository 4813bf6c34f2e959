#include "codec.hpp"
#include "test_helpers.hpp"
#include "verification_service.hpp"

#include <gtest/gtest.h>
#include <limits>

using namespace faceverify;
using test::FakeEmbedder;
using test::makeDetection;

namespace {
class VerificationServiceTest : public ::testing::Test {
protected:
  FakeEmbedder embedder;
  VerificationService service{embedder};
  std::string image = test::pngPayload();
};
} // namespace

// ============================================================================
// EMBED
// ============================================================================

TEST_F(VerificationServiceTest, EmbedReturnsNormalizedTemplate) {
  embedder.detections = {makeDetection(0, 0, 10, 10, {3.0f, 4.0f})};

  EmbedResult r = service.embed(image);
  ASSERT_TRUE(r.success) << r.reason;
  EXPECT_EQ(r.error, ErrorKind::NONE);
  EXPECT_EQ(r.model_id, "test/fake");

  Embedding emb = decodeEmbedding(r.embedding_b64);
  ASSERT_EQ(emb.size(), 2u);
  EXPECT_NEAR(emb[0], 0.6f, 1e-6);
  EXPECT_NEAR(emb[1], 0.8f, 1e-6);
}

TEST_F(VerificationServiceTest, EmbedUsesLargestFace) {
  embedder.detections = {makeDetection(0, 0, 10, 10, test::axis(4, 0)),
                         makeDetection(0, 0, 20, 20, test::axis(4, 1)),
                         makeDetection(0, 0, 15, 15, test::axis(4, 2))};

  EmbedResult r = service.embed(image);
  ASSERT_TRUE(r.success) << r.reason;
  EXPECT_EQ(r.embedding_b64, encodeEmbedding(test::axis(4, 1)));
}

TEST_F(VerificationServiceTest, EmbedNoFace) {
  EmbedResult r = service.embed(image);
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error, ErrorKind::NO_FACE);
  EXPECT_TRUE(r.embedding_b64.empty());
  EXPECT_EQ(embedder.calls, 1);
}

TEST_F(VerificationServiceTest, EmbedEmptyEmbedding) {
  embedder.detections = {makeDetection(0, 0, 10, 10)};
  EmbedResult r = service.embed(image);
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error, ErrorKind::EMPTY_EMBEDDING);
}

TEST_F(VerificationServiceTest, EmbedDecodeErrorSkipsModel) {
  EmbedResult r = service.embed("data:image/png;base64,");
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error, ErrorKind::DECODE);
  EXPECT_EQ(embedder.calls, 0);
}

TEST_F(VerificationServiceTest, EmbedModelFailure) {
  embedder.fail = true;
  EmbedResult r = service.embed(image);
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error, ErrorKind::MODEL);
}

// ============================================================================
// VERIFY
// ============================================================================

TEST_F(VerificationServiceTest, OwnTemplateMatches) {
  embedder.detections = {
      makeDetection(0, 0, 10, 10, test::randomEmbedding(512, 21))};

  EmbedResult enrolled = service.embed(image);
  ASSERT_TRUE(enrolled.success) << enrolled.reason;

  for (double thr : {1e-5, 0.45, 2.0}) {
    VerifyResult r = service.verify(image, {enrolled.embedding_b64}, thr);
    ASSERT_TRUE(r.success) << r.reason;
    EXPECT_NEAR(r.outcome.best_distance, 0.0, 1e-6);
    EXPECT_TRUE(r.outcome.match) << "threshold " << thr;
    EXPECT_DOUBLE_EQ(r.outcome.threshold_used, thr);
  }
}

TEST_F(VerificationServiceTest, LowSimilarityDoesNotMatch) {
  embedder.detections = {makeDetection(0, 0, 10, 10, test::axis(16, 0))};
  std::string tmpl = encodeEmbedding(test::withCosine(16, 0.3f));

  VerifyResult r = service.verify(image, {tmpl}, 0.45);
  ASSERT_TRUE(r.success) << r.reason;
  EXPECT_NEAR(r.outcome.best_distance, 0.7, 1e-6);
  EXPECT_FALSE(r.outcome.match);
  EXPECT_EQ(r.model_id, "test/fake");
}

TEST_F(VerificationServiceTest, DefaultThresholdApplied) {
  embedder.detections = {makeDetection(0, 0, 10, 10, test::axis(16, 0))};
  // distance 0.4, under the 0.45 default
  std::string tmpl = encodeEmbedding(test::withCosine(16, 0.6f));

  VerifyResult r = service.verify(image, {tmpl});
  ASSERT_TRUE(r.success) << r.reason;
  EXPECT_DOUBLE_EQ(r.outcome.threshold_used, DEFAULT_THRESHOLD);
  EXPECT_TRUE(r.outcome.match);
}

TEST_F(VerificationServiceTest, ConfiguredDefaultThreshold) {
  VerificationService strict(embedder, 0.1);
  embedder.detections = {makeDetection(0, 0, 10, 10, test::axis(16, 0))};
  std::string tmpl = encodeEmbedding(test::withCosine(16, 0.6f));

  VerifyResult r = strict.verify(image, {tmpl});
  ASSERT_TRUE(r.success) << r.reason;
  EXPECT_DOUBLE_EQ(r.outcome.threshold_used, 0.1);
  EXPECT_FALSE(r.outcome.match);
}

TEST_F(VerificationServiceTest, BestOfSeveralTemplates) {
  embedder.detections = {makeDetection(0, 0, 10, 10, test::axis(16, 0))};
  std::vector<std::string> templates = {
      encodeEmbedding(test::withCosine(16, 0.2f)),
      encodeEmbedding(test::withCosine(16, 0.8f)),
      encodeEmbedding(test::withCosine(16, 0.5f))};

  VerifyResult r = service.verify(image, templates);
  ASSERT_TRUE(r.success) << r.reason;
  EXPECT_EQ(r.outcome.best_index, 1u);
  EXPECT_NEAR(r.outcome.best_distance, 0.2, 1e-6);
  EXPECT_TRUE(r.outcome.match);
}

TEST_F(VerificationServiceTest, NoTemplatesCheckedBeforeDetection) {
  embedder.detections = {makeDetection(0, 0, 10, 10, test::axis(16, 0))};

  VerifyResult r = service.verify(image, {});
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error, ErrorKind::NO_TEMPLATES);
  EXPECT_EQ(embedder.calls, 0);

  // Even an undecodable image reports the missing templates
  r = service.verify("", {});
  EXPECT_EQ(r.error, ErrorKind::NO_TEMPLATES);
}

TEST_F(VerificationServiceTest, OddLengthTemplateIsCodecError) {
  embedder.detections = {makeDetection(0, 0, 10, 10, test::axis(16, 0))};
  std::string odd = base64Encode({1, 2, 3, 4, 5, 6, 7});

  VerifyResult r = service.verify(image, {odd});
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error, ErrorKind::CODEC);
  EXPECT_NE(r.reason.find("template 0"), std::string::npos);
}

TEST_F(VerificationServiceTest, DimensionMismatchIsCodecError) {
  embedder.detections = {makeDetection(0, 0, 10, 10, test::axis(16, 0))};
  std::vector<std::string> templates = {encodeEmbedding(test::axis(16, 0)),
                                        encodeEmbedding(test::axis(8, 0))};

  VerifyResult r = service.verify(image, templates);
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error, ErrorKind::CODEC);
  EXPECT_NE(r.reason.find("template 1"), std::string::npos);
}

TEST_F(VerificationServiceTest, NonFiniteTemplateIsCodecError) {
  embedder.detections = {makeDetection(0, 0, 10, 10, test::axis(4, 0))};
  std::vector<std::string> templates = {
      encodeEmbedding({std::numeric_limits<float>::quiet_NaN(), 0, 0, 0}),
      encodeEmbedding(test::axis(4, 0))};

  VerifyResult r = service.verify(image, templates);
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error, ErrorKind::CODEC);
  EXPECT_NE(r.reason.find("template 0"), std::string::npos);
}

TEST_F(VerificationServiceTest, VerifyPrefixedEmptyImageIsDecodeError) {
  VerifyResult r = service.verify("data:image/png;base64,",
                                  {encodeEmbedding(test::axis(4, 0))});
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error, ErrorKind::DECODE);
}

TEST_F(VerificationServiceTest, VerifyNoFace) {
  VerifyResult r = service.verify(image, {encodeEmbedding(test::axis(4, 0))});
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error, ErrorKind::NO_FACE);
}

TEST_F(VerificationServiceTest, FailureDoesNotAffectNextRequest) {
  embedder.fail = true;
  EXPECT_EQ(service.embed(image).error, ErrorKind::MODEL);

  embedder.fail = false;
  embedder.detections = {makeDetection(0, 0, 10, 10, test::axis(4, 0))};
  EXPECT_TRUE(service.embed(image).success);
}
