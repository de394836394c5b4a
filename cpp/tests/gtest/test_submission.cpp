// =============================================================================
// SubmissionService Tests
// =============================================================================

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <cmath>
#include <memory>

#include "fedrelay/codec.hpp"
#include "fedrelay/error.hpp"
#include "fedrelay/submission.hpp"

using namespace fedrelay;
using ::testing::_;
using ::testing::DoAll;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::SaveArg;

namespace {

class MockModelStore : public store::ModelStore {
public:
    MOCK_METHOD(store::FetchResult, get, (const std::string&), (override));
    MOCK_METHOD(store::PutResult, put,
        (const std::string&, const Bytes&, const store::Headers&), (override));
    MOCK_METHOD(std::string, describe, (), (const, override));
};

// Always returns the midpoint, which Box-Muller maps to a fixed sample.
class MidpointSource : public UniformSource {
public:
    double uniform_open() override { ++draws; return 0.5; }
    int draws = 0;
};

} // namespace

class SubmissionServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<NiceMock<MockModelStore>>();
        ON_CALL(*store_, get(_)).WillByDefault(Return(store::FetchResult::not_found()));
        coordinator_ = std::make_shared<PersistenceCoordinator>(store_);
        calibrator_ = std::make_shared<NoiseCalibrator>(source_);
        service_ = std::make_unique<SubmissionService>(coordinator_, calibrator_);
    }

    MidpointSource source_;
    std::shared_ptr<NiceMock<MockModelStore>> store_;
    std::shared_ptr<PersistenceCoordinator> coordinator_;
    std::shared_ptr<NoiseCalibrator> calibrator_;
    std::unique_ptr<SubmissionService> service_;
};

TEST_F(SubmissionServiceTest, SubmitsRawUpdateWithoutPrivacy) {
    Bytes written;
    EXPECT_CALL(*store_, put("digits/globalModel.bin", _, _))
        .WillOnce(DoAll(SaveArg<1>(&written), Return(store::PutResult::success("loc"))));

    const Bytes payload = codec::encode_weights({3.0f, 4.0f});
    SubmitResult result = service_->submit_update("digits", 1, "alice", payload);

    EXPECT_EQ(result.location, "loc");
    EXPECT_EQ(written, payload);
    EXPECT_EQ(source_.draws, 0);
}

TEST_F(SubmissionServiceTest, AppliesPrivacyBeforePersisting) {
    Bytes written;
    store::Headers headers;
    EXPECT_CALL(*store_, put(_, _, _))
        .WillOnce(DoAll(SaveArg<1>(&written), SaveArg<2>(&headers), Return(store::PutResult::success("loc"))));

    PrivacyParameters params;
    params.l2_norm_clip = 1.0;
    service_->submit_update("digits", 1, "alice", codec::encode_weights({3.0f, 4.0f}), params);

    // u1 = u2 = 0.5: radius sqrt(2 ln 2), angle pi
    const double sigma = NoiseCalibrator::noise_scale(params.epsilon, params.delta, 1.0);
    const double radius = std::sqrt(-2.0 * std::log(0.5));
    WeightVector out = codec::decode_weights(written);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_NEAR(out[0], 0.6 - radius * sigma, 1e-4);
    EXPECT_NEAR(out[1], 0.8, 1e-4);
    EXPECT_EQ(source_.draws, 2);
    EXPECT_EQ(headers["X-Privacy-Applied"], "true");
}

TEST_F(SubmissionServiceTest, ValidatesRequest) {
    EXPECT_CALL(*store_, put(_, _, _)).Times(0);
    const Bytes payload = codec::encode_weights({1.0f});

    EXPECT_THROW(service_->submit_update("", 1, "alice", payload), InvalidParameterError);
    EXPECT_THROW(service_->submit_update("digits", 0, "alice", payload), InvalidParameterError);
    EXPECT_THROW(service_->submit_update("digits", 1, "", payload), InvalidParameterError);
    EXPECT_THROW(service_->submit_update("digits", 1, "alice", Bytes{0x01}), WireFormatError);

    PrivacyParameters bad;
    bad.epsilon = -1.0;
    EXPECT_THROW(service_->submit_update("digits", 1, "alice", payload, bad), InvalidParameterError);
}

TEST_F(SubmissionServiceTest, SurfacesStorageWriteFailure) {
    CoordinatorOptions opts;
    opts.retry = RetryPolicy::linear_backoff(2, Millis(0));
    opts.sleeper = [](Millis, const CancellationToken*) { return true; };
    auto coordinator = std::make_shared<PersistenceCoordinator>(store_, opts);
    SubmissionService service(coordinator, calibrator_);

    EXPECT_CALL(*store_, put(_, _, _))
        .Times(2)
        .WillRepeatedly(Return(store::PutResult::failure(507, "Insufficient Storage")));

    EXPECT_THROW(service.submit_update("digits", 2, "alice", codec::encode_weights({1.0f})), StorageWriteError);
}
