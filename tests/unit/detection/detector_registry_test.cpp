/// @file detector_registry_test.cpp
/// @brief Tests for concurrent, failure-isolated signal execution

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "common/metrics.h"
#include "detection/detector_registry.h"

namespace ipishield::detection {
namespace {

using ::testing::_;
using ::testing::HasSubstr;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;

class MockSignal : public Signal {
public:
    MOCK_METHOD(std::string, Name, (), (const, override));
    MOCK_METHOD(absl::StatusOr<SignalResult>, Analyze, (const SignalInput& input), (const, override));
    MOCK_METHOD(Availability, GetAvailability, (), (const, override));
    MOCK_METHOD(bool, IsOptional, (), (const, override));
    MOCK_METHOD(std::chrono::milliseconds, CallTimeout, (), (const, override));
    MOCK_METHOD(absl::Status, Warmup, (), (override));
};

SignalResult Scored(const std::string& name, double score) {
    SignalResult result;
    result.signal_name = name;
    result.available = true;
    result.score = score;
    return result;
}

std::shared_ptr<NiceMock<MockSignal>> MakeSignal(const std::string& name, double score,
                                                 bool optional = false,
                                                 std::chrono::milliseconds timeout = {}) {
    auto signal = std::make_shared<NiceMock<MockSignal>>();
    ON_CALL(*signal, Name()).WillByDefault(Return(name));
    ON_CALL(*signal, GetAvailability()).WillByDefault(Return(Availability::kAvailable));
    ON_CALL(*signal, IsOptional()).WillByDefault(Return(optional));
    ON_CALL(*signal, CallTimeout()).WillByDefault(Return(timeout));
    ON_CALL(*signal, Warmup()).WillByDefault(Return(absl::OkStatus()));
    ON_CALL(*signal, Analyze(_)).WillByDefault(Return(Scored(name, score)));
    return signal;
}

std::shared_ptr<const SignalInput> Input(std::string content) {
    AnalysisRequest request;
    request.content = std::move(content);
    return SignalInput::Create(request);
}

class DetectorRegistryTest : public ::testing::Test {
protected:
    DetectorRegistry registry_{DetectorRegistryConfig{2}};
};

TEST_F(DetectorRegistryTest, ResultsFollowRegistrationOrder) {
    ASSERT_TRUE(registry_.Register(MakeSignal("pattern", 80.0)).ok());
    ASSERT_TRUE(registry_.Register(MakeSignal("anomaly", 20.0)).ok());

    auto results = registry_.RunAll(Input("some content"));
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].signal_name, "pattern");
    EXPECT_DOUBLE_EQ(results[0].score, 80.0);
    EXPECT_EQ(results[1].signal_name, "anomaly");
    EXPECT_DOUBLE_EQ(results[1].score, 20.0);
    EXPECT_EQ(registry_.SignalNames(), (std::vector<std::string>{"pattern", "anomaly"}));
    EXPECT_EQ(registry_.Workers(), 2u);
}

TEST_F(DetectorRegistryTest, RejectsNullAndDuplicateSignals) {
    EXPECT_EQ(registry_.Register(nullptr).code(), absl::StatusCode::kFailedPrecondition);

    ASSERT_TRUE(registry_.Register(MakeSignal("pattern", 0.0)).ok());
    auto duplicate = registry_.Register(MakeSignal("pattern", 0.0));
    EXPECT_EQ(duplicate.code(), absl::StatusCode::kFailedPrecondition);
    EXPECT_THAT(std::string(duplicate.message()), HasSubstr("already registered"));
}

TEST_F(DetectorRegistryTest, ExceptionIsIsolated) {
    auto throwing = MakeSignal("classifier", 0.0, true, std::chrono::milliseconds(1000));
    ON_CALL(*throwing, Analyze(_)).WillByDefault(
        Invoke([](const SignalInput&) -> absl::StatusOr<SignalResult> {
            throw std::runtime_error("model exploded");
        }));
    ASSERT_TRUE(registry_.Register(MakeSignal("pattern", 70.0)).ok());
    ASSERT_TRUE(registry_.Register(throwing).ok());

    auto results = registry_.RunAll(Input("content"));
    ASSERT_EQ(results.size(), 2u);
    EXPECT_DOUBLE_EQ(results[0].score, 70.0);

    EXPECT_TRUE(results[1].available);
    EXPECT_DOUBLE_EQ(results[1].score, 0.0);
    ASSERT_TRUE(results[1].error.has_value());
    EXPECT_THAT(*results[1].error, HasSubstr("model exploded"));
}

TEST_F(DetectorRegistryTest, ErrorStatusDegradesToZero) {
    auto failing = MakeSignal("embedding", 0.0, true, std::chrono::milliseconds(1000));
    ON_CALL(*failing, Analyze(_))
        .WillByDefault(Return(absl::StatusOr<SignalResult>(absl::InternalError("index corrupt"))));
    ASSERT_TRUE(registry_.Register(failing).ok());

    auto& errors = MetricsRegistry::Instance().GetCounter(
        LabeledName(metric_names::kSignalErrorsTotal, "signal", "embedding"));
    const int64_t before = errors.Value();

    auto results = registry_.RunAll(Input("content"));
    ASSERT_EQ(results.size(), 1u);
    EXPECT_TRUE(results[0].available);
    EXPECT_DOUBLE_EQ(results[0].score, 0.0);
    ASSERT_TRUE(results[0].error.has_value());
    EXPECT_THAT(*results[0].error, HasSubstr("index corrupt"));
    EXPECT_EQ(errors.Value(), before + 1);
}

TEST_F(DetectorRegistryTest, OptionalSignalTimesOut) {
    auto slow = MakeSignal("classifier", 95.0, true, std::chrono::milliseconds(20));
    ON_CALL(*slow, Analyze(_)).WillByDefault(
        Invoke([](const SignalInput&) -> absl::StatusOr<SignalResult> {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            return Scored("classifier", 95.0);
        }));
    ASSERT_TRUE(registry_.Register(MakeSignal("pattern", 10.0)).ok());
    ASSERT_TRUE(registry_.Register(slow).ok());

    auto& timeouts = MetricsRegistry::Instance().GetCounter(
        LabeledName(metric_names::kSignalTimeoutsTotal, "signal", "classifier"));
    const int64_t before = timeouts.Value();

    const auto start = std::chrono::steady_clock::now();
    auto results = registry_.RunAll(Input("content"));
    const auto waited = std::chrono::steady_clock::now() - start;

    EXPECT_LT(waited, std::chrono::milliseconds(150));
    ASSERT_EQ(results.size(), 2u);
    EXPECT_DOUBLE_EQ(results[0].score, 10.0);
    EXPECT_TRUE(results[1].available);
    EXPECT_DOUBLE_EQ(results[1].score, 0.0);
    ASSERT_TRUE(results[1].error.has_value());
    EXPECT_THAT(*results[1].error, HasSubstr("timed out"));
    EXPECT_EQ(timeouts.Value(), before + 1);
}

TEST_F(DetectorRegistryTest, CoreSignalsAreAwaited) {
    auto slow_core = MakeSignal("pattern", 55.0);
    ON_CALL(*slow_core, Analyze(_)).WillByDefault(
        Invoke([](const SignalInput&) -> absl::StatusOr<SignalResult> {
            std::this_thread::sleep_for(std::chrono::milliseconds(60));
            return Scored("pattern", 55.0);
        }));
    ASSERT_TRUE(registry_.Register(slow_core).ok());

    auto results = registry_.RunAll(Input("content"));
    ASSERT_EQ(results.size(), 1u);
    EXPECT_DOUBLE_EQ(results[0].score, 55.0);
    EXPECT_FALSE(results[0].error.has_value());
}

TEST(DetectorRegistryStuckSignalTest, StuckOptionalSignalDoesNotStallCoreSignals) {
    std::atomic<int> calls{0};
    {
        DetectorRegistry registry{DetectorRegistryConfig{2, 3}};
        auto stuck = MakeSignal("classifier", 95.0, true, std::chrono::milliseconds(20));
        ON_CALL(*stuck, Analyze(_)).WillByDefault(
            Invoke([&calls](const SignalInput&) -> absl::StatusOr<SignalResult> {
                calls.fetch_add(1);
                std::this_thread::sleep_for(std::chrono::milliseconds(400));
                return Scored("classifier", 95.0);
            }));
        ASSERT_TRUE(registry.Register(MakeSignal("pattern", 40.0)).ok());
        ASSERT_TRUE(registry.Register(stuck).ok());
        EXPECT_EQ(registry.OptionalWorkers(), 2u);

        // More requests than optional workers, each abandoning a stuck call
        for (int i = 0; i < 6; ++i) {
            const auto start = std::chrono::steady_clock::now();
            auto results = registry.RunAll(Input("content"));
            const auto waited = std::chrono::steady_clock::now() - start;

            EXPECT_LT(waited, std::chrono::milliseconds(150)) << "request " << i;
            ASSERT_EQ(results.size(), 2u);
            EXPECT_DOUBLE_EQ(results[0].score, 40.0);
            EXPECT_DOUBLE_EQ(results[1].score, 0.0);
            ASSERT_TRUE(results[1].error.has_value());
            EXPECT_THAT(*results[1].error,
                        HasSubstr(i < 3 ? "timed out" : "optional workers saturated"));
        }
    }
    // Saturated requests never queued a call
    EXPECT_EQ(calls.load(), 3);
}

TEST_F(DetectorRegistryTest, UnavailableSignalsAreNotDispatched) {
    auto missing = MakeSignal("classifier", 90.0, true, std::chrono::milliseconds(100));
    ON_CALL(*missing, GetAvailability()).WillByDefault(Return(Availability::kUnavailable));
    EXPECT_CALL(*missing, Analyze(_)).Times(0);

    ASSERT_TRUE(registry_.Register(MakeSignal("pattern", 30.0)).ok());
    ASSERT_TRUE(registry_.Register(missing).ok());

    auto results = registry_.RunAll(Input("content"));
    ASSERT_EQ(results.size(), 2u);
    EXPECT_FALSE(results[1].available);
    EXPECT_DOUBLE_EQ(results[1].score, 0.0);

    EXPECT_EQ(registry_.AvailableSignals(), (std::set<std::string>{"pattern"}));
    auto health = registry_.Health();
    EXPECT_EQ(health["pattern"], Availability::kAvailable);
    EXPECT_EQ(health["classifier"], Availability::kUnavailable);
}

TEST_F(DetectorRegistryTest, SkippedSignalsCountAsUnavailable) {
    auto anomaly = MakeSignal("anomaly", 40.0);
    EXPECT_CALL(*anomaly, Analyze(_)).Times(0);
    ASSERT_TRUE(registry_.Register(MakeSignal("pattern", 30.0)).ok());
    ASSERT_TRUE(registry_.Register(anomaly).ok());

    AnalysisOptions options;
    options.skip_signals = {"anomaly"};
    auto results = registry_.RunAll(Input("content"), options);
    ASSERT_EQ(results.size(), 2u);
    EXPECT_TRUE(results[0].available);
    EXPECT_FALSE(results[1].available);
}

TEST_F(DetectorRegistryTest, SanitizesSignalOutput) {
    SignalResult noisy = Scored("pattern", 150.0);
    noisy.segments.push_back(FlaggedSegment{"some", 0, 4, "jailbreak", 0.9, "ok"});
    noisy.segments.push_back(FlaggedSegment{"x", 3, 100, "jailbreak", 0.9, "past the end"});
    noisy.segments.push_back(FlaggedSegment{"", 5, 5, "jailbreak", 0.9, "empty"});

    auto signal = MakeSignal("pattern", 0.0);
    ON_CALL(*signal, Analyze(_)).WillByDefault(Return(noisy));
    ASSERT_TRUE(registry_.Register(signal).ok());

    auto results = registry_.RunAll(Input("some content"));
    ASSERT_EQ(results.size(), 1u);
    EXPECT_DOUBLE_EQ(results[0].score, 100.0);
    ASSERT_EQ(results[0].segments.size(), 1u);
    EXPECT_EQ(results[0].segments[0].end, 4u);
}

TEST_F(DetectorRegistryTest, LateUnavailabilityClearsScore) {
    SignalResult late;
    late.available = false;
    late.score = 70.0;
    late.segments.push_back(FlaggedSegment{"c", 0, 1, "embedding:jailbreak", 0.8, "stale"});

    auto signal = MakeSignal("embedding", 0.0, true, std::chrono::milliseconds(500));
    ON_CALL(*signal, Analyze(_)).WillByDefault(Return(late));
    ASSERT_TRUE(registry_.Register(signal).ok());

    auto results = registry_.RunAll(Input("content"));
    ASSERT_EQ(results.size(), 1u);
    EXPECT_FALSE(results[0].available);
    EXPECT_DOUBLE_EQ(results[0].score, 0.0);
    EXPECT_TRUE(results[0].segments.empty());
    EXPECT_EQ(results[0].signal_name, "embedding");
}

TEST_F(DetectorRegistryTest, WarmupToleratesFailures) {
    auto good = MakeSignal("classifier", 0.0, true);
    auto bad = MakeSignal("embedding", 0.0, true);
    EXPECT_CALL(*good, Warmup()).WillOnce(Return(absl::OkStatus()));
    EXPECT_CALL(*bad, Warmup()).WillOnce(Return(absl::UnavailableError("corpus missing")));
    ASSERT_TRUE(registry_.Register(good).ok());
    ASSERT_TRUE(registry_.Register(bad).ok());

    registry_.Warmup();
}

TEST(DetectorRegistryConfigTest, DefaultWorkerCount) {
    DetectorRegistry registry;
    EXPECT_GE(registry.Workers(), 4u);
}

}  // namespace
}  // namespace ipishield::detection
