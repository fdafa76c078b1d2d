#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <atomic>
#include "../core/test_base.hpp"
#include "../data/test_db_utils.hpp"
#include "pipeline_test_utils.hpp"
#include "signal_ngin/data/market_data_bus.hpp"
#include "signal_ngin/pipeline/signal_sink.hpp"

using namespace signal_ngin;
using namespace signal_ngin::testing;

namespace {

class MockSignalSink : public SignalSink {
public:
    MOCK_METHOD(Result<void>, emit, (const AggregatedSignal& signal), (override));
};

}  // namespace

class SignalSinkTest : public TestBase {
protected:
    AggregatedSignal make_signal() const {
        AggregatedSignal signal;
        signal.instrument = "HOSE:VNM";
        signal.type = SignalType::SELL;
        signal.confidence = 0.75;
        signal.bull_score = 1.0;
        signal.bear_score = 3.0;
        signal.total_weight = 4.0;
        signal.policy_id = 2;
        signal.timestamp = core::from_epoch_seconds(1717200000);
        return signal;
    }
};

TEST_F(SignalSinkTest, CompositeForwardsToAllChildren) {
    auto first = std::make_shared<RecordingSignalSink>();
    auto second = std::make_shared<RecordingSignalSink>();
    CompositeSignalSink composite({first, second});
    EXPECT_EQ(composite.size(), 2u);

    ASSERT_TRUE(composite.emit(make_signal()).is_ok());
    EXPECT_EQ(first->signals.size(), 1u);
    EXPECT_EQ(second->signals.size(), 1u);
}

TEST_F(SignalSinkTest, CompositeCallsChildrenInOrder) {
    auto first = std::make_shared<MockSignalSink>();
    auto second = std::make_shared<MockSignalSink>();
    {
        ::testing::InSequence sequence;
        EXPECT_CALL(*first, emit(::testing::Field(&AggregatedSignal::instrument, "HOSE:VNM")))
            .WillOnce([](const AggregatedSignal&) { return Result<void>(); });
        EXPECT_CALL(*second, emit(::testing::_))
            .WillOnce([](const AggregatedSignal&) { return Result<void>(); });
    }

    CompositeSignalSink composite({first, second});
    EXPECT_TRUE(composite.emit(make_signal()).is_ok());
}

TEST_F(SignalSinkTest, CompositeTriesEveryChildAndReportsFailure) {
    auto failing = std::make_shared<RecordingSignalSink>();
    failing->fail = true;
    auto healthy = std::make_shared<RecordingSignalSink>();

    CompositeSignalSink composite;
    composite.add_sink(failing);
    composite.add_sink(healthy);

    auto result = composite.emit(make_signal());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::EMISSION_ERROR);
    EXPECT_NE(std::string(result.error()->what()).find("sink 0"), std::string::npos);
    EXPECT_EQ(healthy->signals.size(), 1u);

    EXPECT_THROW(composite.add_sink(nullptr), std::invalid_argument);
}

TEST_F(SignalSinkTest, BusSinkPublishesSignalEvent) {
    auto& bus = MarketDataBus::instance();
    bus.set_publish_enabled(true);

    std::atomic<int> received{0};
    std::string seen_type;
    double seen_confidence = 0.0;

    SubscriberInfo info;
    info.id = "signal_sink_test_subscriber";
    info.event_types = {MarketDataEventType::SIGNAL};
    info.callback = [&](const MarketDataEvent& event) {
        ++received;
        seen_type = event.string_fields.at("signal");
        seen_confidence = event.numeric_fields.at("confidence");
    };
    ASSERT_TRUE(bus.subscribe(info).is_ok());

    BusSignalSink sink;
    ASSERT_TRUE(sink.emit(make_signal()).is_ok());

    EXPECT_EQ(received.load(), 1);
    EXPECT_EQ(seen_type, "SELL");
    EXPECT_DOUBLE_EQ(seen_confidence, 0.75);

    ASSERT_TRUE(bus.unsubscribe(info.id).is_ok());
}

TEST_F(SignalSinkTest, PostgresSinkStoresRow) {
    auto db = std::make_shared<MockDatabase>();
    ASSERT_TRUE(db->connect().is_ok());

    PostgresSignalSink sink(db, "signals.test_signals");
    ASSERT_TRUE(sink.emit(make_signal()).is_ok());

    auto stored = db->signals();
    ASSERT_EQ(stored.size(), 1u);
    EXPECT_EQ(stored[0].instrument, "HOSE:VNM");
    EXPECT_EQ(stored[0].signal_type, "SELL");
    EXPECT_EQ(stored[0].policy_id, 2);
    EXPECT_EQ(stored[0].table_name, "signals.test_signals");
    EXPECT_EQ(stored[0].details["bear_score"], 3.0);
}

TEST_F(SignalSinkTest, PostgresSinkMapsFailureToEmissionError) {
    auto db = std::make_shared<MockDatabase>();
    PostgresSignalSink sink(db);

    auto result = sink.emit(make_signal());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::EMISSION_ERROR);

    EXPECT_THROW(PostgresSignalSink(nullptr), std::invalid_argument);
}
