// include/signal_ngin/pipeline/pipeline_executor.hpp
#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "signal_ngin/core/cancellation.hpp"
#include "signal_ngin/core/config_base.hpp"
#include "signal_ngin/core/error.hpp"
#include "signal_ngin/core/types.hpp"
#include "signal_ngin/data/market_data_source.hpp"
#include "signal_ngin/pipeline/signal_sink.hpp"
#include "signal_ngin/strategy/aggregation_engine.hpp"
#include "signal_ngin/strategy/config_registry.hpp"
#include "signal_ngin/strategy/macd.hpp"

namespace signal_ngin {

/**
 * @brief Stages of one instrument run
 */
enum class PipelineStage { FETCHING, COMPUTING, CLASSIFYING, AGGREGATING, EMITTING, DONE, FAILED };

std::string pipeline_stage_to_string(PipelineStage stage);

/**
 * @brief Configuration for the pipeline executor
 */
struct PipelineConfig : public ConfigBase {
    int backfill_days{365};
    int warmup_bars{0};  // 0 uses macd.lookback_bars()
    MacdParams macd;
    bool emit_hold_signals{false};

    int effective_warmup_bars() const {
        return warmup_bars > 0 ? warmup_bars : macd.lookback_bars();
    }

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["backfill_days"] = backfill_days;
        j["warmup_bars"] = warmup_bars;
        j["macd"] = {{"fast_period", macd.fast_period},
                     {"slow_period", macd.slow_period},
                     {"signal_period", macd.signal_period}};
        j["emit_hold_signals"] = emit_hold_signals;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        read_field(j, "backfill_days", backfill_days);
        read_field(j, "warmup_bars", warmup_bars);
        if (j.contains("macd")) {
            const auto& m = j.at("macd");
            read_field(m, "fast_period", macd.fast_period);
            read_field(m, "slow_period", macd.slow_period);
            read_field(m, "signal_period", macd.signal_period);
        }
        read_field(j, "emit_hold_signals", emit_hold_signals);
    }

    Result<void> validate() const override {
        if (backfill_days <= 0) {
            return invalid("backfill_days must be positive");
        }
        if (warmup_bars < 0) {
            return invalid("warmup_bars must not be negative");
        }
        if (macd.fast_period <= 0 || macd.slow_period <= 0 || macd.signal_period <= 0) {
            return invalid("macd periods must be positive");
        }
        if (macd.fast_period >= macd.slow_period) {
            return invalid("macd.fast_period must be shorter than macd.slow_period");
        }
        return Result<void>();
    }

    std::string section_name() const override {
        return "pipeline";
    }
};

/**
 * @brief Failure of one instrument within a run
 */
struct InstrumentError {
    std::string instrument;
    ErrorCode code{ErrorCode::UNKNOWN_ERROR};
    std::string message;
    PipelineStage stage{PipelineStage::FAILED};
};

/**
 * @brief A timeframe left out of aggregation and the reason
 */
struct ExcludedTimeframe {
    std::string timeframe;
    ErrorCode code{ErrorCode::NONE};
    std::string reason;
};

/**
 * @brief What happened to one instrument
 */
struct InstrumentOutcome {
    std::string instrument;
    PipelineStage stage{PipelineStage::FETCHING};
    std::optional<AggregatedSignal> signal;
    std::vector<ExcludedTimeframe> excluded;
    bool emitted{false};
};

/**
 * @brief Batch summary returned by every run
 * Partial success is always explicit.
 */
struct RunSummary {
    RunMode mode{RunMode::REALTIME};
    size_t processed{0};
    size_t signals_generated{0};  // non-HOLD
    size_t skipped{0};
    size_t emission_failures{0};
    std::vector<InstrumentError> errors;
    std::vector<InstrumentOutcome> outcomes;

    nlohmann::json to_json() const;
};

/**
 * @brief Runs fetch, indicator, classification, aggregation and emission
 *        for instruments in backfill or realtime mode
 *
 * MACD state is cached per instrument and timeframe so realtime runs only
 * fold the newest candle. Failures local to one instrument are recorded in
 * the summary and never stop the rest of the batch.
 */
class PipelineExecutor {
public:
    using Clock = std::function<Timestamp()>;

    /**
     * @throws std::invalid_argument on a null collaborator or invalid MACD periods
     */
    PipelineExecutor(PipelineConfig config, std::shared_ptr<MarketDataSource> market_data,
                     std::shared_ptr<const ConfigRegistry> registry,
                     std::shared_ptr<SignalSink> sink, Clock clock = nullptr);

    ~PipelineExecutor();

    PipelineExecutor(const PipelineExecutor&) = delete;
    PipelineExecutor& operator=(const PipelineExecutor&) = delete;

    /**
     * @brief Run one instrument
     */
    RunSummary run(const Instrument& instrument, RunMode mode);

    /**
     * @brief Run instruments in order, checking the token between them
     * Inactive instruments and those left after cancellation count as skipped.
     */
    RunSummary run_batch(const std::vector<Instrument>& instruments, RunMode mode,
                         const CancellationToken& cancel = CancellationToken());

    std::optional<MacdState> cached_state(const Instrument& instrument,
                                          const Timeframe& timeframe) const;

    void clear_state();

    const PipelineConfig& config() const {
        return config_;
    }

    const std::string& component_id() const {
        return component_id_;
    }

private:
    struct FetchedTimeframe {
        Timeframe timeframe;
        MacdState state;
    };

    InstrumentOutcome run_instrument(const Instrument& instrument, RunMode mode,
                                     RunSummary& summary);

    Result<MacdState> fetch_state(const Instrument& instrument, const Timeframe& timeframe,
                                  RunMode mode);

    Result<MacdState> seed_from_window(const Instrument& instrument, const Timeframe& timeframe,
                                       const TimeWindow& window);

    void store_state(const Instrument& instrument, const Timeframe& timeframe,
                     const MacdState& state);

    void fail(InstrumentOutcome& outcome, RunSummary& summary, PipelineStage stage,
              ErrorCode code, const std::string& message) const;

    void mark_running();
    void publish_metrics(const RunSummary& summary);

    static std::string state_key(const Instrument& instrument, const Timeframe& timeframe) {
        return instrument.key() + "|" + timeframe.label;
    }

    PipelineConfig config_;
    MacdCalculator macd_;
    std::shared_ptr<MarketDataSource> market_data_;
    std::shared_ptr<const ConfigRegistry> registry_;
    std::shared_ptr<SignalSink> sink_;
    Clock clock_;

    std::string component_id_;
    bool registered_{false};

    mutable std::mutex state_mutex_;
    std::map<std::string, MacdState> states_;
};

}  // namespace signal_ngin
