// src/pipeline/pipeline_executor.cpp

#include "signal_ngin/pipeline/pipeline_executor.hpp"
#include <atomic>
#include <stdexcept>
#include "signal_ngin/core/logger.hpp"
#include "signal_ngin/core/state_manager.hpp"
#include "signal_ngin/core/time_utils.hpp"

namespace signal_ngin {

namespace {
std::atomic<uint64_t> executor_counter{0};
}

std::string pipeline_stage_to_string(PipelineStage stage) {
    switch (stage) {
        case PipelineStage::FETCHING:
            return "FETCHING";
        case PipelineStage::COMPUTING:
            return "COMPUTING";
        case PipelineStage::CLASSIFYING:
            return "CLASSIFYING";
        case PipelineStage::AGGREGATING:
            return "AGGREGATING";
        case PipelineStage::EMITTING:
            return "EMITTING";
        case PipelineStage::DONE:
            return "DONE";
        case PipelineStage::FAILED:
            return "FAILED";
    }
    return "UNKNOWN";
}

nlohmann::json RunSummary::to_json() const {
    nlohmann::json j;
    j["mode"] = run_mode_to_string(mode);
    j["processed"] = processed;
    j["signals_generated"] = signals_generated;
    j["skipped"] = skipped;
    j["emission_failures"] = emission_failures;

    nlohmann::json error_array = nlohmann::json::array();
    for (const auto& error : errors) {
        error_array.push_back({{"instrument", error.instrument},
                               {"code", error_code_to_string(error.code)},
                               {"message", error.message},
                               {"stage", pipeline_stage_to_string(error.stage)}});
    }
    j["errors"] = error_array;

    nlohmann::json outcome_array = nlohmann::json::array();
    for (const auto& outcome : outcomes) {
        nlohmann::json o;
        o["instrument"] = outcome.instrument;
        o["stage"] = pipeline_stage_to_string(outcome.stage);
        o["emitted"] = outcome.emitted;
        if (outcome.signal) {
            o["signal"] = signal_type_to_string(outcome.signal->type);
            o["confidence"] = outcome.signal->confidence;
        }
        nlohmann::json excluded = nlohmann::json::array();
        for (const auto& entry : outcome.excluded) {
            excluded.push_back({{"timeframe", entry.timeframe}, {"reason", entry.reason}});
        }
        o["excluded_timeframes"] = excluded;
        outcome_array.push_back(o);
    }
    j["outcomes"] = outcome_array;
    return j;
}

PipelineExecutor::PipelineExecutor(PipelineConfig config,
                                   std::shared_ptr<MarketDataSource> market_data,
                                   std::shared_ptr<const ConfigRegistry> registry,
                                   std::shared_ptr<SignalSink> sink, Clock clock)
    : config_(std::move(config)),
      macd_(config_.macd),
      market_data_(std::move(market_data)),
      registry_(std::move(registry)),
      sink_(std::move(sink)),
      clock_(std::move(clock)) {
    if (!market_data_ || !registry_ || !sink_) {
        throw std::invalid_argument("PipelineExecutor requires market data, registry and sink");
    }
    if (config_.backfill_days <= 0) {
        throw std::invalid_argument("PipelineExecutor: backfill_days must be positive");
    }
    if (!clock_) {
        clock_ = [] { return std::chrono::system_clock::now(); };
    }

    Logger::register_component("PipelineExecutor");

    component_id_ = "PIPELINE_EXECUTOR_" + std::to_string(++executor_counter);
    ComponentInfo info{ComponentType::PIPELINE_EXECUTOR,
                       ComponentState::INITIALIZED,
                       component_id_,
                       "",
                       std::chrono::system_clock::now(),
                       {}};

    auto register_result = StateManager::instance().register_component(info);
    if (register_result.is_error()) {
        ERROR("Failed to register pipeline executor with state manager: "
              << register_result.error()->what() << ". Continuing without state management.");
    } else {
        registered_ = true;
    }
}

PipelineExecutor::~PipelineExecutor() {
    if (registered_) {
        auto result = StateManager::instance().unregister_component(component_id_);
        if (result.is_error()) {
            DEBUG("Pipeline executor unregister: " << result.error()->what());
        }
    }
}

RunSummary PipelineExecutor::run(const Instrument& instrument, RunMode mode) {
    return run_batch({instrument}, mode);
}

RunSummary PipelineExecutor::run_batch(const std::vector<Instrument>& instruments, RunMode mode,
                                       const CancellationToken& cancel) {
    Logger::register_component("PipelineExecutor");
    mark_running();

    RunSummary summary;
    summary.mode = mode;

    INFO("Starting " << run_mode_to_string(mode) << " run over " << instruments.size()
                     << " instruments");

    for (size_t i = 0; i < instruments.size(); ++i) {
        if (cancel.is_cancelled()) {
            summary.skipped += instruments.size() - i;
            WARN("Run cancelled, skipping " << instruments.size() - i << " remaining instruments");
            break;
        }

        const auto& instrument = instruments[i];
        if (!instrument.active) {
            ++summary.skipped;
            DEBUG("Skipping inactive instrument " << instrument.key());
            continue;
        }

        ++summary.processed;
        summary.outcomes.push_back(run_instrument(instrument, mode, summary));
    }

    INFO(run_mode_to_string(mode)
         << " run finished: processed=" << summary.processed
         << " signals=" << summary.signals_generated << " skipped=" << summary.skipped
         << " errors=" << summary.errors.size()
         << " emission_failures=" << summary.emission_failures);

    publish_metrics(summary);
    return summary;
}

InstrumentOutcome PipelineExecutor::run_instrument(const Instrument& instrument, RunMode mode,
                                                   RunSummary& summary) {
    InstrumentOutcome outcome;
    outcome.instrument = instrument.key();
    ScopedLogContext context("instrument=" + instrument.key());

    // FETCHING
    outcome.stage = PipelineStage::FETCHING;
    std::vector<FetchedTimeframe> fetched;
    for (const auto& timeframe : registry_->timeframes()) {
        auto state = fetch_state(instrument, timeframe, mode);
        if (state.is_error()) {
            WARN("No data for " << instrument.key() << " " << timeframe.label << ": "
                                << state.error()->what());
            outcome.excluded.push_back(
                {timeframe.label, state.error()->code(), state.error()->what()});
            continue;
        }
        fetched.push_back({timeframe, state.take_value()});
    }

    if (fetched.empty()) {
        fail(outcome, summary, PipelineStage::FETCHING, ErrorCode::DATA_UNAVAILABLE,
             "No timeframe produced data");
        return outcome;
    }

    // COMPUTING
    outcome.stage = PipelineStage::COMPUTING;
    struct Computed {
        Timeframe timeframe;
        double fast;
        double signal;
        Timestamp candle_time;
    };
    std::vector<Computed> computed;
    for (const auto& entry : fetched) {
        if (!entry.state.initialized()) {
            outcome.excluded.push_back(
                {entry.timeframe.label, ErrorCode::DATA_UNAVAILABLE, "indicator not seeded"});
            continue;
        }
        computed.push_back({entry.timeframe, entry.state.macd(), entry.state.signal(),
                            entry.state.last_candle_time});
    }

    // CLASSIFYING
    outcome.stage = PipelineStage::CLASSIFYING;
    auto policy = registry_->policy_for(instrument);
    if (policy.is_error()) {
        fail(outcome, summary, PipelineStage::CLASSIFYING, policy.error()->code(),
             policy.error()->what());
        return outcome;
    }
    const ZoneLines lines = policy.value()->zone_lines();

    std::map<Timeframe, IndicatorResult> results;
    Timestamp latest_candle{};
    for (const auto& entry : computed) {
        auto thresholds = registry_->resolve_thresholds(instrument, entry.timeframe);
        if (!thresholds) {
            DEBUG("No thresholds for " << instrument.key() << " " << entry.timeframe.label
                                       << ", excluding timeframe");
            outcome.excluded.push_back(
                {entry.timeframe.label, ErrorCode::CONFIGURATION_ERROR, "no thresholds"});
            continue;
        }
        results[entry.timeframe] = IndicatorResult::classify(entry.timeframe, entry.fast,
                                                             entry.signal, *thresholds,
                                                             entry.candle_time, lines);
        if (entry.candle_time > latest_candle) {
            latest_candle = entry.candle_time;
        }
    }

    // AGGREGATING
    outcome.stage = PipelineStage::AGGREGATING;
    AggregatedSignal signal = AggregationEngine::aggregate(results, *policy.value());
    signal.instrument = instrument.key();
    signal.timestamp = results.empty() ? clock_() : latest_candle;

    DEBUG(instrument.key() << " -> " << signal_type_to_string(signal.type)
                           << " confidence=" << signal.confidence << " bull="
                           << signal.bull_score << " bear=" << signal.bear_score
                           << (signal.gated_by.empty() ? ""
                                                       : " (held by " + signal.gated_by + ")"));

    if (signal.type != SignalType::HOLD) {
        ++summary.signals_generated;
    }

    // EMITTING
    outcome.stage = PipelineStage::EMITTING;
    if (signal.type != SignalType::HOLD || config_.emit_hold_signals) {
        auto emitted = sink_->emit(signal);
        if (emitted.is_error()) {
            ++summary.emission_failures;
            ERROR("Failed to emit signal for " << instrument.key() << ": "
                                               << emitted.error()->what());
        } else {
            outcome.emitted = true;
        }
    }

    outcome.signal = std::move(signal);
    outcome.stage = PipelineStage::DONE;
    return outcome;
}

Result<MacdState> PipelineExecutor::fetch_state(const Instrument& instrument,
                                                const Timeframe& timeframe, RunMode mode) {
    const Timestamp now = clock_();

    switch (mode) {
        case RunMode::BACKFILL: {
            TimeWindow window{now - std::chrono::hours(24) * config_.backfill_days, now};
            return seed_from_window(instrument, timeframe, window);
        }
        case RunMode::REALTIME: {
            auto cached = cached_state(instrument, timeframe);
            if (!cached) {
                TimeWindow window{
                    now - std::chrono::seconds(timeframe.seconds) * config_.effective_warmup_bars(),
                    now};
                INFO("Cold start for " << instrument.key() << " " << timeframe.label
                                       << ", warming up with " << config_.effective_warmup_bars()
                                       << " bars");
                return seed_from_window(instrument, timeframe, window);
            }

            auto latest = market_data_->latest_candle(instrument, timeframe);
            if (latest.is_error()) {
                return make_error<MacdState>(ErrorCode::DATA_UNAVAILABLE,
                                             latest.error()->what(), "PipelineExecutor");
            }
            if (!latest.value()) {
                return make_error<MacdState>(ErrorCode::DATA_UNAVAILABLE,
                                             "No latest candle for " + instrument.key() + " " +
                                                 timeframe.label,
                                             "PipelineExecutor");
            }

            MacdState state = *cached;
            if (macd_.update(state, *latest.value())) {
                store_state(instrument, timeframe, state);
            }
            return Result<MacdState>(state);
        }
    }

    return make_error<MacdState>(ErrorCode::INVALID_ARGUMENT, "Unknown run mode",
                                 "PipelineExecutor");
}

Result<MacdState> PipelineExecutor::seed_from_window(const Instrument& instrument,
                                                     const Timeframe& timeframe,
                                                     const TimeWindow& window) {
    auto candles = market_data_->fetch_candles(instrument, timeframe, window);
    if (candles.is_error()) {
        return make_error<MacdState>(ErrorCode::DATA_UNAVAILABLE, candles.error()->what(),
                                     "PipelineExecutor");
    }
    if (candles.value().empty()) {
        return make_error<MacdState>(ErrorCode::DATA_UNAVAILABLE,
                                     "No candles for " + instrument.key() + " " +
                                         timeframe.label + " between " +
                                         core::format_utc(window.start) + " and " +
                                         core::format_utc(window.end),
                                     "PipelineExecutor");
    }

    MacdState state = macd_.seed(candles.value());
    store_state(instrument, timeframe, state);
    DEBUG("Seeded " << instrument.key() << " " << timeframe.label << " from "
                    << candles.value().size() << " candles");
    return Result<MacdState>(state);
}

void PipelineExecutor::store_state(const Instrument& instrument, const Timeframe& timeframe,
                                   const MacdState& state) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    states_[state_key(instrument, timeframe)] = state;
}

std::optional<MacdState> PipelineExecutor::cached_state(const Instrument& instrument,
                                                        const Timeframe& timeframe) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto it = states_.find(state_key(instrument, timeframe));
    if (it == states_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void PipelineExecutor::clear_state() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    states_.clear();
}

void PipelineExecutor::fail(InstrumentOutcome& outcome, RunSummary& summary,
                            PipelineStage stage, ErrorCode code,
                            const std::string& message) const {
    ERROR(outcome.instrument << " failed at " << pipeline_stage_to_string(stage) << ": "
                             << message);
    summary.errors.push_back({outcome.instrument, code, message, stage});
    outcome.stage = PipelineStage::FAILED;
}

void PipelineExecutor::mark_running() {
    if (!registered_) {
        return;
    }
    auto state = StateManager::instance().get_state(component_id_);
    if (state.is_ok() && state.value().state == ComponentState::INITIALIZED) {
        auto result =
            StateManager::instance().update_state(component_id_, ComponentState::RUNNING);
        if (result.is_error()) {
            WARN("Pipeline executor state update failed: " << result.error()->what());
        }
    }
}

void PipelineExecutor::publish_metrics(const RunSummary& summary) {
    if (!registered_) {
        return;
    }
    auto result = StateManager::instance().update_metrics(
        component_id_, {{"processed", static_cast<double>(summary.processed)},
                        {"signals_generated", static_cast<double>(summary.signals_generated)},
                        {"skipped", static_cast<double>(summary.skipped)},
                        {"errors", static_cast<double>(summary.errors.size())},
                        {"emission_failures", static_cast<double>(summary.emission_failures)}});
    if (result.is_error()) {
        DEBUG("Pipeline executor metrics update failed: " << result.error()->what());
    }
}

}  // namespace signal_ngin
