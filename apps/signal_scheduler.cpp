// apps/signal_scheduler.cpp

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include "signal_ngin/core/cancellation.hpp"
#include "signal_ngin/core/config_loader.hpp"
#include "signal_ngin/core/logger.hpp"
#include "signal_ngin/data/postgres_database.hpp"
#include "signal_ngin/data/postgres_market_data.hpp"
#include "signal_ngin/pipeline/pipeline_executor.hpp"
#include "signal_ngin/pipeline/signal_sink.hpp"
#include "signal_ngin/scheduler/cadence_runner.hpp"
#include "signal_ngin/scheduler/conflict_arbiter.hpp"
#include "signal_ngin/scheduler/instrument_provider.hpp"
#include "signal_ngin/scheduler/lease_store.hpp"
#include "signal_ngin/scheduler/market_calendar.hpp"
#include "signal_ngin/scheduler/scheduler.hpp"
#include "signal_ngin/scheduler/worker_pool_job_queue.hpp"
#include "signal_ngin/strategy/config_registry.hpp"

using namespace signal_ngin;

namespace {

std::atomic<bool> running(true);

void signalHandler(int signum) {
    std::cout << "Interrupt signal (" << signum << ") received. Shutting down..." << std::endl;
    running.store(false);
}

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [--config <path>] [--once | --backfill]" << std::endl;
    std::cerr << "  --config <path>  configuration file (default config/signal_ngin.json)"
              << std::endl;
    std::cerr << "  --once           run a single scheduler cycle and wait for its jobs"
              << std::endl;
    std::cerr << "  --backfill       run one backfill batch over the active universe"
              << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string config_path = "config/signal_ngin.json";
    bool once = false;
    bool backfill = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--once") {
            once = true;
        } else if (arg == "--backfill") {
            backfill = true;
        } else {
            std::cerr << "Invalid argument: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }
    if (once && backfill) {
        std::cerr << "--once and --backfill are mutually exclusive" << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    auto config_result = ConfigLoader::load(config_path);
    if (config_result.is_error()) {
        std::cerr << "Failed to load configuration: " << config_result.error()->what()
                  << std::endl;
        return 1;
    }
    AppConfig config = config_result.take_value();

    auto& logger = Logger::instance();
    logger.initialize(config.logging);
    Logger::register_component("SignalScheduler");
    INFO("Configuration loaded from " << config_path);

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    CancellationToken shutdown;
    std::thread watcher([&shutdown] {
        while (running.load() && !shutdown.is_cancelled()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        shutdown.cancel();
    });
    auto stop_watcher = [&] {
        running.store(false);
        if (watcher.joinable()) {
            watcher.join();
        }
    };

    try {
        auto registry_result = InMemoryConfigRegistry::create(config.registry);
        if (registry_result.is_error()) {
            ERROR("Invalid registry configuration: " << registry_result.error()->what());
            stop_watcher();
            return 1;
        }
        auto registry = registry_result.take_value();

        auto calendar_result = MarketCalendar::create(config.calendar);
        if (calendar_result.is_error()) {
            ERROR("Invalid calendar configuration: " << calendar_result.error()->what());
            stop_watcher();
            return 1;
        }
        auto calendar = calendar_result.take_value();

        auto db = std::make_shared<PostgresDatabase>(config.database.get_connection_string());
        auto connected = db->connect();
        if (connected.is_error()) {
            ERROR("Failed to connect to database: " << connected.error()->what());
            stop_watcher();
            return 1;
        }

        auto market_data =
            std::make_shared<PostgresMarketDataSource>(db, config.database.candles_table);

        auto sink = std::make_shared<CompositeSignalSink>();
        sink->add_sink(std::make_shared<PostgresSignalSink>(db, config.database.signals_table));
        sink->add_sink(std::make_shared<BusSignalSink>());

        auto executor = std::make_shared<PipelineExecutor>(config.pipeline, market_data,
                                                           registry, sink);

        std::shared_ptr<InstrumentProvider> instruments;
        if (config.instrument_source == "database") {
            instruments = std::make_shared<PostgresInstrumentProvider>(
                db, config.database.instruments_table);
        } else {
            instruments = std::make_shared<RegistryInstrumentProvider>(registry);
        }

        if (backfill) {
            auto universe = instruments->active_instruments();
            if (universe.is_error()) {
                ERROR("Failed to load instruments: " << universe.error()->what());
                stop_watcher();
                return 1;
            }
            RunSummary summary =
                executor->run_batch(universe.value(), RunMode::BACKFILL, shutdown);
            INFO("Backfill finished: " << summary.to_json().dump());
            stop_watcher();
            db->disconnect();
            return summary.errors.empty() ? 0 : 2;
        }

        std::shared_ptr<LeaseStore> leases;
        if (config.lease_store == "memory") {
            leases = std::make_shared<InMemoryLeaseStore>();
        } else {
            leases = std::make_shared<PostgresLeaseStore>(db, config.database.leases_table);
        }

        // The arbiter controls the queue and the queue's handler needs the
        // arbiter, so the handler is bound after both exist.
        auto handler_slot = std::make_shared<JobHandler>();
        auto queue = std::make_shared<WorkerPoolJobQueue>(
            config.job_queue,
            [handler_slot](const Job& job, const CancellationToken& cancel) {
                return (*handler_slot)(job, cancel);
            });

        auto arbiter = std::make_shared<ConflictArbiter>(
            leases, queue, config.scheduler.high_priority_class,
            config.scheduler.competing_worker_class, default_lease_owner_prefix());
        *handler_slot = make_batch_handler(executor, arbiter);

        auto started = queue->start();
        if (started.is_error()) {
            ERROR("Failed to start job queue: " << started.error()->what());
            stop_watcher();
            return 1;
        }

        Scheduler scheduler(config.scheduler, queue, arbiter, instruments, calendar, nullptr,
                            shutdown);

        int exit_code = 0;
        if (once) {
            auto report = scheduler.tick();
            if (report.is_error()) {
                ERROR("Scheduler cycle failed: " << report.error()->what());
                exit_code = 2;
            } else {
                const auto wait_limit = std::chrono::seconds(
                    std::max(config.scheduler.realtime_timeout_seconds,
                             config.scheduler.backfill_timeout_seconds));
                if (!queue->wait_idle(wait_limit)) {
                    WARN("Jobs still running after " << wait_limit.count() << "s");
                    exit_code = 2;
                }
            }
        } else {
            CadenceRunner runner("scheduler", std::chrono::seconds(config.scheduler.cadence_seconds),
                                 [&scheduler]() -> Result<void> {
                                     auto report = scheduler.tick();
                                     if (report.is_error()) {
                                         return make_error<void>(report.error()->code(),
                                                                 report.error()->what(),
                                                                 "SignalScheduler");
                                     }
                                     return Result<void>();
                                 });
            auto result = runner.run(shutdown);
            if (result.is_error()) {
                ERROR("Scheduler loop aborted: " << result.error()->what());
                exit_code = 2;
            }
        }

        queue->stop();
        stop_watcher();
        db->disconnect();
        INFO("Signal scheduler exited with code " << exit_code);
        return exit_code;

    } catch (const std::exception& e) {
        ERROR("Unexpected error: " << e.what());
        stop_watcher();
        return 1;
    }
}
