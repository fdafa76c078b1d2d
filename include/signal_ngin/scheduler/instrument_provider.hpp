// include/signal_ngin/scheduler/instrument_provider.hpp
#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include "signal_ngin/core/error.hpp"
#include "signal_ngin/core/types.hpp"
#include "signal_ngin/data/database_interface.hpp"
#include "signal_ngin/strategy/config_registry.hpp"

namespace signal_ngin {

/**
 * @brief Source of the active instrument universe, read once per cycle
 */
class InstrumentProvider {
public:
    virtual ~InstrumentProvider() = default;
    virtual Result<std::vector<Instrument>> active_instruments() = 0;
};

/**
 * @brief Instruments listed in the configuration registry
 */
class RegistryInstrumentProvider : public InstrumentProvider {
public:
    explicit RegistryInstrumentProvider(std::shared_ptr<const ConfigRegistry> registry)
        : registry_(std::move(registry)) {
        if (!registry_) {
            throw std::invalid_argument("RegistryInstrumentProvider: null registry");
        }
    }

    Result<std::vector<Instrument>> active_instruments() override {
        return Result<std::vector<Instrument>>(registry_->active_instruments());
    }

private:
    std::shared_ptr<const ConfigRegistry> registry_;
};

/**
 * @brief Instruments flagged active in the instruments table
 */
class PostgresInstrumentProvider : public InstrumentProvider {
public:
    explicit PostgresInstrumentProvider(std::shared_ptr<DatabaseInterface> db,
                                        std::string table_name = "market.instruments")
        : db_(std::move(db)), table_name_(std::move(table_name)) {
        if (!db_) {
            throw std::invalid_argument("PostgresInstrumentProvider: null database");
        }
    }

    Result<std::vector<Instrument>> active_instruments() override {
        return db_->get_active_instruments(table_name_);
    }

private:
    std::shared_ptr<DatabaseInterface> db_;
    std::string table_name_;
};

}  // namespace signal_ngin
