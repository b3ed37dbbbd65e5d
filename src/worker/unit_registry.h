#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "processing_unit.h"

namespace worker {

// Name of the unit used when a stage does not name one
inline constexpr const char* kPassUnit = "_pass";

// Maps `uses` names to unit factories
class UnitRegistry {
public:
    UnitRegistry() = default;

    // Registry preloaded with the built-in units
    static std::shared_ptr<UnitRegistry> with_builtins();

    // Throws ConfigurationError if the name is taken
    void register_unit(const std::string& name, UnitFactory factory);

    bool contains(const std::string& name) const;

    // Fresh unit instance; empty name resolves to the pass unit
    std::unique_ptr<ProcessingUnit> create(const std::string& name) const;

    std::vector<std::string> names() const;

private:
    static std::string resolve(const std::string& name);

    std::unordered_map<std::string, UnitFactory> factories_;
    mutable std::mutex mutex_;
};

} // namespace worker
