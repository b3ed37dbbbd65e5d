#include "unit_registry.h"
#include "builtin_units.h"
#include "errors.h"
#include <algorithm>

namespace worker {

std::shared_ptr<UnitRegistry> UnitRegistry::with_builtins() {
    auto registry = std::make_shared<UnitRegistry>();
    register_builtin_units(*registry);
    return registry;
}

std::string UnitRegistry::resolve(const std::string& name) {
    return name.empty() ? std::string(kPassUnit) : name;
}

void UnitRegistry::register_unit(const std::string& name, UnitFactory factory) {
    if (name.empty()) {
        throw podflow::ConfigurationError("unit name must not be empty");
    }
    if (!factory) {
        throw podflow::ConfigurationError("unit '" + name + "' has no factory");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (!factories_.emplace(name, std::move(factory)).second) {
        throw podflow::ConfigurationError("unit '" + name + "' is already registered");
    }
}

bool UnitRegistry::contains(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return factories_.count(resolve(name)) > 0;
}

std::unique_ptr<ProcessingUnit> UnitRegistry::create(const std::string& name) const {
    UnitFactory factory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = factories_.find(resolve(name));
        if (it == factories_.end()) {
            throw podflow::ConfigurationError("unknown unit '" + resolve(name) + "'");
        }
        factory = it->second;
    }
    auto unit = factory();
    if (!unit) {
        throw podflow::ConfigurationError("factory of unit '" + resolve(name) + "' returned nothing");
    }
    return unit;
}

std::vector<std::string> UnitRegistry::names() const {
    std::vector<std::string> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : factories_) {
            result.push_back(entry.first);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

} // namespace worker
