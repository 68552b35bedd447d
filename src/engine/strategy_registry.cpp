#include "engine/strategy.hpp"
#include "engine/book_pressure_strategy.hpp"
#include <iostream>
#include <algorithm>

bool StrategyRegistry::registerFactory(const std::string& name, Factory factory) {
    if (!factory) return false;
    return factories_.emplace(name, std::move(factory)).second;
}

std::unique_ptr<IStrategy> StrategyRegistry::create(const StrategyConfig& config) const {
    auto it = factories_.find(config.name);
    if (it == factories_.end()) {
        std::cerr << "[STRAT] Unknown strategy '" << config.name << "' for " << config.id << "\n";
        return nullptr;
    }
    return it->second(config);
}

bool StrategyRegistry::contains(const std::string& name) const {
    return factories_.count(name) > 0;
}

std::vector<std::string> StrategyRegistry::names() const {
    std::vector<std::string> out;
    for (const auto& kv : factories_) out.push_back(kv.first);
    std::sort(out.begin(), out.end());
    return out;
}

void registerBuiltinStrategies(StrategyRegistry& registry) {
    registry.registerFactory("BookPressure", [](const StrategyConfig& cfg) {
        return std::unique_ptr<IStrategy>(new BookPressureStrategy(cfg));
    });
}
