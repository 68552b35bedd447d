#include "core/pending_symbols.hpp"

bool PendingSymbolTable::tryAcquire(const std::string& symbol,
                                    size_t openPositions,
                                    size_t maxActive)
{
    std::lock_guard<std::mutex> lk(mutex_);
    if (symbols_.count(symbol)) {
        return false;
    }
    if (openPositions + symbols_.size() >= maxActive) {
        return false;
    }
    symbols_.insert(symbol);
    return true;
}

void PendingSymbolTable::release(const std::string& symbol) {
    std::lock_guard<std::mutex> lk(mutex_);
    symbols_.erase(symbol);
}

bool PendingSymbolTable::contains(const std::string& symbol) const {
    std::lock_guard<std::mutex> lk(mutex_);
    return symbols_.count(symbol) > 0;
}

size_t PendingSymbolTable::size() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return symbols_.size();
}

std::vector<std::string> PendingSymbolTable::snapshot() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return std::vector<std::string>(symbols_.begin(), symbols_.end());
}
