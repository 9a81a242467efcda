#include "flbplug/context_table.h"

namespace flbplug {

// Handles are odd integers so they can never alias a real (aligned) pointer.
void* ContextTable::adopt(std::unique_ptr<InputContext> ctx) {
    std::lock_guard<std::mutex> lk(mu_);
    uintptr_t h = (next_seq_++ << 1) | 1u;
    live_[h] = std::move(ctx);
    return reinterpret_cast<void*>(h);
}

InputContext* ContextTable::lookup(void* handle) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = live_.find(key(handle));
    return it == live_.end() ? nullptr : it->second.get();
}

std::unique_ptr<InputContext> ContextTable::release(void* handle) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = live_.find(key(handle));
    if (it == live_.end()) return nullptr;
    auto ctx = std::move(it->second);
    live_.erase(it);
    return ctx;
}

size_t ContextTable::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return live_.size();
}

} // namespace flbplug
