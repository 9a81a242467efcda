#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace flbplug {

// Per-instance state of the example input.
struct InputContext {
    uint64_t collect_count{0};
};

// Owns every live InputContext and hands the host tagged opaque handles
// instead of raw pointers. A handle resolves until it is released; releasing
// it twice, or resolving a handle that was never issued, yields nullptr.
class ContextTable {
public:
    // Takes ownership. The returned handle is never null.
    void* adopt(std::unique_ptr<InputContext> ctx);

    // Borrow. Valid until release(handle).
    InputContext* lookup(void* handle) const;

    std::unique_ptr<InputContext> release(void* handle);

    size_t size() const;

private:
    static uintptr_t key(void* handle) { return reinterpret_cast<uintptr_t>(handle); }

    mutable std::mutex mu_;
    uintptr_t next_seq_{1};
    std::unordered_map<uintptr_t, std::unique_ptr<InputContext>> live_;
};

} // namespace flbplug
