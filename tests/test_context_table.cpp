#include "test_common.h"
#include "flbplug/context_table.h"

#include <cstdint>

using namespace flbplug;

int main() {
    ContextTable t;

    // Test 1: adopt hands out distinct, non-null, odd handles
    void* a = t.adopt(std::make_unique<InputContext>());
    void* b = t.adopt(std::make_unique<InputContext>());
    expect_true(a != nullptr && b != nullptr, "handles must not be null");
    expect_true(a != b, "handles must be distinct");
    expect_true((reinterpret_cast<uintptr_t>(a) & 1u) == 1u, "handles are tagged");
    expect_eq_ll((long long)t.size(), 2, "two live contexts");

    // Test 2: lookup resolves to independent state
    InputContext* ca = t.lookup(a);
    InputContext* cb = t.lookup(b);
    expect_true(ca && cb && ca != cb, "lookup should resolve both");
    ca->collect_count = 5;
    expect_eq_ll((long long)t.lookup(b)->collect_count, 0, "contexts are independent");

    // Test 3: release exactly once
    auto released = t.release(a);
    expect_true(released != nullptr, "first release returns the context");
    expect_eq_ll((long long)released->collect_count, 5, "released state");
    expect_true(t.release(a) == nullptr, "second release yields nothing");
    expect_true(t.lookup(a) == nullptr, "released handle no longer resolves");
    expect_eq_ll((long long)t.size(), 1, "one live context");

    // Test 4: handles never issued
    expect_true(t.lookup(nullptr) == nullptr, "null handle");
    expect_true(t.release(nullptr) == nullptr, "release null handle");
    int dummy = 0;
    expect_true(t.lookup(&dummy) == nullptr, "raw pointer is not a handle");

    // Test 5: released handles are not reused
    void* c = t.adopt(std::make_unique<InputContext>());
    expect_true(c != a && c != b, "fresh handle");

    t.release(b);
    t.release(c);
    expect_eq_ll((long long)t.size(), 0, "table empty");

    std::cerr << "test_context_table: ALL PASSED" << std::endl;
    return 0;
}
