#include "test_common.h"
#include "flbplug/example_input.h"
#include "flbplug/input_host.h"
#include "flbplug/log.h"
#include "flbplug/record_codec.h"

#include <cstdio>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

using namespace flbplug;

// Fixed clock so records can be compared exactly.
static const Timestamp T0 = {1700000000u, 123456789u};
static bool g_clock_fails = false;

static bool fixed_clock(Timestamp* out, std::string* err) {
    if (g_clock_fails) {
        *err = "clock unavailable";
        return false;
    }
    *out = T0;
    return true;
}

static int t_collect(flbplug_input_instance* ins, flbplug_config*, void* in_context) {
    return example::collect(ins, in_context, &fixed_clock);
}
static int t_init(flbplug_input_instance* ins, flbplug_config* config, void*) {
    return example::init(ins, config, &t_collect);
}
static int t_exit(void* in_context, flbplug_config*) {
    return example::shutdown(in_context);
}

static const flbplug_input_plugin TEST_PLUGIN = {
    example::PLUGIN_NAME, example::PLUGIN_DESCRIPTION, FLBPLUG_EVENT_LOGS,
    t_init, nullptr, t_collect, t_exit, example::CONFIG_MAP,
};

// Host API that refuses collector registration.
static const char* refuse_config_get(flbplug_input_instance*, const char*) { return nullptr; }
static void* g_refuse_ctx = nullptr;
static void refuse_set_context(flbplug_input_instance*, void* c) { g_refuse_ctx = c; }
static int refuse_collector(flbplug_input_instance*, flbplug_collect_fn, time_t, long, flbplug_config*) {
    return -1;
}

int main() {
    namespace fs = std::filesystem;
    const fs::path log_path = fs::temp_directory_path() / "flbplug_test_example_input.log";
    fs::remove(log_path);
    JsonlLogger logger(LogLevel::DEBUG, log_path.string());

    const size_t base_contexts = example::contexts().size();

    // Test 1: default interval is 30 seconds
    {
        InputHost host(&TEST_PLUGIN, &logger);
        expect_eq_ll(host.initialize(), 0, "init with defaults");
        expect_true(host.has_collector(), "collector registered");
        expect_eq_ll((long long)host.interval_sec(), 30, "default interval");
        expect_eq_ll(host.interval_nsec(), 0, "no nanosecond part");
        expect_true(host.context() != nullptr, "context handed to host");
        expect_eq_ll((long long)example::contexts().size(), (long long)base_contexts + 1, "one context");
        expect_eq_ll(host.shutdown(), 0, "exit succeeds");
        expect_eq_ll((long long)example::contexts().size(), (long long)base_contexts, "context released");
    }

    // Test 2: interval_sec=10 and N collects emit 1..N at the clock time
    {
        InputHost host(&TEST_PLUGIN, &logger);
        std::string err;
        expect_true(host.set_property("interval_sec", "10", &err), "set interval: " + err);

        std::vector<Record> got;
        host.set_ingest_sink([&got](const char* tag, size_t tag_len, const void* buf, size_t size) {
            expect_true(tag == nullptr && tag_len == 0, "no routing tag");
            Record r;
            std::string e;
            expect_true(decode_record(buf, size, &r, &e), "decode: " + e);
            got.push_back(r);
            return 0;
        });

        expect_eq_ll(host.initialize(), 0, "init interval=10");
        expect_eq_ll((long long)host.interval_sec(), 10, "configured interval");

        const int N = 5;
        for (int i = 0; i < N; i++) expect_eq_ll(host.collect_once(), 0, "collect");
        expect_eq_ll((long long)got.size(), N, "one record per collect");
        for (int i = 0; i < N; i++) {
            expect_eq_ll(got[i].ts.sec, T0.sec, "timestamp seconds");
            expect_eq_ll(got[i].ts.nsec, T0.nsec, "timestamp nanoseconds");
            expect_true(got[i].ts.nsec <= 999999999u, "nsec in range");
            expect_eq_ll((long long)got[i].fields.size(), 1, "single field");
            expect_eq_str(got[i].fields[0].first, "collect-calls", "field name");
            expect_eq_ll((long long)std::get<uint64_t>(got[i].fields[0].second), i + 1, "counter value");
        }
        expect_eq_ll(host.shutdown(), 0, "exit");
    }

    // Test 3: malformed interval fails init and leaks nothing
    {
        const char* bad[] = {"abc", "0", "10s", "", "-3"};
        for (const char* b : bad) {
            InputHost host(&TEST_PLUGIN, &logger);
            std::string err;
            expect_true(host.set_property("interval_sec", b, &err), "property accepted by host");
            expect_true(host.initialize() != 0, std::string("init should fail for '") + b + "'");
            expect_true(host.state() == InputHost::State::FAILED, "host marks instance failed");
            expect_true(host.context() == nullptr, "no context kept");
            expect_eq_ll((long long)example::contexts().size(), (long long)base_contexts, "no context leaked");
            expect_true(host.shutdown() != 0, "exit refused after failed init");
        }
        expect_true(slurp(log_path).find("invalid configuration: interval_sec") != std::string::npos,
                    "configuration error logged");
    }

    // Test 4: ingestion status is returned unchanged and logged
    {
        InputHost host(&TEST_PLUGIN, &logger);
        host.set_ingest_sink([](const char*, size_t, const void*, size_t) { return 7; });
        expect_eq_ll(host.initialize(), 0, "init");
        expect_eq_ll(host.collect_once(), 7, "ingest status passthrough");
        expect_eq_ll((long long)host.ingested(), 0, "nothing accepted");
        expect_true(slurp(log_path).find("ingest failed with status 7") != std::string::npos,
                    "ingest failure logged");

        // The next cycle still counts on: no retry of the lost record.
        uint64_t seen = 0;
        host.set_ingest_sink([&seen](const char*, size_t, const void* buf, size_t size) {
            Record r;
            std::string e;
            expect_true(decode_record(buf, size, &r, &e), "decode: " + e);
            seen = std::get<uint64_t>(*r.find("collect-calls"));
            return 0;
        });
        expect_eq_ll(host.collect_once(), 0, "collect after failure");
        expect_eq_ll((long long)seen, 2, "counter keeps counting invocations");
        expect_eq_ll(host.shutdown(), 0, "exit");
    }

    // Test 5: clock failure sends nothing
    {
        InputHost host(&TEST_PLUGIN, &logger);
        int calls = 0;
        host.set_ingest_sink([&calls](const char*, size_t, const void*, size_t) { calls++; return 0; });
        expect_eq_ll(host.initialize(), 0, "init");
        g_clock_fails = true;
        expect_true(host.collect_once() != 0, "clock failure propagates");
        g_clock_fails = false;
        expect_eq_ll(calls, 0, "no buffer sent");
        expect_eq_ll(host.shutdown(), 0, "exit");
    }

    // Test 6: unknown handles are rejected without touching memory
    {
        int dummy = 0;
        expect_eq_ll(example::shutdown(nullptr), -1, "exit(null)");
        expect_eq_ll(example::shutdown(&dummy), -1, "exit(foreign pointer)");

        // No instance to log through: exactly one line on stderr.
        const auto err_path = std::filesystem::temp_directory_path() / "flbplug_test_example_stderr.log";
        std::fflush(stderr);
        int saved = dup(STDERR_FILENO);
        int fd = open(err_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600);
        expect_true(saved >= 0 && fd >= 0, "redirect stderr");
        dup2(fd, STDERR_FILENO);
        close(fd);
        int ret = example::shutdown(&dummy);
        std::fflush(stderr);
        dup2(saved, STDERR_FILENO);
        close(saved);
        expect_eq_ll(ret, -1, "exit(foreign pointer) with stderr captured");
        expect_eq_str(slurp(err_path), "[in_example] error: exit: unknown context\n", "stderr line");
        std::filesystem::remove(err_path);

        InputHost host(&TEST_PLUGIN, &logger);
        expect_eq_ll(host.initialize(), 0, "init");
        void* h = host.context();
        expect_eq_ll(host.shutdown(), 0, "first exit");
        expect_eq_ll(example::shutdown(h), -1, "second exit of the same handle");

        flbplug_host_api api{};
        api.abi_version = FLBPLUG_ABI_VERSION;
        flbplug_input_instance ins{&api, "example", nullptr};
        expect_eq_ll(example::collect(&ins, h, &fixed_clock), -1, "collect with released handle");
    }

    // Test 7: refused collector registration leaves no context behind
    {
        flbplug_host_api api{};
        api.abi_version = FLBPLUG_ABI_VERSION;
        api.config_get = refuse_config_get;
        api.set_context = refuse_set_context;
        api.set_collector_time = refuse_collector;
        flbplug_input_instance ins{&api, "example", nullptr};

        expect_eq_ll(example::init(&ins, nullptr, &t_collect), -1, "init fails");
        expect_true(g_refuse_ctx == nullptr, "host context cleared");
        expect_eq_ll((long long)example::contexts().size(), (long long)base_contexts, "no context leaked");

        api.abi_version = FLBPLUG_ABI_VERSION + 1;
        expect_eq_ll(example::init(&ins, nullptr, &t_collect), -1, "ABI mismatch refused");
        expect_eq_ll(example::init(nullptr, nullptr, &t_collect), -1, "null instance refused");
    }

    // Test 8: record builder
    {
        Record r = example::make_record(T0, 9);
        expect_eq_ll((long long)r.fields.size(), 1, "one field");
        expect_eq_ll((long long)std::get<uint64_t>(*r.find(example::COUNTER_FIELD)), 9, "counter");
    }

    fs::remove(log_path);
    std::cerr << "test_example_input: ALL PASSED" << std::endl;
    return 0;
}
