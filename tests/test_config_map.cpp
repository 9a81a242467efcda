#include "test_common.h"
#include "flbplug/config_map.h"
#include "flbplug/example_input.h"

#include <cstring>

using namespace flbplug;

int main() {
    // Test 1: the example map has exactly interval_sec
    {
        expect_eq_ll((long long)config_map_size(example::CONFIG_MAP), 1, "one recognized key");
        const flbplug_config_map* e = find_config_entry(example::CONFIG_MAP, "interval_sec");
        expect_true(e != nullptr, "interval_sec should be recognized");
        expect_eq_ll(e->type, FLBPLUG_CONFIG_MAP_INT, "interval_sec is an int");
        expect_eq_str(e->def_value, "30", "default 30");
        expect_eq_str(e->desc, "Collect interval.", "description");

        expect_true(find_config_entry(example::CONFIG_MAP, "Interval_Sec") == e, "keys are case-insensitive");
        expect_true(find_config_entry(example::CONFIG_MAP, "interval_nsec") == nullptr, "unknown key");
        expect_true(find_config_entry(nullptr, "interval_sec") == nullptr, "null map");
        expect_eq_ll((long long)config_map_size(nullptr), 0, "null map size");
    }

    // Test 2: strict integer parsing
    {
        long v = 0;
        std::string err;
        expect_true(parse_int_property("interval_sec", "10", 1, 86400, &v, &err), "10 should parse");
        expect_eq_ll(v, 10, "parsed value");
        expect_true(parse_int_property("interval_sec", "86400", 1, 86400, &v, &err), "upper bound");

        const char* bad[] = {"", "abc", "10s", " 10", "10 ", "0", "-1", "86401",
                             "99999999999999999999999", "1.5"};
        for (const char* b : bad) {
            err.clear();
            v = 77;
            expect_true(!parse_int_property("interval_sec", b, 1, 86400, &v, &err),
                        std::string("should reject '") + b + "'");
            expect_eq_ll(v, 77, "output untouched on failure");
            expect_true(err.find("interval_sec") != std::string::npos, "error names the key");
        }
    }

    std::cerr << "test_config_map: ALL PASSED" << std::endl;
    return 0;
}
