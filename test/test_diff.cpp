// test_diff.cpp - Tests for diff system
// Module 3: DiffCollector, free diff functions and diff rendering

#include <catch2/catch_all.hpp>
#include <dumptree/dump_parser.h>
#include <dumptree/value_diff.h>
#include <dumptree/value.h>

#include <atomic>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

using namespace dumptree;

// ============================================================
// Helper Functions
// ============================================================

Value create_person_v1() {
    return Value::object({
        {"name", Value{"Alice"}},
        {"age", Value{30}},
        {"address", Value::object({
            {"city", Value{"NYC"}},
            {"zip", Value{10001}}
        })},
        {"tags", Value::list({"a", "b", "c"})}
    });
}

Value create_person_v2() {
    return Value::object({
        {"name", Value{"Alice"}},             // Same
        {"age", Value{31}},                   // Changed
        {"address", Value::object({
            {"city", Value{"LA"}},            // Changed (nested)
            {"zip", Value{10001}}             // Same
        })},
        {"tags", Value::list({"a", "b", "d"})},  // Changed (whole list)
        {"email", Value{"a@x.com"}}           // Added
    });
}

template <typename T>
const T* find_diff(const std::vector<Diff>& diffs, std::string_view path) {
    for (const auto& d : diffs) {
        if (auto* p = std::get_if<T>(&d); p && p->path == path) {
            return p;
        }
    }
    return nullptr;
}

template <typename T>
std::set<std::string> paths_of(const std::vector<Diff>& diffs) {
    std::set<std::string> paths;
    for (const auto& d : diffs) {
        if (auto* p = std::get_if<T>(&d)) {
            paths.insert(p->path);
        }
    }
    return paths;
}

// ============================================================
// Diff Variant Tests
// ============================================================

TEST_CASE("Diff construction and path", "[diff][entry]") {
    Diff a = MissingInFirst{"email", Value{"a@x.com"}};
    Diff b = MissingInSecond{"phone", Value{}};
    Diff c = ValueMismatch{"age", Value{30}, Value{31}};

    REQUIRE(diff_path(a) == "email");
    REQUIRE(diff_path(b) == "phone");
    REQUIRE(diff_path(c) == "age");
    REQUIRE(a == Diff{MissingInFirst{"email", Value{"a@x.com"}}});
    REQUIRE(a != Diff{MissingInSecond{"email", Value{"a@x.com"}}});
}

TEST_CASE("diff_to_string formats", "[diff][render]") {
    REQUIRE(diff_to_string(MissingInFirst{"email", Value{"a@x.com"}}) ==
            "email: missing in first (second has \"a@x.com\")");
    REQUIRE(diff_to_string(MissingInSecond{"address.zip", Value{10001}}) ==
            "address.zip: missing in second (first has 10001)");
    REQUIRE(diff_to_string(ValueMismatch{"age", Value{30}, Value{31}}) ==
            "age: value mismatch (first has 30, second has 31)");
}

// ============================================================
// DiffCollector Tests
// ============================================================

TEST_CASE("DiffCollector detects additions", "[diff][collector][add]") {
    auto first = Value::object({{"a", 1}});
    auto second = Value::object({{"a", 1}, {"b", 2}});

    DiffCollector collector;
    collector.diff(first, second);

    const auto& diffs = collector.get_diffs();
    REQUIRE(diffs.size() == 1);
    auto* d = find_diff<MissingInFirst>(diffs, "b");
    REQUIRE(d != nullptr);
    REQUIRE(d->value_in_second == Value{2});
}

TEST_CASE("DiffCollector detects removals", "[diff][collector][remove]") {
    auto first = Value::object({{"a", 1}, {"b", Value{}}});
    auto second = Value::object({{"a", 1}});

    DiffCollector collector;
    collector.diff(first, second);

    const auto& diffs = collector.get_diffs();
    REQUIRE(diffs.size() == 1);
    auto* d = find_diff<MissingInSecond>(diffs, "b");
    REQUIRE(d != nullptr);
    REQUIRE(d->value_in_first.is_null());
}

TEST_CASE("DiffCollector detects changes", "[diff][collector][change]") {
    SECTION("same kind") {
        auto diffs = diff_values(Value::object({{"a", 1}}), Value::object({{"a", 2}}));
        REQUIRE(diffs.size() == 1);
        REQUIRE(diffs[0] == Diff{ValueMismatch{"a", Value{1}, Value{2}}});
    }

    SECTION("different kinds") {
        auto diffs = diff_values(Value::object({{"a", 1}}), Value::object({{"a", "1"}}));
        REQUIRE(diffs.size() == 1);
        REQUIRE(find_diff<ValueMismatch>(diffs, "a") != nullptr);
    }

    SECTION("object against scalar is not recursed") {
        auto first = Value::object({{"address", Value::object({{"city", "NYC"}})}});
        auto second = Value::object({{"address", Value{"unknown"}}});

        auto diffs = diff_values(first, second);
        REQUIRE(diffs.size() == 1);
        auto* d = find_diff<ValueMismatch>(diffs, "address");
        REQUIRE(d != nullptr);
        REQUIRE(d->value_in_first.is_object());
        REQUIRE(d->value_in_second == Value{"unknown"});
    }
}

TEST_CASE("DiffCollector no changes", "[diff][collector]") {
    SECTION("same object") {
        auto v = create_person_v1();
        REQUIRE(diff_values(v, v).empty());
    }

    SECTION("independently built equal objects") {
        REQUIRE(diff_values(create_person_v1(), create_person_v1()).empty());
    }

    SECTION("empty objects") {
        REQUIRE(diff_values(Value::object({}), Value::object({})).empty());
    }
}

TEST_CASE("DiffCollector recurses into nested objects", "[diff][collector][nested]") {
    SECTION("nested mismatch is reported at the leaf path") {
        auto first = Value::object({{"address", Value::object({{"city", "NYC"}, {"zip", 1}})}});
        auto second = Value::object({{"address", Value::object({{"city", "LA"}, {"zip", 1}})}});

        auto diffs = diff_values(first, second);
        REQUIRE(diffs.size() == 1);
        REQUIRE(diffs[0] == Diff{ValueMismatch{"address.city", Value{"NYC"}, Value{"LA"}}});
    }

    SECTION("nested missing key") {
        auto first = Value::object({{"address", Value::object({{"city", "NYC"}, {"zip", 1}})}});
        auto second = Value::object({{"address", Value::object({{"city", "NYC"}})}});

        auto diffs = diff_values(first, second);
        REQUIRE(diffs.size() == 1);
        REQUIRE(find_diff<MissingInSecond>(diffs, "address.zip") != nullptr);
    }

    SECTION("three levels deep") {
        auto first = Value::object({{"a", Value::object({{"b", Value::object({{"c", 1}})}})}});
        auto second = Value::object({{"a", Value::object({{"b", Value::object({{"c", 2}})}})}});

        auto diffs = diff_values(first, second);
        REQUIRE(diffs.size() == 1);
        REQUIRE(diff_path(diffs[0]) == "a.b.c");
    }
}

TEST_CASE("DiffCollector compares lists as whole values", "[diff][collector][list]") {
    SECTION("differing lists give one mismatch at the list path") {
        auto first = Value::object({{"tags", Value::list({"a", "b", "c"})}});
        auto second = Value::object({{"tags", Value::list({"a", "b", "d"})}});

        auto diffs = diff_values(first, second);
        REQUIRE(diffs.size() == 1);
        auto* d = find_diff<ValueMismatch>(diffs, "tags");
        REQUIRE(d != nullptr);
        REQUIRE(d->value_in_first == Value::list({"a", "b", "c"}));
        REQUIRE(d->value_in_second == Value::list({"a", "b", "d"}));
    }

    SECTION("objects inside lists are not recursed") {
        auto first = Value::object({{"items", Value::list({Value::object({{"id", 1}})})}});
        auto second = Value::object({{"items", Value::list({Value::object({{"id", 2}})})}});

        auto diffs = diff_values(first, second);
        REQUIRE(diffs.size() == 1);
        REQUIRE(diff_path(diffs[0]) == "items");
    }

    SECTION("equal lists") {
        auto first = Value::object({{"tags", Value::list({1, 2})}});
        auto second = Value::object({{"tags", Value::list({1, 2})}});
        REQUIRE(diff_values(first, second).empty());
    }
}

TEST_CASE("DiffCollector path prefix", "[diff][collector]") {
    auto first = Value::object({{"a", Value::object({{"b", 1}})}});
    auto second = Value::object({{"a", Value::object({{"b", 2}})}, {"c", 3}});

    auto diffs = diff_values(first, second, "root");
    REQUIRE(diffs.size() == 2);
    REQUIRE(find_diff<ValueMismatch>(diffs, "root.a.b") != nullptr);
    REQUIRE(find_diff<MissingInFirst>(diffs, "root.c") != nullptr);
}

TEST_CASE("DiffCollector structurally shared update", "[diff][collector]") {
    auto base = create_person_v1();
    auto updated = base.set("age", 40);

    auto diffs = diff_values(base, updated);
    REQUIRE(diffs.size() == 1);
    REQUIRE(diffs[0] == Diff{ValueMismatch{"age", Value{30}, Value{40}}});
}

TEST_CASE("DiffCollector clear and has_changes", "[diff][collector]") {
    DiffCollector collector;
    REQUIRE_FALSE(collector.has_changes());

    collector.diff(create_person_v1(), create_person_v2());
    REQUIRE(collector.has_changes());

    collector.clear();
    REQUIRE_FALSE(collector.has_changes());
    REQUIRE(collector.get_diffs().empty());

    SECTION("diff replaces earlier results") {
        collector.diff(create_person_v1(), create_person_v2());
        collector.diff(create_person_v1(), create_person_v1());
        REQUIRE_FALSE(collector.has_changes());
    }
}

TEST_CASE("DiffCollector print_diffs", "[diff][collector][render]") {
    DiffCollector collector;

    SECTION("no changes") {
        collector.diff(Value::object({{"a", 1}}), Value::object({{"a", 1}}));
        std::ostringstream oss;
        collector.print_diffs(oss);
        REQUIRE(oss.str() == "  (no changes)\n");
    }

    SECTION("one line per diff") {
        collector.diff(Value::object({{"a", 1}}), Value::object({{"a", 2}}));
        std::ostringstream oss;
        collector.print_diffs(oss);
        REQUIRE(oss.str() == "  a: value mismatch (first has 1, second has 2)\n");
    }
}

TEST_CASE("diff_values rejects non-object operands", "[diff][error]") {
    auto obj = Value::object({{"a", 1}});

    REQUIRE_THROWS_AS(diff_values(Value::list({1}), obj), std::invalid_argument);
    REQUIRE_THROWS_AS(diff_values(obj, Value{42}), std::invalid_argument);
    REQUIRE_THROWS_AS(diff_values(Value{}, Value{}), std::invalid_argument);
}

TEST_CASE("diff_objects on raw maps", "[diff]") {
    auto first = create_person_v1().as_map();
    auto second = create_person_v2().as_map();

    auto diffs = diff_objects(first, second);
    REQUIRE(diffs.size() == 4);
    REQUIRE(find_diff<ValueMismatch>(diffs, "age") != nullptr);
    REQUIRE(find_diff<ValueMismatch>(diffs, "address.city") != nullptr);
    REQUIRE(find_diff<ValueMismatch>(diffs, "tags") != nullptr);
    REQUIRE(find_diff<MissingInFirst>(diffs, "email") != nullptr);
}

// ============================================================
// Properties
// ============================================================

TEST_CASE("diff is symmetric", "[diff][property]") {
    auto first = create_person_v1();
    auto second = create_person_v2().set("name", Value{}).set("extra", 1);
    auto trimmed = Value{first.as_map().erase("tags")};

    for (const auto& [a, b] : {std::pair{first, second}, std::pair{trimmed, second}}) {
        auto forward = diff_values(a, b);
        auto backward = diff_values(b, a);

        REQUIRE(forward.size() == backward.size());
        REQUIRE(paths_of<MissingInFirst>(forward) == paths_of<MissingInSecond>(backward));
        REQUIRE(paths_of<MissingInSecond>(forward) == paths_of<MissingInFirst>(backward));
        REQUIRE(paths_of<ValueMismatch>(forward) == paths_of<ValueMismatch>(backward));

        for (const auto& d : forward) {
            if (auto* m = std::get_if<ValueMismatch>(&d)) {
                auto* swapped = find_diff<ValueMismatch>(backward, m->path);
                REQUIRE(swapped != nullptr);
                REQUIRE(swapped->value_in_first == m->value_in_second);
                REQUIRE(swapped->value_in_second == m->value_in_first);
            }
        }
    }
}

TEST_CASE("has_any_difference function", "[diff]") {
    auto v1 = create_person_v1();
    auto v2 = create_person_v2();

    REQUIRE(has_any_difference(v1.as_map(), v2.as_map()));
    REQUIRE_FALSE(has_any_difference(v1.as_map(), v1.as_map()));
    REQUIRE_FALSE(has_any_difference(v1.as_map(), create_person_v1().as_map()));

    // Agrees with the full diff
    REQUIRE(has_any_difference(v1.as_map(), v2.as_map()) == !diff_values(v1, v2).empty());
}

// ============================================================
// Parse + Diff
// ============================================================

TEST_CASE("diff of two parsed dumps", "[diff][parser]") {
    auto first = parse_dump("Person[name=Alice, age=30, address=Address[city=NYC, zip=<null>]]");
    auto second = parse_dump(
        "Person[name=Alice, age=31, address=Address[city=NYC, zip=<null>], email=a@x.com]");

    auto diffs = diff_values(first, second);
    REQUIRE(diffs.size() == 2);

    auto* age = find_diff<ValueMismatch>(diffs, "age");
    REQUIRE(age != nullptr);
    REQUIRE(age->value_in_first == Value{30});
    REQUIRE(age->value_in_second == Value{31});

    auto* email = find_diff<MissingInFirst>(diffs, "email");
    REQUIRE(email != nullptr);
    REQUIRE(email->value_in_second == Value{"a@x.com"});
}

TEST_CASE("diff of parsed dumps with nested changes", "[diff][parser]") {
    auto first = parse_dump("Order[id=7, customer=Customer[name=Bob, address=Address[zip=<null>]]]");
    auto second = parse_dump("Order[id=7, customer=Customer[name=Bob, address=Address[zip=90210]]]");

    auto diffs = diff_values(first, second);
    REQUIRE(diffs.size() == 1);
    REQUIRE(diffs[0] == Diff{ValueMismatch{"customer.address.zip", Value{}, Value{90210}}});
}

TEST_CASE("diff of an empty labelled scope against a populated one", "[diff][parser]") {
    // Address[] parses as an empty list, so the whole entry mismatches
    auto first = parse_dump("Person[addr=Address[]]");
    auto second = parse_dump("Person[addr=Address[x=1]]");

    auto diffs = diff_values(first, second);
    REQUIRE(diffs.size() == 1);
    auto* d = find_diff<ValueMismatch>(diffs, "addr");
    REQUIRE(d != nullptr);
    REQUIRE(d->value_in_first == Value::list({}));
    REQUIRE(d->value_in_second == Value::object({{"x", 1}}));
}

// ============================================================
// Threading Tests
// ============================================================

TEST_CASE("parse and diff on shared trees from several threads", "[diff][parser][thread]") {
    const std::string dump = "Person[name=Alice, age=30, address=Address[city=NYC, zip=<null>]]";
    const Value baseline = parse_dump(dump);

    const int num_threads = 4;
    const int rounds_per_thread = 50;
    std::atomic<int> consistent{0};
    std::vector<std::thread> threads;

    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&baseline, &dump, &consistent, rounds_per_thread, t]() {
            for (int i = 0; i < rounds_per_thread; ++i) {
                // Copies and updates share nodes with baseline
                Value local = baseline;
                Value updated = local.set("age", 31 + t);
                Value reparsed = parse_dump(dump);

                auto unchanged = diff_values(baseline, reparsed);
                auto changed = diff_values(local, updated);
                if (unchanged.empty() && changed.size() == 1 && diff_path(changed[0]) == "age") {
                    ++consistent;
                }
            }
        });
    }

    for (auto& th : threads) {
        th.join();
    }

    REQUIRE(consistent == num_threads * rounds_per_thread);
    REQUIRE(baseline.at("age") == Value{30});
    REQUIRE(baseline.at("address").at("city") == Value{"NYC"});
}
