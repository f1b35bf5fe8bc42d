// test_diff.cpp - Tests for the snapshot differ

#include <catch2/catch_all.hpp>
#include <geo_nodes/value_diff.h>
#include <geo_nodes/value.h>

#include <limits>
#include <sstream>
#include <string>
#include <vector>

using namespace geo_nodes;

// ============================================================
// Helper Functions
// ============================================================

namespace {

Value create_state_v1() {
    return Value::map({
        {"name", Value{"Alice"}},
        {"age", Value{30}},
        {"items", Value::vector({
            Value{1},
            Value{2},
            Value{3}
        })}
    });
}

Value create_state_v2() {
    return Value::map({
        {"name", Value{"Bob"}},     // Changed
        {"age", Value{30}},         // Same
        {"items", Value::vector({
            Value{1},
            Value{2},
            Value{4}                // Changed
        })},
        {"email", Value{"bob@test.com"}}  // Added
    });
}

std::vector<std::string> paths_of(const std::vector<DiffEntry>& diffs) {
    std::vector<std::string> result;
    for (const auto& d : diffs) {
        result.push_back(path_to_string(d.path));
    }
    return result;
}

} // namespace

// ============================================================
// DiffEntry Tests
// ============================================================

TEST_CASE("DiffEntry construction", "[diff][entry]") {
    Path path;
    path.push_back("test");

    SECTION("Add entry") {
        DiffEntry entry{DiffEntry::Type::Add, path, Value{}, Value{42}};
        REQUIRE(entry.type == DiffEntry::Type::Add);
        REQUIRE(entry.get_new().as<int>() == 42);
    }

    SECTION("Unchanged entry") {
        DiffEntry entry{DiffEntry::Type::Unchanged, path, Value{7}, Value{7}};
        REQUIRE(entry.value().as<int>() == 7);
    }

    SECTION("value() accessor") {
        DiffEntry add_entry{DiffEntry::Type::Add, path, Value{}, Value{42}};
        REQUIRE(add_entry.value().as<int>() == 42);

        DiffEntry remove_entry{DiffEntry::Type::Remove, path, Value{100}, Value{}};
        REQUIRE(remove_entry.value().as<int>() == 100);
    }
}

TEST_CASE("diff_type_name", "[diff][entry]") {
    REQUIRE(diff_type_name(DiffEntry::Type::Add) == "added");
    REQUIRE(diff_type_name(DiffEntry::Type::Remove) == "removed");
    REQUIRE(diff_type_name(DiffEntry::Type::Change) == "modified");
    REQUIRE(diff_type_name(DiffEntry::Type::Unchanged) == "unchanged");
}

// ============================================================
// DiffEntryCollector Tests
// ============================================================

TEST_CASE("DiffEntryCollector records every leaf in key order", "[diff][collector]") {
    DiffEntryCollector collector;
    collector.diff(create_state_v1(), create_state_v2());

    const auto& diffs = collector.get_diffs();
    REQUIRE(paths_of(diffs) == std::vector<std::string>{
        ".age", ".email", ".items[0]", ".items[1]", ".items[2]", ".name"});

    REQUIRE(diffs[0].type == DiffEntry::Type::Unchanged);
    REQUIRE(diffs[1].type == DiffEntry::Type::Add);
    REQUIRE(diffs[1].get_new().as_string() == "bob@test.com");
    REQUIRE(diffs[2].type == DiffEntry::Type::Unchanged);
    REQUIRE(diffs[3].type == DiffEntry::Type::Unchanged);
    REQUIRE(diffs[4].type == DiffEntry::Type::Change);
    REQUIRE(diffs[4].get_old().as<int>() == 3);
    REQUIRE(diffs[4].get_new().as<int>() == 4);
    REQUIRE(diffs[5].type == DiffEntry::Type::Change);

    REQUIRE(collector.has_changes());
    REQUIRE(collector.count(DiffEntry::Type::Change) == 2);
    REQUIRE(collector.count(DiffEntry::Type::Add) == 1);
    REQUIRE(collector.count(DiffEntry::Type::Remove) == 0);
    REQUIRE(collector.count(DiffEntry::Type::Unchanged) == 3);
}

TEST_CASE("DiffEntryCollector detects removals", "[diff][collector][remove]") {
    auto old_state = Value::map({
        {"a", Value{1}},
        {"b", Value{2}}
    });
    auto new_state = Value::map({{"a", Value{1}}});

    DiffEntryCollector collector;
    collector.diff(old_state, new_state);

    const auto& diffs = collector.get_diffs();
    REQUIRE(diffs.size() == 2);
    REQUIRE(diffs[1].type == DiffEntry::Type::Remove);
    REQUIRE(diffs[1].get_old().as<int>() == 2);
    REQUIRE(path_to_string(diffs[1].path) == ".b");
}

TEST_CASE("DiffEntryCollector one-sided subtree is a single record", "[diff][collector][add]") {
    const auto node = Value::map({
        {"x", Value{1.0}},
        {"y", Value{2.0}},
        {"tags", Value::vector({Value{"a"}})}
    });

    SECTION("added key carries the whole subtree") {
        DiffEntryCollector collector;
        collector.diff(Value::map({}), Value::map({{"node", node}}));

        const auto& diffs = collector.get_diffs();
        REQUIRE(paths_of(diffs) == std::vector<std::string>{".node"});
        REQUIRE(diffs[0].type == DiffEntry::Type::Add);
        REQUIRE(diffs[0].value() == node);
    }

    SECTION("removed key carries the whole subtree") {
        DiffEntryCollector collector;
        collector.diff(Value::map({{"node", node}, {"k", Value{1}}}), Value::map({{"k", Value{1}}}));

        auto removes = collector.count(DiffEntry::Type::Remove);
        REQUIRE(removes == 1);
        REQUIRE(path_to_string(collector.get_diffs()[1].path) == ".node");
        REQUIRE(collector.get_diffs()[1].value() == node);
    }

    SECTION("shallow mode gives the same single record") {
        DiffEntryCollector collector;
        collector.diff(Value::map({}), Value::map({{"node", node}}), false);

        REQUIRE(paths_of(collector.get_diffs()) == std::vector<std::string>{".node"});
        REQUIRE(collector.get_diffs()[0].value() == node);
    }

    SECTION("vector tail element that is a map") {
        DiffEntryCollector collector;
        collector.diff(Value::vector({}), Value::vector({node}));

        REQUIRE(paths_of(collector.get_diffs()) == std::vector<std::string>{"[0]"});
        REQUIRE(collector.get_diffs()[0].type == DiffEntry::Type::Add);
    }
}

TEST_CASE("DiffEntryCollector identical snapshots", "[diff][collector]") {
    auto state = create_state_v1();

    SECTION("only Unchanged records") {
        DiffEntryCollector collector;
        collector.diff(state, state);

        REQUIRE_FALSE(collector.has_changes());
        REQUIRE(collector.get_diffs().size() == 5);
        REQUIRE(collector.count(DiffEntry::Type::Unchanged) == 5);
    }

    SECTION("nothing when unchanged records are suppressed") {
        DiffEntryCollector collector;
        collector.diff(state, state, DiffOptions{.recursive = true, .report_unchanged = false});

        REQUIRE_FALSE(collector.has_changes());
        REQUIRE(collector.get_diffs().empty());
        REQUIRE_FALSE(collector.reports_unchanged());
    }

    SECTION("equal but separately built snapshots") {
        DiffEntryCollector collector;
        collector.diff(create_state_v1(), create_state_v1());
        REQUIRE_FALSE(collector.has_changes());
    }
}

TEST_CASE("DiffEntryCollector kind mismatch is a single change", "[diff][collector][change]") {
    SECTION("int vs double") {
        DiffEntryCollector collector;
        collector.diff(Value::map({{"v", Value{1}}}), Value::map({{"v", Value{1.0}}}));

        REQUIRE(collector.get_diffs().size() == 1);
        REQUIRE(collector.get_diffs()[0].type == DiffEntry::Type::Change);
    }

    SECTION("map vs scalar") {
        DiffEntryCollector collector;
        collector.diff(Value::map({{"v", Value::map({{"a", Value{1}}})}}),
                       Value::map({{"v", Value{"flat"}}}));

        const auto& diffs = collector.get_diffs();
        REQUIRE(diffs.size() == 1);
        REQUIRE(diffs[0].type == DiffEntry::Type::Change);
        REQUIRE(diffs[0].get_old().is_map());
        REQUIRE(diffs[0].get_new().as_string() == "flat");
    }
}

TEST_CASE("DiffEntryCollector vectors compare positionally", "[diff][collector][vector]") {
    SECTION("reorder is reported as pairwise changes") {
        DiffEntryCollector collector;
        collector.diff(Value::vector({Value{1}, Value{2}}), Value::vector({Value{2}, Value{1}}));

        const auto& diffs = collector.get_diffs();
        REQUIRE(diffs.size() == 2);
        REQUIRE(diffs[0].type == DiffEntry::Type::Change);
        REQUIRE(diffs[1].type == DiffEntry::Type::Change);
        REQUIRE(paths_of(diffs) == std::vector<std::string>{"[0]", "[1]"});
    }

    SECTION("tail elements are added or removed") {
        DiffEntryCollector collector;
        collector.diff(Value::vector({Value{1}, Value{2}, Value{3}}), Value::vector({Value{1}}));

        REQUIRE(collector.count(DiffEntry::Type::Unchanged) == 1);
        REQUIRE(collector.count(DiffEntry::Type::Remove) == 2);
        REQUIRE(paths_of(collector.get_diffs()) == std::vector<std::string>{"[0]", "[1]", "[2]"});
    }
}

TEST_CASE("DiffEntryCollector empty containers and nulls", "[diff][collector]") {
    SECTION("empty on both sides emits nothing") {
        DiffEntryCollector collector;
        collector.diff(Value::map({{"m", Value::map({})}, {"v", Value::vector({})}}),
                       Value::map({{"m", Value::map({})}, {"v", Value::vector({})}}));
        REQUIRE(collector.get_diffs().empty());
    }

    SECTION("empty container on one side is one record") {
        DiffEntryCollector collector;
        collector.diff(Value::map({}), Value::map({{"m", Value::map({})}}));

        const auto& diffs = collector.get_diffs();
        REQUIRE(diffs.size() == 1);
        REQUIRE(diffs[0].type == DiffEntry::Type::Add);
        REQUIRE(diffs[0].get_new().is_map());
        REQUIRE(path_to_string(diffs[0].path) == ".m");
    }

    SECTION("null on both sides is unchanged") {
        DiffEntryCollector collector;
        collector.diff(Value::map({{"n", Value{}}}), Value::map({{"n", Value{}}}));

        REQUIRE(collector.get_diffs().size() == 1);
        REQUIRE(collector.get_diffs()[0].type == DiffEntry::Type::Unchanged);
    }
}

TEST_CASE("DiffEntryCollector shallow mode", "[diff][collector]") {
    auto old_state = Value::map({
        {"nested", Value::map({{"value", Value{1}}})}
    });
    auto new_state = Value::map({
        {"nested", Value::map({{"value", Value{2}}})}
    });

    SECTION("recursive = true (default)") {
        DiffEntryCollector collector;
        collector.diff(old_state, new_state, true);

        REQUIRE(collector.is_recursive());
        REQUIRE(collector.get_diffs().size() == 1);
        REQUIRE(path_to_string(collector.get_diffs()[0].path) == ".nested.value");
    }

    SECTION("recursive = false reports the differing container once") {
        DiffEntryCollector collector;
        collector.diff(old_state, new_state, false);

        REQUIRE_FALSE(collector.is_recursive());
        const auto& diffs = collector.get_diffs();
        REQUIRE(diffs.size() == 1);
        REQUIRE(diffs[0].type == DiffEntry::Type::Change);
        REQUIRE(diffs[0].path.empty());
        REQUIRE(diffs[0].get_new() == new_state);
    }
}

TEST_CASE("DiffEntryCollector clear", "[diff][collector]") {
    DiffEntryCollector collector;
    collector.diff(Value::map({{"a", Value{1}}}), Value::map({{"a", Value{2}}}));
    REQUIRE(collector.has_changes());

    collector.clear();

    REQUIRE_FALSE(collector.has_changes());
    REQUIRE(collector.get_diffs().empty());
}

TEST_CASE("DiffEntryCollector print_diffs", "[diff][collector]") {
    DiffEntryCollector collector;
    collector.diff(Value::map({{"a", Value{1}}, {"b", Value{2}}, {"c", Value{3}}}),
                   Value::map({{"a", Value{1}}, {"b", Value{5}}, {"d", Value{4}}}));

    std::ostringstream os;
    collector.print_diffs(os);

    REQUIRE(os.str() ==
            "entry unchanged 1 at .a\n"
            "modified 2 to 5 at .b\n"
            "removed 3 at .c\n"
            "added 4 at .d\n");
}

TEST_CASE("DiffEntryCollector print_diffs with extreme doubles", "[diff][collector]") {
    const double tiny = std::numeric_limits<double>::denorm_min();

    DiffEntryCollector collector;
    collector.diff(Value::map({{"a", Value{tiny}}, {"b", Value{1e308}}}),
                   Value::map({{"a", Value{0.0}}, {"b", Value{1e308}}}));

    std::ostringstream os;
    REQUIRE_NOTHROW(collector.print_diffs(os));
    REQUIRE(os.str() ==
            "modified 5e-324 to 0.0 at .a\n"
            "entry unchanged 1e+308 at .b\n");
}

TEST_CASE("DiffEntryCollector stop_at_first", "[diff][collector]") {
    DiffEntryCollector collector;
    collector.diff(create_state_v1(), create_state_v2(), DiffOptions{.stop_at_first = true});

    // .age is unchanged and skipped; .email is the first difference in key order
    const auto& diffs = collector.get_diffs();
    REQUIRE(diffs.size() == 1);
    REQUIRE(diffs[0].type == DiffEntry::Type::Add);
    REQUIRE(path_to_string(diffs[0].path) == ".email");
    REQUIRE_FALSE(collector.reports_unchanged());
}

// ============================================================
// has_any_difference Tests
// ============================================================

TEST_CASE("has_any_difference", "[diff][quick]") {
    SECTION("same value") {
        auto v = create_state_v1();
        REQUIRE_FALSE(has_any_difference(v, v));
    }

    SECTION("equal values built separately") {
        REQUIRE_FALSE(has_any_difference(create_state_v1(), create_state_v1()));
    }

    SECTION("different values") {
        REQUIRE(has_any_difference(create_state_v1(), create_state_v2()));
    }

    SECTION("nested change, shallow check") {
        auto a = Value::map({{"n", Value::map({{"x", Value{1}}})}});
        auto b = Value::map({{"n", Value::map({{"x", Value{2}}})}});
        REQUIRE(has_any_difference(a, b, false));
        REQUIRE(has_any_difference(a, b, true));
    }

    SECTION("difference only in a vector tail") {
        auto a = Value::map({{"v", Value::vector({Value{1}})}});
        auto b = Value::map({{"v", Value::vector({Value{1}, Value{2}})}});
        REQUIRE(has_any_difference(a, b));
    }

    SECTION("null leaves on both sides") {
        REQUIRE_FALSE(has_any_difference(Value::map({{"n", Value{}}}), Value::map({{"n", Value{}}})));
    }
}
