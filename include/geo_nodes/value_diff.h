// value_diff.h - Structural diff between two Value snapshots

#pragma once

#include <geo_nodes/api.h>
#include <geo_nodes/value.h>

#include <cstddef>
#include <iostream>
#include <string_view>
#include <vector>

namespace geo_nodes {

struct DiffEntry {
    enum class Type { Add, Remove, Change, Unchanged };

    Type type;
    Path path;              // Path to the leaf (or container) the record refers to
    ValueBox old_value;     // Meaningful for Remove, Change and Unchanged
    ValueBox new_value;     // Meaningful for Add, Change and Unchanged

    // Add, Remove and Unchanged hold the same value in both boxes

    DiffEntry(Type t, const Path& p, const Value& old_v, const Value& new_v)
        : type(t), path(p), old_value(ValueBox{old_v}), new_value(ValueBox{new_v}) {}

    DiffEntry(Type t, const Path& p, const ValueBox& old_box, const ValueBox& new_box)
        : type(t), path(p), old_value(old_box), new_value(new_box) {}

    DiffEntry() : type(Type::Add), old_value(ValueBox{Value{}}), new_value(ValueBox{Value{}}) {}

    /// The value the record is about
    /// For Add: returns new_value
    /// For Remove: returns old_value
    /// For Change: returns new_value (use get_old() for the previous value)
    /// For Unchanged: the value present on both sides
    [[nodiscard]] const Value& value() const {
        return (type == Type::Remove) ? *old_value : *new_value;
    }

    [[nodiscard]] const Value& get_old() const { return *old_value; }
    [[nodiscard]] const Value& get_new() const { return *new_value; }
};

/// "added", "removed", "modified" or "unchanged"
[[nodiscard]] GEO_NODES_API std::string_view diff_type_name(DiffEntry::Type type) noexcept;

struct DiffOptions {
    /// When false, a differing container is reported as one Change and an
    /// added or removed container as one record, without descending into it
    bool recursive = true;

    /// When false, Unchanged records are dropped from the result
    bool report_unchanged = true;

    /// Stop after the first Add, Remove or Change. Implies that Unchanged
    /// records are not reported.
    bool stop_at_first = false;
};

// ============================================================
// DiffEntryCollector - Collects diff as a flat list of DiffEntry
//
// Records follow a depth-first traversal. Map keys are visited in ascending
// order and vectors are compared position by position, so the same pair of
// snapshots always yields the same sequence. A key or vector slot present on
// one side only is a single Add or Remove carrying the whole subtree.
//
// Example:
//   DiffEntryCollector collector;
//   collector.diff(before, after);
//   for (const auto& d : collector.get_diffs()) {
//       if (d.type == DiffEntry::Type::Change) {
//           std::cout << path_to_string(d.path) << "\n";
//       }
//   }
// ============================================================

class GEO_NODES_API DiffEntryCollector {
private:
    std::vector<DiffEntry> diffs_;
    bool recursive_ = true;
    bool report_unchanged_ = true;
    bool stop_at_first_ = false;

    [[nodiscard]] bool done() const { return stop_at_first_ && !diffs_.empty(); }
    void diff_value(const Value& old_val, const Value& new_val, Path& current_path);
    void diff_map(const ValueMap& old_map, const ValueMap& new_map, Path& current_path);
    void diff_vector(const ValueVector& old_vec, const ValueVector& new_vec, Path& current_path);
    void record(DiffEntry::Type type, const Path& path, const Value& old_val, const Value& new_val);

public:
    void diff(const Value& old_val, const Value& new_val, DiffOptions options = {});
    void diff(const Value& old_val, const Value& new_val, bool recursive);

    [[nodiscard]] const std::vector<DiffEntry>& get_diffs() const;
    void clear();

    /// True if any Add, Remove or Change was recorded
    [[nodiscard]] bool has_changes() const;

    [[nodiscard]] std::size_t count(DiffEntry::Type type) const;
    [[nodiscard]] bool is_recursive() const { return recursive_; }
    [[nodiscard]] bool reports_unchanged() const { return report_unchanged_; }

    /// One line per record: "removed X", "added X", "entry unchanged X",
    /// "modified X to Y", each followed by the record's path
    void print_diffs(std::ostream& os = std::cout) const;
};

/// Runs the collector with stop_at_first, so the walk ends at the first difference
[[nodiscard]] GEO_NODES_API bool has_any_difference(const Value& old_val, const Value& new_val, bool recursive = true);

} // namespace geo_nodes
