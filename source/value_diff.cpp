// value_diff.cpp - DiffEntryCollector and difference checks

#include <geo_nodes/value_diff.h>

#include <algorithm>

namespace geo_nodes {

namespace {

std::vector<std::string> sorted_keys(const ValueMap& map)
{
    std::vector<std::string> keys;
    keys.reserve(map.size());
    for (const auto& [k, v] : map) {
        keys.push_back(k);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

bool same_root(const ValueMap& a, const ValueMap& b)
{
    return a.impl().root == b.impl().root && a.impl().size == b.impl().size;
}

bool same_root(const ValueVector& a, const ValueVector& b)
{
    return a.impl().root == b.impl().root &&
           a.impl().tail == b.impl().tail &&
           a.impl().size == b.impl().size;
}

} // namespace

std::string_view diff_type_name(DiffEntry::Type type) noexcept
{
    switch (type) {
        case DiffEntry::Type::Add:       return "added";
        case DiffEntry::Type::Remove:    return "removed";
        case DiffEntry::Type::Change:    return "modified";
        case DiffEntry::Type::Unchanged: return "unchanged";
    }
    return "unknown";
}

// ============================================================
// DiffEntryCollector Implementation
// ============================================================

void DiffEntryCollector::diff(const Value& old_val, const Value& new_val, DiffOptions options)
{
    diffs_.clear();
    recursive_ = options.recursive;
    stop_at_first_ = options.stop_at_first;
    report_unchanged_ = options.report_unchanged && !options.stop_at_first;

    diffs_.reserve(32);

    Path root_path;
    root_path.reserve(8);
    diff_value(old_val, new_val, root_path);
}

void DiffEntryCollector::diff(const Value& old_val, const Value& new_val, bool recursive)
{
    diff(old_val, new_val, DiffOptions{.recursive = recursive});
}

const std::vector<DiffEntry>& DiffEntryCollector::get_diffs() const
{
    return diffs_;
}

void DiffEntryCollector::clear()
{
    diffs_.clear();
}

bool DiffEntryCollector::has_changes() const
{
    return std::any_of(diffs_.begin(), diffs_.end(), [](const DiffEntry& d) {
        return d.type != DiffEntry::Type::Unchanged;
    });
}

std::size_t DiffEntryCollector::count(DiffEntry::Type type) const
{
    return static_cast<std::size_t>(std::count_if(diffs_.begin(), diffs_.end(), [type](const DiffEntry& d) {
        return d.type == type;
    }));
}

void DiffEntryCollector::print_diffs(std::ostream& os) const
{
    if (diffs_.empty()) {
        os << "  (no entries)\n";
        return;
    }
    for (const auto& d : diffs_) {
        switch (d.type) {
            case DiffEntry::Type::Remove:
                os << "removed " << value_to_string(d.get_old());
                break;
            case DiffEntry::Type::Add:
                os << "added " << value_to_string(d.get_new());
                break;
            case DiffEntry::Type::Unchanged:
                os << "entry unchanged " << value_to_string(d.get_new());
                break;
            case DiffEntry::Type::Change:
                os << "modified " << value_to_string(d.get_old()) << " to " << value_to_string(d.get_new());
                break;
        }
        os << " at " << path_to_string(d.path) << "\n";
    }
}

void DiffEntryCollector::record(DiffEntry::Type type, const Path& path, const Value& old_val, const Value& new_val)
{
    if (type == DiffEntry::Type::Unchanged && !report_unchanged_) {
        return;
    }
    diffs_.emplace_back(type, path, old_val, new_val);
}

void DiffEntryCollector::diff_value(const Value& old_val, const Value& new_val, Path& current_path)
{
    const auto old_index = old_val.data.index();
    const auto new_index = new_val.data.index();
    if (old_index != new_index) [[unlikely]] {
        record(DiffEntry::Type::Change, current_path, old_val, new_val);
        return;
    }

    std::visit([&](const auto& old_arg) {
        using T = std::decay_t<decltype(old_arg)>;

        if constexpr (std::is_same_v<T, ValueMap> || std::is_same_v<T, ValueVector>) {
            const auto& new_arg = std::get<T>(new_val.data);

            // Shared structure means nothing below can differ
            const bool identical = same_root(old_arg, new_arg);
            if (identical && !report_unchanged_) [[likely]] {
                return;
            }

            // Shallow mode: the container is one record
            if (!recursive_) {
                if (identical || old_arg == new_arg) {
                    if (!old_arg.empty()) {
                        record(DiffEntry::Type::Unchanged, current_path, old_val, new_val);
                    }
                } else {
                    record(DiffEntry::Type::Change, current_path, old_val, new_val);
                }
                return;
            }

            if constexpr (std::is_same_v<T, ValueMap>) {
                diff_map(old_arg, new_arg, current_path);
            } else {
                diff_vector(old_arg, new_arg, current_path);
            }
        }
        else if constexpr (std::is_same_v<T, std::monostate>) {
            record(DiffEntry::Type::Unchanged, current_path, old_val, new_val);
        }
        else {
            const auto& new_arg = std::get<T>(new_val.data);
            record(old_arg == new_arg ? DiffEntry::Type::Unchanged : DiffEntry::Type::Change,
                   current_path, old_val, new_val);
        }
    }, old_val.data);
}

void DiffEntryCollector::diff_map(const ValueMap& old_map, const ValueMap& new_map, Path& current_path)
{
    // Merge walk over both key sets in ascending order
    const auto old_keys = sorted_keys(old_map);
    const auto new_keys = sorted_keys(new_map);

    auto old_it = old_keys.begin();
    auto new_it = new_keys.begin();
    while ((old_it != old_keys.end() || new_it != new_keys.end()) && !done()) {
        if (new_it == new_keys.end() || (old_it != old_keys.end() && *old_it < *new_it)) {
            const Value& removed = old_map.find(*old_it)->get();
            current_path.push_back(*old_it);
            record(DiffEntry::Type::Remove, current_path, removed, removed);
            current_path.pop_back();
            ++old_it;
        } else if (old_it == old_keys.end() || *new_it < *old_it) {
            const Value& added = new_map.find(*new_it)->get();
            current_path.push_back(*new_it);
            record(DiffEntry::Type::Add, current_path, added, added);
            current_path.pop_back();
            ++new_it;
        } else {
            const std::string& key = *old_it;
            const auto* old_box = old_map.find(key);
            const auto* new_box = new_map.find(key);
            ++old_it;
            ++new_it;

            // Shared entry
            if (&old_box->get() == &new_box->get() && !report_unchanged_) {
                continue;
            }
            current_path.push_back(key);
            diff_value(old_box->get(), new_box->get(), current_path);
            current_path.pop_back();
        }
    }
}

void DiffEntryCollector::diff_vector(const ValueVector& old_vec, const ValueVector& new_vec, Path& current_path)
{
    const size_t old_size = old_vec.size();
    const size_t new_size = new_vec.size();
    const size_t common_size = std::min(old_size, new_size);

    for (size_t i = 0; i < common_size && !done(); ++i) {
        const auto& old_box = old_vec[i];
        const auto& new_box = new_vec[i];

        if (&old_box.get() == &new_box.get() && !report_unchanged_) [[likely]] {
            continue;
        }

        current_path.push_back(i);
        diff_value(*old_box, *new_box, current_path);
        current_path.pop_back();
    }

    // Removed tail elements
    for (size_t i = common_size; i < old_size && !done(); ++i) {
        current_path.push_back(i);
        record(DiffEntry::Type::Remove, current_path, *old_vec[i], *old_vec[i]);
        current_path.pop_back();
    }

    // Added tail elements
    for (size_t i = common_size; i < new_size && !done(); ++i) {
        current_path.push_back(i);
        record(DiffEntry::Type::Add, current_path, *new_vec[i], *new_vec[i]);
        current_path.pop_back();
    }
}

// ============================================================
// has_any_difference
// ============================================================

bool has_any_difference(const Value& old_val, const Value& new_val, bool recursive)
{
    if (&old_val.data == &new_val.data) {
        return false;
    }
    DiffEntryCollector collector;
    collector.diff(old_val, new_val, DiffOptions{.recursive = recursive, .stop_at_first = true});
    return collector.has_changes();
}

} // namespace geo_nodes
