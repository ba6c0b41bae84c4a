// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// comparison.cpp - TreeComparator and result queries

#include <jsoncmp/comparison.h>
#include <jsoncmp/json_pointer.h>

#include <algorithm>
#include <cmath>

namespace jsoncmp {

namespace {

// 2^63 as a double; every double in [-2^63, 2^63) converts to int64_t exactly
constexpr double kInt64Bound = 9223372036854775808.0;

bool int_equals_double(std::int64_t i, double d)
{
    if (!std::isfinite(d) || d != std::trunc(d)) {
        return false;
    }
    if (d < -kInt64Bound || d >= kInt64Bound) {
        return false;
    }
    return static_cast<std::int64_t>(d) == i;
}

ComparisonNode missing_node(std::string field, const Value& present, bool in_first,
                            const RenderOptions& render)
{
    ComparisonNode node;
    node.field_path = std::move(field);
    if (in_first) {
        node.value1 = render_value(present, render);
        node.type1 = present.kind();
        node.status = NodeStatus::MissingInSecond;
    } else {
        node.value2 = render_value(present, render);
        node.type2 = present.kind();
        node.status = NodeStatus::MissingInFirst;
    }
    node.matched = false;
    return node;
}

void finish_container(ComparisonNode& node, ComparisonResult children)
{
    node.value1 = std::string{};
    node.value2 = std::string{};
    node.matched = std::all_of(children.begin(), children.end(),
                               [](const ComparisonNode& c) { return c.matched; });
    node.status = node.matched ? NodeStatus::Match : NodeStatus::ChildMismatch;
    node.children = std::move(children);
}

bool parse_index(const std::string& label, std::size_t& index)
{
    if (label.empty()) {
        return false;
    }
    index = 0;
    for (char c : label) {
        if (c < '0' || c > '9') {
            return false;
        }
        index = index * 10 + static_cast<std::size_t>(c - '0');
    }
    return true;
}

void collect_mismatches_impl(const ComparisonResult& nodes, bool parent_is_array,
                             Path& current_path, std::vector<Mismatch>& out)
{
    for (const auto& node : nodes) {
        std::size_t index = 0;
        if (parent_is_array && parse_index(node.field_path, index)) {
            current_path.push_back(index);
        } else {
            current_path.push_back(node.field_path);
        }

        if (node.is_container()) {
            if (!node.matched) {
                collect_mismatches_impl(node.children, *node.type1 == JsonType::Array,
                                        current_path, out);
            }
        } else if (!node.matched) {
            out.push_back(Mismatch{current_path, &node});
        }

        current_path.pop_back();
    }
}

std::size_t count_nodes_impl(const ComparisonResult& nodes)
{
    std::size_t total = nodes.size();
    for (const auto& node : nodes) {
        total += count_nodes_impl(node.children);
    }
    return total;
}

} // anonymous namespace

// ============================================================
// TreeComparator
// ============================================================

ComparisonResult TreeComparator::compare(const Value& doc1, const Value& doc2) const
{
    const auto* obj1 = doc1.get_if<ValueObject>();
    const auto* obj2 = doc2.get_if<ValueObject>();
    if (!obj1 || !obj2) {
        throw InvalidRootType(doc1.kind(), doc2.kind());
    }
    return compare_objects(*obj1, *obj2);
}

ComparisonResult TreeComparator::compare_objects(const ValueObject& obj1, const ValueObject& obj2) const
{
    ComparisonResult nodes;
    nodes.reserve(obj1.size());

    for (const auto& member : obj1) {
        nodes.push_back(compare_field(member.key, &member.value.get(), obj2.find(member.key)));
    }
    for (const auto& member : obj2) {
        if (!obj1.contains(member.key)) {
            nodes.push_back(compare_field(member.key, nullptr, &member.value.get()));
        }
    }
    return nodes;
}

ComparisonResult TreeComparator::compare_arrays(const ValueArray& arr1, const ValueArray& arr2) const
{
    const std::size_t count = std::max(arr1.size(), arr2.size());
    ComparisonResult nodes;
    nodes.reserve(count);

    for (std::size_t i = 0; i < count; ++i) {
        const Value* v1 = i < arr1.size() ? &arr1[i].get() : nullptr;
        const Value* v2 = i < arr2.size() ? &arr2[i].get() : nullptr;
        nodes.push_back(compare_field(std::to_string(i), v1, v2));
    }
    return nodes;
}

ComparisonNode TreeComparator::compare_field(std::string field, const Value* v1, const Value* v2) const
{
    if (!v2) {
        return missing_node(std::move(field), *v1, true, options_.render);
    }
    if (!v1) {
        return missing_node(std::move(field), *v2, false, options_.render);
    }

    ComparisonNode node;
    node.field_path = std::move(field);
    node.type1 = v1->kind();
    node.type2 = v2->kind();

    if (*node.type1 != *node.type2) [[unlikely]] {
        node.value1 = render_value(*v1, options_.render);
        node.value2 = render_value(*v2, options_.render);
        node.matched = false;
        node.status = NodeStatus::TypeMismatch;
        return node;
    }

    std::visit([&](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, ValueObject>) {
            finish_container(node, compare_objects(arg, std::get<ValueObject>(v2->data)));
        } else if constexpr (std::is_same_v<T, ValueArray>) {
            finish_container(node, compare_arrays(arg, std::get<ValueArray>(v2->data)));
        } else if constexpr (std::is_same_v<T, std::monostate> ||
                             std::is_same_v<T, bool> ||
                             std::is_same_v<T, std::int64_t> ||
                             std::is_same_v<T, double> ||
                             std::is_same_v<T, std::string>) {
            node.value1 = render_value(*v1, options_.render);
            node.value2 = render_value(*v2, options_.render);
            node.matched = scalars_equal(*v1, *v2);
            node.status = node.matched ? NodeStatus::Match : NodeStatus::ValueMismatch;
        } else {
            static_assert(detail::always_false_v<T>, "unhandled Value alternative");
        }
    }, v1->data);

    return node;
}

bool TreeComparator::scalars_equal(const Value& v1, const Value& v2) const
{
    if (v1.is_number()) {
        return numbers_equal(v1, v2, options_.numeric);
    }
    return v1 == v2;
}

// ============================================================
// Free functions
// ============================================================

ComparisonResult compare(const Value& doc1, const Value& doc2, const CompareOptions& options)
{
    return TreeComparator{options}.compare(doc1, doc2);
}

ComparisonResult compare_json(std::string_view text1, std::string_view text2,
                              const CompareOptions& options, const ParseOptions& parse_options)
{
    Value doc1 = parse_json(text1, parse_options);
    Value doc2 = parse_json(text2, parse_options);
    return compare(doc1, doc2, options);
}

bool numbers_equal(const Value& a, const Value& b, NumericEquality policy)
{
    if (auto* ia = a.get_if<std::int64_t>()) {
        if (auto* ib = b.get_if<std::int64_t>()) {
            return *ia == *ib;
        }
        if (auto* db = b.get_if<double>()) {
            return policy == NumericEquality::ByValue && int_equals_double(*ia, *db);
        }
        return false;
    }
    if (auto* da = a.get_if<double>()) {
        if (auto* db = b.get_if<double>()) {
            return *da == *db;
        }
        if (auto* ib = b.get_if<std::int64_t>()) {
            return policy == NumericEquality::ByValue && int_equals_double(*ib, *da);
        }
    }
    return false;
}

bool all_matched(const ComparisonResult& result)
{
    return std::all_of(result.begin(), result.end(),
                       [](const ComparisonNode& node) { return node.matched; });
}

std::size_t count_nodes(const ComparisonResult& result)
{
    return count_nodes_impl(result);
}

std::vector<Mismatch> collect_mismatches(const ComparisonResult& result)
{
    std::vector<Mismatch> out;
    Path current_path;
    current_path.reserve(16);
    collect_mismatches_impl(result, false, current_path, out);
    return out;
}

const ComparisonNode* find_node(const ComparisonResult& result, const Path& path)
{
    if (path.empty()) {
        return nullptr;
    }

    const ComparisonResult* level = &result;
    const ComparisonNode* found = nullptr;
    for (const auto& elem : path) {
        const std::string label = path_element_label(elem);
        auto it = std::find_if(level->begin(), level->end(),
                               [&](const ComparisonNode& node) { return node.field_path == label; });
        if (it == level->end()) {
            return nullptr;
        }
        found = &*it;
        level = &it->children;
    }
    return found;
}

const ComparisonNode* find_node(const ComparisonResult& result, std::string_view pointer)
{
    return find_node(result, parse_json_pointer(pointer));
}

} // namespace jsoncmp
