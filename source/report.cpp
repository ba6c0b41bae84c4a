// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// report.cpp - comparison reports

#include <jsoncmp/report.h>
#include <jsoncmp/builders.h>
#include <jsoncmp/serialization.h>

namespace jsoncmp {

namespace {

Value optional_text(const std::optional<std::string>& text)
{
    return text ? Value{*text} : Value{};
}

Value optional_type(const std::optional<JsonType>& type)
{
    return type ? Value{type_name(*type)} : Value{};
}

Value nodes_to_value(const ComparisonResult& nodes)
{
    ArrayBuilder array;
    for (const auto& node : nodes) {
        ObjectBuilder object;
        object.set("field", node.field_path)
              .set("value1", optional_text(node.value1))
              .set("value2", optional_text(node.value2))
              .set("type1", optional_type(node.type1))
              .set("type2", optional_type(node.type2))
              .set("matched", node.matched)
              .set("status", status_name(node.status));
        if (node.is_container()) {
            object.set("children", nodes_to_value(node.children));
        }
        array.push_back(object.finish());
    }
    return array.finish();
}

void print_nodes(const ComparisonResult& nodes, std::ostream& os,
                 const PrintOptions& options, std::size_t depth)
{
    const std::string indent(depth * 2, ' ');
    for (const auto& node : nodes) {
        if (options.only_mismatches && node.matched) {
            continue;
        }
        os << indent << (node.matched ? '=' : '!') << ' ' << node.field_path << ':';
        if (node.is_container()) {
            os << '\n';
            print_nodes(node.children, os, options, depth + 1);
            continue;
        }
        os << ' ' << node.value1.value_or("<missing>")
           << " | " << node.value2.value_or("<missing>") << '\n';
    }
}

void summarize_nodes(const ComparisonResult& nodes, ComparisonSummary& summary)
{
    for (const auto& node : nodes) {
        ++summary.total;
        if (node.matched) {
            ++summary.matched;
        }
        switch (node.status) {
            case NodeStatus::Match:
            case NodeStatus::ChildMismatch:
                break;
            case NodeStatus::MissingInFirst:
                ++summary.missing_in_first;
                break;
            case NodeStatus::MissingInSecond:
                ++summary.missing_in_second;
                break;
            case NodeStatus::TypeMismatch:
                ++summary.type_mismatches;
                break;
            case NodeStatus::ValueMismatch:
                ++summary.value_mismatches;
                break;
        }
        summarize_nodes(node.children, summary);
    }
}

} // anonymous namespace

std::string_view status_name(NodeStatus status) noexcept
{
    switch (status) {
        case NodeStatus::Match:           return "match";
        case NodeStatus::MissingInFirst:  return "missing_in_first";
        case NodeStatus::MissingInSecond: return "missing_in_second";
        case NodeStatus::TypeMismatch:    return "type_mismatch";
        case NodeStatus::ValueMismatch:   return "value_mismatch";
        case NodeStatus::ChildMismatch:   return "child_mismatch";
    }
    return "unknown";
}

Value comparison_to_value(const ComparisonResult& result)
{
    return nodes_to_value(result);
}

std::string comparison_to_json(const ComparisonResult& result, bool compact)
{
    return to_json(comparison_to_value(result), compact);
}

void print_comparison(const ComparisonResult& result, std::ostream& os, const PrintOptions& options)
{
    if (result.empty()) {
        os << "(no fields)\n";
        return;
    }
    print_nodes(result, os, options, 0);
}

ComparisonSummary summarize(const ComparisonResult& result)
{
    ComparisonSummary summary;
    summarize_nodes(result, summary);
    summary.mismatched_leaves = summary.missing_in_first + summary.missing_in_second +
                                summary.type_mismatches + summary.value_mismatches;
    return summary;
}

} // namespace jsoncmp
