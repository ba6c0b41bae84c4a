// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file comparison.h
/// @brief Field-by-field comparison of two JSON object documents.
///
/// TreeComparator walks two Value trees in lockstep and produces one
/// ComparisonNode per field, mirroring the union of both structures:
///
/// @code
///   Value a = parse_json(R"({"id": 1, "tags": ["x"]})");
///   Value b = parse_json(R"({"id": 2, "tags": ["x", "y"]})");
///
///   ComparisonResult result = compare(a, b);
///   // result[0]: field "id",   value1 "1", value2 "2", ValueMismatch
///   // result[1]: field "tags", ChildMismatch, children "0" (Match), "1" (MissingInFirst)
/// @endcode
///
/// Children order: keys of the first object in order, then keys found only
/// in the second object in its order. Arrays are compared by position.

#pragma once

#include <jsoncmp/api.h>
#include <jsoncmp/errors.h>
#include <jsoncmp/render.h>
#include <jsoncmp/serialization.h>
#include <jsoncmp/value.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jsoncmp {

/// How an integer literal compares against a floating literal
enum class NumericEquality : std::uint8_t {
    ByValue,          ///< 1 == 1.0
    ByRepresentation  ///< 1 != 1.0; integers only equal integers
};

struct CompareOptions {
    NumericEquality numeric = NumericEquality::ByValue;
    RenderOptions render{};
};

enum class NodeStatus : std::uint8_t {
    Match,
    MissingInFirst,   ///< field only exists in the second document
    MissingInSecond,  ///< field only exists in the first document
    TypeMismatch,
    ValueMismatch,
    ChildMismatch     ///< container present on both sides with a differing descendant
};

// ============================================================
// ComparisonNode - one field of the merged tree
// ============================================================
struct ComparisonNode {
    /// Key (object member) or decimal index (array element) at this level
    std::string field_path;

    /// Rendering of each side; nullopt when the field is absent on that side.
    /// Container nodes carry an empty string on both sides.
    std::optional<std::string> value1;
    std::optional<std::string> value2;

    std::optional<JsonType> type1;
    std::optional<JsonType> type2;

    /// True iff this node and every node beneath it agree
    bool matched = false;
    NodeStatus status = NodeStatus::Match;

    std::vector<ComparisonNode> children;

    [[nodiscard]] bool is_leaf() const noexcept { return !is_container(); }
    [[nodiscard]] bool is_container() const noexcept {
        return type1 && type2 && *type1 == *type2 &&
               (*type1 == JsonType::Object || *type1 == JsonType::Array);
    }
};

using ComparisonResult = std::vector<ComparisonNode>;

// ============================================================
// TreeComparator
//
// Stateless apart from its options; compare() may be called
// concurrently from several threads on shared inputs.
// ============================================================
class JSONCMP_API TreeComparator {
public:
    explicit TreeComparator(CompareOptions options = {}) : options_(std::move(options)) {}

    /// Compare two object documents
    /// @throws InvalidRootType if either document is not an object
    [[nodiscard]] ComparisonResult compare(const Value& doc1, const Value& doc2) const;

    [[nodiscard]] const CompareOptions& options() const noexcept { return options_; }

private:
    [[nodiscard]] ComparisonResult compare_objects(const ValueObject& obj1, const ValueObject& obj2) const;
    [[nodiscard]] ComparisonResult compare_arrays(const ValueArray& arr1, const ValueArray& arr2) const;
    [[nodiscard]] ComparisonNode compare_field(std::string field, const Value* v1, const Value* v2) const;
    [[nodiscard]] bool scalars_equal(const Value& v1, const Value& v2) const;

    CompareOptions options_;
};

/// Shorthand for TreeComparator{options}.compare(doc1, doc2)
[[nodiscard]] JSONCMP_API ComparisonResult compare(const Value& doc1, const Value& doc2,
                                                   const CompareOptions& options = {});

/// Parse both texts, then compare them
/// @throws JsonParseError before any comparison if either text is malformed
/// @throws InvalidRootType if either document is not an object
[[nodiscard]] JSONCMP_API ComparisonResult compare_json(std::string_view text1, std::string_view text2,
                                                        const CompareOptions& options = {},
                                                        const ParseOptions& parse_options = {});

/// Whether two numbers are equal under the given policy.
/// Integer vs double under ByValue is exact: the double must be integral
/// and convert back to the same int64_t.
[[nodiscard]] JSONCMP_API bool numbers_equal(const Value& a, const Value& b, NumericEquality policy);

// ============================================================
// Queries over a comparison result
// ============================================================

/// True when every top-level node matched (an empty result matches)
[[nodiscard]] JSONCMP_API bool all_matched(const ComparisonResult& result);

/// Total node count, recursively
[[nodiscard]] JSONCMP_API std::size_t count_nodes(const ComparisonResult& result);

/// A leaf that did not match, with its position in the tree
struct Mismatch {
    Path path;
    const ComparisonNode* node = nullptr;
};

/// Depth-first list of mismatched leaves. Array children contribute
/// index elements to the path, object children key elements.
[[nodiscard]] JSONCMP_API std::vector<Mismatch> collect_mismatches(const ComparisonResult& result);

/// Node at path, nullptr when there is none.
/// An index element matches an array child label ("0", "1", ...).
[[nodiscard]] JSONCMP_API const ComparisonNode* find_node(const ComparisonResult& result, const Path& path);

/// Node addressed by a JSON Pointer such as "/users/0/name"
[[nodiscard]] JSONCMP_API const ComparisonNode* find_node(const ComparisonResult& result, std::string_view pointer);

} // namespace jsoncmp
