#pragma once

#include "model/Category.hpp"
#include "model/Record.hpp"
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace strata::model {

/// Group value for records where no key alternative yields a value.
inline constexpr const char* UNGROUPED = "__NONE__";

struct TaxonomyNode;

struct TaxonomyBranch {
    std::vector<TaxonomyNode> children;  // Sorted by group_value

    // Out of line: TaxonomyNode is incomplete here.
    bool operator==(const TaxonomyBranch& other) const;
};

struct TaxonomyLeaf {
    std::vector<Record> members;              // Disk, track, path, title order
    AttributeMap representative_attributes;   // First member minus per-item tags

    bool operator==(const TaxonomyLeaf&) const = default;
};

/// One grouping level. Whether it is a branch or a leaf is decided by the
/// number of key specs left when it is built and never changes afterwards.
struct TaxonomyNode {
    KeySpec key;
    std::string group_value;
    bool ungrouped = false;
    std::variant<TaxonomyBranch, TaxonomyLeaf> content;

    bool is_leaf() const { return std::holds_alternative<TaxonomyLeaf>(content); }
    const TaxonomyBranch& branch() const { return std::get<TaxonomyBranch>(content); }
    TaxonomyBranch& branch() { return std::get<TaxonomyBranch>(content); }
    const TaxonomyLeaf& leaf() const { return std::get<TaxonomyLeaf>(content); }
    TaxonomyLeaf& leaf() { return std::get<TaxonomyLeaf>(content); }

    /// Child with the given group value, or nullptr (branches only).
    const TaxonomyNode* child(const std::string& value) const;

    bool operator==(const TaxonomyNode&) const = default;
};

/// Top level of a category tree, sorted by group value.
using Taxonomy = std::vector<TaxonomyNode>;

const TaxonomyNode* find_group(const Taxonomy& taxonomy, const std::string& value);

/// Number of records reachable from the tree.
size_t count_members(const Taxonomy& taxonomy);

enum class CategoryKind {
    Primary,
    Secondary,
};

struct CategoryResult {
    CategoryKind kind = CategoryKind::Primary;
    std::string code;
    std::string name;
    std::optional<std::string> inherits;
    std::vector<KeySpec> taxonomy;
    std::optional<std::string> sort;
    Taxonomy groups;

    bool operator==(const CategoryResult&) const = default;
};

struct PlaylistTrack {
    std::string path;               // Normalized to the record key convention
    std::optional<Record> record;   // Empty => unresolved reference

    bool resolved() const { return record.has_value(); }

    bool operator==(const PlaylistTrack&) const = default;
};

struct Playlist {
    std::string id;
    std::string title;
    std::string source;
    std::vector<PlaylistTrack> tracks;

    bool operator==(const Playlist&) const = default;
};

struct Catalogue {
    std::vector<CategoryResult> categories;
    std::vector<Playlist> playlists;
    std::string tree_hash;
    int64_t generated_at = 0;  // ms since epoch

    bool operator==(const Catalogue&) const = default;
};

}  // namespace strata::model
