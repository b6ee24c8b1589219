#include "backend/Serialization.hpp"
#include "backend/Errors.hpp"
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <algorithm>
#include <cmath>

namespace strata::backend {

using JsonWriter = rapidjson::Writer<rapidjson::StringBuffer>;

namespace {

// ---------------------------------------------------------------------------
// Writing
// ---------------------------------------------------------------------------

void write_string(JsonWriter& w, const std::string& s) {
    w.String(s.data(), static_cast<rapidjson::SizeType>(s.size()));
}

void write_value(JsonWriter& w, const model::AttributeValue& value) {
    if (const auto* b = std::get_if<bool>(&value)) {
        w.Bool(*b);
    } else if (const auto* i = std::get_if<int64_t>(&value)) {
        w.Int64(*i);
    } else if (const auto* d = std::get_if<double>(&value)) {
        if (std::isfinite(*d)) w.Double(*d);
        else w.Null();
    } else if (const auto* s = std::get_if<std::string>(&value)) {
        write_string(w, *s);
    } else {
        w.StartArray();
        for (const auto& item : std::get<std::vector<std::string>>(value)) {
            write_string(w, item);
        }
        w.EndArray();
    }
}

void write_attributes(JsonWriter& w, const model::AttributeMap& attrs) {
    w.StartObject();
    for (const auto& [key, value] : attrs) {
        write_string(w, key);
        write_value(w, value);
    }
    w.EndObject();
}

void write_record(JsonWriter& w, const model::Record& r) {
    w.StartObject();
    w.Key("file"); write_string(w, r.path);
    w.Key("tags"); write_attributes(w, r.attributes);
    w.Key("category"); write_attributes(w, r.category_attributes);
    w.Key("format"); write_attributes(w, r.format_info);
    w.Key("meta");
    w.StartObject();
    w.Key("category");
    if (r.category_code) write_string(w, *r.category_code);
    else w.Null();
    w.EndObject();
    w.Key("mtime"); w.Int64(r.modified_time);
    w.Key("time"); w.Int64(r.scanned_at);
    w.Key("ext"); write_string(w, r.extension);
    if (r.error) {
        w.Key("error"); write_string(w, *r.error);
    }
    w.EndObject();
}

void write_key_spec(JsonWriter& w, const model::KeySpec& key) {
    w.StartArray();
    for (const auto& alt : key.alternatives) write_string(w, alt);
    w.EndArray();
}

void write_node(JsonWriter& w, const model::TaxonomyNode& node) {
    w.StartObject();
    w.Key("key"); write_key_spec(w, node.key);
    w.Key("data"); write_string(w, node.group_value);
    w.Key("isNullCollection"); w.Bool(node.ungrouped);
    w.Key("isEndNode"); w.Bool(node.is_leaf());
    if (node.is_leaf()) {
        const auto& leaf = node.leaf();
        w.Key("tags"); write_attributes(w, leaf.representative_attributes);
        w.Key("items");
        w.StartArray();
        for (const auto& member : leaf.members) write_record(w, member);
        w.EndArray();
    } else {
        w.Key("items");
        w.StartArray();
        for (const auto& child : node.branch().children) write_node(w, child);
        w.EndArray();
    }
    w.EndObject();
}

void write_category(JsonWriter& w, const model::CategoryResult& cat) {
    w.StartObject();
    w.Key("type"); w.String(cat.kind == model::CategoryKind::Primary ? "primary" : "secondary");
    w.Key("code"); write_string(w, cat.code);
    w.Key("name"); write_string(w, cat.name);
    if (cat.inherits) {
        w.Key("inherits"); write_string(w, *cat.inherits);
    }
    w.Key("taxonomy");
    w.StartArray();
    for (const auto& key : cat.taxonomy) write_key_spec(w, key);
    w.EndArray();
    if (cat.sort) {
        w.Key("sort"); write_string(w, *cat.sort);
    }
    w.Key("items");
    w.StartArray();
    for (const auto& node : cat.groups) write_node(w, node);
    w.EndArray();
    w.EndObject();
}

void write_playlist(JsonWriter& w, const model::Playlist& pl) {
    w.StartObject();
    w.Key("id"); write_string(w, pl.id);
    w.Key("title"); write_string(w, pl.title);
    w.Key("file"); write_string(w, pl.source);
    w.Key("tracks");
    w.StartArray();
    for (const auto& track : pl.tracks) {
        w.StartObject();
        w.Key("file"); write_string(w, track.path);
        w.Key("resolved"); w.Bool(track.resolved());
        w.Key("record");
        if (track.record) write_record(w, *track.record);
        else w.Null();
        w.EndObject();
    }
    w.EndArray();
    w.EndObject();
}

// ---------------------------------------------------------------------------
// Reading
// ---------------------------------------------------------------------------

[[noreturn]] void corrupt(const std::string& what) {
    throw CacheCorruptionError("Malformed state: " + what);
}

const rapidjson::Value& member(const rapidjson::Value& obj, const char* name) {
    auto it = obj.FindMember(name);
    if (it == obj.MemberEnd()) corrupt(std::string("missing '") + name + "'");
    return it->value;
}

const rapidjson::Value& object_member(const rapidjson::Value& obj, const char* name) {
    const auto& v = member(obj, name);
    if (!v.IsObject()) corrupt(std::string("'") + name + "' is not an object");
    return v;
}

const rapidjson::Value& array_member(const rapidjson::Value& obj, const char* name) {
    const auto& v = member(obj, name);
    if (!v.IsArray()) corrupt(std::string("'") + name + "' is not an array");
    return v;
}

std::string string_member(const rapidjson::Value& obj, const char* name) {
    const auto& v = member(obj, name);
    if (!v.IsString()) corrupt(std::string("'") + name + "' is not a string");
    return std::string(v.GetString(), v.GetStringLength());
}

std::optional<std::string> optional_string(const rapidjson::Value& obj, const char* name) {
    auto it = obj.FindMember(name);
    if (it == obj.MemberEnd() || it->value.IsNull()) return std::nullopt;
    if (!it->value.IsString()) corrupt(std::string("'") + name + "' is not a string");
    return std::string(it->value.GetString(), it->value.GetStringLength());
}

int64_t int_member(const rapidjson::Value& obj, const char* name) {
    const auto& v = member(obj, name);
    if (!v.IsInt64()) corrupt(std::string("'") + name + "' is not an integer");
    return v.GetInt64();
}

bool bool_member(const rapidjson::Value& obj, const char* name) {
    const auto& v = member(obj, name);
    if (!v.IsBool()) corrupt(std::string("'") + name + "' is not a boolean");
    return v.GetBool();
}

model::AttributeMap read_attributes(const rapidjson::Value& obj) {
    model::AttributeMap attrs;
    for (auto it = obj.MemberBegin(); it != obj.MemberEnd(); ++it) {
        std::string key(it->name.GetString(), it->name.GetStringLength());
        const auto& v = it->value;
        if (v.IsNull()) continue;
        if (v.IsBool()) {
            attrs[key] = v.GetBool();
        } else if (v.IsString()) {
            attrs[key] = std::string(v.GetString(), v.GetStringLength());
        } else if (v.IsDouble()) {
            attrs[key] = v.GetDouble();
        } else if (v.IsInt64()) {
            attrs[key] = v.GetInt64();
        } else if (v.IsArray()) {
            std::vector<std::string> items;
            for (const auto& item : v.GetArray()) {
                if (!item.IsString()) corrupt("list attribute '" + key + "' holds a non-string");
                items.emplace_back(item.GetString(), item.GetStringLength());
            }
            attrs[key] = std::move(items);
        } else {
            corrupt("attribute '" + key + "' has an unsupported type");
        }
    }
    return attrs;
}

model::Record read_record(const rapidjson::Value& obj) {
    if (!obj.IsObject()) corrupt("record is not an object");
    model::Record r;
    r.path = string_member(obj, "file");
    r.attributes = read_attributes(object_member(obj, "tags"));
    r.category_attributes = read_attributes(object_member(obj, "category"));
    r.format_info = read_attributes(object_member(obj, "format"));
    r.category_code = optional_string(object_member(obj, "meta"), "category");
    r.modified_time = int_member(obj, "mtime");
    r.scanned_at = int_member(obj, "time");
    r.extension = string_member(obj, "ext");
    r.error = optional_string(obj, "error");
    return r;
}

model::KeySpec read_key_spec(const rapidjson::Value& v) {
    if (!v.IsArray()) corrupt("key spec is not an array");
    model::KeySpec key;
    for (const auto& alt : v.GetArray()) {
        if (!alt.IsString()) corrupt("key spec alternative is not a string");
        key.alternatives.emplace_back(alt.GetString(), alt.GetStringLength());
    }
    return key;
}

model::TaxonomyNode read_node(const rapidjson::Value& obj) {
    if (!obj.IsObject()) corrupt("taxonomy node is not an object");
    model::TaxonomyNode node;
    node.key = read_key_spec(member(obj, "key"));
    node.group_value = string_member(obj, "data");
    node.ungrouped = bool_member(obj, "isNullCollection");

    const auto& items = array_member(obj, "items");
    if (bool_member(obj, "isEndNode")) {
        model::TaxonomyLeaf leaf;
        leaf.representative_attributes = read_attributes(object_member(obj, "tags"));
        for (const auto& item : items.GetArray()) leaf.members.push_back(read_record(item));
        node.content = std::move(leaf);
    } else {
        model::TaxonomyBranch branch;
        for (const auto& item : items.GetArray()) branch.children.push_back(read_node(item));
        node.content = std::move(branch);
    }
    return node;
}

model::CategoryResult read_category(const rapidjson::Value& obj) {
    if (!obj.IsObject()) corrupt("category is not an object");
    model::CategoryResult cat;
    auto type = string_member(obj, "type");
    if (type == "primary") cat.kind = model::CategoryKind::Primary;
    else if (type == "secondary") cat.kind = model::CategoryKind::Secondary;
    else corrupt("unknown category type '" + type + "'");
    cat.code = string_member(obj, "code");
    cat.name = string_member(obj, "name");
    cat.inherits = optional_string(obj, "inherits");
    for (const auto& key : array_member(obj, "taxonomy").GetArray()) {
        cat.taxonomy.push_back(read_key_spec(key));
    }
    cat.sort = optional_string(obj, "sort");
    for (const auto& node : array_member(obj, "items").GetArray()) {
        cat.groups.push_back(read_node(node));
    }
    return cat;
}

model::Playlist read_playlist(const rapidjson::Value& obj) {
    if (!obj.IsObject()) corrupt("playlist is not an object");
    model::Playlist pl;
    pl.id = string_member(obj, "id");
    pl.title = string_member(obj, "title");
    pl.source = string_member(obj, "file");
    for (const auto& t : array_member(obj, "tracks").GetArray()) {
        if (!t.IsObject()) corrupt("playlist track is not an object");
        model::PlaylistTrack track;
        track.path = string_member(t, "file");
        const auto& rec = member(t, "record");
        if (!rec.IsNull()) track.record = read_record(rec);
        pl.tracks.push_back(std::move(track));
    }
    return pl;
}

void parse_document(rapidjson::Document& doc, const std::string& json) {
    doc.Parse<rapidjson::kParseFullPrecisionFlag>(json.c_str(), json.size());
    if (doc.HasParseError()) {
        corrupt(std::string(rapidjson::GetParseError_En(doc.GetParseError())) +
                " at offset " + std::to_string(doc.GetErrorOffset()));
    }
    if (!doc.IsObject()) corrupt("document root is not an object");
    if (int_member(doc, "version") != STATE_VERSION) {
        corrupt("unsupported version " + std::to_string(int_member(doc, "version")));
    }
}

}  // namespace

std::string encode_records(const model::RecordMap& records) {
    std::vector<const model::Record*> ordered;
    ordered.reserve(records.size());
    for (const auto& [path, record] : records) ordered.push_back(&record);
    std::sort(ordered.begin(), ordered.end(),
              [](const model::Record* a, const model::Record* b) { return a->path < b->path; });

    rapidjson::StringBuffer buffer;
    JsonWriter w(buffer);
    w.StartObject();
    w.Key("version"); w.Int(STATE_VERSION);
    w.Key("records");
    w.StartObject();
    for (const auto* record : ordered) {
        write_string(w, record->path);
        write_record(w, *record);
    }
    w.EndObject();
    w.EndObject();
    return std::string(buffer.GetString(), buffer.GetSize());
}

model::RecordMap decode_records(const std::string& json) {
    rapidjson::Document doc;
    parse_document(doc, json);

    model::RecordMap records;
    const auto& obj = object_member(doc, "records");
    for (auto it = obj.MemberBegin(); it != obj.MemberEnd(); ++it) {
        std::string key(it->name.GetString(), it->name.GetStringLength());
        auto record = read_record(it->value);
        if (record.path != key) corrupt("record key '" + key + "' does not match its path");
        records.emplace(std::move(key), std::move(record));
    }
    return records;
}

std::string encode_catalogue(const model::Catalogue& catalogue) {
    rapidjson::StringBuffer buffer;
    JsonWriter w(buffer);
    w.StartObject();
    w.Key("version"); w.Int(STATE_VERSION);
    w.Key("generatedAt"); w.Int64(catalogue.generated_at);
    w.Key("treeHash"); write_string(w, catalogue.tree_hash);
    w.Key("categories");
    w.StartArray();
    for (const auto& cat : catalogue.categories) write_category(w, cat);
    w.EndArray();
    w.Key("playlists");
    w.StartArray();
    for (const auto& pl : catalogue.playlists) write_playlist(w, pl);
    w.EndArray();
    w.EndObject();
    return std::string(buffer.GetString(), buffer.GetSize());
}

model::Catalogue decode_catalogue(const std::string& json) {
    rapidjson::Document doc;
    parse_document(doc, json);

    model::Catalogue catalogue;
    catalogue.generated_at = int_member(doc, "generatedAt");
    catalogue.tree_hash = string_member(doc, "treeHash");
    for (const auto& cat : array_member(doc, "categories").GetArray()) {
        catalogue.categories.push_back(read_category(cat));
    }
    for (const auto& pl : array_member(doc, "playlists").GetArray()) {
        catalogue.playlists.push_back(read_playlist(pl));
    }
    return catalogue;
}

}  // namespace strata::backend
