/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#pragma once

#include <stash/archive/Codec.hxx>
#include <stash/archive/IdentityTracker.hxx>
#include <stash/archive/errors.hxx>

#include <fmt/format.h>

#include <optional>

namespace stash {

enum class Location
{
    NONE,
    INLINE,
    EXTERNAL
};

/////////////////////////////////////////////////////////////////////////////
/// The metadata index record for one stored path.
/// - An alias records only the reference id of an object stored at another
///   path, and has no type tag.
/// - The children of SEQUENCE nodes are addressed by index, `0..length`.
///   The children of MAPPING and OBJECT nodes are addressed by the names in
///   `keys`, in their original order.
/// - JSON form: `{"type", "kind", "location", "value", "member", "ref",
///   "length", "keys"}`, omitting absent fields.
/////////////////////////////////////////////////////////////////////////////
struct Descriptor
{
    String type_tag;
    ContainerKind kind = ContainerKind::SCALAR;
    Location location = Location::NONE;
    Value value;
    String member;
    std::optional<RefId> ref_id;
    size_t length = 0;
    std::vector<String> keys;

    bool is_alias() const { return type_tag.size() == 0 && ref_id.has_value(); }

    static Descriptor alias(RefId ref_id) {
        Descriptor desc;
        desc.ref_id = ref_id;
        return desc;
    }

    Value to_json() const;

    /// @param identifier The archive identifier, for error reporting.
    /// @param path The index key of the descriptor, for error reporting.
    /// @throws CorruptArchiveError if the JSON is not a valid descriptor.
    static Descriptor from_json(const Value& json, const String& identifier, const String& path);
};

inline
std::string_view kind_name(ContainerKind kind) {
    switch (kind) {
        case ContainerKind::SCALAR:   return "scalar";
        case ContainerKind::SEQUENCE: return "sequence";
        case ContainerKind::MAPPING:  return "mapping";
        case ContainerKind::OBJECT:   return "object";
        default:                      throw std::logic_error("invalid container kind");
    }
}

inline
std::optional<ContainerKind> kind_from_name(const String& name) {
    if (name == "scalar")   return ContainerKind::SCALAR;
    if (name == "sequence") return ContainerKind::SEQUENCE;
    if (name == "mapping")  return ContainerKind::MAPPING;
    if (name == "object")   return ContainerKind::OBJECT;
    return std::nullopt;
}

inline
Value Descriptor::to_json() const {
    Map json;
    if (is_alias()) {
        json.insert({"ref", *ref_id});
        return json;
    }

    json.insert({"type", type_tag});
    json.insert({"kind", kind_name(kind)});
    switch (location) {
        case Location::INLINE:
            json.insert({"location", "inline"});
            json.insert({"value", value});
            break;
        case Location::EXTERNAL:
            json.insert({"location", "external"});
            json.insert({"member", member});
            if (!value.is_empty()) json.insert({"value", value});
            break;
        default:
            break;
    }
    if (ref_id) json.insert({"ref", *ref_id});
    switch (kind) {
        case ContainerKind::SEQUENCE:
            json.insert({"length", (UInt)length});
            break;
        case ContainerKind::MAPPING:
        case ContainerKind::OBJECT: {
            List key_list;
            for (auto& key : keys) key_list.push_back(key);
            json.insert({"keys", key_list});
            break;
        }
        default:
            break;
    }
    return json;
}

inline
Descriptor Descriptor::from_json(const Value& json, const String& identifier, const String& path) {
    auto error = [&identifier, &path] (std::string_view reason) {
        return CorruptArchiveError(identifier, fmt::format("{}, path={}", reason, path));
    };

    if (json.type() != Value::MAP) throw error("Descriptor is not an object");

    Descriptor desc;
    auto ref = json.get("ref");
    if (ref != nil) {
        if (ref.type() != Value::INT && ref.type() != Value::UINT) throw error("Invalid reference id");
        desc.ref_id = ref.to_int();
    }

    auto type_tag = json.get("type");
    if (type_tag == nil) {
        if (!desc.ref_id) throw error("Descriptor has neither type nor ref");
        return desc;
    }
    if (type_tag.type() != Value::STR) throw error("Invalid type tag");
    desc.type_tag = type_tag.as<String>();

    auto kind = json.get("kind");
    if (kind.type() != Value::STR) throw error("Missing container kind");
    auto opt_kind = kind_from_name(kind.as<String>());
    if (!opt_kind) throw error(fmt::format("Invalid container kind '{}'", kind.as<String>()));
    desc.kind = *opt_kind;

    auto location = json.get("location");
    if (location == nil) {
        desc.location = Location::NONE;
    } else if (location == "inline") {
        desc.location = Location::INLINE;
        if (!json.contains("value")) throw error("Inline descriptor has no value");
        desc.value = json.get("value");
    } else if (location == "external") {
        desc.location = Location::EXTERNAL;
        auto member = json.get("member");
        if (member.type() != Value::STR) throw error("External descriptor has no member");
        desc.member = member.as<String>();
        if (json.contains("value")) desc.value = json.get("value");
    } else {
        throw error("Invalid location");
    }

    switch (desc.kind) {
        case ContainerKind::SEQUENCE: {
            auto length = json.get("length");
            if (length.type() != Value::INT && length.type() != Value::UINT) throw error("Sequence has no length");
            if (length.to_int() < 0) throw error("Negative sequence length");
            desc.length = (size_t)length.to_int();
            break;
        }
        case ContainerKind::MAPPING:
        case ContainerKind::OBJECT: {
            auto keys = json.get("keys");
            if (keys.type() != Value::LIST) throw error("Mapping has no keys");
            for (auto& key : keys.as<List>()) {
                if (key.type() != Value::STR) throw error("Mapping key is not a string");
                desc.keys.push_back(key.as<String>());
            }
            break;
        }
        default:
            break;
    }

    return desc;
}

} // namespace stash
