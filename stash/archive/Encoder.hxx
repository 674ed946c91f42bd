/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#pragma once

#include <stash/archive/Metadata.hxx>
#include <stash/archive/Registry.hxx>
#include <stash/archive/IdentityTracker.hxx>
#include <stash/json/json.hxx>
#include <stash/support/Finally.hxx>
#include <stash/support/logging.hxx>

#include <fmt/format.h>
#include <tsl/ordered_map.h>

#include <unordered_set>

namespace stash {

using PayloadMap = tsl::ordered_map<String, Bytes>;

/////////////////////////////////////////////////////////////////////////////
/// Returns the name of the container member holding the payload of the
/// node at `path`.
/// - The path text is escaped so that it contains no directory separators.
/////////////////////////////////////////////////////////////////////////////
inline
String member_name(const String& path, const String& extension) {
    String name;
    name.reserve(path.size() + extension.size() + 1);
    for (char c : path) {
        switch (c) {
            case '%':  name.append("%25"); break;
            case '/':  name.append("%2F"); break;
            case '\\': name.append("%5C"); break;
            default:   name.push_back(c); break;
        }
    }
    name.push_back('.');
    name.append(extension);
    return name;
}

/////////////////////////////////////////////////////////////////////////////
/// Walks values of a write session, filling the metadata index and the
/// payload members.
/// - Each top-level value is encoded in one pass.  The descriptor of a node
///   is added before its children, so the index lists parents first.
/// - A failed @ref put leaves the session as it was before the call.
/////////////////////////////////////////////////////////////////////////////
class Encoder
{
  public:
    Encoder(const Ref<TypeRegistry>& r_registry, Metadata& metadata, bool track_identity)
      : mr_registry{r_registry}
      , m_metadata{metadata}
      , m_tracker{track_identity}
    {}

    Encoder(const Encoder&) = delete;
    Encoder& operator = (const Encoder&) = delete;

    void put(const String& name, const Value& value);
    void reset_ids() { m_tracker.reset(); }

    const PayloadMap& payloads() const { return m_payloads; }

  private:
    void encode(const Value& value, const Path& path);
    void add_payload(Descriptor& desc, const String& path, Encoding& encoding);

  private:
    Ref<TypeRegistry> mr_registry;
    Metadata& m_metadata;
    IdentityTracker m_tracker;
    PayloadMap m_payloads;
    std::unordered_set<const void*> m_in_progress;
};

inline
void Encoder::put(const String& name, const Value& value) {
    auto tracker_cp = m_tracker.checkpoint();
    auto metadata_cp = m_metadata.checkpoint();
    auto n_payloads = m_payloads.size();

    Finally rollback{[&] () {
        m_tracker.rollback(tracker_cp);
        m_metadata.rollback(metadata_cp, tracker_cp.next_ref_id);
        while (m_payloads.size() > n_payloads)
            m_payloads.pop_back();
        m_in_progress.clear();
    }};

    encode(value, Path{KeyList{Key{name}}});
    m_metadata.add_root(name);
    rollback.cancel();
}

inline
void Encoder::encode(const Value& value, const Path& path) {
    auto path_text = path.to_str();

    bool participates = IdentityTracker::participates(value);
    if (participates && m_in_progress.count(value.id()) > 0)
        throw StashException{fmt::format("Object contains itself, path={}", path_text)};

    auto seen = m_tracker.mark_seen(value, path_text);
    if (!seen.is_first) {
        if (seen.is_new_ref) m_metadata.set_ref(seen.ref_id, seen.canonical_path);
        STASH_DEBUG("Alias {} -> {} (ref {})", path_text, seen.canonical_path, seen.ref_id);
        m_metadata.add_node(path_text, Descriptor::alias(seen.ref_id));
        return;
    }

    auto [type_tag, r_codec] = mr_registry->resolve_for_encode(value, path);
    auto encoding = r_codec->encode(value);

    Descriptor desc;
    desc.type_tag = type_tag;
    desc.kind = encoding.kind;

    if (encoding.payload) {
        add_payload(desc, path_text, encoding);
    } else if (!encoding.inline_value.is_empty()) {
        if (!json::is_json(encoding.inline_value))
            throw StashException{fmt::format("Inline value is not JSON, path={}, type_tag={}", path_text, type_tag)};
        desc.location = Location::INLINE;
        desc.value = encoding.inline_value;
    }

    auto& children = encoding.children;
    switch (encoding.kind) {
        case ContainerKind::SEQUENCE: {
            if (children.type() != Value::LIST)
                throw StashException{fmt::format("Sequence children are not a list, path={}, type_tag={}", path_text, type_tag)};
            desc.length = children.size();
            break;
        }
        case ContainerKind::MAPPING:
        case ContainerKind::OBJECT: {
            if (children.type() != Value::MAP)
                throw StashException{fmt::format("Mapping children are not a map, path={}, type_tag={}", path_text, type_tag)};
            desc.keys = children.keys();
            break;
        }
        default:
            break;
    }

    m_metadata.add_node(path_text, std::move(desc));

    if (encoding.kind == ContainerKind::SCALAR) return;

    if (participates) m_in_progress.insert(value.id());
    Finally done{[this, &value, participates] () { if (participates) m_in_progress.erase(value.id()); }};

    if (encoding.kind == ContainerKind::SEQUENCE) {
        auto& list = children.as<List>();
        for (size_t i = 0; i < list.size(); ++i)
            encode(list[i], path.child(Key{i}));
    } else {
        for (auto& [key, child] : children.as<Map>())
            encode(child, path.child(Key{key}));
    }
}

inline
void Encoder::add_payload(Descriptor& desc, const String& path, Encoding& encoding) {
    auto member = member_name(path, encoding.extension);
    if (member == METADATA_MEMBER || m_payloads.find(member) != m_payloads.end())
        throw StashException{fmt::format("Payload member name collision, path={}, member={}", path, member)};

    if (!encoding.inline_value.is_empty()) {
        if (!json::is_json(encoding.inline_value))
            throw StashException{fmt::format("Inline value is not JSON, path={}, type_tag={}", path, desc.type_tag)};
        desc.value = encoding.inline_value;
    }

    desc.location = Location::EXTERNAL;
    desc.member = member;
    m_payloads.insert({member, std::move(*encoding.payload)});
}

} // namespace stash
