/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#pragma once

#include <stash/archive/Descriptor.hxx>
#include <stash/json/json.hxx>
#include <stash/support/logging.hxx>

#include <fmt/format.h>
#include <fmt/chrono.h>
#include <tsl/ordered_map.h>

#include <algorithm>
#include <cstdlib>
#include <ctime>

#define STASH_VERSION "1.0.0"

namespace stash {

constexpr auto FORMAT_NAME = "stash";
constexpr Int FORMAT_VERSION = 1;
constexpr auto METADATA_MEMBER = "__metadata__.json";
constexpr auto ROOT_NAME = "__root__";

using NodeMap = tsl::ordered_map<String, Descriptor>;

/////////////////////////////////////////////////////////////////////////////
/// The metadata index of an archive.
/// - Maps the canonical text of every stored path to its Descriptor, in the
///   order the paths were written.
/// - Maps each reference id to the path where the object is stored.
/// - Lists the top-level names, and carries user attributes and provenance.
/// - A write session builds the index and calls @ref finalize exactly once.
///   A read session obtains the index from @ref load.
/////////////////////////////////////////////////////////////////////////////
class Metadata
{
  public:
    struct Checkpoint
    {
        size_t n_nodes;
        size_t n_roots;
    };

    Metadata();

    void add_node(const String& path, Descriptor&& desc);
    const Descriptor* find(const String& path) const;
    Descriptor* find(const String& path);
    const NodeMap& nodes() const { return m_nodes; }

    void set_ref(RefId ref_id, const String& path);
    std::optional<String> ref_path(RefId ref_id) const;
    const tsl::ordered_map<RefId, String>& refs() const { return m_refs; }

    void add_root(const String& name) { m_roots.push_back(name); }
    const std::vector<String>& roots() const { return m_roots; }
    bool has_root(const String& name) const;

    Map& attributes()             { return m_attributes; }
    const Map& attributes() const { return m_attributes; }
    const Map& provenance() const { return m_provenance; }

    Checkpoint checkpoint() const { return {m_nodes.size(), m_roots.size()}; }
    void rollback(const Checkpoint& checkpoint, RefId first_discarded_ref);

    bool is_sealed() const { return m_sealed; }

    /// Seal the index and return its JSON text.
    /// @throws AlreadySealedError on the second call.
    String finalize(const String& identifier, int indent = 4);

    /// Returns the JSON text of the index without sealing it.
    String to_text(int indent = 4) const;

    /// @throws AlreadySealedError if the index is already sealed.
    void seal(const String& identifier);

    /// @throws CorruptArchiveError if the text is not a valid index.
    static Metadata load(const String& text, const String& identifier);

  private:
    static String current_user();
    static String utc_timestamp();

  private:
    NodeMap m_nodes;
    tsl::ordered_map<RefId, String> m_refs;
    std::vector<String> m_roots;
    Map m_attributes;
    Map m_provenance;
    bool m_sealed = false;
};

inline
Metadata::Metadata() {
    m_provenance.insert({"format", FORMAT_NAME});
    m_provenance.insert({"format_version", FORMAT_VERSION});
    m_provenance.insert({"library_version", STASH_VERSION});
    m_provenance.insert({"created_by", current_user()});
    m_provenance.insert({"created", utc_timestamp()});
}

inline
void Metadata::add_node(const String& path, Descriptor&& desc) {
    if (m_sealed) throw AlreadySealedError(path);
    auto [it, inserted] = m_nodes.insert({path, std::forward<Descriptor>(desc)});
    if (!inserted) throw StashException{fmt::format("Path written twice: {}", path)};
}

inline
const Descriptor* Metadata::find(const String& path) const {
    auto it = m_nodes.find(path);
    return it == m_nodes.end()? nullptr: &it->second;
}

inline
Descriptor* Metadata::find(const String& path) {
    auto it = m_nodes.find(path);
    return it == m_nodes.end()? nullptr: &it.value();
}

inline
void Metadata::set_ref(RefId ref_id, const String& path) {
    auto p_desc = find(path);
    if (p_desc == nullptr) throw StashException{fmt::format("Reference to unknown path: {}", path)};
    p_desc->ref_id = ref_id;
    m_refs.insert_or_assign(ref_id, path);
}

inline
std::optional<String> Metadata::ref_path(RefId ref_id) const {
    auto it = m_refs.find(ref_id);
    if (it == m_refs.end()) return std::nullopt;
    return it->second;
}

inline
bool Metadata::has_root(const String& name) const {
    return std::find(m_roots.begin(), m_roots.end(), name) != m_roots.end();
}

/// Discard nodes and roots added after the checkpoint, and reference ids
/// greater or equal to `first_discarded_ref`.
inline
void Metadata::rollback(const Checkpoint& checkpoint, RefId first_discarded_ref) {
    while (m_nodes.size() > checkpoint.n_nodes)
        m_nodes.pop_back();

    m_roots.resize(std::min(m_roots.size(), checkpoint.n_roots));

    std::vector<RefId> discarded;
    for (auto& [ref_id, path] : m_refs) {
        if (ref_id >= first_discarded_ref) {
            auto p_desc = find(path);
            if (p_desc != nullptr) p_desc->ref_id.reset();
            discarded.push_back(ref_id);
        }
    }
    for (auto ref_id : discarded)
        m_refs.erase(ref_id);
}

inline
String Metadata::finalize(const String& identifier, int indent) {
    if (m_sealed) throw AlreadySealedError(identifier);
    auto text = to_text(indent);
    m_sealed = true;
    return text;
}

inline
void Metadata::seal(const String& identifier) {
    if (m_sealed) throw AlreadySealedError(identifier);
    m_sealed = true;
}

inline
String Metadata::to_text(int indent) const {
    Map refs;
    for (auto& [ref_id, path] : m_refs)
        refs.insert({int_to_str(ref_id), path});

    Map nodes;
    for (auto& [path, desc] : m_nodes)
        nodes.insert({path, desc.to_json()});

    List roots;
    for (auto& name : m_roots)
        roots.push_back(name);

    Map index;
    index.insert({"provenance", m_provenance});
    index.insert({"attributes", m_attributes});
    index.insert({"roots", roots});
    index.insert({"refs", refs});
    index.insert({"nodes", nodes});

    return json::to_json(index, indent);
}

inline
Metadata Metadata::load(const String& text, const String& identifier) {
    Value index;
    try {
        index = json::parse(text);
    } catch (const parse::SyntaxError& exc) {
        throw CorruptArchiveError(identifier, fmt::format("Metadata is not valid JSON: {}", exc.message()));
    }
    if (index.type() != Value::MAP) throw CorruptArchiveError(identifier, "Metadata is not a JSON object");

    Metadata metadata;
    metadata.m_sealed = true;

    auto provenance = index.get("provenance");
    if (provenance.type() != Value::MAP) throw CorruptArchiveError(identifier, "Missing provenance");
    if (provenance.get("format") != FORMAT_NAME)
        throw CorruptArchiveError(identifier, fmt::format("Not a {} archive", FORMAT_NAME));
    auto version = provenance.get("format_version");
    if (!version.is_number()) throw CorruptArchiveError(identifier, "Missing format version");
    if (version.to_int() > FORMAT_VERSION)
        STASH_WARN("{} has format version {}, newer than {}", identifier, version.to_int(), FORMAT_VERSION);
    metadata.m_provenance = provenance.as<Map>();

    auto attributes = index.get("attributes");
    if (attributes.type() == Value::MAP)
        metadata.m_attributes = attributes.as<Map>();
    else if (attributes != nil)
        throw CorruptArchiveError(identifier, "Attributes is not a JSON object");

    auto roots = index.get("roots");
    if (roots.type() != Value::LIST) throw CorruptArchiveError(identifier, "Missing roots");
    for (auto& name : roots.as<List>()) {
        if (name.type() != Value::STR) throw CorruptArchiveError(identifier, "Root name is not a string");
        metadata.m_roots.push_back(name.as<String>());
    }

    auto nodes = index.get("nodes");
    if (nodes.type() != Value::MAP) throw CorruptArchiveError(identifier, "Missing nodes");
    for (auto& [path, json] : nodes.as<Map>())
        metadata.m_nodes.insert({path, Descriptor::from_json(json, identifier, path)});

    auto refs = index.get("refs");
    if (refs.type() != Value::MAP) throw CorruptArchiveError(identifier, "Missing refs");
    for (auto& [key, path] : refs.as<Map>()) {
        if (path.type() != Value::STR) throw CorruptArchiveError(identifier, fmt::format("Invalid ref {}", key));
        RefId ref_id;
        try {
            ref_id = str_to_int(key);
        } catch (const StashException&) {
            throw CorruptArchiveError(identifier, fmt::format("Invalid ref id '{}'", key));
        }
        metadata.m_refs.insert_or_assign(ref_id, path.as<String>());
    }

    return metadata;
}

inline
String Metadata::current_user() {
    for (auto name : {"USER", "USERNAME", "LOGNAME"}) {
        auto value = std::getenv(name);
        if (value != nullptr && *value != 0) return value;
    }
    return "unknown";
}

inline
String Metadata::utc_timestamp() {
    auto now = std::time(nullptr);
    std::tm tm;
    gmtime_r(&now, &tm);
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}Z", tm);
}

} // namespace stash
