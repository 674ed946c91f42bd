/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#pragma once

#include <stash/archive/Metadata.hxx>
#include <stash/archive/Registry.hxx>
#include <stash/storage/Storage.hxx>
#include <stash/storage/ZipContainer.hxx>
#include <stash/support/Finally.hxx>
#include <stash/support/logging.hxx>

#include <fmt/format.h>

#include <algorithm>
#include <memory>
#include <unordered_map>
#include <unordered_set>

namespace stash {

/////////////////////////////////////////////////////////////////////////////
/// A read session over one archive.
/// - The metadata index is loaded and checked when the session opens.
///   Payload members are read, and values decoded, only when a path that
///   needs them is requested.
/// - Looking up a nested path descends through descriptors without decoding
///   sibling subtrees.
/// - Decoded containers and objects are cached by their stored path, so an
///   object stored once and reachable by several paths is returned as the
///   same instance within a session.
/// - The session holds a snapshot of the type registry taken when it was
///   opened.  Each session owns its cache, so independent sessions may read
///   the same archive concurrently.
/////////////////////////////////////////////////////////////////////////////
class ArchiveReader
{
  public:
    /// @throws StorageError if the archive cannot be opened.
    /// @throws CorruptArchiveError if the archive is not valid.
    ArchiveReader(const URI& uri, const Ref<TypeRegistry>& r_registry = default_registry());
    ArchiveReader(const Ref<Storage>& r_storage, const String& identifier,
                  const Ref<TypeRegistry>& r_registry = default_registry());

    ArchiveReader(const ArchiveReader&) = delete;
    ArchiveReader& operator = (const ArchiveReader&) = delete;

    /// Returns the value stored at `path`.
    /// @throws PathNotFoundError if the path does not exist.
    /// @throws UnknownTypeTagError if a type tag in the subtree is not registered.
    Value get(const Path& path);

    /// Returns the value stored at `path`, or `default_value` if the path does
    /// not exist.
    Value get(const Path& path, const Value& default_value);

    /// Returns a map of path text to value.
    /// - A path that does not exist, or whose subtree has an unregistered
    ///   type tag, is omitted.  The other paths are unaffected.
    Map get_many(const std::vector<Path>& paths);

    /// Returns a map of path text to value, substituting `default_value` for
    /// the paths omitted by @ref get_many(const std::vector<Path>&).
    Map get_many(const std::vector<Path>& paths, const Value& default_value);

    bool contains(const Path& path);

    const std::vector<String>& keys() const { return m_metadata.roots(); }
    size_t size() const                     { return m_metadata.roots().size(); }

    bool has_root() const { return m_metadata.has_root(ROOT_NAME); }

    /// Returns the value written by @ref dump with a non-map root.
    /// @throws PathNotFoundError if the archive has no root value.
    Value get_root();

    const Map& attributes() const     { return m_metadata.attributes(); }
    const Metadata& metadata() const  { return m_metadata; }
    std::vector<String> members() const;

    const String& identifier() const  { return m_identifier; }

    /// Release the container.  Further reads raise StashException.
    void close();
    bool is_open() const { return mp_zip != nullptr; }

  private:
    ArchiveReader(StorageLocation&& location, const Ref<TypeRegistry>& r_registry);

    static Metadata open(ZipReader& zip, const String& identifier);
    static void validate(const Metadata& metadata, const ZipReader& zip, const String& identifier);

    void check_open() const;
    Path resolve(const Path& path) const;
    Path canonical(const Path& path) const;
    Value materialize(const Path& path);
    Map collect(const std::vector<Path>& paths, const Value* p_default);

  private:
    String m_identifier;
    Ref<TypeRegistry> mr_registry;
    std::unique_ptr<ZipReader> mp_zip;
    Metadata m_metadata;
    std::unordered_map<String, Value> m_cache;
    std::unordered_set<String> m_in_progress;
};

inline
ArchiveReader::ArchiveReader(const URI& uri, const Ref<TypeRegistry>& r_registry)
  : ArchiveReader(open_storage(uri), r_registry)
{}

inline
ArchiveReader::ArchiveReader(const Ref<Storage>& r_storage, const String& identifier,
                             const Ref<TypeRegistry>& r_registry)
  : ArchiveReader(StorageLocation{r_storage, identifier}, r_registry)
{}

inline
ArchiveReader::ArchiveReader(StorageLocation&& location, const Ref<TypeRegistry>& r_registry)
  : m_identifier{location.identifier}
  , mr_registry{r_registry}
{
    try {
        mp_zip = std::make_unique<ZipReader>(location.storage->open_for_read(m_identifier));
    } catch (const ContainerError& exc) {
        STASH_ERROR("Failed to open {}: {}", m_identifier, exc.message());
        throw CorruptArchiveError(m_identifier, exc.message());
    }

    m_metadata = open(*mp_zip, m_identifier);
    STASH_DEBUG("Opened {} for read: {} nodes", m_identifier, m_metadata.nodes().size());
}

inline
Metadata ArchiveReader::open(ZipReader& zip, const String& identifier) {
    try {
        if (!zip.contains(METADATA_MEMBER))
            throw CorruptArchiveError(identifier, fmt::format("Missing {}", METADATA_MEMBER));
        auto metadata = Metadata::load(zip.read_text(METADATA_MEMBER), identifier);
        validate(metadata, zip, identifier);
        return metadata;
    } catch (const CorruptArchiveError& exc) {
        STASH_ERROR("{}", exc.message());
        throw;
    } catch (const ContainerError& exc) {
        STASH_ERROR("{}", exc.message());
        throw CorruptArchiveError(identifier, exc.message());
    } catch (const parse::SyntaxError& exc) {
        STASH_ERROR("{}", exc.message());
        throw CorruptArchiveError(identifier, fmt::format("Invalid path in metadata: {}", exc.message()));
    }
}

/// Check that every path, reference and member named by the index exists.
inline
void ArchiveReader::validate(const Metadata& metadata, const ZipReader& zip, const String& identifier) {
    for (auto& name : metadata.roots()) {
        auto path = Path{KeyList{Key{name}}}.to_str();
        if (metadata.find(path) == nullptr)
            throw CorruptArchiveError(identifier, fmt::format("Missing top-level node '{}'", name));
    }

    for (auto& [ref_id, path] : metadata.refs()) {
        auto p_desc = metadata.find(path);
        if (p_desc == nullptr || p_desc->is_alias())
            throw CorruptArchiveError(identifier, fmt::format("Reference {} to missing node {}", ref_id, path));
    }

    for (auto& [path_text, desc] : metadata.nodes()) {
        if (desc.is_alias()) {
            if (!metadata.ref_path(*desc.ref_id))
                throw CorruptArchiveError(identifier, fmt::format("Unknown reference {}, path={}", *desc.ref_id, path_text));
            continue;
        }

        if (desc.location == Location::EXTERNAL && !zip.contains(desc.member))
            throw CorruptArchiveError(identifier, fmt::format("Missing member {}, path={}", desc.member, path_text));

        if (desc.kind == ContainerKind::SCALAR) continue;

        Path path(path_text);
        if (desc.kind == ContainerKind::SEQUENCE) {
            for (size_t i = 0; i < desc.length; ++i)
                if (metadata.find(path.child(Key{i}).to_str()) == nullptr)
                    throw CorruptArchiveError(identifier, fmt::format("Missing element {}, path={}", i, path_text));
        } else {
            for (auto& key : desc.keys)
                if (metadata.find(path.child(Key{key}).to_str()) == nullptr)
                    throw CorruptArchiveError(identifier, fmt::format("Missing field '{}', path={}", key, path_text));
        }
    }
}

inline
void ArchiveReader::check_open() const {
    if (!mp_zip) throw StashException{fmt::format("Archive is closed: {}", m_identifier)};
}

/// Returns the stored path of the node an alias refers to, or `path`.
inline
Path ArchiveReader::canonical(const Path& path) const {
    auto p_desc = m_metadata.find(path.to_str());
    if (p_desc == nullptr) throw PathNotFoundError(path);
    if (!p_desc->is_alias()) return path;
    auto ref_path = m_metadata.ref_path(*p_desc->ref_id);
    if (!ref_path) throw CorruptArchiveError(m_identifier, fmt::format("Unknown reference {}", *p_desc->ref_id));
    return Path(*ref_path);
}

/// Returns the stored path of the node addressed by `path`, following
/// aliases at each step.
inline
Path ArchiveReader::resolve(const Path& path) const {
    if (path.is_root()) throw PathNotFoundError(path);

    auto& first = path[0];
    if (!first.is_name() || !m_metadata.has_root(first.name()))
        throw PathNotFoundError(path);

    Path current = canonical(Path{KeyList{first}});
    for (size_t i = 1; i < path.size(); ++i) {
        auto& key = path[i];
        auto p_desc = m_metadata.find(current.to_str());
        if (p_desc == nullptr) throw PathNotFoundError(path);

        switch (p_desc->kind) {
            case ContainerKind::SEQUENCE: {
                if (!key.is_index()) throw PathNotFoundError(path);
                Int index = key.index();
                if (index < 0) index += (Int)p_desc->length;
                if (index < 0 || index >= (Int)p_desc->length) throw PathNotFoundError(path);
                current = canonical(current.child(Key{index}));
                break;
            }
            case ContainerKind::MAPPING:
            case ContainerKind::OBJECT: {
                if (!key.is_name()) throw PathNotFoundError(path);
                auto& keys = p_desc->keys;
                if (std::find(keys.begin(), keys.end(), key.name()) == keys.end()) throw PathNotFoundError(path);
                current = canonical(current.child(key));
                break;
            }
            default:
                throw PathNotFoundError(path);
        }
    }
    return current;
}

/// Decode the node stored at `path`, which is not an alias.
inline
Value ArchiveReader::materialize(const Path& path) {
    auto path_text = path.to_str();

    auto it = m_cache.find(path_text);
    if (it != m_cache.end()) return it->second;

    auto p_desc = m_metadata.find(path_text);
    if (p_desc == nullptr) throw PathNotFoundError(path);
    auto& desc = *p_desc;

    if (m_in_progress.count(path_text) > 0)
        throw CorruptArchiveError(m_identifier, fmt::format("Object contains itself, path={}", path_text));
    m_in_progress.insert(path_text);
    Finally done{[this, &path_text] () { m_in_progress.erase(path_text); }};

    auto r_codec = mr_registry->resolve_for_decode(desc.type_tag, path);

    Encoding encoding;
    encoding.kind = desc.kind;
    encoding.inline_value = desc.value;
    if (desc.location == Location::EXTERNAL) {
        try {
            encoding.payload = mp_zip->read(desc.member);
        } catch (const ContainerError& exc) {
            STASH_ERROR("{}", exc.message());
            throw CorruptArchiveError(m_identifier, exc.message());
        }
        auto pos = desc.member.rfind('.');
        if (pos != String::npos) encoding.extension = desc.member.substr(pos + 1);
    }

    switch (desc.kind) {
        case ContainerKind::SEQUENCE: {
            List children;
            children.reserve(desc.length);
            for (size_t i = 0; i < desc.length; ++i)
                children.push_back(materialize(canonical(path.child(Key{i}))));
            encoding.children = std::move(children);
            break;
        }
        case ContainerKind::MAPPING:
        case ContainerKind::OBJECT: {
            Map children;
            for (auto& key : desc.keys)
                children.insert({key, materialize(canonical(path.child(Key{key})))});
            encoding.children = std::move(children);
            break;
        }
        default:
            break;
    }

    auto value = r_codec->decode(encoding);
    if (IdentityTracker::participates(value) || desc.ref_id)
        m_cache.insert({path_text, value});
    return value;
}

inline
Value ArchiveReader::get(const Path& path) {
    check_open();
    return materialize(resolve(path));
}

inline
Value ArchiveReader::get(const Path& path, const Value& default_value) {
    try {
        return get(path);
    } catch (const PathNotFoundError&) {
        return default_value;
    }
}

inline
Map ArchiveReader::get_many(const std::vector<Path>& paths) {
    return collect(paths, nullptr);
}

inline
Map ArchiveReader::get_many(const std::vector<Path>& paths, const Value& default_value) {
    return collect(paths, &default_value);
}

inline
Map ArchiveReader::collect(const std::vector<Path>& paths, const Value* p_default) {
    Map result;
    for (auto& path : paths) {
        auto path_text = path.to_str();
        try {
            result.insert_or_assign(path_text, get(path));
            continue;
        } catch (const PathNotFoundError& exc) {
            STASH_DEBUG("Skipped {}: {}", path_text, exc.message());
        } catch (const UnknownTypeTagError& exc) {
            STASH_DEBUG("Skipped {}: {}", path_text, exc.message());
        }
        if (p_default != nullptr) result.insert_or_assign(path_text, *p_default);
    }
    return result;
}

inline
bool ArchiveReader::contains(const Path& path) {
    check_open();
    try {
        resolve(path);
        return true;
    } catch (const PathNotFoundError&) {
        return false;
    }
}

inline
Value ArchiveReader::get_root() {
    return get(Path{KeyList{Key{ROOT_NAME}}});
}

inline
std::vector<String> ArchiveReader::members() const {
    check_open();
    std::vector<String> names;
    for (auto& name : mp_zip->names())
        if (name != METADATA_MEMBER)
            names.push_back(name);
    return names;
}

inline
void ArchiveReader::close() {
    if (mp_zip) STASH_DEBUG("Closed {}", m_identifier);
    mp_zip.reset();
    m_cache.clear();
}

} // namespace stash
