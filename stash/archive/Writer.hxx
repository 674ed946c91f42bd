/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#pragma once

#include <stash/archive/Encoder.hxx>
#include <stash/archive/Options.hxx>
#include <stash/storage/Storage.hxx>
#include <stash/storage/ZipContainer.hxx>
#include <stash/support/logging.hxx>

namespace stash {

/////////////////////////////////////////////////////////////////////////////
/// A write session building one archive.
/// - Top-level values are added with @ref put, and the archive is written
///   to storage by @ref finalize.  Nothing is visible in storage until then.
/// - The session holds a snapshot of the type registry taken when it was
///   opened.
/// - A session is driven by one thread.
/////////////////////////////////////////////////////////////////////////////
class ArchiveWriter
{
  public:
    /// Open a write session for the archive addressed by a URI.
    /// - Options in the URI query override `options`.
    /// @throws ArchiveExistsError if the archive exists and clobber is false.
    ArchiveWriter(const URI& uri, const Options& options = {}, const Ref<TypeRegistry>& r_registry = default_registry());

    /// @throws ArchiveExistsError if the archive exists and clobber is false.
    ArchiveWriter(const Ref<Storage>& r_storage, const String& identifier, const Options& options = {},
                  const Ref<TypeRegistry>& r_registry = default_registry());

    ~ArchiveWriter();

    ArchiveWriter(const ArchiveWriter&) = delete;
    ArchiveWriter& operator = (const ArchiveWriter&) = delete;

    /// Add a top-level value.
    /// @throws ReservedNameError, DuplicateNameError, AlreadySealedError.
    /// @throws UnsupportedTypeError if a value in the graph has no codec, in
    /// which case nothing of `value` is added.
    void put(const String& name, const Value& value);

    /// Store a value as the archive root, see @ref dump.
    void put_root(const Value& value);

    /// Returns true if `name` may not be passed to @ref put.
    static bool is_reserved_name(const String& name) {
        return name.size() == 0 || name == ROOT_NAME || name == "__metadata__";
    }

    bool contains(const String& name) const { return m_metadata.has_root(name); }
    size_t size() const                     { return m_metadata.roots().size(); }
    const std::vector<String>& keys() const { return m_metadata.roots(); }

    /// Set a user attribute, stored in the metadata index.
    /// @throws WrongType if the value is not JSON representable.
    void set_attribute(const String& key, const Value& value);

    /// Objects added after this call are stored independently of objects
    /// added before it.
    void reset_ids() { m_encoder.reset_ids(); }

    /// Write the archive to storage and seal the session.
    /// - If writing fails the session stays open, so finalize may be retried.
    /// @throws AlreadySealedError on the call after a successful one.
    /// @throws StorageError if the archive cannot be written.
    void finalize();

    bool is_finalized() const          { return m_finalized; }
    const String& identifier() const   { return m_identifier; }
    const Options& options() const     { return m_options; }
    const Metadata& metadata() const   { return m_metadata; }

  private:
    ArchiveWriter(StorageLocation&& location, const Options& options, const Ref<TypeRegistry>& r_registry);

    static Options configured(const Options& options, const URI& uri) {
        Options result{options};
        result.configure(uri);
        return result;
    }

    void add_root(const String& name, const Value& value);

  private:
    Ref<Storage> mr_storage;
    String m_identifier;
    Options m_options;
    Metadata m_metadata;
    Encoder m_encoder;
    bool m_finalized = false;
};

inline
ArchiveWriter::ArchiveWriter(const URI& uri, const Options& options, const Ref<TypeRegistry>& r_registry)
  : ArchiveWriter(open_storage(uri), configured(options, uri), r_registry)
{}

inline
ArchiveWriter::ArchiveWriter(const Ref<Storage>& r_storage, const String& identifier, const Options& options,
                             const Ref<TypeRegistry>& r_registry)
  : ArchiveWriter(StorageLocation{r_storage, identifier}, options, r_registry)
{}

inline
ArchiveWriter::ArchiveWriter(StorageLocation&& location, const Options& options, const Ref<TypeRegistry>& r_registry)
  : mr_storage{location.storage}
  , m_identifier{location.identifier}
  , m_options{options}
  , m_encoder{r_registry, m_metadata, options.track_identity}
{
    if (!m_options.clobber && mr_storage->exists(m_identifier))
        throw ArchiveExistsError(m_identifier);
    STASH_DEBUG("Opened {} for write", m_identifier);
}

inline
ArchiveWriter::~ArchiveWriter() {
    if (!m_finalized && !m_options.quiet)
        STASH_WARN("{} was not finalized, nothing was written", m_identifier);
}

inline
void ArchiveWriter::put(const String& name, const Value& value) {
    if (is_reserved_name(name)) throw ReservedNameError(name);
    add_root(name, value);
}

inline
void ArchiveWriter::put_root(const Value& value) {
    add_root(ROOT_NAME, value);
}

inline
void ArchiveWriter::add_root(const String& name, const Value& value) {
    if (m_finalized) throw AlreadySealedError(m_identifier);
    if (m_metadata.has_root(name)) throw DuplicateNameError(name);
    m_encoder.put(name, value);
}

inline
void ArchiveWriter::set_attribute(const String& key, const Value& value) {
    if (m_finalized) throw AlreadySealedError(m_identifier);
    if (!json::is_json(value)) throw WrongType{value.type_name(), "json"};
    m_metadata.attributes().insert_or_assign(key, value);
}

inline
void ArchiveWriter::finalize() {
    if (m_finalized) throw AlreadySealedError(m_identifier);

    auto index = m_metadata.to_text(m_options.indent);

    ZipWriter zip;
    zip.add(METADATA_MEMBER, index, m_options.compression);
    for (auto& [name, data] : m_encoder.payloads())
        zip.add(name, data, m_options.compression);

    auto p_sink = mr_storage->open_for_write(m_identifier);
    zip.write(p_sink->stream());
    p_sink->commit();

    m_metadata.seal(m_identifier);
    m_finalized = true;

    STASH_DEBUG("Finalized {}: {} nodes, {} payload members", m_identifier,
                m_metadata.nodes().size(), m_encoder.payloads().size());
}

} // namespace stash
