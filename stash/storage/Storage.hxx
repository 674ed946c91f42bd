/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#pragma once

#include <stash/storage/URI.hxx>
#include <stash/support/Ref.hxx>
#include <stash/support/logging.hxx>
#include <stash/support/exception.hxx>

#include <fmt/format.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <random>
#include <sstream>
#include <unordered_map>

namespace stash {

struct StorageError : public StashException
{
    StorageError(const String& identifier, const String& reason)
      : StashException(fmt::format("Storage error, identifier={}: {}", identifier, reason)) {}
};

/////////////////////////////////////////////////////////////////////////////
/// Destination of one complete archive.
/// - Data written to @ref stream becomes visible under the identifier only
///   when @ref commit is called.
/// - Destroying a Sink that was not committed discards the data.
/////////////////////////////////////////////////////////////////////////////
class Sink
{
  public:
    virtual ~Sink() = default;
    virtual std::ostream& stream() = 0;
    virtual void commit() = 0;
};

/////////////////////////////////////////////////////////////////////////////
/// Byte-level access to archives addressed by an identifier.
/// - Implementations for remote stores are registered with
///   @ref register_storage_scheme and must present each archive as a
///   seekable input stream.
/////////////////////////////////////////////////////////////////////////////
class Storage
{
  public:
    virtual ~Storage() = default;

    /// @throws StorageError if the archive does not exist, or cannot be read.
    virtual std::unique_ptr<std::istream> open_for_read(const String& identifier) = 0;

    /// @throws StorageError if the destination cannot be created.
    virtual std::unique_ptr<Sink> open_for_write(const String& identifier) = 0;

    virtual bool exists(const String& identifier) = 0;
    virtual void remove(const String& identifier) = 0;

  private:
    refcnt_t m_ref_count = 0;

  template <typename> friend class ::stash::Ref;
};

/// Copy one archive to another identifier, possibly in another storage.
inline
void copy_archive(Storage& from, const String& from_id, Storage& to, const String& to_id) {
    auto p_in = from.open_for_read(from_id);
    auto p_sink = to.open_for_write(to_id);
    p_sink->stream() << p_in->rdbuf();
    if (p_in->bad()) throw StorageError(from_id, std::strerror(errno));
    p_sink->commit();
}

//----------------------------------------------------------------------------------
// FileStorage
//----------------------------------------------------------------------------------

namespace impl {

class FileSink : public Sink
{
  public:
    FileSink(const std::filesystem::path& fpath) : m_fpath{fpath} {
        std::random_device rd;
        m_temp_fpath = m_fpath;
        m_temp_fpath += fmt::format(".{:08x}.partial", rd());
        m_f_out.open(m_temp_fpath, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!m_f_out.is_open())
            throw StorageError(m_fpath.string(), std::strerror(errno));
    }

    ~FileSink() override {
        if (!m_committed) {
            if (m_f_out.is_open()) m_f_out.close();
            std::error_code ec;
            std::filesystem::remove(m_temp_fpath, ec);
            if (ec) STASH_WARN("Failed to remove {}: {}", m_temp_fpath.string(), ec.message());
        }
    }

    std::ostream& stream() override { return m_f_out; }

    void commit() override {
        m_f_out.flush();
        if (m_f_out.bad()) throw StorageError(m_fpath.string(), std::strerror(errno));
        if (m_f_out.fail()) throw StorageError(m_fpath.string(), "ostream::fail()");
        m_f_out.close();

        std::error_code ec;
        std::filesystem::rename(m_temp_fpath, m_fpath, ec);
        if (ec) throw StorageError(m_fpath.string(), ec.message());
        m_committed = true;
    }

  private:
    std::filesystem::path m_fpath;
    std::filesystem::path m_temp_fpath;
    std::ofstream m_f_out;
    bool m_committed = false;
};

} // namespace impl

/////////////////////////////////////////////////////////////////////////////
/// Archives stored in the local filesystem.
/// - Identifiers are file paths, resolved relative to the root directory
///   passed to the constructor when they are relative.
/// - Writes go to a temporary sibling file which is renamed into place on
///   commit.
/////////////////////////////////////////////////////////////////////////////
class FileStorage : public Storage
{
  public:
    FileStorage() = default;
    FileStorage(const std::filesystem::path& root) : m_root{root} {}

    std::unique_ptr<std::istream> open_for_read(const String& identifier) override {
        auto fpath = resolve(identifier);
        auto p_in = std::make_unique<std::ifstream>(fpath, std::ios::in | std::ios::binary);
        if (!p_in->is_open())
            throw StorageError(fpath.string(), std::strerror(errno));
        return p_in;
    }

    std::unique_ptr<Sink> open_for_write(const String& identifier) override {
        return std::make_unique<impl::FileSink>(resolve(identifier));
    }

    bool exists(const String& identifier) override {
        std::error_code ec;
        return std::filesystem::exists(resolve(identifier), ec);
    }

    void remove(const String& identifier) override {
        std::error_code ec;
        std::filesystem::remove(resolve(identifier), ec);
        if (ec) throw StorageError(identifier, ec.message());
    }

    std::filesystem::path resolve(const String& identifier) const {
        std::filesystem::path fpath{identifier};
        if (fpath.is_relative() && !m_root.empty()) return m_root / fpath;
        return fpath;
    }

  private:
    std::filesystem::path m_root;
};

//----------------------------------------------------------------------------------
// MemoryStorage
//----------------------------------------------------------------------------------

class MemoryStorage;

namespace impl {

class MemorySink : public Sink
{
  public:
    MemorySink(MemoryStorage& storage, const String& identifier)
      : m_storage{storage}, m_identifier{identifier} {}

    std::ostream& stream() override { return m_buffer; }
    void commit() override;

  private:
    MemoryStorage& m_storage;
    String m_identifier;
    std::stringstream m_buffer;
};

} // namespace impl

/////////////////////////////////////////////////////////////////////////////
/// Archives held in process memory, keyed by name.
/// - Reads see a snapshot of the buffer at the time of the call.
/// - A Sink must not outlive the storage that created it.
/////////////////////////////////////////////////////////////////////////////
class MemoryStorage : public Storage
{
  public:
    std::unique_ptr<std::istream> open_for_read(const String& identifier) override {
        std::scoped_lock lock{m_mutex};
        auto it = m_buffers.find(identifier);
        if (it == m_buffers.end()) throw StorageError(identifier, "No such buffer");
        return std::make_unique<std::istringstream>(it->second, std::ios::in | std::ios::binary);
    }

    std::unique_ptr<Sink> open_for_write(const String& identifier) override {
        return std::make_unique<impl::MemorySink>(*this, identifier);
    }

    bool exists(const String& identifier) override {
        std::scoped_lock lock{m_mutex};
        return m_buffers.find(identifier) != m_buffers.end();
    }

    void remove(const String& identifier) override {
        std::scoped_lock lock{m_mutex};
        m_buffers.erase(identifier);
    }

    /// Returns a copy of the buffer, or an empty string.
    String buffer(const String& identifier) {
        std::scoped_lock lock{m_mutex};
        auto it = m_buffers.find(identifier);
        return it == m_buffers.end()? String{}: it->second;
    }

    void set_buffer(const String& identifier, String&& data) {
        std::scoped_lock lock{m_mutex};
        m_buffers[identifier] = std::forward<String>(data);
    }

  private:
    std::mutex m_mutex;
    std::unordered_map<String, String> m_buffers;
};

inline
void impl::MemorySink::commit() {
    m_storage.set_buffer(m_identifier, m_buffer.str());
}

//----------------------------------------------------------------------------------
// Storage schemes
//----------------------------------------------------------------------------------

/// A storage and the identifier of one archive within it.
struct StorageLocation
{
    Ref<Storage> storage;
    String identifier;
};

using StorageFactory = std::function<StorageLocation(const URI& uri)>;
using StorageSchemeMap = std::unordered_map<String, StorageFactory>;

#define STASH_INIT_STORAGE_SCHEMES namespace stash { \
    std::mutex global_storage_scheme_mutex; \
    StorageSchemeMap global_storage_schemes; \
    thread_local StorageSchemeMap local_storage_schemes; \
}

extern std::mutex global_storage_scheme_mutex;
extern StorageSchemeMap global_storage_schemes;
extern thread_local StorageSchemeMap local_storage_schemes;

template <typename Func>
void register_storage_scheme(const String& scheme, Func&& func) {
    StorageFactory factory{std::forward<Func>(func)};
    local_storage_schemes[scheme] = factory;
    std::scoped_lock lock{global_storage_scheme_mutex};
    global_storage_schemes[scheme] = factory;
}

inline
void remove_storage_scheme(const String& scheme) {
    local_storage_schemes.erase(scheme);
    std::scoped_lock lock{global_storage_scheme_mutex};
    global_storage_schemes.erase(scheme);
}

inline
StorageFactory lookup_storage_scheme(const String& scheme) {
    auto it = local_storage_schemes.find(scheme);
    if (it != local_storage_schemes.end())
        return it->second;

    // registered by another thread, or removed from this one
    std::scoped_lock lock{global_storage_scheme_mutex};
    auto g_it = global_storage_schemes.find(scheme);
    if (g_it != global_storage_schemes.end()) {
        local_storage_schemes[scheme] = g_it->second;
        return g_it->second;
    }
    return {};
}

/// Returns the process-wide storage backing the `mem` scheme.
inline
Ref<MemoryStorage> memory_storage() {
    static Ref<MemoryStorage> r_storage{new MemoryStorage()};
    return r_storage;
}

/// Register the built-in `file` and `mem` schemes.
/// - `file:///abs/path.zip` or `file://?path=rel/path.zip`
/// - `mem://name`
inline
void register_builtin_storage_schemes() {
    register_storage_scheme("file", [] (const URI& uri) -> StorageLocation {
        auto path = uri.path();
        auto query_path = uri.query("path");
        if (path.size() > 0 && query_path != nil)
            throw StorageError(uri.spec(), "URI specifies path twice");
        if (query_path != nil) path = query_path.as<String>();
        if (path.size() == 0)
            throw StorageError(uri.spec(), "URI does not specify a path");
        return {new FileStorage(), path};
    });

    register_storage_scheme("mem", [] (const URI& uri) -> StorageLocation {
        auto name = uri.host() + uri.path();
        if (name.size() == 0)
            throw StorageError(uri.spec(), "URI does not specify a name");
        return {memory_storage(), name};
    });
}

/// Resolve a URI to a storage location.
/// @throws StorageError if the URI is malformed, or its scheme is not registered.
inline
StorageLocation open_storage(const URI& uri) {
    if (!uri.is_valid()) throw StorageError(uri.spec(), "Malformed URI");
    auto scheme = uri.scheme();
    auto factory = lookup_storage_scheme(scheme);
    if (!factory) {
        if (scheme != "file" && scheme != "mem")
            throw StorageError(uri.spec(), fmt::format("URI scheme not found: {}", scheme));
        register_builtin_storage_schemes();
        factory = lookup_storage_scheme(scheme);
    }
    return factory(uri);
}

} // namespace stash
