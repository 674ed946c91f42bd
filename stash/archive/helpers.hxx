/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#pragma once

#include <stash/archive/Reader.hxx>
#include <stash/archive/Writer.hxx>

#include <filesystem>

namespace stash {

/////////////////////////////////////////////////////////////////////////////
/// Write a complete archive holding `value`.
/// - The entries of a map are stored as top-level entries, so that each may
///   be read on its own.  Any other value, or a map with a key that is a
///   reserved name, is stored as the archive root.
/////////////////////////////////////////////////////////////////////////////
inline
void dump(const Value& value, const URI& uri, const Options& options = {},
          const Ref<TypeRegistry>& r_registry = default_registry()) {
    auto has_reserved_key = [] (const Map& map) {
        for (auto& [name, _] : map)
            if (ArchiveWriter::is_reserved_name(name)) return true;
        return false;
    };

    ArchiveWriter writer{uri, options, r_registry};
    if (value.type() == Value::MAP && !has_reserved_key(value.as<Map>())) {
        for (auto& [name, item] : value.as<Map>())
            writer.put(name, item);
    } else {
        writer.put_root(value);
    }
    writer.finalize();
}

/// Read a complete archive, the inverse of @ref dump.
/// - Returns the archive root if there is one, otherwise a map of all
///   top-level entries.
inline
Value load(const URI& uri, const Ref<TypeRegistry>& r_registry = default_registry()) {
    ArchiveReader reader{uri, r_registry};
    if (reader.has_root()) return reader.get_root();

    Map result;
    for (auto& name : reader.keys())
        result.insert({name, reader.get(Path{KeyList{Key{name}}})});
    return result;
}

/// Returns the identifier under which @ref replace keeps the previous archive,
/// `<stem>_old<extension>`.
inline
String old_identifier(const String& identifier) {
    std::filesystem::path fpath{identifier};
    auto file_name = fpath.stem().string() + "_old" + fpath.extension().string();
    return fpath.replace_filename(file_name).string();
}

/////////////////////////////////////////////////////////////////////////////
/// Rewrite an archive with some top-level entries replaced or added.
/// - Entries keep their original order, and new entries follow.
/// - Attributes are carried over.
/// - Objects shared between kept entries remain shared, since they are read
///   through one session and written through one session.
/// @param save_old Keep a copy of the previous archive, see @ref old_identifier.
/////////////////////////////////////////////////////////////////////////////
inline
void replace(const URI& uri, const Map& updates, bool save_old = false, const Options& options = {},
             const Ref<TypeRegistry>& r_registry = default_registry()) {
    auto location = open_storage(uri);
    auto& storage = *location.storage;
    auto& identifier = location.identifier;

    if (save_old) copy_archive(storage, identifier, storage, old_identifier(identifier));

    Options write_options{options};
    write_options.configure(uri);
    write_options.clobber = true;

    ArchiveReader reader{location.storage, identifier, r_registry};
    ArchiveWriter writer{location.storage, identifier, write_options, r_registry};

    auto put = [&writer] (const String& name, const Value& value) {
        if (name == ROOT_NAME) writer.put_root(value);
        else                   writer.put(name, value);
    };

    for (auto& name : reader.keys()) {
        auto it = updates.find(name);
        put(name, it == updates.end()? reader.get(Path{KeyList{Key{name}}}): it->second);
    }

    for (auto& [name, value] : updates)
        if (!reader.metadata().has_root(name))
            put(name, value);

    for (auto& [key, value] : reader.attributes())
        writer.set_attribute(key, value);

    reader.close();
    writer.finalize();
}

} // namespace stash
