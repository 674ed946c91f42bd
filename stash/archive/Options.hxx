/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#pragma once

#include <stash/storage/URI.hxx>
#include <stash/storage/ZipContainer.hxx>
#include <stash/support/logging.hxx>
#include <stash/support/string.hxx>

namespace stash {

/////////////////////////////////////////////////////////////////////////////
/// Archive session options.
/// - Options may be set in code, or from the query of the archive URI, for
///   example `file://?path=a.zip&ids=false&compression=store`.
/////////////////////////////////////////////////////////////////////////////
struct Options
{
    /// Configure options from the specified URI query.
    /// Unknown query keys are logged and ignored.
    void configure(const URI& uri);

    /// Store an object reachable by more than one path once, and restore the
    /// aliasing on read.  When false the stored graph is a pure tree.
    bool track_identity = true;

    /// Compression of payload members.
    Compression compression = Compression::DEFLATE;

    /// Allow a write session to replace an existing archive.
    bool clobber = false;

    /// Suppress warnings from archive sessions.
    bool quiet = false;

    /// Indentation of the metadata index JSON, 0 for a single line.
    int indent = 4;
};

inline
void Options::configure(const URI& uri) {
    for (auto& [key, value] : uri.query()) {
        auto text = value.type() == Value::STR? value.as<String>(): value.to_str();
        if (key == "path") {
            continue;
        } else if (key == "ids") {
            track_identity = str_to_bool(text);
        } else if (key == "compression") {
            if (text == "deflate")    compression = Compression::DEFLATE;
            else if (text == "store") compression = Compression::STORE;
            else throw StashException{fmt::format("Invalid compression: {}", text)};
        } else if (key == "clobber") {
            clobber = str_to_bool(text);
        } else if (key == "quiet") {
            quiet = str_to_bool(text);
        } else if (key == "indent") {
            indent = (int)str_to_int(text);
        } else {
            STASH_WARN("Ignoring unknown option '{}' in {}", key, uri.spec());
        }
    }
}

} // namespace stash
