/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#pragma once

#include <stash/support/types.hxx>
#include <stash/support/Finally.hxx>
#include <stash/support/exception.hxx>

#include <ZipLib/ZipFile.h>
#include <ZipLib/ZipArchive.h>
#include <ZipLib/ZipArchiveEntry.h>
#include <ZipLib/methods/DeflateMethod.h>
#include <ZipLib/methods/StoreMethod.h>

#include <fmt/format.h>

#include <iterator>
#include <memory>
#include <sstream>
#include <vector>

namespace stash {

enum class Compression
{
    DEFLATE,
    STORE
};

struct ContainerError : public StashException
{
    ContainerError(const String& reason) : StashException(fmt::format("ZIP container error: {}", reason)) {}
};

/////////////////////////////////////////////////////////////////////////////
/// Assembles a ZIP container in memory.
/// - Member data is buffered until @ref write, since ZipLib compresses
///   deferred streams when the archive is written.
/////////////////////////////////////////////////////////////////////////////
class ZipWriter
{
  public:
    ZipWriter() : mp_zip{ZipArchive::Create()} {}

    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator = (const ZipWriter&) = delete;

    void add(const String& name, const String& data, Compression compression) {
        auto p_entry = mp_zip->CreateEntry(name);
        if (!p_entry) throw ContainerError(fmt::format("Duplicate or invalid member name: {}", name));

        auto p_stream = std::make_unique<std::istringstream>(data, std::ios::in | std::ios::binary);
        ICompressionMethod::Ptr method;
        if (compression == Compression::STORE) method = StoreMethod::Create();
        else                                   method = DeflateMethod::Create();

        if (!p_entry->SetCompressionStream(*p_stream, method, ZipArchiveEntry::CompressionMode::Deferred))
            throw ContainerError(fmt::format("Failed to add member: {}", name));
        m_streams.push_back(std::move(p_stream));
    }

    void add(const String& name, const Bytes& data, Compression compression) {
        add(name, String{data.begin(), data.end()}, compression);
    }

    void write(std::ostream& stream) {
        mp_zip->WriteToStream(stream);
        m_streams.clear();
    }

  private:
    ZipArchive::Ptr mp_zip;
    std::vector<std::unique_ptr<std::istringstream>> m_streams;
};

/////////////////////////////////////////////////////////////////////////////
/// Random access to the members of a ZIP container.
/////////////////////////////////////////////////////////////////////////////
class ZipReader
{
  public:
    /// @param p_stream A seekable stream, owned by the reader.
    /// @throws ContainerError if the stream is not a ZIP container.
    ZipReader(std::unique_ptr<std::istream>&& p_stream) {
        try {
            mp_zip = ZipArchive::Create(p_stream.release(), true);
        } catch (const std::exception& exc) {
            throw ContainerError(exc.what());
        }
        if (!mp_zip) throw ContainerError("Failed to open container");

        auto n_entries = mp_zip->GetEntriesCount();
        for (size_t i = 0; i < n_entries; ++i) {
            auto p_entry = mp_zip->GetEntry(int(i));
            if (p_entry && !p_entry->IsDirectory())
                m_names.push_back(p_entry->GetFullName());
        }
    }

    ZipReader(const ZipReader&) = delete;
    ZipReader& operator = (const ZipReader&) = delete;

    const std::vector<String>& names() const { return m_names; }

    bool contains(const String& name) const {
        return mp_zip->GetEntry(name) != nullptr;
    }

    /// Returns the decompressed content of a member.
    /// @throws ContainerError if the member does not exist or cannot be extracted.
    Bytes read(const String& name) const {
        auto p_entry = mp_zip->GetEntry(name);
        if (!p_entry) throw ContainerError(fmt::format("Member not found: {}", name));
        if (!p_entry->CanExtract()) throw ContainerError(fmt::format("Member cannot be extracted: {}", name));

        auto p_stream = p_entry->GetDecompressionStream();
        Finally finally{ [&p_entry] () { p_entry->CloseDecompressionStream(); } };
        if (p_stream == nullptr) throw ContainerError(fmt::format("Member cannot be decompressed: {}", name));

        Bytes data;
        data.reserve(p_entry->GetSize());
        data.assign(std::istreambuf_iterator<char>{*p_stream}, std::istreambuf_iterator<char>{});
        if (p_stream->bad()) throw ContainerError(fmt::format("Read error in member: {}", name));
        if (data.size() != p_entry->GetSize()) throw ContainerError(fmt::format("Truncated member: {}", name));
        return data;
    }

    String read_text(const String& name) const {
        auto data = read(name);
        return String{data.begin(), data.end()};
    }

  private:
    ZipArchive::Ptr mp_zip;
    std::vector<String> m_names;
};

} // namespace stash
