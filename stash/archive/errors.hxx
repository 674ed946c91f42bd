/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#pragma once

#include <stash/core/Path.hxx>
#include <stash/support/exception.hxx>

#include <fmt/format.h>

namespace stash {

struct UnsupportedTypeError : public StashException
{
    UnsupportedTypeError(const Path& path, const std::string_view& type_name)
      : StashException(fmt::format("No codec for type, path={}, type={}", path.to_str(), type_name)) {}
};

struct UnknownTypeTagError : public StashException
{
    UnknownTypeTagError(const Path& path, const std::string_view& type_tag)
      : StashException(fmt::format("Type tag not registered, path={}, type_tag={}", path.to_str(), type_tag)) {}
};

struct PathNotFoundError : public StashException
{
    PathNotFoundError(const Path& path)
      : StashException(fmt::format("Path not found: {}", path.to_str())) {}
};

struct AlreadySealedError : public StashException
{
    AlreadySealedError(const std::string_view& identifier)
      : StashException(fmt::format("Archive already sealed: {}", identifier)) {}
};

struct CorruptArchiveError : public StashException
{
    CorruptArchiveError(const std::string_view& identifier, const std::string_view& reason)
      : StashException(fmt::format("Corrupt archive, identifier={}: {}", identifier, reason)) {}
};

struct DuplicateNameError : public StashException
{
    DuplicateNameError(const std::string_view& name)
      : StashException(fmt::format("Name already in archive: {}", name)) {}
};

struct ReservedNameError : public StashException
{
    ReservedNameError(const std::string_view& name)
      : StashException(fmt::format("Name is reserved: '{}'", name)) {}
};

struct ArchiveExistsError : public StashException
{
    ArchiveExistsError(const std::string_view& identifier)
      : StashException(fmt::format("{} exists, to overwrite set clobber=true", identifier)) {}
};

} // namespace stash
