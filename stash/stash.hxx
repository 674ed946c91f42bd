/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#pragma once

#include <stash/core/Value.hxx>
#include <stash/json/json.hxx>
#include <stash/csv/csv.hxx>
#include <stash/storage/URI.hxx>
#include <stash/storage/Storage.hxx>
#include <stash/archive/Registry.hxx>
#include <stash/adapters/adapters.hxx>
#include <stash/archive/Writer.hxx>
#include <stash/archive/Reader.hxx>
#include <stash/archive/helpers.hxx>
#include <stash/support/logging.hxx>

/////////////////////////////////////////////////////////////////////////////
/// Stash initialization macro
/// This macro must be instantiated once, in one translation unit, before
/// using stash::* services.
/////////////////////////////////////////////////////////////////////////////
#define STASH_INIT \
    STASH_INIT_LOGGING; \
    STASH_INIT_STORAGE_SCHEMES; \
    STASH_INIT_REGISTRY;
