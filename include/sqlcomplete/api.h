#pragma once

#include <cstddef>
#include <cstdint>

#include "sqlcomplete/catalog.h"
#include "sqlcomplete/version.h"

/// Get the version
extern "C" sqlcomplete::SQLCompleteVersion* sqlcomplete_version();

/// Allocate memory
extern "C" std::byte* sqlcomplete_malloc(size_t length);
/// Delete memory
extern "C" void sqlcomplete_free(const void* buffer);

/// A managed FFI result container
struct FFIResult {
    uint32_t status_code;
    uint32_t data_length;
    const void* data_ptr;
    void* owner_ptr;
    void (*owner_deleter)(void*);

    template <typename T> T* CastOwnerPtr() { return static_cast<T*>(owner_ptr); }
};
/// Delete a result
extern "C" void sqlcomplete_delete_result(FFIResult* result);

/// Create a catalog
extern "C" FFIResult* sqlcomplete_catalog_new();
/// Drop all schema metadata of a catalog
extern "C" void sqlcomplete_catalog_reset(sqlcomplete::Catalog* catalog);
/// Load a schema descriptor into a catalog
extern "C" FFIResult* sqlcomplete_catalog_load_descriptor(sqlcomplete::Catalog* catalog, const void* data_ptr,
                                                          size_t data_size);
/// Get the catalog version
extern "C" uint64_t sqlcomplete_catalog_get_version(sqlcomplete::Catalog* catalog);

/// Complete at a cursor.
/// The suggestion list is a SuggestionList buffer computed by the host, it may be null.
/// The cursor is a byte offset into the text.
extern "C" FFIResult* sqlcomplete_complete(sqlcomplete::Catalog* catalog, const char* text_ptr, size_t text_length,
                                           size_t cursor, bool smart_completion, const void* suggestions_ptr = nullptr,
                                           size_t suggestions_size = 0);
