#include "sqlcomplete/api.h"

#include <flatbuffers/detached_buffer.h>
#include <flatbuffers/flatbuffer_builder.h>
#include <flatbuffers/verifier.h>

#include <memory>
#include <string_view>

#include "sqlcomplete/completer.h"
#include "sqlcomplete/completion.h"
#include "sqlcomplete/proto/proto_generated.h"
#include "sqlcomplete/suggestion.h"
#include "sqlcomplete/version.h"

using namespace sqlcomplete;

static FFIResult* packOK() {
    auto result = std::make_unique<FFIResult>();
    result->status_code = static_cast<uint32_t>(proto::StatusCode::OK);
    result->data_ptr = nullptr;
    result->data_length = 0;
    result->owner_ptr = nullptr;
    result->owner_deleter = [](void*) {};
    return result.release();
}

template <typename T> static FFIResult* packPtr(std::unique_ptr<T> ptr) {
    auto result = std::make_unique<FFIResult>();
    auto raw_ptr = ptr.release();
    result->status_code = static_cast<uint32_t>(proto::StatusCode::OK);
    result->data_ptr = nullptr;
    result->data_length = 0;
    result->owner_ptr = raw_ptr;
    result->owner_deleter = [](void* p) { delete reinterpret_cast<T*>(p); };
    return result.release();
}

static FFIResult* packBuffer(std::unique_ptr<flatbuffers::DetachedBuffer> detached) {
    auto result = std::make_unique<FFIResult>();
    result->status_code = static_cast<uint32_t>(proto::StatusCode::OK);
    result->data_ptr = detached->data();
    result->data_length = detached->size();
    result->owner_ptr = detached.release();
    result->owner_deleter = [](void* buffer) { delete reinterpret_cast<flatbuffers::DetachedBuffer*>(buffer); };
    return result.release();
}

static FFIResult* packError(proto::StatusCode status) {
    std::string_view message;
    switch (status) {
        case proto::StatusCode::CATALOG_RELATION_UNKNOWN:
            message = "Relation is not registered in the catalog";
            break;
        case proto::StatusCode::CATALOG_DESCRIPTOR_INVALID:
            message = "Schema descriptor is not a valid buffer";
            break;
        case proto::StatusCode::CATALOG_DESCRIPTOR_RELATION_NAME_EMPTY:
            message = "Relation name in schema descriptor is null or empty";
            break;
        case proto::StatusCode::SUGGESTION_LIST_INVALID:
            message = "Suggestion list is not a valid buffer";
            break;
        case proto::StatusCode::CURSOR_OUT_OF_BOUNDS:
            message = "Cursor is out of bounds";
            break;
        case proto::StatusCode::OK:
            message = "";
            break;
    }
    auto result = new FFIResult();
    result->status_code = static_cast<uint32_t>(status);
    result->data_ptr = static_cast<const void*>(message.data());
    result->data_length = message.size();
    result->owner_ptr = nullptr;
    result->owner_deleter = [](void*) {};
    return result;
}

/// Get the version
extern "C" SQLCompleteVersion* sqlcomplete_version() { return &sqlcomplete::VERSION; }

/// Allocate memory
extern "C" std::byte* sqlcomplete_malloc(size_t length) { return new std::byte[length]; }
/// Delete memory
extern "C" void sqlcomplete_free(const void* buffer) { delete[] reinterpret_cast<const std::byte*>(buffer); }

/// Delete a result
extern "C" void sqlcomplete_delete_result(FFIResult* result) {
    result->owner_deleter(result->owner_ptr);
    result->owner_ptr = nullptr;
    result->owner_deleter = nullptr;
    delete result;
}

/// Create a catalog
extern "C" FFIResult* sqlcomplete_catalog_new() { return packPtr(std::make_unique<sqlcomplete::Catalog>()); }
/// Reset a catalog
extern "C" void sqlcomplete_catalog_reset(sqlcomplete::Catalog* catalog) { catalog->Reset(); }
/// Load a schema descriptor
extern "C" FFIResult* sqlcomplete_catalog_load_descriptor(sqlcomplete::Catalog* catalog, const void* data_ptr,
                                                          size_t data_size) {
    flatbuffers::Verifier verifier{static_cast<const uint8_t*>(data_ptr), data_size};
    if (data_ptr == nullptr || !proto::VerifySchemaDescriptorBuffer(verifier)) {
        return packError(proto::StatusCode::CATALOG_DESCRIPTOR_INVALID);
    }
    auto* descriptor = flatbuffers::GetRoot<proto::SchemaDescriptor>(data_ptr);
    auto status = catalog->Load(*descriptor);
    if (status != proto::StatusCode::OK) {
        return packError(status);
    }
    return packOK();
}
/// Get the catalog version
extern "C" uint64_t sqlcomplete_catalog_get_version(sqlcomplete::Catalog* catalog) { return catalog->GetVersion(); }

/// Complete at a cursor
extern "C" FFIResult* sqlcomplete_complete(sqlcomplete::Catalog* catalog, const char* text_ptr, size_t text_length,
                                           size_t cursor, bool smart_completion, const void* suggestions_ptr,
                                           size_t suggestions_size) {
    if (cursor > text_length) {
        return packError(proto::StatusCode::CURSOR_OUT_OF_BOUNDS);
    }
    std::string_view text{text_ptr, text_length};

    // Read the suggestion requests
    std::vector<SuggestionRequest> requests;
    if (suggestions_ptr != nullptr) {
        flatbuffers::Verifier verifier{static_cast<const uint8_t*>(suggestions_ptr), suggestions_size};
        if (!verifier.VerifyBuffer<proto::SuggestionList>(nullptr)) {
            return packError(proto::StatusCode::SUGGESTION_LIST_INVALID);
        }
        auto [unpacked, status] = UnpackSuggestions(*flatbuffers::GetRoot<proto::SuggestionList>(suggestions_ptr));
        if (status != proto::StatusCode::OK) {
            return packError(status);
        }
        requests = std::move(unpacked);
    }

    // Compute the completions
    StaticClassifier classifier{std::move(requests)};
    Completer completer{*catalog, classifier};
    auto completions = completer.Complete(text, text.substr(0, cursor), smart_completion);

    // Pack the completions
    flatbuffers::FlatBufferBuilder fb;
    fb.Finish(Completion::PackList(fb, completions));

    // Store the buffer
    auto detached = std::make_unique<flatbuffers::DetachedBuffer>(std::move(fb.Release()));
    return packBuffer(std::move(detached));
}
