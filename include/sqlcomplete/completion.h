#pragma once

#include <flatbuffers/flatbuffer_builder.h>

#include <cstdint>
#include <ostream>
#include <span>
#include <string>

#include "sqlcomplete/proto/proto_generated.h"

namespace sqlcomplete {

/// A completion candidate.
/// The caller replaces the delete_back_count characters before the cursor with the text.
struct Completion {
    /// The text to insert
    std::string text;
    /// The number of characters (not bytes) to delete before the cursor
    uint32_t delete_back_count = 0;

    /// Comparison
    bool operator==(const Completion& other) const = default;
    /// Pack as FlatBuffer
    flatbuffers::Offset<proto::CompletionCandidate> Pack(flatbuffers::FlatBufferBuilder& builder) const;
    /// Pack a list of completions as FlatBuffer
    static flatbuffers::Offset<proto::CompletionList> PackList(flatbuffers::FlatBufferBuilder& builder,
                                                               std::span<const Completion> completions);
};

/// Print a completion
void PrintTo(const Completion& completion, std::ostream* out);

}  // namespace sqlcomplete
