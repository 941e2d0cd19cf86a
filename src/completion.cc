#include "sqlcomplete/completion.h"

#include <vector>

namespace sqlcomplete {

flatbuffers::Offset<proto::CompletionCandidate> Completion::Pack(flatbuffers::FlatBufferBuilder& builder) const {
    auto text_ofs = builder.CreateString(text);
    proto::CompletionCandidateBuilder out{builder};
    out.add_text(text_ofs);
    out.add_delete_back_count(delete_back_count);
    return out.Finish();
}

flatbuffers::Offset<proto::CompletionList> Completion::PackList(flatbuffers::FlatBufferBuilder& builder,
                                                                std::span<const Completion> completions) {
    std::vector<flatbuffers::Offset<proto::CompletionCandidate>> candidates;
    candidates.reserve(completions.size());
    for (auto& completion : completions) {
        candidates.push_back(completion.Pack(builder));
    }
    auto candidates_ofs = builder.CreateVector(candidates);
    proto::CompletionListBuilder out{builder};
    out.add_candidates(candidates_ofs);
    return out.Finish();
}

void PrintTo(const Completion& completion, std::ostream* out) {
    *out << "{" << completion.text << ", -" << completion.delete_back_count << "}";
}

}  // namespace sqlcomplete
