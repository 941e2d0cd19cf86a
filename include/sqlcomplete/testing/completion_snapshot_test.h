#pragma once

#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "gtest/gtest.h"
#include "pugixml.hpp"
#include "sqlcomplete/completion.h"

namespace sqlcomplete::testing {

struct CompletionSnapshotTest {
    /// Printer test name
    struct TestPrinter {
        std::string operator()(const ::testing::TestParamInfo<const CompletionSnapshotTest*>& info) const {
            return std::string{info.param->name};
        }
    };

    /// The name
    std::string name;
    /// The schema
    pugi::xml_document catalog;
    /// The input text
    std::string input;
    /// The search string for the cursor
    std::string cursor_search_string;
    /// The search index for the cursor
    size_t cursor_search_index = 0;
    /// The smart completion override
    std::optional<bool> smart_completion;
    /// The suggestion requests in text form
    std::string suggestions;
    /// The expected completions
    pugi::xml_document completions;
    /// The snapshot node in the test file
    pugi::xml_node snapshot_node;

    /// Encode completions
    static void EncodeCompletions(pugi::xml_node root, std::span<const Completion> completions);
    /// Load the completion tests
    static void LoadTests(const std::filesystem::path& source_dir);
    /// Get the completion tests of a file
    static std::vector<const CompletionSnapshotTest*> GetTests(std::string_view filename);
    /// Replace the expected completions of a test and rewrite its file
    static bool UpdateExpecteds(const CompletionSnapshotTest& test, std::span<const Completion> completions);
};

extern void operator<<(std::ostream& out, const CompletionSnapshotTest& p);

}  // namespace sqlcomplete::testing
