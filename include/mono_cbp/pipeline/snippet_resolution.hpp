#pragma once

#include "mono_cbp/core/types.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace mono_cbp::pipeline {

// Vetting input: snippets held in memory, or a directory of snippet files.
using SnippetSource = std::variant<std::vector<EventSnippet>, fs::path>;

/**
 * Picks the vetting input, first match wins:
 *   1. explicit in-memory snippets (even if empty),
 *   2. snippets on the transit finder's last result (if non-empty),
 *   3. explicit snippet directory,
 *   4. <output_location>/<default_dir_name>.
 */
SnippetSource resolve_snippet_source(const std::optional<std::vector<EventSnippet>>& explicit_snippets,
                                     const TransitSearchResult* finder_result,
                                     const std::optional<fs::path>& explicit_dir,
                                     const fs::path& output_location,
                                     const std::string& default_dir_name);

bool is_in_memory(const SnippetSource& source);

// Reads snippet files when source is a directory.
std::vector<EventSnippet> materialize_snippets(const SnippetSource& source);

std::string describe_snippet_source(const SnippetSource& source);

} // namespace mono_cbp::pipeline
