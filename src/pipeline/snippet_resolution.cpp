#include "mono_cbp/pipeline/snippet_resolution.hpp"
#include "mono_cbp/io/fits_io.hpp"

#include <functional>

namespace mono_cbp::pipeline {

namespace {

using Candidate = std::function<std::optional<SnippetSource>()>;

} // namespace

SnippetSource resolve_snippet_source(const std::optional<std::vector<EventSnippet>>& explicit_snippets,
                                     const TransitSearchResult* finder_result,
                                     const std::optional<fs::path>& explicit_dir,
                                     const fs::path& output_location,
                                     const std::string& default_dir_name) {
    const Candidate chain[] = {
        [&]() -> std::optional<SnippetSource> {
            if (explicit_snippets) return SnippetSource(*explicit_snippets);
            return std::nullopt;
        },
        [&]() -> std::optional<SnippetSource> {
            if (finder_result && !finder_result->event_snippets.empty()) {
                return SnippetSource(finder_result->event_snippets);
            }
            return std::nullopt;
        },
        [&]() -> std::optional<SnippetSource> {
            if (explicit_dir) return SnippetSource(*explicit_dir);
            return std::nullopt;
        },
    };

    for (const auto& candidate : chain) {
        if (auto source = candidate()) {
            return *source;
        }
    }
    return SnippetSource(output_location / default_dir_name);
}

bool is_in_memory(const SnippetSource& source) {
    return std::holds_alternative<std::vector<EventSnippet>>(source);
}

std::vector<EventSnippet> materialize_snippets(const SnippetSource& source) {
    if (const auto* snippets = std::get_if<std::vector<EventSnippet>>(&source)) {
        return *snippets;
    }
    return io::load_event_snippets(std::get<fs::path>(source));
}

std::string describe_snippet_source(const SnippetSource& source) {
    if (const auto* snippets = std::get_if<std::vector<EventSnippet>>(&source)) {
        return std::to_string(snippets->size()) + " in-memory event snippets";
    }
    return "event snippets in " + std::get<fs::path>(source).string();
}

} // namespace mono_cbp::pipeline
