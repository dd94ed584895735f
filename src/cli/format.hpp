#pragma once

#include "core/map.hpp"
#include "core/search.hpp"
#include "core/sync_types.hpp"
#include <QString>
#include <vector>

namespace mindsync::cli {

struct FormatOptions {
    bool includeIds = false;
    bool json = false;
};

// Pure formatters for the mindsync CLI. Text output is one item per line;
// JSON output is an indented document.

[[nodiscard]] QString format_vaults(const std::vector<Vault>& vaults, const FormatOptions& options = {});

[[nodiscard]] QString format_map_list(const std::vector<MapSummary>& maps, const FormatOptions& options = {});

// Text: the node tree as an indented list, then the non-hierarchy edges.
// JSON: the map's wire form.
[[nodiscard]] QString format_map(const Map& map, const FormatOptions& options = {});

[[nodiscard]] QString format_search_results(const std::vector<SearchResult>& results,
                                            const FormatOptions& options = {});

[[nodiscard]] QString format_resolutions(const std::vector<ResolutionEntry>& entries,
                                         const FormatOptions& options = {});

} // namespace mindsync::cli
