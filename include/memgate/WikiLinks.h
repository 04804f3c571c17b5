//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: WikiLinks.h
// Purpose: Extraction of [[wiki-link]] entity references from memory content
//==========================================================================================================
#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace memgate {

//==========================================================================================================
// ExtractWikiLinks
// Purpose: Returns the entities referenced by [[entity]] and [[display|entity]] links in text.
// Args:
//   text: Arbitrary UTF-8 text.
// Returns:
//   Sorted, de-duplicated, whitespace-trimmed, ASCII-lower-cased entity names. Links with an empty entity
//   and links containing '[' or ']' are ignored. Extraction is idempotent.
//==========================================================================================================
std::vector<std::string> ExtractWikiLinks(const std::string& text);

// Undirected co-occurrence graph; edges are stored with from < to.
struct WikiLinkGraph {
    std::vector<std::string> nodes;
    std::vector<std::pair<std::string, std::string>> edges;
};

//==========================================================================================================
// BuildWikiLinkGraph
// Purpose: Links that appear in the same memory are related. Each entry of linkSets is one memory's links.
// Args:
//   linkSets: Per-memory link lists as produced by ExtractWikiLinks.
//   entity: When set, the graph is restricted to entities within depth hops of it (normalized like a link).
//   depth: Hop limit for the entity walk; ignored when entity is unset.
// Returns:
//   Sorted nodes and sorted, de-duplicated edges. An entity that never occurs yields an empty graph.
//==========================================================================================================
WikiLinkGraph BuildWikiLinkGraph(const std::vector<std::vector<std::string>>& linkSets,
                                 const std::optional<std::string>& entity, unsigned depth);

} // namespace memgate
