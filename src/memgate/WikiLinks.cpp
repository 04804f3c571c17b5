//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: WikiLinks.cpp
// Purpose: Wiki-link scanner and co-occurrence graph
//==========================================================================================================

#include "memgate/WikiLinks.h"

#include <algorithm>
#include <cctype>
#include <map>
#include <set>

namespace memgate {

namespace {

std::string normalizeEntity(const std::string& raw) {
    auto isSpace = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    auto begin = std::find_if_not(raw.begin(), raw.end(), isSpace);
    auto end = std::find_if_not(raw.rbegin(), raw.rend(), isSpace).base();
    if (begin >= end) {
        return {};
    }
    std::string out(begin, end);
    for (char& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

} // namespace

std::vector<std::string> ExtractWikiLinks(const std::string& text) {
    std::set<std::string> links;
    std::size_t pos = text.find("[[");
    while (pos != std::string::npos) {
        const std::size_t start = pos + 2;
        std::size_t j = start;
        while (j < text.size() && text[j] != '[' && text[j] != ']') {
            ++j;
        }
        if (j + 1 < text.size() && text[j] == ']' && text[j + 1] == ']' && j > start) {
            const std::string inner = text.substr(start, j - start);
            const std::size_t bar = inner.find('|');
            std::string entity;
            if (bar == std::string::npos) {
                entity = normalizeEntity(inner);
            } else if (bar > 0) {
                // [[display|target]] links reference the target
                entity = normalizeEntity(inner.substr(bar + 1));
            }
            if (!entity.empty()) {
                links.insert(std::move(entity));
            }
            pos = text.find("[[", j + 2);
        } else {
            pos = text.find("[[", pos + 1);
        }
    }
    return std::vector<std::string>(links.begin(), links.end());
}

WikiLinkGraph BuildWikiLinkGraph(const std::vector<std::vector<std::string>>& linkSets,
                                 const std::optional<std::string>& entity, unsigned depth) {
    std::map<std::string, std::set<std::string>> adjacency;
    for (const auto& links : linkSets) {
        for (const auto& l : links) {
            adjacency[l];
        }
        for (std::size_t i = 0; i < links.size(); ++i) {
            for (std::size_t j = i + 1; j < links.size(); ++j) {
                if (links[i] == links[j]) continue;
                adjacency[links[i]].insert(links[j]);
                adjacency[links[j]].insert(links[i]);
            }
        }
    }

    std::set<std::string> keep;
    if (entity.has_value()) {
        const std::string root = normalizeEntity(*entity);
        if (adjacency.count(root) == 0) {
            return {};
        }
        keep.insert(root);
        std::vector<std::string> frontier{root};
        for (unsigned hop = 0; hop < depth && !frontier.empty(); ++hop) {
            std::vector<std::string> next;
            for (const auto& n : frontier) {
                for (const auto& peer : adjacency[n]) {
                    if (keep.insert(peer).second) {
                        next.push_back(peer);
                    }
                }
            }
            frontier = std::move(next);
        }
    } else {
        for (const auto& entry : adjacency) {
            keep.insert(entry.first);
        }
    }

    WikiLinkGraph graph;
    graph.nodes.assign(keep.begin(), keep.end());
    for (const auto& node : graph.nodes) {
        for (const auto& peer : adjacency[node]) {
            if (node < peer && keep.count(peer) != 0) {
                graph.edges.emplace_back(node, peer);
            }
        }
    }
    return graph;
}

} // namespace memgate
