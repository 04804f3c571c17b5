//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MemoryService.cpp
// Purpose: In-process memory store with word-overlap search
//==========================================================================================================

#include "memgate/MemoryService.h"

#include <algorithm>
#include <cctype>
#include <set>
#include <sstream>

#include <boost/uuid/uuid_io.hpp>

#include "logging/Logger.h"
#include "memgate/Session.h"
#include "memgate/WikiLinks.h"

namespace memgate {

namespace {

std::string toLower(std::string s) {
    for (char& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

std::vector<std::string> splitWords(const std::string& text) {
    std::vector<std::string> words;
    std::istringstream iss(text);
    std::string w;
    while (iss >> w) {
        words.push_back(w);
    }
    return words;
}

std::string nowTimestamp() {
    return FormatTimestamp(Session::Clock::now());
}

} // namespace

InMemoryMemoryService::InMemoryMemoryService() = default;

std::string InMemoryMemoryService::newId() {
    return boost::uuids::to_string(uuidGen());
}

MemoryRecord InMemoryMemoryService::Create(const NewMemory& memory) {
    MemoryRecord rec;
    rec.content = memory.content;
    rec.tenantId = memory.tenantId;
    rec.userId = memory.userId;
    rec.metadata = memory.metadata.IsObject() ? memory.metadata : JSONValue{JSONValue::Object{}};
    rec.createdAt = nowTimestamp();
    rec.wikiLinks = ExtractWikiLinks(memory.content);

    std::lock_guard<std::mutex> lock(mutex);
    rec.id = newId();
    records.push_back(rec);
    LOG_DEBUG("Memory {} created for tenant {}", rec.id, rec.tenantId);
    return rec;
}

std::vector<ScoredMemory> InMemoryMemoryService::Search(const std::string& tenantId, const std::string& query,
                                                        std::size_t limit) {
    const std::vector<std::string> words = splitWords(toLower(query));
    std::vector<ScoredMemory> results;
    if (words.empty() || limit == 0) {
        return results;
    }
    {
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto& rec : records) {
            if (rec.tenantId != tenantId) {
                continue;
            }
            const std::string haystack = toLower(rec.content);
            std::size_t hits = 0;
            for (const auto& w : words) {
                if (haystack.find(w) != std::string::npos) {
                    ++hits;
                }
            }
            if (hits > 0) {
                results.push_back(ScoredMemory{rec, static_cast<double>(hits) / static_cast<double>(words.size())});
            }
        }
    }
    std::stable_sort(results.begin(), results.end(),
                     [](const ScoredMemory& a, const ScoredMemory& b) { return a.score > b.score; });
    if (results.size() > limit) {
        results.resize(limit);
    }
    return results;
}

std::vector<MemoryRecord> InMemoryMemoryService::List(const std::string& tenantId, std::size_t skip,
                                                      std::size_t limit) {
    std::vector<MemoryRecord> out;
    std::lock_guard<std::mutex> lock(mutex);
    std::size_t seen = 0;
    for (const auto& rec : records) {
        if (rec.tenantId != tenantId) {
            continue;
        }
        if (seen++ < skip) {
            continue;
        }
        if (out.size() >= limit) {
            break;
        }
        out.push_back(rec);
    }
    return out;
}

std::optional<MemoryRecord> InMemoryMemoryService::Get(const std::string& memoryId) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = std::find_if(records.begin(), records.end(),
                           [&](const MemoryRecord& r) { return r.id == memoryId; });
    if (it == records.end()) {
        return std::nullopt;
    }
    return *it;
}

std::vector<MemoryRecord>::iterator InMemoryMemoryService::findOwned(const std::string& memoryId,
                                                                     const MemoryOwner& owner) {
    auto it = std::find_if(records.begin(), records.end(),
                           [&](const MemoryRecord& r) { return r.id == memoryId; });
    if (it != records.end() && (it->tenantId != owner.tenantId || it->userId != owner.userId)) {
        LOG_WARN("Memory {} is not owned by {}/{}; write refused", memoryId, owner.tenantId, owner.userId);
        return records.end();
    }
    return it;
}

std::optional<MemoryRecord> InMemoryMemoryService::Update(const std::string& memoryId, const MemoryOwner& owner,
                                                          const std::optional<std::string>& content,
                                                          const std::optional<JSONValue>& metadata) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = findOwned(memoryId, owner);
    if (it == records.end()) {
        return std::nullopt;
    }
    if (content.has_value()) {
        it->content = *content;
        it->wikiLinks = ExtractWikiLinks(*content);
    }
    if (metadata.has_value()) {
        it->metadata = *metadata;
    }
    it->updatedAt = nowTimestamp();
    return *it;
}

bool InMemoryMemoryService::Delete(const std::string& memoryId, const MemoryOwner& owner) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = findOwned(memoryId, owner);
    if (it == records.end()) {
        return false;
    }
    records.erase(it);
    return true;
}

MemoryStats InMemoryMemoryService::Stats() {
    std::lock_guard<std::mutex> lock(mutex);
    std::set<std::string> tenants;
    for (const auto& rec : records) {
        tenants.insert(rec.tenantId);
    }
    return MemoryStats{records.size(), tenants.size()};
}

JSONValue ToJSON(const MemoryRecord& record) {
    JSONValue::Array links;
    for (const auto& l : record.wikiLinks) {
        links.push_back(std::make_shared<JSONValue>(l));
    }
    JSONValue::Object obj;
    obj["id"] = std::make_shared<JSONValue>(record.id);
    obj["content"] = std::make_shared<JSONValue>(record.content);
    obj["tenant_id"] = std::make_shared<JSONValue>(record.tenantId);
    obj["user_id"] = std::make_shared<JSONValue>(record.userId);
    obj["metadata"] = std::make_shared<JSONValue>(record.metadata);
    obj["created_at"] = std::make_shared<JSONValue>(record.createdAt);
    if (record.updatedAt.has_value()) {
        obj["updated_at"] = std::make_shared<JSONValue>(record.updatedAt.value());
    }
    obj["wiki_links"] = std::make_shared<JSONValue>(links);
    return JSONValue{obj};
}

JSONValue ToJSON(const ScoredMemory& scored) {
    JSONValue::Object obj;
    obj["id"] = std::make_shared<JSONValue>(scored.record.id);
    obj["content"] = std::make_shared<JSONValue>(scored.record.content);
    obj["score"] = std::make_shared<JSONValue>(scored.score);
    obj["metadata"] = std::make_shared<JSONValue>(scored.record.metadata);
    obj["created_at"] = std::make_shared<JSONValue>(scored.record.createdAt);
    return JSONValue{obj};
}

} // namespace memgate
