//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MemoryService.h
// Purpose: Interface to the memory/knowledge service behind the gateway, plus an in-process implementation
//==========================================================================================================
#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <boost/uuid/uuid_generators.hpp>

#include "memgate/JSONRPCTypes.h"

namespace memgate {

//==========================================================================================================
// MemoryRecord
// Purpose: One stored memory. Timestamps are ISO-8601 UTC strings.
//==========================================================================================================
struct MemoryRecord {
    std::string id;
    std::string content;
    std::string tenantId;
    std::string userId;
    JSONValue metadata{JSONValue::Object{}};
    std::string createdAt;
    std::optional<std::string> updatedAt;
    std::vector<std::string> wikiLinks;
};

struct NewMemory {
    std::string content;
    std::string tenantId;
    std::string userId;
    JSONValue metadata{JSONValue::Object{}};
};

// Owner a write must match: a memory is only visible to updates and deletes from its own tenant and user.
struct MemoryOwner {
    std::string tenantId;
    std::string userId;
};

struct ScoredMemory {
    MemoryRecord record;
    double score{0.0};
};

struct MemoryStats {
    std::size_t totalMemories{0};
    std::size_t tenantCount{0};
};

//==========================================================================================================
// IMemoryService
// Purpose: Storage and retrieval seam. The gateway never ranks, persists, or embeds on its own; it forwards to
//          this interface. Implementations must be safe for concurrent calls and report failures by throwing
//          std::exception derivatives.
//==========================================================================================================
class IMemoryService {
public:
    virtual ~IMemoryService() = default;

    virtual MemoryRecord Create(const NewMemory& memory) = 0;
    // Best matches first, at most limit entries, restricted to tenantId.
    virtual std::vector<ScoredMemory> Search(const std::string& tenantId, const std::string& query,
                                             std::size_t limit) = 0;
    // Creation order, restricted to tenantId.
    virtual std::vector<MemoryRecord> List(const std::string& tenantId, std::size_t skip, std::size_t limit) = 0;
    virtual std::optional<MemoryRecord> Get(const std::string& memoryId) = 0;
    // Replaces the content (re-extracting wiki links) and/or metadata. nullopt when the id is unknown or the
    // memory belongs to another owner.
    virtual std::optional<MemoryRecord> Update(const std::string& memoryId, const MemoryOwner& owner,
                                               const std::optional<std::string>& content,
                                               const std::optional<JSONValue>& metadata) = 0;
    // False when the id is unknown or the memory belongs to another owner.
    virtual bool Delete(const std::string& memoryId, const MemoryOwner& owner) = 0;
    virtual MemoryStats Stats() = 0;
};

//==========================================================================================================
// InMemoryMemoryService
// Purpose: Process-local IMemoryService. Search scores each memory by the fraction of query words (whitespace
//          separated, case-insensitive) that occur in its content; memories matching no word are omitted.
//          Ties keep creation order.
//==========================================================================================================
class InMemoryMemoryService : public IMemoryService {
public:
    InMemoryMemoryService();

    MemoryRecord Create(const NewMemory& memory) override;
    std::vector<ScoredMemory> Search(const std::string& tenantId, const std::string& query,
                                     std::size_t limit) override;
    std::vector<MemoryRecord> List(const std::string& tenantId, std::size_t skip, std::size_t limit) override;
    std::optional<MemoryRecord> Get(const std::string& memoryId) override;
    std::optional<MemoryRecord> Update(const std::string& memoryId, const MemoryOwner& owner,
                                       const std::optional<std::string>& content,
                                       const std::optional<JSONValue>& metadata) override;
    bool Delete(const std::string& memoryId, const MemoryOwner& owner) override;
    MemoryStats Stats() override;

private:
    std::string newId();
    std::vector<MemoryRecord>::iterator findOwned(const std::string& memoryId, const MemoryOwner& owner);

    std::mutex mutex;
    std::vector<MemoryRecord> records; // creation order
    boost::uuids::random_generator uuidGen; // guarded by mutex
};

// JSON views of memory records used by the tool executor and resource reads.
JSONValue ToJSON(const MemoryRecord& record);
JSONValue ToJSON(const ScoredMemory& scored);

} // namespace memgate
