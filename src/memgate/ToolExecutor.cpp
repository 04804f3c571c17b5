//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolExecutor.cpp
// Purpose: Memory tool descriptors and argument forwarding to the memory service
//==========================================================================================================

#include "memgate/ToolExecutor.h"

#include <algorithm>

#include "logging/Logger.h"
#include "memgate/errors/Errors.h"
#include "memgate/typed/Content.h"
#include "memgate/typed/Params.h"
#include "memgate/WikiLinks.h"

namespace memgate {

namespace {

using Property = std::pair<std::string, JSONValue>;

JSONValue typedProperty(const char* type, const char* description) {
    JSONValue::Object p;
    p["type"] = std::make_shared<JSONValue>(type);
    p["description"] = std::make_shared<JSONValue>(description);
    return JSONValue{p};
}

JSONValue integerProperty(const char* description, int64_t defaultValue) {
    JSONValue v = typedProperty("integer", description);
    std::get<JSONValue::Object>(v.value)["default"] = std::make_shared<JSONValue>(defaultValue);
    return v;
}

JSONValue objectSchema(const std::vector<Property>& properties, const std::vector<std::string>& required) {
    JSONValue::Object props;
    for (const auto& [name, schema] : properties) {
        props[name] = std::make_shared<JSONValue>(schema);
    }
    JSONValue::Array req;
    for (const auto& r : required) {
        req.push_back(std::make_shared<JSONValue>(r));
    }
    JSONValue::Object schema;
    schema["type"] = std::make_shared<JSONValue>("object");
    schema["properties"] = std::make_shared<JSONValue>(props);
    schema["required"] = std::make_shared<JSONValue>(req);
    return JSONValue{schema};
}

JSONValue memoriesText(JSONValue::Array memories) {
    JSONValue::Object obj;
    obj["memories"] = std::make_shared<JSONValue>(std::move(memories));
    return JSONValue{obj};
}

ToolResult textResult(const std::string& text, bool isError = false) {
    ToolResult out;
    out.result = typed::makeTextResult(text, isError);
    return out;
}

std::string resolveTenant(const ToolCallContext& ctx, const std::optional<std::string>& requested) {
    if (ctx.tenantId.has_value()) {
        return *ctx.tenantId;
    }
    if (requested.has_value() && !requested->empty()) {
        return *requested;
    }
    return MemoryToolExecutor::DefaultTenant;
}

MemoryOwner resolveOwner(const ToolCallContext& ctx, const std::optional<std::string>& tenant,
                         const std::optional<std::string>& user) {
    return MemoryOwner{resolveTenant(ctx, tenant),
                       ctx.userId.value_or(user.value_or(MemoryToolExecutor::DefaultUser))};
}

JSONValue stringArray(const std::vector<std::string>& items) {
    JSONValue::Array arr;
    for (const auto& s : items) {
        arr.push_back(std::make_shared<JSONValue>(s));
    }
    return JSONValue{arr};
}

} // namespace

MemoryToolExecutor::MemoryToolExecutor(IMemoryService& memory) : memory(memory) {
    descriptors.emplace_back("memory_search", "Search through stored memories",
        objectSchema({{"query", typedProperty("string", "Search query")},
                      {"tenant_id", typedProperty("string", "Tenant ID (ignored for authenticated sessions)")},
                      {"limit", integerProperty("Max results", 10)}},
                     {"query"}));
    descriptors.emplace_back("memory_create", "Create a new memory entry",
        objectSchema({{"content", typedProperty("string", "Memory content; [[links]] are extracted")},
                      {"tenant_id", typedProperty("string", "Tenant ID (ignored for authenticated sessions)")},
                      {"user_id", typedProperty("string", "User ID (ignored for authenticated sessions)")},
                      {"metadata", typedProperty("object", "Additional metadata")}},
                     {"content"}));
    descriptors.emplace_back("memory_update", "Update an existing memory",
        objectSchema({{"memory_id", typedProperty("string", "Memory ID")},
                      {"content", typedProperty("string", "New content")},
                      {"metadata", typedProperty("object", "Replacement metadata")},
                      {"tenant_id", typedProperty("string", "Owning tenant (ignored for authenticated sessions)")},
                      {"user_id", typedProperty("string", "Owning user (ignored for authenticated sessions)")}},
                     {"memory_id"}));
    descriptors.emplace_back("memory_delete", "Delete a memory entry",
        objectSchema({{"memory_id", typedProperty("string", "Memory ID to delete")},
                      {"tenant_id", typedProperty("string", "Owning tenant (ignored for authenticated sessions)")},
                      {"user_id", typedProperty("string", "Owning user (ignored for authenticated sessions)")}},
                     {"memory_id"}));
    descriptors.emplace_back("memory_list", "List memories for a tenant",
        objectSchema({{"tenant_id", typedProperty("string", "Tenant ID (ignored for authenticated sessions)")},
                      {"skip", integerProperty("Number of memories to skip", 0)},
                      {"limit", integerProperty("Max results", 50)}},
                     {}));
    descriptors.emplace_back("wiki_link_extract", "Extract [[wiki links]] from text",
        objectSchema({{"text", typedProperty("string", "Text to scan")}},
                     {"text"}));
    descriptors.emplace_back("wiki_link_graph", "Graph of entities linked together in a tenant's memories",
        objectSchema({{"tenant_id", typedProperty("string", "Tenant ID (ignored for authenticated sessions)")},
                      {"entity", typedProperty("string", "Restrict the graph to entities near this one")},
                      {"depth", integerProperty("Hops from entity", 2)}},
                     {}));
}

std::vector<Tool> MemoryToolExecutor::ListDescriptors() const {
    return descriptors;
}

bool MemoryToolExecutor::HasTool(const std::string& name) const {
    return std::any_of(descriptors.begin(), descriptors.end(),
                       [&](const Tool& t) { return t.name == name; });
}

ToolResult MemoryToolExecutor::Execute(const std::string& name, const JSONValue& arguments,
                                       const ToolCallContext& context) {
    FUNC_SCOPE();
    if (!HasTool(name)) {
        JSONValue::Object data;
        data["tool"] = std::make_shared<JSONValue>(name);
        throw errors::invalidParams("Unknown tool: " + name, JSONValue{data});
    }
    try {
        if (name == "memory_search") return search(arguments, context);
        if (name == "memory_create") return create(arguments, context);
        if (name == "memory_update") return update(arguments, context);
        if (name == "memory_delete") return remove(arguments, context);
        if (name == "memory_list") return list(arguments, context);
        if (name == "wiki_link_extract") return extractLinks(arguments);
        return linkGraph(arguments, context);
    } catch (const errors::McpException&) {
        throw;
    } catch (const std::exception& e) {
        LOG_ERROR("Tool {} failed in memory service: {}", name, e.what());
        throw errors::internalError("Internal error", JSONValue(std::string(e.what())));
    }
}

ToolResult MemoryToolExecutor::search(const JSONValue& arguments, const ToolCallContext& context) {
    const auto args = typed::parseMemorySearchArgs(arguments);
    const auto tenant = resolveTenant(context, args.tenantId);
    const auto found = memory.Search(tenant, args.query, static_cast<std::size_t>(args.limit));
    JSONValue::Array items;
    for (const auto& m : found) {
        items.push_back(std::make_shared<JSONValue>(ToJSON(m)));
    }
    LOG_DEBUG("memory_search tenant={} query='{}' hits={}", tenant, args.query, found.size());
    return textResult(SerializeJSON(memoriesText(std::move(items))));
}

ToolResult MemoryToolExecutor::create(const JSONValue& arguments, const ToolCallContext& context) {
    const auto args = typed::parseMemoryCreateArgs(arguments);
    NewMemory m;
    m.content = args.content;
    m.tenantId = resolveTenant(context, args.tenantId);
    m.userId = context.userId.value_or(args.userId.value_or(DefaultUser));
    m.metadata = args.metadata;
    const MemoryRecord rec = memory.Create(m);

    ToolResult out = textResult("Memory created with ID: " + rec.id);
    JSONValue::Object params;
    params["memory_id"] = std::make_shared<JSONValue>(rec.id);
    params["tenant_id"] = std::make_shared<JSONValue>(rec.tenantId);
    out.notifications.emplace_back(Notifications::MemoryCreated, JSONValue{params});
    return out;
}

ToolResult MemoryToolExecutor::update(const JSONValue& arguments, const ToolCallContext& context) {
    const auto args = typed::parseMemoryUpdateArgs(arguments);
    const auto owner = resolveOwner(context, args.tenantId, args.userId);
    // Another owner's memory reports as missing so ids do not leak across tenants
    auto rec = memory.Update(args.memoryId, owner, args.content, args.metadata);
    if (!rec.has_value()) {
        return textResult("Memory not found: " + args.memoryId, true);
    }
    return textResult("Memory updated: " + rec->id);
}

ToolResult MemoryToolExecutor::remove(const JSONValue& arguments, const ToolCallContext& context) {
    const auto args = typed::parseMemoryDeleteArgs(arguments);
    if (!memory.Delete(args.memoryId, resolveOwner(context, args.tenantId, args.userId))) {
        return textResult("Memory not found: " + args.memoryId, true);
    }
    return textResult("Memory deleted: " + args.memoryId);
}

ToolResult MemoryToolExecutor::list(const JSONValue& arguments, const ToolCallContext& context) {
    const auto args = typed::parseMemoryListArgs(arguments);
    const auto tenant = resolveTenant(context, args.tenantId);
    const auto records = memory.List(tenant, static_cast<std::size_t>(args.skip), static_cast<std::size_t>(args.limit));
    JSONValue::Array items;
    for (const auto& rec : records) {
        std::string preview = rec.content;
        if (preview.size() > ListPreviewChars) {
            preview = preview.substr(0, ListPreviewChars) + "...";
        }
        JSONValue::Object item;
        item["id"] = std::make_shared<JSONValue>(rec.id);
        item["content"] = std::make_shared<JSONValue>(preview);
        item["created_at"] = std::make_shared<JSONValue>(rec.createdAt);
        items.push_back(std::make_shared<JSONValue>(item));
    }
    return textResult(SerializeJSON(memoriesText(std::move(items))));
}

ToolResult MemoryToolExecutor::extractLinks(const JSONValue& arguments) {
    const auto args = typed::parseWikiLinkExtractArgs(arguments);
    JSONValue::Object obj;
    obj["wiki_links"] = std::make_shared<JSONValue>(stringArray(ExtractWikiLinks(args.text)));
    return textResult(SerializeJSON(JSONValue{obj}));
}

ToolResult MemoryToolExecutor::linkGraph(const JSONValue& arguments, const ToolCallContext& context) {
    const auto args = typed::parseWikiLinkGraphArgs(arguments);
    const auto tenant = resolveTenant(context, args.tenantId);
    std::vector<std::vector<std::string>> linkSets;
    for (const auto& rec : memory.List(tenant, 0, GraphScanLimit)) {
        if (!rec.wikiLinks.empty()) {
            linkSets.push_back(rec.wikiLinks);
        }
    }
    const WikiLinkGraph graph = BuildWikiLinkGraph(linkSets, args.entity, static_cast<unsigned>(args.depth));

    JSONValue::Array nodes;
    for (const auto& n : graph.nodes) {
        JSONValue::Object node;
        node["id"] = std::make_shared<JSONValue>(n);
        node["label"] = std::make_shared<JSONValue>(n);
        nodes.push_back(std::make_shared<JSONValue>(node));
    }
    JSONValue::Array edges;
    for (const auto& [from, to] : graph.edges) {
        JSONValue::Object edge;
        edge["from"] = std::make_shared<JSONValue>(from);
        edge["to"] = std::make_shared<JSONValue>(to);
        edge["label"] = std::make_shared<JSONValue>(std::string("related"));
        edges.push_back(std::make_shared<JSONValue>(edge));
    }
    JSONValue::Object g;
    g["nodes"] = std::make_shared<JSONValue>(nodes);
    g["edges"] = std::make_shared<JSONValue>(edges);
    JSONValue::Object obj;
    obj["graph"] = std::make_shared<JSONValue>(g);
    LOG_DEBUG("wiki_link_graph tenant={} nodes={} edges={}", tenant, graph.nodes.size(), graph.edges.size());
    return textResult(SerializeJSON(JSONValue{obj}));
}

} // namespace memgate
