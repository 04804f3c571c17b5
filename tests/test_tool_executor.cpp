//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_tool_executor.cpp
// Purpose: GoogleTests for the memory tool executor (descriptors, argument validation, tenancy)
//==========================================================================================================

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "memgate/ToolExecutor.h"
#include "memgate/errors/Errors.h"
#include "memgate/typed/Content.h"

using namespace memgate;

namespace {

JSONValue args(std::initializer_list<std::pair<const char*, JSONValue>> kv) {
    JSONValue::Object o;
    for (const auto& [k, v] : kv) {
        o[k] = std::make_shared<JSONValue>(v);
    }
    return JSONValue{o};
}

std::string text(const ToolResult& r) {
    return typed::firstText(r.result).value_or("");
}

std::size_t memoryCount(const ToolResult& r) {
    JSONValue v = ParseJSON(text(r));
    const JSONValue* arr = FindMember(v, "memories");
    return arr && arr->IsArray() ? std::get<JSONValue::Array>(arr->value).size() : 0;
}

// Memory service that fails every call, for the internal-error path
class FailingMemoryService : public InMemoryMemoryService {
public:
    std::vector<ScoredMemory> Search(const std::string&, const std::string&, std::size_t) override {
        throw std::runtime_error("backend unavailable");
    }
};

} // namespace

TEST(ToolExecutor, DescriptorsInRegistrationOrder) {
    InMemoryMemoryService svc;
    MemoryToolExecutor tools(svc);
    std::vector<std::string> names;
    for (const auto& t : tools.ListDescriptors()) {
        names.push_back(t.name);
        EXPECT_TRUE(t.inputSchema.IsObject()) << t.name;
    }
    EXPECT_EQ(names, (std::vector<std::string>{"memory_search", "memory_create", "memory_update",
                                               "memory_delete", "memory_list", "wiki_link_extract",
                                               "wiki_link_graph"}));
    EXPECT_TRUE(tools.HasTool("memory_list"));
    EXPECT_FALSE(tools.HasTool("memory_purge"));
}

TEST(ToolExecutor, CreateThenSearchFindsMemory) {
    InMemoryMemoryService svc;
    MemoryToolExecutor tools(svc);
    ToolCallContext ctx{"s1", std::nullopt, std::nullopt};

    ToolResult created = tools.Execute("memory_create", args({{"content", JSONValue("Quarterly [[Budget]] review")}}), ctx);
    EXPECT_FALSE(created.result.isError);
    EXPECT_EQ(text(created).rfind("Memory created with ID: ", 0), 0u);
    ASSERT_EQ(created.notifications.size(), 1u);
    EXPECT_EQ(created.notifications[0].method, "memory.created");
    ASSERT_TRUE(created.notifications[0].params.has_value());
    EXPECT_EQ(GetStringMember(*created.notifications[0].params, "tenant_id").value_or(""), "default");

    ToolResult found = tools.Execute("memory_search", args({{"query", JSONValue("budget")}}), ctx);
    EXPECT_FALSE(found.result.isError);
    EXPECT_EQ(memoryCount(found), 1u);
    EXPECT_TRUE(found.notifications.empty());

    // Anonymous callers are recorded as the default user
    auto listed = svc.List("default", 0, 10);
    ASSERT_EQ(listed.size(), 1u);
    EXPECT_EQ(listed[0].userId, "anonymous");
}

TEST(ToolExecutor, AuthenticatedTenantOverridesArgument) {
    InMemoryMemoryService svc;
    MemoryToolExecutor tools(svc);
    ToolCallContext authed{"s1", std::string("acme"), std::string("alice")};

    tools.Execute("memory_create",
                  args({{"content", JSONValue("secret plan")}, {"tenant_id", JSONValue("other")}}), authed);
    EXPECT_EQ(svc.List("acme", 0, 10).size(), 1u);
    EXPECT_TRUE(svc.List("other", 0, 10).empty());
    EXPECT_EQ(svc.List("acme", 0, 10)[0].userId, "alice");

    // A tenant_id argument cannot reach past the authenticated tenant
    ToolCallContext otherTenant{"s2", std::string("globex"), std::nullopt};
    ToolResult r = tools.Execute("memory_search",
                                 args({{"query", JSONValue("secret")}, {"tenant_id", JSONValue("acme")}}), otherTenant);
    EXPECT_EQ(memoryCount(r), 0u);
}

TEST(ToolExecutor, UnauthenticatedTenantArgumentIsHonoured) {
    InMemoryMemoryService svc;
    MemoryToolExecutor tools(svc);
    ToolCallContext anon{"s1", std::nullopt, std::nullopt};
    tools.Execute("memory_create", args({{"content", JSONValue("x")}, {"tenant_id", JSONValue("team-a")}}), anon);
    EXPECT_EQ(svc.List("team-a", 0, 10).size(), 1u);
    EXPECT_EQ(memoryCount(tools.Execute("memory_list", args({{"tenant_id", JSONValue("team-a")}}), anon)), 1u);
    EXPECT_EQ(memoryCount(tools.Execute("memory_list", args({}), anon)), 0u);
}

TEST(ToolExecutor, UpdateAndDeleteReportMissingAsToolError) {
    InMemoryMemoryService svc;
    MemoryToolExecutor tools(svc);
    ToolCallContext ctx{"s1", std::nullopt, std::nullopt};

    ToolResult upd = tools.Execute("memory_update", args({{"memory_id", JSONValue("nope")}, {"content", JSONValue("y")}}), ctx);
    EXPECT_TRUE(upd.result.isError);
    EXPECT_EQ(text(upd), "Memory not found: nope");

    ToolResult del = tools.Execute("memory_delete", args({{"memory_id", JSONValue("nope")}}), ctx);
    EXPECT_TRUE(del.result.isError);

    auto rec = svc.Create(NewMemory{"orig", "default", "anonymous", JSONValue{JSONValue::Object{}}});
    ToolResult ok = tools.Execute("memory_update", args({{"memory_id", JSONValue(rec.id)}, {"content", JSONValue("changed")}}), ctx);
    EXPECT_FALSE(ok.result.isError);
    EXPECT_EQ(text(ok), "Memory updated: " + rec.id);
    EXPECT_EQ(svc.Get(rec.id)->content, "changed");

    ToolResult gone = tools.Execute("memory_delete", args({{"memory_id", JSONValue(rec.id)}}), ctx);
    EXPECT_FALSE(gone.result.isError);
    EXPECT_EQ(text(gone), "Memory deleted: " + rec.id);
}

TEST(ToolExecutor, ListTruncatesLongContent) {
    InMemoryMemoryService svc;
    MemoryToolExecutor tools(svc);
    svc.Create(NewMemory{std::string(300, 'a'), "default", "anonymous", JSONValue{JSONValue::Object{}}});
    ToolResult r = tools.Execute("memory_list", args({}), ToolCallContext{"s1", std::nullopt, std::nullopt});
    JSONValue v = ParseJSON(text(r));
    const auto& items = std::get<JSONValue::Array>(FindMember(v, "memories")->value);
    ASSERT_EQ(items.size(), 1u);
    const std::string preview = GetStringMember(*items[0], "content").value_or("");
    EXPECT_EQ(preview.size(), MemoryToolExecutor::ListPreviewChars + 3);
    EXPECT_EQ(preview.substr(preview.size() - 3), "...");
}

TEST(ToolExecutor, UnknownToolIsInvalidParams) {
    InMemoryMemoryService svc;
    MemoryToolExecutor tools(svc);
    try {
        tools.Execute("memory_purge", args({}), ToolCallContext{"s1", std::nullopt, std::nullopt});
        FAIL() << "expected McpException";
    } catch (const errors::McpException& e) {
        EXPECT_EQ(e.code(), JSONRPCErrorCodes::InvalidParams);
    }
}

TEST(ToolExecutor, MissingOrMistypedArgumentsAreInvalidParams) {
    InMemoryMemoryService svc;
    MemoryToolExecutor tools(svc);
    ToolCallContext ctx{"s1", std::nullopt, std::nullopt};
    EXPECT_THROW(tools.Execute("memory_search", args({}), ctx), errors::McpException);
    EXPECT_THROW(tools.Execute("memory_create", args({{"content", JSONValue(int64_t{5})}}), ctx), errors::McpException);
    EXPECT_THROW(tools.Execute("memory_search", args({{"query", JSONValue("x")}, {"limit", JSONValue(int64_t{0})}}), ctx),
                 errors::McpException);
    EXPECT_THROW(tools.Execute("memory_delete", args({}), ctx), errors::McpException);
    try {
        tools.Execute("memory_create", args({}), ctx);
        FAIL() << "expected McpException";
    } catch (const errors::McpException& e) {
        EXPECT_EQ(e.code(), JSONRPCErrorCodes::InvalidParams);
        ASSERT_TRUE(e.error().data.has_value());
        EXPECT_EQ(GetStringMember(*e.error().data, "missing").value_or(""), "content");
    }
}

TEST(ToolExecutor, ServiceFailureBecomesInternalError) {
    FailingMemoryService svc;
    MemoryToolExecutor tools(svc);
    try {
        tools.Execute("memory_search", args({{"query", JSONValue("x")}}), ToolCallContext{"s1", std::nullopt, std::nullopt});
        FAIL() << "expected McpException";
    } catch (const errors::McpException& e) {
        EXPECT_EQ(e.code(), JSONRPCErrorCodes::InternalError);
        ASSERT_TRUE(e.error().data.has_value());
        EXPECT_EQ(std::get<std::string>(e.error().data->value), "backend unavailable");
    }
}

TEST(ToolExecutor, UpdateAndDeleteAreScopedToTheCallersTenant) {
    InMemoryMemoryService svc;
    MemoryToolExecutor tools(svc);
    ToolCallContext alice{"s-alice", std::string("tenant-a"), std::string("alice")};
    ToolCallContext mallory{"s-mallory", std::string("tenant-b"), std::string("mallory")};

    const std::string created = text(tools.Execute("memory_create", args({{"content", JSONValue("alice secret")}}), alice));
    const std::string id = created.substr(created.rfind(' ') + 1);

    // tenant_id/user_id arguments cannot override an authenticated identity
    ToolResult upd = tools.Execute("memory_update",
        args({{"memory_id", JSONValue(id)}, {"content", JSONValue("pwned")}, {"tenant_id", JSONValue("tenant-a")}}),
        mallory);
    EXPECT_TRUE(upd.result.isError);
    EXPECT_EQ(text(upd), "Memory not found: " + id);

    ToolResult del = tools.Execute("memory_delete", args({{"memory_id", JSONValue(id)}}), mallory);
    EXPECT_TRUE(del.result.isError);
    EXPECT_EQ(text(del), "Memory not found: " + id);

    ASSERT_TRUE(svc.Get(id).has_value());
    EXPECT_EQ(svc.Get(id)->content, "alice secret");
    EXPECT_EQ(memoryCount(tools.Execute("memory_list", args({}), alice)), 1u);

    // Same tenant, different user
    ToolCallContext bob{"s-bob", std::string("tenant-a"), std::string("bob")};
    EXPECT_TRUE(tools.Execute("memory_delete", args({{"memory_id", JSONValue(id)}}), bob).result.isError);
    EXPECT_FALSE(tools.Execute("memory_delete", args({{"memory_id", JSONValue(id)}}), alice).result.isError);
    EXPECT_FALSE(svc.Get(id).has_value());
}

TEST(ToolExecutor, AnonymousWritesMatchOnTenantArgument) {
    InMemoryMemoryService svc;
    MemoryToolExecutor tools(svc);
    ToolCallContext anon{"s1", std::nullopt, std::nullopt};
    auto rec = svc.Create(NewMemory{"team note", "team-a", "anonymous", JSONValue{JSONValue::Object{}}});

    EXPECT_TRUE(tools.Execute("memory_delete", args({{"memory_id", JSONValue(rec.id)}}), anon).result.isError);
    EXPECT_FALSE(tools.Execute("memory_delete",
        args({{"memory_id", JSONValue(rec.id)}, {"tenant_id", JSONValue("team-a")}}), anon).result.isError);
}

TEST(ToolExecutor, WikiLinkExtractReturnsNormalizedLinks) {
    InMemoryMemoryService svc;
    MemoryToolExecutor tools(svc);
    ToolResult r = tools.Execute("wiki_link_extract", args({{"text", JSONValue("See [[Rust]], [[ c++ ]] and [[rust]]")}}),
                                 ToolCallContext{"s1", std::nullopt, std::nullopt});
    EXPECT_FALSE(r.result.isError);
    JSONValue v = ParseJSON(text(r));
    const auto& links = std::get<JSONValue::Array>(FindMember(v, "wiki_links")->value);
    ASSERT_EQ(links.size(), 2u);
    EXPECT_EQ(std::get<std::string>(links[0]->value), "c++");
    EXPECT_EQ(std::get<std::string>(links[1]->value), "rust");
    EXPECT_THROW(tools.Execute("wiki_link_extract", args({}), ToolCallContext{"s1", std::nullopt, std::nullopt}),
                 errors::McpException);
}

TEST(ToolExecutor, WikiLinkGraphLinksEntitiesSharingAMemory) {
    InMemoryMemoryService svc;
    MemoryToolExecutor tools(svc);
    ToolCallContext ctx{"s1", std::string("t1"), std::string("u1")};
    tools.Execute("memory_create", args({{"content", JSONValue("[[Rust]] beats [[Go]]")}}), ctx);
    tools.Execute("memory_create", args({{"content", JSONValue("[[Go]] was made at [[Google]]")}}), ctx);
    svc.Create(NewMemory{"[[Rust]] and [[Secret]]", "t2", "u2", JSONValue{JSONValue::Object{}}});

    JSONValue v = ParseJSON(text(tools.Execute("wiki_link_graph", args({}), ctx)));
    const JSONValue* graph = FindMember(v, "graph");
    ASSERT_NE(graph, nullptr);
    const auto& nodes = std::get<JSONValue::Array>(FindMember(*graph, "nodes")->value);
    const auto& edges = std::get<JSONValue::Array>(FindMember(*graph, "edges")->value);
    std::vector<std::string> ids;
    for (const auto& n : nodes) {
        ids.push_back(GetStringMember(*n, "id").value_or(""));
        EXPECT_EQ(GetStringMember(*n, "label"), GetStringMember(*n, "id"));
    }
    EXPECT_EQ(ids, (std::vector<std::string>{"go", "google", "rust"}));
    ASSERT_EQ(edges.size(), 2u);
    EXPECT_EQ(GetStringMember(*edges[0], "from").value_or(""), "go");
    EXPECT_EQ(GetStringMember(*edges[0], "to").value_or(""), "google");
    EXPECT_EQ(GetStringMember(*edges[0], "label").value_or(""), "related");

    JSONValue near = ParseJSON(text(tools.Execute("wiki_link_graph",
        args({{"entity", JSONValue("Rust")}, {"depth", JSONValue(int64_t{1})}}), ctx)));
    const auto& nearNodes = std::get<JSONValue::Array>(FindMember(*FindMember(near, "graph"), "nodes")->value);
    EXPECT_EQ(nearNodes.size(), 2u);

    EXPECT_THROW(tools.Execute("wiki_link_graph", args({{"depth", JSONValue(int64_t{0})}}), ctx), errors::McpException);
}
