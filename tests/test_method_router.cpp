//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_method_router.cpp
// Purpose: GoogleTests for JSON-RPC method dispatch (lifecycle, tools, resources, prompts, memory/*)
//==========================================================================================================

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "memgate/MethodRouter.h"
#include "memgate/typed/Content.h"

using namespace memgate;

namespace {

class MethodRouterTest : public ::testing::Test {
protected:
    SessionRegistry sessions;
    InMemoryMemoryService memory;
    MemoryToolExecutor tools{memory};
    NotificationPump pump{sessions};
    MethodRouter router{sessions, tools, memory, pump, Implementation("memgate", "test")};
    std::shared_ptr<OutboundQueue> queue;
    int64_t nextId{1};

    void SetUp() override { queue = sessions.Create("s1"); }

    std::unique_ptr<JSONRPCResponse> call(const std::string& method, std::optional<JSONValue> params = std::nullopt,
                                          const std::string& sid = "s1") {
        return router.Dispatch(sid, JSONRPCRequest(nextId++, method, std::move(params)));
    }

    std::unique_ptr<JSONRPCResponse> initialize() {
        JSONValue::Object info;
        info["name"] = std::make_shared<JSONValue>("test-client");
        info["version"] = std::make_shared<JSONValue>("1.0");
        JSONValue::Object params;
        params["protocolVersion"] = std::make_shared<JSONValue>(PROTOCOL_VERSION);
        params["capabilities"] = std::make_shared<JSONValue>(JSONValue::Object{});
        params["clientInfo"] = std::make_shared<JSONValue>(info);
        return call(Methods::Initialize, JSONValue{params});
    }

    std::unique_ptr<JSONRPCResponse> callTool(const std::string& name, JSONValue::Object arguments) {
        JSONValue::Object params;
        params["name"] = std::make_shared<JSONValue>(name);
        params["arguments"] = std::make_shared<JSONValue>(std::move(arguments));
        return call(Methods::CallTool, JSONValue{params});
    }

    static int errorCode(const JSONRPCResponse& r) {
        return r.error.has_value() ? static_cast<int>(GetIntMember(*r.error, "code").value_or(0)) : 0;
    }
};

JSONValue::Object kv(const std::string& k, const std::string& v) {
    JSONValue::Object o;
    o[k] = std::make_shared<JSONValue>(v);
    return o;
}

} // namespace

TEST_F(MethodRouterTest, InitializeReturnsServerInfoAndMarksSession) {
    auto resp = initialize();
    ASSERT_FALSE(resp->IsError());
    const JSONValue& result = *resp->result;
    EXPECT_EQ(GetStringMember(result, "protocolVersion").value_or(""), "2024-11-05");
    const JSONValue* info = FindMember(result, "serverInfo");
    ASSERT_NE(info, nullptr);
    EXPECT_EQ(GetStringMember(*info, "name").value_or(""), "memgate");
    const JSONValue* caps = FindMember(result, "capabilities");
    ASSERT_NE(caps, nullptr);
    EXPECT_NE(FindMember(*caps, "tools"), nullptr);
    EXPECT_NE(FindMember(*caps, "resources"), nullptr);
    EXPECT_NE(FindMember(*caps, "prompts"), nullptr);

    auto s = sessions.Get("s1");
    ASSERT_TRUE(s->IsInitialized());
    ASSERT_TRUE(s->clientInfo.has_value());
    EXPECT_EQ(s->clientInfo->name, "test-client");
}

TEST_F(MethodRouterTest, ResponseEchoesRequestId) {
    auto resp = router.Dispatch("s1", JSONRPCRequest(std::string("abc-1"), Methods::Ping));
    ASSERT_FALSE(resp->IsError());
    EXPECT_EQ(std::get<std::string>(resp->id), "abc-1");
    EXPECT_TRUE(resp->result->IsObject());
}

TEST_F(MethodRouterTest, UnknownSessionAnswersSessionNotFound) {
    auto resp = call(Methods::Ping, std::nullopt, "ghost");
    ASSERT_TRUE(resp->IsError());
    EXPECT_EQ(errorCode(*resp), JSONRPCErrorCodes::SessionNotFound);
    const JSONValue* data = FindMember(*resp->error, "data");
    ASSERT_NE(data, nullptr);
    EXPECT_EQ(GetStringMember(*data, "session_id").value_or(""), "ghost");
}

TEST_F(MethodRouterTest, UnknownMethodIsMethodNotFound) {
    initialize();
    auto resp = call("foo/bar");
    EXPECT_EQ(errorCode(*resp), JSONRPCErrorCodes::MethodNotFound);
    auto memResp = call("memory/nonexistent");
    EXPECT_EQ(errorCode(*memResp), JSONRPCErrorCodes::MethodNotFound);
}

TEST_F(MethodRouterTest, CallsBeforeInitializeAreServedButCounted) {
    auto resp = call(Methods::ListTools);
    EXPECT_FALSE(resp->IsError());
    EXPECT_EQ(sessions.Get("s1")->outOfOrderCalls, 1u);
    call(Methods::Ping);
    EXPECT_EQ(sessions.Get("s1")->outOfOrderCalls, 1u);
}

TEST_F(MethodRouterTest, ToolsListNamesEveryTool) {
    initialize();
    auto resp = call(Methods::ListTools);
    ASSERT_FALSE(resp->IsError());
    const auto& arr = std::get<JSONValue::Array>(FindMember(*resp->result, "tools")->value);
    std::vector<std::string> names;
    for (const auto& t : arr) {
        names.push_back(GetStringMember(*t, "name").value_or(""));
        EXPECT_NE(FindMember(*t, "inputSchema"), nullptr);
    }
    EXPECT_EQ(names, (std::vector<std::string>{"memory_search", "memory_create", "memory_update",
                                               "memory_delete", "memory_list", "wiki_link_extract",
                                               "wiki_link_graph"}));
}

TEST_F(MethodRouterTest, CreateThenSearchThroughToolsCall) {
    initialize();
    auto created = callTool("memory_create", kv("content", "Notes on [[Rust]] and C++"));
    ASSERT_FALSE(created->IsError());
    auto createdText = typed::firstTextOfResult(*created->result);
    ASSERT_TRUE(createdText.has_value());
    EXPECT_EQ(createdText->rfind("Memory created with ID: ", 0), 0u);

    // The side-effect notification reaches the session stream
    auto queued = queue->Drain();
    ASSERT_EQ(queued.size(), 1u);
    EXPECT_NE(queued.front().find("memory.created"), std::string::npos);

    JSONValue::Object q = kv("query", "rust");
    auto found = callTool("memory_search", q);
    ASSERT_FALSE(found->IsError());
    JSONValue body = ParseJSON(typed::firstTextOfResult(*found->result).value_or("{}"));
    const auto& mems = std::get<JSONValue::Array>(FindMember(body, "memories")->value);
    ASSERT_EQ(mems.size(), 1u);
    EXPECT_EQ(GetStringMember(*mems[0], "content").value_or(""), "Notes on [[Rust]] and C++");
}

TEST_F(MethodRouterTest, ToolsCallErrors) {
    initialize();
    EXPECT_EQ(errorCode(*callTool("memory_purge", {})), JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(errorCode(*callTool("memory_search", {})), JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(errorCode(*call(Methods::CallTool, JSONValue{JSONValue::Object{}})), JSONRPCErrorCodes::InvalidParams);

    // A missing memory is a tool-level error, not a protocol error
    auto missing = callTool("memory_delete", kv("memory_id", "nope"));
    ASSERT_FALSE(missing->IsError());
    EXPECT_TRUE(GetBoolMember(*missing->result, "isError").value_or(false));
}

TEST_F(MethodRouterTest, AuthenticatedSessionIsScopedToItsTenant) {
    sessions.Update("s1", [](Session& s) {
        s.tenantId = "acme";
        s.userId = "alice";
    });
    initialize();
    callTool("memory_create", kv("content", "acme roadmap"));
    ASSERT_EQ(memory.List("acme", 0, 10).size(), 1u);

    auto list = call(Methods::ListResources);
    const auto& res = std::get<JSONValue::Array>(FindMember(*list->result, "resources")->value);
    ASSERT_EQ(res.size(), 1u);
    EXPECT_EQ(GetStringMember(*res[0], "uri").value_or(""), "memory://tenant/acme/all");

    auto denied = call(Methods::ReadResource, JSONValue{kv("uri", "memory://tenant/other/all")});
    EXPECT_EQ(errorCode(*denied), JSONRPCErrorCodes::ResourceNotFound);
}

TEST_F(MethodRouterTest, ReadResourceAllAndSingle) {
    initialize();
    auto rec = memory.Create(NewMemory{"first [[Topic]]", "default", "anonymous", JSONValue{JSONValue::Object{}}});
    memory.Create(NewMemory{"second", "default", "anonymous", JSONValue{JSONValue::Object{}}});

    auto all = call(Methods::ReadResource, JSONValue{kv("uri", "memory://tenant/default/all")});
    ASSERT_FALSE(all->IsError());
    const auto& contents = std::get<JSONValue::Array>(FindMember(*all->result, "contents")->value);
    ASSERT_EQ(contents.size(), 1u);
    EXPECT_EQ(GetStringMember(*contents[0], "mimeType").value_or(""), "application/json");
    JSONValue records = ParseJSON(GetStringMember(*contents[0], "text").value_or("[]"));
    EXPECT_EQ(std::get<JSONValue::Array>(records.value).size(), 2u);

    auto one = call(Methods::ReadResource, JSONValue{kv("uri", "memory://tenant/default/memory/" + rec.id)});
    ASSERT_FALSE(one->IsError());
    const auto& oneContents = std::get<JSONValue::Array>(FindMember(*one->result, "contents")->value);
    JSONValue single = ParseJSON(GetStringMember(*oneContents[0], "text").value_or("[]"));
    const auto& singleArr = std::get<JSONValue::Array>(single.value);
    ASSERT_EQ(singleArr.size(), 1u);
    EXPECT_EQ(GetStringMember(*singleArr[0], "id").value_or(""), rec.id);
}

TEST_F(MethodRouterTest, ReadResourceRejectsUnknownUris) {
    initialize();
    EXPECT_EQ(errorCode(*call(Methods::ReadResource, JSONValue{kv("uri", "file:///etc/passwd")})),
              JSONRPCErrorCodes::ResourceNotFound);
    EXPECT_EQ(errorCode(*call(Methods::ReadResource, JSONValue{kv("uri", "memory://tenant/default/memory/none")})),
              JSONRPCErrorCodes::ResourceNotFound);
    EXPECT_EQ(errorCode(*call(Methods::ReadResource, JSONValue{kv("uri", "memory://tenant/default/other")})),
              JSONRPCErrorCodes::ResourceNotFound);
    EXPECT_EQ(errorCode(*call(Methods::ReadResource, JSONValue{JSONValue::Object{}})),
              JSONRPCErrorCodes::InvalidParams);
}

TEST_F(MethodRouterTest, PromptsListAndGet) {
    initialize();
    auto list = call(Methods::ListPrompts);
    const auto& prompts = std::get<JSONValue::Array>(FindMember(*list->result, "prompts")->value);
    ASSERT_EQ(prompts.size(), 2u);
    EXPECT_EQ(GetStringMember(*prompts[0], "name").value_or(""), "search_memories");

    JSONValue::Object params = kv("name", "search_memories");
    params["arguments"] = std::make_shared<JSONValue>(kv("query", "budgets"));
    auto got = call(Methods::GetPrompt, JSONValue{params});
    ASSERT_FALSE(got->IsError());
    const auto& messages = std::get<JSONValue::Array>(FindMember(*got->result, "messages")->value);
    ASSERT_EQ(messages.size(), 1u);
    const JSONValue* content = FindMember(*messages[0], "content");
    ASSERT_NE(content, nullptr);
    EXPECT_NE(typed::getText(*content).value_or("").find("budgets"), std::string::npos);

    EXPECT_EQ(errorCode(*call(Methods::GetPrompt, JSONValue{kv("name", "nope")})), JSONRPCErrorCodes::InvalidParams);
}

TEST_F(MethodRouterTest, MemoryStatsAndWikiLinks) {
    initialize();
    memory.Create(NewMemory{"a", "t1", "u", JSONValue{JSONValue::Object{}}});
    memory.Create(NewMemory{"b", "t2", "u", JSONValue{JSONValue::Object{}}});
    auto stats = call("memory/stats");
    ASSERT_FALSE(stats->IsError());
    EXPECT_EQ(GetIntMember(*stats->result, "total_memories").value_or(-1), 2);
    EXPECT_EQ(GetIntMember(*stats->result, "tenant_count").value_or(-1), 2);
    EXPECT_EQ(GetStringMember(*stats->result, "session_id").value_or(""), "s1");

    auto links = call("memory/wiki_links", JSONValue{kv("text", "[[B]] then [[a]]")});
    ASSERT_FALSE(links->IsError());
    const auto& arr = std::get<JSONValue::Array>(FindMember(*links->result, "links")->value);
    ASSERT_EQ(arr.size(), 2u);
    EXPECT_EQ(std::get<std::string>(arr[0]->value), "a");
    EXPECT_EQ(std::get<std::string>(arr[1]->value), "b");
}

TEST_F(MethodRouterTest, CustomMemoryMethodAndInternalError) {
    initialize();
    router.RegisterMemoryMethod("echo", [](const std::optional<JSONValue>& params, const Session& s) {
        JSONValue::Object out;
        out["session"] = std::make_shared<JSONValue>(s.id);
        out["has_params"] = std::make_shared<JSONValue>(params.has_value());
        return JSONValue{out};
    });
    auto echo = call("memory/echo", JSONValue{JSONValue::Object{}});
    ASSERT_FALSE(echo->IsError());
    EXPECT_TRUE(GetBoolMember(*echo->result, "has_params").value_or(false));

    router.RegisterMemoryMethod("boom", [](const std::optional<JSONValue>&, const Session&) -> JSONValue {
        throw std::runtime_error("exploded");
    });
    auto boom = call("memory/boom");
    ASSERT_TRUE(boom->IsError());
    EXPECT_EQ(errorCode(*boom), JSONRPCErrorCodes::InternalError);
    EXPECT_EQ(GetStringMember(*boom->error, "message").value_or(""), "Internal error");
}

TEST_F(MethodRouterTest, NotificationsAreAbsorbed) {
    router.HandleNotification("s1", JSONRPCNotification(Methods::InitializedNotification));
    router.HandleNotification("ghost", JSONRPCNotification(Methods::InitializedNotification));
    EXPECT_TRUE(sessions.Contains("s1"));
    EXPECT_FALSE(sessions.Contains("ghost"));
    EXPECT_EQ(queue->Size(), 0u);
}

TEST_F(MethodRouterTest, ServerInfoAndPromptAccessors) {
    EXPECT_EQ(router.GetServerInfo().name, "memgate");
    EXPECT_EQ(router.ListPrompts().size(), 2u);
}
