// ==============================================================================
// test_llm_gtest.cpp - Тесты протокола Ollama и промптов (GoogleTest)
// ==============================================================================
//
// Сетевые вызовы не выполняются: проверяются чистые функции протокола.
//
// ==============================================================================

#include "terse/llm.hpp"

#include <gtest/gtest.h>
#include <rapidjson/document.h>
#include <string>

namespace terse::llm::test {

// ==============================================================================
// TST-LLM-001: URL и бюджет ответа
// ==============================================================================

TEST(LlmProtocolTest, NormalizeBaseUrl) {
    EXPECT_EQ(normalize_base_url("http://localhost:11434"), "http://127.0.0.1:11434");
    EXPECT_EQ(normalize_base_url(" http://localhost:11434// "), "http://127.0.0.1:11434");
    EXPECT_EQ(normalize_base_url("http://gpu-box:8080/"), "http://gpu-box:8080");
}

TEST(LlmProtocolTest, ResponseBudget_Clamped) {
    EXPECT_EQ(response_budget(0), 1024u);
    EXPECT_EQ(response_budget(16000), 2000u);
    EXPECT_EQ(response_budget(400000), 4096u);
}

// ==============================================================================
// TST-LLM-002: JSON запросы и ответы
// ==============================================================================

TEST(LlmProtocolTest, BuildChatRequest_Fields) {
    std::vector<ChatMessage> messages = {{"system", "be brief"}, {"user", "say \"hi\"\n"}};
    const std::string body = build_chat_request("llama3.2:1b", messages, 0.0);

    rapidjson::Document doc;
    doc.Parse(body.c_str());
    ASSERT_FALSE(doc.HasParseError());
    EXPECT_STREQ(doc["model"].GetString(), "llama3.2:1b");
    EXPECT_FALSE(doc["stream"].GetBool());
    ASSERT_EQ(doc["messages"].Size(), 2u);
    EXPECT_STREQ(doc["messages"][0]["role"].GetString(), "system");
    EXPECT_STREQ(doc["messages"][1]["content"].GetString(), "say \"hi\"\n");
    EXPECT_EQ(doc["options"]["num_ctx"].GetUint(), CONTEXT_WINDOW);
    EXPECT_EQ(doc["options"]["num_predict"].GetUint(), 1024u);
    EXPECT_DOUBLE_EQ(doc["options"]["temperature"].GetDouble(), 0.0);
}

TEST(LlmProtocolTest, ParseChatResponse) {
    EXPECT_EQ(parse_chat_response(R"({"message":{"role":"assistant","content":"ok"},"done":true})"),
              "ok");
    EXPECT_EQ(parse_chat_response(R"({"message":{}})"), "");
    EXPECT_EQ(parse_chat_response(R"({"error":"model not found"})"), "");
    EXPECT_EQ(parse_chat_response("not json"), "");
}

TEST(LlmProtocolTest, CountModels) {
    EXPECT_EQ(count_models(R"({"models":[{"name":"a"},{"name":"b"}]})"), 2u);
    EXPECT_EQ(count_models(R"({"models":[]})"), 0u);
    EXPECT_EQ(count_models("{}"), 0u);
    EXPECT_EQ(count_models(""), 0u);
}

TEST(LlmProtocolTest, ModelListed) {
    const char* ps = R"({"models":[{"name":"llama3.2:1b","size":1},{"model":"phi3:mini"}]})";
    EXPECT_TRUE(model_listed(ps, "llama3.2:1b"));
    EXPECT_TRUE(model_listed(ps, "phi3:mini"));
    EXPECT_FALSE(model_listed(ps, "llama3.2"));
    EXPECT_FALSE(model_listed("[]", "llama3.2:1b"));
}

// ==============================================================================
// TST-LLM-003: Промпты
// ==============================================================================

TEST(PromptTest, TruncateForPrompt_ShortUnchanged) {
    EXPECT_EQ(truncate_for_prompt("abc", 10), "abc");
}

TEST(PromptTest, TruncateForPrompt_AddsMarker) {
    EXPECT_EQ(truncate_for_prompt("abcdef", 4), "abcd\n[... 2 more characters truncated]");
}

TEST(PromptTest, TruncateForPrompt_RespectsUtf8Boundary) {
    // "жж" = 4 байта; граница 3 попадает внутрь второго символа
    EXPECT_EQ(truncate_for_prompt("\xd0\xb6\xd0\xb6", 3),
              "\xd0\xb6\n[... 2 more characters truncated]");
}

TEST(PromptTest, TemplateFor_EveryCategoryHasExample) {
    for (Category c : {Category::VersionControl, Category::Logs, Category::FileOperations,
                       Category::BuildTest, Category::ContainerTools, Category::Generic}) {
        const auto& t = template_for(c);
        EXPECT_NE(std::string(t.preamble), "");
        EXPECT_NE(std::string(t.example_before), "");
        EXPECT_LT(std::string(t.example_after).size(), std::string(t.example_before).size());
    }
}

TEST(PromptTest, BuildMessages_SystemAndUser) {
    auto messages = build_messages("git status", "On branch main\n", Category::VersionControl);
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[0].role, "system");
    EXPECT_NE(messages[0].content.find("## Rules"), std::string::npos);
    EXPECT_NE(messages[0].content.find("version-control"), std::string::npos);
    EXPECT_EQ(messages[1].role, "user");
    EXPECT_NE(messages[1].content.find("`git status`"), std::string::npos);
    EXPECT_NE(messages[1].content.find("On branch main"), std::string::npos);
}

TEST(PromptTest, BuildMessages_LongOutputTruncated) {
    const std::string big(MAX_PROMPT_INPUT_CHARS + 500, 'x');
    auto messages = build_messages("cat big", big, Category::FileOperations);
    EXPECT_NE(messages[1].content.find("[... 500 more characters truncated]"), std::string::npos);
}

}  // namespace terse::llm::test
