#include <gtest/gtest.h>
#include "llm/providers.h"
#include "llm/provider_config.h"
#include "llm/local_models.h"
#include "workers/process_util.h"
#include "config.h"
#include "test_helpers.h"
#include "temp_dir.h"

using json = nlohmann::json;

// =============================================================================
// ProviderConfig
// =============================================================================

TEST(ProviderConfigTest, FromJsonAppliesTypeDefaults) {
    ProviderConfig p = ProviderConfig::from_json({{"type", "groq"}, {"model", "llama-3.3-70b"}});
    EXPECT_EQ(p.name, "groq");
    EXPECT_EQ(p.base_url, "https://api.groq.com/openai/v1");
    EXPECT_EQ(p.api_key_env, "GROQ");
    EXPECT_EQ(p.effective_timeout(), 60);
    EXPECT_FLOAT_EQ(p.temperature, 0.1f);
    EXPECT_EQ(p.max_tokens, 4096);
}

TEST(ProviderConfigTest, LocalTimeoutIsLong) {
    ProviderConfig p = ProviderConfig::from_json({{"type", "local"}});
    EXPECT_TRUE(p.is_local());
    EXPECT_EQ(p.effective_timeout(), 900);

    p.timeout_seconds = 30;
    EXPECT_EQ(p.effective_timeout(), 30);
}

TEST(ProviderConfigTest, MissingTypeIsAnError) {
    EXPECT_THROW(ProviderConfig::from_json({{"name", "mystery"}}), ConfigError);
    EXPECT_THROW(ProviderConfig::from_json(json::array()), ConfigError);
}

TEST(ProviderConfigTest, ToJsonHidesSecret) {
    ProviderConfig p = ProviderConfig::from_json({{"type", "openai"}, {"api_key", "sk-secret"}});
    json j = p.to_json();
    EXPECT_TRUE(j["api_key_set"].get<bool>());
    EXPECT_EQ(j.dump().find("sk-secret"), std::string::npos);
}

TEST(ProviderConfigTest, LoadProvidersSortedByPriority) {
    test_helpers::TempDir dir;
    test_helpers::ScopedEnv xdg("XDG_CONFIG_HOME", dir.path());
    ASSERT_TRUE(dir.write("dirgen/providers/b.json", R"({"type":"openai","priority":5})"));
    ASSERT_TRUE(dir.write("dirgen/providers/a.json", R"({"type":"groq","priority":5})"));
    ASSERT_TRUE(dir.write("dirgen/providers/first.json", R"({"type":"anthropic","name":"claude","priority":1})"));
    ASSERT_TRUE(dir.write("dirgen/providers/broken.json", "{not json"));
    ASSERT_TRUE(dir.write("dirgen/providers/readme.txt", "ignored"));

    auto providers = ProviderConfig::load_providers();
    ASSERT_EQ(providers.size(), 3u);
    EXPECT_EQ(providers[0].name, "claude");
    EXPECT_EQ(providers[1].name, "groq");
    EXPECT_EQ(providers[2].name, "openai");
}

// =============================================================================
// Wire formats
// =============================================================================

TEST(ProviderWireTest, OpenAIRequest) {
    json req = OpenAICompatProvider::build_request("gpt-4o", "be brief", "hi", 0.1f, 256);
    EXPECT_EQ(req["model"], "gpt-4o");
    ASSERT_EQ(req["messages"].size(), 2u);
    EXPECT_EQ(req["messages"][0]["role"], "system");
    EXPECT_EQ(req["messages"][1]["content"], "hi");
    EXPECT_EQ(req["max_tokens"], 256);

    json no_system = OpenAICompatProvider::build_request("m", "", "hi", 0.1f, 0);
    EXPECT_EQ(no_system["messages"].size(), 1u);
    EXPECT_FALSE(no_system.contains("max_tokens"));
}

TEST(ProviderWireTest, OpenAIExtract) {
    json reply = {{"choices", json::array({{{"message", {{"role", "assistant"}, {"content", "answer"}}}}})}};
    EXPECT_EQ(OpenAICompatProvider::extract_text(reply), "answer");
    EXPECT_THROW(OpenAICompatProvider::extract_text({{"choices", json::array()}}), ProviderError);
}

TEST(ProviderWireTest, GeminiRequestPrependsSystemPrompt) {
    json req = GeminiProvider::build_request("You are a planner", "Plan it", 0.1f, 4096);
    EXPECT_EQ(req["contents"][0]["parts"][0]["text"], "You are a planner\n\nPlan it");
    EXPECT_EQ(req["generationConfig"]["maxOutputTokens"], 4096);

    json bare = GeminiProvider::build_request("", "Plan it", 0.1f, 10);
    EXPECT_EQ(bare["contents"][0]["parts"][0]["text"], "Plan it");
}

TEST(ProviderWireTest, GeminiExtract) {
    json reply = {{"candidates", json::array({{{"content", {{"parts", json::array({{{"text", "ok"}}})}}}}})}};
    EXPECT_EQ(GeminiProvider::extract_text(reply), "ok");
    EXPECT_THROW(GeminiProvider::extract_text({{"promptFeedback", json::object()}}), ProviderError);
}

TEST(ProviderWireTest, AnthropicExtract) {
    json reply = {{"content", json::array({{{"type", "text"}, {"text", "hello"}}})}};
    EXPECT_EQ(AnthropicProvider::extract_text(reply), "hello");
    EXPECT_THROW(AnthropicProvider::extract_text(json::object()), ProviderError);
}

// =============================================================================
// Failures that never reach the network
// =============================================================================

TEST(ProviderFailureTest, GeminiWithoutKeys) {
    GeminiProvider provider(ProviderConfig::from_json({{"type", "gemini"}}), nullptr);
    try {
        provider.complete("", "sys", "q");
        FAIL() << "expected ProviderError";
    } catch (const ProviderError& e) {
        EXPECT_NE(std::string(e.what()).find("API key not configured"), std::string::npos);
    }
}

TEST(ProviderFailureTest, OpenAIWithoutKey) {
    ProviderConfig config = ProviderConfig::from_json({{"type", "openai"}, {"api_key_env", "DIRGEN_UNSET_PREFIX"}});
    OpenAICompatProvider provider(config);
    EXPECT_THROW(provider.complete("gpt-4o", "", "q"), ProviderError);
}

namespace {

class NeverStarts : public ModelRuntime {
public:
    std::vector<std::string> list_running() override { return {}; }
    int start(const std::string&) override { throw ProcessLaunchError("docker: not found"); }
    void abort_start(int) override {}
    bool stop(const std::string&) override { return true; }
};

} // namespace

TEST(ProviderFailureTest, LocalModelThatCannotStart) {
    LocalModelManager models(std::make_unique<NeverStarts>(), LocalModelManager::Options{});
    LocalProvider provider(ProviderConfig::from_json({{"type", "local"}}),
                           "http://127.0.0.1:1/engines/v1/chat/completions", &models);
    EXPECT_TRUE(provider.is_local());
    try {
        provider.complete("ai/gemma3", "", "q");
        FAIL() << "expected ProviderError";
    } catch (const ProviderError& e) {
        EXPECT_EQ(std::string(e.what()), "Could not start local model: ai/gemma3");
    }
}

// =============================================================================
// Provider set construction
// =============================================================================

TEST(BuildProvidersTest, DefaultsFillPriorityOrder) {
    test_helpers::TempDir dir;
    test_helpers::ScopedEnv xdg("XDG_CONFIG_HOME", dir.path());
    test_helpers::ScopedEnv key("GEMINI_API_KEY", "test-key");

    Config config;
    config.llm.priority_order = {"gemini", "groq", "local"};
    config.llm.providers = json::array({{{"type", "groq"}, {"model", "llama-3.3-70b"}}});

    ProviderSet set = build_providers(config, nullptr);
    ASSERT_EQ(set.providers.size(), 3u);
    EXPECT_EQ(set.providers[0]->name(), "groq");
    EXPECT_EQ(set.providers[1]->name(), "gemini");
    EXPECT_EQ(set.providers[2]->name(), "local");
    EXPECT_TRUE(set.providers[2]->is_local());
    ASSERT_EQ(set.credential_pools.count("gemini"), 1u);
    EXPECT_EQ(set.credential_pools["gemini"]->size(), 1u);
}

TEST(BuildProvidersTest, DuplicateNamesKeepFirst) {
    test_helpers::TempDir dir;
    test_helpers::ScopedEnv xdg("XDG_CONFIG_HOME", dir.path());
    ASSERT_TRUE(dir.write("dirgen/providers/local.json", R"({"type":"local","model":"ai/other"})"));

    Config config;
    config.llm.priority_order = {"local"};
    config.llm.providers = json::array({{{"type", "local"}, {"model", "ai/gemma3"}}});

    ProviderSet set = build_providers(config, nullptr);
    ASSERT_EQ(set.definitions.size(), 1u);
    EXPECT_EQ(set.definitions[0].model, "ai/gemma3");
}

TEST(BuildProvidersTest, UnknownTypeIsAConfigError) {
    test_helpers::TempDir dir;
    test_helpers::ScopedEnv xdg("XDG_CONFIG_HOME", dir.path());

    Config config;
    config.llm.providers = json::array({{{"type", "palm"}}});
    EXPECT_THROW(build_providers(config, nullptr), ConfigError);
}
