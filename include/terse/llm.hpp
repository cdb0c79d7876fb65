// ==============================================================================
// terse/llm.hpp - Клиент локальной LLM (Smart path)
// ==============================================================================
//
// Назначение:
// - Интерфейс LlmClient: проверка доступности и chat-запрос
// - OllamaClient поверх libcurl:
//     GET  {url}/api/tags  - доступность (непустой список моделей)
//     GET  {url}/api/ps    - загружена ли модель (выбор тайм-аута)
//     POST {url}/api/chat  - сжатие вывода
// - Промпты по категориям команд с примером "до/после"
//
// Все ошибки сети, тайм-ауты и неверные ответы возвращаются как
// ChatResult{ok=false}; исключения наружу не выходят.
//
// ==============================================================================

#ifndef TERSE_LLM_HPP
#define TERSE_LLM_HPP

#include "terse/category.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace terse::llm {

/// Максимальная длина вывода команды в промпте (символы)
constexpr size_t MAX_PROMPT_INPUT_CHARS = 6000;

/// Окно контекста модели (num_ctx)
constexpr std::uint32_t CONTEXT_WINDOW = 40960;

// ----------------------------------------------------------------------------
// Сообщения и результаты
// ----------------------------------------------------------------------------

struct ChatMessage {
    std::string role;  // "system" / "user"
    std::string content;
};

struct ChatResult {
    bool ok = false;
    std::string text;
    std::string error;
    std::uint64_t latency_ms = 0;

    explicit operator bool() const { return ok; }
};

// ----------------------------------------------------------------------------
// LlmClient
// ----------------------------------------------------------------------------

class LlmClient {
public:
    virtual ~LlmClient() = default;

    /// Сервис отвечает и имеет хотя бы одну модель
    virtual bool is_healthy() = 0;

    virtual ChatResult chat(const std::vector<ChatMessage>& messages) = 0;

    virtual std::string model_name() const = 0;
};

struct ClientOptions {
    std::string url = "http://localhost:11434";
    std::string model = "llama3.2:1b";
    double temperature = 0.0;
    std::uint64_t cold_start_timeout_ms = 60000;
    std::uint64_t warm_timeout_ms = 3000;
    std::uint64_t health_timeout_ms = 5000;
};

class OllamaClient : public LlmClient {
public:
    explicit OllamaClient(ClientOptions options);

    bool is_healthy() override;
    ChatResult chat(const std::vector<ChatMessage>& messages) override;
    std::string model_name() const override { return options_.model; }

    /// Модель уже загружена в память (по /api/ps)
    bool is_model_loaded();

    const std::string& base_url() const { return base_url_; }

private:
    ClientOptions options_;
    std::string base_url_;
};

// ----------------------------------------------------------------------------
// Протокол (чистые функции)
// ----------------------------------------------------------------------------

/// Убрать завершающие '/', заменить "://localhost" на "://127.0.0.1"
std::string normalize_base_url(std::string_view url);

/// Бюджет ответа (num_predict): половина входных токенов в пределах [1024, 4096]
std::uint32_t response_budget(size_t total_chars);

/// Тело POST /api/chat
std::string build_chat_request(const std::string& model,
                               const std::vector<ChatMessage>& messages, double temperature);

/// message.content из ответа /api/chat; пустая строка если ответ неверный
std::string parse_chat_response(std::string_view json);

/// Число моделей в ответе /api/tags (0 если ответ неверный)
size_t count_models(std::string_view json);

/// Модель присутствует в ответе /api/ps
bool model_listed(std::string_view json, std::string_view model);

// ----------------------------------------------------------------------------
// Промпты
// ----------------------------------------------------------------------------

struct PromptTemplate {
    const char* preamble;
    const char* rules;
    const char* example_before;
    const char* example_after;
};

const PromptTemplate& template_for(Category category);

/// Обрезать текст до max_chars (граница UTF-8) с пометкой об остатке
std::string truncate_for_prompt(std::string_view text, size_t max_chars = MAX_PROMPT_INPUT_CHARS);

/// system: инструкция, правила и пример; user: команда и вывод
std::vector<ChatMessage> build_messages(std::string_view command, std::string_view output,
                                        Category category);

}  // namespace terse::llm

#endif  // TERSE_LLM_HPP
