// ==============================================================================
// ollama.cpp - HTTP-клиент Ollama (libcurl + RapidJSON)
// ==============================================================================

#include "terse/llm.hpp"

#include "terse/platform.hpp"
#include "terse/text.hpp"

#include <curl/curl.h>

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <algorithm>
#include <initializer_list>

namespace terse::llm {

namespace {

struct HttpResponse {
    bool ok = false;
    long status = 0;
    std::string body;
    std::string error;
};

size_t write_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

/// Глобальная инициализация libcurl на время жизни процесса
class CurlGlobal {
public:
    CurlGlobal() : ok_(curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK) {}
    ~CurlGlobal() {
        if (ok_) {
            curl_global_cleanup();
        }
    }
    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;

    bool ok() const { return ok_; }

private:
    bool ok_;
};

bool ensure_curl() {
    static CurlGlobal global;
    return global.ok();
}

/// GET при body == nullptr, иначе POST application/json
HttpResponse http_request(const std::string& url, const std::string* body,
                          std::uint64_t timeout_ms) {
    HttpResponse resp;
    if (!ensure_curl()) {
        resp.error = "curl global init failed";
        return resp;
    }
    CURL* curl = curl_easy_init();
    if (!curl) {
        resp.error = "curl init failed";
        return resp;
    }

    struct curl_slist* headers = nullptr;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(std::min<std::uint64_t>(timeout_ms, 2000)));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &resp.body);
    if (body != nullptr) {
        headers = curl_slist_append(headers, "Content-Type: application/json");
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body->c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
    }

    const CURLcode res = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &resp.status);
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        resp.error = std::string("curl error: ") + curl_easy_strerror(res);
        return resp;
    }
    if (resp.status >= 400) {
        resp.error = "HTTP " + std::to_string(resp.status);
        return resp;
    }
    resp.ok = true;
    return resp;
}

}  // namespace

// ----------------------------------------------------------------------------
// Протокол
// ----------------------------------------------------------------------------

std::string normalize_base_url(std::string_view url) {
    std::string out(text::trim(url));
    while (!out.empty() && out.back() == '/') {
        out.pop_back();
    }
    text::replace_first(out, "://localhost", "://127.0.0.1");
    return out;
}

std::uint32_t response_budget(size_t total_chars) {
    const auto input_tokens = static_cast<std::uint32_t>(total_chars / 4);
    return std::clamp<std::uint32_t>(input_tokens / 2, 1024, 4096);
}

std::string build_chat_request(const std::string& model, const std::vector<ChatMessage>& messages,
                               double temperature) {
    size_t total = 0;
    for (const auto& m : messages) {
        total += m.content.size();
    }

    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> w(buffer);
    w.StartObject();
    w.Key("model");
    w.String(model.c_str(), static_cast<rapidjson::SizeType>(model.size()));
    w.Key("messages");
    w.StartArray();
    for (const auto& m : messages) {
        w.StartObject();
        w.Key("role");
        w.String(m.role.c_str(), static_cast<rapidjson::SizeType>(m.role.size()));
        w.Key("content");
        w.String(m.content.c_str(), static_cast<rapidjson::SizeType>(m.content.size()));
        w.EndObject();
    }
    w.EndArray();
    w.Key("stream");
    w.Bool(false);
    w.Key("options");
    w.StartObject();
    w.Key("temperature");
    w.Double(temperature);
    w.Key("num_predict");
    w.Uint(response_budget(total));
    w.Key("num_ctx");
    w.Uint(CONTEXT_WINDOW);
    w.EndObject();
    w.EndObject();
    return std::string(buffer.GetString(), buffer.GetSize());
}

std::string parse_chat_response(std::string_view json) {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());
    if (doc.HasParseError() || !doc.IsObject()) {
        return {};
    }
    auto message = doc.FindMember("message");
    if (message == doc.MemberEnd() || !message->value.IsObject()) {
        return {};
    }
    auto content = message->value.FindMember("content");
    if (content == message->value.MemberEnd() || !content->value.IsString()) {
        return {};
    }
    return std::string(content->value.GetString(), content->value.GetStringLength());
}

size_t count_models(std::string_view json) {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());
    if (doc.HasParseError() || !doc.IsObject()) {
        return 0;
    }
    auto models = doc.FindMember("models");
    if (models == doc.MemberEnd() || !models->value.IsArray()) {
        return 0;
    }
    return models->value.Size();
}

bool model_listed(std::string_view json, std::string_view model) {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());
    if (doc.HasParseError() || !doc.IsObject()) {
        return false;
    }
    auto models = doc.FindMember("models");
    if (models == doc.MemberEnd() || !models->value.IsArray()) {
        return false;
    }
    for (const auto& m : models->value.GetArray()) {
        if (!m.IsObject()) {
            continue;
        }
        for (const char* key : {"name", "model"}) {
            auto it = m.FindMember(key);
            if (it != m.MemberEnd() && it->value.IsString() &&
                std::string_view(it->value.GetString(), it->value.GetStringLength()) == model) {
                return true;
            }
        }
    }
    return false;
}

// ----------------------------------------------------------------------------
// OllamaClient
// ----------------------------------------------------------------------------

OllamaClient::OllamaClient(ClientOptions options)
    : options_(std::move(options)), base_url_(normalize_base_url(options_.url)) {}

bool OllamaClient::is_healthy() {
    auto resp = http_request(base_url_ + "/api/tags", nullptr, options_.health_timeout_ms);
    return resp.ok && count_models(resp.body) > 0;
}

bool OllamaClient::is_model_loaded() {
    auto resp = http_request(base_url_ + "/api/ps", nullptr, options_.health_timeout_ms);
    return resp.ok && model_listed(resp.body, options_.model);
}

ChatResult OllamaClient::chat(const std::vector<ChatMessage>& messages) {
    ChatResult result;
    const std::uint64_t timeout =
        is_model_loaded() ? options_.warm_timeout_ms : options_.cold_start_timeout_ms;
    const std::string body = build_chat_request(options_.model, messages, options_.temperature);

    const std::uint64_t started = platform::monotonic_ms();
    auto resp = http_request(base_url_ + "/api/chat", &body, timeout);
    result.latency_ms = platform::monotonic_ms() - started;
    if (!resp.ok) {
        result.error = "chat request failed: " + resp.error;
        return result;
    }

    result.text = parse_chat_response(resp.body);
    if (text::trim(result.text).empty()) {
        result.error = "empty or malformed chat response";
        return result;
    }
    result.ok = true;
    return result;
}

}  // namespace terse::llm
