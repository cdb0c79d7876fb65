// ==============================================================================
// circuit_breaker.cpp - Предохранитель путей оптимизации
// ==============================================================================

#include "terse/circuit_breaker.hpp"

#include "terse/platform.hpp"

#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

#include <algorithm>

namespace terse::safety {

namespace {

constexpr const char* STATE_FILE_NAME = "circuit-breaker.json";

void write_path_state(rapidjson::PrettyWriter<rapidjson::StringBuffer>& w, const PathState& ps) {
    w.StartObject();
    w.Key("results");
    w.StartArray();
    for (bool r : ps.results) {
        w.Bool(r);
    }
    w.EndArray();
    w.Key("open_until");
    if (ps.open_until) {
        w.Int64(*ps.open_until);
    } else {
        w.Null();
    }
    w.EndObject();
}

/// Разбор одного пути; отсутствующие или неверные поля дают значения по умолчанию
PathState read_path_state(const rapidjson::Value& obj, size_t window) {
    PathState ps;
    if (!obj.IsObject()) {
        return ps;
    }
    auto results = obj.FindMember("results");
    if (results != obj.MemberEnd() && results->value.IsArray()) {
        for (const auto& v : results->value.GetArray()) {
            if (v.IsBool()) {
                ps.results.push_back(v.GetBool());
            }
        }
    }
    while (ps.results.size() > window) {
        ps.results.pop_front();
    }
    auto until = obj.FindMember("open_until");
    if (until != obj.MemberEnd() && until->value.IsInt64()) {
        ps.open_until = until->value.GetInt64();
    }
    return ps;
}

}  // namespace

std::string to_string(PathId path) {
    switch (path) {
    case PathId::Fast:
        return "fast_path";
    case PathId::Smart:
        return "smart_path";
    }
    return "unknown";
}

CircuitBreaker::CircuitBreaker(BreakerSettings settings) : settings_(settings) {
    if (settings_.window == 0) {
        settings_.window = 1;
    }
}

CircuitBreaker CircuitBreaker::load(const std::filesystem::path& file, BreakerSettings settings) {
    auto content = platform::read_file(file);
    if (!content) {
        return CircuitBreaker(settings);
    }
    auto parsed = from_json(*content, settings);
    if (!parsed) {
        return CircuitBreaker(settings);
    }
    return std::move(*parsed);
}

std::optional<std::filesystem::path> CircuitBreaker::default_path() {
    auto dir = platform::state_dir();
    if (!dir) {
        return std::nullopt;
    }
    return *dir / STATE_FILE_NAME;
}

const PathState& CircuitBreaker::state(PathId path) const {
    return path == PathId::Fast ? fast_ : smart_;
}

PathState& CircuitBreaker::state(PathId path) {
    return path == PathId::Fast ? fast_ : smart_;
}

bool CircuitBreaker::is_allowed(PathId path, std::int64_t now) const {
    const auto& ps = state(path);
    return !ps.open_until || now >= *ps.open_until;
}

bool CircuitBreaker::is_allowed(PathId path) const {
    return is_allowed(path, platform::now_unix());
}

void CircuitBreaker::record_success(PathId path, std::int64_t now) {
    record(path, true, now);
}

void CircuitBreaker::record_failure(PathId path, std::int64_t now) {
    record(path, false, now);
}

void CircuitBreaker::record(PathId path, bool success) {
    record(path, success, platform::now_unix());
}

void CircuitBreaker::record(PathId path, bool success, std::int64_t now) {
    auto& ps = state(path);

    // Истёкшее окно охлаждения: новое окно с чистого листа
    if (ps.open_until && now >= *ps.open_until) {
        ps.open_until.reset();
        ps.results.clear();
    }

    ps.results.push_back(success);
    while (ps.results.size() > settings_.window) {
        ps.results.pop_front();
    }

    if (ps.results.size() >= settings_.window) {
        const auto failures =
            static_cast<size_t>(std::count(ps.results.begin(), ps.results.end(), false));
        const double rate = static_cast<double>(failures) / static_cast<double>(ps.results.size());
        if (rate > settings_.threshold) {
            ps.open_until = now + settings_.cooldown_secs;
        }
    }
}

PathStatus CircuitBreaker::status(PathId path, std::int64_t now) const {
    const auto& ps = state(path);
    PathStatus st;
    st.allowed = is_allowed(path, now);
    st.open_until = ps.open_until;
    st.recent_failures =
        static_cast<size_t>(std::count(ps.results.begin(), ps.results.end(), false));
    st.recent_total = ps.results.size();
    return st;
}

PathStatus CircuitBreaker::status(PathId path) const {
    return status(path, platform::now_unix());
}

// ----------------------------------------------------------------------------
// Сериализация
// ----------------------------------------------------------------------------

std::string CircuitBreaker::to_json() const {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> w(buffer);
    w.SetIndent(' ', 2);
    w.StartObject();
    w.Key("fast_path");
    write_path_state(w, fast_);
    w.Key("smart_path");
    write_path_state(w, smart_);
    w.EndObject();
    return std::string(buffer.GetString(), buffer.GetSize());
}

std::optional<CircuitBreaker> CircuitBreaker::from_json(std::string_view json,
                                                        BreakerSettings settings) {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());
    if (doc.HasParseError() || !doc.IsObject()) {
        return std::nullopt;
    }

    CircuitBreaker cb(settings);
    auto fast = doc.FindMember("fast_path");
    if (fast != doc.MemberEnd()) {
        cb.fast_ = read_path_state(fast->value, cb.settings_.window);
    }
    auto smart = doc.FindMember("smart_path");
    if (smart != doc.MemberEnd()) {
        cb.smart_ = read_path_state(smart->value, cb.settings_.window);
    }
    return cb;
}

SaveResult CircuitBreaker::save(const std::filesystem::path& file) const {
    SaveResult result;
    if (!platform::write_file_atomic(file, to_json())) {
        result.error = "failed to write " + platform::path_to_utf8(file);
        return result;
    }
    result.ok = true;
    return result;
}

}  // namespace terse::safety
