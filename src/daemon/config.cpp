#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

// Short greetings nudge whisper towards the right language and punctuation.
const std::map<std::string, std::string>& builtin_prompts() {
    static const std::map<std::string, std::string> prompts = {
        {"en", "Hello, how are you doing? Nice to meet you."},
        {"es", "¡Hola, ¿cómo estás? Encantado de conocerte."},
        {"fr", "Bonjour, comment allez-vous? Ravi de vous rencontrer."},
        {"de", "Hallo, wie geht es dir? Schön dich kennenzulernen."},
        {"it", "Ciao, come stai? Piacere di conoscerti."},
        {"pt", "Olá, como você está? Prazer em conhecê-lo."},
        {"nl", "Hallo, hoe gaat het? Aangenaam kennis te maken."},
        {"pl", "Cześć, jak się masz? Miło cię poznać."},
        {"tr", "Merhaba, nasılsın? Tanıştığımıza memnun oldum."},
        {"ru", "Здравствуйте, как ваши дела? Приятно познакомиться."},
        {"ja", "こんにちは、お元気ですか？お会いできて嬉しいです。"},
        {"zh", "你好，最近好吗？见到你很高兴。"},
        {"ko", "안녕하세요, 잘 지내시나요? 만나서 반갑습니다."},
    };
    return prompts;
}

} // namespace

std::string Config::prompt_for_language(const std::string& language) const {
    if (auto it = transcription.prompts.find(language);
        it != transcription.prompts.end() && !it->second.empty()) {
        return it->second;
    }
    const auto& builtin = builtin_prompts();
    if (auto it = builtin.find(language); it != builtin.end()) return it->second;
    return {};
}

std::string Config::api_key_for(const std::string& provider) const {
    auto it = remote.api_keys.find(provider);
    return it != remote.api_keys.end() ? it->second : std::string{};
}

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("transcription")) {
            auto& t = j["transcription"];
            if (t.contains("provider")) cfg.transcription.provider = t["provider"].get<std::string>();
            if (t.contains("model")) cfg.transcription.model = t["model"].get<std::string>();
            if (t.contains("language")) cfg.transcription.language = t["language"].get<std::string>();
            if (t.contains("prompts")) {
                cfg.transcription.prompts = t["prompts"].get<std::map<std::string, std::string>>();
            }
            if (t.contains("text_formatting")) cfg.transcription.text_formatting = t["text_formatting"].get<bool>();
            if (t.contains("validate_audio")) cfg.transcription.validate_audio = t["validate_audio"].get<bool>();
        }

        if (j.contains("word_replacements")) {
            cfg.word_replacements = j["word_replacements"].get<std::map<std::string, std::string>>();
        }

        if (j.contains("models_dir")) cfg.models_dir = j["models_dir"].get<std::string>();
        if (j.contains("recordings_dir")) cfg.recordings_dir = j["recordings_dir"].get<std::string>();

        if (j.contains("remote")) {
            auto& r = j["remote"];
            if (r.contains("url")) cfg.remote.url = r["url"].get<std::string>();
            if (r.contains("api_format")) cfg.remote.api_format = r["api_format"].get<std::string>();
            if (r.contains("api_model")) cfg.remote.api_model = r["api_model"].get<std::string>();
            if (r.contains("api_keys")) {
                cfg.remote.api_keys = r["api_keys"].get<std::map<std::string, std::string>>();
            }
        }

        if (j.contains("enhancement")) {
            auto& e = j["enhancement"];
            if (e.contains("enabled")) cfg.enhancement.enabled = e["enabled"].get<bool>();
            if (e.contains("url")) cfg.enhancement.url = e["url"].get<std::string>();
            if (e.contains("model")) cfg.enhancement.model = e["model"].get<std::string>();
            if (e.contains("api_key")) cfg.enhancement.api_key = e["api_key"].get<std::string>();
            if (e.contains("prompt_name")) cfg.enhancement.prompt_name = e["prompt_name"].get<std::string>();
            if (e.contains("system_prompt")) cfg.enhancement.system_prompt = e["system_prompt"].get<std::string>();
        }

        if (j.contains("audio")) {
            auto& a = j["audio"];
            if (a.contains("sample_rate")) cfg.audio.sample_rate = a["sample_rate"].get<uint32_t>();
            if (a.contains("max_seconds")) cfg.audio.max_seconds = a["max_seconds"].get<uint32_t>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
