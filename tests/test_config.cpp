#include <catch2/catch_test_macros.hpp>

#include "config.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

// RAII temp file that auto-deletes.
struct TmpFile {
    std::string path;

    explicit TmpFile(const std::string& content) {
        path = std::filesystem::temp_directory_path() / "inkwell_test_config_XXXXXX";
        // mkstemp needs a mutable char*
        std::vector<char> tmpl(path.begin(), path.end());
        tmpl.push_back('\0');
        int fd = mkstemp(tmpl.data());
        path.assign(tmpl.data());
        REQUIRE(::write(fd, content.data(), content.size()) == static_cast<ssize_t>(content.size()));
        ::close(fd);
    }

    ~TmpFile() { std::filesystem::remove(path); }
};

} // namespace

TEST_CASE("Config", "[config]") {

    SECTION("DefaultValues") {
        Config cfg;
        REQUIRE(cfg.transcription.provider == "local");
        REQUIRE(cfg.transcription.model == "base.en");
        REQUIRE(cfg.transcription.language == "en");
        REQUIRE(cfg.transcription.text_formatting);
        REQUIRE(cfg.transcription.validate_audio);
        REQUIRE(cfg.remote.url == "http://localhost:8080");
        REQUIRE(cfg.remote.api_format == "whisper.cpp");
        REQUIRE_FALSE(cfg.enhancement.enabled);
        REQUIRE(cfg.audio.sample_rate == 16000);
        REQUIRE(cfg.audio.max_seconds == 120);
        REQUIRE(cfg.audio.ring_buffer_samples() == 120 * 16000);
        REQUIRE(cfg.word_replacements.empty());
    }

    SECTION("LoadFullConfig") {
        TmpFile f(R"({
            "transcription": {
                "provider": "groq",
                "model": "whisper-large-v3",
                "language": "de",
                "prompts": { "de": "Hallo Welt." },
                "text_formatting": false,
                "validate_audio": false
            },
            "word_replacements": { "gonna, gunna": "going to" },
            "models_dir": "/opt/models",
            "recordings_dir": "/var/tmp/rec",
            "remote": {
                "url": "http://10.0.0.1:9090",
                "api_format": "openai",
                "api_model": "whisper-small",
                "api_keys": { "groq": "gsk_123" }
            },
            "enhancement": { "enabled": true, "model": "qwen3", "prompt_name": "Email" },
            "audio": { "sample_rate": 48000, "max_seconds": 60 }
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.transcription.provider == "groq");
        REQUIRE(cfg.transcription.model == "whisper-large-v3");
        REQUIRE(cfg.transcription.language == "de");
        REQUIRE_FALSE(cfg.transcription.text_formatting);
        REQUIRE_FALSE(cfg.transcription.validate_audio);
        REQUIRE(cfg.word_replacements.at("gonna, gunna") == "going to");
        REQUIRE(cfg.models_dir == "/opt/models");
        REQUIRE(cfg.recordings_dir == "/var/tmp/rec");
        REQUIRE(cfg.remote.url == "http://10.0.0.1:9090");
        REQUIRE(cfg.remote.api_format == "openai");
        REQUIRE(cfg.remote.api_model == "whisper-small");
        REQUIRE(cfg.api_key_for("groq") == "gsk_123");
        REQUIRE(cfg.api_key_for("mistral").empty());
        REQUIRE(cfg.enhancement.enabled);
        REQUIRE(cfg.enhancement.model == "qwen3");
        REQUIRE(cfg.enhancement.prompt_name == "Email");
        REQUIRE(cfg.audio.sample_rate == 48000);
        REQUIRE(cfg.audio.max_seconds == 60);
    }

    SECTION("LoadPartialConfig") {
        TmpFile f(R"({ "transcription": { "language": "fr" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.transcription.language == "fr");
        // Other fields retain defaults
        REQUIRE(cfg.transcription.provider == "local");
        REQUIRE(cfg.remote.url == "http://localhost:8080");
        REQUIRE(cfg.audio.sample_rate == 16000);
    }

    SECTION("LoadInvalidJson") {
        TmpFile f("not json {{{");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.transcription.provider == "local");
        REQUIRE(cfg.audio.sample_rate == 16000);
    }

    SECTION("WrongTypeFallsBackToDefaults") {
        TmpFile f(R"({ "audio": { "sample_rate": "fast" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.audio.sample_rate == 16000);
    }

    SECTION("LoadMissingFile") {
        auto cfg = Config::load("/tmp/inkwell_test_nonexistent_config_file.json");
        REQUIRE(cfg.transcription.provider == "local");
        REQUIRE(cfg.audio.sample_rate == 16000);
    }
}

TEST_CASE("Config::prompt_for_language", "[config]") {
    Config cfg;

    SECTION("BuiltinPrompt") {
        REQUIRE(cfg.prompt_for_language("en") == "Hello, how are you doing? Nice to meet you.");
        REQUIRE_FALSE(cfg.prompt_for_language("de").empty());
    }

    SECTION("CustomPromptWins") {
        cfg.transcription.prompts["en"] = "Kubernetes, gRPC, Postgres.";
        REQUIRE(cfg.prompt_for_language("en") == "Kubernetes, gRPC, Postgres.");
    }

    SECTION("EmptyCustomPromptFallsBack") {
        cfg.transcription.prompts["en"] = "";
        REQUIRE(cfg.prompt_for_language("en") == "Hello, how are you doing? Nice to meet you.");
    }

    SECTION("UnknownLanguageIsEmpty") {
        REQUIRE(cfg.prompt_for_language("auto").empty());
        REQUIRE(cfg.prompt_for_language("xx").empty());
    }
}
