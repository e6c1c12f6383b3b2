#include <catch2/catch_test_macros.hpp>

#include "config.hpp"
#include "test_support.hpp"
#include "transcription/model.hpp"

#include <filesystem>

TEST_CASE("ModelProvider names", "[model]") {
    for (auto p : {ModelProvider::Local, ModelProvider::Lan, ModelProvider::Groq,
                   ModelProvider::Mistral, ModelProvider::Custom}) {
        REQUIRE(provider_from_string(to_string(p)) == p);
    }
    REQUIRE_FALSE(provider_from_string("openai").has_value());
    REQUIRE_FALSE(provider_from_string("").has_value());
}

TEST_CASE("ModelCatalog", "[model]") {
    test_support::TmpDir dir("models");
    Config cfg;
    cfg.remote.url = "http://192.168.1.20:8080";
    cfg.remote.api_model = "whisper-small";
    auto catalog = ModelCatalog::from_config(cfg, dir.path);

    SECTION("LocalModel") {
        auto m = catalog.resolve(ModelProvider::Local, "base.en");
        REQUIRE(m.name == "base.en");
        REQUIRE(m.model_path == dir.path / "ggml-base.en.bin");
        REQUIRE_FALSE(m.endpoint.has_value());
    }

    SECTION("LanModel") {
        auto m = catalog.resolve(ModelProvider::Lan, "large-v3");
        REQUIRE(m.endpoint == "http://192.168.1.20:8080");
        REQUIRE_FALSE(m.model_path.has_value());
    }

    SECTION("CloudModels") {
        auto groq = catalog.resolve(ModelProvider::Groq, "whisper-large-v3-turbo");
        REQUIRE(groq.endpoint == ModelCatalog::GROQ_ENDPOINT);
        REQUIRE(groq.api_model == "whisper-large-v3-turbo");

        auto mistral = catalog.resolve(ModelProvider::Mistral, "voxtral-mini-latest");
        REQUIRE(mistral.endpoint == ModelCatalog::MISTRAL_ENDPOINT);
    }

    SECTION("CustomFallsBackToConfiguredApiModel") {
        REQUIRE(catalog.resolve(ModelProvider::Custom, "").api_model == "whisper-small");
        REQUIRE(catalog.resolve(ModelProvider::Custom, "distil").api_model == "distil");
    }

    SECTION("EmptyNamePicksProviderDefault") {
        REQUIRE(catalog.resolve(ModelProvider::Groq, "").api_model == ModelCatalog::DEFAULT_GROQ_MODEL);
        REQUIRE(catalog.resolve(ModelProvider::Mistral, "").name == ModelCatalog::DEFAULT_MISTRAL_MODEL);
        REQUIRE(catalog.resolve(ModelProvider::Lan, "").api_model == "whisper-small");
        REQUIRE(catalog.resolve(ModelProvider::Local, "").model_path == dir.path / "ggml-base.en.bin");
    }

    SECTION("InstalledModels") {
        test_support::write_bytes(dir / "ggml-small.bin", {0});
        test_support::write_bytes(dir / "ggml-base.en.bin", {0});
        test_support::write_bytes(dir / "README.md", {0});
        std::filesystem::create_directories(dir / "ggml-dir.bin");

        REQUIRE(catalog.installed_local_models() == std::vector<std::string>{"base.en", "small"});
    }

    SECTION("MissingModelsDir") {
        ModelCatalog empty(dir / "absent", "", "");
        REQUIRE(empty.installed_local_models().empty());
    }
}
