#include <catch2/catch_test_macros.hpp>

#include "inference/context_manager.hpp"
#include "test_support.hpp"

#include <chrono>
#include <future>
#include <thread>
#include <vector>

using test_support::FakeEngine;

namespace {

const std::vector<float> one_second(16000, 0.0f);

// Spins until pred holds or a second passes.
template <typename Pred>
bool eventually(Pred pred) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(1);
    while (!pred()) {
        if (std::chrono::steady_clock::now() > deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
}

} // namespace

TEST_CASE("ContextManager load", "[context]") {
    FakeEngine engine;
    ContextManager mgr(engine);

    SECTION("LoadIsIdempotent") {
        auto a = mgr.load_context("base.en", "/models/base.en");
        auto b = mgr.load_context("base.en", "/models/base.en");
        REQUIRE(a.has_value());
        REQUIRE(b.has_value());
        REQUIRE(a->get() == b->get());
        REQUIRE(engine.loads.load() == 1);
        REQUIRE(mgr.is_context_loaded("base.en"));
        REQUIRE(mgr.available_contexts() == std::vector<std::string>{"base.en"});
    }

    SECTION("ConcurrentLoadIsRejected") {
        std::promise<void> release;
        engine.gate = release.get_future().share();

        auto first = std::async(std::launch::async,
                                [&] { return mgr.load_context("small", "/models/small"); });
        REQUIRE(eventually([&] { return mgr.is_loading("small"); }));

        auto second = mgr.load_context("small", "/models/small");
        REQUIRE_FALSE(second.has_value());
        REQUIRE(second.error().code == ErrorCode::ContextLoadInProgress);
        REQUIRE_FALSE(mgr.is_context_loaded("small"));

        release.set_value();
        REQUIRE(first.get().has_value());
        REQUIRE(mgr.is_context_loaded("small"));
        REQUIRE_FALSE(mgr.is_loading("small"));
    }

    SECTION("FailedLoadLeavesNoTrace") {
        auto bad = mgr.load_context("tiny", "/models/missing");
        REQUIRE_FALSE(bad.has_value());
        REQUIRE(bad.error().code == ErrorCode::ModelLoadFailed);
        REQUIRE_FALSE(mgr.is_context_loaded("tiny"));
        REQUIRE_FALSE(mgr.is_loading("tiny"));

        auto good = mgr.load_context("tiny", "/models/tiny");
        REQUIRE(good.has_value());
        REQUIRE(mgr.is_context_loaded("tiny"));
    }

    SECTION("LoadUnloadSequence") {
        // Final state tracks the last operation applied to each id.
        REQUIRE(mgr.load_context("a", "/models/a").has_value());
        REQUIRE(mgr.load_context("b", "/models/b").has_value());
        mgr.unload_context("a");
        REQUIRE(mgr.load_context("c", "/models/c").has_value());
        mgr.unload_context("b");
        REQUIRE(mgr.load_context("a", "/models/a").has_value());
        mgr.unload_context("missing-id");

        REQUIRE(mgr.available_contexts() == std::vector<std::string>{"a", "c"});
        REQUIRE(engine.loads.load() == 4);
        REQUIRE(engine.releases.load() == 2);
    }

    SECTION("UnloadReleasesNativeHandle") {
        auto ctx = mgr.load_context("base", "/models/base");
        REQUIRE(ctx.has_value());
        auto held = *ctx;

        mgr.unload_context("base");
        REQUIRE(held->is_released());
        REQUIRE(engine.releases.load() == 1);

        // A stale holder gets an error instead of touching freed memory.
        auto text = held->transcribe(one_second, "", "en");
        REQUIRE_FALSE(text.has_value());
        REQUIRE(text.error().code == ErrorCode::ContextNotLoaded);
    }

    SECTION("UnloadAll") {
        REQUIRE(mgr.load_context("a", "/models/a").has_value());
        REQUIRE(mgr.load_context("b", "/models/b").has_value());
        mgr.unload_all();
        REQUIRE(mgr.available_contexts().empty());
        REQUIRE(engine.releases.load() == 2);
    }
}

TEST_CASE("ContextManager inference", "[context]") {
    FakeEngine engine;
    ContextManager mgr(engine);

    SECTION("NotLoaded") {
        auto text = mgr.perform_inference("base", one_second);
        REQUIRE_FALSE(text.has_value());
        REQUIRE(text.error().code == ErrorCode::ContextNotLoaded);
        REQUIRE(engine.runs == 0);
    }

    SECTION("UsesConfiguredPromptAndLanguage") {
        mgr.set_prompt("Hello, how are you doing?");
        mgr.set_language("en");
        REQUIRE(mgr.load_context("base", "/models/base").has_value());

        auto text = mgr.perform_inference("base", one_second);
        REQUIRE(text.has_value());
        REQUIRE(*text == "hello world");
        REQUIRE(engine.last_prompt == "Hello, how are you doing?");
        REQUIRE(engine.last_language == "en");
        REQUIRE(engine.last_sample_count == 16000);
    }

    SECTION("OverridesWinForOneCall") {
        mgr.set_prompt("default");
        REQUIRE(mgr.load_context("base", "/models/base").has_value());

        REQUIRE(mgr.perform_inference("base", one_second, "custom", "de").has_value());
        REQUIRE(engine.last_prompt == "custom");
        REQUIRE(engine.last_language == "de");

        REQUIRE(mgr.perform_inference("base", one_second).has_value());
        REQUIRE(engine.last_prompt == "default");
        REQUIRE(engine.last_language == "auto");
        REQUIRE(mgr.prompt() == "default");
    }

    SECTION("EmptyTextIsSuccess") {
        engine.text = "";
        REQUIRE(mgr.load_context("base", "/models/base").has_value());
        auto text = mgr.perform_inference("base", one_second);
        REQUIRE(text.has_value());
        REQUIRE(text->empty());
    }

    SECTION("EngineFailure") {
        engine.fail_inference = true;
        REQUIRE(mgr.load_context("base", "/models/base").has_value());
        auto text = mgr.perform_inference("base", one_second);
        REQUIRE_FALSE(text.has_value());
        REQUIRE(text.error().code == ErrorCode::TranscriptionFailed);
    }

    SECTION("RetainRelease") {
        REQUIRE(mgr.retain("base") == -1);
        REQUIRE(mgr.load_context("base", "/models/base").has_value());
        REQUIRE(mgr.retain("base") == 1);
        REQUIRE(mgr.retain("base") == 2);
        REQUIRE(mgr.release("base") == 1);
        REQUIRE(mgr.release("base") == 0);
        REQUIRE(mgr.release("base") == 0);
        REQUIRE(mgr.ref_count("base") == 0);
        // Reaching zero frees nothing.
        REQUIRE(mgr.is_context_loaded("base"));
    }
}
