/**
 * @file test_synthesis_chain.cpp
 * @brief Tests for ordered TTS provider fallback
 */

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

#include "rey/tts/rey_synthesis.h"
#include "test_fakes.h"

using namespace rey;
using rey::test::FakeProvider;
using rey::test::ProviderCounters;

namespace {

std::shared_ptr<ProviderCounters> add(SynthesisChain& chain, const char* name,
                                   FakeProvider::Mode mode, bool configured = true,
                                   size_t max_length = 0) {
    auto counters = std::make_shared<ProviderCounters>();
    chain.add_provider(std::make_unique<FakeProvider>(name, mode, counters, configured, max_length));
    return counters;
}

}  // namespace

TEST(SynthesisChain, FirstProviderWins) {
    SynthesisChain chain;
    auto first = add(chain, "A", FakeProvider::Mode::Audio);
    auto second = add(chain, "B", FakeProvider::Mode::Audio);

    std::string used;
    auto audio = chain.synthesize("hello", &used);
    EXPECT_FALSE(audio.empty());
    EXPECT_EQ(used, "A");
    EXPECT_EQ(first->calls.load(), 1);
    EXPECT_EQ(second->calls.load(), 0);
}

TEST(SynthesisChain, FallsBackOnEmptyAndThrow) {
    SynthesisChain chain;
    auto a = add(chain, "A", FakeProvider::Mode::Throw);
    auto b = add(chain, "B", FakeProvider::Mode::Empty);
    auto c = add(chain, "C", FakeProvider::Mode::Audio);
    auto d = add(chain, "D", FakeProvider::Mode::Audio);

    std::string used;
    EXPECT_FALSE(chain.synthesize("hello", &used).empty());
    EXPECT_EQ(used, "C");
    EXPECT_EQ(a->calls.load(), 1);
    EXPECT_EQ(b->calls.load(), 1);
    EXPECT_EQ(c->calls.load(), 1);
    EXPECT_EQ(d->calls.load(), 0);
}

TEST(SynthesisChain, SkipsUnconfiguredProviders) {
    SynthesisChain chain;
    auto a = add(chain, "A", FakeProvider::Mode::Audio, false);
    auto b = add(chain, "B", FakeProvider::Mode::Audio);

    std::string used;
    EXPECT_FALSE(chain.synthesize("hello", &used).empty());
    EXPECT_EQ(used, "B");
    EXPECT_EQ(a->calls.load(), 0);
    EXPECT_TRUE(chain.has_configured_provider());
}

TEST(SynthesisChain, AllFailingYieldsEmpty) {
    SynthesisChain chain;
    add(chain, "A", FakeProvider::Mode::Empty);
    add(chain, "B", FakeProvider::Mode::Throw);
    EXPECT_TRUE(chain.synthesize("hello").empty());
}

TEST(SynthesisChain, EmptyChainAndEmptyText) {
    SynthesisChain chain;
    EXPECT_TRUE(chain.synthesize("hello").empty());
    EXPECT_FALSE(chain.has_configured_provider());

    auto a = add(chain, "A", FakeProvider::Mode::Audio);
    EXPECT_TRUE(chain.synthesize("").empty());
    EXPECT_EQ(a->calls.load(), 0);
}

TEST(SynthesisChain, NullProviderIgnored) {
    SynthesisChain chain;
    chain.add_provider(nullptr);
    EXPECT_EQ(chain.provider_count(), 0u);
}

TEST(SynthesisChain, TruncatesToProviderLimit) {
    SynthesisChain chain;
    auto a = add(chain, "A", FakeProvider::Mode::Audio, true, 5);
    chain.synthesize("hello world");
    std::lock_guard<std::mutex> lock(a->mutex);
    EXPECT_EQ(a->last_text, "hello");
}

TEST(SynthesisChain, CancelledBeforeStartCallsNothing) {
    SynthesisChain chain;
    auto a = add(chain, "A", FakeProvider::Mode::Audio);

    std::atomic<bool> cancelled{true};
    EXPECT_TRUE(chain.synthesize("hello", nullptr, &cancelled).empty());
    EXPECT_EQ(a->calls.load(), 0);
}

TEST(SynthesisChain, CancelDuringSlowProviderStopsChain) {
    using namespace std::chrono;
    SynthesisChain chain;
    chain.set_cancel_poll(milliseconds(5));
    auto slow = std::make_shared<ProviderCounters>();
    chain.add_provider(std::make_unique<FakeProvider>("Slow", FakeProvider::Mode::Empty, slow,
                                                      true, 0, milliseconds(800)));
    auto next = add(chain, "Next", FakeProvider::Mode::Audio);

    std::atomic<bool> cancelled{false};
    std::thread canceller([&cancelled] {
        std::this_thread::sleep_for(milliseconds(50));
        cancelled = true;
    });

    const auto start = steady_clock::now();
    const auto audio = chain.synthesize("hello", nullptr, &cancelled);
    const auto elapsed = duration_cast<milliseconds>(steady_clock::now() - start);
    canceller.join();

    EXPECT_TRUE(audio.empty());
    EXPECT_LT(elapsed.count(), 300);
    EXPECT_EQ(slow->calls.load(), 1);
    EXPECT_EQ(next->calls.load(), 0);
}

TEST(SynthesisChain, UncancelledFlagStillFallsBack) {
    SynthesisChain chain;
    chain.set_cancel_poll(std::chrono::milliseconds(5));
    auto a = add(chain, "A", FakeProvider::Mode::Throw);
    auto b = add(chain, "B", FakeProvider::Mode::Audio);

    std::atomic<bool> cancelled{false};
    std::string used;
    EXPECT_FALSE(chain.synthesize("hello", &used, &cancelled).empty());
    EXPECT_EQ(used, "B");
    EXPECT_EQ(a->calls.load(), 1);
}

TEST(TruncateUtf8, NeverSplitsCodePoint) {
    const std::string text = "ab\xC3\xA9" "cd";  // "abécd"
    EXPECT_EQ(truncate_utf8(text, 3), "ab");
    EXPECT_EQ(truncate_utf8(text, 4), "ab\xC3\xA9");
    EXPECT_EQ(truncate_utf8(text, 0), text);
    EXPECT_EQ(truncate_utf8(text, 100), text);

    const std::string emoji = "\xF0\x9F\xA6\x9E!";  // lobster
    EXPECT_EQ(truncate_utf8(emoji, 3), "");
    EXPECT_EQ(truncate_utf8(emoji, 4), "\xF0\x9F\xA6\x9E");
}
