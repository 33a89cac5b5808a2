/**
 * @file rey_synthesis.h
 * @brief Rey Voice Server - Text-to-speech provider chain
 *
 * Providers are tried in order. The first one that returns audio wins; a
 * provider that is not configured is skipped, and one that fails or throws
 * passes the text to the next. When every provider fails the chain returns
 * an empty payload and the turn continues text-only.
 *
 * With a cancel flag each provider call runs on a detached thread and the
 * caller polls the flag, so a closed session never waits out a provider's
 * network timeout and no further provider is started.
 */

#ifndef REY_SYNTHESIS_H
#define REY_SYNTHESIS_H

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace rey {

class SynthesisProvider {
public:
    virtual ~SynthesisProvider() = default;

    virtual const char* name() const = 0;

    /// False when required credentials are missing.
    virtual bool is_configured() const = 0;

    /// Maximum input length in bytes accepted by the provider (0 = unlimited).
    virtual size_t max_text_length() const = 0;

    /// Synthesize @p text. Returns an empty payload on failure.
    virtual std::vector<uint8_t> synthesize(const std::string& text) = 0;
};

/**
 * Truncate @p text to at most @p max_bytes without splitting a UTF-8 sequence.
 */
std::string truncate_utf8(const std::string& text, size_t max_bytes);

class SynthesisChain {
public:
    SynthesisChain() = default;

    void add_provider(std::unique_ptr<SynthesisProvider> provider);

    /**
     * Synthesize @p text with the first provider that succeeds.
     *
     * @param out_provider Optional; receives the winning provider's name
     * @param cancelled Optional; when set the call returns empty within one
     *                  poll interval and the remaining providers are skipped
     * @return Audio bytes, or empty when no provider produced audio
     */
    std::vector<uint8_t> synthesize(const std::string& text,
                                    std::string* out_provider = nullptr,
                                    const std::atomic<bool>* cancelled = nullptr);

    void set_cancel_poll(std::chrono::milliseconds poll) { cancel_poll_ = poll; }

    size_t provider_count() const { return providers_.size(); }
    bool has_configured_provider() const;

private:
    // Shared so a detached call can outlive the chain after cancellation
    std::vector<std::shared_ptr<SynthesisProvider>> providers_;
    std::chrono::milliseconds cancel_poll_{20};
};

}  // namespace rey

#endif  // REY_SYNTHESIS_H
