#pragma once
#include "language/run_context.hpp"
#include <ostream>
#include <streambuf>
#include <string>

// Append-only in-memory buffer that stands in for a program's stdout.
// One sink belongs to exactly one run; it is never shared.
class OutputSink {
public:
    static constexpr size_t kDefaultMaxBytes = 1 << 20;
    static constexpr const char* kTruncatedMarker = "\n[output truncated]\n";

    explicit OutputSink(size_t max_bytes = kDefaultMaxBytes);
    ~OutputSink();

    OutputSink(const OutputSink&) = delete;
    OutputSink& operator=(const OutputSink&) = delete;

    // Points `target` at this sink, remembering where it pointed before.
    // Throws std::logic_error if the sink is already acquired.
    void acquire(OutputTarget& target);
    // Restores the remembered target. No-op when not acquired.
    void release();
    bool acquired() const { return target_ != nullptr; }

    std::string contents() const;
    bool truncated() const { return buf_.truncated; }
    std::ostream& stream() { return stream_; }

private:
    struct CappedBuffer : std::streambuf {
        explicit CappedBuffer(size_t cap) : cap(cap) {}
        int_type overflow(int_type ch) override;
        std::streamsize xsputn(const char* s, std::streamsize n) override;

        std::string data;
        size_t cap;
        bool truncated{false};
    };

    CappedBuffer buf_;
    std::ostream stream_;
    OutputTarget* target_{nullptr};
    std::ostream* previous_{nullptr};
};

// Scoped acquire/release so every exit path restores the previous target.
class ScopedOutputRedirect {
public:
    ScopedOutputRedirect(OutputSink& sink, OutputTarget& target) : sink_(sink) { sink_.acquire(target); }
    ~ScopedOutputRedirect() { sink_.release(); }

    ScopedOutputRedirect(const ScopedOutputRedirect&) = delete;
    ScopedOutputRedirect& operator=(const ScopedOutputRedirect&) = delete;

private:
    OutputSink& sink_;
};
