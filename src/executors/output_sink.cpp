#include "output_sink.hpp"
#include <algorithm>
#include <stdexcept>

OutputSink::CappedBuffer::int_type OutputSink::CappedBuffer::overflow(int_type ch) {
    if (traits_type::eq_int_type(ch, traits_type::eof())) return traits_type::not_eof(ch);
    char c = traits_type::to_char_type(ch);
    xsputn(&c, 1);
    return ch;
}

std::streamsize OutputSink::CappedBuffer::xsputn(const char* s, std::streamsize n) {
    size_t room = cap > data.size() ? cap - data.size() : 0;
    size_t take = std::min(room, static_cast<size_t>(n));
    data.append(s, take);
    if (take < static_cast<size_t>(n)) truncated = true;
    // Report everything as written; dropped bytes must not put the stream in a failed state.
    return n;
}

OutputSink::OutputSink(size_t max_bytes) : buf_(max_bytes), stream_(&buf_) {}

OutputSink::~OutputSink() { release(); }

void OutputSink::acquire(OutputTarget& target) {
    if (target_) throw std::logic_error("output sink is already acquired");
    previous_ = target.stream;
    target_ = &target;
    target.stream = &stream_;
}

void OutputSink::release() {
    if (!target_) return;
    target_->stream = previous_;
    target_ = nullptr;
    previous_ = nullptr;
}

std::string OutputSink::contents() const {
    if (!buf_.truncated) return buf_.data;
    return buf_.data + kTruncatedMarker;
}
