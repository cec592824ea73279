#include <gtest/gtest.h>
#include "executors/output_sink.hpp"
#include <sstream>
#include <stdexcept>

TEST(OutputSinkTest, CapturesWhileAcquiredAndRestoresAfter) {
    std::ostringstream original;
    OutputTarget target{&original};
    OutputSink sink;

    sink.acquire(target);
    EXPECT_TRUE(sink.acquired());
    *target.stream << "captured";
    sink.release();

    EXPECT_FALSE(sink.acquired());
    EXPECT_EQ(target.stream, &original);
    *target.stream << "after";

    EXPECT_EQ(sink.contents(), "captured");
    EXPECT_EQ(original.str(), "after");
}

TEST(OutputSinkTest, DoubleAcquireThrows) {
    OutputTarget a, b;
    OutputSink sink;
    sink.acquire(a);
    EXPECT_THROW(sink.acquire(b), std::logic_error);
    sink.release();
    EXPECT_NO_THROW(sink.acquire(b));
}

TEST(OutputSinkTest, ReleaseIsIdempotent) {
    std::ostringstream original;
    OutputTarget target{&original};
    OutputSink sink;
    sink.release();
    sink.acquire(target);
    sink.release();
    sink.release();
    EXPECT_EQ(target.stream, &original);
}

TEST(OutputSinkTest, ScopedRedirectRestoresOnException) {
    std::ostringstream original;
    OutputTarget target{&original};
    OutputSink sink;
    try {
        ScopedOutputRedirect redirect(sink, target);
        *target.stream << "partial";
        throw std::runtime_error("boom");
    } catch (const std::runtime_error&) {
    }
    EXPECT_EQ(target.stream, &original);
    EXPECT_EQ(sink.contents(), "partial");
}

TEST(OutputSinkTest, DestructorReleases) {
    std::ostringstream original;
    OutputTarget target{&original};
    {
        OutputSink sink;
        sink.acquire(target);
    }
    EXPECT_EQ(target.stream, &original);
}

TEST(OutputSinkTest, TruncatesAtCapAndKeepsStreamGood) {
    OutputSink sink(8);
    sink.stream() << "0123456789";
    sink.stream() << 'x';
    EXPECT_TRUE(sink.stream().good());
    EXPECT_TRUE(sink.truncated());
    EXPECT_EQ(sink.contents(), std::string("01234567") + OutputSink::kTruncatedMarker);
}

TEST(OutputSinkTest, ExactlyAtCapIsNotTruncated) {
    OutputSink sink(4);
    sink.stream() << "abcd";
    EXPECT_FALSE(sink.truncated());
    EXPECT_EQ(sink.contents(), "abcd");
}
