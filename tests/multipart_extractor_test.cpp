#include "http/MultipartExtractor.hpp"

#include <gtest/gtest.h>

#include <string>

#include "core/UploadError.hpp"
#include "test_support.hpp"

using chunkdrop::core::BodyReader;
using chunkdrop::core::ErrorKind;
using chunkdrop::core::StringSink;
using chunkdrop::core::StringSource;
using chunkdrop::core::UploadError;
using chunkdrop::http::ExtractorLimits;
using chunkdrop::http::FilePart;
using chunkdrop::http::MultipartExtractor;
using chunkdrop::testing::multipartBody;
using chunkdrop::testing::patternBytes;

namespace {

const std::string kBoundary = "----WebKitFormBoundaryX3b9";

// Small limits so a few KiB of payload cross many flushes
ExtractorLimits tinyLimits()
{
    ExtractorLimits limits;
    limits.readQuantum = 7;
    limits.flushThreshold = 64;
    return limits;
}

struct Extracted {
    FilePart part;
    std::string data;
    std::uint64_t written = 0;
};

Extracted extract(const std::string& body, const ExtractorLimits& limits, std::size_t maxRead = 0)
{
    StringSource source(body, maxRead);
    BodyReader reader(source, body.size());
    MultipartExtractor extractor(kBoundary, limits);

    Extracted out;
    out.part = extractor.readPartHeaders(reader);
    StringSink sink;
    out.written = extractor.extractPayload(reader, sink);
    out.data = sink.data();
    return out;
}

ErrorKind kindOf(const std::string& body)
{
    try {
        extract(body, ExtractorLimits());
    } catch (const UploadError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected an UploadError";
    return ErrorKind::Storage;
}

}

TEST(MultipartExtractor, SmallPayloadIsExact)
{
    Extracted out = extract(multipartBody(kBoundary, "hello.txt", "hello world"), ExtractorLimits());
    EXPECT_EQ("file", out.part.fieldName);
    EXPECT_EQ("hello.txt", out.part.filename);
    EXPECT_EQ("application/octet-stream", out.part.contentType);
    EXPECT_EQ("hello world", out.data);
    EXPECT_EQ(11u, out.written);
}

TEST(MultipartExtractor, EmptyPayload)
{
    Extracted out = extract(multipartBody(kBoundary, "empty.bin", ""), ExtractorLimits());
    EXPECT_EQ("", out.data);
    EXPECT_EQ(0u, out.written);
}

TEST(MultipartExtractor, PayloadAcrossManyFlushes)
{
    const std::string payload = patternBytes(5000);
    Extracted out = extract(multipartBody(kBoundary, "big.bin", payload), tinyLimits());
    EXPECT_EQ(payload, out.data);
    EXPECT_EQ(payload.size(), out.written);
}

TEST(MultipartExtractor, PayloadSizesAroundFlushThreshold)
{
    ExtractorLimits limits = tinyLimits();
    for (std::size_t size : {0u, 1u, 63u, 64u, 65u, 128u, 129u, 1000u}) {
        const std::string payload = patternBytes(size, static_cast<unsigned>(size));
        Extracted out = extract(multipartBody(kBoundary, "f.bin", payload), limits, 5);
        EXPECT_EQ(payload, out.data) << "payload size " << size;
    }
}

TEST(MultipartExtractor, PartialDelimiterInsidePayloadIsData)
{
    std::string payload = "abc\r\n--" + kBoundary.substr(0, kBoundary.size() - 1) + "Z tail\r\n-";
    payload += std::string(200, 'q') + "\r\n--" + kBoundary.substr(0, 5);
    Extracted out = extract(multipartBody(kBoundary, "tricky.bin", payload), tinyLimits(), 3);
    EXPECT_EQ(payload, out.data);
}

TEST(MultipartExtractor, DelimiterStraddlingReads)
{
    const std::string payload = patternBytes(300, 11);
    for (std::size_t maxRead : {1u, 2u, 13u, 31u}) {
        Extracted out = extract(multipartBody(kBoundary, "s.bin", payload), tinyLimits(), maxRead);
        EXPECT_EQ(payload, out.data) << "maxRead " << maxRead;
    }
}

TEST(MultipartExtractor, PayloadEndingInNewlinesKeepsThem)
{
    const std::string payload = "line one\r\nline two\r\n\r\n";
    Extracted out = extract(multipartBody(kBoundary, "text.txt", payload), ExtractorLimits());
    EXPECT_EQ(payload, out.data);
}

TEST(MultipartExtractor, BareLineFeedFraming)
{
    Extracted out = extract(multipartBody(kBoundary, "unix.txt", "payload", "\n"), ExtractorLimits());
    EXPECT_EQ("unix.txt", out.part.filename);
    EXPECT_EQ("payload", out.data);
}

TEST(MultipartExtractor, MissingClosingDelimiterWritesEverything)
{
    std::string body = "--" + kBoundary + "\r\n"
                       "Content-Disposition: form-data; name=\"file\"; filename=\"cut.bin\"\r\n"
                       "\r\n"
                       "no closing boundary here\r\n";
    Extracted out = extract(body, ExtractorLimits());
    EXPECT_EQ("no closing boundary here", out.data);
}

TEST(MultipartExtractor, MissingInitialBoundary)
{
    std::string body = "--other-boundary\r\n"
                       "Content-Disposition: form-data; name=\"file\"; filename=\"a\"\r\n\r\nx\r\n";
    EXPECT_EQ(ErrorKind::Protocol, kindOf(body));
}

TEST(MultipartExtractor, MissingFilename)
{
    std::string body = "--" + kBoundary + "\r\n"
                       "Content-Disposition: form-data; name=\"file\"\r\n"
                       "\r\n"
                       "data\r\n--" + kBoundary + "--\r\n";
    EXPECT_EQ(ErrorKind::Protocol, kindOf(body));
}

TEST(MultipartExtractor, WrongFieldName)
{
    std::string body = "--" + kBoundary + "\r\n"
                       "Content-Disposition: form-data; name=\"avatar\"; filename=\"a.png\"\r\n"
                       "\r\n"
                       "data\r\n--" + kBoundary + "--\r\n";
    EXPECT_EQ(ErrorKind::Protocol, kindOf(body));
}

TEST(MultipartExtractor, HeadersWithoutBlankLine)
{
    std::string body = "--" + kBoundary + "\r\n"
                       "Content-Disposition: form-data; name=\"file\"; filename=\"a\"\r\n";
    EXPECT_EQ(ErrorKind::Protocol, kindOf(body));
}

TEST(MultipartExtractor, TruncatedBodyIsTruncation)
{
    const std::string full = multipartBody(kBoundary, "t.bin", patternBytes(500));
    StringSource source(full.substr(0, 300));
    BodyReader reader(source, full.size());
    MultipartExtractor extractor(kBoundary);

    extractor.readPartHeaders(reader);
    StringSink sink;
    try {
        extractor.extractPayload(reader, sink);
        FAIL() << "expected TruncationError";
    } catch (const UploadError& e) {
        EXPECT_EQ(ErrorKind::Truncation, e.kind());
    }
}

TEST(MultipartExtractor, InvalidBoundaryRejected)
{
    EXPECT_THROW(MultipartExtractor(""), UploadError);
    EXPECT_THROW(MultipartExtractor(std::string(71, 'b')), UploadError);
}

TEST(MultipartExtractor, FlushThresholdNeverBelowRetainedTail)
{
    ExtractorLimits limits;
    limits.readQuantum = 4;
    limits.flushThreshold = 1;
    const std::string payload = patternBytes(257, 3);
    Extracted out = extract(multipartBody(kBoundary, "x.bin", payload), limits);
    EXPECT_EQ(payload, out.data);
}
