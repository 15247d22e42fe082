#include "http/MultipartParser.hpp"

#include <gtest/gtest.h>

using chunkdrop::http::ContentDisposition;
using chunkdrop::http::ContentType;
using chunkdrop::http::MultipartParser;

TEST(MultipartParser, ContentTypeWithBoundary)
{
    ContentType ct = MultipartParser::parseContentType(
        "Multipart/Form-Data; boundary=----WebKitFormBoundary7MA4YWxkTrZu0gW");
    EXPECT_TRUE(ct.isMultipartFormData());
    EXPECT_EQ("----WebKitFormBoundary7MA4YWxkTrZu0gW", ct.boundary);
}

TEST(MultipartParser, QuotedBoundaryAndExtraParameters)
{
    ContentType ct = MultipartParser::parseContentType(
        "multipart/form-data; charset=utf-8; boundary=\"a;b c\"");
    EXPECT_EQ("a;b c", ct.boundary);
}

TEST(MultipartParser, ContentTypeWithoutBoundary)
{
    ContentType ct = MultipartParser::parseContentType("application/json");
    EXPECT_FALSE(ct.isMultipartFormData());
    EXPECT_TRUE(ct.boundary.empty());
}

TEST(MultipartParser, ContentDispositionWithFilename)
{
    ContentDisposition cd = MultipartParser::parseContentDisposition(
        "form-data; name=\"file\"; filename=\"report; final.pdf\"");
    EXPECT_EQ("form-data", cd.type);
    EXPECT_EQ("file", cd.name);
    EXPECT_TRUE(cd.hasFilename);
    EXPECT_EQ("report; final.pdf", cd.filename);
}

TEST(MultipartParser, WindowsPathIsKeptVerbatim)
{
    ContentDisposition cd = MultipartParser::parseContentDisposition(
        "form-data; name=\"file\"; filename=\"C:\\Users\\me\\a.txt\"");
    EXPECT_EQ("C:\\Users\\me\\a.txt", cd.filename);
}

TEST(MultipartParser, ContentDispositionWithoutFilename)
{
    ContentDisposition cd = MultipartParser::parseContentDisposition("form-data; name=\"comment\"");
    EXPECT_EQ("comment", cd.name);
    EXPECT_FALSE(cd.hasFilename);
}

TEST(MultipartParser, BoundaryValidity)
{
    EXPECT_TRUE(MultipartParser::isValidBoundary("abc"));
    EXPECT_TRUE(MultipartParser::isValidBoundary(std::string(70, 'x')));
    EXPECT_FALSE(MultipartParser::isValidBoundary(""));
    EXPECT_FALSE(MultipartParser::isValidBoundary(std::string(71, 'x')));
    EXPECT_FALSE(MultipartParser::isValidBoundary("trailing "));
    EXPECT_FALSE(MultipartParser::isValidBoundary("a\r\nb"));
}
