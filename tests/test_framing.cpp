#include <gtest/gtest.h>

#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>
#include <string>

#include "netcall/framing.hpp"

using namespace netcall;
namespace http = boost::beast::http;

namespace {

    TEST(FramingTest, NoEntity) {
        http::fields headers;
        auto d = decide_framing(HttpMethod::Get, headers, EntityKind::None);
        ASSERT_TRUE(d.has_value());
        EXPECT_EQ(d.value().framing, Framing::None);
        EXPECT_FALSE(d.value().chunked());
    }

    TEST(FramingTest, BufferedEntityUsesContentLength) {
        http::fields headers;
        auto d = decide_framing(HttpMethod::Post, headers, EntityKind::Buffered,
                                11);
        ASSERT_TRUE(d.has_value());
        EXPECT_EQ(d.value().framing, Framing::ContentLength);
        EXPECT_EQ(d.value().content_length, 11u);
    }

    TEST(FramingTest, OutputStreamDefaultsToChunked) {
        http::fields headers;
        auto d = decide_framing(HttpMethod::Put, headers,
                                EntityKind::OutputStream);
        ASSERT_TRUE(d.has_value());
        EXPECT_EQ(d.value().framing, Framing::Chunked);
        EXPECT_TRUE(d.value().chunked());
    }

    TEST(FramingTest, OutputStreamWithDeclaredLength) {
        http::fields headers;
        headers.set(http::field::content_length, " 42 ");
        auto d = decide_framing(HttpMethod::Put, headers,
                                EntityKind::OutputStream);
        ASSERT_TRUE(d.has_value());
        EXPECT_EQ(d.value().framing, Framing::ContentLength);
        EXPECT_EQ(d.value().content_length, 42u);
    }

    TEST(FramingTest, CallerForcesChunked) {
        http::fields headers;
        headers.set(http::field::transfer_encoding, "gzip, Chunked");
        auto d = decide_framing(HttpMethod::Post, headers, EntityKind::Buffered,
                                5);
        ASSERT_TRUE(d.has_value());
        EXPECT_EQ(d.value().framing, Framing::ForcedChunked);
    }

    TEST(FramingTest, HeadWithEntityRejected) {
        http::fields headers;
        auto d = decide_framing(HttpMethod::Head, headers, EntityKind::Buffered,
                                3);
        ASSERT_TRUE(d.has_error());
        EXPECT_EQ(d.error().code, Error::Code::InvalidArgument);
    }

    TEST(FramingTest, HeadWithOutputStreamRejected) {
        http::fields headers;
        auto d = decide_framing(HttpMethod::Head, headers,
                                EntityKind::OutputStream);
        ASSERT_TRUE(d.has_error());
        EXPECT_EQ(d.error().code, Error::Code::InvalidArgument);
    }

    TEST(FramingTest, HeadWithEmptyEntityHasNoFraming) {
        http::fields headers;
        auto d = decide_framing(HttpMethod::Head, headers, EntityKind::Buffered,
                                0);
        ASSERT_TRUE(d.has_value()) << d.error().message;
        EXPECT_EQ(d.value().framing, Framing::None);
    }

    TEST(FramingTest, InvalidContentLengthRejected) {
        http::fields headers;
        headers.set(http::field::content_length, "12abc");
        auto d = decide_framing(HttpMethod::Put, headers,
                                EntityKind::OutputStream);
        ASSERT_TRUE(d.has_error());
        EXPECT_EQ(d.error().code, Error::Code::InvalidArgument);
    }

    TEST(FramingTest, ContentLengthMismatchRejected) {
        http::fields headers;
        headers.set(http::field::content_length, "10");
        auto d = decide_framing(HttpMethod::Post, headers, EntityKind::Buffered,
                                4);
        ASSERT_TRUE(d.has_error());
        EXPECT_EQ(d.error().code, Error::Code::InvalidArgument);
    }

    TEST(FramingTest, ApplyFramingRewritesHeaders) {
        http::fields headers;
        headers.set(http::field::content_length, "3");

        FramingDecision chunked;
        chunked.framing = Framing::Chunked;
        apply_framing(chunked, headers);
        EXPECT_EQ(headers.find(http::field::content_length), headers.end());
        EXPECT_EQ(headers[http::field::transfer_encoding], "chunked");

        FramingDecision length;
        length.framing = Framing::ContentLength;
        length.content_length = 7;
        apply_framing(length, headers);
        EXPECT_EQ(headers.find(http::field::transfer_encoding), headers.end());
        EXPECT_EQ(headers[http::field::content_length], "7");
    }

    TEST(FramingTest, ForcedChunkedKeepsCallerCodings) {
        http::fields headers;
        headers.set(http::field::transfer_encoding, "gzip, chunked");
        auto d = decide_framing(HttpMethod::Post, headers,
                                EntityKind::OutputStream);
        ASSERT_TRUE(d.has_value());
        EXPECT_EQ(d.value().framing, Framing::ForcedChunked);

        apply_framing(d.value(), headers);
        EXPECT_EQ(headers[http::field::transfer_encoding], "gzip, chunked");
    }

    TEST(FramingTest, MisplacedChunkedIsReplaced) {
        http::fields headers;
        headers.set(http::field::transfer_encoding, "chunked, gzip");
        FramingDecision forced;
        forced.framing = Framing::ForcedChunked;
        apply_framing(forced, headers);
        EXPECT_EQ(headers[http::field::transfer_encoding], "chunked");
    }

    TEST(FramingTest, HasChunkedCoding) {
        EXPECT_TRUE(has_chunked_coding("chunked"));
        EXPECT_TRUE(has_chunked_coding("gzip , chunked"));
        EXPECT_FALSE(has_chunked_coding("gzip"));
        EXPECT_FALSE(has_chunked_coding(""));
    }

    TEST(FramingTest, EmptyChunkIsNeverEmitted) {
        EXPECT_TRUE(encode_chunk("").empty());
    }

    TEST(FramingTest, ChunksParseBack) {
        std::string wire =
            "POST /x HTTP/1.1\r\nHost: h\r\nTransfer-Encoding: chunked\r\n\r\n";
        wire += encode_chunk("Hello ");
        wire += encode_chunk("chunked ");
        wire += encode_chunk(std::string(300, 'x'));
        wire += encode_last_chunk();

        http::request_parser<http::string_body> parser;
        boost::beast::error_code ec;
        parser.eager(true);
        std::size_t offset = 0;
        while (!parser.is_done() && offset < wire.size()) {
            offset += parser.put(
                boost::asio::buffer(wire.data() + offset, wire.size() - offset),
                ec);
            ASSERT_FALSE(ec) << ec.message();
        }
        EXPECT_EQ(offset, wire.size());
        ASSERT_TRUE(parser.is_done());
        EXPECT_EQ(parser.get().body(),
                  "Hello chunked " + std::string(300, 'x'));
    }

}  // namespace
