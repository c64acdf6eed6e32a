#include "zstdsafe/stream-driver.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "zstdsafe/buffer-sizes.hpp"
#include "zstdsafe/buffer-view.hpp"
#include "zstdsafe/compression-context.hpp"
#include "zstdsafe/compression-test-helpers.hpp"
#include "zstdsafe/context-state.hpp"
#include "zstdsafe/decompression-context.hpp"
#include "zstdsafe/frame-info.hpp"
#include "zstdsafe/parameters.hpp"
#include "zstdsafe/zstd-error.hpp"

namespace zstdsafe {

namespace {

constexpr std::size_t kChunkSizes[] = {1, 7, 64, 4096};

std::vector<std::string> SamplePayloads() {
  std::vector<std::string> payloads;
  payloads.reserve(5);
  payloads.emplace_back("");
  payloads.emplace_back("Zstd keeps strings sharp.");
  payloads.emplace_back(4096, 'Z');
  payloads.emplace_back(test::MakePatternedPayload(64UL * 1024UL));
  payloads.emplace_back(test::MakeTextPayload(300UL * 1024UL));
  return payloads;
}

// Compresses 'payload' with a single finish call per output chunk of 'outChunkSize' bytes,
// checking that cursors only move forward and stay within their regions.
std::string FinishWithOutputChunk(std::string_view payload, std::size_t outChunkSize) {
  CompressionContext ctx;
  CompressionStream stream(ctx);
  std::string compressed;
  std::string chunk(outChunkSize, '\0');
  OutBuffer out{std::span<char>(chunk)};
  InBuffer in(payload);
  for (;;) {
    const auto inBefore = in.pos();
    auto res = stream.finish(in, out);
    EXPECT_TRUE(res);
    if (!res) {
      break;
    }
    EXPECT_GE(in.pos(), inBefore);
    EXPECT_LE(in.pos(), in.size());
    EXPECT_LE(out.pos(), out.capacity());
    compressed.append(out.writtenChars());
    out.rewind();
    if (res.value().frameComplete) {
      break;
    }
  }
  EXPECT_TRUE(in.exhausted());
  EXPECT_EQ(stream.totalIn(), payload.size());
  EXPECT_EQ(stream.totalOut(), compressed.size());
  return compressed;
}

}  // namespace

TEST(StreamDriverTest, RoundTripWithVariousChunkSizes) {
  for (const auto &payload : SamplePayloads()) {
    for (std::size_t inChunk : kChunkSizes) {
      for (std::size_t outChunk : kChunkSizes) {
        SCOPED_TRACE(testing::Message() << "payload=" << payload.size() << " in=" << inChunk << " out=" << outChunk);
        CompressionContext cctx;
        const auto compressed = test::CompressAll(cctx, payload, outChunk, inChunk);
        ASSERT_TRUE(test::HasZstdMagic(compressed));

        DecompressionContext dctx;
        EXPECT_EQ(test::DecompressAll(dctx, compressed, outChunk, inChunk), payload);
      }
    }
  }
}

TEST(StreamDriverTest, TinyOutputBufferProducesSameFrame) {
  const auto payload = test::MakeTextPayload(50000);
  const auto reference = FinishWithOutputChunk(payload, CompressBound(payload.size()));
  const auto tiny = FinishWithOutputChunk(payload, 1);
  EXPECT_GT(reference.size(), 1U);
  EXPECT_EQ(tiny.size(), reference.size());
  EXPECT_EQ(tiny, reference);

  DecompressionContext dctx;
  EXPECT_EQ(test::DecompressAll(dctx, tiny, 1), payload);
}

TEST(StreamDriverTest, CompressAllDrainsFinishOverSmallOutputChunks) {
  // Finishing needs many calls here, the last outcome alone tells that the frame is complete.
  const auto payload = test::MakeTextPayload(3000);
  CompressionContext cctx;
  const auto compressed = test::CompressAll(cctx, payload, 7);
  EXPECT_TRUE(test::HasZstdMagic(compressed));
  EXPECT_EQ(cctx.state(), ContextState::Configured);

  auto frameSize = FindFrameCompressedSize(test::AsBytes(compressed));
  ASSERT_TRUE(frameSize);
  EXPECT_EQ(frameSize.value(), compressed.size());

  DecompressionContext dctx;
  EXPECT_EQ(test::DecompressAll(dctx, compressed, 7), payload);
}

TEST(StreamDriverTest, EmptyInputFinishProducesMinimalFrame) {
  const auto frame = FinishWithOutputChunk("", 1);
  EXPECT_FALSE(frame.empty());
  EXPECT_TRUE(test::HasZstdMagic(frame));

  DecompressionContext dctx;
  DecompressionStream stream(dctx);
  std::string out(16, '\0');
  OutBuffer outBuf{std::span<char>(out)};
  InBuffer in(frame);
  auto res = stream.decompress(in, outBuf);
  ASSERT_TRUE(res);
  EXPECT_TRUE(res.value().frameComplete);
  EXPECT_TRUE(in.exhausted());
  EXPECT_EQ(outBuf.pos(), 0U);
}

TEST(StreamDriverTest, CompressWithEmptyInputDoesNotStartSession) {
  CompressionContext ctx;
  CompressionStream stream(ctx);
  std::string out(64, '\0');
  OutBuffer outBuf{std::span<char>(out)};
  InBuffer in;
  auto res = stream.compress(in, outBuf);
  ASSERT_TRUE(res);
  EXPECT_EQ(outBuf.pos(), 0U);
  EXPECT_EQ(ctx.state(), ContextState::Created);
  EXPECT_EQ(stream.totalIn(), 0U);
}

TEST(StreamDriverTest, FlushMakesBufferedDataDecodable) {
  const auto firstHalf = test::MakeTextPayload(20000, 3);
  const auto secondHalf = test::MakeTextPayload(20000, 4);

  CompressionContext cctx;
  CompressionStream cstream(cctx);
  std::string compressed(CompressBound(firstHalf.size() + secondHalf.size()) + 64, '\0');
  OutBuffer cout{std::span<char>(compressed)};

  InBuffer firstIn(firstHalf);
  ASSERT_TRUE(cstream.compress(firstIn, cout));
  auto flushed = cstream.flush(cout);
  ASSERT_TRUE(flushed);
  EXPECT_EQ(flushed.value().hint, 0U);
  EXPECT_FALSE(flushed.value().frameComplete);
  EXPECT_EQ(cctx.state(), ContextState::Streaming);
  const std::size_t flushedSize = cout.pos();

  // Everything given so far can be decoded from the flushed bytes alone.
  DecompressionContext dctx;
  DecompressionStream dstream(dctx);
  std::string decoded(firstHalf.size() + secondHalf.size(), '\0');
  OutBuffer dout{std::span<char>(decoded)};
  InBuffer partial(std::string_view(compressed.data(), flushedSize));
  auto partialRes = dstream.decompress(partial, dout);
  ASSERT_TRUE(partialRes);
  EXPECT_FALSE(partialRes.value().frameComplete);
  EXPECT_TRUE(partial.exhausted());
  EXPECT_EQ(dout.writtenChars(), firstHalf);

  InBuffer secondIn(secondHalf);
  auto finished = cstream.finish(secondIn, cout);
  ASSERT_TRUE(finished);
  EXPECT_TRUE(finished.value().frameComplete);
  EXPECT_EQ(cctx.state(), ContextState::Configured);

  InBuffer rest(std::string_view(compressed.data() + flushedSize, cout.pos() - flushedSize));
  auto restRes = dstream.decompress(rest, dout);
  ASSERT_TRUE(restRes);
  EXPECT_TRUE(restRes.value().frameComplete);
  EXPECT_EQ(dout.writtenChars(), firstHalf + secondHalf);
  EXPECT_EQ(dstream.totalIn(), cout.pos());
  EXPECT_EQ(dstream.totalOut(), firstHalf.size() + secondHalf.size());
}

TEST(StreamDriverTest, DecompressStopsAtFrameBoundary) {
  CompressionContext cctx;
  const auto first = test::CompressAll(cctx, "first frame");
  const auto second = test::CompressAll(cctx, "second frame");
  const auto both = first + second;

  DecompressionContext dctx;
  DecompressionStream stream(dctx);
  std::string out(64, '\0');
  OutBuffer outBuf{std::span<char>(out)};
  InBuffer in(both);

  auto res = stream.decompress(in, outBuf);
  ASSERT_TRUE(res);
  EXPECT_TRUE(res.value().frameComplete);
  EXPECT_EQ(in.pos(), first.size());
  EXPECT_EQ(outBuf.writtenChars(), "first frame");
  EXPECT_EQ(dctx.state(), ContextState::Configured);

  outBuf.rewind();
  res = stream.decompress(in, outBuf);
  ASSERT_TRUE(res);
  EXPECT_TRUE(res.value().frameComplete);
  EXPECT_TRUE(in.exhausted());
  EXPECT_EQ(outBuf.writtenChars(), "second frame");
}

TEST(StreamDriverTest, DecompressNeedsMoreInput) {
  const auto payload = test::MakeTextPayload(30000);
  CompressionContext cctx;
  const auto compressed = test::CompressAll(cctx, payload);

  DecompressionContext dctx;
  DecompressionStream stream(dctx);
  std::string out(payload.size(), '\0');
  OutBuffer outBuf{std::span<char>(out)};
  InBuffer head(std::string_view(compressed).substr(0, compressed.size() / 2));

  auto res = stream.decompress(head, outBuf);
  ASSERT_TRUE(res);
  EXPECT_FALSE(res.value().frameComplete);
  EXPECT_GT(res.value().hint, 0U);
  EXPECT_TRUE(head.exhausted());
  EXPECT_EQ(dctx.state(), ContextState::Streaming);

  InBuffer tail(std::string_view(compressed).substr(compressed.size() / 2));
  res = stream.decompress(tail, outBuf);
  ASSERT_TRUE(res);
  EXPECT_TRUE(res.value().frameComplete);
  EXPECT_EQ(outBuf.writtenChars(), payload);
}

TEST(StreamDriverTest, DecompressFullOutputIsNotAnError) {
  const auto payload = test::MakePatternedPayload(10000);
  CompressionContext cctx;
  const auto compressed = test::CompressAll(cctx, payload);

  DecompressionContext dctx;
  DecompressionStream stream(dctx);
  std::string out(100, '\0');
  OutBuffer outBuf{std::span<char>(out)};
  InBuffer in(compressed);
  std::string decoded;
  for (;;) {
    auto res = stream.decompress(in, outBuf);
    ASSERT_TRUE(res);
    decoded.append(outBuf.writtenChars());
    if (res.value().frameComplete) {
      break;
    }
    ASSERT_TRUE(outBuf.full());
    outBuf.rewind();
  }
  EXPECT_EQ(decoded, payload);
}

TEST(StreamDriverTest, StepIsASingleNativeCall) {
  CompressionContext cctx;
  CompressionStream stream(cctx);
  const auto payload = test::MakeTextPayload(1000);
  std::string out(CStreamOutSize(), '\0');
  OutBuffer outBuf{std::span<char>(out)};
  InBuffer in(payload);

  auto res = stream.step(in, outBuf, EndDirective::Continue);
  ASSERT_TRUE(res);
  EXPECT_FALSE(res.value().frameComplete);
  // Small inputs are entirely buffered by the encoder.
  EXPECT_TRUE(in.exhausted());
  EXPECT_EQ(stream.totalIn(), payload.size());
}

TEST(StreamDriverTest, ErrorsStopTheLoop) {
  DecompressionContext dctx;
  DecompressionStream stream(dctx);
  const std::string garbage(64, 'x');
  std::string out(64, '\0');
  OutBuffer outBuf{std::span<char>(out)};
  InBuffer in(garbage);

  auto res = stream.decompress(in, outBuf);
  ASSERT_TRUE(res.hasError());
  EXPECT_EQ(res.errorKind(), ErrorKind::CorruptedData);

  // The session must be abandoned before another attempt.
  auto again = stream.decompress(in, outBuf);
  ASSERT_TRUE(again.hasError());
  EXPECT_EQ(again.errorKind(), ErrorKind::WrongStage);
  ASSERT_TRUE(dctx.reset(ResetDirective::SessionOnly));
  EXPECT_EQ(dctx.state(), ContextState::Configured);
}

}  // namespace zstdsafe
