#include "zstdsafe/compression-context.hpp"

#include <gtest/gtest.h>
#include <zstd.h>
#include <zstd_errors.h>

#include <cstddef>
#include <new>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "zstdsafe/buffer-sizes.hpp"
#include "zstdsafe/buffer-view.hpp"
#include "zstdsafe/compression-config.hpp"
#include "zstdsafe/compression-test-helpers.hpp"
#include "zstdsafe/context-state.hpp"
#include "zstdsafe/decompression-context.hpp"
#include "zstdsafe/parameters.hpp"
#include "zstdsafe/sys-test-support.hpp"
#include "zstdsafe/zstd-error.hpp"

namespace zstdsafe {

namespace {

std::string OneShotCompress(CompressionContext &ctx, std::string_view payload) {
  std::string out(CompressBound(payload.size()), '\0');
  OutBuffer dst{std::span<char>(out)};
  InBuffer src(payload);
  auto res = ctx.compress(dst, src);
  if (res.hasError()) {
    throw std::runtime_error(std::string(res.error().message()));
  }
  out.resize(dst.pos());
  return out;
}

std::string OneShotDecompress(std::string_view frame, std::size_t decompressedSize) {
  DecompressionContext dctx;
  std::string out(decompressedSize, '\0');
  OutBuffer dst{std::span<char>(out)};
  InBuffer src(frame);
  auto res = dctx.decompress(dst, src);
  if (res.hasError()) {
    throw std::runtime_error(std::string(res.error().message()));
  }
  out.resize(dst.pos());
  return out;
}

}  // namespace

TEST(CompressionContextTest, CreateAndRelease) {
  CompressionContext ctx;
  EXPECT_EQ(ctx.state(), ContextState::Created);
  EXPECT_FALSE(ctx.released());
  EXPECT_GT(ctx.sizeOf(), 0U);
  EXPECT_NE(ctx.native(), nullptr);

  ctx.release();
  EXPECT_TRUE(ctx.released());
  EXPECT_EQ(ctx.state(), ContextState::Released);
}

TEST(CompressionContextTest, DoubleReleaseThrows) {
  CompressionContext ctx;
  ctx.release();
  EXPECT_THROW(ctx.release(), std::logic_error);
}

TEST(CompressionContextTest, OperationsOnReleasedContextThrow) {
  CompressionContext ctx;
  ctx.release();

  std::string out(64, '\0');
  OutBuffer dst{std::span<char>(out)};
  InBuffer src(std::string_view("data"));

  EXPECT_THROW((void)ctx.setParameter(CParameter::CompressionLevel, 3), std::logic_error);
  EXPECT_THROW((void)ctx.getParameter(CParameter::CompressionLevel), std::logic_error);
  EXPECT_THROW((void)ctx.parameters(), std::logic_error);
  EXPECT_THROW((void)ctx.reset(ResetDirective::SessionOnly), std::logic_error);
  EXPECT_THROW((void)ctx.loadDictionary({}), std::logic_error);
  EXPECT_THROW((void)ctx.compress(dst, src), std::logic_error);
  EXPECT_THROW((void)ctx.compressStream2(dst, src, EndDirective::End), std::logic_error);
  EXPECT_THROW((void)ctx.sizeOf(), std::logic_error);
  EXPECT_THROW((void)ctx.native(), std::logic_error);
  // Nothing was consumed nor produced.
  EXPECT_EQ(dst.pos(), 0U);
  EXPECT_EQ(src.pos(), 0U);
}

TEST(CompressionContextTest, MoveLeavesSourceReleased) {
  CompressionContext ctx;
  ASSERT_TRUE(ctx.setParameter(CParameter::CompressionLevel, 4));

  CompressionContext moved(std::move(ctx));
  EXPECT_TRUE(ctx.released());  // NOLINT(bugprone-use-after-move)
  EXPECT_THROW(ctx.release(), std::logic_error);
  EXPECT_EQ(moved.getParameter(CParameter::CompressionLevel), 4);

  CompressionContext other;
  other = std::move(moved);
  EXPECT_TRUE(moved.released());  // NOLINT(bugprone-use-after-move)
  EXPECT_EQ(other.getParameter(CParameter::CompressionLevel), 4);
  EXPECT_EQ(other.state(), ContextState::Configured);
}

TEST(CompressionContextTest, TryCreate) {
  auto res = CompressionContext::TryCreate();
  ASSERT_TRUE(res);
  EXPECT_EQ(res.value().state(), ContextState::Created);
}

#if ZSTDSAFE_WANT_MALLOC_OVERRIDES
TEST(CompressionContextTest, TryCreateReportsAllocationFailure) {
  test::FailNextMalloc();
  auto res = CompressionContext::TryCreate();
  EXPECT_EQ(test::PendingMallocFailures(), 0);
  ASSERT_TRUE(res.hasError());
  EXPECT_EQ(res.errorKind(), ErrorKind::MemoryAllocation);
}

TEST(CompressionContextTest, ConstructorThrowsOnAllocationFailure) {
  test::FailNextMalloc();
  EXPECT_THROW(CompressionContext ctx, std::bad_alloc);
  EXPECT_EQ(test::PendingMallocFailures(), 0);
}
#endif

TEST(CompressionContextTest, ParameterRoundTrip) {
  CompressionContext ctx;
  for (CParameter param : kAllCParameters) {
    if (RequiresMultithread(param)) {
      continue;
    }
    SCOPED_TRACE(ParameterName(param));
    const auto bounds = Bounds(param).value();
    for (int value : {bounds.lower, bounds.upper}) {
      ASSERT_TRUE(ctx.setParameter(param, value));
      EXPECT_EQ(ctx.getParameter(param), value);
    }
  }
  EXPECT_EQ(ctx.state(), ContextState::Configured);
}

TEST(CompressionContextTest, OutOfBoundValueLeavesParametersUnchanged) {
  CompressionContext ctx;
  ASSERT_TRUE(ctx.setParameter(CParameter::CompressionLevel, 9));
  ASSERT_TRUE(ctx.setParameter(CParameter::WindowLog, 20));
  const CParameterTable before = ctx.parameters();

  auto status = ctx.setParameter(CParameter::WindowLog, 1000);
  ASSERT_TRUE(status.hasError());
  EXPECT_EQ(status.errorKind(), ErrorKind::InvalidParameter);

  status = ctx.setParameter(CParameter::CompressionLevel, ZSTD_maxCLevel() + 1);
  ASSERT_TRUE(status.hasError());
  EXPECT_EQ(status.errorKind(), ErrorKind::InvalidParameter);

  EXPECT_EQ(ctx.parameters(), before);
  EXPECT_EQ(ctx.getParameter(CParameter::WindowLog), 20);
}

TEST(CompressionContextTest, StrategyOverload) {
  CompressionContext ctx;
  ASSERT_TRUE(ctx.setParameter(Strategy::Lazy2));
  EXPECT_EQ(ctx.getParameter(CParameter::Strategy), static_cast<int>(Strategy::Lazy2));
}

TEST(CompressionContextTest, ResetParametersIsIdempotent) {
  CompressionContext ctx;
  ASSERT_TRUE(ctx.setParameter(CParameter::CompressionLevel, 12));
  ASSERT_TRUE(ctx.setParameter(CParameter::ChecksumFlag, 1));

  ASSERT_TRUE(ctx.reset(ResetDirective::Parameters));
  const auto stateOnce = ctx.state();
  const CParameterTable paramsOnce = ctx.parameters();

  ASSERT_TRUE(ctx.reset(ResetDirective::Parameters));
  EXPECT_EQ(ctx.state(), stateOnce);
  EXPECT_EQ(ctx.state(), ContextState::Configured);
  EXPECT_EQ(ctx.parameters(), paramsOnce);
  EXPECT_TRUE(ctx.parameters().empty());
}

TEST(CompressionContextTest, SessionResetKeepsParameters) {
  CompressionContext ctx;
  ASSERT_TRUE(ctx.setParameter(CParameter::ChecksumFlag, 1));
  ASSERT_TRUE(ctx.reset(ResetDirective::SessionOnly));
  ASSERT_TRUE(ctx.reset(ResetDirective::SessionOnly));
  EXPECT_EQ(ctx.getParameter(CParameter::ChecksumFlag), 1);
}

TEST(CompressionContextTest, OneShotRoundTrip) {
  CompressionContext ctx;
  ASSERT_TRUE(ctx.setParameter(CParameter::CompressionLevel, 5));
  ASSERT_TRUE(ctx.setParameter(CParameter::ChecksumFlag, 1));

  for (const std::string &payload :
       {std::string(), std::string("Zstd keeps strings sharp."), std::string(4096, 'Z'),
        test::MakeTextPayload(100000), test::MakeRandomPayload(10000)}) {
    SCOPED_TRACE(payload.size());
    const auto compressed = OneShotCompress(ctx, payload);
    EXPECT_TRUE(test::HasZstdMagic(compressed));
    EXPECT_EQ(OneShotDecompress(compressed, payload.size()), payload);
  }
}

TEST(CompressionContextTest, OneShotConsumesAllInput) {
  CompressionContext ctx;
  const auto payload = test::MakePatternedPayload(5000);
  std::string out(CompressBound(payload.size()), '\0');
  OutBuffer dst{std::span<char>(out), 3};
  InBuffer src(payload);

  auto res = ctx.compress(dst, src);
  ASSERT_TRUE(res);
  EXPECT_TRUE(src.exhausted());
  EXPECT_EQ(dst.pos(), 3U + res.value());
  EXPECT_TRUE(test::HasZstdMagic(std::string_view(out).substr(3)));
}

TEST(CompressionContextTest, OneShotDestinationTooSmall) {
  CompressionContext ctx;
  const auto payload = test::MakeRandomPayload(4096);
  std::string out(16, '\0');
  OutBuffer dst{std::span<char>(out)};
  InBuffer src(payload);

  auto res = ctx.compress(dst, src);
  ASSERT_TRUE(res.hasError());
  EXPECT_EQ(res.errorKind(), ErrorKind::DestinationTooSmall);
  EXPECT_EQ(src.pos(), 0U);
  EXPECT_EQ(dst.pos(), 0U);
  EXPECT_EQ(ctx.state(), ContextState::Failed);

  // Abandon the failed frame, then the context is usable again.
  ASSERT_TRUE(ctx.reset(ResetDirective::SessionOnly));
  const auto compressed = OneShotCompress(ctx, payload);
  EXPECT_EQ(OneShotDecompress(compressed, payload.size()), payload);
}

TEST(CompressionContextTest, ContinueWithEmptyInputIsNoop) {
  CompressionContext ctx;
  std::string out(64, '\0');
  OutBuffer dst{std::span<char>(out)};
  InBuffer src;

  auto res = ctx.compressStream2(dst, src, EndDirective::Continue);
  ASSERT_TRUE(res);
  EXPECT_EQ(res.value(), StepOutcome{});
  EXPECT_EQ(dst.pos(), 0U);
  EXPECT_EQ(ctx.state(), ContextState::Created);

  // Parameters can still be changed.
  EXPECT_TRUE(ctx.setParameter(CParameter::CompressionLevel, 1));
}

TEST(CompressionContextTest, EmptyInputWithEndProducesMinimalFrame) {
  CompressionContext ctx;
  std::string out(CStreamOutSize(), '\0');
  OutBuffer dst{std::span<char>(out)};
  InBuffer src;

  auto res = ctx.compressStream2(dst, src, EndDirective::End);
  ASSERT_TRUE(res);
  EXPECT_TRUE(res.value().frameComplete);
  EXPECT_EQ(res.value().hint, 0U);
  EXPECT_EQ(ctx.state(), ContextState::Configured);
  ASSERT_GT(dst.pos(), 0U);

  const std::string frame(dst.writtenChars());
  EXPECT_TRUE(test::HasZstdMagic(frame));
  EXPECT_EQ(OneShotDecompress(frame, 0), "");
  DecompressionContext dctx;
  EXPECT_EQ(test::DecompressAll(dctx, frame), "");
}

TEST(CompressionContextTest, MidSessionChangesAreRejected) {
  CompressionContext ctx;
  const auto payload = test::MakeTextPayload(10000);
  std::string out(CStreamOutSize(), '\0');
  OutBuffer dst{std::span<char>(out)};
  InBuffer src(payload);

  ASSERT_TRUE(ctx.compressStream2(dst, src, EndDirective::Continue));
  EXPECT_EQ(ctx.state(), ContextState::Streaming);

  auto status = ctx.setParameter(CParameter::CompressionLevel, 3);
  ASSERT_TRUE(status.hasError());
  EXPECT_EQ(status.errorKind(), ErrorKind::WrongStage);
  EXPECT_EQ(ctx.getParameter(CParameter::CompressionLevel), std::nullopt);

  const auto dict = test::MakeTextPayload(1000, 7);
  status = ctx.loadDictionary(test::AsBytes(dict));
  ASSERT_TRUE(status.hasError());
  EXPECT_EQ(status.errorKind(), ErrorKind::WrongStage);
  EXPECT_EQ(ctx.setPledgedSrcSize(10).errorKind(), ErrorKind::WrongStage);

  // Finishing the frame closes the session.
  InBuffer noInput;
  for (;;) {
    auto res = ctx.compressStream2(dst, noInput, EndDirective::End);
    ASSERT_TRUE(res);
    if (res.value().frameComplete) {
      break;
    }
  }
  EXPECT_EQ(ctx.state(), ContextState::Configured);
  EXPECT_TRUE(ctx.setParameter(CParameter::CompressionLevel, 3));

  DecompressionContext dctx;
  EXPECT_EQ(test::DecompressAll(dctx, dst.writtenChars()), payload);
}

TEST(CompressionContextTest, FailedStepRequiresReset) {
  CompressionContext ctx;
  ASSERT_TRUE(ctx.setPledgedSrcSize(100));
  const auto payload = test::MakeTextPayload(50);
  std::string out(CStreamOutSize(), '\0');
  OutBuffer dst{std::span<char>(out)};
  InBuffer src(payload);

  // Ending the frame in the same call as the first input would let the encoder deduce the size from that input.
  ASSERT_TRUE(ctx.compressStream2(dst, src, EndDirective::Continue));
  InBuffer noInput;
  auto res = ctx.compressStream2(dst, noInput, EndDirective::End);
  ASSERT_TRUE(res.hasError());
  EXPECT_EQ(res.errorKind(), ErrorKind::CorruptedData);
  EXPECT_EQ(res.error().code(), ZSTD_error_srcSize_wrong);
  EXPECT_EQ(ctx.state(), ContextState::Failed);

  // Positions advanced before the failure are kept.
  EXPECT_TRUE(src.exhausted());
  const auto produced = dst.pos();

  InBuffer more(std::string_view("more"));
  auto again = ctx.compressStream2(dst, more, EndDirective::Continue);
  ASSERT_TRUE(again.hasError());
  EXPECT_EQ(again.errorKind(), ErrorKind::WrongStage);
  EXPECT_EQ(more.pos(), 0U);
  EXPECT_EQ(dst.pos(), produced);

  EXPECT_EQ(ctx.setParameter(CParameter::CompressionLevel, 2).errorKind(), ErrorKind::WrongStage);

  ASSERT_TRUE(ctx.reset(ResetDirective::SessionOnly));
  const auto compressed = test::CompressAll(ctx, payload);
  DecompressionContext dctx;
  EXPECT_EQ(test::DecompressAll(dctx, compressed), payload);
}

TEST(CompressionContextTest, PledgedSourceSizeIsWrittenInFrame) {
  CompressionContext ctx;
  const auto payload = test::MakeTextPayload(3000);
  ASSERT_TRUE(ctx.setPledgedSrcSize(payload.size()));
  // Feed the input in small pieces so that the size is not deduced from a single End call.
  const auto compressed = test::CompressAll(ctx, payload, 0, 100);
  EXPECT_EQ(ZSTD_getFrameContentSize(compressed.data(), compressed.size()), payload.size());

  const auto unknown = test::CompressAll(ctx, payload, 0, 100);
  EXPECT_EQ(ZSTD_getFrameContentSize(unknown.data(), unknown.size()), ZSTD_CONTENTSIZE_UNKNOWN);
}

TEST(CompressionContextTest, ConfigConstructor) {
  CompressionConfig config;
  config.compressionLevel = 7;
  config.checksum = true;
  config.strategy = Strategy::Greedy;
  CompressionContext ctx(config);
  EXPECT_EQ(ctx.getParameter(CParameter::CompressionLevel), 7);
  EXPECT_EQ(ctx.getParameter(CParameter::ChecksumFlag), 1);
  EXPECT_EQ(ctx.getParameter(CParameter::Strategy), static_cast<int>(Strategy::Greedy));
  EXPECT_EQ(ctx.getParameter(CParameter::WindowLog), std::nullopt);

  config.compressionLevel = ZSTD_maxCLevel() + 10;
  EXPECT_THROW(CompressionContext invalid(config), std::invalid_argument);
}

}  // namespace zstdsafe
