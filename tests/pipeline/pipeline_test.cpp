// =============================================================================
// mtc - Transcode Pipeline Tests
// =============================================================================
// End-to-end runs of TranscodePipeline over temporary files: ordering under
// parallelism, progress reporting, failure and cancellation handling, and
// buffer accounting.
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <mutex>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "mtc/codec/chunk_transformer.h"
#include "mtc/common/types.h"
#include "mtc/format/chunk_writer.h"
#include "mtc/io/chunk_reader.h"
#include "mtc/io/media_source.h"
#include "mtc/pipeline/pipeline.h"

namespace mtc::pipeline::test {

namespace {

// =============================================================================
// Test Doubles
// =============================================================================

/// @brief Identity copy with a random delay, tracking peak concurrency.
class DelayingTransformer final : public codec::ChunkTransformer {
public:
    explicit DelayingTransformer(int maxDelayMicros = 2000) : maxDelayMicros_(maxDelayMicros) {}

    Result<io::ManagedBuffer> transform(std::span<const std::uint8_t> input,
                                        const MediaDescriptor& source,
                                        const TranscodeOptions& target,
                                        io::BufferPool& pool) const override {
        const int now = active_.fetch_add(1) + 1;
        int peak = peak_.load();
        while (now > peak && !peak_.compare_exchange_weak(peak, now)) {
        }

        thread_local std::mt19937 rng{std::random_device{}()};
        std::uniform_int_distribution<int> delay(0, maxDelayMicros_);
        std::this_thread::sleep_for(std::chrono::microseconds(delay(rng)));

        auto output = codec::IdentityTransformer{}.transform(input, source, target, pool);
        active_.fetch_sub(1);
        return output;
    }

    std::string_view name() const noexcept override { return "delaying"; }

    [[nodiscard]] int peakConcurrency() const noexcept { return peak_.load(); }

private:
    int maxDelayMicros_;
    mutable std::atomic<int> active_{0};
    mutable std::atomic<int> peak_{0};
};

/// @brief Fails on the Nth call (1-based).
class FailingTransformer final : public codec::ChunkTransformer {
public:
    explicit FailingTransformer(int failOnCall) : failOnCall_(failOnCall) {}

    Result<io::ManagedBuffer> transform(std::span<const std::uint8_t> input,
                                        const MediaDescriptor& source,
                                        const TranscodeOptions& target,
                                        io::BufferPool& pool) const override {
        if (calls_.fetch_add(1) + 1 == failOnCall_) {
            return makeError<io::ManagedBuffer>(ErrorCode::kTransformFailure, "injected failure");
        }
        return codec::IdentityTransformer{}.transform(input, source, target, pool);
    }

    std::string_view name() const noexcept override { return "failing"; }

private:
    int failOnCall_;
    mutable std::atomic<int> calls_{0};
};

/// @brief Throws instead of returning an error.
class ThrowingTransformer final : public codec::ChunkTransformer {
public:
    Result<io::ManagedBuffer> transform(std::span<const std::uint8_t> /*input*/,
                                        const MediaDescriptor& /*source*/,
                                        const TranscodeOptions& /*target*/,
                                        io::BufferPool& /*pool*/) const override {
        throw std::runtime_error("decoder exploded");
    }

    std::string_view name() const noexcept override { return "throwing"; }
};

/// @brief Emits every chunk twice.
class DoublingTransformer final : public codec::ChunkTransformer {
public:
    Result<io::ManagedBuffer> transform(std::span<const std::uint8_t> input,
                                        const MediaDescriptor& /*source*/,
                                        const TranscodeOptions& /*target*/,
                                        io::BufferPool& pool) const override {
        io::ManagedBuffer output = pool.acquire(input.size() * 2);
        if (!input.empty()) {
            std::memcpy(output.data(), input.data(), input.size());
            std::memcpy(output.data() + input.size(), input.data(), input.size());
        }
        output.setSize(input.size() * 2);
        return output;
    }

    std::string_view name() const noexcept override { return "doubling"; }
};

/// @brief In-memory writer recording the call sequence.
struct WriterLog {
    std::mutex mutex;
    std::vector<std::uint8_t> bytes;
    std::vector<ChunkRange> ranges;
    std::vector<ChunkId> ids;
    int initializeCount = 0;
    int finalizeCount = 0;
    int abortCount = 0;
    bool sawOutOfOrder = false;
};

class MemoryChunkWriter final : public format::ChunkWriter {
public:
    /// @param failOnWrite 1-based writeChunk call that fails; 0 never fails.
    explicit MemoryChunkWriter(std::shared_ptr<WriterLog> log, int failOnWrite = 0)
        : log_(std::move(log)), failOnWrite_(failOnWrite) {}

    VoidResult initialize(const std::filesystem::path& /*outputPath*/,
                          const TranscodeOptions& /*target*/,
                          const MediaDescriptor& /*source*/) override {
        std::lock_guard lock(log_->mutex);
        ++log_->initializeCount;
        return makeVoidSuccess();
    }

    VoidResult writeChunk(const Chunk& chunk) override {
        std::lock_guard lock(log_->mutex);
        if (++writes_ == failOnWrite_) {
            return makeVoidError(ErrorCode::kWriteFailure, "disk full");
        }
        if (!log_->ids.empty() && chunk.id != log_->ids.back() + 1) {
            log_->sawOutOfOrder = true;
        }
        log_->ids.push_back(chunk.id);
        log_->ranges.push_back(chunk.range);
        log_->bytes.insert(log_->bytes.end(), chunk.bytes().begin(), chunk.bytes().end());
        return makeVoidSuccess();
    }

    VoidResult finalize() override {
        std::lock_guard lock(log_->mutex);
        ++log_->finalizeCount;
        return makeVoidSuccess();
    }

    void abort() noexcept override {
        std::lock_guard lock(log_->mutex);
        ++log_->abortCount;
    }

    std::uint64_t bytesWritten() const noexcept override {
        std::lock_guard lock(log_->mutex);
        return log_->bytes.size();
    }

    Checksum checksum() const noexcept override { return 0; }

private:
    std::shared_ptr<WriterLog> log_;
    int failOnWrite_;
    int writes_ = 0;
};

/// @brief File reads that fail on the Nth call (1-based).
class FailingChunkReader final : public io::ChunkReader {
public:
    explicit FailingChunkReader(int failOnCall) : failOnCall_(failOnCall) {}

    Result<Chunk> readRange(const io::MediaSource& source, ChunkId id, const ChunkRange& range,
                            io::BufferPool& pool) const override {
        if (calls_.fetch_add(1) + 1 == failOnCall_) {
            return makeError<Chunk>(ErrorCode::kReadFailure, "unreadable sector");
        }
        return io::FileChunkReader{}.readRange(source, id, range, pool);
    }

private:
    int failOnCall_;
    mutable std::atomic<int> calls_{0};
};

// =============================================================================
// Fixture
// =============================================================================

class PipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::string name = ::testing::UnitTest::GetInstance()->current_test_info()->name();
        std::replace(name.begin(), name.end(), '/', '_');
        dir_ = std::filesystem::temp_directory_path() / ("mtc_pipeline_" + name);
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::filesystem::path makeSource(std::size_t size, const std::string& name = "input.bin") {
        auto path = dir_ / name;
        source_ = patternBytes(size);
        std::ofstream out(path, std::ios::binary);
        out.write(reinterpret_cast<const char*>(source_.data()),
                  static_cast<std::streamsize>(source_.size()));
        return path;
    }

    static std::vector<std::uint8_t> patternBytes(std::size_t size) {
        std::vector<std::uint8_t> bytes(size);
        std::uint32_t state = 0x9E3779B9u;
        for (auto& b : bytes) {
            state = state * 1664525u + 1013904223u;
            b = static_cast<std::uint8_t>(state >> 24);
        }
        return bytes;
    }

    static std::vector<std::uint8_t> readFile(const std::filesystem::path& path) {
        std::ifstream in(path, std::ios::binary);
        return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    }

    static PipelineConfig makeConfig(std::size_t parallelism, std::uint64_t chunkBytes) {
        PipelineConfig config;
        config.maxParallelism = parallelism;
        config.fixedChunkBytes = chunkBytes;
        return config;
    }

    TranscodePipeline makePipeline(const PipelineConfig& config,
                                   std::unique_ptr<codec::ChunkTransformer> transformer,
                                   std::unique_ptr<format::ChunkWriter> writer = nullptr,
                                   std::unique_ptr<io::ChunkReader> reader = nullptr) {
        PipelineComponents components;
        components.analyzer = std::make_unique<io::ProbeAnalyzer>();
        components.reader = reader ? std::move(reader) : std::make_unique<io::FileChunkReader>();
        components.transformer = std::move(transformer);
        components.writer =
            writer ? std::move(writer) : std::make_unique<format::FileChunkWriter>();
        return TranscodePipeline(config, std::move(components));
    }

    static void expectPoolBalanced(const TranscodePipeline& pipeline) {
        const auto stats = pipeline.bufferPoolStats();
        EXPECT_EQ(stats.outstanding, 0u);
        EXPECT_EQ(stats.acquireCount, stats.releaseCount);
    }

    std::filesystem::path dir_;
    std::vector<std::uint8_t> source_;
};

}  // namespace

// =============================================================================
// Construction
// =============================================================================

TEST_F(PipelineTest, RejectsInvalidConfig) {
    PipelineConfig config;
    config.maxParallelism = 0;
    EXPECT_THROW(makePipeline(config, std::make_unique<codec::IdentityTransformer>()),
                 ConfigurationError);
}

TEST_F(PipelineTest, RejectsMissingComponent) {
    PipelineComponents components;
    components.analyzer = std::make_unique<io::ProbeAnalyzer>();
    EXPECT_THROW((void)TranscodePipeline(PipelineConfig{}, std::move(components)),
                 ConfigurationError);
}

TEST_F(PipelineTest, CreateDefaultRejectsUnknownEngine) {
    auto pipeline = TranscodePipeline::createDefault(PipelineConfig{}, "mpeg2-hw");
    ASSERT_FALSE(pipeline.has_value());
    EXPECT_EQ(pipeline.error().code(), ErrorCode::kUnsupportedCodec);
}

// =============================================================================
// Ordering
// =============================================================================

class PipelineOrderingTest : public PipelineTest,
                             public ::testing::WithParamInterface<std::size_t> {};

TEST_P(PipelineOrderingTest, IdentityOutputMatchesInput) {
    const std::size_t parallelism = GetParam();
    const auto input = makeSource(200 * 1024 + 123);
    const auto output = dir_ / "output.bin";

    auto transformer = std::make_unique<DelayingTransformer>();
    const DelayingTransformer* delaying = transformer.get();
    auto pipeline = makePipeline(makeConfig(parallelism, 4096), std::move(transformer));

    io::MediaSource source(input);
    auto result = pipeline.run(source, output, TranscodeOptions{});
    ASSERT_TRUE(result.has_value()) << result.error().message();

    EXPECT_EQ(readFile(output), source_);
    EXPECT_EQ(result->chunksProcessed, (source_.size() + 4095) / 4096);
    EXPECT_EQ(result->inputSizeBytes, source_.size());
    EXPECT_EQ(result->outputSizeBytes, source_.size());
    EXPECT_EQ(result->chunkSizeBytes, 4096u);
    EXPECT_LE(delaying->peakConcurrency(), static_cast<int>(parallelism));
    EXPECT_FALSE(std::filesystem::exists(dir_ / "output.bin.part"));
    expectPoolBalanced(pipeline);
}

INSTANTIATE_TEST_SUITE_P(Parallelism, PipelineOrderingTest, ::testing::Values(1u, 2u, 8u));

RC_GTEST_PROP(PipelineProperty, WriterSeesAscendingChunks, ()) {
    const auto size = *rc::gen::inRange<std::size_t>(0, 64 * 1024);
    const auto chunk = *rc::gen::inRange<std::uint64_t>(256, 8192);
    const auto parallelism = *rc::gen::inRange<std::size_t>(1, 9);

    const auto dir = std::filesystem::temp_directory_path() / "mtc_pipeline_property";
    std::filesystem::create_directories(dir);
    const auto input = dir / "input.bin";
    std::vector<std::uint8_t> bytes(size);
    for (std::size_t i = 0; i < size; ++i) {
        bytes[i] = static_cast<std::uint8_t>(i * 7 + i / 256);
    }
    {
        std::ofstream out(input, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char*>(bytes.data()),
                  static_cast<std::streamsize>(bytes.size()));
    }

    auto log = std::make_shared<WriterLog>();
    PipelineComponents components;
    components.analyzer = std::make_unique<io::ProbeAnalyzer>();
    components.reader = std::make_unique<io::FileChunkReader>();
    components.transformer = std::make_unique<DelayingTransformer>(200);
    components.writer = std::make_unique<MemoryChunkWriter>(log);

    PipelineConfig config;
    config.maxParallelism = parallelism;
    config.fixedChunkBytes = chunk;
    TranscodePipeline pipeline(config, std::move(components));

    io::MediaSource source(input);
    auto result = pipeline.run(source, dir / "unused.out", TranscodeOptions{});
    RC_ASSERT(result.has_value());
    RC_ASSERT(!log->sawOutOfOrder);
    RC_ASSERT(log->bytes == bytes);
    RC_ASSERT(log->finalizeCount == 1);
    RC_ASSERT(log->abortCount == 0);
    RC_ASSERT(pipeline.bufferPoolStats().outstanding == 0u);

    std::filesystem::remove_all(dir);
}

// =============================================================================
// Edge cases
// =============================================================================

TEST_F(PipelineTest, EmptyFileFinalizesImmediately) {
    const auto input = makeSource(0);
    const auto output = dir_ / "empty.out";
    auto pipeline = makePipeline(makeConfig(4, 0), std::make_unique<codec::IdentityTransformer>());

    std::vector<ProgressSnapshot> snapshots;
    io::MediaSource source(input);
    auto result = pipeline.run(source, output, TranscodeOptions{},
                               [&](const ProgressSnapshot& s) { snapshots.push_back(s); });
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->chunksProcessed, 0u);
    EXPECT_EQ(result->outputSizeBytes, 0u);
    ASSERT_TRUE(std::filesystem::exists(output));
    EXPECT_EQ(std::filesystem::file_size(output), 0u);
    ASSERT_EQ(snapshots.size(), 1u);
    EXPECT_DOUBLE_EQ(snapshots.back().fractionComplete, 1.0);
}

TEST_F(PipelineTest, TenMiBInFiveFixedChunks) {
    const auto input = makeSource(10 * kMiB);
    auto log = std::make_shared<WriterLog>();
    auto pipeline = makePipeline(makeConfig(4, 2 * kMiB),
                                 std::make_unique<codec::IdentityTransformer>(),
                                 std::make_unique<MemoryChunkWriter>(log));

    io::MediaSource source(input);
    auto result = pipeline.run(source, dir_ / "out.bin", TranscodeOptions{});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->chunksProcessed, 5u);

    ASSERT_EQ(log->ranges.size(), 5u);
    for (std::size_t i = 0; i < 5; ++i) {
        EXPECT_EQ(log->ranges[i].offset, i * 2 * kMiB);
        EXPECT_EQ(log->ranges[i].length, 2 * kMiB);
        EXPECT_EQ(log->ranges[i].isLast, i == 4);
    }
    EXPECT_EQ(log->bytes, source_);
}

TEST_F(PipelineTest, LargerOutputIsWrittenInFull) {
    const auto input = makeSource(50000);
    const auto output = dir_ / "doubled.bin";
    auto pipeline =
        makePipeline(makeConfig(3, 8192), std::make_unique<DoublingTransformer>());

    io::MediaSource source(input);
    auto result = pipeline.run(source, output, TranscodeOptions{});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->outputSizeBytes, 100000u);

    std::vector<std::uint8_t> expected;
    for (std::size_t offset = 0; offset < source_.size(); offset += 8192) {
        const auto end = std::min<std::size_t>(offset + 8192, source_.size());
        expected.insert(expected.end(), source_.begin() + offset, source_.begin() + end);
        expected.insert(expected.end(), source_.begin() + offset, source_.begin() + end);
    }
    EXPECT_EQ(readFile(output), expected);
    EXPECT_LT(result->compressionRatio(), 1.0);
}

TEST_F(PipelineTest, OutputMustDifferFromSource) {
    const auto input = makeSource(1000);
    auto pipeline = makePipeline(makeConfig(2, 0), std::make_unique<codec::IdentityTransformer>());
    io::MediaSource source(input);
    auto result = pipeline.run(source, input, TranscodeOptions{});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kInvalidConfiguration);
    EXPECT_EQ(readFile(input), source_);
}

TEST_F(PipelineTest, InvalidOptionsFailBeforeWork) {
    const auto input = makeSource(1000);
    auto log = std::make_shared<WriterLog>();
    auto pipeline = makePipeline(makeConfig(2, 0), std::make_unique<codec::IdentityTransformer>(),
                                 std::make_unique<MemoryChunkWriter>(log));
    TranscodeOptions options;
    options.width = 641;

    io::MediaSource source(input);
    auto result = pipeline.run(source, dir_ / "out.bin", options);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kInvalidConfiguration);
    EXPECT_EQ(log->initializeCount, 0);
}

TEST_F(PipelineTest, PipelineCanRunRepeatedly) {
    const auto input = makeSource(30000);
    auto pipeline =
        makePipeline(makeConfig(4, 4096), std::make_unique<codec::InvertTransformer>());
    io::MediaSource source(input);

    auto first = pipeline.run(source, dir_ / "a.bin", TranscodeOptions{});
    ASSERT_TRUE(first.has_value());
    io::MediaSource inverted(dir_ / "a.bin");
    auto second = pipeline.run(inverted, dir_ / "b.bin", TranscodeOptions{});
    ASSERT_TRUE(second.has_value());

    EXPECT_EQ(readFile(dir_ / "b.bin"), source_);
    EXPECT_FALSE(pipeline.isRunning());
}

// =============================================================================
// Progress
// =============================================================================

TEST_F(PipelineTest, ProgressIsMonotonicAndEndsAtTotal) {
    const auto input = makeSource(100000);
    auto pipeline = makePipeline(makeConfig(8, 4096), std::make_unique<DelayingTransformer>(500));

    std::vector<ProgressSnapshot> snapshots;
    io::MediaSource source(input);
    auto result = pipeline.run(source, dir_ / "out.bin", TranscodeOptions{},
                               [&](const ProgressSnapshot& s) { snapshots.push_back(s); });
    ASSERT_TRUE(result.has_value());

    ASSERT_EQ(snapshots.size(), result->chunksProcessed);
    for (std::size_t i = 1; i < snapshots.size(); ++i) {
        EXPECT_GT(snapshots[i].chunksCompleted, snapshots[i - 1].chunksCompleted);
        EXPECT_GE(snapshots[i].fractionComplete, snapshots[i - 1].fractionComplete);
        EXPECT_GE(snapshots[i].bytesCompleted, snapshots[i - 1].bytesCompleted);
    }
    const auto& last = snapshots.back();
    EXPECT_EQ(last.chunksCompleted, last.totalChunks);
    EXPECT_DOUBLE_EQ(last.fractionComplete, 1.0);
    EXPECT_EQ(last.bytesCompleted, source_.size());
    EXPECT_EQ(last.estimatedRemainingMs(), 0u);
}

// =============================================================================
// Failures
// =============================================================================

TEST_F(PipelineTest, TransformFailureAbortsRun) {
    const auto input = makeSource(64 * 1024);
    const auto output = dir_ / "out.bin";
    auto log = std::make_shared<WriterLog>();
    auto pipeline = makePipeline(makeConfig(4, 4096), std::make_unique<FailingTransformer>(5),
                                 std::make_unique<MemoryChunkWriter>(log));

    io::MediaSource source(input);
    auto result = pipeline.run(source, output, TranscodeOptions{});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kTransformFailure);
    EXPECT_NE(result.error().message().find("injected failure"), std::string::npos);
    EXPECT_EQ(log->finalizeCount, 0);
    EXPECT_EQ(log->abortCount, 1);
    EXPECT_LT(log->ids.size(), 16u);
    EXPECT_FALSE(log->sawOutOfOrder);
    expectPoolBalanced(pipeline);
}

TEST_F(PipelineTest, TransformFailureLeavesNoOutputFile) {
    const auto input = makeSource(64 * 1024);
    const auto output = dir_ / "out.bin";
    auto pipeline = makePipeline(makeConfig(2, 4096), std::make_unique<FailingTransformer>(3));

    io::MediaSource source(input);
    auto result = pipeline.run(source, output, TranscodeOptions{});
    ASSERT_FALSE(result.has_value());
    EXPECT_FALSE(std::filesystem::exists(output));
    EXPECT_FALSE(std::filesystem::exists(dir_ / "out.bin.part"));
}

TEST_F(PipelineTest, ThrowingTransformerIsReported) {
    const auto input = makeSource(20000);
    auto pipeline = makePipeline(makeConfig(4, 4096), std::make_unique<ThrowingTransformer>());

    io::MediaSource source(input);
    auto result = pipeline.run(source, dir_ / "out.bin", TranscodeOptions{});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kTransformFailure);
    EXPECT_NE(result.error().message().find("decoder exploded"), std::string::npos);
    expectPoolBalanced(pipeline);
}

TEST_F(PipelineTest, ReadFailureAbortsRun) {
    const auto input = makeSource(64 * 1024);
    auto log = std::make_shared<WriterLog>();
    auto pipeline = makePipeline(makeConfig(4, 4096), std::make_unique<DelayingTransformer>(300),
                                 std::make_unique<MemoryChunkWriter>(log),
                                 std::make_unique<FailingChunkReader>(6));

    io::MediaSource source(input);
    auto result = pipeline.run(source, dir_ / "out.bin", TranscodeOptions{});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kReadFailure);
    EXPECT_NE(result.error().message().find("unreadable sector"), std::string::npos);
    EXPECT_EQ(log->finalizeCount, 0);
    EXPECT_EQ(log->abortCount, 1);
    EXPECT_LT(log->ids.size(), 16u);
    EXPECT_FALSE(log->sawOutOfOrder);
    expectPoolBalanced(pipeline);
}

TEST_F(PipelineTest, WriteChunkFailureAbortsRun) {
    const auto input = makeSource(64 * 1024);
    auto log = std::make_shared<WriterLog>();
    auto pipeline = makePipeline(makeConfig(4, 4096), std::make_unique<DelayingTransformer>(300),
                                 std::make_unique<MemoryChunkWriter>(log, 4));

    io::MediaSource source(input);
    auto result = pipeline.run(source, dir_ / "out.bin", TranscodeOptions{});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kWriteFailure);
    EXPECT_NE(result.error().message().find("disk full"), std::string::npos);
    EXPECT_EQ(log->initializeCount, 1);
    EXPECT_EQ(log->finalizeCount, 0);
    EXPECT_EQ(log->abortCount, 1);
    // The failing write stops the commit stage; nothing after it is written.
    EXPECT_EQ(log->ids.size(), 3u);
    expectPoolBalanced(pipeline);
}

TEST_F(PipelineTest, ThrowingProgressSinkDoesNotBreakRun) {
    const auto input = makeSource(40000);
    const auto output = dir_ / "out.bin";
    auto pipeline = makePipeline(makeConfig(2, 4096), std::make_unique<codec::IdentityTransformer>());

    int calls = 0;
    io::MediaSource source(input);
    auto result = pipeline.run(source, output, TranscodeOptions{},
                               [&](const ProgressSnapshot& /*s*/) {
                                   ++calls;
                                   throw std::runtime_error("display went away");
                               });
    ASSERT_TRUE(result.has_value()) << result.error().message();
    EXPECT_EQ(calls, static_cast<int>(result->chunksProcessed));
    EXPECT_EQ(readFile(output), source_);
    EXPECT_FALSE(std::filesystem::exists(dir_ / "out.bin.part"));
    EXPECT_FALSE(pipeline.isRunning());

    auto again = pipeline.run(source, dir_ / "again.bin", TranscodeOptions{});
    ASSERT_TRUE(again.has_value()) << again.error().message();
    EXPECT_EQ(readFile(dir_ / "again.bin"), source_);
    expectPoolBalanced(pipeline);
}

TEST_F(PipelineTest, WriterInitializeFailureSurfaces) {
    const auto input = makeSource(20000);
    auto pipeline =
        makePipeline(makeConfig(2, 4096), std::make_unique<codec::IdentityTransformer>());

    io::MediaSource source(input);
    auto result = pipeline.run(source, dir_ / "missing" / "out.bin", TranscodeOptions{});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kWriteFailure);
}

// =============================================================================
// Cancellation
// =============================================================================

TEST_F(PipelineTest, CancellationFromProgressStopsRun) {
    const auto input = makeSource(256 * 1024);
    const auto output = dir_ / "out.bin";
    auto pipeline = makePipeline(makeConfig(2, 4096), std::make_unique<DelayingTransformer>(300));

    CancellationToken token;
    io::MediaSource source(input);
    auto result = pipeline.run(
        source, output, TranscodeOptions{},
        [&](const ProgressSnapshot& s) {
            if (s.chunksCompleted == 3) {
                token.cancel();
            }
        },
        token);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kCancelled);
    EXPECT_FALSE(std::filesystem::exists(output));
    EXPECT_FALSE(std::filesystem::exists(dir_ / "out.bin.part"));
    expectPoolBalanced(pipeline);
}

TEST_F(PipelineTest, CancelFromAnotherThread) {
    const auto input = makeSource(512 * 1024);
    const auto output = dir_ / "out.bin";
    auto log = std::make_shared<WriterLog>();
    auto pipeline = makePipeline(makeConfig(2, 4096), std::make_unique<DelayingTransformer>(5000),
                                 std::make_unique<MemoryChunkWriter>(log));

    // Cancel as soon as the run is visible; the request must not be lost.
    std::thread canceller([&] {
        while (!pipeline.isRunning()) {
            std::this_thread::yield();
        }
        pipeline.cancel();
    });

    io::MediaSource source(input);
    auto result = pipeline.run(source, output, TranscodeOptions{});
    canceller.join();

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kCancelled);
    EXPECT_EQ(log->finalizeCount, 0);
    EXPECT_EQ(log->abortCount, 1);
    expectPoolBalanced(pipeline);
}

TEST_F(PipelineTest, IdleCancelAppliesToNextRunOnly) {
    const auto input = makeSource(20000);
    auto log = std::make_shared<WriterLog>();
    auto pipeline = makePipeline(makeConfig(2, 4096), std::make_unique<codec::IdentityTransformer>(),
                                 std::make_unique<MemoryChunkWriter>(log));

    pipeline.cancel();
    io::MediaSource source(input);
    auto first = pipeline.run(source, dir_ / "first.bin", TranscodeOptions{});
    ASSERT_FALSE(first.has_value());
    EXPECT_EQ(first.error().code(), ErrorCode::kCancelled);
    EXPECT_TRUE(log->ids.empty());

    auto second = pipeline.run(source, dir_ / "second.bin", TranscodeOptions{});
    ASSERT_TRUE(second.has_value()) << second.error().message();
    EXPECT_EQ(log->bytes, source_);
}

TEST_F(PipelineTest, PreCancelledTokenDoesNoWork) {
    const auto input = makeSource(20000);
    auto log = std::make_shared<WriterLog>();
    auto pipeline = makePipeline(makeConfig(2, 4096), std::make_unique<codec::IdentityTransformer>(),
                                 std::make_unique<MemoryChunkWriter>(log));

    CancellationToken token;
    token.cancel();
    io::MediaSource source(input);
    auto result = pipeline.run(source, dir_ / "out.bin", TranscodeOptions{}, {}, token);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kCancelled);
    EXPECT_TRUE(log->ids.empty());
    EXPECT_EQ(pipeline.bufferPoolStats().acquireCount, 0u);
}

// =============================================================================
// Default engines
// =============================================================================

TEST_F(PipelineTest, DefaultPipelineWithInvertEngine) {
    const auto input = makeSource(3 * kMiB + 17, "clip.mov");
    const auto output = dir_ / "clip.out";
    auto pipeline = TranscodePipeline::createDefault(makeConfig(4, 0), "invert");
    ASSERT_TRUE(pipeline.has_value());

    io::MediaSource source(input);
    auto result = pipeline->run(source, output, TranscodeOptions::webPreset());
    ASSERT_TRUE(result.has_value()) << result.error().message();

    // 3 MiB + 17 bytes on 4 workers uses the 1 MiB floor.
    EXPECT_EQ(result->chunkSizeBytes, kMinChunkBytes);
    EXPECT_EQ(result->chunksProcessed, 4u);
    ASSERT_TRUE(source.descriptor().has_value());
    EXPECT_EQ(source.descriptor()->container, "QuickTime");

    const auto written = readFile(output);
    ASSERT_EQ(written.size(), source_.size());
    for (std::size_t i = 0; i < written.size(); i += 4093) {
        EXPECT_EQ(written[i], static_cast<std::uint8_t>(255 - source_[i]));
    }
}

}  // namespace mtc::pipeline::test
