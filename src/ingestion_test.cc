#include "ingestion.hh"
#include "manual_executor.hh"

#include <gtest/gtest.h>

using namespace chunkview;

namespace {
Lines numbered(uint64_t first, uint64_t count) {
  Lines ret;
  ret.reserve(count);
  for (auto i = first; i < first + count; i++) {
    ret.push_back(fmt::format("line {}", i));
  }
  return ret;
}

// Counts decompressions, so tests can tell a resident read from a store read.
class CountingCodec final : public Codec {
public:
  explicit CountingCodec(CodecPtr inner) : inner_(std::move(inner)) {}

  std::string_view name() const final {
    return inner_->name();
  }
  Result<std::string> compress(const Lines& lines) const final {
    return inner_->compress(lines);
  }
  Result<Lines> decompress(std::string_view data) const final {
    decompressed_++;
    return inner_->decompress(data);
  }

  int decompressed() const {
    return decompressed_;
  }

private:
  CodecPtr inner_;
  mutable int decompressed_ = 0;
};
}  // namespace

class IngestionTest : public ::testing::Test {
protected:
  void SetUp() override {
    make_pipeline(10);
  }

  void make_pipeline(uint32_t chunk_size) {
    auto codec = Codec::gzip(1);
    ASSERT_TRUE(codec);
    codec_ = std::make_shared<CountingCodec>(std::move(codec).value());
    store_ = std::make_shared<ChunkStore>(codec_, chunk_size);
    window_ = std::make_shared<WindowManager>(store_, executor_, "...");
    pipeline_ = std::make_unique<IngestionPipeline>(store_, window_);
  }

  void append_numbered(uint64_t count) {
    ASSERT_TRUE(pipeline_->append(numbered(appended_, count)));
    appended_ += count;
  }

  Lines chunk(ChunkID id) {
    auto ret = store_->read_chunk(id);
    EXPECT_TRUE(ret);
    return std::move(ret).value();
  }

  void expect_chunks_consistent() {
    auto chunk_size = store_->chunk_size();
    auto total = store_->total_lines();
    EXPECT_EQ(store_->chunk_count(), (total + chunk_size - 1) / chunk_size);
    for (ChunkID id = 0; id < store_->chunk_count(); id++) {
      SCOPED_TRACE(id);
      auto first = static_cast<uint64_t>(id) * chunk_size;
      auto n = std::min<uint64_t>(chunk_size, total - first);
      EXPECT_EQ(chunk(id), numbered(first, n));
    }
  }

  ManualExecutor executor_;
  std::shared_ptr<CountingCodec> codec_;
  std::shared_ptr<ChunkStore> store_;
  std::shared_ptr<WindowManager> window_;
  std::unique_ptr<IngestionPipeline> pipeline_;
  uint64_t appended_ = 0;
};

TEST_F(IngestionTest, fills_open_chunk) {
  append_numbered(3);
  append_numbered(4);
  EXPECT_EQ(store_->total_lines(), 7u);
  EXPECT_EQ(store_->chunk_count(), 1u);
  EXPECT_EQ(chunk(0), numbered(0, 7));
}

TEST_F(IngestionTest, splits_at_chunk_boundaries) {
  append_numbered(25);
  EXPECT_EQ(store_->chunk_count(), 3u);
  EXPECT_EQ(chunk(2).size(), 5u);

  append_numbered(7);
  EXPECT_EQ(store_->total_lines(), 32u);
  EXPECT_EQ(store_->chunk_count(), 4u);
  expect_chunks_consistent();
}

TEST_F(IngestionTest, exact_chunk_multiples) {
  append_numbered(10);
  EXPECT_EQ(store_->chunk_count(), 1u);
  append_numbered(20);
  EXPECT_EQ(store_->chunk_count(), 3u);
  append_numbered(1);
  EXPECT_EQ(store_->chunk_count(), 4u);
  expect_chunks_consistent();
}

TEST_F(IngestionTest, total_is_sum_of_appends) {
  uint64_t sum = 0;
  for (uint64_t n : {1, 9, 10, 11, 0, 23, 2, 48}) {
    SCOPED_TRACE(n);
    append_numbered(n);
    sum += n;
    EXPECT_EQ(store_->total_lines(), sum);
  }
  expect_chunks_consistent();
}

TEST_F(IngestionTest, one_past_chunk_size_makes_two_chunks) {
  make_pipeline(50'000);
  append_numbered(50'001);
  EXPECT_EQ(store_->total_lines(), 50'001u);
  EXPECT_EQ(store_->chunk_count(), 2u);
  EXPECT_EQ(chunk(1), Lines{"line 50000"});
}

TEST_F(IngestionTest, empty_append_is_noop) {
  ASSERT_TRUE(pipeline_->append({}));
  EXPECT_EQ(store_->total_lines(), 0u);
  EXPECT_EQ(store_->chunk_count(), 0u);
}

TEST_F(IngestionTest, failed_append_changes_nothing) {
  append_numbered(5);
  auto size = store_->compressed_size();
  auto tail = store_->snapshot(0);

  // the bad line lands in the second chunk, after the first was staged
  auto lines = numbered(5, 12);
  lines[8] = "broken\nline";
  auto ret = pipeline_->append(lines);
  ASSERT_FALSE(ret);
  EXPECT_TRUE(is_error(ret.error(), Errc::invalid_line));

  EXPECT_EQ(store_->total_lines(), 5u);
  EXPECT_EQ(store_->chunk_count(), 1u);
  EXPECT_EQ(store_->compressed_size(), size);
  EXPECT_EQ(store_->snapshot(0), tail);

  append_numbered(12);
  expect_chunks_consistent();
}

TEST_F(IngestionTest, appends_show_up_in_resident_window) {
  append_numbered(14);
  window_->resolve(0, 8);
  executor_.run_all();

  // chunk 1 is the window's next buffer and gets refreshed in place
  append_numbered(4);
  EXPECT_EQ(window_->resolve(6, 8), numbered(6, 8));
  auto resident = window_->resident_lines(1);
  ASSERT_TRUE(resident);
  EXPECT_EQ(*resident, numbered(10, 8));

  // chunk 2 is outside the window
  append_numbered(5);
  EXPECT_FALSE(window_->resident_lines(2));
  EXPECT_EQ(executor_.pending(), 0u);
  expect_chunks_consistent();
}

TEST_F(IngestionTest, streaming_into_current_chunk) {
  append_numbered(2);
  window_->resolve(0, 8);
  executor_.run_all();
  auto decompressed = codec_->decompressed();

  // the tail stays within the window (chunk 0 or its next neighbor), so the
  // open chunk never has to be decompressed again
  for (int i = 0; i < 6; i++) {
    append_numbered(3);
    auto tail = chunk_of(appended_ - 1, 10);
    auto resident = window_->resident_lines(tail);
    ASSERT_TRUE(resident);
    EXPECT_EQ(resident->size(), appended_ - tail * 10);
  }
  EXPECT_EQ(codec_->decompressed(), decompressed);
  EXPECT_EQ(window_->resolve(0, 8), numbered(0, 8));

  // chunk 2 is outside the window, its tail is read back from the store
  append_numbered(3);
  EXPECT_EQ(codec_->decompressed(), decompressed);
  append_numbered(2);
  EXPECT_EQ(codec_->decompressed(), decompressed + 1);
  expect_chunks_consistent();
}

TEST_F(IngestionTest, rejects_lines_beyond_chunk_ids) {
  append_numbered(4);
  ASSERT_TRUE(store_->commit(4, {}, std::numeric_limits<LineNo>::max() - 10));

  auto ret = pipeline_->append(Lines(20, "x"));
  ASSERT_FALSE(ret);
  EXPECT_TRUE(is_error(ret.error(), Errc::chunk_out_of_range));
  EXPECT_EQ(store_->total_lines(), std::numeric_limits<LineNo>::max() - 6);
}
