#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>
#include "chunk/chunk.hpp"
#include "pipeline/transform_pipeline.hpp"
#include "test_utils.hpp"

using namespace streamcorpus;
using namespace streamcorpus::chunk;
using streamcorpus::codec::StreamItem;
using streamcorpus::codec::message_as;

namespace {

const std::string EMPTY_MD5 = "d41d8cd98f00b204e9800998ecf8427e";

// Stands in for xz: reverses the buffer, which is its own inverse
class ReversingStage : public pipeline::TransformStage {
public:
  pipeline::StageResult run(const Bytes& input) override {
    pipeline::StageResult result;
    result.output.assign(input.rbegin(), input.rend());
    return result;
  }
  std::string name() const override { return "reverse"; }
};

class ReversingStageFactory : public pipeline::StageFactory {
public:
  std::unique_ptr<pipeline::TransformStage> compressor() override { return std::make_unique<ReversingStage>(); }
  std::unique_ptr<pipeline::TransformStage> decompressor() override { return std::make_unique<ReversingStage>(); }
  std::unique_ptr<pipeline::TransformStage> key_importer(const std::filesystem::path&,
                                                         const std::filesystem::path&) override {
    return std::make_unique<ReversingStage>();
  }
  std::unique_ptr<pipeline::TransformStage> encryptor(const std::filesystem::path&, const std::string&) override {
    return std::make_unique<ReversingStage>();
  }
  std::unique_ptr<pipeline::TransformStage> decryptor(const std::filesystem::path&) override {
    return std::make_unique<ReversingStage>();
  }
};

} // namespace

class ChunkTest : public ::testing::Test {
protected:
  void SetUp() override {
    init_logging();
    test_dir_ = make_test_dir("chunk_test");
  }

  void TearDown() override {
    std::filesystem::remove_all(test_dir_);
  }

  static Bytes write_items(int count) {
    auto chunk = Chunk::create();
    for (int i = 0; i < count; ++i) {
      chunk.add(make_item(i));
    }
    chunk.close();
    return chunk.data();
  }

  static std::vector<std::string> read_doc_ids(Chunk& chunk) {
    std::vector<std::string> ids;
    for (const auto& message : chunk) {
      ids.push_back(message_as<StreamItem>(*message).doc_id);
    }
    return ids;
  }

  static Bytes read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    return Bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  }

  std::filesystem::path test_dir_;
};

//==============================================
// WRITING AND READING
//==============================================

TEST_F(ChunkTest, RoundTripPreservesOrder) {
  Bytes data = write_items(5);

  auto reader = Chunk::from_buffer(data);
  std::vector<StreamItem> items;
  for (const auto& message : reader) {
    items.push_back(message_as<StreamItem>(*message));
  }

  ASSERT_EQ(items.size(), 5u);
  for (int i = 0; i < 5; ++i) {
    EXPECT_EQ(items[i], make_item(i)) << "Record " << i;
  }
  EXPECT_EQ(reader.length(), 5u);
}

TEST_F(ChunkTest, LengthCountsWrittenRecords) {
  auto chunk = Chunk::create();
  EXPECT_EQ(chunk.length(), 0u);
  chunk.add(make_item(0));
  chunk.add(make_item(1));
  EXPECT_EQ(chunk.length(), 2u);
  chunk.close();
  EXPECT_EQ(chunk.length(), 2u);
}

TEST_F(ChunkTest, LengthGrowsWithIteration) {
  auto reader = Chunk::from_buffer(write_items(3));
  EXPECT_EQ(reader.length(), 0u) << "Read mode never pre-scans";

  auto it = reader.begin();
  EXPECT_EQ(reader.length(), 1u);
  ++it;
  EXPECT_EQ(reader.length(), 2u);
  ++it;
  ++it;
  EXPECT_TRUE(it == reader.end());
  EXPECT_EQ(reader.length(), 3u);
}

TEST_F(ChunkTest, EmptyChunk) {
  auto chunk = Chunk::create();
  chunk.close();

  EXPECT_EQ(chunk.length(), 0u);
  EXPECT_EQ(chunk.digest(), EMPTY_MD5);
  EXPECT_TRUE(chunk.data().empty());

  auto reader = Chunk::from_buffer(chunk.data());
  EXPECT_TRUE(reader.begin() == reader.end());
  EXPECT_EQ(reader.length(), 0u);
}

TEST_F(ChunkTest, IterationRestartsOnSeekableSource) {
  auto reader = Chunk::from_buffer(write_items(3));

  std::vector<std::string> first = read_doc_ids(reader);
  std::vector<std::string> second = read_doc_ids(reader);

  EXPECT_EQ(first, (std::vector<std::string>{"doc-0", "doc-1", "doc-2"}));
  EXPECT_EQ(second, first);
  EXPECT_EQ(reader.length(), 6u) << "Record counter keeps growing across passes";
}

TEST_F(ChunkTest, MovedReaderIteratesFromFreshBegin) {
  auto reader = Chunk::from_buffer(write_items(3));
  auto it = reader.begin();
  ASSERT_TRUE(it != reader.end());
  EXPECT_EQ(message_as<StreamItem>(**it).doc_id, "doc-0");

  // Iterators of the moved-from chunk are not used past this point
  Chunk moved = std::move(reader);
  EXPECT_EQ(read_doc_ids(moved), (std::vector<std::string>{"doc-0", "doc-1", "doc-2"}));
}

TEST_F(ChunkTest, PipeCanOnlyBeReadOnce) {
  Bytes data = write_items(2);
  auto reader = Chunk::from_input_handle(std::make_shared<PipeStream>(to_string(data)));

  EXPECT_EQ(read_doc_ids(reader).size(), 2u);
  EXPECT_THROW(reader.begin(), ResourceStateError);
}

TEST_F(ChunkTest, TruncatedTrailingRecordIsMalformed) {
  Bytes data = write_items(2);
  data.resize(data.size() - 3);

  auto reader = Chunk::from_buffer(data);
  auto it = reader.begin();
  EXPECT_EQ(message_as<StreamItem>(**it).doc_id, "doc-0");
  EXPECT_THROW(++it, MalformedRecordError);
}

TEST_F(ChunkTest, GarbageIsMalformed) {
  Bytes garbage{0x42, 0x42, 0x42, 0x42};
  auto reader = Chunk::from_buffer(garbage);
  EXPECT_THROW(reader.begin(), MalformedRecordError);
}

TEST_F(ChunkTest, OutputHandleReceivesRecords) {
  auto sink = std::make_shared<std::stringstream>();
  auto writer = Chunk::from_output_handle(sink);
  writer.add(make_item(0));
  writer.close();

  Bytes written = to_bytes(sink->str());
  EXPECT_EQ(writer.digest(), stream::Md5Digest::of(written));
  EXPECT_THROW(writer.data(), ResourceStateError) << "Handle-backed chunks do not expose their bytes";

  auto reader = Chunk::from_input_handle(std::make_shared<std::stringstream>(sink->str()));
  EXPECT_EQ(read_doc_ids(reader), std::vector<std::string>{"doc-0"});
}

TEST_F(ChunkTest, LegacyCodecReadsLegacyRecords) {
  codec::StreamItemV0_1_0 legacy;
  legacy.doc_id = "old";
  auto writer = Chunk::create(codec::legacy_codec());
  writer.add(legacy);
  writer.close();

  auto reader = Chunk::from_buffer(writer.data(), Mode::Read, codec::legacy_codec());
  auto it = reader.begin();
  ASSERT_TRUE(it != reader.end());
  EXPECT_EQ(message_as<codec::StreamItemV0_1_0>(**it).doc_id, "old");
}

//==============================================
// DIGEST
//==============================================

TEST_F(ChunkTest, WriteDigestMatchesBytes) {
  auto chunk = Chunk::create();
  chunk.add(make_item(0));
  chunk.add(make_item(1));
  std::string live = chunk.digest();
  chunk.close();

  EXPECT_EQ(chunk.digest(), live);
  EXPECT_EQ(chunk.digest(), stream::Md5Digest::of(chunk.data()));
  EXPECT_NE(chunk.digest(), EMPTY_MD5);
}

TEST_F(ChunkTest, ReadDigestMatchesAfterFullPass) {
  Bytes data = write_items(4);
  auto reader = Chunk::from_buffer(data);
  read_doc_ids(reader);
  reader.close();
  EXPECT_EQ(reader.digest(), stream::Md5Digest::of(data));
}

TEST_F(ChunkTest, FileDigestMatchesFileContents) {
  auto path = test_dir_ / "nested" / "items.sc";
  {
    auto writer = Chunk::from_path(path, Mode::Write);
    writer.add(make_item(0));
    writer.add(make_item(1));
    writer.close();
    EXPECT_EQ(writer.digest(), stream::Md5Digest::of(read_file(path)));
  }

  auto reader = Chunk::from_path(path);
  EXPECT_EQ(read_doc_ids(reader).size(), 2u);
  reader.close();
  EXPECT_EQ(reader.digest(), stream::Md5Digest::of(read_file(path)));
}

TEST_F(ChunkTest, MovedFromChunkHasNoDigest) {
  auto chunk = Chunk::create();
  chunk.add(make_item(0));
  Chunk moved = std::move(chunk);

  EXPECT_THROW(chunk.digest(), ResourceStateError);
  EXPECT_EQ(moved.length(), 1u);
  EXPECT_NO_THROW(moved.digest());
}

//==============================================
// MODES AND PRECONDITIONS
//==============================================

TEST_F(ChunkTest, ModeRestrictions) {
  auto writer = Chunk::create();
  EXPECT_THROW(writer.begin(), InvalidModeError);

  auto reader = Chunk::from_buffer(write_items(1));
  EXPECT_THROW(reader.add(make_item(0)), InvalidModeError);

  reader.close();
  EXPECT_THROW(reader.begin(), InvalidModeError);
}

TEST_F(ChunkTest, CloseIsIdempotent) {
  auto chunk = Chunk::create();
  chunk.add(make_item(0));
  chunk.close();
  std::string digest = chunk.digest();

  EXPECT_NO_THROW(chunk.close());
  EXPECT_TRUE(chunk.is_closed());
  EXPECT_EQ(chunk.digest(), digest);
  EXPECT_THROW(chunk.add(make_item(1)), InvalidModeError);
}

TEST_F(ChunkTest, PathPreconditions) {
  auto existing = test_dir_ / "existing.sc";
  std::ofstream(existing) << "";
  auto missing = test_dir_ / "missing.sc";

  EXPECT_THROW(Chunk::from_path(existing, Mode::Write), PreconditionError);
  EXPECT_THROW(Chunk::from_path(missing, Mode::Read), PreconditionError);
  EXPECT_THROW(Chunk::from_path(test_dir_ / "new.sc.xz", Mode::Write), PreconditionError);
  EXPECT_THROW(Chunk::from_buffer(Bytes(), Mode::Write), PreconditionError);
  EXPECT_THROW(Chunk::from_input_handle(nullptr), PreconditionError);
  EXPECT_THROW(Chunk::from_output_handle(std::make_shared<std::stringstream>(), Mode::Read), PreconditionError);
  EXPECT_FALSE(std::filesystem::exists(missing));
}

TEST_F(ChunkTest, CompressedFileIsReadOnly) {
  auto path = test_dir_ / "existing.sc.xz";
  std::ofstream(path) << "x";
  EXPECT_THROW(Chunk::from_path(path, Mode::Append), PreconditionError);
}

//==============================================
// APPEND
//==============================================

TEST_F(ChunkTest, AppendToFileKeepsExistingRecords) {
  auto path = test_dir_ / "append.sc";
  {
    auto writer = Chunk::from_path(path, Mode::Write);
    writer.add(make_item(0));
  }
  Bytes before = read_file(path);
  {
    auto appender = Chunk::from_path(path, Mode::Append);
    appender.add(make_item(1));
    appender.close();

    Bytes after = read_file(path);
    Bytes appended(after.begin() + static_cast<std::ptrdiff_t>(before.size()), after.end());
    EXPECT_EQ(appender.digest(), stream::Md5Digest::of(appended)) << "Digest covers appended bytes only";
    EXPECT_EQ(appender.length(), 1u);
  }

  auto reader = Chunk::from_path(path);
  EXPECT_EQ(read_doc_ids(reader), (std::vector<std::string>{"doc-0", "doc-1"}));
}

TEST_F(ChunkTest, AppendToBuffer) {
  auto appender = Chunk::from_buffer(write_items(2), Mode::Append);
  appender.add(make_item(2));
  appender.close();

  auto reader = Chunk::from_buffer(appender.data());
  EXPECT_EQ(read_doc_ids(reader), (std::vector<std::string>{"doc-0", "doc-1", "doc-2"}));
}

TEST_F(ChunkTest, AppendCreatesMissingFile) {
  auto path = test_dir_ / "fresh" / "append.sc";
  {
    auto appender = Chunk::from_path(path, Mode::Append);
    appender.add(make_item(0));
  }
  EXPECT_TRUE(std::filesystem::exists(path));
}

//==============================================
// COMPRESSED FILES
//==============================================

TEST_F(ChunkTest, CompressedFileDecodedThroughPipeline) {
  auto stages = std::make_shared<ReversingStageFactory>();
  auto scratch = std::make_shared<pipeline::UuidScratchDirectoryFactory>(test_dir_ / "scratch");
  pipeline::TransformPipeline transforms(stages, scratch);

  Bytes plain = write_items(3);
  Bytes compressed = transforms.compress_and_encrypt(plain).data;
  auto path = test_dir_ / "items.sc.xz";
  {
    std::ofstream file(path, std::ios::binary);
    file.write(reinterpret_cast<const char*>(compressed.data()), static_cast<std::streamsize>(compressed.size()));
  }

  auto reader = Chunk::from_path(path, Mode::Read, codec::default_codec(), transforms);
  EXPECT_EQ(read_doc_ids(reader), (std::vector<std::string>{"doc-0", "doc-1", "doc-2"}));
  reader.close();
  EXPECT_EQ(reader.digest(), stream::Md5Digest::of(plain));
}

TEST_F(ChunkTest, CompressedPathDetection) {
  EXPECT_TRUE(Chunk::is_compressed_path("a/b/items.sc.xz"));
  EXPECT_FALSE(Chunk::is_compressed_path("a/b/items.sc"));
  EXPECT_FALSE(Chunk::is_compressed_path("items.xz.sc"));
}

//==============================================
// SINGLE MESSAGE HELPERS
//==============================================

TEST_F(ChunkTest, SerializeDeserialize) {
  StreamItem item = make_item(9);
  Bytes blob = serialize(item);

  auto message = deserialize(blob);
  EXPECT_EQ(message_as<StreamItem>(*message), item);
}

TEST_F(ChunkTest, DeserializeRequiresExactlyOneRecord) {
  EXPECT_THROW(deserialize(Bytes()), MalformedRecordError);
  EXPECT_THROW(deserialize(write_items(2)), MalformedRecordError);
}

TEST_F(ChunkTest, StreamsLength) {
  auto chunk = Chunk::create();
  chunk.add(make_item(0));
  std::ostringstream out;
  out << chunk;
  EXPECT_EQ(out.str(), "Chunk(len=1)");
}
