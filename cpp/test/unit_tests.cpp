#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"

#include <algorithm>
#include <array>
#include <iterator>
#include <new>
#include <numeric>

using replay::ReadResult;
using replay::RecordWriter;
using replay::StatusCode;

static replay::ByteArray ChunkStream(const replay::ByteArray& records,
                                     const std::string& compression, uint32_t crc = 0,
                                     std::optional<uint64_t> uncompressedSize = std::nullopt) {
  replay::BufferWriter out;
  RecordWriter::writeMagic(out);
  RecordWriter::write(out, replay::Header{"test", ""});
  replay::Chunk chunk;
  chunk.uncompressedSize = uncompressedSize.value_or(records.size());
  chunk.uncompressedCrc = crc;
  chunk.compression = compression;
  chunk.compressedSize = records.size();
  chunk.records = records.data();
  RecordWriter::write(out, chunk);
  RecordWriter::write(out, replay::Footer{});
  RecordWriter::writeMagic(out);
  return out.release();
}

static replay::ByteArray ChannelAndMessageRecords() {
  replay::BufferWriter records;
  replay::Channel channel("/a", "text", 0);
  channel.id = 3;
  RecordWriter::write(records, channel);
  const auto payload = Bytes("hello");
  replay::Message message;
  message.channelId = 3;
  message.logTime = 42;
  message.data = payload.data();
  message.dataSize = payload.size();
  RecordWriter::write(records, message);
  return records.release();
}

template <typename T>
static std::vector<T> RecordsOfType(const std::vector<replay::TypedRecord>& records) {
  std::vector<T> output;
  for (const auto& record : records) {
    if (const auto* typed = std::get_if<T>(&record)) {
      output.push_back(*typed);
    }
  }
  return output;
}

TEST_CASE("internal::crc32", "[decoder]") {
  std::array<uint8_t, 32> data;
  std::iota(data.begin(), data.end(), uint8_t(1));
  const auto* bytes = reinterpret_cast<const std::byte*>(data.data());

  REQUIRE(replay::internal::crc32(bytes, 0) == 0);
  REQUIRE(replay::internal::crc32(bytes, 1) == 2768625435);

  for (size_t split = 0; split <= data.size(); split++) {
    CAPTURE(split);
    uint32_t crc = replay::internal::CRC32_INIT;
    crc = replay::internal::crc32Update(crc, bytes, split);
    crc = replay::internal::crc32Update(crc, bytes + split, data.size() - split);
    REQUIRE(replay::internal::crc32Final(crc) == 2280057893);
  }
}

TEST_CASE("Time arithmetic", "[time]") {
  SECTION("fromNanos normalizes negative values") {
    const auto time = replay::fromNanos(-1);
    REQUIRE(time.sec == -1);
    REQUIRE(time.nsec == 999'999'999);
    REQUIRE(replay::toNanos(time) == -1);
  }

  SECTION("add and subtract carry across seconds") {
    const replay::Time a{1, 900'000'000};
    const replay::Time b{0, 200'000'000};
    REQUIRE(replay::add(a, b) == replay::Time{2, 100'000'000});
    REQUIRE(replay::subtract(b, a) == replay::fromNanos(-1'700'000'000));
    REQUIRE(replay::subtract(replay::add(a, b), b) == a);
  }

  SECTION("compare and clampTime") {
    const replay::Time start{10, 0};
    const replay::Time end{20, 0};
    REQUIRE(replay::compare(start, end) < 0);
    REQUIRE(replay::compare(end, start) > 0);
    REQUIRE(replay::compare(start, start) == 0);
    REQUIRE(replay::clampTime({5, 0}, start, end) == start);
    REQUIRE(replay::clampTime({25, 0}, start, end) == end);
    REQUIRE(replay::clampTime({15, 5}, start, end) == replay::Time{15, 5});
  }

  SECTION("percentOf") {
    REQUIRE(replay::percentOf({0, 0}, {10, 0}, {2, 500'000'000}) == Approx(0.25));
    REQUIRE(replay::percentOf({3, 0}, {3, 0}, {3, 0}) == 0.0);
  }

  SECTION("fromMillis and toString") {
    REQUIRE(replay::fromMillis(1500) == replay::Time{1, 500'000'000});
    REQUIRE(replay::fromMillis(0.5) == replay::Time{0, 500'000});
    REQUIRE(replay::toString(replay::Time{12, 5}) == "12.000000005");
    REQUIRE(replay::isZero(replay::Time{}));
  }
}

TEST_CASE("ByteCursor", "[decoder]") {
  replay::ByteCursor cursor;
  const auto first = Bytes("abcdef");
  cursor.append(first.data(), first.size());
  REQUIRE(cursor.remaining() == 6);
  REQUIRE(cursor.hasBytes(6));
  REQUIRE_FALSE(cursor.hasBytes(7));

  cursor.consume(4);
  REQUIRE(cursor.remaining() == 2);
  REQUIRE(char(cursor.data()[0]) == 'e');

  const auto second = Bytes("gh");
  cursor.append(second.data(), second.size());
  REQUIRE(cursor.remaining() == 4);
  REQUIRE(std::string(reinterpret_cast<const char*>(cursor.data()), 4) == "efgh");

  cursor.consume(100);
  REQUIRE(cursor.remaining() == 0);
}

TEST_CASE("ProblemStore", "[player]") {
  replay::ProblemStore store;
  store.addProblem("a", replay::PlayerProblem{"", replay::ProblemSeverity::Warn, "first"});
  store.addProblem("b", replay::PlayerProblem{"", replay::ProblemSeverity::Error, "second"});
  store.addProblem("a", replay::PlayerProblem{"", replay::ProblemSeverity::Error, "replaced"});

  REQUIRE(store.problems().size() == 2);
  REQUIRE(store.problems()[0].id == "a");
  REQUIRE(store.problems()[0].message == "replaced");
  REQUIRE(store.hasProblem("b"));

  REQUIRE(store.removeProblem("b"));
  REQUIRE_FALSE(store.removeProblem("b"));

  store.addProblem("requestTopics:error", replay::PlayerProblem{});
  store.addProblem("requestTopics:system-state", replay::PlayerProblem{});
  REQUIRE(store.removeProblems([](const std::string& id) {
    return id.rfind("requestTopics:", 0) == 0;
  }) == 2);
  REQUIRE(store.problems().size() == 1);
  store.clear();
  REQUIRE(store.empty());
}

TEST_CASE("Options", "[options]") {
  SECTION("GetSeekTimeFromSpec") {
    const replay::Time start{10, 0};
    const replay::Time end{20, 0};
    REQUIRE(replay::GetSeekTimeFromSpec(replay::SeekToTimeSpec{}, start, end) ==
            replay::Time{10, 99'000'000});
    REQUIRE(replay::GetSeekTimeFromSpec(replay::SeekToTimeSpec::Absolute({30, 0}), start, end) ==
            end);
    REQUIRE(replay::GetSeekTimeFromSpec(replay::SeekToTimeSpec::Fraction(0.5), start, end) ==
            replay::Time{15, 0});
    REQUIRE(replay::GetSeekTimeFromSpec(replay::SeekToTimeSpec::Relative({100, 0}), start,
                                        end) == end);
  }

  SECTION("RandomAccessPlayerOptions::validate") {
    replay::RandomAccessPlayerOptions options;
    requireOk(options.validate());
    options.initialSpeed = 0;
    REQUIRE(options.validate().code == StatusCode::InvalidOptions);
    options.initialSpeed = 1;
    options.seekToTime = replay::SeekToTimeSpec::Relative(replay::fromMillis(500));
    REQUIRE(options.validate().code == StatusCode::InvalidOptions);
  }

  SECTION("LivePlayerOptions::validate") {
    replay::LivePlayerOptions options;
    requireOk(options.validate());
    options.clockTopic.clear();
    REQUIRE(options.validate().code == StatusCode::InvalidOptions);
  }
}

TEST_CASE("StreamReader", "[decoder]") {
  SECTION("Channel and message between magic and footer") {
    replay::BufferWriter out;
    RecordWriter::writeMagic(out);
    const auto records = ChannelAndMessageRecords();
    out.write(records.data(), records.size());
    RecordWriter::write(out, replay::Footer{});
    RecordWriter::writeMagic(out);

    replay::Status status;
    const auto decoded = DecodeAll(out.data(), 1, {}, &status);
    requireOk(status);
    REQUIRE(decoded.size() == 2);
    const auto* channel = std::get_if<replay::Channel>(&decoded[0]);
    REQUIRE(channel != nullptr);
    REQUIRE(channel->id == 3);
    REQUIRE(channel->topic == "/a");
    const auto* message = std::get_if<replay::MessageRecord>(&decoded[1]);
    REQUIRE(message != nullptr);
    REQUIRE(message->channelId == 3);
    REQUIRE(message->logTime == 42);
    REQUIRE(Text(message->data) == "hello");
  }

  SECTION("Reports completion and the footer") {
    replay::BufferWriter out;
    RecordWriter::writeMagic(out);
    RecordWriter::write(out, replay::Footer{0, 0, 0});
    RecordWriter::writeMagic(out);

    replay::StreamReader reader;
    REQUIRE(reader.next().kind == ReadResult::Kind::NeedMoreData);
    requireOk(reader.append(out.data().data(), out.data().size()));
    REQUIRE(reader.next().kind == ReadResult::Kind::Done);
    REQUIRE(reader.done());
    REQUIRE(reader.footer().has_value());
    REQUIRE(reader.bytesRemaining() == 0);
    REQUIRE(reader.bytesConsumed() == out.size());
    REQUIRE(reader.append(out.data().data(), 1).code == StatusCode::AlreadyDone);
  }

  SECTION("Invalid leading magic") {
    auto bytes = WriteExampleRecording(replay::RecordWriterOptions("test"));
    bytes[1] = std::byte('X');
    replay::Status status;
    const auto decoded = DecodeAll(bytes, 1024, {}, &status);
    REQUIRE(decoded.empty());
    REQUIRE(status.code == StatusCode::MagicMismatch);
  }

  SECTION("Trailing bytes after the footer") {
    auto bytes = WriteExampleRecording(replay::RecordWriterOptions("test"));
    bytes.push_back(std::byte(0));

    replay::StreamReader reader;
    requireOk(reader.append(bytes.data(), bytes.size()));
    ReadResult result;
    do {
      result = reader.next();
    } while (result.kind == ReadResult::Kind::Record);
    REQUIRE(result.kind == ReadResult::Kind::Failed);
    REQUIRE(reader.status().code == StatusCode::TrailingData);
    REQUIRE(reader.next().kind == ReadResult::Kind::Failed);
    REQUIRE(reader.append(bytes.data(), 1).code == StatusCode::AlreadyDone);
  }

  SECTION("Header inside a chunk") {
    replay::BufferWriter nested;
    RecordWriter::write(nested, replay::Header{"nested", ""});
    replay::Status status;
    const auto decoded = DecodeAll(ChunkStream(nested.data(), ""), 5, {}, &status);
    REQUIRE(status.code == StatusCode::InvalidOpCode);
    REQUIRE(decoded.size() == 1);
    REQUIRE(std::holds_alternative<replay::Header>(decoded[0]));
  }

  SECTION("Leftover bytes inside a chunk") {
    auto records = ChannelAndMessageRecords();
    records.push_back(std::byte(0x04));
    records.push_back(std::byte(0xff));
    replay::Status status;
    const auto decoded = DecodeAll(ChunkStream(records, ""), 1, {}, &status);
    REQUIRE(status.code == StatusCode::InvalidRecord);
    REQUIRE(RecordsOfType<replay::MessageRecord>(decoded).size() == 1);
  }

  SECTION("Unknown chunk compression") {
    replay::Status status;
    const auto decoded = DecodeAll(ChunkStream(ChannelAndMessageRecords(), "brotli"), 64, {},
                                   &status);
    REQUIRE(status.code == StatusCode::UnrecognizedCompression);
    REQUIRE(RecordsOfType<replay::MessageRecord>(decoded).empty());
  }

  SECTION("Chunk claiming an impossible uncompressed size") {
    const uint64_t hugeSize = uint64_t(1) << 44;
    const replay::ByteArray garbage(4, std::byte(0));
    for (const std::string compression : {"zstd", "lz4"}) {
      CAPTURE(compression);
      replay::Status status;
      const auto decoded =
        DecodeAll(ChunkStream(garbage, compression, 0, hugeSize), 4096, {}, &status);
      REQUIRE(status.code == StatusCode::DecompressionFailed);
      REQUIRE(RecordsOfType<replay::MessageRecord>(decoded).empty());
    }
  }

  SECTION("Allocation failure in a decompression handler") {
    replay::StreamReaderOptions options;
    options.decompressHandlers.registerHandler(
      "greedy", [](const std::byte*, uint64_t, uint64_t, replay::ByteArray*) -> replay::Status {
        throw std::bad_alloc();
      });
    replay::Status status;
    const auto decoded = DecodeAll(ChunkStream(ChannelAndMessageRecords(), "greedy"), 64,
                                   std::move(options), &status);
    REQUIRE(status.code == StatusCode::DecompressionFailed);
    REQUIRE(RecordsOfType<replay::MessageRecord>(decoded).empty());
  }

  SECTION("Custom decompression handler") {
    replay::StreamReaderOptions options;
    options.decompressHandlers.registerHandler(
      "reverse", [](const std::byte* data, uint64_t size, uint64_t, replay::ByteArray* output) {
        output->assign(std::reverse_iterator(data + size), std::reverse_iterator(data));
        return replay::Status{};
      });
    auto records = ChannelAndMessageRecords();
    std::reverse(records.begin(), records.end());

    replay::Status status;
    const auto decoded = DecodeAll(ChunkStream(records, "reverse"), 3, std::move(options), &status);
    requireOk(status);
    REQUIRE(RecordsOfType<replay::Channel>(decoded).size() == 1);
    REQUIRE(RecordsOfType<replay::MessageRecord>(decoded).size() == 1);
  }

  SECTION("Chunk CRC") {
    const auto records = ChannelAndMessageRecords();
    const uint32_t wrongCrc = replay::internal::crc32(records.data(), records.size()) + 1;
    const auto bytes = ChunkStream(records, "", wrongCrc);

    replay::Status status;
    DecodeAll(bytes, 16, {}, &status);
    requireOk(status);

    replay::StreamReaderOptions options;
    options.validateChunkCrc = true;
    const auto decoded = DecodeAll(bytes, 16, std::move(options), &status);
    REQUIRE(status.code == StatusCode::InvalidChunkCrc);
    REQUIRE(RecordsOfType<replay::MessageRecord>(decoded).empty());
  }

  SECTION("includeChunks yields the chunk before its records") {
    replay::StreamReaderOptions options;
    options.includeChunks = true;
    replay::Status status;
    const auto decoded = DecodeAll(ChunkStream(ChannelAndMessageRecords(), ""), 7,
                                   std::move(options), &status);
    requireOk(status);
    REQUIRE(decoded.size() == 4);
    REQUIRE(std::holds_alternative<replay::ChunkRecord>(decoded[1]));
    REQUIRE(std::holds_alternative<replay::Channel>(decoded[2]));
    REQUIRE(std::holds_alternative<replay::MessageRecord>(decoded[3]));
  }

  SECTION("Unknown opcodes are passed through") {
    replay::BufferWriter out;
    RecordWriter::writeMagic(out);
    RecordWriter::write(out, replay::OpCode(0x80), Bytes("future"));
    RecordWriter::write(out, replay::Footer{});
    RecordWriter::writeMagic(out);

    replay::Status status;
    const auto decoded = DecodeAll(out.data(), 2, {}, &status);
    requireOk(status);
    REQUIRE(decoded.size() == 1);
    const auto* unknown = std::get_if<replay::UnknownRecord>(&decoded[0]);
    REQUIRE(unknown != nullptr);
    REQUIRE(unknown->opcode == 0x80);
    REQUIRE(Text(unknown->data) == "future");
  }
}

TEST_CASE("StreamReader decodes writer output in any fragment size", "[decoder][writer]") {
  replay::RecordWriterOptions options("test");
  options.chunkSize = 64;
  SECTION("zstd") {
    options.compression = replay::Compression::Zstd;
  }
  SECTION("lz4") {
    options.compression = replay::Compression::Lz4;
  }
  SECTION("uncompressed") {
    options.compression = replay::Compression::None;
  }
  SECTION("unchunked") {
    options.noChunking = true;
  }
  const auto bytes = WriteExampleRecording(options);

  replay::Status status;
  const auto whole = DecodeAll(bytes, bytes.size(), {}, &status);
  requireOk(status);
  const auto messages = RecordsOfType<replay::MessageRecord>(whole);
  REQUIRE(messages.size() == 11);
  REQUIRE(Text(messages.front().data) == "a0");
  REQUIRE(Text(messages.back().data) == "a9");

  for (size_t fragmentSize : {1, 2, 7, 100, 4096}) {
    CAPTURE(fragmentSize);
    const auto fragmented = DecodeAll(bytes, fragmentSize, {}, &status);
    requireOk(status);
    REQUIRE(fragmented.size() == whole.size());
    for (size_t i = 0; i < whole.size(); ++i) {
      REQUIRE(replay::RecordOpCode(fragmented[i]) == replay::RecordOpCode(whole[i]));
    }
    const auto fragmentedMessages = RecordsOfType<replay::MessageRecord>(fragmented);
    REQUIRE(fragmentedMessages.size() == messages.size());
    for (size_t i = 0; i < messages.size(); ++i) {
      REQUIRE(fragmentedMessages[i].channelId == messages[i].channelId);
      REQUIRE(fragmentedMessages[i].logTime == messages[i].logTime);
      REQUIRE(fragmentedMessages[i].data == messages[i].data);
    }
  }
}

TEST_CASE("RecordWriter", "[writer]") {
  SECTION("Rejects messages on unknown channels") {
    replay::BufferWriter out;
    RecordWriter writer;
    writer.open(out, replay::RecordWriterOptions("test"));
    replay::Message message;
    message.channelId = 7;
    REQUIRE(writer.write(message).code == StatusCode::InvalidChannelId);
    writer.close();
  }

  SECTION("Writing before open fails") {
    RecordWriter writer;
    replay::Message message;
    REQUIRE(writer.write(message).code == StatusCode::NotOpen);
  }

  SECTION("Statistics") {
    replay::RecordWriterOptions options("test");
    options.chunkSize = 32;
    const auto bytes = WriteExampleRecording(options);
    replay::Status status;
    const auto records = DecodeAll(bytes, bytes.size(), {}, &status);
    requireOk(status);
    const auto statistics = RecordsOfType<replay::Statistics>(records);
    REQUIRE(statistics.size() == 1);
    REQUIRE(statistics[0].messageCount == 11);
    REQUIRE(statistics[0].channelCount == 2);
    REQUIRE(statistics[0].messageStartTime == 0);
    REQUIRE(statistics[0].messageEndTime == 9'000'000'000);
    REQUIRE(statistics[0].chunkCount > 1);
    REQUIRE(RecordsOfType<replay::ChunkIndex>(records).size() == statistics[0].chunkCount);
  }
}
