#include <replay/replay.hpp>

#include <benchmark/benchmark.h>

#include <algorithm>
#include <array>
#include <cstring>

constexpr char StringSchema[] = "string data";
constexpr size_t WriteIterations = 10000;
constexpr size_t RecordingMessages = 100000;

static std::array<std::byte, 4 + 13> HelloPayload() {
  std::array<std::byte, 4 + 13> payload;
  const uint32_t length = 13;
  std::memcpy(payload.data(), &length, 4);
  std::memcpy(payload.data() + 4, "Hello, world!", 13);
  return payload;
}

// Writes RecordingMessages messages 1ms apart on a single channel into memory.
static replay::ByteArray MakeRecording(const replay::RecordWriterOptions& options) {
  const auto payload = HelloPayload();
  replay::BufferWriter out;
  replay::RecordWriter writer;
  writer.open(out, options);

  replay::Schema stdMsgsString("std_msgs/String", "ros1msg", StringSchema);
  writer.addSchema(stdMsgsString);
  replay::Channel topic("/chatter", "ros1", stdMsgsString.id);
  writer.addChannel(topic);

  replay::Message msg;
  msg.channelId = topic.id;
  msg.data = payload.data();
  msg.dataSize = payload.size();
  for (size_t i = 0; i < RecordingMessages; i++) {
    msg.sequence = uint32_t(i);
    msg.logTime = replay::Timestamp(i) * replay::NanosecondsPerMillisecond;
    msg.publishTime = msg.logTime;
    if (!writer.write(msg).ok()) {
      break;
    }
  }
  writer.close();
  return out.release();
}

static replay::RecordWriterOptions ChunkedOptions(replay::Compression compression) {
  replay::RecordWriterOptions options("ros1");
  options.compression = compression;
  return options;
}

static void BM_RecordWriterUnchunked(benchmark::State& state) {
  const auto payload = HelloPayload();
  auto options = replay::RecordWriterOptions("ros1");
  options.noChunking = true;
  options.noSummary = true;

  replay::BufferWriter out;
  replay::RecordWriter writer;
  writer.open(out, options);

  replay::Schema stdMsgsString("std_msgs/String", "ros1msg", StringSchema);
  writer.addSchema(stdMsgsString);
  replay::Channel topic("/chatter", "ros1", stdMsgsString.id);
  writer.addChannel(topic);

  replay::Message msg;
  msg.channelId = topic.id;
  msg.data = payload.data();
  msg.dataSize = payload.size();

  while (state.KeepRunning()) {
    for (size_t i = 0; i < WriteIterations; i++) {
      auto status = writer.write(msg);
      benchmark::DoNotOptimize(status);
      benchmark::ClobberMemory();
    }
  }

  writer.close();
}

// Args: chunk size, compression (0 = none, 1 = lz4, 2 = zstd).
static void BM_RecordWriterChunked(benchmark::State& state) {
  const auto payload = HelloPayload();
  auto options = replay::RecordWriterOptions("ros1");
  options.chunkSize = uint64_t(state.range(0));
  options.compression = replay::Compression(state.range(1));

  replay::BufferWriter out;
  replay::RecordWriter writer;
  writer.open(out, options);

  replay::Schema stdMsgsString("std_msgs/String", "ros1msg", StringSchema);
  writer.addSchema(stdMsgsString);
  replay::Channel topic("/chatter", "ros1", stdMsgsString.id);
  writer.addChannel(topic);

  replay::Message msg;
  msg.channelId = topic.id;
  msg.data = payload.data();
  msg.dataSize = payload.size();

  while (state.KeepRunning()) {
    for (size_t i = 0; i < WriteIterations; i++) {
      auto status = writer.write(msg);
      benchmark::DoNotOptimize(status);
      benchmark::ClobberMemory();
    }
  }

  writer.close();
}

// Args: fragment size, compression. Decodes a whole recording handed over in
// fragments of the given size.
static void BM_StreamReaderFragments(benchmark::State& state) {
  const auto fragmentSize = size_t(state.range(0));
  const auto recording =
    MakeRecording(ChunkedOptions(replay::Compression(state.range(1))));

  for (auto _ : state) {
    replay::StreamReader reader;
    size_t offset = 0;
    size_t records = 0;
    for (;;) {
      const auto result = reader.next();
      if (result.kind == replay::ReadResult::Kind::Record) {
        records++;
        continue;
      }
      if (result.kind != replay::ReadResult::Kind::NeedMoreData || offset >= recording.size()) {
        break;
      }
      const size_t size = std::min(fragmentSize, recording.size() - offset);
      if (!reader.append(recording.data() + offset, size).ok()) {
        break;
      }
      offset += size;
    }
    benchmark::DoNotOptimize(records);
  }
  state.SetBytesProcessed(int64_t(state.iterations()) * int64_t(recording.size()));
}

// Args: read mode (0 = streamed, 1 = indexed), window in milliseconds. Reads
// consecutive windows across the recording the way playback ticks do.
static void BM_ProviderWindows(benchmark::State& state) {
  replay::McapProviderOptions options;
  options.readMode = state.range(0) == 0 ? replay::McapProviderOptions::ReadMode::Streamed
                                         : replay::McapProviderOptions::ReadMode::Indexed;
  const auto window = replay::fromMillis(double(state.range(1)));
  const auto recording = MakeRecording(ChunkedOptions(replay::Compression::Zstd));

  std::unique_ptr<replay::IDataProvider> provider;
  replay::InitializationResult info;
  if (!replay::OpenMcapProvider(std::make_unique<replay::BufferReader>(recording), options,
                                &provider)
         .ok() ||
      !provider->initialize({}, &info).ok()) {
    state.SkipWithError("failed to open recording");
    return;
  }

  const replay::GetMessagesTopics topics{{"/chatter"}};
  for (auto _ : state) {
    size_t messages = 0;
    for (auto start = info.start; start <= info.end;
         start = replay::add(start, replay::add(window, replay::fromNanos(1)))) {
      replay::GetMessagesResult result;
      if (!provider->getMessages(start, replay::add(start, window), topics, &result).ok()) {
        state.SkipWithError("getMessages failed");
        return;
      }
      messages += result.parsedMessages->size();
    }
    benchmark::DoNotOptimize(messages);
  }

  if (!provider->close().ok()) {
    state.SkipWithError("close failed");
  }
}

int main(int argc, char* argv[]) {
  benchmark::RegisterBenchmark("BM_RecordWriterUnchunked", BM_RecordWriterUnchunked);
  benchmark::RegisterBenchmark("BM_RecordWriterChunked", BM_RecordWriterChunked)
    ->Args({1, 0})
    ->Args({1, 1})
    ->Args({1, 2})
    ->Args({replay::DefaultChunkSize, 0})
    ->Args({replay::DefaultChunkSize, 1})
    ->Args({replay::DefaultChunkSize, 2});
  benchmark::RegisterBenchmark("BM_StreamReaderFragments", BM_StreamReaderFragments)
    ->Args({64, 0})
    ->Args({4096, 0})
    ->Args({1024 * 1024, 0})
    ->Args({4096, 1})
    ->Args({4096, 2})
    ->Unit(benchmark::kMillisecond);
  benchmark::RegisterBenchmark("BM_ProviderWindows", BM_ProviderWindows)
    ->Args({0, 100})
    ->Args({0, 1000})
    ->Args({1, 100})
    ->Args({1, 1000})
    ->Unit(benchmark::kMillisecond);
  benchmark::Initialize(&argc, argv);
  benchmark::RunSpecifiedBenchmarks();

  return 0;
}
