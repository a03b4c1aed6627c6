#include "test_helpers.hpp"

using replay::McapProviderOptions;
using replay::StatusCode;

namespace {

std::unique_ptr<replay::IReadable> Readable(replay::ByteArray bytes) {
  return std::make_unique<replay::BufferReader>(std::move(bytes));
}

std::vector<std::string> Payloads(const std::vector<replay::MessageEvent>& events) {
  std::vector<std::string> payloads;
  for (const auto& event : events) {
    payloads.push_back(Text(*event.message));
  }
  return payloads;
}

std::vector<replay::MessageEvent> Read(replay::IDataProvider& provider, double start, double end,
                                       std::vector<std::string> topics) {
  replay::GetMessagesResult result;
  requireOk(provider.getMessages(Seconds(start), Seconds(end),
                                 replay::GetMessagesTopics{std::move(topics)}, &result));
  REQUIRE(result.parsedMessages.has_value());
  return *result.parsedMessages;
}

struct InitRecord {
  std::vector<replay::Progress> progress;
  uint64_t receivedBytes = 0;

  replay::ExtensionPoint extensionPoint() {
    replay::ExtensionPoint extensionPoint;
    extensionPoint.progressCallback = [this](const replay::Progress& update) {
      progress.push_back(update);
    };
    extensionPoint.reportMetadataCallback = [this](const replay::ProviderMetadata& metadata) {
      if (const auto* bytes = std::get_if<replay::ReceivedBytesMetadata>(&metadata)) {
        receivedBytes += bytes->bytes;
      }
    };
    return extensionPoint;
  }
};

void RequireExampleDescription(const replay::InitializationResult& result) {
  REQUIRE(result.start == Seconds(0));
  REQUIRE(result.end == Seconds(9));
  REQUIRE(result.providesParsedMessages);
  REQUIRE(result.messageDefinitions.kind == replay::MessageDefinitions::Kind::Parsed);

  REQUIRE(result.topics.size() == 2);
  REQUIRE(result.topics[0] == replay::Topic{"/a", "example/A"});
  REQUIRE(result.topics[1] == replay::Topic{"/b", ""});

  REQUIRE(result.messageDefinitions.datatypes.size() == 1);
  REQUIRE(result.messageDefinitions.datatypes.at("example/A") == "string data");

  REQUIRE(result.connections.size() == 2);
  REQUIRE(result.connections[0].topic == "/a");
  REQUIRE(result.connections[0].callerId == "/talker");
  REQUIRE(result.connections[1].callerId.empty());
}

}  // namespace

TEST_CASE("McapStreamProvider", "[provider]") {
  replay::RecordWriterOptions writerOptions("test");
  SECTION("chunked") {
    writerOptions.chunkSize = 40;
  }
  SECTION("unchunked") {
    writerOptions.noChunking = true;
  }
  const auto bytes = WriteExampleRecording(writerOptions);

  McapProviderOptions options;
  options.pageSize = 17;
  replay::McapStreamProvider provider(Readable(bytes), options);

  InitRecord record;
  replay::InitializationResult result;
  requireOk(provider.initialize(record.extensionPoint(), &result));
  RequireExampleDescription(result);

  REQUIRE(record.receivedBytes == bytes.size());
  REQUIRE(record.progress.size() == 1);
  REQUIRE(record.progress[0].fullyLoadedFractionRanges->size() == 1);
  REQUIRE(record.progress[0].fullyLoadedFractionRanges->at(0).end == 1.0);

  SECTION("both ends of the window are inclusive") {
    const auto events = Read(provider, 2, 4, {"/a"});
    REQUIRE(Payloads(events) == std::vector<std::string>{"a2", "a3", "a4"});
    REQUIRE(events[0].topic == "/a");
    REQUIRE(events[0].receiveTime == Seconds(2));
    REQUIRE(events[0].sizeInBytes == 2);
  }

  SECTION("only requested topics are returned") {
    REQUIRE(Payloads(Read(provider, 0, 1, {"/a", "/b"})) ==
            std::vector<std::string>{"a0", "b0", "a1"});
    REQUIRE(Payloads(Read(provider, 0, 9, {"/b"})) == std::vector<std::string>{"b0"});
    REQUIRE(Read(provider, 0, 9, {"/missing"}).empty());
  }

  requireOk(provider.close());
}

TEST_CASE("McapStreamProvider rejects broken recordings", "[provider]") {
  auto bytes = WriteExampleRecording(replay::RecordWriterOptions("test"));

  SECTION("truncated") {
    bytes.resize(bytes.size() - 10);
    replay::McapStreamProvider provider(Readable(bytes));
    replay::InitializationResult result;
    REQUIRE(provider.initialize({}, &result).code == StatusCode::InvalidRecord);
  }

  SECTION("corrupted magic") {
    bytes[0] = std::byte(0);
    replay::McapStreamProvider provider(Readable(bytes));
    replay::InitializationResult result;
    const auto status = provider.initialize({}, &result);
    REQUIRE(status.code == StatusCode::MagicMismatch);
    REQUIRE(status.message.find("failed to decode recording at byte 0") == 0);
  }
}

TEST_CASE("McapIndexedProvider", "[provider]") {
  replay::RecordWriterOptions writerOptions("test");
  writerOptions.chunkSize = 40;
  const auto bytes = WriteExampleRecording(writerOptions);

  SECTION("ReadSummary") {
    replay::BufferReader readable(bytes);
    replay::McapSummary summary;
    requireOk(replay::McapIndexedProvider::ReadSummary(readable, &summary));
    REQUIRE(summary.channels.size() == 2);
    REQUIRE(summary.schemas.size() == 1);
    REQUIRE(summary.statistics.has_value());
    REQUIRE(summary.statistics->messageCount == 11);
    REQUIRE(summary.chunkIndexes.size() > 1);
  }

  replay::McapIndexedProvider provider(Readable(bytes));
  InitRecord record;
  replay::InitializationResult result;
  requireOk(provider.initialize(record.extensionPoint(), &result));
  RequireExampleDescription(result);
  REQUIRE(record.receivedBytes == 0);
  REQUIRE(record.progress.size() == 1);
  REQUIRE(record.progress[0].fullyLoadedFractionRanges->empty());

  SECTION("reads only overlapping chunks") {
    REQUIRE(Payloads(Read(provider, 3, 3, {"/a"})) == std::vector<std::string>{"a3"});
    const uint64_t afterOne = record.receivedBytes;
    REQUIRE(afterOne > 0);
    REQUIRE(afterOne < bytes.size());

    REQUIRE(Payloads(Read(provider, 3, 3, {"/a"})) == std::vector<std::string>{"a3"});
    REQUIRE(record.receivedBytes == afterOne);
  }

  SECTION("messages are ordered across chunks") {
    REQUIRE(Payloads(Read(provider, 0, 9, {"/a", "/b"})) ==
            std::vector<std::string>{"a0", "b0", "a1", "a2", "a3", "a4", "a5", "a6", "a7", "a8",
                                     "a9"});
    REQUIRE(Read(provider, 9.5, 20, {"/a"}).empty());
  }

  requireOk(provider.close());
  replay::GetMessagesResult closed;
  REQUIRE(provider.getMessages(Seconds(0), Seconds(1), {{"/a"}}, &closed).code ==
          StatusCode::NotOpen);
}

TEST_CASE("McapIndexedProvider requires a summary", "[provider]") {
  SECTION("no summary section") {
    replay::RecordWriterOptions writerOptions("test");
    writerOptions.noSummary = true;
    replay::BufferReader readable(WriteExampleRecording(writerOptions));
    replay::McapSummary summary;
    REQUIRE(replay::McapIndexedProvider::ReadSummary(readable, &summary).code ==
            StatusCode::MissingSummary);
  }

  SECTION("no chunk indexes") {
    replay::RecordWriterOptions writerOptions("test");
    writerOptions.noChunking = true;
    replay::McapIndexedProvider provider(Readable(WriteExampleRecording(writerOptions)));
    replay::InitializationResult result;
    REQUIRE(provider.initialize({}, &result).code == StatusCode::MissingSummary);
  }

  SECTION("too small") {
    replay::BufferReader readable(Bytes("tiny"));
    replay::McapSummary summary;
    REQUIRE(replay::McapIndexedProvider::ReadSummary(readable, &summary).code ==
            StatusCode::InvalidFooter);
  }
}

TEST_CASE("OpenMcapProvider", "[provider]") {
  McapProviderOptions options;
  std::unique_ptr<replay::IDataProvider> provider;

  SECTION("Auto picks the indexed provider for indexed recordings") {
    requireOk(replay::OpenMcapProvider(
      Readable(WriteExampleRecording(replay::RecordWriterOptions("test"))), options, &provider));
    REQUIRE(dynamic_cast<replay::McapIndexedProvider*>(provider.get()) != nullptr);
  }

  SECTION("Auto falls back to scanning without a summary") {
    replay::RecordWriterOptions writerOptions("test");
    writerOptions.noSummary = true;
    requireOk(
      replay::OpenMcapProvider(Readable(WriteExampleRecording(writerOptions)), options, &provider));
    REQUIRE(dynamic_cast<replay::McapStreamProvider*>(provider.get()) != nullptr);

    replay::InitializationResult result;
    requireOk(provider->initialize({}, &result));
    RequireExampleDescription(result);
  }

  SECTION("Streamed is honored for indexed recordings") {
    options.readMode = McapProviderOptions::ReadMode::Streamed;
    requireOk(replay::OpenMcapProvider(
      Readable(WriteExampleRecording(replay::RecordWriterOptions("test"))), options, &provider));
    REQUIRE(dynamic_cast<replay::McapStreamProvider*>(provider.get()) != nullptr);
  }

  SECTION("invalid options") {
    options.pageSize = 0;
    REQUIRE(replay::OpenMcapProvider(Readable(Bytes("")), options, &provider).code ==
            StatusCode::InvalidOptions);
    options.pageSize = 1;
    REQUIRE(replay::OpenMcapProvider(nullptr, options, &provider).code ==
            StatusCode::InvalidOptions);
  }
}
