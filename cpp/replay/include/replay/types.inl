#include "internal.hpp"

namespace replay {

MessageRecord::MessageRecord(const Message& message)
    : channelId(message.channelId)
    , sequence(message.sequence)
    , logTime(message.logTime)
    , publishTime(message.publishTime)
    , data(message.data, message.data + message.dataSize) {}

Message MessageRecord::view() const {
  Message message;
  message.channelId = channelId;
  message.sequence = sequence;
  message.logTime = logTime;
  message.publishTime = publishTime;
  message.dataSize = data.size();
  message.data = data.data();
  return message;
}

ChunkRecord::ChunkRecord(const Chunk& chunk)
    : messageStartTime(chunk.messageStartTime)
    , messageEndTime(chunk.messageEndTime)
    , uncompressedSize(chunk.uncompressedSize)
    , uncompressedCrc(chunk.uncompressedCrc)
    , compression(chunk.compression)
    , records(chunk.records, chunk.records + chunk.compressedSize) {}

AttachmentRecord::AttachmentRecord(const Attachment& attachment)
    : logTime(attachment.logTime)
    , createTime(attachment.createTime)
    , name(attachment.name)
    , mediaType(attachment.mediaType)
    , data(attachment.data, attachment.data + attachment.dataSize)
    , crc(attachment.crc) {}

OpCode RecordOpCode(const TypedRecord& record) {
  return std::visit(
    [](auto&& arg) -> OpCode {
      using T = std::decay_t<decltype(arg)>;
      if constexpr (std::is_same_v<T, Header>) {
        return OpCode::Header;
      } else if constexpr (std::is_same_v<T, Schema>) {
        return OpCode::Schema;
      } else if constexpr (std::is_same_v<T, Channel>) {
        return OpCode::Channel;
      } else if constexpr (std::is_same_v<T, MessageRecord>) {
        return OpCode::Message;
      } else if constexpr (std::is_same_v<T, ChunkRecord>) {
        return OpCode::Chunk;
      } else if constexpr (std::is_same_v<T, MessageIndex>) {
        return OpCode::MessageIndex;
      } else if constexpr (std::is_same_v<T, ChunkIndex>) {
        return OpCode::ChunkIndex;
      } else if constexpr (std::is_same_v<T, AttachmentRecord>) {
        return OpCode::Attachment;
      } else if constexpr (std::is_same_v<T, AttachmentIndex>) {
        return OpCode::AttachmentIndex;
      } else if constexpr (std::is_same_v<T, Statistics>) {
        return OpCode::Statistics;
      } else if constexpr (std::is_same_v<T, Metadata>) {
        return OpCode::Metadata;
      } else if constexpr (std::is_same_v<T, MetadataIndex>) {
        return OpCode::MetadataIndex;
      } else if constexpr (std::is_same_v<T, SummaryOffset>) {
        return OpCode::SummaryOffset;
      } else if constexpr (std::is_same_v<T, DataEnd>) {
        return OpCode::DataEnd;
      } else if constexpr (std::is_same_v<T, UnknownRecord>) {
        return OpCode(arg.opcode);
      } else {
        static_assert(internal::always_false_v<T>, "non-exhaustive visitor!");
      }
    },
    record);
}

}  // namespace replay
