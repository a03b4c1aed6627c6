#pragma once

#include <string>

namespace replay {

/**
 * @brief Status codes returned by the decoder, writer, providers and players.
 */
enum class StatusCode {
  Success = 0,
  NotOpen,
  ReadFailed,
  OpenFailed,
  MagicMismatch,
  InvalidRecord,
  InvalidOpCode,
  InvalidFooter,
  TrailingData,
  InvalidChunkCrc,
  DecompressionFailed,
  DecompressionSizeMismatch,
  UnrecognizedCompression,
  AlreadyDone,
  MissingSummary,
  InvalidOptions,
  InvalidTopic,
  InvalidChannelId,
  ProviderFailed,
  ConnectionFailed,
  UnsupportedOperation,
};

/**
 * @brief Wraps a status code and string message carrying additional context.
 */
struct [[nodiscard]] Status {
  StatusCode code;
  std::string message;

  Status()
      : code(StatusCode::Success) {}

  Status(StatusCode _code)
      : code(_code) {
    switch (code) {
      case StatusCode::Success:
        break;
      case StatusCode::NotOpen:
        message = "not open";
        break;
      case StatusCode::ReadFailed:
        message = "read failed";
        break;
      case StatusCode::OpenFailed:
        message = "open failed";
        break;
      case StatusCode::MagicMismatch:
        message = "magic mismatch";
        break;
      case StatusCode::InvalidRecord:
        message = "invalid record";
        break;
      case StatusCode::InvalidOpCode:
        message = "invalid opcode";
        break;
      case StatusCode::InvalidFooter:
        message = "invalid footer";
        break;
      case StatusCode::TrailingData:
        message = "trailing data after footer";
        break;
      case StatusCode::InvalidChunkCrc:
        message = "chunk crc mismatch";
        break;
      case StatusCode::DecompressionFailed:
        message = "decompression failed";
        break;
      case StatusCode::DecompressionSizeMismatch:
        message = "decompression size mismatch";
        break;
      case StatusCode::UnrecognizedCompression:
        message = "unrecognized compression";
        break;
      case StatusCode::AlreadyDone:
        message = "already done reading";
        break;
      case StatusCode::MissingSummary:
        message = "missing summary section";
        break;
      case StatusCode::InvalidOptions:
        message = "invalid options";
        break;
      case StatusCode::InvalidTopic:
        message = "invalid topic";
        break;
      case StatusCode::InvalidChannelId:
        message = "invalid channel id";
        break;
      case StatusCode::ProviderFailed:
        message = "data provider failed";
        break;
      case StatusCode::ConnectionFailed:
        message = "connection failed";
        break;
      case StatusCode::UnsupportedOperation:
        message = "unsupported operation";
        break;
      default:
        message = "unknown";
        break;
    }
  }

  Status(StatusCode _code, const std::string& _message)
      : code(_code)
      , message(_message) {}

  bool ok() const {
    return code == StatusCode::Success;
  }
};

}  // namespace replay
