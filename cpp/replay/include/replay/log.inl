#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace replay {

namespace internal {

struct LoggerSlot {
  std::mutex mutex;
  std::shared_ptr<spdlog::logger> logger;
};

LoggerSlot& loggerSlot() {
  static LoggerSlot slot;
  return slot;
}

std::shared_ptr<spdlog::logger> makeDefaultLogger() {
  if (auto existing = spdlog::get("replay")) {
    return existing;
  }
  auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto created = std::make_shared<spdlog::logger>("replay", sink);
  created->set_level(spdlog::level::info);
  return created;
}

}  // namespace internal

std::shared_ptr<spdlog::logger> logger() {
  auto& slot = internal::loggerSlot();
  std::lock_guard<std::mutex> lock(slot.mutex);
  if (!slot.logger) {
    slot.logger = internal::makeDefaultLogger();
  }
  return slot.logger;
}

void setLogger(std::shared_ptr<spdlog::logger> logger) {
  auto& slot = internal::loggerSlot();
  std::lock_guard<std::mutex> lock(slot.mutex);
  slot.logger = std::move(logger);
}

}  // namespace replay
