#include <replay/replay.hpp>
#include <replay/internal.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/thread_pool.hpp>
#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <csignal>
#include <fstream>
#include <iostream>

// Optional JSON configuration, for example:
//   {"speed": 2.0, "seek": 12.5, "topics": ["/clock", "/tf"], "readMode": "indexed",
//    "duration": 30}
struct PlayConfig {
  double speed = 1.0;
  std::optional<double> seek;
  std::vector<std::string> topics;
  replay::McapProviderOptions::ReadMode readMode = replay::McapProviderOptions::ReadMode::Auto;
  double duration = 0;
};

replay::Status LoadConfig(const std::string& path, PlayConfig* config) {
  std::ifstream file(path);
  if (!file) {
    return replay::Status{replay::StatusCode::OpenFailed,
                          replay::internal::StrCat("failed to open config ", path)};
  }
  try {
    const auto json = nlohmann::json::parse(file);
    config->speed = json.value("speed", config->speed);
    config->duration = json.value("duration", config->duration);
    if (json.contains("seek")) {
      config->seek = json.at("seek").get<double>();
    }
    if (json.contains("topics")) {
      config->topics = json.at("topics").get<std::vector<std::string>>();
    }
    const auto readMode = json.value("readMode", std::string("auto"));
    if (readMode == "streamed") {
      config->readMode = replay::McapProviderOptions::ReadMode::Streamed;
    } else if (readMode == "indexed") {
      config->readMode = replay::McapProviderOptions::ReadMode::Indexed;
    } else if (readMode != "auto") {
      return replay::Status{replay::StatusCode::InvalidOptions,
                            replay::internal::StrCat("unknown readMode ", readMode)};
    }
  } catch (const nlohmann::json::exception& e) {
    return replay::Status{replay::StatusCode::InvalidOptions,
                          replay::internal::StrCat("invalid config ", path, ": ", e.what())};
  }
  return replay::StatusCode::Success;
}

void PrintState(const replay::PlayerState& state, uint64_t* messageCount) {
  for (const auto& problem : state.problems) {
    std::cerr << fmt::format("! [{}] {}: {}\n", replay::SeverityString(problem.severity),
                             problem.id, problem.message);
  }
  if (!state.activeData) {
    std::cout << fmt::format("{} ({})\n", state.name, replay::PresenceString(state.presence));
    return;
  }
  const auto& active = *state.activeData;
  for (const auto& message : active.messages) {
    std::cout << fmt::format("  {} {} <{} bytes>\n", replay::toString(message.receiveTime),
                             message.topic, message.sizeInBytes);
  }
  *messageCount += active.messages.size();
  if (active.currentTimeChanged) {
    std::cout << fmt::format("{} {:.1f}% {}x{}\n", replay::toString(active.currentTime),
                             replay::percentOf(active.startTime, active.endTime,
                                               active.currentTime),
                             active.speed, active.isPlaying ? "" : " (paused)");
  }
}

int main(int argc, char* argv[]) {
  if (argc < 2 || argc > 3) {
    std::cerr << "Usage: " << argv[0] << " <input.mcap> [config.json]\n";
    return 1;
  }

  PlayConfig config;
  if (argc == 3) {
    if (auto status = LoadConfig(argv[2], &config); !status.ok()) {
      std::cerr << "! " << status.message << "\n";
      return 1;
    }
  }

  std::unique_ptr<replay::FileReader> file;
  if (auto status = replay::FileReader::Open(argv[1], &file); !status.ok()) {
    std::cerr << "! " << status.message << "\n";
    return 1;
  }

  replay::McapProviderOptions providerOptions;
  providerOptions.readMode = config.readMode;
  std::unique_ptr<replay::IDataProvider> provider;
  if (auto status = replay::OpenMcapProvider(std::move(file), providerOptions, &provider);
      !status.ok()) {
    std::cerr << "! " << status.message << "\n";
    return 1;
  }

  boost::asio::thread_pool pool(2);
  replay::RandomAccessPlayerOptions playerOptions;
  playerOptions.name = argv[1];
  playerOptions.initialSpeed = config.speed;
  if (config.seek) {
    playerOptions.seekToTime = replay::SeekToTimeSpec::Absolute(replay::fromSec(*config.seek));
  }
  std::shared_ptr<replay::RandomAccessPlayer> player;
  if (auto status = replay::RandomAccessPlayer::Create(pool.get_executor(), std::move(provider),
                                                       playerOptions, &player);
      !status.ok()) {
    std::cerr << "! " << status.message << "\n";
    return 1;
  }

  boost::asio::io_context io;
  boost::asio::signal_set signals(io, SIGINT, SIGTERM);
  boost::asio::steady_timer deadline(io);
  auto stop = [&] {
    signals.cancel();
    deadline.cancel();
  };
  signals.async_wait([&](const boost::system::error_code& ec, int) {
    if (!ec) {
      stop();
    }
  });
  if (config.duration > 0) {
    deadline.expires_after(std::chrono::duration_cast<std::chrono::steady_clock::duration>(
      std::chrono::duration<double>(config.duration)));
    deadline.async_wait([&](const boost::system::error_code& ec) {
      if (!ec) {
        stop();
      }
    });
  }

  std::vector<replay::SubscribePayload> subscriptions;
  for (const auto& topic : config.topics) {
    subscriptions.push_back({topic, "replay_play"});
  }

  if (!subscriptions.empty()) {
    player->setSubscriptions(subscriptions);
  }

  std::atomic<bool> started = false;
  std::atomic<bool> failed = false;
  uint64_t messageCount = 0;
  player->setListener([&](replay::PlayerState state) {
    // Subscribe to everything the recording offers unless the config narrowed it.
    if (state.activeData && !started.exchange(true)) {
      if (subscriptions.empty()) {
        std::vector<replay::SubscribePayload> all;
        for (const auto& topic : state.activeData->topics) {
          all.push_back({topic.name, "replay_play"});
        }
        player->setSubscriptions(std::move(all));
      }
      player->startPlayback();
    }
    PrintState(state, &messageCount);
    if (state.presence == replay::PlayerPresence::Error && !failed.exchange(true)) {
      boost::asio::post(io, stop);
    }
  });
  io.run();
  player->close();
  pool.join();

  std::cout << fmt::format("{} messages\n", messageCount);
  return failed ? 1 : 0;
}
