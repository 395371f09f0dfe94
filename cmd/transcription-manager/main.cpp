#include <chrono>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

namespace observability = transcription::observability;

using transcription::runtime::config::RuntimeConfig;

namespace {

constexpr int kDefaultMaxMessageBytes = 512 * 1024 * 1024;

volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

std::optional<std::string> ConfigPathFromArgs(int argc, char** argv) {
  if (argc == 2) {
    return std::string(argv[1]);
  }
  if (argc == 3 && std::string(argv[1]) == "--config") {
    return std::string(argv[2]);
  }
  return std::nullopt;
}

const char* BackendName(const RuntimeConfig& config) {
  return config.database().has_memory() ? "memory" : "sqlite";
}

// serves until SIGINT or SIGTERM; the worker pool is drained before returning
void Serve(const RuntimeConfig& config) {
  auto app = transcription::factory::Build(config);

  const int max_message_bytes =
      config.server().max_message_bytes() > 0 ? static_cast<int>(config.server().max_message_bytes()) : kDefaultMaxMessageBytes;
  transcription::runtime::Server server(config.server().bind_address(), std::move(app.grpc_services), max_message_bytes);

  // handlers go in before Start so an early signal is not lost
  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);

  server.Start();
  TRANSCRIPTION_LOG_INFO("transcription-manager listening",
                         {observability::StringField("bind_address", config.server().bind_address()), observability::StringField("database", BackendName(config)),
                          observability::IntField("workers", config.workers().threads()), observability::IntField("max_message_bytes", max_message_bytes)});

  while (g_running) {
    std::this_thread::sleep_for(std::chrono::milliseconds(250));
  }

  TRANSCRIPTION_LOG_INFO("transcription-manager stopping", {observability::IntField("queued", static_cast<std::int64_t>(app.queue->Depth()))});
  server.Stop();
  app.Shutdown();
}

} // namespace

int main(int argc, char** argv) {
  const auto config_path = ConfigPathFromArgs(argc, argv);
  if (!config_path) {
    std::cerr << "Usage: transcription-manager <config.yaml> | --config <config.yaml>" << std::endl;
    return 1;
  }

  RuntimeConfig config;
  try {
    config = transcription::config::ConfigLoader::LoadFromYaml(*config_path);
  } catch (const std::exception& e) {
    std::cerr << "transcription-manager: " << e.what() << std::endl;
    return 1;
  }

  observability::InitializeLogging(config);
  const bool tracing = observability::InitializeTracing(config);
  const bool metrics = observability::InitializeMetrics(config);
  TRANSCRIPTION_LOG_INFO("observability", {observability::BoolField("tracing", tracing), observability::BoolField("metrics", metrics)});

  int exit_code = 0;
  try {
    Serve(config);
  } catch (const std::exception& e) {
    TRANSCRIPTION_LOG_ERROR("fatal", {observability::StringField("error", e.what())});
    exit_code = 2;
  }

  observability::ShutdownMetrics();
  observability::ShutdownTracing();
  observability::ShutdownLogging();
  return exit_code;
}
