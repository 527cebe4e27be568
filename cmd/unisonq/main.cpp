#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/queue/payload.hpp"
#include "internal/util/parse.hpp"

using unison::observability::StringField;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void Usage() {
  std::cout << "Usage:\n"
            << "  unisonq [--config <config.yaml>] enqueue <queue> <json>\n"
            << "  unisonq [--config <config.yaml>] dequeue <queue> [vt_sec]\n"
            << "  unisonq [--config <config.yaml>] archive <queue> <msg_id>\n"
            << "  unisonq [--config <config.yaml>] retry <queue> <msg_id> <json>\n"
            << "  unisonq [--config <config.yaml>] dlq <queue> <msg_id> <json> <error>\n"
            << "  unisonq [--config <config.yaml>] drop <queue>\n"
            << "  unisonq [--config <config.yaml>] length <queue>\n"
            << "  unisonq [--config <config.yaml>] list\n"
            << "  unisonq [--config <config.yaml>] work [queue...]\n";
}

static int64_t ParseMsgId(const std::string& value) {
  return unison::util::ParsePositiveInt("msg_id", value);
}

static std::chrono::seconds ParseLease(const std::string& value) {
  return std::chrono::seconds(unison::util::ParsePositiveInt("vt_sec", value));
}

static void Shutdown() {
  unison::observability::ShutdownLogging();
  unison::observability::ShutdownMetrics();
  unison::observability::ShutdownTracing();
}

static int Work(const unison::factory::Runtime& runtime, unison::runtime::config::RuntimeConfig config,
                const std::vector<std::string>& queues) {
  if (!queues.empty()) {
    config.mutable_worker()->clear_queues();
    for (const auto& queue : queues) {
      config.mutable_worker()->add_queues(queue);
    }
  }
  if (config.worker().queues().empty()) {
    std::cerr << "work: no queues given and worker.queues is empty\n";
    return 1;
  }

  // Echo handler: logs the payload and completes it.
  unison::queue::Handler handler = [](const unison::queue::Payload& payload) {
    UNISON_LOG_INFO("processing message", {StringField("payload", unison::queue::SerializePayload(payload))});
    google::protobuf::Value result;
    result.set_null_value(google::protobuf::NULL_VALUE);
    return result;
  };

  auto workers = unison::factory::BuildWorkers(runtime, config, handler);

  // Register signal handlers before starting workers to avoid race window.
  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);

  for (auto& worker : workers) {
    worker->Start();
  }

  while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(200));

  UNISON_LOG_INFO("Shutting down workers");
  for (auto& worker : workers) {
    worker->Stop();
  }
  return 0;
}

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);

  std::string config_path;
  if (args.size() >= 2 && args[0] == "--config") {
    config_path = args[1];
    args.erase(args.begin(), args.begin() + 2);
  }
  if (args.empty()) {
    Usage();
    return 1;
  }

  const std::string cmd = args[0];

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    unison::runtime::config::RuntimeConfig config;
    if (!config_path.empty()) {
      config = unison::config::ConfigLoader::LoadFromYaml(config_path);
    }
    unison::config::ConfigLoader::ApplyEnvironment(config);

    unison::observability::InitializeTracing(config);
    unison::observability::InitializeMetrics(config);
    unison::observability::InitializeLogging(config);

    auto  runtime = unison::factory::Build(config);
    auto& client  = *runtime.client;

    // ------------------------------------------------------------

    if (cmd == "enqueue" && args.size() == 3) {
      std::cout << client.Enqueue(args[1], unison::queue::ParsePayload(args[2])) << "\n";
    } else if (cmd == "dequeue" && (args.size() == 2 || args.size() == 3)) {
      auto message = args.size() == 3 ? client.Dequeue(args[1], ParseLease(args[2]))
                                      : client.Dequeue(args[1]);
      if (!message) {
        std::cout << "empty\n";
      } else {
        std::cout << "msg_id=" << message->msg_id << " read_count=" << message->read_count
                  << " payload=" << unison::queue::SerializePayload(message->payload) << "\n";
      }
    } else if (cmd == "archive" && args.size() == 3) {
      std::cout << (client.Archive(args[1], ParseMsgId(args[2])) ? "archived" : "not found") << "\n";
    } else if (cmd == "retry" && args.size() == 4) {
      std::cout << client.RetryMessage(args[1], ParseMsgId(args[2]), unison::queue::ParsePayload(args[3])) << "\n";
    } else if (cmd == "dlq" && args.size() == 5) {
      std::cout << client.MoveToDlq(args[1], ParseMsgId(args[2]), unison::queue::ParsePayload(args[3]), args[4]) << "\n";
    } else if (cmd == "drop" && args.size() == 2) {
      std::cout << (client.DeleteQueue(args[1]) ? "dropped" : "not found") << "\n";
    } else if (cmd == "length" && args.size() == 2) {
      std::cout << client.QueueLength(args[1]) << "\n";
    } else if (cmd == "list" && args.size() == 1) {
      for (const auto& queue : client.ListQueues()) {
        std::cout << queue << "\n";
      }
    } else if (cmd == "work") {
      const int rc = Work(runtime, config, {args.begin() + 1, args.end()});
      Shutdown();
      return rc;
    } else {
      Usage();
      Shutdown();
      return 1;
    }

    Shutdown();
  } catch (const std::exception& e) {
    UNISON_LOG_ERROR("Fatal error", {StringField("command", cmd), StringField("error", e.what())});
    std::cerr << e.what() << "\n";
    Shutdown();
    return 2;
  }

  return 0;
}
