#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"
#include "offline/cache/v1.hpp"

using offline::cache::v1::CacheSnapshot;
using offline::cache::v1::SyncAction;

static void Usage() {
  std::cout << "Usage:\n"
            << "  offline-cache [--config <config.yaml>] <command> [args]\n"
            << "\n"
            << "Commands:\n"
            << "  set <key> <json> [ttl_ms] [type_tag]\n"
            << "  get <key>\n"
            << "  remove <key>\n"
            << "  clear\n"
            << "  keys\n"
            << "  usage\n"
            << "  purge-expired\n"
            << "  remove-type <type_tag>\n"
            << "  enqueue <target> <method> [body] [priority]\n"
            << "  pending\n"
            << "  drain\n"
            << "  export <file>\n"
            << "  import <file>\n";
}

static std::string ToJson(const google::protobuf::Message& message) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json);
  if (!status.ok()) {
    throw std::runtime_error("cannot render JSON: " + std::string(status.message()));
  }
  return json;
}

static std::optional<google::protobuf::Value> ParseJsonValue(const std::string& text) {
  google::protobuf::Value value;
  if (!google::protobuf::util::JsonStringToMessage(text, &value).ok()) {
    return std::nullopt;
  }
  return value;
}

static int Run(offline::cache::OfflineCache& cache, const std::vector<std::string>& args) {
  const std::string& cmd = args[0];

  // ------------------------------------------------------------

  if (cmd == "set") {
    if (args.size() < 3) return 1;

    auto value = ParseJsonValue(args[2]);
    if (!value) {
      std::cerr << "invalid JSON value: " << args[2] << "\n";
      return 1;
    }

    offline::cache::SetOptions options;
    if (args.size() >= 4) options.ttl_ms = std::stoull(args[3]);
    if (args.size() >= 5) options.type_tag = args[4];

    if (!cache.Set(args[1], *value, options)) {
      std::cerr << "set failed\n";
      return 2;
    }
    std::cout << "ok\n";
    return 0;
  }

  if (cmd == "get") {
    if (args.size() < 2) return 1;

    auto value = cache.Get(args[1]);
    if (!value) {
      std::cout << "(miss)\n";
      return 3;
    }
    std::cout << ToJson(*value) << "\n";
    return 0;
  }

  if (cmd == "remove") {
    if (args.size() < 2) return 1;
    cache.Remove(args[1]);
    std::cout << "ok\n";
    return 0;
  }

  if (cmd == "clear") {
    if (!cache.Clear()) {
      std::cerr << "clear failed\n";
      return 2;
    }
    std::cout << "ok\n";
    return 0;
  }

  if (cmd == "keys") {
    for (const auto& key : cache.Keys()) {
      std::cout << key << "\n";
    }
    return 0;
  }

  if (cmd == "usage") {
    const auto usage = cache.Usage();
    std::cout << "records: " << usage.record_count << "\n"
              << "size:    " << usage.formatted << " (" << usage.size_bytes << " bytes)\n"
              << "quota:   " << cache.Options().quota_bytes << " bytes\n";
    return 0;
  }

  if (cmd == "purge-expired") {
    std::cout << "purged " << cache.PurgeExpired() << "\n";
    return 0;
  }

  if (cmd == "remove-type") {
    if (args.size() < 2) return 1;
    std::cout << "removed " << cache.RemoveByType(args[1]) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "enqueue") {
    if (args.size() < 3) return 1;

    SyncAction action;
    action.set_type("http");
    action.set_target(args[1]);
    action.set_method(args[2]);
    if (args.size() >= 4) action.set_body(args[3]);

    std::optional<int32_t> priority;
    if (args.size() >= 5) priority = std::stoi(args[4]);

    std::cout << cache.QueueAction(action, priority) << "\n";
    return 0;
  }

  if (cmd == "pending") {
    for (const auto& item : cache.PendingActions()) {
      std::cout << ToJson(item) << "\n";
    }
    return 0;
  }

  if (cmd == "drain") {
    // No network here: hand each action to stdout and count it delivered.
    auto report = cache.FlushQueue([](const SyncAction& action) {
      std::cout << ToJson(action) << "\n";
      return offline::sync::DeliveryResult::Ok();
    });
    std::cout << "succeeded: " << report.succeeded.size() << " retried: " << report.retried.size()
              << " failed: " << report.permanently_failed.size() << " store errors: " << report.store_errors.size() << "\n";
    return report.permanently_failed.empty() && report.store_errors.empty() ? 0 : 2;
  }

  // ------------------------------------------------------------

  if (cmd == "export") {
    if (args.size() < 2) return 1;

    const auto    snapshot = cache.Export();
    std::ofstream out(args[1], std::ios::binary | std::ios::trunc);
    if (!out || !snapshot.SerializeToOstream(&out)) {
      std::cerr << "cannot write " << args[1] << "\n";
      return 2;
    }
    std::cout << "exported " << snapshot.records_size() << "\n";
    return 0;
  }

  if (cmd == "import") {
    if (args.size() < 2) return 1;

    CacheSnapshot snapshot;
    std::ifstream in(args[1], std::ios::binary);
    if (!in || !snapshot.ParseFromIstream(&in)) {
      std::cerr << "cannot read snapshot " << args[1] << "\n";
      return 2;
    }
    std::cout << "imported " << cache.Import(snapshot) << "\n";
    return 0;
  }

  std::cerr << "unknown command: " << cmd << "\n";
  return 1;
}

int main(int argc, char** argv) {
  std::optional<std::string> config_path;
  std::vector<std::string>   args;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else {
      args.push_back(std::move(arg));
    }
  }

  if (args.empty()) {
    Usage();
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = config_path ? offline::config::ConfigLoader::LoadFromYaml(*config_path) : offline::config::ConfigLoader::Defaults();

    offline::observability::InitializeMetrics(config);
    offline::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build cache (dependency graph)
    // ------------------------------------------------------------
    auto deps = offline::factory::BuildCache(config);

    const int rc = Run(*deps.cache, args);
    if (rc == 1) Usage();

    deps = {};
    offline::observability::ShutdownLogging();
    offline::observability::ShutdownMetrics();
    return rc;
  } catch (const std::exception& e) {
    OFFLINE_LOG_ERROR("Fatal error", {offline::observability::StringField("error", e.what())});
    std::cerr << "error: " << e.what() << "\n";
    offline::observability::ShutdownLogging();
    offline::observability::ShutdownMetrics();
    return 2;
  }
}
