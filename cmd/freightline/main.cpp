#include <cstdint>
#include <fstream>
#include <iostream>
#include <map>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/telemetry/raw_telemetry.hpp"
#include "internal/token/metadata.hpp"
#include "internal/util/errors.hpp"

using freightline::observability::IntField;
using freightline::observability::StringField;

static void Usage() {
  std::cerr << "Usage:\n"
            << "  freightline --config <config.yaml> --input <samples.jsonl>\n"
            << "              [--shipment <id> --origin <origin> --destination <destination> --carrier <carrier_id>]\n"
            << "  freightline --config <config.yaml> --list <shipment_id>\n";
}

// --key value pairs only; returns false on a dangling or unknown flag.
static bool ParseArgs(int argc, char** argv, std::map<std::string, std::string>* args) {
  static const char* kKnown[] = {"--config", "--input", "--shipment", "--origin", "--destination", "--carrier", "--list"};
  for (int i = 1; i < argc; i += 2) {
    const std::string key = argv[i];
    bool              known = false;
    for (const char* k : kKnown) known = known || key == k;
    if (!known || i + 1 >= argc) return false;
    (*args)[key] = argv[i + 1];
  }
  return args->contains("--config") && (args->contains("--input") || args->contains("--list"));
}

// Creates the ST-01 root for --shipment unless it already exists.
static void EnsureShipment(freightline::factory::RuntimeDependencies& deps, const std::map<std::string, std::string>& args, bool persist) {
  const auto& shipment_id = args.at("--shipment");
  if (deps.index->Contains(shipment_id)) {
    FREIGHTLINE_LOG_INFO("shipment already registered", {StringField("shipment_id", shipment_id)});
    return;
  }

  freightline::token::Metadata metadata;
  freightline::token::SetString(metadata, "origin", args.contains("--origin") ? args.at("--origin") : "");
  freightline::token::SetString(metadata, "destination", args.contains("--destination") ? args.at("--destination") : "");
  freightline::token::SetString(metadata, "carrier_id", args.contains("--carrier") ? args.at("--carrier") : "");

  auto root = deps.token_factory->CreateToken("ST-01", shipment_id, metadata, {});
  if (persist) {
    deps.registry->Persist(root);
  }
  FREIGHTLINE_LOG_INFO("shipment registered", {StringField("shipment_id", root.id())});
}

static int Replay(freightline::factory::RuntimeDependencies& deps, const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    FREIGHTLINE_LOG_ERROR("cannot open input", {StringField("path", path)});
    return 2;
  }

  std::int64_t line_no = 0, accepted = 0, rejected = 0, tokens = 0, flags = 0;
  std::string  line;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.find_first_not_of(" \t\r") == std::string::npos) continue;

    freightline::telemetry::RawTelemetry raw;
    try {
      raw = freightline::telemetry::ParseJson(line);
    } catch (const freightline::util::MalformedTelemetryError& e) {
      ++rejected;
      FREIGHTLINE_LOG_WARN("unparseable sample", {IntField("line", line_no), StringField("reason", e.what())});
      continue;
    }

    auto result = deps.pipeline->Process(raw);
    if (!result.ok()) {
      ++rejected;
      continue;
    }
    ++accepted;
    flags += static_cast<std::int64_t>(result.flags.size());
    for (const auto& outcome : result.tokens) {
      if (outcome.ok()) ++tokens;
    }
  }

  FREIGHTLINE_LOG_INFO("replay finished", {StringField("input", path), IntField("accepted", accepted), IntField("rejected", rejected),
                                           IntField("flags", flags), IntField("tokens", tokens)});
  return 0;
}

static int List(freightline::factory::RuntimeDependencies& deps, const std::string& shipment_id) {
  for (const auto& token : deps.registry->LoadShipment(shipment_id)) {
    std::cout << token.id() << ' ' << freightline::token::ToString(token.type()) << ' ' << freightline::token::ToString(token.state())
              << ' ' << freightline::token::MetadataToJson(token.metadata()) << '\n';
  }
  return 0;
}

int main(int argc, char** argv) {
  std::map<std::string, std::string> args;
  if (!ParseArgs(argc, argv, &args)) {
    Usage();
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = freightline::config::ConfigLoader::LoadFromYaml(args.at("--config"));
    freightline::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build pipeline (dependency graph)
    // ------------------------------------------------------------
    auto deps = freightline::factory::BuildRuntime(config);

    int rc = 0;
    if (args.contains("--list")) {
      rc = List(deps, args.at("--list"));
    } else {
      if (args.contains("--shipment")) {
        EnsureShipment(deps, args, config.pipeline().persist_tokens());
      }
      rc = Replay(deps, args.at("--input"));
    }

    freightline::observability::ShutdownLogging();
    return rc;
  } catch (const freightline::util::Error& e) {
    FREIGHTLINE_LOG_ERROR("Fatal error", {StringField("kind", freightline::util::ToString(e.Kind())), StringField("error", e.what())});
    freightline::observability::ShutdownLogging();
    return 2;
  } catch (const std::exception& e) {
    FREIGHTLINE_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    freightline::observability::ShutdownLogging();
    return 2;
  }
}
