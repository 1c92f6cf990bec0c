#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "devices/device.hpp"

namespace ov_bench::core {
namespace {

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string unquote(const std::string& value) {
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool parse_bool(const std::string& value) {
  const std::string lower = [&value]() {
    std::string out;
    out.reserve(value.size());
    for (const char c : value) {
      out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
  }();

  return lower == "true" || lower == "yes" || lower == "on" || lower == "1";
}

long long parse_integer(const std::string& key, const std::string& value, const long long min_value, const long long max_value) {
  long long parsed = 0;
  std::size_t consumed = 0;
  try {
    parsed = std::stoll(value, &consumed);
  } catch (const std::exception&) {
    throw std::runtime_error(key + " must be an integer, got '" + value + "'");
  }
  if (consumed != value.size()) {
    throw std::runtime_error(key + " must be an integer, got '" + value + "'");
  }
  if (parsed < min_value || parsed > max_value) {
    throw std::runtime_error(key + " must be in range " + std::to_string(min_value) + ".." + std::to_string(max_value));
  }
  return parsed;
}

std::uint32_t parse_u32(const std::string& key, const std::string& value, const long long min_value = 0) {
  return static_cast<std::uint32_t>(parse_integer(key, value, min_value, 0xFFFFFFFFLL));
}

std::vector<std::string> parse_list(const std::string& value) {
  std::string body = value;
  if (!body.empty() && body.front() == '[') {
    if (body.back() != ']') {
      throw std::runtime_error("unterminated list: " + value);
    }
    body = body.substr(1, body.size() - 2);
  }

  std::vector<std::string> items;
  std::istringstream input(body);
  std::string item;
  while (std::getline(input, item, ',')) {
    const std::string cleaned = unquote(trim(item));
    if (!cleaned.empty()) {
      items.push_back(cleaned);
    }
  }
  return items;
}

std::vector<std::uint32_t> parse_u32_list(const std::string& key, const std::string& value) {
  std::vector<std::uint32_t> out;
  for (const auto& item : parse_list(value)) {
    out.push_back(parse_u32(key, item, 1));
  }
  return out;
}

model::device_target& find_or_add_device(BenchConfig& config, const std::string& id) {
  for (auto& device : config.devices) {
    if (device.id == id) {
      return device;
    }
  }
  model::device_target target{};
  target.id = id;
  config.devices.push_back(target);
  return config.devices.back();
}

ModelConfig& find_or_add_model(BenchConfig& config, const std::string& name) {
  for (auto& model : config.models) {
    if (model.name == name) {
      return model;
    }
  }
  ModelConfig model{};
  model.name = name;
  config.models.push_back(model);
  return config.models.back();
}

void apply_device_key(BenchConfig& config, const std::string& key, const std::string& id, const std::string& field,
                      const std::string& value) {
  auto& device = find_or_add_device(config, id);

  if (field == "kind") {
    if (value == "adb" || value == "android") {
      device.kind = model::device_kind::ADB;
    } else if (value == "ssh" || value == "linux_ssh") {
      device.kind = model::device_kind::SSH;
    } else {
      throw std::runtime_error(key + " must be one of adb, ssh");
    }
    return;
  }
  if (field == "serial") {
    device.serial = value;
    return;
  }
  if (field == "host") {
    device.host = value;
    return;
  }
  if (field == "user") {
    device.user = value;
    return;
  }
  if (field == "port") {
    device.port = static_cast<std::uint16_t>(parse_integer(key, value, 1, 65535));
    return;
  }
  if (field == "key_path") {
    device.key_path = value;
    return;
  }
  if (field == "push_dir") {
    device.push_dir = value;
    return;
  }
  if (field == "use_root") {
    device.use_root = parse_bool(value);
    return;
  }

  throw std::runtime_error("unknown config key: " + key);
}

void apply_model_key(BenchConfig& config, const std::string& key, const std::string& name, const std::string& field,
                     const std::string& value) {
  auto& model = find_or_add_model(config, name);

  if (field == "path") {
    if (value.size() < 4 || value.compare(value.size() - 4, 4, ".xml") != 0) {
      throw std::runtime_error(key + " must point to an IR .xml file");
    }
    model.path = value;
    return;
  }
  if (field == "inputs") {
    model.inputs = parse_list(value);
    return;
  }
  throw std::runtime_error("unknown config key: " + key);
}

void apply_redis_address(RedisConfig& redis, const std::string& value) {
  redis.enabled = !value.empty();
  if (value.rfind("unix://", 0) == 0) {
    redis.unix_socket = value.substr(std::string("unix://").size());
    redis.host.clear();
    redis.port = 0;
    return;
  }

  if (!value.empty() && value.front() == '/') {
    redis.unix_socket = value;
    redis.host.clear();
    redis.port = 0;
    return;
  }

  redis.unix_socket.clear();
  const auto split = value.find(':');
  if (split == std::string::npos) {
    redis.host = value;
    return;
  }

  redis.host = value.substr(0, split);
  redis.port = static_cast<std::uint16_t>(parse_integer("report.redis.address port", value.substr(split + 1), 1, 65535));
}

void apply_key_value(BenchConfig& config, const std::string& key, const std::string& raw_value) {
  const std::string value = unquote(raw_value);

  if (key == "project.name") {
    config.project_name = value;
    return;
  }
  if (key == "project.run_id") {
    config.run_id = value;
    return;
  }
  if (key == "bundle.root") {
    config.bundle_root = value;
    return;
  }
  if (key == "bundle.executable") {
    config.executable = value;
    return;
  }
  if (key == "artifacts_dir") {
    config.artifacts_dir = value;
    return;
  }

  if (key.rfind("devices.", 0) == 0 || key.rfind("models.", 0) == 0) {
    const auto first_dot = key.find('.');
    const auto second_dot = key.find('.', first_dot + 1);
    if (second_dot == std::string::npos) {
      throw std::runtime_error(key + " must be a section");
    }
    const std::string name = key.substr(first_dot + 1, second_dot - first_dot - 1);
    const std::string field = key.substr(second_dot + 1);
    if (key.front() == 'd') {
      apply_device_key(config, key, name, field, value);
    } else {
      apply_model_key(config, key, name, field, value);
    }
    return;
  }

  if (key == "matrix.devices") {
    config.matrix.devices = parse_list(value);
    return;
  }
  if (key == "matrix.models") {
    config.matrix.models = parse_list(value);
    return;
  }
  if (key == "matrix.threads") {
    config.matrix.threads = parse_u32_list(key, value);
    return;
  }
  if (key == "matrix.streams") {
    config.matrix.streams = parse_u32_list(key, value);
    return;
  }
  if (key == "matrix.precisions") {
    config.matrix.precisions = parse_list(value);
    return;
  }
  if (key == "matrix.batches") {
    config.matrix.batches = parse_u32_list(key, value);
    return;
  }
  if (key == "matrix.repeats") {
    config.matrix.repeats = parse_u32(key, value, 1);
    return;
  }

  if (key == "run.timeout_sec") {
    config.run.timeout = std::chrono::seconds(parse_integer(key, value, 1, 7 * 24 * 3600));
    return;
  }
  if (key == "run.max_attempts") {
    config.run.max_attempts = parse_u32(key, value, 1);
    if (config.run.max_attempts > 100) {
      throw std::runtime_error("run.max_attempts must be less than or equal to 100");
    }
    return;
  }
  if (key == "run.backoff_initial_ms") {
    config.run.backoff_initial = std::chrono::milliseconds(parse_integer(key, value, 0, 3600000));
    return;
  }
  if (key == "run.backoff_max_ms") {
    config.run.backoff_max = std::chrono::milliseconds(parse_integer(key, value, 0, 3600000));
    return;
  }
  if (key == "run.cooldown_sec") {
    config.run.cooldown = std::chrono::seconds(parse_integer(key, value, 0, 3600));
    return;
  }
  if (key == "run.max_concurrency") {
    config.run.max_concurrency = static_cast<std::size_t>(parse_integer(key, value, 0, 1024));
    return;
  }
  if (key == "run.tune_devices") {
    config.run.tune_devices = parse_bool(value);
    return;
  }
  if (key == "run.warmup") {
    config.run.warmup = parse_bool(value);
    return;
  }
  if (key == "run.api") {
    if (value != "sync" && value != "async") {
      throw std::runtime_error("run.api must be sync or async");
    }
    config.run.api = value;
    return;
  }
  if (key == "run.niter") {
    config.run.niter = parse_u32(key, value, 1);
    return;
  }
  if (key == "run.nireq") {
    config.run.nireq = parse_u32(key, value, 1);
    return;
  }
  if (key == "run.inference_device") {
    config.run.inference_device = value;
    return;
  }
  if (key == "run.measure_resources") {
    config.run.measure_resources = parse_bool(value);
    return;
  }
  if (key == "run.time_binary") {
    config.run.time_binary = value;
    return;
  }
  if (key == "run.collect_device_reports") {
    config.run.collect_device_reports = parse_bool(value);
    return;
  }
  if (key == "run.transfer_timeout_sec") {
    config.run.transfer_timeout = std::chrono::seconds(parse_integer(key, value, 1, 24 * 3600));
    return;
  }

  if (key == "report.json") {
    config.report.json_path = value;
    return;
  }
  if (key == "report.csv") {
    config.report.csv_path = value;
    return;
  }
  if (key == "report.stdout") {
    config.report.stdout_summary = parse_bool(value);
    return;
  }
  if (key == "report.summary") {
    config.report.summary = parse_bool(value);
    return;
  }
  if (key == "report.include_raw") {
    config.report.include_raw = parse_bool(value);
    return;
  }
  if (key == "report.redis.address") {
    apply_redis_address(config.report.redis, value);
    return;
  }
  if (key == "report.redis.key_prefix") {
    config.report.redis.key_prefix = value;
    return;
  }

  throw std::runtime_error("unknown config key: " + key);
}

void validate(BenchConfig& config) {
  if (config.bundle_root.empty()) {
    throw std::runtime_error("bundle.root is required");
  }
  if (config.devices.empty()) {
    throw std::runtime_error("at least one device must be configured under devices");
  }
  if (config.models.empty()) {
    throw std::runtime_error("at least one model must be configured under models");
  }

  for (auto& device : config.devices) {
    if (device.kind == model::device_kind::ADB && device.serial.empty()) {
      throw std::runtime_error("devices." + device.id + ".serial is required for adb devices");
    }
    if (device.kind == model::device_kind::SSH && device.host.empty()) {
      throw std::runtime_error("devices." + device.id + ".host is required for ssh devices");
    }
    if (device.push_dir.empty()) {
      device.push_dir = devices::default_push_dir(device.kind);
    }
    if (device.push_dir.front() != '/') {
      throw std::runtime_error("devices." + device.id + ".push_dir must be an absolute path");
    }
  }

  for (const auto& model : config.models) {
    if (model.path.empty()) {
      throw std::runtime_error("models." + model.name + ".path is required");
    }
  }

  if (config.run.backoff_max < config.run.backoff_initial) {
    throw std::runtime_error("run.backoff_max_ms must be greater than or equal to run.backoff_initial_ms");
  }
}

}  // namespace

BenchConfig parse_bench_config(const std::string& text) {
  BenchConfig config{};

  std::istringstream input(text);
  std::vector<std::string> sections;
  std::string line;
  while (std::getline(input, line)) {
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.erase(comment_pos);
    }

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = trim(stripped.substr(colon_pos + 1));

    if (sections.size() > depth) {
      sections.resize(depth);
    }

    if (value.empty()) {
      if (sections.size() == depth) {
        sections.push_back(key);
      } else {
        sections.resize(depth);
        sections.push_back(key);
      }
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    apply_key_value(config, full_key.str(), value);
  }

  validate(config);
  return config;
}

BenchConfig load_bench_config(const std::string& path) {
  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }

  std::ostringstream text;
  text << input.rdbuf();
  return parse_bench_config(text.str());
}

}  // namespace ov_bench::core
