#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <sys/stat.h>
#include <unistd.h>

#include "core/errors.hpp"
#include "core/log.hpp"
#include "devices/adb_device.hpp"
#include "devices/device.hpp"
#include "devices/device_pool.hpp"
#include "devices/probe.hpp"
#include "devices/ssh_device.hpp"
#include "devices/stub_device.hpp"

using ov_bench::core::BenchError;
using ov_bench::core::ErrorKind;
using ov_bench::core::Logger;
using ov_bench::devices::AdbDevice;
using ov_bench::devices::Device;
using ov_bench::devices::DeviceOptions;
using ov_bench::devices::DevicePool;
using ov_bench::devices::SshDevice;
using ov_bench::devices::StubDevice;
using ov_bench::model::device_health;
using ov_bench::model::device_kind;
using ov_bench::model::device_target;

namespace {

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

std::filesystem::path scratch_root() {
  static const auto root = [] {
    auto dir = std::filesystem::temp_directory_path() / ("ov_bench_devices_" + std::to_string(::getpid()));
    std::filesystem::create_directories(dir);
    return dir;
  }();
  return root;
}

std::string write_script(const std::string& name, const std::string& body) {
  const auto path = scratch_root() / name;
  {
    std::ofstream out(path);
    out << "#!/bin/sh\n" << body;
  }
  ::chmod(path.c_str(), 0755);
  return path.string();
}

device_target adb_target(const std::string& serial) {
  device_target target{};
  target.id = "phone";
  target.kind = device_kind::ADB;
  target.serial = serial;
  target.push_dir = "/data/local/tmp/ov-bench";
  return target;
}

device_target ssh_target() {
  device_target target{};
  target.id = "board";
  target.kind = device_kind::SSH;
  target.host = "10.0.0.9";
  target.user = "ci";
  target.port = 2222;
  target.push_dir = "/tmp/ov-bench";
  return target;
}

template <typename Fn>
bool throws_kind(Fn&& fn, const ErrorKind kind) {
  try {
    fn();
  } catch (const BenchError& ex) {
    return ex.kind() == kind;
  }
  return false;
}

int test_probe_parsers() {
  const auto props = ov_bench::devices::parse_getprop(
      "[ro.product.model]: [Pixel 7]\n[ro.build.version.release]: [14]\nnoise line\n[empty]: []\n");
  if (props.at("ro.product.model") != "Pixel 7" || props.at("ro.build.version.release") != "14") {
    return fail("test_probe_parsers", "getprop lines should map key to value");
  }

  const auto mem = ov_bench::devices::parse_meminfo_total_gb("MemTotal:        8388608 kB\nMemFree: 1 kB\n");
  if (!mem || *mem < 7.99 || *mem > 8.01) {
    return fail("test_probe_parsers", "MemTotal should convert to GiB");
  }
  if (ov_bench::devices::parse_meminfo_total_gb("garbage")) {
    return fail("test_probe_parsers", "missing MemTotal should yield nullopt");
  }

  if (ov_bench::devices::parse_cpuinfo_model("processor\t: 0\nHardware\t: Qualcomm SM8550\n") != "Qualcomm SM8550") {
    return fail("test_probe_parsers", "Hardware line should be used for cpu");
  }
  if (ov_bench::devices::parse_cpuinfo_model("model name\t: Cortex-A76\n") != "Cortex-A76") {
    return fail("test_probe_parsers", "model name line should be used for cpu");
  }

  const auto temp = ov_bench::devices::parse_thermal_zone_c("42500\n");
  if (!temp || *temp != 42.5) {
    return fail("test_probe_parsers", "thermal zone millidegrees should convert to celsius");
  }
  return 0;
}

int test_adb_shell_argv_quoting() {
  DeviceOptions options{};
  AdbDevice device(adb_target("R5CT"), options);
  const auto argv = device.shell_argv({"ls", "/data/local/tmp/my model's dir"});
  const std::vector<std::string> expected = {"adb", "-s", "R5CT", "shell", "'ls' '/data/local/tmp/my model'\\''s dir'"};
  if (argv != expected) {
    return fail("test_adb_shell_argv_quoting", "adb shell argv should carry one quoted remote command");
  }

  auto root_target = adb_target("R5CT");
  root_target.use_root = true;
  AdbDevice root_device(root_target, options);
  const auto root_argv = root_device.shell_argv({"id"});
  if (root_argv.back() != "su -c ''\\''id'\\'''") {
    return fail("test_adb_shell_argv_quoting", "use_root should wrap the command in su -c");
  }
  return 0;
}

int test_ssh_argv_and_path_validation() {
  DeviceOptions options{};
  auto target = ssh_target();
  target.key_path = "/keys/id_ed25519";
  SshDevice device(target, options);

  const auto argv = device.shell_argv({"uname", "-a"});
  if (argv.front() != "ssh" || argv[1] != "-p" || argv[2] != "2222" || argv[argv.size() - 2] != "ci@10.0.0.9" ||
      argv.back() != "'uname' '-a'") {
    return fail("test_ssh_argv_and_path_validation", "ssh argv layout mismatch");
  }
  bool has_batch = false;
  bool has_key = false;
  for (std::size_t i = 0; i + 1 < argv.size(); ++i) {
    has_batch = has_batch || (argv[i] == "-o" && argv[i + 1] == "BatchMode=yes");
    has_key = has_key || (argv[i] == "-i" && argv[i + 1] == "/keys/id_ed25519");
  }
  if (!has_batch || !has_key) {
    return fail("test_ssh_argv_and_path_validation", "ssh must run non-interactively with the configured key");
  }

  const auto scp = device.scp_argv("/local/model.xml", "ci@10.0.0.9:/tmp/ov-bench/models/model.xml");
  if (scp.front() != "scp" || scp[1] != "-P" || scp[2] != "2222" || scp.back() != "ci@10.0.0.9:/tmp/ov-bench/models/model.xml") {
    return fail("test_ssh_argv_and_path_validation", "scp argv layout mismatch");
  }

  if (!ov_bench::devices::is_safe_remote_path("/tmp/ov-bench/scratch/12/input_0.bin") ||
      ov_bench::devices::is_safe_remote_path("/tmp/x;rm -rf /") ||
      ov_bench::devices::is_safe_remote_path("/tmp/$(id)")) {
    return fail("test_ssh_argv_and_path_validation", "remote path validation mismatch");
  }

  bool rejected = false;
  try {
    device.push("/local/a.bin", "/tmp/ov bench/a.bin");
  } catch (const std::invalid_argument&) {
    rejected = true;
  }
  if (!rejected) {
    return fail("test_ssh_argv_and_path_validation", "unsafe scp destination should be rejected before spawning");
  }
  return 0;
}

int test_adb_transport_failure_is_unreachable() {
  DeviceOptions options{};
  options.adb_executable =
      write_script("adb-missing", "echo \"error: device 'R5CT' not found\" >&2\nexit 1\n");
  options.control_timeout = std::chrono::seconds(5);
  AdbDevice device(adb_target("R5CT"), options);

  if (!throws_kind([&] { (void)device.shell({"true"}, std::chrono::seconds(5)); }, ErrorKind::DeviceUnreachable)) {
    return fail("test_adb_transport_failure_is_unreachable", "adb transport error should classify as unreachable");
  }
  if (!throws_kind([&] { (void)device.info(); }, ErrorKind::DeviceUnreachable)) {
    return fail("test_adb_transport_failure_is_unreachable", "probe through a lost adb transport should fail");
  }
  if (!throws_kind([&] { device.push("/tmp/a", "/data/local/tmp/a"); }, ErrorKind::DeviceUnreachable)) {
    return fail("test_adb_transport_failure_is_unreachable", "push through a lost adb transport should fail");
  }

  DeviceOptions missing{};
  missing.adb_executable = (scratch_root() / "no-such-adb").string();
  AdbDevice no_client(adb_target("R5CT"), missing);
  if (!throws_kind([&] { (void)no_client.shell({"true"}, std::chrono::seconds(5)); }, ErrorKind::DeviceUnreachable)) {
    return fail("test_adb_transport_failure_is_unreachable", "missing adb client should classify as unreachable");
  }
  return 0;
}

int test_adb_shell_through_fake_client() {
  DeviceOptions options{};
  options.adb_executable = write_script("adb-local",
                                        "shift 2\n"
                                        "if [ \"$1\" = shell ]; then\n"
                                        "  shift\n"
                                        "  exec sh -c \"$1\"\n"
                                        "fi\n"
                                        "echo unsupported >&2\n"
                                        "exit 1\n");
  options.control_timeout = std::chrono::seconds(5);
  AdbDevice device(adb_target("R5CT"), options);

  const auto present = scratch_root() / "present file";
  std::ofstream(present) << "x";
  if (!device.exists(present.string()) || device.exists((scratch_root() / "absent").string())) {
    return fail("test_adb_shell_through_fake_client", "exists should map test -e exit codes");
  }

  const auto result = device.shell({"sh", "-c", "echo benchmark; exit 4"}, std::chrono::seconds(5));
  if (result.exit_code != 4 || result.stdout_text != "benchmark\n") {
    return fail("test_adb_shell_through_fake_client", "remote exit code and output should pass through");
  }

  const auto dir = scratch_root() / "adb-mkdir" / "nested";
  device.mkdir(dir.string());
  if (!std::filesystem::is_directory(dir)) {
    return fail("test_adb_shell_through_fake_client", "mkdir should create nested directories");
  }
  device.remove((scratch_root() / "adb-mkdir").string());
  if (std::filesystem::exists(dir)) {
    return fail("test_adb_shell_through_fake_client", "remove should delete recursively");
  }

  if (!throws_kind([&] { (void)device.shell({"sleep", "5"}, std::chrono::milliseconds(200)); }, ErrorKind::Timeout)) {
    return fail("test_adb_shell_through_fake_client", "shell timeout should raise Timeout");
  }
  return 0;
}

int test_ssh_transport_failure_is_unreachable() {
  DeviceOptions options{};
  options.ssh_executable = write_script(
      "ssh-refused", "echo 'ssh: connect to host 10.0.0.9 port 2222: Connection refused' >&2\nexit 255\n");
  options.scp_executable = write_script("scp-refused", "echo 'lost connection' >&2\nexit 255\n");
  SshDevice device(ssh_target(), options);

  if (!throws_kind([&] { (void)device.shell({"true"}, std::chrono::seconds(5)); }, ErrorKind::DeviceUnreachable)) {
    return fail("test_ssh_transport_failure_is_unreachable", "ssh exit 255 should classify as unreachable");
  }
  if (!throws_kind([&] { device.push("/tmp/model.xml", "/tmp/ov-bench/models/model.xml"); },
                   ErrorKind::DeviceUnreachable)) {
    return fail("test_ssh_transport_failure_is_unreachable", "scp failure should classify as unreachable");
  }

  DeviceOptions local{};
  local.ssh_executable = write_script("ssh-local", "for last; do :; done\nexec sh -c \"$last\"\n");
  SshDevice reachable(ssh_target(), local);
  const auto missing_binary = reachable.shell({"ov-bench-no-such-binary"}, std::chrono::seconds(5));
  if (missing_binary.exit_code != 127) {
    return fail("test_ssh_transport_failure_is_unreachable", "remote command-not-found is a process result");
  }
  const auto normal = reachable.shell({"sh", "-c", "exit 7"}, std::chrono::seconds(5));
  if (normal.exit_code != 7) {
    return fail("test_ssh_transport_failure_is_unreachable", "remote exit code should pass through");
  }
  return 0;
}

int test_stub_device_filesystem() {
  StubDevice stub("stub");
  stub.mkdir("/root/scratch/1");
  stub.push("/local/in.bin", "/root/scratch/1/in.bin");
  stub.mkdir("/root/scratch/10");
  stub.push("/local/m.xml", "/root/scratch-x");

  if (!stub.exists("/root/scratch") || !stub.exists("/root/scratch/1/in.bin") || stub.exists("/root/scratch/2")) {
    return fail("test_stub_device_filesystem", "exists should see parents of stored paths");
  }

  stub.remove("/root/scratch/1");
  if (stub.has_path("/root/scratch/1/in.bin") || !stub.has_path("/root/scratch/10") || !stub.has_path("/root/scratch-x")) {
    return fail("test_stub_device_filesystem", "remove should delete only the subtree");
  }

  stub.set_read_only(true);
  if (!throws_kind([&] { stub.mkdir("/root/other"); }, ErrorKind::ProcessError)) {
    return fail("test_stub_device_filesystem", "read-only mkdir should be a process error");
  }

  stub.set_reachable(false);
  if (!throws_kind([&] { (void)stub.info(); }, ErrorKind::DeviceUnreachable)) {
    return fail("test_stub_device_filesystem", "unreachable stub should fail every call");
  }
  return 0;
}

struct StubFarm {
  std::map<std::string, StubDevice*> stubs{};
  std::set<std::string> unreachable{};
  std::atomic<int> created{0};

  DevicePool::Factory factory() {
    return [this](const device_target& target) -> std::unique_ptr<Device> {
      auto stub = std::make_unique<StubDevice>(target.id);
      if (unreachable.count(target.id) != 0) {
        stub->set_reachable(false);
      }
      stubs[target.id] = stub.get();
      created.fetch_add(1);
      return stub;
    };
  }
};

std::vector<device_target> two_targets() {
  auto a = adb_target("A");
  a.id = "a";
  auto b = ssh_target();
  b.id = "b";
  return {a, b};
}

int test_pool_resolves_lazily_and_tracks_health() {
  std::ostringstream log;
  Logger logger(log);
  StubFarm farm;
  farm.unreachable.insert("b");
  DevicePool pool(two_targets(), farm.factory(), logger);

  if (farm.created.load() != 0 || pool.health("a") != device_health::UNKNOWN) {
    return fail("test_pool_resolves_lazily_and_tracks_health", "pool must not connect before first use");
  }

  Device& a = pool.resolve("a");
  if (a.id() != "a" || pool.health("a") != device_health::REACHABLE || farm.stubs["a"]->info_calls() != 1) {
    return fail("test_pool_resolves_lazily_and_tracks_health", "resolve should probe exactly once");
  }
  if (pool.last_info("a").model != "stub-device" || !pool.last_info("b").model.empty()) {
    return fail("test_pool_resolves_lazily_and_tracks_health", "last_info should hold the probed snapshot");
  }
  (void)pool.resolve("a");
  if (farm.created.load() != 1) {
    return fail("test_pool_resolves_lazily_and_tracks_health", "handle should be constructed once per device");
  }

  if (!throws_kind([&] { (void)pool.resolve("b"); }, ErrorKind::DeviceUnreachable) ||
      pool.health("b") != device_health::UNREACHABLE) {
    return fail("test_pool_resolves_lazily_and_tracks_health", "failed probe should mark the device unreachable");
  }
  if (log.str().find("[pool] warning: device b unreachable") == std::string::npos) {
    return fail("test_pool_resolves_lazily_and_tracks_health", "health change should be logged");
  }

  farm.stubs["b"]->set_reachable(true);
  (void)pool.resolve("b");
  if (pool.health("b") != device_health::REACHABLE) {
    return fail("test_pool_resolves_lazily_and_tracks_health", "later probe should report recovery");
  }

  if (!throws_kind([&] { (void)pool.acquire("missing"); }, ErrorKind::DeviceNotFound)) {
    return fail("test_pool_resolves_lazily_and_tracks_health", "unknown id should be DeviceNotFound");
  }

  const auto snapshot = pool.health_snapshot();
  if (snapshot.size() != 2 || pool.ids() != std::vector<std::string>{"a", "b"}) {
    return fail("test_pool_resolves_lazily_and_tracks_health", "snapshot/ids should list every device");
  }

  bool duplicate_threw = false;
  try {
    auto targets = two_targets();
    targets[1].id = "a";
    DevicePool duplicate(targets, farm.factory(), logger);
  } catch (const std::invalid_argument&) {
    duplicate_threw = true;
  }
  if (!duplicate_threw) {
    return fail("test_pool_resolves_lazily_and_tracks_health", "duplicate ids should be rejected");
  }
  return 0;
}

int test_pool_lease_is_exclusive_per_device() {
  std::ostringstream log;
  Logger logger(log);
  StubFarm farm;
  DevicePool pool(two_targets(), farm.factory(), logger);

  std::atomic<bool> second_acquired{false};
  std::atomic<bool> other_device_acquired{false};
  std::thread contender;
  std::thread neighbour;
  {
    auto lease = pool.acquire("a");
    (void)lease.device();

    contender = std::thread([&] {
      auto second = pool.acquire("a");
      second_acquired.store(true);
    });
    neighbour = std::thread([&] {
      auto other = pool.acquire("b");
      other_device_acquired.store(true);
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    if (second_acquired.load() || !other_device_acquired.load()) {
      contender.join();
      neighbour.join();
      return fail("test_pool_lease_is_exclusive_per_device", "same device must wait while a different device proceeds");
    }
  }
  contender.join();
  neighbour.join();

  if (!second_acquired.load() || !other_device_acquired.load()) {
    return fail("test_pool_lease_is_exclusive_per_device", "leases should be granted once released");
  }
  return 0;
}

}  // namespace

int main() {
  int rc = 0;
  if (rc == 0) rc = test_probe_parsers();
  if (rc == 0) rc = test_adb_shell_argv_quoting();
  if (rc == 0) rc = test_ssh_argv_and_path_validation();
  if (rc == 0) rc = test_adb_transport_failure_is_unreachable();
  if (rc == 0) rc = test_adb_shell_through_fake_client();
  if (rc == 0) rc = test_ssh_transport_failure_is_unreachable();
  if (rc == 0) rc = test_stub_device_filesystem();
  if (rc == 0) rc = test_pool_resolves_lazily_and_tracks_health();
  if (rc == 0) rc = test_pool_lease_is_exclusive_per_device();

  std::error_code ec;
  std::filesystem::remove_all(scratch_root(), ec);
  if (rc != 0) {
    return rc;
  }

  std::cout << "[PASS] devices unit tests\n";
  return 0;
}
