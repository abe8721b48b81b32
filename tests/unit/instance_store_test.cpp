#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>

#include "internal/store/memory/memory_instance_store.hpp"
#include "internal/util/errors.hpp"
#include "tests/test_support.hpp"

namespace {

using localrun::store::memory::MemoryInstanceStore;
using localrun::testing::MakeSeed;
using localrun::testing::Properties;
using localrun::testing::TestDir;
using localrun::testing::Throws;
using localrun::util::ConflictError;
using localrun::util::NotFound;

void TestSeedVersionsAreReset() {
  MemoryInstanceStore store(MakeSeed("store", TestDir("instance_store", "seed")));

  for (const auto& instance : store.GetNodeInstances()) {
    assert(instance.version() == 0);
    assert(instance.state() == "uninitialized");
  }
}

void TestInstancesListedInIdOrder() {
  MemoryInstanceStore store(MakeSeed("store", TestDir("instance_store", "order")));

  auto instances = store.GetNodeInstances();
  assert(instances.size() == 3);
  assert(instances[0].id() == "vm_1");
  assert(instances[1].id() == "web_server_1");
  assert(instances[2].id() == "web_server_2");
}

void TestVersionCountsAcceptedUpdates() {
  MemoryInstanceStore store(MakeSeed("store", TestDir("instance_store", "versions")));

  for (std::uint64_t v = 0; v < 5; ++v) {
    store.UpdateNodeInstance("vm_1", v, Properties("step", std::to_string(v)), std::nullopt);
  }

  auto instance = store.GetNodeInstance("vm_1");
  assert(instance.version() == 5);
  assert(instance.runtime_properties().fields().at("step").string_value() == "4");
}

void TestStalePropertyUpdateIsRejected() {
  MemoryInstanceStore store(MakeSeed("store", TestDir("instance_store", "stale")));

  store.UpdateNodeInstance("vm_1", 0, Properties("ip", "10.0.0.1"), std::nullopt);

  std::string message;
  bool        threw = Throws<ConflictError>([&] { store.UpdateNodeInstance("vm_1", 0, Properties("ip", "10.0.0.2"), std::nullopt); }, &message);
  assert(threw && "stale expected_version must conflict");
  assert(message == "version 0 does not match current version of node instance vm_1 which is 1");

  auto instance = store.GetNodeInstance("vm_1");
  assert(instance.version() == 1);
  assert(instance.runtime_properties().fields().at("ip").string_value() == "10.0.0.1");
}

void TestStateTransitionBypassesVersionCheck() {
  MemoryInstanceStore store(MakeSeed("store", TestDir("instance_store", "state")));

  store.UpdateNodeInstance("vm_1", 0, Properties("ip", "10.0.0.1"), std::nullopt);
  store.UpdateNodeInstance("vm_1", 42, std::nullopt, std::string("started"));

  auto instance = store.GetNodeInstance("vm_1");
  assert(instance.state() == "started");
  assert(instance.version() == 2);
  // Properties untouched when not supplied.
  assert(instance.runtime_properties().fields().at("ip").string_value() == "10.0.0.1");
}

void TestReturnedInstancesAreCopies() {
  MemoryInstanceStore store(MakeSeed("store", TestDir("instance_store", "copies")));

  auto instance = store.GetNodeInstance("web_server_1");
  (*instance.mutable_runtime_properties()->mutable_fields())["ip"].set_string_value("mutated");
  instance.set_state("mutated");

  auto fresh = store.GetNodeInstance("web_server_1");
  assert(fresh.runtime_properties().fields().count("ip") == 0);
  assert(fresh.state() == "uninitialized");

  auto node = store.GetNode("vm");
  node.set_type("mutated");
  assert(store.GetNode("vm").type() == "test.nodes.Compute");
}

void TestUnknownIdsAreNotFound() {
  MemoryInstanceStore store(MakeSeed("store", TestDir("instance_store", "unknown")));

  assert(Throws<NotFound>([&] { (void)store.GetNodeInstance("missing"); }));
  assert(Throws<NotFound>([&] { store.UpdateNodeInstance("missing", 0, std::nullopt, std::string("started")); }));
  assert(Throws<NotFound>([&] { (void)store.GetNode("missing"); }));
  assert(store.GetNodes().size() == 2);
}

void TestResources() {
  const auto root = TestDir("instance_store", "resources");
  localrun::testing::WriteFile(root / "scripts" / "install.sh", "#!/bin/sh\necho hi\n");

  MemoryInstanceStore store(MakeSeed("store", root));

  assert(store.GetResource("scripts/install.sh") == "#!/bin/sh\necho hi\n");
  assert(Throws<NotFound>([&] { (void)store.GetResource("scripts/missing.sh"); }));

  const auto target = (root / "copy.sh").string();
  assert(store.DownloadResource("scripts/install.sh", target) == target);

  const auto temp_path = store.DownloadResource("scripts/install.sh", std::nullopt);
  assert(std::filesystem::path(temp_path).filename().string().rfind("localrun-", 0) == 0);
  std::ifstream     in(temp_path, std::ios::binary);
  const std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  assert(content == "#!/bin/sh\necho hi\n");
  std::filesystem::remove(temp_path);
}

} // namespace

int main() {
  TestSeedVersionsAreReset();
  TestInstancesListedInIdOrder();
  TestVersionCountsAcceptedUpdates();
  TestStalePropertyUpdateIsRejected();
  TestStateTransitionBypassesVersionCheck();
  TestReturnedInstancesAreCopies();
  TestUnknownIdsAreNotFound();
  TestResources();

  std::cout << "localrun_unit_instance_store: pass\n";
  return 0;
}
