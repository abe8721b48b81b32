#include <google/protobuf/util/message_differencer.h>

#include <cassert>
#include <filesystem>
#include <functional>
#include <initializer_list>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/store/api/instance_store.hpp"
#include "internal/store/file/file_instance_store.hpp"
#include "internal/store/memory/memory_instance_store.hpp"
#include "internal/util/errors.hpp"
#include "tests/test_support.hpp"

namespace {

using google::protobuf::util::MessageDifferencer;
using localrun::store::InstanceStore;
using localrun::store::file::FileInstanceStore;
using localrun::store::memory::MemoryInstanceStore;
using localrun::testing::MakeSeed;
using localrun::testing::Properties;
using localrun::testing::TestDir;
using localrun::testing::Throws;

struct BackendFactory {
  std::string                                          name;
  std::function<std::shared_ptr<InstanceStore>()>      make_store;
  std::function<void(std::shared_ptr<InstanceStore>&)> restart;
};

std::vector<BackendFactory> Backends(const std::filesystem::path& base) {
  return {
      {"memory", [base]() { return std::make_shared<MemoryInstanceStore>(MakeSeed("parity", base)); }, nullptr},
      {"file",
       [base]() { return std::make_shared<FileInstanceStore>(MakeSeed("parity", base), base / "storage", true); },
       [base](std::shared_ptr<InstanceStore>& store) {
         store.reset();
         store = std::make_shared<FileInstanceStore>(MakeSeed("parity", base), base / "storage", false);
       }},
  };
}

// Same call sequence on any backend.
std::vector<localrun::plan::v1::NodeInstance> RunScenario(InstanceStore& store) {
  store.UpdateNodeInstance("vm_1", 0, std::nullopt, std::string("creating"));
  store.UpdateNodeInstance("vm_1", 1, Properties("ip", "10.0.0.1"), std::nullopt);
  store.UpdateNodeInstance("vm_1", 0, std::nullopt, std::string("started"));

  auto nested = Properties("ip", "10.0.0.2");
  auto* ports = (*nested.mutable_fields())["ports"].mutable_list_value();
  ports->add_values()->set_number_value(80);
  ports->add_values()->set_number_value(443);
  (*nested.mutable_fields())["healthy"].set_bool_value(true);
  (*nested.mutable_fields())["owner"].set_null_value(google::protobuf::NULL_VALUE);
  store.UpdateNodeInstance("web_server_1", 0, nested, std::nullopt);

  assert(Throws<localrun::util::ConflictError>([&] { store.UpdateNodeInstance("web_server_1", 0, Properties("ip", "x"), std::nullopt); }));

  return store.GetNodeInstances();
}

void TestBackendsAreIndistinguishable() {
  const auto base = TestDir("store_parity", "indistinguishable");

  std::vector<std::vector<localrun::plan::v1::NodeInstance>> results;
  for (const auto& backend : Backends(base)) {
    auto store = backend.make_store();
    results.push_back(RunScenario(*store));

    assert(store->Name() == "parity");
    assert(store->GetNodes().size() == 2);
    assert(store->GetNode("web_server").id() == "web_server");
  }

  assert(results.size() == 2);
  assert(results[0].size() == results[1].size());
  for (size_t i = 0; i < results[0].size(); ++i) {
    assert(MessageDifferencer::Equals(results[0][i], results[1][i]));
  }

  const auto& vm = results[0][0];
  assert(vm.id() == "vm_1");
  assert(vm.version() == 3);
  assert(vm.state() == "started");
}

void TestFileStateSurvivesRestart() {
  const auto base = TestDir("store_parity", "restart");

  for (const auto& backend : Backends(base)) {
    if (!backend.restart) {
      continue;
    }
    auto store = backend.make_store();
    store->UpdateNodeInstance("web_server_2", 0, Properties("ip", "10.0.0.3"), std::nullopt);
    store->UpdateNodeInstance("web_server_2", 1, std::nullopt, std::string("started"));

    backend.restart(store);

    auto instance = store->GetNodeInstance("web_server_2");
    assert(instance.version() == 2);
    assert(instance.state() == "started");
    assert(instance.runtime_properties().fields().at("ip").string_value() == "10.0.0.3");

    // Reused state keeps counting from the persisted version.
    store->UpdateNodeInstance("web_server_2", 2, Properties("ip", "10.0.0.4"), std::nullopt);
    assert(store->GetNodeInstance("web_server_2").version() == 3);
  }
}

void TestReuseIgnoresNewSeed() {
  const auto base = TestDir("store_parity", "reuse");

  { FileInstanceStore first(MakeSeed("parity", base), base / "storage", false); }

  auto seed = MakeSeed("parity", base);
  seed.node_instances.push_back(localrun::testing::MakeInstance("vm_2", "vm"));
  FileInstanceStore second(std::move(seed), base / "storage", false);

  assert(second.GetNodeInstances().size() == 3);
  assert(Throws<localrun::util::NotFound>([&] { (void)second.GetNodeInstance("vm_2"); }));
}

void TestClearDiscardsPreviousRun() {
  const auto base = TestDir("store_parity", "clear");

  {
    FileInstanceStore first(MakeSeed("parity", base), base / "storage", false);
    first.UpdateNodeInstance("vm_1", 0, Properties("ip", "10.0.0.1"), std::nullopt);
  }

  FileInstanceStore cleared(MakeSeed("parity", base), base / "storage", true);
  auto              instance = cleared.GetNodeInstance("vm_1");
  assert(instance.version() == 0);
  assert(instance.runtime_properties().fields().empty());
}

void TestOnDiskLayout() {
  const auto base = TestDir("store_parity", "layout");

  FileInstanceStore store(MakeSeed("parity", base), base / "storage", true);
  assert(store.InstancesDir() == base / "storage" / "parity" / "node-instances");
  assert(std::filesystem::is_regular_file(store.InstancesDir() / "vm_1"));
  assert(std::filesystem::is_regular_file(store.InstancesDir() / "web_server_1"));

  store.UpdateNodeInstance("vm_1", 0, Properties("ip", "10.0.0.1"), std::nullopt);

  // Atomic writes leave no temporaries behind.
  for (const auto& entry : std::filesystem::directory_iterator(store.InstancesDir())) {
    assert(entry.path().extension() != ".tmp");
  }
}

void TestCorruptInstanceFileIsStorageError() {
  const auto base = TestDir("store_parity", "corrupt");

  FileInstanceStore store(MakeSeed("parity", base), base / "storage", true);
  localrun::testing::WriteFile(store.InstancesDir() / "vm_1", "{not json");

  assert(Throws<localrun::util::StorageError>([&] { (void)store.GetNodeInstance("vm_1"); }));
  assert(Throws<localrun::util::StorageError>([&] { store.UpdateNodeInstance("vm_1", 0, std::nullopt, std::string("x")); }));
}

void TestInvalidInstanceIdRejected() {
  const auto base = TestDir("store_parity", "invalid_id");

  auto seed = MakeSeed("parity", base);
  seed.node_instances.push_back(localrun::testing::MakeInstance("../escape", "vm"));

  assert(Throws<localrun::util::ConfigurationError>([&] { FileInstanceStore store(std::move(seed), base / "storage", true); }));
}

void TestUnusableStorageDirIsStorageError() {
  const auto base    = TestDir("store_parity", "unusable_dir");
  const auto blocker = localrun::testing::WriteFile(base / "blocker", "not a directory");

  for (bool clear : {false, true}) {
    std::string message;
    assert(Throws<localrun::util::StorageError>([&] { FileInstanceStore store(MakeSeed("parity", base), blocker, clear); }, &message));
    assert(message.find(blocker.string()) != std::string::npos);
  }
}

} // namespace

int main() {
  TestBackendsAreIndistinguishable();
  TestFileStateSurvivesRestart();
  TestReuseIgnoresNewSeed();
  TestClearDiscardsPreviousRun();
  TestOnDiskLayout();
  TestCorruptInstanceFileIsStorageError();
  TestInvalidInstanceIdRejected();
  TestUnusableStorageDirIsStorageError();

  std::cout << "localrun_integration_store_parity: pass\n";
  return 0;
}
