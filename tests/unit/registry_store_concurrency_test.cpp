#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/registry/registry_store.hpp"
#include "internal/util/errors.hpp"

#if DISPATCHER_DB_SQLITE
#include <filesystem>

#include "internal/db/sql/schema.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace {

using dispatcher::model::ProcessState;
using dispatcher::registry::RegistryStore;
using dispatcher::util::StoreError;
using dispatcher::util::StoreErrorCode;
using dispatcher::util::TransitionError;

/*
  Two callers race to complete the same running record, repeatedly.
  Exactly one of them must win each round.
*/
void VerifyConcurrentCompletionHasOneWinner(RegistryStore& store, int rounds) {
  for (int round = 0; round < rounds; ++round) {
    auto rec = store.Create(1, 1);
    store.UpdateState(rec.id, ProcessState::kRunning);

    std::atomic<int>  successes{0};
    std::atomic<int>  illegal{0};
    std::atomic<int>  other{0};
    std::atomic<bool> go{false};

    auto worker = [&] {
      while (!go) std::this_thread::yield();
      try {
        auto updated = store.UpdateState(rec.id, ProcessState::kCompleted);
        assert(updated.state == ProcessState::kCompleted);
        ++successes;
      } catch (const TransitionError&) {
        ++illegal;
      } catch (const std::exception&) {
        ++other;
      }
    };

    std::thread a(worker);
    std::thread b(worker);
    go = true;
    a.join();
    b.join();

    assert(successes == 1);
    assert(illegal == 1);
    assert(other == 0);
    assert(store.Get(rec.id).state == ProcessState::kCompleted);
  }
}

// Many threads push one record through competing edges; the final state
// must be one reachable by exactly the transitions that succeeded.
void VerifyCompetingEdges(RegistryStore& store) {
  auto rec = store.Create(2, 1);
  store.UpdateState(rec.id, ProcessState::kRunning);

  const std::vector<ProcessState> targets = {ProcessState::kCompleted, ProcessState::kFailed, ProcessState::kCancelled,
                                             ProcessState::kCompleted, ProcessState::kFailed, ProcessState::kCancelled};

  std::atomic<int>         successes{0};
  std::vector<std::thread> threads;
  std::vector<ProcessState> winners(targets.size(), ProcessState::kRunning);
  for (std::size_t i = 0; i < targets.size(); ++i) {
    threads.emplace_back([&, i] {
      try {
        winners[i] = store.UpdateState(rec.id, targets[i]).state;
        ++successes;
      } catch (const TransitionError&) {
      }
    });
  }
  for (auto& t : threads) t.join();

  assert(successes == 1);
  const auto final_state = store.Get(rec.id).state;
  assert(dispatcher::model::IsTerminal(final_state));

  int matching = 0;
  for (auto w : winners) {
    if (w == final_state) ++matching;
  }
  assert(matching >= 1);
}

void VerifyParallelCreatesAreUnique(RegistryStore& store, int threads_count, int per_thread) {
  std::vector<std::thread>        threads;
  std::vector<std::vector<std::string>> ids(threads_count);
  for (int t = 0; t < threads_count; ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < per_thread; ++i) {
        ids[t].push_back(dispatcher::util::ToString(store.Create(100 + t, 1).id));
      }
    });
  }
  for (auto& t : threads) t.join();

  std::set<std::string> unique;
  for (const auto& list : ids) unique.insert(list.begin(), list.end());
  assert(unique.size() == static_cast<std::size_t>(threads_count * per_thread));

  for (int t = 0; t < threads_count; ++t) {
    auto        seq   = store.ListBySource(100 + t);
    std::size_t count = 0;
    auto        prev  = dispatcher::util::TimePoint{};
    while (auto rec = seq.Next()) {
      assert(rec->created_at > prev);
      prev = rec->created_at;
      ++count;
    }
    assert(count == static_cast<std::size_t>(per_thread));
  }
}

void VerifyDeleteRacingUpdate(RegistryStore& store) {
  auto rec = store.Create(3, 1);

  std::atomic<bool> go{false};
  std::atomic<int>  not_found{0};

  std::thread deleter([&] {
    while (!go) std::this_thread::yield();
    store.Delete(rec.id);
  });
  std::thread updater([&] {
    while (!go) std::this_thread::yield();
    try {
      store.UpdateState(rec.id, ProcessState::kRunning);
    } catch (const StoreError& e) {
      assert(e.code() == StoreErrorCode::kNotFound);
      ++not_found;
    }
  });

  go = true;
  deleter.join();
  updater.join();

  bool gone = false;
  try {
    store.Get(rec.id);
  } catch (const StoreError& e) {
    gone = e.code() == StoreErrorCode::kNotFound;
  }
  assert(gone);
  assert(not_found <= 1);
}

void RunSuite(const std::string& name, RegistryStore& store) {
  std::cout << "running concurrency suite: " << name << "\n";
  VerifyConcurrentCompletionHasOneWinner(store, 50);
  VerifyCompetingEdges(store);
  VerifyParallelCreatesAreUnique(store, 4, 25);
  VerifyDeleteRacingUpdate(store);
}

} // namespace

int main() {
  {
    RegistryStore store(std::make_shared<dispatcher::db::memory::MemoryRepository>());
    RunSuite("memory", store);
  }

#if DISPATCHER_DB_SQLITE
  {
    const auto path = (std::filesystem::temp_directory_path() / "process_dispatcher_concurrency_test.db").string();
    std::filesystem::remove(path);
    {
      auto db = std::make_shared<dispatcher::db::sqlite::SqliteDB>(path);
      for (const auto& sql : dispatcher::db::sql::SqliteSchema()) db->Exec(sql);
      RegistryStore store(std::make_shared<dispatcher::db::sqlite::SqliteRepository>(db));
      RunSuite("sqlite", store);
    }
    std::filesystem::remove(path);
    std::filesystem::remove(path + "-wal");
    std::filesystem::remove(path + "-shm");
  }
#endif

  std::cout << "process_dispatcher_unit_registry_store_concurrency: pass\n";
  return 0;
}
