#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/model/token_record.hpp"
#include "internal/factory.hpp"
#include "internal/registry/token_registry.hpp"
#include "internal/token/token_factory.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/token_fixtures.hpp"

#if FREIGHTLINE_DB_SQLITE
#include <sqlite3.h>

#include "internal/db/sql/sql_queries.hpp"
#endif

namespace {

using freightline::db::ErrorCode;
using freightline::db::Repository;
using freightline::db::TransactionError;
using freightline::db::memory::MemoryRepository;
using freightline::db::model::TokenRecord;
using freightline::registry::TokenRegistry;
using freightline::runtime::config::RuntimeConfig;

int64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

// How a backend treats two open transactions on the same row.
enum class Concurrency {
  kSerialized,     // second Begin() fails while the first is open
  kOptimistic,     // stale commit fails with Conflict
  kLastWriterWins, // row-level locking, both commit
};

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  Concurrency                                       concurrency = Concurrency::kOptimistic;
};

TokenRecord MakeRecord(const std::string& id, const std::string& root, int64_t created_at_ms) {
  TokenRecord r;
  r.id               = id;
  r.token_type       = id == root ? "ST-01" : "MT-01";
  r.version          = 1;
  r.state            = "CREATED";
  r.payload          = R"({"metadata":{"k":"v"},"relations":{}})";
  r.root_shipment_id = root;
  r.created_at_ms    = created_at_ms;
  r.updated_at_ms    = created_at_ms;
  return r;
}

void VerifyInsertGetUpdate(Repository& repo, const std::string& id) {
  auto tx = repo.Begin();

  auto record = MakeRecord(id, id, 1000);
  assert(repo.InsertToken(*tx, record));

  auto read = repo.GetToken(*tx, id);
  assert(read.has_value());
  assert(read->token_type == "ST-01");
  assert(read->root_shipment_id == id);
  assert(!read->signature.has_value());
  assert(read->created_at_ms == 1000);

  assert(repo.UpdateTokenState(*tx, id, "DISPATCHED", std::string("sig"), 2000));

  auto updated = repo.GetToken(*tx, id);
  assert(updated.has_value());
  assert(updated->state == "DISPATCHED");
  assert(updated->signature == "sig");
  assert(updated->updated_at_ms == 2000);
  assert(updated->payload == read->payload);
  assert(updated->created_at_ms == 1000);

  assert(repo.UpdateTokenState(*tx, id, "IN_TRANSIT", std::nullopt, 3000));
  assert(!repo.GetToken(*tx, id)->signature.has_value());

  tx->Commit();
}

void VerifyErrorCodes(Repository& repo, const std::string& id) {
  auto tx = repo.Begin();

  assert(repo.InsertToken(*tx, MakeRecord(id, id, 1000)));
  auto duplicate = repo.InsertToken(*tx, MakeRecord(id, id, 1000));
  assert(!duplicate);
  assert(duplicate.code == ErrorCode::AlreadyExists);

  auto missing = repo.UpdateTokenState(*tx, id + "-missing", "SIGNED", std::nullopt, 1);
  assert(!missing);
  assert(missing.code == ErrorCode::NotFound);

  assert(!repo.GetToken(*tx, id + "-missing").has_value());
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& id) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertToken(*tx, MakeRecord(id, id, 1000)));
    tx->Rollback();
  }
  {
    // destructor rolls back too
    auto tx = repo.Begin();
    assert(repo.InsertToken(*tx, MakeRecord(id, id, 1000)));
  }

  auto check_tx = repo.Begin();
  assert(!repo.GetToken(*check_tx, id).has_value());
  check_tx->Commit();
}

void VerifyListingOrder(Repository& repo, const std::string& root) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertToken(*tx, MakeRecord(root, root, 5000)));
    // inserted out of creation order; ties keep insertion order
    assert(repo.InsertToken(*tx, MakeRecord(root + "-c", root, 7000)));
    assert(repo.InsertToken(*tx, MakeRecord(root + "-a", root, 6000)));
    assert(repo.InsertToken(*tx, MakeRecord(root + "-b", root, 6000)));
    assert(repo.InsertToken(*tx, MakeRecord(root + "-other", root + "-elsewhere", 5500)));
    tx->Commit();
  }

  auto tx   = repo.Begin();
  auto rows = repo.ListTokensByShipment(*tx, root);
  assert(rows.size() == 4);
  assert(rows[0].id == root);
  assert(rows[1].id == root + "-a");
  assert(rows[2].id == root + "-b");
  assert(rows[3].id == root + "-c");

  assert(repo.ListTokensByShipment(*tx, root + "-nothing").empty());

  auto all = repo.ListTokens(*tx);
  assert(all.size() >= 5);
  for (std::size_t i = 1; i < all.size(); ++i) {
    assert(all[i - 1].created_at_ms <= all[i].created_at_ms);
  }
  tx->Commit();
}

void VerifyConcurrentUpdates(Repository& repo, const std::string& id, Concurrency concurrency) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertToken(*tx, MakeRecord(id, id, 1000)));
    tx->Commit();
  }

  auto tx1 = repo.Begin();
  if (concurrency == Concurrency::kSerialized) {
    // a nested Begin() on the owning thread is reported as a transient Busy
    bool busy = false;
    try {
      auto tx2 = repo.Begin();
      (void)tx2;
    } catch (const TransactionError& e) {
      busy = e.Code() == ErrorCode::Busy && freightline::db::IsTransient(e.Code());
    }
    assert(busy);
    tx1->Rollback();
    return;
  }

  auto tx2 = repo.Begin();
  assert(repo.GetToken(*tx1, id).has_value());
  assert(repo.GetToken(*tx2, id).has_value());

  assert(repo.UpdateTokenState(*tx1, id, "DISPATCHED", std::nullopt, 2000));
  tx1->Commit();

  assert(repo.UpdateTokenState(*tx2, id, "CANCELLED", std::nullopt, 3000));
  if (concurrency == Concurrency::kOptimistic) {
    bool conflicted = false;
    try {
      tx2->Commit();
    } catch (const TransactionError& e) {
      conflicted = e.Code() == ErrorCode::Conflict && freightline::db::IsTransient(e.Code());
    }
    assert(conflicted);
  } else {
    tx2->Commit();
  }

  auto verify_tx = repo.Begin();
  auto final     = repo.GetToken(*verify_tx, id);
  assert(final.has_value());
  assert(final->state == (concurrency == Concurrency::kOptimistic ? "DISPATCHED" : "CANCELLED"));
  verify_tx->Commit();
}

// Same registry behaviour regardless of backend.
void VerifyRegistryOnBackend(const std::shared_ptr<Repository>& repo, const std::string& shipment_id) {
  freightline::token::TokenIndex   index;
  freightline::token::TokenFactory factory(index);
  TokenRegistry                    registry(repo);

  auto chain = freightline::testing::MakeChain(factory, shipment_id);
  registry.Persist(chain.st01);
  registry.Persist(chain.mt01);
  registry.Persist(chain.qt01);
  registry.Persist(chain.it01);

  auto signed_invoice = chain.it01;
  signed_invoice.TransitionTo(freightline::token::TokenState::kSigned);
  registry.Persist(signed_invoice, std::string("0xfeed"));

  auto loaded = registry.Load(chain.it01.id());
  assert(loaded == TokenRegistry::FromRecord(TokenRegistry::ToRecord(signed_invoice, std::string("0xfeed"), 0)));
  assert(loaded.metadata().fields().at("line_items").list_value().values_size() == 1);

  auto tokens = registry.LoadShipment(shipment_id);
  assert(tokens.size() == 4);
  assert(tokens[0] == chain.st01);
  assert(tokens[1] == chain.mt01);

  bool threw = false;
  try {
    (void)registry.Persist(chain.it01);
  } catch (const freightline::util::InvalidStateTransitionError&) {
    threw = true;
  }
  assert(threw);
}

// Many threads persisting through one registry; only retryable failures
// may occur and a retry always lands.
void VerifyConcurrentPersist(const std::shared_ptr<Repository>& repo, const std::string& prefix) {
  constexpr int kThreads   = 8;
  constexpr int kPerThread = 50;

  freightline::token::TokenIndex   index;
  freightline::token::TokenFactory factory(index);
  TokenRegistry                    registry(repo);

  std::vector<std::vector<freightline::token::Token>> batches(kThreads);
  for (int t = 0; t < kThreads; ++t) {
    for (int i = 0; i < kPerThread; ++i) {
      auto id = prefix + "-" + std::to_string(t) + "-" + std::to_string(i);
      batches[t].push_back(factory.CreateToken("ST-01", id, freightline::testing::ShipmentMetadata(), {}));
    }
  }

  std::atomic<int> fatal{0};
  std::atomic<int> retries{0};
  std::vector<std::thread> workers;
  for (int t = 0; t < kThreads; ++t) {
    workers.emplace_back([&, t]() {
      for (const auto& token : batches[t]) {
        for (;;) {
          try {
            registry.Persist(token);
            break;
          } catch (const freightline::util::Error& e) {
            if (!e.Retryable()) {
              ++fatal;
              break;
            }
            ++retries;
          }
        }
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }

  assert(fatal.load() == 0);
  for (const auto& batch : batches) {
    for (const auto& token : batch) {
      assert(registry.Load(token.id()) == token);
    }
  }
  std::cout << "  concurrent persist retries: " << retries.load() << "\n";
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& id) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();
    assert(repo->InsertToken(*tx, MakeRecord(id, id, 1000)));
    assert(repo->InsertToken(*tx, MakeRecord(id + "-child", id, 2000)));
    assert(repo->UpdateTokenState(*tx, id, "DISPATCHED", std::string("0x01"), 3000));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  auto st = repo->GetToken(*tx, id);
  assert(st.has_value());
  assert(st->state == "DISPATCHED");
  assert(st->signature == "0x01");

  auto rows = repo->ListTokensByShipment(*tx, id);
  assert(rows.size() == 2);
  assert(rows[1].id == id + "-child");
  tx->Commit();

  // the index rebuilt from storage sees both rows
  freightline::token::TokenIndex index;
  TokenRegistry                  registry(repo);
  assert(registry.HydrateIndex(index) >= 2);
  assert(index.Contains(id + "-child"));
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
      .concurrency      = Concurrency::kOptimistic,
  };
}

#if FREIGHTLINE_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("freightline_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    RuntimeConfig config;
    config.mutable_database()->mutable_sqlite()->set_path(db_path);
    config.mutable_database()->mutable_sqlite()->set_wal_mode(true);
    return freightline::factory::BuildRepository(config);
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup =
          [db_path]() {
            std::filesystem::remove(db_path);
            std::filesystem::remove(db_path + "-wal");
            std::filesystem::remove(db_path + "-shm");
          },
      .concurrency = Concurrency::kSerialized,
  };
}
#endif

#if FREIGHTLINE_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("FREIGHTLINE_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("FREIGHTLINE_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    RuntimeConfig config;
    config.mutable_database()->mutable_postgres()->set_connection_uri(conninfo);
    config.mutable_database()->mutable_postgres()->set_max_connections(4);
    return freightline::factory::BuildRepository(config);
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = []() {},
      .concurrency      = Concurrency::kLastWriterWins,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  // ids are unique per run so a shared Postgres database can be reused
  const auto prefix = backend.name + "-" + std::to_string(NowMs());

  VerifyInsertGetUpdate(*repo, prefix + "-life");
  VerifyErrorCodes(*repo, prefix + "-errors");
  VerifyRollbackBehavior(*repo, prefix + "-rollback");
  VerifyListingOrder(*repo, prefix + "-order");
  VerifyConcurrentUpdates(*repo, prefix + "-concurrency", backend.concurrency);
  VerifyRegistryOnBackend(repo, prefix + "-registry");
  VerifyConcurrentPersist(repo, prefix + "-parallel");

  VerifyRestartDurability(backend, prefix + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
#if FREIGHTLINE_DB_SQLITE
  // schema text and sqlite3.h share one translation unit
  assert(std::string(freightline::db::sql::kSqliteSchema).find("CREATE TABLE") != std::string::npos);
#endif

  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if FREIGHTLINE_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if FREIGHTLINE_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "freightline_integration_repository_parity: pass\n";
  return 0;
}
