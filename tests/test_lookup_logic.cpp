#include "nif_cli/commands/lookup_logic.h"

#include "nifpt/core/clock.h"
#include "nifpt/core/id_generator.h"
#include "nifpt/lookup/inmemory_nif_registry.h"
#include "nifpt/lookup/nif_registry.h"
#include "nifpt/storage/audit_log.h"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <iostream>
#include <sstream>
#include <streambuf>
#include <string>

using namespace nifpt;

namespace {

// Redirects std::cout into a buffer for the lifetime of the object.
class CoutCapture {
 public:
  CoutCapture() : previous_(std::cout.rdbuf(buffer_.rdbuf())) {}
  ~CoutCapture() { std::cout.rdbuf(previous_); }

  CoutCapture(const CoutCapture&) = delete;
  CoutCapture& operator=(const CoutCapture&) = delete;
  CoutCapture(CoutCapture&&) = delete;
  CoutCapture& operator=(CoutCapture&&) = delete;

  [[nodiscard]] std::string str() const { return buffer_.str(); }

 private:
  std::ostringstream buffer_;
  std::streambuf* previous_;
};

lookup::LookupRecord known_record() {
  lookup::EntityRecord entity;
  entity.title = "Example Lda";
  entity.city = "Lisboa";
  entity.status = "active";
  entity.active = true;
  return {core::Nif{"500960046"}, lookup::RegistryStatus::kValidKnown, entity, std::nullopt};
}

}  // namespace

TEST_CASE("lookup_logic: known NIF exits 0 and prints the entity", "[cli][lookup]") {
  core::DeterministicIdGenerator id_gen;
  core::FixedClock clock("2026-01-01T00:00:00Z");
  storage::InMemoryAuditLog audit_log;
  lookup::InMemoryNifRegistry registry;
  registry.upsert(known_record());

  CoutCapture capture;
  const int rc = execute_lookup("500960046", false, false, registry, audit_log, id_gen, clock);

  CHECK(rc == 0);
  CHECK(capture.str().find("valid_known") != std::string::npos);
  CHECK(capture.str().find("Example Lda") != std::string::npos);
  CHECK(audit_log.size() == 3);
}

TEST_CASE("lookup_logic: unknown NIF still counts as a registry answer", "[cli][lookup]") {
  core::DeterministicIdGenerator id_gen;
  core::FixedClock clock("2026-01-01T00:00:00Z");
  storage::InMemoryAuditLog audit_log;
  lookup::InMemoryNifRegistry registry;

  CoutCapture capture;
  const int rc = execute_lookup("100000002", false, false, registry, audit_log, id_gen, clock);

  CHECK(rc == 0);
  CHECK(capture.str().find("valid_unknown") != std::string::npos);
}

TEST_CASE("lookup_logic: locally invalid candidate exits 1", "[cli][lookup]") {
  core::DeterministicIdGenerator id_gen;
  core::FixedClock clock("2026-01-01T00:00:00Z");
  storage::InMemoryAuditLog audit_log;
  lookup::InMemoryNifRegistry registry;
  registry.upsert(known_record());

  CoutCapture capture;
  const int rc = execute_lookup("500960047", false, false, registry, audit_log, id_gen, clock);

  CHECK(rc == 1);
  CHECK(capture.str().find("invalid_check_digit") != std::string::npos);
  CHECK(capture.str().find("not contacted") != std::string::npos);
}

TEST_CASE("lookup_logic: no registry configured exits 1", "[cli][lookup]") {
  core::DeterministicIdGenerator id_gen;
  core::FixedClock clock("2026-01-01T00:00:00Z");
  storage::InMemoryAuditLog audit_log;
  lookup::NullNifRegistry registry;

  CoutCapture capture;
  const int rc = execute_lookup("500960046", false, true, registry, audit_log, id_gen, clock);

  CHECK(rc == 1);
  const auto j = nlohmann::json::parse(capture.str());
  CHECK(j.at("local").at("result") == "valid");
  CHECK(j.at("registry").is_null());
  CHECK(j.at("failure").at("error") == "unreachable");
}

TEST_CASE("lookup_logic: JSON output survives invalid UTF-8", "[cli][lookup]") {
  core::DeterministicIdGenerator id_gen;
  core::FixedClock clock("2026-01-01T00:00:00Z");
  storage::InMemoryAuditLog audit_log;
  lookup::InMemoryNifRegistry registry;

  CoutCapture capture;
  int rc = 0;
  CHECK_NOTHROW(rc = execute_lookup("50096004\xff", false, true, registry, audit_log, id_gen,
                                    clock));

  CHECK(rc == 1);
  const auto j = nlohmann::json::parse(capture.str());
  CHECK(j.at("local").at("result") == "invalid_length");
  CHECK(j.at("local").at("candidate") == "50096004\xEF\xBF\xBD");
}
