#include "Database/SchemaProvisioner.h"
#include "Common/Exceptions.h"
#include "Database/TenantSQLQueries.h"
#include "Logging/LogManager.h"

#include <algorithm>

namespace ImageVault {
namespace Database {

SchemaProvisioner::SchemaProvisioner(DbLib::SqlSession &session,
                                     const IdentifierSanitizer &sanitizer)
    : session_(session), sanitizer_(sanitizer) {}

// =============================================================================
// 생성
// =============================================================================

ProvisionResult SchemaProvisioner::provision(const TenantId &tenant_id) {
  TenantTableSet tables(sanitizer_.sanitize(tenant_id), session_.dialect());
  const std::string &fragment = tables.fragment().str();
  auto &logger = LogManager::getInstance();

  ProvisionResult result;
  result.fragment = fragment;
  result.declarative_cascade = session_.dialect().supportsForeignKeyCascade();

  try {
    // IMMEDIATE: 같은 테넌트 동시 생성 시 두 번째는 완성된 세트를 본다
    DbLib::SqlTransaction tx(session_);

    int existing = countExistingTables(tables);
    if (existing == 3) {
      tx.commit();
      logger.logTenantOperation(fragment, "provision", "already provisioned");
      logger.logTenantLifecycle(fragment, "provision", "noop");
      return result;
    }
    if (existing != 0) {
      throw ProvisionError(fragment, "partial table set (" +
                                         std::to_string(existing) +
                                         " of 3 tables exist)");
    }

    for (const auto &statement :
         SQL::Tenant::buildProvisionStatements(tables, session_.dialect())) {
      session_.executeNonQuery(statement);
    }
    tx.commit();
    result.created = true;
  } catch (const ProvisionError &e) {
    logger.logTenantLifecycle(fragment, "provision", "failed");
    logger.logTenantOperation(fragment, "provision", e.what(), LogLevel::WARN);
    throw;
  } catch (const DbLib::SqlError &e) {
    logger.logTenantLifecycle(fragment, "provision", "failed");
    logger.logTenantOperation(fragment, "provision",
                              "engine error " + std::to_string(e.extendedCode()),
                              LogLevel::LOG_ERROR);
    throw ProvisionError(fragment, e.what());
  }

  logger.logTenantOperation(
      fragment, "provision",
      result.declarative_cascade ? "created" : "created (explicit cascade only)",
      LogLevel::INFO);
  logger.logTenantLifecycle(fragment, "provision", "ok");
  return result;
}

// =============================================================================
// 삭제
// =============================================================================

bool SchemaProvisioner::deprovision(const TenantId &tenant_id) {
  TenantTableSet tables(sanitizer_.sanitize(tenant_id), session_.dialect());
  const std::string &fragment = tables.fragment().str();
  auto &logger = LogManager::getInstance();

  try {
    DbLib::SqlTransaction tx(session_);

    if (countExistingTables(tables) == 0) {
      tx.commit();
      logger.logTenantLifecycle(fragment, "deprovision", "noop");
      return false;
    }

    ensureNoInboundReferences(tables);

    for (const auto &statement : SQL::Tenant::buildDropStatements(tables)) {
      session_.executeNonQuery(statement);
    }
    tx.commit();
  } catch (const ProvisionError &e) {
    logger.logTenantLifecycle(fragment, "deprovision", "failed");
    logger.logTenantOperation(fragment, "deprovision", e.what(),
                              LogLevel::WARN);
    throw;
  } catch (const DbLib::SqlError &e) {
    logger.logTenantLifecycle(fragment, "deprovision", "failed");
    throw ProvisionError(fragment, e.what());
  }

  logger.logTenantOperation(fragment, "deprovision", "dropped", LogLevel::INFO);
  logger.logTenantLifecycle(fragment, "deprovision", "ok");
  return true;
}

bool SchemaProvisioner::isProvisioned(const TenantId &tenant_id) {
  TenantTableSet tables(sanitizer_.sanitize(tenant_id), session_.dialect());
  return isProvisioned(tables);
}

bool SchemaProvisioner::isProvisioned(const TenantTableSet &tables) {
  return countExistingTables(tables) == 3;
}

std::vector<std::string> SchemaProvisioner::listProvisionedTenants() {
  static const std::string prefix = "store_";
  static const std::string suffix = "_categories";

  auto rows = session_.executeQuery(session_.dialect().buildTableListQuery(),
                                    {std::string("store\\_%\\_categories")});

  std::vector<std::string> fragments;
  for (const auto &row : rows) {
    auto it = row.find("name");
    if (it == row.end())
      continue;
    const std::string &name = it->second;
    if (name.size() <= prefix.size() + suffix.size())
      continue;

    std::string candidate = name.substr(
        prefix.size(), name.size() - prefix.size() - suffix.size());
    if (!sanitizer_.isValidToken(candidate))
      continue;
    if (isProvisioned(candidate))
      fragments.push_back(candidate);
  }

  std::sort(fragments.begin(), fragments.end());
  return fragments;
}

int SchemaProvisioner::provisionMissing(const std::vector<TenantId> &tenant_ids) {
  int created = 0;
  for (const auto &tenant_id : tenant_ids) {
    if (provision(tenant_id).created)
      ++created;
  }
  if (created > 0) {
    LogManager::getInstance().Info("provisionMissing: {} of {} tenant(s) created",
                                   created, tenant_ids.size());
  }
  return created;
}

// =============================================================================
// 내부 헬퍼
// =============================================================================

int SchemaProvisioner::countExistingTables(const TenantTableSet &tables) {
  int count = 0;
  for (const auto &name : tables.rawNames()) {
    if (session_.executeQueryOne(session_.dialect().buildTableExistsQuery(),
                                 {name})) {
      ++count;
    }
  }
  return count;
}

void SchemaProvisioner::ensureNoInboundReferences(const TenantTableSet &tables) {
  std::vector<std::string> names = tables.rawNames();
  std::vector<DbLib::SqlValue> params;
  for (int pass = 0; pass < 2; ++pass) {
    for (const auto &name : names)
      params.emplace_back(name);
  }

  auto row = session_.executeQueryOne(
      session_.dialect().buildInboundForeignKeyQuery(names.size()), params);
  if (row) {
    auto source = row->find("source_table");
    throw ProvisionError(tables.fragment().str(),
                         "referenced by foreign key from " +
                             (source != row->end() ? source->second
                                                   : std::string("?")));
  }
}

} // namespace Database
} // namespace ImageVault
