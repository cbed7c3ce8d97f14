#pragma once

#include <memory>

#include "config/config.pb.h"

namespace settle::core {
class SettlementEngine;
}
namespace settle::audit {
class AuditReader;
}
namespace settle::db {
class Repository;
}

namespace settle::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<settle::core::SettlementEngine> engine;
  std::shared_ptr<settle::audit::AuditReader>     audit;
  std::shared_ptr<settle::db::Repository>         repository;
  settle::runtime::config::SettlementConfig       settlement;
};

} // namespace settle::service
