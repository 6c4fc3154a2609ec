#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>

#include "api_client.hpp"
#include "log.hpp"
#include "transfer_pool.hpp"

// Everything an operation needs, resolved once per invocation and passed in
// explicitly. There is no process-wide active team.
struct SyncContext {
  std::string active_team;
  std::filesystem::path datasets_root;
  std::shared_ptr<ApiClient> api;
  std::shared_ptr<Logger> logger = std::make_shared<Logger>("dsync");
  std::size_t max_workers = 4;
  const CancellationToken* cancel = nullptr;
  TransferProgress progress;

  DatasetIdentifier resolve(const DatasetIdentifier& id) const { return with_team(id, active_team); }
};
