#pragma once

#include <memory>

namespace tierbridge::db {
class Repository;
}
namespace tierbridge::source {
class SourceRegistry;
}
namespace tierbridge::transfer {
class TransferEngine;
}
namespace tierbridge::tiering {
class TieringCoordinator;
}
namespace tierbridge::ledger {
class OperationLedger;
class TransferJournal;
}
namespace tierbridge::fileops {
class FileOperations;
}
namespace tierbridge::clipboard {
class ClipboardManager;
}
namespace tierbridge::transcode {
class TranscodeCoordinator;
}

namespace tierbridge::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<tierbridge::db::Repository>              repository;
  std::shared_ptr<tierbridge::source::SourceRegistry>      registry;
  std::shared_ptr<tierbridge::transfer::TransferEngine>    transfers;
  std::shared_ptr<tierbridge::tiering::TieringCoordinator> tiering;
  std::shared_ptr<tierbridge::ledger::OperationLedger>     ledger;
  std::shared_ptr<tierbridge::ledger::TransferJournal>     journal;
  std::shared_ptr<tierbridge::fileops::FileOperations>     files;
  std::shared_ptr<tierbridge::clipboard::ClipboardManager> clipboard;
  std::shared_ptr<tierbridge::transcode::TranscodeCoordinator> transcode;
};

} // namespace tierbridge::service
