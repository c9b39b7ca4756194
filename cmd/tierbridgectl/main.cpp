#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "tierbridge/vfs/v1.hpp"

using namespace tierbridge::vfs::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  tierbridgectl <addr> sources\n"
            << "  tierbridgectl <addr> targets <exclude_source_id>\n"
            << "  tierbridgectl <addr> ops [active]\n"
            << "  tierbridgectl <addr> ls <source:path> [recursive]\n"
            << "  tierbridgectl <addr> mv <source:path> <source:path>\n"
            << "  tierbridgectl <addr> cp <source:path> <source:path> [recursive]\n"
            << "  tierbridgectl <addr> mv-into <source:dir> <source:path>...\n"
            << "  tierbridgectl <addr> cp-into <source:dir> <source:path>...\n"
            << "  tierbridgectl <addr> rename <source:path> <new_name>\n"
            << "  tierbridgectl <addr> rm <source:path>\n"
            << "  tierbridgectl <addr> mkdir <source:path>\n"
            << "  tierbridgectl <addr> upload <source_id> <local_path> <remote_path>\n"
            << "  tierbridgectl <addr> download <source_id> <remote_path> <local_path>\n"
            << "  tierbridgectl <addr> transfers [source_id]\n"
            << "  tierbridgectl <addr> pause|resume|cancel <transfer_id>\n"
            << "  tierbridgectl <addr> watch-transfer <transfer_id>\n"
            << "  tierbridgectl <addr> warm <source:path> [priority]\n"
            << "  tierbridgectl <addr> watch-warm [request_id]\n"
            << "  tierbridgectl <addr> tier <hot|warm|cold|nearline|archive> <source:path>...\n"
            << "  tierbridgectl <addr> transcode <source:path> <mp4|webm|mkv|mov>\n"
            << "  tierbridgectl <addr> watch-transcode <job_id>\n"
            << "  tierbridgectl <addr> clip-copy|clip-cut <source_id> <path>...\n"
            << "  tierbridgectl <addr> paste <source:dir>\n"
            << "  tierbridgectl <addr> paste-native <host_dir>\n"
            << "  tierbridgectl <addr> copy-native <source_id> <path>...\n"
            << "  tierbridgectl <addr> read-native\n"
            << "  tierbridgectl <addr> write-native <host_path>...\n"
            << "  tierbridgectl <addr> paste-native-into <source:dir> [host_path...]\n"
            << "  tierbridgectl <addr> clip-get|clip-has|clip-clear\n";
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  if (status.error_code() == grpc::StatusCode::UNAVAILABLE && !status.error_details().empty()) {
    std::cerr << "estimated retrieval: " << status.error_details() << "s, warm the file first\n";
  }
  return 2;
}

// "s3:/photos/a.jpg" -> {s3, /photos/a.jpg}
static FileLocation ParseLocation(const std::string& value) {
  const auto colon = value.find(':');
  if (colon == std::string::npos || colon == 0) {
    std::cerr << "expected <source:path>, got '" << value << "'\n";
    std::exit(1);
  }
  FileLocation location;
  location.set_source_id(value.substr(0, colon));
  location.set_path(colon + 1 < value.size() ? value.substr(colon + 1) : "/");
  return location;
}

static std::optional<TierStatus> ParseTier(const std::string& value) {
  if (value == "hot") return TIER_STATUS_HOT;
  if (value == "warm") return TIER_STATUS_WARM;
  if (value == "cold") return TIER_STATUS_COLD;
  if (value == "nearline") return TIER_STATUS_NEARLINE;
  if (value == "archive") return TIER_STATUS_ARCHIVE;
  return std::nullopt;
}

static void PrintBatch(const BatchResult& result) {
  std::cout << "pasted=" << result.files_pasted() << " failed=" << result.files_failed() << "\n";
  for (const auto& path : result.pasted_paths()) std::cout << "  " << path << "\n";
  for (const auto& error : result.errors()) std::cerr << "  error: " << error << "\n";
}

static void PrintTransfer(const TransferRecord& record) {
  std::cout << record.id() << " " << TransferStatus_Name(record.status()) << " " << record.bytes_transferred() << "/"
            << record.total_size() << " part=" << record.part_index() << "/" << record.total_parts();
  if (record.has_speed_bytes_per_sec()) std::cout << " speed=" << static_cast<uint64_t>(record.speed_bytes_per_sec()) << "B/s";
  if (record.has_eta_sec()) std::cout << " eta=" << static_cast<uint64_t>(record.eta_sec()) << "s";
  if (!record.error().empty()) std::cout << " error=" << record.error();
  std::cout << "\n";
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto catalog_stub   = CatalogService::NewStub(channel);
  auto clipboard_stub = ClipboardService::NewStub(channel);
  auto file_stub      = FileService::NewStub(channel);
  auto tiering_stub   = TieringService::NewStub(channel);
  auto transfer_stub  = TransferService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------
  // Catalog
  // ------------------------------------------------------------

  if (cmd == "sources" || cmd == "targets") {
    ListSourcesResponse resp;
    grpc::Status        status;
    if (cmd == "sources") {
      status = catalog_stub->ListSources(&ctx, google::protobuf::Empty(), &resp);
    } else {
      if (argc < 4) return 1;
      TransferTargetsRequest req;
      req.set_exclude_source_id(argv[3]);
      status = catalog_stub->GetTransferTargets(&ctx, req, &resp);
    }
    if (!status.ok()) return Fail(status);

    for (const auto& source : resp.sources()) {
      std::cout << source.id() << " " << SourceCategory_Name(source.category()) << " " << TierStatus_Name(source.default_tier())
                << " " << source.name() << "\n";
    }
    return 0;
  }

  if (cmd == "ops") {
    ListOperationsRequest req;
    req.set_active_only(argc >= 4 && std::string(argv[3]) == "active");

    ListOperationsResponse resp;
    auto                   status = catalog_stub->ListOperations(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& op : resp.operations()) {
      std::cout << op.id() << " " << OperationType_Name(op.type()) << " " << OperationStatus_Name(op.status()) << " " << op.source_id()
                << ":" << op.source_path() << " -> " << op.dest_path() << " " << op.bytes_processed() << "/" << op.file_size();
      if (!op.error().empty()) std::cout << " error=" << op.error();
      std::cout << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------
  // Files
  // ------------------------------------------------------------

  if (cmd == "ls") {
    if (argc < 4) return 1;
    const auto location = ParseLocation(argv[3]);

    ListRequest req;
    req.set_source_id(location.source_id());
    req.set_path(location.path());
    req.set_recursive(argc >= 5 && std::string(argv[4]) == "recursive");

    ListResponse resp;
    auto         status = file_stub->List(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& entry : resp.entries()) {
      std::cout << (entry.is_directory() ? "d " : "- ") << entry.size() << " " << TierStatus_Name(entry.tier_status()) << " "
                << entry.path() << "\n";
    }
    return 0;
  }

  if (cmd == "mv") {
    if (argc < 5) return 1;

    MoveRequest req;
    *req.mutable_from() = ParseLocation(argv[3]);
    *req.mutable_to()   = ParseLocation(argv[4]);

    MoveResponse resp;
    auto         status = file_stub->Move(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "moved to " << resp.dest_path() << " bytes=" << resp.bytes_transferred()
              << " source_deleted=" << (resp.source_deleted() ? "true" : "false") << "\n";
    return 0;
  }

  if (cmd == "cp") {
    if (argc < 5) return 1;

    CopyRequest req;
    *req.mutable_from() = ParseLocation(argv[3]);
    *req.mutable_to()   = ParseLocation(argv[4]);
    req.set_recursive(argc >= 6 && std::string(argv[5]) == "recursive");

    CopyResponse resp;
    auto         status = file_stub->Copy(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "copied to " << resp.dest_path() << " bytes=" << resp.bytes_transferred() << "\n";
    return 0;
  }

  if (cmd == "mv-into" || cmd == "cp-into") {
    if (argc < 5) return 1;
    const auto dest = ParseLocation(argv[3]);

    BatchRequest req;
    req.set_to_source_id(dest.source_id());
    req.set_dest_dir(dest.path());
    for (int i = 4; i < argc; ++i) {
      const auto from = ParseLocation(argv[i]);
      if (!req.from_source_id().empty() && req.from_source_id() != from.source_id()) {
        std::cerr << "all paths must be on one source\n";
        return 1;
      }
      req.set_from_source_id(from.source_id());
      req.add_paths(from.path());
    }

    BatchResult resp;
    auto        status = cmd == "mv-into" ? file_stub->MoveBatch(&ctx, req, &resp) : file_stub->CopyBatch(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintBatch(resp);
    return resp.files_failed() == 0 ? 0 : 3;
  }

  if (cmd == "rename") {
    if (argc < 5) return 1;
    const auto location = ParseLocation(argv[3]);

    RenameRequest req;
    req.set_source_id(location.source_id());
    req.set_from(location.path());
    req.set_to(argv[4]);

    google::protobuf::Empty resp;
    auto                    status = file_stub->Rename(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "renamed\n";
    return 0;
  }

  if (cmd == "rm" || cmd == "mkdir") {
    if (argc < 4) return 1;
    const auto location = ParseLocation(argv[3]);

    PathRequest req;
    req.set_source_id(location.source_id());
    req.set_path(location.path());

    google::protobuf::Empty resp;
    auto status = cmd == "rm" ? file_stub->DeleteRecursive(&ctx, req, &resp) : file_stub->Mkdir(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << (cmd == "rm" ? "deleted\n" : "created\n");
    return 0;
  }

  // ------------------------------------------------------------
  // Transfers
  // ------------------------------------------------------------

  if (cmd == "upload" || cmd == "download") {
    if (argc < 6) return 1;

    EnqueueTransferRequest req;
    req.set_source_id(argv[3]);
    if (cmd == "upload") {
      req.set_local_path(argv[4]);
      req.set_remote_path(argv[5]);
    } else {
      req.set_remote_path(argv[4]);
      req.set_local_path(argv[5]);
    }

    TransferRecord resp;
    auto status = cmd == "upload" ? transfer_stub->EnqueueUpload(&ctx, req, &resp) : transfer_stub->EnqueueDownload(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintTransfer(resp);
    return 0;
  }

  if (cmd == "transfers") {
    ListTransfersRequest req;
    if (argc >= 4) req.set_source_id(argv[3]);

    ListTransfersResponse resp;
    auto                  status = transfer_stub->ListTransfers(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& record : resp.transfers()) PrintTransfer(record);
    return 0;
  }

  if (cmd == "pause" || cmd == "resume" || cmd == "cancel") {
    if (argc < 4) return 1;

    TransferControlRequest req;
    req.set_upload_id(argv[3]);

    google::protobuf::Empty resp;
    grpc::Status            status;
    if (cmd == "pause") {
      status = transfer_stub->PauseTransfer(&ctx, req, &resp);
    } else if (cmd == "resume") {
      status = transfer_stub->ResumeTransfer(&ctx, req, &resp);
    } else {
      status = transfer_stub->CancelTransfer(&ctx, req, &resp);
    }
    if (!status.ok()) return Fail(status);

    std::cout << cmd << " requested\n";
    return 0;
  }

  if (cmd == "watch-transfer") {
    if (argc < 4) return 1;

    TransferControlRequest req;
    req.set_upload_id(argv[3]);

    auto           reader = transfer_stub->WatchTransfer(&ctx, req);
    TransferRecord record;
    while (reader->Read(&record)) PrintTransfer(record);

    auto status = reader->Finish();
    if (!status.ok()) return Fail(status);
    return 0;
  }

  // ------------------------------------------------------------
  // Tiering and transcoding
  // ------------------------------------------------------------

  if (cmd == "warm") {
    if (argc < 4) return 1;
    const auto location = ParseLocation(argv[3]);

    WarmFileRequest req;
    req.set_source_id(location.source_id());
    req.set_file_path(location.path());
    req.set_priority(argc >= 5 ? std::stoi(argv[4]) : 0);

    WarmHandle resp;
    auto       status = tiering_stub->WarmFile(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "request=" << resp.request_id() << " eta=" << resp.estimated_retrieval_sec() << "s\n";
    return 0;
  }

  if (cmd == "watch-warm") {
    WatchWarmRequest req;
    if (argc >= 4) req.set_request_id(argv[3]);

    auto         reader = tiering_stub->WatchWarm(&ctx, req);
    WarmProgress progress;
    while (reader->Read(&progress)) {
      std::cout << progress.request_id() << " " << WarmState_Name(progress.status()) << " " << progress.progress() << "% "
                << progress.file_path();
      if (!progress.error().empty()) std::cout << " error=" << progress.error();
      std::cout << "\n";
    }

    auto status = reader->Finish();
    if (!status.ok()) return Fail(status);
    return 0;
  }

  if (cmd == "tier") {
    if (argc < 5) return 1;

    auto target = ParseTier(argv[3]);
    if (!target.has_value()) {
      std::cerr << "unsupported tier: " << argv[3] << "\n";
      return 1;
    }

    ChangeTierRequest req;
    req.set_target_tier(target.value());
    for (int i = 4; i < argc; ++i) {
      const auto location = ParseLocation(argv[i]);
      req.set_source_id(location.source_id());
      req.add_paths(location.path());
    }

    SyncResult resp;
    auto       status = tiering_stub->ChangeTier(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "synced=" << resp.files_synced() << " skipped=" << resp.files_skipped() << " failed=" << resp.files_failed()
              << " duration_ms=" << resp.duration_ms() << "\n";
    for (const auto& error : resp.errors()) std::cerr << "  error: " << error << "\n";
    return resp.files_failed() == 0 ? 0 : 3;
  }

  if (cmd == "transcode") {
    if (argc < 5) return 1;
    const auto location = ParseLocation(argv[3]);

    TranscodeVideoRequest req;
    req.set_source_id(location.source_id());
    req.set_file_path(location.path());
    req.set_format(argv[4]);

    TranscodeHandle resp;
    auto            status = tiering_stub->TranscodeVideo(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "job=" << resp.job_id() << " output=" << resp.output_path() << "\n";
    return 0;
  }

  if (cmd == "watch-transcode") {
    if (argc < 4) return 1;

    WatchTranscodeRequest req;
    req.set_job_id(argv[3]);

    auto              reader = tiering_stub->WatchTranscode(&ctx, req);
    TranscodeProgress progress;
    while (reader->Read(&progress)) {
      std::cout << TranscodeState_Name(progress.status()) << " " << progress.progress() << "%";
      if (!progress.error().empty()) std::cout << " error=" << progress.error();
      std::cout << "\n";
    }

    auto status = reader->Finish();
    if (!status.ok()) return Fail(status);
    return 0;
  }

  // ------------------------------------------------------------
  // Clipboard
  // ------------------------------------------------------------

  if (cmd == "clip-copy" || cmd == "clip-cut") {
    if (argc < 5) return 1;

    ClipboardSetRequest req;
    req.set_source_id(argv[3]);
    for (int i = 4; i < argc; ++i) req.add_paths(argv[i]);

    google::protobuf::Empty resp;
    auto status = cmd == "clip-copy" ? clipboard_stub->Copy(&ctx, req, &resp) : clipboard_stub->Cut(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << (cmd == "clip-copy" ? "copied " : "cut ") << req.paths_size() << " path(s)\n";
    return 0;
  }

  if (cmd == "paste") {
    if (argc < 4) return 1;
    const auto dest = ParseLocation(argv[3]);

    PasteRequest req;
    req.set_dest_source_id(dest.source_id());
    req.set_dest_path(dest.path());

    BatchResult resp;
    auto        status = clipboard_stub->Paste(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintBatch(resp);
    return resp.files_failed() == 0 ? 0 : 3;
  }

  if (cmd == "paste-native") {
    if (argc < 4) return 1;

    PasteToNativeRequest req;
    req.set_dest_path(argv[3]);

    BatchResult resp;
    auto        status = clipboard_stub->PasteToNative(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintBatch(resp);
    return resp.files_failed() == 0 ? 0 : 3;
  }

  if (cmd == "copy-native") {
    if (argc < 5) return 1;

    CopyForNativeRequest req;
    req.set_source_id(argv[3]);
    for (int i = 4; i < argc; ++i) req.add_paths(argv[i]);

    CopyForNativeResponse resp;
    auto                  status = clipboard_stub->CopyForNative(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << resp.status() << "\n";
    for (const auto& path : resp.exported_paths()) std::cout << "  " << path << "\n";
    return 0;
  }

  if (cmd == "read-native" || cmd == "write-native") {
    NativePaths  resp;
    grpc::Status status;
    if (cmd == "read-native") {
      status = clipboard_stub->ReadNative(&ctx, google::protobuf::Empty(), &resp);
    } else {
      NativePaths req;
      for (int i = 3; i < argc; ++i) req.add_paths(argv[i]);
      status = clipboard_stub->WriteNative(&ctx, req, &resp);
    }
    if (!status.ok()) return Fail(status);

    for (const auto& path : resp.paths()) std::cout << path << "\n";
    return 0;
  }

  if (cmd == "paste-native-into") {
    if (argc < 4) return 1;
    const auto dest = ParseLocation(argv[3]);

    PasteNativeIntoVfsRequest req;
    req.set_dest_source_id(dest.source_id());
    req.set_dest_path(dest.path());
    for (int i = 4; i < argc; ++i) req.add_paths(argv[i]);

    BatchResult resp;
    auto        status = clipboard_stub->PasteNativeIntoVfs(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintBatch(resp);
    return resp.files_failed() == 0 ? 0 : 3;
  }

  if (cmd == "clip-get") {
    GetClipboardResponse resp;
    auto                 status = clipboard_stub->Get(&ctx, google::protobuf::Empty(), &resp);
    if (!status.ok()) return Fail(status);

    if (!resp.has_payload()) {
      std::cout << "empty\n";
      return 0;
    }
    std::cout << ClipboardOperation_Name(resp.payload().operation()) << " from " << resp.payload().source_id() << "\n";
    for (const auto& path : resp.payload().paths()) std::cout << "  " << path << "\n";
    return 0;
  }

  if (cmd == "clip-has") {
    HasFilesResponse resp;
    auto             status = clipboard_stub->HasFiles(&ctx, google::protobuf::Empty(), &resp);
    if (!status.ok()) return Fail(status);

    std::cout << (resp.has_files() ? "true" : "false") << "\n";
    return 0;
  }

  if (cmd == "clip-clear") {
    google::protobuf::Empty resp;
    auto                    status = clipboard_stub->Clear(&ctx, google::protobuf::Empty(), &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "cleared\n";
    return 0;
  }

  Usage();
  return 1;
}
