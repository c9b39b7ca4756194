#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "internal/clipboard/clipboard_manager.hpp"
#include "internal/grpc/clipboard_server.hpp"
#include "internal/grpc/file_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/transfer_server.hpp"
#include "internal/service/clipboard_service.hpp"
#include "internal/service/file_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/transfer_service.hpp"
#include "internal/util/errors.hpp"
#include "tests/unit/test_stack.hpp"
#include "tierbridge/vfs/v1.hpp"

namespace {

using tierbridge::grpc::ToStatus;
using tierbridge::testing::FaultyDriver;
using tierbridge::testing::Put;
using tierbridge::testing::Stack;

tierbridge::service::ServiceContext BuildServiceContext(Stack& s) {
  tierbridge::service::ServiceContext ctx;
  ctx.repository = s.repository;
  ctx.registry   = s.registry;
  ctx.transfers  = s.transfers;
  ctx.tiering    = s.tiering;
  ctx.ledger     = s.ledger;
  ctx.files      = s.files;
  ctx.clipboard  = std::make_shared<tierbridge::clipboard::ClipboardManager>(s.registry, s.files, nullptr, s.host,
                                                                              tierbridge::runtime::config::ClipboardConfig{});
  return ctx;
}

void TestExceptionMapping() {
  using namespace tierbridge::util;

  assert(ToStatus(SourceNotFound("s3")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(AlreadyExists("x")).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  assert(ToStatus(ClipboardEmpty()).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(PermissionDenied("x")).error_code() == ::grpc::StatusCode::PERMISSION_DENIED);
  assert(ToStatus(DestinationFull("x")).error_code() == ::grpc::StatusCode::RESOURCE_EXHAUSTED);
  assert(ToStatus(std::invalid_argument("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(std::runtime_error("x")).error_code() == ::grpc::StatusCode::INTERNAL);

  const auto retrieval = ToStatus(RetrievalRequired(43200));
  assert(retrieval.error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(retrieval.error_details() == "43200");
}

void TestMoveMissingFileReturnsNotFound() {
  Stack                         s;
  tierbridge::grpc::FileServer server(std::make_shared<tierbridge::service::FileService>(BuildServiceContext(s)));

  tierbridge::vfs::v1::MoveRequest req;
  req.mutable_from()->set_source_id("disk");
  req.mutable_from()->set_path("/missing.txt");
  req.mutable_to()->set_source_id("disk");
  req.mutable_to()->set_path("/elsewhere.txt");
  tierbridge::vfs::v1::MoveResponse resp;
  ::grpc::ServerContext              grpc_ctx;

  assert(server.Move(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);

  req.mutable_from()->set_source_id("");
  assert(server.Move(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  Put(*s.disk, "/here.txt", "h");
  req.mutable_from()->set_source_id("disk");
  req.mutable_from()->set_path("/here.txt");
  assert(server.Move(&grpc_ctx, &req, &resp).ok());
  assert(resp.source_deleted());
  assert(resp.dest_path() == "/elsewhere.txt");
}

void TestPasteEmptyClipboardFailsPrecondition() {
  Stack                             s;
  tierbridge::grpc::ClipboardServer server(std::make_shared<tierbridge::service::ClipboardService>(BuildServiceContext(s)));

  tierbridge::vfs::v1::PasteRequest req;
  req.set_dest_source_id("disk");
  req.set_dest_path("/");
  tierbridge::vfs::v1::BatchResult resp;
  ::grpc::ServerContext            grpc_ctx;

  assert(server.Paste(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

void TestDownloadOfColdFileReportsRetrievalEstimate() {
  Stack s;
  Put(*s.bucket, "/cold.bin", "frozen");
  tierbridge::grpc::TransferServer server(std::make_shared<tierbridge::service::TransferService>(BuildServiceContext(s)));

  tierbridge::vfs::v1::EnqueueTransferRequest req;
  req.set_source_id("bucket");
  req.set_remote_path("/cold.bin");
  req.set_local_path(s.dir / "cold.bin");
  tierbridge::vfs::v1::TransferRecord resp;
  ::grpc::ServerContext               grpc_ctx;

  const auto status = server.EnqueueDownload(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(status.error_details() == "0");

  req.set_source_id("nowhere");
  assert(server.EnqueueDownload(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestCrossSourceCopyReportsPermissionDenied() {
  Stack s;
  auto  vault = std::make_shared<FaultyDriver>(tierbridge::testing::BucketDriver());
  tierbridge::testing::Mount(*s.registry, "vault", tierbridge::vfs::core::v1::SOURCE_CATEGORY_CLOUD, vault,
                             {tierbridge::vfs::core::v1::CAPABILITY_MULTIPART_UPLOAD});
  vault->FailWrites(10, [] { throw tierbridge::util::PermissionDenied("write access denied"); });
  Put(*s.disk, "/report.pdf", "quarterly numbers");

  tierbridge::grpc::FileServer server(std::make_shared<tierbridge::service::FileService>(BuildServiceContext(s)));

  tierbridge::vfs::v1::CopyRequest req;
  req.mutable_from()->set_source_id("disk");
  req.mutable_from()->set_path("/report.pdf");
  req.mutable_to()->set_source_id("vault");
  req.mutable_to()->set_path("/report.pdf");
  tierbridge::vfs::v1::CopyResponse resp;
  ::grpc::ServerContext             grpc_ctx;

  const auto status = server.Copy(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::PERMISSION_DENIED);
  assert(status.error_message() == "write access denied");

  vault->FailWrites(10, [] { throw tierbridge::util::DestinationFull("quota exceeded"); });
  assert(server.Copy(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::RESOURCE_EXHAUSTED);
}

} // namespace

int main() {
  TestExceptionMapping();
  TestMoveMissingFileReturnsNotFound();
  TestPasteEmptyClipboardFailsPrecondition();
  TestDownloadOfColdFileReportsRetrievalEstimate();
  TestCrossSourceCopyReportsPermissionDenied();

  std::cout << "tierbridge_unit_grpc_status: pass\n";
  return 0;
}
