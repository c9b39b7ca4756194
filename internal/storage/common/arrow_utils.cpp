#include "arrow_utils.hpp"

#include <arrow/filesystem/azurefs.h>
#include <arrow/filesystem/gcsfs.h>
#include <arrow/filesystem/localfs.h>
#include <arrow/filesystem/s3fs.h>
#include <arrow/util/io_util.h>

#include <cerrno>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace tierbridge::storage::common {

namespace {

bool Contains(const std::string& haystack, const char* needle) {
  return haystack.find(needle) != std::string::npos;
}

} // namespace

void ThrowStatus(const arrow::Status& status) {
  const auto message = status.ToString();
  const int  err     = arrow::internal::ErrnoFromStatus(status);

  switch (err) {
    case EACCES:
    case EPERM:
      throw util::PermissionDenied(message);
    case ENOSPC:
    case EDQUOT:
      throw util::DestinationFull(message);
    case ENOENT:
      throw util::NotFound(message);
    case EEXIST:
      throw util::AlreadyExists(message);
    default:
      break;
  }

  // Cloud filesystems report provider error names instead of errno.
  if (Contains(message, "AccessDenied") || Contains(message, "Forbidden") || Contains(message, "AuthorizationFailure")) {
    throw util::PermissionDenied(message);
  }
  if (Contains(message, "NoSuchKey") || Contains(message, "NoSuchBucket") || Contains(message, "Path does not exist") ||
      Contains(message, "not found")) {
    throw util::NotFound(message);
  }
  if (Contains(message, "QuotaExceeded") || Contains(message, "InsufficientStorage")) {
    throw util::DestinationFull(message);
  }
  if (status.IsInvalid()) {
    throw std::invalid_argument(message);
  }
  throw std::runtime_error(message);
}

arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(
    const std::string& uri, const tierbridge::runtime::config::FileSystemOptions& filesystem_options) {
  using tierbridge::runtime::config::FileSystemOptions;

  std::string resolved_path = uri;

  auto resolve_uri_path = [&resolved_path]() -> arrow::Status {
    ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::FileSystemFromUri(resolved_path, &resolved_path));
    return arrow::Status::OK();
  };

  switch (filesystem_options.options_case()) {
    case FileSystemOptions::kS3: {
      const auto& proto_options = filesystem_options.s3();
      auto        options       = arrow::fs::S3Options::Defaults();
      if (!proto_options.access_key().empty()) {
        options.ConfigureAccessKey(proto_options.access_key(), proto_options.secret_key(), proto_options.session_token());
      } else if (!proto_options.role_arn().empty()) {
        options.ConfigureAssumeRoleCredentials(proto_options.role_arn());
      }
      options.region                   = proto_options.region();
      options.endpoint_override        = proto_options.endpoint_override();
      options.force_virtual_addressing = proto_options.force_virtual_addressing();
      if (!proto_options.scheme().empty()) {
        options.scheme = proto_options.scheme();
      }
      if (proto_options.connect_timeout() > 0) {
        options.connect_timeout = proto_options.connect_timeout();
      }
      if (proto_options.request_timeout() > 0) {
        options.request_timeout = proto_options.request_timeout();
      }

      ARROW_RETURN_NOT_OK(resolve_uri_path());
      ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::S3FileSystem::Make(options));
      return std::make_pair(std::shared_ptr<arrow::fs::FileSystem>(std::move(fs)), resolved_path);
    }
    case FileSystemOptions::kGcs: {
      const auto& proto_options = filesystem_options.gcs();

      arrow::fs::GcsOptions options = arrow::fs::GcsOptions::Defaults();
      if (proto_options.anonymous()) {
        options = arrow::fs::GcsOptions::Anonymous();
      } else if (!proto_options.json_credentials().empty()) {
        options = arrow::fs::GcsOptions::FromServiceAccountCredentials(proto_options.json_credentials());
      }

      options.endpoint_override = proto_options.endpoint_override();
      if (!proto_options.scheme().empty()) {
        options.scheme = proto_options.scheme();
      }
      if (!proto_options.project_id().empty()) {
        options.project_id = proto_options.project_id();
      }

      ARROW_RETURN_NOT_OK(resolve_uri_path());
      ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::GcsFileSystem::Make(options));
      return std::make_pair(std::shared_ptr<arrow::fs::FileSystem>(std::move(fs)), resolved_path);
    }
    case FileSystemOptions::kAzure: {
      const auto&             proto_options = filesystem_options.azure();
      arrow::fs::AzureOptions options;
      options.account_name = proto_options.account_name();
      if (!proto_options.blob_storage_authority().empty()) {
        options.blob_storage_authority = proto_options.blob_storage_authority();
      }
      if (!proto_options.blob_storage_scheme().empty()) {
        options.blob_storage_scheme = proto_options.blob_storage_scheme();
      }

      if (!proto_options.account_key().empty()) {
        ARROW_RETURN_NOT_OK(options.ConfigureAccountKeyCredential(proto_options.account_key()));
      } else if (!proto_options.sas_token().empty()) {
        ARROW_RETURN_NOT_OK(options.ConfigureSASCredential(proto_options.sas_token()));
      } else {
        ARROW_RETURN_NOT_OK(options.ConfigureDefaultCredential());
      }

      ARROW_RETURN_NOT_OK(resolve_uri_path());
      ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::AzureFileSystem::Make(options));
      return std::make_pair(std::shared_ptr<arrow::fs::FileSystem>(std::move(fs)), resolved_path);
    }
    case FileSystemOptions::OPTIONS_NOT_SET:
      break;
  }

  ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::FileSystemFromUriOrPath(uri, &resolved_path));
  return std::make_pair(std::move(fs), resolved_path);
}

} // namespace tierbridge::storage::common
