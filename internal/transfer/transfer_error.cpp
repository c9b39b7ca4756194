#include "transfer_error.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace tierbridge::transfer {

using namespace tierbridge::vfs::core::v1;

TransferErrorCode ClassifyError(const std::exception& e) {
  using namespace tierbridge::util;

  // Subclasses first.
  if (dynamic_cast<const SourceNotFound*>(&e)) return TRANSFER_ERROR_CODE_SOURCE_NOT_FOUND;
  if (dynamic_cast<const NotFound*>(&e)) return TRANSFER_ERROR_CODE_NOT_FOUND;
  if (dynamic_cast<const PermissionDenied*>(&e)) return TRANSFER_ERROR_CODE_PERMISSION_DENIED;
  if (dynamic_cast<const DestinationFull*>(&e)) return TRANSFER_ERROR_CODE_DESTINATION_FULL;
  if (dynamic_cast<const AlreadyExists*>(&e)) return TRANSFER_ERROR_CODE_ALREADY_EXISTS;
  if (dynamic_cast<const InvalidState*>(&e)) return TRANSFER_ERROR_CODE_INVALID_STATE;
  if (dynamic_cast<const std::invalid_argument*>(&e)) return TRANSFER_ERROR_CODE_INVALID_ARGUMENT;
  return TRANSFER_ERROR_CODE_INTERNAL;
}

void ThrowTransferError(TransferErrorCode code, const std::string& message) {
  using namespace tierbridge::util;

  switch (code) {
    case TRANSFER_ERROR_CODE_SOURCE_NOT_FOUND:
    case TRANSFER_ERROR_CODE_NOT_FOUND:
      throw NotFound(message);
    case TRANSFER_ERROR_CODE_PERMISSION_DENIED:
      throw PermissionDenied(message);
    case TRANSFER_ERROR_CODE_DESTINATION_FULL:
      throw DestinationFull(message);
    case TRANSFER_ERROR_CODE_ALREADY_EXISTS:
      throw AlreadyExists(message);
    case TRANSFER_ERROR_CODE_INVALID_STATE:
      throw InvalidState(message);
    case TRANSFER_ERROR_CODE_INVALID_ARGUMENT:
      throw std::invalid_argument(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace tierbridge::transfer
