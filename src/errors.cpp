#include "errors.hpp"

const char* error_kind_name(ErrorKind kind) {
  switch(kind) {
    case ErrorKind::InvalidConfiguration: return "InvalidConfiguration";
    case ErrorKind::SourceNotFound: return "SourceNotFound";
    case ErrorKind::Unauthorized: return "Unauthorized";
    case ErrorKind::ItemNotFound: return "ItemNotFound";
    case ErrorKind::IOFailure: return "IOFailure";
  }
  return "Unknown";
}
