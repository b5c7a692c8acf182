#include <pk3/types.hpp>

namespace pk3 {

std::string_view toString(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::None:
    return "none";
  case ErrorKind::NotFound:
    return "not found";
  case ErrorKind::Format:
    return "format error";
  case ErrorKind::IO:
    return "I/O error";
  case ErrorKind::InvalidArgument:
    return "invalid argument";
  case ErrorKind::AlreadyExists:
    return "already exists";
  }
  return "unknown";
}

} // namespace pk3
