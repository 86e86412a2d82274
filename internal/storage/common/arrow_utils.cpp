#include "arrow_utils.hpp"

#include <arrow/filesystem/localfs.h>

namespace callscribe::storage::common {

arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(const std::string& uri) {
  if (uri.empty()) {
    return arrow::Status::Invalid("filesystem root must not be empty");
  }
  std::string resolved_path;
  ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::FileSystemFromUriOrPath(uri, &resolved_path));
  return std::make_pair(std::move(fs), resolved_path);
}

std::string JoinPath(const std::string& root, const std::string& key) {
  if (root.empty()) {
    return key;
  }
  if (root.back() == '/') {
    return root + key;
  }
  return root + "/" + key;
}

void ValidateKeyComponent(const std::string& component) {
  if (component.empty()) {
    throw std::invalid_argument("storage key component must not be empty");
  }
  for (char c : component) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw std::invalid_argument("storage key component contains invalid character: " + component);
    }
  }
  if (component == "." || component == "..") {
    throw std::invalid_argument("storage key component must not be a relative path component");
  }
}

} // namespace callscribe::storage::common
