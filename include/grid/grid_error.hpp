#ifndef GRIDSTORE_GRID_ERROR_HPP
#define GRIDSTORE_GRID_ERROR_HPP

#include <stdexcept>
#include <string>

namespace gridstore::grid {

class GridError : public std::runtime_error {
public:
  explicit GridError(const std::string& message)
    : std::runtime_error(message) {}
};

// Raised when the checksum the store recomputes over the written chunks
// differs from the checksum of the file that was written
class InvalidFile : public GridError {
public:
  InvalidFile(const std::string& client_md5, const std::string& server_md5)
    : GridError("File MD5 on client side is " + client_md5 +
                " but the server reported " + server_md5 + ".")
    , client_md5_(client_md5)
    , server_md5_(server_md5) {}

  const std::string& client_md5() const { return client_md5_; }
  const std::string& server_md5() const { return server_md5_; }

private:
  std::string client_md5_;
  std::string server_md5_;
};

} // namespace gridstore::grid

#endif // GRIDSTORE_GRID_ERROR_HPP
