#ifndef NETCP_STORE_STORE_HPP
#define NETCP_STORE_STORE_HPP

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <istream>
#include <stdexcept>
#include <string>

namespace netcp {
namespace store {

// A file opened for sending, with its size and the name announced on the wire
struct SourceFile {
  std::ifstream stream;
  uint64_t size{0};
  std::string name;
};

class FileStore {
public:

  // ---- CONSTRUCTOR ----
  // base_path is the already-resolved directory received files are created in
  explicit FileStore(const std::filesystem::path& base_path);


  // ---- FILE ACCESS ----
  // Opens an already-resolved path for reading; the announced name is its basename
  SourceFile open_for_read(const std::filesystem::path& path) const;
  // Creates (or truncates) base_path/name for writing
  std::ofstream create(const std::string& name) const;


  // ---- QUERY OPERATIONS ----
  // Checks that name is a single plain path component
  static bool is_plain_file_name(const std::string& name);
  // Size found by seeking to the end; the prior read position is restored
  static uint64_t stream_size(std::istream& stream);

private:
  // ---- PARAMETERS ----
  std::filesystem::path base_path_;


  // Resolves name under base_path_, throws StoreError if name is not a plain file name
  std::filesystem::path resolve(const std::string& name) const;
};

class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace store
} // namespace netcp

#endif // NETCP_STORE_STORE_HPP
