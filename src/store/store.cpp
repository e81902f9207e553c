#include "store/store.hpp"
#include "utils/utf8.hpp"
#include <boost/log/trivial.hpp>

namespace netcp {
namespace store {

//==============================================
// CONSTRUCTOR
//==============================================

FileStore::FileStore(const std::filesystem::path& base_path) : base_path_(base_path) {
  BOOST_LOG_TRIVIAL(info) << "Store: Initializing FileStore with base path: " << base_path_.string();
}


//==============================================
// FILE ACCESS
//==============================================

SourceFile FileStore::open_for_read(const std::filesystem::path& path) const {
  BOOST_LOG_TRIVIAL(debug) << "Store: Opening file for reading: " << path.string();

  SourceFile file;
  file.name = path.filename().string();
  if (file.name.empty() || !utils::is_valid_utf8(file.name)) {
    BOOST_LOG_TRIVIAL(error) << "Store: File name is not valid UTF-8: " << path.string();
    throw StoreError("Couldn't convert filename to utf8");
  }

  std::error_code ec;
  if (std::filesystem::is_directory(path, ec)) {
    BOOST_LOG_TRIVIAL(error) << "Store: Path is a directory: " << path.string();
    throw StoreError("File doesn't exist or is not accessible (" + path.string() + ")");
  }

  // Open in binary mode so the byte count matches the file size on every platform
  file.stream.open(path, std::ios::binary);
  if (!file.stream) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to open file: " << path.string();
    throw StoreError("File doesn't exist or is not accessible (" + path.string() + ")");
  }

  file.size = stream_size(file.stream);
  BOOST_LOG_TRIVIAL(info) << "Store: Opened " << file.name << " (" << file.size << " bytes)";
  return file;
}

std::ofstream FileStore::create(const std::string& name) const {
  std::filesystem::path file_path = resolve(name);
  BOOST_LOG_TRIVIAL(debug) << "Store: Creating file: " << file_path.string();

  std::ofstream file(file_path, std::ios::binary | std::ios::trunc);
  if (!file) {
    BOOST_LOG_TRIVIAL(warning) << "Store: Failed to create file: " << file_path.string();
    throw StoreError("Couldn't create file " + name);
  }

  BOOST_LOG_TRIVIAL(info) << "Store: Created file: " << file_path.string();
  return file;
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool FileStore::is_plain_file_name(const std::string& name) {
  if (name.empty() || name == "." || name == "..") {
    return false;
  }
  return name.find_first_of(std::string("/\\\0", 3)) == std::string::npos;
}

uint64_t FileStore::stream_size(std::istream& stream) {
  std::istream::pos_type current = stream.tellg();
  stream.seekg(0, std::ios::end);
  std::istream::pos_type end = stream.tellg();
  stream.seekg(current);

  if (current == std::istream::pos_type(-1) || end == std::istream::pos_type(-1) || !stream) {
    BOOST_LOG_TRIVIAL(error) << "Store: File seeking failed";
    throw StoreError("File seeking failed");
  }
  return static_cast<uint64_t>(end);
}

std::filesystem::path FileStore::resolve(const std::string& name) const {
  if (!is_plain_file_name(name)) {
    BOOST_LOG_TRIVIAL(warning) << "Store: Rejecting file name that is not a plain file name: " << name;
    throw StoreError("Couldn't create file " + name);
  }
  return base_path_ / name;
}

} // namespace store
} // namespace netcp
