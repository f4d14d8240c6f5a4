#include "util.h"

#include <cstdio>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace forcegen {

void file_deleter::operator()(std::FILE *file) const noexcept {
  if (file) { static_cast<void>(std::fclose(file)); }
}

file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode) {
  return file_ptr_t{ std::fopen(path.c_str(), mode) };
}

std::vector<unsigned char> util_load_file(std::filesystem::path const &path) {
  auto file{ util_open_file(path, "rb") };
  if (!file) {
    throw std::runtime_error("util_load_file: failed to open file: " + path.string());
  }

  if (std::fseek(file.get(), 0, SEEK_END) != 0) {
    throw std::runtime_error("util_load_file: failed to seek to end: " + path.string());
  }

  long const file_size{ std::ftell(file.get()) };
  if (file_size < 0) {
    throw std::runtime_error("util_load_file: failed to get file size: " + path.string());
  }

  if (std::fseek(file.get(), 0, SEEK_SET) != 0) {
    throw std::runtime_error("util_load_file: failed to seek to start: " + path.string());
  }

  std::vector<unsigned char> buffer(static_cast<size_t>(file_size));
  if (file_size > 0) {
    size_t const bytes_read{ std::fread(buffer.data(), 1, buffer.size(), file.get()) };
    if (bytes_read != buffer.size()) {
      throw std::runtime_error("util_load_file: failed to read entire file: " +
                               path.string());
    }
  }

  return buffer;
}

void util_write_file_atomic(std::filesystem::path const &path, std::string_view content) {
  auto tmp_path{ path };
  tmp_path += ".tmp";
  scoped_path_cleanup tmp_cleanup{ tmp_path };

  {
    auto file{ util_open_file(tmp_path, "wb") };
    if (!file) {
      throw std::runtime_error("util_write_file_atomic: failed to open file: " +
                               tmp_path.string());
    }

    if (!content.empty() &&
        std::fwrite(content.data(), 1, content.size(), file.get()) != content.size()) {
      throw std::runtime_error("util_write_file_atomic: failed to write file: " +
                               tmp_path.string());
    }

    if (std::fflush(file.get()) != 0) {
      throw std::runtime_error("util_write_file_atomic: failed to flush file: " +
                               tmp_path.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    throw std::runtime_error("util_write_file_atomic: failed to rename " +
                             tmp_path.string() + " to " + path.string() + ": " +
                             ec.message());
  }
  tmp_cleanup.reset();  // renamed away, nothing left to remove
}

std::string util_shell_quote(std::string_view s) {
  std::string result;
  result.reserve(s.size() + 2);
  result.push_back('\'');
  for (char const c : s) {
    if (c == '\'') {
      result.append("'\\''");
    } else {
      result.push_back(c);
    }
  }
  result.push_back('\'');
  return result;
}

scoped_path_cleanup::scoped_path_cleanup(std::filesystem::path path)
    : path_{ std::move(path) } {}

scoped_path_cleanup::~scoped_path_cleanup() { cleanup(); }

void scoped_path_cleanup::reset(std::filesystem::path path) {
  cleanup();
  path_ = std::move(path);
}

void scoped_path_cleanup::cleanup() {
  if (path_.empty()) { return; }
  std::error_code ec;
  std::filesystem::remove(path_, ec);
  path_.clear();
}

}  // namespace forcegen
