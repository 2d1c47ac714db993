#include "json_file_store.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <utility>

namespace chatgen {
namespace {

class FileLock {
 public:
  explicit FileLock(const std::string& path) {
    fd_ = ::open(path.c_str(), O_CREAT | O_RDWR, 0644);
    if (fd_ < 0) {
      error_ = std::string("open lock failed: ") + std::strerror(errno);
      return;
    }
    struct flock fl{};
    fl.l_type = F_WRLCK;
    fl.l_whence = SEEK_SET;
    fl.l_start = 0;
    fl.l_len = 0;
    while (::fcntl(fd_, F_SETLKW, &fl) == -1) {
      if (errno == EINTR) continue;
      error_ = std::string("lock failed: ") + std::strerror(errno);
      ::close(fd_);
      fd_ = -1;
      return;
    }
  }

  ~FileLock() {
    if (fd_ < 0) return;
    struct flock fl{};
    fl.l_type = F_UNLCK;
    fl.l_whence = SEEK_SET;
    fl.l_start = 0;
    fl.l_len = 0;
    ::fcntl(fd_, F_SETLK, &fl);
    ::close(fd_);
  }

  FileLock(const FileLock&) = delete;
  FileLock& operator=(const FileLock&) = delete;

  bool ok() const { return fd_ >= 0; }
  const std::string& error() const { return error_; }

 private:
  int fd_ = -1;
  std::string error_;
};

static bool EnsureParentDir(const std::string& path, std::string* err) {
  const auto dir = std::filesystem::path(path).parent_path();
  if (dir.empty()) return true;
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    if (err) *err = "create_directories failed: " + ec.message();
    return false;
  }
  return true;
}

}  // namespace

JsonFileDocument::JsonFileDocument(std::string path) : path_(std::move(path)) {}

bool JsonFileDocument::Load(nlohmann::json* out, std::string* err) const {
  *out = nlohmann::json::object();
  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) return true;
  std::ifstream in(path_, std::ios::binary);
  if (!in) {
    if (err) *err = "cannot open " + path_;
    return false;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  const auto body = ss.str();
  if (body.empty()) return true;
  auto j = nlohmann::json::parse(body, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    if (err) *err = "corrupt store document: " + path_;
    return false;
  }
  *out = std::move(j);
  return true;
}

bool JsonFileDocument::Persist(const nlohmann::json& doc, std::string* err) const {
  std::filesystem::path path(path_);
  auto tmp = path;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      if (err) *err = "cannot write " + tmp.string();
      return false;
    }
    out << doc.dump();
    out.flush();
    if (!out) {
      if (err) *err = "short write " + tmp.string();
      return false;
    }
  }
  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    std::filesystem::remove(tmp, ec);
    if (err) *err = "rename failed: " + path_;
    return false;
  }
  return true;
}

bool JsonFileDocument::Mutate(const std::function<bool(nlohmann::json&)>& fn, std::string* err) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!EnsureParentDir(path_, err)) return false;
  FileLock file_lock(path_ + ".lock");
  if (!file_lock.ok()) {
    if (err) *err = file_lock.error();
    return false;
  }
  nlohmann::json doc;
  if (!Load(&doc, err)) return false;
  if (!fn(doc)) return true;
  return Persist(doc, err);
}

bool JsonFileDocument::Read(const std::function<void(const nlohmann::json&)>& fn, std::string* err) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!EnsureParentDir(path_, err)) return false;
  FileLock file_lock(path_ + ".lock");
  if (!file_lock.ok()) {
    if (err) *err = file_lock.error();
    return false;
  }
  nlohmann::json doc;
  if (!Load(&doc, err)) return false;
  fn(doc);
  return true;
}

}  // namespace chatgen
