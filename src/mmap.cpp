#include <format>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

#include <bigarc/mmap.hpp>

#ifdef _WIN32
#include <windows.h>
#else
#include <cerrno>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace bigarc {

namespace {

std::string systemErrorText() {
#ifdef _WIN32
  return std::system_category().message(static_cast<int>(GetLastError()));
#else
  return std::generic_category().message(errno);
#endif
}

} // namespace

MappedFile::~MappedFile() {
  release();
}

MappedFile::MappedFile(MappedFile &&other) noexcept
    :
#ifdef _WIN32
      fileHandle_(std::exchange(other.fileHandle_, nullptr)),
      mappingHandle_(std::exchange(other.mappingHandle_, nullptr)),
#else
      fd_(std::exchange(other.fd_, -1)),
#endif
      data_(std::exchange(other.data_, nullptr)), size_(std::exchange(other.size_, 0)),
      access_(std::exchange(other.access_, Access::Read)), path_(std::move(other.path_)) {
  other.path_.clear();
}

MappedFile &MappedFile::operator=(MappedFile &&other) noexcept {
  if (this == &other) {
    return *this;
  }
  release();
#ifdef _WIN32
  fileHandle_ = std::exchange(other.fileHandle_, nullptr);
  mappingHandle_ = std::exchange(other.mappingHandle_, nullptr);
#else
  fd_ = std::exchange(other.fd_, -1);
#endif
  data_ = std::exchange(other.data_, nullptr);
  size_ = std::exchange(other.size_, 0);
  access_ = std::exchange(other.access_, Access::Read);
  path_ = std::move(other.path_);
  other.path_.clear();
  return *this;
}

bool MappedFile::fail(Error *outError, ErrorCode code, std::string_view what,
                      bool withSystemError) {
  std::string reason = withSystemError ? systemErrorText() : std::string();
  std::string message = reason.empty()
                            ? std::format("{}: {}", what, path_.string())
                            : std::format("{}: {} ({})", what, path_.string(), reason);
  detail::setError(outError, code, std::move(message), path_.string());
  release();
  return false;
}

bool MappedFile::failCreated(Error *outError, std::string_view what) {
  fail(outError, ErrorCode::Io, what);
  discard();
  return false;
}

bool MappedFile::openRead(const std::filesystem::path &path, Error *outError) {
  release();
  path_ = path;
  access_ = Access::Read;

#ifdef _WIN32
  fileHandle_ = CreateFileW(path.c_str(), GENERIC_READ, FILE_SHARE_READ, nullptr, OPEN_EXISTING,
                            FILE_ATTRIBUTE_NORMAL, nullptr);
  if (fileHandle_ == INVALID_HANDLE_VALUE) {
    fileHandle_ = nullptr;
    return fail(outError, ErrorCode::Io, "Cannot open archive");
  }

  LARGE_INTEGER fileSize;
  if (!GetFileSizeEx(static_cast<HANDLE>(fileHandle_), &fileSize)) {
    return fail(outError, ErrorCode::Io, "Cannot stat archive");
  }
  if (fileSize.QuadPart == 0) {
    return fail(outError, ErrorCode::AttemptCreateEmpty, "Archive file is empty", false);
  }
  size_ = static_cast<size_t>(fileSize.QuadPart);

  mappingHandle_ =
      CreateFileMappingW(static_cast<HANDLE>(fileHandle_), nullptr, PAGE_READONLY, 0, 0, nullptr);
  if (!mappingHandle_) {
    return fail(outError, ErrorCode::Io, "Cannot map archive");
  }
  data_ = MapViewOfFile(static_cast<HANDLE>(mappingHandle_), FILE_MAP_READ, 0, 0, 0);
  if (!data_) {
    return fail(outError, ErrorCode::Io, "Cannot map archive");
  }
#else
  fd_ = ::open(path.c_str(), O_RDONLY);
  if (fd_ < 0) {
    return fail(outError, ErrorCode::Io, "Cannot open archive");
  }

  struct stat st;
  if (::fstat(fd_, &st) < 0) {
    return fail(outError, ErrorCode::Io, "Cannot stat archive");
  }
  if (S_ISDIR(st.st_mode)) {
    return fail(outError, ErrorCode::Io, "Archive path is a directory", false);
  }
  if (st.st_size == 0) {
    return fail(outError, ErrorCode::AttemptCreateEmpty, "Archive file is empty", false);
  }
  size_ = static_cast<size_t>(st.st_size);

  void *mapped = ::mmap(nullptr, size_, PROT_READ, MAP_PRIVATE, fd_, 0);
  if (mapped == MAP_FAILED) {
    return fail(outError, ErrorCode::Io, "Cannot map archive");
  }
  data_ = mapped;
#endif

  return true;
}

bool MappedFile::openWrite(const std::filesystem::path &path, size_t size, Error *outError) {
  release();
  path_ = path;
  access_ = Access::Write;

  if (size == 0) {
    return fail(outError, ErrorCode::AttemptCreateEmpty, "Refusing to map a zero-byte output",
                false);
  }

#ifdef _WIN32
  fileHandle_ = CreateFileW(path.c_str(), GENERIC_READ | GENERIC_WRITE, 0, nullptr, CREATE_ALWAYS,
                            FILE_ATTRIBUTE_NORMAL, nullptr);
  if (fileHandle_ == INVALID_HANDLE_VALUE) {
    fileHandle_ = nullptr;
    return fail(outError, ErrorCode::Io, "Cannot create archive");
  }

  LARGE_INTEGER fileSize;
  fileSize.QuadPart = static_cast<LONGLONG>(size);
  if (!SetFilePointerEx(static_cast<HANDLE>(fileHandle_), fileSize, nullptr, FILE_BEGIN) ||
      !SetEndOfFile(static_cast<HANDLE>(fileHandle_))) {
    return failCreated(outError, "Cannot size archive");
  }
  size_ = size;

  mappingHandle_ =
      CreateFileMappingW(static_cast<HANDLE>(fileHandle_), nullptr, PAGE_READWRITE, 0, 0, nullptr);
  if (!mappingHandle_) {
    return failCreated(outError, "Cannot map archive for writing");
  }
  data_ = MapViewOfFile(static_cast<HANDLE>(mappingHandle_), FILE_MAP_WRITE, 0, 0, 0);
  if (!data_) {
    return failCreated(outError, "Cannot map archive for writing");
  }
#else
  fd_ = ::open(path.c_str(), O_RDWR | O_CREAT | O_TRUNC, 0644);
  if (fd_ < 0) {
    return fail(outError, ErrorCode::Io, "Cannot create archive");
  }
  if (::ftruncate(fd_, static_cast<off_t>(size)) < 0) {
    return failCreated(outError, "Cannot size archive");
  }
  size_ = size;

  void *mapped = ::mmap(nullptr, size_, PROT_READ | PROT_WRITE, MAP_SHARED, fd_, 0);
  if (mapped == MAP_FAILED) {
    return failCreated(outError, "Cannot map archive for writing");
  }
  data_ = mapped;
#endif

  return true;
}

bool MappedFile::flush(Error *outError) {
  if (!data_ || access_ != Access::Write) {
    detail::setError(outError, ErrorCode::Io,
                     std::format("Not open for writing: {}", path_.string()), path_.string());
    return false;
  }

#ifdef _WIN32
  bool synced = FlushViewOfFile(data_, 0) && FlushFileBuffers(static_cast<HANDLE>(fileHandle_));
#else
  bool synced = ::msync(data_, size_, MS_SYNC) == 0;
#endif
  if (!synced) {
    detail::setError(outError, ErrorCode::Io,
                     std::format("Cannot flush archive: {} ({})", path_.string(),
                                 systemErrorText()),
                     path_.string());
    return false;
  }
  return true;
}

void MappedFile::close() {
  release();
}

void MappedFile::discard() {
  bool created = access_ == Access::Write && !path_.empty();
  std::filesystem::path target = path_;
  release();
  if (!created) {
    return;
  }

  std::error_code ec;
  std::filesystem::remove(target, ec);
  if (ec) {
    spdlog::warn("Failed to remove incomplete archive {}: {}", target.string(), ec.message());
  }
}

void MappedFile::release() noexcept {
  if (data_) {
#ifdef _WIN32
    UnmapViewOfFile(data_);
#else
    ::munmap(data_, size_);
#endif
    data_ = nullptr;
  }

#ifdef _WIN32
  if (mappingHandle_) {
    CloseHandle(static_cast<HANDLE>(mappingHandle_));
    mappingHandle_ = nullptr;
  }
  if (fileHandle_) {
    CloseHandle(static_cast<HANDLE>(fileHandle_));
    fileHandle_ = nullptr;
  }
#else
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
#endif

  size_ = 0;
}

} // namespace bigarc
