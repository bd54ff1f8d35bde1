#pragma once
#include "../core/errors.hpp"
#include "../core/sample.hpp"
#include <cerrno>
#include <cstring>
#include <string>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

/**
 * @brief Durability options for the append path
 */
struct AppendOptions {
  bool fsync{false};  ///< fsync() the file after the line is written
  bool lock{false};   ///< Hold an exclusive flock() for the duration of the write
};

/**
 * @brief Owned POSIX file descriptor, closed on scope exit
 */
class FileHandle {
  int fd_{-1};

public:
  explicit FileHandle(int fd) : fd_(fd) {}
  ~FileHandle() {
    if (fd_ >= 0) ::close(fd_);
  }
  FileHandle(const FileHandle&) = delete;
  FileHandle& operator=(const FileHandle&) = delete;

  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }

  /**
   * @brief Close now and report the result
   * @return 0 on success, errno otherwise
   */
  int close() {
    int rc = ::close(fd_);
    fd_ = -1;
    return rc == 0 ? 0 : errno;
  }
};

/**
 * @brief Appends serialized samples to the record log
 *
 * The log is append-only: the file is opened with O_APPEND | O_CREAT and is
 * never truncated, except to roll back a failed write. The whole line is
 * formatted in memory first and handed to the kernel as a single write, so
 * on a local filesystem concurrent appenders see complete lines.
 *
 * A write that fails part-way is rolled back to the length the file had
 * before it. Under the advisory lock this is always done. Without the lock
 * it is only done when the file grew by exactly the bytes this call wrote;
 * if another process appended in between, the partial line is left in place
 * and reported in the error.
 *
 * Target "-" sends the line to standard output instead of a file.
 */
class RecordAppender {
public:
  static constexpr const char* DEFAULT_PATH = "records.tsv";
  static constexpr const char* STDOUT_TARGET = "-";

private:
  AppendOptions options_;

  static std::string errno_text(int err) {
    return std::strerror(err);
  }

  /**
   * @brief Write the whole buffer, continuing after short writes
   * @param written Set to the number of bytes that reached the file
   * @return 0 on success, errno otherwise
   */
  static int write_fully(int fd, const std::string& data, std::size_t& written) {
    const char* p = data.data();
    std::size_t left = data.size();
    written = 0;
    while (left > 0) {
      ssize_t n = ::write(fd, p, left);
      if (n < 0) {
        if (errno == EINTR) continue;
        return errno;
      }
      if (n == 0) return EIO;
      p += n;
      left -= static_cast<std::size_t>(n);
      written += static_cast<std::size_t>(n);
    }
    return 0;
  }

  static off_t file_size(int fd, const std::string& target) {
    struct stat st;
    if (::fstat(fd, &st) < 0) {
      throw IoError("cannot stat " + target + ": " + errno_text(errno));
    }
    return st.st_size;
  }

  /**
   * @brief Undo a partial line after a failed write
   * @return Empty on success, otherwise why the partial line was left
   */
  std::string roll_back(int fd, off_t size_before, std::size_t written) const {
    if (written == 0) return {};
    if (!options_.lock) {
      struct stat st;
      if (::fstat(fd, &st) < 0) {
        return "stat failed: " + errno_text(errno);
      }
      if (st.st_size != size_before + static_cast<off_t>(written)) {
        return "log grew concurrently";
      }
    }
    if (::ftruncate(fd, size_before) < 0) {
      return "truncate failed: " + errno_text(errno);
    }
    return {};
  }

  std::size_t append_to_stdout(const std::string& line) const {
    std::size_t written = 0;
    int err = write_fully(STDOUT_FILENO, line, written);
    if (err != 0) {
      throw IoError("write to stdout failed: " + errno_text(err));
    }
    return line.size();
  }

public:
  explicit RecordAppender(AppendOptions options = AppendOptions{}) : options_(options) {}

  /**
   * @brief Append one record line for the sample
   * @param sample Fully populated sample; never modified
   * @param target Log file path, or "-" for standard output
   * @return Number of bytes written
   * @throws IoError if the target cannot be opened, locked, written or synced
   */
  std::size_t append(const Sample& sample, const std::string& target) const {
    if (target.empty()) {
      throw IoError("log path is empty");
    }
    const std::string line = to_record_line(sample);
    if (target == STDOUT_TARGET) {
      return append_to_stdout(line);
    }

    FileHandle file(::open(target.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644));
    if (!file.valid()) {
      throw IoError("cannot open " + target + ": " + errno_text(errno));
    }

    if (options_.lock) {
      while (::flock(file.get(), LOCK_EX) < 0) {
        if (errno != EINTR) {
          throw IoError("cannot lock " + target + ": " + errno_text(errno));
        }
      }
    }
    const off_t size_before = file_size(file.get(), target);

    std::size_t written = 0;
    int err = write_fully(file.get(), line, written);
    if (err != 0) {
      std::string msg = "write to " + target + " failed: " + errno_text(err);
      std::string left = roll_back(file.get(), size_before, written);
      if (!left.empty()) {
        msg += " (partial line left, " + left + ")";
      }
      throw IoError(msg);
    }

    if (options_.fsync && ::fsync(file.get()) < 0) {
      throw IoError("fsync of " + target + " failed: " + errno_text(errno));
    }

    err = file.close();
    if (err != 0) {
      throw IoError("close of " + target + " failed: " + errno_text(err));
    }
    return line.size();
  }

  /**
   * @brief Drop a sample captured in init-only mode
   *
   * Exists so both run modes consume the sample explicitly. Performs no I/O.
   */
  void discard(const Sample& sample) const {
    (void)sample;
  }

  const AppendOptions& get_options() const {
    return options_;
  }
};
