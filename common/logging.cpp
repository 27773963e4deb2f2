// Async file logger backed by a bounded Vyukov MPMC queue

#include "common/logging.h"
#include "common/thread_utils.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <functional>
#include <mutex>
#include <new>
#include <thread>

namespace Common {

namespace {

// ---------- Runtime-sized Vyukov MPMC bounded queue ----------
class LogQueue {
public:
  struct LogRecord {
    uint64_t wall_nanos{0};
    uint32_t thread_id{0};
    uint16_t level{0};
    uint16_t len{0};
    char msg[Logger::MAX_MSG_SIZE]{};
  };

  explicit LogQueue(std::size_t capacity)
  : size_(roundUpPow2(capacity)),
    mask_(size_ - 1),
    cells_(new Cell[size_]) {
    for (std::size_t i = 0; i < size_; ++i) {
      cells_[i].seq.store(i, std::memory_order_relaxed);
    }
  }

  ~LogQueue() { delete[] cells_; }

  LogQueue(const LogQueue&) = delete;
  LogQueue& operator=(const LogQueue&) = delete;

  bool enqueue(const LogRecord& rec) noexcept {
    std::size_t pos = tail_.load(std::memory_order_relaxed);
    for (;;) {
      Cell& c = cells_[pos & mask_];
      const std::size_t seq = c.seq.load(std::memory_order_acquire);
      const intptr_t diff = static_cast<intptr_t>(seq) - static_cast<intptr_t>(pos);
      if (diff == 0) {
        if (tail_.compare_exchange_weak(pos, pos + 1, std::memory_order_relaxed)) {
          c.data = rec;
          c.seq.store(pos + 1, std::memory_order_release);
          return true;
        }
      } else if (diff < 0) {
        return false; // full
      } else {
        pos = tail_.load(std::memory_order_relaxed);
      }
    }
  }

  bool dequeue(LogRecord& out) noexcept {
    std::size_t pos = head_.load(std::memory_order_relaxed);
    for (;;) {
      Cell& c = cells_[pos & mask_];
      const std::size_t seq = c.seq.load(std::memory_order_acquire);
      const intptr_t diff = static_cast<intptr_t>(seq) - static_cast<intptr_t>(pos + 1);
      if (diff == 0) {
        if (head_.compare_exchange_weak(pos, pos + 1, std::memory_order_relaxed)) {
          out = c.data;
          c.seq.store(pos + size_, std::memory_order_release);
          return true;
        }
      } else if (diff < 0) {
        return false; // empty
      } else {
        pos = head_.load(std::memory_order_relaxed);
      }
    }
  }

  bool empty() const noexcept {
    return head_.load(std::memory_order_acquire) == tail_.load(std::memory_order_acquire);
  }

private:
  struct Cell {
    std::atomic<std::size_t> seq{0};
    LogRecord data{};
  };

  static std::size_t roundUpPow2(std::size_t n) noexcept {
    if (n < 2) return 2;
    --n;
    n |= n >> 1;  n |= n >> 2;  n |= n >> 4;
    n |= n >> 8;  n |= n >> 16; n |= n >> 32;
    return n + 1;
  }

  alignas(CACHE_LINE_SIZE) std::atomic<std::size_t> head_{0};
  alignas(CACHE_LINE_SIZE) std::atomic<std::size_t> tail_{0};
  std::size_t size_;
  std::size_t mask_;
  Cell* cells_;
};

const char* levelToString(uint16_t level) noexcept {
  switch (level) {
    case Logger::DEBUG: return "DEBUG";
    case Logger::INFO:  return "INFO ";
    case Logger::WARN:  return "WARN ";
    case Logger::ERROR: return "ERROR";
    case Logger::FATAL: return "FATAL";
    default: return "UNKN ";
  }
}

// ---------- Async logger implementation ----------
class AsyncLoggerImpl {
public:
  static constexpr std::size_t DEFAULT_CAPACITY = 4096;
  static constexpr int SPIN_BEFORE_WAIT = 200;

  explicit AsyncLoggerImpl(const char* path)
  : file_(nullptr),
    queue_(DEFAULT_CAPACITY),
    writer_thread_(),
    mutex_(),
    cv_(),
    running_(true) {
    std::snprintf(path_, sizeof(path_), "%s", path);

    std::filesystem::path p(path_);
    if (p.has_parent_path()) {
      std::error_code ec;
      std::filesystem::create_directories(p.parent_path(), ec);
      // fopen reports the failure below
    }

    file_ = std::fopen(path_, "a");
    if (!file_) {
      std::fprintf(stderr, "Warning: cannot open log file %s, logging disabled\n", path_);
    } else {
      std::setvbuf(file_, nullptr, _IOFBF, 64 * 1024);
    }

    writer_thread_ = createNamedThread("sk-logger", [this] { writerLoop(); });
  }

  ~AsyncLoggerImpl() {
    running_.store(false, std::memory_order_release);
    cv_.notify_all();
    if (writer_thread_.joinable()) {
      writer_thread_.join();
    }
    if (file_) {
      std::fflush(file_);
      std::fclose(file_);
    }
  }

  AsyncLoggerImpl(const AsyncLoggerImpl&) = delete;
  AsyncLoggerImpl& operator=(const AsyncLoggerImpl&) = delete;

  void log(uint16_t level, const char* msg, std::size_t len) noexcept {
    LogQueue::LogRecord rec{};
    rec.wall_nanos = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
    rec.thread_id = static_cast<uint32_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
    rec.level = level;
    rec.len = static_cast<uint16_t>(std::min(len, sizeof(rec.msg) - 1));
    std::memcpy(rec.msg, msg, rec.len);
    rec.msg[rec.len] = '\0';

    if (UNLIKELY(!queue_.enqueue(rec))) {
      drops_.fetch_add(1, std::memory_order_relaxed);
      return;
    }
    cv_.notify_one();
  }

  Logger::Stats stats() const noexcept {
    Logger::Stats s;
    s.messages_written = written_.load(std::memory_order_relaxed);
    s.messages_dropped = drops_.load(std::memory_order_relaxed);
    s.bytes_written = bytes_.load(std::memory_order_relaxed);
    return s;
  }

private:
  void writerLoop() noexcept {
    LogQueue::LogRecord rec;
    while (running_.load(std::memory_order_acquire) || !queue_.empty()) {
      bool found = false;
      for (int i = 0; i < SPIN_BEFORE_WAIT; ++i) {
        if (!queue_.empty()) {
          found = true;
          break;
        }
        CPU_PAUSE();
      }

      if (!found) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, std::chrono::milliseconds(5), [this] {
          return !running_.load(std::memory_order_acquire) || !queue_.empty();
        });
      }

      while (queue_.dequeue(rec)) {
        if (!file_) continue;
        const auto secs = rec.wall_nanos / 1'000'000'000ULL;
        const auto nanos = rec.wall_nanos % 1'000'000'000ULL;
        const int written = std::fprintf(file_, "[%llu.%09llu][%s][T%u] %s\n",
                                         static_cast<unsigned long long>(secs),
                                         static_cast<unsigned long long>(nanos),
                                         levelToString(rec.level),
                                         rec.thread_id,
                                         rec.msg);
        if (written > 0) {
          written_.fetch_add(1, std::memory_order_relaxed);
          bytes_.fetch_add(static_cast<uint64_t>(written), std::memory_order_relaxed);
        }
      }
      if (file_) std::fflush(file_);
    }
  }

  char path_[512]{};
  FILE* file_;
  LogQueue queue_;
  std::thread writer_thread_;
  std::mutex mutex_;
  std::condition_variable cv_;
  std::atomic<bool> running_;
  alignas(CACHE_LINE_SIZE) std::atomic<uint64_t> drops_{0};
  alignas(CACHE_LINE_SIZE) std::atomic<uint64_t> written_{0};
  alignas(CACHE_LINE_SIZE) std::atomic<uint64_t> bytes_{0};
};

// Placement storage so init/shutdown cycles never touch the heap for the impl
alignas(AsyncLoggerImpl) char g_impl_storage[sizeof(AsyncLoggerImpl)];
std::atomic<AsyncLoggerImpl*> g_logger_impl{nullptr};
std::mutex g_logger_mutex;
std::atomic<uint16_t> g_min_level{Logger::INFO};

void destroyLocked() {
  AsyncLoggerImpl* impl = g_logger_impl.exchange(nullptr, std::memory_order_acq_rel);
  if (impl) {
    impl->~AsyncLoggerImpl();
  }
}

} // namespace

void Logger::enqueue(Level level, const char* msg, size_t len) noexcept {
  AsyncLoggerImpl* impl = g_logger_impl.load(std::memory_order_acquire);
  if (impl) {
    impl->log(static_cast<uint16_t>(level), msg, len);
  }
}

Logger::Level Logger::minLevel() noexcept {
  return static_cast<Level>(g_min_level.load(std::memory_order_relaxed));
}

void Logger::setMinLevel(Level level) noexcept {
  g_min_level.store(static_cast<uint16_t>(level), std::memory_order_relaxed);
}

Logger::Level Logger::parseLevel(const char* name) noexcept {
  if (!name) return INFO;
  if (std::strcmp(name, "DEBUG") == 0) return DEBUG;
  if (std::strcmp(name, "WARN") == 0) return WARN;
  if (std::strcmp(name, "ERROR") == 0) return ERROR;
  if (std::strcmp(name, "FATAL") == 0) return FATAL;
  return INFO;
}

Logger::Stats Logger::getStats() noexcept {
  std::lock_guard<std::mutex> lock(g_logger_mutex);
  AsyncLoggerImpl* impl = g_logger_impl.load(std::memory_order_acquire);
  return impl ? impl->stats() : Stats{};
}

void initLogging(const char* log_file) {
  std::lock_guard<std::mutex> lock(g_logger_mutex);
  destroyLocked();
  auto* impl = new (g_impl_storage) AsyncLoggerImpl(log_file);
  g_logger_impl.store(impl, std::memory_order_release);
}

void shutdownLogging() {
  std::lock_guard<std::mutex> lock(g_logger_mutex);
  destroyLocked();
}

bool isLoggingActive() noexcept {
  return g_logger_impl.load(std::memory_order_acquire) != nullptr;
}

} // namespace Common
