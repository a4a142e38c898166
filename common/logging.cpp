// logging.cpp - Async file logger on a bounded Vyukov MPMC queue

#include "logging.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <strings.h>

#include "time_utils.h"

namespace Common {

// ---------- Runtime-sized Vyukov MPMC bounded queue ----------
class MPMCQueue {
public:
  static constexpr std::size_t MAX_CAPACITY = 65536;

  MPMCQueue(const MPMCQueue&) = delete;
  MPMCQueue& operator=(const MPMCQueue&) = delete;

  struct LogRecord {
    uint64_t timestamp{0};
    uint32_t thread_id{0};
    uint16_t level{0};
    uint16_t len{0};
    char msg[Logger::MAX_MSG_SIZE]{};
  };

  explicit MPMCQueue(std::size_t capacity)
  : size_(std::min(round_up_pow2(capacity), MAX_CAPACITY)),
    mask_(size_ - 1),
    buffer_(std::make_unique<Cell[]>(size_)) {
    for (std::size_t i = 0; i < size_; ++i) {
      buffer_[i].seq.store(i, std::memory_order_relaxed);
    }
  }

  bool enqueue(const LogRecord& rec) noexcept {
    std::size_t pos = tail_.load(std::memory_order_relaxed);
    for (;;) {
      Cell& c = buffer_[pos & mask_];
      std::size_t seq = c.seq.load(std::memory_order_acquire);
      intptr_t diff = static_cast<intptr_t>(seq) - static_cast<intptr_t>(pos);
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
      Cell& c = buffer_[pos & mask_];
      std::size_t seq = c.seq.load(std::memory_order_acquire);
      intptr_t diff = static_cast<intptr_t>(seq) - static_cast<intptr_t>(pos + 1);
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
    return head_.load(std::memory_order_acquire) ==
           tail_.load(std::memory_order_acquire);
  }

private:
  struct Cell {
    alignas(CACHE_LINE_SIZE) std::atomic<std::size_t> seq{0};
    LogRecord data{};
  };

  static std::size_t round_up_pow2(std::size_t n) {
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
  std::unique_ptr<Cell[]> buffer_;
};

// ---------- Writer side ----------
class AsyncLoggerImpl {
public:
  AsyncLoggerImpl(const AsyncLoggerImpl&) = delete;
  AsyncLoggerImpl& operator=(const AsyncLoggerImpl&) = delete;

  AsyncLoggerImpl(const char* path, std::size_t capacity)
  : file_(nullptr),
    queue_(envSize("DOCLINKS_LOG_QUEUE_CAPACITY", capacity, 1, MPMCQueue::MAX_CAPACITY)),
    batch_size_(envSize("DOCLINKS_LOG_BATCH", 128, 1, MAX_BATCH_SIZE)),
    flush_ms_(static_cast<int>(envSize("DOCLINKS_LOG_FLUSH_MS", 100, 1, 10000))),
    writer_thread_(),
    mutex_(),
    cv_(),
    running_(true) {
    std::filesystem::path p(path);
    if (p.has_parent_path()) {
      std::error_code ec;
      std::filesystem::create_directories(p.parent_path(), ec);
      // Error surfaces at fopen below
    }

    file_ = std::fopen(path, "w");
    if (!file_) {
      std::fprintf(stderr, "Warning: cannot open log file %s, logging disabled\n", path);
    }

    writer_thread_ = std::thread([this] { writerLoop(); });
  }

  ~AsyncLoggerImpl() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      running_.store(false, std::memory_order_release);
    }
    cv_.notify_all();
    if (writer_thread_.joinable()) {
      writer_thread_.join();
    }
    if (file_) {
      std::fflush(file_);
      std::fclose(file_);
    }
  }

  void log(uint16_t level, const char* msg, std::size_t len) noexcept {
    MPMCQueue::LogRecord rec{};
    rec.timestamp = getWallClockNanos();
    rec.thread_id = static_cast<uint32_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
    rec.level = level;
    rec.len = static_cast<uint16_t>(std::min(len, sizeof(rec.msg) - 1));
    std::memcpy(rec.msg, msg, rec.len);
    rec.msg[rec.len] = '\0';

    if (!queue_.enqueue(rec)) {
      drops_.fetch_add(1, std::memory_order_relaxed);
      return;
    }
    cv_.notify_one();
  }

  uint64_t getDrops() const noexcept { return drops_.load(std::memory_order_relaxed); }
  uint64_t getWritten() const noexcept { return written_.load(std::memory_order_relaxed); }
  uint64_t getBytes() const noexcept { return bytes_.load(std::memory_order_relaxed); }

private:
  static constexpr std::size_t MAX_BATCH_SIZE = 256;

  void writerLoop() {
    MPMCQueue::LogRecord batch[MAX_BATCH_SIZE];
    auto last_flush = std::chrono::steady_clock::now();

    for (;;) {
      {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, std::chrono::milliseconds(flush_ms_), [this] {
          return !running_.load(std::memory_order_acquire) || !queue_.empty();
        });
        if (!running_.load(std::memory_order_acquire) && queue_.empty()) {
          break;
        }
      }

      std::size_t n = 0;
      while (n < batch_size_ && queue_.dequeue(batch[n])) {
        ++n;
      }
      if (n == 0 || !file_) {
        continue;
      }

      for (std::size_t i = 0; i < n; ++i) {
        const auto& rec = batch[i];
        const int written = std::fprintf(file_, "[%llu.%09llu][%s][T%u] %s\n",
            static_cast<unsigned long long>(rec.timestamp / 1'000'000'000ULL),
            static_cast<unsigned long long>(rec.timestamp % 1'000'000'000ULL),
            Logger::levelToString(static_cast<Logger::Level>(rec.level)),
            rec.thread_id,
            rec.msg);
        if (written > 0) {
          written_.fetch_add(1, std::memory_order_relaxed);
          bytes_.fetch_add(static_cast<uint64_t>(written), std::memory_order_relaxed);
        }
      }

      // Flush when drained, on errors, or when the flush interval elapsed
      const auto now = std::chrono::steady_clock::now();
      const auto since_flush = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_flush).count();
      const bool saw_error = batch[n - 1].level >= Logger::ERROR;
      if (queue_.empty() || saw_error || since_flush >= flush_ms_) {
        std::fflush(file_);
        last_flush = now;
      }
    }

    if (file_) {
      std::fflush(file_);
    }
  }

  static std::size_t envSize(const char* name, std::size_t fallback, std::size_t lo, std::size_t hi) {
    const char* env = std::getenv(name);
    if (!env) {
      return fallback;
    }
    char* end = nullptr;
    const unsigned long long value = std::strtoull(env, &end, 10);
    if (end == env || value < lo || value > hi) {
      return fallback;
    }
    return static_cast<std::size_t>(value);
  }

  FILE* file_;
  MPMCQueue queue_;
  const std::size_t batch_size_;
  const int flush_ms_;
  std::thread writer_thread_;
  std::mutex mutex_;
  std::condition_variable cv_;
  std::atomic<bool> running_;
  alignas(CACHE_LINE_SIZE) std::atomic<uint64_t> drops_{0};
  alignas(CACHE_LINE_SIZE) std::atomic<uint64_t> written_{0};
  alignas(CACHE_LINE_SIZE) std::atomic<uint64_t> bytes_{0};
};

static std::unique_ptr<AsyncLoggerImpl> g_logger_impl;
static std::unique_ptr<Logger> g_logger_owner;
static std::mutex g_logger_mutex;

Logger* g_logger = nullptr;

void initLogging(const char* log_file, Logger::Level min_level) {
    std::lock_guard<std::mutex> lock(g_logger_mutex);

    g_logger = nullptr;
    g_logger_owner.reset();
    g_logger_impl.reset();

    g_logger_impl = std::make_unique<AsyncLoggerImpl>(log_file, 4096);
    g_logger_owner = std::make_unique<Logger>(min_level);
    g_logger = g_logger_owner.get();
}

void shutdownLogging() {
    std::lock_guard<std::mutex> lock(g_logger_mutex);

    g_logger = nullptr;
    g_logger_owner.reset();
    g_logger_impl.reset();
}

void logMessageToGlobal(uint16_t level, const char* msg, size_t len) noexcept {
    if (g_logger_impl) {
        g_logger_impl->log(level, msg, len);
    }
}

Logger::Stats Logger::getStats() const noexcept {
    Stats stats;
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (g_logger_impl) {
        stats.messages_written = g_logger_impl->getWritten();
        stats.messages_dropped = g_logger_impl->getDrops();
        stats.bytes_written = g_logger_impl->getBytes();
    }
    return stats;
}

const char* Logger::levelToString(Level level) noexcept {
    switch (level) {
      case DEBUG: return "DEBUG";
      case INFO:  return "INFO ";
      case WARN:  return "WARN ";
      case ERROR: return "ERROR";
      case FATAL: return "FATAL";
      default:    return "UNKN ";
    }
}

bool Logger::parseLevel(const char* name, Level* out) noexcept {
    if (!name || !out) {
        return false;
    }
    static constexpr struct { const char* name; Level level; } kLevels[] = {
        {"debug", DEBUG}, {"info", INFO}, {"warn", WARN}, {"warning", WARN},
        {"error", ERROR}, {"fatal", FATAL},
    };
    for (const auto& entry : kLevels) {
        if (strcasecmp(name, entry.name) == 0) {
            *out = entry.level;
            return true;
        }
    }
    return false;
}

} // namespace Common
