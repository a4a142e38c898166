#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdio>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <tuple>
#include <type_traits>
#include <pthread.h>

#include "macros.h"

namespace Common {

  /// Name the calling thread (truncated to the 15 chars pthread allows)
  inline auto setThreadName(const char* name) noexcept -> bool {
    char truncated_name[16];
    std::snprintf(truncated_name, sizeof(truncated_name), "%s", name);
    return pthread_setname_np(pthread_self(), truncated_name) == 0;
  }

  /// Fixed-size pool of pre-created workers draining a FIFO task queue.
  /// Tasks start in submission order; at most num_workers run at once.
  class ThreadPool {
  public:
    static constexpr size_t MAX_THREADS = 64;

    explicit ThreadPool(size_t num_workers, const char* name_prefix = "worker")
      : workers_{}, num_workers_(num_workers), tasks_{}, queue_mutex_{}, condition_{}, stopped_{false} {
      ASSERT(num_workers > 0 && num_workers <= MAX_THREADS, "ThreadPool worker count out of range");
      for (size_t i = 0; i < num_workers_; ++i) {
        workers_[i] = std::thread([this, i, name_prefix] {
          char name[32];
          std::snprintf(name, sizeof(name), "%s-%zu", name_prefix, i);
          setThreadName(name);

          while (true) {
            std::function<void()> task;

            {
              std::unique_lock<std::mutex> lock(queue_mutex_);
              condition_.wait(lock, [this] {
                return stopped_.load(std::memory_order_acquire) || !tasks_.empty();
              });

              if (stopped_.load(std::memory_order_acquire) && tasks_.empty()) {
                break;
              }

              task = std::move(tasks_.front());
              tasks_.pop_front();
            }

            if (task) {
              task();
            }
          }
        });
      }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Finishes every queued task, then joins
    ~ThreadPool() {
      {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        stopped_.store(true, std::memory_order_release);
      }
      condition_.notify_all();

      for (size_t i = 0; i < num_workers_; ++i) {
        if (workers_[i].joinable()) {
          workers_[i].join();
        }
      }
    }

    template<typename F, typename... Args>
    auto enqueue(F&& f, Args&&... args)
        -> std::future<std::invoke_result_t<F, Args...>> {
      using R = std::invoke_result_t<F, Args...>;

      auto task = std::make_shared<std::packaged_task<R()>>(
        [fn = std::forward<F>(f),
         args_tuple = std::make_tuple(std::forward<Args>(args)...)]() mutable -> R {
          return std::apply([&fn](auto&&... captured_args) -> R {
            return std::invoke(std::move(fn), std::forward<decltype(captured_args)>(captured_args)...);
          }, std::move(args_tuple));
        }
      );

      auto res = task->get_future();

      {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        if (stopped_.load(std::memory_order_acquire)) {
          std::promise<R> error_promise;
          error_promise.set_exception(std::make_exception_ptr(
            std::runtime_error("enqueue on stopped ThreadPool")));
          return error_promise.get_future();
        }

        tasks_.emplace_back([task]() { (*task)(); });
      }

      condition_.notify_one();
      return res;
    }

    [[nodiscard]] auto size() const noexcept -> size_t {
      return num_workers_;
    }

    [[nodiscard]] auto is_stopped() const noexcept -> bool {
      return stopped_.load(std::memory_order_acquire);
    }

  private:
    std::thread workers_[MAX_THREADS];
    size_t num_workers_;
    std::deque<std::function<void()>> tasks_;

    std::mutex queue_mutex_;
    std::condition_variable condition_;
    std::atomic<bool> stopped_;
  };

} // namespace Common
