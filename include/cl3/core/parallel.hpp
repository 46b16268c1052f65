#pragma once

#include <algorithm>
#include <atomic>
#include <cl3/core/config.hpp>
#include <cstddef>
#include <exception>
#include <mutex>
#include <system_error>
#include <thread>
#include <vector>

namespace cl3::core {

/// \brief Half-open range `[first, last)` of packed record indices.
struct RecordBlock {
  std::size_t first = 0;
  std::size_t last = 0;
};

/// \brief Records handed to one participant at a time.
inline constexpr std::size_t kBlockRecords = 64;

/**
 * \brief Fork-join scheduler over blocks of packed cliffor records.
 *
 * `run` starts up to `threads - 1` helpers, the caller works alongside them,
 * and every participant claims the next `kBlockRecords` records from a
 * shared cursor until the buffer is exhausted. Blocks never overlap, so each
 * record is written by exactly one thread. The first exception thrown by the
 * block body stops further claims and is rethrown on the caller after the
 * join.
 */
class RecordScheduler {
public:
  explicit RecordScheduler(int threads) : threads_(std::max(1, threads)) {}

  int threads() const { return threads_; }

  template <typename Fn> void run(std::size_t records, Fn &&fn) const {
    const std::size_t blocks = (records + kBlockRecords - 1) / kBlockRecords;
    const std::size_t participants =
        std::min(blocks, static_cast<std::size_t>(threads_));
    if (participants <= 1) {
      if (records > 0) {
        fn(RecordBlock{0, records});
      }
      return;
    }

    std::atomic<std::size_t> cursor{0};
    std::mutex error_mutex;
    std::exception_ptr error;

    const auto drain = [&]() {
      try {
        for (std::size_t b = cursor.fetch_add(1); b < blocks; b = cursor.fetch_add(1)) {
          fn(RecordBlock{b * kBlockRecords, std::min(records, (b + 1) * kBlockRecords)});
        }
      } catch (...) {
        std::lock_guard<std::mutex> lock(error_mutex);
        if (!error) {
          error = std::current_exception();
        }
        cursor.store(blocks);
      }
    };

    std::vector<std::thread> helpers;
    helpers.reserve(participants - 1);
    for (std::size_t t = 1; t < participants; ++t) {
      try {
        helpers.emplace_back(drain);
      } catch (const std::system_error &e) {
        // Fewer helpers; the caller drains whatever is left.
        log_line("Bulk", "started {} of {} helper threads: {}", helpers.size(),
                 participants - 1, e.what());
        break;
      }
    }
    drain();
    for (auto &helper : helpers) {
      helper.join();
    }

    if (error) {
      std::rethrow_exception(error);
    }
  }

private:
  int threads_;
};

/**
 * \brief Run `fn(RecordBlock)` over records `[0, records)`.
 *
 * Serial when `CL3_BACKEND=cpu`, otherwise spread over `CL3_NUM_THREADS`
 * participants. Buffers shorter than two blocks always run on the caller.
 */
template <typename Fn> void for_each_record_block(std::size_t records, Fn &&fn) {
  const BulkConfig config = bulk_config_from_env();
  RecordScheduler(config.parallel ? config.threads : 1).run(records, fn);
}

} // namespace cl3::core
