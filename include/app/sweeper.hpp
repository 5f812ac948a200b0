#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <thread>

#include "app/upload_service.hpp"

namespace app
{

// Background timer evicting abandoned uploads from the service.
class Sweeper
{
  public:
    Sweeper(UploadService &svc, std::chrono::steady_clock::duration max_age,
            std::chrono::milliseconds interval);
    ~Sweeper() { stop(); }

    Sweeper(const Sweeper &)            = delete;
    Sweeper &operator=(const Sweeper &) = delete;

    void start();
    void stop();

    std::size_t sweeps() const { return sweeps_.load(); }

  private:
    UploadService                      &svc_;
    std::chrono::steady_clock::duration max_age_;
    std::chrono::milliseconds           interval_;
    std::thread                         thr_;
    std::mutex                          mu_;
    std::condition_variable             cv_;
    bool                                stop_{true};
    std::atomic<std::size_t>            sweeps_{0};
};

}  // namespace app
