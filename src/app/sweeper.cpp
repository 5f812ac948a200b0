#include "app/sweeper.hpp"
#include "util/log.hpp"

namespace app
{

Sweeper::Sweeper(UploadService                      &svc,
                 std::chrono::steady_clock::duration max_age,
                 std::chrono::milliseconds           interval)
    : svc_(svc), max_age_(max_age), interval_(interval)
{
}

void Sweeper::start()
{
    // in case a previous sweeper thread is still around
    stop();

    {
        std::lock_guard<std::mutex> lk(mu_);
        stop_ = false;
    }
    thr_ = std::thread([this] {
        std::unique_lock<std::mutex> lk(mu_);
        while (!stop_)
        {
            if (cv_.wait_for(lk, interval_, [this] { return stop_; }))
                break;
            lk.unlock();
            svc_.evict_stale(max_age_);
            sweeps_.fetch_add(1);
            lk.lock();
        }
    });
    LOG_DEBUG("sweeper started (every %lld ms)", (long long)interval_.count());
}

void Sweeper::stop()
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        stop_ = true;
    }
    cv_.notify_all();
    if (thr_.joinable())
        thr_.join();
}

}  // namespace app
