#pragma once

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <functional>
#include <thread>

namespace msgraph_sync {

/// One-shot timer running on its own background thread.  Every arm()
/// replaces the pending wait; the thread lives until destruction.
class RefreshTimer {
public:
    RefreshTimer();
    ~RefreshTimer();

    RefreshTimer(const RefreshTimer&) = delete;
    RefreshTimer& operator=(const RefreshTimer&) = delete;

    /// Schedule @p callback after @p delay.  Safe from any thread,
    /// including from inside a running callback.
    void arm(std::chrono::milliseconds delay, std::function<void()> callback);

private:
    boost::asio::io_context mIoc;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> mWork;
    boost::asio::steady_timer mTimer;
    std::thread mThread;
};

} // namespace msgraph_sync
