#include "refresh_timer.hpp"

#include <boost/asio/post.hpp>

#include <exception>
#include <iostream>
#include <utility>

namespace net = boost::asio;

namespace msgraph_sync {

RefreshTimer::RefreshTimer()
    : mWork(net::make_work_guard(mIoc))
    , mTimer(mIoc)
    , mThread([this] { mIoc.run(); })
{}

RefreshTimer::~RefreshTimer() {
    mWork.reset();
    mIoc.stop();
    if (mThread.joinable()) {
        mThread.join();
    }
}

void RefreshTimer::arm(std::chrono::milliseconds delay,
                       std::function<void()> callback)
{
    // The timer is only touched from the io_context thread.
    net::post(mIoc, [this, delay, cb = std::move(callback)]() mutable {
        mTimer.expires_after(delay);
        mTimer.async_wait([cb = std::move(cb)](const boost::system::error_code& ec) {
            if (ec == net::error::operation_aborted) {
                return;  // superseded by a newer arm()
            }
            try {
                cb();
            } catch (const std::exception& e) {
                std::cerr << "[RefreshTimer] Scheduled task failed: "
                          << e.what() << "\n";
            }
        });
    });
}

} // namespace msgraph_sync
