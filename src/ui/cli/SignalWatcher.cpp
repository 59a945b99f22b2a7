#include "SignalWatcher.hpp"
#include "keyward/log/Log.hpp"

#include <cstring>
#include <exception>
#include <initializer_list>
#include <system_error>
#include <utility>

#include <pthread.h>

namespace keyward::ui::cli
{

SignalWatcher::SignalWatcher(Handler handler) : m_handler(std::move(handler))
{
    (void)::sigemptyset(&m_watched);
    for (const int sig : { SIGINT, SIGTERM, SIGHUP })
    {
        (void)::sigaddset(&m_watched, sig);
    }
    const int rc{ ::pthread_sigmask(SIG_BLOCK, &m_watched, &m_previous) };
    if (rc != 0)
    {
        throw std::system_error(rc, std::generic_category(), "pthread_sigmask");
    }
    m_thread = std::thread([this] { waitLoop(); });
}

SignalWatcher::~SignalWatcher() noexcept
{
    m_stopping.store(true);
    // Directed at the waiting thread, where the signal is blocked, so sigwait consumes it.
    if (::pthread_kill(m_thread.native_handle(), SIGTERM) == 0)
    {
        m_thread.join();
    }
    else
    {
        keyward::log::error("signals", "cannot wake the signal thread; detaching it");
        m_thread.detach();
    }
    (void)::pthread_sigmask(SIG_SETMASK, &m_previous, nullptr);
}

void SignalWatcher::waitLoop() noexcept
{
    while (true)
    {
        int sig{};
        const int rc{ ::sigwait(&m_watched, &sig) };
        if (rc != 0)
        {
            keyward::log::error("signals", "sigwait failed: ", std::strerror(rc));
            return;
        }
        if (m_stopping.load())
        {
            return;
        }
        keyward::log::info("signals", "received signal ", sig);
        try
        {
            m_handler(sig);
        }
        catch (const std::exception& e)
        {
            keyward::log::error("signals", "signal handler failed: ", e.what());
        }
    }
}

} // namespace keyward::ui::cli
