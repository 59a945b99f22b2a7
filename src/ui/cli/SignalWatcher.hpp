#ifndef KEYWARD_UI_CLI_SIGNALWATCHER_HPP
#define KEYWARD_UI_CLI_SIGNALWATCHER_HPP

#include <atomic>
#include <csignal>
#include <functional>
#include <thread>

namespace keyward::ui::cli
{

// Blocks SIGINT, SIGTERM and SIGHUP in the constructing thread and receives them with sigwait on a
// thread of its own, where `handler` runs with the signal number. Threads started afterwards inherit
// the mask, so construct it before any other thread exists.
class SignalWatcher final
{
public:
    using Handler = std::function<void(int)>;

    explicit SignalWatcher(Handler handler);
    ~SignalWatcher() noexcept;

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;
    SignalWatcher(SignalWatcher&&) = delete;
    SignalWatcher& operator=(SignalWatcher&&) = delete;

private:
    void waitLoop() noexcept;

    Handler m_handler;
    sigset_t m_watched{};
    sigset_t m_previous{};
    std::atomic<bool> m_stopping{ false };
    std::thread m_thread;
};

} // namespace keyward::ui::cli

#endif // KEYWARD_UI_CLI_SIGNALWATCHER_HPP
