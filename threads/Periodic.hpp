#pragma once
#include <pthread.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include <thread>

#include <exception/Error.hpp>
#include <unsorted/Log4cxx.hpp>

namespace Threads {
    inline log4cxx::LoggerPtr sLogger = Logger::Get("periodic");

    // run handler in dedicated thread every period.
    // stop flag polled at least every POLL, so stop() and destructor are not delayed by long period.
    class Periodic
    {
    public:
        using Handler  = std::function<void()>;
        using Duration = std::chrono::milliseconds;

        static constexpr Duration POLL{100};

    private:
        std::atomic<bool> m_Stop{false};
        std::thread       m_Thread;

        void thread_loop(const std::string& aName, Duration aPeriod, const Handler& aHandler)
        {
            using Clock   = std::chrono::steady_clock;
            auto sLastRun = Clock::now();
            while (!m_Stop) {
                if (sLastRun + aPeriod > Clock::now()) {
                    std::this_thread::sleep_for(std::min(aPeriod, POLL));
                    continue;
                }
                if (m_Stop)
                    break;

                try {
                    aHandler();
                } catch (const std::exception& e) {
                    ERROR(aName << ": periodic task failed: " << e.what());
                } catch (...) {
                    ERROR(aName << ": periodic task failed: unknown exception");
                }
                sLastRun = Clock::now();
            }
            DEBUG(aName << ": periodic task stopped");
        }

    public:
        Periodic() = default;
        Periodic(const Periodic&) = delete;
        Periodic& operator=(const Periodic&) = delete;

        // thread name is truncated to 15 chars by kernel
        void start(const std::string& aName, Duration aPeriod, Handler aHandler)
        {
            if (m_Thread.joinable())
                throw std::logic_error("Periodic: already started");
            if (aPeriod <= Duration::zero())
                throw std::invalid_argument("Periodic: period must be positive");

            m_Thread = std::thread([this, aName, aPeriod, aHandler = std::move(aHandler)]() {
                thread_loop(aName, aPeriod, aHandler);
            });

            const std::string sShort = aName.substr(0, 15);
            if (int sRc = pthread_setname_np(m_Thread.native_handle(), sShort.c_str()); sRc != 0)
                throw Exception::ErrnoError("fail to set thread name " + sShort, sRc);
        }

        // returns true on first call
        bool stop() { return !m_Stop.exchange(true); }

        bool stopped() const { return m_Stop; }

        void wait()
        {
            if (m_Thread.joinable() and m_Thread.get_id() != std::this_thread::get_id())
                m_Thread.join();
        }

        ~Periodic() noexcept
        {
            stop();
            wait();
        }
    };
} // namespace Threads
