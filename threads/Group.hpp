#pragma once

#include <sys/prctl.h>

#include <chrono>
#include <functional>
#include <list>
#include <string>
#include <thread>

#include <exception/Error.hpp>

namespace Threads {
    struct Group
    {
        typedef std::function<void()> Handler;

    public:
        void start(Handler aHandler, size_t aCount = 1)
        {
            for (size_t i = 0; i < aCount; i++)
                m_Threads.push_back(std::thread(aHandler));
        }
        template <class F>
        void at_stop(F aStop) { m_Stoppers.push_back(aStop); }

        // stoppers called in order of registration, then all threads joined
        void wait()
        {
            for (auto& x : m_Stoppers)
                x();
            m_Stoppers.clear();
            for (auto& x : m_Threads)
                x.join();
            m_Threads.clear();
        }

        size_t size() const { return m_Threads.size(); }

        ~Group() throw() { wait(); }

    private:
        std::list<std::thread>               m_Threads;
        std::list<std::function<void(void)>> m_Stoppers;
    };

    template <class Rep, class Period>
    void sleep(std::chrono::duration<Rep, Period> aTime)
    {
        std::this_thread::sleep_for(aTime);
    }

    // name must fit 15 chars, longer names are truncated by kernel
    inline void threadName(const std::string& aName)
    {
        if (prctl(PR_SET_NAME, aName.substr(0, 15).c_str()))
            throw Exception::ErrnoError("fail to threadName");
    }
} // namespace Threads
