#pragma once
#include <atomic>
#include <condition_variable>
#include <functional>
#include <list>
#include <mutex>
#include <string>

#include "Group.hpp"

#include <unsorted/Log4cxx.hpp>

namespace Threads {

    inline log4cxx::LoggerPtr sLogger = Logger::Get("threads");

    // queue of tasks processed by worker threads
    // stop() do not drop pending tasks: workers exit once queue is drained
    class Executor
    {
    public:
        using Task = std::function<void()>;

    private:
        mutable std::mutex                   m_Mutex;
        typedef std::unique_lock<std::mutex> Lock;
        std::condition_variable              m_Cond;
        std::list<Task>                      m_List;
        bool                                 m_Stop    = false;
        uint64_t                             m_Counter = 0;
        std::atomic<uint64_t>                m_Done{0};
        const std::string                    m_Name;

        bool wait(Task& aTask)
        {
            Lock lk(m_Mutex);
            m_Cond.wait(lk, [this]() { return m_Stop or !m_List.empty(); });
            if (m_List.empty()) // stopped and drained
                return false;
            aTask = std::move(m_List.front());
            m_List.pop_front();
            return true;
        }

        void handle(Task& aTask)
        {
            try {
                aTask();
            } catch (const std::exception& e) {
                ERROR(m_Name << ": task failed: " << e.what());
            } catch (...) {
                ERROR(m_Name << ": task failed with unknown exception");
            }
        }

    public:
        explicit Executor(const std::string& aName = "executor")
        : m_Name(aName)
        {}

        void start(Group& aGroup, unsigned aCount = 1)
        {
            aGroup.start(
                [this]() {
                    threadName(m_Name);
                    Task sTask;
                    while (wait(sTask)) {
                        handle(sTask);
                        sTask = nullptr;
                        m_Done++;
                    }
                },
                aCount);
            aGroup.at_stop([this]() { stop(); });
        }

        void stop()
        {
            Lock lk(m_Mutex);
            m_Stop = true;
            m_Cond.notify_all();
        }

        // false if executor already stopped, task is not queued
        bool insert(Task&& aTask)
        {
            Lock lk(m_Mutex);
            if (m_Stop)
                return false;
            m_List.push_back(std::move(aTask));
            m_Counter++;
            m_Cond.notify_one();
            return true;
        }

        uint64_t count() const
        {
            Lock lk(m_Mutex);
            return m_Counter;
        }

        // queued and running tasks
        size_t size() const { return count() - m_Done; }
        bool   idle() const { return m_Done == count(); }
    };
} // namespace Threads
