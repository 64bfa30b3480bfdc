// *****************************************************************************
// * This file is part of the RoboMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************
#ifndef THREAD_H_5019283746510293
#define THREAD_H_5019283746510293

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>
#include "scope_guard.h"
#include "string_tools.h"
#include "zstring.h"


namespace rbm
{
//thrown inside a ThreadGroup worker once the group is shutting down
class ThreadStopRequest {};

//context of a ThreadGroup worker: throw ThreadStopRequest if the group is shutting down
//any other thread: no-op
void interruptionPoint(); //throw ThreadStopRequest

//context of a ThreadGroup worker: returns early with ThreadStopRequest if the group is shutting down
//any other thread: plain sleep
template <class Rep, class Period>
void interruptibleSleep(const std::chrono::duration<Rep, Period>& relTime); //throw ThreadStopRequest

void setCurrentThreadName(const Zstring& threadName);

//------------------------------------------------------------------------------------------

/*  std::async replacement: guaranteed to run on a new thread, and ~std::future does not block

    Example:
            auto ft = rbm::runAsync([&] { return scanFolder(dirPath); });
            while (ft.wait_for(std::chrono::milliseconds(100)) != std::future_status::ready)
                reportStatus();

    CAVEAT: the thread is detached => everything captured by reference must outlive the result!  */
template <class Function>
auto runAsync(Function&& fun);

//------------------------------------------------------------------------------------------

namespace impl
{
struct StopState
{
    void requestStop()
    {
        {
            std::lock_guard dummy(lock);
            stopRequested = true;
        }
        conditionStop.notify_all();
    }

    std::mutex lock;
    bool stopRequested = false; //protected by "lock"
    std::condition_variable conditionStop;
};

inline thread_local StopState* threadLocalStopState = nullptr; //set for ThreadGroup workers only
}


/*  FIFO task queue served by up to "threadCountMax" worker threads, started on demand

    - ~ThreadGroup() requests stop and joins: tasks still queued are discarded, running tasks
      see ThreadStopRequest at their next interruptionPoint() or interruptibleSleep()
    - a task must not throw anything but ThreadStopRequest                                   */
template <class Function>
class ThreadGroup
{
public:
    ThreadGroup(size_t threadCountMax, const Zstring& groupName) : threadCountMax_(threadCountMax), groupName_(groupName)
    {
        if (threadCountMax == 0)
            throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
    }

    ~ThreadGroup()
    {
        workLoad_->requestStop();
        workLoad_->conditionNewTask.notify_all();

        for (std::thread& worker : worker_)
            worker.join();
    }

    //context of controlling thread, non-blocking
    void run(Function&& task)
    {
        {
            std::lock_guard dummy(workLoad_->lock);

            workLoad_->tasks.push_back(std::move(task));
            ++workLoad_->tasksPending;

            if (worker_.size() < std::min(workLoad_->tasksPending, threadCountMax_))
                addWorkerThread();
        }
        workLoad_->conditionNewTask.notify_one();
    }

private:
    ThreadGroup           (const ThreadGroup&) = delete;
    ThreadGroup& operator=(const ThreadGroup&) = delete;

    struct WorkLoad : impl::StopState
    {
        std::deque<Function> tasks;
        size_t tasksPending = 0; //queued + running
        std::condition_variable conditionNewTask;
    };

    //worker_ is modified under workLoad_->lock, but only ever by the controlling thread
    void addWorkerThread()
    {
        Zstring threadName = groupName_ + Zstr('[') + numberTo<Zstring>(worker_.size() + 1) + Zstr('/') + numberTo<Zstring>(threadCountMax_) + Zstr(']');

        worker_.emplace_back([workLoad = workLoad_ /*share ownership*/, threadName = std::move(threadName)]
        {
            setCurrentThreadName(threadName);

            impl::threadLocalStopState = workLoad.get();
            RBM_ON_SCOPE_EXIT(impl::threadLocalStopState = nullptr);

            std::unique_lock dummy(workLoad->lock);
            for (;;)
            {
                workLoad->conditionNewTask.wait(dummy, [&] { return workLoad->stopRequested || !workLoad->tasks.empty(); });
                if (workLoad->stopRequested)
                    return;

                Function task = std::move(workLoad->tasks.front());
                workLoad->tasks.pop_front();

                dummy.unlock();
                try
                {
                    task(); //throw ThreadStopRequest
                }
                catch (ThreadStopRequest&) { return; } //regular thread exit
                dummy.lock();

                --workLoad->tasksPending;
            }
        });
    }

    std::vector<std::thread> worker_;
    const std::shared_ptr<WorkLoad> workLoad_ = std::make_shared<WorkLoad>();
    const size_t threadCountMax_;
    const Zstring groupName_;
};








//###################### implementation ######################

template <class Function> inline
auto runAsync(Function&& fun)
{
    using ResultType = decltype(fun());

    std::packaged_task<ResultType()> pt(std::forward<Function>(fun));
    auto fut = pt.get_future();
    std::thread(std::move(pt)).detach(); //~thread() calls std::terminate() if joinable()
    return fut;
}


inline
void interruptionPoint() //throw ThreadStopRequest
{
    if (impl::StopState* ss = impl::threadLocalStopState)
    {
        std::lock_guard dummy(ss->lock);
        if (ss->stopRequested)
            throw ThreadStopRequest();
    }
}


template <class Rep, class Period> inline
void interruptibleSleep(const std::chrono::duration<Rep, Period>& relTime) //throw ThreadStopRequest
{
    if (impl::StopState* ss = impl::threadLocalStopState)
    {
        std::unique_lock dummy(ss->lock);
        if (ss->conditionStop.wait_for(dummy, relTime, [ss] { return ss->stopRequested; }))
            throw ThreadStopRequest();
    }
    else
        std::this_thread::sleep_for(relTime);
}
}

#endif //THREAD_H_5019283746510293
