// ======================= thread_pool.cpp =======================
#include "thread_pool.hpp"

#include <algorithm>

namespace mqsim {

thread_pool::thread_pool(size_t num_threads)
    : __state(std::make_shared<state>())
{
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) num_threads = 1;
    }

    for (size_t i = 0; i < num_threads; ++i) {
        __threads.emplace_back(&thread_pool::worker, __state);
    }
}

thread_pool::~thread_pool()
{
    stop();
}

void thread_pool::worker(const std::shared_ptr<state>& st)
{
    task t;
    while (true) {
        {
            std::unique_lock<std::mutex> lock(st->mtx);
            st->cv.wait(lock, [&st] { return st->stop || !st->tasks.empty(); });
            if (st->stop && st->tasks.empty()) return;
            t = std::move(st->tasks.front());
            st->tasks.pop();
            ++st->active;
        }
        t();  // 在锁外执行
        t = nullptr;
        {
            std::unique_lock<std::mutex> lock(st->mtx);
            --st->active;
            if (st->active == 0 && st->tasks.empty()) st->idle_cv.notify_all();
        }
    }
}

bool thread_pool::push(task t)
{
    {
        std::unique_lock<std::mutex> lock(__state->mtx);
        if (__state->stop) return false;
        __state->tasks.emplace(std::move(t));
    }
    __state->cv.notify_one();
    return true;
}

void thread_pool::wait_idle()
{
    if (in_pool_thread()) return;
    std::unique_lock<std::mutex> lock(__state->mtx);
    __state->idle_cv.wait(lock, [this] {
        return __state->tasks.empty() && __state->active == 0;
    });
}

void thread_pool::stop()
{
    {
        std::unique_lock<std::mutex> lock(__state->mtx);
        if (__state->stop) return;
        __state->stop = true;
    }
    __state->cv.notify_all();
    for (std::thread& t : __threads) {
        if (t.get_id() == std::this_thread::get_id()) {
            t.detach();
        } else if (t.joinable()) {
            t.join();
        }
    }
}

bool thread_pool::in_pool_thread() const
{
    auto self = std::this_thread::get_id();
    return std::any_of(__threads.begin(), __threads.end(),
                       [self](const std::thread& t) { return t.get_id() == self; });
}

}
