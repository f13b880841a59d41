// ======================= thread_pool.hpp =======================
#pragma once

#include <functional>
#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <memory>

namespace mqsim {

// 任务按提交顺序执行；单线程时即为一个有序的投递执行器
class thread_pool {
public:
    using ptr  = std::shared_ptr<thread_pool>;
    using task = std::function<void()>;

    explicit thread_pool(size_t num_threads = 0);
    ~thread_pool();

    thread_pool(const thread_pool&) = delete;
    thread_pool& operator=(const thread_pool&) = delete;

    // 向线程池提交任务；stop() 之后提交的任务被丢弃，返回 false
    bool push(task t);

    // 阻塞直到队列为空且没有正在执行的任务（在池内线程调用时直接返回）
    void wait_idle();

    // 执行完已入队的任务后退出所有工作线程
    void stop();

    bool in_pool_thread() const;

private:
    // 工作线程与池对象共享的状态：池在自己的工作线程里析构时，线程 detach 后仍可安全退出
    struct state {
        std::queue<task>        tasks;
        std::mutex              mtx;
        std::condition_variable cv;
        std::condition_variable idle_cv;
        size_t                  active{0};
        bool                    stop{false};
    };

    static void worker(const std::shared_ptr<state>& st);

    std::shared_ptr<state>   __state;
    std::vector<std::thread> __threads;
};

}
