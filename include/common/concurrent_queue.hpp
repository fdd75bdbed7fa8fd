#pragma once

#include <condition_variable>
#include <mutex>
#include <queue>
#include <stdexcept>

namespace grader {

/**
 * @brief 可关闭的并发队列，写者读者模型
 * 评测一个提交时，所有测试点的下标被放入队列后关闭队列，
 * 若干个 worker 线程不断弹出下标直到队列为空且已关闭。
 * @param <T> 队列元素类型
 */
template <typename T>
struct concurrent_queue {
    /**
     * @brief 尝试从队列中弹出队头元素，如果队列为空返回 false
     * @param element 如果队列有元素，则保存队头元素，否则不变
     * @return 是否成功弹出队列头元素
     */
    bool try_pop(T &element) {
        std::unique_lock<std::mutex> mlock(mut);
        if (q.empty()) return false;
        element = std::move(q.front());
        q.pop();
        return true;
    }

    /**
     * @brief 从队列中弹出队头元素，队列为空时阻塞等待，直到有新元素或者队列被关闭
     * @param element 保存弹出的队头元素
     * @return 队列已关闭且没有剩余元素时返回 false
     */
    bool pop(T &element) {
        std::unique_lock<std::mutex> mlock(mut);
        cond.wait(mlock, [this] { return !q.empty() || closed; });
        if (q.empty()) return false;
        element = std::move(q.front());
        q.pop();
        return true;
    }

    /**
     * @brief 向队列中插入一个新元素
     * @throw std::logic_error 队列已经关闭
     */
    void push(const T &value) {
        std::unique_lock<std::mutex> mlock(mut);
        if (closed) throw std::logic_error("push to a closed concurrent_queue");
        q.push(value);
        mlock.unlock();
        cond.notify_one();
    }

    /**
     * @brief 关闭队列，唤醒所有等待中的读者
     * 关闭后已在队列中的元素仍然可以被弹出。
     */
    void close() {
        std::unique_lock<std::mutex> mlock(mut);
        closed = true;
        mlock.unlock();
        cond.notify_all();
    }

private:
    std::queue<T> q;
    bool closed = false;
    std::mutex mut;
    std::condition_variable cond;
};

}  // namespace grader
