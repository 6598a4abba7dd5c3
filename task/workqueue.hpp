#pragma once

#include "lock.hpp"
#include "log.hpp"
#include "usrlist.hpp"

namespace fhosts {

struct worknode {
    typedef void (*work_func_t)(struct worknode* work);

    struct list_head ws_node;
    work_func_t      func { nullptr };
};

/**
 * @brief 侵入式 FIFO 工作队列：投递 worknode，由执行线程逐个取出调用 func。
 *
 * 队列本身不持有线程；trig 回调在每次投递后触发，用于唤醒真正的执行者。
 */
template <lockable Lock> struct workqueue {
    explicit workqueue() { }
    virtual ~workqueue() = default;
    typedef void (*wq_trig)(struct workqueue* work);

    struct list_head ws_head;
    wq_trig          trig { nullptr };
    Lock             lk;

    int work_once()
    {
        lk.lock();
        struct worknode* pnod = get_work_node(*this);
        lk.unlock();

        if (pnod) {
            if (auto fn = pnod->func) {
                fn(pnod);
            } else {
                FHOSTS_LOG_WARN("[workqueue] null func for node %p", static_cast<void*>(pnod));
            }
            return 1;
        }
        return 0;
    }
    void post(struct worknode& pnode)
    {
        lk.lock();
        list_del(&pnode.ws_node);
        list_add_tail(&pnode.ws_node, &ws_head);
        lk.unlock();
        if (trig) {
            trig(this);
        }
    }

    void lock() { lk.lock(); }
    void unlock() { lk.unlock(); }

protected:
    virtual struct worknode* get_work_node(struct workqueue& wq)
    {
        if (list_empty(&wq.ws_head))
            return nullptr;
        struct worknode* pnod = list_first_entry(&wq.ws_head, worknode, ws_node);
        list_del(&pnod->ws_node);
        return pnod;
    }
};

} // namespace fhosts
