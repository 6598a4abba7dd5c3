// fd_base.hpp - fd factory binding sockets to an embedded reactor (fd_workqueue)
#pragma once
#include "epoll_reactor.hpp"
#include "tcp_listener.hpp"
#include "tcp_socket.hpp"
#include <memory>

namespace fhosts::net {

/**
 * @brief 封装一个基础 workqueue + 内嵌 epoll reactor，用于创建/接管 TCP 对象。
 * @note Reactor 作为成员，生命周期与 fd_workqueue 绑定；其创建的 socket 不得比它活得更久。
 */
template <lockable lock> class fd_workqueue {
public:
    explicit fd_workqueue(workqueue<lock>& base) : _base(base), _reactor(base) { }
    workqueue<lock>&     base() { return _base; }
    epoll_reactor<lock>& reactor() { return _reactor; }

    tcp_socket<lock> make_tcp_socket() { return tcp_socket<lock>(_reactor); } ///< 未打开的 TCP socket
    tcp_socket<lock> adopt_tcp_socket(int fd) { return tcp_socket<lock>(fd, _reactor); } ///< 接管 accept 得到的 fd
    std::unique_ptr<tcp_listener<lock>> make_tcp_listener()
    {
        return std::unique_ptr<tcp_listener<lock>>(new tcp_listener<lock>(_reactor));
    }

private:
    workqueue<lock>&    _base;
    epoll_reactor<lock> _reactor; // 内嵌 reactor (无堆分配)
};

} // namespace fhosts::net
