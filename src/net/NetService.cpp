#include "fsremote/net/NetService.hpp"
#include "fsremote/log/Log.hpp"

#include <utility>

namespace fsremote::net {

NetService::NetService(std::string name)
: name_(std::move(name))
, io_(std::make_shared<asio::io_context>())
, work_guard_(asio::make_work_guard(*io_))
, t_([this]{ io_->run(); })
{
    thread_id_ = t_.get_id();
    logDebug("[NetService] started '", name_, "'\n");
}

NetService::~NetService() {
    shutdown();
}

bool NetService::runningInThisThread() const {
    return std::this_thread::get_id() == thread_id_;
}

void NetService::shutdown() {
    if (!t_.joinable()) {
        return;
    }
    // Let queued handlers finish; run() returns once the queue is empty.
    work_guard_.reset();
    t_.join();
    logDebug("[NetService] stopped '", name_, "'\n");
}

NetService& sharedNetService() {
    static NetService service("network");
    return service;
}

std::shared_ptr<asio::io_context> shared_io_context() {
    return sharedNetService().io();
}

} // namespace fsremote::net
