#include "io_worker.hpp"
#include "../util/logger.hpp"

namespace httprange::asio{

    io_worker::io_worker(std::string name) :
        name_(std::move(name)),
        io_{1}{
    }

    io_worker::~io_worker() {
        stop();
    }

    void io_worker::start() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_) return;
        io_.restart();
        work_ = std::make_unique<work_guard_type>(boost::asio::make_work_guard(io_));
        running_ = true;
        thread_ = std::thread([this]{ run(); });
        LOG_DEBUG("[{}] worker started", name_);
    }

    void io_worker::run() {
        // keep running the io_context so a crashing handler does not kill the worker
        for (;;) {
            try {
                io_.run();
                break; // run() exited normally
            } catch (const std::exception &ex) {
                LOG_ERROR("[{}] thread crashed: {}", name_, ex.what());
            }
            LOG_WARNING("[{}] restarting thread", name_);
            io_.restart();
        }
    }

    void io_worker::stop(){
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return;
        running_ = false;
        work_.reset();
        io_.stop();
        if (thread_.joinable()) {
            if (thread_.get_id() == std::this_thread::get_id()) {
                thread_.detach();
            } else {
                thread_.join();
            }
        }
        LOG_DEBUG("[{}] worker stopped", name_);
    }

    boost::asio::io_context& io_worker::get_io_context(){
        return io_;
    }

}
