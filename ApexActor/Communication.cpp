#include<memory>
#include<string>

#include<spdlog/spdlog.h>
#include<zmq.hpp>

#include"Communication.hpp"

namespace WorkerClient
{
    Communicator::Communicator(const std::string &url, std::shared_ptr<zmq::context_t> context, int timeout) :
    context(context ? std::move(context) : std::make_shared<zmq::context_t>(1)),
    url(url)
    {
        socket = std::make_unique<zmq::socket_t>(*this->context, zmq::socket_type::pair);
        socket->set(zmq::sockopt::rcvtimeo, timeout);
        socket->set(zmq::sockopt::linger, 0);

        socket->connect(url);
        spdlog::info("Connected to gym environment at: {}", url);
    }

    Communicator::~Communicator()
    {
        // The socket must be closed before its context is released
        socket.reset();
    }
}
