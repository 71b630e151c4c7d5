#include<memory>
#include<sstream>
#include<string>

#include<spdlog/spdlog.h>
#include<zmq.hpp>

#include"../../include/Environment/Communication.hpp"

namespace TrustRegion
{
namespace GymClient
{
    Communicator::Communicator(const std::string &url, int timeoutMs) : url(url)
    {
        context = std::make_unique<zmq::context_t>(1);
        socket = std::make_unique<zmq::socket_t>(*context, zmq::socket_type::pair);

        socket->set(zmq::sockopt::rcvtimeo, timeoutMs);
        socket->set(zmq::sockopt::sndtimeo, timeoutMs);
        socket->set(zmq::sockopt::linger, 0);

        socket->connect(url);
        spdlog::info("Connected to gym environment at: {}", url);
    }

    Communicator::~Communicator() {

    }

    void Communicator::sendRaw(const msgpack::sbuffer &buffer)
    {
        zmq::message_t message(buffer.data(), buffer.size());
        zmq::send_result_t sent;
        try
        {
            sent = socket->send(message, zmq::send_flags::none);
        }
        catch (const zmq::error_t &error)
        {
            throw EnvironmentError("Could not send request to " + url + ": " + error.what());
        }
        if (!sent)
        {
            throw EnvironmentError("Timed out sending request to gym server at " + url);
        }
    }

    msgpack::object_handle Communicator::receiveRaw()
    {
        zmq::message_t packedMessage;
        zmq::recv_result_t received;
        try
        {
            received = socket->recv(packedMessage, zmq::recv_flags::none);
        }
        catch (const zmq::error_t &error)
        {
            throw EnvironmentError("Could not receive response from " + url + ": " + error.what());
        }
        if (!received)
        {
            throw EnvironmentError("Timed out waiting for response from gym server at " + url);
        }

        try
        {
            return msgpack::unpack(static_cast<const char *>(packedMessage.data()), packedMessage.size());
        }
        catch (const msgpack::unpack_error &error)
        {
            throw EnvironmentError("Undecodable response from gym server at " + url + ": " + error.what());
        }
    }
}
}
