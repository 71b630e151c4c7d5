#pragma once

#ifndef TRUSTREGIONRL_COMMUNICATION_HPP
#define TRUSTREGIONRL_COMMUNICATION_HPP

#include<cstring>
#include<memory>
#include<sstream>
#include<string>

#include<msgpack.hpp>
#include<spdlog/spdlog.h>
#include<zmq.hpp>

#include"Request.hpp"
#include"../Errors.hpp"

namespace TrustRegion
{
namespace GymClient
{
    /**
     * @class Communicator
     * @brief Request/response channel to a gym server over a ZeroMQ PAIR socket.
     *
     * Requests and responses are MessagePack maps. Sending and receiving time out after
     * `timeoutMs` milliseconds; timeouts and undecodable responses raise
     * EnvironmentError.
     */
    class Communicator
    {
    private:
        std::unique_ptr<zmq::context_t> context;
        std::unique_ptr<zmq::socket_t> socket;
        std::string url;

        void sendRaw(const msgpack::sbuffer &buffer);

        msgpack::object_handle receiveRaw();

    public:
        explicit Communicator(const std::string &url, int timeoutMs = 5000);

        ~Communicator();

        /**
         * @brief Receives the next message and decodes it as `T`.
         *
         * @throws EnvironmentError On timeout, transport error or a message that does not decode as `T`.
         */
        template <typename T>
        T getResponse()
        {
            auto objectHandle = receiveRaw();
            msgpack::object object = objectHandle.get();

            T response;
            try
            {
                object.convert(response);
            }
            catch (const msgpack::type_error &)
            {
                std::stringstream text;
                text << object;
                throw EnvironmentError("Malformed response from gym server at " + url + ": " + text.str());
            }
            return response;
        }

        template<class T>
        void sendRequest(const Request<T> &request)
        {
            msgpack::sbuffer buffer;
            msgpack::pack(buffer, request);
            sendRaw(buffer);
        }
    };
}
}

#endif //TRUSTREGIONRL_COMMUNICATION_HPP
