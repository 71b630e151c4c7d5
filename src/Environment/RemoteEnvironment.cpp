#include<atomic>
#include<map>
#include<thread>

#include<fmt/ranges.h>
#include<spdlog/spdlog.h>
#include<doctest/doctest.h>

#include"../../include/Environment/RemoteEnvironment.hpp"
#include"../../include/Errors.hpp"

namespace TrustRegion
{
    RemoteEnvironment::RemoteEnvironment(const std::string &url, const std::string &environmentName, int timeoutMs)
        : communicator(std::make_unique<GymClient::Communicator>(url, timeoutMs))
    {
        auto makeParams = std::make_shared<GymClient::MakeParam>();
        makeParams->envName = environmentName;
        makeParams->numEnv = 1;
        communicator->sendRequest(GymClient::Request<GymClient::MakeParam>("make", makeParams));
        auto makeResponse = communicator->getResponse<GymClient::MakeResponse>();
        spdlog::debug("Gym server created {}: {}", environmentName, makeResponse.result);

        communicator->sendRequest(GymClient::Request<GymClient::InfoParam>("info", std::make_shared<GymClient::InfoParam>()));
        auto info = communicator->getResponse<GymClient::InfoResponse>();

        if (info.actionSpaceType != "Discrete" && info.actionSpaceType != "Box")
        {
            throw EnvironmentError("Unsupported remote action space: " + info.actionSpaceType);
        }
        if (info.observationSpaceShape.size() != 1)
        {
            throw EnvironmentError("Remote observations must be flat vectors, got " +
                                   std::to_string(info.observationSpaceShape.size()) + " dimensions");
        }
        space = ActionSpace{info.actionSpaceType, info.actionSpaceShape};
        observationDims = info.observationSpaceShape;
        spdlog::info("Remote environment {}: action space {} {}, observation space {}",
                     environmentName, space.type, fmt::join(space.shape, "x"), fmt::join(observationDims, "x"));
    }

    torch::Tensor RemoteEnvironment::toObservation(const std::vector<std::vector<float>> &observation) const
    {
        if (observation.size() != 1 || static_cast<int64_t>(observation[0].size()) != observationDims[0])
        {
            throw EnvironmentError("Remote observation does not match the advertised observation space");
        }
        return torch::tensor(observation[0]);
    }

    torch::Tensor RemoteEnvironment::reset()
    {
        communicator->sendRequest(GymClient::Request<GymClient::ResetParam>("reset", std::make_shared<GymClient::ResetParam>()));
        return toObservation(communicator->getResponse<GymClient::ResetResponse>().observation);
    }

    StepResult RemoteEnvironment::step(const torch::Tensor &action)
    {
        auto flatAction = action.to(torch::kFloat).reshape({-1}).contiguous();
        auto stepParams = std::make_shared<GymClient::StepParam>();
        stepParams->action = {std::vector<float>(flatAction.data_ptr<float>(),
                                                 flatAction.data_ptr<float>() + flatAction.numel())};
        stepParams->render = false;
        communicator->sendRequest(GymClient::Request<GymClient::StepParam>("step", stepParams));

        auto response = communicator->getResponse<GymClient::StepResponse>();
        if (response.reward.size() != 1 || response.reward[0].empty() ||
            response.done.size() != 1 || response.done[0].empty())
        {
            throw EnvironmentError("Remote step response is missing reward or done flags");
        }

        StepResult result{toObservation(response.observation), response.reward[0][0], response.done[0][0], {}};
        if (!response.real_reward.empty() && !response.real_reward[0].empty())
        {
            result.info["real_reward"] = response.real_reward[0][0];
        }
        return result;
    }

    void RemoteEnvironment::seed(uint64_t seed)
    {
        spdlog::debug("Ignoring seed {} for remote environment", seed);
    }

    std::vector<int64_t> RemoteEnvironment::observationShape() const
    {
        return observationDims;
    }

    ActionSpace RemoteEnvironment::actionSpace() const
    {
        return space;
    }

    TEST_CASE("RemoteEnvironment")
    {
        SUBCASE("Talks to a gym server")
        {
            const std::string url = "tcp://127.0.0.1:10391";
            zmq::context_t context(1);
            zmq::socket_t server(context, zmq::socket_type::pair);
            server.set(zmq::sockopt::rcvtimeo, 5000);
            server.set(zmq::sockopt::linger, 0);
            server.bind(url);

            std::atomic<bool> served{true};
            std::thread serverThread([&server, &served]() {
                for (int i = 0; i < 4; ++i)
                {
                    zmq::message_t request;
                    if (!server.recv(request, zmq::recv_flags::none))
                    {
                        served = false;
                        return;
                    }
                    auto handle = msgpack::unpack(static_cast<const char *>(request.data()), request.size());
                    std::map<std::string, msgpack::object> fields;
                    handle.get().convert(fields);
                    auto method = fields.at("method").as<std::string>();

                    msgpack::sbuffer buffer;
                    if (method == "make")
                    {
                        msgpack::pack(buffer, GymClient::MakeResponse{"ok"});
                    }
                    else if (method == "info")
                    {
                        msgpack::pack(buffer, GymClient::InfoResponse{"Discrete", {3}, "Box", {2}});
                    }
                    else if (method == "reset")
                    {
                        msgpack::pack(buffer, GymClient::ResetResponse{{{0.5f, -0.5f}}});
                    }
                    else
                    {
                        // Reward echoes the action so the client side can be checked
                        auto param = fields.at("param").as<std::map<std::string, msgpack::object>>();
                        auto action = param.at("action").as<std::vector<std::vector<float>>>();
                        GymClient::StepResponse response;
                        response.observation = {{1.f, 2.f}};
                        response.reward = {{action[0][0]}};
                        response.done = {{true}};
                        response.real_reward = {{10.f}};
                        msgpack::pack(buffer, response);
                    }
                    if (!server.send(zmq::buffer(buffer.data(), buffer.size()), zmq::send_flags::none))
                    {
                        served = false;
                        return;
                    }
                }
            });

            RemoteEnvironment environment(url, "Test-v0");
            CHECK(environment.actionSpace().type == "Discrete");
            CHECK(environment.actionSpace().shape == std::vector<int64_t>{3});
            CHECK(environment.observationShape() == std::vector<int64_t>{2});

            auto observation = environment.reset();
            CHECK(observation[0].item<float>() == doctest::Approx(0.5));

            auto result = environment.step(torch::tensor({2}, torch::kLong));
            CHECK(result.reward == doctest::Approx(2));
            CHECK(result.done);
            CHECK(result.info.at("real_reward") == doctest::Approx(10));
            CHECK(result.observation[1].item<float>() == doctest::Approx(2));

            serverThread.join();
            CHECK(served);
        }

        SUBCASE("A missing server times out")
        {
            CHECK_THROWS_AS(RemoteEnvironment("tcp://127.0.0.1:10392", "Test-v0", 200), EnvironmentError);
        }
    }
}
