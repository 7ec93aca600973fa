//
// Worker process: plays a gym environment served over ZeroMQ and streams
// prioritized experience to the replay side.
//
// Usage: apexactor_worker <rank> [gym url] [experience url] [parameter url] [checkpoint]
//

#include<exception>
#include<memory>
#include<string>

#include<spdlog/spdlog.h>
#include<ATen/Parallel.h>
#include<torch/torch.h>

#include"../include/ApexActor.hpp"

#include"Communication.hpp"
#include"GymEnvironment.hpp"
#include"ZmqChannel.hpp"

using namespace ApexActor;

// Worker hyperparameters
const double discountFactor = 0.99;
const int nStep = 3;
const double maxEpsilon = 1.0;
const double minEpsilon = 0.01;
const double epsilonDecay = 1e-5;
const double perEps = 1e-6;
const std::size_t localBufferMaxSize = 1000;
const int64_t workerUpdateInterval = 50;
const int64_t maxUpdateStep = 100000;
const std::string lossType = "DQNLoss";
const bool render = false;

const std::string envName = "CartPole-v1";

// Model hyperparameters
const std::vector<int64_t> hiddenSizes = {128, 128};
const bool useCuda = false;

int main(int argc, char *argv[])
{
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("%^[%T %7l] %v%$");
    at::set_num_threads(1);

    if (argc < 2)
    {
        spdlog::error("Usage: {} <rank> [gym url] [experience url] [parameter url] [checkpoint]", argv[0]);
        return 1;
    }

    const int rank = std::stoi(argv[1]);
    const std::string gymUrl = argc > 2 ? argv[2] : "tcp://127.0.0.1:" + std::to_string(10201 + rank);
    const std::string experienceUrl = argc > 3 ? argv[3] : "tcp://127.0.0.1:6554";
    const std::string parameterUrl = argc > 4 ? argv[4] : "tcp://127.0.0.1:6555";

    torch::manual_seed(rank);
    torch::Device device = useCuda ? torch::kCUDA : torch::kCPU;

    WorkerConfig config;
    config.gamma = discountFactor;
    config.nStep = nStep;
    config.maxEpsilon = maxEpsilon;
    config.minEpsilon = minEpsilon;
    config.epsilonDecay = epsilonDecay;
    config.perEps = perEps;
    config.localBufferMaxSize = localBufferMaxSize;
    config.workerUpdateInterval = workerUpdateInterval;
    config.maxUpdateStep = maxUpdateStep;
    config.lossType = lossType;
    config.render = render;

    try
    {
        spdlog::info("Connecting to the Gym Environment");
        auto context = std::make_shared<zmq::context_t>(1);
        auto env = std::make_shared<WorkerClient::GymEnvironment>(
            std::make_unique<WorkerClient::Communicator>(gymUrl, context), envName);

        DQNWorker worker(rank,
            config,
            hiddenSizes,
            env,
            {},
            std::make_shared<WorkerClient::ZmqExperienceSink>(experienceUrl, context),
            std::make_shared<WorkerClient::ZmqParameterSource>(parameterUrl, context),
            device);

        if (argc > 5)
        {
            worker.loadParams(argv[5]);
        }

        worker.run();
    }
    catch (const std::exception &error)
    {
        spdlog::critical("Worker {} stopped: {}", rank, error.what());
        return 1;
    }
    return 0;
}
