#pragma once

#include"Channel.hpp"
#include"EpsilonGreedy.hpp"
#include"LocalBuffer.hpp"
#include"NStepWindow.hpp"
#include"ParameterSynchronizer.hpp"
#include"PriorityEstimator.hpp"
#include"Space.hpp"
#include"Transition.hpp"
#include"WorkerConfig.hpp"

#include"Environment/Environment.hpp"

#include"Loss/DQNLoss.hpp"
#include"Loss/Loss.hpp"

#include"Model/brain.hpp"
#include"Model/modelUtils.hpp"

#include"Worker/DQNWorker.hpp"
#include"Worker/Worker.hpp"
