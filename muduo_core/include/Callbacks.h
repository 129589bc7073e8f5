#pragma once

#include <functional>

class Timestamp;

using TimerCallback = std::function<void()>;
using ReadEventCallback = std::function<void(Timestamp)>;
using EventCallback = std::function<void()>;
