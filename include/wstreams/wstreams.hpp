#pragma once

#include "abort_signal.hpp"
#include "awaitable.hpp"
#include "block_on.hpp"
#include "errors.hpp"
#include "host/event_loop.hpp"
#include "host/promise.hpp"
#include "host/queuing_strategy.hpp"
#include "host/readable_stream.hpp"
#include "host/transform_stream.hpp"
#include "host/writable_stream.hpp"
#include "log.hpp"
#include "next.hpp"
#include "race.hpp"
#include "readable.hpp"
#include "ref.hpp"
#include "result.hpp"
#include "sink.hpp"
#include "stream.hpp"
#include "stream_awaitable.hpp"
#include "task.hpp"
#include "value.hpp"
#include "waker.hpp"
#include "writable.hpp"
#include "yield.hpp"
