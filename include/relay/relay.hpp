#pragma once
#include <relay/version.hpp>

#include <relay/core/demand.hpp>
#include <relay/core/errors.hpp>
#include <relay/core/log.hpp>
#include <relay/core/subscription.hpp>
#include <relay/core/scheduler.hpp>
#include <relay/core/thread_pool.hpp>
#include <relay/core/observable.hpp>
#include <relay/core/pipeline.hpp>
#include <relay/core/future.hpp>
#include <relay/core/task.hpp>
#include <relay/core/sequence.hpp>
#include <relay/core/async_stream.hpp>

#include <relay/adapters/sequence_publisher.hpp>
#include <relay/adapters/stream_publisher.hpp>
#include <relay/adapters/task_publisher.hpp>

#include <relay/ops/last_value.hpp>
#include <relay/ops/for_each_async.hpp>
