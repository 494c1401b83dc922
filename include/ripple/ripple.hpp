#pragma once
#include <ripple/version.hpp>

#include <ripple/core/log.hpp>
#include <ripple/core/subscription.hpp>
#include <ripple/core/composite_subscription.hpp>
#include <ripple/core/observer.hpp>
#include <ripple/core/observable.hpp>
#include <ripple/core/pipeline.hpp>
#include <ripple/core/util.hpp>

#include <ripple/core/scheduler.hpp>
#include <ripple/core/cooperative_scheduler.hpp>
#include <ripple/core/timer_queue.hpp>
#include <ripple/core/timeout_scheduler.hpp>

#include <ripple/core/subject.hpp>
#include <ripple/core/async_subject.hpp>
#include <ripple/core/behavior_subject.hpp>
#include <ripple/core/replay_subject.hpp>

// sources
#include <ripple/ops/empty.hpp>
#include <ripple/ops/of.hpp>
#include <ripple/ops/range.hpp>
#include <ripple/ops/from_iterable.hpp>
#include <ripple/ops/from_generator.hpp>
#include <ripple/ops/defer.hpp>
#include <ripple/ops/replicate.hpp>

// operators
#include <ripple/ops/map.hpp>
#include <ripple/ops/scan.hpp>
#include <ripple/ops/reduce.hpp>
#include <ripple/ops/aggregate.hpp>
#include <ripple/ops/pluck.hpp>
#include <ripple/ops/pack.hpp>
#include <ripple/ops/filter.hpp>
#include <ripple/ops/distinct.hpp>
#include <ripple/ops/find.hpp>
#include <ripple/ops/take.hpp>
#include <ripple/ops/skip.hpp>
#include <ripple/ops/concat.hpp>
#include <ripple/ops/merge.hpp>
#include <ripple/ops/combine_latest.hpp>
#include <ripple/ops/zip.hpp>
#include <ripple/ops/amb.hpp>
#include <ripple/ops/with.hpp>
#include <ripple/ops/switch_latest.hpp>
#include <ripple/ops/flat_map.hpp>
#include <ripple/ops/debounce.hpp>
#include <ripple/ops/delay.hpp>
#include <ripple/ops/sample.hpp>
#include <ripple/ops/buffer.hpp>
#include <ripple/ops/window.hpp>
#include <ripple/ops/catch_error.hpp>
#include <ripple/ops/retry.hpp>
#include <ripple/ops/tap.hpp>
#include <ripple/ops/lifecycle.hpp>
#include <ripple/ops/start_with.hpp>
#include <ripple/ops/dump.hpp>
