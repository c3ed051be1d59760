#pragma once
#include <surge/version.hpp>

#include <surge/core/config.hpp>
#include <surge/core/errors.hpp>
#include <surge/core/plugins.hpp>
#include <surge/core/disposable.hpp>
#include <surge/core/composite_disposable.hpp>
#include <surge/core/subscription.hpp>
#include <surge/core/scheduler.hpp>
#include <surge/core/terminal_gate.hpp>

#include <surge/core/observer.hpp>
#include <surge/core/observable.hpp>
#include <surge/core/pipeline.hpp>

#include <surge/subjects/publish_subject.hpp>
#include <surge/subjects/behavior_subject.hpp>
#include <surge/subjects/replay_subject.hpp>
#include <surge/subjects/async_subject.hpp>

#include <surge/flowable/backpressure.hpp>
#include <surge/flowable/flow_subscription.hpp>
#include <surge/flowable/subscriber.hpp>
#include <surge/flowable/flowable.hpp>

#include <surge/ops/flat_map.hpp>
#include <surge/ops/switch_map.hpp>
#include <surge/ops/concat_map.hpp>
#include <surge/ops/merge.hpp>
#include <surge/ops/zip.hpp>
#include <surge/ops/observe_on.hpp>
#include <surge/ops/subscribe_on.hpp>
#include <surge/ops/publish.hpp>
#include <surge/ops/share.hpp>
