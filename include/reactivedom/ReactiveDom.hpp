#pragma once

#include <reactivedom/core/Error.hpp>
#include <reactivedom/core/RuntimeOptions.hpp>
#include <reactivedom/dom/Binder.hpp>
#include <reactivedom/dom/Component.hpp>
#include <reactivedom/dom/KeyedList.hpp>
#include <reactivedom/dom/Node.hpp>
#include <reactivedom/dom/Region.hpp>
#include <reactivedom/inspector/GraphSnapshot.hpp>
#include <reactivedom/reactive/Cell.hpp>
#include <reactivedom/reactive/CellRegistry.hpp>
#include <reactivedom/reactive/Cleanup.hpp>
#include <reactivedom/reactive/Derive.hpp>
#include <reactivedom/reactive/Lifecycle.hpp>
#include <reactivedom/reactive/Scheduler.hpp>
#include <reactivedom/reactive/Store.hpp>
#include <reactivedom/reactive/TrackingContext.hpp>
#include <reactivedom/reactive/Watch.hpp>
