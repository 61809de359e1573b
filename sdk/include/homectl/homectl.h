// ─────────────────────────────────────────────────────────────────────────────
// homectl — Convenience umbrella header
// ─────────────────────────────────────────────────────────────────────────────
#pragma once

#include "homectl/types.h"
#include "homectl/clock.h"
#include "homectl/logger.h"
#include "homectl/device.h"
#include "homectl/value_source.h"
#include "homectl/sensor.h"
#include "homectl/rule_engine.h"
#include "homectl/recorder.h"
#include "homectl/series_sink.h"
#include "homectl/controller.h"
#include "homectl/lifecycle.h"
#include "homectl/config.h"
#include "homectl/telemetry_publisher.h"
