// udpperf.hpp
// Umbrella header: engine, metrics, CSV event log and default policy composition
#pragma once

#include "core/errors.hpp"
#include "core/log.hpp"
#include "core/stats.hpp"
#include "core/timing.hpp"
#include "msg/packet_codec.hpp"
#include "transport/udp_socket.hpp"
#include "flow/session_config.hpp"
#include "flow/flow_event.hpp"
#include "flow/flow_sender.hpp"
#include "flow/flow_receiver.hpp"
#include "flow/rendezvous.hpp"
#include "flow/flow_coordinator.hpp"
#include "metrics/metrics_aggregator.hpp"
#include "log/event_csv.hpp"
#include "log/session_output.hpp"
#include "udpperf_configs.hpp"
