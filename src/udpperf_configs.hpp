// udpperf_configs.hpp
// Pre-configured coordinator instantiations using policy-based design
//
// Template parameters:
//   - ClockPolicy: MonotonicClock
//   - RecvBackend: EpollRecvBackend<EpollPolicy> or IoUringRecvBackend
//
#pragma once

#include "core/timing.hpp"
#include "policy/event.hpp"
#include "policy/recv_backend.hpp"
#include "flow/flow_coordinator.hpp"

// ============================================================================
// Linux Default
// ============================================================================
// Policy composition:
//   - ClockPolicy: MonotonicClock (CLOCK_MONOTONIC, clock_nanosleep TIMER_ABSTIME)
//   - RecvBackend: IoUringRecvBackend when ENABLE_IO_URING is defined,
//                  otherwise EpollRecvBackend (edge-triggered epoll + recvmmsg)
//
// Sender flows always use blocking-free send() on connected sockets; the
// backend only affects the receiving socket owner.

#ifdef __linux__

#ifdef ENABLE_IO_URING
    using DefaultRecvBackend = udpperf::recv_backends::IoUringRecvBackend;
#else
    using DefaultRecvBackend = udpperf::recv_backends::EpollRecvBackend<EventPolicy>;
#endif

using DefaultClockPolicy = udpperf::MonotonicClock;

using DefaultCoordinator = udpperf::FlowCoordinator<DefaultClockPolicy, DefaultRecvBackend>;

// Epoll backend regardless of ENABLE_IO_URING
using EpollCoordinator = udpperf::FlowCoordinator<DefaultClockPolicy,
                                                  udpperf::recv_backends::EpollRecvBackend<EventPolicy>>;

#else
#error "udpperf requires Linux (epoll, recvmmsg, SO_TIMESTAMPNS)"
#endif // __linux__
