// POSIX TCP helpers with connect and stall timeouts, shared by the SSH and FTP
// backends.
#pragma once
#include "HostTypes.hpp"
#include <cstdint>
#include <string>

namespace tscp {
namespace net {

// Returns a connected, blocking socket or -1. Unreachable hosts and timeouts
// are reported as Connection errors (timed_out set on timeout).
int tcpConnect(const std::string& host, std::uint16_t port, int timeout_ms, BridgeError& err);

// Waits until fd can be read/written. false with Connection{timed_out} on
// timeout, Connection on poll failure.
bool waitReadable(int fd, int timeout_ms, BridgeError& err);
bool waitWritable(int fd, int timeout_ms, BridgeError& err);
// Either direction; used when a library reports which way it is blocked.
bool waitReady(int fd, bool readable, bool writable, int timeout_ms, BridgeError& err);

bool sendAll(int fd, const char* data, std::size_t len, int timeout_ms, BridgeError& err);

// Numeric address of the connected peer ("" on failure).
std::string peerAddress(int fd);

void closeSocket(int& fd);

} // namespace net
} // namespace tscp
