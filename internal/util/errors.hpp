#pragma once

#include <stdexcept>
#include <string>

namespace vkyc::util {

/*
  Central error types.

  Core components throw these; the gRPC adapters translate them to status
  codes in one place (internal/grpc/grpc_error.cpp).
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Link resolution failures.
class LinkError : public std::runtime_error {
 public:
  explicit LinkError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class LinkExpired : public LinkError {
 public:
  explicit LinkExpired(const std::string& msg) : LinkError(msg) {
  }
};

class LinkConsumed : public LinkError {
 public:
  explicit LinkConsumed(const std::string& msg) : LinkError(msg) {
  }
};

class TransitionError : public std::runtime_error {
 public:
  explicit TransitionError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidTransition : public TransitionError {
 public:
  explicit InvalidTransition(const std::string& msg) : TransitionError(msg) {
  }
};

// The session is taken by another agent, or the agent is busy elsewhere.
class AgentUnavailable : public TransitionError {
 public:
  explicit AgentUnavailable(const std::string& msg) : TransitionError(msg) {
  }
};

// Signaling boundary failures.
class ChannelError : public std::runtime_error {
 public:
  explicit ChannelError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class SessionNotActive : public ChannelError {
 public:
  explicit SessionNotActive(const std::string& msg) : ChannelError(msg) {
  }
};

class InvalidMessage : public ChannelError {
 public:
  explicit InvalidMessage(const std::string& msg) : ChannelError(msg) {
  }
};

// An agent stream for a session that agent has not accepted.
class AgentNotAssigned : public ChannelError {
 public:
  explicit AgentNotAssigned(const std::string& msg) : ChannelError(msg) {
  }
};

class VerificationError : public std::runtime_error {
 public:
  explicit VerificationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class VerificationBusy : public VerificationError {
 public:
  explicit VerificationBusy(const std::string& msg) : VerificationError(msg) {
  }
};

class RecordingError : public std::runtime_error {
 public:
  explicit RecordingError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class TimeoutError : public std::runtime_error {
 public:
  explicit TimeoutError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ResourceExhausted : public std::runtime_error {
 public:
  explicit ResourceExhausted(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace vkyc::util
