#pragma once

#include <chrono>
#include <cstddef>
#include <string_view>

#include <sys/types.h>

namespace tw::orchestrator {

// Files within the working directory.
inline constexpr std::string_view kDefaultDir{"taskwire.d"};
inline constexpr std::string_view kLogFile{"log.json"};
inline constexpr std::string_view kOpSock{"op.sock"};
inline constexpr std::string_view kStateFile{"state.json"};

inline constexpr mode_t kFilePerms = 0640;
inline constexpr mode_t kDirPerms = 0750;

inline constexpr size_t kNSeen = 10;
inline constexpr std::chrono::milliseconds kAcceptWait{250};
inline constexpr std::chrono::milliseconds kOpNameWait{10000};
inline constexpr std::chrono::milliseconds kStateWriteDelay{5000};

// Event names.
namespace event {
inline constexpr std::string_view kGoodbye{"goodbye"};
inline constexpr std::string_view kName{"name"};
inline constexpr std::string_view kEnqueue{"enqueue"};
inline constexpr std::string_view kListSeen{"listseen"};
} // namespace event

// Log messages. Operators subscribe to these by event name.
namespace lm {
inline constexpr std::string_view kOpListening{"Operator listener started"};
inline constexpr std::string_view kOpConnected{"Operator connected"};
inline constexpr std::string_view kOpDisconnected{"Operator disconnected"};
inline constexpr std::string_view kServerReady{"Server ready"};
inline constexpr std::string_view kCaughtSignal{"Caught signal, exiting"};
inline constexpr std::string_view kOpNameChange{"Operator name change"};
inline constexpr std::string_view kTaskQueued{"Task queued"};
inline constexpr std::string_view kSentSeenList{"Sent implant list"};
inline constexpr std::string_view kNewImplant{"New implant"};
inline constexpr std::string_view kTaskRequest{"Task request"};
inline constexpr std::string_view kStateWriteFailed{"State write failed"};
inline constexpr std::string_view kTemporaryAcceptError{"Temporary accept error"};
inline constexpr std::string_view kUnexpectedMessage{"Unexpected message"};
inline constexpr std::string_view kDecodeError{"Undecodable message"};
inline constexpr std::string_view kServerDied{"Server died"};
inline constexpr std::string_view kOpInitialNameError{"Error getting initial operator name"};
} // namespace lm

// Log keys.
namespace lk {
inline constexpr std::string_view kAddress{"address"};
inline constexpr std::string_view kDirname{"dirname"};
inline constexpr std::string_view kId{"id"};
inline constexpr std::string_view kTask{"task"};
inline constexpr std::string_view kConnNumber{"cnum"};
inline constexpr std::string_view kOpName{"opname"};
inline constexpr std::string_view kOpOldName{"oldname"};
inline constexpr std::string_view kMessageType{"message_type"};
inline constexpr std::string_view kMessage{"message"};
inline constexpr std::string_view kSignal{"signal"};
inline constexpr std::string_view kQLen{"qlen"};
inline constexpr std::string_view kErrorType{"error_type"};
inline constexpr std::string_view kFrom{"from"};
} // namespace lk

} // namespace tw::orchestrator
