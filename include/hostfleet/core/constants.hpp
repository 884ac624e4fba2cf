#pragma once

#include <chrono>
#include <string_view>

namespace hostfleet {

// Owner name of instances belonging to the shared public pool.
inline constexpr std::string_view kPublicOwner = "*";

inline constexpr std::string_view kPidDirName = "ClusterManager";
inline constexpr std::string_view kManagerLockFile = "ClusterManager.lock";
inline constexpr std::string_view kAccountRegistryFile = "existingAccounts.json";

// Private message sent by the manager to ask an idle instance to exit.
inline constexpr std::string_view kQuitIfIdleMessage = "!#quitIfIdle";

namespace timing {
constexpr auto kPruneInterval = std::chrono::seconds(5);
constexpr auto kOwnerOfflineGrace = std::chrono::seconds(10);
constexpr auto kDefaultTickInterval = std::chrono::milliseconds(1000);
} // namespace timing

namespace macro {
inline constexpr std::string_view kManagerName = "ManagerName";
inline constexpr std::string_view kInstNb = "InstNb";
inline constexpr std::string_view kClustInstNb = "ClustInstNb";
inline constexpr std::string_view kOwnerName = "OwnerName";
inline constexpr std::string_view kInstanceName = "InstanceName";
inline constexpr std::string_view kLobbyLogin = "set:lobbyLogin";
inline constexpr std::string_view kDefaultPreset = "set:defaultPreset";
inline constexpr std::string_view kGamePort = "hSet:port";
inline constexpr std::string_view kAutoHostPort = "set:autoHostPort";
inline constexpr std::string_view kInstanceDir = "set:instanceDir";
inline constexpr std::string_view kLogDir = "set:logDir";
inline constexpr std::string_view kPassword = "hSet:password";
inline constexpr std::string_view kLobbyPassword = "set:lobbyPassword";
} // namespace macro

} // namespace hostfleet
