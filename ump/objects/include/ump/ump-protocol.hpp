#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace ump {

// UMP (Universal Media Part) protocol constants
// ==============================================

// Content-Type of HTTP responses carrying a UMP body.
inline constexpr std::string_view kUmpContentType = "application/vnd.yt-ump";

// Known UMP part types.
// The registry is advisory: any other id is a valid, opaque part type.
enum class PartType : uint32_t {  // NOLINT(performance-enum-size)
  OnesieHeader = 10,
  OnesieData = 11,
  OnesieEncryptedMedia = 12,
  MediaHeader = 20,
  Media = 21,
  MediaEnd = 22,
  LiveMetadata = 31,
  LiveMetadataPromise = 33,
  LiveMetadataPromiseCancellation = 34,
  NextRequestPolicy = 35,
  UstreamerVideoAndFormatData = 36,
  FormatSelectionConfig = 37,
  UstreamerSelectedMediaStream = 38,
  FormatInitializationMetadata = 42,
  SabrRedirect = 43,
  SabrError = 44,
  SabrSeek = 45,
  ReloadPlayerResponse = 46,
  PlaybackStartPolicy = 47,
  AllowedCachedFormats = 48,
  StartBwSamplingHint = 49,
  PauseBwSamplingHint = 50,
  SelectableFormats = 51,
  RequestIdentifier = 52,
  RequestCancellationPolicy = 53,
  OnesiePrefetchRejection = 54,
  TimelineContext = 55,
  RequestPipelining = 56,
  SabrContextUpdate = 57,
  StreamProtectionStatus = 58,
  SabrContextSendingPolicy = 59,
  LawnmowerPolicy = 60,
  SabrAck = 61,
  EndOfTrack = 62,
  CacheLoadPolicy = 63,
  LawnmowerMessagingPolicy = 64,
  PrewarmConnection = 65,
};

// Part type that precedes the continuation of a partial part in each following chunk.
inline constexpr uint32_t kContinuationWrapperType = static_cast<uint32_t>(PartType::MediaHeader);

struct PartTypeEntry {
  uint32_t id;
  std::string_view name;
};

/// All registered part types, sorted by id.
[[nodiscard]] std::span<const PartTypeEntry> KnownPartTypes() noexcept;

/// Registered name of a part type id (e.g. "MEDIA_HEADER" for 20), for logging/debugging.
/// Returns std::nullopt for unregistered ids.
[[nodiscard]] std::optional<std::string_view> PartTypeName(uint32_t type) noexcept;

[[nodiscard]] inline std::optional<std::string_view> PartTypeName(PartType type) noexcept {
  return PartTypeName(static_cast<uint32_t>(type));
}

}  // namespace ump
