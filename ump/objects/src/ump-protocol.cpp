#include "ump/ump-protocol.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace ump {

namespace {

constexpr std::array kPartTypes = {
    PartTypeEntry{10, "ONESIE_HEADER"},
    PartTypeEntry{11, "ONESIE_DATA"},
    PartTypeEntry{12, "ONESIE_ENCRYPTED_MEDIA"},
    PartTypeEntry{20, "MEDIA_HEADER"},
    PartTypeEntry{21, "MEDIA"},
    PartTypeEntry{22, "MEDIA_END"},
    PartTypeEntry{31, "LIVE_METADATA"},
    PartTypeEntry{33, "LIVE_METADATA_PROMISE"},
    PartTypeEntry{34, "LIVE_METADATA_PROMISE_CANCELLATION"},
    PartTypeEntry{35, "NEXT_REQUEST_POLICY"},
    PartTypeEntry{36, "USTREAMER_VIDEO_AND_FORMAT_DATA"},
    PartTypeEntry{37, "FORMAT_SELECTION_CONFIG"},
    PartTypeEntry{38, "USTREAMER_SELECTED_MEDIA_STREAM"},
    PartTypeEntry{42, "FORMAT_INITIALIZATION_METADATA"},
    PartTypeEntry{43, "SABR_REDIRECT"},
    PartTypeEntry{44, "SABR_ERROR"},
    PartTypeEntry{45, "SABR_SEEK"},
    PartTypeEntry{46, "RELOAD_PLAYER_RESPONSE"},
    PartTypeEntry{47, "PLAYBACK_START_POLICY"},
    PartTypeEntry{48, "ALLOWED_CACHED_FORMATS"},
    PartTypeEntry{49, "START_BW_SAMPLING_HINT"},
    PartTypeEntry{50, "PAUSE_BW_SAMPLING_HINT"},
    PartTypeEntry{51, "SELECTABLE_FORMATS"},
    PartTypeEntry{52, "REQUEST_IDENTIFIER"},
    PartTypeEntry{53, "REQUEST_CANCELLATION_POLICY"},
    PartTypeEntry{54, "ONESIE_PREFETCH_REJECTION"},
    PartTypeEntry{55, "TIMELINE_CONTEXT"},
    PartTypeEntry{56, "REQUEST_PIPELINING"},
    PartTypeEntry{57, "SABR_CONTEXT_UPDATE"},
    PartTypeEntry{58, "STREAM_PROTECTION_STATUS"},
    PartTypeEntry{59, "SABR_CONTEXT_SENDING_POLICY"},
    PartTypeEntry{60, "LAWNMOWER_POLICY"},
    PartTypeEntry{61, "SABR_ACK"},
    PartTypeEntry{62, "END_OF_TRACK"},
    PartTypeEntry{63, "CACHE_LOAD_POLICY"},
    PartTypeEntry{64, "LAWNMOWER_MESSAGING_POLICY"},
    PartTypeEntry{65, "PREWARM_CONNECTION"},
};

static_assert(std::ranges::is_sorted(kPartTypes, {}, &PartTypeEntry::id));

}  // namespace

std::span<const PartTypeEntry> KnownPartTypes() noexcept { return kPartTypes; }

std::optional<std::string_view> PartTypeName(uint32_t type) noexcept {
  const auto it = std::ranges::lower_bound(kPartTypes, type, {}, &PartTypeEntry::id);
  if (it == kPartTypes.end() || it->id != type) {
    return std::nullopt;
  }
  return it->name;
}

}  // namespace ump
