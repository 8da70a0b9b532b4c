#pragma once

namespace langcloud::http::media_type
{

inline constexpr const char* APPLICATION_JSON = "application/json";
inline constexpr const char* TEXT_PLAIN = "text/plain";
inline constexpr const char* BINARY_FILE = "application/octet-stream";
inline constexpr const char* AUDIO_OGG = "audio/ogg; codecs=opus";
inline constexpr const char* AUDIO_WAV = "audio/wav";
inline constexpr const char* AUDIO_FLAC = "audio/flac";

} // namespace langcloud::http::media_type
