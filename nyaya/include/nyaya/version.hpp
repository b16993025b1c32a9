#pragma once

#define NYAYA_VERSION "0.4.1"
#define NYAYA_CODEC_VERSION 1
#define NYAYA_LOG_FORMAT_VERSION 1

namespace nyaya {
namespace version {

// Payloads written by an older codec are readable; newer ones are not
inline bool codec_compatible(int codec) {
    return codec >= 1 && codec <= NYAYA_CODEC_VERSION;
}

} // namespace version
} // namespace nyaya
