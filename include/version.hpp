#pragma once

namespace lnk {

#ifdef LNK_VERSION_STRING
inline constexpr const char* VERSION = LNK_VERSION_STRING;
#else
inline constexpr const char* VERSION = "0.1.0";
#endif

}
