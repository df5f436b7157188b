#pragma once

#ifndef LANSCAN_VERSION
#define LANSCAN_VERSION "0.1.0"
#endif

namespace lanscan {
namespace scanner {

inline const char* Version() { return LANSCAN_VERSION; }

}  // namespace scanner
}  // namespace lanscan
