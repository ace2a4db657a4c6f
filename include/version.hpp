// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <string>

#ifndef KADCAST_VERSION_STRING
#define KADCAST_VERSION_STRING "0.4.1"
#endif

namespace kadcast {

inline std::string GetVersionString() {
  return KADCAST_VERSION_STRING;
}

inline std::string GetFullVersionString() {
  return std::string("kadcastd version v") + KADCAST_VERSION_STRING;
}

inline std::string GetCopyrightString() {
  return "Copyright (C) 2025 The Unicity Foundation";
}

}  // namespace kadcast
