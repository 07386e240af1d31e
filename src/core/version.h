// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

#ifndef PROXIMA_CORE_VERSION_H
#define PROXIMA_CORE_VERSION_H

#include <string>

/** PROXIMA_VERSION from the build, "dev" otherwise */
std::string GetVersionString();

/** Release and wire protocol, e.g. "proximad 0.3.1 (protocol 1)" */
std::string GetFullVersionString();

#endif // PROXIMA_CORE_VERSION_H
